#pragma once

/**
 * @brief PZEM-004T 协议模块
 *
 * 包含:
 * - Pzem.Types.hpp   - 寄存器地址、功能码、异常码、测量快照
 * - Pzem.Utils.hpp   - CRC16、帧构建、应答准入检查
 * - Pzem.Decoder.hpp - 测量块/保持寄存器解码
 */

#include "Pzem.Types.hpp"
#include "Pzem.Utils.hpp"
#include "Pzem.Decoder.hpp"
