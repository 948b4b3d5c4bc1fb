#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 0: 成功
 * - 1xxx: 配置错误（启动参数、地址范围等，调用方必须修正配置）
 * - 3xxx: 链路/帧错误（串口读写、长度、校验、回显）
 * - 4xxx: 设备端异常应答
 */
namespace ErrorCodes {

// ==================== 成功 ====================

/** 操作成功 */
inline constexpr int SUCCESS = 0;

// ==================== 配置错误 (1xxx) ====================

/** 配置无效（如串口标识为空） */
inline constexpr int CONFIG_ERROR = 1001;

/** 从站地址超出 0x01-0xF7 */
inline constexpr int INVALID_ADDRESS = 1002;

// ==================== 链路/帧错误 (3xxx) ====================

/** 串口打开/读/写失败 */
inline constexpr int IO_ERROR = 3001;

/** 接收字节数与期望帧长不一致 */
inline constexpr int SHORT_READ = 3002;

/** CRC 校验失败 */
inline constexpr int BAD_CHECKSUM = 3003;

/** 写入回显与请求不一致 */
inline constexpr int ECHO_MISMATCH = 3004;

/** 帧结构异常（字节数字段不符等） */
inline constexpr int MALFORMED_FRAME = 3005;

// ==================== 设备异常 (4xxx) ====================

/** 设备返回异常码 */
inline constexpr int DEVICE_ERROR = 4001;

}  // namespace ErrorCodes
