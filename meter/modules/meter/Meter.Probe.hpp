#pragma once

#include "common/protocol/pzem/Pzem.Types.hpp"

namespace pzem {

/**
 * @brief 电能表探头接口
 *
 * 每个读数访问器都可能触发一次设备读取（缓存过期时），
 * 调用方需按 IO 操作对待：可能阻塞，也可能抛出异常。
 */
class Probe {
public:
    virtual ~Probe() = default;

    // ==================== 测量值 ====================

    /** 电压 (V) */
    virtual double voltage() = 0;

    /** 电流 (A) */
    virtual double intensity() = 0;

    /** 有功功率 (W) */
    virtual double power() = 0;

    /** 累计电能 */
    virtual double energy() = 0;

    /** 频率 (Hz) */
    virtual double frequency() = 0;

    /** 功率因数 */
    virtual double powerFactor() = 0;

    /** 告警状态原值（0x0000 / 0xFFFF） */
    virtual uint16_t alarm() = 0;

    virtual bool isAlarmActive() = 0;

    /** 完整测量快照 */
    virtual Measurement snapshot() = 0;

    // ==================== 配置与指令 ====================

    virtual void resetEnergy() = 0;

    virtual void setAddress(uint8_t address) = 0;

    /** 功率告警阈值 (W) */
    virtual void setAlarmThreshold(uint16_t watts) = 0;

    virtual uint16_t readAlarmThreshold() = 0;

    /** 当前会话使用的从站地址 */
    virtual uint8_t address() const = 0;
};

}  // namespace pzem
