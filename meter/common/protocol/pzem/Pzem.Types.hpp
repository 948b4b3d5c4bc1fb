#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "common/utils/AppException.hpp"

namespace pzem {

// ==================== 寄存器地址 ====================

/** 输入寄存器（只读测量值） */
struct InputRegisters {
    static constexpr uint16_t VOLTAGE = 0x0000;          // 1LSB = 0.1V
    static constexpr uint16_t CURRENT_LOW = 0x0001;      // 1LSB = 0.001A
    static constexpr uint16_t CURRENT_HIGH = 0x0002;
    static constexpr uint16_t POWER_LOW = 0x0003;        // 1LSB = 0.1W
    static constexpr uint16_t POWER_HIGH = 0x0004;
    static constexpr uint16_t ENERGY_LOW = 0x0005;       // 1LSB = 1Wh
    static constexpr uint16_t ENERGY_HIGH = 0x0006;
    static constexpr uint16_t FREQUENCY = 0x0007;        // 1LSB = 0.1Hz
    static constexpr uint16_t POWER_FACTOR = 0x0008;     // 1LSB = 0.01
    static constexpr uint16_t ALARM = 0x0009;            // 0xFFFF 告警, 0x0000 正常

    /** 一次读取的整块测量寄存器 */
    static constexpr uint16_t BLOCK_START = VOLTAGE;
    static constexpr uint16_t BLOCK_COUNT = 10;
};

/** 保持寄存器（可写配置） */
struct HoldingRegisters {
    static constexpr uint16_t ALARM_THRESHOLD = 0x0001;  // 1LSB = 1W
    static constexpr uint16_t SLAVE_ADDRESS = 0x0002;    // 0x0001-0x00F7
};

// ==================== 功能码常量 ====================

struct FuncCodes {
    static constexpr uint8_t READ_HOLDING_REGISTERS = 0x03;
    static constexpr uint8_t READ_INPUT_REGISTERS = 0x04;
    static constexpr uint8_t WRITE_SINGLE_REGISTER = 0x06;
    static constexpr uint8_t CALIBRATION = 0x41;         // 仅厂内校准使用，不下发
    static constexpr uint8_t RESET_ENERGY = 0x42;

    /** 异常应答标志位 */
    static constexpr uint8_t ERROR_MARKER = 0x80;
};

// ==================== 地址与帧长 ====================

/** 通用地址（未配置地址时使用，单机直连） */
inline constexpr uint8_t DEFAULT_ADDRESS = 0xF8;

/** 可写从站地址范围 */
inline constexpr uint8_t MIN_SLAVE_ADDRESS = 0x01;
inline constexpr uint8_t MAX_SLAVE_ADDRESS = 0xF7;

/** 默认波特率 */
inline constexpr int DEFAULT_BAUD_RATE = 9600;

/** 读/写单寄存器请求帧长 */
inline constexpr size_t REGISTER_FRAME_LENGTH = 8;

/** 复位指令帧长（含 CRC） */
inline constexpr size_t RESET_FRAME_LENGTH = 4;

/** 测量块应答帧长: Addr(1) + FC(1) + ByteCount(1) + 20 + CRC(2) */
inline constexpr size_t MEASUREMENT_FRAME_LENGTH = 25;

/** 读单个保持寄存器应答帧长: Addr(1) + FC(1) + ByteCount(1) + 2 + CRC(2) */
inline constexpr size_t HOLDING_FRAME_LENGTH = 7;

/** 异常应答帧长: Addr(1) + FC|0x80(1) + ExceptionCode(1) + CRC(2) */
inline constexpr size_t EXCEPTION_FRAME_LENGTH = 5;

// ==================== 时序 ====================

/** 测量快照有效期，期内的读数访问直接复用缓存 */
inline constexpr std::chrono::milliseconds REFRESH_INTERVAL{1000};

/** 发送指令后等待设备应答的最小间隔 */
inline constexpr std::chrono::milliseconds COMMAND_DELAY{200};

/** 电能清零后设备清空累加器所需时间 */
inline constexpr std::chrono::milliseconds RESET_SETTLE_DELAY{400};

/** 告警状态 */
inline constexpr uint16_t ALARM_OFF = 0x0000;
inline constexpr uint16_t ALARM_ON = 0xFFFF;

inline bool isValidSlaveAddress(uint8_t address) {
    return address >= MIN_SLAVE_ADDRESS && address <= MAX_SLAVE_ADDRESS;
}

// ==================== 设备异常 ====================

/** 设备异常码 */
enum class DeviceError : uint8_t {
    IllegalCommand = 0x01,
    IllegalAddress = 0x02,
    IllegalData = 0x03,
    SlaveError = 0x04,
    Unknown = 0xFF
};

inline DeviceError parseDeviceError(uint8_t code) {
    switch (code) {
        case 0x01: return DeviceError::IllegalCommand;
        case 0x02: return DeviceError::IllegalAddress;
        case 0x03: return DeviceError::IllegalData;
        case 0x04: return DeviceError::SlaveError;
        default: return DeviceError::Unknown;
    }
}

inline const char* deviceErrorToString(DeviceError error) {
    switch (error) {
        case DeviceError::IllegalCommand: return "Illegal command";
        case DeviceError::IllegalAddress: return "Illegal address";
        case DeviceError::IllegalData: return "Illegal data";
        case DeviceError::SlaveError: return "Slave error";
        case DeviceError::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief 设备返回异常应答（重试同一指令结果相同，不自动重试）
 */
class DeviceException : public ProtocolException {
public:
    DeviceException(DeviceError error, uint8_t rawCode)
        : ProtocolException(deviceErrorToString(error), ErrorCodes::DEVICE_ERROR),
          error_(error), rawCode_(rawCode) {}

    DeviceError getDeviceError() const { return error_; }
    uint8_t getRawCode() const { return rawCode_; }

private:
    DeviceError error_;
    uint8_t rawCode_;
};

// ==================== 测量快照 ====================

/** 解码后的一组测量值（整体替换，不做部分更新） */
struct Measurement {
    double voltage = 0.0;       // V
    double current = 0.0;       // A
    double power = 0.0;         // W
    double energy = 0.0;        // 见 RegisterDecoder 关于能量单位的说明
    double frequency = 0.0;     // Hz
    double powerFactor = 0.0;   // 0.00-1.00
    uint16_t alarm = ALARM_OFF;

    bool isAlarmActive() const { return alarm == ALARM_ON; }
};

}  // namespace pzem
