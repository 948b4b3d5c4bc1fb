#pragma once

/**
 * @brief 全局常量定义
 *
 * 集中管理项目中的魔法数字，提高可维护性和可读性
 * 协议时序常量见 common/protocol/pzem/Pzem.Types.hpp
 */
namespace Constants {

// ==================== 日志相关 ====================

/** 默认日志目录 */
inline constexpr const char* DEFAULT_LOG_DIR = "./logs";

/** 日志文件名前缀 */
inline constexpr const char* LOG_FILE_PREFIX = "pzem-meter_";

/** 单个日志文件大小上限（字节）- 100MB */
inline constexpr uint64_t LOG_FILE_SIZE_LIMIT = 100 * 1024 * 1024;

// ==================== 串口相关 ====================

/** 串口读超时默认值（毫秒） */
inline constexpr int DEFAULT_SERIAL_TIMEOUT_MS = 5000;

/** 支持的波特率 */
inline constexpr std::array<int, 8> SUPPORTED_BAUD_RATES = {
    1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200
};

// ==================== 采集相关 ====================

/** 打印循环默认周期（毫秒） */
inline constexpr int DEFAULT_POLL_INTERVAL_MS = 1000;

/** 告警阈值上限（W） */
inline constexpr int MAX_ALARM_THRESHOLD = 0xFFFF;

}  // namespace Constants
