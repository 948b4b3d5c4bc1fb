#pragma once

#include "common/utils/Constants.hpp"

namespace fs = std::filesystem;

/**
 * @brief 日志管理器 - 使用 trantor::AsyncFileLogger 异步写盘 + 按日期轮转
 *
 * 文件命名: logs/pzem-meter_YYYY-MM-DD_HHMMSS.log
 * 轮转策略: 每天自动创建新文件 + 单文件超 100MB 时轮转
 * 可选同时输出到 stderr（stdout 留给读数输出）
 */
class LoggerManager {
private:
    static std::unique_ptr<trantor::AsyncFileLogger> fileLogger_;
    static std::shared_mutex loggerMutex_;
    static std::string logDir_;
    static std::atomic<int> currentDay_;
    static std::atomic<bool> consoleEnabled_;

    /** 自 epoch 起的天数（UTC），轮转判断只比较整数 */
    static int currentEpochDay() {
        auto today = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
        return static_cast<int>(today.time_since_epoch().count());
    }

    /** epoch 天数转 "YYYY-MM-DD" */
    static std::string formatDay(int epochDay) {
        std::chrono::year_month_day ymd{std::chrono::sys_days{std::chrono::days{epochDay}}};
        char buf[11];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
        return buf;
    }

    static std::unique_ptr<trantor::AsyncFileLogger> openDayFile(int epochDay) {
        auto logger = std::make_unique<trantor::AsyncFileLogger>();
        logger->setFileName(logDir_ + "/" + Constants::LOG_FILE_PREFIX + formatDay(epochDay));
        logger->setFileSizeLimit(Constants::LOG_FILE_SIZE_LIMIT);
        logger->startLogging();
        return logger;
    }

    /** 跨天时切换到新文件，旧 logger 在锁外析构并 flush */
    static void switchDayIfNeeded() {
        int today = currentEpochDay();
        if (today == currentDay_.load(std::memory_order_relaxed)) return;

        std::unique_ptr<trantor::AsyncFileLogger> previous;
        {
            std::unique_lock lock(loggerMutex_);
            if (today == currentDay_.load(std::memory_order_relaxed) || !fileLogger_) return;
            previous = std::move(fileLogger_);
            fileLogger_ = openDayFile(today);
            currentDay_.store(today, std::memory_order_relaxed);
        }
    }

public:
    /**
     * @brief 格式化日志消息
     * @details 将 trantor 原始日志格式转换为更易读的格式
     *          原始: "YYYYMMDD HH:MM:SS.microseconds ThreadID Level [func] message - file:line"
     *          目标: "YYYY-MM-DD HH:MM:SS ThreadID Level message"
     */
    static std::string formatLogMessage(const char* msg, uint64_t len) {
        std::string logMsg(msg, len);

        if (len < 17 || logMsg[8] != ' ') {
            return logMsg;
        }

        size_t timeEnd = logMsg.find(' ', 9);
        if (timeEnd == std::string::npos || timeEnd <= 15) {
            return logMsg;
        }

        std::string rest = logMsg.substr(timeEnd);

        // 移除 [operator ()] - lambda 函数名无意义
        size_t opStart = rest.find("[operator ()");
        if (opStart != std::string::npos) {
            size_t opEnd = rest.find("] ", opStart);
            if (opEnd != std::string::npos) {
                rest = rest.substr(0, opStart) + rest.substr(opEnd + 2);
            }
        }

        // 移除末尾的 " - file.cpp:line"
        size_t filePos = rest.rfind(" - ");
        if (filePos != std::string::npos) {
            std::string suffix = rest.substr(filePos + 3);
            if (suffix.find(".cpp:") != std::string::npos ||
                suffix.find(".hpp:") != std::string::npos) {
                rest = rest.substr(0, filePos) + "\n";
            }
        }

        return logMsg.substr(0, 4) + "-" + logMsg.substr(4, 2) + "-" + logMsg.substr(6, 2)
             + " " + logMsg.substr(9, 8) + rest;
    }

private:
    /** 日志输出函数（注册到 trantor::Logger） */
    static void outputFunction(const char* msg, const uint64_t len) {
        std::string formatted = formatLogMessage(msg, len);

        if (consoleEnabled_.load(std::memory_order_relaxed)) {
            std::cerr.write(formatted.data(), static_cast<std::streamsize>(formatted.size()));
        }

        switchDayIfNeeded();

        std::shared_lock lock(loggerMutex_);
        if (fileLogger_) {
            fileLogger_->output(formatted.c_str(), formatted.size());
        }
    }

    /** 日志刷新函数（注册到 trantor::Logger） */
    static void flushFunction() {
        if (consoleEnabled_.load(std::memory_order_relaxed)) {
            std::cerr.flush();
        }
        std::shared_lock lock(loggerMutex_);
        if (fileLogger_) {
            fileLogger_->flush();
        }
    }

public:
    /**
     * @brief 初始化日志系统
     * @param logDir 日志目录路径
     * @param console 是否同时输出到 stderr
     */
    static void initialize(const std::string& logDir, bool console) {
        fs::create_directories(logDir);
        logDir_ = logDir;
        consoleEnabled_.store(console, std::memory_order_relaxed);

        int today = currentEpochDay();
        {
            std::unique_lock lock(loggerMutex_);
            fileLogger_ = openDayFile(today);
            currentDay_.store(today, std::memory_order_relaxed);
        }

        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(outputFunction, flushFunction);
        trantor::Logger::setLogLevel(trantor::Logger::kInfo);
    }

    /**
     * @brief 设置日志级别
     * @return 级别名称是否有效，无效时保持原级别
     */
    static bool setLogLevel(const std::string& level) {
        if (level == "TRACE") {
            trantor::Logger::setLogLevel(trantor::Logger::kTrace);
        } else if (level == "DEBUG") {
            trantor::Logger::setLogLevel(trantor::Logger::kDebug);
        } else if (level == "INFO") {
            trantor::Logger::setLogLevel(trantor::Logger::kInfo);
        } else if (level == "WARN") {
            trantor::Logger::setLogLevel(trantor::Logger::kWarn);
        } else if (level == "ERROR") {
            trantor::Logger::setLogLevel(trantor::Logger::kError);
        } else if (level == "FATAL") {
            trantor::Logger::setLogLevel(trantor::Logger::kFatal);
        } else {
            return false;
        }
        return true;
    }

    /** 是否同时输出到 stderr */
    static void setConsoleEnabled(bool enabled) {
        consoleEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /** 日志级别名称是否有效 */
    static bool isValidLogLevel(const std::string& level) {
        static const std::set<std::string> levels = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
        return levels.count(level) > 0;
    }

    /**
     * @brief 关闭日志系统
     */
    static void close() {
        std::unique_lock lock(loggerMutex_);
        fileLogger_.reset();
    }
};

// 静态成员初始化（inline 避免多翻译单元 ODR 违规）
inline std::unique_ptr<trantor::AsyncFileLogger> LoggerManager::fileLogger_;
inline std::shared_mutex LoggerManager::loggerMutex_;
inline std::string LoggerManager::logDir_;
inline std::atomic<int> LoggerManager::currentDay_{0};
inline std::atomic<bool> LoggerManager::consoleEnabled_{true};
