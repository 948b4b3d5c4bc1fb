#pragma once

#include "common/protocol/pzem/Pzem.Types.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/LoggerManager.hpp"

namespace fs = std::filesystem;

/**
 * @brief 应用配置
 */
struct AppConfig {
    // 串口
    std::string port;
    int baudRate = pzem::DEFAULT_BAUD_RATE;
    int timeoutMs = Constants::DEFAULT_SERIAL_TIMEOUT_MS;

    // 设备
    uint8_t slaveAddress = pzem::DEFAULT_ADDRESS;
    std::optional<uint16_t> alarmThreshold;
    bool resetEnergyOnStart = false;

    // 采集/日志
    int pollIntervalMs = Constants::DEFAULT_POLL_INTERVAL_MS;
    std::string logLevel = "INFO";
    bool consoleLog = true;
};

/**
 * @brief 配置管理器 - 负责加载、验证和管理应用配置
 *
 * 启动时检查配置文件的完整性和正确性：
 * - JSON 语法检查
 * - 类型与取值范围校验（波特率、超时、从站地址、告警阈值）
 * - 不合理但可运行的取值给出警告
 *
 * 配置文件可选：未找到时使用默认值，串口由命令行参数指定。
 */
class ConfigManager {
public:
    /**
     * @brief 查找、加载并验证配置文件
     * @return 是否成功，失败时已输出详细错误信息到 stderr 和日志
     */
    static bool load() {
        config_ = AppConfig{};
        loadedPath_.reset();

        auto configPath = findConfigFile();
        if (!configPath) {
            LOG_INFO << "[Config] No config file found, using defaults";
            return true;
        }
        return loadFile(*configPath);
    }

    /**
     * @brief 从指定路径加载并验证配置
     */
    static bool loadFile(const std::string& path) {
        config_ = AppConfig{};
        loadedPath_.reset();

        Json::Value root;
        if (!parseConfigFile(path, root)) {
            return false;
        }

        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        validateConfig(root, errors, warnings);

        // 先输出警告（不阻断启动）
        if (!warnings.empty()) {
            printWarnings("配置警告 (" + path + ")", warnings);
        }

        // 有错误则中断启动
        if (!errors.empty()) {
            printErrors("配置验证失败: " + path, errors);
            return false;
        }

        config_ = fromJson(root);
        loadedPath_ = path;
        LOG_INFO << "[Config] Config loaded from: " << path;
        return true;
    }

    static const AppConfig& get() {
        return config_;
    }

    /** 命令行指定的串口优先于配置文件 */
    static void overridePort(const std::string& port) {
        config_.port = port;
    }

    static const std::optional<std::string>& loadedPath() {
        return loadedPath_;
    }

    // ─── 配置验证 ──────────────────────────────────────────────

    static void validateConfig(const Json::Value& root,
                               std::vector<std::string>& errors,
                               std::vector<std::string>& warnings) {
        if (!root.isObject()) {
            errors.emplace_back("配置文件根节点必须是 JSON 对象");
            return;
        }

        validateSerial(root, errors);
        validateDevice(root, errors, warnings);
        validateRuntime(root, errors, warnings);
    }

    /**
     * @brief 将已通过验证的 JSON 转为 AppConfig
     */
    static AppConfig fromJson(const Json::Value& root) {
        AppConfig config;

        if (root.isMember("serial")) {
            const auto& serial = root["serial"];
            config.port = serial.get("port", "").asString();
            config.baudRate = serial.get("baud_rate", pzem::DEFAULT_BAUD_RATE).asInt();
            if (config.baudRate == 0) {
                config.baudRate = pzem::DEFAULT_BAUD_RATE;
            }
            config.timeoutMs = serial.get("timeout_ms", Constants::DEFAULT_SERIAL_TIMEOUT_MS).asInt();
        }

        if (root.isMember("device")) {
            const auto& device = root["device"];
            int address = device.get("slave_address", static_cast<int>(pzem::DEFAULT_ADDRESS)).asInt();
            if (address < pzem::MIN_SLAVE_ADDRESS || address > pzem::DEFAULT_ADDRESS) {
                address = pzem::DEFAULT_ADDRESS;
            }
            config.slaveAddress = static_cast<uint8_t>(address);

            if (device.isMember("alarm_threshold") && !device["alarm_threshold"].isNull()) {
                config.alarmThreshold = static_cast<uint16_t>(device["alarm_threshold"].asInt());
            }
        }

        config.resetEnergyOnStart = root.get("reset_energy_on_start", false).asBool();
        config.pollIntervalMs = root.get("poll_interval_ms", Constants::DEFAULT_POLL_INTERVAL_MS).asInt();
        config.logLevel = root.get("log_level", "INFO").asString();
        config.consoleLog = root.get("console_log", true).asBool();
        return config;
    }

private:
    inline static AppConfig config_;
    inline static std::optional<std::string> loadedPath_;

    // ─── 配置文件查找 ───────────────────────────────────────────

    static std::optional<std::string> findConfigFile() {
        static const std::vector<std::string> paths = {
            "./config/config.local.json",
            "../config/config.local.json",
            "./config/config.json",
            "../config/config.json",
            "config.json"
        };

        for (const auto& path : paths) {
            if (fs::exists(path)) {
                return path;
            }
        }
        return std::nullopt;
    }

    // ─── JSON 解析 ──────────────────────────────────────────────

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printErrors("无法打开配置文件: " + path, {"请检查文件是否存在及读取权限"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            printErrors("JSON 解析失败: " + path, {
                errs,
                "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"
            });
            return false;
        }

        return true;
    }

    static void validateSerial(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("serial")) return;

        const auto& serial = root["serial"];
        if (!serial.isObject()) {
            errors.emplace_back("[serial] 必须是 JSON 对象");
            return;
        }

        if (serial.isMember("port") && !serial["port"].isString()) {
            errors.emplace_back("[serial] port 必须是字符串");
        }

        if (serial.isMember("baud_rate")) {
            if (!serial["baud_rate"].isInt()) {
                errors.emplace_back("[serial] baud_rate 必须是整数");
            } else {
                int baud = serial["baud_rate"].asInt();
                const auto& supported = Constants::SUPPORTED_BAUD_RATES;
                if (baud != 0 && std::find(supported.begin(), supported.end(), baud) == supported.end()) {
                    errors.push_back("[serial] baud_rate 值无效: " + std::to_string(baud) +
                                     "（支持: 1200/2400/4800/9600/19200/38400/57600/115200）");
                }
            }
        }

        if (serial.isMember("timeout_ms")) {
            if (!serial["timeout_ms"].isInt()) {
                errors.emplace_back("[serial] timeout_ms 必须是整数");
            } else if (serial["timeout_ms"].asInt() <= 0) {
                errors.emplace_back("[serial] timeout_ms 必须大于 0");
            }
        }
    }

    static void validateDevice(const Json::Value& root,
                               std::vector<std::string>& errors,
                               std::vector<std::string>& warnings) {
        if (!root.isMember("device")) return;

        const auto& device = root["device"];
        if (!device.isObject()) {
            errors.emplace_back("[device] 必须是 JSON 对象");
            return;
        }

        if (device.isMember("slave_address")) {
            if (!device["slave_address"].isInt()) {
                errors.emplace_back("[device] slave_address 必须是整数");
            } else {
                int address = device["slave_address"].asInt();
                if (address != 0 && (address < pzem::MIN_SLAVE_ADDRESS || address > pzem::DEFAULT_ADDRESS)) {
                    warnings.push_back("[device] slave_address 超出范围: " + std::to_string(address) +
                                       "（有效范围: 1-247，248 为通用地址），将使用通用地址 248");
                }
            }
        }

        if (device.isMember("alarm_threshold") && !device["alarm_threshold"].isNull()) {
            if (!device["alarm_threshold"].isInt()) {
                errors.emplace_back("[device] alarm_threshold 必须是整数");
            } else {
                int threshold = device["alarm_threshold"].asInt();
                if (threshold < 0 || threshold > Constants::MAX_ALARM_THRESHOLD) {
                    errors.push_back("[device] alarm_threshold 值无效: " + std::to_string(threshold) +
                                     "（有效范围: 0-65535 W）");
                }
            }
        }
    }

    static void validateRuntime(const Json::Value& root,
                                std::vector<std::string>& errors,
                                std::vector<std::string>& warnings) {
        if (root.isMember("poll_interval_ms")) {
            if (!root["poll_interval_ms"].isInt()) {
                errors.emplace_back("[poll_interval_ms] 必须是整数");
            } else {
                int interval = root["poll_interval_ms"].asInt();
                if (interval <= 0) {
                    errors.emplace_back("[poll_interval_ms] 必须大于 0");
                } else if (interval < pzem::REFRESH_INTERVAL.count()) {
                    warnings.push_back("[poll_interval_ms] " + std::to_string(interval) +
                                       "ms 小于设备刷新周期 " +
                                       std::to_string(pzem::REFRESH_INTERVAL.count()) +
                                       "ms，部分读数将重复");
                }
            }
        }

        if (root.isMember("reset_energy_on_start") && !root["reset_energy_on_start"].isBool()) {
            errors.emplace_back("[reset_energy_on_start] 必须是布尔值");
        }

        if (root.isMember("console_log") && !root["console_log"].isBool()) {
            errors.emplace_back("[console_log] 必须是布尔值");
        }

        if (root.isMember("log_level")) {
            if (!root["log_level"].isString() ||
                !LoggerManager::isValidLogLevel(root["log_level"].asString())) {
                errors.emplace_back("[log_level] 无效，可选: TRACE/DEBUG/INFO/WARN/ERROR/FATAL");
            }
        }
    }

    // ─── 工具方法 ──────────────────────────────────────────────

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        std::string border(60, '=');
        std::cerr << "\n" << border << "\n";
        std::cerr << " [ERROR] " << title << "\n";
        std::cerr << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] " << msg;
        }
        std::cerr << border << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '-') << "\n";
        std::cerr << " [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::string(60, '-') << "\n" << std::endl;
    }
};
