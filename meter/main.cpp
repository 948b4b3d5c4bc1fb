// mimalloc: 全局替换 new/delete
#include <mimalloc-new-delete.h>

#include "common/utils/ConfigManager.hpp"
#include "common/serial/SerialTransport.hpp"
#include "modules/meter/Meter.Session.hpp"

namespace {

std::atomic<bool> stopRequested{false};

void onSignal(int) {
    stopRequested.store(true);
}

}  // namespace

// ─── 错误输出 ──────────────────────────────────────────────

/**
 * @brief 输出致命错误到控制台和日志
 */
void printFatalError(const std::string& title, const std::string& detail,
                     const std::vector<std::string>& hints = {}) {
    std::string border(60, '=');
    std::cerr << "\n" << border << "\n";
    std::cerr << " [ERROR] " << title << "\n";
    std::cerr << std::string(60, '-') << "\n";
    std::cerr << "  " << detail << "\n";
    if (!hints.empty()) {
        std::cerr << "\n  请检查:\n";
        for (const auto& hint : hints) {
            std::cerr << "    - " << hint << "\n";
        }
    }
    std::cerr << border << "\n" << std::endl;

    LOG_ERROR << "[Main] " << title << ": " << detail;
}

/**
 * @brief 根据失败阶段和错误码返回排查提示
 */
std::vector<std::string> getStageHints(const std::string& stage, int code) {
    if (code == ErrorCodes::IO_ERROR || stage == "serial:open") {
        return {
            "串口设备路径是否正确（如 /dev/ttyUSB0）",
            "当前用户是否有串口读写权限（dialout 组）",
            "串口是否被其他程序占用",
        };
    }
    if (code == ErrorCodes::SHORT_READ) {
        return {
            "电能表是否上电、A/B 线是否接反",
            "波特率是否与设备一致（默认 9600）",
            "从站地址是否正确，serial.timeout_ms 是否过短",
        };
    }
    if (code == ErrorCodes::BAD_CHECKSUM || code == ErrorCodes::ECHO_MISMATCH) {
        return {
            "线路是否受干扰、接地是否良好",
            "总线上是否有其他设备同时应答",
        };
    }
    if (code == ErrorCodes::DEVICE_ERROR) {
        return {
            "设备型号是否为 PZEM-004T v3",
            "写入的地址/阈值是否在设备允许范围内",
        };
    }
    if (code == ErrorCodes::CONFIG_ERROR || code == ErrorCodes::INVALID_ADDRESS) {
        return {
            "config 中 serial / device 配置是否正确",
        };
    }
    return {};
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <serial-port>\n"
              << "  serial-port 也可在 config/config.json 的 serial.port 中配置" << std::endl;
}

/**
 * @brief 打印一轮读数（各访问器在刷新周期内复用同一快照）
 */
void printReadings(pzem::Probe& probe) {
    double voltage = probe.voltage();
    double intensity = probe.intensity();
    double power = probe.power();
    double frequency = probe.frequency();
    double energy = probe.energy();
    double powerFactor = probe.powerFactor();
    bool alarm = probe.isAlarmActive();

    std::cout << "\n" << trantor::Date::now().toFormattedStringLocal(false) << "\n"
              << std::fixed << std::setprecision(6)
              << "Voltage: " << voltage << "\n"
              << "Intensity: " << intensity << "\n"
              << "Power: " << power << "\n"
              << "Frequency: " << frequency << "\n"
              << "Energy: " << energy << "\n"
              << "PowerFactor: " << powerFactor << "\n"
              << "Alarm: " << (alarm ? "ON" : "OFF") << std::endl;
}

int main(int argc, char* argv[]) {
    // 1. 初始化日志系统（AsyncFileLogger 异步写盘 + 按日期轮转）
    LoggerManager::initialize(Constants::DEFAULT_LOG_DIR, true);

    int v = mi_version();
    LOG_INFO << "[Main] mimalloc v" << (v / 100) << "." << (v % 100) << " active";

    if (argc > 2) {
        printUsage(argv[0]);
        return 1;
    }

    // 2. 加载并验证配置文件（失败时 ConfigManager 已输出详细错误）
    if (!ConfigManager::load()) {
        std::cerr << "Startup aborted due to configuration errors." << std::endl;
        return 1;
    }
    if (argc == 2) {
        ConfigManager::overridePort(argv[1]);
    }

    const AppConfig& config = ConfigManager::get();
    if (config.port.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    // 3. 应用配置
    LoggerManager::setLogLevel(config.logLevel);
    LoggerManager::setConsoleEnabled(config.consoleLog);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // 4. 打开串口与设备会话
    std::unique_ptr<pzem::PzemProbe> probe;
    std::string stage = "serial:open";
    try {
        auto timeout = std::chrono::milliseconds(config.timeoutMs);
        auto transport = SerialTransport::open(config.port, config.baudRate, timeout);

        stage = "session:open";
        probe = pzem::PzemProbe::open(std::move(transport), config.slaveAddress, timeout);

        if (config.resetEnergyOnStart) {
            stage = "device:reset-energy";
            probe->resetEnergy();
        }

        if (config.alarmThreshold) {
            stage = "device:alarm-threshold";
            probe->setAlarmThreshold(*config.alarmThreshold);
            LOG_INFO << "[Main] Alarm threshold read back: " << probe->readAlarmThreshold() << "W";
        }
    } catch (const AppException& e) {
        printFatalError("启动阶段失败: " + stage, e.what(), getStageHints(stage, e.getCode()));
        LoggerManager::close();
        return 1;
    }

    // 5. 周期打印读数，任一错误即退出
    trantor::EventLoop loop;
    bool failed = false;

    loop.runEvery(std::chrono::milliseconds(config.pollIntervalMs), [&]() {
        try {
            printReadings(*probe);
        } catch (const AppException& e) {
            printFatalError("读取失败 (" + std::string(pzem::sessionStateToString(probe->state())) + ")",
                            e.what(), getStageHints("poll", e.getCode()));
            failed = true;
            loop.quit();
        }
    });

    loop.runEvery(0.2, [&]() {
        if (stopRequested.load()) {
            LOG_INFO << "[Main] Stop requested";
            loop.quit();
        }
    });

    LOG_INFO << "[Main] Polling " << config.port << " every " << config.pollIntervalMs << "ms";
    loop.loop();

    // 6. 退出清理
    probe->close();
    LOG_INFO << "[Main] Exit";
    LoggerManager::close();
    return failed ? 1 : 0;
}
