#pragma once

#include "modules/meter/Meter.Probe.hpp"
#include "common/protocol/pzem/Pzem.hpp"
#include "common/serial/Transport.hpp"
#include "common/utils/Clock.hpp"

namespace pzem {

/** 会话状态（Faulted 不粘滞，后续操作各自重新尝试） */
enum class SessionState {
    Uninitialized,
    Ready,
    Faulted
};

inline const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::Ready: return "Ready";
        case SessionState::Faulted: return "Faulted";
    }
    return "Unknown";
}

/**
 * @brief PZEM-004T 设备会话
 *
 * 职责：
 * 1. 持有从站地址、最近一次测量快照及其刷新时间
 * 2. 按 写请求 → 固定等待 → 读应答 → 校验 的时序与设备交互
 * 3. 刷新失败时保留旧快照和时间戳，错误原样抛给调用方
 *
 * 会话独占链路，所有操作同步阻塞，内部不重试。
 * 非线程安全：多线程共用时由调用方在每次操作外加锁。
 */
class PzemProbe : public Probe {
    struct ConstructTag {
        explicit ConstructTag() = default;
    };

public:
    /**
     * @brief 在已打开的链路上建立会话
     * @param transport 链路（会话独占）
     * @param requestedAddress 期望地址，0 或超出 0x01-0xF8 时使用通用地址 0xF8
     * @param responseTimeout 链路读超时
     * @param clock 时钟，默认单调时钟
     * @throws ConfigException 链路为空或标识为空
     * @throws AppException 写入地址失败（此时不产生会话）
     */
    static std::unique_ptr<PzemProbe> open(std::unique_ptr<Transport> transport,
                                           uint8_t requestedAddress,
                                           std::chrono::milliseconds responseTimeout,
                                           std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>()) {
        if (!transport || transport->identifier().empty()) {
            throw ConfigException("transport identifier must be set");
        }
        if (!clock) {
            throw ConfigException("clock must be set");
        }

        transport->setReadTimeout(responseTimeout);

        uint8_t resolved = resolveAddress(requestedAddress);
        auto probe = std::make_unique<PzemProbe>(ConstructTag{}, std::move(transport), std::move(clock));

        if (resolved != DEFAULT_ADDRESS) {
            probe->setAddress(resolved);
        }

        LOG_INFO << "[Pzem] Session opened on " << probe->transport_->identifier()
                 << ", address=0x" << hexByte(probe->address_);
        return probe;
    }

    /** 仅供 open() 使用 */
    PzemProbe(ConstructTag, std::unique_ptr<Transport> transport, std::shared_ptr<Clock> clock)
        : transport_(std::move(transport)), clock_(std::move(clock)) {}

    ~PzemProbe() override {
        close();
    }

    PzemProbe(const PzemProbe&) = delete;
    PzemProbe& operator=(const PzemProbe&) = delete;

    // ==================== 测量值 ====================

    double voltage() override { return current().voltage; }
    double intensity() override { return current().current; }
    double power() override { return current().power; }
    double energy() override { return current().energy; }
    double frequency() override { return current().frequency; }
    double powerFactor() override { return current().powerFactor; }
    uint16_t alarm() override { return current().alarm; }
    bool isAlarmActive() override { return current().isAlarmActive(); }
    Measurement snapshot() override { return current(); }

    /**
     * @brief 刷新测量快照（距上次成功刷新不足 REFRESH_INTERVAL 时直接返回）
     *
     * 读取 0x0000 起 10 个输入寄存器，应答 25 字节。
     * 任一步失败都不改动快照和时间戳。
     */
    void refresh() {
        ensureOpen();
        guarded([this] {
            if (lastRefresh_ && clock_->now() - *lastRefresh_ < REFRESH_INTERVAL) {
                LOG_TRACE << "[Pzem] Snapshot still fresh, skip read";
                return;
            }

            sendCommand(FuncCodes::READ_INPUT_REGISTERS, InputRegisters::BLOCK_START,
                        InputRegisters::BLOCK_COUNT, false);
            auto payload = receive(MEASUREMENT_FRAME_LENGTH);
            Measurement decoded = RegisterDecoder::decodeMeasurement(payload);

            snapshot_ = decoded;
            lastRefresh_ = clock_->now();

            LOG_DEBUG << "[Pzem] Refreshed: U=" << decoded.voltage << "V I=" << decoded.current
                      << "A P=" << decoded.power << "W E=" << decoded.energy
                      << " F=" << decoded.frequency << "Hz PF=" << decoded.powerFactor
                      << " alarm=0x" << toHex(decoded.alarm, 4);
        });
    }

    // ==================== 配置与指令 ====================

    /**
     * @brief 电能清零
     * 发送 4 字节复位帧，等待 RESET_SETTLE_DELAY 后读取 4 字节应答
     * 不影响测量快照的新鲜度，刷新周期内的读数仍来自缓存
     */
    void resetEnergy() override {
        ensureOpen();
        guarded([this] {
            auto frame = PzemUtils::buildResetFrame(address_);
            transmit(frame);
            clock_->sleepFor(RESET_SETTLE_DELAY);
            receive(RESET_FRAME_LENGTH);

            LOG_INFO << "[Pzem] Energy counter reset, address=0x" << hexByte(address_);
        });
    }

    /**
     * @brief 写入新的从站地址（回显校验通过后才切换会话地址）
     * @throws InvalidAddressException 地址超出 0x01-0xF7，此时不发送任何字节
     */
    void setAddress(uint8_t newAddress) override {
        ensureOpen();
        if (!isValidSlaveAddress(newAddress)) {
            throw InvalidAddressException(newAddress);
        }

        guarded([this, newAddress] {
            sendCommand(FuncCodes::WRITE_SINGLE_REGISTER, HoldingRegisters::SLAVE_ADDRESS, newAddress, true);
            LOG_INFO << "[Pzem] Slave address changed 0x" << hexByte(address_)
                     << " -> 0x" << hexByte(newAddress);
            address_ = newAddress;
        });
    }

    void setAlarmThreshold(uint16_t watts) override {
        ensureOpen();
        guarded([this, watts] {
            sendCommand(FuncCodes::WRITE_SINGLE_REGISTER, HoldingRegisters::ALARM_THRESHOLD, watts, true);
            LOG_INFO << "[Pzem] Alarm threshold set to " << watts << "W";
        });
    }

    uint16_t readAlarmThreshold() override {
        ensureOpen();
        return guarded([this] {
            sendCommand(FuncCodes::READ_HOLDING_REGISTERS, HoldingRegisters::ALARM_THRESHOLD, 1, false);
            auto payload = receive(HOLDING_FRAME_LENGTH);
            return RegisterDecoder::decodeHoldingRegister(payload);
        });
    }

    uint8_t address() const override { return address_; }

    SessionState state() const { return state_; }

    /** 最近一次成功刷新的时间（从未刷新则为空） */
    std::optional<Clock::TimePoint> lastRefreshTime() const { return lastRefresh_; }

    /**
     * @brief 关闭链路，会话回到 Uninitialized
     */
    void close() {
        if (state_ == SessionState::Uninitialized) return;
        if (transport_) {
            transport_->close();
        }
        state_ = SessionState::Uninitialized;
    }

private:
    std::unique_ptr<Transport> transport_;
    std::shared_ptr<Clock> clock_;
    uint8_t address_ = DEFAULT_ADDRESS;
    Measurement snapshot_;
    std::optional<Clock::TimePoint> lastRefresh_;
    SessionState state_ = SessionState::Ready;

    static uint8_t resolveAddress(uint8_t requested) {
        if (requested < MIN_SLAVE_ADDRESS || requested > DEFAULT_ADDRESS) {
            return DEFAULT_ADDRESS;
        }
        return requested;
    }

    static std::string toHex(unsigned value, int width) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setw(width) << std::setfill('0') << value;
        return oss.str();
    }

    static std::string hexByte(uint8_t value) {
        return toHex(value, 2);
    }

    void ensureOpen() const {
        if (state_ == SessionState::Uninitialized) {
            throw ConfigException("session is closed");
        }
    }

    /** 执行一次设备操作并按结果更新会话状态 */
    template<typename Fn>
    std::invoke_result_t<Fn> guarded(Fn&& fn) {
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
                fn();
                state_ = SessionState::Ready;
            } else {
                auto result = fn();
                state_ = SessionState::Ready;
                return result;
            }
        } catch (const AppException&) {
            state_ = SessionState::Faulted;
            throw;
        }
    }

    const Measurement& current() {
        refresh();
        return snapshot_;
    }

    /**
     * @brief 发送单寄存器指令
     * @param check 为 true 时读取 8 字节应答并做回显校验
     */
    void sendCommand(uint8_t functionCode, uint16_t reg, uint16_t value, bool check) {
        auto frame = PzemUtils::buildRegisterFrame(address_, functionCode, reg, value);
        transmit(frame);
        clock_->sleepFor(COMMAND_DELAY);

        if (check) {
            auto reply = receive(REGISTER_FRAME_LENGTH);
            PzemUtils::verifyEcho(frame, reply);
        }
    }

    void transmit(const std::vector<uint8_t>& frame) {
        transport_->discardInput();
        LOG_TRACE << "[Pzem] TX " << PzemUtils::toHexString(frame);

        size_t sent = transport_->write(frame);
        if (sent < frame.size()) {
            throw IoException("try to send " + std::to_string(frame.size()) + " bytes, but "
                              + std::to_string(sent) + " sent");
        }
    }

    std::vector<uint8_t> receive(size_t expectedLength) {
        std::vector<uint8_t> buffer(expectedLength);
        size_t n = transport_->read(buffer.data(), buffer.size());
        buffer.resize(n);

        // 期望帧短于异常帧时，异常应答会被截断在期望长度处，需补读剩余字节
        if (n == expectedLength && expectedLength < EXCEPTION_FRAME_LENGTH && n >= 2
            && (buffer[1] & FuncCodes::ERROR_MARKER)) {
            buffer.resize(EXCEPTION_FRAME_LENGTH);
            size_t extra = transport_->read(buffer.data() + n, EXCEPTION_FRAME_LENGTH - n);
            buffer.resize(n + extra);
            expectedLength = EXCEPTION_FRAME_LENGTH;
        }

        LOG_TRACE << "[Pzem] RX " << PzemUtils::toHexString(buffer);
        return PzemUtils::parseResponse(buffer, expectedLength);
    }
};

}  // namespace pzem
