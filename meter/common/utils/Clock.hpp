#pragma once

/**
 * @brief 时钟抽象 - 会话的新鲜度判断和指令间固定等待都经由它完成
 */
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;

    /** 阻塞等待（设备应答时序要求的最小等待，不是轮询） */
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

/**
 * @brief 单调时钟实现
 */
class SteadyClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }

    void sleepFor(std::chrono::milliseconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};
