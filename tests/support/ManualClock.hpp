#pragma once

#include "common/utils/Clock.hpp"

/** 手动时钟：sleepFor 只推进时间并记录等待 */
class ManualClock : public Clock {
public:
    TimePoint now() const override { return now_; }

    void sleepFor(std::chrono::milliseconds duration) override {
        sleeps.push_back(duration);
        now_ += duration;
    }

    void advance(std::chrono::milliseconds duration) { now_ += duration; }

    std::vector<std::chrono::milliseconds> sleeps;

private:
    TimePoint now_{std::chrono::hours(1)};
};
