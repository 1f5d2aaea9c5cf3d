#pragma once

#include "clock.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>

// Hand-driven clock for host tests. Starts at a fixed, arbitrary instant.
// advance_ms() moves both time bases; step_wall_ms() and set() move only the
// wall clock, like an NTP or operator adjustment.
class ManualClock : public Clock {
public:
    ManualClock() : wall_(std::chrono::seconds(1700000000)), mono_(std::chrono::seconds(1000)) {}
    explicit ManualClock(WallTime start) : wall_(start), mono_(std::chrono::seconds(1000)) {}

    WallTime now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return wall_;
    }

    MonoTime monotonic_now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return mono_;
    }

    void set(WallTime t) {
        std::lock_guard<std::mutex> lock(mutex_);
        wall_ = t;
    }

    void advance_ms(int64_t ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        wall_ += std::chrono::milliseconds(ms);
        mono_ += std::chrono::milliseconds(ms);
    }

    void step_wall_ms(int64_t ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        wall_ += std::chrono::milliseconds(ms);
    }

private:
    mutable std::mutex mutex_;
    WallTime wall_;
    MonoTime mono_;
};
