#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "watchdog.hpp"

// Periodic poll/notify driver for a Watchdog. Detection latency is bounded by
// poll_interval_ms on top of the watchdog's own threshold.
class WatchdogMonitor {
public:
    WatchdogMonitor(Watchdog& watchdog, uint32_t poll_interval_ms);
    ~WatchdogMonitor();

    WatchdogMonitor(const WatchdogMonitor&) = delete;
    WatchdogMonitor& operator=(const WatchdogMonitor&) = delete;

    // One poll; runs notify() if it reported a timeout. Returns true in that case.
    bool tick();

    bool start();
    void stop();
    bool active() const;
    uint32_t ticks() const;

private:
    void run();

    Watchdog& watchdog_;
    const uint32_t poll_interval_ms_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::thread worker_;
    bool active_ = false;
    bool stop_requested_ = false;
    uint32_t ticks_ = 0;
};
