#include "watchdog_monitor.hpp"
#include "logging.hpp"

#include <chrono>

WatchdogMonitor::WatchdogMonitor(Watchdog& watchdog, uint32_t poll_interval_ms)
    : watchdog_(watchdog), poll_interval_ms_(poll_interval_ms == 0 ? 1 : poll_interval_ms) {}

WatchdogMonitor::~WatchdogMonitor() {
    stop();
}

bool WatchdogMonitor::tick() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ticks_++;
    }
    if (!watchdog_.poll()) {
        return false;
    }
    const bool delivered = watchdog_.notify();
    if (!delivered) {
        log_warn("MONITOR", "timeout alert was not delivered on any channel");
    }
    return true;
}

bool WatchdogMonitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        return false;
    }
    stop_requested_ = false;
    active_ = true;
    worker_ = std::thread(&WatchdogMonitor::run, this);
    log_info("MONITOR", "started, poll interval %ums", static_cast<unsigned>(poll_interval_ms_));
    return true;
}

void WatchdogMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || stop_requested_) {
            return;
        }
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = false;
    log_info("MONITOR", "stopped after %u tick(s)", static_cast<unsigned>(ticks_));
}

bool WatchdogMonitor::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

uint32_t WatchdogMonitor::ticks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ticks_;
}

void WatchdogMonitor::run() {
    const auto period = std::chrono::milliseconds(poll_interval_ms_);
    auto next_wake = std::chrono::steady_clock::now() + period;
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (wake_.wait_until(lock, next_wake, [this] { return stop_requested_; })) {
                return;
            }
        }
        tick();
        next_wake += period;
        const auto now = std::chrono::steady_clock::now();
        if (next_wake < now) {
            next_wake = now + period;
        }
    }
}
