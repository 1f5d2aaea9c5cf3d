#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "clock.hpp"
#include "notification_router.hpp"

struct WatchdogStatus {
    bool running;
    bool timeout_occurred;
    uint32_t timeout_ms;
    uint32_t episodes;
    uint32_t alerts_sent;
    uint32_t alerts_failed;
};

// Liveness watchdog for one monitored subject.
//
// Idle until the first feed() arms it. While Running, poll() reports a
// timeout once per episode (the latch is cleared by the next feed). notify()
// sends the timeout alert and returns the watchdog to Idle whether or not the
// alert was delivered.
//
// All state is guarded by one mutex. Alerts are formatted under the mutex but
// dispatched after it is released, so a slow channel never blocks feed/poll.
class Watchdog {
public:
    static constexpr uint32_t kDefaultTimeoutMs = 30000;

    Watchdog(const Clock& clock, NotificationRouter& router);

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    // Arms when Idle (timeout_ms or kDefaultTimeoutMs). When Running, resets
    // the timer and, if timeout_ms is given, replaces the threshold.
    bool feed(std::optional<uint32_t> timeout_ms = std::nullopt, const std::string& info = "");

    // True exactly once per timeout episode. Never sends anything.
    bool poll();

    // Sends the timeout alert and auto-stops. Returns delivery result.
    bool notify();

    bool manual_stop(const std::string& info = "");

    bool is_running() const;
    bool timeout_occurred() const;
    uint32_t current_timeout_ms() const;
    WatchdogStatus status() const;

private:
    std::string stop_locked(const std::string& reason, WallTime now);
    bool dispatch(const std::string& alert);

    const Clock& clock_;
    NotificationRouter& router_;

    mutable std::mutex mutex_;
    bool running_ = false;
    bool timeout_signaled_ = false;
    uint32_t timeout_ms_ = 0;
    std::optional<WallTime> last_feed_;
    std::optional<MonoTime> last_feed_mono_;
    std::string start_info_;
    uint32_t episodes_ = 0;
    uint32_t alerts_sent_ = 0;
    uint32_t alerts_failed_ = 0;
};
