#include "watchdog.hpp"
#include "alert_messages.hpp"
#include "logging.hpp"

#include <limits>

Watchdog::Watchdog(const Clock& clock, NotificationRouter& router)
    : clock_(clock), router_(router) {}

bool Watchdog::dispatch(const std::string& alert) {
    const bool ok = router_.send(alert);
    std::lock_guard<std::mutex> lock(mutex_);
    if (ok) {
        alerts_sent_++;
    } else {
        alerts_failed_++;
    }
    return ok;
}

std::string Watchdog::stop_locked(const std::string& reason, WallTime now) {
    running_ = false;
    timeout_signaled_ = false;
    log_info("WATCHDOG", "auto-stopped - reason: %s", reason.c_str());
    return format_stop_alert(reason, now);
}

bool Watchdog::feed(std::optional<uint32_t> timeout_ms, const std::string& info) {
    std::string alert;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const WallTime now = clock_.now();
        const MonoTime mono = clock_.monotonic_now();

        if (!running_) {
            const uint32_t actual = timeout_ms.value_or(kDefaultTimeoutMs);
            log_debug("WATCHDOG", "not running, auto-starting with timeout %ums, info: %s",
                      static_cast<unsigned>(actual), info.c_str());
            timeout_ms_ = actual;
            start_info_ = info;
            last_feed_ = now;
            last_feed_mono_ = mono;
            timeout_signaled_ = false;
            running_ = true;
            log_info("WATCHDOG", "auto-started - timeout: %ums, info: %s",
                     static_cast<unsigned>(actual), info.c_str());
            alert = format_start_alert(actual, info, now);
        } else {
            last_feed_ = now;
            last_feed_mono_ = mono;
            timeout_signaled_ = false;
            log_debug("WATCHDOG", "fed at %s", format_timestamp(now).c_str());

            if (timeout_ms) {
                const uint32_t old_timeout = timeout_ms_;
                timeout_ms_ = *timeout_ms;
                log_info("WATCHDOG", "timeout updated - old: %ums, new: %ums, info: %s",
                         static_cast<unsigned>(old_timeout), static_cast<unsigned>(timeout_ms_), info.c_str());
                alert = format_update_alert(old_timeout, timeout_ms_, info, now);
            }
        }
    }

    // Best effort: delivery does not affect the result.
    if (!alert.empty()) {
        dispatch(alert);
    }
    return true;
}

bool Watchdog::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return false;
    }

    // A running watchdog always has a feed time; a missing one counts as expired.
    const double elapsed = last_feed_mono_ ? elapsed_ms(*last_feed_mono_, clock_.monotonic_now())
                                           : std::numeric_limits<double>::infinity();
    const bool expired = elapsed > static_cast<double>(timeout_ms_);

    if (expired && !timeout_signaled_) {
        timeout_signaled_ = true;
        episodes_++;
        log_debug("WATCHDOG", "timeout detected - elapsed: %.1fms, timeout: %ums",
                  elapsed, static_cast<unsigned>(timeout_ms_));
        return true;
    }

    log_debug("WATCHDOG", "poll - elapsed: %.1fms, timeout: %ums, expired: %d, already_signaled: %d",
              elapsed, static_cast<unsigned>(timeout_ms_), expired ? 1 : 0, timeout_signaled_ ? 1 : 0);
    return false;
}

bool Watchdog::notify() {
    std::string timeout_alert;
    std::string stop_alert;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return false;
        }
        const WallTime now = clock_.now();
        const double elapsed = last_feed_mono_ ? elapsed_ms(*last_feed_mono_, clock_.monotonic_now())
                                               : std::numeric_limits<double>::infinity();

        timeout_alert = format_timeout_alert(start_info_, timeout_ms_, elapsed, last_feed_, now);
        log_info("WATCHDOG", "timeout alert - elapsed: %.1fms, threshold: %ums, auto-stopping",
                 elapsed, static_cast<unsigned>(timeout_ms_));

        // Auto-stop regardless of delivery so one episode yields one alert.
        stop_alert = stop_locked("Timeout occurred", now);
    }

    const bool sent = dispatch(timeout_alert);
    dispatch(stop_alert);
    return sent;
}

bool Watchdog::manual_stop(const std::string& info) {
    std::string alert;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            log_debug("WATCHDOG", "manual stop ignored, not running");
            return false;
        }
        alert = stop_locked("Manual stop - " + info, clock_.now());
    }
    dispatch(alert);
    return true;
}

bool Watchdog::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool Watchdog::timeout_occurred() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeout_signaled_;
}

uint32_t Watchdog::current_timeout_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeout_ms_;
}

WatchdogStatus Watchdog::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {running_, timeout_signaled_, timeout_ms_, episodes_, alerts_sent_, alerts_failed_};
}
