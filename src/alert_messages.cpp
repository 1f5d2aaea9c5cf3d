#include "alert_messages.hpp"

#include <cstdio>
#include <ctime>

std::string format_timestamp(WallTime t) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm local{};
    localtime_r(&tt, &local);
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buf, n);
}

std::string format_start_alert(uint32_t timeout_ms, const std::string& info, WallTime now) {
    return "[WATCHDOG] Auto-Started\n\nTimeout: " + std::to_string(timeout_ms) +
           "ms\n\nInfo: " + info +
           "\n\nTime: " + format_timestamp(now);
}

std::string format_update_alert(uint32_t old_timeout_ms, uint32_t new_timeout_ms, const std::string& info, WallTime now) {
    return "[WATCHDOG] Timeout Updated\n\nOld Timeout: " + std::to_string(old_timeout_ms) +
           "ms\n\nNew Timeout: " + std::to_string(new_timeout_ms) +
           "ms\n\nInfo: " + info +
           "\n\nTime: " + format_timestamp(now);
}

std::string format_stop_alert(const std::string& reason, WallTime now) {
    return "[WATCHDOG] Auto-Stopped\n\nReason: " + reason +
           "\n\nTime: " + format_timestamp(now);
}

std::string format_timeout_alert(const std::string& start_info,
                                 uint32_t timeout_ms,
                                 double elapsed_time_ms,
                                 const std::optional<WallTime>& last_feed,
                                 WallTime now) {
    char elapsed[48];
    std::snprintf(elapsed, sizeof(elapsed), "%.1f", elapsed_time_ms);
    return "[WATCHDOG] Timeout Alert!\n\nStart Info: " + start_info +
           "\n\nTimeout Threshold: " + std::to_string(timeout_ms) +
           "ms\n\nElapsed Time: " + elapsed +
           "ms\n\nLast Feed: " + (last_feed ? format_timestamp(*last_feed) : std::string("Never")) +
           "\n\nAlert Time: " + format_timestamp(now);
}
