#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "clock.hpp"

// "%Y-%m-%d %H:%M:%S", local time.
std::string format_timestamp(WallTime t);

std::string format_start_alert(uint32_t timeout_ms, const std::string& info, WallTime now);
std::string format_update_alert(uint32_t old_timeout_ms, uint32_t new_timeout_ms, const std::string& info, WallTime now);
std::string format_stop_alert(const std::string& reason, WallTime now);
std::string format_timeout_alert(const std::string& start_info,
                                 uint32_t timeout_ms,
                                 double elapsed_time_ms,
                                 const std::optional<WallTime>& last_feed,
                                 WallTime now);
