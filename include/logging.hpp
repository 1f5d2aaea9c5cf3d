#pragma once

#include <cstdint>

enum class LogLevel : uint8_t {
    Debug = 0,
    Info,
    Warn,
    Error,
};

void init_logging(LogLevel level = LogLevel::Info);
void set_log_level(LogLevel level);
LogLevel log_level();
const char* log_level_name(LogLevel level);

// printf-style, one line per call: "[TAG] message". Warn/Error go to stderr.
void log_debug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_error(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
