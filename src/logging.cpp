#include "logging.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace {
std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_write_mutex;

void vlog(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (level < g_level.load()) {
        return;
    }
    char line[1024];
    std::vsnprintf(line, sizeof(line), fmt, args);

    FILE* out = level >= LogLevel::Warn ? stderr : stdout;
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fprintf(out, "[%s] %s\n", tag ? tag : "-", line);
    std::fflush(out);
}
} // namespace

void init_logging(LogLevel level) {
    g_level.store(level);
}

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Info:
            return "info";
        case LogLevel::Error:
            return "error";
    }
    return "unknown";
}

void log_debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, tag, fmt, args);
    va_end(args);
}

void log_info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, tag, fmt, args);
    va_end(args);
}

void log_warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warn, tag, fmt, args);
    va_end(args);
}

void log_error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, tag, fmt, args);
    va_end(args);
}
