#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace {
std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

uint32_t env_u32(const char* name, uint32_t fallback) {
    const std::string raw = env_or_empty(name);
    if (raw.empty()) {
        return fallback;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(raw.c_str(), &end, 10);
    if (errno != 0 || end == raw.c_str() || *end != '\0' || parsed > UINT32_MAX || raw[0] == '-') {
        log_warn("CONFIG", "%s=%s is not a valid value, using %u", name, raw.c_str(), static_cast<unsigned>(fallback));
        return fallback;
    }
    return static_cast<uint32_t>(parsed);
}
} // namespace

NotifyConfig load_config() {
    NotifyConfig cfg{};
    cfg.telegram_bot_token = env_or_empty("LW_TELEGRAM_BOT_TOKEN");
    cfg.telegram_chat_id = env_or_empty("LW_TELEGRAM_CHAT_ID");
    cfg.wechat_webhook_key = env_or_empty("LW_WECHAT_WEBHOOK_KEY");
    cfg.http_timeout_ms = env_u32("LW_HTTP_TIMEOUT_MS", cfg.http_timeout_ms);
    cfg.poll_interval_ms = env_u32("LW_POLL_INTERVAL_MS", cfg.poll_interval_ms);

    const std::string default_name = env_or_empty("LW_DEFAULT_NOTIFY");
    if (!default_name.empty()) {
        cfg.default_channel = parse_notify_channel(default_name);
        if (!cfg.default_channel) {
            log_warn("CONFIG", "unknown default channel '%s' ignored", default_name.c_str());
        }
    }

    const std::string level_name = env_or_empty("LW_LOG_LEVEL");
    if (!level_name.empty()) {
        const auto level = parse_log_level(level_name);
        if (level) {
            cfg.log_level = *level;
        } else {
            log_warn("CONFIG", "unknown log level '%s' ignored", level_name.c_str());
        }
    }
    return cfg;
}

const char* notify_channel_name(NotifyChannel channel) {
    switch (channel) {
        case NotifyChannel::Telegram:
            return "telegram";
        case NotifyChannel::WeChat:
            return "wechat";
    }
    return "unknown";
}

std::optional<NotifyChannel> parse_notify_channel(const std::string& name) {
    const std::string key = lowercase(name);
    for (const auto channel : kAllNotifyChannels) {
        if (key == notify_channel_name(channel)) {
            return channel;
        }
    }
    return std::nullopt;
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    const std::string key = lowercase(name);
    if (key == "debug") return LogLevel::Debug;
    if (key == "info") return LogLevel::Info;
    if (key == "warn" || key == "warning") return LogLevel::Warn;
    if (key == "error") return LogLevel::Error;
    return std::nullopt;
}

bool is_channel_configured(const NotifyConfig& cfg, NotifyChannel channel) {
    switch (channel) {
        case NotifyChannel::Telegram:
            return !cfg.telegram_bot_token.empty() && !cfg.telegram_chat_id.empty();
        case NotifyChannel::WeChat:
            return !cfg.wechat_webhook_key.empty();
    }
    return false;
}

std::optional<NotifyChannel> default_channel(const NotifyConfig& cfg) {
    return cfg.default_channel;
}

std::vector<NotifyChannel> enabled_channels(const NotifyConfig& cfg) {
    std::vector<NotifyChannel> out;
    for (const auto channel : kAllNotifyChannels) {
        if (is_channel_configured(cfg, channel)) {
            out.push_back(channel);
        }
    }
    return out;
}

std::vector<NotifyChannel> notification_try_order(const NotifyConfig& cfg) {
    const std::vector<NotifyChannel> enabled = enabled_channels(cfg);
    std::vector<NotifyChannel> order;
    order.reserve(enabled.size());

    const auto preferred = default_channel(cfg);
    if (preferred && std::find(enabled.begin(), enabled.end(), *preferred) != enabled.end()) {
        order.push_back(*preferred);
    }
    for (const auto channel : enabled) {
        if (std::find(order.begin(), order.end(), channel) == order.end()) {
            order.push_back(channel);
        }
    }
    return order;
}
