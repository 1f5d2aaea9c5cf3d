#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "logging.hpp"

enum class NotifyChannel : uint8_t {
    Telegram = 0,
    WeChat,
};

constexpr std::size_t kNotifyChannelCount = 2;

// Enumerated order; also the fallback order after the default channel.
constexpr std::array<NotifyChannel, kNotifyChannelCount> kAllNotifyChannels{{
    NotifyChannel::Telegram,
    NotifyChannel::WeChat,
}};

struct NotifyConfig {
    std::optional<NotifyChannel> default_channel;
    std::string telegram_bot_token;
    std::string telegram_chat_id;
    std::string wechat_webhook_key;
    uint32_t http_timeout_ms = 10000;
    uint32_t poll_interval_ms = 1000;
    LogLevel log_level = LogLevel::Info;
};

// Reads LW_* environment variables on top of built-in defaults.
NotifyConfig load_config();

const char* notify_channel_name(NotifyChannel channel);
std::optional<NotifyChannel> parse_notify_channel(const std::string& name);
std::optional<LogLevel> parse_log_level(const std::string& name);

bool is_channel_configured(const NotifyConfig& cfg, NotifyChannel channel);
std::optional<NotifyChannel> default_channel(const NotifyConfig& cfg);
std::vector<NotifyChannel> enabled_channels(const NotifyConfig& cfg);
std::vector<NotifyChannel> notification_try_order(const NotifyConfig& cfg);
