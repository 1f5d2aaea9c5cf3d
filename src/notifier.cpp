#include "notifier.hpp"
#include "http_client.hpp"
#include "logging.hpp"

#include <utility>

namespace {
constexpr const char* kTelegramOkToken = "\"ok\":true";
constexpr const char* kWeChatOkToken = "\"errcode\":0";
} // namespace

SendResult check_http_response(const HttpResponse& resp, const char* success_token) {
    if (!resp.transport_ok) {
        return send_failed("transport error: " + resp.error);
    }
    if (resp.status != 200) {
        return send_failed("http status " + std::to_string(resp.status));
    }
    if (resp.body.find(success_token) == std::string::npos) {
        return send_failed("rejected: " + resp.body.substr(0, 200));
    }
    return send_ok();
}

std::string telegram_request_url(const std::string& bot_token) {
    return "https://api.telegram.org/bot" + bot_token + "/sendMessage";
}

std::string telegram_request_body(const std::string& chat_id, const std::string& text) {
    return "chat_id=" + url_encode(chat_id) + "&text=" + url_encode(text);
}

std::string wechat_request_url(const std::string& webhook_key) {
    return "https://qyapi.weixin.qq.com/cgi-bin/webhook/send?key=" + url_encode(webhook_key);
}

std::string wechat_request_body(const std::string& text) {
    return "{\"msgtype\":\"text\",\"text\":{\"content\":\"" + json_escape(text) + "\"}}";
}

TelegramNotifier::TelegramNotifier(std::string bot_token, std::string chat_id, uint32_t timeout_ms, HttpPoster post)
    : bot_token_(std::move(bot_token)),
      chat_id_(std::move(chat_id)),
      timeout_ms_(timeout_ms),
      post_(std::move(post)) {}

SendResult TelegramNotifier::send_message(const std::string& text) {
    const HttpResponse resp = post_(telegram_request_url(bot_token_),
                                    telegram_request_body(chat_id_, text),
                                    "application/x-www-form-urlencoded",
                                    timeout_ms_);
    return check_http_response(resp, kTelegramOkToken);
}

WeChatWorkNotifier::WeChatWorkNotifier(std::string webhook_key, uint32_t timeout_ms, HttpPoster post)
    : webhook_key_(std::move(webhook_key)), timeout_ms_(timeout_ms), post_(std::move(post)) {}

SendResult WeChatWorkNotifier::send_message(const std::string& text) {
    const HttpResponse resp = post_(wechat_request_url(webhook_key_),
                                    wechat_request_body(text),
                                    "application/json",
                                    timeout_ms_);
    return check_http_response(resp, kWeChatOkToken);
}

std::unique_ptr<Notifier> make_notifier(NotifyChannel channel, const NotifyConfig& cfg) {
    if (!is_channel_configured(cfg, channel)) {
        log_debug("NOTIFY", "%s has no credentials, notifier not created", notify_channel_name(channel));
        return nullptr;
    }
    switch (channel) {
        case NotifyChannel::Telegram:
            return std::make_unique<TelegramNotifier>(cfg.telegram_bot_token, cfg.telegram_chat_id, cfg.http_timeout_ms);
        case NotifyChannel::WeChat:
            return std::make_unique<WeChatWorkNotifier>(cfg.wechat_webhook_key, cfg.http_timeout_ms);
    }
    return nullptr;
}
