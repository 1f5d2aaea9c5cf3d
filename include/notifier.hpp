#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "config.hpp"
#include "http_client.hpp"

struct SendResult {
    bool ok;
    std::string reason;
};

inline SendResult send_ok() {
    return {true, std::string()};
}

inline SendResult send_failed(std::string reason) {
    return {false, std::move(reason)};
}

// One notification transport. send_message may also throw; callers treat that as failure.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual SendResult send_message(const std::string& text) = 0;
};

// Same shape as http_post(); replaced in tests to run without network access.
using HttpPoster = std::function<HttpResponse(const std::string& url,
                                              const std::string& body,
                                              const char* content_type,
                                              uint32_t timeout_ms)>;

// Success needs a completed transfer, HTTP 200, and success_token in the body.
SendResult check_http_response(const HttpResponse& resp, const char* success_token);

std::string telegram_request_url(const std::string& bot_token);
std::string telegram_request_body(const std::string& chat_id, const std::string& text);
std::string wechat_request_url(const std::string& webhook_key);
std::string wechat_request_body(const std::string& text);

class TelegramNotifier : public Notifier {
public:
    TelegramNotifier(std::string bot_token, std::string chat_id, uint32_t timeout_ms, HttpPoster post = http_post);
    SendResult send_message(const std::string& text) override;

private:
    std::string bot_token_;
    std::string chat_id_;
    uint32_t timeout_ms_;
    HttpPoster post_;
};

class WeChatWorkNotifier : public Notifier {
public:
    WeChatWorkNotifier(std::string webhook_key, uint32_t timeout_ms, HttpPoster post = http_post);
    SendResult send_message(const std::string& text) override;

private:
    std::string webhook_key_;
    uint32_t timeout_ms_;
    HttpPoster post_;
};

// Default factory. Returns nullptr when the channel has no credentials.
std::unique_ptr<Notifier> make_notifier(NotifyChannel channel, const NotifyConfig& cfg);
