#include "notifier.hpp"
#include "http_client.hpp"

#include <cassert>
#include <string>

namespace {
struct RecordingPoster {
    std::string url;
    std::string body;
    std::string content_type;
    uint32_t timeout_ms = 0;
    int calls = 0;
    HttpResponse reply{true, 200, std::string(), std::string()};

    HttpPoster poster() {
        return [this](const std::string& u, const std::string& b, const char* ct, uint32_t t) {
            calls++;
            url = u;
            body = b;
            content_type = ct ? ct : "";
            timeout_ms = t;
            return reply;
        };
    }
};

HttpResponse response(bool transport_ok, long status, const std::string& body, const std::string& error) {
    return HttpResponse{transport_ok, status, body, error};
}
} // namespace

int main() {
    // json_escape
    assert(json_escape("plain text") == "plain text");
    assert(json_escape("say \"hi\"") == "say \\\"hi\\\"");
    assert(json_escape("C:\\tmp") == "C:\\\\tmp");
    assert(json_escape("a\nb\r\tc") == "a\\nb\\r\\tc");
    assert(json_escape(std::string("\x01\x1f", 2)) == "\\u0001\\u001f");
    assert(json_escape("[WATCHDOG] Auto-Started\n\nTimeout: 30000ms") ==
           "[WATCHDOG] Auto-Started\\n\\nTimeout: 30000ms");

    // Response classification
    assert(check_http_response(response(true, 200, "{\"ok\":true,\"result\":{}}", ""), "\"ok\":true").ok);
    assert(check_http_response(response(true, 200, "{\"errcode\":0,\"errmsg\":\"ok\"}", ""), "\"errcode\":0").ok);

    SendResult r = check_http_response(response(true, 200, "{\"errcode\":93000,\"errmsg\":\"invalid key\"}", ""), "\"errcode\":0");
    assert(!r.ok);
    assert(r.reason.find("rejected") == 0);

    r = check_http_response(response(true, 401, "{\"ok\":true}", ""), "\"ok\":true");
    assert(!r.ok);
    assert(r.reason == "http status 401");

    r = check_http_response(response(false, 0, "", "Couldn't resolve host name"), "\"ok\":true");
    assert(!r.ok);
    assert(r.reason == "transport error: Couldn't resolve host name");

    // Request construction
    assert(telegram_request_url("123:abc") == "https://api.telegram.org/bot123:abc/sendMessage");
    assert(telegram_request_body("-100123", "hello world\nbye") == "chat_id=-100123&text=hello%20world%0Abye");
    assert(wechat_request_url("k-1") == "https://qyapi.weixin.qq.com/cgi-bin/webhook/send?key=k-1");
    assert(wechat_request_body("line1\n\"q\"") ==
           "{\"msgtype\":\"text\",\"text\":{\"content\":\"line1\\n\\\"q\\\"\"}}");

    // Telegram notifier end to end over an injected poster.
    {
        RecordingPoster rec;
        rec.reply.body = "{\"ok\":true}";
        TelegramNotifier telegram("123:abc", "42", 2500, rec.poster());
        assert(telegram.send_message("alert & more").ok);
        assert(rec.calls == 1);
        assert(rec.url == "https://api.telegram.org/bot123:abc/sendMessage");
        assert(rec.body == "chat_id=42&text=alert%20%26%20more");
        assert(rec.content_type == "application/x-www-form-urlencoded");
        assert(rec.timeout_ms == 2500);

        rec.reply.body = "{\"ok\":false,\"description\":\"chat not found\"}";
        assert(!telegram.send_message("x").ok);
        rec.reply.status = 500;
        rec.reply.body = "{\"ok\":true}";
        assert(!telegram.send_message("x").ok);
    }

    // WeChat Work notifier end to end over an injected poster.
    {
        RecordingPoster rec;
        rec.reply.body = "{\"errcode\":0,\"errmsg\":\"ok\"}";
        WeChatWorkNotifier wechat("key", 1000, rec.poster());
        assert(wechat.send_message("a\nb").ok);
        assert(rec.url == "https://qyapi.weixin.qq.com/cgi-bin/webhook/send?key=key");
        assert(rec.body == "{\"msgtype\":\"text\",\"text\":{\"content\":\"a\\nb\"}}");
        assert(rec.content_type == "application/json");
        assert(rec.timeout_ms == 1000);

        rec.reply.transport_ok = false;
        rec.reply.error = "timeout";
        const SendResult failed = wechat.send_message("a");
        assert(!failed.ok);
        assert(failed.reason == "transport error: timeout");
    }

    // Factory only builds channels that have credentials.
    {
        NotifyConfig cfg{};
        assert(!make_notifier(NotifyChannel::Telegram, cfg));
        assert(!make_notifier(NotifyChannel::WeChat, cfg));
        cfg.telegram_bot_token = "t";
        cfg.telegram_chat_id = "c";
        cfg.wechat_webhook_key = "k";
        assert(make_notifier(NotifyChannel::Telegram, cfg));
        assert(make_notifier(NotifyChannel::WeChat, cfg));
    }

    return 0;
}
