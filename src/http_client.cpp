#include "http_client.hpp"
#include "logging.hpp"

#include <cstdio>
#include <mutex>

#include <curl/curl.h>

namespace {
std::once_flag g_curl_once;

void ensure_curl_global() {
    std::call_once(g_curl_once, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            log_error("HTTP", "curl_global_init failed: %s", curl_easy_strerror(rc));
        }
    });
}

size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}
} // namespace

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const char* content_type,
                       uint32_t timeout_ms) {
    ensure_curl_global();
    HttpResponse resp{false, 0, std::string(), std::string()};

    CURL* c = curl_easy_init();
    if (!c) {
        resp.error = "curl_easy_init failed";
        return resp;
    }

    struct curl_slist* headers = nullptr;
    if (content_type) {
        const std::string header = std::string("Content-Type: ") + content_type;
        headers = curl_slist_append(headers, header.c_str());
    }

    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_POST, 1L);
    curl_easy_setopt(c, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &resp.body);

    const CURLcode rc = curl_easy_perform(c);
    if (rc == CURLE_OK) {
        resp.transport_ok = true;
        curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &resp.status);
    } else {
        resp.error = curl_easy_strerror(rc);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(c);
    return resp;
}

std::string url_encode(const std::string& raw) {
    ensure_curl_global();
    std::string out;
    char* escaped = curl_easy_escape(nullptr, raw.c_str(), static_cast<int>(raw.size()));
    if (escaped) {
        out = escaped;
        curl_free(escaped);
    }
    return out;
}

std::string json_escape(const std::string& raw) {
    std::string out;
    out.reserve(raw.size() + 8);
    for (const char ch : raw) {
        switch (ch) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    out += buf;
                } else {
                    out += ch;
                }
                break;
        }
    }
    return out;
}
