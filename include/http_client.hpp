#pragma once

#include <cstdint>
#include <string>

struct HttpResponse {
    bool transport_ok;
    long status;
    std::string body;
    std::string error;
};

// Blocking POST. transport_ok is false when curl could not complete the request.
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const char* content_type,
                       uint32_t timeout_ms);

std::string url_encode(const std::string& raw);
std::string json_escape(const std::string& raw);
