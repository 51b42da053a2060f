#pragma once
#include <stdexcept>
#include <string>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Connection, DNS or timeout failure; no HTTP status was received.
struct HttpTransportError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000);

// 408, 429 and 5xx are worth retrying; other non-2xx codes are not.
bool is_transient_status(long status);
bool is_success_status(long status);

std::string join_url(const std::string& base, const std::string& path);
