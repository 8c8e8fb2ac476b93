#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>

namespace playback_monitor {
namespace services {

// Media-server APIs and webhooks only need these two
enum class HttpMethod {
    GET,
    POST
};

enum class NetworkError {
    ConnectionFailed,
    Timeout,
    DNSResolutionFailed,
    SSLError,
    InvalidUrl,
    TooManyRedirects,
    BadResponse,
    Cancelled
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::chrono::seconds timeout{30};
    bool follow_redirects = true;
    int max_redirects = 5;
    bool verify_ssl = true;

    bool is_valid() const;
};

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::chrono::milliseconds response_time{0};

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

// Receives raw chunks of a streaming response as they arrive
using StreamingCallback = std::function<void(const std::string& data_chunk)>;

std::string to_string(NetworkError error);

} // namespace services
} // namespace playback_monitor
