#pragma once

#include "playback_monitor/services/network/http_types.hpp"
#include <atomic>
#include <expected>
#include <memory>

namespace playback_monitor {
namespace services {

// Transport seam shared by the connectors, the SSE reader and the webhook
// handler. Tests substitute a mock.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) = 0;

    virtual std::expected<HttpResponse, NetworkError> post_json(
        const std::string& url,
        const std::string& json_body,
        const HttpHeaders& headers = {}) = 0;

    // Blocks until the server closes the stream, the transfer fails, or
    // keep_running turns false. The status line is reported before the body;
    // a non-2xx status ends the call with the status in the response.
    virtual std::expected<HttpResponse, NetworkError> execute_streaming(
        const HttpRequest& request,
        StreamingCallback callback,
        const std::atomic<bool>* keep_running = nullptr) = 0;
};

struct HttpClientConfig {
    std::chrono::seconds default_timeout{30};
    std::chrono::seconds connect_timeout{10};
    // Streams with no bytes for this long are treated as dead
    std::chrono::seconds stream_idle_timeout{60};
    std::string user_agent;
    bool verify_ssl = true;

    bool is_valid() const;
};

std::shared_ptr<HttpClient> create_http_client(const HttpClientConfig& config = {});

} // namespace services
} // namespace playback_monitor
