#pragma once

#include "playback_monitor/services/network/http_client.hpp"
#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace playback_monitor {
namespace services {

using SSEEventCallback = std::function<void(const std::string& event_data)>;
using SSEConnectedCallback = std::function<void()>;

// Server-sent events reader. stream() runs on the caller's thread; the
// caller owns reconnection policy.
class SSEClient {
public:
    explicit SSEClient(std::shared_ptr<HttpClient> http_client);

    std::expected<HttpResponse, NetworkError> stream(
        HttpRequest request,
        SSEEventCallback callback,
        const std::atomic<bool>* keep_running);

    void set_connected_callback(SSEConnectedCallback callback);

    bool is_connected() const;
    std::chrono::system_clock::time_point get_last_event_time() const;

    // Feeds a raw chunk through the line parser; complete events are
    // dispatched to the callback passed to stream().
    void process_streaming_data(const std::string& data_chunk);

    void set_event_callback(SSEEventCallback callback);

private:
    void process_sse_line(const std::string& line);
    void process_sse_field(const std::string& field, const std::string& value);
    void handle_event(const std::string& event_data);
    void reset_parser();

    std::shared_ptr<HttpClient> m_http_client;
    SSEEventCallback m_callback;
    SSEConnectedCallback m_connected_callback;

    std::atomic<bool> m_connected{false};

    mutable std::mutex m_state_mutex;
    std::chrono::system_clock::time_point m_last_event_time;
    std::string m_partial_data;

    std::string m_current_event_data;
    std::string m_current_event_type;
    std::string m_current_event_id;
};

} // namespace services
} // namespace playback_monitor
