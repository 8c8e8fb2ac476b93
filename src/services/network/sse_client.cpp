#include "playback_monitor/services/network/sse_client.hpp"
#include "playback_monitor/utils/logger.hpp"

namespace playback_monitor {
namespace services {

SSEClient::SSEClient(std::shared_ptr<HttpClient> http_client)
    : m_http_client(std::move(http_client))
    , m_last_event_time(std::chrono::system_clock::now()) {}

void SSEClient::set_connected_callback(SSEConnectedCallback callback) {
    m_connected_callback = std::move(callback);
}

void SSEClient::set_event_callback(SSEEventCallback callback) {
    m_callback = std::move(callback);
}

std::expected<HttpResponse, NetworkError> SSEClient::stream(
    HttpRequest request,
    SSEEventCallback callback,
    const std::atomic<bool>* keep_running) {

    m_callback = std::move(callback);
    reset_parser();

    request.method = HttpMethod::GET;
    request.follow_redirects = false;
    request.headers["Accept"] = "text/event-stream";
    request.headers["Cache-Control"] = "no-cache";

    LOG_DEBUG("SSEClient", "Opening event stream: " + request.url);

    auto streaming_callback = [this](const std::string& data_chunk) {
        process_streaming_data(data_chunk);
    };

    auto result = m_http_client->execute_streaming(request, streaming_callback, keep_running);
    m_connected.store(false);

    if (!result) {
        LOG_DEBUG("SSEClient", "Event stream ended with error: " + to_string(result.error()));
    } else {
        LOG_DEBUG("SSEClient", "Event stream closed with status " + std::to_string(result->status_code));
    }
    return result;
}

bool SSEClient::is_connected() const {
    return m_connected;
}

std::chrono::system_clock::time_point SSEClient::get_last_event_time() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_last_event_time;
}

void SSEClient::reset_parser() {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_partial_data.clear();
    m_current_event_data.clear();
    m_current_event_type.clear();
    m_current_event_id.clear();
}

void SSEClient::process_streaming_data(const std::string& data_chunk) {
    if (data_chunk.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_state_mutex);

    m_partial_data += data_chunk;

    size_t pos = 0;
    while ((pos = m_partial_data.find('\n')) != std::string::npos) {
        std::string line = m_partial_data.substr(0, pos);

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        m_partial_data.erase(0, pos + 1);
        process_sse_line(line);
    }

    m_last_event_time = std::chrono::system_clock::now();
}

void SSEClient::process_sse_line(const std::string& line) {
    if (line.empty()) {
        // Blank line terminates an event
        if (!m_current_event_data.empty()) {
            handle_event(m_current_event_data);
        }
        m_current_event_data.clear();
        m_current_event_type.clear();
        m_current_event_id.clear();
        return;
    }

    if (line[0] == ':') {
        if (line.rfind(": connection established", 0) == 0 && !m_connected.exchange(true)) {
            LOG_DEBUG("SSEClient", "Event stream established");
            if (m_connected_callback) {
                m_connected_callback();
            }
        }
        return;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
        process_sse_field(line, "");
        return;
    }

    std::string field = line.substr(0, colon_pos);
    std::string value = line.substr(colon_pos + 1);
    if (!value.empty() && value[0] == ' ') {
        value.erase(0, 1);
    }
    process_sse_field(field, value);
}

void SSEClient::process_sse_field(const std::string& field, const std::string& value) {
    if (field == "data") {
        if (!m_current_event_data.empty()) {
            m_current_event_data += "\n";
        }
        m_current_event_data += value;
    } else if (field == "event") {
        m_current_event_type = value;
    } else if (field == "id") {
        m_current_event_id = value;
    }
}

void SSEClient::handle_event(const std::string& event_data) {
    LOG_DEBUG("SSEClient", "Received SSE event: " + event_data.substr(0, 100) +
                   (event_data.length() > 100 ? "..." : ""));

    if (!m_callback) {
        return;
    }

    try {
        m_callback(event_data);
    } catch (const std::exception& e) {
        LOG_ERROR("SSEClient", "Error in SSE callback: " + std::string(e.what()));
    }
}

} // namespace services
} // namespace playback_monitor
