#pragma once

#include "playback_monitor/core/models.hpp"
#include <expected>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace playback_monitor {
namespace services {

class HttpClient;

struct StreamEvent {
    enum class Kind {
        Update,
        Stopped,
        Malformed
    };

    core::SessionSnapshot snapshot;
    Kind kind = Kind::Update;
};

using StreamEventCallback = std::function<void(const StreamEvent&)>;

// A live push channel. run() blocks until the server closes the stream,
// the transport fails, or stop is requested.
class EventStream {
public:
    virtual ~EventStream() = default;

    virtual std::expected<void, core::ConnectorError> run(
        const StreamEventCallback& on_event,
        std::stop_token stop_token) = 0;

    // Invoked once the server accepted the subscription
    virtual void set_connected_callback(std::function<void()> callback) = 0;
};

// Capability set shared by every supported media-server product
class BackendConnector {
public:
    virtual ~BackendConnector() = default;

    virtual std::string backend_name() const = 0;

    virtual std::expected<std::vector<core::SessionSnapshot>, core::ConnectorError>
    list_active_sessions() = 0;

    virtual std::expected<core::ItemMetadata, core::ConnectorError>
    get_item_metadata(const std::string& item_id, const std::string& user_id = {}) = 0;

    virtual bool supports_event_stream() const = 0;

    // Returns ConnectorError::Unsupported when the backend has no push channel
    virtual std::expected<std::unique_ptr<EventStream>, core::ConnectorError>
    open_event_stream() = 0;

    virtual std::expected<void, core::ConnectorError>
    send_command(const core::SessionKey& key, const core::SessionCommand& command) = 0;

    // Applies new credentials and retry policy; clears a latched Unauthorized
    virtual void reconfigure(const core::ConnectorConfig& config) = 0;

    // Aborts pending retry waits so callers return promptly
    virtual void shutdown() = 0;
};

// "Series - s01e05 - Title", "Title (2023)", "Artist - Title"
std::string format_full_title(const core::ItemMetadata& metadata);

std::expected<std::shared_ptr<BackendConnector>, core::PipelineError>
create_connector(const core::ConnectorConfig& config, std::shared_ptr<HttpClient> http_client);

} // namespace services
} // namespace playback_monitor
