#pragma once

#include "playback_monitor/services/connector/http_connector_base.hpp"
#include <unordered_map>

namespace playback_monitor {
namespace services {

// Plex Media Server: /status/sessions for polling, the notification
// event source for push.
class PlexConnector : public HttpConnectorBase {
public:
    PlexConnector(core::ConnectorConfig config, std::shared_ptr<HttpClient> http_client);

    std::expected<std::vector<core::SessionSnapshot>, core::ConnectorError>
    list_active_sessions() override;

    std::expected<core::ItemMetadata, core::ConnectorError>
    get_item_metadata(const std::string& item_id, const std::string& user_id = {}) override;

    bool supports_event_stream() const override { return true; }

    std::expected<std::unique_ptr<EventStream>, core::ConnectorError>
    open_event_stream() override;

    std::expected<void, core::ConnectorError>
    send_command(const core::SessionKey& key, const core::SessionCommand& command) override;

    static std::expected<std::vector<core::SessionSnapshot>, core::ConnectorError>
    parse_sessions(const nlohmann::json& body);

    static std::expected<core::ItemMetadata, core::ConnectorError>
    parse_metadata(const nlohmann::json& body);

    static std::vector<StreamEvent> parse_notification(const std::string& event_data);

    static constexpr const char* SESSIONS_ENDPOINT = "/status/sessions";
    static constexpr const char* EVENTS_ENDPOINT = "/:/eventsource/notifications?filters=playing";

protected:
    HttpHeaders auth_headers(const core::ConnectorConfig& config) const override;

private:
    struct PlayerTarget {
        std::string session_id;
        std::string machine_identifier;
        core::SessionState state = core::SessionState::Playing;
    };

    void remember_targets(const nlohmann::json& body);

    mutable std::mutex m_targets_mutex;
    std::unordered_map<core::SessionKey, PlayerTarget> m_targets;
};

} // namespace services
} // namespace playback_monitor
