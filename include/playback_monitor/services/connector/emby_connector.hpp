#pragma once

#include "playback_monitor/services/connector/http_connector_base.hpp"

namespace playback_monitor {
namespace services {

// Emby server. Polling only; the backend offers no push channel here.
class EmbyConnector : public HttpConnectorBase {
public:
    EmbyConnector(core::ConnectorConfig config, std::shared_ptr<HttpClient> http_client);

    std::expected<std::vector<core::SessionSnapshot>, core::ConnectorError>
    list_active_sessions() override;

    std::expected<core::ItemMetadata, core::ConnectorError>
    get_item_metadata(const std::string& item_id, const std::string& user_id = {}) override;

    bool supports_event_stream() const override { return false; }

    std::expected<std::unique_ptr<EventStream>, core::ConnectorError>
    open_event_stream() override;

    std::expected<void, core::ConnectorError>
    send_command(const core::SessionKey& key, const core::SessionCommand& command) override;

    static std::expected<std::vector<core::SessionSnapshot>, core::ConnectorError>
    parse_sessions(const nlohmann::json& body);

    static core::ItemMetadata parse_item(const nlohmann::json& item);

    // Emby ticks are 100ns units
    static constexpr std::int64_t TICKS_PER_MS = 10000;

protected:
    HttpHeaders auth_headers(const core::ConnectorConfig& config) const override;
};

} // namespace services
} // namespace playback_monitor
