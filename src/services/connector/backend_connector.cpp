#include "playback_monitor/services/connector/backend_connector.hpp"
#include "playback_monitor/services/connector/emby_connector.hpp"
#include "playback_monitor/services/connector/plex_connector.hpp"
#include "playback_monitor/services/network/http_client.hpp"
#include "playback_monitor/utils/logger.hpp"
#include <cstdio>

namespace playback_monitor {
namespace services {

std::string format_full_title(const core::ItemMetadata& metadata) {
    switch (metadata.media_type) {
        case core::MediaType::Episode: {
            if (metadata.grandparent_title.empty()) {
                return metadata.title;
            }
            char episode_code[32];
            std::snprintf(episode_code, sizeof(episode_code), "s%02de%02d",
                          metadata.parent_index, metadata.index);
            return metadata.grandparent_title + " - " + episode_code + " - " + metadata.title;
        }
        case core::MediaType::Movie:
            if (metadata.year > 0) {
                return metadata.title + " (" + std::to_string(metadata.year) + ")";
            }
            return metadata.title;
        case core::MediaType::Track:
            if (!metadata.grandparent_title.empty()) {
                return metadata.grandparent_title + " - " + metadata.title;
            }
            return metadata.title;
        case core::MediaType::Other:
            break;
    }
    return metadata.title;
}

std::expected<std::shared_ptr<BackendConnector>, core::PipelineError>
create_connector(const core::ConnectorConfig& config, std::shared_ptr<HttpClient> http_client) {
    if (!config.is_valid()) {
        LOG_ERROR("ConnectorFactory", "Invalid connector configuration for backend '" + config.backend + "'");
        return std::unexpected(core::PipelineError::ConnectorConstructionFailed);
    }

    if (!http_client) {
        HttpClientConfig client_config;
        client_config.default_timeout = config.request_timeout;
        client_config.verify_ssl = config.verify_ssl;
        http_client = create_http_client(client_config);
        if (!http_client) {
            return std::unexpected(core::PipelineError::ConnectorConstructionFailed);
        }
    }

    if (config.backend == "plex") {
        LOG_INFO("ConnectorFactory", "Using Plex backend at " + config.server_url);
        return std::make_shared<PlexConnector>(config, std::move(http_client));
    }
    if (config.backend == "emby") {
        LOG_INFO("ConnectorFactory", "Using Emby backend at " + config.server_url);
        return std::make_shared<EmbyConnector>(config, std::move(http_client));
    }

    LOG_ERROR("ConnectorFactory", "Unknown backend: " + config.backend);
    return std::unexpected(core::PipelineError::ConnectorConstructionFailed);
}

} // namespace services
} // namespace playback_monitor
