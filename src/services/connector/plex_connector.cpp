#include "playback_monitor/services/connector/plex_connector.hpp"
#include "playback_monitor/services/network/sse_client.hpp"
#include "playback_monitor/utils/json_helper.hpp"
#include "playback_monitor/utils/logger.hpp"
#include "playback_monitor/utils/url_utils.hpp"

namespace playback_monitor {
namespace services {

using core::ConnectorError;
using core::SessionState;
using utils::JsonHelper;

namespace {

core::MediaType plex_media_type(const std::string& type) {
    if (type == "movie") return core::MediaType::Movie;
    if (type == "episode") return core::MediaType::Episode;
    if (type == "track") return core::MediaType::Track;
    return core::MediaType::Other;
}

std::optional<SessionState> plex_state(const std::string& state) {
    if (state == "playing") return SessionState::Playing;
    if (state == "paused") return SessionState::Paused;
    if (state == "buffering") return SessionState::Buffering;
    if (state == "stopped") return SessionState::Stopped;
    if (state == "error") return SessionState::Error;
    return std::nullopt;
}

core::ItemMetadata metadata_from_item(const nlohmann::json& item) {
    core::ItemMetadata metadata;
    metadata.item_id = JsonHelper::get_id(item, "ratingKey");
    metadata.title = JsonHelper::get_optional<std::string>(item, "title", "");
    metadata.media_type = plex_media_type(JsonHelper::get_optional<std::string>(item, "type", ""));
    metadata.grandparent_title = JsonHelper::get_optional<std::string>(item, "grandparentTitle", "");
    metadata.parent_index = static_cast<int>(JsonHelper::get_int(item, "parentIndex"));
    metadata.index = static_cast<int>(JsonHelper::get_int(item, "index"));
    metadata.year = static_cast<int>(JsonHelper::get_int(item, "year"));
    metadata.duration_ms = JsonHelper::get_int(item, "duration");
    metadata.full_title = format_full_title(metadata);
    return metadata;
}

std::optional<core::TranscodeInfo> transcode_from_item(const nlohmann::json& item) {
    if (!JsonHelper::has_field(item, "TranscodeSession")) {
        return core::TranscodeInfo{"direct play", "", "", ""};
    }
    const auto& session = item["TranscodeSession"];
    core::TranscodeInfo info;
    info.video_decision = JsonHelper::get_optional<std::string>(session, "videoDecision", "");
    info.audio_decision = JsonHelper::get_optional<std::string>(session, "audioDecision", "");
    info.container = JsonHelper::get_optional<std::string>(session, "container", "");
    info.decision = (info.video_decision == "transcode" || info.audio_decision == "transcode")
        ? "transcode" : "copy";
    return info;
}

class PlexEventStream : public EventStream {
public:
    PlexEventStream(std::shared_ptr<HttpClient> http_client, HttpRequest request, std::stop_token shutdown)
        : m_http_client(std::move(http_client))
        , m_request(std::move(request))
        , m_shutdown(std::move(shutdown)) {}

    void set_connected_callback(std::function<void()> callback) override {
        m_connected_callback = std::move(callback);
    }

    std::expected<void, ConnectorError> run(const StreamEventCallback& on_event,
                                            std::stop_token stop_token) override {
        std::atomic<bool> keep_running{true};
        std::stop_callback on_stop(stop_token, [&keep_running] { keep_running = false; });
        std::stop_callback on_shutdown(m_shutdown, [&keep_running] { keep_running = false; });

        SSEClient sse(m_http_client);
        sse.set_connected_callback(m_connected_callback);

        auto result = sse.stream(m_request, [&on_event](const std::string& data) {
            for (const auto& event : PlexConnector::parse_notification(data)) {
                on_event(event);
            }
        }, &keep_running);

        if (!keep_running) {
            return {};
        }
        if (!result) {
            return std::unexpected(HttpConnectorBase::map_network_error(result.error()));
        }
        if (auto error = HttpConnectorBase::map_status(result->status_code)) {
            return std::unexpected(*error);
        }
        return {};
    }

private:
    std::shared_ptr<HttpClient> m_http_client;
    HttpRequest m_request;
    std::stop_token m_shutdown;
    std::function<void()> m_connected_callback;
};

} // namespace

PlexConnector::PlexConnector(core::ConnectorConfig config, std::shared_ptr<HttpClient> http_client)
    : HttpConnectorBase("PlexConnector", std::move(config), std::move(http_client)) {}

HttpHeaders PlexConnector::auth_headers(const core::ConnectorConfig& config) const {
    return {
        {"X-Plex-Token", config.api_token},
        {"X-Plex-Product", "Playback Monitor"},
        {"X-Plex-Client-Identifier", "playback-monitor"},
        {"Accept", "application/json"}
    };
}

std::expected<std::vector<core::SessionSnapshot>, ConnectorError> PlexConnector::list_active_sessions() {
    auto body = get_json(SESSIONS_ENDPOINT, "list sessions");
    if (!body) {
        return std::unexpected(body.error());
    }

    auto sessions = parse_sessions(*body);
    if (sessions) {
        remember_targets(*body);
    }
    return sessions;
}

std::expected<std::vector<core::SessionSnapshot>, ConnectorError>
PlexConnector::parse_sessions(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("MediaContainer") || !body["MediaContainer"].is_object()) {
        return std::unexpected(ConnectorError::MalformedResponse);
    }

    std::vector<core::SessionSnapshot> sessions;
    JsonHelper::for_each_in_array(body["MediaContainer"], "Metadata", [&sessions](const nlohmann::json& item) {
        core::SessionSnapshot snapshot;
        snapshot.session_key = core::SessionKey(JsonHelper::get_id(item, "sessionKey"));
        if (snapshot.session_key.empty()) {
            LOG_DEBUG("PlexConnector", "Skipping session entry without sessionKey");
            return;
        }

        const auto metadata = metadata_from_item(item);
        snapshot.item_id = metadata.item_id;
        snapshot.title = metadata.full_title;
        snapshot.media_type = metadata.media_type;
        snapshot.duration_ms = metadata.duration_ms;
        snapshot.position_ms = JsonHelper::get_int(item, "viewOffset");

        if (JsonHelper::has_field(item, "User")) {
            snapshot.user_id = JsonHelper::get_id(item["User"], "id");
            snapshot.user_name = JsonHelper::get_optional<std::string>(item["User"], "title", "");
        }
        if (JsonHelper::has_field(item, "Player")) {
            const auto& player = item["Player"];
            snapshot.player = JsonHelper::get_optional<std::string>(player, "title", "");
            snapshot.state = plex_state(JsonHelper::get_optional<std::string>(player, "state", ""))
                .value_or(SessionState::Playing);
        }

        snapshot.transcode = transcode_from_item(item);
        snapshot.is_transcoding = snapshot.transcode && snapshot.transcode->decision == "transcode";
        snapshot.raw_payload = item.dump();
        sessions.push_back(std::move(snapshot));
    });

    return sessions;
}

void PlexConnector::remember_targets(const nlohmann::json& body) {
    std::unordered_map<core::SessionKey, PlayerTarget> targets;
    JsonHelper::for_each_in_array(body["MediaContainer"], "Metadata", [&targets](const nlohmann::json& item) {
        core::SessionKey key(JsonHelper::get_id(item, "sessionKey"));
        if (key.empty()) {
            return;
        }
        PlayerTarget target;
        if (JsonHelper::has_field(item, "Session")) {
            target.session_id = JsonHelper::get_id(item["Session"], "id");
        }
        if (JsonHelper::has_field(item, "Player")) {
            target.machine_identifier = JsonHelper::get_optional<std::string>(item["Player"], "machineIdentifier", "");
            target.state = plex_state(JsonHelper::get_optional<std::string>(item["Player"], "state", ""))
                .value_or(SessionState::Playing);
        }
        targets.emplace(std::move(key), std::move(target));
    });

    std::lock_guard lock(m_targets_mutex);
    m_targets = std::move(targets);
}

std::expected<core::ItemMetadata, ConnectorError>
PlexConnector::get_item_metadata(const std::string& item_id, const std::string&) {
    if (item_id.empty()) {
        return std::unexpected(ConnectorError::NotFound);
    }
    auto body = get_json("/library/metadata/" + utils::UrlUtils::encode(item_id), "item metadata");
    if (!body) {
        return std::unexpected(body.error());
    }
    return parse_metadata(*body);
}

std::expected<core::ItemMetadata, ConnectorError> PlexConnector::parse_metadata(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("MediaContainer")) {
        return std::unexpected(ConnectorError::MalformedResponse);
    }
    const auto& container = body["MediaContainer"];
    if (!JsonHelper::has_array(container, "Metadata")) {
        return std::unexpected(ConnectorError::NotFound);
    }
    return metadata_from_item(container["Metadata"][0]);
}

std::vector<StreamEvent> PlexConnector::parse_notification(const std::string& event_data) {
    std::vector<StreamEvent> events;

    auto parsed = JsonHelper::safe_parse(event_data);
    if (!parsed) {
        StreamEvent malformed;
        malformed.kind = StreamEvent::Kind::Malformed;
        malformed.snapshot.raw_payload = event_data;
        events.push_back(std::move(malformed));
        return events;
    }

    // Other notification families share the channel and are not session data
    if (!parsed->is_object() || !parsed->contains("PlaySessionStateNotification")) {
        return events;
    }

    const auto& payload = (*parsed)["PlaySessionStateNotification"];
    auto handle = [&events](const nlohmann::json& notification) {
        StreamEvent event;
        event.snapshot.raw_payload = notification.dump();
        event.snapshot.session_key = core::SessionKey(JsonHelper::get_id(notification, "sessionKey"));
        auto state = plex_state(JsonHelper::get_optional<std::string>(notification, "state", ""));

        if (event.snapshot.session_key.empty() || !state) {
            event.kind = StreamEvent::Kind::Malformed;
            events.push_back(std::move(event));
            return;
        }

        event.snapshot.item_id = JsonHelper::get_id(notification, "ratingKey");
        event.snapshot.position_ms = JsonHelper::get_int(notification, "viewOffset");
        event.snapshot.state = *state;
        event.kind = *state == SessionState::Stopped ? StreamEvent::Kind::Stopped : StreamEvent::Kind::Update;
        events.push_back(std::move(event));
    };

    if (payload.is_array()) {
        for (const auto& notification : payload) {
            handle(notification);
        }
    } else {
        handle(payload);
    }
    return events;
}

std::expected<std::unique_ptr<EventStream>, ConnectorError> PlexConnector::open_event_stream() {
    if (is_unauthorized()) {
        return std::unexpected(ConnectorError::Unauthorized);
    }
    auto request = build_request(HttpMethod::GET, EVENTS_ENDPOINT);
    return std::make_unique<PlexEventStream>(http_client(), std::move(request), shutdown_token());
}

std::expected<void, ConnectorError>
PlexConnector::send_command(const core::SessionKey& key, const core::SessionCommand& command) {
    PlayerTarget target;
    {
        std::lock_guard lock(m_targets_mutex);
        auto it = m_targets.find(key);
        if (it == m_targets.end()) {
            LOG_WARNING("PlexConnector", "No player known for session " + key.get());
            return std::unexpected(ConnectorError::NotFound);
        }
        target = it->second;
    }

    using Kind = core::SessionCommand::Kind;
    if (command.kind == Kind::Terminate) {
        if (target.session_id.empty()) {
            return std::unexpected(ConnectorError::NotFound);
        }
        const auto reason = command.text.empty() ? "The server owner has ended the stream." : command.text;
        LOG_INFO("PlexConnector", "Terminating session " + key.get());
        return send(HttpMethod::GET, std::string(SESSIONS_ENDPOINT) + "/terminate?" +
            utils::UrlUtils::build_query_string({{"sessionId", target.session_id}, {"reason", reason}}),
            "terminate session");
    }

    if (command.kind == Kind::Message) {
        return std::unexpected(ConnectorError::Unsupported);
    }

    std::string action;
    switch (command.kind) {
        case Kind::Play: action = "play"; break;
        case Kind::Pause: action = "pause"; break;
        case Kind::Stop: action = "stop"; break;
        case Kind::PlayPause:
            action = target.state == SessionState::Playing ? "pause" : "play";
            break;
        default:
            return std::unexpected(ConnectorError::Unsupported);
    }

    if (target.machine_identifier.empty()) {
        return std::unexpected(ConnectorError::NotFound);
    }

    auto request = build_request(HttpMethod::GET, "/player/playback/" + action);
    request.headers["X-Plex-Target-Client-Identifier"] = target.machine_identifier;
    auto response = execute_with_retry(request, "player " + action);
    if (!response) {
        return std::unexpected(response.error());
    }
    return {};
}

} // namespace services
} // namespace playback_monitor
