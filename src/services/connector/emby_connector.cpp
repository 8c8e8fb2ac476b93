#include "playback_monitor/services/connector/emby_connector.hpp"
#include "playback_monitor/utils/json_helper.hpp"
#include "playback_monitor/utils/logger.hpp"
#include "playback_monitor/utils/url_utils.hpp"

namespace playback_monitor {
namespace services {

using core::ConnectorError;
using utils::JsonHelper;

namespace {

core::MediaType emby_media_type(const std::string& type) {
    if (type == "Movie") return core::MediaType::Movie;
    if (type == "Episode") return core::MediaType::Episode;
    if (type == "Audio") return core::MediaType::Track;
    return core::MediaType::Other;
}

std::string transcode_decision(const std::string& play_method) {
    if (play_method == "DirectPlay") return "direct play";
    if (play_method == "DirectStream") return "copy";
    return "transcode";
}

} // namespace

EmbyConnector::EmbyConnector(core::ConnectorConfig config, std::shared_ptr<HttpClient> http_client)
    : HttpConnectorBase("EmbyConnector", std::move(config), std::move(http_client)) {}

HttpHeaders EmbyConnector::auth_headers(const core::ConnectorConfig& config) const {
    return {
        {"X-Emby-Token", config.api_token},
        {"Accept", "application/json"}
    };
}

core::ItemMetadata EmbyConnector::parse_item(const nlohmann::json& item) {
    core::ItemMetadata metadata;
    metadata.item_id = JsonHelper::get_id(item, "Id");
    metadata.title = JsonHelper::get_optional<std::string>(item, "Name", "");
    metadata.media_type = emby_media_type(JsonHelper::get_optional<std::string>(item, "Type", ""));
    metadata.parent_index = static_cast<int>(JsonHelper::get_int(item, "ParentIndexNumber"));
    metadata.index = static_cast<int>(JsonHelper::get_int(item, "IndexNumber"));
    metadata.year = static_cast<int>(JsonHelper::get_int(item, "ProductionYear"));
    metadata.duration_ms = JsonHelper::get_int(item, "RunTimeTicks") / TICKS_PER_MS;

    if (metadata.media_type == core::MediaType::Episode) {
        metadata.grandparent_title = JsonHelper::get_optional<std::string>(item, "SeriesName", "");
    } else if (metadata.media_type == core::MediaType::Track) {
        metadata.grandparent_title = JsonHelper::get_optional<std::string>(item, "AlbumArtist", "");
        if (metadata.grandparent_title.empty() && JsonHelper::has_array(item, "Artists")) {
            metadata.grandparent_title = item["Artists"][0].get<std::string>();
        }
    }

    metadata.full_title = format_full_title(metadata);
    return metadata;
}

std::expected<std::vector<core::SessionSnapshot>, ConnectorError>
EmbyConnector::parse_sessions(const nlohmann::json& body) {
    if (!body.is_array()) {
        return std::unexpected(ConnectorError::MalformedResponse);
    }

    std::vector<core::SessionSnapshot> sessions;
    for (const auto& session : body) {
        // Idle client connections are listed too; only playback counts
        if (!JsonHelper::has_field(session, "NowPlayingItem")) {
            continue;
        }

        core::SessionSnapshot snapshot;
        snapshot.session_key = core::SessionKey(JsonHelper::get_id(session, "Id"));
        if (snapshot.session_key.empty()) {
            continue;
        }

        const auto metadata = parse_item(session["NowPlayingItem"]);
        snapshot.item_id = metadata.item_id;
        snapshot.title = metadata.full_title;
        snapshot.media_type = metadata.media_type;
        snapshot.duration_ms = metadata.duration_ms;
        snapshot.user_id = JsonHelper::get_id(session, "UserId");
        snapshot.user_name = JsonHelper::get_optional<std::string>(session, "UserName", "");
        snapshot.player = JsonHelper::get_optional<std::string>(session, "DeviceName",
            JsonHelper::get_optional<std::string>(session, "Client", ""));

        std::string play_method;
        snapshot.state = core::SessionState::Playing;
        if (JsonHelper::has_field(session, "PlayState")) {
            const auto& play_state = session["PlayState"];
            if (JsonHelper::get_optional<bool>(play_state, "IsPaused", false)) {
                snapshot.state = core::SessionState::Paused;
            }
            snapshot.position_ms = JsonHelper::get_int(play_state, "PositionTicks") / TICKS_PER_MS;
            play_method = JsonHelper::get_optional<std::string>(play_state, "PlayMethod", "");
        }

        core::TranscodeInfo transcode;
        transcode.decision = transcode_decision(play_method);
        if (JsonHelper::has_field(session, "TranscodingInfo")) {
            const auto& info = session["TranscodingInfo"];
            const bool video_direct = JsonHelper::get_optional<bool>(info, "IsVideoDirect", false);
            const bool audio_direct = JsonHelper::get_optional<bool>(info, "IsAudioDirect", false);
            transcode.video_decision = video_direct ? "copy" : "transcode";
            transcode.audio_decision = audio_direct ? "copy" : "transcode";
            transcode.container = JsonHelper::get_optional<std::string>(info, "Container", "");
        }
        snapshot.is_transcoding = transcode.decision == "transcode";
        snapshot.transcode = std::move(transcode);
        snapshot.raw_payload = session.dump();
        sessions.push_back(std::move(snapshot));
    }

    return sessions;
}

std::expected<std::vector<core::SessionSnapshot>, ConnectorError> EmbyConnector::list_active_sessions() {
    auto body = get_json("/Sessions", "list sessions");
    if (!body) {
        return std::unexpected(body.error());
    }
    return parse_sessions(*body);
}

std::expected<core::ItemMetadata, ConnectorError>
EmbyConnector::get_item_metadata(const std::string& item_id, const std::string& user_id) {
    if (item_id.empty()) {
        return std::unexpected(ConnectorError::NotFound);
    }

    if (!user_id.empty()) {
        auto body = get_json("/Users/" + utils::UrlUtils::encode(user_id) + "/Items/" +
                             utils::UrlUtils::encode(item_id), "item metadata");
        if (!body) {
            return std::unexpected(body.error());
        }
        if (!body->is_object()) {
            return std::unexpected(ConnectorError::MalformedResponse);
        }
        return parse_item(*body);
    }

    auto body = get_json("/Items?" + utils::UrlUtils::build_query_string({{"Ids", item_id}}), "item metadata");
    if (!body) {
        return std::unexpected(body.error());
    }
    if (!JsonHelper::has_array(*body, "Items")) {
        return std::unexpected(ConnectorError::NotFound);
    }
    return parse_item((*body)["Items"][0]);
}

std::expected<std::unique_ptr<EventStream>, ConnectorError> EmbyConnector::open_event_stream() {
    return std::unexpected(ConnectorError::Unsupported);
}

std::expected<void, ConnectorError>
EmbyConnector::send_command(const core::SessionKey& key, const core::SessionCommand& command) {
    using Kind = core::SessionCommand::Kind;
    const auto session_path = "/Sessions/" + utils::UrlUtils::encode(key.get());

    auto send_message = [&](const std::string& header, const std::string& text) {
        nlohmann::json body = {
            {"Header", header},
            {"Text", text},
            {"TimeoutMs", 5000}
        };
        return send(HttpMethod::POST, session_path + "/Message", "send message", body.dump());
    };

    switch (command.kind) {
        case Kind::Play:
            return send(HttpMethod::POST, session_path + "/Playing/Unpause", "play");
        case Kind::Pause:
            return send(HttpMethod::POST, session_path + "/Playing/Pause", "pause");
        case Kind::Stop:
            return send(HttpMethod::POST, session_path + "/Playing/Stop", "stop");
        case Kind::PlayPause:
            return send(HttpMethod::POST, session_path + "/Playing/PlayPause", "play/pause");
        case Kind::Message:
            return send_message("Message", command.text);
        case Kind::Terminate: {
            LOG_INFO("EmbyConnector", "Terminating session " + key.get());
            const auto text = command.text.empty() ? "The server owner has ended the stream." : command.text;
            auto notified = send_message("Stream Terminated", text);
            if (!notified) {
                LOG_WARNING("EmbyConnector", "Termination message failed for " + key.get() + ": " +
                            core::to_string(notified.error()));
            }
            return send(HttpMethod::POST, session_path + "/Playing/Stop", "stop");
        }
    }
    return std::unexpected(ConnectorError::Unsupported);
}

} // namespace services
} // namespace playback_monitor
