#include "playback_monitor/core/models.hpp"
#include "playback_monitor/utils/url_utils.hpp"

namespace playback_monitor {
namespace core {

bool ConnectorConfig::is_valid() const {
    if (backend != "plex" && backend != "emby") {
        return false;
    }
    return utils::UrlUtils::is_valid_url(server_url) &&
           request_timeout.count() > 0 &&
           max_retries >= 0 &&
           retry_initial_backoff.count() >= 0 &&
           retry_max_backoff >= retry_initial_backoff;
}

bool PollerConfig::is_valid() const {
    return interval.count() > 0 &&
           missed_ticks_before_stop >= 0 &&
           failure_threshold > 0;
}

bool PushConfig::is_valid() const {
    return reconnect_initial_backoff.count() > 0 &&
           reconnect_max_backoff >= reconnect_initial_backoff;
}

bool ReconcilerConfig::is_valid() const {
    return stale_session_grace.count() > 0 &&
           shard_count > 0 &&
           intake_capacity >= shard_count;
}

bool HistoryConfig::is_valid() const {
    return merge_gap.count() >= 0 &&
           write_retries >= 0 &&
           write_initial_backoff.count() >= 0 &&
           write_max_backoff >= write_initial_backoff;
}

bool NotificationConfig::is_valid() const {
    for (const auto& url : webhook_urls) {
        if (!utils::UrlUtils::is_valid_url(url)) {
            return false;
        }
    }
    return queue_capacity > 0 &&
           watched_threshold_percent >= 0 && watched_threshold_percent <= 100 &&
           handler_retries >= 0;
}

bool MonitorConfig::is_valid() const {
    return connector.is_valid() &&
           poller.is_valid() &&
           push.is_valid() &&
           reconciler.is_valid() &&
           history.is_valid() &&
           notifications.is_valid();
}

std::string to_string(SessionState state) {
    switch (state) {
        case SessionState::Starting: return "starting";
        case SessionState::Playing: return "playing";
        case SessionState::Paused: return "paused";
        case SessionState::Buffering: return "buffering";
        case SessionState::Stopped: return "stopped";
        case SessionState::Error: return "error";
    }
    return "unknown";
}

std::optional<SessionState> session_state_from_string(const std::string& str) {
    if (str == "starting") return SessionState::Starting;
    if (str == "playing") return SessionState::Playing;
    if (str == "paused") return SessionState::Paused;
    if (str == "buffering") return SessionState::Buffering;
    if (str == "stopped") return SessionState::Stopped;
    if (str == "error") return SessionState::Error;
    return std::nullopt;
}

std::string to_string(ObservationSource source) {
    switch (source) {
        case ObservationSource::Poll: return "poll";
        case ObservationSource::Push: return "push";
        case ObservationSource::Internal: return "internal";
    }
    return "unknown";
}

std::string to_string(NotificationAction action) {
    switch (action) {
        case NotificationAction::OnStart: return "on_start";
        case NotificationAction::OnPause: return "on_pause";
        case NotificationAction::OnResume: return "on_resume";
        case NotificationAction::OnStop: return "on_stop";
        case NotificationAction::OnWatched: return "on_watched";
        case NotificationAction::OnError: return "on_error";
    }
    return "unknown";
}

std::string to_string(MediaType type) {
    switch (type) {
        case MediaType::Movie: return "movie";
        case MediaType::Episode: return "episode";
        case MediaType::Track: return "track";
        case MediaType::Other: return "other";
    }
    return "other";
}

std::string to_string(ConnectorError error) {
    switch (error) {
        case ConnectorError::Unreachable: return "unreachable";
        case ConnectorError::Unauthorized: return "unauthorized";
        case ConnectorError::NotFound: return "not found";
        case ConnectorError::Timeout: return "timeout";
        case ConnectorError::MalformedResponse: return "malformed response";
        case ConnectorError::Unsupported: return "unsupported";
    }
    return "unknown connector error";
}

bool is_transient(ConnectorError error) {
    return error == ConnectorError::Unreachable || error == ConnectorError::Timeout;
}

std::string to_string(StorageError error) {
    switch (error) {
        case StorageError::Unavailable: return "storage unavailable";
        case StorageError::WriteFailed: return "write failed";
        case StorageError::Corrupt: return "corrupt record";
    }
    return "unknown storage error";
}

std::string to_string(PipelineError error) {
    switch (error) {
        case PipelineError::InvalidConfiguration: return "invalid configuration";
        case PipelineError::ConnectorConstructionFailed: return "connector construction failed";
        case PipelineError::StorageUnavailable: return "history storage unavailable";
        case PipelineError::AlreadyRunning: return "pipeline already running";
    }
    return "unknown pipeline error";
}

std::string to_string(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::InvalidFormat: return "invalid format";
        case ConfigError::ValidationError: return "validation error";
        case ConfigError::PermissionDenied: return "permission denied";
    }
    return "unknown config error";
}

std::int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(std::int64_t ms) {
    return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms))};
}

} // namespace core
} // namespace playback_monitor
