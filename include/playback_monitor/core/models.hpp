#pragma once

#include "playback_monitor/utils/logger.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace playback_monitor {
namespace core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ============================================================================
// Error types
// ============================================================================

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

// Failure contract of every backend connector call
enum class ConnectorError {
    Unreachable,
    Unauthorized,
    NotFound,
    Timeout,
    MalformedResponse,
    Unsupported
};

enum class StorageError {
    Unavailable,
    WriteFailed,
    Corrupt
};

enum class HistoryError {
    StorageFailed
};

enum class PipelineError {
    InvalidConfiguration,
    ConnectorConstructionFailed,
    StorageUnavailable,
    AlreadyRunning
};

// ============================================================================
// Domain types
// ============================================================================

enum class SessionState {
    Starting,
    Playing,
    Paused,
    Buffering,
    Stopped,
    Error
};

enum class ObservationSource {
    Poll,
    Push,
    Internal
};

enum class ObservationKind {
    Started,
    Update,
    Stopped
};

enum class MediaType {
    Movie,
    Episode,
    Track,
    Other
};

struct SessionKey {
    std::string value;

    SessionKey() = default;
    explicit SessionKey(std::string key) : value(std::move(key)) {}

    bool empty() const { return value.empty(); }
    const std::string& get() const { return value; }

    bool operator==(const SessionKey& other) const { return value == other.value; }
    bool operator<(const SessionKey& other) const { return value < other.value; }
};

struct TranscodeInfo {
    std::string decision;        // "direct play", "copy" or "transcode"
    std::string video_decision;
    std::string audio_decision;
    std::string container;
};

// Normalized view of one session as reported by a backend
struct SessionSnapshot {
    SessionKey session_key;
    std::string user_id;
    std::string user_name;
    std::string item_id;
    std::string title;
    MediaType media_type = MediaType::Other;
    SessionState state = SessionState::Playing;
    std::int64_t position_ms = 0;
    std::int64_t duration_ms = 0;  // 0 when unknown
    bool is_transcoding = false;
    std::optional<TranscodeInfo> transcode;
    std::string player;
    std::string raw_payload;
};

struct Observation {
    SessionSnapshot snapshot;
    ObservationSource source = ObservationSource::Poll;
    ObservationKind kind = ObservationKind::Update;
    std::uint64_t revision = 0;
    TimePoint observed_at{};
    std::string note;
};

// Authoritative live record owned by the reconciler
struct Session {
    SessionSnapshot snapshot;
    std::uint64_t last_seen_revision = 0;
    ObservationSource last_source = ObservationSource::Poll;
    TimePoint started_at{};
    TimePoint last_seen_at{};
    TimePoint stopped_at{};
    std::optional<TimePoint> paused_since;
    std::int64_t paused_duration_ms = 0;
    bool seen_by_poll = false;
    bool seen_by_push = false;
    bool ever_transcoded = false;
    bool flush_pending = false;
    bool flush_in_flight = false;
    std::string history_note;

    const SessionKey& key() const { return snapshot.session_key; }
    SessionState state() const { return snapshot.state; }
};

struct HistoryEntry {
    std::string history_id;
    std::vector<SessionKey> session_key_group;
    std::string user_id;
    std::string user_name;
    std::string item_id;
    std::string title;
    TimePoint started_at{};
    TimePoint stopped_at{};
    std::int64_t paused_duration_ms = 0;
    std::int64_t final_position_ms = 0;
    std::int64_t duration_ms = 0;
    int watched_percent = 0;
    bool transcoded = false;
    std::string note;

    bool contains(const SessionKey& key) const {
        for (const auto& k : session_key_group) {
            if (k == key) return true;
        }
        return false;
    }
};

struct LifecycleEvent {
    SessionKey session_key;
    SessionState from_state = SessionState::Starting;
    SessionState to_state = SessionState::Starting;
    TimePoint timestamp{};
    SessionSnapshot snapshot;
    std::string note;
};

enum class NotificationAction {
    OnStart,
    OnPause,
    OnResume,
    OnStop,
    OnWatched,
    OnError
};

struct Notification {
    NotificationAction action = NotificationAction::OnStart;
    SessionKey session_key;
    std::string user_id;
    std::string item_id;
    TimePoint timestamp{};
    SessionSnapshot snapshot;
    int watched_percent = 0;
};

struct ItemMetadata {
    std::string item_id;
    std::string title;
    MediaType media_type = MediaType::Other;
    std::string full_title;
    std::string grandparent_title;  // series or artist
    int parent_index = 0;           // season
    int index = 0;                  // episode
    int year = 0;
    std::int64_t duration_ms = 0;
};

struct SessionCommand {
    enum class Kind {
        Play,
        Pause,
        Stop,
        PlayPause,
        Terminate,
        Message
    };

    Kind kind = Kind::Stop;
    std::string text;

    static SessionCommand terminate(std::string reason) {
        return SessionCommand{Kind::Terminate, std::move(reason)};
    }
    static SessionCommand message(std::string text) {
        return SessionCommand{Kind::Message, std::move(text)};
    }
};

// ============================================================================
// Configuration structures
// ============================================================================

struct ConnectorConfig {
    std::string backend = "plex";
    std::string server_url;
    std::string api_token;
    std::chrono::seconds request_timeout{30};
    bool verify_ssl = true;
    int max_retries = 3;
    std::chrono::milliseconds retry_initial_backoff{500};
    std::chrono::milliseconds retry_max_backoff{8000};

    bool is_valid() const;
};

struct PollerConfig {
    std::chrono::milliseconds interval{5000};
    int missed_ticks_before_stop = 1;
    int failure_threshold = 6;

    bool is_valid() const;
};

struct PushConfig {
    bool enabled = true;
    std::chrono::milliseconds reconnect_initial_backoff{1000};
    std::chrono::milliseconds reconnect_max_backoff{60000};

    bool is_valid() const;
};

struct ReconcilerConfig {
    std::chrono::milliseconds stale_session_grace{90000};
    std::size_t shard_count = 4;
    std::size_t intake_capacity = 4096;

    bool is_valid() const;
};

struct HistoryConfig {
    std::string database_path;  // empty keeps history in memory
    std::chrono::milliseconds merge_gap{30000};
    int write_retries = 5;
    std::chrono::milliseconds write_initial_backoff{200};
    std::chrono::milliseconds write_max_backoff{5000};

    bool is_valid() const;
};

struct NotificationConfig {
    std::size_t queue_capacity = 256;
    int watched_threshold_percent = 85;
    int handler_retries = 2;
    bool log_handler = true;
    std::vector<std::string> webhook_urls;

    bool is_valid() const;
};

struct MonitorConfig {
    ConnectorConfig connector;
    PollerConfig poller;
    PushConfig push;
    ReconcilerConfig reconciler;
    HistoryConfig history;
    NotificationConfig notifications;
    utils::LogLevel log_level = utils::LogLevel::Info;
    std::string log_file;

    bool is_valid() const;
};

// ============================================================================
// String conversions
// ============================================================================

std::string to_string(SessionState state);
std::optional<SessionState> session_state_from_string(const std::string& str);
std::string to_string(ObservationSource source);
std::string to_string(NotificationAction action);
std::string to_string(MediaType type);
std::string to_string(ConnectorError error);
bool is_transient(ConnectorError error);
std::string to_string(StorageError error);
std::string to_string(PipelineError error);
std::string to_string(ConfigError error);

std::int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(std::int64_t ms);

} // namespace core
} // namespace playback_monitor

namespace std {
    template<>
    struct hash<playback_monitor::core::SessionKey> {
        size_t operator()(const playback_monitor::core::SessionKey& key) const noexcept {
            return std::hash<std::string>{}(key.value);
        }
    };
}
