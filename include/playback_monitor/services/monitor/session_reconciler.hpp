#pragma once

#include "playback_monitor/core/models.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace playback_monitor {
namespace services {

// Outcome of applying one observation to the live session table
enum class ApplyResult {
    Applied,    // accepted and the state changed (one lifecycle event)
    Touched,    // accepted without a state change
    Stale,      // revision older than the session or its tombstone
    Duplicate,  // same revision from the same source
    Illegal,    // transition not in the table, or session is being flushed
    Malformed,  // unusable snapshot
    Ignored     // stop for a key that is not live
};

std::string to_string(ApplyResult result);

/**
 * @brief Authoritative owner of the live session table
 *
 * Sessions are partitioned into shards by key. Each mutation happens under
 * its shard's lock, and ordering per key is provided by the intake, which
 * routes every observation for a key to the same worker. Accepted state
 * changes are reported to the lifecycle sink while the shard is locked so
 * events for one key leave in the order they were applied.
 *
 * Stopped sessions are handed to the flusher outside the lock. A successful
 * flush removes the session and leaves a tombstone carrying its final
 * revision; a failed flush keeps the session with flush_pending set until
 * retry_pending_flushes() succeeds. Those retries go through the pending
 * flusher when one is given, so the apply path can stay on a single attempt.
 */
class SessionReconciler {
public:
    using LifecycleSink = std::function<void(const core::LifecycleEvent&)>;
    using SessionFlusher = std::function<std::expected<void, core::HistoryError>(const core::Session&)>;

    struct Counters {
        std::uint64_t applied = 0;
        std::uint64_t touched = 0;
        std::uint64_t stale = 0;
        std::uint64_t duplicate = 0;
        std::uint64_t illegal = 0;
        std::uint64_t malformed = 0;
        std::uint64_t ignored = 0;
        std::uint64_t lifecycle_events = 0;
        std::uint64_t flushes = 0;
        std::uint64_t flush_failures = 0;
    };

    SessionReconciler(std::size_t shard_count, LifecycleSink sink, SessionFlusher flusher,
                      SessionFlusher pending_flusher = {});

    SessionReconciler(const SessionReconciler&) = delete;
    SessionReconciler& operator=(const SessionReconciler&) = delete;

    ApplyResult apply(const core::Observation& observation);

    // Stops sessions no source has reported for longer than grace and drops
    // tombstones older than grace. Returns the number of sessions stopped.
    std::size_t expire_idle(core::TimePoint now, std::chrono::milliseconds grace);

    // Stops sessions that only the poller has ever reported
    std::size_t force_stop_poll_only(const std::string& note);

    // Stops every live session; used on shutdown
    std::size_t flush_all(const std::string& note);

    // Returns the number of sessions whose flush now succeeded. The pass
    // ends at the first failure.
    std::size_t retry_pending_flushes();

    std::vector<core::Session> live_sessions() const;
    std::optional<core::Session> find(const core::SessionKey& key) const;
    std::size_t live_count() const;
    std::size_t pending_flush_count() const;
    Counters counters() const;

private:
    struct Tombstone {
        std::uint64_t revision = 0;
        core::TimePoint removed_at{};
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<core::SessionKey, core::Session> sessions;
        std::unordered_map<core::SessionKey, Tombstone> tombstones;
    };

    struct AtomicCounters {
        std::atomic<std::uint64_t> applied{0};
        std::atomic<std::uint64_t> touched{0};
        std::atomic<std::uint64_t> stale{0};
        std::atomic<std::uint64_t> duplicate{0};
        std::atomic<std::uint64_t> illegal{0};
        std::atomic<std::uint64_t> malformed{0};
        std::atomic<std::uint64_t> ignored{0};
        std::atomic<std::uint64_t> lifecycle_events{0};
        std::atomic<std::uint64_t> flushes{0};
        std::atomic<std::uint64_t> flush_failures{0};
    };

    Shard& shard_for(const core::SessionKey& key);
    ApplyResult record(ApplyResult result);

    ApplyResult create_session(Shard& shard, const core::Observation& observation, core::TimePoint now);
    void merge_snapshot(core::Session& session, const core::Observation& observation, core::TimePoint now);
    void transition(core::Session& session, core::SessionState to, core::TimePoint now, const std::string& note);

    bool flush(Shard& shard, const core::Session& session, const SessionFlusher& flusher);

    core::Observation internal_stop(const core::Session& session, const std::string& note, core::TimePoint now) const;
    std::size_t stop_matching(const std::function<bool(const core::Session&)>& predicate,
                              const std::string& note, core::TimePoint now);

    LifecycleSink m_sink;
    SessionFlusher m_flusher;
    SessionFlusher m_pending_flusher;
    std::vector<std::unique_ptr<Shard>> m_shards;
    AtomicCounters m_counters;
};

} // namespace services
} // namespace playback_monitor
