#include "playback_monitor/services/monitor/session_reconciler.hpp"
#include "playback_monitor/core/session_state.hpp"
#include "playback_monitor/utils/logger.hpp"
#include <algorithm>

namespace playback_monitor {
namespace services {

using core::ObservationKind;
using core::ObservationSource;
using core::SessionState;

std::string to_string(ApplyResult result) {
    switch (result) {
        case ApplyResult::Applied: return "applied";
        case ApplyResult::Touched: return "touched";
        case ApplyResult::Stale: return "stale";
        case ApplyResult::Duplicate: return "duplicate";
        case ApplyResult::Illegal: return "illegal";
        case ApplyResult::Malformed: return "malformed";
        case ApplyResult::Ignored: return "ignored";
    }
    return "unknown";
}

SessionReconciler::SessionReconciler(std::size_t shard_count, LifecycleSink sink, SessionFlusher flusher,
                                     SessionFlusher pending_flusher)
    : m_sink(std::move(sink))
    , m_flusher(std::move(flusher))
    , m_pending_flusher(pending_flusher ? std::move(pending_flusher) : m_flusher) {
    const std::size_t shards = shard_count > 0 ? shard_count : 1;
    m_shards.reserve(shards);
    for (std::size_t i = 0; i < shards; ++i) {
        m_shards.push_back(std::make_unique<Shard>());
    }
}

SessionReconciler::Shard& SessionReconciler::shard_for(const core::SessionKey& key) {
    return *m_shards[std::hash<core::SessionKey>{}(key) % m_shards.size()];
}

ApplyResult SessionReconciler::record(ApplyResult result) {
    switch (result) {
        case ApplyResult::Applied: m_counters.applied.fetch_add(1); break;
        case ApplyResult::Touched: m_counters.touched.fetch_add(1); break;
        case ApplyResult::Stale: m_counters.stale.fetch_add(1); break;
        case ApplyResult::Duplicate: m_counters.duplicate.fetch_add(1); break;
        case ApplyResult::Illegal: m_counters.illegal.fetch_add(1); break;
        case ApplyResult::Malformed: m_counters.malformed.fetch_add(1); break;
        case ApplyResult::Ignored: m_counters.ignored.fetch_add(1); break;
    }
    return result;
}

ApplyResult SessionReconciler::apply(const core::Observation& observation) {
    const auto& snapshot = observation.snapshot;
    const auto& key = snapshot.session_key;

    if (key.empty() || snapshot.position_ms < 0 || snapshot.duration_ms < 0) {
        LOG_WARNING("SessionReconciler", "Dropping malformed " + core::to_string(observation.source) +
                    " observation for '" + key.get() + "'");
        return record(ApplyResult::Malformed);
    }

    const auto now = observation.observed_at == core::TimePoint{} ? core::Clock::now() : observation.observed_at;
    const auto target = observation.kind == ObservationKind::Stopped ? SessionState::Stopped : snapshot.state;

    auto& shard = shard_for(key);
    std::unique_lock lock(shard.mutex);

    auto it = shard.sessions.find(key);
    if (it == shard.sessions.end()) {
        auto tombstone = shard.tombstones.find(key);
        if (tombstone != shard.tombstones.end() && observation.revision <= tombstone->second.revision) {
            return record(ApplyResult::Stale);
        }
        if (target == SessionState::Stopped) {
            return record(ApplyResult::Ignored);
        }
        if (tombstone != shard.tombstones.end()) {
            LOG_DEBUG("SessionReconciler", "Key " + key.get() + " reused after flush, starting a new session");
            shard.tombstones.erase(tombstone);
        }
        return create_session(shard, observation, now);
    }

    auto& session = it->second;

    // The previous logical session is still on its way to history
    if (session.flush_pending || session.flush_in_flight) {
        return record(target == SessionState::Stopped ? ApplyResult::Touched : ApplyResult::Illegal);
    }

    if (observation.revision < session.last_seen_revision) {
        return record(ApplyResult::Stale);
    }

    if (observation.revision == session.last_seen_revision) {
        if (observation.source == session.last_source) {
            return record(ApplyResult::Duplicate);
        }
        // Ties go to push on state; poll still refines the position when both agree
        if (observation.source == ObservationSource::Poll && target == session.state()) {
            session.snapshot.position_ms = snapshot.position_ms;
            if (snapshot.duration_ms > 0) {
                session.snapshot.duration_ms = snapshot.duration_ms;
            }
            session.seen_by_poll = true;
            session.last_seen_at = now;
            return record(ApplyResult::Touched);
        }
        if (observation.source != ObservationSource::Push) {
            return record(ApplyResult::Stale);
        }
    }

    if (target != session.state() && !core::is_legal_transition(session.state(), target)) {
        LOG_DEBUG("SessionReconciler", "Illegal transition " + core::to_string(session.state()) + " -> " +
                  core::to_string(target) + " for " + key.get());
        return record(ApplyResult::Illegal);
    }

    merge_snapshot(session, observation, now);

    if (target == session.state()) {
        return record(ApplyResult::Touched);
    }

    transition(session, target, now, observation.note);
    if (target != SessionState::Stopped) {
        return record(ApplyResult::Applied);
    }

    session.stopped_at = now;
    if (!observation.note.empty()) {
        session.history_note = observation.note;
    }
    session.flush_in_flight = true;
    core::Session finished = session;
    lock.unlock();

    flush(shard, finished, m_flusher);
    return record(ApplyResult::Applied);
}

ApplyResult SessionReconciler::create_session(Shard& shard, const core::Observation& observation,
                                              core::TimePoint now) {
    const auto& key = observation.snapshot.session_key;

    core::Session session;
    session.snapshot = observation.snapshot;
    session.snapshot.state = SessionState::Starting;
    session.last_seen_revision = observation.revision;
    session.last_source = observation.source;
    session.started_at = now;
    session.last_seen_at = now;
    session.seen_by_poll = observation.source == ObservationSource::Poll;
    session.seen_by_push = observation.source == ObservationSource::Push;
    session.ever_transcoded = observation.snapshot.is_transcoding;

    auto [it, inserted] = shard.sessions.emplace(key, std::move(session));

    LOG_INFO("SessionReconciler", "New session " + key.get() + " (" + it->second.snapshot.title +
             ") via " + core::to_string(observation.source));

    if (observation.snapshot.state != SessionState::Starting) {
        transition(it->second, observation.snapshot.state, now, observation.note);
    }
    return record(ApplyResult::Applied);
}

void SessionReconciler::merge_snapshot(core::Session& session, const core::Observation& observation,
                                       core::TimePoint now) {
    const auto& incoming = observation.snapshot;
    auto& current = session.snapshot;

    if (!incoming.user_id.empty()) current.user_id = incoming.user_id;
    if (!incoming.user_name.empty()) current.user_name = incoming.user_name;
    if (!incoming.item_id.empty()) current.item_id = incoming.item_id;
    if (!incoming.title.empty()) current.title = incoming.title;
    if (!incoming.player.empty()) current.player = incoming.player;
    if (!incoming.raw_payload.empty()) current.raw_payload = incoming.raw_payload;
    if (incoming.media_type != core::MediaType::Other) current.media_type = incoming.media_type;
    if (incoming.duration_ms > 0) current.duration_ms = incoming.duration_ms;
    current.position_ms = incoming.position_ms;

    // Push payloads carry no transcode detail; keep what polling learned
    if (incoming.transcode) {
        current.transcode = incoming.transcode;
        current.is_transcoding = incoming.is_transcoding;
    }
    session.ever_transcoded = session.ever_transcoded || current.is_transcoding;

    session.last_seen_revision = observation.revision;
    session.last_source = observation.source;
    if (observation.source == ObservationSource::Poll) session.seen_by_poll = true;
    if (observation.source == ObservationSource::Push) session.seen_by_push = true;
    if (observation.source != ObservationSource::Internal) {
        session.last_seen_at = now;
    }
}

void SessionReconciler::transition(core::Session& session, SessionState to, core::TimePoint now,
                                   const std::string& note) {
    const auto from = session.state();

    if (from == SessionState::Paused && session.paused_since) {
        const auto paused = std::chrono::duration_cast<std::chrono::milliseconds>(now - *session.paused_since);
        session.paused_duration_ms += std::max<std::int64_t>(0, paused.count());
        session.paused_since.reset();
    }
    if (to == SessionState::Paused) {
        session.paused_since = now;
    }
    session.snapshot.state = to;

    LOG_DEBUG("SessionReconciler", session.key().get() + ": " + core::to_string(from) + " -> " + core::to_string(to));

    m_counters.lifecycle_events.fetch_add(1);
    if (!m_sink) {
        return;
    }

    core::LifecycleEvent event{
        .session_key = session.key(),
        .from_state = from,
        .to_state = to,
        .timestamp = now,
        .snapshot = session.snapshot,
        .note = note
    };

    try {
        m_sink(event);
    } catch (const std::exception& e) {
        LOG_ERROR("SessionReconciler", "Lifecycle sink failed for " + session.key().get() + ": " + e.what());
    }
}

bool SessionReconciler::flush(Shard& shard, const core::Session& session, const SessionFlusher& flusher) {
    std::expected<void, core::HistoryError> result;
    if (flusher) {
        try {
            result = flusher(session);
        } catch (const std::exception& e) {
            LOG_ERROR("SessionReconciler", "History flush threw for " + session.key().get() + ": " + e.what());
            result = std::unexpected(core::HistoryError::StorageFailed);
        }
    }

    std::lock_guard lock(shard.mutex);
    auto it = shard.sessions.find(session.key());
    if (it == shard.sessions.end()) {
        return result.has_value();
    }

    if (result) {
        shard.tombstones[session.key()] = Tombstone{it->second.last_seen_revision, core::Clock::now()};
        shard.sessions.erase(it);
        m_counters.flushes.fetch_add(1);
        LOG_DEBUG("SessionReconciler", "Flushed session " + session.key().get());
        return true;
    }

    it->second.flush_in_flight = false;
    it->second.flush_pending = true;
    m_counters.flush_failures.fetch_add(1);
    LOG_DEBUG("SessionReconciler", "Flush failed for " + session.key().get() + ", keeping it in memory");
    return false;
}

std::size_t SessionReconciler::retry_pending_flushes() {
    std::size_t succeeded = 0;

    for (auto& shard : m_shards) {
        std::vector<core::Session> pending;
        {
            std::lock_guard lock(shard->mutex);
            for (auto& [key, session] : shard->sessions) {
                if (session.flush_pending && !session.flush_in_flight) {
                    session.flush_pending = false;
                    session.flush_in_flight = true;
                    pending.push_back(session);
                }
            }
        }

        for (std::size_t i = 0; i < pending.size(); ++i) {
            if (flush(*shard, pending[i], m_pending_flusher)) {
                ++succeeded;
                continue;
            }

            // Storage is still failing; the rest wait for the next pass
            std::lock_guard lock(shard->mutex);
            for (std::size_t rest = i + 1; rest < pending.size(); ++rest) {
                auto it = shard->sessions.find(pending[rest].key());
                if (it != shard->sessions.end()) {
                    it->second.flush_in_flight = false;
                    it->second.flush_pending = true;
                }
            }
            if (succeeded > 0) {
                LOG_INFO("SessionReconciler", "Recovered " + std::to_string(succeeded) + " pending history flushes");
            }
            return succeeded;
        }
    }

    if (succeeded > 0) {
        LOG_INFO("SessionReconciler", "Recovered " + std::to_string(succeeded) + " pending history flushes");
    }
    return succeeded;
}

core::Observation SessionReconciler::internal_stop(const core::Session& session, const std::string& note,
                                                   core::TimePoint now) const {
    core::Observation observation;
    observation.snapshot = session.snapshot;
    observation.source = ObservationSource::Internal;
    observation.kind = ObservationKind::Stopped;
    observation.revision = session.last_seen_revision + 1;
    observation.observed_at = now;
    observation.note = note;
    return observation;
}

std::size_t SessionReconciler::stop_matching(const std::function<bool(const core::Session&)>& predicate,
                                             const std::string& note, core::TimePoint now) {
    std::vector<core::Observation> stops;
    for (auto& shard : m_shards) {
        std::lock_guard lock(shard->mutex);
        for (const auto& [key, session] : shard->sessions) {
            if (!session.flush_pending && !session.flush_in_flight && predicate(session)) {
                stops.push_back(internal_stop(session, note, now));
            }
        }
    }

    std::size_t stopped = 0;
    for (const auto& observation : stops) {
        if (apply(observation) == ApplyResult::Applied) {
            ++stopped;
        }
    }
    return stopped;
}

std::size_t SessionReconciler::expire_idle(core::TimePoint now, std::chrono::milliseconds grace) {
    const auto stopped = stop_matching([&](const core::Session& session) {
        return now - session.last_seen_at > grace;
    }, "grace expired", now);

    for (auto& shard : m_shards) {
        std::lock_guard lock(shard->mutex);
        std::erase_if(shard->tombstones, [&](const auto& entry) {
            return now - entry.second.removed_at > grace;
        });
    }

    if (stopped > 0) {
        LOG_INFO("SessionReconciler", "Expired " + std::to_string(stopped) + " idle sessions");
    }
    return stopped;
}

std::size_t SessionReconciler::force_stop_poll_only(const std::string& note) {
    const auto stopped = stop_matching([](const core::Session& session) {
        return session.seen_by_poll && !session.seen_by_push;
    }, note, core::Clock::now());

    if (stopped > 0) {
        LOG_WARNING("SessionReconciler", "Force-stopped " + std::to_string(stopped) + " poll-only sessions: " + note);
    }
    return stopped;
}

std::size_t SessionReconciler::flush_all(const std::string& note) {
    const auto stopped = stop_matching([](const core::Session&) { return true; }, note, core::Clock::now());
    retry_pending_flushes();

    LOG_INFO("SessionReconciler", "Stopped " + std::to_string(stopped) + " live sessions (" + note + ")");
    return stopped;
}

std::vector<core::Session> SessionReconciler::live_sessions() const {
    std::vector<core::Session> sessions;
    for (const auto& shard : m_shards) {
        std::lock_guard lock(shard->mutex);
        for (const auto& [key, session] : shard->sessions) {
            sessions.push_back(session);
        }
    }
    return sessions;
}

std::optional<core::Session> SessionReconciler::find(const core::SessionKey& key) const {
    const auto& shard = *m_shards[std::hash<core::SessionKey>{}(key) % m_shards.size()];
    std::lock_guard lock(shard.mutex);
    auto it = shard.sessions.find(key);
    if (it == shard.sessions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t SessionReconciler::live_count() const {
    std::size_t count = 0;
    for (const auto& shard : m_shards) {
        std::lock_guard lock(shard->mutex);
        count += shard->sessions.size();
    }
    return count;
}

std::size_t SessionReconciler::pending_flush_count() const {
    std::size_t count = 0;
    for (const auto& shard : m_shards) {
        std::lock_guard lock(shard->mutex);
        for (const auto& [key, session] : shard->sessions) {
            if (session.flush_pending) {
                ++count;
            }
        }
    }
    return count;
}

SessionReconciler::Counters SessionReconciler::counters() const {
    return Counters{
        .applied = m_counters.applied.load(),
        .touched = m_counters.touched.load(),
        .stale = m_counters.stale.load(),
        .duplicate = m_counters.duplicate.load(),
        .illegal = m_counters.illegal.load(),
        .malformed = m_counters.malformed.load(),
        .ignored = m_counters.ignored.load(),
        .lifecycle_events = m_counters.lifecycle_events.load(),
        .flushes = m_counters.flushes.load(),
        .flush_failures = m_counters.flush_failures.load()
    };
}

} // namespace services
} // namespace playback_monitor
