#include "playback_monitor/services/history/history_writer.hpp"
#include "playback_monitor/core/events.hpp"
#include "playback_monitor/core/session_state.hpp"
#include "playback_monitor/utils/logger.hpp"
#include "playback_monitor/utils/threading.hpp"
#include <algorithm>
#include <functional>

namespace playback_monitor {
namespace services {

HistoryWriter::HistoryWriter(std::shared_ptr<HistoryStore> store, core::HistoryConfig config)
    : m_store(std::move(store))
    , m_config(std::move(config)) {}

void HistoryWriter::set_event_bus(std::shared_ptr<core::EventBus> bus) {
    m_event_bus = std::move(bus);
}

void HistoryWriter::set_config(const core::HistoryConfig& config) {
    std::lock_guard lock(m_config_mutex);
    m_config = config;
}

core::HistoryConfig HistoryWriter::config() const {
    std::lock_guard lock(m_config_mutex);
    return m_config;
}

void HistoryWriter::shutdown() {
    m_shutdown.request_stop();
}

std::string HistoryWriter::make_history_id(const core::Session& session) {
    return session.snapshot.user_id + "|" + session.snapshot.item_id + "|" +
           std::to_string(core::to_epoch_ms(session.started_at));
}

core::HistoryEntry HistoryWriter::entry_for(const core::Session& session) {
    const auto& snapshot = session.snapshot;

    core::HistoryEntry entry;
    entry.history_id = make_history_id(session);
    entry.session_key_group.push_back(session.key());
    entry.user_id = snapshot.user_id;
    entry.user_name = snapshot.user_name;
    entry.item_id = snapshot.item_id;
    entry.title = snapshot.title;
    entry.started_at = session.started_at;
    entry.stopped_at = session.stopped_at == core::TimePoint{} ? session.last_seen_at : session.stopped_at;
    entry.paused_duration_ms = session.paused_duration_ms;
    entry.final_position_ms = snapshot.position_ms;
    entry.duration_ms = snapshot.duration_ms;
    entry.watched_percent = core::compute_watched_percent(snapshot.position_ms, snapshot.duration_ms);
    entry.transcoded = session.ever_transcoded || snapshot.is_transcoding;
    entry.note = session.history_note;
    return entry;
}

bool HistoryWriter::continues(const core::HistoryEntry& existing, const core::HistoryEntry& next,
                              std::chrono::milliseconds merge_gap) {
    if (existing.user_id.empty() || existing.item_id.empty()) {
        return false;
    }
    if (existing.user_id != next.user_id || existing.item_id != next.item_id) {
        return false;
    }
    return next.started_at - existing.stopped_at <= merge_gap;
}

core::HistoryEntry HistoryWriter::merge(const core::HistoryEntry& existing, const core::HistoryEntry& next) {
    core::HistoryEntry merged = existing;

    for (const auto& key : next.session_key_group) {
        if (!merged.contains(key)) {
            merged.session_key_group.push_back(key);
        }
    }

    merged.started_at = std::min(existing.started_at, next.started_at);
    merged.stopped_at = std::max(existing.stopped_at, next.stopped_at);
    merged.paused_duration_ms = existing.paused_duration_ms + next.paused_duration_ms;
    merged.final_position_ms = next.final_position_ms;
    if (next.duration_ms > 0) {
        merged.duration_ms = next.duration_ms;
    }
    if (!next.user_name.empty()) merged.user_name = next.user_name;
    if (!next.title.empty()) merged.title = next.title;
    merged.transcoded = existing.transcoded || next.transcoded;
    if (!next.note.empty()) {
        merged.note = next.note;
    }
    merged.watched_percent = core::compute_watched_percent(merged.final_position_ms, merged.duration_ms);
    return merged;
}

bool HistoryWriter::is_reflush(const core::HistoryEntry& existing, const core::HistoryEntry& fresh) {
    // A key can be reused by a later session; only one that began inside the
    // recorded span is the same watch flushed again
    const auto& key = fresh.session_key_group.front();
    return existing.contains(key) &&
           fresh.started_at >= existing.started_at &&
           fresh.started_at <= existing.stopped_at;
}

std::mutex& HistoryWriter::group_lock(const core::HistoryEntry& entry) {
    const auto hash = std::hash<std::string>{}(entry.user_id + "|" + entry.item_id);
    return m_group_locks[hash % m_group_locks.size()];
}

std::expected<core::HistoryEntry, core::StorageError> HistoryWriter::write_once(const core::HistoryEntry& fresh,
                                                                                 std::chrono::milliseconds merge_gap) {
    std::lock_guard lock(group_lock(fresh));

    std::optional<core::HistoryEntry> latest;
    if (!fresh.user_id.empty() && !fresh.item_id.empty()) {
        auto found = m_store->find_latest(fresh.user_id, fresh.item_id);
        if (!found) {
            return std::unexpected(found.error());
        }
        latest = std::move(*found);
    }

    core::HistoryEntry entry;
    if (latest && is_reflush(*latest, fresh)) {
        // Refresh the end without counting pauses twice
        entry = *latest;
        entry.stopped_at = std::max(latest->stopped_at, fresh.stopped_at);
        entry.final_position_ms = fresh.final_position_ms;
        if (fresh.duration_ms > 0) entry.duration_ms = fresh.duration_ms;
        if (!fresh.note.empty()) entry.note = fresh.note;
        entry.transcoded = latest->transcoded || fresh.transcoded;
        entry.watched_percent = core::compute_watched_percent(entry.final_position_ms, entry.duration_ms);
    } else if (latest && continues(*latest, fresh, merge_gap)) {
        LOG_INFO("HistoryWriter", "Merging session " + fresh.session_key_group.front().get() + " into " +
                 latest->history_id);
        entry = merge(*latest, fresh);
    } else {
        entry = fresh;
    }

    auto written = m_store->upsert(entry);
    if (!written) {
        return std::unexpected(written.error());
    }
    return entry;
}

std::expected<core::HistoryEntry, core::HistoryError> HistoryWriter::record(const core::Session& session) {
    return record_with(session, config().write_retries);
}

std::expected<core::HistoryEntry, core::HistoryError> HistoryWriter::record_once(const core::Session& session) {
    return record_with(session, 0);
}

std::expected<core::HistoryEntry, core::HistoryError> HistoryWriter::record_with(const core::Session& session,
                                                                                 int retries) {
    const auto cfg = config();
    const auto fresh = entry_for(session);

    // The group lock is held per attempt only; backoff waits hold nothing
    auto result = write_once(fresh, cfg.merge_gap);
    int attempts = 1;
    for (int retry = 0; !result && retry < retries; ++retry) {
        const auto delay = utils::exponential_backoff(retry, cfg.write_initial_backoff, cfg.write_max_backoff);
        LOG_DEBUG("HistoryWriter", "Storage error (" + core::to_string(result.error()) + "), retrying in " +
                  std::to_string(delay.count()) + "ms");
        if (!utils::interruptible_sleep(delay, m_shutdown.get_token())) {
            break;
        }
        result = write_once(fresh, cfg.merge_gap);
        ++attempts;
    }

    if (!result) {
        report_failure(result.error(), attempts, session.key());
        return std::unexpected(core::HistoryError::StorageFailed);
    }

    report_success();
    const auto& entry = *result;
    LOG_DEBUG("HistoryWriter", "Recorded " + entry.history_id + " (" + std::to_string(entry.watched_percent) +
              "% watched, " + std::to_string(entry.session_key_group.size()) + " sessions)");
    return entry;
}

void HistoryWriter::report_failure(core::StorageError error, int attempts, const core::SessionKey& key) {
    if (!m_storage_failed.exchange(true)) {
        LOG_ERROR("HistoryWriter", "History storage unavailable (" + core::to_string(error) + ") after " +
                  std::to_string(attempts) + " attempts; sessions are kept in memory until it recovers");
    }
    publish(core::events::HistoryStorageFailure{error, attempts, key});
}

void HistoryWriter::report_success() {
    if (m_storage_failed.exchange(false)) {
        LOG_INFO("HistoryWriter", "History storage recovered");
        publish(core::events::HistoryStorageRecovered{});
    }
}

} // namespace services
} // namespace playback_monitor
