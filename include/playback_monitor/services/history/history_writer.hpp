#pragma once

#include "playback_monitor/core/event_bus.hpp"
#include "playback_monitor/core/models.hpp"
#include "playback_monitor/services/history/history_store.hpp"
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <stop_token>

namespace playback_monitor {
namespace services {

/**
 * @brief Turns finished sessions into watch history
 *
 * A session that stops and a successor for the same user and item that
 * starts within the merge gap are the same watch, typically a client
 * reconnecting under a new session key. The successor is folded into the
 * existing entry instead of producing a new one.
 *
 * record() retries writes with exponential backoff; record_once() makes a
 * single attempt. When a write fails for good the failure is published on
 * the event bus and returned to the caller, which keeps the session in
 * memory and tries again later.
 */
class HistoryWriter {
public:
    HistoryWriter(std::shared_ptr<HistoryStore> store, core::HistoryConfig config);

    void set_event_bus(std::shared_ptr<core::EventBus> bus);

    std::expected<core::HistoryEntry, core::HistoryError> record(const core::Session& session);
    std::expected<core::HistoryEntry, core::HistoryError> record_once(const core::Session& session);

    void set_config(const core::HistoryConfig& config);
    core::HistoryConfig config() const;

    bool storage_healthy() const { return !m_storage_failed.load(); }

    // Aborts retry waits in progress
    void shutdown();

    std::shared_ptr<HistoryStore> store() const { return m_store; }

    static std::string make_history_id(const core::Session& session);
    static core::HistoryEntry entry_for(const core::Session& session);

    // Folds a later session into an existing entry
    static core::HistoryEntry merge(const core::HistoryEntry& existing, const core::HistoryEntry& next);

    // True when next continues existing under the merge rule
    static bool continues(const core::HistoryEntry& existing, const core::HistoryEntry& next,
                          std::chrono::milliseconds merge_gap);

    // True when fresh is a session already recorded in existing
    static bool is_reflush(const core::HistoryEntry& existing, const core::HistoryEntry& fresh);

private:
    std::expected<core::HistoryEntry, core::HistoryError> record_with(const core::Session& session, int retries);
    std::expected<core::HistoryEntry, core::StorageError> write_once(const core::HistoryEntry& fresh,
                                                                     std::chrono::milliseconds merge_gap);
    std::mutex& group_lock(const core::HistoryEntry& entry);

    void report_failure(core::StorageError error, int attempts, const core::SessionKey& key);
    void report_success();

    template<typename EventType>
    void publish(const EventType& event) {
        if (m_event_bus) {
            m_event_bus->publish(event);
        }
    }

    std::shared_ptr<HistoryStore> m_store;
    std::shared_ptr<core::EventBus> m_event_bus;

    mutable std::mutex m_config_mutex;
    core::HistoryConfig m_config;

    // Serialize the read-merge-write per user and item
    std::array<std::mutex, 16> m_group_locks;
    std::atomic<bool> m_storage_failed{false};
    std::stop_source m_shutdown;
};

} // namespace services
} // namespace playback_monitor
