#pragma once

#include "playback_monitor/core/models.hpp"
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace playback_monitor {
namespace services {

// Durable upsert-by-identity storage for watch history
class HistoryStore {
public:
    virtual ~HistoryStore() = default;

    // Inserts or replaces the entry with the same history_id, atomically
    virtual std::expected<void, core::StorageError> upsert(const core::HistoryEntry& entry) = 0;

    // Most recently stopped entry for the user and item
    virtual std::expected<std::optional<core::HistoryEntry>, core::StorageError>
    find_latest(const std::string& user_id, const std::string& item_id) = 0;

    virtual std::expected<std::optional<core::HistoryEntry>, core::StorageError>
    find(const std::string& history_id) = 0;

    // Newest first
    virtual std::expected<std::vector<core::HistoryEntry>, core::StorageError>
    list_recent(std::size_t limit) = 0;
};

class InMemoryHistoryStore : public HistoryStore {
public:
    std::expected<void, core::StorageError> upsert(const core::HistoryEntry& entry) override;

    std::expected<std::optional<core::HistoryEntry>, core::StorageError>
    find_latest(const std::string& user_id, const std::string& item_id) override;

    std::expected<std::optional<core::HistoryEntry>, core::StorageError>
    find(const std::string& history_id) override;

    std::expected<std::vector<core::HistoryEntry>, core::StorageError>
    list_recent(std::size_t limit) override;

    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, core::HistoryEntry> m_entries;
};

} // namespace services
} // namespace playback_monitor
