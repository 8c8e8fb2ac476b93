#include "playback_monitor/services/history/history_store.hpp"
#include <algorithm>

namespace playback_monitor {
namespace services {

std::expected<void, core::StorageError> InMemoryHistoryStore::upsert(const core::HistoryEntry& entry) {
    std::lock_guard lock(m_mutex);
    m_entries[entry.history_id] = entry;
    return {};
}

std::expected<std::optional<core::HistoryEntry>, core::StorageError>
InMemoryHistoryStore::find_latest(const std::string& user_id, const std::string& item_id) {
    std::lock_guard lock(m_mutex);

    const core::HistoryEntry* latest = nullptr;
    for (const auto& [id, entry] : m_entries) {
        if (entry.user_id != user_id || entry.item_id != item_id) {
            continue;
        }
        if (!latest || entry.stopped_at > latest->stopped_at) {
            latest = &entry;
        }
    }

    if (!latest) {
        return std::optional<core::HistoryEntry>{};
    }
    return std::optional<core::HistoryEntry>{*latest};
}

std::expected<std::optional<core::HistoryEntry>, core::StorageError>
InMemoryHistoryStore::find(const std::string& history_id) {
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(history_id);
    if (it == m_entries.end()) {
        return std::optional<core::HistoryEntry>{};
    }
    return std::optional<core::HistoryEntry>{it->second};
}

std::expected<std::vector<core::HistoryEntry>, core::StorageError>
InMemoryHistoryStore::list_recent(std::size_t limit) {
    std::lock_guard lock(m_mutex);

    std::vector<core::HistoryEntry> entries;
    entries.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) {
        entries.push_back(entry);
    }

    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.stopped_at > b.stopped_at;
    });
    if (entries.size() > limit) {
        entries.resize(limit);
    }
    return entries;
}

std::size_t InMemoryHistoryStore::size() const {
    std::lock_guard lock(m_mutex);
    return m_entries.size();
}

} // namespace services
} // namespace playback_monitor
