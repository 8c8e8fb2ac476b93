#pragma once

#include "playback_monitor/services/history/history_store.hpp"
#include <filesystem>
#include <memory>

struct sqlite3;
struct sqlite3_stmt;

namespace playback_monitor {
namespace services {

// History persisted in a single SQLite table keyed by history_id
class SqliteHistoryStore : public HistoryStore {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    // Opens or creates the database and its schema
    static std::expected<std::unique_ptr<SqliteHistoryStore>, core::StorageError>
    open(const std::filesystem::path& path);

    SqliteHistoryStore(ConstructionKey, sqlite3* db);
    ~SqliteHistoryStore() override;

    SqliteHistoryStore(const SqliteHistoryStore&) = delete;
    SqliteHistoryStore& operator=(const SqliteHistoryStore&) = delete;

    std::expected<void, core::StorageError> upsert(const core::HistoryEntry& entry) override;

    std::expected<std::optional<core::HistoryEntry>, core::StorageError>
    find_latest(const std::string& user_id, const std::string& item_id) override;

    std::expected<std::optional<core::HistoryEntry>, core::StorageError>
    find(const std::string& history_id) override;

    std::expected<std::vector<core::HistoryEntry>, core::StorageError>
    list_recent(std::size_t limit) override;

private:
    std::expected<void, core::StorageError> init_schema();
    static core::HistoryEntry read_row(sqlite3_stmt* statement);

    std::mutex m_mutex;
    sqlite3* m_db = nullptr;
};

} // namespace services
} // namespace playback_monitor
