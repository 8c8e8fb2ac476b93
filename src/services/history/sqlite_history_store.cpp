#include "playback_monitor/services/history/sqlite_history_store.hpp"
#include "playback_monitor/utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>

namespace playback_monitor {
namespace services {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* statement) const {
        if (statement) sqlite3_finalize(statement);
    }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

constexpr const char* SCHEMA = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS history (
        history_id TEXT PRIMARY KEY,
        session_keys TEXT NOT NULL,
        user_id TEXT NOT NULL,
        user_name TEXT,
        item_id TEXT NOT NULL,
        title TEXT,
        started_at_ms INTEGER NOT NULL,
        stopped_at_ms INTEGER NOT NULL,
        paused_duration_ms INTEGER DEFAULT 0,
        final_position_ms INTEGER DEFAULT 0,
        duration_ms INTEGER DEFAULT 0,
        watched_percent INTEGER DEFAULT 0,
        transcoded INTEGER DEFAULT 0,
        note TEXT
    );
    CREATE INDEX IF NOT EXISTS idx_history_user_item
        ON history (user_id, item_id, stopped_at_ms);
)SQL";

constexpr const char* UPSERT_SQL = R"SQL(
    INSERT INTO history (history_id, session_keys, user_id, user_name, item_id, title,
                         started_at_ms, stopped_at_ms, paused_duration_ms, final_position_ms,
                         duration_ms, watched_percent, transcoded, note)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(history_id) DO UPDATE SET
        session_keys = excluded.session_keys,
        user_name = excluded.user_name,
        title = excluded.title,
        started_at_ms = excluded.started_at_ms,
        stopped_at_ms = excluded.stopped_at_ms,
        paused_duration_ms = excluded.paused_duration_ms,
        final_position_ms = excluded.final_position_ms,
        duration_ms = excluded.duration_ms,
        watched_percent = excluded.watched_percent,
        transcoded = excluded.transcoded,
        note = excluded.note;
)SQL";

constexpr const char* SELECT_COLUMNS =
    "SELECT history_id, session_keys, user_id, user_name, item_id, title, started_at_ms, stopped_at_ms, "
    "paused_duration_ms, final_position_ms, duration_ms, watched_percent, transcoded, note FROM history ";

core::StorageError map_sqlite_error(int code) {
    switch (code & 0xff) {
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return core::StorageError::Corrupt;
        case SQLITE_CANTOPEN:
        case SQLITE_PERM:
        case SQLITE_READONLY:
            return core::StorageError::Unavailable;
        default:
            return core::StorageError::WriteFailed;
    }
}

std::string column_text(sqlite3_stmt* statement, int column) {
    const auto* text = sqlite3_column_text(statement, column);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

void bind_text(sqlite3_stmt* statement, int index, const std::string& value) {
    sqlite3_bind_text(statement, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

} // namespace

SqliteHistoryStore::SqliteHistoryStore(ConstructionKey, sqlite3* db) : m_db(db) {}

SqliteHistoryStore::~SqliteHistoryStore() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

std::expected<std::unique_ptr<SqliteHistoryStore>, core::StorageError>
SqliteHistoryStore::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("SqliteHistoryStore", "Cannot create directory for " + path.string() + ": " + ec.message());
            return std::unexpected(core::StorageError::Unavailable);
        }
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open(path.string().c_str(), &db);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteHistoryStore", "Cannot open history database at " + path.string() + ": " +
                  (db ? sqlite3_errmsg(db) : "out of memory"));
        if (db) {
            sqlite3_close(db);
        }
        return std::unexpected(core::StorageError::Unavailable);
    }

    auto store = std::make_unique<SqliteHistoryStore>(ConstructionKey{}, db);
    if (auto schema = store->init_schema(); !schema) {
        return std::unexpected(schema.error());
    }

    LOG_INFO("SqliteHistoryStore", "History database: " + path.string());
    return store;
}

std::expected<void, core::StorageError> SqliteHistoryStore::init_schema() {
    char* error = nullptr;
    const int rc = sqlite3_exec(m_db, SCHEMA, nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        LOG_ERROR("SqliteHistoryStore", "Schema creation failed: " + message);
        return std::unexpected(map_sqlite_error(rc));
    }
    return {};
}

std::expected<void, core::StorageError> SqliteHistoryStore::upsert(const core::HistoryEntry& entry) {
    std::lock_guard lock(m_mutex);

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(m_db, UPSERT_SQL, -1, &raw, nullptr);
    Statement statement(raw);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteHistoryStore", "Prepare failed: " + std::string(sqlite3_errmsg(m_db)));
        return std::unexpected(map_sqlite_error(rc));
    }

    auto keys = nlohmann::json::array();
    for (const auto& key : entry.session_key_group) {
        keys.push_back(key.get());
    }

    bind_text(raw, 1, entry.history_id);
    bind_text(raw, 2, keys.dump());
    bind_text(raw, 3, entry.user_id);
    bind_text(raw, 4, entry.user_name);
    bind_text(raw, 5, entry.item_id);
    bind_text(raw, 6, entry.title);
    sqlite3_bind_int64(raw, 7, core::to_epoch_ms(entry.started_at));
    sqlite3_bind_int64(raw, 8, core::to_epoch_ms(entry.stopped_at));
    sqlite3_bind_int64(raw, 9, entry.paused_duration_ms);
    sqlite3_bind_int64(raw, 10, entry.final_position_ms);
    sqlite3_bind_int64(raw, 11, entry.duration_ms);
    sqlite3_bind_int(raw, 12, entry.watched_percent);
    sqlite3_bind_int(raw, 13, entry.transcoded ? 1 : 0);
    bind_text(raw, 14, entry.note);

    rc = sqlite3_step(raw);
    if (rc != SQLITE_DONE) {
        LOG_WARNING("SqliteHistoryStore", "Upsert of " + entry.history_id + " failed: " +
                    std::string(sqlite3_errmsg(m_db)));
        return std::unexpected(map_sqlite_error(rc));
    }
    return {};
}

core::HistoryEntry SqliteHistoryStore::read_row(sqlite3_stmt* statement) {
    core::HistoryEntry entry;
    entry.history_id = column_text(statement, 0);

    const auto keys = nlohmann::json::parse(column_text(statement, 1), nullptr, false);
    if (keys.is_array()) {
        for (const auto& key : keys) {
            if (key.is_string()) {
                entry.session_key_group.emplace_back(key.get<std::string>());
            }
        }
    }

    entry.user_id = column_text(statement, 2);
    entry.user_name = column_text(statement, 3);
    entry.item_id = column_text(statement, 4);
    entry.title = column_text(statement, 5);
    entry.started_at = core::from_epoch_ms(sqlite3_column_int64(statement, 6));
    entry.stopped_at = core::from_epoch_ms(sqlite3_column_int64(statement, 7));
    entry.paused_duration_ms = sqlite3_column_int64(statement, 8);
    entry.final_position_ms = sqlite3_column_int64(statement, 9);
    entry.duration_ms = sqlite3_column_int64(statement, 10);
    entry.watched_percent = sqlite3_column_int(statement, 11);
    entry.transcoded = sqlite3_column_int(statement, 12) != 0;
    entry.note = column_text(statement, 13);
    return entry;
}

std::expected<std::optional<core::HistoryEntry>, core::StorageError>
SqliteHistoryStore::find_latest(const std::string& user_id, const std::string& item_id) {
    std::lock_guard lock(m_mutex);

    const std::string sql = std::string(SELECT_COLUMNS) +
        "WHERE user_id = ? AND item_id = ? ORDER BY stopped_at_ms DESC LIMIT 1;";

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &raw, nullptr);
    Statement statement(raw);
    if (rc != SQLITE_OK) {
        return std::unexpected(map_sqlite_error(rc));
    }

    bind_text(raw, 1, user_id);
    bind_text(raw, 2, item_id);

    rc = sqlite3_step(raw);
    if (rc == SQLITE_ROW) {
        return std::optional<core::HistoryEntry>{read_row(raw)};
    }
    if (rc == SQLITE_DONE) {
        return std::optional<core::HistoryEntry>{};
    }
    return std::unexpected(map_sqlite_error(rc));
}

std::expected<std::optional<core::HistoryEntry>, core::StorageError>
SqliteHistoryStore::find(const std::string& history_id) {
    std::lock_guard lock(m_mutex);

    const std::string sql = std::string(SELECT_COLUMNS) + "WHERE history_id = ?;";

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &raw, nullptr);
    Statement statement(raw);
    if (rc != SQLITE_OK) {
        return std::unexpected(map_sqlite_error(rc));
    }

    bind_text(raw, 1, history_id);

    rc = sqlite3_step(raw);
    if (rc == SQLITE_ROW) {
        return std::optional<core::HistoryEntry>{read_row(raw)};
    }
    if (rc == SQLITE_DONE) {
        return std::optional<core::HistoryEntry>{};
    }
    return std::unexpected(map_sqlite_error(rc));
}

std::expected<std::vector<core::HistoryEntry>, core::StorageError>
SqliteHistoryStore::list_recent(std::size_t limit) {
    std::lock_guard lock(m_mutex);

    const std::string sql = std::string(SELECT_COLUMNS) + "ORDER BY stopped_at_ms DESC LIMIT ?;";

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &raw, nullptr);
    Statement statement(raw);
    if (rc != SQLITE_OK) {
        return std::unexpected(map_sqlite_error(rc));
    }

    sqlite3_bind_int64(raw, 1, static_cast<sqlite3_int64>(limit));

    std::vector<core::HistoryEntry> entries;
    while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
        entries.push_back(read_row(raw));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(map_sqlite_error(rc));
    }
    return entries;
}

} // namespace services
} // namespace playback_monitor
