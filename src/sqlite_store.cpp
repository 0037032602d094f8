#include "resync/durable_store.hpp"
#include "resync/log.hpp"
#include "resync/util.hpp"

#include <chrono>
#include <mutex>
#include <sqlite3.h>
#include <stdexcept>
#include <thread>

namespace resync {

namespace {

constexpr const char* STORE_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS kv (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL,
    updated_at INTEGER NOT NULL
) WITHOUT ROWID;
)";

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_warn("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_warn("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

class SqliteStore : public DurableStore {
public:
    SqliteStore(const std::filesystem::path& db_path, size_t max_value_bytes) : db_path_(db_path) {
        if (db_path_.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(db_path_.parent_path(), ec);
        }

        int rc = sqlite3_open(db_path_.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error("Cannot open store " + db_path_.string() + ": " + msg);
        }

        // WAL mode for concurrent readers
        sql_exec(db_, "PRAGMA journal_mode=WAL");
        sql_exec(db_, "PRAGMA synchronous=NORMAL");
        sql_exec(db_, "PRAGMA busy_timeout=5000");
        if (!sql_exec(db_, STORE_SCHEMA)) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error("Cannot create schema in " + db_path_.string());
        }

        // Values are bound with an int length, so never let one past INT_MAX
        int limit = sqlite3_limit(db_, SQLITE_LIMIT_LENGTH, -1);
        if (max_value_bytes > 0 && max_value_bytes < static_cast<size_t>(limit)) {
            limit = static_cast<int>(max_value_bytes);
            sqlite3_limit(db_, SQLITE_LIMIT_LENGTH, limit);
        }
        max_value_bytes_ = static_cast<size_t>(limit);

        prepare("SELECT value FROM kv WHERE key = ?1", &stmt_get_);
        prepare("INSERT OR REPLACE INTO kv (key, value, updated_at) VALUES (?1, ?2, ?3)", &stmt_set_);
        prepare("DELETE FROM kv WHERE key = ?1", &stmt_remove_);
        prepare("SELECT key FROM kv ORDER BY key", &stmt_keys_);
    }

    ~SqliteStore() override { close(); }

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string type_name() const override { return "sqlite"; }

    std::optional<std::string> get(const std::string& key) const override {
        std::lock_guard lock(db_mutex_);
        sqlite3_reset(stmt_get_);
        sqlite3_bind_text(stmt_get_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sql_step_retry(stmt_get_);
        if (rc == SQLITE_ROW) {
            auto text = sqlite3_column_text(stmt_get_, 0);
            int len = sqlite3_column_bytes(stmt_get_, 0);
            std::string value = text ? std::string(reinterpret_cast<const char*>(text), len) : std::string();
            sqlite3_reset(stmt_get_);
            return value;
        }
        if (rc != SQLITE_DONE) {
            log_warn("Store get failed for %s: %s", key.c_str(), sqlite3_errmsg(db_));
        }
        sqlite3_reset(stmt_get_);
        return std::nullopt;
    }

    void set(const std::string& key, const std::string& value) override {
        if (value.size() > max_value_bytes_) {
            log_warn("Store set skipped for %s: %zu bytes exceeds the %zu byte value limit",
                     key.c_str(), value.size(), max_value_bytes_);
            return;
        }
        std::lock_guard lock(db_mutex_);
        sqlite3_reset(stmt_set_);
        sqlite3_bind_text(stmt_set_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_set_, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_set_, 3, now_epoch_ms());
        int rc = sql_step_retry(stmt_set_);
        if (rc != SQLITE_DONE) {
            // SQLITE_FULL, SQLITE_IOERR, ... : durability is best-effort
            log_warn("Store set failed for %s (%zu bytes): %s (rc=%d)",
                     key.c_str(), value.size(), sqlite3_errmsg(db_), rc);
        }
        sqlite3_reset(stmt_set_);
    }

    void remove(const std::string& key) override {
        std::lock_guard lock(db_mutex_);
        sqlite3_reset(stmt_remove_);
        sqlite3_bind_text(stmt_remove_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sql_step_retry(stmt_remove_);
        if (rc != SQLITE_DONE) {
            log_warn("Store remove failed for %s: %s (rc=%d)", key.c_str(), sqlite3_errmsg(db_), rc);
        }
        sqlite3_reset(stmt_remove_);
    }

    std::vector<std::string> keys() const override {
        std::lock_guard lock(db_mutex_);
        std::vector<std::string> result;
        sqlite3_reset(stmt_keys_);
        while (sql_step_retry(stmt_keys_) == SQLITE_ROW) {
            auto text = sqlite3_column_text(stmt_keys_, 0);
            if (text) result.emplace_back(reinterpret_cast<const char*>(text));
        }
        sqlite3_reset(stmt_keys_);
        return result;
    }

private:
    void prepare(const char* sql, sqlite3_stmt** stmt) {
        if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db_);
            close();
            throw std::runtime_error("Cannot prepare statement: " + msg);
        }
    }

    void close() {
        if (stmt_get_) sqlite3_finalize(stmt_get_);
        if (stmt_set_) sqlite3_finalize(stmt_set_);
        if (stmt_remove_) sqlite3_finalize(stmt_remove_);
        if (stmt_keys_) sqlite3_finalize(stmt_keys_);
        stmt_get_ = stmt_set_ = stmt_remove_ = stmt_keys_ = nullptr;

        if (db_) {
            sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    std::filesystem::path db_path_;
    size_t max_value_bytes_ = 0;

    // Protects prepared statement usage
    mutable std::mutex db_mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_set_ = nullptr;
    sqlite3_stmt* stmt_remove_ = nullptr;
    sqlite3_stmt* stmt_keys_ = nullptr;
};

}  // namespace

std::unique_ptr<DurableStore> DurableStore::create_sqlite(const std::filesystem::path& db_path,
                                                          size_t max_value_bytes) {
    return std::make_unique<SqliteStore>(db_path, max_value_bytes);
}

}  // namespace resync
