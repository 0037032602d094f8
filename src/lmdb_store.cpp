#include "resync/durable_store.hpp"
#include "resync/log.hpp"

#include <lmdb.h>
#include <mutex>
#include <stdexcept>

namespace resync {

namespace {

class LmdbStore : public DurableStore {
public:
    LmdbStore(const std::filesystem::path& env_path, size_t mapsize_mb) : env_path_(env_path) {
        std::error_code ec;
        std::filesystem::create_directories(env_path_, ec);
        if (ec) {
            throw std::runtime_error("Cannot create " + env_path_.string() + ": " + ec.message());
        }

        int rc = mdb_env_create(&env_);
        if (rc != MDB_SUCCESS) {
            throw std::runtime_error(std::string("mdb_env_create: ") + mdb_strerror(rc));
        }

        rc = mdb_env_set_mapsize(env_, static_cast<size_t>(mapsize_mb) * 1024 * 1024);
        if (rc == MDB_SUCCESS) {
            rc = mdb_env_open(env_, env_path_.c_str(), MDB_NOTLS, 0664);
        }
        if (rc != MDB_SUCCESS) {
            mdb_env_close(env_);
            env_ = nullptr;
            throw std::runtime_error("Cannot open store at " + env_path_.string() + ": " + mdb_strerror(rc));
        }

        MDB_txn* txn = nullptr;
        rc = mdb_txn_begin(env_, nullptr, 0, &txn);
        if (rc == MDB_SUCCESS) {
            rc = mdb_dbi_open(txn, nullptr, 0, &dbi_);
            if (rc == MDB_SUCCESS) {
                rc = mdb_txn_commit(txn);
            } else {
                mdb_txn_abort(txn);
            }
        }
        if (rc != MDB_SUCCESS) {
            mdb_env_close(env_);
            env_ = nullptr;
            throw std::runtime_error(std::string("mdb_dbi_open: ") + mdb_strerror(rc));
        }
    }

    ~LmdbStore() override {
        if (env_) {
            mdb_dbi_close(env_, dbi_);
            mdb_env_close(env_);
        }
    }

    LmdbStore(const LmdbStore&) = delete;
    LmdbStore& operator=(const LmdbStore&) = delete;

    std::string type_name() const override { return "lmdb"; }

    std::optional<std::string> get(const std::string& key) const override {
        MDB_txn* txn = nullptr;
        int rc = mdb_txn_begin(env_, nullptr, MDB_RDONLY, &txn);
        if (rc != MDB_SUCCESS) {
            log_warn("Store get failed for %s: %s", key.c_str(), mdb_strerror(rc));
            return std::nullopt;
        }

        MDB_val k{key.size(), const_cast<char*>(key.data())};
        MDB_val v{};
        std::optional<std::string> result;
        rc = mdb_get(txn, dbi_, &k, &v);
        if (rc == MDB_SUCCESS) {
            result.emplace(static_cast<const char*>(v.mv_data), v.mv_size);
        } else if (rc != MDB_NOTFOUND) {
            log_warn("Store get failed for %s: %s", key.c_str(), mdb_strerror(rc));
        }
        mdb_txn_abort(txn);
        return result;
    }

    void set(const std::string& key, const std::string& value) override {
        std::lock_guard lock(write_mutex_);
        MDB_txn* txn = nullptr;
        int rc = mdb_txn_begin(env_, nullptr, 0, &txn);
        if (rc != MDB_SUCCESS) {
            log_warn("Store set failed for %s: %s", key.c_str(), mdb_strerror(rc));
            return;
        }

        MDB_val k{key.size(), const_cast<char*>(key.data())};
        MDB_val v{value.size(), const_cast<char*>(value.data())};
        rc = mdb_put(txn, dbi_, &k, &v, 0);
        if (rc != MDB_SUCCESS) {
            // MDB_MAP_FULL is the usual suspect: durability is best-effort
            mdb_txn_abort(txn);
            log_warn("Store set failed for %s (%zu bytes): %s", key.c_str(), value.size(), mdb_strerror(rc));
            return;
        }
        rc = mdb_txn_commit(txn);
        if (rc != MDB_SUCCESS) {
            log_warn("Store commit failed for %s: %s", key.c_str(), mdb_strerror(rc));
        }
    }

    void remove(const std::string& key) override {
        std::lock_guard lock(write_mutex_);
        MDB_txn* txn = nullptr;
        int rc = mdb_txn_begin(env_, nullptr, 0, &txn);
        if (rc != MDB_SUCCESS) {
            log_warn("Store remove failed for %s: %s", key.c_str(), mdb_strerror(rc));
            return;
        }

        MDB_val k{key.size(), const_cast<char*>(key.data())};
        rc = mdb_del(txn, dbi_, &k, nullptr);
        if (rc != MDB_SUCCESS && rc != MDB_NOTFOUND) {
            mdb_txn_abort(txn);
            log_warn("Store remove failed for %s: %s", key.c_str(), mdb_strerror(rc));
            return;
        }
        rc = mdb_txn_commit(txn);
        if (rc != MDB_SUCCESS) {
            log_warn("Store commit failed for %s: %s", key.c_str(), mdb_strerror(rc));
        }
    }

    std::vector<std::string> keys() const override {
        std::vector<std::string> result;
        MDB_txn* txn = nullptr;
        int rc = mdb_txn_begin(env_, nullptr, MDB_RDONLY, &txn);
        if (rc != MDB_SUCCESS) {
            log_warn("Store key scan failed: %s", mdb_strerror(rc));
            return result;
        }

        MDB_cursor* cursor = nullptr;
        rc = mdb_cursor_open(txn, dbi_, &cursor);
        if (rc != MDB_SUCCESS) {
            log_warn("mdb_cursor_open: %s", mdb_strerror(rc));
            mdb_txn_abort(txn);
            return result;
        }

        MDB_val k{}, v{};
        rc = mdb_cursor_get(cursor, &k, &v, MDB_FIRST);
        while (rc == MDB_SUCCESS) {
            result.emplace_back(static_cast<const char*>(k.mv_data), k.mv_size);
            rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
        }
        mdb_cursor_close(cursor);
        mdb_txn_abort(txn);
        return result;
    }

private:
    std::filesystem::path env_path_;
    MDB_env* env_ = nullptr;
    MDB_dbi dbi_ = 0;

    // LMDB allows one write transaction at a time
    std::mutex write_mutex_;
};

}  // namespace

std::unique_ptr<DurableStore> DurableStore::create_lmdb(const std::filesystem::path& env_path,
                                                        size_t mapsize_mb) {
    return std::make_unique<LmdbStore>(env_path, mapsize_mb);
}

}  // namespace resync
