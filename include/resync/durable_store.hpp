#pragma once

#include "resync/config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace resync {

/// Persistent string-keyed store used for queue and cache snapshots.
///
/// Durability is best-effort: a missing key returns an empty optional, and
/// failures of the storage medium (disk full, map full, busy timeouts) are
/// logged as warnings and turn the operation into a no-op. Nothing here
/// throws after construction.
class DurableStore {
public:
    virtual ~DurableStore() = default;

    // Backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;

    // All keys, sorted. Used by the inspection tool.
    virtual std::vector<std::string> keys() const = 0;

    /// Create a store from configuration.
    /// Throws std::runtime_error if the type is unknown or the store cannot be opened.
    static std::unique_ptr<DurableStore> create(const StoreConfig& config);

    static std::unique_ptr<DurableStore> create_memory();
    /// @param max_value_bytes Largest value accepted by set(); 0 keeps SQLite's own length limit.
    static std::unique_ptr<DurableStore> create_sqlite(const std::filesystem::path& db_path,
                                                       size_t max_value_bytes = 0);
    static std::unique_ptr<DurableStore> create_lmdb(const std::filesystem::path& env_path,
                                                     size_t mapsize_mb = 64);
};

}  // namespace resync
