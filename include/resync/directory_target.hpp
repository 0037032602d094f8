#pragma once

#include "resync/prefetch_cache.hpp"
#include "resync/sync_queue.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace resync {

/// Remote endpoint backed by a directory, typically a network mount.
///
/// deliver() writes each operation to <root>/<operation_type>/<id>.json via
/// temp file + rename, so redelivering the same item overwrites instead of
/// duplicating. fetch() reads <root>/<key>.json. When the root is missing
/// (mount gone) both report a failure that the queue retries.
class DirectoryTarget {
public:
    explicit DirectoryTarget(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }

    /// Execute capability for the sync queue.
    SyncResult deliver(const SyncRequest& request);

    /// Fetch capability for the prefetch cache.
    FetchResult fetch(const std::string& key);

    struct Stats {
        uint64_t delivered = 0;
        uint64_t deliver_failed = 0;
        uint64_t fetched = 0;
        uint64_t fetch_failed = 0;
    };
    Stats get_stats() const;

private:
    std::filesystem::path root_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace resync
