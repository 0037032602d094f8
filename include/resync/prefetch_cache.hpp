#pragma once

#include "resync/config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace meridian {
class ThreadPool;
}  // namespace meridian

namespace resync {

class DurableStore;

struct FetchResult {
    bool success = false;
    nlohmann::json value;
    std::string error_message;
};

/// Loads the data for one key. Throwing counts as a failed fetch.
using FetchFn = std::function<FetchResult()>;

struct PrefetchRequest {
    std::string key;
    FetchFn fetch;
};

struct CacheEntry {
    std::string key;
    nlohmann::json value;
    int64_t stored_at = 0;  // Epoch ms
};

/// Time-bounded key/value cache filled speculatively.
///
/// Entries are fresh while younger than max_age. The cache holds at most
/// max_entries; when full, the oldest stored entry goes first (reads do not
/// refresh). Concurrent prefetches of one key share a single fetch. The whole
/// cache is persisted as one JSON snapshot after every mutation.
///
/// Lock order: inflight_mutex_ before entries_mutex_.
class PrefetchCache {
public:
    /// Loads the persisted snapshot, dropping entries that expired meanwhile.
    PrefetchCache(const PrefetchOptions& options, DurableStore& store);
    ~PrefetchCache();

    PrefetchCache(const PrefetchCache&) = delete;
    PrefetchCache& operator=(const PrefetchCache&) = delete;

    /// Start the housekeeping thread (periodic sweep, lazy prefetches).
    /// Returns error message on failure, empty string on success.
    std::string start();

    /// Stop the housekeeping thread. Lazy prefetches not yet due are discarded.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_relaxed); }
    bool is_enabled() const { return options_.enabled; }

    /// Value for key if present and fresh.
    std::optional<nlohmann::json> get_cached_data(const std::string& key) const;

    /// Insert or replace, stamped with the current time. Evicts the oldest
    /// entries if this pushes the cache over capacity.
    void set_cached_data(const std::string& key, const nlohmann::json& value);

    /// Fresh hit resolves immediately; otherwise joins the in-flight fetch for
    /// key or starts one on the fetch pool. Resolves empty when the fetch fails
    /// or the cache is disabled. Never throws for fetch failures.
    std::shared_future<std::optional<nlohmann::json>> prefetch(const std::string& key, FetchFn fetch);

    /// prefetch() after delay, from the housekeeping thread. Fire-and-forget.
    void prefetch_lazy(const std::string& key, FetchFn fetch,
                       std::chrono::milliseconds delay = std::chrono::milliseconds(1000));

    /// Prefetch several keys concurrently and wait for all of them.
    /// Empty when the cache is disabled.
    std::map<std::string, std::optional<nlohmann::json>> prefetch_batch(
        const std::vector<PrefetchRequest>& requests);

    /// Returns true if an entry was removed.
    bool invalidate_cache(const std::string& key);
    void clear_cache();

    /// Drop every expired entry. Returns how many were removed.
    size_t sweep_expired();

    size_t cache_size() const;
    bool is_prefetching() const;
    std::vector<CacheEntry> entries() const;

    struct Stats {
        uint64_t hits = 0;           // prefetch() served from a fresh entry
        uint64_t misses = 0;         // prefetch() started a fetch
        uint64_t shared = 0;         // prefetch() joined an in-flight fetch
        uint64_t fetches_ok = 0;
        uint64_t fetches_failed = 0;
        uint64_t evicted_expired = 0;
        uint64_t evicted_capacity = 0;
        uint64_t lazy_scheduled = 0;
        uint64_t lazy_discarded = 0;
    };
    Stats get_stats() const;

private:
    struct Slot {
        CacheEntry entry;
        std::list<std::string>::iterator order_pos;
    };

    void run_fetch(const std::string& key, const FetchFn& fetch,
                   const std::shared_ptr<std::promise<std::optional<nlohmann::json>>>& promise);
    void housekeeping_loop();

    // Caller holds entries_mutex_
    bool is_fresh(const CacheEntry& entry, int64_t now) const;
    void erase_locked(std::unordered_map<std::string, Slot>::iterator it);
    void persist_locked();
    void load_snapshot();

    PrefetchOptions options_;
    DurableStore& store_;

    // In-flight fetches by key
    mutable std::mutex inflight_mutex_;
    std::unordered_map<std::string, std::shared_future<std::optional<nlohmann::json>>> inflight_;

    // Entries plus their keys ordered by stored_at (oldest first)
    mutable std::mutex entries_mutex_;
    std::unordered_map<std::string, Slot> entries_;
    std::list<std::string> order_;

    std::unique_ptr<meridian::ThreadPool> fetch_pool_;

    // Housekeeping
    struct LazyTask {
        std::chrono::steady_clock::time_point due;
        std::string key;
        FetchFn fetch;
    };
    std::thread housekeeping_thread_;
    std::atomic<bool> running_{false};
    std::mutex housekeeping_mutex_;
    std::condition_variable housekeeping_cv_;
    std::vector<LazyTask> lazy_;
    bool wake_ = false;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace resync
