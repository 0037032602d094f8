#include "resync/prefetch_cache.hpp"
#include "resync/durable_store.hpp"
#include "resync/log.hpp"
#include "resync/util.hpp"
#include "meridian/core/thread_pool.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

namespace resync {

namespace {

constexpr int SNAPSHOT_VERSION = 1;

using OptionalJson = std::optional<nlohmann::json>;

std::shared_future<OptionalJson> ready_future(OptionalJson value) {
    std::promise<OptionalJson> p;
    p.set_value(std::move(value));
    return p.get_future().share();
}

}  // namespace

PrefetchCache::PrefetchCache(const PrefetchOptions& options, DurableStore& store)
    : options_(options), store_(store) {
    load_snapshot();
    fetch_pool_ = std::make_unique<meridian::ThreadPool>(options_.fetch_threads);
}

PrefetchCache::~PrefetchCache() {
    stop();
    // Let in-flight fetches settle their promises before members go away
    if (fetch_pool_) fetch_pool_->shutdown(true);
}

std::string PrefetchCache::start() {
    if (running_.exchange(true)) return {};

    try {
        housekeeping_thread_ = std::thread(&PrefetchCache::housekeeping_loop, this);
    } catch (const std::system_error& e) {
        running_ = false;
        return std::string("Failed to start cache housekeeping: ") + e.what();
    }

    log_info("Prefetch cache started: %zu entries, max=%zu, max_age=%llds",
             cache_size(), options_.max_entries,
             static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(options_.max_age).count()));
    return {};
}

void PrefetchCache::stop() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard lock(housekeeping_mutex_);
        wake_ = true;
    }
    housekeeping_cv_.notify_all();

    if (housekeeping_thread_.joinable()) {
        housekeeping_thread_.join();
    }

    size_t discarded = 0;
    {
        std::lock_guard lock(housekeeping_mutex_);
        discarded = lazy_.size();
        lazy_.clear();
    }
    if (discarded > 0) {
        std::lock_guard lock(stats_mutex_);
        stats_.lazy_discarded += discarded;
    }
    log_info("Prefetch cache stopped");
}

// --- Entries ---

bool PrefetchCache::is_fresh(const CacheEntry& entry, int64_t now) const {
    return now - entry.stored_at < options_.max_age.count();
}

void PrefetchCache::erase_locked(std::unordered_map<std::string, Slot>::iterator it) {
    order_.erase(it->second.order_pos);
    entries_.erase(it);
}

std::optional<nlohmann::json> PrefetchCache::get_cached_data(const std::string& key) const {
    std::lock_guard lock(entries_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (!is_fresh(it->second.entry, now_epoch_ms())) return std::nullopt;
    return it->second.entry.value;
}

void PrefetchCache::set_cached_data(const std::string& key, const nlohmann::json& value) {
    uint64_t evicted = 0;
    {
        std::lock_guard lock(entries_mutex_);
        int64_t now = now_epoch_ms();

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.entry.value = value;
            it->second.entry.stored_at = now;
            order_.splice(order_.end(), order_, it->second.order_pos);
        } else {
            order_.push_back(key);
            entries_.emplace(key, Slot{CacheEntry{key, value, now}, std::prev(order_.end())});
        }

        while (entries_.size() > options_.max_entries) {
            auto oldest = entries_.find(order_.front());
            log_debug("Cache full, evicting %s", order_.front().c_str());
            erase_locked(oldest);
            evicted++;
        }
        persist_locked();
    }
    if (evicted > 0) {
        std::lock_guard lock(stats_mutex_);
        stats_.evicted_capacity += evicted;
    }
}

bool PrefetchCache::invalidate_cache(const std::string& key) {
    std::lock_guard lock(entries_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    erase_locked(it);
    persist_locked();
    return true;
}

void PrefetchCache::clear_cache() {
    std::lock_guard lock(entries_mutex_);
    entries_.clear();
    order_.clear();
    persist_locked();
}

size_t PrefetchCache::sweep_expired() {
    size_t removed = 0;
    {
        std::lock_guard lock(entries_mutex_);
        int64_t now = now_epoch_ms();
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (is_fresh(it->second.entry, now)) {
                ++it;
                continue;
            }
            order_.erase(it->second.order_pos);
            it = entries_.erase(it);
            removed++;
        }
        if (removed > 0) persist_locked();
    }
    if (removed > 0) {
        {
            std::lock_guard lock(stats_mutex_);
            stats_.evicted_expired += removed;
        }
        log_debug("Cache sweep removed %zu expired entries", removed);
    }
    return removed;
}

size_t PrefetchCache::cache_size() const {
    std::lock_guard lock(entries_mutex_);
    return entries_.size();
}

std::vector<CacheEntry> PrefetchCache::entries() const {
    std::lock_guard lock(entries_mutex_);
    std::vector<CacheEntry> result;
    result.reserve(entries_.size());
    for (const auto& key : order_) {
        result.push_back(entries_.at(key).entry);
    }
    return result;
}

// --- Prefetch ---

std::shared_future<std::optional<nlohmann::json>> PrefetchCache::prefetch(const std::string& key,
                                                                          FetchFn fetch) {
    if (!options_.enabled) return ready_future(std::nullopt);

    std::lock_guard inflight_lock(inflight_mutex_);
    {
        std::lock_guard lock(entries_mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && is_fresh(it->second.entry, now_epoch_ms())) {
            std::lock_guard stats_lock(stats_mutex_);
            stats_.hits++;
            return ready_future(it->second.entry.value);
        }
    }

    auto it = inflight_.find(key);
    if (it != inflight_.end()) {
        std::lock_guard stats_lock(stats_mutex_);
        stats_.shared++;
        return it->second;
    }

    {
        std::lock_guard stats_lock(stats_mutex_);
        stats_.misses++;
    }

    auto promise = std::make_shared<std::promise<OptionalJson>>();
    auto future = promise->get_future().share();
    inflight_[key] = future;

    fetch_pool_->execute([this, key, fetch = std::move(fetch), promise]() {
        run_fetch(key, fetch, promise);
    });
    return future;
}

void PrefetchCache::run_fetch(const std::string& key, const FetchFn& fetch,
                              const std::shared_ptr<std::promise<OptionalJson>>& promise) {
    FetchResult result;
    try {
        result = fetch();
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
    } catch (...) {
        result.success = false;
        result.error_message = "fetch threw a non-standard exception";
    }

    OptionalJson value;
    if (result.success) {
        set_cached_data(key, result.value);
        value = result.value;
    } else {
        log_warn("Prefetch failed for %s: %s", key.c_str(),
                 result.error_message.empty() ? "unknown error" : result.error_message.c_str());
    }
    {
        std::lock_guard lock(stats_mutex_);
        if (result.success) stats_.fetches_ok++;
        else stats_.fetches_failed++;
    }

    // Stored before the in-flight entry goes, so a later prefetch sees the hit
    {
        std::lock_guard lock(inflight_mutex_);
        inflight_.erase(key);
    }
    promise->set_value(std::move(value));
}

void PrefetchCache::prefetch_lazy(const std::string& key, FetchFn fetch, std::chrono::milliseconds delay) {
    if (!options_.enabled) return;

    if (!running_.load()) {
        log_debug("Lazy prefetch of %s dropped: cache not started", key.c_str());
        std::lock_guard lock(stats_mutex_);
        stats_.lazy_discarded++;
        return;
    }

    {
        std::lock_guard lock(housekeeping_mutex_);
        lazy_.push_back(LazyTask{std::chrono::steady_clock::now() + delay, key, std::move(fetch)});
        wake_ = true;
    }
    housekeeping_cv_.notify_all();

    std::lock_guard lock(stats_mutex_);
    stats_.lazy_scheduled++;
}

std::map<std::string, std::optional<nlohmann::json>> PrefetchCache::prefetch_batch(
    const std::vector<PrefetchRequest>& requests) {
    std::map<std::string, OptionalJson> results;
    if (!options_.enabled) return results;

    std::vector<std::pair<std::string, std::shared_future<OptionalJson>>> futures;
    futures.reserve(requests.size());
    for (const auto& req : requests) {
        futures.emplace_back(req.key, prefetch(req.key, req.fetch));
    }
    for (auto& [key, future] : futures) {
        results[key] = future.get();
    }
    return results;
}

bool PrefetchCache::is_prefetching() const {
    std::lock_guard lock(inflight_mutex_);
    return !inflight_.empty();
}

PrefetchCache::Stats PrefetchCache::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

// --- Housekeeping ---

void PrefetchCache::housekeeping_loop() {
    auto next_sweep = std::chrono::steady_clock::now() + options_.sweep_interval;

    while (running_.load(std::memory_order_relaxed)) {
        std::vector<LazyTask> due;
        {
            std::unique_lock lock(housekeeping_mutex_);
            auto wake_at = next_sweep;
            for (const auto& task : lazy_) {
                wake_at = std::min(wake_at, task.due);
            }
            housekeeping_cv_.wait_until(lock, wake_at, [this] {
                return wake_ || !running_.load();
            });
            wake_ = false;
            if (!running_.load()) break;

            auto now = std::chrono::steady_clock::now();
            auto split = std::partition(lazy_.begin(), lazy_.end(), [now](const LazyTask& t) {
                return t.due > now;
            });
            std::move(split, lazy_.end(), std::back_inserter(due));
            lazy_.erase(split, lazy_.end());
        }

        for (auto& task : due) {
            // Result lands in the cache; nobody waits on it
            prefetch(task.key, std::move(task.fetch));
        }

        if (std::chrono::steady_clock::now() >= next_sweep) {
            sweep_expired();
            next_sweep = std::chrono::steady_clock::now() + options_.sweep_interval;
        }
    }
}

// --- Persistence ---

void PrefetchCache::persist_locked() {
    std::string data;
    try {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& key : order_) {
            const auto& e = entries_.at(key).entry;
            arr.push_back({{"key", e.key}, {"value", e.value}, {"stored_at", e.stored_at}});
        }
        nlohmann::json j = {{"version", SNAPSHOT_VERSION}, {"entries", std::move(arr)}};
        // Stray invalid UTF-8 (payloads, errors, keys) must not block every later snapshot
        data = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        log_warn("Cannot serialize prefetch cache: %s", e.what());
        return;
    }
    store_.set(options_.cache_key, data);
}

void PrefetchCache::load_snapshot() {
    auto data = store_.get(options_.cache_key);
    if (!data) return;

    auto j = nlohmann::json::parse(*data, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("entries") || !j["entries"].is_array()) {
        log_warn("Ignoring unreadable prefetch cache snapshot under '%s'", options_.cache_key.c_str());
        return;
    }
    if (j.value("version", 0) != SNAPSHOT_VERSION) {
        log_warn("Ignoring prefetch cache snapshot with unknown version");
        return;
    }

    std::vector<CacheEntry> loaded;
    int64_t now = now_epoch_ms();
    for (const auto& je : j["entries"]) {
        try {
            CacheEntry e;
            e.key = je.at("key").get<std::string>();
            e.value = je.value("value", nlohmann::json());
            e.stored_at = je.at("stored_at").get<int64_t>();
            if (is_fresh(e, now)) loaded.push_back(std::move(e));
        } catch (const nlohmann::json::exception& ex) {
            log_warn("Skipping malformed cache entry: %s", ex.what());
        }
    }

    std::stable_sort(loaded.begin(), loaded.end(), [](const CacheEntry& a, const CacheEntry& b) {
        return a.stored_at < b.stored_at;
    });
    // Keep the newest max_entries
    if (loaded.size() > options_.max_entries) {
        loaded.erase(loaded.begin(), loaded.end() - static_cast<std::ptrdiff_t>(options_.max_entries));
    }

    for (auto& e : loaded) {
        auto it = entries_.find(e.key);
        if (it != entries_.end()) erase_locked(it);
        order_.push_back(e.key);
        std::string key = e.key;
        entries_.emplace(key, Slot{std::move(e), std::prev(order_.end())});
    }

    if (!entries_.empty()) {
        log_info("Restored %zu cached entries", entries_.size());
    }
}

}  // namespace resync
