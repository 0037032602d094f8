#pragma once

#include "resync/config.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace meridian {
class ThreadPool;
}  // namespace meridian

namespace resync {

class ConnectivityMonitor;
class DurableStore;

enum class SyncStatus { Pending, Syncing, Retrying, Completed, Failed };

/// Selection order within a pass. Enqueue order breaks ties.
enum class SyncPriority { High, Normal, Low };

const char* to_string(SyncStatus status);
const char* to_string(SyncPriority priority);
std::optional<SyncStatus> parse_sync_status(const std::string& s);
std::optional<SyncPriority> parse_sync_priority(const std::string& s);

/// What an execute capability sees for one attempt.
struct SyncRequest {
    std::string id;
    std::string operation_type;
    nlohmann::json payload;
    uint32_t attempt = 0;  // 0 for the first execution
};

struct SyncResult {
    bool success = false;
    nlohmann::json value;        // Remote result on success
    std::string error_message;   // Why the attempt failed
};

/// Performs the remote operation for one item. Throwing counts as a failed attempt.
using ExecuteFn = std::function<SyncResult(const SyncRequest& request)>;

/// Optional notifications fired once per item, when it completes or fails for good.
struct SyncCallbacks {
    std::function<void(const nlohmann::json& value)> on_success;
    std::function<void(const std::string& error)> on_error;
};

enum class SyncOutcomeStatus { Completed, Failed, Cancelled };

struct SyncOutcome {
    SyncOutcomeStatus status = SyncOutcomeStatus::Cancelled;
    nlohmann::json value;
    std::string error;
};

/// Returned by add_to_sync_queue(): the item id and an awaitable final outcome.
struct SyncTicket {
    std::string id;
    std::shared_future<SyncOutcome> outcome;
};

/// Read-only copy of one queued item.
struct SyncItemView {
    std::string id;
    std::string operation_type;
    nlohmann::json payload;
    SyncStatus status = SyncStatus::Pending;
    SyncPriority priority = SyncPriority::Normal;
    uint32_t attempts = 0;
    int64_t enqueued_at = 0;      // Epoch ms
    int64_t last_attempt_at = 0;  // Epoch ms, 0 if never attempted
    int64_t next_attempt_at = 0;  // Epoch ms, 0 if due immediately
    std::string last_error;
    bool bound = false;           // Has an execute capability (own or registered)
};

struct SyncQueueStatus {
    size_t queue_length = 0;
    size_t pending_count = 0;   // Pending or Retrying
    size_t failed_count = 0;
    bool is_syncing = false;
    std::optional<int64_t> last_sync_time;  // Epoch ms of the last pass that attempted items
};

/// Durable store-and-forward queue for write operations.
///
/// Items are persisted as one JSON snapshot (write-through, after every
/// mutation) and executed in batches by processing passes. A pass runs on the
/// scheduler thread (periodically, and when a retry comes due), on sync_now(),
/// or when connectivity returns. At most one pass runs at a time; a concurrent
/// request is a no-op.
///
/// Failed attempts are retried with exponential backoff up to max_retries.
/// Execute capabilities are not persisted: items restored after a restart are
/// bound again through register_handler() / set_default_handler().
class SyncQueue {
public:
    /// Loads the persisted snapshot. Items that were Syncing when the process
    /// died are restored as Pending.
    /// @param monitor Optional; without one the queue considers itself online.
    SyncQueue(const SyncQueueOptions& options, DurableStore& store,
              ConnectivityMonitor* monitor = nullptr);
    ~SyncQueue();

    SyncQueue(const SyncQueue&) = delete;
    SyncQueue& operator=(const SyncQueue&) = delete;

    /// Start the scheduler thread. Returns error message on failure, empty string on success.
    std::string start();

    /// Stop the scheduler thread. In-flight executions finish; their results are applied.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_relaxed); }

    // --- Capabilities ---

    void register_handler(const std::string& operation_type, ExecuteFn fn);
    void set_default_handler(ExecuteFn fn);

    // --- Operations ---

    /// Append a Pending item. Never executes synchronously.
    /// @param execute Per-item capability; if empty the handler registry is used.
    /// @throws std::invalid_argument if operation_type is empty or not valid UTF-8.
    SyncTicket add_to_sync_queue(const std::string& operation_type,
                                 const nlohmann::json& payload,
                                 ExecuteFn execute = {},
                                 SyncCallbacks callbacks = {},
                                 SyncPriority priority = SyncPriority::Normal);

    /// Remove an item in any state. An outstanding outcome resolves Cancelled.
    /// Returns false if the id is unknown.
    bool remove_from_sync_queue(const std::string& id);

    /// Run one processing pass. Returns false if the pass was skipped
    /// (disabled, offline, or another pass is already running).
    bool process_sync_queue();

    /// Run a pass immediately on the calling thread, regardless of schedule.
    bool sync_now();

    /// Drop every item, cancelling scheduled retries. Results of executions
    /// still in flight are discarded.
    void clear_sync_queue();

    /// Put a Failed item back to Pending with attempts reset.
    /// Returns the new ticket, or empty if the id is unknown or not Failed.
    std::optional<SyncTicket> retry_failed(const std::string& id);

    /// Drop all Failed items. Returns how many were removed.
    size_t clear_failed();

    /// Connectivity listener: offline pauses passes, coming back online syncs now.
    void on_connectivity_changed(bool online);

    bool is_online() const { return online_.load(); }

    // --- Inspection ---

    SyncQueueStatus status() const;
    std::vector<SyncItemView> items() const;

    struct Stats {
        uint64_t enqueued = 0;
        uint64_t passes = 0;
        uint64_t passes_skipped = 0;
        uint64_t attempts_ok = 0;
        uint64_t attempts_failed = 0;
        uint64_t retries_scheduled = 0;
        uint64_t completed = 0;
        uint64_t failed = 0;      // Exhausted retries
        uint64_t cancelled = 0;
        uint64_t discarded_results = 0;
    };
    Stats get_stats() const;

    /// Backoff before the retry numbered `attempts` (1-based), without jitter.
    static std::chrono::milliseconds backoff_delay(std::chrono::milliseconds retry_delay,
                                                   uint32_t attempts);

private:
    struct Item {
        SyncItemView view;
        ExecuteFn execute;
        SyncCallbacks callbacks;
        std::shared_ptr<std::promise<SyncOutcome>> promise;
        std::shared_future<SyncOutcome> outcome;
    };

    // Counts run_pass() invocations so stop() and the destructor can wait them out
    class PassGuard {
    public:
        explicit PassGuard(SyncQueue& queue) : queue_(queue) {
            std::lock_guard lock(queue_.pass_mutex_);
            queue_.passes_in_flight_++;
        }
        ~PassGuard() {
            std::lock_guard lock(queue_.pass_mutex_);
            if (--queue_.passes_in_flight_ == 0) queue_.pass_cv_.notify_all();
        }
        PassGuard(const PassGuard&) = delete;
        PassGuard& operator=(const PassGuard&) = delete;

    private:
        SyncQueue& queue_;
    };

    void scheduler_loop();
    bool run_pass();
    void wait_for_passes();

    // Caller holds mutex_
    void persist_locked();
    void load_snapshot();
    ExecuteFn resolve_execute_locked(const Item& item) const;
    std::vector<Item>::iterator find_locked(const std::string& id);
    std::chrono::milliseconds jittered(std::chrono::milliseconds delay);
    void notify_scheduler();

    static void arm_promise(Item& item);

    SyncQueueOptions options_;
    DurableStore& store_;
    ConnectivityMonitor* monitor_ = nullptr;
    uint64_t monitor_subscription_ = 0;

    // Items in enqueue order
    mutable std::mutex mutex_;
    std::vector<Item> items_;
    std::unordered_map<std::string, ExecuteFn> handlers_;
    ExecuteFn default_handler_;
    std::optional<int64_t> last_sync_time_;
    std::mt19937_64 rng_{std::random_device{}()};

    std::atomic<bool> online_{true};
    std::atomic<bool> processing_{false};

    std::mutex pass_mutex_;
    std::condition_variable pass_cv_;
    size_t passes_in_flight_ = 0;

    std::unique_ptr<meridian::ThreadPool> execute_pool_;

    // Scheduler
    std::thread scheduler_thread_;
    std::atomic<bool> running_{false};
    std::mutex scheduler_mutex_;
    std::condition_variable scheduler_cv_;
    bool wake_ = false;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace resync
