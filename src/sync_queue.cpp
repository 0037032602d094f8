#include "resync/sync_queue.hpp"
#include "resync/connectivity_monitor.hpp"
#include "resync/durable_store.hpp"
#include "resync/log.hpp"
#include "resync/util.hpp"
#include "meridian/core/thread_pool.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <system_error>

namespace resync {

namespace {

constexpr int SNAPSHOT_VERSION = 1;

// Cap on the backoff exponent; 2^20 * retry_delay is already far past any sane interval
constexpr uint32_t MAX_BACKOFF_EXPONENT = 20;

SyncResult invoke_execute(const ExecuteFn& execute, const SyncRequest& request) {
    try {
        return execute(request);
    } catch (const std::exception& e) {
        SyncResult r;
        r.error_message = e.what();
        return r;
    } catch (...) {
        SyncResult r;
        r.error_message = "execute threw a non-standard exception";
        return r;
    }
}

}  // namespace

const char* to_string(SyncStatus status) {
    switch (status) {
        case SyncStatus::Pending: return "pending";
        case SyncStatus::Syncing: return "syncing";
        case SyncStatus::Retrying: return "retrying";
        case SyncStatus::Completed: return "completed";
        case SyncStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(SyncPriority priority) {
    switch (priority) {
        case SyncPriority::High: return "high";
        case SyncPriority::Normal: return "normal";
        case SyncPriority::Low: return "low";
    }
    return "unknown";
}

std::optional<SyncStatus> parse_sync_status(const std::string& s) {
    if (s == "pending") return SyncStatus::Pending;
    if (s == "syncing") return SyncStatus::Syncing;
    if (s == "retrying") return SyncStatus::Retrying;
    if (s == "completed") return SyncStatus::Completed;
    if (s == "failed") return SyncStatus::Failed;
    return std::nullopt;
}

std::optional<SyncPriority> parse_sync_priority(const std::string& s) {
    if (s == "high") return SyncPriority::High;
    if (s == "normal") return SyncPriority::Normal;
    if (s == "low") return SyncPriority::Low;
    return std::nullopt;
}

std::chrono::milliseconds SyncQueue::backoff_delay(std::chrono::milliseconds retry_delay,
                                                   uint32_t attempts) {
    uint32_t exponent = std::min(attempts, MAX_BACKOFF_EXPONENT);
    return retry_delay * (int64_t{1} << exponent);
}

SyncQueue::SyncQueue(const SyncQueueOptions& options, DurableStore& store,
                     ConnectivityMonitor* monitor)
    : options_(options), store_(store), monitor_(monitor) {
    load_snapshot();

    if (options_.execute_threads == 0) {
        options_.execute_threads = options_.batch_size;
    } else if (options_.execute_threads < options_.batch_size) {
        log_warn("execute_threads (%zu) < batch_size (%zu): a pass runs at most %zu items at once",
                 options_.execute_threads, options_.batch_size, options_.execute_threads);
    }
    execute_pool_ = std::make_unique<meridian::ThreadPool>(options_.execute_threads);

    if (monitor_) {
        online_ = monitor_->is_online();
        monitor_subscription_ = monitor_->subscribe([this](bool online) {
            on_connectivity_changed(online);
        });
    }
}

SyncQueue::~SyncQueue() {
    if (monitor_) {
        monitor_->unsubscribe(monitor_subscription_);
    }
    stop();
    wait_for_passes();
    if (execute_pool_) execute_pool_->shutdown(true);
}

void SyncQueue::wait_for_passes() {
    std::unique_lock lock(pass_mutex_);
    pass_cv_.wait(lock, [this] { return passes_in_flight_ == 0; });
}

std::string SyncQueue::start() {
    if (running_.exchange(true)) return {};

    try {
        scheduler_thread_ = std::thread(&SyncQueue::scheduler_loop, this);
    } catch (const std::system_error& e) {
        running_ = false;
        return std::string("Failed to start sync scheduler: ") + e.what();
    }

    log_info("Sync queue started: %zu items, batch=%zu, max_retries=%u",
             status().queue_length, options_.batch_size, options_.max_retries);
    return {};
}

void SyncQueue::stop() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard lock(scheduler_mutex_);
        wake_ = true;
    }
    scheduler_cv_.notify_all();

    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }
    // A pass started by sync_now or a reconnect may still be applying results
    wait_for_passes();
    log_info("Sync queue stopped");
}

// --- Capabilities ---

void SyncQueue::register_handler(const std::string& operation_type, ExecuteFn fn) {
    {
        std::lock_guard lock(mutex_);
        handlers_[operation_type] = std::move(fn);
    }
    // Restored items of this type may now be runnable
    notify_scheduler();
}

void SyncQueue::set_default_handler(ExecuteFn fn) {
    {
        std::lock_guard lock(mutex_);
        default_handler_ = std::move(fn);
    }
    notify_scheduler();
}

ExecuteFn SyncQueue::resolve_execute_locked(const Item& item) const {
    if (item.execute) return item.execute;
    auto it = handlers_.find(item.view.operation_type);
    if (it != handlers_.end() && it->second) return it->second;
    return default_handler_;
}

// --- Operations ---

void SyncQueue::arm_promise(Item& item) {
    item.promise = std::make_shared<std::promise<SyncOutcome>>();
    item.outcome = item.promise->get_future().share();
}

SyncTicket SyncQueue::add_to_sync_queue(const std::string& operation_type,
                                        const nlohmann::json& payload,
                                        ExecuteFn execute,
                                        SyncCallbacks callbacks,
                                        SyncPriority priority) {
    if (operation_type.empty() || !is_valid_utf8(operation_type)) {
        throw std::invalid_argument("operation type must be non-empty UTF-8");
    }

    Item item;
    item.view.id = generate_sync_id();
    item.view.operation_type = operation_type;
    item.view.payload = payload;
    item.view.status = SyncStatus::Pending;
    item.view.priority = priority;
    item.view.enqueued_at = now_epoch_ms();
    item.execute = std::move(execute);
    item.callbacks = std::move(callbacks);
    arm_promise(item);

    SyncTicket ticket{item.view.id, item.outcome};
    {
        std::lock_guard lock(mutex_);
        items_.push_back(std::move(item));
        persist_locked();
    }
    {
        std::lock_guard lock(stats_mutex_);
        stats_.enqueued++;
    }
    log_debug("Queued %s (%s)", ticket.id.c_str(), operation_type.c_str());
    return ticket;
}

std::vector<SyncQueue::Item>::iterator SyncQueue::find_locked(const std::string& id) {
    return std::find_if(items_.begin(), items_.end(),
                        [&id](const Item& item) { return item.view.id == id; });
}

bool SyncQueue::remove_from_sync_queue(const std::string& id) {
    std::shared_ptr<std::promise<SyncOutcome>> promise;
    bool resolve = false;
    {
        std::lock_guard lock(mutex_);
        auto it = find_locked(id);
        if (it == items_.end()) return false;

        // Failed items already delivered their outcome
        resolve = it->view.status != SyncStatus::Failed;
        promise = it->promise;
        items_.erase(it);
        persist_locked();
    }

    if (resolve && promise) {
        promise->set_value(SyncOutcome{SyncOutcomeStatus::Cancelled, nullptr, "removed"});
        std::lock_guard lock(stats_mutex_);
        stats_.cancelled++;
    }
    log_debug("Removed %s", id.c_str());
    return true;
}

void SyncQueue::clear_sync_queue() {
    std::vector<Item> dropped;
    {
        std::lock_guard lock(mutex_);
        dropped.swap(items_);
        persist_locked();
    }
    // Due times went away with the items
    notify_scheduler();

    uint64_t cancelled = 0;
    for (auto& item : dropped) {
        if (item.view.status == SyncStatus::Failed || !item.promise) continue;
        item.promise->set_value(SyncOutcome{SyncOutcomeStatus::Cancelled, nullptr, "queue cleared"});
        cancelled++;
    }
    {
        std::lock_guard lock(stats_mutex_);
        stats_.cancelled += cancelled;
    }
    log_info("Sync queue cleared (%zu items)", dropped.size());
}

std::optional<SyncTicket> SyncQueue::retry_failed(const std::string& id) {
    SyncTicket ticket;
    {
        std::lock_guard lock(mutex_);
        auto it = find_locked(id);
        if (it == items_.end() || it->view.status != SyncStatus::Failed) return std::nullopt;

        it->view.status = SyncStatus::Pending;
        it->view.attempts = 0;
        it->view.next_attempt_at = 0;
        it->view.last_error.clear();
        arm_promise(*it);
        ticket = SyncTicket{it->view.id, it->outcome};
        persist_locked();
    }
    log_info("Manual retry: %s", id.c_str());
    return ticket;
}

size_t SyncQueue::clear_failed() {
    size_t removed = 0;
    {
        std::lock_guard lock(mutex_);
        auto it = std::remove_if(items_.begin(), items_.end(), [](const Item& item) {
            return item.view.status == SyncStatus::Failed;
        });
        removed = static_cast<size_t>(std::distance(it, items_.end()));
        items_.erase(it, items_.end());
        if (removed > 0) persist_locked();
    }
    if (removed > 0) log_info("Cleared %zu failed items", removed);
    return removed;
}

bool SyncQueue::process_sync_queue() {
    return run_pass();
}

bool SyncQueue::sync_now() {
    log_debug("Sync requested");
    return run_pass();
}

void SyncQueue::on_connectivity_changed(bool online) {
    bool was_online = online_.exchange(online);
    if (online && !was_online) {
        sync_now();
    }
    // Interval depends on connectivity
    notify_scheduler();
}

// --- Processing ---

std::chrono::milliseconds SyncQueue::jittered(std::chrono::milliseconds delay) {
    if (options_.retry_jitter <= 0.0) return delay;
    std::uniform_real_distribution<double> dist(-options_.retry_jitter, options_.retry_jitter);
    double factor = 1.0 + dist(rng_);
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay.count() * factor)));
}

bool SyncQueue::run_pass() {
    PassGuard guard(*this);

    if (!options_.enabled || !online_.load() || processing_.exchange(true)) {
        std::lock_guard lock(stats_mutex_);
        stats_.passes_skipped++;
        return false;
    }

    struct Job {
        SyncRequest request;
        ExecuteFn execute;
    };
    std::vector<Job> batch;

    {
        std::lock_guard lock(mutex_);
        int64_t now = now_epoch_ms();

        std::vector<Item*> candidates;
        for (auto& item : items_) {
            auto s = item.view.status;
            if (s != SyncStatus::Pending && s != SyncStatus::Retrying) continue;
            if (item.view.next_attempt_at > now) continue;
            if (!resolve_execute_locked(item)) continue;
            candidates.push_back(&item);
        }
        std::stable_sort(candidates.begin(), candidates.end(), [](const Item* a, const Item* b) {
            return a->view.priority < b->view.priority;
        });
        if (candidates.size() > options_.batch_size) {
            candidates.resize(options_.batch_size);
        }

        for (auto* item : candidates) {
            item->view.status = SyncStatus::Syncing;
            item->view.last_attempt_at = now;
            batch.push_back(Job{
                SyncRequest{item->view.id, item->view.operation_type, item->view.payload, item->view.attempts},
                resolve_execute_locked(*item)});
        }

        if (!batch.empty()) {
            last_sync_time_ = now;
            persist_locked();
        }
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.passes++;
    }

    if (batch.empty()) {
        processing_ = false;
        return true;
    }

    log_debug("Sync pass: %zu items", batch.size());

    std::vector<std::future<SyncResult>> futures;
    futures.reserve(batch.size());
    for (auto& job : batch) {
        futures.push_back(execute_pool_->submit([job]() {
            return invoke_execute(job.execute, job.request);
        }));
    }

    std::vector<SyncResult> results;
    results.reserve(futures.size());
    for (auto& f : futures) {
        try {
            results.push_back(f.get());
        } catch (const std::exception& e) {
            SyncResult r;
            r.error_message = e.what();
            results.push_back(std::move(r));
        }
    }

    struct Notification {
        SyncCallbacks callbacks;
        bool success = false;
        nlohmann::json value;
        std::string error;
    };
    std::vector<Notification> notifications;
    uint64_t ok = 0, failed_attempts = 0, retries = 0, completed = 0, exhausted = 0, discarded = 0;

    {
        std::lock_guard lock(mutex_);
        int64_t now = now_epoch_ms();

        for (size_t i = 0; i < batch.size(); ++i) {
            const auto& id = batch[i].request.id;
            auto& result = results[i];

            auto it = find_locked(id);
            if (it == items_.end() || it->view.status != SyncStatus::Syncing) {
                // Removed or cleared while executing
                discarded++;
                continue;
            }

            it->view.last_attempt_at = now;

            if (result.success) {
                ok++;
                completed++;
                log_debug("Synced %s (%s)", id.c_str(), it->view.operation_type.c_str());
                it->promise->set_value(SyncOutcome{SyncOutcomeStatus::Completed, result.value, {}});
                notifications.push_back(Notification{it->callbacks, true, result.value, {}});
                items_.erase(it);
                continue;
            }

            failed_attempts++;
            std::string error = result.error_message.empty() ? "unknown error" : result.error_message;
            it->view.last_error = error;

            if (it->view.attempts < options_.max_retries) {
                it->view.attempts++;
                it->view.status = SyncStatus::Retrying;
                auto delay = jittered(backoff_delay(options_.retry_delay, it->view.attempts));
                it->view.next_attempt_at = now + delay.count();
                retries++;
                log_warn("Sync attempt failed for %s (%s), retry %u/%u in %lld ms: %s",
                         id.c_str(), it->view.operation_type.c_str(), it->view.attempts,
                         options_.max_retries, static_cast<long long>(delay.count()), error.c_str());
            } else {
                it->view.status = SyncStatus::Failed;
                it->view.next_attempt_at = 0;
                exhausted++;
                log_error("Sync failed for %s (%s) after %u retries: %s",
                          id.c_str(), it->view.operation_type.c_str(), it->view.attempts, error.c_str());
                it->promise->set_value(SyncOutcome{SyncOutcomeStatus::Failed, nullptr, error});
                notifications.push_back(Notification{it->callbacks, false, nullptr, error});
            }
        }

        persist_locked();
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.attempts_ok += ok;
        stats_.attempts_failed += failed_attempts;
        stats_.retries_scheduled += retries;
        stats_.completed += completed;
        stats_.failed += exhausted;
        stats_.discarded_results += discarded;
    }

    processing_ = false;

    // Callbacks run without any queue lock held
    for (auto& n : notifications) {
        try {
            if (n.success && n.callbacks.on_success) {
                n.callbacks.on_success(n.value);
            } else if (!n.success && n.callbacks.on_error) {
                n.callbacks.on_error(n.error);
            }
        } catch (const std::exception& e) {
            log_error("Sync callback failed: %s", e.what());
        }
    }

    // New due times: let the scheduler recompute its wait
    notify_scheduler();
    return true;
}

void SyncQueue::notify_scheduler() {
    {
        std::lock_guard lock(scheduler_mutex_);
        wake_ = true;
    }
    scheduler_cv_.notify_all();
}

void SyncQueue::scheduler_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        auto wait = online_.load() ? options_.online_interval : options_.offline_interval;

        // A retry coming due shortens the wait. Skipped while offline (passes are
        // no-ops) and while a pass is running (it notifies when done).
        if (options_.enabled && online_.load() && !processing_.load()) {
            std::lock_guard lock(mutex_);
            int64_t now = now_epoch_ms();
            for (const auto& item : items_) {
                if (item.view.status != SyncStatus::Retrying && item.view.status != SyncStatus::Pending) continue;
                if (item.view.next_attempt_at == 0) continue;
                if (!resolve_execute_locked(item)) continue;
                auto until = std::chrono::milliseconds(std::max<int64_t>(item.view.next_attempt_at - now, 0));
                wait = std::min(wait, until);
            }
        }

        {
            std::unique_lock lock(scheduler_mutex_);
            bool woken = scheduler_cv_.wait_for(lock, wait, [this] {
                return wake_ || !running_.load();
            });
            if (!running_.load()) break;
            if (woken) {
                wake_ = false;
                continue;
            }
        }

        run_pass();
    }
}

// --- Inspection ---

SyncQueueStatus SyncQueue::status() const {
    SyncQueueStatus s;
    std::lock_guard lock(mutex_);
    s.queue_length = items_.size();
    for (const auto& item : items_) {
        switch (item.view.status) {
            case SyncStatus::Pending:
            case SyncStatus::Retrying:
                s.pending_count++;
                break;
            case SyncStatus::Failed:
                s.failed_count++;
                break;
            case SyncStatus::Syncing:
                s.is_syncing = true;
                break;
            case SyncStatus::Completed:
                break;
        }
    }
    if (processing_.load()) s.is_syncing = true;
    s.last_sync_time = last_sync_time_;
    return s;
}

std::vector<SyncItemView> SyncQueue::items() const {
    std::lock_guard lock(mutex_);
    std::vector<SyncItemView> result;
    result.reserve(items_.size());
    for (const auto& item : items_) {
        result.push_back(item.view);
        result.back().bound = static_cast<bool>(resolve_execute_locked(item));
    }
    return result;
}

SyncQueue::Stats SyncQueue::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

// --- Persistence ---

void SyncQueue::persist_locked() {
    std::string data;
    try {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& item : items_) {
            const auto& v = item.view;
            arr.push_back({
                {"id", v.id},
                {"operation_type", v.operation_type},
                {"payload", v.payload},
                {"status", to_string(v.status)},
                {"priority", to_string(v.priority)},
                {"attempts", v.attempts},
                {"enqueued_at", v.enqueued_at},
                {"last_attempt_at", v.last_attempt_at},
                {"next_attempt_at", v.next_attempt_at},
                {"last_error", v.last_error},
            });
        }
        nlohmann::json j = {{"version", SNAPSHOT_VERSION}, {"items", std::move(arr)}};
        // Stray invalid UTF-8 (payloads, errors, keys) must not block every later snapshot
        data = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        log_warn("Cannot serialize sync queue: %s", e.what());
        return;
    }
    store_.set(options_.queue_key, data);
}

void SyncQueue::load_snapshot() {
    auto data = store_.get(options_.queue_key);
    if (!data) return;

    auto j = nlohmann::json::parse(*data, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("items") || !j["items"].is_array()) {
        log_warn("Ignoring unreadable sync queue snapshot under '%s'", options_.queue_key.c_str());
        return;
    }
    if (j.value("version", 0) != SNAPSHOT_VERSION) {
        log_warn("Ignoring sync queue snapshot with unknown version");
        return;
    }

    size_t recovered = 0;
    for (const auto& ji : j["items"]) {
        try {
            Item item;
            item.view.id = ji.at("id").get<std::string>();
            item.view.operation_type = ji.at("operation_type").get<std::string>();
            item.view.payload = ji.value("payload", nlohmann::json());
            auto status = parse_sync_status(ji.at("status").get<std::string>());
            if (!status || *status == SyncStatus::Completed) continue;
            item.view.status = *status;
            item.view.priority = parse_sync_priority(ji.value("priority", std::string("normal")))
                                     .value_or(SyncPriority::Normal);
            item.view.attempts = ji.value("attempts", 0u);
            item.view.enqueued_at = ji.value("enqueued_at", int64_t{0});
            item.view.last_attempt_at = ji.value("last_attempt_at", int64_t{0});
            item.view.next_attempt_at = ji.value("next_attempt_at", int64_t{0});
            item.view.last_error = ji.value("last_error", std::string());

            // Crash recovery: the attempt never reported back
            if (item.view.status == SyncStatus::Syncing) {
                item.view.status = SyncStatus::Pending;
                recovered++;
            }
            arm_promise(item);
            items_.push_back(std::move(item));
        } catch (const nlohmann::json::exception& e) {
            log_warn("Skipping malformed sync queue item: %s", e.what());
        }
    }

    if (!items_.empty()) {
        log_info("Restored %zu queued items (%zu interrupted, reset to pending)", items_.size(), recovered);
    }
}

}  // namespace resync
