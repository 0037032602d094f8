#include "resync/metrics.hpp"
#include "resync/connectivity_monitor.hpp"
#include "resync/log.hpp"
#include "resync/prefetch_cache.hpp"
#include "resync/sync_queue.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace resync {

namespace {

// Counters only move forward: add what the source gained since the last sample
void advance(prometheus::Counter& counter, uint64_t current, uint64_t& previous) {
    if (current > previous) {
        counter.Increment(static_cast<double>(current - previous));
        previous = current;
    }
}

}  // namespace

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& attempts_family = prometheus::BuildCounter()
        .Name("resync_sync_attempts_total")
        .Help("Sync executions by result")
        .Labels(labels)
        .Register(*registry_);
    attempts_ok_ = &attempts_family.Add({{"result", "ok"}});
    attempts_failed_ = &attempts_family.Add({{"result", "failed"}});

    retries_scheduled_ = &prometheus::BuildCounter()
        .Name("resync_sync_retries_total")
        .Help("Retries scheduled after a failed execution")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& items_family = prometheus::BuildCounter()
        .Name("resync_sync_items_total")
        .Help("Queue items that reached a final outcome")
        .Labels(labels)
        .Register(*registry_);
    items_completed_ = &items_family.Add({{"outcome", "completed"}});
    items_failed_ = &items_family.Add({{"outcome", "failed"}});
    items_cancelled_ = &items_family.Add({{"outcome", "cancelled"}});

    auto& prefetch_family = prometheus::BuildCounter()
        .Name("resync_prefetch_requests_total")
        .Help("Prefetch requests by result")
        .Labels(labels)
        .Register(*registry_);
    prefetch_hits_ = &prefetch_family.Add({{"result", "hit"}});
    prefetch_misses_ = &prefetch_family.Add({{"result", "miss"}});
    prefetch_shared_ = &prefetch_family.Add({{"result", "shared"}});

    auto& fetches_family = prometheus::BuildCounter()
        .Name("resync_fetches_total")
        .Help("Fetches run for prefetch misses")
        .Labels(labels)
        .Register(*registry_);
    fetches_ok_ = &fetches_family.Add({{"result", "ok"}});
    fetches_failed_ = &fetches_family.Add({{"result", "failed"}});

    auto& evictions_family = prometheus::BuildCounter()
        .Name("resync_cache_evictions_total")
        .Help("Cache entries removed by reason")
        .Labels(labels)
        .Register(*registry_);
    evictions_expired_ = &evictions_family.Add({{"reason", "expired"}});
    evictions_capacity_ = &evictions_family.Add({{"reason", "capacity"}});

    connectivity_transitions_ = &prometheus::BuildCounter()
        .Name("resync_connectivity_transitions_total")
        .Help("Online/offline transitions")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    queue_length_ = &gauge_reg("resync_queue_length", "Items in the sync queue");
    queue_pending_ = &gauge_reg("resync_queue_pending", "Items pending or awaiting retry");
    queue_failed_ = &gauge_reg("resync_queue_failed", "Items that exhausted their retries");
    queue_syncing_ = &gauge_reg("resync_queue_syncing", "1 while a processing pass runs");
    cache_entries_ = &gauge_reg("resync_cache_entries", "Entries in the prefetch cache");
    cache_prefetching_ = &gauge_reg("resync_cache_prefetching", "1 while any fetch is in flight");
    online_ = &gauge_reg("resync_online", "1 when connectivity is up");

    // --- Histograms ---

    execute_duration_ = &prometheus::BuildHistogram()
        .Name("resync_execute_duration_seconds")
        .Help("Sync execution duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.001, 0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30});

    fetch_duration_ = &prometheus::BuildHistogram()
        .Name("resync_fetch_duration_seconds")
        .Help("Prefetch fetch duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.001, 0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (!was_running) return;

    cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    // Final snapshot
    write_now();
}

void MetricsExporter::write_now() {
    std::lock_guard lock(update_mutex_);
    update_metrics();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_now();
    }
}

void MetricsExporter::update_metrics() {
    if (queue_) {
        auto s = queue_->status();
        queue_length_->Set(static_cast<double>(s.queue_length));
        queue_pending_->Set(static_cast<double>(s.pending_count));
        queue_failed_->Set(static_cast<double>(s.failed_count));
        queue_syncing_->Set(s.is_syncing ? 1.0 : 0.0);

        auto qs = queue_->get_stats();
        advance(*attempts_ok_, qs.attempts_ok, prev_.attempts_ok);
        advance(*attempts_failed_, qs.attempts_failed, prev_.attempts_failed);
        advance(*retries_scheduled_, qs.retries_scheduled, prev_.retries);
        advance(*items_completed_, qs.completed, prev_.completed);
        advance(*items_failed_, qs.failed, prev_.failed);
        advance(*items_cancelled_, qs.cancelled, prev_.cancelled);
    }

    if (cache_) {
        cache_entries_->Set(static_cast<double>(cache_->cache_size()));
        cache_prefetching_->Set(cache_->is_prefetching() ? 1.0 : 0.0);

        auto cs = cache_->get_stats();
        advance(*prefetch_hits_, cs.hits, prev_.hits);
        advance(*prefetch_misses_, cs.misses, prev_.misses);
        advance(*prefetch_shared_, cs.shared, prev_.shared);
        advance(*fetches_ok_, cs.fetches_ok, prev_.fetches_ok);
        advance(*fetches_failed_, cs.fetches_failed, prev_.fetches_failed);
        advance(*evictions_expired_, cs.evicted_expired, prev_.evicted_expired);
        advance(*evictions_capacity_, cs.evicted_capacity, prev_.evicted_capacity);
    }

    if (monitor_) {
        online_->Set(monitor_->is_online() ? 1.0 : 0.0);
        advance(*connectivity_transitions_, monitor_->get_stats().transitions, prev_.transitions);
    }
}

void MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot rename metrics file: %s", ec.message().c_str());
    }
}

}  // namespace resync
