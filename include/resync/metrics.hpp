#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace resync {

class ConnectivityMonitor;
class PrefetchCache;
class SyncQueue;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports resync metrics to a Prometheus textfile for node_exporter pickup.
///
/// Counters are advanced from the components' own stats by delta on every
/// write; gauges are sampled at the same time. The file is replaced
/// atomically (temp + rename).
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Set pointers for snapshots (not owned).
    void set_queue(SyncQueue* queue) { queue_ = queue; }
    void set_cache(PrefetchCache* cache) { cache_ = cache; }
    void set_monitor(ConnectivityMonitor* monitor) { monitor_ = monitor; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Sample all sources and write the file now.
    void write_now();

    // --- Histogram accessors ---
    prometheus::Histogram& execute_duration() { return *execute_duration_; }
    prometheus::Histogram& fetch_duration() { return *fetch_duration_; }

private:
    void writer_loop();
    void update_metrics();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // Pointers for snapshots (not owned)
    SyncQueue* queue_ = nullptr;
    PrefetchCache* cache_ = nullptr;
    ConnectivityMonitor* monitor_ = nullptr;

    // Serializes update_metrics()/write_file() between the writer thread and write_now()
    std::mutex update_mutex_;

    // Previous stats for delta computation
    struct Previous {
        uint64_t attempts_ok = 0;
        uint64_t attempts_failed = 0;
        uint64_t retries = 0;
        uint64_t completed = 0;
        uint64_t failed = 0;
        uint64_t cancelled = 0;
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t shared = 0;
        uint64_t fetches_ok = 0;
        uint64_t fetches_failed = 0;
        uint64_t evicted_expired = 0;
        uint64_t evicted_capacity = 0;
        uint64_t transitions = 0;
    } prev_;

    // --- Counters ---
    prometheus::Counter* attempts_ok_;
    prometheus::Counter* attempts_failed_;
    prometheus::Counter* retries_scheduled_;
    prometheus::Counter* items_completed_;
    prometheus::Counter* items_failed_;
    prometheus::Counter* items_cancelled_;
    prometheus::Counter* prefetch_hits_;
    prometheus::Counter* prefetch_misses_;
    prometheus::Counter* prefetch_shared_;
    prometheus::Counter* fetches_ok_;
    prometheus::Counter* fetches_failed_;
    prometheus::Counter* evictions_expired_;
    prometheus::Counter* evictions_capacity_;
    prometheus::Counter* connectivity_transitions_;

    // --- Gauges ---
    prometheus::Gauge* queue_length_;
    prometheus::Gauge* queue_pending_;
    prometheus::Gauge* queue_failed_;
    prometheus::Gauge* queue_syncing_;
    prometheus::Gauge* cache_entries_;
    prometheus::Gauge* cache_prefetching_;
    prometheus::Gauge* online_;

    // --- Histograms ---
    prometheus::Histogram* execute_duration_;
    prometheus::Histogram* fetch_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace resync
