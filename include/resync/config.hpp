#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace resync {

/// Configuration for the durable key-value store (sqlite, lmdb or memory).
struct StoreConfig {
    std::string type = "sqlite";
    std::filesystem::path path;                 // Database file (sqlite) or environment dir (lmdb)
    std::map<std::string, std::string> params;  // Backend-specific, e.g. "mapsize_mb" for lmdb

    /// Validate required fields for this store type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Tuning for the sync queue.
struct SyncQueueOptions {
    bool enabled = true;
    std::string queue_key = "background_sync_queue";  // Snapshot key in the durable store

    size_t batch_size = 3;        // Items attempted per pass
    uint32_t max_retries = 3;     // Executions never exceed max_retries + 1
    std::chrono::milliseconds retry_delay{5000};
    double retry_jitter = 0.2;    // +/- fraction applied to each backoff delay, 0 disables

    std::chrono::milliseconds online_interval{30000};
    std::chrono::milliseconds offline_interval{60000};

    size_t execute_threads = 0;   // Concurrent executions, 0 follows batch_size
};

/// Tuning for the prefetch cache.
struct PrefetchOptions {
    bool enabled = true;
    std::string cache_key = "prefetch_cache";  // Snapshot key in the durable store

    std::chrono::milliseconds max_age{5 * 60 * 1000};
    size_t max_entries = 50;
    std::chrono::milliseconds sweep_interval{60000};

    size_t fetch_threads = 4;
};

/// Configuration for the resync daemon.
struct ResyncConfig {
    // State directory: durable store, control socket
    std::filesystem::path state_dir;

    StoreConfig store;
    SyncQueueOptions queue;
    PrefetchOptions prefetch;

    // "netlink" watches interface changes, "manual" only reacts to ONLINE/OFFLINE commands
    std::string connectivity_mode = "netlink";

    // Delivery target for queued operations and fetch source for prefetches
    std::filesystem::path target_dir;

    // Control socket (default: <state_dir>/control.sock)
    std::filesystem::path control_socket;
    size_t control_threads = 4;

    size_t stats_interval_secs = 60;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<ResyncConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults (store path, control socket) based on state_dir.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace resync
