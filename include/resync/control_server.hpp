#pragma once

#include "resync/prefetch_cache.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace meridian {
class ThreadPool;
}  // namespace meridian

namespace resync {

class ConnectivityMonitor;
class SyncQueue;

/// Line-oriented Unix socket for operating the daemon.
///
/// One request per connection, answered with one line:
///   STATUS                     -> OK <status json>
///   SYNC                       -> OK <status json>   (runs a pass now)
///   ENQUEUE <type> <json>      -> OK <id>
///   REMOVE <id>                -> OK | NOTFOUND
///   RETRY <id>                 -> OK | NOTFOUND
///   CLEAR                      -> OK
///   CLEAR-FAILED               -> OK <count>
///   ITEMS                      -> OK <items json>
///   ONLINE | OFFLINE           -> OK
///   GET <key>                  -> OK <json> | MISS
///   PREFETCH <key>             -> OK <json> | MISS   (waits for the fetch)
///   INVALIDATE <key>           -> OK | NOTFOUND
///   CACHE-CLEAR                -> OK
/// Anything else gets ERROR <msg>.
class ControlServer {
public:
    /// Builds the fetch capability PREFETCH uses for a key.
    using FetchFactory = std::function<FetchFn(const std::string& key)>;

    ControlServer(const std::filesystem::path& socket_path, size_t threads,
                  SyncQueue& queue, PrefetchCache& cache,
                  ConnectivityMonitor& monitor, FetchFactory make_fetch);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    /// Bind the socket and start accepting.
    /// Returns error message on failure, empty string on success.
    std::string start();

    /// Stop accepting, finish requests in progress, remove the socket file.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_relaxed); }

    /// Handle one request line (without trailing newline). Returns the reply line.
    std::string handle_request(const std::string& line);

    struct Stats {
        uint64_t requests = 0;
        uint64_t errors = 0;
    };
    Stats get_stats() const;

private:
    void server_loop();
    void handle_client(int client_fd);

    std::filesystem::path socket_path_;
    size_t threads_;
    SyncQueue& queue_;
    PrefetchCache& cache_;
    ConnectivityMonitor& monitor_;
    FetchFactory make_fetch_;

    int sock_fd_ = -1;
    std::unique_ptr<meridian::ThreadPool> pool_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace resync
