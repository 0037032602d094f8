#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace resync {

/// Tracks online/offline state and notifies subscribers on transitions.
///
/// State can be driven two ways: set_online() (tests, control socket, "manual"
/// mode), or start(), which watches rtnetlink link/address events in a
/// background thread and re-probes the interface table on every event.
/// Listeners only fire when the state actually changes.
class ConnectivityMonitor {
public:
    using Listener = std::function<void(bool online)>;

    /// @param initially_online Starting state before any probe or set_online().
    explicit ConnectivityMonitor(bool initially_online = true);
    ~ConnectivityMonitor();

    ConnectivityMonitor(const ConnectivityMonitor&) = delete;
    ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

    /// Register a listener. Returns an id for unsubscribe().
    uint64_t subscribe(Listener listener);
    void unsubscribe(uint64_t id);

    bool is_online() const { return online_.load(); }

    /// Inject a connectivity signal. Notifies listeners if the state changed.
    void set_online(bool online);

    /// Probe interfaces once, then watch netlink events in a background thread.
    /// Throws std::runtime_error if the netlink socket cannot be opened.
    void start();

    /// Stop the event loop and join the background thread.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_relaxed); }

    /// True if any non-loopback interface is up, running and has an IPv4/IPv6 address.
    static bool probe_interfaces();

    struct Stats {
        uint64_t transitions = 0;
        uint64_t netlink_events = 0;
        uint64_t probes = 0;
        uint64_t errors = 0;
    };
    Stats get_stats() const;

private:
    void event_loop();
    void close_fds();

    std::atomic<bool> online_;

    std::mutex listeners_mutex_;
    std::map<uint64_t, Listener> listeners_;
    uint64_t next_listener_id_ = 1;

    // Serializes transitions so listeners see them in order
    std::mutex dispatch_mutex_;

    int netlink_fd_ = -1;
    int stop_pipe_[2] = {-1, -1};  // Self-pipe for wakeup
    std::thread event_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace resync
