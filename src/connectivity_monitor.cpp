#include "resync/connectivity_monitor.hpp"
#include "resync/log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <ifaddrs.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <net/if.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace resync {

ConnectivityMonitor::ConnectivityMonitor(bool initially_online) : online_(initially_online) {}

ConnectivityMonitor::~ConnectivityMonitor() {
    stop();
    close_fds();
}

void ConnectivityMonitor::close_fds() {
    if (netlink_fd_ >= 0) {
        close(netlink_fd_);
        netlink_fd_ = -1;
    }
    if (stop_pipe_[0] >= 0) {
        close(stop_pipe_[0]);
        close(stop_pipe_[1]);
        stop_pipe_[0] = stop_pipe_[1] = -1;
    }
}

uint64_t ConnectivityMonitor::subscribe(Listener listener) {
    std::lock_guard lock(listeners_mutex_);
    uint64_t id = next_listener_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

void ConnectivityMonitor::unsubscribe(uint64_t id) {
    // Waits out a dispatch in progress, so the listener is not running once this returns
    std::lock_guard dispatch(dispatch_mutex_);
    std::lock_guard lock(listeners_mutex_);
    listeners_.erase(id);
}

void ConnectivityMonitor::set_online(bool online) {
    std::lock_guard dispatch(dispatch_mutex_);
    if (online_.exchange(online) == online) return;

    {
        std::lock_guard lock(stats_mutex_);
        stats_.transitions++;
    }
    log_info("Connectivity: %s", online ? "online" : "offline");

    std::vector<Listener> snapshot;
    {
        std::lock_guard lock(listeners_mutex_);
        snapshot.reserve(listeners_.size());
        for (auto& [id, listener] : listeners_) snapshot.push_back(listener);
    }

    for (auto& listener : snapshot) {
        try {
            listener(online);
        } catch (const std::exception& e) {
            log_error("Connectivity listener failed: %s", e.what());
        }
    }
}

bool ConnectivityMonitor::probe_interfaces() {
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) < 0) {
        log_warn("getifaddrs failed: %s", strerror(errno));
        return false;
    }

    bool online = false;
    for (auto* ifa = addrs; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_RUNNING)) continue;

        int family = ifa->ifa_addr->sa_family;
        if (family == AF_INET || family == AF_INET6) {
            online = true;
            break;
        }
    }
    freeifaddrs(addrs);
    return online;
}

void ConnectivityMonitor::start() {
    if (running_.load()) return;

    // Create self-pipe for clean shutdown
    if (pipe2(stop_pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw std::runtime_error("pipe2 failed: " + std::string(strerror(errno)));
    }

    netlink_fd_ = socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC | SOCK_NONBLOCK, NETLINK_ROUTE);
    if (netlink_fd_ < 0) {
        int saved = errno;
        close_fds();
        throw std::runtime_error("netlink socket failed: " + std::string(strerror(saved)));
    }

    struct sockaddr_nl addr;
    memset(&addr, 0, sizeof(addr));
    addr.nl_family = AF_NETLINK;
    addr.nl_groups = RTMGRP_LINK | RTMGRP_IPV4_IFADDR | RTMGRP_IPV6_IFADDR;
    if (bind(netlink_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int saved = errno;
        close_fds();
        throw std::runtime_error("netlink bind failed: " + std::string(strerror(saved)));
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.probes++;
    }
    set_online(probe_interfaces());

    running_ = true;
    event_thread_ = std::thread(&ConnectivityMonitor::event_loop, this);
}

void ConnectivityMonitor::stop() {
    if (!running_.exchange(false)) return;

    // Signal the event loop to stop via the self-pipe
    if (stop_pipe_[1] >= 0) {
        char c = 1;
        (void)write(stop_pipe_[1], &c, 1);
    }

    if (event_thread_.joinable()) {
        event_thread_.join();
    }
    close_fds();
}

ConnectivityMonitor::Stats ConnectivityMonitor::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

void ConnectivityMonitor::event_loop() {
    alignas(struct nlmsghdr) char buf[8192];

    struct pollfd fds[2];
    fds[0].fd = netlink_fd_;
    fds[0].events = POLLIN;
    fds[1].fd = stop_pipe_[0];
    fds[1].events = POLLIN;

    while (running_.load(std::memory_order_relaxed)) {
        int ret = poll(fds, 2, 1000);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::lock_guard lock(stats_mutex_);
            stats_.errors++;
            break;
        }
        if (ret == 0) continue;

        // Check stop signal
        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & POLLIN)) continue;

        // Drain everything queued; one probe covers the whole burst
        bool relevant = false;
        while (true) {
            ssize_t len = recv(netlink_fd_, buf, sizeof(buf), 0);
            if (len < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                if (errno == EINTR) continue;
                if (errno == ENOBUFS) {
                    // Kernel dropped events: state is unknown, re-probe
                    relevant = true;
                    continue;
                }
                std::lock_guard lock(stats_mutex_);
                stats_.errors++;
                break;
            }
            if (len == 0) break;

            for (auto* nh = reinterpret_cast<struct nlmsghdr*>(buf); NLMSG_OK(nh, len);
                 nh = NLMSG_NEXT(nh, len)) {
                switch (nh->nlmsg_type) {
                    case RTM_NEWLINK:
                    case RTM_DELLINK:
                    case RTM_NEWADDR:
                    case RTM_DELADDR:
                        relevant = true;
                        break;
                    default:
                        break;
                }
            }
        }

        if (!relevant) continue;

        {
            std::lock_guard lock(stats_mutex_);
            stats_.netlink_events++;
            stats_.probes++;
        }
        bool online = probe_interfaces();
        log_debug("Netlink event, interfaces %s", online ? "up" : "down");
        set_online(online);
    }
}

}  // namespace resync
