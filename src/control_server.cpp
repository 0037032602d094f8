#include "resync/control_server.hpp"
#include "resync/connectivity_monitor.hpp"
#include "resync/log.hpp"
#include "resync/prefetch_cache.hpp"
#include "resync/sync_queue.hpp"
#include "resync/util.hpp"
#include "meridian/core/thread_pool.hpp"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

namespace resync {

namespace {

// Requests larger than this are rejected (ENQUEUE payloads included)
constexpr size_t MAX_REQUEST_BYTES = 1024 * 1024;

// Split "VERB rest" at the first space
std::pair<std::string, std::string> split_command(const std::string& line) {
    auto sp = line.find(' ');
    if (sp == std::string::npos) return {line, {}};
    return {line.substr(0, sp), line.substr(sp + 1)};
}

nlohmann::json status_json(const SyncQueue& queue, const PrefetchCache& cache,
                           const ConnectivityMonitor& monitor) {
    auto s = queue.status();
    nlohmann::json j = {
        {"queue_length", s.queue_length},
        {"pending", s.pending_count},
        {"failed", s.failed_count},
        {"syncing", s.is_syncing},
        {"online", monitor.is_online()},
        {"cache_entries", cache.cache_size()},
        {"prefetching", cache.is_prefetching()},
    };
    if (s.last_sync_time) j["last_sync_time"] = *s.last_sync_time;
    else j["last_sync_time"] = nullptr;
    return j;
}

nlohmann::json items_json(const std::vector<SyncItemView>& items) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& v : items) {
        nlohmann::json ji = {
            {"id", v.id},
            {"operation_type", v.operation_type},
            {"status", to_string(v.status)},
            {"priority", to_string(v.priority)},
            {"attempts", v.attempts},
            {"next_attempt_at", v.next_attempt_at},
            {"bound", v.bound},
        };
        if (!v.last_error.empty()) ji["last_error"] = v.last_error;
        arr.push_back(std::move(ji));
    }
    return arr;
}

}  // namespace

ControlServer::ControlServer(const std::filesystem::path& socket_path, size_t threads,
                             SyncQueue& queue, PrefetchCache& cache,
                             ConnectivityMonitor& monitor, FetchFactory make_fetch)
    : socket_path_(socket_path)
    , threads_(threads)
    , queue_(queue)
    , cache_(cache)
    , monitor_(monitor)
    , make_fetch_(std::move(make_fetch)) {}

ControlServer::~ControlServer() {
    stop();
}

std::string ControlServer::start() {
    if (running_.load()) return {};

    struct sockaddr_un addr;
    if (socket_path_.native().size() >= sizeof(addr.sun_path)) {
        return "control socket path too long: " + socket_path_.string();
    }

    std::error_code ec;
    if (socket_path_.has_parent_path()) {
        std::filesystem::create_directories(socket_path_.parent_path(), ec);
    }

    // Remove stale socket
    unlink(socket_path_.c_str());

    sock_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock_fd_ < 0) {
        return "Failed to create control socket: " + std::string(strerror(errno));
    }

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(sock_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = "Failed to bind control socket: " + std::string(strerror(errno));
        close(sock_fd_);
        sock_fd_ = -1;
        return err;
    }

    if (listen(sock_fd_, 64) < 0) {
        std::string err = "Failed to listen on control socket: " + std::string(strerror(errno));
        close(sock_fd_);
        sock_fd_ = -1;
        unlink(socket_path_.c_str());
        return err;
    }

    chmod(socket_path_.c_str(), 0660);

    pool_ = std::make_unique<meridian::ThreadPool>(threads_);
    running_ = true;
    server_thread_ = std::thread(&ControlServer::server_loop, this);

    log_info("Control server listening on %s", socket_path_.c_str());
    return {};
}

void ControlServer::stop() {
    if (!running_.exchange(false)) return;

    // Unblock accept()
    if (sock_fd_ >= 0) {
        shutdown(sock_fd_, SHUT_RDWR);
    }
    if (server_thread_.joinable()) server_thread_.join();

    if (sock_fd_ >= 0) {
        close(sock_fd_);
        sock_fd_ = -1;
    }
    unlink(socket_path_.c_str());

    if (pool_) pool_->shutdown(true);
    log_info("Control server stopped");
}

ControlServer::Stats ControlServer::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

void ControlServer::server_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        int client_fd = accept4(sock_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            if (!running_.load()) break;
            log_error("Control accept failed: %s", strerror(errno));
            std::lock_guard lock(stats_mutex_);
            stats_.errors++;
            continue;
        }

        // Set read timeout
        struct timeval tv;
        tv.tv_sec = 30;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        pool_->execute([this, client_fd]() { handle_client(client_fd); });
    }
}

void ControlServer::handle_client(int client_fd) {
    std::string request;
    char buf[4096];
    while (request.find('\n') == std::string::npos && request.size() < MAX_REQUEST_BYTES) {
        ssize_t n = read(client_fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        request.append(buf, static_cast<size_t>(n));
    }

    if (request.empty()) {
        close(client_fd);
        return;
    }

    auto nl = request.find('\n');
    if (nl != std::string::npos) request.resize(nl);
    while (!request.empty() && request.back() == '\r') request.pop_back();

    std::string response = handle_request(request) + "\n";

    const char* p = response.data();
    size_t left = response.size();
    while (left > 0) {
        ssize_t n = write(client_fd, p, left);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        p += n;
        left -= static_cast<size_t>(n);
    }
    close(client_fd);
}

std::string ControlServer::handle_request(const std::string& line) {
    {
        std::lock_guard lock(stats_mutex_);
        stats_.requests++;
    }

    auto [verb, arg] = split_command(line);
    std::string response;

    try {
        if (verb == "STATUS") {
            response = "OK " + status_json(queue_, cache_, monitor_).dump();
        } else if (verb == "SYNC") {
            queue_.sync_now();
            response = "OK " + status_json(queue_, cache_, monitor_).dump();
        } else if (verb == "ENQUEUE") {
            auto [type, body] = split_command(arg);
            if (type.empty() || body.empty()) {
                response = "ERROR usage: ENQUEUE <type> <json>";
            } else if (!is_valid_utf8(type)) {
                response = "ERROR operation type is not valid UTF-8";
            } else {
                auto payload = nlohmann::json::parse(body, nullptr, false);
                if (payload.is_discarded()) {
                    response = "ERROR invalid JSON payload";
                } else {
                    auto ticket = queue_.add_to_sync_queue(type, payload);
                    response = "OK " + ticket.id;
                }
            }
        } else if (verb == "REMOVE") {
            response = queue_.remove_from_sync_queue(arg) ? "OK" : "NOTFOUND";
        } else if (verb == "RETRY") {
            response = queue_.retry_failed(arg) ? "OK" : "NOTFOUND";
        } else if (verb == "CLEAR") {
            queue_.clear_sync_queue();
            response = "OK";
        } else if (verb == "CLEAR-FAILED") {
            response = "OK " + std::to_string(queue_.clear_failed());
        } else if (verb == "ITEMS") {
            response = "OK " + items_json(queue_.items()).dump();
        } else if (verb == "ONLINE") {
            monitor_.set_online(true);
            response = "OK";
        } else if (verb == "OFFLINE") {
            monitor_.set_online(false);
            response = "OK";
        } else if (verb == "GET") {
            auto value = cache_.get_cached_data(arg);
            response = value ? "OK " + value->dump() : "MISS";
        } else if (verb == "PREFETCH") {
            if (arg.empty()) {
                response = "ERROR usage: PREFETCH <key>";
            } else {
                auto value = cache_.prefetch(arg, make_fetch_(arg)).get();
                response = value ? "OK " + value->dump() : "MISS";
            }
        } else if (verb == "INVALIDATE") {
            response = cache_.invalidate_cache(arg) ? "OK" : "NOTFOUND";
        } else if (verb == "CACHE-CLEAR") {
            cache_.clear_cache();
            response = "OK";
        } else {
            response = "ERROR unknown command";
        }
    } catch (const std::exception& e) {
        response = std::string("ERROR ") + e.what();
    }

    if (response.compare(0, 5, "ERROR") == 0) {
        std::lock_guard lock(stats_mutex_);
        stats_.errors++;
    }
    return response;
}

}  // namespace resync
