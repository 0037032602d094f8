#include "resync/config.hpp"
#include "resync/connectivity_monitor.hpp"
#include "resync/control_server.hpp"
#include "resync/directory_target.hpp"
#include "resync/durable_store.hpp"
#include "resync/log.hpp"
#include "resync/metrics.hpp"
#include "resync/prefetch_cache.hpp"
#include "resync/sync_queue.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);  // Parent exits

    if (setsid() < 0) return false;

    // Second fork to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    // Redirect stdin to /dev/null; stdout/stderr will be redirected
    // to log file after this function returns.
    close(STDIN_FILENO);
    open("/dev/null", O_RDONLY);  // stdin = fd 0

    return true;
}

void write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (ofs) {
        ofs << getpid() << "\n";
    }
}

void log_stats(const resync::SyncQueue& queue, const resync::PrefetchCache& cache,
               const resync::ConnectivityMonitor& monitor, const resync::DirectoryTarget& target) {
    auto st = queue.status();
    auto qs = queue.get_stats();
    auto cs = cache.get_stats();
    auto ts = target.get_stats();
    resync::log_info("[stats] %s | queue: %zu items, %zu pending, %zu failed | sync: %lu ok, %lu fail, "
                     "%lu retries | cache: %zu entries, %lu hit, %lu miss, %lu shared, %lu evicted | "
                     "target: %lu delivered, %lu fetched",
                     monitor.is_online() ? "online" : "offline",
                     st.queue_length, st.pending_count, st.failed_count,
                     qs.attempts_ok, qs.attempts_failed, qs.retries_scheduled,
                     cache.cache_size(), cs.hits, cs.misses, cs.shared,
                     cs.evicted_expired + cs.evicted_capacity,
                     ts.delivered, ts.fetched);
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = resync::ResyncConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Daemonize if requested (before log redirect so we fork first)
    if (config.daemonize) {
        if (!daemonize()) {
            std::cerr << "Failed to daemonize" << std::endl;
            return 1;
        }
    }

    // Redirect log output if log file specified (after daemonize)
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }

    resync::set_verbose(config.verbose);

    std::cout << "resync starting..." << std::endl;
    std::cout << "  state-dir: " << config.state_dir << std::endl;
    std::cout << "  target-dir: " << config.target_dir << std::endl;
    std::cout << "  store: " << config.store.type;
    if (!config.store.path.empty()) std::cout << " at " << config.store.path;
    std::cout << std::endl;
    for (auto& [k, v] : config.store.params) {
        std::cout << "  store-" << k << ": " << v << std::endl;
    }
    std::cout << "  connectivity: " << config.connectivity_mode << std::endl;
    if (config.queue.enabled) {
        std::cout << "  sync: batch " << config.queue.batch_size
                  << ", max-retries " << config.queue.max_retries
                  << ", retry-delay " << config.queue.retry_delay.count() << " ms"
                  << ", interval " << config.queue.online_interval.count() / 1000 << "s/"
                  << config.queue.offline_interval.count() / 1000 << "s" << std::endl;
    } else {
        std::cout << "  sync: disabled" << std::endl;
    }
    if (config.prefetch.enabled) {
        std::cout << "  prefetch: " << config.prefetch.max_entries << " entries, max-age "
                  << config.prefetch.max_age.count() / 1000 << "s" << std::endl;
    } else {
        std::cout << "  prefetch: disabled" << std::endl;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.state_dir, ec);
    if (ec) {
        std::cerr << "Failed to create state_dir: " << ec.message() << std::endl;
        return 1;
    }

    if (!config.pid_file.empty()) {
        std::filesystem::create_directories(
            std::filesystem::path(config.pid_file).parent_path(), ec);
        write_pid_file(config.pid_file);
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    std::unique_ptr<resync::DurableStore> store;
    try {
        store = resync::DurableStore::create(config.store);
    } catch (const std::exception& e) {
        std::cerr << "Failed to open store: " << e.what() << std::endl;
        return 1;
    }

    resync::ConnectivityMonitor monitor;
    if (config.connectivity_mode == "netlink") {
        try {
            monitor.start();
        } catch (const std::exception& e) {
            std::cerr << "Failed to start connectivity monitor: " << e.what() << std::endl;
            return 1;
        }
    }

    std::optional<resync::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics.emplace(config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
                        std::map<std::string, std::string>{});
    }

    resync::DirectoryTarget target(config.target_dir);
    resync::SyncQueue queue(config.queue, *store, &monitor);
    resync::PrefetchCache cache(config.prefetch, *store);

    queue.set_default_handler([&target, &metrics](const resync::SyncRequest& request) {
        std::optional<resync::ScopedTimer> timer;
        if (metrics) timer.emplace(metrics->execute_duration());
        return target.deliver(request);
    });

    err = queue.start();
    if (err.empty()) err = cache.start();
    if (!err.empty()) {
        std::cerr << "Failed to start: " << err << std::endl;
        return 1;
    }

    auto make_fetch = [&target, &metrics](const std::string& key) -> resync::FetchFn {
        return [&target, &metrics, key]() {
            std::optional<resync::ScopedTimer> timer;
            if (metrics) timer.emplace(metrics->fetch_duration());
            return target.fetch(key);
        };
    };

    resync::ControlServer control(config.control_socket, config.control_threads,
                                  queue, cache, monitor, make_fetch);
    err = control.start();
    if (!err.empty()) {
        std::cerr << err << std::endl;
        return 1;
    }

    if (metrics) {
        metrics->set_queue(&queue);
        metrics->set_cache(&cache);
        metrics->set_monitor(&monitor);
        metrics->start();
    }

    std::cout << "resync running (PID " << getpid() << ")" << std::endl;

    // Wait until shutdown signal, then stop outside signal context.
    auto next_stats = std::chrono::steady_clock::now() + std::chrono::seconds(config.stats_interval_secs);
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (config.stats_interval_secs > 0 && std::chrono::steady_clock::now() >= next_stats) {
            log_stats(queue, cache, monitor, target);
            next_stats = std::chrono::steady_clock::now() + std::chrono::seconds(config.stats_interval_secs);
        }
    }

    resync::log_info("Shutting down...");
    control.stop();
    if (metrics) metrics->stop();
    cache.stop();
    queue.stop();
    monitor.stop();

    // Remove PID file
    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    std::cout << "resync exited cleanly" << std::endl;
    return 0;
}
