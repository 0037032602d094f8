#include "resync/config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace resync {

// --- StoreConfig ---

std::string StoreConfig::validate() const {
    if (type.empty()) return "store type is required";
    if (type == "sqlite" || type == "lmdb") {
        if (path.empty()) return type + " store requires a path";
        if (type == "sqlite" && params.count("max_value_bytes")) {
            try {
                (void)std::stoull(params.at("max_value_bytes"));
            } catch (const std::exception&) {
                return "sqlite max_value_bytes is not a number: " + params.at("max_value_bytes");
            }
        }
        if (type == "lmdb" && params.count("mapsize_mb")) {
            try {
                if (std::stoull(params.at("mapsize_mb")) == 0) return "lmdb mapsize_mb must be > 0";
            } catch (const std::exception&) {
                return "lmdb mapsize_mb is not a number: " + params.at("mapsize_mb");
            }
        }
    } else if (type != "memory") {
        return "unknown store type: " + type;
    }
    return {};
}

// --- ResyncConfig ---

namespace {

std::chrono::milliseconds seconds_arg(const char* v) {
    return std::chrono::milliseconds(std::stoull(v) * 1000ULL);
}

void print_usage() {
    std::cerr <<
        "Usage: resync --state-dir <path> --target-dir <path> [options]\n"
        "\n"
        "Required:\n"
        "  --state-dir <path>               Directory for the durable store and control socket\n"
        "  --target-dir <path>              Delivery directory for queued operations\n"
        "\n"
        "Durable store:\n"
        "  --store-type <type>              sqlite, lmdb or memory (default: sqlite)\n"
        "  --store-path <path>              Store location (default: <state-dir>/resync.db or resync.lmdb)\n"
        "  --lmdb-mapsize-mb <N>            LMDB map size in MB (default: 64)\n"
        "\n"
        "Sync queue:\n"
        "  --no-sync                        Disable queue processing\n"
        "  --queue-key <key>                Snapshot key (default: background_sync_queue)\n"
        "  --batch-size <N>                 Items attempted per pass (default: 3)\n"
        "  --max-retries <N>                Retries before an item fails (default: 3)\n"
        "  --retry-delay-ms <N>             Base backoff delay (default: 5000)\n"
        "  --retry-jitter <F>               Backoff jitter fraction (default: 0.2)\n"
        "  --sync-interval <secs>           Pass interval while online (default: 30)\n"
        "  --offline-interval <secs>        Pass interval while offline (default: 60)\n"
        "  --execute-threads <N>            Concurrent executions (default: batch size)\n"
        "  --connectivity <mode>            netlink or manual (default: netlink)\n"
        "\n"
        "Prefetch cache:\n"
        "  --no-prefetch                    Disable prefetching\n"
        "  --cache-key <key>                Snapshot key (default: prefetch_cache)\n"
        "  --cache-max-age <secs>           Entry freshness (default: 300)\n"
        "  --cache-max-entries <N>          Capacity (default: 50)\n"
        "  --cache-sweep-interval <secs>    Expiry sweep interval (default: 60)\n"
        "  --fetch-threads <N>              Concurrent fetches (default: 4)\n"
        "\n"
        "Daemon:\n"
        "  --config <path>                  JSON config file\n"
        "  --control-socket <path>          Control socket (default: <state-dir>/control.sock)\n"
        "  --daemon                         Run as daemon\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path\n"
        "  --log-file <path>                Log file path\n"
        "  --stats-interval <secs>          Stats reporting interval (default: 60)\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<ResyncConfig> ResyncConfig::from_args(int argc, char* argv[]) {
    ResyncConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--state-dir") {
                auto* v = next_arg(i, "--state-dir");
                if (!v) return std::nullopt;
                config.state_dir = v;
            } else if (arg == "--target-dir") {
                auto* v = next_arg(i, "--target-dir");
                if (!v) return std::nullopt;
                config.target_dir = v;
            } else if (arg == "--store-type") {
                auto* v = next_arg(i, "--store-type");
                if (!v) return std::nullopt;
                config.store.type = v;
            } else if (arg == "--store-path") {
                auto* v = next_arg(i, "--store-path");
                if (!v) return std::nullopt;
                config.store.path = v;
            } else if (arg == "--lmdb-mapsize-mb") {
                auto* v = next_arg(i, "--lmdb-mapsize-mb");
                if (!v) return std::nullopt;
                config.store.params["mapsize_mb"] = v;
            } else if (arg == "--no-sync") {
                config.queue.enabled = false;
            } else if (arg == "--queue-key") {
                auto* v = next_arg(i, "--queue-key");
                if (!v) return std::nullopt;
                config.queue.queue_key = v;
            } else if (arg == "--batch-size") {
                auto* v = next_arg(i, "--batch-size");
                if (!v) return std::nullopt;
                config.queue.batch_size = std::stoull(v);
            } else if (arg == "--max-retries") {
                auto* v = next_arg(i, "--max-retries");
                if (!v) return std::nullopt;
                config.queue.max_retries = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--retry-delay-ms") {
                auto* v = next_arg(i, "--retry-delay-ms");
                if (!v) return std::nullopt;
                config.queue.retry_delay = std::chrono::milliseconds(std::stoull(v));
            } else if (arg == "--retry-jitter") {
                auto* v = next_arg(i, "--retry-jitter");
                if (!v) return std::nullopt;
                config.queue.retry_jitter = std::stod(v);
            } else if (arg == "--sync-interval") {
                auto* v = next_arg(i, "--sync-interval");
                if (!v) return std::nullopt;
                config.queue.online_interval = seconds_arg(v);
            } else if (arg == "--offline-interval") {
                auto* v = next_arg(i, "--offline-interval");
                if (!v) return std::nullopt;
                config.queue.offline_interval = seconds_arg(v);
            } else if (arg == "--execute-threads") {
                auto* v = next_arg(i, "--execute-threads");
                if (!v) return std::nullopt;
                config.queue.execute_threads = std::stoull(v);
            } else if (arg == "--connectivity") {
                auto* v = next_arg(i, "--connectivity");
                if (!v) return std::nullopt;
                config.connectivity_mode = v;
            } else if (arg == "--no-prefetch") {
                config.prefetch.enabled = false;
            } else if (arg == "--cache-key") {
                auto* v = next_arg(i, "--cache-key");
                if (!v) return std::nullopt;
                config.prefetch.cache_key = v;
            } else if (arg == "--cache-max-age") {
                auto* v = next_arg(i, "--cache-max-age");
                if (!v) return std::nullopt;
                config.prefetch.max_age = seconds_arg(v);
            } else if (arg == "--cache-max-entries") {
                auto* v = next_arg(i, "--cache-max-entries");
                if (!v) return std::nullopt;
                config.prefetch.max_entries = std::stoull(v);
            } else if (arg == "--cache-sweep-interval") {
                auto* v = next_arg(i, "--cache-sweep-interval");
                if (!v) return std::nullopt;
                config.prefetch.sweep_interval = seconds_arg(v);
            } else if (arg == "--fetch-threads") {
                auto* v = next_arg(i, "--fetch-threads");
                if (!v) return std::nullopt;
                config.prefetch.fetch_threads = std::stoull(v);
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--control-socket") {
                auto* v = next_arg(i, "--control-socket");
                if (!v) return std::nullopt;
                config.control_socket = v;
            } else if (arg == "--daemon") {
                config.daemonize = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--pid-file") {
                auto* v = next_arg(i, "--pid-file");
                if (!v) return std::nullopt;
                config.pid_file = v;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--stats-interval") {
                auto* v = next_arg(i, "--stats-interval");
                if (!v) return std::nullopt;
                config.stats_interval_secs = std::stoull(v);
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool ResyncConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("target_dir")) target_dir = j["target_dir"].get<std::string>();
        if (j.contains("connectivity")) connectivity_mode = j["connectivity"].get<std::string>();
        if (j.contains("control_socket")) control_socket = j["control_socket"].get<std::string>();
        if (j.contains("control_threads")) control_threads = j["control_threads"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("stats_interval")) stats_interval_secs = j["stats_interval"].get<size_t>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("pid_file")) pid_file = j["pid_file"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();

        // Durable store: "type", "path", everything else is a backend param
        if (j.contains("store") && j["store"].is_object()) {
            auto& js = j["store"];
            for (auto& [key, val] : js.items()) {
                if (key == "type") {
                    store.type = val.get<std::string>();
                } else if (key == "path") {
                    store.path = val.get<std::string>();
                } else if (val.is_string()) {
                    store.params[key] = val.get<std::string>();
                } else {
                    store.params[key] = val.dump();
                }
            }
        }

        if (j.contains("queue") && j["queue"].is_object()) {
            auto& jq = j["queue"];
            if (jq.contains("enabled")) queue.enabled = jq["enabled"].get<bool>();
            if (jq.contains("queue_key")) queue.queue_key = jq["queue_key"].get<std::string>();
            if (jq.contains("batch_size")) queue.batch_size = jq["batch_size"].get<size_t>();
            if (jq.contains("max_retries")) queue.max_retries = jq["max_retries"].get<uint32_t>();
            if (jq.contains("retry_delay_ms"))
                queue.retry_delay = std::chrono::milliseconds(jq["retry_delay_ms"].get<int64_t>());
            if (jq.contains("retry_jitter")) queue.retry_jitter = jq["retry_jitter"].get<double>();
            if (jq.contains("sync_interval"))
                queue.online_interval = std::chrono::seconds(jq["sync_interval"].get<int64_t>());
            if (jq.contains("offline_interval"))
                queue.offline_interval = std::chrono::seconds(jq["offline_interval"].get<int64_t>());
            if (jq.contains("execute_threads")) queue.execute_threads = jq["execute_threads"].get<size_t>();
        }

        if (j.contains("prefetch") && j["prefetch"].is_object()) {
            auto& jp = j["prefetch"];
            if (jp.contains("enabled")) prefetch.enabled = jp["enabled"].get<bool>();
            if (jp.contains("cache_key")) prefetch.cache_key = jp["cache_key"].get<std::string>();
            if (jp.contains("max_age"))
                prefetch.max_age = std::chrono::seconds(jp["max_age"].get<int64_t>());
            if (jp.contains("max_entries")) prefetch.max_entries = jp["max_entries"].get<size_t>();
            if (jp.contains("sweep_interval"))
                prefetch.sweep_interval = std::chrono::seconds(jp["sweep_interval"].get<int64_t>());
            if (jp.contains("fetch_threads")) prefetch.fetch_threads = jp["fetch_threads"].get<size_t>();
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ResyncConfig::apply_defaults() {
    if (state_dir.empty()) return;

    if (store.path.empty()) {
        if (store.type == "sqlite") store.path = state_dir / "resync.db";
        else if (store.type == "lmdb") store.path = state_dir / "resync.lmdb";
    }
    if (control_socket.empty()) {
        control_socket = state_dir / "control.sock";
    }
}

std::string ResyncConfig::validate() const {
    if (state_dir.empty()) return "state_dir is required (--state-dir)";
    if (target_dir.empty()) return "target_dir is required (--target-dir)";
    auto err = store.validate();
    if (!err.empty()) return "store: " + err;
    if (connectivity_mode != "netlink" && connectivity_mode != "manual")
        return "unknown connectivity mode: " + connectivity_mode;
    if (queue.batch_size == 0) return "batch_size must be > 0";
    if (queue.retry_jitter < 0.0 || queue.retry_jitter >= 1.0) return "retry_jitter must be in [0, 1)";
    if (queue.online_interval.count() <= 0 || queue.offline_interval.count() <= 0)
        return "sync intervals must be > 0";
    if (prefetch.max_entries == 0) return "cache max_entries must be > 0";
    if (prefetch.max_age.count() <= 0) return "cache max_age must be > 0";
    if (prefetch.sweep_interval.count() <= 0) return "cache sweep_interval must be > 0";
    if (prefetch.fetch_threads == 0) return "fetch_threads must be > 0";
    return {};
}

}  // namespace resync
