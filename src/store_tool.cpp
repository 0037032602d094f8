// resync-store: Standalone inspection tool for the resync durable store.
//
// Opens the store the daemon writes its queue and cache snapshots to and
// prints them. Never writes.
//
// Usage: resync-store --store-path <path> [--store-type sqlite|lmdb] <subcommand> [args]
//
// Subcommands:
//   keys                         List stored keys
//   get <key>                    Print the raw value for one key
//   queue                        Summarize the sync queue snapshot
//   cache                        Summarize the prefetch cache snapshot

#include "resync/durable_store.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>

#include <nlohmann/json.hpp>

namespace {

void format_timestamp(int64_t ts_ms, char* buf, size_t buf_size) {
    if (ts_ms <= 0) {
        snprintf(buf, buf_size, "-");
        return;
    }
    time_t t = static_cast<time_t>(ts_ms / 1000);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    strftime(buf, buf_size, "%Y-%m-%dT%H:%M:%SZ", &tm_val);
}

void print_usage() {
    fprintf(stderr,
        "Usage: resync-store --store-path <path> [options] <subcommand> [args]\n"
        "\n"
        "Subcommands:\n"
        "  keys                          List stored keys\n"
        "  get <key>                     Print the raw value for one key\n"
        "  queue                         Summarize the sync queue snapshot\n"
        "  cache                         Summarize the prefetch cache snapshot\n"
        "\n"
        "Options:\n"
        "  --store-type <type>           sqlite (default) or lmdb\n"
        "  --store-path <path>           Database file (sqlite) or environment dir (lmdb)\n"
        "  --lmdb-mapsize-mb <N>         LMDB map size (default: 64)\n"
        "  --queue-key <key>             Queue snapshot key (default: background_sync_queue)\n"
        "  --cache-key <key>             Cache snapshot key (default: prefetch_cache)\n"
        "  --help                        Show this help\n"
    );
}

// Returns false (after printing why) when the snapshot is missing or unreadable
bool load_snapshot(const resync::DurableStore& store, const std::string& key,
                   nlohmann::json& out) {
    auto raw = store.get(key);
    if (!raw) {
        fprintf(stderr, "No snapshot under key '%s'\n", key.c_str());
        return false;
    }
    out = nlohmann::json::parse(*raw, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        fprintf(stderr, "Snapshot under key '%s' is not valid JSON\n", key.c_str());
        return false;
    }
    return true;
}

int cmd_queue(const resync::DurableStore& store, const std::string& key) {
    nlohmann::json snap;
    if (!load_snapshot(store, key, snap)) return 1;

    auto items = snap.value("items", nlohmann::json::array());
    printf("%-32s %-16s %-9s %-7s %3s  %-20s  %s\n",
           "ID", "TYPE", "STATUS", "PRIO", "TRY", "NEXT ATTEMPT", "LAST ERROR");

    size_t pending = 0, failed = 0;
    for (const auto& item : items) {
        if (!item.is_object()) continue;
        auto status = item.value("status", std::string("?"));
        if (status == "pending" || status == "retrying") pending++;
        if (status == "failed") failed++;

        char next_buf[32];
        format_timestamp(item.value("next_attempt_at", int64_t{0}), next_buf, sizeof(next_buf));
        printf("%-32s %-16s %-9s %-7s %3" PRIu32 "  %-20s  %s\n",
               item.value("id", std::string("?")).c_str(),
               item.value("operation_type", std::string("?")).c_str(),
               status.c_str(),
               item.value("priority", std::string("normal")).c_str(),
               item.value("attempts", uint32_t{0}),
               next_buf,
               item.value("last_error", std::string()).c_str());
    }
    printf("\n%zu items, %zu pending, %zu failed\n", items.size(), pending, failed);
    return 0;
}

int cmd_cache(const resync::DurableStore& store, const std::string& key) {
    nlohmann::json snap;
    if (!load_snapshot(store, key, snap)) return 1;

    auto entries = snap.value("entries", nlohmann::json::array());
    printf("%-40s %-20s %10s\n", "KEY", "STORED AT", "BYTES");
    for (const auto& entry : entries) {
        if (!entry.is_object()) continue;
        char ts_buf[32];
        format_timestamp(entry.value("stored_at", int64_t{0}), ts_buf, sizeof(ts_buf));
        std::string value = entry.contains("value") ? entry["value"].dump() : "";
        printf("%-40s %-20s %10zu\n",
               entry.value("key", std::string("?")).c_str(), ts_buf, value.size());
    }
    printf("\n%zu entries\n", entries.size());
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    resync::StoreConfig store_config;
    std::string subcommand;
    std::string get_key;
    std::string queue_key = "background_sync_queue";
    std::string cache_key = "prefetch_cache";

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--store-type") {
            if (++i >= argc) { fprintf(stderr, "--store-type requires argument\n"); return 1; }
            store_config.type = argv[i];
        } else if (arg == "--store-path") {
            if (++i >= argc) { fprintf(stderr, "--store-path requires argument\n"); return 1; }
            store_config.path = argv[i];
        } else if (arg == "--lmdb-mapsize-mb") {
            if (++i >= argc) { fprintf(stderr, "--lmdb-mapsize-mb requires argument\n"); return 1; }
            store_config.params["mapsize_mb"] = argv[i];
        } else if (arg == "--queue-key") {
            if (++i >= argc) { fprintf(stderr, "--queue-key requires argument\n"); return 1; }
            queue_key = argv[i];
        } else if (arg == "--cache-key") {
            if (++i >= argc) { fprintf(stderr, "--cache-key requires argument\n"); return 1; }
            cache_key = argv[i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg[0] != '-' && subcommand.empty()) {
            subcommand = arg;
        } else if (subcommand == "get" && get_key.empty()) {
            get_key = arg;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage();
            return 1;
        }
    }

    if (subcommand.empty()) {
        print_usage();
        return 1;
    }
    if (store_config.type == "memory") {
        fprintf(stderr, "The memory store has nothing to inspect\n");
        return 1;
    }
    auto err = store_config.validate();
    if (!err.empty()) {
        fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }
    if (!std::filesystem::exists(store_config.path)) {
        fprintf(stderr, "Error: %s does not exist\n", store_config.path.c_str());
        return 1;
    }

    std::unique_ptr<resync::DurableStore> store;
    try {
        store = resync::DurableStore::create(store_config);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    if (subcommand == "keys") {
        for (const auto& key : store->keys()) {
            printf("%s\n", key.c_str());
        }
        return 0;
    }

    if (subcommand == "get") {
        if (get_key.empty()) {
            fprintf(stderr, "get requires a key\n");
            return 1;
        }
        auto value = store->get(get_key);
        if (!value) {
            fprintf(stderr, "Not found: %s\n", get_key.c_str());
            return 1;
        }
        auto parsed = nlohmann::json::parse(*value, nullptr, false);
        if (parsed.is_discarded()) {
            printf("%s\n", value->c_str());
        } else {
            printf("%s\n", parsed.dump(2).c_str());
        }
        return 0;
    }

    if (subcommand == "queue") return cmd_queue(*store, queue_key);
    if (subcommand == "cache") return cmd_cache(*store, cache_key);

    fprintf(stderr, "Unknown subcommand: %s\n", subcommand.c_str());
    print_usage();
    return 1;
}
