#include "resync/util.hpp"

#include <chrono>
#include <random>

#include <nlohmann/json.hpp>

namespace resync {

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string generate_sync_id() {
    static constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 35);

    std::string id = "sync_" + std::to_string(now_epoch_ms()) + "_";
    for (int i = 0; i < 9; ++i) {
        id.push_back(kBase36[dist(rng)]);
    }
    return id;
}

bool is_valid_utf8(const std::string& s) {
    try {
        (void)nlohmann::json(s).dump();
        return true;
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
}

}  // namespace resync
