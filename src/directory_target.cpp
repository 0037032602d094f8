#include "resync/directory_target.hpp"
#include "resync/log.hpp"
#include "resync/util.hpp"

#include <fstream>

namespace resync {

namespace {

// A single path component: no separators, no "." or ".."
bool valid_component(const std::string& s) {
    return !s.empty() && s != "." && s != ".." && s.find('/') == std::string::npos &&
           s.find('\0') == std::string::npos;
}

// Relative path of plain components ("essays/42" is fine, "../x" and "/x" are not)
bool valid_key(const std::string& key) {
    if (key.empty() || key.front() == '/') return false;
    std::string::size_type start = 0;
    while (start <= key.size()) {
        auto end = key.find('/', start);
        if (end == std::string::npos) end = key.size();
        if (!valid_component(key.substr(start, end - start))) return false;
        start = end + 1;
    }
    return true;
}

}  // namespace

DirectoryTarget::DirectoryTarget(const std::filesystem::path& root) : root_(root) {}

SyncResult DirectoryTarget::deliver(const SyncRequest& request) {
    SyncResult result;

    auto fail = [&](const std::string& msg) {
        result.success = false;
        result.error_message = msg;
        std::lock_guard lock(stats_mutex_);
        stats_.deliver_failed++;
        return result;
    };

    if (!valid_component(request.operation_type)) {
        return fail("invalid operation type: " + request.operation_type);
    }
    if (!valid_component(request.id)) {
        return fail("invalid item id: " + request.id);
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return fail("target unavailable: " + root_.string());
    }

    auto dir = root_ / request.operation_type;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return fail("cannot create " + dir.string() + ": " + ec.message());
    }

    nlohmann::json doc = {
        {"id", request.id},
        {"operation_type", request.operation_type},
        {"attempt", request.attempt},
        {"delivered_at", now_epoch_ms()},
        {"payload", request.payload},
    };

    std::string body;
    try {
        body = doc.dump(2);
    } catch (const nlohmann::json::exception& e) {
        return fail(std::string("cannot serialize payload: ") + e.what());
    }

    auto final_path = dir / (request.id + ".json");
    auto tmp_path = final_path;
    tmp_path += ".tmp";

    {
        std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return fail("cannot create " + tmp_path.string());
        }
        ofs << body << "\n";
        ofs.close();
        if (!ofs.good()) {
            std::filesystem::remove(tmp_path, ec);
            return fail("write failed: " + tmp_path.string());
        }
    }

    std::filesystem::rename(tmp_path, final_path, ec);
    if (ec) {
        std::error_code ignore;
        std::filesystem::remove(tmp_path, ignore);
        return fail("rename failed: " + ec.message());
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.delivered++;
    }
    log_debug("Delivered %s to %s", request.id.c_str(), final_path.c_str());

    result.success = true;
    result.value = {{"path", final_path.string()}};
    return result;
}

FetchResult DirectoryTarget::fetch(const std::string& key) {
    FetchResult result;

    auto fail = [&](const std::string& msg) {
        result.success = false;
        result.error_message = msg;
        std::lock_guard lock(stats_mutex_);
        stats_.fetch_failed++;
        return result;
    };

    if (!valid_key(key)) {
        return fail("invalid key: " + key);
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return fail("target unavailable: " + root_.string());
    }

    auto path = root_ / (key + ".json");
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return fail("not found: " + key);
    }

    auto j = nlohmann::json::parse(ifs, nullptr, false);
    if (j.is_discarded()) {
        return fail("malformed JSON in " + path.string());
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.fetched++;
    }
    result.success = true;
    result.value = std::move(j);
    return result;
}

DirectoryTarget::Stats DirectoryTarget::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

}  // namespace resync
