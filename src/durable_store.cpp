#include "resync/durable_store.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

namespace resync {

namespace {

class MemoryStore : public DurableStore {
public:
    std::string type_name() const override { return "memory"; }

    std::optional<std::string> get(const std::string& key) const override {
        std::lock_guard lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) return std::nullopt;
        return it->second;
    }

    void set(const std::string& key, const std::string& value) override {
        std::lock_guard lock(mutex_);
        data_[key] = value;
    }

    void remove(const std::string& key) override {
        std::lock_guard lock(mutex_);
        data_.erase(key);
    }

    std::vector<std::string> keys() const override {
        std::lock_guard lock(mutex_);
        std::vector<std::string> result;
        result.reserve(data_.size());
        for (auto& [k, v] : data_) result.push_back(k);
        std::sort(result.begin(), result.end());
        return result;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> data_;
};

}  // namespace

std::unique_ptr<DurableStore> DurableStore::create_memory() {
    return std::make_unique<MemoryStore>();
}

std::unique_ptr<DurableStore> DurableStore::create(const StoreConfig& config) {
    auto err = config.validate();
    if (!err.empty()) {
        throw std::runtime_error("Invalid store config: " + err);
    }

    if (config.type == "memory") {
        return create_memory();
    }
    if (config.type == "sqlite") {
        size_t max_value_bytes = 0;
        auto it = config.params.find("max_value_bytes");
        if (it != config.params.end()) {
            max_value_bytes = std::stoull(it->second);
        }
        return create_sqlite(config.path, max_value_bytes);
    }
    if (config.type == "lmdb") {
        size_t mapsize_mb = 64;
        auto it = config.params.find("mapsize_mb");
        if (it != config.params.end()) {
            mapsize_mb = std::stoull(it->second);
        }
        return create_lmdb(config.path, mapsize_mb);
    }

    throw std::runtime_error("Unknown store type: " + config.type);
}

}  // namespace resync
