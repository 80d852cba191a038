#include "ferry/storage/memory_kv_store.hpp"

#include <algorithm>
#include <mutex>

namespace ferry::storage {

Result<std::optional<std::string>> MemoryKeyValueStore::get(const std::string& key) const {
    std::shared_lock lock(mutex_);
    const auto it = values_.find(key);
    if (it == values_.end()) {
        return Ok(std::optional<std::string>{});
    }
    return Ok(std::optional<std::string>{it->second});
}

Result<void> MemoryKeyValueStore::set(const std::string& key, const std::string& value) {
    if (key.empty()) {
        return Err<void>(std::string("Key must not be empty"));
    }
    std::unique_lock lock(mutex_);
    values_[key] = value;
    ++writes_;
    return Ok();
}

Result<void> MemoryKeyValueStore::remove(const std::string& key) {
    std::unique_lock lock(mutex_);
    values_.erase(key);
    return Ok();
}

Result<std::vector<std::string>> MemoryKeyValueStore::list_keys(const std::string& prefix) const {
    std::shared_lock lock(mutex_);

    std::vector<std::string> keys;
    for (const auto& [key, value] : values_) {
        if (key.rfind(prefix, 0) == 0) {
            keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return Ok(std::move(keys));
}

size_t MemoryKeyValueStore::size() const {
    std::shared_lock lock(mutex_);
    return values_.size();
}

size_t MemoryKeyValueStore::write_count() const {
    std::shared_lock lock(mutex_);
    return writes_;
}

} // namespace ferry::storage
