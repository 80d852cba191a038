#pragma once

/**
 * @file memory_kv_store.hpp
 * @brief In-memory KeyValueStore
 *
 * WHY THIS FILE EXISTS:
 * Tests and dry runs need a checkpoint backend that never touches disk.
 *
 * THREAD SAFETY PATTERN:
 * - Readers (get, list_keys) take a shared_lock
 * - Writers (set, remove) take a unique_lock
 */

#include "ferry/storage/kv_store.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace ferry::storage {

class MemoryKeyValueStore : public KeyValueStore {
public:
    MemoryKeyValueStore() = default;

    Result<std::optional<std::string>> get(const std::string& key) const override;
    Result<void> set(const std::string& key, const std::string& value) override;
    Result<void> remove(const std::string& key) override;
    Result<std::vector<std::string>> list_keys(const std::string& prefix) const override;

    size_t size() const;

    /// Number of set() calls so far; lets tests count checkpoint writes
    size_t write_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
    size_t writes_ = 0;
};

} // namespace ferry::storage
