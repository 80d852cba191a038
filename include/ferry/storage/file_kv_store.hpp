#pragma once

#include "ferry/storage/kv_store.hpp"

#include <filesystem>
#include <mutex>

namespace ferry::storage {

/**
 * @brief Directory-backed KeyValueStore, one file per key
 *
 * Key "upload_job_42" lives in "<root>/upload_job_42.json". Characters
 * outside [A-Za-z0-9._-] are percent-encoded in the file name. Writes go to
 * a ".tmp" sibling first and are renamed over the target, so a crash leaves
 * either the old or the new record on disk.
 */
class FileKeyValueStore : public KeyValueStore {
public:
    explicit FileKeyValueStore(std::filesystem::path root);

    /// Creates the root directory if needed
    Result<void> open();

    Result<std::optional<std::string>> get(const std::string& key) const override;
    Result<void> set(const std::string& key, const std::string& value) override;
    Result<void> remove(const std::string& key) override;
    Result<std::vector<std::string>> list_keys(const std::string& prefix) const override;

    const std::filesystem::path& root() const noexcept { return root_; }

    static std::string encode_key(const std::string& key);
    static std::optional<std::string> decode_key(const std::string& file_stem);

private:
    std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

} // namespace ferry::storage
