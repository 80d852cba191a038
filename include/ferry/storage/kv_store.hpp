#pragma once

#include "ferry/core/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ferry::storage {

/**
 * @brief Minimal keyed string store the checkpoint layer is written against
 *
 * Values are opaque strings (the checkpoint store puts JSON in them).
 * Implementations must make set() atomic per key: a reader sees either the
 * previous value or the new one, never a torn write.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /// nullopt when the key is absent; Err only for I/O failures
    virtual Result<std::optional<std::string>> get(const std::string& key) const = 0;

    virtual Result<void> set(const std::string& key, const std::string& value) = 0;

    /// Removing an absent key is not an error
    virtual Result<void> remove(const std::string& key) = 0;

    virtual Result<std::vector<std::string>> list_keys(const std::string& prefix) const = 0;
};

} // namespace ferry::storage
