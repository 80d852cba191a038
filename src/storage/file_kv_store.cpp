#include "ferry/storage/file_kv_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace ferry::storage {
namespace fs = std::filesystem;

namespace {

constexpr const char* kRecordExtension = ".json";
constexpr const char* kTempExtension = ".tmp";

bool is_plain(unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '_' || c == '-';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

FileKeyValueStore::FileKeyValueStore(fs::path root) : root_(std::move(root)) {}

Result<void> FileKeyValueStore::open() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec && !fs::is_directory(root_)) {
        return Err<void>(std::string("Failed to create state directory: ") + root_.string() + ": " + ec.message());
    }
    spdlog::debug("Checkpoint directory: {}", root_.string());
    return Ok();
}

Result<std::optional<std::string>> FileKeyValueStore::get(const std::string& key) const {
    std::lock_guard lock(mutex_);

    const auto path = path_for(key);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Ok(std::optional<std::string>{});
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::optional<std::string>>(std::string("Failed to open record: ") + path.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    if (input.bad()) {
        return Err<std::optional<std::string>>(std::string("Failed to read record: ") + path.string());
    }
    return Ok(std::optional<std::string>{contents.str()});
}

Result<void> FileKeyValueStore::set(const std::string& key, const std::string& value) {
    if (key.empty()) {
        return Err<void>(std::string("Key must not be empty"));
    }

    std::lock_guard lock(mutex_);

    const auto path = path_for(key);
    auto temp_path = path;
    temp_path += kTempExtension;

    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(std::string("Failed to create temp record: ") + temp_path.string());
        }
        output.write(value.data(), static_cast<std::streamsize>(value.size()));
        output.flush();
        if (!output) {
            return Err<void>(std::string("Failed to write temp record: ") + temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(temp_path, cleanup);
        return Err<void>(std::string("Failed to replace record: ") + path.string() + ": " + ec.message());
    }
    return Ok();
}

Result<void> FileKeyValueStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec) {
        return Err<void>(std::string("Failed to remove record for ") + key + ": " + ec.message());
    }
    return Ok();
}

Result<std::vector<std::string>> FileKeyValueStore::list_keys(const std::string& prefix) const {
    std::lock_guard lock(mutex_);

    std::vector<std::string> keys;
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        return Ok(std::move(keys));
    }

    fs::directory_iterator it(root_, ec);
    if (ec) {
        return Err<std::vector<std::string>>(std::string("Failed to list ") + root_.string() + ": " + ec.message());
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Err<std::vector<std::string>>(std::string("Failed to list ") + root_.string() + ": " + ec.message());
        }
        const auto& path = it->path();
        if (path.extension() != kRecordExtension) {
            continue;
        }
        auto key = decode_key(path.stem().string());
        if (!key) {
            spdlog::warn("Ignoring foreign file in state directory: {}", path.filename().string());
            continue;
        }
        if (key->rfind(prefix, 0) == 0) {
            keys.push_back(std::move(*key));
        }
    }

    std::sort(keys.begin(), keys.end());
    return Ok(std::move(keys));
}

std::string FileKeyValueStore::encode_key(const std::string& key) {
    static const char* digits = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(key.size());
    for (char ch : key) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_plain(c)) {
            encoded += ch;
        } else {
            encoded += '%';
            encoded += digits[c >> 4];
            encoded += digits[c & 0x0F];
        }
    }
    return encoded;
}

std::optional<std::string> FileKeyValueStore::decode_key(const std::string& file_stem) {
    std::string key;
    key.reserve(file_stem.size());
    for (size_t i = 0; i < file_stem.size(); ++i) {
        if (file_stem[i] != '%') {
            key += file_stem[i];
            continue;
        }
        if (i + 2 >= file_stem.size()) {
            return std::nullopt;
        }
        const int high = hex_value(file_stem[i + 1]);
        const int low = hex_value(file_stem[i + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        key += static_cast<char>((high << 4) | low);
        i += 2;
    }
    return key;
}

fs::path FileKeyValueStore::path_for(const std::string& key) const {
    return root_ / (encode_key(key) + kRecordExtension);
}

} // namespace ferry::storage
