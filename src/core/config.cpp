#include "ferry/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace ferry {

using json = nlohmann::json;

namespace {

template<typename T>
bool read_number(const json& object, const char* key, T& out, std::string& error) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return true;
    }
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->template get<std::int64_t>() >= 0)) {
        error = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = it->template get<T>();
    return true;
}

bool read_string(const json& object, const char* key, std::string& out, std::string& error) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return true;
    }
    if (!it->is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_millis(const json& object, const char* key, std::chrono::milliseconds& out, std::string& error) {
    std::int64_t value = out.count();
    if (!read_number(object, key, value, error)) {
        return false;
    }
    out = std::chrono::milliseconds(value);
    return true;
}

} // namespace

Result<UploadConfig> UploadConfig::load(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<UploadConfig>("Cannot open config file: " + path.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    return from_json_text(contents.str());
}

Result<UploadConfig> UploadConfig::from_json_text(const std::string& text) {
    const json root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return Err<UploadConfig>(std::string("Config is not a JSON object"));
    }

    UploadConfig config;
    std::string error;
    std::string state_dir = config.state_directory.string();

    bool ok = read_string(root, "server_url", config.server_url, error) &&
              read_string(root, "state_directory", state_dir, error) &&
              read_string(root, "log_level", config.log_level, error) &&
              read_millis(root, "request_timeout_ms", config.request_timeout, error) &&
              read_number(root, "max_file_size", config.max_file_size, error) &&
              read_number(root, "max_retries", config.max_retries, error) &&
              read_millis(root, "base_delay_ms", config.base_delay, error) &&
              read_millis(root, "max_delay_ms", config.max_delay, error) &&
              read_number(root, "failure_percent", config.failure_percent, error) &&
              read_number(root, "failure_minimum", config.failure_minimum, error) &&
              read_string(root, "user_id", config.user_id, error) &&
              read_string(root, "email", config.email, error);

    if (ok) {
        if (const auto it = root.find("concurrency"); it != root.end()) {
            if (!it->is_object()) {
                error = "'concurrency' must be an object";
                ok = false;
            } else {
                ok = read_number(*it, "default", config.default_concurrency, error) &&
                     read_number(*it, "large_batch", config.large_batch_concurrency, error) &&
                     read_number(*it, "large_batch_threshold", config.large_batch_threshold, error);
            }
        }
    }

    if (ok) {
        if (const auto it = root.find("allowed_extensions"); it != root.end()) {
            if (!it->is_array()) {
                error = "'allowed_extensions' must be an array of strings";
                ok = false;
            } else {
                for (const auto& entry : *it) {
                    if (!entry.is_string()) {
                        error = "'allowed_extensions' must be an array of strings";
                        ok = false;
                        break;
                    }
                    config.allowed_extensions.push_back(entry.get<std::string>());
                }
            }
        }
    }

    if (!ok) {
        return Err<UploadConfig>("Invalid config: " + error);
    }

    config.state_directory = state_dir;
    if (auto valid = config.validate(); valid.is_error()) {
        return Err<UploadConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<void> UploadConfig::validate() const {
    if (server_url.empty()) {
        return Err<void>(std::string("server_url must not be empty"));
    }
    if (default_concurrency == 0 || large_batch_concurrency == 0) {
        return Err<void>(std::string("Concurrency limits must be at least 1"));
    }
    if (failure_percent > 100) {
        return Err<void>(std::string("failure_percent must be between 0 and 100"));
    }
    if (max_delay < base_delay) {
        return Err<void>(std::string("max_delay_ms must not be smaller than base_delay_ms"));
    }
    return Ok();
}

} // namespace ferry
