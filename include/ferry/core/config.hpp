#pragma once

#include "ferry/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ferry {

/**
 * @brief Runtime settings for the upload client
 *
 * Every field has a working default. A JSON file may override any subset
 * of them; unknown keys are ignored so older binaries accept newer files.
 *
 * EXAMPLE FILE:
 * {
 *   "server_url": "http://uploads.internal:3000",
 *   "state_directory": "/var/lib/ferry",
 *   "log_level": "debug",
 *   "concurrency": { "default": 5, "large_batch": 3, "large_batch_threshold": 100 }
 * }
 */
struct UploadConfig {
    std::string server_url = "http://localhost:3000";
    std::filesystem::path state_directory = ".ferry";
    std::string log_level = "info";
    std::chrono::milliseconds request_timeout{30000};

    // Transfer unit
    std::uint64_t max_file_size = 100ULL * 1024 * 1024;
    unsigned max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{10000};

    // Batch scheduler
    std::size_t default_concurrency = 5;
    std::size_t large_batch_concurrency = 3;
    std::size_t large_batch_threshold = 100;
    unsigned failure_percent = 5;
    std::size_t failure_minimum = 5;

    std::vector<std::string> allowed_extensions;   ///< Empty means the built-in image list

    // Identity attached to submitted jobs
    std::string user_id;
    std::string email;

    static Result<UploadConfig> load(const std::filesystem::path& path);
    static Result<UploadConfig> from_json_text(const std::string& text);

    Result<void> validate() const;
};

} // namespace ferry
