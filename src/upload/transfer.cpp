#include "ferry/upload/transfer.hpp"

#include "ferry/core/base64.hpp"
#include "ferry/upload/classifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <thread>
#include <vector>

namespace ferry::upload {

std::chrono::milliseconds RetryPolicy::delay_for_retry(unsigned retry) const {
    auto delay = base_delay;
    for (unsigned i = 1; i < retry && delay < max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

const char* to_string(TransferFailure::Kind kind) {
    switch (kind) {
        case TransferFailure::Kind::TooLarge: return "too_large";
        case TransferFailure::Kind::Unreadable: return "unreadable";
        case TransferFailure::Kind::Rejected: return "rejected";
        case TransferFailure::Kind::RetriesExhausted: return "retries_exhausted";
    }
    return "unknown";
}

TransferUnit::TransferUnit(api::FileUploadApi& api, TransferOptions options, Sleeper sleeper)
    : api_(api), options_(std::move(options)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

Result<std::string, TransferFailure> TransferUnit::read_encoded(const SourceFile& file) const {
    std::ifstream input(file.location, std::ios::binary);
    if (!input) {
        return Err<std::string>(TransferFailure{TransferFailure::Kind::Unreadable,
                                                "Failed to open " + file.location.string(), 0});
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(static_cast<std::size_t>(file.size));
    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        bytes.insert(bytes.end(), buffer, buffer + input.gcount());
    }
    if (input.bad()) {
        return Err<std::string>(TransferFailure{TransferFailure::Kind::Unreadable,
                                                "Failed to read " + file.location.string(), 0});
    }
    if (bytes.size() > options_.max_file_size) {
        // The file grew since it was selected
        return Err<std::string>(TransferFailure{TransferFailure::Kind::TooLarge,
                                                file.name + " exceeds the maximum upload size", 0});
    }
    return Ok<std::string, TransferFailure>(base64_encode(bytes));
}

Result<unsigned, TransferFailure> TransferUnit::upload(const SourceFile& file,
                                                       const std::string& job_id,
                                                       const std::string& relative_path) const {
    if (file.size > options_.max_file_size) {
        spdlog::warn("Skipping {}: {} exceeds the {} limit", file.identity_path(),
                     format_file_size(file.size), format_file_size(options_.max_file_size));
        return Err<unsigned>(TransferFailure{TransferFailure::Kind::TooLarge,
                                             file.name + " exceeds the maximum upload size", 0});
    }

    auto encoded = read_encoded(file);
    if (encoded.is_error()) {
        spdlog::error("Cannot upload {}: {}", file.identity_path(), encoded.error().message);
        return Err<unsigned>(encoded.error());
    }

    api::FileUploadRequest request;
    request.job_id = job_id;
    request.file_name = file.name;
    request.file_path = relative_path.empty() ? file.name : relative_path;
    request.content_base64 = std::move(encoded.value());
    request.content_type = file.mime_type.empty() ? mime_type_for(file.name) : file.mime_type;

    const unsigned max_attempts = options_.retry.max_retries + 1;
    std::string last_error;
    for (unsigned attempt = 1; attempt <= max_attempts; ++attempt) {
        auto result = api_.upload_file(request);
        if (result.is_ok()) {
            spdlog::debug("Uploaded {} (attempt {})", request.file_path, attempt);
            return Ok<unsigned, TransferFailure>(attempt);
        }

        const auto& failure = result.error();
        last_error = failure.describe();
        if (!failure.retryable()) {
            spdlog::error("Upload of {} rejected: {}", request.file_path, last_error);
            return Err<unsigned>(TransferFailure{TransferFailure::Kind::Rejected, last_error, attempt});
        }

        if (attempt < max_attempts) {
            const auto delay = options_.retry.delay_for_retry(attempt);
            spdlog::warn("Upload of {} failed ({}), retry {}/{} in {}ms", request.file_path, last_error,
                         attempt, options_.retry.max_retries, delay.count());
            sleeper_(delay);
        }
    }

    spdlog::error("Giving up on {} after {} attempts: {}", request.file_path, max_attempts, last_error);
    return Err<unsigned>(TransferFailure{TransferFailure::Kind::RetriesExhausted, last_error, max_attempts});
}

} // namespace ferry::upload
