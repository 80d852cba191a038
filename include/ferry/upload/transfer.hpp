#pragma once

#include "ferry/api/job_api.hpp"
#include "ferry/core/result.hpp"
#include "ferry/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace ferry::upload {

/**
 * @brief Exponential backoff: base, 2*base, 4*base ... capped at max_delay
 */
struct RetryPolicy {
    unsigned max_retries = 3;   ///< Attempts after the first one
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{10000};

    /// Delay before retry number `retry` (1-based)
    std::chrono::milliseconds delay_for_retry(unsigned retry) const;
};

struct TransferOptions {
    RetryPolicy retry;
    std::uint64_t max_file_size = 100ULL * 1024 * 1024;
};

struct TransferFailure {
    enum class Kind {
        TooLarge,          ///< Over the size limit, never sent
        Unreadable,        ///< Local read failed, never sent
        Rejected,          ///< Server refused the request, not retried
        RetriesExhausted   ///< Every attempt hit a transient error
    };

    Kind kind = Kind::RetriesExhausted;
    std::string message;
    unsigned attempts = 0;
};

const char* to_string(TransferFailure::Kind kind);

/**
 * @brief Sends exactly one file, retrying transient failures
 *
 * Produces exactly one outcome per call: the number of attempts it took, or
 * a TransferFailure. The sleeper is injectable so tests don't wait out the
 * real backoff.
 */
class TransferUnit {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    TransferUnit(api::FileUploadApi& api, TransferOptions options, Sleeper sleeper = {});

    Result<unsigned, TransferFailure> upload(const SourceFile& file,
                                             const std::string& job_id,
                                             const std::string& relative_path) const;

    const TransferOptions& options() const noexcept { return options_; }

private:
    Result<std::string, TransferFailure> read_encoded(const SourceFile& file) const;

    api::FileUploadApi& api_;
    TransferOptions options_;
    Sleeper sleeper_;
};

} // namespace ferry::upload
