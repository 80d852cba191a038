#pragma once

#include "ferry/core/result.hpp"
#include "ferry/upload/transfer.hpp"
#include "ferry/upload/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace ferry::upload {

/**
 * @brief One file waiting to be sent
 */
struct PendingTransfer {
    SourceFile source;
    std::string record_identity;   ///< Checkpoint identity to mark complete
    std::string relative_path;     ///< Path sent to the upload endpoint
};

struct ConcurrencyPolicy {
    std::size_t default_limit = 5;
    std::size_t large_batch_limit = 3;
    std::size_t large_batch_threshold = 100;

    /// Large jobs get fewer parallel transfers to spare the server
    std::size_t limit_for(std::size_t pending) const noexcept {
        const std::size_t limit = pending > large_batch_threshold ? large_batch_limit : default_limit;
        return limit == 0 ? 1 : limit;
    }
};

struct FailurePolicy {
    unsigned percent = 5;
    std::size_t minimum = 5;

    /// max(minimum, ceil(percent% of pending)), in integer arithmetic
    std::size_t threshold_for(std::size_t pending) const noexcept {
        const std::size_t proportional = (pending * percent + 99) / 100;
        return proportional > minimum ? proportional : minimum;
    }
};

struct BatchReport {
    std::size_t uploaded_count = 0;
    std::size_t failed_count = 0;
    std::size_t batches_run = 0;
    std::size_t concurrency = 0;
    std::size_t failure_threshold = 0;
    bool aborted = false;   ///< Threshold reached; later groups were not started
    std::vector<std::string> failed_files;

    bool all_successful() const noexcept { return failed_count == 0 && !aborted; }
};

/**
 * @brief Hooks the scheduler calls on the controlling thread
 *
 * on_file_uploaded runs once per success, serially, after the group that
 * contained it has settled. An error from it stops the run: a success that
 * cannot be recorded must not be reported as done.
 */
struct BatchCallbacks {
    std::function<void(std::size_t batch_index, std::size_t batch_size)> on_batch_started;
    std::function<Result<void>(const PendingTransfer& transfer, unsigned attempts)> on_file_uploaded;
    std::function<void(const PendingTransfer& transfer, const TransferFailure& failure)> on_file_failed;
    std::function<void(std::size_t batch_index, std::size_t batch_size, std::size_t succeeded,
                       std::size_t failed, std::chrono::milliseconds duration)> on_batch_completed;
};

/**
 * @brief Runs pending transfers in fixed-size concurrent groups
 *
 * Group n+1 starts only after every transfer of group n has returned, so at
 * most `limit` transfers are ever in flight. After each group the failure
 * count is compared with the threshold; reaching it stops scheduling while
 * letting the current group finish.
 */
class BatchScheduler {
public:
    BatchScheduler(const TransferUnit& unit, ConcurrencyPolicy concurrency = {}, FailurePolicy failures = {});

    Result<BatchReport> run(const std::string& job_id,
                            const std::vector<PendingTransfer>& pending,
                            const BatchCallbacks& callbacks = {}) const;

    const ConcurrencyPolicy& concurrency() const noexcept { return concurrency_; }
    const FailurePolicy& failures() const noexcept { return failures_; }

private:
    const TransferUnit& unit_;
    ConcurrencyPolicy concurrency_;
    FailurePolicy failures_;
};

} // namespace ferry::upload
