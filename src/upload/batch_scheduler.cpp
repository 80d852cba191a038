#include "ferry/upload/batch_scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <future>

namespace ferry::upload {
namespace {

struct TransferOutcome {
    std::size_t position = 0;            // index into the pending list
    std::size_t finish_order = 0;        // completion sequence within the run
    Result<unsigned, TransferFailure> result;
};

} // namespace

BatchScheduler::BatchScheduler(const TransferUnit& unit, ConcurrencyPolicy concurrency, FailurePolicy failures)
    : unit_(unit), concurrency_(concurrency), failures_(failures) {}

Result<BatchReport> BatchScheduler::run(const std::string& job_id,
                                        const std::vector<PendingTransfer>& pending,
                                        const BatchCallbacks& callbacks) const {
    BatchReport report;
    report.concurrency = concurrency_.limit_for(pending.size());
    report.failure_threshold = failures_.threshold_for(pending.size());

    if (pending.empty()) {
        return Ok(std::move(report));
    }

    spdlog::info("Uploading {} files for job {} ({} at a time, abort after {} failures)",
                 pending.size(), job_id, report.concurrency, report.failure_threshold);

    std::atomic<std::size_t> finish_sequence{0};

    for (std::size_t start = 0; start < pending.size(); start += report.concurrency) {
        const std::size_t end = std::min(start + report.concurrency, pending.size());
        const std::size_t batch_index = report.batches_run;
        const std::size_t batch_size = end - start;
        const auto batch_started = std::chrono::steady_clock::now();

        if (callbacks.on_batch_started) {
            callbacks.on_batch_started(batch_index, batch_size);
        }

        std::vector<std::future<TransferOutcome>> in_flight;
        in_flight.reserve(batch_size);
        for (std::size_t i = start; i < end; ++i) {
            in_flight.push_back(std::async(std::launch::async, [this, &pending, &job_id, &finish_sequence, i]() {
                const auto& transfer = pending[i];
                auto result = unit_.upload(transfer.source, job_id, transfer.relative_path);
                return TransferOutcome{i, finish_sequence.fetch_add(1), std::move(result)};
            }));
        }

        // Settle the whole group before touching the checkpoint
        std::vector<TransferOutcome> outcomes;
        outcomes.reserve(batch_size);
        for (auto& future : in_flight) {
            outcomes.push_back(future.get());
        }
        std::sort(outcomes.begin(), outcomes.end(), [](const TransferOutcome& lhs, const TransferOutcome& rhs) {
            return lhs.finish_order < rhs.finish_order;
        });

        std::size_t succeeded = 0;
        std::size_t failed = 0;
        for (const auto& outcome : outcomes) {
            const auto& transfer = pending[outcome.position];
            if (outcome.result.is_ok()) {
                if (callbacks.on_file_uploaded) {
                    if (auto recorded = callbacks.on_file_uploaded(transfer, outcome.result.value());
                        recorded.is_error()) {
                        return Err<BatchReport>(recorded.error());
                    }
                }
                ++succeeded;
            } else {
                ++failed;
                report.failed_files.push_back(transfer.record_identity);
                if (callbacks.on_file_failed) {
                    callbacks.on_file_failed(transfer, outcome.result.error());
                }
            }
        }

        report.uploaded_count += succeeded;
        report.failed_count += failed;
        ++report.batches_run;

        if (callbacks.on_batch_completed) {
            callbacks.on_batch_completed(batch_index, batch_size, succeeded, failed,
                std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - batch_started));
        }

        if (report.failed_count >= report.failure_threshold) {
            report.aborted = true;
            spdlog::error("Job {}: {} files failed (threshold {}), not starting further batches",
                          job_id, report.failed_count, report.failure_threshold);
            break;
        }
    }

    return Ok(std::move(report));
}

} // namespace ferry::upload
