/**
 * @file components.hpp
 * @brief Ready-made subscribers for upload events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "ferry/events/event_bus.hpp"
#include "ferry/events/events.hpp"
#include "ferry/upload/classifier.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace ferry::events {

/**
 * @brief Logs every upload event with spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<JobStateChangedEvent>([this](const JobStateChangedEvent& e) {
            on_state_changed(e);
        });

        bus_.subscribe<UploadProgressEvent>([this](const UploadProgressEvent& e) {
            on_progress(e);
        });

        bus_.subscribe<FileTransferredEvent>([this](const FileTransferredEvent& e) {
            on_file_transferred(e);
        });

        bus_.subscribe<FileTransferFailedEvent>([this](const FileTransferFailedEvent& e) {
            on_file_failed(e);
        });

        bus_.subscribe<BatchCompletedEvent>([this](const BatchCompletedEvent& e) {
            on_batch_completed(e);
        });

        bus_.subscribe<UploadAbortedEvent>([this](const UploadAbortedEvent& e) {
            on_aborted(e);
        });
    }

private:
    void on_state_changed(const JobStateChangedEvent& e) {
        if (e.to == upload::JobState::Error) {
            spdlog::error("[JobState] job={} {} -> {} cause={}", e.job_id,
                          upload::to_string(e.from), upload::to_string(e.to), e.cause);
            return;
        }
        spdlog::info("[JobState] job={} {} -> {}", e.job_id,
                     upload::to_string(e.from), upload::to_string(e.to));
    }

    void on_progress(const UploadProgressEvent& e) {
        spdlog::debug("[Progress] job={} {}/{} ({}%) active={}", e.job_id,
                      e.progress.uploaded, e.progress.total, e.progress.percentage, e.progress.active);
    }

    void on_file_transferred(const FileTransferredEvent& e) {
        spdlog::debug("[Transferred] job={} path={} size={} attempts={}", e.job_id, e.file_path,
                      upload::format_file_size(e.bytes), e.attempts);
    }

    void on_file_failed(const FileTransferFailedEvent& e) {
        spdlog::warn("[TransferFailed] job={} path={} attempts={} reason={}", e.job_id, e.file_path,
                     e.attempts, e.reason);
    }

    void on_batch_completed(const BatchCompletedEvent& e) {
        spdlog::info("[Batch] job={} batch={} size={} ok={} failed={} duration={}ms", e.job_id,
                     e.batch_index + 1, e.batch_size, e.succeeded, e.failed, e.duration.count());
    }

    void on_aborted(const UploadAbortedEvent& e) {
        spdlog::error("[Aborted] job={} failed={} threshold={} pending={}", e.job_id, e.failed,
                      e.threshold, e.pending);
    }

    EventBus& bus_;
};

/**
 * @brief Counts transfers for the end-of-run summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_uploaded{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> files_failed{0};
        std::atomic<uint64_t> retries{0};
        std::atomic<uint64_t> batches{0};
        std::atomic<uint64_t> aborts{0};
        std::atomic<uint64_t> state_changes{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FileTransferredEvent>([this](const FileTransferredEvent& e) {
            stats_.files_uploaded++;
            stats_.bytes_uploaded += e.bytes;
            stats_.retries += e.attempts > 0 ? e.attempts - 1 : 0;
        });

        bus_.subscribe<FileTransferFailedEvent>([this](const FileTransferFailedEvent&) {
            stats_.files_failed++;
        });

        bus_.subscribe<BatchCompletedEvent>([this](const BatchCompletedEvent&) {
            stats_.batches++;
        });

        bus_.subscribe<UploadAbortedEvent>([this](const UploadAbortedEvent&) {
            stats_.aborts++;
        });

        bus_.subscribe<JobStateChangedEvent>([this](const JobStateChangedEvent&) {
            stats_.state_changes++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Files uploaded:  {}", stats_.files_uploaded.load());
        spdlog::info("  Bytes uploaded:  {}", upload::format_file_size(stats_.bytes_uploaded.load()));
        spdlog::info("  Files failed:    {}", stats_.files_failed.load());
        spdlog::info("  Retries:         {}", stats_.retries.load());
        spdlog::info("  Batches:         {}", stats_.batches.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace ferry::events
