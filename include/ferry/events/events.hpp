/**
 * @file events.hpp
 * @brief Events emitted while a job moves through its lifecycle
 *
 * NAMING CONVENTION:
 * Events are past-tense: FileTransferredEvent, UploadAbortedEvent
 */

#pragma once

#include "ferry/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ferry::events {

/**
 * @brief The job state machine moved
 *
 * WHO EMITS: UploadOrchestrator, on every successful transition
 * WHO SUBSCRIBES: CLI status line, LoggerComponent
 */
struct JobStateChangedEvent {
    std::string job_id;
    upload::JobState from = upload::JobState::Idle;
    upload::JobState to = upload::JobState::Idle;
    std::string cause;   ///< Set when `to` is Error
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Durable progress changed
 *
 * Emitted after the checkpoint write, so `uploaded` is never ahead of disk.
 */
struct UploadProgressEvent {
    std::string job_id;
    upload::Progress progress;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileTransferredEvent {
    std::string job_id;
    std::string file_path;
    std::uint64_t bytes = 0;
    unsigned attempts = 1;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A file ran out of attempts; it stays pending in the checkpoint
 */
struct FileTransferFailedEvent {
    std::string job_id;
    std::string file_path;
    std::string reason;
    unsigned attempts = 0;   ///< 0 when the file was never sent
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct BatchCompletedEvent {
    std::string job_id;
    std::size_t batch_index = 0;   ///< 0-based
    std::size_t batch_size = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Too many files failed; no further batches were started
 */
struct UploadAbortedEvent {
    std::string job_id;
    std::size_t failed = 0;
    std::size_t threshold = 0;
    std::size_t pending = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace ferry::events
