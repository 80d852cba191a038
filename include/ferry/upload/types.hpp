#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::upload {

/**
 * @brief Durable per-file status
 *
 * There is deliberately no "in progress" value: a crash mid-transfer leaves
 * the file pending and it is simply sent again on resume.
 */
enum class FileStatus {
    Pending,
    Complete
};

enum class JobState {
    Idle,
    CreatingJob,
    Uploading,
    Completing,
    Complete,
    Error
};

std::string to_string(FileStatus status);
std::optional<FileStatus> file_status_from_string(const std::string& text);

std::string to_string(JobState state);
std::optional<JobState> job_state_from_string(const std::string& text);

/**
 * @brief A file handle as supplied by the caller's selection
 */
struct SourceFile {
    std::filesystem::path location;   ///< Where the bytes are read from
    std::string name;                 ///< Bare file name
    std::string relative_path;        ///< Selection-relative path incl. top folder; may be empty
    std::uint64_t size = 0;
    std::string mime_type;

    /// Path used as the upload target and checkpoint identity
    std::string identity_path() const {
        return relative_path.empty() ? name : relative_path;
    }
};

/**
 * @brief One file of a job as recorded in its checkpoint
 */
struct FileRecord {
    std::string name;
    std::string path;            ///< Full selection-relative path (or the name)
    std::string relative_path;   ///< Path below the top-level folder
    std::uint64_t size = 0;
    std::string mime_type;
    FileStatus status = FileStatus::Pending;
};

struct JobInfo {
    std::string job_id;
    JobState state = JobState::Idle;
    std::chrono::system_clock::time_point created_at{};
    nlohmann::json submission_parameters = nlohmann::json::object();  ///< Passed through untouched
    std::string top_level_folder_name;
};

/**
 * @brief Persisted {job, files} pair, the source of truth for resume
 *
 * `uploaded` is always equal to the number of complete records; the store
 * rewrites both together.
 */
struct Checkpoint {
    JobInfo job;
    std::vector<FileRecord> files;
    std::size_t uploaded = 0;

    std::size_t total() const noexcept { return files.size(); }
    std::size_t pending_count() const noexcept { return files.size() - uploaded; }

    /// A checkpoint with nothing left to send is never offered for resume
    bool is_resolved() const noexcept { return pending_count() == 0; }

    std::size_t count_complete() const noexcept;
};

/**
 * @brief Derived progress view, never persisted
 */
struct Progress {
    std::size_t total = 0;
    std::size_t uploaded = 0;
    std::size_t active = 0;
    int percentage = 0;

    static Progress from(const Checkpoint& checkpoint, std::size_t active = 0);
    static int compute_percentage(std::size_t uploaded, std::size_t total);
};

FileRecord make_file_record(const SourceFile& file, const std::string& top_level_folder);

/// Milliseconds since the Unix epoch, the checkpoint timestamp format
std::int64_t to_epoch_millis(std::chrono::system_clock::time_point time);
std::chrono::system_clock::time_point from_epoch_millis(std::int64_t millis);

} // namespace ferry::upload
