#include "ferry/upload/types.hpp"

#include <algorithm>
#include <cmath>

namespace ferry::upload {

std::string to_string(FileStatus status) {
    switch (status) {
        case FileStatus::Pending: return "pending";
        case FileStatus::Complete: return "complete";
    }
    return "pending";
}

std::optional<FileStatus> file_status_from_string(const std::string& text) {
    if (text == "pending") return FileStatus::Pending;
    if (text == "complete") return FileStatus::Complete;
    return std::nullopt;
}

std::string to_string(JobState state) {
    switch (state) {
        case JobState::Idle: return "idle";
        case JobState::CreatingJob: return "creating_job";
        case JobState::Uploading: return "uploading";
        case JobState::Completing: return "completing";
        case JobState::Complete: return "complete";
        case JobState::Error: return "error";
    }
    return "idle";
}

std::optional<JobState> job_state_from_string(const std::string& text) {
    if (text == "idle") return JobState::Idle;
    if (text == "creating_job") return JobState::CreatingJob;
    if (text == "uploading") return JobState::Uploading;
    if (text == "completing") return JobState::Completing;
    if (text == "complete") return JobState::Complete;
    if (text == "error") return JobState::Error;
    return std::nullopt;
}

std::size_t Checkpoint::count_complete() const noexcept {
    return static_cast<std::size_t>(std::count_if(files.begin(), files.end(), [](const FileRecord& record) {
        return record.status == FileStatus::Complete;
    }));
}

int Progress::compute_percentage(std::size_t uploaded, std::size_t total) {
    if (total == 0) {
        return 0;
    }
    const double ratio = static_cast<double>(uploaded) / static_cast<double>(total);
    return static_cast<int>(std::lround(ratio * 100.0));
}

Progress Progress::from(const Checkpoint& checkpoint, std::size_t active) {
    Progress progress;
    progress.total = checkpoint.total();
    progress.uploaded = checkpoint.uploaded;
    progress.active = active;
    progress.percentage = compute_percentage(progress.uploaded, progress.total);
    return progress;
}

FileRecord make_file_record(const SourceFile& file, const std::string& top_level_folder) {
    FileRecord record;
    record.name = file.name;
    record.path = file.identity_path();
    record.size = file.size;
    record.mime_type = file.mime_type;
    record.status = FileStatus::Pending;

    const std::string prefix = top_level_folder + "/";
    if (!top_level_folder.empty() && file.relative_path.rfind(prefix, 0) == 0) {
        record.relative_path = file.relative_path.substr(prefix.size());
    } else if (!file.relative_path.empty()) {
        record.relative_path = file.relative_path;
    } else {
        record.relative_path = file.name;
    }
    return record;
}

std::int64_t to_epoch_millis(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_millis(std::int64_t millis) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis)));
}

} // namespace ferry::upload
