#include "ferry/upload/checkpoint_store.hpp"

#include "ferry/upload/file_identity.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ferry::upload {

using json = nlohmann::json;

namespace {

json record_to_json(const FileRecord& record) {
    return json{
        {"name", record.name},
        {"size", record.size},
        {"type", record.mime_type},
        {"path", record.path},
        {"relativePath", record.relative_path},
        {"status", to_string(record.status)},
    };
}

Result<FileRecord> record_from_json(const json& object) {
    if (!object.is_object()) {
        return Err<FileRecord>(std::string("File entry is not an object"));
    }

    FileRecord record;
    try {
        record.name = object.at("name").get<std::string>();
        record.size = object.value("size", std::uint64_t{0});
        record.mime_type = object.value("type", std::string{});
        record.path = object.value("path", record.name);
        record.relative_path = object.value("relativePath", record.name);
        const auto status = file_status_from_string(object.value("status", std::string{"pending"}));
        if (!status) {
            return Err<FileRecord>("Unknown file status for " + record.name);
        }
        record.status = *status;
    } catch (const json::exception& e) {
        return Err<FileRecord>(std::string("Malformed file entry: ") + e.what());
    }
    return Ok(std::move(record));
}

} // namespace

CheckpointStore::CheckpointStore(storage::KeyValueStore& store) : store_(store) {}

std::string CheckpointStore::key_for(const std::string& job_id) {
    return std::string(kKeyPrefix) + job_id;
}

json CheckpointStore::to_json(const Checkpoint& checkpoint) {
    json files = json::array();
    for (const auto& record : checkpoint.files) {
        files.push_back(record_to_json(record));
    }

    return json{
        {"jobId", checkpoint.job.job_id},
        {"status", to_string(checkpoint.job.state)},
        {"timestamp", to_epoch_millis(checkpoint.job.created_at)},
        {"files", std::move(files)},
        {"formData", checkpoint.job.submission_parameters},
        {"uploaded", checkpoint.uploaded},
        {"num_images", checkpoint.files.size()},
        {"topLevelFolderName", checkpoint.job.top_level_folder_name},
    };
}

Result<Checkpoint> CheckpointStore::from_json(const json& record) {
    if (!record.is_object()) {
        return Err<Checkpoint>(std::string("Checkpoint is not a JSON object"));
    }

    Checkpoint checkpoint;
    std::size_t stored_uploaded = 0;
    try {
        checkpoint.job.job_id = record.at("jobId").get<std::string>();
        const auto state = job_state_from_string(record.value("status", std::string{"idle"}));
        if (!state) {
            return Err<Checkpoint>("Unknown job status in checkpoint " + checkpoint.job.job_id);
        }
        checkpoint.job.state = *state;
        checkpoint.job.created_at = from_epoch_millis(record.value("timestamp", std::int64_t{0}));
        if (const auto it = record.find("formData"); it != record.end() && it->is_object()) {
            checkpoint.job.submission_parameters = *it;
        }
        checkpoint.job.top_level_folder_name = record.value("topLevelFolderName", std::string{});
        stored_uploaded = record.value("uploaded", std::size_t{0});

        const auto& files = record.at("files");
        if (!files.is_array()) {
            return Err<Checkpoint>("Checkpoint " + checkpoint.job.job_id + " has no file list");
        }
        checkpoint.files.reserve(files.size());
        for (const auto& entry : files) {
            auto file = record_from_json(entry);
            if (file.is_error()) {
                return Err<Checkpoint>(file.error());
            }
            checkpoint.files.push_back(std::move(file.value()));
        }
    } catch (const json::exception& e) {
        return Err<Checkpoint>(std::string("Malformed checkpoint: ") + e.what());
    }

    // The records are authoritative; a stale counter is corrected on load
    checkpoint.uploaded = checkpoint.count_complete();
    if (stored_uploaded != checkpoint.uploaded) {
        spdlog::warn("Checkpoint {} counter disagrees with its records, using {}",
                     checkpoint.job.job_id, checkpoint.uploaded);
    }
    return Ok(std::move(checkpoint));
}

Result<void> CheckpointStore::save(const JobInfo& job, const std::vector<FileRecord>& files) {
    Checkpoint checkpoint;
    checkpoint.job = job;
    checkpoint.files = files;
    return save(checkpoint);
}

Result<void> CheckpointStore::save(const Checkpoint& checkpoint) {
    if (checkpoint.job.job_id.empty()) {
        return Err<void>(std::string("Cannot checkpoint a job without an id"));
    }

    Checkpoint normalized = checkpoint;
    normalized.uploaded = normalized.count_complete();
    return store_.set(key_for(checkpoint.job.job_id), to_json(normalized).dump());
}

Result<std::optional<Checkpoint>> CheckpointStore::load(const std::string& job_id) const {
    auto raw = store_.get(key_for(job_id));
    if (raw.is_error()) {
        return Err<std::optional<Checkpoint>>(raw.error());
    }
    if (!raw.value()) {
        return Ok(std::optional<Checkpoint>{});
    }

    const json record = json::parse(*raw.value(), nullptr, false);
    if (record.is_discarded()) {
        return Err<std::optional<Checkpoint>>("Checkpoint for job " + job_id + " is not valid JSON");
    }

    auto checkpoint = from_json(record);
    if (checkpoint.is_error()) {
        return Err<std::optional<Checkpoint>>(checkpoint.error());
    }
    return Ok(std::optional<Checkpoint>{std::move(checkpoint.value())});
}

Result<std::size_t> CheckpointStore::update_file_status(const std::string& job_id,
                                                        const std::string& file_identity,
                                                        FileStatus new_status) {
    auto loaded = load(job_id);
    if (loaded.is_error()) {
        return Err<std::size_t>(loaded.error());
    }
    if (!loaded.value()) {
        return Err<std::size_t>("No checkpoint for job " + job_id);
    }

    Checkpoint& checkpoint = *loaded.value();
    const auto match = resolve_file_identity(checkpoint.files, file_identity, new_status);
    if (!match) {
        return Err<std::size_t>("No file matching '" + file_identity + "' in job " + job_id);
    }

    FileRecord& record = checkpoint.files[match->index];
    if (record.status == new_status) {
        return Ok(checkpoint.uploaded);
    }
    record.status = new_status;
    checkpoint.uploaded = checkpoint.count_complete();

    if (auto saved = save(checkpoint); saved.is_error()) {
        return Err<std::size_t>(saved.error());
    }
    return Ok(checkpoint.uploaded);
}

Result<void> CheckpointStore::set_job_state(const std::string& job_id, JobState state) {
    auto loaded = load(job_id);
    if (loaded.is_error()) {
        return Err<void>(loaded.error());
    }
    if (!loaded.value()) {
        return Err<void>("No checkpoint for job " + job_id);
    }

    Checkpoint& checkpoint = *loaded.value();
    if (checkpoint.job.state == state) {
        return Ok();
    }
    checkpoint.job.state = state;
    return save(checkpoint);
}

Result<void> CheckpointStore::remove(const std::string& job_id) {
    return store_.remove(key_for(job_id));
}

Result<std::vector<Checkpoint>> CheckpointStore::list_incomplete() const {
    auto keys = store_.list_keys(kKeyPrefix);
    if (keys.is_error()) {
        return Err<std::vector<Checkpoint>>(keys.error());
    }

    std::vector<Checkpoint> incomplete;
    for (const auto& key : keys.value()) {
        const std::string job_id = key.substr(std::string(kKeyPrefix).size());
        auto loaded = load(job_id);
        if (loaded.is_error()) {
            // One corrupt record must not hide the others
            spdlog::warn("Skipping unreadable checkpoint {}: {}", key, loaded.error());
            continue;
        }
        if (loaded.value() && !loaded.value()->is_resolved()) {
            incomplete.push_back(std::move(*loaded.value()));
        }
    }

    std::stable_sort(incomplete.begin(), incomplete.end(), [](const Checkpoint& lhs, const Checkpoint& rhs) {
        return lhs.job.created_at > rhs.job.created_at;
    });
    return Ok(std::move(incomplete));
}

} // namespace ferry::upload
