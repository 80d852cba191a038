#pragma once

#include "ferry/core/result.hpp"
#include "ferry/storage/kv_store.hpp"
#include "ferry/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ferry::upload {

/**
 * @brief Durable per-job record of which files are done
 *
 * One record per job under "upload_job_<jobId>". Every mutation reloads the
 * record, changes it and writes it back whole, so `uploaded` and the file
 * statuses can never disagree on disk.
 *
 * Not internally synchronized per job: the orchestrator is the single
 * writer for a given jobId.
 */
class CheckpointStore {
public:
    static constexpr const char* kKeyPrefix = "upload_job_";

    explicit CheckpointStore(storage::KeyValueStore& store);

    /// Writes the initial snapshot; `uploaded` is recomputed from the records
    Result<void> save(const JobInfo& job, const std::vector<FileRecord>& files);
    Result<void> save(const Checkpoint& checkpoint);

    Result<std::optional<Checkpoint>> load(const std::string& job_id) const;

    /**
     * @brief Set one file's status, returns the new uploaded count
     *
     * The identity is resolved with resolve_file_identity(). An identity that
     * matches no record is an error and nothing is written.
     */
    Result<std::size_t> update_file_status(const std::string& job_id,
                                           const std::string& file_identity,
                                           FileStatus new_status);

    Result<void> set_job_state(const std::string& job_id, JobState state);

    Result<void> remove(const std::string& job_id);

    /// Checkpoints with at least one pending file, newest first
    Result<std::vector<Checkpoint>> list_incomplete() const;

    static std::string key_for(const std::string& job_id);

    static nlohmann::json to_json(const Checkpoint& checkpoint);
    static Result<Checkpoint> from_json(const nlohmann::json& record);

private:
    storage::KeyValueStore& store_;
};

} // namespace ferry::upload
