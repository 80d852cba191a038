#pragma once

#include "ferry/api/job_api.hpp"
#include "ferry/core/result.hpp"
#include "ferry/events/event_bus.hpp"
#include "ferry/upload/batch_scheduler.hpp"
#include "ferry/upload/checkpoint_store.hpp"
#include "ferry/upload/classifier.hpp"
#include "ferry/upload/errors.hpp"
#include "ferry/upload/job_state.hpp"
#include "ferry/upload/transfer.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ferry::upload {

struct OrchestratorOptions {
    TransferOptions transfer;
    ConcurrencyPolicy concurrency;
    FailurePolicy failures;
    std::vector<std::string> allowed_extensions = default_allowed_extensions();
    bool auto_submit = true;   ///< Call the completion endpoint once nothing is pending
};

/**
 * @brief What job creation hands back to the caller
 */
struct JobCreation {
    std::string job_id;
    std::string storage_locator;   ///< Alternate transfer path for very large datasets
    std::string copy_command;
    std::size_t eligible_count = 0;
    std::size_t ignored_count = 0;
    std::uint64_t eligible_bytes = 0;
    std::string top_level_folder_name;
};

/**
 * @brief Result of one start/resume run that did not hit a job-level error
 */
struct UploadOutcome {
    std::string job_id;
    JobState state = JobState::Idle;
    Progress progress;
    BatchReport report;
    std::size_t matched_records = 0;   ///< Pending records matched to supplied files
    bool used_fallback = false;        ///< No record matched; the whole selection was sent
    std::size_t untracked = 0;         ///< Fallback uploads with no record to mark
    bool submitted = false;
};

/**
 * @brief Drives one job at a time from selection to submission
 *
 * All calls are made from a single controlling thread. Transfers fan out on
 * worker threads inside the batch scheduler, but every checkpoint write and
 * every event is issued from the caller's thread.
 *
 * Job-level failures move the state machine to Error and come back as
 * UploadError. Validation failures come back without any transition.
 */
class UploadOrchestrator {
public:
    UploadOrchestrator(api::JobApi& api,
                       CheckpointStore& checkpoints,
                       events::EventBus& bus,
                       OrchestratorOptions options = {},
                       TransferUnit::Sleeper sleeper = {});

    UploadOrchestrator(const UploadOrchestrator&) = delete;
    UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

    /**
     * @brief Create the remote job and write its initial checkpoint
     *
     * `parameters` is forwarded untouched apart from num_images and
     * image_path_prefix, which are derived from the selection. The job is
     * in Uploading once its checkpoint is written.
     */
    Result<JobCreation, UploadError> create_job(const nlohmann::json& parameters,
                                                const std::vector<SourceFile>& files);

    /**
     * @brief Send every pending file of a job
     *
     * Works both right after create_job() and for a job found through
     * find_resumable_job(), in which case `available_files` is the user's
     * fresh re-selection. Pending records are matched to it by path, then by
     * name; records with no match stay pending.
     */
    Result<UploadOutcome, UploadError> start_or_resume_upload(const std::string& job_id,
                                                              const std::vector<SourceFile>& available_files);

    /// Tell the service a fully uploaded job may be processed, then drop the checkpoint
    Result<void, UploadError> submit_for_processing(const std::string& job_id);

    /// Newest checkpoint with pending files; never acted on without the caller
    Result<std::optional<Checkpoint>, UploadError> find_resumable_job() const;

    Result<void, UploadError> abandon_job(const std::string& job_id);

    Result<Progress, UploadError> progress(const std::string& job_id) const;

    JobState state() const noexcept { return machine_.state(); }
    const JobStateMachine& machine() const noexcept { return machine_; }
    const std::string& current_job_id() const noexcept { return current_job_id_; }

private:
    void begin_job(const std::string& job_id);
    Result<void, UploadError> enter(JobState state);
    UploadError fail(UploadError::Kind kind, const std::string& message, std::size_t pending);
    void persist_state(JobState state);
    void emit_progress(std::size_t uploaded, std::size_t total);

    Result<Checkpoint, UploadError> load_checkpoint(const std::string& job_id) const;

    api::JobApi& api_;
    CheckpointStore& checkpoints_;
    events::EventBus& bus_;
    OrchestratorOptions options_;
    FileClassifier classifier_;
    TransferUnit transfer_;
    BatchScheduler scheduler_;

    JobStateMachine machine_;
    std::string current_job_id_;
    std::size_t active_transfers_ = 0;
};

} // namespace ferry::upload
