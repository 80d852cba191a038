#include "ferry/upload/orchestrator.hpp"

#include "ferry/events/events.hpp"
#include "ferry/upload/file_identity.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <unordered_set>

namespace ferry::upload {

using json = nlohmann::json;

namespace {

std::string pending_hint(std::size_t pending) {
    if (pending == 0) {
        return "";
    }
    return " " + std::to_string(pending) + (pending == 1 ? " file remains" : " files remain") +
           " pending; resume the job to retry.";
}

} // namespace

UploadOrchestrator::UploadOrchestrator(api::JobApi& api,
                                       CheckpointStore& checkpoints,
                                       events::EventBus& bus,
                                       OrchestratorOptions options,
                                       TransferUnit::Sleeper sleeper)
    : api_(api),
      checkpoints_(checkpoints),
      bus_(bus),
      options_(std::move(options)),
      classifier_(options_.allowed_extensions),
      transfer_(api_, options_.transfer, std::move(sleeper)),
      scheduler_(transfer_, options_.concurrency, options_.failures) {
    begin_job("");
}

void UploadOrchestrator::begin_job(const std::string& job_id) {
    machine_ = JobStateMachine();
    machine_.set_listener([this](JobState from, JobState to, const std::string& cause) {
        bus_.emit(events::JobStateChangedEvent{current_job_id_, from, to, cause});
    });
    current_job_id_ = job_id;
    active_transfers_ = 0;
}

Result<void, UploadError> UploadOrchestrator::enter(JobState state) {
    if (auto moved = machine_.transition_to(state); moved.is_error()) {
        return Err<void>(UploadError::make(UploadError::Kind::InvalidState, moved.error()));
    }
    persist_state(state);
    return Ok<UploadError>();
}

UploadError UploadOrchestrator::fail(UploadError::Kind kind, const std::string& message, std::size_t pending) {
    UploadError error = UploadError::make(kind, message + pending_hint(pending), pending);
    if (auto failed = machine_.fail(error.message); failed.is_error()) {
        spdlog::debug("Job {} not moved to error: {}", current_job_id_, failed.error());
    } else {
        persist_state(JobState::Error);
    }
    return error;
}

void UploadOrchestrator::persist_state(JobState state) {
    // CreatingJob has no checkpoint yet and Complete removes it
    if (current_job_id_.empty() || state == JobState::CreatingJob || state == JobState::Complete) {
        return;
    }
    if (auto saved = checkpoints_.set_job_state(current_job_id_, state); saved.is_error()) {
        spdlog::warn("Could not record state {} for job {}: {}", to_string(state), current_job_id_, saved.error());
    }
}

void UploadOrchestrator::emit_progress(std::size_t uploaded, std::size_t total) {
    events::UploadProgressEvent event;
    event.job_id = current_job_id_;
    event.progress.total = total;
    event.progress.uploaded = uploaded;
    event.progress.active = active_transfers_;
    event.progress.percentage = Progress::compute_percentage(uploaded, total);
    bus_.emit(event);
}

Result<Checkpoint, UploadError> UploadOrchestrator::load_checkpoint(const std::string& job_id) const {
    auto loaded = checkpoints_.load(job_id);
    if (loaded.is_error()) {
        return Err<Checkpoint>(UploadError::make(UploadError::Kind::Storage,
                                                 "Could not read saved progress for job " + job_id + ": " + loaded.error()));
    }
    if (!loaded.value()) {
        return Err<Checkpoint>(UploadError::make(UploadError::Kind::NotFound,
                                                 "No saved upload for job " + job_id));
    }
    return Ok<Checkpoint, UploadError>(std::move(*loaded.value()));
}

Result<JobCreation, UploadError> UploadOrchestrator::create_job(const json& parameters,
                                                                const std::vector<SourceFile>& files) {
    const Classification classification = classifier_.classify(files);
    if (classification.empty()) {
        return Err<JobCreation>(UploadError::validation(
            "No image files found in the selection (" + std::to_string(classification.ignored_count()) + " ignored)"));
    }
    if (!parameters.is_object() && !parameters.is_null()) {
        return Err<JobCreation>(UploadError::validation("Job parameters must be a JSON object"));
    }

    begin_job("");
    if (auto entered = enter(JobState::CreatingJob); entered.is_error()) {
        return Err<JobCreation>(entered.error());
    }

    json body = parameters.is_object() ? parameters : json::object();
    body["num_images"] = classification.eligible_count();
    body["image_path_prefix"] = classification.top_level_folder_name;

    spdlog::info("Creating job for {} files ({}), {} ignored", classification.eligible_count(),
                 format_file_size(classification.eligible_bytes), classification.ignored_count());

    auto created = api_.create_job(body);
    if (created.is_error()) {
        return Err<JobCreation>(fail(UploadError::Kind::Api,
                                     "Could not create the job: " + created.error().describe(), 0));
    }

    current_job_id_ = created.value().job_id;

    JobInfo job;
    job.job_id = current_job_id_;
    job.state = JobState::CreatingJob;
    job.created_at = std::chrono::system_clock::now();
    job.submission_parameters = parameters.is_object() ? parameters : json::object();
    job.top_level_folder_name = classification.top_level_folder_name;

    std::vector<FileRecord> records;
    records.reserve(classification.eligible.size());
    for (const auto& file : classification.eligible) {
        records.push_back(make_file_record(file, classification.top_level_folder_name));
    }

    if (auto saved = checkpoints_.save(job, records); saved.is_error()) {
        return Err<JobCreation>(fail(UploadError::Kind::Storage,
                                     "Job " + job.job_id + " was created but its progress could not be saved: " +
                                     saved.error(), 0));
    }
    if (auto entered = enter(JobState::Uploading); entered.is_error()) {
        return Err<JobCreation>(entered.error());
    }

    emit_progress(0, records.size());

    JobCreation creation;
    creation.job_id = job.job_id;
    creation.storage_locator = created.value().storage_locator;
    creation.copy_command = created.value().copy_command;
    creation.eligible_count = classification.eligible_count();
    creation.ignored_count = classification.ignored_count();
    creation.eligible_bytes = classification.eligible_bytes;
    creation.top_level_folder_name = classification.top_level_folder_name;
    return Ok<JobCreation, UploadError>(std::move(creation));
}

Result<UploadOutcome, UploadError> UploadOrchestrator::start_or_resume_upload(const std::string& job_id,
                                                                              const std::vector<SourceFile>& available_files) {
    if (job_id.empty()) {
        return Err<UploadOutcome>(UploadError::validation("A job id is required"));
    }

    const bool continuing = current_job_id_ == job_id &&
                            (machine_.state() == JobState::CreatingJob || machine_.state() == JobState::Uploading);

    auto loaded = load_checkpoint(job_id);
    if (loaded.is_error()) {
        if (continuing) {
            return Err<UploadOutcome>(fail(loaded.error().kind, loaded.error().message, 0));
        }
        return Err<UploadOutcome>(loaded.error());
    }
    const Checkpoint checkpoint = std::move(loaded.value());
    const std::size_t total = checkpoint.total();

    // Work out what to send before touching the state machine; a selection
    // that cannot be used is a validation error with no transition.
    const Classification classification = classifier_.classify(available_files);
    const std::string top_folder = checkpoint.job.top_level_folder_name.empty()
        ? classification.top_level_folder_name
        : checkpoint.job.top_level_folder_name;

    UploadOutcome outcome;
    outcome.job_id = job_id;

    std::vector<PendingTransfer> plan;
    const std::size_t pending_records = checkpoint.pending_count();
    if (pending_records > 0) {
        if (classification.empty()) {
            return Err<UploadOutcome>(UploadError::make(UploadError::Kind::Validation,
                "No eligible files supplied for job " + job_id + "; reselect your files to resume.",
                pending_records));
        }

        std::vector<bool> used(classification.eligible.size(), false);
        const auto claim = [&](const auto& predicate) -> std::optional<std::size_t> {
            for (std::size_t i = 0; i < classification.eligible.size(); ++i) {
                if (!used[i] && predicate(classification.eligible[i])) {
                    used[i] = true;
                    return i;
                }
            }
            return std::nullopt;
        };

        // Exact paths are claimed for every record before any name match, so
        // a record whose file is missing cannot take a same-named file that
        // belongs to another record.
        std::vector<const FileRecord*> pending;
        std::unordered_set<std::string> recorded_paths;
        for (const auto& record : checkpoint.files) {
            recorded_paths.insert(record.path);
            if (record.status == FileStatus::Pending) {
                pending.push_back(&record);
            }
        }

        std::vector<std::optional<std::size_t>> assigned(pending.size());
        for (std::size_t r = 0; r < pending.size(); ++r) {
            assigned[r] = claim([&](const SourceFile& file) { return file.identity_path() == pending[r]->path; });
        }
        // A name match needs a file without a path, or one whose path is not recorded
        for (std::size_t r = 0; r < pending.size(); ++r) {
            if (assigned[r]) {
                continue;
            }
            assigned[r] = claim([&](const SourceFile& file) {
                return file.name == pending[r]->name &&
                       (file.relative_path.empty() || recorded_paths.count(file.identity_path()) == 0);
            });
        }

        for (std::size_t r = 0; r < pending.size(); ++r) {
            if (assigned[r]) {
                plan.push_back(PendingTransfer{classification.eligible[*assigned[r]], pending[r]->path,
                                               pending[r]->relative_path});
                ++outcome.matched_records;
            }
        }

        if (outcome.matched_records == 0) {
            spdlog::warn("None of the {} pending files of job {} are in the new selection; "
                         "uploading all {} selected files instead", pending_records, job_id,
                         classification.eligible_count());
            outcome.used_fallback = true;
            for (const auto& file : classification.eligible) {
                const FileRecord candidate = make_file_record(file, top_folder);
                const bool tracked = resolve_file_identity(checkpoint.files, candidate.path, FileStatus::Complete)
                                         .has_value();
                plan.push_back(PendingTransfer{file, tracked ? candidate.path : std::string{}, candidate.relative_path});
            }
        } else if (outcome.matched_records < pending_records) {
            spdlog::warn("{} pending files of job {} were not reselected and stay pending",
                         pending_records - outcome.matched_records, job_id);
        }
    }

    if (!continuing) {
        begin_job(job_id);
    }
    if (auto entered = enter(JobState::Uploading); entered.is_error()) {
        return Err<UploadOutcome>(entered.error());
    }

    std::size_t uploaded = checkpoint.uploaded;
    emit_progress(uploaded, total);

    BatchCallbacks callbacks;
    callbacks.on_batch_started = [&](std::size_t, std::size_t batch_size) {
        active_transfers_ = batch_size;
        emit_progress(uploaded, total);
    };
    callbacks.on_file_uploaded = [&](const PendingTransfer& transfer, unsigned attempts) -> Result<void> {
        if (transfer.record_identity.empty()) {
            ++outcome.untracked;
            spdlog::warn("Uploaded {} but it matches no file of job {}", transfer.relative_path, job_id);
        } else {
            auto updated = checkpoints_.update_file_status(job_id, transfer.record_identity, FileStatus::Complete);
            if (updated.is_error()) {
                return Err<void>(updated.error());
            }
            uploaded = updated.value();
        }
        bus_.emit(events::FileTransferredEvent{job_id, transfer.relative_path, transfer.source.size, attempts});
        emit_progress(uploaded, total);
        return Ok();
    };
    callbacks.on_file_failed = [&](const PendingTransfer& transfer, const TransferFailure& failure) {
        bus_.emit(events::FileTransferFailedEvent{job_id, transfer.relative_path,
                                                  std::string(to_string(failure.kind)) + ": " + failure.message,
                                                  failure.attempts});
    };
    callbacks.on_batch_completed = [&](std::size_t batch_index, std::size_t batch_size, std::size_t succeeded,
                                       std::size_t failed, std::chrono::milliseconds duration) {
        active_transfers_ = 0;
        bus_.emit(events::BatchCompletedEvent{job_id, batch_index, batch_size, succeeded, failed, duration});
    };

    auto run = scheduler_.run(job_id, plan, callbacks);
    active_transfers_ = 0;
    if (run.is_error()) {
        return Err<UploadOutcome>(fail(UploadError::Kind::Storage,
                                       "Could not record upload progress for job " + job_id + ": " + run.error(),
                                       total - uploaded));
    }

    outcome.report = std::move(run.value());
    const std::size_t pending = total - uploaded;
    outcome.progress.total = total;
    outcome.progress.uploaded = uploaded;
    outcome.progress.percentage = Progress::compute_percentage(uploaded, total);

    if (outcome.report.aborted) {
        bus_.emit(events::UploadAbortedEvent{job_id, outcome.report.failed_count,
                                             outcome.report.failure_threshold, pending});
        return Err<UploadOutcome>(fail(UploadError::Kind::Aborted,
            "Upload of job " + job_id + " stopped after " + std::to_string(outcome.report.failed_count) +
            " files failed.", pending));
    }

    if (pending == 0 && options_.auto_submit) {
        if (auto submitted = submit_for_processing(job_id); submitted.is_error()) {
            return Err<UploadOutcome>(submitted.error());
        }
        outcome.submitted = true;
    } else if (pending > 0) {
        spdlog::warn("Job {}: {} of {} files uploaded.{}", job_id, uploaded, total, pending_hint(pending));
    }

    outcome.state = machine_.state();
    return Ok<UploadOutcome, UploadError>(std::move(outcome));
}

Result<void, UploadError> UploadOrchestrator::submit_for_processing(const std::string& job_id) {
    auto loaded = load_checkpoint(job_id);
    if (loaded.is_error()) {
        return Err<void>(loaded.error());
    }
    const Checkpoint& checkpoint = loaded.value();
    if (!checkpoint.is_resolved()) {
        return Err<void>(UploadError::make(UploadError::Kind::InvalidState,
            "Job " + job_id + " cannot be submitted yet." + pending_hint(checkpoint.pending_count()),
            checkpoint.pending_count()));
    }

    if (current_job_id_ != job_id || machine_.is_terminal() || machine_.state() == JobState::Idle) {
        begin_job(job_id);
        if (auto entered = enter(JobState::Uploading); entered.is_error()) {
            return entered;
        }
    }
    if (auto entered = enter(JobState::Completing); entered.is_error()) {
        return entered;
    }

    if (auto completed = api_.complete_upload(job_id); completed.is_error()) {
        return Err<void>(fail(UploadError::Kind::Api,
            "All files of job " + job_id + " are uploaded but submitting it failed (" +
            completed.error().describe() + "); run the completion step again.", 0));
    }

    if (auto entered = enter(JobState::Complete); entered.is_error()) {
        return entered;
    }

    if (auto removed = checkpoints_.remove(job_id); removed.is_error()) {
        spdlog::warn("Job {} is submitted but its checkpoint could not be removed: {}", job_id, removed.error());
    }
    spdlog::info("Job {} submitted for processing ({} files)", job_id, checkpoint.total());
    return Ok<UploadError>();
}

Result<std::optional<Checkpoint>, UploadError> UploadOrchestrator::find_resumable_job() const {
    auto incomplete = checkpoints_.list_incomplete();
    if (incomplete.is_error()) {
        return Err<std::optional<Checkpoint>>(UploadError::make(UploadError::Kind::Storage,
            "Could not list saved uploads: " + incomplete.error()));
    }
    if (incomplete.value().empty()) {
        return Ok<std::optional<Checkpoint>, UploadError>(std::nullopt);
    }
    if (incomplete.value().size() > 1) {
        spdlog::debug("{} incomplete uploads saved, offering the newest", incomplete.value().size());
    }
    return Ok<std::optional<Checkpoint>, UploadError>(std::move(incomplete.value().front()));
}

Result<void, UploadError> UploadOrchestrator::abandon_job(const std::string& job_id) {
    auto loaded = load_checkpoint(job_id);
    if (loaded.is_error()) {
        return Err<void>(loaded.error());
    }

    if (auto removed = checkpoints_.remove(job_id); removed.is_error()) {
        return Err<void>(UploadError::make(UploadError::Kind::Storage,
            "Could not remove saved progress for job " + job_id + ": " + removed.error(),
            loaded.value().pending_count()));
    }

    if (current_job_id_ == job_id && machine_.state() != JobState::Idle && !machine_.is_terminal()) {
        // Checkpoint is gone, so nothing to persist the error into
        if (auto failed = machine_.fail("Job " + job_id + " abandoned"); failed.is_error()) {
            spdlog::debug("Abandoned job {} left in state {}", job_id, to_string(machine_.state()));
        }
    }
    begin_job("");

    spdlog::info("Abandoned job {} ({} files were still pending)", job_id, loaded.value().pending_count());
    return Ok<UploadError>();
}

Result<Progress, UploadError> UploadOrchestrator::progress(const std::string& job_id) const {
    auto loaded = load_checkpoint(job_id);
    if (loaded.is_error()) {
        return Err<Progress>(loaded.error());
    }
    const std::size_t active = current_job_id_ == job_id ? active_transfers_ : 0;
    return Ok<Progress, UploadError>(Progress::from(loaded.value(), active));
}

} // namespace ferry::upload
