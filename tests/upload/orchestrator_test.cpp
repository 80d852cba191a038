#include "ferry/upload/orchestrator.hpp"

#include "ferry/api/job_parameters.hpp"
#include "ferry/core/base64.hpp"
#include "ferry/events/events.hpp"
#include "ferry/storage/memory_kv_store.hpp"
#include "support/fake_job_api.hpp"
#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <vector>

using ferry::api::ApiFailure;
using ferry::events::EventBus;
using ferry::events::JobStateChangedEvent;
using ferry::events::UploadAbortedEvent;
using ferry::events::UploadProgressEvent;
using ferry::storage::MemoryKeyValueStore;
using ferry::testing::FakeJobApi;
using ferry::upload::CheckpointStore;
using ferry::upload::FileStatus;
using ferry::upload::JobState;
using ferry::upload::OrchestratorOptions;
using ferry::upload::SourceFile;
using ferry::upload::UploadError;
using ferry::upload::UploadOrchestrator;

class UploadOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = ferry::testing::create_temp_dir("orchestrator");

        bus_.subscribe<UploadProgressEvent>([this](const UploadProgressEvent& e) {
            percentages_.push_back(e.progress.percentage);
        });
        bus_.subscribe<JobStateChangedEvent>([this](const JobStateChangedEvent& e) {
            states_.push_back(e.to);
        });
        bus_.subscribe<UploadAbortedEvent>([this](const UploadAbortedEvent&) { aborts_++; });
    }

    std::unique_ptr<UploadOrchestrator> make_orchestrator(FakeJobApi& api) {
        OrchestratorOptions options;
        options.transfer.retry.max_delay = std::chrono::milliseconds(1);
        return std::make_unique<UploadOrchestrator>(api, checkpoints_, bus_, options,
                                                    [](std::chrono::milliseconds) {});
    }

    nlohmann::json parameters() const {
        ferry::api::JobParameters params;
        params.email = "ops@example.org";
        return params.to_json("field user");
    }

    std::filesystem::path root_;
    FakeJobApi api_;
    MemoryKeyValueStore kv_;
    CheckpointStore checkpoints_{kv_};
    EventBus bus_;

    std::vector<int> percentages_;
    std::vector<JobState> states_;
    int aborts_ = 0;
};

TEST_F(UploadOrchestratorTest, SmallJobRunsToSubmission) {
    const auto files = ferry::testing::make_images(root_, "trip", 3);
    auto orchestrator = make_orchestrator(api_);

    auto created = orchestrator->create_job(parameters(), files);
    ASSERT_TRUE(created.is_ok()) << created.error().message;
    EXPECT_EQ(created.value().job_id, "job-1");
    EXPECT_EQ(created.value().eligible_count, 3u);
    EXPECT_EQ(created.value().top_level_folder_name, "trip");
    EXPECT_FALSE(created.value().storage_locator.empty());

    const auto sent = api_.created_parameters();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].at("num_images"), 3);
    EXPECT_EQ(sent[0].at("image_path_prefix"), "trip");
    EXPECT_EQ(sent[0].at("email"), "ops@example.org");
    EXPECT_EQ(sent[0].at("request_name"), "field_user");

    auto outcome = orchestrator->start_or_resume_upload("job-1", files);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().message;
    EXPECT_TRUE(outcome.value().submitted);
    EXPECT_EQ(outcome.value().state, JobState::Complete);
    EXPECT_EQ(outcome.value().matched_records, 3u);
    EXPECT_EQ(outcome.value().progress.uploaded, 3u);
    EXPECT_EQ(outcome.value().progress.percentage, 100);

    EXPECT_EQ(orchestrator->machine().history(),
              (std::vector<JobState>{JobState::Idle, JobState::CreatingJob, JobState::Uploading,
                                     JobState::Completing, JobState::Complete}));
    EXPECT_EQ(states_, (std::vector<JobState>{JobState::CreatingJob, JobState::Uploading,
                                              JobState::Completing, JobState::Complete}));

    std::vector<int> distinct;
    for (int percentage : percentages_) {
        if (distinct.empty() || distinct.back() != percentage) {
            distinct.push_back(percentage);
        }
    }
    EXPECT_EQ(distinct, (std::vector<int>{0, 33, 67, 100}));

    EXPECT_EQ(api_.completed_jobs(), (std::vector<std::string>{"job-1"}));
    EXPECT_EQ(api_.uploaded_paths().size(), 3u);
    EXPECT_FALSE(checkpoints_.load("job-1").value().has_value());
}

TEST_F(UploadOrchestratorTest, PermanentFailureLeavesFilePending) {
    const auto files = ferry::testing::make_images(root_, "trip", 10);
    api_.fail_always("img_4.jpg", ApiFailure::from_status(400, "corrupt image"));
    auto orchestrator = make_orchestrator(api_);

    ASSERT_TRUE(orchestrator->create_job(parameters(), files).is_ok());
    auto outcome = orchestrator->start_or_resume_upload("job-1", files);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().message;

    EXPECT_FALSE(outcome.value().submitted);
    EXPECT_EQ(outcome.value().state, JobState::Uploading);
    EXPECT_EQ(outcome.value().progress.uploaded, 9u);
    EXPECT_EQ(outcome.value().report.failed_count, 1u);
    EXPECT_FALSE(outcome.value().report.aborted);
    EXPECT_EQ(api_.attempts_for("img_4.jpg"), 1);
    EXPECT_TRUE(api_.completed_jobs().empty());

    auto saved = checkpoints_.load("job-1");
    ASSERT_TRUE(saved.is_ok());
    ASSERT_TRUE(saved.value().has_value());
    EXPECT_EQ(saved.value()->uploaded, 9u);
    EXPECT_EQ(saved.value()->files[4].path, "trip/img_4.jpg");
    EXPECT_EQ(saved.value()->files[4].status, FileStatus::Pending);

    auto resumable = orchestrator->find_resumable_job();
    ASSERT_TRUE(resumable.is_ok());
    ASSERT_TRUE(resumable.value().has_value());
    EXPECT_EQ(resumable.value()->job.job_id, "job-1");

    auto submit = orchestrator->submit_for_processing("job-1");
    ASSERT_TRUE(submit.is_error());
    EXPECT_EQ(submit.error().kind, UploadError::Kind::InvalidState);
    EXPECT_EQ(submit.error().pending_files, 1u);
}

TEST_F(UploadOrchestratorTest, ResumeSendsOnlyPendingFiles) {
    const auto files = ferry::testing::make_images(root_, "trip", 10);
    api_.fail_next("img_4.jpg", std::vector<ApiFailure>(4, ApiFailure::from_status(503, "busy")));

    {
        auto first = make_orchestrator(api_);
        ASSERT_TRUE(first->create_job(parameters(), files).is_ok());
        auto outcome = first->start_or_resume_upload("job-1", files);
        ASSERT_TRUE(outcome.is_ok());
        EXPECT_EQ(outcome.value().progress.uploaded, 9u);
        EXPECT_EQ(api_.attempts_for("img_4.jpg"), 4);
    }

    // A new process picks the job up from its checkpoint
    auto second = make_orchestrator(api_);
    auto resumable = second->find_resumable_job();
    ASSERT_TRUE(resumable.is_ok());
    ASSERT_TRUE(resumable.value().has_value());
    EXPECT_EQ(resumable.value()->pending_count(), 1u);

    auto progress = second->progress("job-1");
    ASSERT_TRUE(progress.is_ok());
    EXPECT_EQ(progress.value().percentage, 90);

    percentages_.clear();
    auto outcome = second->start_or_resume_upload("job-1", files);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().message;
    EXPECT_TRUE(outcome.value().submitted);
    EXPECT_EQ(outcome.value().matched_records, 1u);
    EXPECT_EQ(outcome.value().report.uploaded_count, 1u);

    EXPECT_EQ(api_.total_attempts(), 14u);
    for (int i = 0; i < 10; ++i) {
        const std::string path = "img_" + std::to_string(i) + ".jpg";
        EXPECT_EQ(api_.attempts_for(path), i == 4 ? 5 : 1) << path;
    }
    EXPECT_EQ(second->machine().history(),
              (std::vector<JobState>{JobState::Idle, JobState::Uploading, JobState::Completing, JobState::Complete}));
    EXPECT_EQ(percentages_.front(), 90);
    EXPECT_EQ(percentages_.back(), 100);
    EXPECT_FALSE(checkpoints_.load("job-1").value().has_value());
}

TEST_F(UploadOrchestratorTest, ProgressNeverMovesBackwards) {
    const auto files = ferry::testing::make_images(root_, "trip", 23);
    api_.fail_always("img_11.jpg", ApiFailure::from_status(422, "bad exif"));
    auto orchestrator = make_orchestrator(api_);

    ASSERT_TRUE(orchestrator->create_job(parameters(), files).is_ok());
    ASSERT_TRUE(orchestrator->start_or_resume_upload("job-1", files).is_ok());

    ASSERT_FALSE(percentages_.empty());
    for (std::size_t i = 1; i < percentages_.size(); ++i) {
        EXPECT_GE(percentages_[i], percentages_[i - 1]);
    }
    EXPECT_EQ(percentages_.back(), 96);
}

TEST_F(UploadOrchestratorTest, SelectionWithoutImagesIsRejectedBeforeAnyTransition) {
    std::vector<SourceFile> files{
        ferry::testing::make_source(root_, "docs/readme.txt", "x"),
        ferry::testing::make_source(root_, "docs/data.csv", "y"),
    };
    auto orchestrator = make_orchestrator(api_);

    auto created = orchestrator->create_job(parameters(), files);
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, UploadError::Kind::Validation);
    EXPECT_EQ(orchestrator->state(), JobState::Idle);
    EXPECT_EQ(orchestrator->machine().history().size(), 1u);
    EXPECT_TRUE(states_.empty());
    EXPECT_TRUE(api_.created_parameters().empty());
    EXPECT_EQ(kv_.size(), 0u);
}

TEST_F(UploadOrchestratorTest, ResumeWithEmptySelectionIsAValidationError) {
    const auto files = ferry::testing::make_images(root_, "trip", 3);
    auto orchestrator = make_orchestrator(api_);
    ASSERT_TRUE(orchestrator->create_job(parameters(), files).is_ok());
    states_.clear();

    auto outcome = orchestrator->start_or_resume_upload("job-1", {});
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, UploadError::Kind::Validation);
    EXPECT_EQ(outcome.error().pending_files, 3u);
    EXPECT_EQ(orchestrator->state(), JobState::Uploading);
    EXPECT_TRUE(states_.empty());
    EXPECT_EQ(api_.total_attempts(), 0u);
}

TEST_F(UploadOrchestratorTest, UnmatchedSelectionFallsBackWithoutShrinkingCheckpoint) {
    const auto first_selection = ferry::testing::make_images(root_, "trip", 3);
    std::vector<SourceFile> renamed{
        ferry::testing::make_source(root_, "export/photo_a.jpg", "a"),
        ferry::testing::make_source(root_, "export/photo_b.jpg", "b"),
    };
    auto orchestrator = make_orchestrator(api_);
    ASSERT_TRUE(orchestrator->create_job(parameters(), first_selection).is_ok());

    auto outcome = orchestrator->start_or_resume_upload("job-1", renamed);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().message;
    EXPECT_TRUE(outcome.value().used_fallback);
    EXPECT_EQ(outcome.value().matched_records, 0u);
    EXPECT_EQ(outcome.value().untracked, 2u);
    EXPECT_EQ(outcome.value().report.uploaded_count, 2u);
    EXPECT_EQ(outcome.value().state, JobState::Uploading);
    EXPECT_FALSE(outcome.value().submitted);

    auto saved = checkpoints_.load("job-1");
    ASSERT_TRUE(saved.is_ok());
    EXPECT_EQ(saved.value()->total(), 3u);
    EXPECT_EQ(saved.value()->uploaded, 0u);
}

TEST_F(UploadOrchestratorTest, CreationFailureMovesToError) {
    api_.fail_creation(ApiFailure::from_status(500, "database unavailable"));
    const auto files = ferry::testing::make_images(root_, "trip", 2);
    auto orchestrator = make_orchestrator(api_);

    auto created = orchestrator->create_job(parameters(), files);
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, UploadError::Kind::Api);
    EXPECT_NE(created.error().message.find("database unavailable"), std::string::npos);
    EXPECT_EQ(orchestrator->state(), JobState::Error);
    EXPECT_EQ(orchestrator->machine().history(),
              (std::vector<JobState>{JobState::Idle, JobState::CreatingJob, JobState::Error}));
    EXPECT_EQ(kv_.size(), 0u);
}

TEST_F(UploadOrchestratorTest, TooManyFailuresAbortAndKeepJobResumable) {
    const auto files = ferry::testing::make_images(root_, "trip", 20);
    for (int i = 0; i < 5; ++i) {
        api_.fail_always("img_" + std::to_string(i) + ".jpg", ApiFailure::from_status(400, "rejected"));
    }
    auto orchestrator = make_orchestrator(api_);
    ASSERT_TRUE(orchestrator->create_job(parameters(), files).is_ok());

    auto outcome = orchestrator->start_or_resume_upload("job-1", files);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, UploadError::Kind::Aborted);
    EXPECT_EQ(outcome.error().pending_files, 20u);
    EXPECT_NE(outcome.error().message.find("20 files remain pending"), std::string::npos);
    EXPECT_EQ(orchestrator->state(), JobState::Error);
    EXPECT_EQ(aborts_, 1);
    EXPECT_EQ(api_.total_attempts(), 5u);

    auto saved = checkpoints_.load("job-1");
    ASSERT_TRUE(saved.is_ok());
    EXPECT_EQ(saved.value()->job.state, JobState::Error);

    auto resumable = orchestrator->find_resumable_job();
    ASSERT_TRUE(resumable.is_ok());
    ASSERT_TRUE(resumable.value().has_value());
    EXPECT_EQ(resumable.value()->job.job_id, "job-1");
}

TEST_F(UploadOrchestratorTest, FailedCompletionKeepsCheckpointForRetry) {
    const auto files = ferry::testing::make_images(root_, "trip", 2);
    api_.fail_completion(ApiFailure::from_status(502, "gateway"));
    auto orchestrator = make_orchestrator(api_);
    ASSERT_TRUE(orchestrator->create_job(parameters(), files).is_ok());

    auto outcome = orchestrator->start_or_resume_upload("job-1", files);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, UploadError::Kind::Api);
    EXPECT_EQ(orchestrator->state(), JobState::Error);

    auto saved = checkpoints_.load("job-1");
    ASSERT_TRUE(saved.is_ok());
    ASSERT_TRUE(saved.value().has_value());
    EXPECT_TRUE(saved.value()->is_resolved());

    // Fully uploaded jobs are not offered for resume
    auto resumable = orchestrator->find_resumable_job();
    ASSERT_TRUE(resumable.is_ok());
    EXPECT_FALSE(resumable.value().has_value());

    FakeJobApi healthy;
    auto retry = make_orchestrator(healthy);
    auto submitted = retry->submit_for_processing("job-1");
    ASSERT_TRUE(submitted.is_ok()) << submitted.error().message;
    EXPECT_EQ(healthy.completed_jobs(), (std::vector<std::string>{"job-1"}));
    EXPECT_EQ(retry->state(), JobState::Complete);
    EXPECT_FALSE(checkpoints_.load("job-1").value().has_value());
}

TEST_F(UploadOrchestratorTest, ManualSubmitWhenAutoSubmitIsOff) {
    const auto files = ferry::testing::make_images(root_, "trip", 2);
    OrchestratorOptions options;
    options.auto_submit = false;
    UploadOrchestrator orchestrator(api_, checkpoints_, bus_, options, [](std::chrono::milliseconds) {});

    ASSERT_TRUE(orchestrator.create_job(parameters(), files).is_ok());
    auto outcome = orchestrator.start_or_resume_upload("job-1", files);
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_FALSE(outcome.value().submitted);
    EXPECT_EQ(outcome.value().state, JobState::Uploading);
    EXPECT_TRUE(api_.completed_jobs().empty());

    ASSERT_TRUE(orchestrator.submit_for_processing("job-1").is_ok());
    EXPECT_EQ(orchestrator.state(), JobState::Complete);
}

TEST_F(UploadOrchestratorTest, AbandonRemovesCheckpoint) {
    const auto files = ferry::testing::make_images(root_, "trip", 2);
    auto orchestrator = make_orchestrator(api_);
    ASSERT_TRUE(orchestrator->create_job(parameters(), files).is_ok());

    ASSERT_TRUE(orchestrator->abandon_job("job-1").is_ok());
    EXPECT_FALSE(checkpoints_.load("job-1").value().has_value());
    EXPECT_EQ(orchestrator->state(), JobState::Idle);
    EXPECT_TRUE(orchestrator->current_job_id().empty());
    EXPECT_EQ(states_.back(), JobState::Error);

    auto again = orchestrator->abandon_job("job-1");
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, UploadError::Kind::NotFound);
}

TEST_F(UploadOrchestratorTest, UnknownJobIsNotFound) {
    const auto files = ferry::testing::make_images(root_, "trip", 1);
    auto orchestrator = make_orchestrator(api_);

    auto outcome = orchestrator->start_or_resume_upload("missing", files);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, UploadError::Kind::NotFound);
    EXPECT_EQ(orchestrator->state(), JobState::Idle);

    EXPECT_EQ(orchestrator->progress("missing").error().kind, UploadError::Kind::NotFound);
    EXPECT_EQ(orchestrator->start_or_resume_upload("", files).error().kind, UploadError::Kind::Validation);
}

TEST_F(UploadOrchestratorTest, ResumeByBareNameCompletesTheNamedRecords) {
    const auto files = ferry::testing::make_images(root_, "trip", 3);
    {
        auto first = make_orchestrator(api_);
        ASSERT_TRUE(first->create_job(parameters(), files).is_ok());
    }

    // Reselected without folder information
    std::vector<SourceFile> bare = files;
    for (auto& file : bare) {
        file.relative_path.clear();
    }

    auto second = make_orchestrator(api_);
    auto outcome = second->start_or_resume_upload("job-1", bare);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().message;
    EXPECT_FALSE(outcome.value().used_fallback);
    EXPECT_EQ(outcome.value().matched_records, 3u);
    EXPECT_EQ(outcome.value().untracked, 0u);
    EXPECT_TRUE(outcome.value().submitted);

    std::map<std::string, std::string> sent;
    for (const auto& request : api_.requests()) {
        sent[request.file_path] = request.content_base64;
    }
    ASSERT_EQ(sent.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        const std::string path = "img_" + std::to_string(i) + ".jpg";
        EXPECT_EQ(sent[path], ferry::base64_encode(std::string("jpeg-bytes-" + std::to_string(i)))) << path;
    }
}

TEST_F(UploadOrchestratorTest, SameNamedFileOnlyCompletesItsOwnRecord) {
    const std::vector<SourceFile> files{
        ferry::testing::make_source(root_, "top/x/a.jpg", "XXXX"),
        ferry::testing::make_source(root_, "top/y/a.jpg", "YYYY"),
    };
    {
        auto first = make_orchestrator(api_);
        ASSERT_TRUE(first->create_job(parameters(), files).is_ok());
    }

    // Only the second folder's copy is reselected
    auto second = make_orchestrator(api_);
    auto outcome = second->start_or_resume_upload("job-1", {files[1]});
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().message;
    EXPECT_EQ(outcome.value().matched_records, 1u);
    EXPECT_FALSE(outcome.value().used_fallback);
    EXPECT_FALSE(outcome.value().submitted);
    EXPECT_EQ(outcome.value().progress.uploaded, 1u);
    EXPECT_EQ(second->state(), JobState::Uploading);

    const auto requests = api_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].file_path, "y/a.jpg");
    EXPECT_EQ(requests[0].content_base64, ferry::base64_encode(std::string("YYYY")));

    auto loaded = checkpoints_.load("job-1");
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(loaded.value().has_value());
    for (const auto& record : loaded.value()->files) {
        if (record.path == "top/x/a.jpg") {
            EXPECT_EQ(record.status, FileStatus::Pending);
        } else {
            EXPECT_EQ(record.path, "top/y/a.jpg");
            EXPECT_EQ(record.status, FileStatus::Complete);
        }
    }
}

TEST_F(UploadOrchestratorTest, CreatedJobIsUploadingOnceCheckpointIsWritten) {
    const auto files = ferry::testing::make_images(root_, "trip", 2);
    auto orchestrator = make_orchestrator(api_);

    ASSERT_TRUE(orchestrator->create_job(parameters(), files).is_ok());
    EXPECT_EQ(orchestrator->state(), JobState::Uploading);
    EXPECT_EQ(states_, (std::vector<JobState>{JobState::CreatingJob, JobState::Uploading}));

    auto loaded = checkpoints_.load("job-1");
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(loaded.value()->job.state, JobState::Uploading);
    EXPECT_EQ(api_.total_attempts(), 0u);
}
