#include "ferry/upload/job_state.hpp"

#include <gtest/gtest.h>

#include <tuple>
#include <vector>

using ferry::upload::JobState;
using ferry::upload::JobStateMachine;

TEST(JobStateMachineTest, FreshJobRunsToCompletion) {
    JobStateMachine machine;
    EXPECT_EQ(machine.state(), JobState::Idle);

    ASSERT_TRUE(machine.transition_to(JobState::CreatingJob).is_ok());
    ASSERT_TRUE(machine.transition_to(JobState::Uploading).is_ok());
    ASSERT_TRUE(machine.transition_to(JobState::Completing).is_ok());
    ASSERT_TRUE(machine.transition_to(JobState::Complete).is_ok());

    EXPECT_TRUE(machine.is_terminal());
    EXPECT_EQ(machine.history(), (std::vector<JobState>{JobState::Idle, JobState::CreatingJob,
                                                        JobState::Uploading, JobState::Completing,
                                                        JobState::Complete}));
}

TEST(JobStateMachineTest, ResumeEntersUploadingDirectly) {
    JobStateMachine machine;
    ASSERT_TRUE(machine.transition_to(JobState::Uploading).is_ok());
    EXPECT_EQ(machine.state(), JobState::Uploading);
}

TEST(JobStateMachineTest, RejectsSkippingStates) {
    JobStateMachine machine;
    EXPECT_TRUE(machine.transition_to(JobState::Completing).is_error());
    EXPECT_TRUE(machine.transition_to(JobState::Complete).is_error());
    EXPECT_FALSE(machine.can_transition(JobState::Error));

    ASSERT_TRUE(machine.transition_to(JobState::CreatingJob).is_ok());
    EXPECT_TRUE(machine.transition_to(JobState::Complete).is_error());
    EXPECT_EQ(machine.state(), JobState::CreatingJob);
}

TEST(JobStateMachineTest, ReenteringCurrentStateIsNoOp) {
    JobStateMachine machine;
    ASSERT_TRUE(machine.transition_to(JobState::Uploading).is_ok());
    ASSERT_TRUE(machine.transition_to(JobState::Uploading).is_ok());
    EXPECT_EQ(machine.history().size(), 2u);
}

TEST(JobStateMachineTest, FailRecordsCauseAndIsTerminal) {
    JobStateMachine machine;
    ASSERT_TRUE(machine.transition_to(JobState::Uploading).is_ok());
    ASSERT_TRUE(machine.fail("5 files failed").is_ok());

    EXPECT_EQ(machine.state(), JobState::Error);
    EXPECT_EQ(machine.last_error(), "5 files failed");
    EXPECT_TRUE(machine.is_terminal());
    EXPECT_TRUE(machine.transition_to(JobState::Uploading).is_error());
    EXPECT_TRUE(machine.transition_to(JobState::Idle).is_error());
}

TEST(JobStateMachineTest, CompleteIsTerminal) {
    JobStateMachine machine;
    ASSERT_TRUE(machine.transition_to(JobState::Uploading).is_ok());
    ASSERT_TRUE(machine.transition_to(JobState::Completing).is_ok());
    ASSERT_TRUE(machine.transition_to(JobState::Complete).is_ok());

    EXPECT_TRUE(machine.fail("late").is_error());
    EXPECT_EQ(machine.state(), JobState::Complete);
}

TEST(JobStateMachineTest, ListenerSeesEveryTransition) {
    JobStateMachine machine;
    std::vector<std::tuple<JobState, JobState, std::string>> seen;
    machine.set_listener([&](JobState from, JobState to, const std::string& cause) {
        seen.emplace_back(from, to, cause);
    });

    ASSERT_TRUE(machine.transition_to(JobState::CreatingJob).is_ok());
    ASSERT_TRUE(machine.transition_to(JobState::CreatingJob).is_ok());
    ASSERT_TRUE(machine.fail("HTTP 500").is_ok());

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(std::get<0>(seen[0]), JobState::Idle);
    EXPECT_EQ(std::get<1>(seen[0]), JobState::CreatingJob);
    EXPECT_EQ(std::get<1>(seen[1]), JobState::Error);
    EXPECT_EQ(std::get<2>(seen[1]), "HTTP 500");
}

TEST(JobStateNamesTest, RoundTripNames) {
    EXPECT_EQ(ferry::upload::to_string(JobState::CreatingJob), "creating_job");
    EXPECT_EQ(ferry::upload::job_state_from_string("uploading"), JobState::Uploading);
    EXPECT_FALSE(ferry::upload::job_state_from_string("paused").has_value());
}
