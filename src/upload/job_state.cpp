#include "ferry/upload/job_state.hpp"

#include <algorithm>
#include <unordered_map>

namespace ferry::upload {
namespace {

bool is_progressive(JobState current, JobState target) {
    static const std::unordered_map<JobState, std::vector<JobState>> transitions {
        {JobState::Idle, {JobState::CreatingJob, JobState::Uploading}},
        {JobState::CreatingJob, {JobState::Uploading, JobState::Error}},
        {JobState::Uploading, {JobState::Completing, JobState::Error}},
        {JobState::Completing, {JobState::Complete, JobState::Error}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

JobStateMachine::JobStateMachine() {
    history_.push_back(JobState::Idle);
    last_transition_ = std::chrono::system_clock::now();
}

bool JobStateMachine::is_terminal() const noexcept {
    return state_ == JobState::Complete || state_ == JobState::Error;
}

Result<void> JobStateMachine::transition_to(JobState next_state) {
    if (state_ == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>("Illegal job state transition " + to_string(state_) + " -> " + to_string(next_state));
    }

    const JobState previous = state_;
    state_ = next_state;
    history_.push_back(next_state);
    last_transition_ = std::chrono::system_clock::now();
    if (next_state != JobState::Error) {
        last_error_.clear();
    }

    if (listener_) {
        listener_(previous, next_state, last_error_);
    }
    return Ok();
}

Result<void> JobStateMachine::fail(std::string cause) {
    if (!can_transition(JobState::Error)) {
        return Err<void>("Cannot fail a job in state " + to_string(state_));
    }
    last_error_ = std::move(cause);
    return transition_to(JobState::Error);
}

bool JobStateMachine::can_transition(JobState target) const noexcept {
    if (state_ == target) {
        return true;
    }
    if (is_terminal()) {
        return false;
    }
    return is_progressive(state_, target);
}

} // namespace ferry::upload
