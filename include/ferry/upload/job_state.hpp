#pragma once

#include "ferry/core/result.hpp"
#include "ferry/upload/types.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace ferry::upload {

/**
 * @brief Lifecycle of one upload attempt
 *
 *   Idle -> CreatingJob -> Uploading -> Completing -> Complete
 *   Idle -> Uploading                       (resume entry)
 *   CreatingJob | Uploading | Completing -> Error
 *
 * Complete and Error are terminal. A resume or a new job gets a new machine.
 */
class JobStateMachine {
public:
    using Listener = std::function<void(JobState from, JobState to, const std::string& cause)>;

    JobStateMachine();

    [[nodiscard]] JobState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] const std::vector<JobState>& history() const noexcept { return history_; }
    [[nodiscard]] bool is_terminal() const noexcept;

    /// Re-entering the current state is a no-op success
    Result<void> transition_to(JobState next_state);

    /// Moves to Error and records the cause
    Result<void> fail(std::string cause);

    [[nodiscard]] bool can_transition(JobState target) const noexcept;

    void set_listener(Listener listener) { listener_ = std::move(listener); }

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    JobState state_ = JobState::Idle;
    std::string last_error_;
    std::vector<JobState> history_;
    std::chrono::system_clock::time_point last_transition_{};
    Listener listener_;
};

} // namespace ferry::upload
