/**
 * @file job_state.hpp
 * @brief Job lifecycle state machine.
 *
 *   PENDING → COMPILING → QUEUED → RUNNING → DONE
 *      └──────────┴──────────┴─────────┴──→ ERROR | CANCELLED | TIMEOUT
 *
 * The transition function is pure; JobLifecycle applies it and keeps the
 * audit history. Terminal states accept no event.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hybrid_orchestrator {

enum class JobState : uint8_t {
    Pending,
    Compiling,
    Queued,
    Running,
    Done,
    Error,
    Cancelled,
    Timeout
};

enum class JobEvent : uint8_t {
    StartCompiling,
    FinishCompiling,
    StartRunning,
    FinishRunningOk,
    Fail,
    Cancel,
    Expire
};

[[nodiscard]] constexpr std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Pending:   return "PENDING";
        case JobState::Compiling: return "COMPILING";
        case JobState::Queued:    return "QUEUED";
        case JobState::Running:   return "RUNNING";
        case JobState::Done:      return "DONE";
        case JobState::Error:     return "ERROR";
        case JobState::Cancelled: return "CANCELLED";
        case JobState::Timeout:   return "TIMEOUT";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view to_string(JobEvent event) noexcept {
    switch (event) {
        case JobEvent::StartCompiling:  return "start_compiling";
        case JobEvent::FinishCompiling: return "finish_compiling";
        case JobEvent::StartRunning:    return "start_running";
        case JobEvent::FinishRunningOk: return "finish_running_ok";
        case JobEvent::Fail:            return "fail";
        case JobEvent::Cancel:          return "cancel";
        case JobEvent::Expire:          return "expire";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(JobState state) noexcept {
    return state == JobState::Done || state == JobState::Error
        || state == JobState::Cancelled || state == JobState::Timeout;
}

/// Coarse progress indicator reported by status queries.
[[nodiscard]] constexpr double progress(JobState state) noexcept {
    switch (state) {
        case JobState::Pending:   return 0.0;
        case JobState::Compiling: return 0.25;
        case JobState::Queued:    return 0.5;
        case JobState::Running:   return 0.75;
        default:                  return 1.0;
    }
}

struct TransitionError {
    JobState from;
    JobEvent event;

    [[nodiscard]] std::string message() const {
        return "invalid transition: " + std::string{to_string(event)}
             + " from " + std::string{to_string(from)};
    }
};

/// Pure transition function.
[[nodiscard]] Result<JobState, TransitionError> transition(JobState from, JobEvent event) noexcept;

// ─────────────────────────────────────────────
// Transition History
// ─────────────────────────────────────────────

struct StateTransition {
    JobState from;
    JobState to;
    JobEvent event;
    Timestamp at;
    CauseCode cause = CauseCode::None;
    ArtifactRef detail_ref;     ///< diagnostic detail held by the storage collaborator
    StageId stage;              ///< originating stage for ERROR, if any
};

/**
 * @brief State plus ordered transition history of one job.
 *
 * Not thread-safe; the owning job serializes access.
 */
class JobLifecycle {
public:
    JobLifecycle() = default;

    /**
     * @brief Apply an event.
     *
     * Fail and Expire must carry a cause code other than None.
     */
    Result<JobState, TransitionError> apply(JobEvent event,
                                            CauseCode cause = CauseCode::None,
                                            ArtifactRef detail_ref = {},
                                            StageId stage = {});

    [[nodiscard]] JobState state() const noexcept { return state_; }
    [[nodiscard]] bool terminal() const noexcept { return is_terminal(state_); }
    [[nodiscard]] const std::vector<StateTransition>& history() const noexcept { return history_; }

    /// Cause of the terminal transition (None while running or after DONE).
    [[nodiscard]] CauseCode cause() const noexcept;
    [[nodiscard]] ArtifactRef detail_ref() const;
    [[nodiscard]] StageId failed_stage() const;

    /**
     * @brief Rebuild a lifecycle from a persisted history.
     *
     * Every entry is re-checked against the transition function, so a
     * restored lifecycle is always a valid path from PENDING.
     */
    [[nodiscard]] static Result<JobLifecycle, TransitionError> restore(
        const std::vector<StateTransition>& history);

private:
    JobState state_ = JobState::Pending;
    std::vector<StateTransition> history_;
};

}  // namespace hybrid_orchestrator
