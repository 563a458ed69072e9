/**
 * @file job_state.cpp
 * @brief Transition table and JobLifecycle history.
 */

#include "lifecycle/job_state.hpp"

#include <chrono>

namespace hybrid_orchestrator {

Result<JobState, TransitionError> transition(JobState from, JobEvent event) noexcept {
    if (is_terminal(from)) return TransitionError{from, event};

    switch (event) {
        case JobEvent::Fail:   return JobState::Error;
        case JobEvent::Cancel: return JobState::Cancelled;
        case JobEvent::Expire: return JobState::Timeout;
        case JobEvent::StartCompiling:
            if (from == JobState::Pending) return JobState::Compiling;
            break;
        case JobEvent::FinishCompiling:
            if (from == JobState::Compiling) return JobState::Queued;
            break;
        case JobEvent::StartRunning:
            if (from == JobState::Queued) return JobState::Running;
            break;
        case JobEvent::FinishRunningOk:
            if (from == JobState::Running) return JobState::Done;
            break;
    }
    return TransitionError{from, event};
}

Result<JobState, TransitionError> JobLifecycle::apply(JobEvent event,
                                                      CauseCode cause,
                                                      ArtifactRef detail_ref,
                                                      StageId stage) {
    auto next = transition(state_, event);
    if (!next) return next;

    if ((event == JobEvent::Fail || event == JobEvent::Expire) && cause == CauseCode::None) {
        return TransitionError{state_, event};
    }
    if (event == JobEvent::Cancel && cause == CauseCode::None) {
        cause = CauseCode::Cancelled;
    }

    history_.push_back(StateTransition{
        .from = state_,
        .to = *next,
        .event = event,
        .at = std::chrono::system_clock::now(),
        .cause = cause,
        .detail_ref = std::move(detail_ref),
        .stage = std::move(stage)
    });
    state_ = *next;
    return state_;
}

CauseCode JobLifecycle::cause() const noexcept {
    if (!terminal() || history_.empty()) return CauseCode::None;
    return history_.back().cause;
}

ArtifactRef JobLifecycle::detail_ref() const {
    if (!terminal() || history_.empty()) return {};
    return history_.back().detail_ref;
}

StageId JobLifecycle::failed_stage() const {
    if (state_ != JobState::Error || history_.empty()) return {};
    return history_.back().stage;
}

Result<JobLifecycle, TransitionError> JobLifecycle::restore(
    const std::vector<StateTransition>& history) {
    JobLifecycle lifecycle;
    for (const auto& entry : history) {
        auto next = transition(lifecycle.state_, entry.event);
        if (!next || entry.from != lifecycle.state_ || *next != entry.to) {
            return TransitionError{lifecycle.state_, entry.event};
        }
        lifecycle.history_.push_back(entry);
        lifecycle.state_ = entry.to;
    }
    return lifecycle;
}

}  // namespace hybrid_orchestrator
