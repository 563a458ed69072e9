/**
 * @file event_feed.hpp
 * @brief Ordered, replayable per-job event feed.
 *
 * Every event of a job carries a sequence number that increases by one,
 * starting at 1. A subscriber that saw up to sequence N resumes with
 * read(job, N) and receives every later event exactly once, including at
 * most one terminal state change.
 */

#pragma once

#include "core/types.hpp"
#include "lifecycle/job_state.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hybrid_orchestrator {

enum class FeedEventKind : uint8_t {
    StateChanged,
    StageDispatched,
    StageCompleted,
    StageRetryScheduled,
    StageFailed,
    CheckpointRecorded
};

[[nodiscard]] constexpr std::string_view to_string(FeedEventKind kind) noexcept {
    switch (kind) {
        case FeedEventKind::StateChanged:        return "state_changed";
        case FeedEventKind::StageDispatched:     return "stage_dispatched";
        case FeedEventKind::StageCompleted:      return "stage_completed";
        case FeedEventKind::StageRetryScheduled: return "stage_retry_scheduled";
        case FeedEventKind::StageFailed:         return "stage_failed";
        case FeedEventKind::CheckpointRecorded:  return "checkpoint_recorded";
    }
    return "unknown";
}

struct FeedEvent {
    uint64_t sequence = 0;          ///< assigned by the feed
    JobId job;
    FeedEventKind kind = FeedEventKind::StateChanged;
    Timestamp at;
    JobState state = JobState::Pending;     ///< job state after the event
    StageId stage;
    uint32_t attempt = 0;
    ResourceId resource;
    CauseCode cause = CauseCode::None;
    ArtifactRef ref;                ///< checkpoint or diagnostic reference
    std::string detail;
};

class EventFeed {
public:
    /// Append an event, assigning the job's next sequence number.
    uint64_t publish(FeedEvent event);

    /// Events of `job` with sequence > `after`, in order.
    [[nodiscard]] std::vector<FeedEvent> read(const JobId& job, uint64_t after = 0) const;

    /// Like read(), but blocks up to `timeout` until at least one event is available.
    [[nodiscard]] std::vector<FeedEvent> wait_for(const JobId& job, uint64_t after,
                                                  std::chrono::milliseconds timeout) const;

    [[nodiscard]] uint64_t last_sequence(const JobId& job) const;

    /// Drop the retained log of `job`.
    void forget(const JobId& job);

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::unordered_map<JobId, std::vector<FeedEvent>> events_;
};

}  // namespace hybrid_orchestrator
