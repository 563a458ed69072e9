/**
 * @file job.hpp
 * @brief Job aggregate: one workflow graph, its lifecycle, and per-stage
 *        runtime records.
 */

#pragma once

#include "core/types.hpp"
#include "lifecycle/job_state.hpp"
#include "workflow/workflow_graph.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hybrid_orchestrator {

// ─────────────────────────────────────────────
// Stage Runtime
// ─────────────────────────────────────────────

enum class StagePhase : uint8_t {
    Waiting,        ///< dependencies outstanding
    Ready,
    BackingOff,     ///< failed attempt, retry scheduled
    Running,
    Completed,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(StagePhase phase) noexcept {
    switch (phase) {
        case StagePhase::Waiting:    return "waiting";
        case StagePhase::Ready:      return "ready";
        case StagePhase::BackingOff: return "backing_off";
        case StagePhase::Running:    return "running";
        case StagePhase::Completed:  return "completed";
        case StagePhase::Failed:     return "failed";
    }
    return "unknown";
}

/// A persisted stage output and the checksum recorded when it was written.
struct StoredOutput {
    ArtifactRef ref;
    uint64_t checksum = 0;

    bool operator==(const StoredOutput&) const = default;
};

struct StageRuntime {
    StagePhase phase = StagePhase::Waiting;
    uint32_t attempts = 0;
    ResourceId resource;                        ///< last assigned resource
    uint64_t lease_id = 0;                      ///< 0 = no lease held
    std::map<std::string, StoredOutput> outputs;
    ArtifactRef checkpoint_ref;
    CauseCode last_cause = CauseCode::None;
    std::string last_error;
    std::optional<SteadyTime> not_before;       ///< backoff gate
    std::optional<SteadyTime> dispatched_at;
    std::optional<SteadyTime> last_checkpoint_at;
};

// ─────────────────────────────────────────────
// Checkpoints
// ─────────────────────────────────────────────

enum class CheckpointKind : uint8_t {
    StageComplete,
    InFlight        ///< progress marker for a long stage; never a resume point
};

struct CheckpointRef {
    ArtifactRef ref;
    StageId stage;
    uint32_t attempt = 0;
    uint64_t sequence = 0;
    CheckpointKind kind = CheckpointKind::StageComplete;

    bool operator==(const CheckpointRef&) const = default;
};

// ─────────────────────────────────────────────
// Persisted Job Record
// ─────────────────────────────────────────────

struct StageRecord {
    StageId id;
    StagePhase phase = StagePhase::Waiting;
    uint32_t attempts = 0;
    ResourceId resource;
    ArtifactRef checkpoint_ref;
    CauseCode last_cause = CauseCode::None;
    std::map<std::string, StoredOutput> outputs;
};

/**
 * @brief Everything needed to audit the scheduling decisions of one job.
 */
struct JobRecord {
    JobId id;
    std::string workflow;
    uint64_t fingerprint = 0;
    int32_t priority = 0;
    JobState state = JobState::Pending;
    std::vector<StateTransition> transitions;
    std::vector<StageRecord> stages;
    std::vector<CheckpointRef> checkpoints;
};

// ─────────────────────────────────────────────
// Job
// ─────────────────────────────────────────────

/**
 * @brief Owning aggregate for one admitted workflow.
 *
 * The graph is shared read-only; re-planning yields a new graph and a new
 * job. Access to a live Job is serialized by the pipeline driver.
 */
struct Job {
    JobId id;
    int32_t priority = 0;
    uint64_t arrival = 0;                       ///< admission order, for tie-breaking
    std::shared_ptr<const WorkflowGraph> graph;
    JobLifecycle lifecycle;
    std::vector<StageRuntime> stages;           ///< indexed like graph->stages()
    std::vector<CheckpointRef> checkpoints;
    Timestamp submitted_at;
    std::optional<SteadyTime> deadline;

    [[nodiscard]] JobRecord record() const;
};

}  // namespace hybrid_orchestrator
