/**
 * @file checkpoint_coordinator.hpp
 * @brief Checkpoint persistence and resume-point discovery.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "lifecycle/job.hpp"
#include "storage/artifact_store.hpp"
#include "workflow/workflow_graph.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hybrid_orchestrator {

/**
 * @brief Furthest consistent point of a previously run job.
 *
 * `completed` is dependency-closed: a stage is only marked completed if
 * its own checkpoint verified and all of its dependencies are completed.
 */
struct ResumePoint {
    std::vector<bool> completed;                        ///< indexed like graph.stages()
    std::optional<StageId> latest_stage;                ///< highest-sequence verified stage
    uint64_t last_sequence = 0;
    std::map<StageId, std::map<std::string, StoredOutput>> outputs;
    std::map<StageId, uint32_t> attempts;               ///< attempts already spent per stage
    std::vector<CheckpointRef> checkpoints;             ///< every readable checkpoint, in order
    size_t rejected = 0;                                ///< checkpoints that failed verification

    [[nodiscard]] size_t completed_count() const noexcept;
};

class CheckpointCoordinator {
public:
    CheckpointCoordinator(IArtifactStore& store, Logger& logger);

    /**
     * @brief Write one checkpoint for `stage`.
     *
     * Sequence numbers are monotonic per job. A storage failure is logged
     * and returned; callers treat it as non-fatal.
     */
    Result<CheckpointRef> checkpoint(const JobId& job,
                                     const WorkflowGraph& graph,
                                     const StageId& stage,
                                     uint32_t attempt,
                                     const std::map<std::string, StoredOutput>& outputs,
                                     CheckpointKind kind = CheckpointKind::StageComplete);

    /**
     * @brief Find the resume point of `job` against `graph`.
     *
     * A stage checkpoint counts only if it decodes, belongs to this job and
     * graph fingerprint, names every declared output of its stage, and each
     * output re-reads with the recorded checksum.
     */
    Result<ResumePoint> resume(const JobId& job, const WorkflowGraph& graph);

    [[nodiscard]] uint64_t last_sequence(const JobId& job) const;

    /// Drop the in-memory sequence counter; resume() rebuilds it from storage.
    void forget(const JobId& job);

private:
    bool verify_outputs(const Stage& stage, const std::map<std::string, StoredOutput>& outputs);

    IArtifactStore& store_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::unordered_map<JobId, uint64_t> sequences_;
};

}  // namespace hybrid_orchestrator
