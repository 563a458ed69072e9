/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade that ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Admitting workflows as jobs (submit) and resuming them from checkpoints
 *   2. Querying job status and the ordered per-job event feed
 *   3. Cooperative cancellation
 *
 * Collaborators (storage, compiler, backend) are injected; any that are
 * left empty default to the configured artifact store and the simulated
 * compiler/backend.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/classical_evaluator.hpp"
#include "executor/collaborators.hpp"
#include "orchestrator/event_feed.hpp"
#include "orchestrator/pipeline_driver.hpp"
#include "recovery/checkpoint_coordinator.hpp"
#include "scheduler/allocation_engine.hpp"
#include "scheduler/resource.hpp"
#include "storage/artifact_store.hpp"
#include "workflow/workflow_graph.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hybrid_orchestrator {

struct OrchestratorSubmitOptions {
    int32_t priority = 0;
    std::optional<std::chrono::milliseconds> timeout;   ///< overrides the configured default
    std::optional<JobId> job_id;                        ///< generated when empty
};

class Orchestrator {
public:
    struct Collaborators {
        std::shared_ptr<IArtifactStore> store;
        std::shared_ptr<ICompiler> compiler;
        std::shared_ptr<IBackendExecutor> backend;
    };

    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        Collaborators collaborators;
    };

    using SubmitOptions = OrchestratorSubmitOptions;

    explicit Orchestrator(Options opts);
    ~Orchestrator();

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Register the configured resources (first start only) and start dispatching.
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Admission ────────────────────────────

    /**
     * @brief Validate and admit a workflow.
     *
     * Rejected workflows never enter the state machine. Classical stages
     * must name a registered function. An explicit job id must not already
     * have a stored record.
     */
    Result<JobId, ValidationError> submit(WorkflowIR ir, SubmitOptions opts = {});
    Result<JobId, ValidationError> submit(std::shared_ptr<const WorkflowGraph> graph,
                                          SubmitOptions opts = {});

    /**
     * @brief Re-admit `id` from its verified checkpoints.
     *
     * Stages in the resume point's completed set keep their stored outputs
     * and are not dispatched again. A job interrupted by shutdown continues
     * its stored lifecycle; a job with no stored record starts from PENDING.
     * Jobs that are held in memory or whose stored record is terminal are
     * refused.
     */
    Result<JobId> resume(const JobId& id, std::shared_ptr<const WorkflowGraph> graph,
                         SubmitOptions opts = {});

    // ── Queries ──────────────────────────────

    /// Live status, or the last persisted record for jobs not held in memory.
    [[nodiscard]] std::optional<JobStatus> status(const JobId& id) const;
    bool cancel(const JobId& id);

    [[nodiscard]] std::vector<FeedEvent> events(const JobId& id, uint64_t after = 0) const;
    [[nodiscard]] std::vector<FeedEvent> wait_events(const JobId& id, uint64_t after,
                                                     std::chrono::milliseconds timeout) const;
    bool wait_for_terminal(const JobId& id, std::chrono::milliseconds timeout) const;

    /// Decoded value of a completed stage output.
    [[nodiscard]] Result<Datum> stage_output(const JobId& id, const StageId& stage,
                                             const std::string& output) const;

    // ── Accessors (for testing) ─────────────
    ResourceRegistry& resources() { return registry_; }
    AllocationEngine& allocation() { return engine_; }
    ClassicalEvaluator& evaluator() { return evaluator_; }
    IArtifactStore& store() { return *store_; }
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }
    size_t resident_jobs() const { return driver_->job_count(); }

private:
    Result<JobId, ValidationError> admit(std::shared_ptr<const WorkflowGraph> graph,
                                         SubmitOptions opts);
    std::optional<ValidationError> check_functions(const WorkflowGraph& graph) const;
    Job make_job(const JobId& id, std::shared_ptr<const WorkflowGraph> graph,
                 const SubmitOptions& opts);

    Config config_;
    mutable Logger logger_;

    std::shared_ptr<IArtifactStore> store_;
    std::shared_ptr<ICompiler> compiler_;
    std::shared_ptr<IBackendExecutor> backend_;

    ResourceRegistry registry_;
    AllocationEngine engine_;
    ClassicalEvaluator evaluator_;
    CheckpointCoordinator coordinator_;
    EventFeed feed_;
    std::unique_ptr<PipelineDriver> driver_;

    std::atomic<uint64_t> next_job_{0};
    std::atomic<uint64_t> arrival_{0};
    std::atomic<bool> running_{false};
    bool resources_registered_ = false;
};

}  // namespace hybrid_orchestrator
