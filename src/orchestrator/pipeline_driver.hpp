/**
 * @file pipeline_driver.hpp
 * @brief The control loop that advances admitted jobs through their stages.
 *
 * One dispatcher thread sweeps all live jobs: it starts new jobs, enforces
 * deadlines, writes periodic in-flight checkpoints, evicts jobs that have
 * been terminal longer than the retention window and collects ready
 * stages, which are dispatched in (job priority, topological rank,
 * arrival) order. Stage attempts run on a DispatchPool; only those workers
 * ever wait on a collaborator. Every mutation of a job happens under that
 * job's mutex, so the transitions of one job are totally ordered.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/classical_evaluator.hpp"
#include "executor/collaborators.hpp"
#include "executor/dispatch_pool.hpp"
#include "lifecycle/job.hpp"
#include "orchestrator/event_feed.hpp"
#include "recovery/checkpoint_coordinator.hpp"
#include "scheduler/allocation_engine.hpp"
#include "storage/artifact_store.hpp"
#include "workflow/readiness.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hybrid_orchestrator {

struct DriverOptions {
    RetryPolicy default_retry;
    CheckpointConfig checkpoint;
    double success_rate_smoothing = 0.2;
    std::chrono::milliseconds poll_interval{50};
    uint32_t worker_threads = 0;
    std::chrono::milliseconds retention{60000};     ///< terminal jobs are evicted after this
};

/**
 * @brief Externally visible snapshot of one job.
 */
struct JobStatus {
    JobId id;
    JobState state = JobState::Pending;
    double progress = 0.0;
    CauseCode cause = CauseCode::None;
    ArtifactRef detail_ref;
    StageId failed_stage;
    bool cancel_requested = false;
    int32_t priority = 0;
    std::vector<StateTransition> transitions;
    std::vector<CheckpointRef> checkpoints;
    std::vector<StageRecord> stages;
};

/// Build a status view from a persisted job record.
[[nodiscard]] JobStatus status_from_record(const JobRecord& record);

/**
 * @brief Collaborators and shared services the driver works against.
 *
 * All references must outlive the driver.
 */
struct DriverContext {
    IArtifactStore& store;
    ICompiler& compiler;
    IBackendExecutor& backend;
    const ClassicalEvaluator& evaluator;
    AllocationEngine& engine;
    CheckpointCoordinator& checkpoints;
    EventFeed& feed;
    Logger& logger;
};

class PipelineDriver {
public:
    PipelineDriver(DriverContext context, DriverOptions options);
    ~PipelineDriver();

    PipelineDriver(const PipelineDriver&) = delete;
    PipelineDriver& operator=(const PipelineDriver&) = delete;

    void start();

    /**
     * @brief Stop the dispatcher and signal every in-flight attempt.
     *
     * Interrupted attempts are requeued, not failed, so live jobs continue
     * after a later start().
     */
    void stop();

    /**
     * @brief Hand a job to the driver.
     *
     * The tracker must be built over `*job.graph`. Fails if a job with the
     * same id is still held, terminal or not. A job whose lifecycle was
     * restored past PENDING continues from its restored state.
     */
    Result<void> admit(Job job, std::unique_ptr<ReadinessTracker> tracker);

    /**
     * @brief Request cooperative cancellation.
     *
     * No further stage is dispatched; the job becomes CANCELLED once no
     * attempt is in flight. Returns false for unknown or terminal jobs.
     */
    bool request_cancel(const JobId& id);

    [[nodiscard]] std::optional<JobStatus> status(const JobId& id) const;
    [[nodiscard]] bool contains(const JobId& id) const;

    /// Block until the job is terminal or `timeout` elapses.
    bool wait_for_terminal(const JobId& id, std::chrono::milliseconds timeout) const;

    /// Jobs held in memory, including terminal ones not yet evicted.
    [[nodiscard]] size_t job_count() const;
    [[nodiscard]] bool running() const noexcept { return running_.load(); }

private:
    struct JobContext {
        Job job;
        std::unique_ptr<ReadinessTracker> tracker;
        mutable std::mutex mutex;
        mutable std::condition_variable terminal_cv;
        std::map<size_t, std::stop_source> attempt_stops;  ///< by stage index
        std::set<size_t> lease_expired;
        std::optional<SteadyTime> finished_at;
        bool started = false;
        bool terminating = false;
        bool cancel_requested = false;
        JobEvent pending_event = JobEvent::Cancel;
        CauseCode pending_cause = CauseCode::None;
        ArtifactRef pending_detail;
        StageId pending_stage;
        uint32_t in_flight = 0;
    };
    using JobHandle = std::shared_ptr<JobContext>;

    struct Candidate {
        int32_t priority;
        size_t rank;
        uint64_t arrival;
        size_t index;
        JobHandle job;
    };

    /// Everything a worker needs to run one attempt without the job lock.
    struct StageAttempt {
        size_t index = 0;
        uint32_t attempt = 0;
        uint64_t lease_id = 0;
        ResourceId resource;
        std::vector<ArtifactRef> inputs;        ///< parallel to stage.inputs
        std::stop_token stop;
    };

    struct StageOutcome {
        std::optional<DispatchError> error;
        std::map<std::string, StoredOutput> outputs;
        uint64_t lease_id = 0;
        ResourceId resource;
    };

    void run(std::stop_token stop);
    void sweep(const JobHandle& handle, SteadyTime now,
               std::vector<Candidate>& candidates, SteadyTime& next_wake);
    void try_dispatch(const JobHandle& handle, size_t index, SteadyTime now);
    void run_stage(const JobHandle& handle, StageAttempt attempt);
    StageOutcome execute_stage(const Job& job, const Stage& stage, StageAttempt& attempt);
    void on_stage_finished(const JobHandle& handle, const StageAttempt& attempt, StageOutcome outcome);

    void advance_phase(JobContext& ctx);
    bool apply_event(JobContext& ctx, JobEvent event, CauseCode cause = CauseCode::None,
                     ArtifactRef detail = {}, StageId stage = {});
    void fail_stage(JobContext& ctx, size_t index, CauseCode cause, const std::string& message);
    void internal_error(JobContext& ctx, size_t index, const std::string& message);
    void begin_termination(JobContext& ctx, JobEvent event, CauseCode cause,
                           ArtifactRef detail, StageId stage);
    void finalize(JobContext& ctx);
    void write_progress_checkpoints(JobContext& ctx, SteadyTime now, SteadyTime& next_wake);
    void interrupt_expired(const ResourceAllocation& lease);
    void evict_finished(SteadyTime now);
    static void stop_attempts(JobContext& ctx);

    ArtifactRef persist_diagnostic(const JobId& job, const StageId& stage,
                                   std::string_view kind, const std::string& message);
    void persist_record(const JobContext& ctx);
    FeedEvent make_event(const JobContext& ctx, FeedEventKind kind) const;
    static JobStatus make_status(const JobContext& ctx);

    [[nodiscard]] JobHandle find(const JobId& id) const;
    [[nodiscard]] std::vector<JobHandle> live_jobs() const;
    void wake();

    DriverContext env_;
    DriverOptions options_;

    mutable std::mutex jobs_mutex_;
    std::unordered_map<JobId, JobHandle> jobs_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    bool wake_pending_ = false;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutting_down_{false};
    std::jthread dispatcher_;

    // Destroyed first: drains queued attempts while everything above is alive.
    DispatchPool pool_;
};

}  // namespace hybrid_orchestrator
