/**
 * @file orchestrator.cpp
 * @brief Orchestrator facade implementation.
 */

#include "orchestrator/orchestrator.hpp"

#include "executor/simulated.hpp"
#include "recovery/retry.hpp"
#include "scheduler/policy.hpp"
#include "storage/record_codec.hpp"
#include "workflow/readiness.hpp"

#include <algorithm>
#include <format>

namespace hybrid_orchestrator {

namespace {

constexpr std::string_view kComponent = "orchestrator";

std::shared_ptr<IArtifactStore> default_store(const StorageConfig& cfg) {
    if (cfg.backend == "local") {
        return std::make_shared<LocalArtifactStore>(cfg.root);
    }
    return std::make_shared<MemoryArtifactStore>();
}

DriverOptions driver_options(const Config& cfg) {
    return DriverOptions{
        .default_retry = retry_policy_from(cfg.retry),
        .checkpoint = cfg.checkpoint,
        .success_rate_smoothing = cfg.scheduler.fitness.success_rate_smoothing,
        .poll_interval = std::chrono::milliseconds{std::max<uint32_t>(cfg.orchestrator.poll_interval_ms, 1)},
        .worker_threads = cfg.orchestrator.worker_threads,
        .retention = std::chrono::milliseconds{
            static_cast<int64_t>(cfg.orchestrator.terminal_retention_ms)}
    };
}

}  // anonymous namespace

Orchestrator::Orchestrator(Options opts)
    : config_(std::move(opts.config))
    , logger_(std::move(opts.log_sink), opts.log_level)
    , store_(opts.collaborators.store ? std::move(opts.collaborators.store)
                                      : default_store(config_.storage))
    , compiler_(opts.collaborators.compiler ? std::move(opts.collaborators.compiler)
                                            : std::shared_ptr<ICompiler>(std::make_shared<SimulatedCompiler>()))
    , backend_(opts.collaborators.backend ? std::move(opts.collaborators.backend)
                                          : std::shared_ptr<IBackendExecutor>(std::make_shared<SimulatedBackend>()))
    , engine_(registry_, make_policy(config_.scheduler), logger_,
              std::chrono::milliseconds{static_cast<int64_t>(config_.scheduler.lease_timeout_ms)})
    , coordinator_(*store_, logger_) {
    driver_ = std::make_unique<PipelineDriver>(
        DriverContext{
            .store = *store_,
            .compiler = *compiler_,
            .backend = *backend_,
            .evaluator = evaluator_,
            .engine = engine_,
            .checkpoints = coordinator_,
            .feed = feed_,
            .logger = logger_
        },
        driver_options(config_));
}

Orchestrator::~Orchestrator() {
    stop();
    driver_.reset();
    logger_.flush();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> Orchestrator::start() {
    if (running_.exchange(true)) {
        return Error{"Already running"};
    }

    if (!resources_registered_) {
        const auto now = std::chrono::system_clock::now();
        for (const auto& cfg : config_.resources) {
            auto added = registry_.add(Resource::from_config(cfg, now));
            if (!added) {
                running_ = false;
                return Error{"resource '" + cfg.id + "': " + added.error().message};
            }
        }
        resources_registered_ = true;
    }

    logger_.info(kComponent, std::format("starting: instance={} policy={} resources={}",
                                         config_.orchestrator.instance_id,
                                         engine_.policy().name(), registry_.size()));
    driver_->start();
    return {};
}

void Orchestrator::stop() {
    if (!running_.exchange(false)) return;
    logger_.info(kComponent, "shutting down");
    driver_->stop();
    logger_.flush();
}

// ─────────────────────────────────────────────
// Admission
// ─────────────────────────────────────────────

Result<JobId, ValidationError> Orchestrator::submit(WorkflowIR ir, SubmitOptions opts) {
    const std::string name = ir.name;
    auto graph = WorkflowGraph::build(std::move(ir));
    if (!graph) {
        const auto& err = graph.error();
        logger_.warn(kComponent, std::format("rejected workflow '{}': {} {}",
                                             name, to_string(err.kind), err.message));
        return err;
    }
    return admit(std::make_shared<const WorkflowGraph>(std::move(*graph)), std::move(opts));
}

Result<JobId, ValidationError> Orchestrator::submit(std::shared_ptr<const WorkflowGraph> graph,
                                                    SubmitOptions opts) {
    if (!graph) {
        return ValidationError{ValidationError::Kind::EmptyGraph, {}, "no graph"};
    }
    return admit(std::move(graph), std::move(opts));
}

Result<JobId, ValidationError> Orchestrator::admit(std::shared_ptr<const WorkflowGraph> graph,
                                                   SubmitOptions opts) {
    if (auto err = check_functions(*graph)) {
        logger_.warn(kComponent, std::format("rejected workflow '{}': {}", graph->name(), err->message));
        return *err;
    }

    JobId id;
    if (opts.job_id) {
        id = *opts.job_id;
        if (auto valid = validate_segment("job id", id); !valid) {
            return ValidationError{ValidationError::Kind::InvalidJobId, {}, valid.error().message};
        }
        auto known = store_->has_job_record(id);
        if (!known) {
            return ValidationError{ValidationError::Kind::InvalidJobId, {}, known.error().message};
        }
        if (*known) {
            return ValidationError{ValidationError::Kind::InvalidJobId, {},
                                   "job '" + id + "' already has a stored record; resume it instead"};
        }
    } else {
        // Generated ids skip anything a previous instance left in the store
        while (true) {
            id = std::format("{}-{:06}", config_.orchestrator.instance_id, ++next_job_);
            auto known = store_->has_job_record(id);
            if (!known) {
                return ValidationError{ValidationError::Kind::InvalidJobId, {}, known.error().message};
            }
            if (!*known) break;
        }
    }

    Job job = make_job(id, graph, opts);
    auto tracker = std::make_unique<ReadinessTracker>(*job.graph);
    if (auto admitted = driver_->admit(std::move(job), std::move(tracker)); !admitted) {
        logger_.warn(kComponent, std::format("rejected job {}: {}", id, admitted.error().message));
        return ValidationError{ValidationError::Kind::InvalidJobId, {}, admitted.error().message};
    }

    logger_.info(kComponent, std::format("admitted job {} (workflow '{}', {} stages, priority {})",
                                         id, graph->name(), graph->stage_count(), opts.priority));
    return id;
}

std::optional<ValidationError> Orchestrator::check_functions(const WorkflowGraph& graph) const {
    for (const auto& stage : graph.stages()) {
        const auto* classical = std::get_if<ClassicalStage>(&stage.body);
        if (classical && !evaluator_.has(classical->function)) {
            return ValidationError{ValidationError::Kind::UnsupportedStage, stage.id,
                                   "unknown classical function '" + classical->function + "'"};
        }
    }
    return std::nullopt;
}

Job Orchestrator::make_job(const JobId& id, std::shared_ptr<const WorkflowGraph> graph,
                           const SubmitOptions& opts) {
    Job job;
    job.id = id;
    job.priority = opts.priority;
    job.arrival = ++arrival_;
    job.stages.resize(graph->stage_count());
    job.graph = std::move(graph);
    job.submitted_at = std::chrono::system_clock::now();

    auto timeout = opts.timeout;
    if (!timeout && config_.orchestrator.default_job_timeout_ms > 0) {
        timeout = std::chrono::milliseconds{
            static_cast<int64_t>(config_.orchestrator.default_job_timeout_ms)};
    }
    if (timeout) {
        job.deadline = std::chrono::steady_clock::now() + *timeout;
    }
    return job;
}

Result<JobId> Orchestrator::resume(const JobId& id, std::shared_ptr<const WorkflowGraph> graph,
                                   SubmitOptions opts) {
    if (!graph) return Error{"no graph"};
    if (auto err = check_functions(*graph)) return Error{err->message};
    if (auto live = driver_->status(id)) {
        return Error{"job '" + id + "' is " + (is_terminal(live->state) ? "already finished" : "still active")};
    }
    if (auto valid = validate_segment("job id", id); !valid) return valid.error();

    std::optional<JobLifecycle> lifecycle;
    auto known = store_->has_job_record(id);
    if (!known) return known.error();
    if (*known) {
        auto bytes = store_->get_job_record(id);
        if (!bytes) return bytes.error();
        auto record = RecordCodec::decode_job_record(*bytes);
        if (!record) return Error{"stored record of '" + id + "' is unreadable: " + record.error().message};
        if (is_terminal(record->state)) {
            return Error{std::format("job '{}' already finished as {}", id, to_string(record->state))};
        }
        if (record->fingerprint != graph->fingerprint()) {
            return Error{"job '" + id + "' was submitted with a different workflow"};
        }
        auto restored = JobLifecycle::restore(record->transitions);
        if (!restored) return Error{"stored history of '" + id + "': " + restored.error().message()};
        lifecycle = std::move(*restored);
    }

    auto point = coordinator_.resume(id, *graph);
    if (!point) return point.error();

    auto tracker = ReadinessTracker::from_completed(*graph, point->completed);
    if (!tracker) return tracker.error();

    opts.job_id = id;
    Job job = make_job(id, graph, opts);
    job.checkpoints = point->checkpoints;
    if (lifecycle) job.lifecycle = std::move(*lifecycle);

    for (size_t i = 0; i < graph->stage_count(); ++i) {
        if (!point->completed[i]) continue;
        const auto& stage_id = graph->stage(i).id;
        auto& rt = job.stages[i];
        rt.phase = StagePhase::Completed;
        rt.outputs = point->outputs[stage_id];
        rt.attempts = point->attempts[stage_id];
        for (const auto& cp : point->checkpoints) {
            if (cp.stage == stage_id && cp.kind == CheckpointKind::StageComplete) {
                rt.checkpoint_ref = cp.ref;
            }
        }
    }

    auto admitted = driver_->admit(std::move(job),
                                   std::make_unique<ReadinessTracker>(std::move(*tracker)));
    if (!admitted) return admitted.error();

    logger_.info(kComponent, std::format("resumed job {} in {}: {}/{} stages restored, {} checkpoints rejected",
                                         id, lifecycle ? to_string(lifecycle->state()) : "pending",
                                         point->completed_count(), graph->stage_count(),
                                         point->rejected));
    return id;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<JobStatus> Orchestrator::status(const JobId& id) const {
    if (auto live = driver_->status(id)) return live;

    auto bytes = store_->get_job_record(id);
    if (!bytes) return std::nullopt;
    auto record = RecordCodec::decode_job_record(*bytes);
    if (!record) {
        logger_.warn(kComponent, std::format("stored record of {} unreadable: {}",
                                             id, record.error().message));
        return std::nullopt;
    }
    return status_from_record(*record);
}

bool Orchestrator::cancel(const JobId& id) {
    return driver_->request_cancel(id);
}

std::vector<FeedEvent> Orchestrator::events(const JobId& id, uint64_t after) const {
    return feed_.read(id, after);
}

std::vector<FeedEvent> Orchestrator::wait_events(const JobId& id, uint64_t after,
                                                 std::chrono::milliseconds timeout) const {
    return feed_.wait_for(id, after, timeout);
}

bool Orchestrator::wait_for_terminal(const JobId& id, std::chrono::milliseconds timeout) const {
    if (driver_->wait_for_terminal(id, timeout)) return true;
    // Already evicted from memory
    auto current = status(id);
    return current && is_terminal(current->state);
}

Result<Datum> Orchestrator::stage_output(const JobId& id, const StageId& stage,
                                         const std::string& output) const {
    auto current = status(id);
    if (!current) return Error{"unknown job '" + id + "'"};

    for (const auto& record : current->stages) {
        if (record.id != stage) continue;
        auto it = record.outputs.find(output);
        if (it == record.outputs.end()) {
            return Error{"stage '" + stage + "' has no output '" + output + "'"};
        }
        auto bytes = store_->retrieve(it->second.ref);
        if (!bytes) return bytes.error();
        return RecordCodec::decode_datum(*bytes);
    }
    return Error{"unknown stage '" + stage + "'"};
}

}  // namespace hybrid_orchestrator
