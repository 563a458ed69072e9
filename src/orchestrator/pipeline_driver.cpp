/**
 * @file pipeline_driver.cpp
 * @brief PipelineDriver implementation.
 */

#include "orchestrator/pipeline_driver.hpp"

#include "recovery/retry.hpp"
#include "storage/record_codec.hpp"

#include <algorithm>
#include <format>

namespace hybrid_orchestrator {

namespace {

constexpr std::string_view kComponent = "driver";

Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

}  // anonymous namespace

JobStatus status_from_record(const JobRecord& record) {
    JobStatus status{
        .id = record.id,
        .state = record.state,
        .progress = progress(record.state),
        .cause = CauseCode::None,
        .detail_ref = {},
        .failed_stage = {},
        .cancel_requested = false,
        .priority = record.priority,
        .transitions = record.transitions,
        .checkpoints = record.checkpoints,
        .stages = record.stages
    };
    if (is_terminal(record.state) && !record.transitions.empty()) {
        const auto& last = record.transitions.back();
        status.cause = last.cause;
        status.detail_ref = last.detail_ref;
        status.failed_stage = last.stage;
        status.cancel_requested = last.event == JobEvent::Cancel;
    }
    return status;
}

// ─────────────────────────────────────────────
// Construction & Lifecycle
// ─────────────────────────────────────────────

PipelineDriver::PipelineDriver(DriverContext context, DriverOptions options)
    : env_(context)
    , options_(std::move(options))
    , pool_(options_.worker_threads) {}

PipelineDriver::~PipelineDriver() {
    stop();
}

void PipelineDriver::start() {
    if (running_.exchange(true)) return;
    shutting_down_ = false;
    dispatcher_ = std::jthread([this](std::stop_token stop) { run(stop); });
    env_.logger.info(kComponent, std::format("dispatcher started ({} workers)", pool_.thread_count()));
}

void PipelineDriver::stop() {
    if (!running_.exchange(false)) return;
    shutting_down_ = true;

    dispatcher_.request_stop();
    wake_cv_.notify_all();
    if (dispatcher_.joinable()) dispatcher_.join();

    for (const auto& handle : live_jobs()) {
        std::lock_guard lock(handle->mutex);
        stop_attempts(*handle);
    }
    env_.logger.info(kComponent, "dispatcher stopped");
}

Result<void> PipelineDriver::admit(Job job, std::unique_ptr<ReadinessTracker> tracker) {
    if (!job.graph || !tracker) {
        return Error{"job has no graph or readiness tracker"};
    }

    auto handle = std::make_shared<JobContext>();
    handle->job = std::move(job);
    handle->tracker = std::move(tracker);
    for (size_t index : handle->tracker->ready()) {
        handle->job.stages[index].phase = StagePhase::Ready;
    }

    if (handle->job.lifecycle.terminal()) {
        return Error{"job '" + handle->job.id + "' is already finished"};
    }
    // A restored lifecycle has already left PENDING
    handle->started = handle->job.lifecycle.state() != JobState::Pending;

    const JobId id = handle->job.id;
    {
        std::lock_guard lock(jobs_mutex_);
        if (jobs_.contains(id)) {
            return Error{"job '" + id + "' is already known"};
        }
        jobs_[id] = handle;
    }

    {
        std::lock_guard lock(handle->mutex);
        if (handle->started) advance_phase(*handle);
        persist_record(*handle);
    }
    wake();
    return {};
}

bool PipelineDriver::request_cancel(const JobId& id) {
    auto handle = find(id);
    if (!handle) return false;

    {
        std::lock_guard lock(handle->mutex);
        auto& ctx = *handle;
        if (ctx.job.lifecycle.terminal()) return false;
        if (ctx.cancel_requested) return true;
        if (ctx.terminating) return false;

        ctx.cancel_requested = true;
        env_.logger.info(kComponent, std::format("job {} cancel requested ({} in flight)",
                                                 id, ctx.in_flight));
        begin_termination(ctx, JobEvent::Cancel, CauseCode::Cancelled, {}, {});
    }
    wake();
    return true;
}

std::optional<JobStatus> PipelineDriver::status(const JobId& id) const {
    auto handle = find(id);
    if (!handle) return std::nullopt;
    std::lock_guard lock(handle->mutex);
    return make_status(*handle);
}

bool PipelineDriver::contains(const JobId& id) const {
    return find(id) != nullptr;
}

bool PipelineDriver::wait_for_terminal(const JobId& id, std::chrono::milliseconds timeout) const {
    auto handle = find(id);
    if (!handle) return false;
    std::unique_lock lock(handle->mutex);
    return handle->terminal_cv.wait_for(lock, timeout, [&] {
        return handle->job.lifecycle.terminal();
    });
}

size_t PipelineDriver::job_count() const {
    std::lock_guard lock(jobs_mutex_);
    return jobs_.size();
}

// ─────────────────────────────────────────────
// Dispatcher Loop
// ─────────────────────────────────────────────

void PipelineDriver::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        const auto now = std::chrono::steady_clock::now();
        SteadyTime next_wake = now + options_.poll_interval;

        for (const auto& lease : env_.engine.expire_leases(now)) {
            env_.logger.warn(kComponent, std::format("lease {} of {}/{} expired",
                                                     lease.lease_id, lease.job, lease.stage));
            if (lease.running) interrupt_expired(lease);
        }
        evict_finished(now);

        std::vector<Candidate> candidates;
        for (const auto& handle : live_jobs()) {
            std::lock_guard lock(handle->mutex);
            sweep(handle, now, candidates, next_wake);
        }

        std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
            if (a.priority != b.priority) return a.priority > b.priority;
            if (a.rank != b.rank) return a.rank < b.rank;
            if (a.arrival != b.arrival) return a.arrival < b.arrival;
            return a.index < b.index;
        });

        for (const auto& candidate : candidates) {
            if (stop.stop_requested()) break;
            std::lock_guard lock(candidate.job->mutex);
            try_dispatch(candidate.job, candidate.index, now);
        }

        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_until(lock, stop, next_wake, [this] { return wake_pending_; });
        wake_pending_ = false;
    }
}

void PipelineDriver::sweep(const JobHandle& handle, SteadyTime now,
                           std::vector<Candidate>& candidates, SteadyTime& next_wake) {
    auto& ctx = *handle;
    if (ctx.job.lifecycle.terminal()) return;

    if (!ctx.started) {
        ctx.started = true;
        if (!apply_event(ctx, JobEvent::StartCompiling)) return;
        advance_phase(ctx);
        if (ctx.job.lifecycle.terminal()) return;
    }

    if (ctx.job.deadline && !ctx.terminating) {
        if (now >= *ctx.job.deadline) {
            env_.logger.warn(kComponent, std::format("job {} deadline elapsed ({} in flight)",
                                                     ctx.job.id, ctx.in_flight));
            auto detail = persist_diagnostic(ctx.job.id, {}, "timeout",
                                             "wall-clock deadline elapsed in state "
                                             + std::string{to_string(ctx.job.lifecycle.state())});
            begin_termination(ctx, JobEvent::Expire, CauseCode::Timeout, detail, {});
        } else {
            next_wake = std::min(next_wake, *ctx.job.deadline);
        }
    }

    if (ctx.terminating) {
        if (ctx.in_flight == 0) finalize(ctx);
        return;
    }

    write_progress_checkpoints(ctx, now, next_wake);

    const auto& graph = *ctx.job.graph;
    for (size_t index : ctx.tracker->ready()) {
        const auto& rt = ctx.job.stages[index];
        if (rt.phase == StagePhase::Failed) continue;
        if (rt.not_before && *rt.not_before > now) {
            next_wake = std::min(next_wake, *rt.not_before);
            continue;
        }
        candidates.push_back(Candidate{
            .priority = ctx.job.priority,
            .rank = graph.topological_rank(index),
            .arrival = ctx.job.arrival,
            .index = index,
            .job = handle
        });
    }
}

void PipelineDriver::write_progress_checkpoints(JobContext& ctx, SteadyTime now,
                                                SteadyTime& next_wake) {
    if (options_.checkpoint.periodic_interval_ms == 0) return;
    const auto interval = std::chrono::milliseconds{
        static_cast<int64_t>(options_.checkpoint.periodic_interval_ms)};

    const auto& graph = *ctx.job.graph;
    for (size_t i = 0; i < ctx.job.stages.size(); ++i) {
        auto& rt = ctx.job.stages[i];
        const auto& stage = graph.stage(i);
        if (rt.phase != StagePhase::Running || !stage.checkpointable || !rt.dispatched_at) continue;

        const auto due = rt.last_checkpoint_at.value_or(*rt.dispatched_at) + interval;
        if (due > now) {
            next_wake = std::min(next_wake, due);
            continue;
        }

        rt.last_checkpoint_at = now;
        auto ref = env_.checkpoints.checkpoint(ctx.job.id, graph, stage.id, rt.attempts, {},
                                               CheckpointKind::InFlight);
        if (ref) {
            ctx.job.checkpoints.push_back(*ref);
            auto event = make_event(ctx, FeedEventKind::CheckpointRecorded);
            event.stage = stage.id;
            event.attempt = rt.attempts;
            event.ref = ref->ref;
            event.detail = "in_flight";
            env_.feed.publish(std::move(event));
        }
        next_wake = std::min(next_wake, now + interval);
    }
}

void PipelineDriver::interrupt_expired(const ResourceAllocation& lease) {
    auto handle = find(lease.job);
    if (!handle) return;

    std::lock_guard lock(handle->mutex);
    auto& ctx = *handle;
    auto index = ctx.job.graph->index_of(lease.stage);
    if (!index) return;
    // Released under this lock once the attempt settles
    if (!env_.engine.allocation(lease.lease_id)) return;

    auto it = ctx.attempt_stops.find(*index);
    if (it == ctx.attempt_stops.end()) return;
    ctx.lease_expired.insert(*index);
    it->second.request_stop();
}

void PipelineDriver::evict_finished(SteadyTime now) {
    std::vector<JobId> evicted;
    {
        std::lock_guard lock(jobs_mutex_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            auto& ctx = *it->second;
            std::unique_lock job_lock(ctx.mutex, std::try_to_lock);
            const bool expired = job_lock.owns_lock() && ctx.finished_at && ctx.in_flight == 0
                                 && now - *ctx.finished_at >= options_.retention;
            if (expired) {
                job_lock.unlock();
                evicted.push_back(it->first);
                it = jobs_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& id : evicted) {
        env_.feed.forget(id);
        env_.checkpoints.forget(id);
        env_.logger.debug(kComponent, std::format("job {} evicted from memory", id));
    }
}

void PipelineDriver::stop_attempts(JobContext& ctx) {
    for (auto& entry : ctx.attempt_stops) entry.second.request_stop();
}

// ─────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────

void PipelineDriver::try_dispatch(const JobHandle& handle, size_t index, SteadyTime now) {
    auto& ctx = *handle;
    if (ctx.terminating || ctx.job.lifecycle.terminal()) return;
    if (ctx.tracker->mark(index) != StageMark::Ready) return;

    const auto& graph = *ctx.job.graph;
    const Stage& stage = graph.stage(index);
    auto& rt = ctx.job.stages[index];
    if (rt.phase == StagePhase::Failed) return;
    if (rt.not_before && *rt.not_before > now) return;

    std::optional<ResourceAllocation> lease;
    if (stage.kind() == StageKind::Quantum) {
        auto selected = env_.engine.select_resource(ctx.job.id, stage, now);
        if (!selected) {
            const auto& err = selected.error();
            if (err.fatal()) {
                fail_stage(ctx, index, err.cause, err.message);
                persist_record(ctx);
            } else if (rt.last_cause != err.cause) {
                rt.last_cause = err.cause;
                env_.logger.debug(kComponent, std::format("{}/{} queued: {}",
                                                          ctx.job.id, stage.id, err.message));
            }
            return;
        }
        lease = std::move(*selected);
    }

    auto marked = ctx.tracker->mark_dispatched(index);
    if (!marked) {
        if (lease) env_.engine.release(lease->lease_id);
        internal_error(ctx, index, marked.error().message);
        return;
    }

    if (stage.kind() != StageKind::Compile) {
        if (ctx.job.lifecycle.state() == JobState::Compiling) {
            if (!apply_event(ctx, JobEvent::FinishCompiling)) return;
        }
        if (ctx.job.lifecycle.state() == JobState::Queued) {
            if (!apply_event(ctx, JobEvent::StartRunning)) return;
        }
    }

    rt.phase = StagePhase::Running;
    ++rt.attempts;
    rt.not_before.reset();
    rt.dispatched_at = now;
    rt.last_checkpoint_at.reset();
    if (lease) {
        rt.resource = lease->resource;
        rt.lease_id = lease->lease_id;
    }

    StageAttempt attempt{
        .index = index,
        .attempt = rt.attempts,
        .lease_id = rt.lease_id,
        .resource = lease ? lease->resource : ResourceId{},
        .inputs = {},
        .stop = {}
    };
    auto& source = ctx.attempt_stops[index];
    source = std::stop_source{};
    attempt.stop = source.get_token();
    attempt.inputs.reserve(stage.inputs.size());
    for (const auto& input : stage.inputs) {
        auto producer = graph.index_of(input.stage);
        const auto& outputs = ctx.job.stages[producer.value_or(index)].outputs;
        auto it = outputs.find(input.output);
        attempt.inputs.push_back(it == outputs.end() ? ArtifactRef{} : it->second.ref);
    }

    ++ctx.in_flight;

    auto event = make_event(ctx, FeedEventKind::StageDispatched);
    event.stage = stage.id;
    event.attempt = rt.attempts;
    event.resource = rt.resource;
    env_.feed.publish(std::move(event));
    env_.logger.info(kComponent, std::format("{}/{} dispatched (attempt {}{}{})",
                                             ctx.job.id, stage.id, rt.attempts,
                                             lease ? ", resource " : "",
                                             lease ? lease->resource : ""));

    bool posted = pool_.post([this, handle, attempt = std::move(attempt)](std::stop_token) mutable {
        run_stage(handle, std::move(attempt));
    });
    if (!posted) {
        ctx.attempt_stops.erase(index);
        --ctx.in_flight;
        --rt.attempts;
        rt.phase = StagePhase::Ready;
        if (rt.lease_id != 0) env_.engine.release(rt.lease_id);
        rt.lease_id = 0;
        auto requeued = ctx.tracker->requeue(index);
        if (!requeued) internal_error(ctx, index, requeued.error().message);
    }
}

void PipelineDriver::run_stage(const JobHandle& handle, StageAttempt attempt) {
    // The graph and id are immutable after admission; no lock needed.
    const Job& job = handle->job;
    const Stage& stage = job.graph->stage(attempt.index);

    StageOutcome outcome = execute_stage(job, stage, attempt);
    on_stage_finished(handle, attempt, std::move(outcome));
}

PipelineDriver::StageOutcome PipelineDriver::execute_stage(const Job& job, const Stage& stage,
                                                           StageAttempt& attempt) {
    StageOutcome outcome;
    outcome.lease_id = attempt.lease_id;
    outcome.resource = attempt.resource;

    auto fail = [&](DispatchCause cause, std::string message) {
        outcome.error = DispatchError{cause, std::move(message)};
        return outcome;
    };

    if (attempt.stop.stop_requested()) {
        return fail(DispatchCause::Cancelled, "cancelled before start");
    }

    // ── Inputs ────────────────────────────────
    std::vector<Datum> inputs;
    inputs.reserve(attempt.inputs.size());
    for (size_t i = 0; i < attempt.inputs.size(); ++i) {
        const auto& ref = attempt.inputs[i];
        if (ref.empty()) {
            return fail(DispatchCause::Internal, "input " + stage.inputs[i].str() + " was never produced");
        }
        auto bytes = env_.store.retrieve(ref);
        if (!bytes) {
            return fail(DispatchCause::CollaboratorUnreachable,
                        "retrieve " + stage.inputs[i].str() + ": " + bytes.error().message);
        }
        auto datum = RecordCodec::decode_datum(*bytes);
        if (!datum) {
            return fail(DispatchCause::MalformedPayload,
                        "decode " + stage.inputs[i].str() + ": " + datum.error().message);
        }
        inputs.push_back(std::move(*datum));
    }

    auto input_for = [&](const DataRef& ref) -> const Datum* {
        for (size_t i = 0; i < stage.inputs.size(); ++i) {
            if (stage.inputs[i] == ref) return &inputs[i];
        }
        return nullptr;
    };

    // ── Dispatch by stage kind ────────────────
    auto produced = std::visit(Overloaded{
        [&](const CompileStage& body) -> Result<std::optional<Datum>, DispatchError> {
            auto compiled = env_.compiler.compile(CompileRequest{
                .source = body.source,
                .target_format = body.target_format,
                .options = body.options
            });
            if (!compiled) return compiled.error();
            return std::optional<Datum>{Datum{std::move(compiled->payload)}};
        },
        [&](const QuantumStage& body) -> Result<std::optional<Datum>, DispatchError> {
            std::string payload = body.circuit;
            if (body.circuit_input) {
                const Datum* circuit = input_for(*body.circuit_input);
                const auto* text = circuit ? std::get_if<std::string>(circuit) : nullptr;
                if (!text) {
                    return DispatchError{DispatchCause::MalformedPayload,
                                         "circuit input " + body.circuit_input->str() + " is not a payload"};
                }
                payload = *text;
            }

            auto confirmed = env_.engine.confirm(attempt.lease_id, stage);
            if (!confirmed) {
                // The lease is gone; selection runs again on the next attempt.
                outcome.lease_id = 0;
                return DispatchError{DispatchCause::ResourceUnavailable, confirmed.error().message};
            }
            outcome.lease_id = confirmed->lease_id;
            outcome.resource = confirmed->resource;

            auto executed = env_.backend.execute(ExecutionRequest{
                .job = job.id,
                .stage = stage.id,
                .attempt = attempt.attempt,
                .payload = std::move(payload),
                .resource = confirmed->resource,
                .shots = body.shots,
                .options = body.options
            }, attempt.stop);

            if (!executed) {
                if (executed.error().cause != DispatchCause::Cancelled) {
                    env_.engine.record_outcome(confirmed->resource, false,
                                               options_.success_rate_smoothing);
                }
                return executed.error();
            }
            env_.engine.record_outcome(confirmed->resource, true, options_.success_rate_smoothing);
            return std::optional<Datum>{Datum{std::move(executed->counts)}};
        },
        [&](const ClassicalStage& body) -> Result<std::optional<Datum>, DispatchError> {
            auto value = env_.evaluator.evaluate(body, inputs);
            if (!value) return value.error();
            return std::optional<Datum>{std::move(*value)};
        }
    }, stage.body);

    if (!produced) {
        outcome.error = produced.error();
        return outcome;
    }

    // ── Outputs ───────────────────────────────
    if (produced->has_value() && !stage.outputs.empty()) {
        const auto& name = stage.outputs.front();
        Bytes bytes = RecordCodec::encode_datum(**produced);
        auto ref = env_.store.persist(job.id, stage.id, name, bytes);
        if (!ref) {
            return fail(DispatchCause::CollaboratorUnreachable, "persist " + name + ": " + ref.error().message);
        }
        outcome.outputs.emplace(name, StoredOutput{*ref, RecordCodec::checksum(bytes)});
    }
    return outcome;
}

void PipelineDriver::on_stage_finished(const JobHandle& handle, const StageAttempt& attempt,
                                       StageOutcome outcome) {
    {
        std::lock_guard lock(handle->mutex);
        auto& ctx = *handle;
        const auto& graph = *ctx.job.graph;
        const size_t index = attempt.index;
        const Stage& stage = graph.stage(index);
        auto& rt = ctx.job.stages[index];

        if (outcome.lease_id != 0) env_.engine.release(outcome.lease_id);
        if (attempt.lease_id != 0 && attempt.lease_id != outcome.lease_id) {
            env_.engine.release(attempt.lease_id);
        }
        rt.lease_id = 0;
        if (!outcome.resource.empty()) rt.resource = outcome.resource;
        --ctx.in_flight;
        ctx.attempt_stops.erase(index);

        if (ctx.lease_expired.erase(index) > 0 && outcome.error) {
            outcome.error = DispatchError{DispatchCause::DeadlineExceeded,
                                          "lease on " + rt.resource + " expired while running"};
        }

        if (!outcome.error) {
            auto unblocked = ctx.tracker->mark_completed(index);
            if (!unblocked) {
                internal_error(ctx, index, unblocked.error().message);
            } else {
                rt.phase = StagePhase::Completed;
                rt.outputs = std::move(outcome.outputs);
                rt.last_cause = CauseCode::None;
                rt.last_error.clear();
                for (size_t next : *unblocked) {
                    ctx.job.stages[next].phase = StagePhase::Ready;
                }

                auto event = make_event(ctx, FeedEventKind::StageCompleted);
                event.stage = stage.id;
                event.attempt = attempt.attempt;
                event.resource = rt.resource;
                env_.feed.publish(std::move(event));
                env_.logger.info(kComponent, std::format("{}/{} completed (attempt {})",
                                                         ctx.job.id, stage.id, attempt.attempt));

                if (options_.checkpoint.on_stage_completion && stage.checkpointable) {
                    auto ref = env_.checkpoints.checkpoint(ctx.job.id, graph, stage.id,
                                                           attempt.attempt, rt.outputs);
                    if (ref) {
                        rt.checkpoint_ref = ref->ref;
                        ctx.job.checkpoints.push_back(*ref);
                        auto cp_event = make_event(ctx, FeedEventKind::CheckpointRecorded);
                        cp_event.stage = stage.id;
                        cp_event.attempt = attempt.attempt;
                        cp_event.ref = ref->ref;
                        env_.feed.publish(std::move(cp_event));
                    }
                }

                if (!ctx.terminating) advance_phase(ctx);
            }
        } else if (ctx.terminating || shutting_down_
                   || (outcome.error->cause == DispatchCause::Cancelled
                       && attempt.stop.stop_requested())) {
            const auto& err = *outcome.error;
            rt.phase = StagePhase::Ready;
            rt.last_cause = to_cause_code(err.cause);
            rt.last_error = err.message;
            auto requeued = ctx.tracker->requeue(index);
            if (!requeued) internal_error(ctx, index, requeued.error().message);
        } else {
            const auto& err = *outcome.error;
            const auto& policy = effective_retry_policy(stage, options_.default_retry);
            rt.last_cause = to_cause_code(err.cause);
            rt.last_error = err.message;

            if (is_transient(err.cause) && should_retry(policy, rt.attempts)) {
                auto requeued = ctx.tracker->requeue(index);
                if (!requeued) {
                    internal_error(ctx, index, requeued.error().message);
                } else {
                    const auto delay = backoff_delay(policy, rt.attempts);
                    rt.phase = StagePhase::BackingOff;
                    rt.not_before = std::chrono::steady_clock::now() + delay;

                    auto event = make_event(ctx, FeedEventKind::StageRetryScheduled);
                    event.stage = stage.id;
                    event.attempt = rt.attempts;
                    event.resource = rt.resource;
                    event.cause = rt.last_cause;
                    event.detail = err.message;
                    env_.feed.publish(std::move(event));
                    env_.logger.warn(kComponent, std::format(
                        "{}/{} attempt {} failed ({}): {}; retry in {}ms",
                        ctx.job.id, stage.id, rt.attempts, to_string(err.cause), err.message,
                        std::chrono::duration_cast<std::chrono::milliseconds>(delay).count()));
                }
            } else if (is_transient(err.cause)) {
                fail_stage(ctx, index, CauseCode::RetriesExhausted,
                           std::format("{} after {} attempts: {}", to_string(err.cause),
                                       rt.attempts, err.message));
            } else if (err.cause == DispatchCause::Internal) {
                internal_error(ctx, index, err.message);
            } else {
                fail_stage(ctx, index, to_cause_code(err.cause), err.message);
            }
        }

        if (ctx.terminating && ctx.in_flight == 0) finalize(ctx);
        persist_record(ctx);
    }
    wake();
}

// ─────────────────────────────────────────────
// Job State
// ─────────────────────────────────────────────

void PipelineDriver::advance_phase(JobContext& ctx) {
    const auto& graph = *ctx.job.graph;
    const bool all_done = ctx.tracker->all_completed();

    if (ctx.job.lifecycle.state() == JobState::Compiling) {
        bool leave = all_done;
        for (size_t index : ctx.tracker->ready()) {
            if (graph.stage(index).kind() != StageKind::Compile) leave = true;
        }
        if (leave && !apply_event(ctx, JobEvent::FinishCompiling)) return;
    }

    if (!all_done) return;
    if (ctx.job.lifecycle.state() == JobState::Queued
        && !apply_event(ctx, JobEvent::StartRunning)) {
        return;
    }
    if (ctx.job.lifecycle.state() == JobState::Running) {
        apply_event(ctx, JobEvent::FinishRunningOk);
    }
}

bool PipelineDriver::apply_event(JobContext& ctx, JobEvent event, CauseCode cause,
                                 ArtifactRef detail, StageId stage) {
    const auto from = ctx.job.lifecycle.state();
    auto applied = ctx.job.lifecycle.apply(event, cause, detail, stage);
    if (!applied) {
        env_.logger.error(kComponent, std::format("job {}: {}", ctx.job.id, applied.error().message()));
        if (!ctx.job.lifecycle.terminal() && event != JobEvent::Fail) {
            auto ref = persist_diagnostic(ctx.job.id, stage, "internal", applied.error().message());
            begin_termination(ctx, JobEvent::Fail, CauseCode::Internal, ref, stage);
        }
        return false;
    }

    auto feed_event = make_event(ctx, FeedEventKind::StateChanged);
    feed_event.cause = cause;
    feed_event.ref = detail;
    feed_event.stage = stage;
    env_.feed.publish(std::move(feed_event));

    if (cause == CauseCode::None) {
        env_.logger.info(kComponent, std::format("job {} {} -> {}", ctx.job.id,
                                                 to_string(from), to_string(*applied)));
    } else {
        env_.logger.info(kComponent, std::format("job {} {} -> {} ({}{}{})", ctx.job.id,
                                                 to_string(from), to_string(*applied), to_string(cause),
                                                 stage.empty() ? "" : ", stage ", stage));
    }

    persist_record(ctx);
    if (ctx.job.lifecycle.terminal()) {
        ctx.finished_at = std::chrono::steady_clock::now();
        ctx.terminal_cv.notify_all();
    }
    return true;
}

void PipelineDriver::fail_stage(JobContext& ctx, size_t index, CauseCode cause,
                                const std::string& message) {
    const Stage& stage = ctx.job.graph->stage(index);
    auto& rt = ctx.job.stages[index];
    rt.phase = StagePhase::Failed;
    rt.last_cause = cause;
    rt.last_error = message;
    rt.not_before.reset();

    auto detail = persist_diagnostic(ctx.job.id, stage.id, "error", message);

    auto event = make_event(ctx, FeedEventKind::StageFailed);
    event.stage = stage.id;
    event.attempt = rt.attempts;
    event.resource = rt.resource;
    event.cause = cause;
    event.ref = detail;
    event.detail = message;
    env_.feed.publish(std::move(event));
    env_.logger.warn(kComponent, std::format("{}/{} failed permanently ({}): {}",
                                             ctx.job.id, stage.id, to_string(cause), message));

    begin_termination(ctx, JobEvent::Fail, cause, detail, stage.id);
}

void PipelineDriver::internal_error(JobContext& ctx, size_t index, const std::string& message) {
    const Stage& stage = ctx.job.graph->stage(index);
    env_.logger.error(kComponent, std::format("invariant violation in {}/{}: {}",
                                              ctx.job.id, stage.id, message));
    fail_stage(ctx, index, CauseCode::Internal, message);
}

void PipelineDriver::begin_termination(JobContext& ctx, JobEvent event, CauseCode cause,
                                       ArtifactRef detail, StageId stage) {
    if (ctx.terminating || ctx.job.lifecycle.terminal()) return;

    ctx.terminating = true;
    ctx.pending_event = event;
    ctx.pending_cause = cause;
    ctx.pending_detail = std::move(detail);
    ctx.pending_stage = std::move(stage);
    stop_attempts(ctx);

    if (ctx.in_flight == 0) finalize(ctx);
}

void PipelineDriver::finalize(JobContext& ctx) {
    if (ctx.job.lifecycle.terminal()) return;
    apply_event(ctx, ctx.pending_event, ctx.pending_cause, ctx.pending_detail, ctx.pending_stage);
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

ArtifactRef PipelineDriver::persist_diagnostic(const JobId& job, const StageId& stage,
                                               std::string_view kind, const std::string& message) {
    auto ref = env_.store.persist(job, stage, kind, to_bytes(message));
    if (!ref) {
        env_.logger.warn(kComponent, std::format("could not persist {} diagnostic for {}: {}",
                                                 kind, job, ref.error().message));
        return {};
    }
    return *ref;
}

void PipelineDriver::persist_record(const JobContext& ctx) {
    auto stored = env_.store.put_job_record(ctx.job.id, RecordCodec::encode_job_record(ctx.job.record()));
    if (!stored) {
        env_.logger.warn(kComponent, std::format("could not persist record of {}: {}",
                                                 ctx.job.id, stored.error().message));
    }
}

FeedEvent PipelineDriver::make_event(const JobContext& ctx, FeedEventKind kind) const {
    FeedEvent event;
    event.job = ctx.job.id;
    event.kind = kind;
    event.at = std::chrono::system_clock::now();
    event.state = ctx.job.lifecycle.state();
    return event;
}

JobStatus PipelineDriver::make_status(const JobContext& ctx) {
    const auto& lifecycle = ctx.job.lifecycle;
    auto record = ctx.job.record();
    return JobStatus{
        .id = ctx.job.id,
        .state = lifecycle.state(),
        .progress = progress(lifecycle.state()),
        .cause = lifecycle.cause(),
        .detail_ref = lifecycle.detail_ref(),
        .failed_stage = lifecycle.failed_stage(),
        .cancel_requested = ctx.cancel_requested,
        .priority = ctx.job.priority,
        .transitions = std::move(record.transitions),
        .checkpoints = std::move(record.checkpoints),
        .stages = std::move(record.stages)
    };
}

PipelineDriver::JobHandle PipelineDriver::find(const JobId& id) const {
    std::lock_guard lock(jobs_mutex_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

std::vector<PipelineDriver::JobHandle> PipelineDriver::live_jobs() const {
    std::vector<JobHandle> out;
    std::lock_guard lock(jobs_mutex_);
    out.reserve(jobs_.size());
    for (const auto& [id, handle] : jobs_) out.push_back(handle);
    return out;
}

void PipelineDriver::wake() {
    {
        std::lock_guard lock(wake_mutex_);
        wake_pending_ = true;
    }
    wake_cv_.notify_all();
}

}  // namespace hybrid_orchestrator
