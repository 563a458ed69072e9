/**
 * @file simulated.cpp
 * @brief SimulatedCompiler and SimulatedBackend.
 */

#include "executor/simulated.hpp"

#include "core/checksum.hpp"

#include <algorithm>

namespace hybrid_orchestrator {

// ─────────────────────────────────────────────
// SimulatedCompiler
// ─────────────────────────────────────────────

SimulatedCompiler::SimulatedCompiler(std::set<std::string> formats)
    : formats_(std::move(formats)) {}

Result<CompileOutput, DispatchError> SimulatedCompiler::compile(const CompileRequest& request) {
    {
        std::lock_guard lock(mutex_);
        ++compiles_;
        if (!scripted_.empty()) {
            auto cause = scripted_.front();
            scripted_.pop_front();
            return DispatchError{cause, "scripted compiler failure"};
        }
    }

    if (request.source.empty()) {
        return DispatchError{DispatchCause::MalformedPayload, "empty source"};
    }
    if (!formats_.contains(request.target_format)) {
        return DispatchError{DispatchCause::UnsupportedFormat,
                             "target format '" + request.target_format + "' not supported"};
    }

    CompileOutput out;
    out.payload = request.target_format + ":" + request.source;
    for (const auto& [key, value] : request.options) {
        out.payload += ";" + key + "=" + value;
    }
    out.metadata["source_hash"] = std::to_string(fnv1a_64(request.source));
    return out;
}

void SimulatedCompiler::script_failures(std::vector<DispatchCause> causes) {
    std::lock_guard lock(mutex_);
    scripted_.insert(scripted_.end(), causes.begin(), causes.end());
}

size_t SimulatedCompiler::compile_count() const {
    std::lock_guard lock(mutex_);
    return compiles_;
}

// ─────────────────────────────────────────────
// SimulatedBackend
// ─────────────────────────────────────────────

Result<ExecutionOutput, DispatchError> SimulatedBackend::execute(const ExecutionRequest& request,
                                                                 std::stop_token stop) {
    std::unique_lock lock(mutex_);
    ++dispatches_;
    ++per_stage_[request.stage];

    auto& running = ++running_[request.resource];
    peak_[request.resource] = std::max(peak_[request.resource], running);

    auto finish = [&](auto result) {
        --running_[request.resource];
        return result;
    };

    if (auto it = scripted_.find(request.stage); it != scripted_.end() && !it->second.empty()) {
        auto cause = it->second.front();
        it->second.pop_front();
        return finish(Result<ExecutionOutput, DispatchError>(
            DispatchError{cause, "scripted backend failure"}));
    }

    if (auto it = gates_.find(request.stage); it != gates_.end() && it->second.closed) {
        const bool honor = it->second.honor_cancellation;
        ++it->second.waiting;
        cv_.notify_all();

        if (honor) {
            cv_.wait(lock, stop, [&] { return !gates_[request.stage].closed; });
        } else {
            cv_.wait(lock, [&] { return !gates_[request.stage].closed; });
        }
        --gates_[request.stage].waiting;

        if (honor && gates_[request.stage].closed) {
            return finish(Result<ExecutionOutput, DispatchError>(
                DispatchError{DispatchCause::Cancelled, "execution cancelled"}));
        }
    }

    if (latency_.count() > 0) {
        if (cv_.wait_for(lock, stop, latency_, [] { return false; }) || stop.stop_requested()) {
            return finish(Result<ExecutionOutput, DispatchError>(
                DispatchError{DispatchCause::Cancelled, "execution cancelled"}));
        }
    }

    if (request.payload.empty()) {
        return finish(Result<ExecutionOutput, DispatchError>(
            DispatchError{DispatchCause::MalformedPayload, "empty circuit payload"}));
    }

    // Deterministic Bell-like split: 00 / 11
    const uint64_t shots = request.shots;
    const uint64_t h = fnv1a_64(request.payload);
    const uint64_t zeros = shots / 2 + (shots >= 4 ? h % (shots / 4) : 0);

    ExecutionOutput out;
    if (zeros > 0) out.counts["00"] = zeros;
    if (shots > zeros) out.counts["11"] = shots - zeros;
    out.metadata["resource"] = request.resource;
    out.metadata["shots"] = std::to_string(shots);
    return finish(Result<ExecutionOutput, DispatchError>(std::move(out)));
}

void SimulatedBackend::script_failures(const StageId& stage, std::vector<DispatchCause> causes) {
    std::lock_guard lock(mutex_);
    auto& queue = scripted_[stage];
    queue.insert(queue.end(), causes.begin(), causes.end());
}

void SimulatedBackend::hold(const StageId& stage, bool honor_cancellation) {
    std::lock_guard lock(mutex_);
    auto& gate = gates_[stage];
    gate.closed = true;
    gate.honor_cancellation = honor_cancellation;
}

void SimulatedBackend::release(const StageId& stage) {
    {
        std::lock_guard lock(mutex_);
        gates_[stage].closed = false;
    }
    cv_.notify_all();
}

bool SimulatedBackend::wait_until_held(const StageId& stage, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] {
        auto it = gates_.find(stage);
        return it != gates_.end() && it->second.waiting > 0;
    });
}

void SimulatedBackend::set_latency(Duration latency) {
    std::lock_guard lock(mutex_);
    latency_ = latency;
}

size_t SimulatedBackend::dispatch_count() const {
    std::lock_guard lock(mutex_);
    return dispatches_;
}

size_t SimulatedBackend::dispatch_count(const StageId& stage) const {
    std::lock_guard lock(mutex_);
    auto it = per_stage_.find(stage);
    return it == per_stage_.end() ? 0 : it->second;
}

uint32_t SimulatedBackend::max_concurrency(const ResourceId& resource) const {
    std::lock_guard lock(mutex_);
    auto it = peak_.find(resource);
    return it == peak_.end() ? 0 : it->second;
}

}  // namespace hybrid_orchestrator
