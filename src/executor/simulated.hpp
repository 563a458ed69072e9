/**
 * @file simulated.hpp
 * @brief Deterministic in-process compiler and backend collaborators.
 *
 * Used by the demo CLI and by tests. Both are fully deterministic for
 * identical requests and support scripted failures; the backend also
 * supports gates that hold a stage in flight until released.
 */

#pragma once

#include "executor/collaborators.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace hybrid_orchestrator {

// ─────────────────────────────────────────────
// SimulatedCompiler
// ─────────────────────────────────────────────

class SimulatedCompiler : public ICompiler {
public:
    explicit SimulatedCompiler(std::set<std::string> formats = {"openqasm3", "qir"});

    Result<CompileOutput, DispatchError> compile(const CompileRequest& request) override;

    /// The next `causes.size()` compilations fail with these causes, in order.
    void script_failures(std::vector<DispatchCause> causes);

    [[nodiscard]] size_t compile_count() const;

private:
    std::set<std::string> formats_;
    mutable std::mutex mutex_;
    std::deque<DispatchCause> scripted_;
    size_t compiles_ = 0;
};

// ─────────────────────────────────────────────
// SimulatedBackend
// ─────────────────────────────────────────────

/**
 * @brief Produces Bell-like two-outcome histograms derived from a hash of
 *        the payload, so identical requests give identical counts.
 */
class SimulatedBackend : public IBackendExecutor {
public:
    SimulatedBackend() = default;

    Result<ExecutionOutput, DispatchError> execute(const ExecutionRequest& request,
                                                   std::stop_token stop) override;

    /// The next executions of `stage` (any job) fail with these causes, in order.
    void script_failures(const StageId& stage, std::vector<DispatchCause> causes);

    /**
     * @brief Hold executions of `stage` until release().
     *
     * With `honor_cancellation` a held execution returns Cancelled as soon
     * as its stop token fires; otherwise it waits for release regardless.
     */
    void hold(const StageId& stage, bool honor_cancellation = true);
    void release(const StageId& stage);

    /// Block until an execution of `stage` is waiting at its gate.
    bool wait_until_held(const StageId& stage, std::chrono::milliseconds timeout);

    void set_latency(Duration latency);

    [[nodiscard]] size_t dispatch_count() const;
    [[nodiscard]] size_t dispatch_count(const StageId& stage) const;
    [[nodiscard]] uint32_t max_concurrency(const ResourceId& resource) const;

private:
    struct Gate {
        bool closed = true;
        bool honor_cancellation = true;
        uint32_t waiting = 0;
    };

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::map<StageId, std::deque<DispatchCause>> scripted_;
    std::map<StageId, Gate> gates_;
    std::map<StageId, size_t> per_stage_;
    std::map<ResourceId, uint32_t> running_;
    std::map<ResourceId, uint32_t> peak_;
    size_t dispatches_ = 0;
    Duration latency_{0};
};

}  // namespace hybrid_orchestrator
