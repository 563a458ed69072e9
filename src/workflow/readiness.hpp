/**
 * @file readiness.hpp
 * @brief Incremental ready-set maintenance for one running workflow.
 *
 * Keeps an unresolved-dependency counter per stage index. Completing a
 * stage costs O(out-degree + log ready), independent of how many stages
 * completed before, so wide fan-out graphs never degrade to O(n²).
 */

#pragma once

#include "core/result.hpp"
#include "workflow/workflow_graph.hpp"

#include <cstdint>
#include <set>
#include <utility>
#include <vector>

namespace hybrid_orchestrator {

enum class StageMark : uint8_t {
    Blocked,      ///< waiting on at least one dependency
    Ready,        ///< dependencies complete, not dispatched
    Dispatched,   ///< handed to an executor
    Completed
};

class ReadinessTracker {
public:
    /// Fresh run: nothing completed. The graph must outlive the tracker.
    explicit ReadinessTracker(const WorkflowGraph& graph);

    /**
     * @brief Resumed run starting from a completed set.
     *
     * Fails if `completed` is not dependency-closed (a completed stage with an
     * incomplete dependency) or does not match the graph size.
     */
    [[nodiscard]] static Result<ReadinessTracker> from_completed(
        const WorkflowGraph& graph, const std::vector<bool>& completed);

    /// Ready, undispatched stage indices ordered by topological rank.
    [[nodiscard]] std::vector<size_t> ready() const;

    [[nodiscard]] StageMark mark(size_t index) const { return marks_.at(index); }
    [[nodiscard]] size_t ready_count() const noexcept { return ready_.size(); }
    [[nodiscard]] size_t completed_count() const noexcept { return completed_; }
    [[nodiscard]] size_t stage_count() const noexcept { return marks_.size(); }
    [[nodiscard]] bool all_completed() const noexcept { return completed_ == marks_.size(); }

    /// Ready → Dispatched.
    Result<void> mark_dispatched(size_t index);

    /// Dispatched → Ready (a retry of the same stage).
    Result<void> requeue(size_t index);

    /**
     * @brief Dispatched → Completed.
     * @return Stage indices that became ready because of this completion.
     */
    Result<std::vector<size_t>> mark_completed(size_t index);

private:
    const WorkflowGraph* graph_;
    std::vector<uint32_t> unresolved_;
    std::vector<StageMark> marks_;
    std::set<std::pair<size_t, size_t>> ready_;   // (topological rank, index)
    size_t completed_ = 0;
};

}  // namespace hybrid_orchestrator
