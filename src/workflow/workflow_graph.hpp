/**
 * @file workflow_graph.hpp
 * @brief Validated, immutable DAG of workflow stages.
 *
 * A WorkflowGraph can only be obtained from WorkflowGraph::build(), which
 * rejects cycles, dangling dependencies, duplicate ids and inputs that are
 * not produced by an ancestor. Stages are stored in an index arena; edges
 * are index lists in both directions. Re-planning goes through derive(),
 * which produces a new graph and never touches this one.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workflow/stage.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hybrid_orchestrator {

/**
 * @brief Reason a workflow was rejected before admission.
 */
struct ValidationError {
    enum class Kind : uint8_t {
        EmptyGraph,
        InvalidStage,
        DuplicateStageId,
        DanglingDependency,
        Cycle,
        UnresolvedInput,
        UnsupportedStage,
        InvalidJobId
    };

    Kind kind;
    StageId stage;          ///< offending stage, empty for graph-level errors
    std::string message;
};

[[nodiscard]] constexpr std::string_view to_string(ValidationError::Kind kind) noexcept {
    switch (kind) {
        case ValidationError::Kind::EmptyGraph:         return "empty_graph";
        case ValidationError::Kind::InvalidStage:       return "invalid_stage";
        case ValidationError::Kind::DuplicateStageId:   return "duplicate_stage_id";
        case ValidationError::Kind::DanglingDependency: return "dangling_dependency";
        case ValidationError::Kind::Cycle:              return "cycle";
        case ValidationError::Kind::UnresolvedInput:    return "unresolved_input";
        case ValidationError::Kind::UnsupportedStage:   return "unsupported_stage";
        case ValidationError::Kind::InvalidJobId:       return "invalid_job_id";
    }
    return "unknown";
}

class WorkflowGraph {
public:
    /**
     * @brief Validate an IR and build the graph.
     *
     * Duplicate entries in a stage's dependency list are collapsed. A
     * quantum stage's circuit_input is added to its inputs if missing.
     */
    [[nodiscard]] static Result<WorkflowGraph, ValidationError> build(WorkflowIR ir);

    // ── Structure ─────────────────────────────
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] size_t stage_count() const noexcept { return stages_.size(); }
    [[nodiscard]] size_t edge_count() const noexcept { return edge_count_; }
    [[nodiscard]] const Stage& stage(size_t index) const { return stages_.at(index); }
    [[nodiscard]] const std::vector<Stage>& stages() const noexcept { return stages_; }
    [[nodiscard]] std::optional<size_t> index_of(const StageId& id) const;

    [[nodiscard]] const std::vector<size_t>& dependencies(size_t index) const {
        return dependencies_.at(index);
    }
    [[nodiscard]] const std::vector<size_t>& dependents(size_t index) const {
        return dependents_.at(index);
    }

    [[nodiscard]] const std::vector<size_t>& topological_order() const noexcept { return topo_order_; }
    [[nodiscard]] size_t topological_rank(size_t index) const { return topo_rank_.at(index); }

    // ── Queries ───────────────────────────────

    /**
     * @brief Stages whose dependencies are all in `completed` and which are
     *        neither completed nor dispatched. O(stages + edges).
     *
     * Result is ordered by topological rank.
     */
    [[nodiscard]] std::vector<StageId> ready_stages(
        const std::unordered_set<StageId>& completed,
        const std::unordered_set<StageId>& dispatched = {}) const;

    /// True if `ancestor` is reachable from `index` through dependency edges.
    [[nodiscard]] bool is_ancestor(size_t ancestor, size_t index) const;

    // ── Metrics ───────────────────────────────
    [[nodiscard]] Duration critical_path_estimate() const;
    [[nodiscard]] Duration total_estimated_duration() const;

    /// Stable hash of stage ids, kinds and edges; identifies the graph in job records.
    [[nodiscard]] uint64_t fingerprint() const noexcept { return fingerprint_; }

    // ── Re-planning ───────────────────────────
    [[nodiscard]] WorkflowIR to_ir() const;
    [[nodiscard]] Result<WorkflowGraph, ValidationError> derive(
        const std::function<void(WorkflowIR&)>& edit) const;

private:
    WorkflowGraph() = default;

    std::string name_;
    std::vector<Stage> stages_;
    std::unordered_map<StageId, size_t> index_;
    std::vector<std::vector<size_t>> dependencies_;   // backward edges
    std::vector<std::vector<size_t>> dependents_;     // forward edges
    std::vector<size_t> topo_order_;
    std::vector<size_t> topo_rank_;
    size_t edge_count_ = 0;
    uint64_t fingerprint_ = 0;
};

}  // namespace hybrid_orchestrator
