/**
 * @file workflow_graph.cpp
 * @brief WorkflowGraph construction, validation and graph queries.
 *
 * Topological order is computed with Kahn's algorithm using a min-heap on
 * declaration order, so ranks are deterministic for a given IR. Validation
 * and queries are O(V+E) except input resolution, which walks the ancestor
 * set of each stage that declares inputs.
 */

#include "workflow/workflow_graph.hpp"

#include "core/checksum.hpp"

#include <algorithm>
#include <functional>
#include <queue>

namespace hybrid_orchestrator {

std::optional<DataRef> DataRef::parse(std::string_view text) {
    auto dot = text.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == text.size()) {
        return std::nullopt;
    }
    return DataRef{StageId{text.substr(0, dot)}, std::string{text.substr(dot + 1)}};
}

namespace {

ValidationError invalid(ValidationError::Kind kind, const StageId& stage, std::string message) {
    return ValidationError{kind, stage, std::move(message)};
}

std::optional<ValidationError> check_stage_fields(Stage& stage) {
    if (stage.id.empty()) {
        return invalid(ValidationError::Kind::InvalidStage, stage.id, "stage id must not be empty");
    }
    if (stage.id.find_first_of("./\\") != std::string::npos) {
        return invalid(ValidationError::Kind::InvalidStage, stage.id,
                       "stage id must not contain '.', '/' or '\\'");
    }

    std::unordered_set<std::string> output_names;
    for (const auto& out : stage.outputs) {
        if (out.empty() || !output_names.insert(out).second) {
            return invalid(ValidationError::Kind::InvalidStage, stage.id,
                           "output names must be non-empty and unique");
        }
    }

    return std::visit(Overloaded{
        [&](const CompileStage& c) -> std::optional<ValidationError> {
            if (c.target_format.empty()) {
                return invalid(ValidationError::Kind::InvalidStage, stage.id,
                               "compile stage requires a target format");
            }
            if (stage.outputs.size() != 1) {
                return invalid(ValidationError::Kind::InvalidStage, stage.id,
                               "compile stage must declare exactly one output for its payload");
            }
            return std::nullopt;
        },
        [&](const QuantumStage& q) -> std::optional<ValidationError> {
            if (q.shots == 0) {
                return invalid(ValidationError::Kind::InvalidStage, stage.id, "shots must be > 0");
            }
            if (!q.circuit_input && q.circuit.empty()) {
                return invalid(ValidationError::Kind::InvalidStage, stage.id,
                               "quantum stage needs a circuit input or an inline circuit");
            }
            if (stage.outputs.size() != 1) {
                return invalid(ValidationError::Kind::InvalidStage, stage.id,
                               "quantum stage must declare exactly one output for its counts");
            }
            if (q.circuit_input &&
                std::find(stage.inputs.begin(), stage.inputs.end(), *q.circuit_input)
                    == stage.inputs.end()) {
                stage.inputs.push_back(*q.circuit_input);
            }
            return std::nullopt;
        },
        [&](const ClassicalStage& c) -> std::optional<ValidationError> {
            if (c.function.empty()) {
                return invalid(ValidationError::Kind::InvalidStage, stage.id,
                               "classical stage requires a function name");
            }
            if (stage.outputs.size() > 1) {
                return invalid(ValidationError::Kind::InvalidStage, stage.id,
                               "classical stage produces at most one output");
            }
            return std::nullopt;
        }
    }, stage.body);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction & Validation
// ─────────────────────────────────────────────

Result<WorkflowGraph, ValidationError> WorkflowGraph::build(WorkflowIR ir) {
    if (ir.stages.empty()) {
        return invalid(ValidationError::Kind::EmptyGraph, {}, "workflow has no stages");
    }

    WorkflowGraph g;
    g.name_ = std::move(ir.name);
    g.stages_ = std::move(ir.stages);

    const size_t n = g.stages_.size();
    g.index_.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        auto& stage = g.stages_[i];
        if (auto err = check_stage_fields(stage)) return *err;
        if (!g.index_.emplace(stage.id, i).second) {
            return invalid(ValidationError::Kind::DuplicateStageId, stage.id,
                           "duplicate stage id '" + stage.id + "'");
        }
    }

    // Edges
    g.dependencies_.assign(n, {});
    g.dependents_.assign(n, {});
    for (size_t i = 0; i < n; ++i) {
        auto& stage = g.stages_[i];

        std::vector<StageId> unique_deps;
        for (const auto& dep : stage.dependencies) {
            if (std::find(unique_deps.begin(), unique_deps.end(), dep) == unique_deps.end()) {
                unique_deps.push_back(dep);
            }
        }
        stage.dependencies = std::move(unique_deps);

        for (const auto& dep : stage.dependencies) {
            auto it = g.index_.find(dep);
            if (it == g.index_.end()) {
                return invalid(ValidationError::Kind::DanglingDependency, stage.id,
                               "dependency '" + dep + "' does not exist");
            }
            if (it->second == i) {
                return invalid(ValidationError::Kind::Cycle, stage.id, "stage depends on itself");
            }
            g.dependencies_[i].push_back(it->second);
            g.dependents_[it->second].push_back(i);
            ++g.edge_count_;
        }
    }

    // Kahn's algorithm, smallest declaration index first
    std::vector<size_t> in_degree(n);
    for (size_t i = 0; i < n; ++i) in_degree[i] = g.dependencies_[i].size();

    std::priority_queue<size_t, std::vector<size_t>, std::greater<>> zero_in;
    for (size_t i = 0; i < n; ++i) {
        if (in_degree[i] == 0) zero_in.push(i);
    }

    g.topo_order_.reserve(n);
    while (!zero_in.empty()) {
        size_t current = zero_in.top();
        zero_in.pop();
        g.topo_order_.push_back(current);
        for (size_t next : g.dependents_[current]) {
            if (--in_degree[next] == 0) zero_in.push(next);
        }
    }

    if (g.topo_order_.size() != n) {
        auto it = std::find_if(in_degree.begin(), in_degree.end(),
                               [](size_t d) { return d > 0; });
        const auto& culprit = g.stages_[static_cast<size_t>(it - in_degree.begin())].id;
        return invalid(ValidationError::Kind::Cycle, culprit,
                       "dependency cycle through stage '" + culprit + "'");
    }

    g.topo_rank_.assign(n, 0);
    for (size_t rank = 0; rank < n; ++rank) {
        g.topo_rank_[g.topo_order_[rank]] = rank;
    }

    // Inputs must name a declared output of a transitive dependency
    for (size_t i = 0; i < n; ++i) {
        const auto& stage = g.stages_[i];
        for (const auto& input : stage.inputs) {
            auto producer = g.index_.find(input.stage);
            if (producer == g.index_.end()) {
                return invalid(ValidationError::Kind::UnresolvedInput, stage.id,
                               "input '" + input.str() + "' refers to an unknown stage");
            }
            const auto& outs = g.stages_[producer->second].outputs;
            if (std::find(outs.begin(), outs.end(), input.output) == outs.end()) {
                return invalid(ValidationError::Kind::UnresolvedInput, stage.id,
                               "input '" + input.str() + "' is not an output of '" + input.stage + "'");
            }
            if (!g.is_ancestor(producer->second, i)) {
                return invalid(ValidationError::Kind::UnresolvedInput, stage.id,
                               "input '" + input.str() + "' is not produced by an ancestor");
            }
        }
    }

    // Fingerprint over ids, kinds and edges in declaration order
    uint64_t fp = fnv1a_64(g.name_);
    for (size_t i = 0; i < n; ++i) {
        fp = fnv1a_64(g.stages_[i].id, fp);
        fp = fnv1a_64(to_string(g.stages_[i].kind()), fp);
        for (const auto& dep : g.stages_[i].dependencies) {
            fp = fnv1a_64(dep, fp);
        }
    }
    g.fingerprint_ = fp;

    return g;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<size_t> WorkflowGraph::index_of(const StageId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::vector<StageId> WorkflowGraph::ready_stages(
    const std::unordered_set<StageId>& completed,
    const std::unordered_set<StageId>& dispatched) const {
    std::vector<StageId> ready;

    for (size_t index : topo_order_) {
        const auto& id = stages_[index].id;
        if (completed.contains(id) || dispatched.contains(id)) continue;

        bool all_deps_met = std::all_of(
            dependencies_[index].begin(), dependencies_[index].end(),
            [&](size_t dep) { return completed.contains(stages_[dep].id); });

        if (all_deps_met) ready.push_back(id);
    }

    return ready;
}

bool WorkflowGraph::is_ancestor(size_t ancestor, size_t index) const {
    if (ancestor >= stages_.size() || index >= stages_.size() || ancestor == index) {
        return false;
    }
    // Ancestors always have a lower topological rank
    if (topo_rank_[ancestor] > topo_rank_[index]) return false;

    std::vector<bool> visited(stages_.size(), false);
    std::vector<size_t> stack{index};
    while (!stack.empty()) {
        size_t current = stack.back();
        stack.pop_back();
        for (size_t dep : dependencies_[current]) {
            if (dep == ancestor) return true;
            if (!visited[dep] && topo_rank_[dep] > topo_rank_[ancestor]) {
                visited[dep] = true;
                stack.push_back(dep);
            }
        }
    }
    return false;
}

// ─────────────────────────────────────────────
// Metrics
// ─────────────────────────────────────────────

Duration WorkflowGraph::critical_path_estimate() const {
    // Longest path via DP on topological order
    std::vector<int64_t> finish(stages_.size(), 0);
    int64_t longest = 0;

    for (size_t index : topo_order_) {
        int64_t start = 0;
        for (size_t dep : dependencies_[index]) {
            start = std::max(start, finish[dep]);
        }
        finish[index] = start + stages_[index].constraints.estimated_duration.count();
        longest = std::max(longest, finish[index]);
    }

    return Duration{longest};
}

Duration WorkflowGraph::total_estimated_duration() const {
    int64_t total = 0;
    for (const auto& stage : stages_) {
        total += stage.constraints.estimated_duration.count();
    }
    return Duration{total};
}

// ─────────────────────────────────────────────
// Re-planning
// ─────────────────────────────────────────────

WorkflowIR WorkflowGraph::to_ir() const {
    return WorkflowIR{name_, stages_};
}

Result<WorkflowGraph, ValidationError> WorkflowGraph::derive(
    const std::function<void(WorkflowIR&)>& edit) const {
    auto ir = to_ir();
    edit(ir);
    return build(std::move(ir));
}

}  // namespace hybrid_orchestrator
