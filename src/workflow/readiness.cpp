/**
 * @file readiness.cpp
 * @brief ReadinessTracker implementation.
 */

#include "workflow/readiness.hpp"

#include <string>

namespace hybrid_orchestrator {

namespace {

Error mark_error(const WorkflowGraph& graph, size_t index, const char* what) {
    if (index >= graph.stage_count()) {
        return Error{"stage index " + std::to_string(index) + " out of range"};
    }
    return Error{"stage '" + graph.stage(index).id + "' " + what};
}

}  // anonymous namespace

ReadinessTracker::ReadinessTracker(const WorkflowGraph& graph)
    : graph_(&graph)
    , unresolved_(graph.stage_count(), 0)
    , marks_(graph.stage_count(), StageMark::Blocked) {
    for (size_t i = 0; i < graph.stage_count(); ++i) {
        unresolved_[i] = static_cast<uint32_t>(graph.dependencies(i).size());
        if (unresolved_[i] == 0) {
            marks_[i] = StageMark::Ready;
            ready_.emplace(graph.topological_rank(i), i);
        }
    }
}

Result<ReadinessTracker> ReadinessTracker::from_completed(
    const WorkflowGraph& graph, const std::vector<bool>& completed) {
    if (completed.size() != graph.stage_count()) {
        return Error{"completed set size does not match graph"};
    }

    ReadinessTracker tracker(graph);
    tracker.ready_.clear();

    for (size_t i = 0; i < graph.stage_count(); ++i) {
        uint32_t open = 0;
        for (size_t dep : graph.dependencies(i)) {
            if (!completed[dep]) ++open;
        }
        if (completed[i]) {
            if (open > 0) {
                return Error{"stage '" + graph.stage(i).id
                             + "' is completed but has incomplete dependencies"};
            }
            tracker.marks_[i] = StageMark::Completed;
            ++tracker.completed_;
        } else if (open == 0) {
            tracker.marks_[i] = StageMark::Ready;
            tracker.ready_.emplace(graph.topological_rank(i), i);
        } else {
            tracker.marks_[i] = StageMark::Blocked;
        }
        tracker.unresolved_[i] = open;
    }

    return tracker;
}

std::vector<size_t> ReadinessTracker::ready() const {
    std::vector<size_t> out;
    out.reserve(ready_.size());
    for (const auto& [rank, index] : ready_) out.push_back(index);
    return out;
}

Result<void> ReadinessTracker::mark_dispatched(size_t index) {
    if (index >= marks_.size() || marks_[index] != StageMark::Ready) {
        return mark_error(*graph_, index, "is not ready");
    }
    ready_.erase({graph_->topological_rank(index), index});
    marks_[index] = StageMark::Dispatched;
    return {};
}

Result<void> ReadinessTracker::requeue(size_t index) {
    if (index >= marks_.size() || marks_[index] != StageMark::Dispatched) {
        return mark_error(*graph_, index, "is not dispatched");
    }
    marks_[index] = StageMark::Ready;
    ready_.emplace(graph_->topological_rank(index), index);
    return {};
}

Result<std::vector<size_t>> ReadinessTracker::mark_completed(size_t index) {
    if (index >= marks_.size() || marks_[index] != StageMark::Dispatched) {
        return mark_error(*graph_, index, "was not dispatched");
    }
    marks_[index] = StageMark::Completed;
    ++completed_;

    std::vector<size_t> newly_ready;
    for (size_t next : graph_->dependents(index)) {
        if (unresolved_[next] == 0) continue;  // unreachable for a validated graph
        if (--unresolved_[next] == 0 && marks_[next] == StageMark::Blocked) {
            marks_[next] = StageMark::Ready;
            ready_.emplace(graph_->topological_rank(next), next);
            newly_ready.push_back(next);
        }
    }
    return newly_ready;
}

}  // namespace hybrid_orchestrator
