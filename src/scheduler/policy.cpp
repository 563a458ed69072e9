/**
 * @file policy.cpp
 * @brief Hard-constraint filtering, fitness scoring, and the two policies.
 *
 * Complexity: O(R × C) per selection, R = candidates, C = required couplings.
 */

#include "scheduler/policy.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>

namespace hybrid_orchestrator {

std::optional<std::string> hard_constraint_violation(const ResourceConstraints& constraints,
                                                     const Resource& resource) {
    if (resource.qubits < constraints.min_qubits) {
        return std::format("{}: {} qubits < {} required",
                           resource.id, resource.qubits, constraints.min_qubits);
    }
    if (!resource.supports_format(constraints.format)) {
        return std::format("{}: format '{}' not supported", resource.id, constraints.format);
    }
    for (const auto& [a, b] : constraints.connectivity) {
        if (!resource.has_coupling(a, b)) {
            return std::format("{}: coupling {}-{} not present", resource.id, a, b);
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// WeightedFitness
// ─────────────────────────────────────────────

WeightedFitness::WeightedFitness(FitnessConfig config)
    : config_(config) {}

double WeightedFitness::score(const Stage& /*stage*/, const Resource& candidate,
                              const PolicyContext& ctx) const {
    const auto& q = candidate.quality;

    double depth = static_cast<double>(q.queue_depth);
    double queue_penalty = depth / (1.0 + depth);

    double age_s = std::chrono::duration<double>(ctx.now - q.last_calibration).count();
    double horizon = config_.calibration_horizon_s > 0.0 ? config_.calibration_horizon_s : 1.0;
    double staleness = std::clamp(age_s / horizon, 0.0, 1.0);

    return config_.success_weight * q.success_rate
         - config_.queue_weight * queue_penalty
         - config_.calibration_weight * staleness;
}

// ─────────────────────────────────────────────
// Policies
// ─────────────────────────────────────────────

size_t FirstFitPolicy::choose(const Stage& /*stage*/,
                              std::span<const Resource> /*candidates*/,
                              const PolicyContext& /*ctx*/) const {
    return 0;
}

QualityAwarePolicy::QualityAwarePolicy(std::unique_ptr<IFitnessFunction> fitness)
    : fitness_(std::move(fitness)) {
    if (!fitness_) fitness_ = std::make_unique<WeightedFitness>();
}

size_t QualityAwarePolicy::choose(const Stage& stage,
                                  std::span<const Resource> candidates,
                                  const PolicyContext& ctx) const {
    constexpr double kEpsilon = 1e-9;

    size_t best = 0;
    double best_score = fitness_->score(stage, candidates[0], ctx);

    for (size_t i = 1; i < candidates.size(); ++i) {
        double s = fitness_->score(stage, candidates[i], ctx);
        if (s > best_score + kEpsilon) {
            best = i;
            best_score = s;
        } else if (std::abs(s - best_score) <= kEpsilon
                   && candidates[i].quality.estimated_wait < candidates[best].quality.estimated_wait) {
            best = i;
            best_score = s;
        }
    }
    return best;
}

std::unique_ptr<ISchedulingPolicy> make_policy(const SchedulerConfig& config) {
    if (config.policy == "quality_aware") {
        return std::make_unique<QualityAwarePolicy>(
            std::make_unique<WeightedFitness>(config.fitness));
    }
    return std::make_unique<FirstFitPolicy>();  // default
}

// ─────────────────────────────────────────────
// Candidate Selection
// ─────────────────────────────────────────────

Result<size_t, SelectionError> select_candidate(const Stage& stage,
                                                std::span<const Resource> candidates,
                                                std::span<const uint32_t> in_use,
                                                const ISchedulingPolicy& policy,
                                                const PolicyContext& ctx) {
    const auto& constraints = stage.constraints;

    // Phase 1: hard constraints
    std::vector<size_t> feasible;
    std::string reasons;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (auto why = hard_constraint_violation(constraints, candidates[i])) {
            if (!reasons.empty()) reasons += "; ";
            reasons += *why;
        } else {
            feasible.push_back(i);
        }
    }
    if (feasible.empty()) {
        return SelectionError{
            SelectionError::Kind::Fatal, CauseCode::NoCandidate,
            "no resource can satisfy stage '" + stage.id + "'"
                + (reasons.empty() ? std::string{": no resources registered"} : ": " + reasons)
        };
    }

    // Phase 2: current suitability
    std::vector<Resource> eligible;
    std::vector<size_t> eligible_index;
    bool any_busy = false;
    for (size_t i : feasible) {
        const auto& r = candidates[i];
        uint32_t held = i < in_use.size() ? in_use[i] : 0;
        if (!r.available || r.quality.two_qubit_error > constraints.max_two_qubit_error) continue;
        if (held >= r.capacity) {
            any_busy = true;
            continue;
        }
        eligible.push_back(r);
        eligible.back().quality.queue_depth += held;
        eligible_index.push_back(i);
    }
    if (eligible.empty()) {
        return SelectionError{
            SelectionError::Kind::Transient,
            any_busy ? CauseCode::ResourceBusy : CauseCode::ResourceUnavailable,
            "no suitable resource currently free for stage '" + stage.id + "'"
        };
    }

    // Phase 3: policy
    size_t chosen = policy.choose(stage, eligible, ctx);
    if (chosen >= eligible.size()) chosen = 0;
    return eligible_index[chosen];
}

}  // namespace hybrid_orchestrator
