/**
 * @file policy.hpp
 * @brief Pluggable resource-selection policies.
 *
 * Selection runs in two phases. Hard constraints (qubit count, coupling
 * subgraph, payload format) are checked first: a stage no registered
 * resource can ever satisfy fails fatally. The remaining candidates are
 * then filtered by current suitability (availability, free lease capacity,
 * calibration within the stage's noise tolerance); if none is left the
 * condition is transient and the stage stays queued. Only then does the
 * policy choose among eligible candidates.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "scheduler/resource.hpp"
#include "workflow/stage.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hybrid_orchestrator {

// ─────────────────────────────────────────────
// Selection Errors
// ─────────────────────────────────────────────

struct SelectionError {
    enum class Kind : uint8_t {
        Transient,      ///< no candidate free right now; keep the stage queued
        Fatal           ///< no candidate can ever satisfy the hard constraints
    };

    Kind kind;
    CauseCode cause;
    std::string message;

    [[nodiscard]] bool fatal() const noexcept { return kind == Kind::Fatal; }
};

/// Why `resource` can never host `constraints`, or nullopt if it can.
[[nodiscard]] std::optional<std::string> hard_constraint_violation(
    const ResourceConstraints& constraints, const Resource& resource);

// ─────────────────────────────────────────────
// Fitness
// ─────────────────────────────────────────────

struct PolicyContext {
    Timestamp now;
};

class IFitnessFunction {
public:
    virtual ~IFitnessFunction() = default;
    [[nodiscard]] virtual double score(const Stage& stage, const Resource& candidate,
                                       const PolicyContext& ctx) const = 0;
};

/**
 * @brief Weighted sum of soft signals:
 *
 *   score = w_success * success_rate
 *         - w_queue   * depth / (1 + depth)
 *         - w_calib   * min(calibration_age / horizon, 1)
 */
class WeightedFitness : public IFitnessFunction {
public:
    explicit WeightedFitness(FitnessConfig config = {});

    [[nodiscard]] double score(const Stage& stage, const Resource& candidate,
                               const PolicyContext& ctx) const override;

private:
    FitnessConfig config_;
};

// ─────────────────────────────────────────────
// Policies
// ─────────────────────────────────────────────

/**
 * @brief Chooses one of the eligible candidates.
 *
 * `candidates` is never empty, is in registration order, and every entry
 * already satisfies the stage's hard and current constraints. The
 * candidates' queue_depth includes leases held by this orchestrator.
 */
class ISchedulingPolicy {
public:
    virtual ~ISchedulingPolicy() = default;
    [[nodiscard]] virtual size_t choose(const Stage& stage,
                                        std::span<const Resource> candidates,
                                        const PolicyContext& ctx) const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

class FirstFitPolicy : public ISchedulingPolicy {
public:
    [[nodiscard]] size_t choose(const Stage& stage,
                                std::span<const Resource> candidates,
                                const PolicyContext& ctx) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "first_fit"; }
};

/**
 * @brief Maximum fitness; ties go to the lowest estimated wait, then to
 *        registration order.
 */
class QualityAwarePolicy : public ISchedulingPolicy {
public:
    explicit QualityAwarePolicy(std::unique_ptr<IFitnessFunction> fitness);

    [[nodiscard]] size_t choose(const Stage& stage,
                                std::span<const Resource> candidates,
                                const PolicyContext& ctx) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "quality_aware"; }

private:
    std::unique_ptr<IFitnessFunction> fitness_;
};

/// Build the policy named in configuration ("first_fit" or "quality_aware").
[[nodiscard]] std::unique_ptr<ISchedulingPolicy> make_policy(const SchedulerConfig& config);

// ─────────────────────────────────────────────
// Candidate Selection
// ─────────────────────────────────────────────

/**
 * @brief Pure selection over a candidate snapshot.
 *
 * @param in_use  leases currently held per candidate (same indexing)
 * @return index into `candidates`
 */
[[nodiscard]] Result<size_t, SelectionError> select_candidate(
    const Stage& stage,
    std::span<const Resource> candidates,
    std::span<const uint32_t> in_use,
    const ISchedulingPolicy& policy,
    const PolicyContext& ctx);

}  // namespace hybrid_orchestrator
