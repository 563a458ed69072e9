/**
 * @file retry.hpp
 * @brief Bounded exponential backoff for stage retries.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "workflow/stage.hpp"

#include <cstdint>

namespace hybrid_orchestrator {

/// Orchestrator-wide default retry policy from configuration.
[[nodiscard]] RetryPolicy retry_policy_from(const RetryConfig& config);

/// The stage's own retry policy, or the default.
[[nodiscard]] const RetryPolicy& effective_retry_policy(const Stage& stage,
                                                        const RetryPolicy& fallback) noexcept;

/**
 * @brief Delay before attempt `failed_attempts + 1`.
 *
 * initial_backoff × multiplier^(failed_attempts − 1), capped at
 * max_backoff. Deterministic (no jitter) so resumed runs replay the same
 * schedule.
 */
[[nodiscard]] Duration backoff_delay(const RetryPolicy& policy, uint32_t failed_attempts) noexcept;

/// True while another attempt fits in the budget.
[[nodiscard]] constexpr bool should_retry(const RetryPolicy& policy, uint32_t attempts_made) noexcept {
    return attempts_made < policy.max_attempts;
}

}  // namespace hybrid_orchestrator
