/**
 * @file retry.cpp
 * @brief Retry policy helpers.
 */

#include "recovery/retry.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace hybrid_orchestrator {

RetryPolicy retry_policy_from(const RetryConfig& config) {
    return RetryPolicy{
        .max_attempts = std::max<uint32_t>(config.max_attempts, 1),
        .initial_backoff = std::chrono::milliseconds{static_cast<int64_t>(config.initial_backoff_ms)},
        .max_backoff = std::chrono::milliseconds{static_cast<int64_t>(config.max_backoff_ms)},
        .multiplier = std::max(config.multiplier, 1.0)
    };
}

const RetryPolicy& effective_retry_policy(const Stage& stage, const RetryPolicy& fallback) noexcept {
    return stage.retry ? *stage.retry : fallback;
}

Duration backoff_delay(const RetryPolicy& policy, uint32_t failed_attempts) noexcept {
    if (failed_attempts == 0) return Duration{0};

    const double base = static_cast<double>(policy.initial_backoff.count());
    const double cap = static_cast<double>(policy.max_backoff.count());
    const double scaled = base * std::pow(policy.multiplier, static_cast<double>(failed_attempts - 1));

    // pow can overflow to inf for large attempt counts; min() keeps it bounded
    return Duration{static_cast<int64_t>(std::min(scaled, cap))};
}

}  // namespace hybrid_orchestrator
