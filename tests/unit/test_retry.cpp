/**
 * @file test_retry.cpp
 * @brief Unit tests for bounded exponential backoff.
 */

#include "recovery/retry.hpp"

#include <gtest/gtest.h>

using namespace hybrid_orchestrator;
using std::chrono::milliseconds;

TEST(RetryTest, ExponentialGrowthWithCap) {
    RetryPolicy policy{.max_attempts = 10,
                       .initial_backoff = milliseconds{100},
                       .max_backoff = milliseconds{1000},
                       .multiplier = 2.0};

    EXPECT_EQ(backoff_delay(policy, 0), Duration{0});
    EXPECT_EQ(backoff_delay(policy, 1), milliseconds{100});
    EXPECT_EQ(backoff_delay(policy, 2), milliseconds{200});
    EXPECT_EQ(backoff_delay(policy, 3), milliseconds{400});
    EXPECT_EQ(backoff_delay(policy, 4), milliseconds{800});
    EXPECT_EQ(backoff_delay(policy, 5), milliseconds{1000});
    EXPECT_EQ(backoff_delay(policy, 500), milliseconds{1000});
}

TEST(RetryTest, ConstantBackoffWithUnitMultiplier) {
    RetryPolicy policy{.max_attempts = 3,
                       .initial_backoff = milliseconds{50},
                       .max_backoff = milliseconds{1000},
                       .multiplier = 1.0};
    EXPECT_EQ(backoff_delay(policy, 1), milliseconds{50});
    EXPECT_EQ(backoff_delay(policy, 7), milliseconds{50});
}

TEST(RetryTest, ShouldRetryWithinBudget) {
    RetryPolicy policy{.max_attempts = 3};
    EXPECT_TRUE(should_retry(policy, 1));
    EXPECT_TRUE(should_retry(policy, 2));
    EXPECT_FALSE(should_retry(policy, 3));

    RetryPolicy single{.max_attempts = 1};
    EXPECT_FALSE(should_retry(single, 1));
}

TEST(RetryTest, PolicyFromConfig) {
    RetryConfig cfg{.max_attempts = 0, .initial_backoff_ms = 25, .max_backoff_ms = 75, .multiplier = 0.5};
    auto policy = retry_policy_from(cfg);
    EXPECT_EQ(policy.max_attempts, 1u);
    EXPECT_EQ(policy.initial_backoff, milliseconds{25});
    EXPECT_EQ(policy.max_backoff, milliseconds{75});
    EXPECT_DOUBLE_EQ(policy.multiplier, 1.0);
}

TEST(RetryTest, StageOverrideWins) {
    RetryPolicy fallback{.max_attempts = 3};
    Stage stage;
    stage.id = "execute";
    EXPECT_EQ(effective_retry_policy(stage, fallback).max_attempts, 3u);

    stage.retry = RetryPolicy{.max_attempts = 7};
    EXPECT_EQ(effective_retry_policy(stage, fallback).max_attempts, 7u);
}
