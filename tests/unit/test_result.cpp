/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E>.
 */

#include "core/result.hpp"
#include "workflow/workflow_graph.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace hybrid_orchestrator;

TEST(ResultTest, SuccessValue) {
    Result<int> r(42);
    EXPECT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r(Error{"lease not held"});
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "lease not held");
    EXPECT_EQ(r.error().what(), "lease not held");
}

TEST(ResultTest, WrongAccessThrows) {
    Result<int> ok(1);
    Result<int> bad(Error{"x"});
    EXPECT_THROW((void)ok.error(), std::logic_error);
    EXPECT_THROW((void)bad.value(), std::logic_error);
}

TEST(ResultTest, ValueOr) {
    Result<int> ok(10);
    Result<int> bad(Error{"fail"});
    EXPECT_EQ(ok.value_or(0), 10);
    EXPECT_EQ(bad.value_or(99), 99);
}

TEST(ResultTest, Map) {
    Result<int> r(5);
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(doubled.value(), 10);

    Result<int> bad(Error{"no"});
    auto mapped = bad.map([](int v) { return v * 2; });
    ASSERT_FALSE(mapped.has_value());
    EXPECT_EQ(mapped.error().message, "no");
}

TEST(ResultTest, AndThenChainsAndShortCircuits) {
    auto half = [](int v) -> Result<int> {
        if (v % 2 != 0) return Error{"odd"};
        return v / 2;
    };

    auto ok = Result<int>(8).and_then(half).and_then(half);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), 2);

    auto stopped = Result<int>(6).and_then(half).and_then(half);
    ASSERT_FALSE(stopped.has_value());
    EXPECT_EQ(stopped.error().message, "odd");
}

TEST(ResultTest, MapErrorChangesErrorType) {
    Result<int> bad(Error{"no stages"});
    auto converted = bad.map_error([](const Error& e) {
        return ValidationError{ValidationError::Kind::EmptyGraph, {}, e.message};
    });
    ASSERT_FALSE(converted.has_value());
    EXPECT_EQ(converted.error().kind, ValidationError::Kind::EmptyGraph);
    EXPECT_EQ(converted.error().message, "no stages");
}

TEST(ResultTest, CustomErrorType) {
    Result<std::string, ValidationError> r(
        ValidationError{ValidationError::Kind::Cycle, "a", "dependency cycle"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().stage, "a");
    EXPECT_EQ(to_string(r.error().kind), "cycle");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());

    Result<void> bad(Error{"failed"});
    EXPECT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().message, "failed");
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>("something went wrong");
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> r(std::make_unique<int>(7));
    ASSERT_TRUE(r);
    auto owned = std::move(r).value();
    EXPECT_EQ(*owned, 7);
}
