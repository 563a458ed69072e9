/**
 * @file test_readiness.cpp
 * @brief Unit tests for incremental ready-set tracking.
 */

#include "workflow/generator.hpp"
#include "workflow/readiness.hpp"

#include <gtest/gtest.h>

using namespace hybrid_orchestrator;

namespace {

WorkflowGraph build(WorkflowIR ir) {
    auto g = WorkflowGraph::build(std::move(ir));
    EXPECT_TRUE(g.has_value());
    return std::move(g).value();
}

}  // anonymous namespace

TEST(ReadinessTest, InitialReadySetIsRoots) {
    auto g = build(WorkflowGenerator::fan_out_sampling(3));
    ReadinessTracker tracker(g);

    EXPECT_EQ(tracker.ready(), (std::vector<size_t>{0}));
    EXPECT_EQ(tracker.mark(0), StageMark::Ready);
    EXPECT_EQ(tracker.mark(1), StageMark::Blocked);
    EXPECT_EQ(tracker.completed_count(), 0u);
    EXPECT_FALSE(tracker.all_completed());
}

TEST(ReadinessTest, CompletionUnblocksDependents) {
    auto g = build(WorkflowGenerator::fan_out_sampling(3));
    ReadinessTracker tracker(g);

    ASSERT_TRUE(tracker.mark_dispatched(0));
    EXPECT_EQ(tracker.ready_count(), 0u);

    auto unblocked = tracker.mark_completed(0);
    ASSERT_TRUE(unblocked);
    EXPECT_EQ(unblocked->size(), 3u);
    EXPECT_EQ(tracker.ready(), (std::vector<size_t>{1, 2, 3}));

    const size_t merge = *g.index_of("merge");
    for (size_t i : {1u, 2u}) {
        ASSERT_TRUE(tracker.mark_dispatched(i));
        auto next = tracker.mark_completed(i);
        ASSERT_TRUE(next);
        EXPECT_TRUE(next->empty());
        EXPECT_EQ(tracker.mark(merge), StageMark::Blocked);
    }

    ASSERT_TRUE(tracker.mark_dispatched(3));
    auto last = tracker.mark_completed(3);
    ASSERT_TRUE(last);
    EXPECT_EQ(*last, (std::vector<size_t>{merge}));

    ASSERT_TRUE(tracker.mark_dispatched(merge));
    ASSERT_TRUE(tracker.mark_completed(merge));
    EXPECT_TRUE(tracker.all_completed());
}

TEST(ReadinessTest, RequeueReturnsStageToReadySet) {
    auto g = build(WorkflowGenerator::linear_hybrid());
    ReadinessTracker tracker(g);

    ASSERT_TRUE(tracker.mark_dispatched(0));
    ASSERT_TRUE(tracker.requeue(0));
    EXPECT_EQ(tracker.mark(0), StageMark::Ready);
    EXPECT_EQ(tracker.ready(), (std::vector<size_t>{0}));
}

TEST(ReadinessTest, RejectsInvalidMarks) {
    auto g = build(WorkflowGenerator::linear_hybrid());
    ReadinessTracker tracker(g);

    EXPECT_FALSE(tracker.mark_dispatched(1));     // blocked
    EXPECT_FALSE(tracker.mark_completed(0));      // not dispatched
    EXPECT_FALSE(tracker.requeue(0));             // not dispatched
    EXPECT_FALSE(tracker.mark_dispatched(99));    // out of range

    ASSERT_TRUE(tracker.mark_dispatched(0));
    EXPECT_FALSE(tracker.mark_dispatched(0));     // already dispatched
}

TEST(ReadinessTest, FromCompletedResumesMidGraph) {
    auto g = build(WorkflowGenerator::linear_hybrid());
    auto tracker = ReadinessTracker::from_completed(g, {true, false, false});
    ASSERT_TRUE(tracker) << tracker.error().message;

    EXPECT_EQ(tracker->completed_count(), 1u);
    EXPECT_EQ(tracker->mark(0), StageMark::Completed);
    EXPECT_EQ(tracker->ready(), (std::vector<size_t>{1}));
    EXPECT_EQ(tracker->mark(2), StageMark::Blocked);

    ASSERT_TRUE(tracker->mark_dispatched(1));
    auto unblocked = tracker->mark_completed(1);
    ASSERT_TRUE(unblocked);
    EXPECT_EQ(*unblocked, (std::vector<size_t>{2}));
}

TEST(ReadinessTest, FromCompletedRejectsOpenSet) {
    auto g = build(WorkflowGenerator::linear_hybrid());
    EXPECT_FALSE(ReadinessTracker::from_completed(g, {false, true, false}));
    EXPECT_FALSE(ReadinessTracker::from_completed(g, {true, true}));
}

TEST(ReadinessTest, LayeredGraphCompletesInRankOrder) {
    auto g = build(WorkflowGenerator::layered_classical(4, 5));
    ReadinessTracker tracker(g);

    size_t completed = 0;
    size_t last_rank = 0;
    while (tracker.ready_count() > 0) {
        const size_t next = tracker.ready().front();
        EXPECT_GE(g.topological_rank(next), last_rank);
        last_rank = g.topological_rank(next);
        ASSERT_TRUE(tracker.mark_dispatched(next));
        ASSERT_TRUE(tracker.mark_completed(next));
        ++completed;
    }
    EXPECT_EQ(completed, 20u);
    EXPECT_TRUE(tracker.all_completed());
}
