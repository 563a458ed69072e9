/**
 * @file test_job_state.cpp
 * @brief Unit tests for the job lifecycle state machine and job records.
 */

#include "lifecycle/job.hpp"
#include "lifecycle/job_state.hpp"
#include "workflow/generator.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace hybrid_orchestrator;

// ═══════════════════════════════════════════════
// Transition function
// ═══════════════════════════════════════════════

TEST(JobStateTest, HappyPath) {
    EXPECT_EQ(*transition(JobState::Pending, JobEvent::StartCompiling), JobState::Compiling);
    EXPECT_EQ(*transition(JobState::Compiling, JobEvent::FinishCompiling), JobState::Queued);
    EXPECT_EQ(*transition(JobState::Queued, JobEvent::StartRunning), JobState::Running);
    EXPECT_EQ(*transition(JobState::Running, JobEvent::FinishRunningOk), JobState::Done);
}

TEST(JobStateTest, FailureEventsFromEveryActiveState) {
    for (auto from : {JobState::Pending, JobState::Compiling, JobState::Queued, JobState::Running}) {
        EXPECT_EQ(*transition(from, JobEvent::Fail), JobState::Error);
        EXPECT_EQ(*transition(from, JobEvent::Cancel), JobState::Cancelled);
        EXPECT_EQ(*transition(from, JobEvent::Expire), JobState::Timeout);
    }
}

TEST(JobStateTest, TerminalStatesAcceptNothing) {
    const JobEvent events[] = {
        JobEvent::StartCompiling, JobEvent::FinishCompiling, JobEvent::StartRunning,
        JobEvent::FinishRunningOk, JobEvent::Fail, JobEvent::Cancel, JobEvent::Expire
    };
    for (auto from : {JobState::Done, JobState::Error, JobState::Cancelled, JobState::Timeout}) {
        EXPECT_TRUE(is_terminal(from));
        for (auto event : events) {
            EXPECT_FALSE(transition(from, event).has_value())
                << to_string(event) << " from " << to_string(from);
        }
    }
}

TEST(JobStateTest, SkippingPhasesIsRejected) {
    auto r = transition(JobState::Pending, JobEvent::StartRunning);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().from, JobState::Pending);
    EXPECT_EQ(r.error().message(), "invalid transition: start_running from PENDING");

    EXPECT_FALSE(transition(JobState::Compiling, JobEvent::FinishRunningOk));
    EXPECT_FALSE(transition(JobState::Queued, JobEvent::FinishCompiling));
}

TEST(JobStateTest, ProgressIsMonotonic) {
    EXPECT_LT(progress(JobState::Pending), progress(JobState::Compiling));
    EXPECT_LT(progress(JobState::Compiling), progress(JobState::Queued));
    EXPECT_LT(progress(JobState::Queued), progress(JobState::Running));
    EXPECT_DOUBLE_EQ(progress(JobState::Done), 1.0);
    EXPECT_DOUBLE_EQ(progress(JobState::Timeout), 1.0);
}

// ═══════════════════════════════════════════════
// JobLifecycle
// ═══════════════════════════════════════════════

TEST(JobLifecycleTest, RecordsHistory) {
    JobLifecycle lc;
    ASSERT_TRUE(lc.apply(JobEvent::StartCompiling));
    ASSERT_TRUE(lc.apply(JobEvent::FinishCompiling));
    ASSERT_TRUE(lc.apply(JobEvent::StartRunning));
    ASSERT_TRUE(lc.apply(JobEvent::FinishRunningOk));

    EXPECT_EQ(lc.state(), JobState::Done);
    EXPECT_TRUE(lc.terminal());
    ASSERT_EQ(lc.history().size(), 4u);
    EXPECT_EQ(lc.history()[0].from, JobState::Pending);
    EXPECT_EQ(lc.history()[3].to, JobState::Done);
    EXPECT_EQ(lc.cause(), CauseCode::None);
}

TEST(JobLifecycleTest, FailRequiresCause) {
    JobLifecycle lc;
    ASSERT_TRUE(lc.apply(JobEvent::StartCompiling));
    EXPECT_FALSE(lc.apply(JobEvent::Fail));
    EXPECT_FALSE(lc.apply(JobEvent::Expire));
    EXPECT_EQ(lc.state(), JobState::Compiling);

    ASSERT_TRUE(lc.apply(JobEvent::Fail, CauseCode::NoCandidate, "j/stages/execute/error.bin", "execute"));
    EXPECT_EQ(lc.state(), JobState::Error);
    EXPECT_EQ(lc.cause(), CauseCode::NoCandidate);
    EXPECT_EQ(lc.detail_ref(), "j/stages/execute/error.bin");
    EXPECT_EQ(lc.failed_stage(), "execute");
}

TEST(JobLifecycleTest, CancelDefaultsCause) {
    JobLifecycle lc;
    ASSERT_TRUE(lc.apply(JobEvent::Cancel));
    EXPECT_EQ(lc.state(), JobState::Cancelled);
    EXPECT_EQ(lc.cause(), CauseCode::Cancelled);
    EXPECT_TRUE(lc.failed_stage().empty());
}

TEST(JobLifecycleTest, NoEventAfterTerminal) {
    JobLifecycle lc;
    ASSERT_TRUE(lc.apply(JobEvent::Expire, CauseCode::Timeout));
    EXPECT_FALSE(lc.apply(JobEvent::Cancel));
    EXPECT_FALSE(lc.apply(JobEvent::Fail, CauseCode::Internal));
    EXPECT_EQ(lc.history().size(), 1u);
    EXPECT_EQ(lc.cause(), CauseCode::Timeout);
}

TEST(JobLifecycleTest, RestoreReplaysValidHistory) {
    JobLifecycle lc;
    ASSERT_TRUE(lc.apply(JobEvent::StartCompiling));
    ASSERT_TRUE(lc.apply(JobEvent::FinishCompiling));

    auto restored = JobLifecycle::restore(lc.history());
    ASSERT_TRUE(restored);
    EXPECT_EQ(restored->state(), JobState::Queued);
    EXPECT_EQ(restored->history().size(), 2u);
}

TEST(JobLifecycleTest, RestoreRejectsForgedHistory) {
    std::vector<StateTransition> forged{
        StateTransition{.from = JobState::Pending, .to = JobState::Running,
                        .event = JobEvent::StartRunning, .at = {},
                        .cause = CauseCode::None, .detail_ref = {}, .stage = {}}
    };
    EXPECT_FALSE(JobLifecycle::restore(forged));
}

// ═══════════════════════════════════════════════
// Job record
// ═══════════════════════════════════════════════

TEST(JobRecordTest, ProjectsStagesAndState) {
    auto graph = WorkflowGraph::build(WorkflowGenerator::linear_hybrid());
    ASSERT_TRUE(graph);

    Job job;
    job.id = "job-1";
    job.priority = 3;
    job.graph = std::make_shared<const WorkflowGraph>(std::move(*graph));
    job.stages.resize(job.graph->stage_count());
    job.stages[0].phase = StagePhase::Completed;
    job.stages[0].attempts = 1;
    job.stages[0].outputs["circuit"] = StoredOutput{"job-1/stages/compile/circuit.bin", 42};
    ASSERT_TRUE(job.lifecycle.apply(JobEvent::StartCompiling));

    auto record = job.record();
    EXPECT_EQ(record.id, "job-1");
    EXPECT_EQ(record.workflow, "linear_hybrid");
    EXPECT_EQ(record.fingerprint, job.graph->fingerprint());
    EXPECT_EQ(record.priority, 3);
    EXPECT_EQ(record.state, JobState::Compiling);
    ASSERT_EQ(record.stages.size(), 3u);
    EXPECT_EQ(record.stages[0].id, "compile");
    EXPECT_EQ(record.stages[0].phase, StagePhase::Completed);
    EXPECT_EQ(record.stages[0].outputs.at("circuit").checksum, 42u);
    EXPECT_EQ(record.stages[2].id, "reduce");
    EXPECT_EQ(record.transitions.size(), 1u);
}
