/**
 * @file test_generator.cpp
 * @brief Unit tests for the synthetic workflow generator.
 */

#include "workflow/generator.hpp"
#include "workflow/workflow_graph.hpp"

#include <gtest/gtest.h>

using namespace hybrid_orchestrator;

TEST(GeneratorTest, LinearHybrid) {
    auto ir = WorkflowGenerator::linear_hybrid();
    ASSERT_EQ(ir.stages.size(), 3u);
    EXPECT_EQ(ir.stages[0].kind(), StageKind::Compile);
    EXPECT_EQ(ir.stages[1].kind(), StageKind::Quantum);
    EXPECT_EQ(ir.stages[2].kind(), StageKind::Classical);
    EXPECT_FALSE(ir.stages[2].checkpointable);

    auto g = WorkflowGraph::build(std::move(ir));
    ASSERT_TRUE(g) << g.error().message;
    EXPECT_EQ(g->edge_count(), 2u);
}

TEST(GeneratorTest, FanOutSampling) {
    GeneratorOptions opts;
    opts.qubits = 3;
    opts.shots = 200;
    auto ir = WorkflowGenerator::fan_out_sampling(5, opts);
    ASSERT_EQ(ir.stages.size(), 7u);
    EXPECT_EQ(ir.name, "fan_out_5");

    const auto& branch = ir.stages[1];
    EXPECT_EQ(branch.constraints.min_qubits, 3u);
    EXPECT_EQ(std::get<QuantumStage>(branch.body).shots, 200u);

    const auto& merge = ir.stages.back();
    EXPECT_EQ(merge.id, "merge");
    EXPECT_EQ(merge.dependencies.size(), 5u);
    EXPECT_EQ(merge.inputs.size(), 5u);

    auto g = WorkflowGraph::build(std::move(ir));
    ASSERT_TRUE(g) << g.error().message;
    EXPECT_EQ(g->edge_count(), 10u);
}

TEST(GeneratorTest, VariationalLoopChainsUpdates) {
    auto ir = WorkflowGenerator::variational_loop(3);
    ASSERT_EQ(ir.stages.size(), 1u + 3u * 3u);

    auto g = WorkflowGraph::build(std::move(ir));
    ASSERT_TRUE(g) << g.error().message;

    const size_t update0 = *g->index_of("update_0");
    const size_t update2 = *g->index_of("update_2");
    const size_t execute1 = *g->index_of("execute_1");
    EXPECT_TRUE(g->is_ancestor(update0, update2));
    EXPECT_TRUE(g->is_ancestor(update0, execute1));

    const auto& body = std::get<ClassicalStage>(g->stage(update2).body);
    EXPECT_EQ(body.function, "parameter_update");
    EXPECT_EQ(g->stage(update2).inputs.size(), 2u);
}

TEST(GeneratorTest, LayeredClassical) {
    auto ir = WorkflowGenerator::layered_classical(3, 4);
    ASSERT_EQ(ir.stages.size(), 12u);

    auto g = WorkflowGraph::build(std::move(ir));
    ASSERT_TRUE(g) << g.error().message;
    // Every stage of layers 1 and 2 depends on the whole previous layer
    EXPECT_EQ(g->edge_count(), 2u * 4u * 4u);
    EXPECT_EQ(g->ready_stages({}).size(), 4u);
}

TEST(GeneratorTest, StageDurationPropagates) {
    GeneratorOptions opts;
    opts.stage_duration = std::chrono::milliseconds{5};
    auto g = WorkflowGraph::build(WorkflowGenerator::linear_hybrid(opts));
    ASSERT_TRUE(g);
    // compile and execute carry the duration; the classical reduce does not
    EXPECT_EQ(g->critical_path_estimate(), std::chrono::milliseconds{10});
}
