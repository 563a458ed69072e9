/**
 * @file generator.cpp
 * @brief Synthetic workflow generator: all topology implementations.
 *
 * Generates IRs that model common hybrid patterns:
 * - Linear hybrid pipeline (compile, sample, reduce)
 * - Fan-out sampling (independent circuit executions merged classically)
 * - Variational loop (sample / estimate / update, unrolled)
 * - Layered classical DAGs (readiness stress tests)
 */

#include "workflow/generator.hpp"

#include <format>

namespace hybrid_orchestrator {

namespace {

constexpr const char* kBellCircuit =
    "OPENQASM 3; qubit[2] q; bit[2] c; h q[0]; cx q[0], q[1]; c = measure q;";

Stage compile_stage(const GeneratorOptions& opts) {
    Stage s;
    s.id = "compile";
    s.body = CompileStage{.source = kBellCircuit, .target_format = opts.format, .options = {}};
    s.outputs = {"circuit"};
    s.constraints.estimated_duration = opts.stage_duration;
    return s;
}

Stage execute_stage(const std::string& id, const GeneratorOptions& opts) {
    Stage s;
    s.id = id;
    s.body = QuantumStage{
        .circuit_input = DataRef{"compile", "circuit"},
        .circuit = {},
        .shots = opts.shots,
        .options = {}
    };
    s.dependencies = {"compile"};
    s.inputs = {DataRef{"compile", "circuit"}};
    s.outputs = {"counts"};
    s.constraints.min_qubits = opts.qubits;
    s.constraints.format = opts.format;
    s.constraints.estimated_duration = opts.stage_duration;
    return s;
}

Stage classical_stage(const std::string& id, const std::string& function,
                      std::vector<StageId> deps, std::vector<DataRef> inputs,
                      std::string output) {
    Stage s;
    s.id = id;
    s.body = ClassicalStage{.function = function, .params = {}};
    s.dependencies = std::move(deps);
    s.inputs = std::move(inputs);
    s.outputs = {std::move(output)};
    return s;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Linear hybrid: compile → execute → reduce
// ─────────────────────────────────────────────

WorkflowIR WorkflowGenerator::linear_hybrid(const GeneratorOptions& opts) {
    WorkflowIR ir;
    ir.name = "linear_hybrid";
    ir.stages.push_back(compile_stage(opts));
    ir.stages.push_back(execute_stage("execute", opts));
    auto reduce = classical_stage("reduce", "expectation_z", {"execute"},
                                  {DataRef{"execute", "counts"}}, "expectation");
    reduce.checkpointable = false;
    ir.stages.push_back(std::move(reduce));
    return ir;
}

// ─────────────────────────────────────────────
// Fan-out sampling:
//            compile
//         /    |    \   (backslash)
//   execute_0 ...  execute_{w-1}
//         \    |    /
//             merge
// ─────────────────────────────────────────────

WorkflowIR WorkflowGenerator::fan_out_sampling(size_t width, const GeneratorOptions& opts) {
    WorkflowIR ir;
    ir.name = std::format("fan_out_{}", width);
    ir.stages.push_back(compile_stage(opts));

    std::vector<StageId> branches;
    std::vector<DataRef> merge_inputs;
    for (size_t i = 0; i < width; ++i) {
        auto id = std::format("execute_{}", i);
        ir.stages.push_back(execute_stage(id, opts));
        branches.push_back(id);
        merge_inputs.push_back(DataRef{id, "counts"});
    }

    ir.stages.push_back(classical_stage("merge", "merge_counts", std::move(branches),
                                        std::move(merge_inputs), "counts"));
    return ir;
}

// ─────────────────────────────────────────────
// Variational loop (unrolled)
// ─────────────────────────────────────────────

WorkflowIR WorkflowGenerator::variational_loop(size_t iterations, const GeneratorOptions& opts) {
    WorkflowIR ir;
    ir.name = std::format("variational_{}", iterations);
    ir.stages.push_back(compile_stage(opts));

    for (size_t i = 0; i < iterations; ++i) {
        auto exec_id = std::format("execute_{}", i);
        auto expect_id = std::format("expectation_{}", i);
        auto update_id = std::format("update_{}", i);

        auto exec = execute_stage(exec_id, opts);
        if (i > 0) exec.dependencies.push_back(std::format("update_{}", i - 1));
        ir.stages.push_back(std::move(exec));

        ir.stages.push_back(classical_stage(expect_id, "expectation_z", {exec_id},
                                            {DataRef{exec_id, "counts"}}, "value"));

        std::vector<StageId> update_deps{expect_id};
        std::vector<DataRef> update_inputs{DataRef{expect_id, "value"}};
        if (i > 0) {
            auto prev = std::format("update_{}", i - 1);
            update_deps.push_back(prev);
            update_inputs.push_back(DataRef{prev, "theta"});
        }
        auto update = classical_stage(update_id, "parameter_update", std::move(update_deps),
                                      std::move(update_inputs), "theta");
        std::get<ClassicalStage>(update.body).params = {{"learning_rate", 0.1}, {"theta", 0.5}};
        ir.stages.push_back(std::move(update));
    }

    return ir;
}

// ─────────────────────────────────────────────
// Layered classical DAG: each stage depends on every stage of the previous layer
// ─────────────────────────────────────────────

WorkflowIR WorkflowGenerator::layered_classical(size_t layers, size_t width) {
    WorkflowIR ir;
    ir.name = std::format("layered_{}x{}", layers, width);

    for (size_t layer = 0; layer < layers; ++layer) {
        for (size_t w = 0; w < width; ++w) {
            std::vector<StageId> deps;
            if (layer > 0) {
                for (size_t p = 0; p < width; ++p) {
                    deps.push_back(std::format("l{}_{}", layer - 1, p));
                }
            }
            auto stage = classical_stage(std::format("l{}_{}", layer, w), "identity",
                                         std::move(deps), {}, "out");
            stage.checkpointable = false;
            ir.stages.push_back(std::move(stage));
        }
    }

    return ir;
}

}  // namespace hybrid_orchestrator
