/**
 * @file generator.hpp
 * @brief Synthetic hybrid workflows for the demo, tests and benchmarks.
 */

#pragma once

#include "workflow/stage.hpp"

#include <cstddef>
#include <cstdint>

namespace hybrid_orchestrator {

struct GeneratorOptions {
    uint32_t qubits = 2;
    uint32_t shots = 1000;
    std::string format = "openqasm3";
    Duration stage_duration = std::chrono::milliseconds{1};
};

/**
 * @brief Factory for synthetic workflow IRs with common hybrid topologies.
 */
class WorkflowGenerator {
public:
    /// compile → execute → reduce
    static WorkflowIR linear_hybrid(const GeneratorOptions& opts = {});

    /// compile → {execute_0 .. execute_{width-1}} → merge
    static WorkflowIR fan_out_sampling(size_t width, const GeneratorOptions& opts = {});

    /**
     * @brief Unrolled variational loop.
     *
     * compile → (execute_i → expectation_i → update_i) for i in [0, iterations),
     * each update feeding the next iteration's expectation stage.
     */
    static WorkflowIR variational_loop(size_t iterations, const GeneratorOptions& opts = {});

    /// Layered classical-only DAG of `layers × width` stages for stress tests.
    static WorkflowIR layered_classical(size_t layers, size_t width);
};

}  // namespace hybrid_orchestrator
