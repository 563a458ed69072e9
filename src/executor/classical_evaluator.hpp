/**
 * @file classical_evaluator.hpp
 * @brief In-process evaluation of classical stages.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/collaborators.hpp"
#include "workflow/stage.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace hybrid_orchestrator {

using ClassicalFunction = std::function<Result<Datum, DispatchError>(
    const std::vector<Datum>& inputs, const std::map<std::string, double>& params)>;

/**
 * @brief Registry of named classical functions.
 *
 * Built-ins:
 *   identity          first input, or the params' values when there is none
 *   merge_counts      sum of all Counts inputs
 *   expectation_z     ⟨Z⊗…⊗Z⟩ estimate from Counts (bit parity)
 *   parameter_update  θ' = θ − learning_rate · E, with θ from the second
 *                     input or params["theta"]
 *
 * Registration happens before the orchestrator starts; evaluation is
 * read-only and safe from any worker thread.
 */
class ClassicalEvaluator {
public:
    ClassicalEvaluator();

    void register_function(const std::string& name, ClassicalFunction fn);
    [[nodiscard]] bool has(const std::string& name) const;

    [[nodiscard]] Result<Datum, DispatchError> evaluate(const ClassicalStage& stage,
                                                        const std::vector<Datum>& inputs) const;

private:
    std::map<std::string, ClassicalFunction> functions_;
};

}  // namespace hybrid_orchestrator
