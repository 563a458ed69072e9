/**
 * @file classical_evaluator.cpp
 * @brief Built-in classical functions.
 */

#include "executor/classical_evaluator.hpp"

#include <algorithm>

namespace hybrid_orchestrator {

namespace {

DispatchError malformed(const std::string& message) {
    return DispatchError{DispatchCause::MalformedPayload, message};
}

double param_or(const std::map<std::string, double>& params, const std::string& key, double fallback) {
    auto it = params.find(key);
    return it == params.end() ? fallback : it->second;
}

Result<Datum, DispatchError> identity(const std::vector<Datum>& inputs,
                                      const std::map<std::string, double>& params) {
    if (!inputs.empty()) return inputs.front();
    Parameters values;
    values.reserve(params.size());
    for (const auto& [key, value] : params) values.push_back(value);
    return Datum{std::move(values)};
}

Result<Datum, DispatchError> merge_counts(const std::vector<Datum>& inputs,
                                          const std::map<std::string, double>& /*params*/) {
    Counts merged;
    for (const auto& input : inputs) {
        const auto* counts = std::get_if<Counts>(&input);
        if (!counts) return malformed("merge_counts expects counts inputs");
        for (const auto& [bits, n] : *counts) merged[bits] += n;
    }
    return Datum{std::move(merged)};
}

Result<Datum, DispatchError> expectation_z(const std::vector<Datum>& inputs,
                                           const std::map<std::string, double>& /*params*/) {
    if (inputs.size() != 1) return malformed("expectation_z expects exactly one input");
    const auto* counts = std::get_if<Counts>(&inputs.front());
    if (!counts) return malformed("expectation_z expects counts");

    uint64_t total = 0;
    int64_t signed_sum = 0;
    for (const auto& [bits, n] : *counts) {
        auto ones = std::count(bits.begin(), bits.end(), '1');
        signed_sum += (ones % 2 == 0) ? static_cast<int64_t>(n) : -static_cast<int64_t>(n);
        total += n;
    }
    if (total == 0) return malformed("expectation_z: empty histogram");

    return Datum{Parameters{static_cast<double>(signed_sum) / static_cast<double>(total)}};
}

Result<Datum, DispatchError> parameter_update(const std::vector<Datum>& inputs,
                                              const std::map<std::string, double>& params) {
    if (inputs.empty() || inputs.size() > 2) {
        return malformed("parameter_update expects an expectation and an optional theta");
    }
    const auto* expectation = std::get_if<Parameters>(&inputs[0]);
    if (!expectation || expectation->empty()) return malformed("parameter_update: bad expectation");

    Parameters theta{param_or(params, "theta", 0.0)};
    if (inputs.size() == 2) {
        const auto* prev = std::get_if<Parameters>(&inputs[1]);
        if (!prev || prev->empty()) return malformed("parameter_update: bad theta input");
        theta = *prev;
    }

    const double rate = param_or(params, "learning_rate", 0.1);
    for (double& t : theta) t -= rate * expectation->front();
    return Datum{std::move(theta)};
}

}  // anonymous namespace

ClassicalEvaluator::ClassicalEvaluator() {
    functions_.emplace("identity", identity);
    functions_.emplace("merge_counts", merge_counts);
    functions_.emplace("expectation_z", expectation_z);
    functions_.emplace("parameter_update", parameter_update);
}

void ClassicalEvaluator::register_function(const std::string& name, ClassicalFunction fn) {
    functions_[name] = std::move(fn);
}

bool ClassicalEvaluator::has(const std::string& name) const {
    return functions_.contains(name);
}

Result<Datum, DispatchError> ClassicalEvaluator::evaluate(const ClassicalStage& stage,
                                                          const std::vector<Datum>& inputs) const {
    auto it = functions_.find(stage.function);
    if (it == functions_.end()) {
        return DispatchError{DispatchCause::UnsupportedFormat,
                             "unknown classical function '" + stage.function + "'"};
    }
    return it->second(inputs, stage.params);
}

}  // namespace hybrid_orchestrator
