/**
 * @file stage.hpp
 * @brief Stage data model for hybrid quantum/classical workflows.
 *
 * A stage is one node of a workflow DAG. The set of stage kinds is closed:
 * StageBody is a std::variant and the pipeline driver dispatches on it with
 * an exhaustive std::visit, so adding a kind is a compile-time checked change.
 */

#pragma once

#include "core/types.hpp"

#include <compare>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace hybrid_orchestrator {

/// Helper for exhaustive std::visit over stage bodies.
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// ─────────────────────────────────────────────
// Data References
// ─────────────────────────────────────────────

/**
 * @brief Reference to a named output of another stage ("stage.output").
 */
struct DataRef {
    StageId stage;
    std::string output;

    [[nodiscard]] std::string str() const { return stage + "." + output; }

    /// Parse "stage.output"; the split happens at the first '.'.
    [[nodiscard]] static std::optional<DataRef> parse(std::string_view text);

    auto operator<=>(const DataRef&) const = default;
};

// ─────────────────────────────────────────────
// Constraints & Retry
// ─────────────────────────────────────────────

/**
 * @brief Placement requirements of a stage.
 *
 * min_qubits, connectivity and format are hard constraints. The noise
 * tolerance is compared against the resource's current calibration.
 */
struct ResourceConstraints {
    uint32_t min_qubits = 0;
    std::vector<std::pair<uint32_t, uint32_t>> connectivity;  ///< required couplings
    std::string format;                                       ///< empty = any format
    double max_two_qubit_error = 1.0;
    Duration estimated_duration{0};

    bool operator==(const ResourceConstraints&) const = default;
};

/**
 * @brief Bounded exponential backoff parameters for one stage.
 */
struct RetryPolicy {
    uint32_t max_attempts = 3;
    Duration initial_backoff = std::chrono::milliseconds{100};
    Duration max_backoff = std::chrono::seconds{10};
    double multiplier = 2.0;

    bool operator==(const RetryPolicy&) const = default;
};

// ─────────────────────────────────────────────
// Stage Kinds
// ─────────────────────────────────────────────

/// Front-end compilation of stage source to a backend payload format.
struct CompileStage {
    std::string source;
    std::string target_format;
    std::map<std::string, std::string> options;

    bool operator==(const CompileStage&) const = default;
};

/// Circuit execution on a quantum resource.
struct QuantumStage {
    std::optional<DataRef> circuit_input;   ///< upstream payload; overrides `circuit`
    std::string circuit;                    ///< inline payload
    uint32_t shots = 1024;
    std::map<std::string, std::string> options;

    bool operator==(const QuantumStage&) const = default;
};

/// In-process classical computation over prior results.
struct ClassicalStage {
    std::string function;
    std::map<std::string, double> params;

    bool operator==(const ClassicalStage&) const = default;
};

using StageBody = std::variant<CompileStage, QuantumStage, ClassicalStage>;

enum class StageKind : uint8_t {
    Compile,
    Quantum,
    Classical
};

[[nodiscard]] constexpr std::string_view to_string(StageKind kind) noexcept {
    switch (kind) {
        case StageKind::Compile:   return "compile";
        case StageKind::Quantum:   return "quantum";
        case StageKind::Classical: return "classical";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Stage
// ─────────────────────────────────────────────

struct Stage {
    StageId id;
    StageBody body;
    std::vector<StageId> dependencies;
    std::vector<DataRef> inputs;
    std::vector<std::string> outputs;
    ResourceConstraints constraints;
    std::optional<RetryPolicy> retry;       ///< nullopt = orchestrator default
    bool checkpointable = true;

    [[nodiscard]] StageKind kind() const noexcept {
        return static_cast<StageKind>(body.index());
    }

    bool operator==(const Stage&) const = default;
};

/**
 * @brief Portable description of a workflow before validation.
 */
struct WorkflowIR {
    std::string name;
    std::vector<Stage> stages;
};

}  // namespace hybrid_orchestrator
