/**
 * @file workflow_loader.cpp
 * @brief TOML → WorkflowIR using toml++.
 */

#include "workflow/workflow_loader.hpp"

#include <toml++/toml.hpp>

#include <string>

namespace hybrid_orchestrator {

namespace {

std::vector<std::string> string_list(const toml::node_view<const toml::node>& node) {
    std::vector<std::string> out;
    if (const auto* arr = node.as_array()) {
        for (const auto& item : *arr) {
            if (auto s = item.value<std::string>()) out.push_back(*s);
        }
    }
    return out;
}

std::map<std::string, std::string> string_table(const toml::node_view<const toml::node>& node) {
    std::map<std::string, std::string> out;
    if (const auto* tbl = node.as_table()) {
        for (const auto& [key, value] : *tbl) {
            if (auto s = value.value<std::string>()) {
                out.emplace(std::string{key.str()}, *s);
            }
        }
    }
    return out;
}

Result<std::vector<DataRef>> parse_refs(const std::vector<std::string>& texts, const std::string& stage) {
    std::vector<DataRef> refs;
    for (const auto& text : texts) {
        auto ref = DataRef::parse(text);
        if (!ref) {
            return Error{"stage '" + stage + "': input '" + text + "' is not of the form stage.output"};
        }
        refs.push_back(std::move(*ref));
    }
    return refs;
}

Result<Stage> parse_stage(const toml::table& t, size_t index) {
    Stage stage;
    stage.id = t["id"].value_or(std::string{});
    if (stage.id.empty()) {
        return Error{"stages[" + std::to_string(index) + "]: id is required"};
    }

    const std::string kind = t["kind"].value_or(std::string{});
    if (kind == "compile") {
        stage.body = CompileStage{
            .source = t["source"].value_or(std::string{}),
            .target_format = t["target"].value_or(std::string{}),
            .options = string_table(t["options"])
        };
    } else if (kind == "quantum") {
        QuantumStage q;
        if (auto input = t["circuit_input"].value<std::string>()) {
            q.circuit_input = DataRef::parse(*input);
            if (!q.circuit_input) {
                return Error{"stage '" + stage.id + "': circuit_input '" + *input
                             + "' is not of the form stage.output"};
            }
        }
        q.circuit = t["circuit"].value_or(std::string{});
        q.shots = static_cast<uint32_t>(t["shots"].value_or(int64_t{1024}));
        q.options = string_table(t["options"]);
        stage.body = std::move(q);
    } else if (kind == "classical") {
        ClassicalStage c;
        c.function = t["function"].value_or(std::string{});
        if (const auto* params = t["params"].as_table()) {
            for (const auto& [key, value] : *params) {
                if (auto d = value.value<double>()) c.params.emplace(std::string{key.str()}, *d);
            }
        }
        stage.body = std::move(c);
    } else {
        return Error{"stage '" + stage.id + "': unknown kind '" + kind + "'"};
    }

    stage.dependencies = string_list(t["depends_on"]);
    auto inputs = parse_refs(string_list(t["inputs"]), stage.id);
    if (!inputs) return inputs.error();
    stage.inputs = std::move(*inputs);
    stage.outputs = string_list(t["outputs"]);

    // Constraints
    auto& c = stage.constraints;
    c.min_qubits = static_cast<uint32_t>(t["min_qubits"].value_or(int64_t{0}));
    c.format = t["format"].value_or(std::string{});
    c.max_two_qubit_error = t["max_two_qubit_error"].value_or(1.0);
    c.estimated_duration = std::chrono::milliseconds{t["estimated_duration_ms"].value_or(int64_t{0})};
    if (const auto* connectivity = t["connectivity"].as_array()) {
        for (const auto& edge : *connectivity) {
            const auto* pair = edge.as_array();
            auto a = pair && pair->size() == 2 ? (*pair)[0].value<int64_t>() : std::nullopt;
            auto b = pair && pair->size() == 2 ? (*pair)[1].value<int64_t>() : std::nullopt;
            if (!a || !b || *a < 0 || *b < 0) {
                return Error{"stage '" + stage.id + "': connectivity entries must be [a, b] qubit pairs"};
            }
            c.connectivity.emplace_back(static_cast<uint32_t>(*a), static_cast<uint32_t>(*b));
        }
    }

    // Retry override; any retry key switches the stage off the orchestrator default
    if (t.contains("max_attempts") || t.contains("initial_backoff_ms")
        || t.contains("max_backoff_ms") || t.contains("backoff_multiplier")) {
        RetryPolicy retry;
        retry.max_attempts = static_cast<uint32_t>(t["max_attempts"].value_or(int64_t{3}));
        retry.initial_backoff = std::chrono::milliseconds{t["initial_backoff_ms"].value_or(int64_t{100})};
        retry.max_backoff = std::chrono::milliseconds{t["max_backoff_ms"].value_or(int64_t{10000})};
        retry.multiplier = t["backoff_multiplier"].value_or(2.0);
        if (retry.max_attempts == 0) {
            return Error{"stage '" + stage.id + "': max_attempts must be >= 1"};
        }
        if (retry.multiplier < 1.0) {
            return Error{"stage '" + stage.id + "': backoff_multiplier must be >= 1.0"};
        }
        stage.retry = retry;
    }

    stage.checkpointable = t["checkpointable"].value_or(true);
    return stage;
}

Result<WorkflowIR> from_table(const toml::table& tbl) {
    WorkflowIR ir;
    ir.name = tbl["name"].value_or(std::string{"workflow"});

    const auto* stages = tbl["stages"].as_array();
    if (!stages) return Error{"workflow has no [[stages]]"};

    size_t index = 0;
    for (const auto& node : *stages) {
        const auto* t = node.as_table();
        if (!t) return Error{"stages[" + std::to_string(index) + "] must be a table"};
        auto stage = parse_stage(*t, index);
        if (!stage) return stage.error();
        ir.stages.push_back(std::move(*stage));
        ++index;
    }
    return ir;
}

}  // anonymous namespace

Result<WorkflowIR> load_workflow(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Workflow file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<WorkflowIR> parse_workflow(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

}  // namespace hybrid_orchestrator
