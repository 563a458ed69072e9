/**
 * @file workflow_loader.hpp
 * @brief Workflow IR deserialization from TOML.
 *
 * Example:
 *
 *   name = "bell"
 *
 *   [[stages]]
 *   id = "compile"
 *   kind = "compile"
 *   source = "OPENQASM 3; ..."
 *   target = "openqasm3"
 *   outputs = ["circuit"]
 *
 *   [[stages]]
 *   id = "execute"
 *   kind = "quantum"
 *   depends_on = ["compile"]
 *   circuit_input = "compile.circuit"
 *   shots = 1000
 *   min_qubits = 2
 *   outputs = ["counts"]
 *
 * Loading only parses; structural validation happens in WorkflowGraph::build.
 */

#pragma once

#include "core/result.hpp"
#include "workflow/stage.hpp"

#include <filesystem>
#include <string_view>

namespace hybrid_orchestrator {

Result<WorkflowIR> load_workflow(const std::filesystem::path& path);

Result<WorkflowIR> parse_workflow(std::string_view toml_text);

}  // namespace hybrid_orchestrator
