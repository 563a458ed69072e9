/**
 * @file main.cpp
 * @brief HybridOrchestrator command-line entry point.
 *
 * Wires the orchestrator against the simulated compiler and backend:
 *   Config → Logger → Orchestrator → submit → event feed → final status
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/orchestrator.hpp"
#include "scheduler/resource.hpp"
#include "telemetry/json_sink.hpp"
#include "workflow/generator.hpp"
#include "workflow/workflow_loader.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace hybrid_orchestrator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║        HybridOrchestrator v1.0.0          ║
  ║   Quantum/Classical Workflow Scheduling   ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path workflow_path;
    std::string log_dir;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: hybrid_orchestrator [OPTIONS]\n"
              << "  --config <path>     Configuration file (default: config/default.toml)\n"
              << "  --workflow <path>   Run the workflow described by a TOML file\n"
              << "  --log-dir <path>    Log output directory\n"
              << "  --demo              Run the built-in demo workflows, then exit\n"
              << "  --help, -h          Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--workflow" && i + 1 < argc) {
            args.workflow_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

/**
 * @brief Resources used when the configuration declares none.
 */
void register_demo_resources(ResourceRegistry& registry, Logger& logger) {
    const auto now = std::chrono::system_clock::now();

    ResourceConfig small{.id = "sim-qpu-5",
                         .qubits = 5,
                         .formats = {"openqasm3", "qir"},
                         .coupling = {{0, 1}, {1, 2}, {2, 3}, {3, 4}},
                         .capacity = 2,
                         .queue_depth = 1,
                         .success_rate = 0.98,
                         .two_qubit_error = 0.01,
                         .calibration_age_s = 600.0,
                         .estimated_wait_ms = 20};
    ResourceConfig large{.id = "sim-qpu-27",
                         .qubits = 27,
                         .formats = {"openqasm3"},
                         .coupling = {},
                         .capacity = 1,
                         .queue_depth = 4,
                         .success_rate = 0.95,
                         .two_qubit_error = 0.02,
                         .calibration_age_s = 1800.0,
                         .estimated_wait_ms = 80};

    for (const auto& cfg : {small, large}) {
        if (auto added = registry.add(Resource::from_config(cfg, now)); !added) {
            logger.warn("main", "could not register " + cfg.id + ": " + added.error().message);
        }
    }
}

std::string describe(const FeedEvent& event) {
    std::string line = std::format("  [{:>3}] {:<22} {:<9}", event.sequence,
                                   to_string(event.kind), to_string(event.state));
    if (!event.stage.empty()) line += " stage=" + event.stage;
    if (event.attempt > 0) line += std::format(" attempt={}", event.attempt);
    if (!event.resource.empty()) line += " resource=" + event.resource;
    if (event.cause != CauseCode::None) line += " cause=" + std::string{to_string(event.cause)};
    return line;
}

/**
 * @brief Submit one workflow, stream its events until it is terminal and
 *        print the final status. Returns true when the job reached DONE.
 */
bool run_workflow(Orchestrator& orchestrator, WorkflowIR ir) {
    const std::string name = ir.name;
    auto submitted = orchestrator.submit(std::move(ir));
    if (!submitted) {
        const auto& err = submitted.error();
        std::cerr << "Workflow '" << name << "' rejected: " << to_string(err.kind)
                  << (err.stage.empty() ? "" : " (stage " + err.stage + ")")
                  << ": " << err.message << std::endl;
        return false;
    }

    const JobId id = *submitted;
    std::cout << "Job " << id << " (" << name << ")\n";

    uint64_t seen = 0;
    bool cancel_sent = false;
    for (;;) {
        if (g_shutdown_requested && !cancel_sent) {
            cancel_sent = true;
            if (orchestrator.cancel(id)) std::cout << "  cancellation requested\n";
        }

        for (const auto& event : orchestrator.wait_events(id, seen, std::chrono::milliseconds{200})) {
            std::cout << describe(event) << "\n";
            seen = event.sequence;
        }

        auto status = orchestrator.status(id);
        if (status && is_terminal(status->state) && orchestrator.events(id, seen).empty()) break;
    }

    auto status = orchestrator.status(id);
    if (!status) return false;

    std::cout << std::format("  final: {} cause={}", to_string(status->state), to_string(status->cause));
    if (!status->failed_stage.empty()) std::cout << " stage=" << status->failed_stage;
    std::cout << "\n";

    for (const auto& stage : status->stages) {
        std::cout << std::format("    {:<16} {:<11} attempts={} resource={}\n", stage.id,
                                 to_string(stage.phase), stage.attempts,
                                 stage.resource.empty() ? "-" : stage.resource);
    }
    std::cout << std::format("    {} checkpoints recorded\n\n", status->checkpoints.size());
    return status->state == JobState::Done;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);
    if (!args.demo_mode && args.workflow_path.empty()) {
        print_usage();
        return 2;
    }

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(
            config.telemetry.log_dir, "hybrid_orchestrator",
            static_cast<uint64_t>(config.telemetry.max_file_size_mb) * 1024 * 1024,
            config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<NullSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    // ── Workflows ────────────────────────────
    std::vector<WorkflowIR> workflows;
    if (!args.workflow_path.empty()) {
        auto loaded = load_workflow(args.workflow_path);
        if (!loaded) {
            std::cerr << "Failed to load workflow: " << loaded.error().message << std::endl;
            return 1;
        }
        workflows.push_back(std::move(*loaded));
    }
    if (args.demo_mode) {
        workflows.push_back(WorkflowGenerator::linear_hybrid());
        workflows.push_back(WorkflowGenerator::fan_out_sampling(4));
        workflows.push_back(WorkflowGenerator::variational_loop(3));
    }

    Orchestrator orchestrator({
        .config = config,
        .log_sink = std::move(log_sink),
        .log_level = level,
        .collaborators = {}
    });
    if (config.resources.empty()) {
        register_demo_resources(orchestrator.resources(), orchestrator.logger());
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (auto started = orchestrator.start(); !started) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    bool all_done = true;
    for (auto& workflow : workflows) {
        if (g_shutdown_requested) break;
        all_done = run_workflow(orchestrator, std::move(workflow)) && all_done;
    }

    orchestrator.stop();
    return all_done ? 0 : 1;
}
