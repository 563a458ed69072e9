/**
 * @file config.hpp
 * @brief Orchestrator configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/result.hpp"

namespace hybrid_orchestrator {

struct OrchestratorConfig {
    std::string instance_id = "orch-01";
    uint32_t worker_threads = 0;            ///< 0 = hardware_concurrency
    uint32_t poll_interval_ms = 50;         ///< Upper bound on dispatcher sleep
    uint64_t default_job_timeout_ms = 0;    ///< 0 = no wall-clock deadline
    uint64_t terminal_retention_ms = 60000; ///< How long finished jobs stay in memory
};

struct FitnessConfig {
    double queue_weight = 1.0;
    double calibration_weight = 0.5;
    double success_weight = 2.0;
    double calibration_horizon_s = 3600.0;  ///< Age at which calibration is considered stale
    double success_rate_smoothing = 0.2;    ///< EWMA factor for observed outcomes
};

struct SchedulerConfig {
    std::string policy = "first_fit";       ///< "first_fit" or "quality_aware"
    uint64_t lease_timeout_ms = 600000;
    FitnessConfig fitness;
};

struct RetryConfig {
    uint32_t max_attempts = 3;
    uint64_t initial_backoff_ms = 100;
    uint64_t max_backoff_ms = 10000;
    double multiplier = 2.0;
};

struct CheckpointConfig {
    bool on_stage_completion = true;
    uint64_t periodic_interval_ms = 0;      ///< 0 = no in-flight checkpoints
};

struct StorageConfig {
    std::string backend = "memory";         ///< "memory" or "local"
    std::filesystem::path root = "./artifacts";
};

/**
 * @brief One candidate execution resource as declared in configuration.
 */
struct ResourceConfig {
    std::string id;
    uint32_t qubits = 0;
    std::vector<std::string> formats;
    std::vector<std::pair<uint32_t, uint32_t>> coupling;   ///< empty = all-to-all
    uint32_t capacity = 1;
    uint32_t queue_depth = 0;
    double success_rate = 1.0;
    double two_qubit_error = 0.0;
    double calibration_age_s = 0.0;
    uint64_t estimated_wait_ms = 0;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;          ///< empty = log to stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level orchestrator configuration.
 */
struct Config {
    OrchestratorConfig orchestrator;
    SchedulerConfig scheduler;
    RetryConfig retry;
    CheckpointConfig checkpoint;
    StorageConfig storage;
    std::vector<ResourceConfig> resources;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults; unknown policy or storage names are
 * rejected.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text (used by tests and embedders).
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration (no resources registered).
 */
Config default_config();

}  // namespace hybrid_orchestrator
