/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <unordered_set>

namespace hybrid_orchestrator {

namespace {

Result<ResourceConfig> parse_resource(const toml::table& t, size_t index) {
    ResourceConfig r;
    r.id = t["id"].value_or(std::string{});
    if (r.id.empty()) {
        return Error{"resources[" + std::to_string(index) + "]: id is required"};
    }

    r.qubits = static_cast<uint32_t>(t["qubits"].value_or(int64_t{0}));
    r.capacity = static_cast<uint32_t>(t["capacity"].value_or(int64_t{1}));
    r.queue_depth = static_cast<uint32_t>(t["queue_depth"].value_or(int64_t{0}));
    r.success_rate = t["success_rate"].value_or(1.0);
    r.two_qubit_error = t["two_qubit_error"].value_or(0.0);
    r.calibration_age_s = t["calibration_age_s"].value_or(0.0);
    r.estimated_wait_ms = static_cast<uint64_t>(t["estimated_wait_ms"].value_or(int64_t{0}));

    if (const auto* formats = t["formats"].as_array()) {
        for (const auto& f : *formats) {
            if (auto s = f.value<std::string>()) r.formats.push_back(*s);
        }
    }

    if (const auto* coupling = t["coupling"].as_array()) {
        for (const auto& edge : *coupling) {
            const auto* pair = edge.as_array();
            if (!pair || pair->size() != 2) {
                return Error{"resource '" + r.id + "': coupling entries must be [a, b] pairs"};
            }
            auto a = (*pair)[0].value<int64_t>();
            auto b = (*pair)[1].value<int64_t>();
            if (!a || !b || *a < 0 || *b < 0) {
                return Error{"resource '" + r.id + "': coupling qubits must be non-negative integers"};
            }
            r.coupling.emplace_back(static_cast<uint32_t>(*a), static_cast<uint32_t>(*b));
        }
    }

    if (r.qubits == 0) {
        return Error{"resource '" + r.id + "': qubits must be > 0"};
    }
    if (r.capacity == 0) {
        return Error{"resource '" + r.id + "': capacity must be >= 1"};
    }
    if (r.success_rate < 0.0 || r.success_rate > 1.0) {
        return Error{"resource '" + r.id + "': success_rate must be in [0, 1]"};
    }
    return r;
}

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [orchestrator]
    if (auto orch = tbl["orchestrator"]; orch.is_table()) {
        config.orchestrator.instance_id =
            orch["instance_id"].value_or(std::string{"orch-01"});
        config.orchestrator.worker_threads = static_cast<uint32_t>(
            orch["worker_threads"].value_or(int64_t{0}));
        config.orchestrator.poll_interval_ms = static_cast<uint32_t>(
            orch["poll_interval_ms"].value_or(int64_t{50}));
        config.orchestrator.default_job_timeout_ms = static_cast<uint64_t>(
            orch["default_job_timeout_ms"].value_or(int64_t{0}));
        config.orchestrator.terminal_retention_ms = static_cast<uint64_t>(
            orch["terminal_retention_ms"].value_or(int64_t{60000}));
    }

    // [scheduler]
    if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
        config.scheduler.policy = scheduler["policy"].value_or(std::string{"first_fit"});
        config.scheduler.lease_timeout_ms = static_cast<uint64_t>(
            scheduler["lease_timeout_ms"].value_or(int64_t{600000}));

        // [scheduler.fitness]
        if (auto fitness = scheduler["fitness"]; fitness.is_table()) {
            auto& f = config.scheduler.fitness;
            f.queue_weight = fitness["queue_weight"].value_or(f.queue_weight);
            f.calibration_weight = fitness["calibration_weight"].value_or(f.calibration_weight);
            f.success_weight = fitness["success_weight"].value_or(f.success_weight);
            f.calibration_horizon_s =
                fitness["calibration_horizon_s"].value_or(f.calibration_horizon_s);
            f.success_rate_smoothing =
                fitness["success_rate_smoothing"].value_or(f.success_rate_smoothing);
        }
    }

    // [retry]
    if (auto retry = tbl["retry"]; retry.is_table()) {
        config.retry.max_attempts = static_cast<uint32_t>(
            retry["max_attempts"].value_or(int64_t{3}));
        config.retry.initial_backoff_ms = static_cast<uint64_t>(
            retry["initial_backoff_ms"].value_or(int64_t{100}));
        config.retry.max_backoff_ms = static_cast<uint64_t>(
            retry["max_backoff_ms"].value_or(int64_t{10000}));
        config.retry.multiplier = retry["multiplier"].value_or(2.0);
    }

    // [checkpoint]
    if (auto checkpoint = tbl["checkpoint"]; checkpoint.is_table()) {
        config.checkpoint.on_stage_completion =
            checkpoint["on_stage_completion"].value_or(true);
        config.checkpoint.periodic_interval_ms = static_cast<uint64_t>(
            checkpoint["periodic_interval_ms"].value_or(int64_t{0}));
    }

    // [storage]
    if (auto storage = tbl["storage"]; storage.is_table()) {
        config.storage.backend = storage["backend"].value_or(std::string{"memory"});
        config.storage.root = storage["root"].value_or(std::string{"./artifacts"});
    }

    // [[resources]]
    if (const auto* resources = tbl["resources"].as_array()) {
        std::unordered_set<std::string> seen;
        size_t index = 0;
        for (const auto& node : *resources) {
            const auto* t = node.as_table();
            if (!t) return Error{"resources[" + std::to_string(index) + "] must be a table"};
            auto parsed = parse_resource(*t, index);
            if (!parsed) return parsed.error();
            if (!seen.insert(parsed->id).second) {
                return Error{"duplicate resource id: " + parsed->id};
            }
            config.resources.push_back(std::move(*parsed));
            ++index;
        }
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
        config.telemetry.max_file_size_mb = static_cast<uint32_t>(
            telemetry["max_file_size_mb"].value_or(int64_t{50}));
        config.telemetry.rotate_count = static_cast<uint32_t>(
            telemetry["rotate_count"].value_or(int64_t{5}));
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
    }

    // ── Validation ────────────────────────────
    if (config.scheduler.policy != "first_fit" && config.scheduler.policy != "quality_aware") {
        return Error{"unknown scheduler policy: " + config.scheduler.policy};
    }
    if (config.storage.backend != "memory" && config.storage.backend != "local") {
        return Error{"unknown storage backend: " + config.storage.backend};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{"unknown log level: " + config.telemetry.log_level};
    }
    if (config.retry.max_attempts == 0) {
        return Error{"retry.max_attempts must be >= 1"};
    }
    if (config.retry.multiplier < 1.0) {
        return Error{"retry.multiplier must be >= 1.0"};
    }

    return config;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace hybrid_orchestrator
