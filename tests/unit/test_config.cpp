/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace hybrid_orchestrator;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ho_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.orchestrator.instance_id, "orch-01");
    EXPECT_EQ(config.orchestrator.worker_threads, 0u);
    EXPECT_EQ(config.orchestrator.terminal_retention_ms, 60000u);
    EXPECT_EQ(config.scheduler.policy, "first_fit");
    EXPECT_EQ(config.retry.max_attempts, 3u);
    EXPECT_TRUE(config.checkpoint.on_stage_completion);
    EXPECT_EQ(config.storage.backend, "memory");
    EXPECT_TRUE(config.resources.empty());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [orchestrator]
        instance_id = "lab-7"
        worker_threads = 2
        poll_interval_ms = 10
        default_job_timeout_ms = 60000
        terminal_retention_ms = 5000

        [scheduler]
        policy = "quality_aware"
        lease_timeout_ms = 30000

        [scheduler.fitness]
        queue_weight = 0.5
        success_weight = 3.0

        [retry]
        max_attempts = 5
        initial_backoff_ms = 20
        max_backoff_ms = 400
        multiplier = 3.0

        [checkpoint]
        on_stage_completion = false
        periodic_interval_ms = 250

        [storage]
        backend = "local"
        root = "/tmp/ho-artifacts"

        [[resources]]
        id = "qpu-a"
        qubits = 5
        formats = ["openqasm3"]
        coupling = [[0, 1], [1, 2]]
        capacity = 2
        success_rate = 0.97

        [[resources]]
        id = "qpu-b"
        qubits = 27

        [telemetry]
        log_dir = "/tmp/ho-logs"
        log_level = "debug"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    auto& c = result.value();

    EXPECT_EQ(c.orchestrator.instance_id, "lab-7");
    EXPECT_EQ(c.orchestrator.worker_threads, 2u);
    EXPECT_EQ(c.orchestrator.poll_interval_ms, 10u);
    EXPECT_EQ(c.orchestrator.default_job_timeout_ms, 60000u);
    EXPECT_EQ(c.orchestrator.terminal_retention_ms, 5000u);
    EXPECT_EQ(c.scheduler.policy, "quality_aware");
    EXPECT_EQ(c.scheduler.lease_timeout_ms, 30000u);
    EXPECT_DOUBLE_EQ(c.scheduler.fitness.queue_weight, 0.5);
    EXPECT_DOUBLE_EQ(c.scheduler.fitness.success_weight, 3.0);
    EXPECT_EQ(c.retry.max_attempts, 5u);
    EXPECT_EQ(c.retry.initial_backoff_ms, 20u);
    EXPECT_EQ(c.retry.max_backoff_ms, 400u);
    EXPECT_DOUBLE_EQ(c.retry.multiplier, 3.0);
    EXPECT_FALSE(c.checkpoint.on_stage_completion);
    EXPECT_EQ(c.checkpoint.periodic_interval_ms, 250u);
    EXPECT_EQ(c.storage.backend, "local");
    EXPECT_EQ(c.storage.root, std::filesystem::path{"/tmp/ho-artifacts"});

    ASSERT_EQ(c.resources.size(), 2u);
    EXPECT_EQ(c.resources[0].id, "qpu-a");
    EXPECT_EQ(c.resources[0].qubits, 5u);
    EXPECT_EQ(c.resources[0].formats, std::vector<std::string>{"openqasm3"});
    ASSERT_EQ(c.resources[0].coupling.size(), 2u);
    EXPECT_EQ(c.resources[0].coupling[1], (std::pair<uint32_t, uint32_t>{1, 2}));
    EXPECT_EQ(c.resources[0].capacity, 2u);
    EXPECT_DOUBLE_EQ(c.resources[0].success_rate, 0.97);
    EXPECT_EQ(c.resources[1].capacity, 1u);

    EXPECT_EQ(c.telemetry.log_dir, std::filesystem::path{"/tmp/ho-logs"});
    EXPECT_EQ(c.telemetry.log_level, "debug");
}

TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
    auto path = write_toml(R"(
        [orchestrator]
        instance_id = "partial"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->orchestrator.instance_id, "partial");
    EXPECT_EQ(result->scheduler.policy, "first_fit");
    EXPECT_EQ(result->retry.max_attempts, 3u);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = load_config(temp_dir_ / "nonexistent.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("not found"), std::string::npos);
}

TEST_F(ConfigTest, InvalidToml) {
    auto result = parse_config("[orchestrator\ninstance_id = ");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("TOML parse error"), std::string::npos);
}

TEST_F(ConfigTest, RejectsUnknownPolicy) {
    auto result = parse_config("[scheduler]\npolicy = \"round_robin\"\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("round_robin"), std::string::npos);
}

TEST_F(ConfigTest, RejectsUnknownStorageBackend) {
    auto result = parse_config("[storage]\nbackend = \"s3\"\n");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, RejectsUnknownLogLevel) {
    auto result = parse_config("[telemetry]\nlog_level = \"verbose\"\n");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, RejectsZeroAttempts) {
    auto result = parse_config("[retry]\nmax_attempts = 0\n");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, RejectsInvalidResources) {
    EXPECT_FALSE(parse_config("[[resources]]\nqubits = 5\n").has_value());
    EXPECT_FALSE(parse_config("[[resources]]\nid = \"q\"\nqubits = 0\n").has_value());
    EXPECT_FALSE(parse_config("[[resources]]\nid = \"q\"\nqubits = 2\ncapacity = 0\n").has_value());
    EXPECT_FALSE(parse_config("[[resources]]\nid = \"q\"\nqubits = 2\ncoupling = [[0]]\n").has_value());
}

TEST_F(ConfigTest, RejectsDuplicateResourceIds) {
    auto result = parse_config(R"(
        [[resources]]
        id = "dup"
        qubits = 2

        [[resources]]
        id = "dup"
        qubits = 4
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("duplicate"), std::string::npos);
}
