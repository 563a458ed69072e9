/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger front-end and the NDJSON file sink.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace hybrid_orchestrator;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override { ++flushes; }
    int flushes = 0;

private:
    std::vector<std::string>& lines_;
};

size_t line_count(const std::filesystem::path& path) {
    std::ifstream in(path);
    size_t n = 0;
    for (std::string line; std::getline(in, line);) ++n;
    return n;
}

}  // anonymous namespace

TEST(LoggerTest, EmitsJsonLineWithComponent) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Debug);

    logger.info("driver", "job j-1 PENDING -> COMPILING");

    ASSERT_EQ(lines.size(), 1u);
    const auto& line = lines.front();
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(line.find(R"("component":"driver")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"job j-1 PENDING -> COMPILING")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("scheduler", "lease 1");
    logger.info("scheduler", "lease 2");
    logger.warn("scheduler", "lease 3 expired");
    logger.error("scheduler", "invariant");

    EXPECT_EQ(lines.size(), 2u);
    EXPECT_FALSE(logger.enabled(LogLevel::Info));
    EXPECT_TRUE(logger.enabled(LogLevel::Error));

    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.debug("scheduler", "now visible");
    EXPECT_EQ(lines.size(), 3u);
}

TEST(LoggerTest, EscapesMessageText) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));
    logger.warn("checkpoint", "path \"a\\b\"\nnext");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(R"(path \"a\\b\"\nnext)"), std::string::npos);
}

TEST(LoggerTest, JsonEscapeControlCharacters) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("tab\there"), "tab\\there");
    EXPECT_EQ(json_escape(std::string{"\x01"}), "\\u0001");
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("INFO").has_value());
    EXPECT_FALSE(parse_log_level("trace").has_value());
}

// ═══════════════════════════════════════════════
// JsonFileSink
// ═══════════════════════════════════════════════

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ho_test_sink";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(JsonFileSinkTest, WritesOneLinePerRecord) {
    {
        JsonFileSink sink(temp_dir_, "orch");
        sink.write(R"({"msg":"a"})");
        sink.write(R"({"msg":"b"})");
        sink.flush();
        EXPECT_EQ(sink.current_path(), temp_dir_ / "orch.ndjson");
    }
    EXPECT_EQ(line_count(temp_dir_ / "orch.ndjson"), 2u);
}

TEST_F(JsonFileSinkTest, RotatesWhenSizeExceeded) {
    const std::string record(40, 'x');
    {
        // Each line is 41 bytes; two fit, the third forces a rotation
        JsonFileSink sink(temp_dir_, "orch", 100, 2);
        for (int i = 0; i < 3; ++i) sink.write(record);
        sink.flush();
    }
    EXPECT_EQ(line_count(temp_dir_ / "orch.ndjson"), 1u);
    EXPECT_EQ(line_count(temp_dir_ / "orch.ndjson.1"), 2u);
}

TEST_F(JsonFileSinkTest, KeepsAtMostMaxFiles) {
    const std::string record(60, 'y');
    {
        JsonFileSink sink(temp_dir_, "orch", 100, 2);
        for (int i = 0; i < 6; ++i) sink.write(record);
        sink.flush();
        EXPECT_EQ(sink.rotated_path(2), temp_dir_ / "orch.ndjson.2");
    }
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "orch.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "orch.ndjson.1"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "orch.ndjson.2"));
    EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "orch.ndjson.3"));
}

TEST_F(JsonFileSinkTest, LoggerThroughFileSink) {
    {
        Logger logger(std::make_unique<JsonFileSink>(temp_dir_, "orch"), LogLevel::Info);
        logger.info("orchestrator", "starting");
        logger.debug("orchestrator", "filtered");
        logger.flush();
    }
    std::ifstream in(temp_dir_ / "orch.ndjson");
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find(R"("component":"orchestrator")"), std::string::npos);
    EXPECT_FALSE(std::getline(in, line));
}
