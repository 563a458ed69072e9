/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with size-based rotation, plus stdout and
 *        null sinks.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace hybrid_orchestrator {

/**
 * @brief Writes NDJSON to `<log_dir>/<prefix>.ndjson`.
 *
 * When the active file would exceed `max_file_bytes`, it is shifted to
 * `<prefix>.ndjson.1` (older files move up by one) and a fresh file is
 * opened. At most `max_files` rotated files are kept.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint64_t max_file_bytes = 50ULL * 1024 * 1024,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

private:
    void rotate_if_needed(size_t incoming);
    void open_current();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
    std::mutex mutex_;
};

/**
 * @brief Writes to stdout; the default when no log directory is configured.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output; used by tests and the benchmark.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace hybrid_orchestrator
