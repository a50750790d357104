/**
 * @file json_sink.hpp
 * @brief Log sinks backing the engine and metrics streams.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace exec_engine {

/**
 * @brief Appends NDJSON lines to <log_dir>/<prefix>.ndjson with size-based rotation.
 *
 * Rotation renames the active file to <prefix>.1.ndjson, shifting older
 * generations up by one; generation max_files is dropped. With max_files
 * set to 0 the active file is simply truncated. A size cap of 0 disables
 * rotation. An existing file is appended to and counts towards the cap.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::mutex mutex_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/// Engine log to the console when no log directory is configured.
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/// Metrics sink when telemetry is disabled.
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace exec_engine
