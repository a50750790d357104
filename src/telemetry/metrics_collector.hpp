/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>

namespace exec_engine {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    /// @param elapsed time spent in the previous state
    void record_execution_event(const ExecutionId& id,
                                const ProjectId& project_id,
                                ExecutionStatus status,
                                Duration elapsed);
    void record_usage(const ExecutionId& id, const UsageSnapshot& usage);
    void record_sandbox_event(const EnvironmentId& id,
                              const ProjectId& project_id,
                              std::string_view event_type);

    void flush();

    [[nodiscard]] uint64_t events_emitted() const noexcept { return events_.load(); }

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> events_{0};

    void emit(std::string_view json_line);
};

}  // namespace exec_engine
