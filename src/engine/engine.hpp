/**
 * @file engine.hpp
 * @brief Top-level ExecutionEngine facade: ties all modules together.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Executing a project's entry file in a fresh sandbox
 *   2. Terminating, querying and listing executions
 *   3. Deleting a project together with its outstanding work
 *
 * Template-parameterized on MonitorT for testability (ProcessMonitor or
 * MockMonitor). Storage is injected; the engine owns everything else.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "resource_monitor/monitor.hpp"
#include "sandbox/provisioner.hpp"
#include "scheduler/execution_scheduler.hpp"
#include "storage/storage.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace exec_engine {

/**
 * @brief The top-level engine that wires storage, provisioner, monitor,
 *        runner and scheduler together.
 */
template <UsageMonitorLike MonitorT = ProcessMonitor>
class ExecutionEngine {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;       ///< Default: rotating file in telemetry.log_dir
        std::optional<LogLevel> log_level;        ///< Default: telemetry.log_level
        std::unique_ptr<ILogSink> metrics_sink;   ///< Default: rotating file in telemetry.log_dir
    };

    ExecutionEngine(Options opts, IStorage& storage);
    ~ExecutionEngine();

    // Non-copyable, non-movable
    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // ── Executions ───────────────────────────
    Result<ExecutionId> execute(const ProjectId& project_id,
                                std::optional<std::string> entry_file = std::nullopt,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    Result<void> terminate(const ExecutionId& id);
    Result<ExecutionSnapshot> get_status(const ExecutionId& id);
    Result<ExecutionSnapshot> wait(const ExecutionId& id, std::chrono::milliseconds timeout);

    /// Stored executions of a project, oldest first. A non-empty status
    /// ("QUEUED", "RUNNING", "COMPLETED", "ERROR") keeps only matching records.
    Result<std::vector<ExecutionRecord>> list_executions(const ProjectId& project_id,
                                                         std::string_view status = {});

    // ── Projects ─────────────────────────────
    /// Cancels the project's queued and running executions, then cascades in storage.
    Result<void> delete_project(const ProjectId& project_id);

    // ── Lifecycle ────────────────────────────
    void shutdown();

    // ── Accessors (for testing) ─────────────
    ExecutionScheduler<MonitorT>& scheduler() { return scheduler_; }
    SandboxProvisioner& provisioner() { return provisioner_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }

private:
    static std::unique_ptr<ILogSink> default_log_sink(const TelemetryConfig& telemetry);
    static std::unique_ptr<ILogSink> default_metrics_sink(const TelemetryConfig& telemetry);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    IStorage& storage_;
    SandboxProvisioner provisioner_;
    ExecutionScheduler<MonitorT> scheduler_;
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <UsageMonitorLike MonitorT>
ExecutionEngine<MonitorT>::ExecutionEngine(Options opts, IStorage& storage)
    : config_(std::move(opts.config))
    , logger_(opts.log_sink ? std::move(opts.log_sink) : default_log_sink(config_.telemetry),
              opts.log_level.value_or(parse_log_level(config_.telemetry.log_level)))
    , metrics_(opts.metrics_sink ? std::move(opts.metrics_sink) : default_metrics_sink(config_.telemetry))
    , storage_(storage)
    , provisioner_(config_, storage_, logger_)
    , scheduler_(scheduler_options_from(config_), storage_, provisioner_, logger_, metrics_) {
    logger_.info("Execution engine started: sandbox_root=" + config_.sandbox.root_dir.string()
                 + " languages=" + std::to_string(config_.languages.size()));
}

template <UsageMonitorLike MonitorT>
ExecutionEngine<MonitorT>::~ExecutionEngine() {
    shutdown();
}

template <UsageMonitorLike MonitorT>
Result<ExecutionId> ExecutionEngine<MonitorT>::execute(const ProjectId& project_id,
                                                       std::optional<std::string> entry_file,
                                                       std::optional<std::chrono::milliseconds> timeout) {
    return scheduler_.submit(project_id, std::move(entry_file), timeout);
}

template <UsageMonitorLike MonitorT>
Result<void> ExecutionEngine<MonitorT>::terminate(const ExecutionId& id) {
    return scheduler_.cancel(id, "terminated by request");
}

template <UsageMonitorLike MonitorT>
Result<ExecutionSnapshot> ExecutionEngine<MonitorT>::get_status(const ExecutionId& id) {
    return scheduler_.get_status(id);
}

template <UsageMonitorLike MonitorT>
Result<ExecutionSnapshot> ExecutionEngine<MonitorT>::wait(const ExecutionId& id,
                                                          std::chrono::milliseconds timeout) {
    return scheduler_.wait(id, timeout);
}

template <UsageMonitorLike MonitorT>
Result<std::vector<ExecutionRecord>> ExecutionEngine<MonitorT>::list_executions(
    const ProjectId& project_id, std::string_view status) {
    std::optional<ExecutionStatus> wanted;
    if (!status.empty()) {
        auto parsed = parse_execution_status(status);
        if (!parsed) return parsed.error();
        wanted = *parsed;
    }
    if (auto project = storage_.get_project(project_id); !project) {
        return project.error();
    }
    auto records = storage_.list_executions(project_id);
    if (!records || !wanted) return records;

    std::erase_if(*records, [&](const ExecutionRecord& r) { return r.status != *wanted; });
    return records;
}

template <UsageMonitorLike MonitorT>
Result<void> ExecutionEngine<MonitorT>::delete_project(const ProjectId& project_id) {
    if (auto project = storage_.get_project(project_id); !project) {
        return project.error();
    }
    auto cancelled = scheduler_.cancel_project(project_id, "project deleted");
    auto deleted = storage_.delete_project(project_id);
    if (!deleted) {
        logger_.error("Deleting project " + project_id + " failed: " + deleted.error().message);
        return deleted;
    }
    logger_.info("Project deleted: " + project_id + " (cancelled "
                 + std::to_string(cancelled) + " execution(s))");
    return deleted;
}

template <UsageMonitorLike MonitorT>
void ExecutionEngine<MonitorT>::shutdown() {
    scheduler_.shutdown();
    metrics_.flush();
    logger_.flush();
}

template <UsageMonitorLike MonitorT>
std::unique_ptr<ILogSink> ExecutionEngine<MonitorT>::default_log_sink(const TelemetryConfig& telemetry) {
    if (telemetry.log_dir.empty()) return std::make_unique<StdoutSink>();
    return std::make_unique<JsonFileSink>(telemetry.log_dir, "engine",
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

template <UsageMonitorLike MonitorT>
std::unique_ptr<ILogSink> ExecutionEngine<MonitorT>::default_metrics_sink(const TelemetryConfig& telemetry) {
    if (!telemetry.metrics_enabled || telemetry.log_dir.empty()) return std::make_unique<NullSink>();
    return std::make_unique<JsonFileSink>(telemetry.log_dir, "metrics",
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

}  // namespace exec_engine
