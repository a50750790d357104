/**
 * @file execution_scheduler.cpp
 * @brief Non-template helpers of the execution scheduler.
 * @author Dimitris Kafetzis
 */

#include "scheduler/execution_scheduler.hpp"

namespace exec_engine {

SchedulerOptions scheduler_options_from(const Config& config) {
    SchedulerOptions options;
    options.worker_count = config.engine.worker_count;
    options.default_timeout = std::chrono::milliseconds(config.engine.default_timeout_ms);
    options.sampling_interval_ms = config.monitor.sampling_interval_ms;
    options.runner = RunnerOptions{
        .grace_period = std::chrono::milliseconds(config.engine.grace_period_ms),
        .output_limit_bytes = config.runner.output_limit_bytes,
        .poll_interval = std::chrono::milliseconds(config.runner.poll_interval_ms)
    };
    options.install_timeout = std::chrono::milliseconds(config.runner.install_timeout_ms);
    options.storage_retry_attempts = config.storage.retry_attempts;
    options.storage_retry_backoff = std::chrono::milliseconds(config.storage.retry_backoff_ms);
    for (const auto& [language, runtime] : config.languages) {
        options.default_entries[language] = runtime.entry_file;
    }
    return options;
}

std::string failure_annotation(ErrorKind kind, std::string_view detail) {
    std::string text = "[";
    text += to_string(kind);
    text += "]";
    if (!detail.empty()) {
        text += ' ';
        text += detail;
    }
    text += '\n';
    return text;
}

}  // namespace exec_engine
