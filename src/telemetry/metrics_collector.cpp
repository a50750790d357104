/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace exec_engine {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_execution_event(const ExecutionId& id,
                                              const ProjectId& project_id,
                                              ExecutionStatus status,
                                              Duration elapsed) {
    std::ostringstream oss;
    oss << R"({"event":"execution_state_change")"
        << R"(,"execution":")" << json_escape(id) << "\""
        << R"(,"project":")" << json_escape(project_id) << "\""
        << R"(,"state":")" << to_string(status) << "\""
        << R"(,"elapsed_us":)" << elapsed.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_usage(const ExecutionId& id, const UsageSnapshot& usage) {
    std::ostringstream oss;
    oss << R"({"event":"execution_usage")"
        << R"(,"execution":")" << json_escape(id) << "\""
        << R"(,"cpu_us":)" << usage.cpu_time.count()
        << R"(,"peak_mem_bytes":)" << usage.peak_memory_bytes
        << R"(,"samples":)" << usage.samples
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_sandbox_event(const EnvironmentId& id,
                                            const ProjectId& project_id,
                                            std::string_view event_type) {
    std::ostringstream oss;
    oss << R"({"event":"sandbox_)" << event_type << "\""
        << R"(,"environment":")" << json_escape(id) << "\""
        << R"(,"project":")" << json_escape(project_id) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    events_.fetch_add(1);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace exec_engine
