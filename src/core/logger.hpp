/**
 * @file logger.hpp
 * @brief Structured NDJSON logging for the execution engine.
 * @author Dimitris Kafetzis
 *
 * Every component logs through one Logger owned by the engine. A record is a
 * single JSON object with level, timestamp and message, optionally followed
 * by string fields such as the execution or project id, so one execution's
 * lifecycle can be filtered out of a shared log file.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace exec_engine {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

[[nodiscard]] std::string json_escape(std::string_view text);

// ─────────────────────────────────────────────
// Sinks
// ─────────────────────────────────────────────

/**
 * @brief Destination for finished NDJSON lines (file, stdout, test capture).
 *
 * Implementations receive one line per call without the trailing newline.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/// Extra string attribute appended to a record, e.g. {"execution_id", id}.
struct LogField {
    std::string_view key;
    std::string value;
};

using LogFields = std::initializer_list<LogField>;

/**
 * @brief Thread-safe front-end serialising records onto a single sink.
 *
 * Record layout: {"level":..,"ts":..,"msg":..[,"<key>":"<value>"...]}.
 * The level check is lock-free; formatting happens outside the sink lock.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message, LogFields fields = {});
    void info(std::string_view message, LogFields fields = {});
    void warn(std::string_view message, LogFields fields = {});
    void error(std::string_view message, LogFields fields = {});

    void log(LogLevel level, std::string_view message, LogFields fields = {});
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

private:
    [[nodiscard]] static std::string format_record(LogLevel level,
                                                   std::string_view message,
                                                   LogFields fields);

    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    mutable std::mutex mutex_;
};

}  // namespace exec_engine
