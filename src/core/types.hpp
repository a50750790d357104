/**
 * @file types.hpp
 * @brief Fundamental types used throughout ExecEngine.
 * @author Dimitris Kafetzis
 *
 * Defines identifiers, the Language and ExecutionStatus enums, and the
 * Project / File / Execution / Environment records exchanged with storage.
 * All types are plain values.
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace exec_engine {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ProjectId = std::string;
using FileId = std::string;
using ExecutionId = std::string;
using EnvironmentId = std::string;
using OwnerId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/**
 * @brief Generate a random RFC 4122 version-4 identifier.
 */
[[nodiscard]] std::string generate_id();

// ─────────────────────────────────────────────
// Language
// ─────────────────────────────────────────────

enum class Language : uint8_t {
    Python,
    JavaScript,
    Ruby
};

[[nodiscard]] constexpr std::string_view to_string(Language language) noexcept {
    switch (language) {
        case Language::Python:     return "python";
        case Language::JavaScript: return "javascript";
        case Language::Ruby:       return "ruby";
    }
    return "unknown";
}

[[nodiscard]] Result<Language> parse_language(std::string_view name);

// ─────────────────────────────────────────────
// Execution Status
// ─────────────────────────────────────────────

/**
 * @brief Execution lifecycle state.
 *
 * QUEUED and RUNNING are transient; COMPLETED and ERROR are terminal.
 */
enum class ExecutionStatus : uint8_t {
    Queued,
    Running,
    Completed,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Queued:    return "QUEUED";
        case ExecutionStatus::Running:   return "RUNNING";
        case ExecutionStatus::Completed: return "COMPLETED";
        case ExecutionStatus::Error:     return "ERROR";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool is_terminal(ExecutionStatus status) noexcept {
    return status == ExecutionStatus::Completed || status == ExecutionStatus::Error;
}

/// Only the four column values are accepted.
[[nodiscard]] Result<ExecutionStatus> parse_execution_status(std::string_view text);

// ─────────────────────────────────────────────
// Records
// ─────────────────────────────────────────────

struct Project {
    ProjectId id;
    std::string name;
    std::optional<std::string> description;
    Language language{Language::Python};
    OwnerId owner_id;
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const Project&) const = default;
};

struct File {
    FileId id;
    ProjectId project_id;
    std::string path;         ///< Relative path, unique within the project
    std::string content;
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const File&) const = default;
};

/**
 * @brief Audit record of a provisioned sandbox.
 */
struct EnvironmentRecord {
    EnvironmentId id;
    ProjectId project_id;
    Timestamp created_at;

    bool operator==(const EnvironmentRecord&) const = default;
};

/**
 * @brief Aggregate resource usage of a sandboxed process tree.
 */
struct UsageSnapshot {
    Duration cpu_time{0};
    uint64_t peak_memory_bytes{0};
    uint32_t samples{0};               ///< Number of samples folded in

    [[nodiscard]] double cpu_seconds() const noexcept {
        return static_cast<double>(cpu_time.count()) / 1e6;
    }

    [[nodiscard]] double peak_memory_mb() const noexcept {
        return static_cast<double>(peak_memory_bytes) / (1024.0 * 1024.0);
    }

    bool operator==(const UsageSnapshot&) const = default;
};

/**
 * @brief Persisted execution row.
 *
 * exit_code and completed_at stay empty until the record is terminal.
 * memory_usage_mb and cpu_time_seconds are live aggregates while RUNNING
 * and always present once terminal.
 */
struct ExecutionRecord {
    ExecutionId id;
    ProjectId project_id;
    std::string entry_file;
    ExecutionStatus status{ExecutionStatus::Queued};
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    Timestamp submitted_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    std::optional<double> memory_usage_mb;
    std::optional<double> cpu_time_seconds;
    std::optional<ErrorKind> failure;     ///< Cause category for ERROR records

    [[nodiscard]] bool terminal() const noexcept { return is_terminal(status); }

    bool operator==(const ExecutionRecord&) const = default;
};

/// Read-only view of an execution handed to callers.
using ExecutionSnapshot = ExecutionRecord;

}  // namespace exec_engine
