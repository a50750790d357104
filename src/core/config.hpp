/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace exec_engine {

struct EngineConfig {
    uint32_t worker_count = 0;              ///< 0 = hardware_concurrency
    uint32_t default_timeout_ms = 10000;
    uint32_t grace_period_ms = 1000;        ///< SIGTERM -> SIGKILL delay
};

struct RunnerConfig {
    uint64_t output_limit_bytes = 1048576;  ///< Per stream
    uint32_t poll_interval_ms = 50;
    uint32_t install_timeout_ms = 300000;   ///< Dependency install budget
};

struct MonitorConfig {
    uint32_t sampling_interval_ms = 100;
};

struct SandboxConfig {
    std::filesystem::path root_dir = "/tmp/exec_engine/sandboxes";
    uint32_t max_sandboxes = 64;
    uint64_t disk_quota_mb = 64;            ///< Also the per-run RLIMIT_FSIZE
    uint64_t inode_quota = 4096;
    uint32_t max_processes = 256;           ///< RLIMIT_NPROC, 0 = unlimited
    uint64_t memory_limit_mb = 512;         ///< RLIMIT_AS, 0 = unlimited
    bool isolate_namespaces = true;
    bool allow_network = false;
};

struct StorageConfig {
    uint32_t retry_attempts = 5;
    uint32_t retry_backoff_ms = 50;         ///< Doubles on every retry
};

/**
 * @brief How to launch one language: `<interpreter> <args...> <entry_file>`.
 *
 * When the project snapshot contains @c manifest, @c install runs in the
 * sandbox root before the entry file.
 */
struct LanguageRuntimeConfig {
    std::string interpreter;                ///< Absolute path or name looked up in PATH
    std::vector<std::string> args;
    std::string entry_file;                 ///< Default entry when none is given
    std::vector<std::string> env;           ///< Extra KEY=VALUE pairs
    std::vector<std::string> install;       ///< Installer argv, empty = none
    std::string manifest;                   ///< Dependency file that triggers install
    std::optional<uint64_t> memory_limit_mb;  ///< Overrides sandbox.memory_limit_mb
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";   ///< Empty: engine log goes to stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool metrics_enabled = true;
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    EngineConfig engine;
    RunnerConfig runner;
    MonitorConfig monitor;
    SandboxConfig sandbox;
    StorageConfig storage;
    std::map<Language, LanguageRuntimeConfig> languages;
    TelemetryConfig telemetry;
};

/**
 * @brief Built-in runtimes: python3 -u, node, ruby.
 */
std::map<Language, LanguageRuntimeConfig> default_language_runtimes();

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace exec_engine
