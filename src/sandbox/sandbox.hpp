/**
 * @file sandbox.hpp
 * @brief Sandbox handle and the provisioner interface.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace exec_engine {

/**
 * @brief Limits applied to every process launched inside a sandbox.
 */
struct SandboxLimits {
    uint64_t file_size_bytes{0};      ///< RLIMIT_FSIZE, 0 = unlimited
    uint64_t address_space_bytes{0};  ///< RLIMIT_AS, 0 = unlimited
    uint32_t max_processes{0};        ///< RLIMIT_NPROC, 0 = unlimited
    bool isolate_namespaces{true};
    bool allow_network{false};
};

/**
 * @brief A provisioned, single-use execution sandbox.
 *
 * Owns a private filesystem root holding the snapshot of the project's
 * files. The runner publishes the process group of the launched tree in
 * process_group so the monitor and teardown can reach it.
 */
struct Sandbox {
    EnvironmentId id;
    ProjectId project_id;
    Language language{Language::Python};
    std::filesystem::path root;

    std::filesystem::path interpreter;          ///< Resolved absolute path
    std::vector<std::string> interpreter_args;
    std::vector<std::string> env;               ///< KEY=VALUE, complete environment
    SandboxLimits limits;

    /// Resolved installer argv, set only when the snapshot holds the manifest.
    std::vector<std::string> install_command;

    std::vector<std::string> files;             ///< Snapshot paths, ordered
    uint64_t snapshot_bytes{0};

    std::atomic<pid_t> process_group{0};        ///< 0 until launched
    std::atomic<bool> torn_down{false};

    [[nodiscard]] bool contains(std::string_view relative_path) const;
    [[nodiscard]] bool needs_install() const noexcept { return !install_command.empty(); }
};

/**
 * @brief Abstract interface for sandbox provisioning (runtime polymorphism).
 */
class IProvisioner {
public:
    virtual ~IProvisioner() = default;

    /**
     * @brief Build a fresh sandbox populated from the project's current files.
     * @return ErrorKind::Provision when the runtime is missing or resources
     *         cannot be reserved.
     */
    virtual Result<SandboxHandle> provision(const ProjectId& project_id, Language language) = 0;

    /**
     * @brief Release all sandbox resources. Idempotent.
     *
     * Kills any process left in the sandbox and removes its filesystem.
     * A returned error means resources could not be fully reclaimed.
     */
    virtual Result<void> teardown(const SandboxHandle& sandbox) = 0;

    [[nodiscard]] virtual size_t live_count() const = 0;
};

/**
 * @brief Reject absolute paths, empty components and "..".
 */
[[nodiscard]] bool is_safe_relative_path(std::string_view path);

}  // namespace exec_engine
