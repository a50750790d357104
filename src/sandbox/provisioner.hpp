/**
 * @file provisioner.hpp
 * @brief Filesystem-backed sandbox provisioner.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "sandbox/sandbox.hpp"
#include "storage/storage.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace exec_engine {

/**
 * @brief Find an executable by absolute path or by searching PATH.
 * @return std::nullopt if nothing executable matches.
 */
[[nodiscard]] std::optional<std::filesystem::path> resolve_executable(const std::string& name);

/**
 * @brief Provisions sandboxes as private directories under sandbox.root_dir.
 *
 * Each sandbox receives a snapshot copy of the project's files, a resolved
 * interpreter and the limits the runner applies at launch. At most one live
 * sandbox exists per project and at most max_sandboxes overall.
 */
class SandboxProvisioner : public IProvisioner {
public:
    SandboxProvisioner(const Config& config, IStorage& storage, Logger& logger);
    ~SandboxProvisioner() override;

    SandboxProvisioner(const SandboxProvisioner&) = delete;
    SandboxProvisioner& operator=(const SandboxProvisioner&) = delete;

    Result<SandboxHandle> provision(const ProjectId& project_id, Language language) override;
    Result<void> teardown(const SandboxHandle& sandbox) override;
    [[nodiscard]] size_t live_count() const override;

    [[nodiscard]] const std::filesystem::path& root_dir() const noexcept { return config_.root_dir; }

private:
    Result<void> reserve(const ProjectId& project_id);
    void release(const ProjectId& project_id);
    Result<void> check_filesystem_capacity(uint64_t bytes, uint64_t inodes) const;
    Result<void> populate(Sandbox& sandbox, const std::vector<File>& files) const;
    std::vector<std::string> build_environment(const Sandbox& sandbox,
                                               const LanguageRuntimeConfig& runtime) const;

    SandboxConfig config_;
    std::map<Language, LanguageRuntimeConfig> runtimes_;
    IStorage& storage_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::unordered_map<ProjectId, SandboxHandle> live_;  ///< nullptr while reserved
};

}  // namespace exec_engine
