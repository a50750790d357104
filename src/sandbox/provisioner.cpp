/**
 * @file provisioner.cpp
 * @brief SandboxProvisioner implementation.
 * @author Dimitris Kafetzis
 *
 * A sandbox is a fresh directory named after its environment id. Files are
 * written from a single list_files() read so later edits never reach an
 * in-flight run. Namespaces and rlimits are applied by the runner at launch.
 */

#include "sandbox/provisioner.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>

#include <signal.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace exec_engine {

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultSearchPath = "/usr/local/bin:/usr/bin:/bin";

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

// Directories needed for a path like "a/b/c.py": "a" and "a/b".
uint64_t count_parent_dirs(const std::string& path) {
    uint64_t count = 0;
    for (char c : path) {
        if (c == '/') ++count;
    }
    return count;
}

void make_writable(const fs::path& root) {
    std::error_code ec;
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code perm_ec;
        if (it->is_symlink(perm_ec)) continue;
        fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, perm_ec);
    }
}

}  // anonymous namespace

std::optional<fs::path> resolve_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return fs::path(name);
        return std::nullopt;
    }

    const char* env_path = std::getenv("PATH");
    std::string search = (env_path != nullptr && *env_path != '\0') ? env_path : kDefaultSearchPath;

    size_t start = 0;
    while (start <= search.size()) {
        auto end = search.find(':', start);
        if (end == std::string::npos) end = search.size();
        auto dir = search.substr(start, end - start);
        if (!dir.empty()) {
            auto candidate = fs::path(dir) / name;
            if (is_executable_file(candidate)) return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// SandboxProvisioner
// ─────────────────────────────────────────────

SandboxProvisioner::SandboxProvisioner(const Config& config, IStorage& storage, Logger& logger)
    : config_(config.sandbox)
    , runtimes_(config.languages)
    , storage_(storage)
    , logger_(logger) {}

SandboxProvisioner::~SandboxProvisioner() {
    std::vector<SandboxHandle> remaining;
    {
        std::lock_guard lock(mutex_);
        for (auto& [project, sandbox] : live_) {
            if (sandbox) remaining.push_back(sandbox);
        }
    }
    for (auto& sandbox : remaining) {
        auto result = teardown(sandbox);
        if (!result) {
            logger_.error("Sandbox " + sandbox->id + " not reclaimed at shutdown: "
                          + result.error().message);
        }
    }
}

Result<SandboxHandle> SandboxProvisioner::provision(const ProjectId& project_id, Language language) {
    auto runtime_it = runtimes_.find(language);
    if (runtime_it == runtimes_.end()) {
        return Error{ErrorKind::Provision,
                     "No runtime configured for language " + std::string(to_string(language))};
    }
    const auto& runtime = runtime_it->second;

    auto interpreter = resolve_executable(runtime.interpreter);
    if (!interpreter) {
        return Error{ErrorKind::Provision,
                     "Runtime for " + std::string(to_string(language)) + " unavailable: '"
                     + runtime.interpreter + "' not found"};
    }

    if (auto reserved = reserve(project_id); !reserved) {
        return reserved.error();
    }

    // Snapshot read: one atomic list_files() call.
    auto files = storage_.list_files(project_id);
    if (!files) {
        release(project_id);
        return Error{ErrorKind::Provision, "Cannot read project files: " + files.error().message};
    }

    uint64_t bytes = 0;
    uint64_t inodes = 1;  // sandbox root
    for (const auto& file : *files) {
        if (!is_safe_relative_path(file.path)) {
            release(project_id);
            return Error{ErrorKind::Provision, "Unsafe file path in project: '" + file.path + "'"};
        }
        bytes += file.content.size();
        inodes += 1 + count_parent_dirs(file.path);
    }

    std::vector<std::string> install_command;
    const bool has_manifest = !runtime.manifest.empty()
        && std::any_of(files->begin(), files->end(),
                       [&](const File& file) { return file.path == runtime.manifest; });
    if (has_manifest && !runtime.install.empty()) {
        auto installer = resolve_executable(runtime.install.front());
        if (!installer) {
            release(project_id);
            return Error{ErrorKind::Provision,
                         "Dependency installer for " + std::string(to_string(language))
                         + " unavailable: '" + runtime.install.front() + "' not found"};
        }
        install_command = runtime.install;
        install_command.front() = installer->string();
    }

    const uint64_t quota_bytes = config_.disk_quota_mb * 1024 * 1024;
    if (quota_bytes > 0 && bytes > quota_bytes) {
        release(project_id);
        return Error{ErrorKind::Provision,
                     "Project files (" + std::to_string(bytes) + " bytes) exceed disk quota of "
                     + std::to_string(config_.disk_quota_mb) + " MB"};
    }
    if (config_.inode_quota > 0 && inodes > config_.inode_quota) {
        release(project_id);
        return Error{ErrorKind::Provision,
                     "Project needs " + std::to_string(inodes) + " inodes, quota is "
                     + std::to_string(config_.inode_quota)};
    }

    std::error_code ec;
    fs::create_directories(config_.root_dir, ec);
    if (ec) {
        release(project_id);
        return Error{ErrorKind::Provision,
                     "Cannot create sandbox root " + config_.root_dir.string() + ": " + ec.message()};
    }

    if (auto capacity = check_filesystem_capacity(bytes, inodes); !capacity) {
        release(project_id);
        return capacity.error();
    }

    auto environment = storage_.create_environment(project_id);
    if (!environment) {
        release(project_id);
        return Error{ErrorKind::Provision,
                     "Cannot record environment: " + environment.error().message};
    }

    auto sandbox = std::make_shared<Sandbox>();
    sandbox->id = environment->id;
    sandbox->project_id = project_id;
    sandbox->language = language;
    sandbox->root = config_.root_dir / environment->id;
    sandbox->interpreter = *interpreter;
    sandbox->interpreter_args = runtime.args;
    sandbox->limits = SandboxLimits{
        .file_size_bytes = quota_bytes,
        .address_space_bytes = runtime.memory_limit_mb.value_or(config_.memory_limit_mb) * 1024 * 1024,
        .max_processes = config_.max_processes,
        .isolate_namespaces = config_.isolate_namespaces,
        .allow_network = config_.allow_network
    };
    sandbox->env = build_environment(*sandbox, runtime);
    sandbox->install_command = std::move(install_command);

    if (!fs::create_directory(sandbox->root, ec) || ec) {
        release(project_id);
        return Error{ErrorKind::Provision,
                     "Cannot create sandbox directory " + sandbox->root.string()
                     + (ec ? ": " + ec.message() : ": already exists")};
    }
    fs::permissions(sandbox->root, fs::perms::owner_all, fs::perm_options::replace, ec);

    if (auto populated = populate(*sandbox, *files); !populated) {
        fs::remove_all(sandbox->root, ec);
        release(project_id);
        return populated.error();
    }

    {
        std::lock_guard lock(mutex_);
        live_[project_id] = sandbox;
    }

    logger_.info("Sandbox provisioned: env=" + sandbox->id + " project=" + project_id
                 + " language=" + std::string(to_string(language))
                 + " files=" + std::to_string(sandbox->files.size())
                 + " bytes=" + std::to_string(sandbox->snapshot_bytes));
    return sandbox;
}

Result<void> SandboxProvisioner::teardown(const SandboxHandle& sandbox) {
    if (!sandbox) {
        return Error{ErrorKind::InvalidArgument, "Null sandbox handle"};
    }
    if (sandbox->torn_down.exchange(true)) {
        return Result<void>{};
    }

    std::string problems;

    // Anything still alive in the sandbox's process group is killed outright.
    pid_t pgid = sandbox->process_group.exchange(0);
    if (pgid > 0) {
        if (::kill(-pgid, SIGKILL) == 0) {
            logger_.warn("Sandbox " + sandbox->id + ": killed leftover process group "
                         + std::to_string(pgid));
        } else if (errno != ESRCH) {
            problems += "kill(-" + std::to_string(pgid) + "): " + std::strerror(errno) + "; ";
        }
    }

    std::error_code ec;
    fs::remove_all(sandbox->root, ec);
    if (ec) {
        logger_.warn("Sandbox " + sandbox->id + ": remove failed (" + ec.message()
                     + "), forcing permissions");
        make_writable(sandbox->root);
        ec.clear();
        fs::remove_all(sandbox->root, ec);
    }
    if (ec || fs::exists(sandbox->root, ec)) {
        problems += "filesystem " + sandbox->root.string() + " not removed";
    }

    {
        std::lock_guard lock(mutex_);
        auto it = live_.find(sandbox->project_id);
        if (it != live_.end() && it->second == sandbox) {
            live_.erase(it);
        }
    }

    if (!problems.empty()) {
        logger_.error("Sandbox teardown incomplete: env=" + sandbox->id + " " + problems);
        return Error{ErrorKind::Internal, "Sandbox " + sandbox->id + " teardown incomplete: " + problems};
    }

    logger_.debug("Sandbox torn down: env=" + sandbox->id + " project=" + sandbox->project_id);
    return Result<void>{};
}

size_t SandboxProvisioner::live_count() const {
    std::lock_guard lock(mutex_);
    return live_.size();
}

// ── Private helpers ──────────────────────────

Result<void> SandboxProvisioner::reserve(const ProjectId& project_id) {
    std::lock_guard lock(mutex_);
    if (live_.contains(project_id)) {
        return Error{ErrorKind::Provision, "Project " + project_id + " already has a live sandbox"};
    }
    if (config_.max_sandboxes > 0 && live_.size() >= config_.max_sandboxes) {
        return Error{ErrorKind::Provision,
                     "Sandbox limit reached (" + std::to_string(config_.max_sandboxes) + ")"};
    }
    live_.emplace(project_id, nullptr);
    return Result<void>{};
}

void SandboxProvisioner::release(const ProjectId& project_id) {
    std::lock_guard lock(mutex_);
    auto it = live_.find(project_id);
    if (it != live_.end() && it->second == nullptr) {
        live_.erase(it);
    }
}

Result<void> SandboxProvisioner::check_filesystem_capacity(uint64_t bytes, uint64_t inodes) const {
    struct statvfs info{};
    if (::statvfs(config_.root_dir.c_str(), &info) != 0) {
        return Error{ErrorKind::Provision,
                     "statvfs(" + config_.root_dir.string() + "): " + std::strerror(errno)};
    }

    const uint64_t free_bytes = static_cast<uint64_t>(info.f_bavail) * info.f_frsize;
    if (free_bytes < bytes) {
        return Error{ErrorKind::Provision,
                     "Insufficient disk space: need " + std::to_string(bytes)
                     + " bytes, " + std::to_string(free_bytes) + " available"};
    }
    // Filesystems without inode accounting report zero files.
    if (info.f_files > 0 && static_cast<uint64_t>(info.f_favail) < inodes) {
        return Error{ErrorKind::Provision,
                     "Insufficient inodes: need " + std::to_string(inodes)
                     + ", " + std::to_string(info.f_favail) + " available"};
    }
    return Result<void>{};
}

Result<void> SandboxProvisioner::populate(Sandbox& sandbox, const std::vector<File>& files) const {
    for (const auto& file : files) {
        auto target = sandbox.root / file.path;

        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Error{ErrorKind::Provision,
                         "Cannot create directory for '" + file.path + "': " + ec.message()};
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorKind::Provision, "Cannot write '" + file.path + "'"};
        }
        out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));
        out.close();
        if (!out) {
            return Error{ErrorKind::Provision, "Short write for '" + file.path + "'"};
        }

        sandbox.files.push_back(file.path);
        sandbox.snapshot_bytes += file.content.size();
    }
    return Result<void>{};
}

std::vector<std::string> SandboxProvisioner::build_environment(
    const Sandbox& sandbox, const LanguageRuntimeConfig& runtime) const {
    std::string path = sandbox.interpreter.parent_path().string();
    path += ':';
    path += kDefaultSearchPath;

    std::vector<std::string> env{
        "PATH=" + path,
        "HOME=" + sandbox.root.string(),
        "LANG=C.UTF-8"
    };
    env.insert(env.end(), runtime.env.begin(), runtime.env.end());
    return env;
}

}  // namespace exec_engine
