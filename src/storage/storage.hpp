/**
 * @file storage.hpp
 * @brief Persistence boundary for projects, files, executions and environments.
 * @author Dimitris Kafetzis
 *
 * The engine depends only on this interface. Every call is atomic; reads of
 * file content are linearizable with respect to writes. Failures of the
 * backend itself are reported as ErrorKind::Storage.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <vector>

namespace exec_engine {

/**
 * @brief Abstract storage interface (runtime polymorphism).
 *
 * Implementations are injected at construction time; tests substitute
 * in-memory or fault-injecting stores.
 */
class IStorage {
public:
    virtual ~IStorage() = default;

    // ── Projects ─────────────────────────────
    /// Fails with Conflict when (owner_id, name) or the id already exists.
    virtual Result<Project> create_project(Project project) = 0;
    virtual Result<Project> get_project(const ProjectId& id) = 0;
    virtual Result<std::vector<Project>> list_projects(const OwnerId& owner_id) = 0;
    /// Only name and description may change; a language change is rejected.
    virtual Result<Project> update_project(const Project& project) = 0;
    /// Cascades to files, executions and environments.
    virtual Result<void> delete_project(const ProjectId& id) = 0;

    // ── Files ────────────────────────────────
    /// Insert or replace by (project_id, path).
    virtual Result<File> save_file(File file) = 0;
    virtual Result<File> get_file(const FileId& id) = 0;
    /// Ordered by path.
    virtual Result<std::vector<File>> list_files(const ProjectId& project_id) = 0;
    virtual Result<void> delete_file(const FileId& id) = 0;

    // ── Executions ───────────────────────────
    virtual Result<void> create_execution(const ExecutionRecord& record) = 0;
    /// Rejects changes to a terminal row; an identical rewrite succeeds.
    virtual Result<void> update_execution(const ExecutionRecord& record) = 0;
    virtual Result<ExecutionRecord> get_execution(const ExecutionId& id) = 0;
    /// Ordered by submission time.
    virtual Result<std::vector<ExecutionRecord>> list_executions(const ProjectId& project_id) = 0;

    // ── Environments ─────────────────────────
    virtual Result<EnvironmentRecord> create_environment(const ProjectId& project_id) = 0;
    virtual Result<std::vector<EnvironmentRecord>> list_environments(const ProjectId& project_id) = 0;
};

}  // namespace exec_engine
