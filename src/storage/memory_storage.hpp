/**
 * @file memory_storage.hpp
 * @brief In-memory IStorage implementation.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "storage/storage.hpp"

#include <mutex>
#include <unordered_map>

namespace exec_engine {

/**
 * @brief Thread-safe in-memory store with the constraints of the relational
 *        schema: unique (owner, name), unique (project, path), cascade delete,
 *        and immutable terminal executions.
 */
class MemoryStorage : public IStorage {
public:
    MemoryStorage() = default;

    MemoryStorage(const MemoryStorage&) = delete;
    MemoryStorage& operator=(const MemoryStorage&) = delete;

    Result<Project> create_project(Project project) override;
    Result<Project> get_project(const ProjectId& id) override;
    Result<std::vector<Project>> list_projects(const OwnerId& owner_id) override;
    Result<Project> update_project(const Project& project) override;
    Result<void> delete_project(const ProjectId& id) override;

    Result<File> save_file(File file) override;
    Result<File> get_file(const FileId& id) override;
    Result<std::vector<File>> list_files(const ProjectId& project_id) override;
    Result<void> delete_file(const FileId& id) override;

    Result<void> create_execution(const ExecutionRecord& record) override;
    Result<void> update_execution(const ExecutionRecord& record) override;
    Result<ExecutionRecord> get_execution(const ExecutionId& id) override;
    Result<std::vector<ExecutionRecord>> list_executions(const ProjectId& project_id) override;

    Result<EnvironmentRecord> create_environment(const ProjectId& project_id) override;
    Result<std::vector<EnvironmentRecord>> list_environments(const ProjectId& project_id) override;

    // ── Introspection (tests) ────────────────
    [[nodiscard]] size_t project_count() const;
    [[nodiscard]] size_t file_count() const;
    [[nodiscard]] size_t execution_count() const;
    [[nodiscard]] size_t environment_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ProjectId, Project> projects_;
    std::unordered_map<FileId, File> files_;
    std::unordered_map<ExecutionId, ExecutionRecord> executions_;
    std::unordered_map<EnvironmentId, EnvironmentRecord> environments_;
};

}  // namespace exec_engine
