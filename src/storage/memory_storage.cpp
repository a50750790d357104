/**
 * @file memory_storage.cpp
 * @brief MemoryStorage implementation.
 * @author Dimitris Kafetzis
 */

#include "storage/memory_storage.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace exec_engine {

namespace {

bool blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // anonymous namespace

// ── Projects ─────────────────────────────────

Result<Project> MemoryStorage::create_project(Project project) {
    if (blank(project.name)) {
        return Error{ErrorKind::InvalidArgument, "Project name cannot be empty"};
    }

    std::lock_guard lock(mutex_);
    if (project.id.empty()) project.id = generate_id();
    if (projects_.contains(project.id)) {
        return Error{ErrorKind::Conflict, "Project already exists: " + project.id};
    }
    for (const auto& [id, existing] : projects_) {
        if (existing.owner_id == project.owner_id && existing.name == project.name) {
            return Error{ErrorKind::Conflict,
                         "Project name '" + project.name + "' already used by owner " + project.owner_id};
        }
    }

    auto now = std::chrono::system_clock::now();
    if (project.created_at == Timestamp{}) project.created_at = now;
    if (project.updated_at == Timestamp{}) project.updated_at = project.created_at;

    projects_.emplace(project.id, project);
    return project;
}

Result<Project> MemoryStorage::get_project(const ProjectId& id) {
    std::lock_guard lock(mutex_);
    auto it = projects_.find(id);
    if (it == projects_.end()) {
        return Error{ErrorKind::NotFound, "Project not found: " + id};
    }
    return it->second;
}

Result<std::vector<Project>> MemoryStorage::list_projects(const OwnerId& owner_id) {
    std::lock_guard lock(mutex_);
    std::vector<Project> out;
    for (const auto& [id, project] : projects_) {
        if (project.owner_id == owner_id) out.push_back(project);
    }
    std::sort(out.begin(), out.end(), [](const Project& a, const Project& b) {
        return a.created_at < b.created_at;
    });
    return out;
}

Result<Project> MemoryStorage::update_project(const Project& project) {
    std::lock_guard lock(mutex_);
    auto it = projects_.find(project.id);
    if (it == projects_.end()) {
        return Error{ErrorKind::NotFound, "Project not found: " + project.id};
    }
    auto& stored = it->second;
    if (stored.language != project.language) {
        return Error{ErrorKind::InvalidArgument,
                     "Project language is fixed; create a new project to change it"};
    }
    if (stored.owner_id != project.owner_id) {
        return Error{ErrorKind::InvalidArgument, "Project owner cannot change"};
    }
    if (blank(project.name)) {
        return Error{ErrorKind::InvalidArgument, "Project name cannot be empty"};
    }
    for (const auto& [id, existing] : projects_) {
        if (id != project.id && existing.owner_id == project.owner_id
            && existing.name == project.name) {
            return Error{ErrorKind::Conflict,
                         "Project name '" + project.name + "' already used by owner " + project.owner_id};
        }
    }

    stored.name = project.name;
    stored.description = project.description;
    stored.updated_at = std::chrono::system_clock::now();
    return stored;
}

Result<void> MemoryStorage::delete_project(const ProjectId& id) {
    std::lock_guard lock(mutex_);
    if (projects_.erase(id) == 0) {
        return Error{ErrorKind::NotFound, "Project not found: " + id};
    }
    std::erase_if(files_, [&](const auto& entry) { return entry.second.project_id == id; });
    std::erase_if(executions_, [&](const auto& entry) { return entry.second.project_id == id; });
    std::erase_if(environments_, [&](const auto& entry) { return entry.second.project_id == id; });
    return Result<void>{};
}

// ── Files ────────────────────────────────────

Result<File> MemoryStorage::save_file(File file) {
    if (blank(file.path)) {
        return Error{ErrorKind::InvalidArgument, "Path cannot be empty"};
    }

    std::lock_guard lock(mutex_);
    if (!projects_.contains(file.project_id)) {
        return Error{ErrorKind::NotFound, "Project not found: " + file.project_id};
    }

    auto now = std::chrono::system_clock::now();

    // Same path in the same project replaces the existing row in place.
    for (auto& [id, existing] : files_) {
        if (existing.project_id == file.project_id && existing.path == file.path) {
            if (!file.id.empty() && file.id != id) {
                return Error{ErrorKind::Conflict,
                             "Path '" + file.path + "' already exists in project"};
            }
            existing.content = std::move(file.content);
            existing.updated_at = now;
            return existing;
        }
    }

    if (file.id.empty()) file.id = generate_id();
    if (auto it = files_.find(file.id); it != files_.end()) {
        // Rename of an existing file
        if (it->second.project_id != file.project_id) {
            return Error{ErrorKind::Conflict, "File id belongs to another project"};
        }
        it->second.path = file.path;
        it->second.content = std::move(file.content);
        it->second.updated_at = now;
        return it->second;
    }

    if (file.created_at == Timestamp{}) file.created_at = now;
    file.updated_at = now;
    files_.emplace(file.id, file);
    return file;
}

Result<File> MemoryStorage::get_file(const FileId& id) {
    std::lock_guard lock(mutex_);
    auto it = files_.find(id);
    if (it == files_.end()) {
        return Error{ErrorKind::NotFound, "File not found: " + id};
    }
    return it->second;
}

Result<std::vector<File>> MemoryStorage::list_files(const ProjectId& project_id) {
    std::lock_guard lock(mutex_);
    if (!projects_.contains(project_id)) {
        return Error{ErrorKind::NotFound, "Project not found: " + project_id};
    }
    std::vector<File> out;
    for (const auto& [id, file] : files_) {
        if (file.project_id == project_id) out.push_back(file);
    }
    std::sort(out.begin(), out.end(), [](const File& a, const File& b) {
        return a.path < b.path;
    });
    return out;
}

Result<void> MemoryStorage::delete_file(const FileId& id) {
    std::lock_guard lock(mutex_);
    if (files_.erase(id) == 0) {
        return Error{ErrorKind::NotFound, "File not found: " + id};
    }
    return Result<void>{};
}

// ── Executions ───────────────────────────────

Result<void> MemoryStorage::create_execution(const ExecutionRecord& record) {
    std::lock_guard lock(mutex_);
    if (!projects_.contains(record.project_id)) {
        return Error{ErrorKind::NotFound, "Project not found: " + record.project_id};
    }
    if (executions_.contains(record.id)) {
        return Error{ErrorKind::Conflict, "Execution already exists: " + record.id};
    }
    executions_.emplace(record.id, record);
    return Result<void>{};
}

Result<void> MemoryStorage::update_execution(const ExecutionRecord& record) {
    std::lock_guard lock(mutex_);
    auto it = executions_.find(record.id);
    if (it == executions_.end()) {
        return Error{ErrorKind::NotFound, "Execution not found: " + record.id};
    }
    if (it->second.terminal()) {
        if (it->second == record) return Result<void>{};
        return Error{ErrorKind::AlreadyTerminal,
                     "Execution " + record.id + " is terminal and cannot change"};
    }
    if (record.project_id != it->second.project_id) {
        return Error{ErrorKind::InvalidArgument, "Execution project cannot change"};
    }
    it->second = record;
    return Result<void>{};
}

Result<ExecutionRecord> MemoryStorage::get_execution(const ExecutionId& id) {
    std::lock_guard lock(mutex_);
    auto it = executions_.find(id);
    if (it == executions_.end()) {
        return Error{ErrorKind::NotFound, "Execution not found: " + id};
    }
    return it->second;
}

Result<std::vector<ExecutionRecord>> MemoryStorage::list_executions(const ProjectId& project_id) {
    std::lock_guard lock(mutex_);
    std::vector<ExecutionRecord> out;
    for (const auto& [id, record] : executions_) {
        if (record.project_id == project_id) out.push_back(record);
    }
    std::sort(out.begin(), out.end(), [](const ExecutionRecord& a, const ExecutionRecord& b) {
        return a.submitted_at < b.submitted_at;
    });
    return out;
}

// ── Environments ─────────────────────────────

Result<EnvironmentRecord> MemoryStorage::create_environment(const ProjectId& project_id) {
    std::lock_guard lock(mutex_);
    if (!projects_.contains(project_id)) {
        return Error{ErrorKind::NotFound, "Project not found: " + project_id};
    }
    EnvironmentRecord record{
        .id = "env-" + generate_id(),
        .project_id = project_id,
        .created_at = std::chrono::system_clock::now()
    };
    environments_.emplace(record.id, record);
    return record;
}

Result<std::vector<EnvironmentRecord>> MemoryStorage::list_environments(const ProjectId& project_id) {
    std::lock_guard lock(mutex_);
    std::vector<EnvironmentRecord> out;
    for (const auto& [id, record] : environments_) {
        if (record.project_id == project_id) out.push_back(record);
    }
    std::sort(out.begin(), out.end(), [](const EnvironmentRecord& a, const EnvironmentRecord& b) {
        return a.created_at < b.created_at;
    });
    return out;
}

// ── Introspection ────────────────────────────

size_t MemoryStorage::project_count() const {
    std::lock_guard lock(mutex_);
    return projects_.size();
}

size_t MemoryStorage::file_count() const {
    std::lock_guard lock(mutex_);
    return files_.size();
}

size_t MemoryStorage::execution_count() const {
    std::lock_guard lock(mutex_);
    return executions_.size();
}

size_t MemoryStorage::environment_count() const {
    std::lock_guard lock(mutex_);
    return environments_.size();
}

}  // namespace exec_engine
