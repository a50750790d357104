/**
 * @file run_queue.hpp
 * @brief Per-project FIFO queues with a single-flight dequeue policy.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <unordered_map>

namespace exec_engine {

struct QueuedExecution {
    ExecutionId id;
    ProjectId project_id;
    uint64_t sequence{0};   ///< Global submission order
};

/**
 * @brief Pending executions grouped by project.
 *
 * claim_next() returns the oldest queued execution among projects that
 * have nothing running, and marks its project running until release().
 * Within a project executions are claimed strictly in submission order.
 *
 * Not thread-safe; the scheduler guards it with its state mutex.
 */
class RunQueue {
public:
    void enqueue(const ExecutionId& id, const ProjectId& project_id);

    /// Oldest head of an idle project, or nullopt if none is ready.
    std::optional<QueuedExecution> claim_next();

    /// The project's running execution finished; its next one becomes ready.
    void release(const ProjectId& project_id);

    /// Drop a queued (not running) execution. Returns false if not queued.
    bool remove(const ExecutionId& id);

    [[nodiscard]] bool has_ready() const noexcept { return !ready_heads_.empty(); }
    [[nodiscard]] bool contains(const ExecutionId& id) const { return index_.contains(id); }
    [[nodiscard]] size_t queued_count() const noexcept { return index_.size(); }
    [[nodiscard]] size_t queued_count(const ProjectId& project_id) const;
    [[nodiscard]] size_t running_count() const noexcept { return running_; }

private:
    struct ProjectQueue {
        std::deque<QueuedExecution> pending;
        bool running{false};
    };

    void publish_head(const ProjectId& project_id, const ProjectQueue& queue);
    void erase_if_idle(const ProjectId& project_id);

    std::unordered_map<ProjectId, ProjectQueue> projects_;
    std::unordered_map<ExecutionId, ProjectId> index_;
    std::map<uint64_t, ProjectId> ready_heads_;   ///< head sequence -> idle project
    uint64_t next_sequence_{0};
    size_t running_{0};
};

}  // namespace exec_engine
