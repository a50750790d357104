/**
 * @file run_queue.cpp
 * @brief RunQueue implementation.
 * @author Dimitris Kafetzis
 *
 * ready_heads_ holds exactly one entry per project that has pending work
 * and nothing running, keyed by the sequence of its oldest pending
 * execution. Its first entry is therefore the longest-waiting eligible
 * execution across all projects.
 */

#include "scheduler/run_queue.hpp"

#include <algorithm>

namespace exec_engine {

void RunQueue::enqueue(const ExecutionId& id, const ProjectId& project_id) {
    auto& queue = projects_[project_id];
    queue.pending.push_back(QueuedExecution{
        .id = id,
        .project_id = project_id,
        .sequence = next_sequence_++
    });
    index_.emplace(id, project_id);
    if (queue.pending.size() == 1) {
        publish_head(project_id, queue);
    }
}

std::optional<QueuedExecution> RunQueue::claim_next() {
    if (ready_heads_.empty()) return std::nullopt;

    auto head = ready_heads_.begin();
    auto project_id = head->second;
    ready_heads_.erase(head);

    auto& queue = projects_.at(project_id);
    auto next = std::move(queue.pending.front());
    queue.pending.pop_front();
    queue.running = true;
    index_.erase(next.id);
    ++running_;
    return next;
}

void RunQueue::release(const ProjectId& project_id) {
    auto it = projects_.find(project_id);
    if (it == projects_.end() || !it->second.running) return;

    it->second.running = false;
    --running_;
    publish_head(project_id, it->second);
    erase_if_idle(project_id);
}

bool RunQueue::remove(const ExecutionId& id) {
    auto idx = index_.find(id);
    if (idx == index_.end()) return false;

    auto project_id = idx->second;
    index_.erase(idx);

    auto& queue = projects_.at(project_id);
    auto pos = std::find_if(queue.pending.begin(), queue.pending.end(),
                            [&](const QueuedExecution& q) { return q.id == id; });
    if (pos == queue.pending.end()) return false;

    bool was_head = pos == queue.pending.begin();
    if (was_head && !queue.running) {
        ready_heads_.erase(pos->sequence);
    }
    queue.pending.erase(pos);
    if (was_head) {
        publish_head(project_id, queue);
    }
    erase_if_idle(project_id);
    return true;
}

size_t RunQueue::queued_count(const ProjectId& project_id) const {
    auto it = projects_.find(project_id);
    return it == projects_.end() ? 0 : it->second.pending.size();
}

void RunQueue::publish_head(const ProjectId& project_id, const ProjectQueue& queue) {
    if (!queue.running && !queue.pending.empty()) {
        ready_heads_[queue.pending.front().sequence] = project_id;
    }
}

void RunQueue::erase_if_idle(const ProjectId& project_id) {
    auto it = projects_.find(project_id);
    if (it != projects_.end() && !it->second.running && it->second.pending.empty()) {
        projects_.erase(it);
    }
}

}  // namespace exec_engine
