/**
 * @file worker_pool.hpp
 * @brief Fixed set of named std::jthread workers with cooperative shutdown.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace exec_engine {

/**
 * @brief Runs one long-lived loop per worker thread.
 *
 * Every worker executes the same body with its own stop_token, which fires
 * on request_stop(). The body is expected to return promptly once the token
 * fires. Threads are named `<name>-<index>` for debuggers and `top -H`.
 */
class WorkerPool {
public:
    using Body = std::function<void(std::stop_token, size_t worker_index)>;

    /// @param num_threads 0 = hardware_concurrency (4 if unknown)
    explicit WorkerPool(size_t num_threads = 0, std::string name = "worker");
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Launch the workers. Returns false if already started or stopped.
    bool start(Body body);

    /// Fire every worker's stop_token without waiting.
    void request_stop();

    /// request_stop() and wait for every worker to return. Idempotent.
    void join();

    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_.load(); }
    [[nodiscard]] size_t running_count() const noexcept { return running_.load(); }
    [[nodiscard]] size_t thread_count() const noexcept { return size_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    size_t size_;
    std::string name_;
    Body body_;
    std::vector<std::jthread> workers_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<size_t> running_{0};
};

}  // namespace exec_engine
