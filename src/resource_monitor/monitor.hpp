/**
 * @file monitor.hpp
 * @brief Per-sandbox usage monitors.
 * @author Dimitris Kafetzis
 *
 * Provides ProcessMonitor (samples /proc for the sandbox's process group)
 * and MockMonitor (scripted samples for testing). Both satisfy the
 * UsageMonitorLike concept for zero-cost static dispatch.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/sandbox.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <sys/types.h>

namespace exec_engine {

/**
 * @brief Read aggregate usage of every live process whose pgrp is @p pgid.
 *
 * cpu_time is utime + stime + cutime + cstime summed over the group;
 * peak_memory_bytes is the summed resident set at this instant.
 * @return NotFound when no process belongs to the group.
 */
Result<UsageSnapshot> read_process_group_usage(pid_t pgid);

/**
 * @brief Fold @p sample into @p current: cpu_time and peak memory only grow.
 */
[[nodiscard]] UsageSnapshot fold_usage(const UsageSnapshot& current, const UsageSnapshot& sample) noexcept;

// ─────────────────────────────────────────────
// ProcessMonitor
// ─────────────────────────────────────────────

/**
 * @brief Samples sandboxed process trees from the Linux /proc filesystem.
 *
 * Satisfies UsageMonitorLike. Every attachment runs its own sampling
 * thread (std::jthread) and publishes the running aggregate atomically,
 * so snapshot() never contends with the sampler or the monitored process.
 *
 * The process group is read from Sandbox::process_group on every tick;
 * ticks before the runner publishes it are skipped.
 */
class ProcessMonitor {
public:
    explicit ProcessMonitor(uint32_t sampling_interval_ms = 100);
    ~ProcessMonitor();

    // Non-copyable
    ProcessMonitor(const ProcessMonitor&) = delete;
    ProcessMonitor& operator=(const ProcessMonitor&) = delete;

    // UsageMonitorLike interface
    Result<MonitorHandle> attach(const SandboxHandle& sandbox);
    Result<UsageSnapshot> snapshot(MonitorHandle handle);
    void merge(MonitorHandle handle, const UsageSnapshot& usage);
    Result<UsageSnapshot> detach(MonitorHandle handle);
    [[nodiscard]] size_t attached_count() const;

    [[nodiscard]] uint32_t sampling_interval_ms() const noexcept { return interval_ms_; }

private:
    struct Attachment {
        SandboxHandle sandbox;
        std::atomic<std::shared_ptr<const UsageSnapshot>> latest;
        std::mutex fold_mutex;            ///< Serializes writers of latest
        std::mutex sleep_mutex;
        std::condition_variable_any sleep_cv;
        std::jthread sampler;             ///< Declared last: joins first
    };

    void sampling_loop(Attachment& attachment, std::stop_token stop);
    static void fold_into(Attachment& attachment, const UsageSnapshot& sample);

    uint32_t interval_ms_;
    mutable std::mutex mutex_;
    std::unordered_map<MonitorHandle, std::unique_ptr<Attachment>> attachments_;
    MonitorHandle next_handle_{1};
};

// ─────────────────────────────────────────────
// MockMonitor
// ─────────────────────────────────────────────

/**
 * @brief Mock usage monitor for testing.
 *
 * Each snapshot() folds the next scripted sample into the attachment;
 * detach() folds whatever is left. Satisfies UsageMonitorLike.
 */
class MockMonitor {
public:
    explicit MockMonitor(uint32_t sampling_interval_ms = 0);

    // UsageMonitorLike interface
    Result<MonitorHandle> attach(const SandboxHandle& sandbox);
    Result<UsageSnapshot> snapshot(MonitorHandle handle);
    void merge(MonitorHandle handle, const UsageSnapshot& usage);
    Result<UsageSnapshot> detach(MonitorHandle handle);
    [[nodiscard]] size_t attached_count() const;

    // Test helpers
    void push_sample(UsageSnapshot sample);
    void set_fail_attach(bool fail);
    void set_ignore_merge(bool ignore);
    /// Next attach() throws std::system_error, as a failed thread spawn does.
    void throw_on_next_attach();
    /// Next merge() throws std::system_error.
    void throw_on_next_merge();
    [[nodiscard]] size_t attach_calls() const;
    [[nodiscard]] size_t detach_calls() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<MonitorHandle, UsageSnapshot> attached_;
    std::deque<UsageSnapshot> sequence_;
    MonitorHandle next_handle_{1};
    bool fail_attach_{false};
    bool ignore_merge_{false};
    bool throw_attach_{false};
    bool throw_merge_{false};
    size_t attach_calls_{0};
    size_t detach_calls_{0};
};

// Verify concept satisfaction at compile time
static_assert(UsageMonitorLike<ProcessMonitor>);
static_assert(UsageMonitorLike<MockMonitor>);

}  // namespace exec_engine
