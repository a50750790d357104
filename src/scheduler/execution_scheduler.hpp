/**
 * @file execution_scheduler.hpp
 * @brief Execution scheduler: per-project FIFO queues, a bounded worker
 *        pool, and the execution state machine.
 * @author Dimitris Kafetzis
 *
 * Each worker claims one QUEUED execution, provisions a sandbox, installs
 * the project's dependencies when it has a manifest, runs the entry file
 * under the resource monitor, persists the terminal record and loops. At
 * most one execution per project is RUNNING at any time.
 *
 * Template-parameterized on MonitorT for testability (ProcessMonitor or
 * MockMonitor).
 *
 * Locking: state_mutex_ guards the queue and the tracked map; each Tracked
 * entry has its own mutex for the record. When both are held, state_mutex_
 * is taken first.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/process_runner.hpp"
#include "executor/worker_pool.hpp"
#include "resource_monitor/monitor.hpp"
#include "sandbox/sandbox.hpp"
#include "scheduler/run_queue.hpp"
#include "storage/storage.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace exec_engine {

struct SchedulerOptions {
    size_t worker_count = 0;                         ///< 0 = hardware_concurrency
    std::chrono::milliseconds default_timeout{10000};
    uint32_t sampling_interval_ms = 100;
    RunnerOptions runner;
    std::chrono::milliseconds install_timeout{300000};
    uint32_t storage_retry_attempts = 5;
    std::chrono::milliseconds storage_retry_backoff{50};
    std::map<Language, std::string> default_entries;  ///< Entry used when none is given
};

/**
 * @brief Derive scheduler options from the engine configuration.
 */
SchedulerOptions scheduler_options_from(const Config& config);

struct SchedulerStats {
    size_t queued = 0;
    size_t running = 0;
    size_t tracked = 0;           ///< Records held in memory
    size_t unpersisted = 0;       ///< Terminal records storage has not accepted yet
    uint64_t submitted = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
};

/// Text appended to stderr of an ERROR record, e.g. "[timeout] ...".
[[nodiscard]] std::string failure_annotation(ErrorKind kind, std::string_view detail);

template <UsageMonitorLike MonitorT = ProcessMonitor>
class ExecutionScheduler {
public:
    ExecutionScheduler(SchedulerOptions options,
                       IStorage& storage,
                       IProvisioner& provisioner,
                       Logger& logger,
                       MetricsCollector& metrics);
    ~ExecutionScheduler();

    // Non-copyable, non-movable
    ExecutionScheduler(const ExecutionScheduler&) = delete;
    ExecutionScheduler& operator=(const ExecutionScheduler&) = delete;

    /**
     * @brief Queue an execution of @p entry_file (default: the language's
     *        entry file). Never blocks on execution.
     * @param timeout overrides the default time budget when set
     */
    Result<ExecutionId> submit(const ProjectId& project_id,
                               std::optional<std::string> entry_file = std::nullopt,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Current record; RUNNING records carry live usage.
    Result<ExecutionSnapshot> get_status(const ExecutionId& id);

    /**
     * @brief Cancel a QUEUED or RUNNING execution.
     *
     * QUEUED executions become ERROR immediately. For RUNNING executions the
     * process tree is signalled and the call returns once the record is
     * terminal. AlreadyTerminal if the execution had already finished.
     */
    Result<void> cancel(const ExecutionId& id, std::string reason = "cancelled by request");

    /// Block until terminal or @p timeout; returns the latest record either way.
    Result<ExecutionSnapshot> wait(const ExecutionId& id, std::chrono::milliseconds timeout);

    /// Cancel every queued and running execution of a project.
    size_t cancel_project(const ProjectId& project_id, std::string reason);

    /// Retry persisting terminal records storage rejected; returns how many remain.
    size_t reconcile();

    /// Stop admissions, cancel outstanding work and join the workers. Idempotent.
    void shutdown();

    [[nodiscard]] SchedulerStats stats() const;
    [[nodiscard]] size_t worker_count() const noexcept { return workers_.thread_count(); }

    // ── Accessors (for testing) ─────────────
    MonitorT& monitor() { return monitor_; }
    const SchedulerOptions& options() const { return options_; }

private:
    struct Tracked {
        mutable std::mutex mutex;
        std::condition_variable terminal_cv;
        ExecutionRecord record;
        Language language{Language::Python};
        std::chrono::milliseconds timeout{0};
        std::stop_source stop;
        std::optional<std::string> cancel_reason;
        std::optional<MonitorHandle> monitor;
        SteadyTime state_entered{};
        bool persisted{false};
    };
    using TrackedPtr = std::shared_ptr<Tracked>;

    struct Failure {
        ErrorKind kind;
        std::string detail;
    };

    /**
     * @brief One execution's hold on its sandbox and monitor attachment.
     *
     * release() detaches the monitor and tears the sandbox down. The
     * destructor releases whatever is still held, so a worker that throws
     * mid-run cannot leave a live sandbox behind.
     */
    class SandboxLease {
    public:
        SandboxLease(ExecutionScheduler& owner, TrackedPtr tracked, SandboxHandle sandbox);
        ~SandboxLease();

        SandboxLease(const SandboxLease&) = delete;
        SandboxLease& operator=(const SandboxLease&) = delete;

        [[nodiscard]] Sandbox& sandbox() const noexcept { return *sandbox_; }

        void attach_monitor();
        /// Folds @p measured into the attachment; the final usage if one was attached.
        std::optional<UsageSnapshot> detach_monitor(const std::optional<UsageSnapshot>& measured);
        void release();

    private:
        ExecutionScheduler& owner_;
        TrackedPtr tracked_;
        SandboxHandle sandbox_;
        std::optional<MonitorHandle> monitor_;
        bool released_{false};
    };

    void worker_loop(std::stop_token stop);
    void execute(const TrackedPtr& tracked);
    std::optional<Failure> install_dependencies(Sandbox& sandbox, std::stop_token token,
                                                const ExecutionId& id);
    void finalize(const TrackedPtr& tracked,
                  const std::optional<ExecutionResult>& result,
                  const std::optional<Failure>& failure,
                  const UsageSnapshot& usage);
    void complete(const TrackedPtr& tracked);
    static void apply_terminal(ExecutionRecord& record, ErrorKind kind, std::string_view detail);
    std::vector<TrackedPtr> cancel_matching(const std::function<bool(const ExecutionRecord&)>& match,
                                            const std::string& reason);
    Result<void> persist(const ExecutionRecord& record);
    TrackedPtr find_tracked(const ExecutionId& id) const;

    SchedulerOptions options_;
    IStorage& storage_;
    IProvisioner& provisioner_;
    Logger& logger_;
    MetricsCollector& metrics_;
    MonitorT monitor_;
    ProcessRunner runner_;

    mutable std::mutex state_mutex_;
    std::condition_variable_any work_cv_;
    RunQueue queue_;
    std::unordered_map<ExecutionId, TrackedPtr> tracked_;
    bool accepting_{true};

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};

    WorkerPool workers_;   ///< Declared last: workers stop before members die
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <UsageMonitorLike MonitorT>
ExecutionScheduler<MonitorT>::ExecutionScheduler(SchedulerOptions options,
                                                 IStorage& storage,
                                                 IProvisioner& provisioner,
                                                 Logger& logger,
                                                 MetricsCollector& metrics)
    : options_(std::move(options))
    , storage_(storage)
    , provisioner_(provisioner)
    , logger_(logger)
    , metrics_(metrics)
    , monitor_(options_.sampling_interval_ms)
    , runner_(options_.runner, logger)
    , workers_(options_.worker_count, "ee-worker") {
    workers_.start([this](std::stop_token stop, size_t /*worker_index*/) { worker_loop(stop); });
    logger_.info("Execution scheduler started: workers=" + std::to_string(workers_.thread_count())
                 + " default_timeout_ms=" + std::to_string(options_.default_timeout.count()));
}

template <UsageMonitorLike MonitorT>
ExecutionScheduler<MonitorT>::~ExecutionScheduler() {
    shutdown();
}

// ── Public API ───────────────────────────────

template <UsageMonitorLike MonitorT>
Result<ExecutionId> ExecutionScheduler<MonitorT>::submit(
    const ProjectId& project_id,
    std::optional<std::string> entry_file,
    std::optional<std::chrono::milliseconds> timeout) {
    {
        std::lock_guard lock(state_mutex_);
        if (!accepting_) {
            return Error{ErrorKind::ShuttingDown, "Scheduler is shutting down"};
        }
    }

    auto project = storage_.get_project(project_id);
    if (!project) {
        return project.error();
    }

    if (!entry_file) {
        auto it = options_.default_entries.find(project->language);
        if (it == options_.default_entries.end()) {
            return Error{ErrorKind::InvalidArgument,
                         "No default entry file for " + std::string(to_string(project->language))};
        }
        entry_file = it->second;
    }
    if (!is_safe_relative_path(*entry_file)) {
        return Error{ErrorKind::InvalidArgument, "Invalid entry file: '" + *entry_file + "'"};
    }
    if (timeout && *timeout <= std::chrono::milliseconds::zero()) {
        return Error{ErrorKind::InvalidArgument, "Timeout must be positive"};
    }

    auto tracked = std::make_shared<Tracked>();
    tracked->record = ExecutionRecord{
        .id = generate_id(),
        .project_id = project_id,
        .entry_file = *entry_file,
        .status = ExecutionStatus::Queued,
        .submitted_at = std::chrono::system_clock::now()
    };
    tracked->language = project->language;
    tracked->timeout = timeout.value_or(options_.default_timeout);
    tracked->state_entered = std::chrono::steady_clock::now();

    if (auto created = storage_.create_execution(tracked->record); !created) {
        return created.error();
    }
    tracked->persisted = true;
    const auto id = tracked->record.id;

    bool admitted = false;
    {
        std::lock_guard lock(state_mutex_);
        if (accepting_) {
            tracked_.emplace(id, tracked);
            queue_.enqueue(id, project_id);
            admitted = true;
        }
    }
    submitted_.fetch_add(1);

    if (!admitted) {
        // Shutdown raced with this submission; the row must not stay QUEUED.
        {
            std::lock_guard lock(tracked->mutex);
            apply_terminal(tracked->record, ErrorKind::Cancelled, "engine shutdown");
        }
        complete(tracked);
        return id;
    }

    work_cv_.notify_one();
    logger_.info("Execution queued",
                 {{"execution_id", id}, {"project_id", project_id}, {"entry", *entry_file}});
    metrics_.record_execution_event(id, project_id, ExecutionStatus::Queued, Duration{0});
    return id;
}

template <UsageMonitorLike MonitorT>
Result<ExecutionSnapshot> ExecutionScheduler<MonitorT>::get_status(const ExecutionId& id) {
    auto tracked = find_tracked(id);
    if (!tracked) {
        return storage_.get_execution(id);
    }

    ExecutionSnapshot snapshot;
    std::optional<MonitorHandle> handle;
    {
        std::lock_guard lock(tracked->mutex);
        snapshot = tracked->record;
        handle = tracked->monitor;
    }

    if (snapshot.status == ExecutionStatus::Running && handle) {
        // The handle may be detached concurrently; then there is nothing live to add.
        if (auto usage = monitor_.snapshot(*handle); usage.has_value()) {
            snapshot.memory_usage_mb = usage->peak_memory_mb();
            snapshot.cpu_time_seconds = usage->cpu_seconds();
        }
    }
    return snapshot;
}

template <UsageMonitorLike MonitorT>
Result<void> ExecutionScheduler<MonitorT>::cancel(const ExecutionId& id, std::string reason) {
    TrackedPtr tracked;
    bool finalized_queued = false;
    {
        std::lock_guard lock(state_mutex_);
        auto it = tracked_.find(id);
        if (it != tracked_.end()) {
            tracked = it->second;
            std::lock_guard record_lock(tracked->mutex);
            if (tracked->record.terminal()) {
                return Error{ErrorKind::AlreadyTerminal, "Execution " + id + " already finished"};
            }
            if (tracked->record.status == ExecutionStatus::Queued) {
                queue_.remove(id);
                apply_terminal(tracked->record, ErrorKind::Cancelled, reason);
                finalized_queued = true;
            } else {
                if (!tracked->cancel_reason) tracked->cancel_reason = reason;
                tracked->stop.request_stop();
            }
        }
    }

    if (!tracked) {
        auto stored = storage_.get_execution(id);
        if (!stored) {
            return stored.error();
        }
        if (stored->terminal()) {
            return Error{ErrorKind::AlreadyTerminal, "Execution " + id + " already finished"};
        }
        // Not owned by any live worker: finalize the orphaned row directly.
        auto record = *stored;
        apply_terminal(record, ErrorKind::Cancelled, reason);
        if (auto saved = persist(record); !saved) {
            return saved.error();
        }
        logger_.warn("Orphaned execution " + id + " finalized by cancel");
        failed_.fetch_add(1);
        return Result<void>{};
    }

    if (finalized_queued) {
        logger_.info("Execution cancelled while queued: id=" + id + " reason=" + reason);
        complete(tracked);
        return Result<void>{};
    }

    logger_.info("Cancelling running execution: id=" + id + " reason=" + reason);
    std::unique_lock lock(tracked->mutex);
    tracked->terminal_cv.wait(lock, [&] { return tracked->record.terminal(); });
    return Result<void>{};
}

template <UsageMonitorLike MonitorT>
Result<ExecutionSnapshot> ExecutionScheduler<MonitorT>::wait(const ExecutionId& id,
                                                             std::chrono::milliseconds timeout) {
    auto tracked = find_tracked(id);
    if (!tracked) {
        return storage_.get_execution(id);
    }
    std::unique_lock lock(tracked->mutex);
    tracked->terminal_cv.wait_for(lock, timeout, [&] { return tracked->record.terminal(); });
    return tracked->record;
}

template <UsageMonitorLike MonitorT>
size_t ExecutionScheduler<MonitorT>::cancel_project(const ProjectId& project_id, std::string reason) {
    auto cancelled = cancel_matching(
        [&](const ExecutionRecord& record) { return record.project_id == project_id; }, reason);
    if (!cancelled.empty()) {
        logger_.info("Cancelled " + std::to_string(cancelled.size()) + " execution(s) of project "
                     + project_id + ": " + reason);
    }
    return cancelled.size();
}

template <UsageMonitorLike MonitorT>
size_t ExecutionScheduler<MonitorT>::reconcile() {
    std::vector<TrackedPtr> pending;
    {
        std::lock_guard lock(state_mutex_);
        for (const auto& [id, tracked] : tracked_) {
            std::lock_guard record_lock(tracked->mutex);
            if (tracked->record.terminal() && !tracked->persisted) pending.push_back(tracked);
        }
    }

    size_t remaining = 0;
    for (const auto& tracked : pending) {
        ExecutionRecord record;
        {
            std::lock_guard lock(tracked->mutex);
            record = tracked->record;
        }
        if (persist(record)) {
            {
                std::lock_guard lock(tracked->mutex);
                tracked->persisted = true;
            }
            std::lock_guard lock(state_mutex_);
            tracked_.erase(record.id);
            logger_.info("Execution " + record.id + " reconciled with storage");
        } else {
            ++remaining;
        }
    }
    return remaining;
}

template <UsageMonitorLike MonitorT>
void ExecutionScheduler<MonitorT>::shutdown() {
    {
        std::lock_guard lock(state_mutex_);
        if (!accepting_) return;
        accepting_ = false;
    }
    logger_.info("Execution scheduler shutting down...");

    auto cancelled = cancel_matching([](const ExecutionRecord&) { return true; }, "engine shutdown");
    workers_.join();

    auto unpersisted = stats().unpersisted;
    if (unpersisted > 0) {
        logger_.error(std::to_string(unpersisted)
                      + " terminal execution(s) were never accepted by storage; reconcile manually");
    }
    logger_.info("Execution scheduler stopped (cancelled " + std::to_string(cancelled.size()) + ")");
}

template <UsageMonitorLike MonitorT>
SchedulerStats ExecutionScheduler<MonitorT>::stats() const {
    SchedulerStats s;
    {
        std::lock_guard lock(state_mutex_);
        s.queued = queue_.queued_count();
        s.running = queue_.running_count();
        s.tracked = tracked_.size();
        for (const auto& [id, tracked] : tracked_) {
            std::lock_guard record_lock(tracked->mutex);
            if (tracked->record.terminal() && !tracked->persisted) ++s.unpersisted;
        }
    }
    s.submitted = submitted_.load();
    s.completed = completed_.load();
    s.failed = failed_.load();
    return s;
}

// ── Workers ──────────────────────────────────

template <UsageMonitorLike MonitorT>
void ExecutionScheduler<MonitorT>::worker_loop(std::stop_token stop) {
    while (true) {
        TrackedPtr tracked;
        ProjectId project_id;
        {
            std::unique_lock lock(state_mutex_);
            work_cv_.wait(lock, stop, [this] { return queue_.has_ready(); });
            if (stop.stop_requested()) return;

            auto next = queue_.claim_next();
            if (!next) continue;
            project_id = next->project_id;

            auto it = tracked_.find(next->id);
            if (it == tracked_.end()) {
                logger_.error("Claimed execution " + next->id + " is not tracked");
                queue_.release(project_id);
                continue;
            }
            tracked = it->second;

            // Claim and RUNNING are one atomic step with respect to cancel().
            std::lock_guard record_lock(tracked->mutex);
            tracked->record.status = ExecutionStatus::Running;
            tracked->record.started_at = std::chrono::system_clock::now();
        }

        try {
            execute(tracked);
        } catch (const std::exception& e) {
            logger_.error("Worker failure on execution " + tracked->record.id + ": " + e.what());
            bool terminal = false;
            {
                std::lock_guard lock(tracked->mutex);
                terminal = tracked->record.terminal();
            }
            if (!terminal) {
                finalize(tracked, std::nullopt,
                         Failure{ErrorKind::Provision, std::string("internal error: ") + e.what()},
                         UsageSnapshot{});
            }
        }

        {
            std::lock_guard lock(state_mutex_);
            queue_.release(project_id);
        }
        work_cv_.notify_all();
    }
}

template <UsageMonitorLike MonitorT>
void ExecutionScheduler<MonitorT>::execute(const TrackedPtr& tracked) {
    ExecutionRecord record;
    Language language;
    std::chrono::milliseconds timeout;
    Duration waited{0};
    {
        std::lock_guard lock(tracked->mutex);
        record = tracked->record;
        language = tracked->language;
        timeout = tracked->timeout;
        auto now = std::chrono::steady_clock::now();
        waited = std::chrono::duration_cast<Duration>(now - tracked->state_entered);
        tracked->state_entered = now;
    }
    const auto& id = record.id;
    auto token = tracked->stop.get_token();

    logger_.info("Execution running", {{"execution_id", id}, {"project_id", record.project_id}});
    metrics_.record_execution_event(id, record.project_id, ExecutionStatus::Running, waited);

    if (auto saved = persist(record); !saved) {
        if (!saved.error().is(ErrorKind::NotFound)) {
            finalize(tracked, std::nullopt,
                     Failure{ErrorKind::Storage, "could not record start: " + saved.error().message},
                     UsageSnapshot{});
            return;
        }
    }

    if (token.stop_requested()) {
        finalize(tracked, std::nullopt, Failure{ErrorKind::Cancelled, ""}, UsageSnapshot{});
        return;
    }

    auto provisioned = provisioner_.provision(record.project_id, language);
    if (!provisioned) {
        logger_.warn("Provisioning failed for execution " + id + ": " + provisioned.error().message);
        finalize(tracked, std::nullopt, Failure{ErrorKind::Provision, provisioned.error().message},
                 UsageSnapshot{});
        return;
    }
    metrics_.record_sandbox_event((*provisioned)->id, record.project_id, "provisioned");
    SandboxLease lease(*this, tracked, std::move(*provisioned));

    std::optional<ExecutionResult> result;
    std::optional<Failure> failure;
    UsageSnapshot usage;

    if (!lease.sandbox().contains(record.entry_file)) {
        failure = Failure{ErrorKind::Provision,
                          "entry file '" + record.entry_file + "' not found in project"};
    } else if (lease.sandbox().needs_install()) {
        failure = install_dependencies(lease.sandbox(), token, id);
    }

    if (!failure) {
        lease.attach_monitor();

        auto on_output = [&tracked](OutputStream stream, std::string_view text) {
            std::lock_guard lock(tracked->mutex);
            auto& target = stream == OutputStream::Stdout ? tracked->record.stdout_text
                                                          : tracked->record.stderr_text;
            target.append(text);
        };

        auto run = runner_.run(lease.sandbox(), record.entry_file, timeout, token, on_output);
        if (run.has_value()) {
            result = std::move(*run);
            usage = result->usage;
        } else {
            failure = Failure{ErrorKind::Provision, run.error().message};
        }

        auto measured = result ? std::optional<UsageSnapshot>(result->usage) : std::nullopt;
        if (auto final_usage = lease.detach_monitor(measured)) {
            usage = *final_usage;
        }
    }

    lease.release();
    finalize(tracked, result, failure, usage);
}

template <UsageMonitorLike MonitorT>
auto ExecutionScheduler<MonitorT>::install_dependencies(Sandbox& sandbox,
                                                        std::stop_token token,
                                                        const ExecutionId& id) -> std::optional<Failure> {
    constexpr size_t kStderrTail = 2048;

    auto installed = runner_.install_dependencies(sandbox, options_.install_timeout, token);
    if (!installed) {
        return Failure{ErrorKind::Provision, "dependency install: " + installed.error().message};
    }

    std::string cause;
    switch (installed->outcome) {
        case RunOutcome::Exited:
            if (installed->exit_code.value_or(-1) == 0) {
                logger_.debug("Dependencies installed for execution " + id + " in "
                              + std::to_string(installed->wall_time.count()) + " ms");
                return std::nullopt;
            }
            cause = "failed with exit code " + std::to_string(installed->exit_code.value_or(-1));
            break;
        case RunOutcome::Signaled:
            cause = "killed by signal " + std::to_string(installed->signal.value_or(0));
            break;
        case RunOutcome::TimedOut:
            cause = "timed out after " + std::to_string(options_.install_timeout.count()) + " ms";
            break;
        case RunOutcome::Cancelled:
            return Failure{ErrorKind::Cancelled, ""};
    }

    std::string_view tail = installed->stderr_text;
    if (tail.size() > kStderrTail) tail.remove_prefix(tail.size() - kStderrTail);
    while (!tail.empty() && (tail.back() == '\n' || tail.back() == ' ')) tail.remove_suffix(1);

    logger_.warn("Dependency install " + cause + " for execution " + id);
    std::string detail = "dependency install " + cause;
    if (!tail.empty()) {
        detail += ": ";
        detail += tail;
    }
    return Failure{ErrorKind::Provision, std::move(detail)};
}

// ── Sandbox lease ────────────────────────────

template <UsageMonitorLike MonitorT>
ExecutionScheduler<MonitorT>::SandboxLease::SandboxLease(ExecutionScheduler& owner,
                                                         TrackedPtr tracked,
                                                         SandboxHandle sandbox)
    : owner_(owner), tracked_(std::move(tracked)), sandbox_(std::move(sandbox)) {}

template <UsageMonitorLike MonitorT>
ExecutionScheduler<MonitorT>::SandboxLease::~SandboxLease() {
    if (released_) return;
    try {
        detach_monitor(std::nullopt);
    } catch (const std::exception& e) {
        owner_.logger_.error("Monitor detach failed for sandbox " + sandbox_->id + ": " + e.what());
    }
    try {
        release();
    } catch (const std::exception& e) {
        owner_.logger_.error("Sandbox " + sandbox_->id + " not reclaimed after worker failure: "
                             + e.what());
    }
}

template <UsageMonitorLike MonitorT>
void ExecutionScheduler<MonitorT>::SandboxLease::attach_monitor() {
    auto attached = owner_.monitor_.attach(sandbox_);
    if (!attached) {
        owner_.logger_.warn("Usage monitor unavailable for execution " + tracked_->record.id + ": "
                            + attached.error().message);
        return;
    }
    monitor_ = *attached;
    std::lock_guard lock(tracked_->mutex);
    tracked_->monitor = monitor_;
}

template <UsageMonitorLike MonitorT>
std::optional<UsageSnapshot> ExecutionScheduler<MonitorT>::SandboxLease::detach_monitor(
    const std::optional<UsageSnapshot>& measured) {
    if (!monitor_) return std::nullopt;
    auto handle = *monitor_;
    {
        std::lock_guard lock(tracked_->mutex);
        tracked_->monitor.reset();
    }

    // Still held if merge throws, so the destructor detaches it.
    if (measured) owner_.monitor_.merge(handle, *measured);
    monitor_.reset();
    auto final_usage = owner_.monitor_.detach(handle);
    if (!final_usage) return std::nullopt;
    return *final_usage;
}

template <UsageMonitorLike MonitorT>
void ExecutionScheduler<MonitorT>::SandboxLease::release() {
    if (released_) return;
    released_ = true;

    if (auto torn = owner_.provisioner_.teardown(sandbox_); !torn) {
        owner_.logger_.error("Teardown failed for sandbox " + sandbox_->id + ": " + torn.error().message);
    }
    owner_.metrics_.record_sandbox_event(sandbox_->id, sandbox_->project_id, "torn_down");
}

template <UsageMonitorLike MonitorT>
void ExecutionScheduler<MonitorT>::finalize(const TrackedPtr& tracked,
                                            const std::optional<ExecutionResult>& result,
                                            const std::optional<Failure>& failure,
                                            const UsageSnapshot& usage) {
    {
        std::lock_guard lock(tracked->mutex);
        auto& record = tracked->record;
        if (record.terminal()) return;

        std::string reason = tracked->cancel_reason.value_or("cancelled by request");

        if (failure) {
            auto detail = failure->kind == ErrorKind::Cancelled ? reason : failure->detail;
            apply_terminal(record, failure->kind, detail);
        } else if (result) {
            switch (result->outcome) {
                case RunOutcome::Exited:
                    record.exit_code = result->exit_code;
                    record.status = result->exit_code.value_or(-1) == 0
                        ? ExecutionStatus::Completed : ExecutionStatus::Error;
                    break;
                case RunOutcome::Signaled: {
                    int sig = result->signal.value_or(0);
                    const char* name = ::strsignal(sig);
                    apply_terminal(record, ErrorKind::Crash,
                                   "terminated by signal " + std::to_string(sig)
                                   + (name ? std::string(" (") + name + ")" : std::string{}));
                    break;
                }
                case RunOutcome::TimedOut:
                    apply_terminal(record, ErrorKind::Timeout,
                                   "exceeded " + std::to_string(tracked->timeout.count()) + " ms"
                                   + (result->force_killed ? ", killed after grace period" : ""));
                    break;
                case RunOutcome::Cancelled:
                    apply_terminal(record, ErrorKind::Cancelled, reason);
                    break;
            }
        } else {
            apply_terminal(record, ErrorKind::Provision, "no result");
        }

        auto now = std::chrono::system_clock::now();
        record.completed_at = record.started_at ? std::max(now, *record.started_at) : now;
        record.memory_usage_mb = usage.peak_memory_mb();
        record.cpu_time_seconds = usage.cpu_seconds();
    }

    metrics_.record_usage(tracked->record.id, usage);
    complete(tracked);
}

template <UsageMonitorLike MonitorT>
void ExecutionScheduler<MonitorT>::complete(const TrackedPtr& tracked) {
    ExecutionRecord record;
    Duration elapsed{0};
    {
        std::lock_guard lock(tracked->mutex);
        record = tracked->record;
        auto now = std::chrono::steady_clock::now();
        elapsed = std::chrono::duration_cast<Duration>(now - tracked->state_entered);
        tracked->state_entered = now;
    }

    auto saved = persist(record);
    bool persisted = saved.has_value() || saved.error().is(ErrorKind::NotFound);
    if (!saved) {
        if (saved.error().is(ErrorKind::NotFound)) {
            logger_.warn("Execution " + record.id + " vanished from storage (project deleted?)");
        } else {
            logger_.error("Execution " + record.id + " finished as " + std::string(to_string(record.status))
                          + " but storage rejected it: " + saved.error().message
                          + "; record kept in memory for reconciliation");
        }
    }

    {
        std::lock_guard lock(tracked->mutex);
        tracked->persisted = persisted;
    }
    tracked->terminal_cv.notify_all();

    if (record.status == ExecutionStatus::Completed) {
        completed_.fetch_add(1);
    } else {
        failed_.fetch_add(1);
    }
    logger_.info("Execution finished",
                 {{"execution_id", record.id},
                  {"project_id", record.project_id},
                  {"status", std::string(to_string(record.status))},
                  {"exit_code", record.exit_code ? std::to_string(*record.exit_code) : ""},
                  {"cause", record.failure ? std::string(to_string(*record.failure)) : ""}});
    metrics_.record_execution_event(record.id, record.project_id, record.status, elapsed);

    if (persisted) {
        std::lock_guard lock(state_mutex_);
        tracked_.erase(record.id);
    }
}

template <UsageMonitorLike MonitorT>
void ExecutionScheduler<MonitorT>::apply_terminal(ExecutionRecord& record,
                                                  ErrorKind kind,
                                                  std::string_view detail) {
    record.status = ExecutionStatus::Error;
    record.exit_code.reset();
    record.failure = kind;
    if (!record.stderr_text.empty() && record.stderr_text.back() != '\n') {
        record.stderr_text += '\n';
    }
    record.stderr_text += failure_annotation(kind, detail);

    // Terminal records always carry usage and a completion time.
    auto now = std::chrono::system_clock::now();
    record.completed_at = record.started_at ? std::max(now, *record.started_at) : now;
    if (!record.memory_usage_mb) record.memory_usage_mb = 0.0;
    if (!record.cpu_time_seconds) record.cpu_time_seconds = 0.0;
}

template <UsageMonitorLike MonitorT>
auto ExecutionScheduler<MonitorT>::cancel_matching(
    const std::function<bool(const ExecutionRecord&)>& match,
    const std::string& reason) -> std::vector<TrackedPtr> {
    std::vector<TrackedPtr> queued;
    std::vector<TrackedPtr> running;
    {
        std::lock_guard lock(state_mutex_);
        for (const auto& [id, tracked] : tracked_) {
            std::lock_guard record_lock(tracked->mutex);
            if (tracked->record.terminal() || !match(tracked->record)) continue;
            if (tracked->record.status == ExecutionStatus::Queued) {
                queue_.remove(id);
                apply_terminal(tracked->record, ErrorKind::Cancelled, reason);
                queued.push_back(tracked);
            } else {
                if (!tracked->cancel_reason) tracked->cancel_reason = reason;
                tracked->stop.request_stop();
                running.push_back(tracked);
            }
        }
    }

    for (const auto& tracked : queued) {
        complete(tracked);
    }
    for (const auto& tracked : running) {
        std::unique_lock lock(tracked->mutex);
        tracked->terminal_cv.wait(lock, [&] { return tracked->record.terminal(); });
    }

    queued.insert(queued.end(), running.begin(), running.end());
    return queued;
}

template <UsageMonitorLike MonitorT>
Result<void> ExecutionScheduler<MonitorT>::persist(const ExecutionRecord& record) {
    const uint32_t attempts = std::max<uint32_t>(1, options_.storage_retry_attempts);
    auto backoff = options_.storage_retry_backoff;

    for (uint32_t attempt = 1;; ++attempt) {
        auto saved = storage_.update_execution(record);
        if (saved) return saved;

        // Only backend failures are transient.
        if (!saved.error().is(ErrorKind::Storage)) return saved;

        if (attempt >= attempts) {
            logger_.error("Persisting execution " + record.id + " failed after "
                          + std::to_string(attempts) + " attempt(s): " + saved.error().message);
            return saved;
        }
        logger_.warn("Persisting execution " + record.id + " failed (attempt "
                     + std::to_string(attempt) + "/" + std::to_string(attempts) + "): "
                     + saved.error().message + "; retrying in "
                     + std::to_string(backoff.count()) + " ms");
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}

template <UsageMonitorLike MonitorT>
auto ExecutionScheduler<MonitorT>::find_tracked(const ExecutionId& id) const -> TrackedPtr {
    std::lock_guard lock(state_mutex_);
    auto it = tracked_.find(id);
    return it == tracked_.end() ? nullptr : it->second;
}

}  // namespace exec_engine
