/**
 * @file process_runner.cpp
 * @brief ProcessRunner implementation: fork/exec, pipe capture, timeout and
 *        cancellation via process-group signals, wait4 accounting.
 * @author Dimitris Kafetzis
 *
 * Everything the child needs (argv, envp, paths) is prepared before fork();
 * between fork() and execve() the child only makes async-signal-safe calls.
 */

#include "executor/process_runner.hpp"
#include "executor/output_buffer.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace exec_engine {

namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

constexpr milliseconds kDrainLimit{500};
constexpr size_t kReadChunk = 64 * 1024;

/**
 * @brief Owns a pipe pair; closes whatever ends are still open.
 */
struct Pipe {
    std::array<int, 2> fds{-1, -1};

    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe() {
        close_read();
        close_write();
    }

    bool open() { return ::pipe2(fds.data(), O_CLOEXEC) == 0; }
    [[nodiscard]] int read_end() const noexcept { return fds[0]; }
    [[nodiscard]] int write_end() const noexcept { return fds[1]; }

    void close_read() noexcept {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void close_write() noexcept {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
};

/**
 * @brief Kills and reaps the process group if run() leaves early.
 */
class ChildGuard {
public:
    ChildGuard(pid_t pid, Sandbox& sandbox) : pid_(pid), sandbox_(sandbox) {}
    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    ~ChildGuard() {
        if (!reaped_) {
            ::kill(-pid_, SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        }
        sandbox_.process_group.store(0);
    }

    void mark_reaped() noexcept { reaped_ = true; }

private:
    pid_t pid_;
    Sandbox& sandbox_;
    bool reaped_{false};
};

void set_limit(int resource, rlim_t value) {
    struct rlimit rl{};
    rl.rlim_cur = value;
    rl.rlim_max = value;
    ::setrlimit(resource, &rl);
}

/**
 * @brief Best-effort namespace isolation in the child.
 *
 * Unprivileged callers cannot unshare network/IPC/UTS directly; a new user
 * namespace makes it possible where the kernel allows it. If both fail the
 * run proceeds with process-group and rlimit isolation only.
 */
void isolate_namespaces(const SandboxLimits& limits) {
    if (!limits.isolate_namespaces) return;

    int flags = CLONE_NEWIPC | CLONE_NEWUTS;
    if (!limits.allow_network) flags |= CLONE_NEWNET;

    if (::unshare(flags) == 0) return;
    if (::unshare(CLONE_NEWUSER | flags) == 0) return;
    if (!limits.allow_network && ::unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) return;
    // Falls through to process-group and rlimit isolation.
}

[[noreturn]] void exec_child(const Sandbox& sandbox,
                             const SandboxLimits& limits,
                             char* const* argv,
                             char* const* envp,
                             int stdout_fd,
                             int stderr_fd,
                             int error_fd) {
    auto fail = [error_fd](int err) {
        ssize_t ignored = ::write(error_fd, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    };

    ::setpgid(0, 0);
    isolate_namespaces(limits);

    set_limit(RLIMIT_CORE, 0);
    if (limits.file_size_bytes > 0) {
        set_limit(RLIMIT_FSIZE, limits.file_size_bytes);
    }
    if (limits.max_processes > 0) {
        set_limit(RLIMIT_NPROC, limits.max_processes);
    }
    if (limits.address_space_bytes > 0) {
        set_limit(RLIMIT_AS, limits.address_space_bytes);
    }

    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd < 0) fail(errno);
    if (::dup2(null_fd, STDIN_FILENO) < 0) fail(errno);
    if (::dup2(stdout_fd, STDOUT_FILENO) < 0) fail(errno);
    if (::dup2(stderr_fd, STDERR_FILENO) < 0) fail(errno);
    ::close(null_fd);

    if (::chdir(sandbox.root.c_str()) != 0) fail(errno);

    // Restore default dispositions the engine process may have changed.
    ::signal(SIGPIPE, SIG_DFL);
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    ::execve(argv[0], argv, envp);
    fail(errno);
    ::_exit(127);
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

Duration timeval_to_duration(const struct timeval& tv) {
    return std::chrono::seconds(tv.tv_sec) + std::chrono::microseconds(tv.tv_usec);
}

}  // anonymous namespace

ProcessRunner::ProcessRunner(RunnerOptions options, Logger& logger)
    : options_(options), logger_(logger) {
    if (options_.poll_interval <= milliseconds::zero()) {
        options_.poll_interval = milliseconds{1};
    }
}

Result<ExecutionResult> ProcessRunner::run(Sandbox& sandbox,
                                           const std::string& entry_file,
                                           milliseconds timeout,
                                           std::stop_token cancel,
                                           const OutputCallback& on_output) {
    if (sandbox.torn_down.load()) {
        return Error{ErrorKind::Internal, "Sandbox " + sandbox.id + " already torn down"};
    }
    if (!is_safe_relative_path(entry_file)) {
        return Error{ErrorKind::InvalidArgument, "Invalid entry file: '" + entry_file + "'"};
    }

    std::vector<std::string> args;
    args.push_back(sandbox.interpreter.string());
    args.insert(args.end(), sandbox.interpreter_args.begin(), sandbox.interpreter_args.end());
    args.push_back(entry_file);
    return supervise(sandbox, std::move(args), sandbox.limits, timeout, cancel, on_output);
}

Result<ExecutionResult> ProcessRunner::install_dependencies(Sandbox& sandbox,
                                                            milliseconds timeout,
                                                            std::stop_token cancel,
                                                            const OutputCallback& on_output) {
    if (sandbox.torn_down.load()) {
        return Error{ErrorKind::Internal, "Sandbox " + sandbox.id + " already torn down"};
    }
    if (!sandbox.needs_install()) {
        return Error{ErrorKind::InvalidArgument, "Sandbox " + sandbox.id + " has no dependencies to install"};
    }

    SandboxLimits limits = sandbox.limits;
    limits.allow_network = true;
    logger_.info("Sandbox " + sandbox.id + ": installing dependencies with " + sandbox.install_command.front());
    return supervise(sandbox, sandbox.install_command, limits, timeout, cancel, on_output);
}

Result<ExecutionResult> ProcessRunner::supervise(Sandbox& sandbox,
                                                 std::vector<std::string> args,
                                                 const SandboxLimits& limits,
                                                 milliseconds timeout,
                                                 std::stop_token cancel,
                                                 const OutputCallback& on_output) {
    // ── Prepare argv/envp before fork ────────
    const std::string program = args.front();
    std::vector<std::string> env = sandbox.env;
    auto argv = to_c_array(args);
    auto envp = to_c_array(env);

    Pipe out_pipe, err_pipe, exec_pipe;
    if (!out_pipe.open() || !err_pipe.open() || !exec_pipe.open()) {
        return Error{ErrorKind::Internal, std::string("pipe2: ") + std::strerror(errno)};
    }

    auto start = Clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorKind::Provision, std::string("fork: ") + std::strerror(errno)};
    }
    if (pid == 0) {
        exec_child(sandbox, limits, argv.data(), envp.data(),
                   out_pipe.write_end(), err_pipe.write_end(), exec_pipe.write_end());
    }

    // Both sides call setpgid so the group exists before either side uses it.
    ::setpgid(pid, pid);
    sandbox.process_group.store(pid);
    ChildGuard guard(pid, sandbox);

    out_pipe.close_write();
    err_pipe.close_write();
    exec_pipe.close_write();

    // The error pipe closes on a successful execve(); otherwise it carries errno.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe.read_end(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        return Error{ErrorKind::Provision,
                     "Cannot launch " + program + ": " + std::strerror(exec_errno)};
    }

    logger_.debug("Launched pid " + std::to_string(pid) + " in sandbox " + sandbox.id
                  + ": " + program + " " + args.back());

    ::fcntl(out_pipe.read_end(), F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe.read_end(), F_SETFL, O_NONBLOCK);

    OutputBuffer stdout_buf(options_.output_limit_bytes);
    OutputBuffer stderr_buf(options_.output_limit_bytes);
    std::vector<char> chunk(kReadChunk);

    // Reads whatever is available; closes the fd at EOF.
    auto pump = [&](Pipe& pipe, OutputBuffer& buffer, OutputStream stream) {
        while (pipe.read_end() >= 0) {
            ssize_t got = ::read(pipe.read_end(), chunk.data(), chunk.size());
            if (got > 0) {
                auto stored = buffer.append(std::string_view(chunk.data(), static_cast<size_t>(got)));
                if (!stored.empty() && on_output) on_output(stream, stored);
                continue;
            }
            if (got < 0 && errno == EINTR) continue;
            if (got == 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
                pipe.close_read();
            }
            return;
        }
    };

    auto poll_once = [&](milliseconds wait) {
        std::array<struct pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_pipe.read_end() >= 0) fds[count++] = {out_pipe.read_end(), POLLIN, 0};
        if (err_pipe.read_end() >= 0) fds[count++] = {err_pipe.read_end(), POLLIN, 0};
        int ready = ::poll(count > 0 ? fds.data() : nullptr, count, static_cast<int>(wait.count()));
        if (ready > 0) {
            pump(out_pipe, stdout_buf, OutputStream::Stdout);
            pump(err_pipe, stderr_buf, OutputStream::Stderr);
        }
    };

    // ── Supervision loop ─────────────────────
    const bool has_deadline = timeout > milliseconds::zero();
    const auto deadline = start + timeout;
    std::optional<RunOutcome> termination;
    Clock::time_point term_sent_at{};
    bool kill_sent = false;

    int status = 0;
    struct rusage usage{};

    while (true) {
        auto now = Clock::now();
        auto wait = options_.poll_interval;
        if (!termination && has_deadline) {
            wait = std::min(wait, std::max(milliseconds{0},
                std::chrono::duration_cast<milliseconds>(deadline - now)));
        }
        poll_once(wait);

        pid_t reaped = ::wait4(pid, &status, WNOHANG, &usage);
        if (reaped == pid) break;
        if (reaped < 0 && errno != EINTR) {
            return Error{ErrorKind::Internal, std::string("wait4: ") + std::strerror(errno)};
        }

        now = Clock::now();
        if (!termination) {
            if (cancel.stop_requested()) {
                termination = RunOutcome::Cancelled;
            } else if (has_deadline && now >= deadline) {
                termination = RunOutcome::TimedOut;
            }
            if (termination) {
                ::kill(-pid, SIGTERM);
                term_sent_at = now;
                logger_.info("Sandbox " + sandbox.id + ": SIGTERM sent to group "
                             + std::to_string(pid) + " (" + std::string(to_string(*termination)) + ")");
            }
        } else if (!kill_sent && now - term_sent_at >= options_.grace_period) {
            ::kill(-pid, SIGKILL);
            kill_sent = true;
            logger_.warn("Sandbox " + sandbox.id + ": grace period elapsed, SIGKILL sent to group "
                         + std::to_string(pid));
        }
    }
    guard.mark_reaped();

    // Leader is gone; nothing else in its group may outlive the run.
    ::kill(-pid, SIGKILL);

    auto drain_deadline = Clock::now() + kDrainLimit;
    while ((out_pipe.read_end() >= 0 || err_pipe.read_end() >= 0) && Clock::now() < drain_deadline) {
        poll_once(options_.poll_interval);
    }

    ExecutionResult result;
    result.wall_time = std::chrono::duration_cast<milliseconds>(Clock::now() - start);
    result.force_killed = kill_sent;
    result.usage.cpu_time = timeval_to_duration(usage.ru_utime) + timeval_to_duration(usage.ru_stime);
    result.usage.peak_memory_bytes = static_cast<uint64_t>(std::max(0L, usage.ru_maxrss)) * 1024;
    result.usage.samples = 1;

    if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }

    if (termination) {
        result.outcome = *termination;
    } else if (WIFEXITED(status)) {
        result.outcome = RunOutcome::Exited;
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.outcome = RunOutcome::Signaled;
    }

    result.stdout_truncated = stdout_buf.truncated();
    result.stderr_truncated = stderr_buf.truncated();
    result.stdout_text = stdout_buf.take();
    result.stderr_text = stderr_buf.take();

    logger_.debug("Sandbox " + sandbox.id + ": pid " + std::to_string(pid) + " "
                  + std::string(to_string(result.outcome))
                  + (result.exit_code ? " code=" + std::to_string(*result.exit_code) : "")
                  + (result.signal ? " signal=" + std::to_string(*result.signal) : "")
                  + " wall_ms=" + std::to_string(result.wall_time.count()));
    return result;
}

}  // namespace exec_engine
