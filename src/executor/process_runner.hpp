/**
 * @file process_runner.hpp
 * @brief Launches an entry file inside a sandbox and supervises it.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/sandbox.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace exec_engine {

enum class OutputStream : uint8_t {
    Stdout,
    Stderr
};

/**
 * @brief How a supervised run ended.
 */
enum class RunOutcome : uint8_t {
    Exited,     ///< Process exited on its own; exit_code is set
    Signaled,   ///< Killed by a signal we did not send
    TimedOut,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(RunOutcome outcome) noexcept {
    switch (outcome) {
        case RunOutcome::Exited:    return "exited";
        case RunOutcome::Signaled:  return "signaled";
        case RunOutcome::TimedOut:  return "timed_out";
        case RunOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

/// Receives each stored chunk as it is read. Called on the runner's thread.
using OutputCallback = std::function<void(OutputStream, std::string_view)>;

struct RunnerOptions {
    std::chrono::milliseconds grace_period{1000};
    uint64_t output_limit_bytes{1048576};
    std::chrono::milliseconds poll_interval{50};
};

struct ExecutionResult {
    RunOutcome outcome{RunOutcome::Exited};
    std::optional<int> exit_code;      ///< Only for RunOutcome::Exited
    std::optional<int> signal;         ///< Terminating signal, if any
    bool force_killed{false};          ///< SIGKILL sent after the grace period
    std::chrono::milliseconds wall_time{0};
    UsageSnapshot usage;               ///< From wait4() rusage of the entry process
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated{false};
    bool stderr_truncated{false};
};

/**
 * @brief Runs `<interpreter> <args...> <entry_file>`, or the dependency
 *        installer, in a sandbox.
 *
 * The child becomes leader of its own process group (published through
 * Sandbox::process_group) with stdin on /dev/null, the sandbox root as
 * working directory, the sandbox's reduced environment and rlimits, and,
 * when enabled, private network/IPC/UTS namespaces.
 *
 * run() blocks until the process group leader is reaped. On timeout or
 * cancellation the whole group gets SIGTERM, then SIGKILL after the grace
 * period. Stray group members are killed once the leader exits.
 */
class ProcessRunner {
public:
    ProcessRunner(RunnerOptions options, Logger& logger);

    /**
     * @param timeout zero or negative = no time limit
     * @return ErrorKind::Provision if the interpreter cannot be launched,
     *         ErrorKind::Internal for supervision failures.
     */
    Result<ExecutionResult> run(Sandbox& sandbox,
                                const std::string& entry_file,
                                std::chrono::milliseconds timeout,
                                std::stop_token cancel,
                                const OutputCallback& on_output = {});

    /**
     * @brief Run the sandbox's dependency installer in its root.
     *
     * Same supervision as run(), with network access allowed so packages
     * can be fetched. InvalidArgument if the sandbox has nothing to install.
     */
    Result<ExecutionResult> install_dependencies(Sandbox& sandbox,
                                                 std::chrono::milliseconds timeout,
                                                 std::stop_token cancel,
                                                 const OutputCallback& on_output = {});

    [[nodiscard]] const RunnerOptions& options() const noexcept { return options_; }

private:
    Result<ExecutionResult> supervise(Sandbox& sandbox,
                                      std::vector<std::string> args,
                                      const SandboxLimits& limits,
                                      std::chrono::milliseconds timeout,
                                      std::stop_token cancel,
                                      const OutputCallback& on_output);

    RunnerOptions options_;
    Logger& logger_;
};

}  // namespace exec_engine
