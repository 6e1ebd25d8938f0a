/**
 * @file process_utils.hpp
 * @brief Subprocess execution with output capture and deadline enforcement
 *
 * Spawns a command with posix_spawnp in its own process group, collects
 * stdout and stderr through pipes, and races completion against a watchdog
 * timer. When the deadline passes first the whole process group receives
 * SIGKILL; whatever was captured up to that point is kept.
 *
 * **Timeout Race**:
 * ```
 * caller thread:   spawn -> poll(stdout, stderr) -> waitid(WNOWAIT) -> cancel timer -> reap
 * watchdog thread: wait_until(deadline) --fires--> killpg(SIGKILL) -> on_timeout()
 * ```
 * The child is observed with WNOWAIT and reaped only after the watchdog has
 * been joined, so the watchdog never signals a recycled pid.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief What to run and how long to let it run
 */
struct ProcessOptions {
    std::vector<std::string> argv;                   ///< argv[0] resolved through PATH
    std::optional<std::chrono::milliseconds> timeout; ///< No deadline when empty
    std::function<void()> on_timeout;                 ///< Runs on the watchdog after the kill
    std::size_t max_output_bytes{1024 * 1024};        ///< Per-stream capture cap
};

/**
 * @struct ProcessResult
 * @brief Outcome of one subprocess run
 */
struct ProcessResult {
    std::optional<int> exit_code;          ///< Empty when killed by the deadline
    int term_signal{0};                    ///< Terminating signal, 0 if exited normally
    bool timed_out{false};                 ///< Deadline fired before completion
    bool output_truncated{false};          ///< A stream exceeded max_output_bytes
    std::string stdout_output;             ///< Captured standard output
    std::string stderr_output;             ///< Captured standard error
    std::chrono::milliseconds duration{0}; ///< Wall-clock time from spawn to exit
};

/**
 * @brief Run a command to completion or deadline
 *
 * A child killed by a signal other than the deadline reports
 * exit_code = 128 + signal, the shell convention.
 *
 * @param options Command and limits
 * @return Captured result
 * @throws std::system_error if the command cannot be spawned (errno in code())
 * @throws std::invalid_argument if argv is empty
 */
ProcessResult RunProcess(const ProcessOptions& options);

} // namespace utils
} // namespace codebox
