/**
 * @file process_runner.hpp
 * @brief Child process execution with separated streams and deadlines
 *
 * Spawns a program directly (no shell), feeds it an optional stdin payload,
 * captures stdout and stderr into separate buffers and enforces a wall-clock
 * deadline by killing the child. Used by the Docker CLI adapter for every
 * engine call.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sandcell {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Controls a single child process run
 */
struct ProcessOptions {
    std::string stdin_data;                             ///< Payload written to child stdin, then closed
    std::optional<std::chrono::milliseconds> timeout;   ///< Wall-clock deadline (none = wait forever)
    std::size_t max_output_bytes{0};                    ///< Per-stream capture cap (0 = unlimited)
};

/**
 * @struct ProcessResult
 * @brief Outcome of a child process run
 *
 * `exit_code` follows shell conventions: the exit status for a normal exit,
 * 128 + signal number when the child was killed by a signal.
 */
struct ProcessResult {
    int exit_code{-1};                      ///< Exit status (128 + signal if signaled)
    int term_signal{0};                     ///< Terminating signal, 0 if exited normally
    std::string stdout_output;              ///< Captured standard output
    std::string stderr_output;              ///< Captured standard error
    bool timed_out{false};                  ///< Child was killed at the deadline
    bool stdout_truncated{false};           ///< stdout exceeded max_output_bytes
    bool stderr_truncated{false};           ///< stderr exceeded max_output_bytes
    std::chrono::milliseconds duration{0};  ///< Wall-clock run time
};

/**
 * @brief Run a program and wait for it
 *
 * The program is resolved through `PATH` when `argv[0]` has no slash.
 * Output beyond the cap is drained and discarded so the child never blocks
 * on a full pipe.
 *
 * @param argv Program and arguments (argv[0] is the program)
 * @param options Stdin payload, deadline and capture cap
 * @return ProcessResult with exit status and captured streams
 *
 * @throws std::invalid_argument if argv is empty
 * @throws std::system_error if pipes cannot be created, fork fails, or the
 *         program cannot be executed
 */
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options = {});

} // namespace utils
} // namespace sandcell
