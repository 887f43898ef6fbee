/**
 * @file command_runner.hpp
 * @brief Run an external command with a deadline and captured output.
 *
 * Fleet status commands, cloud start/stop commands and remote state
 * fetch/store commands all go through run_command(). The command is executed
 * directly (execvp, no shell), in its own process group so a timeout kills
 * the whole tree.
 */

#pragma once

#include "core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fleet_router {

struct CommandSpec {
    std::vector<std::string> argv;       ///< argv[0] is looked up on PATH
    std::string stdin_data;              ///< written to the child's stdin, then closed
    uint32_t timeout_ms = 10000;
    size_t max_output_bytes = 4 * 1024 * 1024;
};

struct CommandResult {
    int exit_code{-1};                   ///< 124 on timeout, 128+N when killed by signal N
    bool timed_out{false};
    bool stdout_truncated{false};
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool ok() const noexcept { return !timed_out && exit_code == 0; }
};

/**
 * @brief Execute a command and wait for it, bounded by spec.timeout_ms.
 *
 * Returns an error only when the process could not be spawned; a non-zero
 * exit status or timeout is reported through CommandResult.
 */
[[nodiscard]] Result<CommandResult> run_command(const CommandSpec& spec);

/// Render argv for log messages.
[[nodiscard]] std::string describe_command(const std::vector<std::string>& argv);

}  // namespace fleet_router
