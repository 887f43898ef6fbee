/**
 * @file compute_control.cpp
 * @brief Command-driven, null and mock compute controls.
 */

#include "lifecycle/compute_control.hpp"

#include "platform/command_runner.hpp"

namespace fleet_router {

// ── CommandComputeControl ────────────────────

CommandComputeControl::CommandComputeControl(std::vector<std::string> start_command,
                                             std::vector<std::string> stop_command,
                                             uint32_t timeout_ms)
    : start_command_(std::move(start_command))
    , stop_command_(std::move(stop_command))
    , timeout_ms_(timeout_ms) {}

Result<std::string> CommandComputeControl::start() {
    return invoke(start_command_, "start");
}

Result<std::string> CommandComputeControl::stop() {
    return invoke(stop_command_, "stop");
}

Result<std::string> CommandComputeControl::invoke(const std::vector<std::string>& command,
                                                  std::string_view action) {
    if (command.empty()) {
        return Error{ErrorCode::LifecycleControl,
                     "no " + std::string{action} + "_command configured"};
    }

    auto run = run_command(CommandSpec{.argv = command, .timeout_ms = timeout_ms_});
    if (!run) {
        return Error{ErrorCode::LifecycleControl,
                     std::string{action} + " command could not start: " + run.error().message};
    }
    if (run->timed_out) {
        return Error{ErrorCode::LifecycleControl,
                     std::string{action} + " command timed out: " + describe_command(command)};
    }
    if (run->exit_code != 0) {
        return Error{ErrorCode::LifecycleControl,
                     std::string{action} + " command exited " + std::to_string(run->exit_code)
                     + ": " + run->stderr_text};
    }
    return describe_command(command);
}

// ── NullComputeControl ───────────────────────

Result<std::string> NullComputeControl::start() {
    return Error{ErrorCode::LifecycleControl,
                 "no start_command configured; cannot start on-demand capacity"};
}

Result<std::string> NullComputeControl::stop() {
    return Error{ErrorCode::LifecycleControl,
                 "no stop_command configured; cannot stop on-demand capacity"};
}

// ── MockComputeControl ───────────────────────

Result<std::string> MockComputeControl::start() {
    ++start_calls_;
    if (start_fails_) {
        return Error{ErrorCode::LifecycleControl, "mock start failure"};
    }
    running_ = true;
    return std::string{"mock capacity started"};
}

Result<std::string> MockComputeControl::stop() {
    ++stop_calls_;
    if (stop_fails_) {
        return Error{ErrorCode::LifecycleControl, "mock stop failure"};
    }
    running_ = false;
    return std::string{"mock capacity stopped"};
}

}  // namespace fleet_router
