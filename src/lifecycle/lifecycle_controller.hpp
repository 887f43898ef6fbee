/**
 * @file lifecycle_controller.hpp
 * @brief Starts on-demand capacity when the fleet is down and stops it after inactivity.
 *
 * The controller only ever stops capacity it started itself. The idle timer
 * is an explicit deadline in the lifecycle state: arming overwrites it, and
 * tick() fires on_idle_timeout() once it has passed. Failures of the compute
 * control are logged and reported in the returned outcome, never thrown.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "lifecycle/compute_control.hpp"
#include "lifecycle/lifecycle_store.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fleet_router {

enum class CapacityOutcome : uint8_t {
    Started,
    AlreadyStarted,     ///< pending shutdown cancelled, no start issued
    Failed,
    Disabled
};

enum class StopOutcome : uint8_t {
    NotDue,
    NotAutoStarted,     ///< deadline cleared, nothing stopped
    Stopped,
    Failed              ///< state and deadline kept; the next tick retries
};

[[nodiscard]] constexpr std::string_view to_string(CapacityOutcome outcome) noexcept {
    switch (outcome) {
        case CapacityOutcome::Started:        return "started";
        case CapacityOutcome::AlreadyStarted: return "already_started";
        case CapacityOutcome::Failed:         return "failed";
        case CapacityOutcome::Disabled:       return "disabled";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(StopOutcome outcome) noexcept {
    switch (outcome) {
        case StopOutcome::NotDue:         return "not_due";
        case StopOutcome::NotAutoStarted: return "not_auto_started";
        case StopOutcome::Stopped:        return "stopped";
        case StopOutcome::Failed:         return "failed";
    }
    return "unknown";
}

struct CapacityResult {
    CapacityOutcome outcome{CapacityOutcome::Disabled};
    std::string detail;

    [[nodiscard]] bool capacity_available() const noexcept {
        return outcome == CapacityOutcome::Started || outcome == CapacityOutcome::AlreadyStarted;
    }
};

struct StopResult {
    StopOutcome outcome{StopOutcome::NotDue};
    std::string detail;
};

struct LifecycleStatus {
    bool enabled{false};
    LifecycleState state;
    std::optional<std::chrono::seconds> until_shutdown;   ///< negative once overdue
};

class LifecycleController {
public:
    LifecycleController(IComputeControl& compute,
                        ILifecycleStore& store,
                        Logger& logger,
                        ClockFn clock = system_clock_fn(),
                        bool enabled = true);

    /// Start capacity unless this controller already did; cancels a pending shutdown.
    CapacityResult ensure_capacity();

    /**
     * @brief Replace the pending shutdown deadline with now + delay.
     *
     * Only capacity this controller started is ever scheduled for shutdown;
     * otherwise nothing is armed and false is returned.
     */
    bool arm_idle_shutdown(std::chrono::seconds delay);

    /// The idle timer fired: stop auto-started capacity and reset state.
    StopResult on_idle_timeout();

    /// Fire on_idle_timeout() if the deadline has passed.
    StopResult tick();

    [[nodiscard]] LifecycleStatus status();
    [[nodiscard]] bool enabled() const noexcept { return enabled_; }

private:
    LifecycleState load();
    void save(const LifecycleState& state);

    IComputeControl& compute_;
    ILifecycleStore& store_;
    Logger& logger_;
    ClockFn clock_;
    bool enabled_;
};

}  // namespace fleet_router
