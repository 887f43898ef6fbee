/**
 * @file lifecycle_controller.cpp
 * @brief LifecycleController implementation.
 */

#include "lifecycle/lifecycle_controller.hpp"

namespace fleet_router {

namespace {
constexpr std::string_view kComponent = "lifecycle";
}

LifecycleController::LifecycleController(IComputeControl& compute,
                                         ILifecycleStore& store,
                                         Logger& logger,
                                         ClockFn clock,
                                         bool enabled)
    : compute_(compute)
    , store_(store)
    , logger_(logger)
    , clock_(std::move(clock))
    , enabled_(enabled) {}

LifecycleState LifecycleController::load() {
    auto loaded = store_.load();
    if (!loaded) {
        // Unreadable state counts as "nothing started".
        logger_.warn(kComponent, "lifecycle state unreadable, assuming nothing was started: "
                     + loaded.error().message);
        return LifecycleState{};
    }
    return *loaded;
}

void LifecycleController::save(const LifecycleState& state) {
    if (auto saved = store_.save(state); !saved) {
        logger_.error(kComponent, "lifecycle state not persisted: " + saved.error().message);
    }
}

CapacityResult LifecycleController::ensure_capacity() {
    if (!enabled_) {
        return {CapacityOutcome::Disabled, "lifecycle control disabled"};
    }

    auto state = load();
    if (state.auto_started) {
        if (state.shutdown_deadline) {
            state.shutdown_deadline.reset();
            save(state);
            logger_.info(kComponent, "capacity already started; pending shutdown cancelled");
        }
        return {CapacityOutcome::AlreadyStarted, "capacity already started by this service"};
    }

    logger_.info(kComponent, "fleet offline, starting on-demand capacity via "
                 + std::string{compute_.name()});
    auto started = compute_.start();
    if (!started) {
        logger_.error(kComponent, "capacity start failed: " + started.error().message);
        return {CapacityOutcome::Failed, started.error().message};
    }

    state.auto_started = true;
    state.started_at = clock_();
    state.shutdown_deadline.reset();
    save(state);
    logger_.info(kComponent, "on-demand capacity started: " + *started);
    return {CapacityOutcome::Started, *started};
}

bool LifecycleController::arm_idle_shutdown(std::chrono::seconds delay) {
    if (!enabled_) return false;

    auto state = load();
    if (!state.auto_started) return false;

    state.shutdown_deadline = clock_() + delay;
    save(state);
    logger_.debug(kComponent, "idle shutdown armed in " + std::to_string(delay.count()) + "s");
    return true;
}

StopResult LifecycleController::on_idle_timeout() {
    auto state = load();
    if (!state.auto_started) {
        if (state.shutdown_deadline) {
            state.shutdown_deadline.reset();
            save(state);
        }
        return {StopOutcome::NotAutoStarted,
                "capacity was not started by this service; leaving it alone"};
    }

    auto stopped = compute_.stop();
    if (!stopped) {
        logger_.error(kComponent, "idle shutdown failed, will retry on next tick: "
                      + stopped.error().message);
        return {StopOutcome::Failed, stopped.error().message};
    }

    save(LifecycleState{});
    logger_.info(kComponent, "idle on-demand capacity stopped: " + *stopped);
    return {StopOutcome::Stopped, *stopped};
}

StopResult LifecycleController::tick() {
    if (!enabled_) return {StopOutcome::NotDue, "lifecycle control disabled"};

    auto state = load();
    if (!state.shutdown_deadline) return {StopOutcome::NotDue, "no shutdown pending"};
    if (clock_() < *state.shutdown_deadline) return {StopOutcome::NotDue, "shutdown not yet due"};
    return on_idle_timeout();
}

LifecycleStatus LifecycleController::status() {
    LifecycleStatus status;
    status.enabled = enabled_;
    status.state = load();
    if (status.state.shutdown_deadline) {
        status.until_shutdown = std::chrono::duration_cast<std::chrono::seconds>(
            *status.state.shutdown_deadline - clock_());
    }
    return status;
}

}  // namespace fleet_router
