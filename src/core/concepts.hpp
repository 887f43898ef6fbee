/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for FleetRouter's pluggable edges.
 *
 * The engine and the façade consume strategies, state backends, probers,
 * compute controls and lifecycle stores through virtual interfaces; these concepts pin down the shape every concrete
 * implementation must have and are checked with static_assert next to each
 * implementation.
 */

#pragma once

#include "bandit/arm_statistics.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_router {

// Forward declarations
struct Selection;
struct ProbeResult;
struct LifecycleState;

// ─────────────────────────────────────────────
// SelectionStrategyLike
// ─────────────────────────────────────────────

/**
 * @concept SelectionStrategyLike
 * @brief Types that pick one arm from a non-empty feasible set.
 *
 * `total_pulls` is summed over every registered arm, not just `feasible`.
 */
template <typename T>
concept SelectionStrategyLike = requires(T strategy,
                                         const std::vector<RunnerKey>& feasible,
                                         const BanditState& state,
                                         uint64_t total_pulls) {
    { strategy.select(feasible, state, total_pulls) } -> std::same_as<Selection>;
    { strategy.name() } -> std::convertible_to<std::string_view>;
};

// ─────────────────────────────────────────────
// StateBackendLike
// ─────────────────────────────────────────────

/**
 * @concept StateBackendLike
 * @brief Types that load and persist the complete bandit state.
 */
template <typename T>
concept StateBackendLike = requires(T backend, const BanditState& state) {
    { backend.load() } -> std::same_as<Result<BanditState>>;
    { backend.save(state) } -> std::same_as<Result<void>>;
    { backend.name() } -> std::convertible_to<std::string_view>;
};

// ─────────────────────────────────────────────
// AvailabilityProberLike
// ─────────────────────────────────────────────

/**
 * @concept AvailabilityProberLike
 * @brief Types that can report which runners are currently online.
 *
 * A probe never throws; failure is expressed as an unknown result.
 */
template <typename T>
concept AvailabilityProberLike = requires(T prober) {
    { prober.probe() } -> std::same_as<ProbeResult>;
    { prober.name() } -> std::convertible_to<std::string_view>;
};

// ─────────────────────────────────────────────
// ComputeControlLike
// ─────────────────────────────────────────────

/**
 * @concept ComputeControlLike
 * @brief Types that can power on-demand capacity up and down.
 */
template <typename T>
concept ComputeControlLike = requires(T control) {
    { control.start() } -> std::same_as<Result<std::string>>;
    { control.stop() } -> std::same_as<Result<std::string>>;
};

// ─────────────────────────────────────────────
// LifecycleStoreLike
// ─────────────────────────────────────────────

/**
 * @concept LifecycleStoreLike
 * @brief Types that persist the lifecycle controller's state between calls.
 */
template <typename T>
concept LifecycleStoreLike = requires(T store, const LifecycleState& state) {
    { store.load() } -> std::same_as<Result<LifecycleState>>;
    { store.save(state) } -> std::same_as<Result<void>>;
};

}  // namespace fleet_router
