/**
 * @file arm_statistics.cpp
 * @brief Reward function and state aggregates.
 */

#include "bandit/arm_statistics.hpp"

namespace fleet_router {

double compute_reward(bool success, double duration_seconds, double cost_per_minute) noexcept {
    if (!success) return 0.0;
    const double minutes = duration_seconds / 60.0;
    const double cost_penalty = cost_per_minute * minutes;
    return 1.0 / (minutes + cost_penalty + kRewardEpsilon);
}

uint64_t total_pulls(const BanditState& state) noexcept {
    uint64_t total = 0;
    for (const auto& [key, stats] : state) total += stats.pulls;
    return total;
}

}  // namespace fleet_router
