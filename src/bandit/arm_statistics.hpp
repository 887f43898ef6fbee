/**
 * @file arm_statistics.hpp
 * @brief Per-runner learning statistics and the reward function.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>

namespace fleet_router {

/// Added to the reward denominator so an instant, free job has a finite reward.
inline constexpr double kRewardEpsilon = 0.1;

/**
 * @brief Statistics for one arm (runner).
 *
 * `pulls` and every accumulator only ever grow; reset() on the engine is the
 * only way back to zero.
 */
struct ArmStatistics {
    uint64_t pulls{0};
    double total_reward{0.0};
    uint64_t successes{0};
    uint64_t failures{0};
    double total_duration_seconds{0.0};

    [[nodiscard]] double mean_reward() const noexcept {
        return pulls > 0 ? total_reward / static_cast<double>(pulls) : 0.0;
    }

    [[nodiscard]] double success_rate() const noexcept {
        auto total = successes + failures;
        return total > 0 ? static_cast<double>(successes) / static_cast<double>(total) : 0.5;
    }

    [[nodiscard]] double avg_duration_seconds() const noexcept {
        return pulls > 0 ? total_duration_seconds / static_cast<double>(pulls) : 0.0;
    }

    void record(bool success, double duration_seconds, double reward) noexcept {
        ++pulls;
        total_reward += reward;
        total_duration_seconds += duration_seconds;
        if (success) {
            ++successes;
        } else {
            ++failures;
        }
    }

    bool operator==(const ArmStatistics&) const = default;
};

/// Complete learned state, keyed by runner.
using BanditState = std::map<RunnerKey, ArmStatistics>;

/**
 * @brief reward = success / (minutes + cost_per_minute × minutes + 0.1)
 *
 * Failures earn 0. Faster and cheaper successful runs earn more.
 */
[[nodiscard]] double compute_reward(bool success, double duration_seconds,
                                    double cost_per_minute) noexcept;

[[nodiscard]] uint64_t total_pulls(const BanditState& state) noexcept;

}  // namespace fleet_router
