/**
 * @file selection_strategy.hpp
 * @brief Bandit selection strategy interface and factory.
 *
 * The engine holds exactly one strategy, chosen from configuration at
 * construction. Strategies are pure functions of (feasible arms, state,
 * total pulls) apart from their random engine.
 */

#pragma once

#include "bandit/arm_statistics.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_router {

/**
 * @brief Outcome of one strategy decision.
 */
struct Selection {
    RunnerKey runner_key;
    double score{0.0};          ///< UCB value, posterior sample or mean, per strategy
    double mean_reward{0.0};
    double confidence{0.0};     ///< [0, 1]
    bool exploring{false};      ///< chosen to gather information rather than exploit
    std::string reasoning;
};

/**
 * @brief Abstract interface for selection strategies (runtime polymorphism).
 */
class ISelectionStrategy {
public:
    virtual ~ISelectionStrategy() = default;

    /**
     * @param feasible     non-empty set of candidate arms
     * @param state        statistics for every known arm; missing arms count as unpulled
     * @param total_pulls  pulls summed over all registered arms
     */
    virtual Selection select(const std::vector<RunnerKey>& feasible,
                             const BanditState& state,
                             uint64_t total_pulls) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Random engine shared by the stochastic strategies; seed 0 draws from std::random_device.
[[nodiscard]] std::mt19937_64 make_engine(uint64_t seed);

/**
 * @brief Confidence from the margin between the best and runner-up scores.
 *
 * (best - second) / best, clamped to [0, 1]; a single candidate yields 1.
 */
[[nodiscard]] double margin_confidence(double best, double second, size_t candidates) noexcept;

/// Statistics for `key`, or a zero record when the arm has never been seen.
[[nodiscard]] ArmStatistics stats_for(const BanditState& state, const RunnerKey& key);

/**
 * @brief Build the strategy named by `config.algorithm`.
 */
[[nodiscard]] Result<std::unique_ptr<ISelectionStrategy>> create_strategy(const BanditConfig& config);

}  // namespace fleet_router
