/**
 * @file selection_strategy.cpp
 * @brief Shared strategy helpers and create_strategy().
 */

#include "bandit/selection_strategy.hpp"

#include "bandit/epsilon_greedy_strategy.hpp"
#include "bandit/thompson_strategy.hpp"
#include "bandit/ucb1_strategy.hpp"

#include <algorithm>

namespace fleet_router {

std::mt19937_64 make_engine(uint64_t seed) {
    if (seed == 0) {
        std::random_device device;
        seed = (static_cast<uint64_t>(device()) << 32) ^ device();
    }
    return std::mt19937_64{seed};
}

double margin_confidence(double best, double second, size_t candidates) noexcept {
    if (candidates <= 1) return 1.0;
    if (best <= 0.0) return 0.0;
    return std::clamp((best - second) / best, 0.0, 1.0);
}

ArmStatistics stats_for(const BanditState& state, const RunnerKey& key) {
    auto it = state.find(key);
    return it != state.end() ? it->second : ArmStatistics{};
}

Result<std::unique_ptr<ISelectionStrategy>> create_strategy(const BanditConfig& config) {
    std::unique_ptr<ISelectionStrategy> strategy;
    if (config.algorithm == "ucb1") {
        strategy = std::make_unique<Ucb1Strategy>(config.exploration_constant);
    } else if (config.algorithm == "thompson") {
        strategy = std::make_unique<ThompsonStrategy>(
            config.prior_alpha, config.prior_beta, config.seed);
    } else if (config.algorithm == "epsilon_greedy") {
        strategy = std::make_unique<EpsilonGreedyStrategy>(config.epsilon, config.seed);
    } else {
        return Error{ErrorCode::Config, "unknown bandit algorithm: " + config.algorithm};
    }
    return Result<std::unique_ptr<ISelectionStrategy>>{std::move(strategy)};
}

}  // namespace fleet_router
