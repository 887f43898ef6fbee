/**
 * @file epsilon_greedy_strategy.hpp
 * @brief ε-greedy selection: explore uniformly with probability ε, else exploit.
 */

#pragma once

#include "bandit/selection_strategy.hpp"
#include "core/concepts.hpp"

#include <random>

namespace fleet_router {

class EpsilonGreedyStrategy : public ISelectionStrategy {
public:
    explicit EpsilonGreedyStrategy(double epsilon = 0.1, uint64_t seed = 0);

    Selection select(const std::vector<RunnerKey>& feasible,
                     const BanditState& state,
                     uint64_t total_pulls) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "epsilon_greedy"; }

    [[nodiscard]] double epsilon() const noexcept { return epsilon_; }

private:
    double epsilon_;
    std::mt19937_64 engine_;
};

static_assert(SelectionStrategyLike<EpsilonGreedyStrategy>);

}  // namespace fleet_router
