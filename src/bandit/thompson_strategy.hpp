/**
 * @file thompson_strategy.hpp
 * @brief Thompson sampling over Beta(α₀ + successes, β₀ + failures) posteriors.
 */

#pragma once

#include "bandit/selection_strategy.hpp"
#include "core/concepts.hpp"

#include <random>

namespace fleet_router {

class ThompsonStrategy : public ISelectionStrategy {
public:
    ThompsonStrategy(double prior_alpha = 1.0, double prior_beta = 1.0, uint64_t seed = 0);

    Selection select(const std::vector<RunnerKey>& feasible,
                     const BanditState& state,
                     uint64_t total_pulls) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "thompson"; }

private:
    double sample_beta(double alpha, double beta);

    double prior_alpha_;
    double prior_beta_;
    std::mt19937_64 engine_;
};

static_assert(SelectionStrategyLike<ThompsonStrategy>);

}  // namespace fleet_router
