/**
 * @file ucb1_strategy.hpp
 * @brief UCB1 selection: optimism in the face of uncertainty.
 */

#pragma once

#include "bandit/selection_strategy.hpp"
#include "core/concepts.hpp"

namespace fleet_router {

class Ucb1Strategy : public ISelectionStrategy {
public:
    explicit Ucb1Strategy(double exploration_constant = 2.0);

    Selection select(const std::vector<RunnerKey>& feasible,
                     const BanditState& state,
                     uint64_t total_pulls) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "ucb1"; }

    [[nodiscard]] double exploration_constant() const noexcept { return c_; }

private:
    double c_;
};

static_assert(SelectionStrategyLike<Ucb1Strategy>);

}  // namespace fleet_router
