/**
 * @file ucb1_strategy.cpp
 * @brief Ucb1Strategy: unpulled arms first, then arg-max of mean + c·√(ln t / n).
 *
 * Algorithm:
 *   If any feasible arm has zero pulls:
 *     pick the first such arm in key order
 *   Else:
 *     ucb(arm) = mean(arm) + c * sqrt(ln(t) / pulls(arm))
 *     pick argmax(ucb), ties broken by the smaller key
 *
 * t is the pull count over every registered arm, not only the feasible ones.
 */

#include "bandit/ucb1_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace fleet_router {

Ucb1Strategy::Ucb1Strategy(double exploration_constant) : c_(exploration_constant) {}

Selection Ucb1Strategy::select(const std::vector<RunnerKey>& feasible,
                               const BanditState& state,
                               uint64_t total_pulls) {
    std::vector<RunnerKey> arms = feasible;
    std::sort(arms.begin(), arms.end());

    Selection selection;

    for (const auto& key : arms) {
        if (stats_for(state, key).pulls == 0) {
            selection.runner_key = key;
            selection.score = std::numeric_limits<double>::infinity();
            selection.mean_reward = 0.0;
            selection.confidence = 0.5;
            selection.exploring = true;
            selection.reasoning = "UCB1: " + key + " has never been tried; exploring it first";
            return selection;
        }
    }

    const double log_t = std::log(static_cast<double>(std::max<uint64_t>(total_pulls, 1)));

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << "UCB1 (c=" << c_ << ", t=" << total_pulls << "):";

    double best = -std::numeric_limits<double>::infinity();
    double second = -std::numeric_limits<double>::infinity();
    for (const auto& key : arms) {
        auto stats = stats_for(state, key);
        double mean = stats.mean_reward();
        double bonus = c_ * std::sqrt(log_t / static_cast<double>(stats.pulls));
        double ucb = mean + bonus;

        oss << "\n  " << key << ": mean " << mean << " + bonus " << bonus
            << " = " << ucb << " (pulls " << stats.pulls << ")";

        if (ucb > best) {
            second = best;
            best = ucb;
            selection.runner_key = key;
            selection.mean_reward = mean;
        } else if (ucb > second) {
            second = ucb;
        }
    }

    selection.score = best;
    selection.confidence = margin_confidence(best, second, arms.size());
    selection.reasoning = oss.str();
    return selection;
}

}  // namespace fleet_router
