/**
 * @file epsilon_greedy_strategy.cpp
 * @brief EpsilonGreedyStrategy implementation.
 */

#include "bandit/epsilon_greedy_strategy.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>

namespace fleet_router {

EpsilonGreedyStrategy::EpsilonGreedyStrategy(double epsilon, uint64_t seed)
    : epsilon_(epsilon), engine_(make_engine(seed)) {}

Selection EpsilonGreedyStrategy::select(const std::vector<RunnerKey>& feasible,
                                        const BanditState& state,
                                        uint64_t /*total_pulls*/) {
    std::vector<RunnerKey> arms = feasible;
    std::sort(arms.begin(), arms.end());

    Selection selection;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(engine_) < epsilon_) {
        std::uniform_int_distribution<size_t> pick(0, arms.size() - 1);
        const auto& key = arms[pick(engine_)];
        auto stats = stats_for(state, key);
        selection.runner_key = key;
        selection.score = stats.mean_reward();
        selection.mean_reward = stats.mean_reward();
        selection.confidence = 0.5;
        selection.exploring = true;
        oss << "epsilon-greedy (epsilon=" << epsilon_ << "): random exploration picked "
            << key << " (mean " << stats.mean_reward() << ", pulls " << stats.pulls << ")";
        selection.reasoning = oss.str();
        return selection;
    }

    oss << "epsilon-greedy (epsilon=" << epsilon_ << "): exploiting best mean reward";
    double best = -std::numeric_limits<double>::infinity();
    double second = -std::numeric_limits<double>::infinity();
    bool all_unpulled = true;

    for (const auto& key : arms) {
        auto stats = stats_for(state, key);
        double mean = stats.mean_reward();
        if (stats.pulls > 0) all_unpulled = false;
        oss << "\n  " << key << ": mean " << mean << " (pulls " << stats.pulls << ")";

        if (mean > best) {
            second = best;
            best = mean;
            selection.runner_key = key;
        } else if (mean > second) {
            second = mean;
        }
    }

    selection.score = best;
    selection.mean_reward = best;
    selection.exploring = all_unpulled;
    selection.confidence = all_unpulled ? 0.5 : margin_confidence(best, second, arms.size());
    selection.reasoning = oss.str();
    return selection;
}

}  // namespace fleet_router
