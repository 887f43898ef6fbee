/**
 * @file thompson_strategy.cpp
 * @brief ThompsonStrategy: one posterior draw per feasible arm, arg-max wins.
 *
 * Beta(a, b) is drawn as X / (X + Y) with X ~ Gamma(a, 1), Y ~ Gamma(b, 1).
 */

#include "bandit/thompson_strategy.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>

namespace fleet_router {

ThompsonStrategy::ThompsonStrategy(double prior_alpha, double prior_beta, uint64_t seed)
    : prior_alpha_(prior_alpha)
    , prior_beta_(prior_beta)
    , engine_(make_engine(seed)) {}

double ThompsonStrategy::sample_beta(double alpha, double beta) {
    std::gamma_distribution<double> gamma_a(alpha, 1.0);
    std::gamma_distribution<double> gamma_b(beta, 1.0);
    double x = gamma_a(engine_);
    double y = gamma_b(engine_);
    double sum = x + y;
    return sum > 0.0 ? x / sum : 0.5;
}

Selection ThompsonStrategy::select(const std::vector<RunnerKey>& feasible,
                                   const BanditState& state,
                                   uint64_t /*total_pulls*/) {
    std::vector<RunnerKey> arms = feasible;
    std::sort(arms.begin(), arms.end());

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << "Thompson sampling (prior Beta(" << prior_alpha_ << ", " << prior_beta_ << ")):";

    Selection selection;
    double best = -std::numeric_limits<double>::infinity();
    double second = -std::numeric_limits<double>::infinity();
    bool all_unpulled = true;

    for (const auto& key : arms) {
        auto stats = stats_for(state, key);
        double alpha = prior_alpha_ + static_cast<double>(stats.successes);
        double beta = prior_beta_ + static_cast<double>(stats.failures);
        double sample = sample_beta(alpha, beta);
        if (stats.pulls > 0) all_unpulled = false;

        oss << "\n  " << key << ": Beta(" << alpha << ", " << beta << ") sample " << sample
            << " (success rate " << stats.success_rate() << ")";

        if (sample > best) {
            second = best;
            best = sample;
            selection.runner_key = key;
            selection.mean_reward = stats.mean_reward();
            selection.exploring = stats.pulls == 0;
        } else if (sample > second) {
            second = sample;
        }
    }

    selection.score = best;
    selection.confidence = all_unpulled ? 0.5 : margin_confidence(best, second, arms.size());
    selection.reasoning = oss.str();
    return selection;
}

}  // namespace fleet_router
