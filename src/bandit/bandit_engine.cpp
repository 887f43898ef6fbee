/**
 * @file bandit_engine.cpp
 * @brief BanditEngine implementation: load → compute → save per call.
 */

#include "bandit/bandit_engine.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace fleet_router {

namespace {
constexpr std::string_view kComponent = "bandit";
}

BanditEngine::BanditEngine(IStateBackend& backend,
                           std::unique_ptr<ISelectionStrategy> strategy,
                           const CapabilityOntology& ontology,
                           Logger& logger)
    : backend_(backend)
    , strategy_(std::move(strategy))
    , ontology_(ontology)
    , logger_(logger) {}

BanditState BanditEngine::load_state() {
    auto loaded = backend_.load();
    if (!loaded) {
        last_state_error_ = loaded.error().message;
        logger_.warn(kComponent, "state load failed (" + std::string{backend_.name()}
                     + "), continuing with empty state: " + loaded.error().message);
        return BanditState{};
    }
    last_state_error_.reset();
    return std::move(loaded).value();
}

uint64_t BanditEngine::registered_pulls(const BanditState& state) const {
    uint64_t total = 0;
    for (const auto& [key, stats] : state) {
        if (ontology_.contains(key)) total += stats.pulls;
    }
    return total;
}

std::optional<Selection> BanditEngine::select(const std::vector<RunnerKey>& feasible) {
    std::vector<RunnerKey> arms;
    arms.reserve(feasible.size());
    for (const auto& key : feasible) {
        if (ontology_.contains(key)) {
            arms.push_back(key);
        } else {
            logger_.warn(kComponent, "ignoring unregistered candidate: " + key);
        }
    }
    if (arms.empty()) return std::nullopt;

    auto state = load_state();
    auto t = registered_pulls(state);
    auto selection = strategy_->select(arms, state, t);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << strategy_->name() << " selected " << selection.runner_key
        << " among " << arms.size() << " (score " << selection.score
        << ", confidence " << selection.confidence << ")";
    logger_.debug(kComponent, oss.str());
    return selection;
}

Result<UpdateOutcome> BanditEngine::update(const RunnerKey& runner_key, bool success,
                                           double duration_seconds, double cost_per_minute) {
    if (!ontology_.contains(runner_key)) {
        return Error{ErrorCode::UnknownRunner, "observation for unknown runner: " + runner_key};
    }
    if (!std::isfinite(duration_seconds) || duration_seconds < 0.0) {
        return Error{ErrorCode::InvalidArgument, "duration must be a non-negative number"};
    }
    if (!std::isfinite(cost_per_minute) || cost_per_minute < 0.0) {
        return Error{ErrorCode::InvalidArgument, "cost_per_minute must be a non-negative number"};
    }

    auto state = load_state();
    double reward = compute_reward(success, duration_seconds, cost_per_minute);
    auto& arm = state[runner_key];
    arm.record(success, duration_seconds, reward);

    UpdateOutcome outcome{.reward = reward, .pulls = arm.pulls, .persisted = false};

    auto saved = backend_.save(state);
    if (saved) {
        outcome.persisted = true;
    } else {
        logger_.error(kComponent, "state save failed, observation for " + runner_key
                      + " lost: " + saved.error().message);
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << runner_key << (success ? " success" : " failure")
        << " in " << duration_seconds << "s, reward " << reward
        << ", mean " << arm.mean_reward() << " over " << arm.pulls << " pulls";
    logger_.info(kComponent, oss.str());
    return outcome;
}

StatsSnapshot BanditEngine::stats() {
    auto state = load_state();

    StatsSnapshot snapshot;
    snapshot.algorithm = std::string{strategy_->name()};
    snapshot.total_pulls = registered_pulls(state);
    snapshot.state_error = last_state_error_;

    for (const auto& key : ontology_.runner_keys()) {
        auto stats = stats_for(state, key);
        snapshot.arms.push_back(ArmSummary{
            .runner_key = key,
            .pulls = stats.pulls,
            .successes = stats.successes,
            .failures = stats.failures,
            .total_reward = stats.total_reward,
            .mean_reward = stats.mean_reward(),
            .success_rate = stats.success_rate(),
            .avg_duration_seconds = stats.avg_duration_seconds(),
        });
    }
    return snapshot;
}

Result<void> BanditEngine::reset() {
    auto saved = backend_.save(BanditState{});
    if (!saved) {
        logger_.error(kComponent, "reset failed: " + saved.error().message);
        return saved.error();
    }
    logger_.info(kComponent, "all arm statistics cleared");
    return {};
}

}  // namespace fleet_router
