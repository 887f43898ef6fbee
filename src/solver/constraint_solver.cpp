/**
 * @file constraint_solver.cpp
 * @brief ConstraintSolver: subset test, preference scoring and ranking.
 *
 * Complexity: O(R × (|required| + |preferred|) · log C + R log R) for R runners.
 */

#include "solver/constraint_solver.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace fleet_router {

std::vector<RunnerKey> FeasibilityResult::runner_keys() const {
    std::vector<RunnerKey> keys;
    keys.reserve(ranked.size());
    for (const auto& entry : ranked) keys.push_back(entry.runner_key);
    return keys;
}

double FeasibilityResult::best_score() const noexcept {
    return ranked.empty() ? 0.0 : ranked.front().preference_score;
}

std::optional<RunnerKey> FeasibilityResult::best_runner() const {
    if (ranked.empty()) return std::nullopt;
    return ranked.front().runner_key;
}

bool FeasibilityResult::contains(const RunnerKey& key) const {
    return std::any_of(ranked.begin(), ranked.end(),
                       [&](const RankedRunner& r) { return r.runner_key == key; });
}

FeasibilityResult ConstraintSolver::solve(const JobRequirement& requirement,
                                          const CapabilityOntology& ontology) const {
    FeasibilityResult result;

    for (const auto& [key, profile] : ontology.runners()) {
        CapabilitySet missing;
        for (const auto& cap : requirement.required) {
            if (!profile.capabilities.contains(cap)) missing.insert(cap);
        }
        if (!missing.empty()) {
            result.pruned[key] = "missing: " + join(missing);
            continue;
        }
        result.ranked.push_back(RankedRunner{
            .runner_key = key,
            .preference_score = requirement.preference_score(profile.capabilities),
            .cost_per_minute = profile.cost_per_minute,
        });
    }

    std::sort(result.ranked.begin(), result.ranked.end(),
              [](const RankedRunner& a, const RankedRunner& b) {
                  if (a.preference_score != b.preference_score) {
                      return a.preference_score > b.preference_score;
                  }
                  if (a.cost_per_minute != b.cost_per_minute) {
                      return a.cost_per_minute < b.cost_per_minute;
                  }
                  return a.runner_key < b.runner_key;
              });

    result.summary = explain(requirement, result);
    return result;
}

std::string ConstraintSolver::explain(const JobRequirement& requirement,
                                      const FeasibilityResult& result) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    oss << "Job requires: "
        << (requirement.required.empty() ? "(none)" : join(requirement.required)) << '\n';
    if (!requirement.preferred.empty()) {
        oss << "Job prefers: " << join(requirement.preferred) << '\n';
    }

    if (result.ranked.empty()) {
        oss << "No feasible runners.\n";
        for (const auto& [key, reason] : result.pruned) {
            oss << "  - " << key << ": " << reason << '\n';
        }
        return oss.str();
    }

    oss << "Feasible runners: " << result.ranked.size()
        << " (best score " << result.best_score() << ")\n";
    size_t shown = std::min<size_t>(3, result.ranked.size());
    for (size_t i = 0; i < shown; ++i) {
        const auto& entry = result.ranked[i];
        oss << "  " << (i + 1) << ". " << entry.runner_key
            << " (score: " << entry.preference_score
            << ", cost: " << entry.cost_per_minute << "/min)\n";
    }
    if (!result.pruned.empty()) {
        oss << "Pruned: " << result.pruned.size() << " runner(s)\n";
    }
    return oss.str();
}

}  // namespace fleet_router
