/**
 * @file constraint_solver.hpp
 * @brief Feasibility filtering and preference ranking of runners.
 *
 * A runner is feasible iff the job's required capabilities are a subset of
 * the runner's closed capability set. Feasible runners are ranked by
 * preference score (desc), cost per minute (asc) and runner key (asc), so the
 * result is fully deterministic for a given ontology and requirement.
 */

#pragma once

#include "core/types.hpp"
#include "ontology/capability_ontology.hpp"
#include "parser/job_parser.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fleet_router {

struct RankedRunner {
    RunnerKey runner_key;
    double preference_score{0.0};
    double cost_per_minute{0.0};
};

struct FeasibilityResult {
    std::vector<RankedRunner> ranked;            ///< best first; may be empty
    std::map<RunnerKey, std::string> pruned;     ///< runner → "missing: gpu, linux"
    std::string summary;

    [[nodiscard]] bool empty() const noexcept { return ranked.empty(); }
    [[nodiscard]] size_t size() const noexcept { return ranked.size(); }
    [[nodiscard]] std::vector<RunnerKey> runner_keys() const;
    [[nodiscard]] double best_score() const noexcept;
    [[nodiscard]] std::optional<RunnerKey> best_runner() const;
    [[nodiscard]] bool contains(const RunnerKey& key) const;
};

class ConstraintSolver {
public:
    [[nodiscard]] FeasibilityResult solve(const JobRequirement& requirement,
                                          const CapabilityOntology& ontology) const;

    /// Human-readable account of a result; also stored in FeasibilityResult::summary.
    [[nodiscard]] static std::string explain(const JobRequirement& requirement,
                                             const FeasibilityResult& result);
};

}  // namespace fleet_router
