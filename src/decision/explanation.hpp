/**
 * @file explanation.hpp
 * @brief Human- and machine-readable account of one selection decision.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fleet_router {

struct Explanation {
    std::string job_name;
    std::vector<RunnerKey> feasible_runners;    ///< solver order; empty when infeasible
    std::optional<RunnerKey> selected_runner;
    double confidence{0.0};
    std::string symbolic_reasoning;             ///< constraint solver account
    std::string statistical_reasoning;          ///< bandit / fallback account
    double solve_time_ms{0.0};
    std::string algorithm;
    bool capacity_started{false};
    std::vector<std::string> degraded_notes;    ///< probe unknown, start failure, state load failure

    [[nodiscard]] bool degraded() const noexcept { return !degraded_notes.empty(); }

    /// Multi-line report for terminals and logs.
    [[nodiscard]] std::string to_string() const;

    /// Single-line JSON object.
    [[nodiscard]] std::string to_json() const;
};

}  // namespace fleet_router
