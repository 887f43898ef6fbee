/**
 * @file bandit_engine.hpp
 * @brief Multi-armed bandit engine: pick among feasible runners, learn from outcomes.
 *
 * The engine owns no statistics between calls. select(), update(), stats()
 * and reset() each load the state from the backend, work on the copy and,
 * where they mutate, save it back. A failed load degrades to an empty state
 * with a warning; a failed save loses that observation and is logged. Neither
 * reaches the caller as an error.
 */

#pragma once

#include "bandit/arm_statistics.hpp"
#include "bandit/selection_strategy.hpp"
#include "bandit/state_backend.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "ontology/capability_ontology.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_router {

struct UpdateOutcome {
    double reward{0.0};
    uint64_t pulls{0};          ///< pulls of the updated arm after this observation
    bool persisted{false};
};

struct ArmSummary {
    RunnerKey runner_key;
    uint64_t pulls{0};
    uint64_t successes{0};
    uint64_t failures{0};
    double total_reward{0.0};
    double mean_reward{0.0};
    double success_rate{0.5};
    double avg_duration_seconds{0.0};
};

struct StatsSnapshot {
    std::string algorithm;
    uint64_t total_pulls{0};
    std::vector<ArmSummary> arms;           ///< every registered runner, key order
    std::optional<std::string> state_error; ///< set when the backend could not be read
};

class BanditEngine {
public:
    BanditEngine(IStateBackend& backend,
                 std::unique_ptr<ISelectionStrategy> strategy,
                 const CapabilityOntology& ontology,
                 Logger& logger);

    /**
     * @brief Choose one runner among `feasible`.
     *
     * Empty `feasible` returns nullopt without touching the backend. Keys the
     * ontology does not know are ignored.
     */
    [[nodiscard]] std::optional<Selection> select(const std::vector<RunnerKey>& feasible);

    /**
     * @brief Fold one observation into the runner's arm and persist.
     *
     * Fails with UnknownRunner for keys absent from the ontology and with
     * InvalidArgument for negative or non-finite duration / cost.
     */
    Result<UpdateOutcome> update(const RunnerKey& runner_key, bool success,
                                 double duration_seconds, double cost_per_minute);

    [[nodiscard]] StatsSnapshot stats();

    /// Forget everything; a single save of the empty state.
    Result<void> reset();

    [[nodiscard]] std::string_view algorithm() const noexcept { return strategy_->name(); }
    [[nodiscard]] std::string_view backend_name() const noexcept { return backend_.name(); }

    /// Load error seen by the most recent operation, if any.
    [[nodiscard]] const std::optional<std::string>& last_state_error() const noexcept {
        return last_state_error_;
    }

private:
    BanditState load_state();
    uint64_t registered_pulls(const BanditState& state) const;

    IStateBackend& backend_;
    std::unique_ptr<ISelectionStrategy> strategy_;
    const CapabilityOntology& ontology_;
    Logger& logger_;
    std::optional<std::string> last_state_error_;
};

}  // namespace fleet_router
