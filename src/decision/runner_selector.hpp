/**
 * @file runner_selector.hpp
 * @brief Top-level RunnerSelector facade: ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Selecting a runner for a job (parse → solve → probe → bandit)
 *   2. Reporting job outcomes back to the learning engine
 *   3. Driving the idle-shutdown timer of on-demand capacity
 *
 * Every collaborator is injected through Options so tests can substitute
 * MockProber / MockComputeControl / in-memory stores. Calls are synchronous
 * and sequential; the selector itself is not thread-safe.
 */

#pragma once

#include "availability/prober.hpp"
#include "bandit/bandit_engine.hpp"
#include "bandit/selection_strategy.hpp"
#include "bandit/state_backend.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "decision/explanation.hpp"
#include "lifecycle/compute_control.hpp"
#include "lifecycle/lifecycle_controller.hpp"
#include "lifecycle/lifecycle_store.hpp"
#include "ontology/capability_ontology.hpp"
#include "parser/job_parser.hpp"
#include "solver/constraint_solver.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace fleet_router {

struct SelectionResult {
    std::optional<RunnerKey> runner;
    Explanation explanation;
};

/**
 * @brief A job completion reported by the fleet's status feed.
 */
struct CompletionEvent {
    RunnerKey runner;
    std::string status;                         ///< "success" / "failed"; anything else is ignored
    double duration_seconds{0.0};
    std::optional<double> cost_per_minute;      ///< defaults to the runner profile's cost
};

enum class IngestStatus : uint8_t {
    Recorded,
    IgnoredStatus,
    IgnoredUnknownRunner,
    Rejected
};

[[nodiscard]] constexpr std::string_view to_string(IngestStatus status) noexcept {
    switch (status) {
        case IngestStatus::Recorded:             return "recorded";
        case IngestStatus::IgnoredStatus:        return "ignored_status";
        case IngestStatus::IgnoredUnknownRunner: return "ignored_unknown_runner";
        case IngestStatus::Rejected:             return "rejected";
    }
    return "unknown";
}

struct IngestOutcome {
    IngestStatus status{IngestStatus::Rejected};
    std::string detail;
    std::optional<double> reward;
};

class RunnerSelector {
public:
    struct Options {
        CapabilityOntology ontology;
        RequirementParser parser;
        std::unique_ptr<IStateBackend> state_backend;           ///< null → in-memory
        std::unique_ptr<ISelectionStrategy> strategy;           ///< null → UCB1 (c = 2)
        std::unique_ptr<IAvailabilityProber> prober;            ///< null → every runner online
        std::unique_ptr<IComputeControl> compute;               ///< null → start/stop always fail
        std::unique_ptr<ILifecycleStore> lifecycle_store;       ///< null → in-memory
        std::unique_ptr<ILogSink> log_sink;                     ///< null → discard
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> telemetry_sink;               ///< null → discard
        ClockFn clock = system_clock_fn();
        bool lifecycle_enabled = true;
        std::chrono::seconds idle_shutdown_delay{300};
    };

    explicit RunnerSelector(Options opts);

    // Non-copyable, non-movable
    RunnerSelector(const RunnerSelector&) = delete;
    RunnerSelector& operator=(const RunnerSelector&) = delete;

    // ── Decisions ────────────────────────────

    /**
     * @brief Pick a runner for `job`.
     *
     * An infeasible job yields no runner and an explanation with an empty
     * feasible list. A fleet reported entirely offline triggers a capacity
     * start and returns the solver's top choice (preferring on-demand
     * runners) with confidence 0.
     */
    SelectionResult select_runner(const JobDeclaration& job);

    // ── Feedback ─────────────────────────────

    Result<UpdateOutcome> report_outcome(const RunnerKey& runner_key, bool success,
                                         double duration_seconds, double cost_per_minute);

    /// Uses the registered profile's cost_per_minute.
    Result<UpdateOutcome> report_outcome(const RunnerKey& runner_key, bool success,
                                         double duration_seconds);

    /// Passive observation from the fleet status feed.
    IngestOutcome ingest(const CompletionEvent& event);

    // ── Administration ───────────────────────

    [[nodiscard]] StatsSnapshot get_stats();
    Result<void> reset();
    StopResult tick();
    [[nodiscard]] LifecycleStatus lifecycle_status();

    // ── Accessors (for testing) ─────────────
    [[nodiscard]] const CapabilityOntology& ontology() const noexcept { return ontology_; }
    [[nodiscard]] const RequirementParser& parser() const noexcept { return parser_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    BanditEngine& engine() { return engine_; }
    LifecycleController& lifecycle() { return lifecycle_; }

private:
    void note_capacity(const CapacityResult& capacity, Explanation& explanation);
    void arm_after_activity();

    CapabilityOntology ontology_;
    RequirementParser parser_;
    ConstraintSolver solver_;
    Logger logger_;
    MetricsCollector metrics_;

    std::unique_ptr<IStateBackend> state_backend_;
    std::unique_ptr<IAvailabilityProber> prober_;
    std::unique_ptr<IComputeControl> compute_;
    std::unique_ptr<ILifecycleStore> lifecycle_store_;

    BanditEngine engine_;
    LifecycleController lifecycle_;
    std::chrono::seconds idle_shutdown_delay_;
};

}  // namespace fleet_router
