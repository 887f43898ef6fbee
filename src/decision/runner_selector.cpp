/**
 * @file runner_selector.cpp
 * @brief RunnerSelector implementation.
 *
 * select_runner():
 *   parse → solve → (infeasible? return none)
 *         → probe → intersect feasible with online (skipped when unknown)
 *         → (nothing online and probe known? start capacity, return solver's pick)
 *         → bandit select over the remaining candidates
 *         → re-arm idle shutdown
 */

#include "decision/runner_selector.hpp"

#include "bandit/ucb1_strategy.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace fleet_router {

namespace {

constexpr std::string_view kComponent = "selector";

template <typename Default, typename Base, typename... Args>
std::unique_ptr<Base> or_default(std::unique_ptr<Base> given, Args&&... args) {
    if (given) return given;
    return std::make_unique<Default>(std::forward<Args>(args)...);
}

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - since).count();
}

}  // anonymous namespace

RunnerSelector::RunnerSelector(Options opts)
    : ontology_(std::move(opts.ontology))
    , parser_(std::move(opts.parser))
    , logger_(or_default<NullSink>(std::move(opts.log_sink)), opts.log_level)
    , metrics_(or_default<NullSink>(std::move(opts.telemetry_sink)))
    , state_backend_(or_default<InMemoryStateBackend>(std::move(opts.state_backend)))
    , prober_(or_default<AssumeOnlineProber>(std::move(opts.prober), ontology_))
    , compute_(or_default<NullComputeControl>(std::move(opts.compute)))
    , lifecycle_store_(or_default<InMemoryLifecycleStore>(std::move(opts.lifecycle_store)))
    , engine_(*state_backend_,
              or_default<Ucb1Strategy>(std::move(opts.strategy)),
              ontology_,
              logger_)
    , lifecycle_(*compute_, *lifecycle_store_, logger_, std::move(opts.clock),
                 opts.lifecycle_enabled)
    , idle_shutdown_delay_(opts.idle_shutdown_delay) {
    logger_.info(kComponent, "runner selector ready: " + std::to_string(ontology_.size())
                 + " runners, algorithm " + std::string{engine_.algorithm()}
                 + ", state " + std::string{engine_.backend_name()}
                 + ", availability " + std::string{prober_->name()});
}

// ─────────────────────────────────────────────
// select_runner
// ─────────────────────────────────────────────

SelectionResult RunnerSelector::select_runner(const JobDeclaration& job) {
    SelectionResult result;
    auto& explanation = result.explanation;
    explanation.job_name = job.name;
    explanation.algorithm = std::string{engine_.algorithm()};

    auto solve_start = std::chrono::steady_clock::now();
    auto requirement = parser_.parse(job);
    auto feasibility = solver_.solve(requirement, ontology_);
    explanation.solve_time_ms = elapsed_ms(solve_start);
    explanation.symbolic_reasoning = feasibility.summary;
    explanation.feasible_runners = feasibility.runner_keys();

    auto finish = [&]() -> SelectionResult {
        metrics_.record_selection(SelectionEvent{
            .job_name = job.name,
            .runner = result.runner,
            .feasible_count = explanation.feasible_runners.size(),
            .confidence = explanation.confidence,
            .algorithm = explanation.algorithm,
            .solve_time_ms = explanation.solve_time_ms,
            .capacity_started = explanation.capacity_started,
            .degraded = explanation.degraded(),
        });
        return result;
    };

    // ── Infeasible ───────────────────────────
    if (feasibility.empty()) {
        explanation.statistical_reasoning = "No runner satisfies the job's requirements.";
        logger_.warn(kComponent, "no feasible runner for job '" + job.name + "'");
        return finish();
    }

    // ── Availability ─────────────────────────
    auto probe = prober_->probe();
    std::vector<RunnerKey> candidates;
    if (!probe.known()) {
        explanation.degraded_notes.push_back(
            "availability unknown (" + probe.detail + "); considering every feasible runner");
        logger_.warn(kComponent, "availability probe failed: " + probe.detail);
        candidates = explanation.feasible_runners;
    } else {
        for (const auto& key : explanation.feasible_runners) {
            if (probe.is_online(key)) candidates.push_back(key);
        }
    }

    // ── Whole feasible fleet offline ─────────
    if (candidates.empty()) {
        auto capacity = lifecycle_.ensure_capacity();
        note_capacity(capacity, explanation);

        const RankedRunner* pick = &feasibility.ranked.front();
        for (const auto& ranked : feasibility.ranked) {
            const auto* profile = ontology_.find(ranked.runner_key);
            if (profile && profile->on_demand) {
                pick = &ranked;
                break;
            }
        }
        result.runner = pick->runner_key;
        explanation.selected_runner = pick->runner_key;
        explanation.confidence = 0.0;

        std::ostringstream oss;
        oss << "All " << feasibility.size() << " feasible runner(s) are offline; "
            << "capacity start " << to_string(capacity.outcome) << ". "
            << "Recommending " << pick->runner_key
            << " without statistical evidence.";
        explanation.statistical_reasoning = oss.str();
        logger_.warn(kComponent, "fleet offline for job '" + job.name + "', recommending "
                     + pick->runner_key);
        arm_after_activity();
        return finish();
    }

    // ── Bandit ───────────────────────────────
    auto selection = engine_.select(candidates);
    if (engine_.last_state_error()) {
        explanation.degraded_notes.push_back("learning state unavailable ("
                                             + *engine_.last_state_error()
                                             + "); selected from an empty state");
    }

    if (!selection) {
        // Only reachable when no candidate is registered, which the solver rules out.
        result.runner = feasibility.best_runner();
        explanation.selected_runner = result.runner;
        explanation.statistical_reasoning = "No candidate known to the learning engine; "
                                            "falling back to the solver's ranking.";
    } else {
        result.runner = selection->runner_key;
        explanation.selected_runner = selection->runner_key;
        explanation.confidence = selection->confidence;
        explanation.statistical_reasoning = selection->reasoning;
        if (candidates.size() < explanation.feasible_runners.size()) {
            explanation.statistical_reasoning +=
                "\n(" + std::to_string(explanation.feasible_runners.size() - candidates.size())
                + " feasible runner(s) offline and excluded)";
        }
    }

    logger_.info(kComponent, "job '" + job.name + "' -> " + result.runner.value_or("none"));
    arm_after_activity();
    return finish();
}

void RunnerSelector::note_capacity(const CapacityResult& capacity, Explanation& explanation) {
    explanation.capacity_started = capacity.outcome == CapacityOutcome::Started;
    metrics_.record_capacity_event("start", to_string(capacity.outcome), capacity.detail);

    switch (capacity.outcome) {
        case CapacityOutcome::Started:
        case CapacityOutcome::AlreadyStarted:
            break;
        case CapacityOutcome::Failed:
            explanation.degraded_notes.push_back("capacity start failed: " + capacity.detail);
            break;
        case CapacityOutcome::Disabled:
            explanation.degraded_notes.push_back("fleet offline and lifecycle control disabled");
            break;
    }
}

void RunnerSelector::arm_after_activity() {
    lifecycle_.arm_idle_shutdown(idle_shutdown_delay_);
}

// ─────────────────────────────────────────────
// Feedback
// ─────────────────────────────────────────────

Result<UpdateOutcome> RunnerSelector::report_outcome(const RunnerKey& runner_key, bool success,
                                                     double duration_seconds,
                                                     double cost_per_minute) {
    auto outcome = engine_.update(runner_key, success, duration_seconds, cost_per_minute);
    if (!outcome) {
        logger_.warn(kComponent, "outcome rejected: " + outcome.error().message);
        return outcome;
    }
    metrics_.record_outcome(runner_key, success, duration_seconds,
                            outcome->reward, outcome->persisted);
    arm_after_activity();
    return outcome;
}

Result<UpdateOutcome> RunnerSelector::report_outcome(const RunnerKey& runner_key, bool success,
                                                     double duration_seconds) {
    const auto* profile = ontology_.find(runner_key);
    if (!profile) {
        return Error{ErrorCode::UnknownRunner, "observation for unknown runner: " + runner_key};
    }
    return report_outcome(runner_key, success, duration_seconds, profile->cost_per_minute);
}

IngestOutcome RunnerSelector::ingest(const CompletionEvent& event) {
    auto status = to_lower(event.status);
    if (status != "success" && status != "failed") {
        return {IngestStatus::IgnoredStatus, "status '" + event.status + "' is not final", {}};
    }

    const auto* profile = ontology_.find(event.runner);
    if (!profile) {
        logger_.debug(kComponent, "ignoring completion from unregistered runner " + event.runner);
        return {IngestStatus::IgnoredUnknownRunner, "unknown runner: " + event.runner, {}};
    }

    auto cost = event.cost_per_minute.value_or(profile->cost_per_minute);
    auto outcome = report_outcome(event.runner, status == "success", event.duration_seconds, cost);
    if (!outcome) {
        return {IngestStatus::Rejected, outcome.error().message, {}};
    }
    return {IngestStatus::Recorded, outcome->persisted ? "recorded" : "recorded, not persisted",
            outcome->reward};
}

// ─────────────────────────────────────────────
// Administration
// ─────────────────────────────────────────────

StatsSnapshot RunnerSelector::get_stats() {
    return engine_.stats();
}

Result<void> RunnerSelector::reset() {
    return engine_.reset();
}

StopResult RunnerSelector::tick() {
    auto result = lifecycle_.tick();
    if (result.outcome != StopOutcome::NotDue) {
        metrics_.record_capacity_event("stop", to_string(result.outcome), result.detail);
    }
    return result;
}

LifecycleStatus RunnerSelector::lifecycle_status() {
    return lifecycle_.status();
}

}  // namespace fleet_router
