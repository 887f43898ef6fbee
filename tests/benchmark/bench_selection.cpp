/**
 * @file bench_selection.cpp
 * @brief Performance benchmarks for parsing, solving, bandit selection and
 *        the end-to-end selection pipeline, plus a regret simulation of the
 *        three bandit strategies.
 *
 * Usage: ./bench_selection [--csv]
 */

#include "bandit/bandit_engine.hpp"
#include "bandit/epsilon_greedy_strategy.hpp"
#include "bandit/state_backend.hpp"
#include "bandit/thompson_strategy.hpp"
#include "bandit/ucb1_strategy.hpp"
#include "decision/runner_selector.hpp"
#include "parser/job_parser.hpp"
#include "solver/constraint_solver.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace fleet_router;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

const char* const kPlatforms[] = {"macos", "linux", "windows"};
const char* const kRegions[] = {"nordic", "eu-west", "us-east"};

CapabilityOntology make_fleet(size_t n) {
    CapabilityOntology ontology;
    for (size_t i = 0; i < n; ++i) {
        CapabilitySet caps{"docker", kPlatforms[i % 3], kRegions[(i / 3) % 3]};
        if (i % 4 == 0) caps.insert("gpu");
        auto key = "runner-" + std::to_string(i);
        if (!ontology.register_runner(key, caps, static_cast<double>(i % 5) * 0.01)) {
            std::cerr << "failed to register " << key << "\n";
        }
    }
    return ontology;
}

JobDeclaration make_job() {
    JobDeclaration job;
    job.name = "bench";
    job.tags = {"docker-any", "gpu"};
    job.image = "nvidia/cuda:12.2-runtime-ubuntu22.04";
    job.services = {"postgres:15"};
    job.timeout = "1h 30m";
    return job;
}

// ─────────────────────────────────────────────
// Benchmarks
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_symbolic() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;
    RequirementParser parser;
    auto job = make_job();
    R.push_back(run_bench("parse_job", "Symbolic", N,
        [&]{ auto r = parser.parse(job); (void)r; }));

    auto requirement = parser.parse(job);
    ConstraintSolver solver;
    for (size_t n : {10, 100, 1000}) {
        auto fleet = make_fleet(n);
        auto feasible = solver.solve(requirement, fleet).size();
        R.push_back(run_bench("solve_" + std::to_string(n) + "_runners", "Symbolic",
            n >= 1000 ? N / 10 : N,
            [&]{ auto r = solver.solve(requirement, fleet); (void)r; },
            std::to_string(feasible) + " feasible"));
    }

    R.push_back(run_bench("closure_register_100", "Symbolic", N / 10,
        [&]{ auto fleet = make_fleet(100); (void)fleet; }));
    return R;
}

std::vector<BenchResult> bench_bandit() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;
    Logger logger{std::make_unique<NullSink>()};

    for (size_t n : {10, 100}) {
        auto fleet = make_fleet(n);
        auto keys = fleet.runner_keys();

        std::vector<std::unique_ptr<ISelectionStrategy>> strategies;
        strategies.push_back(std::make_unique<Ucb1Strategy>(2.0));
        strategies.push_back(std::make_unique<ThompsonStrategy>(1.0, 1.0, 42));
        strategies.push_back(std::make_unique<EpsilonGreedyStrategy>(0.1, 42));

        for (auto& strategy : strategies) {
            auto label = std::string{strategy->name()};
            InMemoryStateBackend backend;
            BanditEngine engine(backend, std::move(strategy), fleet, logger);
            for (size_t i = 0; i < keys.size(); ++i) {
                auto updated = engine.update(keys[i], i % 3 != 0, 60.0 + double(i), 0.01);
                (void)updated;
            }
            R.push_back(run_bench(label + "_select_" + std::to_string(n), "Bandit", N,
                [&]{ auto s = engine.select(keys); (void)s; }));
            R.push_back(run_bench(label + "_update_" + std::to_string(n), "Bandit", N,
                [&]{ auto u = engine.update(keys.front(), true, 42.0, 0.0); (void)u; }));
        }
    }
    return R;
}

std::vector<BenchResult> bench_selector() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    for (size_t n : {10, 100}) {
        RunnerSelector::Options opts;
        opts.ontology = make_fleet(n);
        auto prober = std::make_unique<MockProber>();
        std::set<RunnerKey> online;
        for (const auto& key : opts.ontology.runner_keys()) online.insert(key);
        prober->set_online(online);
        opts.prober = std::move(prober);
        opts.compute = std::make_unique<MockComputeControl>();
        RunnerSelector selector(std::move(opts));

        auto job = make_job();
        R.push_back(run_bench("select_runner_" + std::to_string(n), "Selector", N,
            [&]{ auto r = selector.select_runner(job); (void)r; }));
        R.push_back(run_bench("select_and_report_" + std::to_string(n), "Selector", N, [&]{
            auto r = selector.select_runner(job);
            if (r.runner) {
                auto u = selector.report_outcome(*r.runner, true, 120.0);
                (void)u;
            }
        }));
    }
    return R;
}

/**
 * Simulated fleet: each runner succeeds with a fixed probability and takes a
 * fixed time. Regret is the expected-reward gap to the best runner, summed
 * over all rounds.
 */
std::vector<BenchResult> bench_regret() {
    struct Arm {
        RunnerKey key;
        double success_probability;
        double duration_seconds;
        double cost_per_minute;
    };
    const std::vector<Arm> arms{
        {"fast-flaky", 0.60, 60.0, 0.0},
        {"slow-solid", 0.98, 600.0, 0.0},
        {"balanced", 0.90, 120.0, 0.0},
        {"cloud", 0.99, 90.0, 0.05},
        {"legacy", 0.70, 900.0, 0.0},
    };

    auto expected_reward = [](const Arm& arm) {
        return arm.success_probability
            * compute_reward(true, arm.duration_seconds, arm.cost_per_minute);
    };
    double best = 0.0;
    for (const auto& arm : arms) best = std::max(best, expected_reward(arm));

    CapabilityOntology fleet;
    std::vector<RunnerKey> keys;
    for (const auto& arm : arms) {
        if (!fleet.register_runner(arm.key, {"docker"}, arm.cost_per_minute)) {
            std::cerr << "failed to register " << arm.key << "\n";
        }
        keys.push_back(arm.key);
    }

    std::vector<BenchResult> R;
    constexpr size_t kRounds = 2000;
    Logger logger{std::make_unique<NullSink>()};

    auto make = [](size_t which) -> std::unique_ptr<ISelectionStrategy> {
        switch (which) {
            case 0:  return std::make_unique<Ucb1Strategy>(2.0);
            case 1:  return std::make_unique<ThompsonStrategy>(1.0, 1.0, 7);
            default: return std::make_unique<EpsilonGreedyStrategy>(0.1, 7);
        }
    };

    for (size_t which = 0; which < 3; ++which) {
        double regret = 0.0;
        std::string label;
        auto result = run_bench("regret_" + std::to_string(kRounds) + "_rounds", "Regret", 3, [&]{
            InMemoryStateBackend backend;
            BanditEngine engine(backend, make(which), fleet, logger);
            label = std::string{engine.algorithm()};
            std::mt19937_64 rng(11);
            std::bernoulli_distribution coin;
            regret = 0.0;
            for (size_t round = 0; round < kRounds; ++round) {
                auto selection = engine.select(keys);
                if (!selection) break;
                const auto& arm = *std::find_if(arms.begin(), arms.end(),
                    [&](const Arm& a) { return a.key == selection->runner_key; });
                bool success = coin(rng, std::bernoulli_distribution::param_type{
                    arm.success_probability});
                auto updated = engine.update(arm.key, success, arm.duration_seconds,
                                             arm.cost_per_minute);
                (void)updated;
                regret += best - expected_reward(arm);
            }
        });
        result.name = label + "_" + result.name;
        std::ostringstream extra;
        extra << std::fixed << std::setprecision(2) << "regret " << regret
              << " (" << regret / static_cast<double>(kRounds) << "/round)";
        result.extra = extra.str();
        R.push_back(std::move(result));
    }
    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);
    if (!csv) {
        std::cout << "\n  FleetRouter Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };
    append(bench_symbolic());
    append(bench_bandit());
    append(bench_selector());
    append(bench_regret());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
