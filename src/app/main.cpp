/**
 * @file main.cpp
 * @brief FleetRouter command-line entry point.
 *
 * Wires all modules into the selection pipeline:
 *   Config → Logger → Ontology/Parser → Solver → Prober → Lifecycle → Bandit → Telemetry
 *
 * Each invocation is one short-lived request: state lives in the configured
 * state backend and lifecycle store, not in this process.
 */

#include "availability/prober.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "decision/assembly.hpp"
#include "decision/runner_selector.hpp"
#include "lifecycle/compute_control.hpp"
#include "parser/job_parser.hpp"
#include "telemetry/json_sink.hpp"

#include <toml++/toml.hpp>

#include <charconv>
#include <cmath>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace fleet_router;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitNoRunner = 3;

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string command;
    std::filesystem::path job_file;
    std::string job_name;
    std::vector<std::string> tags;
    std::string image;
    std::vector<std::string> services;
    bool json = false;
    std::string runner;
    std::optional<bool> success;
    std::optional<double> duration;
    std::optional<double> cost;
    std::filesystem::path events_file;
    uint32_t interval_seconds = 30;
    std::string log_level;
    std::string error;
};

void print_usage() {
    std::cout
        << "Usage: fleet_router [--config <path>] [--log-level <level>] <command> [options]\n"
        << "\n"
        << "Commands:\n"
        << "  select --job <jobs.toml> [--name <job>] [--json]\n"
        << "  select --tags a,b [--image <image>] [--services s1,s2] [--json]\n"
        << "  report --runner <key> --success|--failure --duration <s> [--cost <per-min>]\n"
        << "  ingest --events <events.toml>\n"
        << "  stats                     Show learned statistics per runner\n"
        << "  reset                     Forget all learned statistics\n"
        << "  tick                      Stop idle on-demand capacity if its deadline passed\n"
        << "  watch [--interval <s>]    Run tick periodically until interrupted\n"
        << "  fleet                     List registered runners and closed capabilities\n"
        << "  status                    Show lifecycle state\n"
        << "  demo                      Walk through a simulated fleet\n";
}

std::vector<std::string> split_csv(const std::string& text) {
    std::vector<std::string> out;
    std::string item;
    for (char c : text) {
        if (c == ',') {
            if (!item.empty()) out.push_back(item);
            item.clear();
        } else if (c != ' ') {
            item += c;
        }
    }
    if (!item.empty()) out.push_back(item);
    return out;
}

std::optional<double> parse_number(const std::string& text) {
    double value = 0.0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    auto need_value = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            args.error = flag + " requires a value";
            return std::nullopt;
        }
        return std::string{argv[++i]};
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(kExitOk);
        } else if (arg == "--config") {
            if (auto v = need_value(i, arg)) args.config_path = *v;
        } else if (arg == "--log-level") {
            if (auto v = need_value(i, arg)) args.log_level = *v;
        } else if (arg == "--job") {
            if (auto v = need_value(i, arg)) args.job_file = *v;
        } else if (arg == "--name") {
            if (auto v = need_value(i, arg)) args.job_name = *v;
        } else if (arg == "--tags") {
            if (auto v = need_value(i, arg)) args.tags = split_csv(*v);
        } else if (arg == "--image") {
            if (auto v = need_value(i, arg)) args.image = *v;
        } else if (arg == "--services") {
            if (auto v = need_value(i, arg)) args.services = split_csv(*v);
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "--runner") {
            if (auto v = need_value(i, arg)) args.runner = *v;
        } else if (arg == "--success") {
            args.success = true;
        } else if (arg == "--failure") {
            args.success = false;
        } else if (arg == "--duration" || arg == "--cost" || arg == "--interval") {
            auto v = need_value(i, arg);
            if (!v) break;
            auto number = parse_number(*v);
            if (!number || *number < 0.0) {
                args.error = arg + " expects a non-negative number, got '" + *v + "'";
            } else if (arg == "--duration") {
                args.duration = number;
            } else if (arg == "--cost") {
                args.cost = number;
            } else if (*number > 86400.0) {
                args.error = "--interval expects at most 86400 seconds, got '" + *v + "'";
            } else {
                args.interval_seconds = static_cast<uint32_t>(*number);
            }
        } else if (arg == "--events") {
            if (auto v = need_value(i, arg)) args.events_file = *v;
        } else if (!arg.empty() && arg.front() != '-' && args.command.empty()) {
            args.command = arg;
        } else {
            args.error = "unknown argument: " + arg;
        }
    }
    return args;
}

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

int print_selection(const SelectionResult& result, bool json) {
    if (json) {
        std::cout << result.explanation.to_json() << std::endl;
    } else {
        std::cout << result.explanation.to_string() << std::endl;
    }
    return result.runner ? kExitOk : kExitNoRunner;
}

int cmd_select(RunnerSelector& selector, const CLIArgs& args) {
    std::vector<JobDeclaration> jobs;
    if (!args.job_file.empty()) {
        auto loaded = load_job_declarations(args.job_file);
        if (!loaded) {
            std::cerr << "Cannot load jobs: " << loaded.error().message << std::endl;
            return kExitError;
        }
        for (auto& job : *loaded) {
            if (args.job_name.empty() || job.name == args.job_name) jobs.push_back(job);
        }
        if (jobs.empty()) {
            std::cerr << "No job named '" << args.job_name << "' in " << args.job_file << std::endl;
            return kExitError;
        }
    } else if (!args.tags.empty() || !args.image.empty() || !args.services.empty()) {
        JobDeclaration job;
        job.name = args.job_name.empty() ? "adhoc" : args.job_name;
        job.tags = args.tags;
        job.image = args.image;
        job.services = args.services;
        jobs.push_back(std::move(job));
    } else {
        std::cerr << "select needs --job <file> or --tags/--image/--services" << std::endl;
        return kExitUsage;
    }

    int exit_code = kExitOk;
    for (const auto& job : jobs) {
        auto code = print_selection(selector.select_runner(job), args.json);
        if (code != kExitOk) exit_code = code;
    }
    return exit_code;
}

int cmd_report(RunnerSelector& selector, const CLIArgs& args) {
    if (args.runner.empty() || !args.success || !args.duration) {
        std::cerr << "report needs --runner, --success|--failure and --duration" << std::endl;
        return kExitUsage;
    }
    auto outcome = args.cost
        ? selector.report_outcome(args.runner, *args.success, *args.duration, *args.cost)
        : selector.report_outcome(args.runner, *args.success, *args.duration);
    if (!outcome) {
        std::cerr << "Report rejected (" << to_string(outcome.error().code) << "): "
                  << outcome.error().message << std::endl;
        return kExitError;
    }
    std::cout << std::fixed << std::setprecision(4)
              << "Recorded " << (*args.success ? "success" : "failure")
              << " for " << args.runner << ": reward " << outcome->reward
              << ", pulls " << outcome->pulls
              << (outcome->persisted ? "" : " (NOT persisted)") << std::endl;
    return outcome->persisted ? kExitOk : kExitError;
}

int cmd_ingest(RunnerSelector& selector, const CLIArgs& args) {
    if (args.events_file.empty()) {
        std::cerr << "ingest needs --events <file>" << std::endl;
        return kExitUsage;
    }

    std::vector<CompletionEvent> events;
    try {
        auto doc = toml::parse_file(args.events_file.string());
        if (auto list = doc["event"].as_array()) {
            for (const auto& node : *list) {
                const auto* entry = node.as_table();
                if (!entry) continue;
                CompletionEvent event;
                event.runner = (*entry)["runner"].value_or(std::string{});
                event.status = (*entry)["status"].value_or(std::string{});
                event.duration_seconds = (*entry)["duration"].value_or(0.0);
                if (auto cost = (*entry)["cost_per_minute"].value<double>()) {
                    event.cost_per_minute = *cost;
                }
                events.push_back(std::move(event));
            }
        }
    } catch (const toml::parse_error& err) {
        std::cerr << "Cannot parse events: " << err.description() << std::endl;
        return kExitError;
    }

    size_t recorded = 0;
    for (const auto& event : events) {
        auto outcome = selector.ingest(event);
        std::cout << event.runner << " [" << event.status << "]: "
                  << to_string(outcome.status) << " - " << outcome.detail << std::endl;
        if (outcome.status == IngestStatus::Recorded) ++recorded;
    }
    std::cout << recorded << " of " << events.size() << " event(s) recorded" << std::endl;
    return kExitOk;
}

int cmd_stats(RunnerSelector& selector) {
    auto stats = selector.get_stats();
    std::cout << "Algorithm: " << stats.algorithm
              << "   total pulls: " << stats.total_pulls << "\n";
    if (stats.state_error) {
        std::cout << "WARNING: state unavailable: " << *stats.state_error << "\n";
    }
    std::cout << std::left << std::setw(24) << "runner"
              << std::right << std::setw(8) << "pulls"
              << std::setw(8) << "ok" << std::setw(8) << "fail"
              << std::setw(12) << "mean" << std::setw(10) << "success"
              << std::setw(12) << "avg_dur_s" << "\n";
    std::cout << std::fixed;
    for (const auto& arm : stats.arms) {
        std::cout << std::left << std::setw(24) << arm.runner_key
                  << std::right << std::setw(8) << arm.pulls
                  << std::setw(8) << arm.successes << std::setw(8) << arm.failures
                  << std::setw(12) << std::setprecision(4) << arm.mean_reward
                  << std::setw(10) << std::setprecision(3) << arm.success_rate
                  << std::setw(12) << std::setprecision(1) << arm.avg_duration_seconds << "\n";
    }
    std::cout.flush();
    return kExitOk;
}

int cmd_fleet(const RunnerSelector& selector) {
    for (const auto& [key, profile] : selector.ontology().runners()) {
        std::cout << key << " (" << profile.display_name << ")"
                  << "  executor=" << to_string(profile.executor)
                  << "  cost/min=" << profile.cost_per_minute
                  << (profile.on_demand ? "  on-demand" : "") << "\n"
                  << "    declared:     " << join(profile.declared) << "\n"
                  << "    capabilities: " << join(profile.capabilities) << "\n";
    }
    std::cout.flush();
    return kExitOk;
}

void print_stop(const StopResult& result) {
    std::cout << "tick: " << to_string(result.outcome) << " - " << result.detail << std::endl;
}

int cmd_status(RunnerSelector& selector) {
    auto status = selector.lifecycle_status();
    auto epoch = [](Timestamp ts) {
        return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    };
    std::cout << "lifecycle control: " << (status.enabled ? "enabled" : "disabled") << "\n"
              << "auto_started:      " << (status.state.auto_started ? "yes" : "no") << "\n";
    if (status.state.started_at) {
        std::cout << "started_at:        " << epoch(*status.state.started_at) << "\n";
    }
    if (status.until_shutdown) {
        std::cout << "shutdown in:       " << status.until_shutdown->count() << "s\n";
    } else {
        std::cout << "shutdown:          not scheduled\n";
    }
    std::cout.flush();
    return kExitOk;
}

int cmd_watch(RunnerSelector& selector, const CLIArgs& args, Logger& logger) {
    auto interval = std::chrono::seconds{std::max<uint32_t>(args.interval_seconds, 1)};
    logger.info("cli", "watching idle shutdown every " + std::to_string(interval.count()) + "s");
    while (!g_shutdown_requested) {
        auto result = selector.tick();
        if (result.outcome != StopOutcome::NotDue) print_stop(result);

        auto wake = std::chrono::steady_clock::now() + interval;
        while (!g_shutdown_requested && std::chrono::steady_clock::now() < wake) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }
    logger.info("cli", "watch stopped");
    return kExitOk;
}

/**
 * @brief Run a scripted walk-through on a simulated fleet: learning, an
 *        offline fleet with capacity start, and idle shutdown.
 */
int run_demo(const CLIArgs& args) {
    Timestamp now = std::chrono::system_clock::now();

    auto prober = std::make_unique<MockProber>();
    auto compute = std::make_unique<MockComputeControl>();
    auto* prober_ptr = prober.get();
    auto* compute_ptr = compute.get();

    RunnerSelector::Options opts;
    const RunnerProfile fleet[] = {
        {.key = "mac-docker", .display_name = "Mac Docker Runner",
         .declared = {"docker", "macos"}, .cost_per_minute = 0.0,
         .executor = ExecutorClass::Container},
        {.key = "linux-docker", .display_name = "Linux Docker Runner",
         .declared = {"docker"}, .cost_per_minute = 0.0,
         .executor = ExecutorClass::Container},
        {.key = "gcp-shell", .display_name = "GCP Nordic Runner",
         .declared = {"shell", "nordic", "docker"}, .cost_per_minute = 0.02,
         .executor = ExecutorClass::VirtualMachine, .on_demand = true},
    };
    for (const auto& profile : fleet) {
        if (auto registered = opts.ontology.register_runner(profile); !registered) {
            std::cerr << "demo fleet: " << registered.error().message << std::endl;
            return kExitError;
        }
    }
    opts.prober = std::move(prober);
    opts.compute = std::move(compute);
    opts.log_sink = std::make_unique<StderrSink>();
    opts.log_level = parse_log_level(args.log_level).value_or(LogLevel::Warn);
    opts.clock = [&now] { return now; };
    opts.lifecycle_enabled = true;

    RunnerSelector selector(std::move(opts));
    JobDeclaration job{.name = "build", .tags = {"docker"}, .image = "ubuntu:22.04"};

    std::cout << "== Learning phase (all runners online) ==\n";
    prober_ptr->set_online({"mac-docker", "linux-docker", "gcp-shell"});
    const std::pair<const char*, double> durations[] = {
        {"mac-docker", 25.0}, {"linux-docker", 90.0}, {"gcp-shell", 40.0}};
    for (int round = 0; round < 6; ++round) {
        auto result = selector.select_runner(job);
        if (!result.runner) break;
        double duration = 60.0;
        for (const auto& [key, seconds] : durations) {
            if (*result.runner == key) duration = seconds;
        }
        auto outcome = selector.report_outcome(*result.runner, true, duration);
        std::cout << "round " << round + 1 << ": " << *result.runner
                  << " (reward " << (outcome ? outcome->reward : 0.0) << ")\n";
    }
    std::cout << selector.select_runner(job).explanation.to_string() << "\n";

    std::cout << "== Fleet offline ==\n";
    prober_ptr->set_all_offline({"mac-docker", "linux-docker", "gcp-shell"});
    auto offline = selector.select_runner(job);
    std::cout << offline.explanation.to_string()
              << "start calls: " << compute_ptr->start_calls() << "\n\n";

    std::cout << "== Idle shutdown ==\n";
    now += std::chrono::seconds{299};
    print_stop(selector.tick());
    now += std::chrono::seconds{2};
    print_stop(selector.tick());
    std::cout << "stop calls: " << compute_ptr->stop_calls() << std::endl;
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args.error.empty()) {
        std::cerr << args.error << "\n\n";
        print_usage();
        return kExitUsage;
    }
    if (args.command.empty()) {
        print_usage();
        return kExitUsage;
    }

    if (args.command == "demo") {
        return run_demo(args);
    }

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    // ── Assemble selector ────────────────────
    auto selector_result = build_selector(config);
    if (!selector_result) {
        std::cerr << "Invalid configuration: " << selector_result.error().message << std::endl;
        return kExitError;
    }
    auto selector = std::move(selector_result).value();
    auto& logger = selector->logger();
    logger.debug("cli", "command '" + args.command + "' with " + args.config_path.string());

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int exit_code = kExitUsage;
    if (args.command == "select") {
        exit_code = cmd_select(*selector, args);
    } else if (args.command == "report") {
        exit_code = cmd_report(*selector, args);
    } else if (args.command == "ingest") {
        exit_code = cmd_ingest(*selector, args);
    } else if (args.command == "stats") {
        exit_code = cmd_stats(*selector);
    } else if (args.command == "reset") {
        auto reset = selector->reset();
        if (reset) {
            std::cout << "Statistics reset." << std::endl;
            exit_code = kExitOk;
        } else {
            std::cerr << "Reset failed: " << reset.error().message << std::endl;
            exit_code = kExitError;
        }
    } else if (args.command == "tick") {
        print_stop(selector->tick());
        exit_code = kExitOk;
    } else if (args.command == "watch") {
        exit_code = cmd_watch(*selector, args, logger);
    } else if (args.command == "fleet") {
        exit_code = cmd_fleet(*selector);
    } else if (args.command == "status") {
        exit_code = cmd_status(*selector);
    } else {
        std::cerr << "Unknown command: " << args.command << "\n\n";
        print_usage();
    }

    selector->metrics().flush();
    logger.flush();
    return exit_code;
}
