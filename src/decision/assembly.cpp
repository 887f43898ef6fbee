/**
 * @file assembly.cpp
 * @brief Configuration → RunnerSelector wiring.
 */

#include "decision/assembly.hpp"

#include "telemetry/json_sink.hpp"

namespace fleet_router {

RequirementParser make_parser(const Config& config) {
    RequirementParser parser;
    for (const auto& [tag, caps] : config.tag_mappings) {
        parser.add_tag_mapping(tag, caps);
    }
    return parser;
}

Result<void> load_fleet(const Config& config, const RequirementParser& parser,
                        CapabilityOntology& ontology) {
    for (const auto& [from, targets] : config.implications) {
        for (const auto& to : targets) ontology.add_implication(from, to);
    }

    for (const auto& runner : config.runners) {
        RunnerProfile profile;
        profile.key = runner.key;
        profile.display_name = runner.name;
        profile.tags = runner.tags;
        profile.cost_per_minute = runner.cost_per_minute;
        profile.executor = executor_class_from_string(to_lower(runner.executor));
        profile.on_demand = runner.on_demand;

        if (!runner.capabilities.empty()) {
            profile.declared.insert(runner.capabilities.begin(), runner.capabilities.end());
        } else {
            for (const auto& tag : runner.tags) {
                auto caps = parser.capabilities_for_tag(tag);
                if (caps.empty()) {
                    profile.declared.insert(to_lower(tag));
                } else {
                    profile.declared.merge(caps);
                }
            }
        }

        if (auto registered = ontology.register_runner(std::move(profile)); !registered) {
            return Error{ErrorCode::Config, registered.error().message};
        }
    }
    return {};
}

std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry) {
    if (telemetry.log_dir.empty()) return std::make_unique<StderrSink>();
    return std::make_unique<JsonFileSink>(telemetry.log_dir, "fleet_router",
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

Result<RunnerSelector::Options> build_selector_options(const Config& config) {
    RunnerSelector::Options opts;

    // ── Symbolic layer ───────────────────────
    opts.parser = make_parser(config);
    if (auto fleet = load_fleet(config, opts.parser, opts.ontology); !fleet) {
        return fleet.error();
    }

    // ── Learning layer ───────────────────────
    auto strategy = create_strategy(config.bandit);
    if (!strategy) return strategy.error();
    opts.strategy = std::move(strategy).value();

    const auto& state = config.state;
    if (state.backend == "file") {
        opts.state_backend = std::make_unique<FileStateBackend>(state.path, config.bandit.algorithm);
    } else if (state.backend == "command") {
        opts.state_backend = std::make_unique<CommandStateBackend>(
            state.fetch_command, state.store_command, state.timeout_ms, config.bandit.algorithm);
    } else {
        opts.state_backend = std::make_unique<InMemoryStateBackend>();
    }

    // ── Availability ─────────────────────────
    const auto& avail = config.availability;
    if (avail.source == "file") {
        opts.prober = std::make_unique<StatusFileProber>(
            avail.status_file, std::chrono::seconds{avail.max_age_seconds});
    } else if (avail.source == "command") {
        opts.prober = std::make_unique<CommandProber>(avail.command, avail.timeout_ms);
    }

    // ── Lifecycle ────────────────────────────
    const auto& life = config.lifecycle;
    if (!life.start_command.empty() || !life.stop_command.empty()) {
        opts.compute = std::make_unique<CommandComputeControl>(
            life.start_command, life.stop_command, life.timeout_ms);
    } else {
        opts.compute = std::make_unique<NullComputeControl>();
    }
    if (!life.state_path.empty()) {
        opts.lifecycle_store = std::make_unique<FileLifecycleStore>(life.state_path);
    } else {
        opts.lifecycle_store = std::make_unique<InMemoryLifecycleStore>();
    }
    opts.lifecycle_enabled = life.enabled;
    opts.idle_shutdown_delay = std::chrono::seconds{life.idle_shutdown_seconds};

    // ── Telemetry ────────────────────────────
    opts.log_sink = make_log_sink(config.telemetry);
    opts.log_level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    if (!config.telemetry.decision_log.empty()) {
        const auto& path = config.telemetry.decision_log;
        auto dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path{"."};
        opts.telemetry_sink = std::make_unique<JsonFileSink>(
            dir, path.stem().string(), config.telemetry.max_file_size_mb,
            config.telemetry.rotate_count);
    } else {
        opts.telemetry_sink = std::make_unique<NullSink>();
    }

    return Result<RunnerSelector::Options>{std::move(opts)};
}

Result<std::unique_ptr<RunnerSelector>> build_selector(const Config& config) {
    auto opts = build_selector_options(config);
    if (!opts) return opts.error();
    return Result<std::unique_ptr<RunnerSelector>>{
        std::make_unique<RunnerSelector>(std::move(opts).value())};
}

}  // namespace fleet_router
