/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <optional>

namespace fleet_router {

namespace {

std::vector<std::string> string_array(toml::node_view<const toml::node> node) {
    std::vector<std::string> out;
    if (auto arr = node.as_array()) {
        for (const auto& element : *arr) {
            if (auto text = element.value<std::string>()) {
                out.push_back(*text);
            }
        }
    }
    return out;
}

std::map<std::string, std::vector<std::string>> string_array_map(
    toml::node_view<const toml::node> node) {
    std::map<std::string, std::vector<std::string>> out;
    if (auto tbl = node.as_table()) {
        for (const auto& [key, value] : *tbl) {
            out[std::string{key.str()}] = string_array(toml::node_view<const toml::node>{value});
        }
    }
    return out;
}

Result<void> validate(const Config& config) {
    const auto& algo = config.bandit.algorithm;
    if (algo != "ucb1" && algo != "thompson" && algo != "epsilon_greedy") {
        return Error{ErrorCode::Config, "unknown bandit algorithm: " + algo};
    }
    if (config.bandit.epsilon < 0.0 || config.bandit.epsilon > 1.0) {
        return Error{ErrorCode::Config, "bandit.epsilon must be within [0, 1]"};
    }
    if (config.bandit.prior_alpha <= 0.0 || config.bandit.prior_beta <= 0.0) {
        return Error{ErrorCode::Config, "bandit priors must be positive"};
    }

    const auto& backend = config.state.backend;
    if (backend != "memory" && backend != "file" && backend != "command") {
        return Error{ErrorCode::Config, "unknown state backend: " + backend};
    }
    if (backend == "command"
        && (config.state.fetch_command.empty() || config.state.store_command.empty())) {
        return Error{ErrorCode::Config,
                     "state backend 'command' needs fetch_command and store_command"};
    }

    const auto& source = config.availability.source;
    if (source != "none" && source != "file" && source != "command") {
        return Error{ErrorCode::Config, "unknown availability source: " + source};
    }
    if (source == "file" && config.availability.status_file.empty()) {
        return Error{ErrorCode::Config, "availability source 'file' needs status_file"};
    }
    if (source == "command" && config.availability.command.empty()) {
        return Error{ErrorCode::Config, "availability source 'command' needs command"};
    }

    // One-shot CLI calls would forget that they started capacity.
    if (config.lifecycle.enabled && config.lifecycle.state_path.empty()) {
        return Error{ErrorCode::Config, "lifecycle control needs lifecycle.state_path"};
    }

    for (const auto& runner : config.runners) {
        if (runner.key.empty()) {
            return Error{ErrorCode::Config, "[[runner]] entry without key"};
        }
        if (runner.cost_per_minute < 0.0) {
            return Error{ErrorCode::Config,
                         "runner '" + runner.key + "' has negative cost_per_minute"};
        }
    }
    return {};
}

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // Counts and durations must fit uint32_t; the first out-of-range key is reported.
    std::optional<Error> range_error;
    auto u32 = [&range_error](toml::node_view<const toml::node> node, std::string_view key,
                              int64_t fallback) -> uint32_t {
        auto value = node.value_or(fallback);
        if (value < 0 || value > int64_t{std::numeric_limits<uint32_t>::max()}) {
            if (!range_error) {
                range_error = Error{ErrorCode::Config,
                                    std::string{key} + " must be within [0, 4294967295], got "
                                    + std::to_string(value)};
            }
            return static_cast<uint32_t>(fallback);
        }
        return static_cast<uint32_t>(value);
    };

    // [bandit]
    if (auto bandit = tbl["bandit"]; bandit.is_table()) {
        config.bandit.algorithm = bandit["algorithm"].value_or(std::string{"ucb1"});
        config.bandit.exploration_constant = bandit["exploration_constant"].value_or(2.0);
        config.bandit.epsilon = bandit["epsilon"].value_or(0.1);
        config.bandit.prior_alpha = bandit["prior_alpha"].value_or(1.0);
        config.bandit.prior_beta = bandit["prior_beta"].value_or(1.0);
        config.bandit.seed = static_cast<uint64_t>(bandit["seed"].value_or(int64_t{0}));
    }

    // [state]
    if (auto state = tbl["state"]; state.is_table()) {
        config.state.backend = state["backend"].value_or(std::string{"memory"});
        config.state.path = state["path"].value_or(std::string{"./state/bandit_state.toml"});
        config.state.fetch_command = string_array(state["fetch_command"]);
        config.state.store_command = string_array(state["store_command"]);
        config.state.timeout_ms = u32(state["timeout_ms"], "state.timeout_ms", 10000);
    }

    // [availability]
    if (auto avail = tbl["availability"]; avail.is_table()) {
        config.availability.source = avail["source"].value_or(std::string{"none"});
        config.availability.status_file = avail["status_file"].value_or(std::string{});
        config.availability.command = string_array(avail["command"]);
        config.availability.timeout_ms =
            u32(avail["timeout_ms"], "availability.timeout_ms", 10000);
        config.availability.max_age_seconds =
            u32(avail["max_age_seconds"], "availability.max_age_seconds", 0);
    }

    // [lifecycle]
    if (auto life = tbl["lifecycle"]; life.is_table()) {
        config.lifecycle.enabled = life["enabled"].value_or(false);
        config.lifecycle.idle_shutdown_seconds =
            u32(life["idle_shutdown_seconds"], "lifecycle.idle_shutdown_seconds", 300);
        config.lifecycle.start_command = string_array(life["start_command"]);
        config.lifecycle.stop_command = string_array(life["stop_command"]);
        config.lifecycle.timeout_ms = u32(life["timeout_ms"], "lifecycle.timeout_ms", 120000);
        config.lifecycle.state_path = life["state_path"].value_or(std::string{});
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
        config.telemetry.max_file_size_mb =
            u32(telemetry["max_file_size_mb"], "telemetry.max_file_size_mb", 50);
        config.telemetry.rotate_count = u32(telemetry["rotate_count"], "telemetry.rotate_count", 5);
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        config.telemetry.decision_log = telemetry["decision_log"].value_or(std::string{});
    }

    // [ontology.implications], [parser.tag_mappings]
    config.implications = string_array_map(tbl["ontology"]["implications"]);
    config.tag_mappings = string_array_map(tbl["parser"]["tag_mappings"]);

    // [[runner]]
    if (auto runners = tbl["runner"].as_array()) {
        for (const auto& element : *runners) {
            const auto* entry = element.as_table();
            if (!entry) continue;
            toml::node_view<const toml::node> view{*entry};

            RunnerConfig runner;
            runner.key = view["key"].value_or(std::string{});
            runner.name = view["name"].value_or(runner.key);
            runner.tags = string_array(view["tags"]);
            runner.capabilities = string_array(view["capabilities"]);
            runner.cost_per_minute = view["cost_per_minute"].value_or(0.0);
            runner.executor = view["executor"].value_or(std::string{"unknown"});
            runner.on_demand = view["on_demand"].value_or(false);
            config.runners.push_back(std::move(runner));
        }
    }

    if (range_error) return *range_error;
    return config;
}

Result<Config> checked(Result<Config> config) {
    if (!config) return config;
    if (auto valid = validate(*config); !valid) {
        return valid.error();
    }
    return config;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return checked(from_table(tbl));
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return checked(from_table(tbl));
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace fleet_router
