/**
 * @file config.hpp
 * @brief Service configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace fleet_router {

struct BanditConfig {
    std::string algorithm = "ucb1";     ///< "ucb1", "thompson", "epsilon_greedy"
    double exploration_constant = 2.0;
    double epsilon = 0.1;
    double prior_alpha = 1.0;
    double prior_beta = 1.0;
    uint64_t seed = 0;                  ///< 0 = seed from std::random_device
};

struct StateConfig {
    std::string backend = "memory";     ///< "memory", "file", "command"
    std::filesystem::path path = "./state/bandit_state.toml";
    std::vector<std::string> fetch_command;
    std::vector<std::string> store_command;
    uint32_t timeout_ms = 10000;
};

struct AvailabilityConfig {
    std::string source = "none";        ///< "none", "file", "command"
    std::filesystem::path status_file;
    std::vector<std::string> command;
    uint32_t timeout_ms = 10000;
    uint32_t max_age_seconds = 0;       ///< 0 = status file never considered stale
};

struct LifecycleConfig {
    bool enabled = false;
    uint32_t idle_shutdown_seconds = 300;
    std::vector<std::string> start_command;
    std::vector<std::string> stop_command;
    uint32_t timeout_ms = 120000;
    std::filesystem::path state_path;   ///< empty = keep lifecycle state in memory
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< empty = log to stderr
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::filesystem::path decision_log; ///< empty = decision events discarded
};

/**
 * @brief One `[[runner]]` table.
 *
 * When `capabilities` is empty the runner's declared capabilities are
 * derived from its tags through the parser's tag table.
 */
struct RunnerConfig {
    std::string key;
    std::string name;
    std::vector<std::string> tags;
    std::vector<std::string> capabilities;
    double cost_per_minute = 0.0;
    std::string executor = "unknown";
    bool on_demand = false;
};

/**
 * @brief Top-level service configuration.
 */
struct Config {
    BanditConfig bandit;
    StateConfig state;
    AvailabilityConfig availability;
    LifecycleConfig lifecycle;
    TelemetryConfig telemetry;
    std::map<std::string, std::vector<std::string>> implications;
    std::map<std::string, std::vector<std::string>> tag_mappings;
    std::vector<RunnerConfig> runners;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from an in-memory TOML document.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace fleet_router
