/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace fleet_router;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "fr_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.bandit.algorithm, "ucb1");
    EXPECT_DOUBLE_EQ(config.bandit.exploration_constant, 2.0);
    EXPECT_EQ(config.state.backend, "memory");
    EXPECT_EQ(config.availability.source, "none");
    EXPECT_FALSE(config.lifecycle.enabled);
    EXPECT_EQ(config.lifecycle.idle_shutdown_seconds, 300u);
    EXPECT_TRUE(config.runners.empty());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [bandit]
        algorithm = "thompson"
        prior_alpha = 2.0
        prior_beta = 3.0
        seed = 42

        [state]
        backend = "command"
        fetch_command = ["vars", "get", "STATE"]
        store_command = ["vars", "set", "STATE"]
        timeout_ms = 5000

        [availability]
        source = "file"
        status_file = "/tmp/status.toml"
        max_age_seconds = 120

        [lifecycle]
        enabled = true
        idle_shutdown_seconds = 600
        start_command = ["start-vm"]
        stop_command = ["stop-vm"]
        state_path = "/tmp/lifecycle.toml"

        [telemetry]
        log_dir = "/tmp/fr_logs"
        log_level = "debug"
        decision_log = "/tmp/fr_logs/decisions.ndjson"

        [ontology.implications]
        apple-silicon = ["arm64", "macos"]

        [parser.tag_mappings]
        mac-docker = ["docker", "macos"]

        [[runner]]
        key = "mac-docker"
        name = "Mac Docker"
        tags = ["mac-docker"]
        cost_per_minute = 0.0
        executor = "container"

        [[runner]]
        key = "gcp-shell"
        capabilities = ["shell", "gcp"]
        cost_per_minute = 0.02
        on_demand = true
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& config = *result;

    EXPECT_EQ(config.bandit.algorithm, "thompson");
    EXPECT_DOUBLE_EQ(config.bandit.prior_alpha, 2.0);
    EXPECT_DOUBLE_EQ(config.bandit.prior_beta, 3.0);
    EXPECT_EQ(config.bandit.seed, 42u);

    EXPECT_EQ(config.state.backend, "command");
    ASSERT_EQ(config.state.fetch_command.size(), 3u);
    EXPECT_EQ(config.state.store_command[1], "set");
    EXPECT_EQ(config.state.timeout_ms, 5000u);

    EXPECT_EQ(config.availability.source, "file");
    EXPECT_EQ(config.availability.status_file.string(), "/tmp/status.toml");
    EXPECT_EQ(config.availability.max_age_seconds, 120u);

    EXPECT_TRUE(config.lifecycle.enabled);
    EXPECT_EQ(config.lifecycle.idle_shutdown_seconds, 600u);
    ASSERT_EQ(config.lifecycle.start_command.size(), 1u);
    EXPECT_EQ(config.lifecycle.stop_command[0], "stop-vm");

    EXPECT_EQ(config.telemetry.log_dir.string(), "/tmp/fr_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");

    ASSERT_EQ(config.implications.count("apple-silicon"), 1u);
    EXPECT_EQ(config.implications.at("apple-silicon").size(), 2u);
    ASSERT_EQ(config.tag_mappings.count("mac-docker"), 1u);

    ASSERT_EQ(config.runners.size(), 2u);
    EXPECT_EQ(config.runners[0].key, "mac-docker");
    EXPECT_EQ(config.runners[0].name, "Mac Docker");
    EXPECT_EQ(config.runners[0].executor, "container");
    EXPECT_EQ(config.runners[1].name, "gcp-shell");
    EXPECT_DOUBLE_EQ(config.runners[1].cost_per_minute, 0.02);
    EXPECT_TRUE(config.runners[1].on_demand);
    EXPECT_EQ(config.runners[1].capabilities.size(), 2u);
}

TEST_F(ConfigTest, PartialConfigUsesDefaults) {
    auto path = write_toml(R"(
        [bandit]
        algorithm = "epsilon_greedy"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->bandit.algorithm, "epsilon_greedy");
    EXPECT_DOUBLE_EQ(result->bandit.epsilon, 0.1);
    EXPECT_EQ(result->state.backend, "memory");
    EXPECT_EQ(result->telemetry.log_level, "info");
}

TEST_F(ConfigTest, MissingFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
    EXPECT_NE(result.error().message.find("not found"), std::string::npos);
}

TEST_F(ConfigTest, InvalidToml) {
    auto path = write_toml("this is not valid toml [[[");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, RejectsUnknownAlgorithm) {
    auto result = parse_config("[bandit]\nalgorithm = \"softmax\"\n");
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find("softmax"), std::string::npos);
}

TEST_F(ConfigTest, RejectsEpsilonOutOfRange) {
    EXPECT_FALSE(parse_config("[bandit]\nepsilon = 1.5\n"));
    EXPECT_FALSE(parse_config("[bandit]\nepsilon = -0.1\n"));
    EXPECT_TRUE(parse_config("[bandit]\nepsilon = 1.0\n"));
}

TEST_F(ConfigTest, RejectsNonPositivePriors) {
    EXPECT_FALSE(parse_config("[bandit]\nprior_alpha = 0.0\n"));
}

TEST_F(ConfigTest, CommandBackendNeedsCommands) {
    auto result = parse_config("[state]\nbackend = \"command\"\nfetch_command = [\"get\"]\n");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, FileSourceNeedsStatusFile) {
    EXPECT_FALSE(parse_config("[availability]\nsource = \"file\"\n"));
    EXPECT_FALSE(parse_config("[availability]\nsource = \"command\"\n"));
    EXPECT_FALSE(parse_config("[availability]\nsource = \"carrier-pigeon\"\n"));
}

TEST_F(ConfigTest, RejectsRunnerWithoutKeyOrNegativeCost) {
    EXPECT_FALSE(parse_config("[[runner]]\nname = \"anonymous\"\n"));
    EXPECT_FALSE(parse_config("[[runner]]\nkey = \"r1\"\ncost_per_minute = -1.0\n"));
}

TEST_F(ConfigTest, EnabledLifecycleNeedsStatePath) {
    auto result = parse_config("[lifecycle]\nenabled = true\nidle_shutdown_seconds = 300\n");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Config);
    EXPECT_NE(result.error().message.find("state_path"), std::string::npos);

    EXPECT_TRUE(parse_config("[lifecycle]\nenabled = false\n"));
    EXPECT_TRUE(parse_config(
        "[lifecycle]\nenabled = true\nstate_path = \"./state/lifecycle.toml\"\n"));
}

TEST_F(ConfigTest, RejectsOutOfRangeCounts) {
    auto negative = parse_config(
        "[lifecycle]\nstate_path = \"l.toml\"\nidle_shutdown_seconds = -1\n");
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code, ErrorCode::Config);
    EXPECT_NE(negative.error().message.find("lifecycle.idle_shutdown_seconds"),
              std::string::npos);

    EXPECT_FALSE(parse_config("[state]\ntimeout_ms = -1\n"));
    EXPECT_FALSE(parse_config("[availability]\nmax_age_seconds = 4294967296\n"));
    EXPECT_FALSE(parse_config("[telemetry]\nrotate_count = -3\n"));

    auto largest = parse_config("[state]\ntimeout_ms = 4294967295\n");
    ASSERT_TRUE(largest) << largest.error().message;
    EXPECT_EQ(largest->state.timeout_ms, 4294967295u);
}

TEST_F(ConfigTest, EmptyDocumentIsDefault) {
    auto result = parse_config("");
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->bandit.algorithm, "ucb1");
}
