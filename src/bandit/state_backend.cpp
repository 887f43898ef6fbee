/**
 * @file state_backend.cpp
 * @brief State document codec and backend implementations.
 */

#include "bandit/state_backend.hpp"

#include "platform/command_runner.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace fleet_router {

// ─────────────────────────────────────────────
// Document codec
// ─────────────────────────────────────────────

std::string serialize_state(const BanditState& state, std::string_view algorithm) {
    toml::table root;
    if (!algorithm.empty()) {
        root.insert_or_assign("algorithm", std::string{algorithm});
    }
    root.insert_or_assign("total_pulls", static_cast<int64_t>(total_pulls(state)));

    toml::table runners;
    for (const auto& [key, stats] : state) {
        toml::table arm;
        arm.insert_or_assign("pulls", static_cast<int64_t>(stats.pulls));
        arm.insert_or_assign("total_reward", stats.total_reward);
        arm.insert_or_assign("successes", static_cast<int64_t>(stats.successes));
        arm.insert_or_assign("failures", static_cast<int64_t>(stats.failures));
        arm.insert_or_assign("total_duration", stats.total_duration_seconds);
        runners.insert_or_assign(key, std::move(arm));
    }
    root.insert_or_assign("runners", std::move(runners));

    std::ostringstream oss;
    oss << root << '\n';
    return oss.str();
}

Result<BanditState> parse_state(std::string_view document) {
    BanditState state;
    try {
        auto root = toml::parse(document);
        const auto* runners = root["runners"].as_table();
        if (!runners) return state;

        for (const auto& [key, node] : *runners) {
            const auto* arm = node.as_table();
            if (!arm) {
                return Error{ErrorCode::StatePersistence,
                             "state entry for '" + std::string{key.str()} + "' is not a table"};
            }
            auto count = [&](std::string_view field) {
                auto value = (*arm)[field].value_or(int64_t{0});
                return static_cast<uint64_t>(std::max<int64_t>(value, 0));
            };

            ArmStatistics stats;
            stats.pulls = count("pulls");
            stats.total_reward = (*arm)["total_reward"].value_or(0.0);
            stats.successes = count("successes");
            stats.failures = count("failures");
            stats.total_duration_seconds = (*arm)["total_duration"].value_or(0.0);
            state.emplace(std::string{key.str()}, stats);
        }
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::StatePersistence,
                     "corrupt state document: " + std::string{err.description()}};
    }
    return state;
}

// ─────────────────────────────────────────────
// InMemoryStateBackend
// ─────────────────────────────────────────────

InMemoryStateBackend::InMemoryStateBackend(BanditState initial) : state_(std::move(initial)) {}

Result<BanditState> InMemoryStateBackend::load() {
    return state_;
}

Result<void> InMemoryStateBackend::save(const BanditState& state) {
    state_ = state;
    ++saves_;
    return {};
}

// ─────────────────────────────────────────────
// FileStateBackend
// ─────────────────────────────────────────────

FileStateBackend::FileStateBackend(std::filesystem::path path, std::string algorithm)
    : path_(std::move(path)), algorithm_(std::move(algorithm)) {}

Result<BanditState> FileStateBackend::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return BanditState{};
    }

    std::ifstream in(path_);
    if (!in) {
        return Error{ErrorCode::StatePersistence, "cannot open state file: " + path_.string()};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_state(buffer.str());
}

Result<void> FileStateBackend::save(const BanditState& state) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::StatePersistence,
                         "cannot create state directory: " + ec.message()};
        }
    }

    auto temp = path_;
    temp += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::StatePersistence, "cannot write " + temp.string()};
        }
        out << serialize_state(state, algorithm_);
        out.flush();
        if (!out) {
            std::filesystem::remove(temp, ec);
            return Error{ErrorCode::StatePersistence, "short write to " + temp.string()};
        }
    }

    std::filesystem::rename(temp, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return Error{ErrorCode::StatePersistence,
                     "cannot replace " + path_.string() + ": " + ec.message()};
    }
    return {};
}

// ─────────────────────────────────────────────
// CommandStateBackend
// ─────────────────────────────────────────────

CommandStateBackend::CommandStateBackend(std::vector<std::string> fetch_command,
                                         std::vector<std::string> store_command,
                                         uint32_t timeout_ms,
                                         std::string algorithm)
    : fetch_command_(std::move(fetch_command))
    , store_command_(std::move(store_command))
    , timeout_ms_(timeout_ms)
    , algorithm_(std::move(algorithm)) {}

Result<BanditState> CommandStateBackend::load() {
    auto run = run_command(CommandSpec{.argv = fetch_command_, .timeout_ms = timeout_ms_});
    if (!run) {
        return Error{ErrorCode::StatePersistence, "state fetch: " + run.error().message};
    }
    if (run->timed_out) {
        return Error{ErrorCode::StatePersistence,
                     "state fetch timed out: " + describe_command(fetch_command_)};
    }
    if (run->exit_code != 0) {
        return Error{ErrorCode::StatePersistence,
                     "state fetch exited " + std::to_string(run->exit_code) + ": "
                     + run->stderr_text};
    }
    return parse_state(run->stdout_text);
}

Result<void> CommandStateBackend::save(const BanditState& state) {
    auto run = run_command(CommandSpec{
        .argv = store_command_,
        .stdin_data = serialize_state(state, algorithm_),
        .timeout_ms = timeout_ms_,
    });
    if (!run) {
        return Error{ErrorCode::StatePersistence, "state store: " + run.error().message};
    }
    if (!run->ok()) {
        return Error{ErrorCode::StatePersistence,
                     "state store failed (exit " + std::to_string(run->exit_code) + "): "
                     + run->stderr_text};
    }
    return {};
}

}  // namespace fleet_router
