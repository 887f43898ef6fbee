/**
 * @file state_backend.hpp
 * @brief Persistence of bandit statistics between requests.
 *
 * The engine is stateless across calls: every public operation loads the
 * state, mutates it and saves it back. Concurrent writers are
 * last-writer-wins; no locking is attempted.
 *
 * Document layout (TOML):
 *
 *   algorithm = "ucb1"        # informational
 *   total_pulls = 4           # informational
 *   [runners."mac-docker"]
 *   pulls = 3
 *   total_reward = 5.0
 *   successes = 3             # optional, defaults to 0
 *   failures = 0              # optional, defaults to 0
 *   total_duration = 90.0     # optional, defaults to 0
 */

#pragma once

#include "bandit/arm_statistics.hpp"
#include "core/concepts.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_router {

/**
 * @brief Abstract interface for state storage.
 */
class IStateBackend {
public:
    virtual ~IStateBackend() = default;

    /// A store that has never been written loads as an empty state.
    virtual Result<BanditState> load() = 0;
    virtual Result<void> save(const BanditState& state) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ─────────────────────────────────────────────
// Document codec
// ─────────────────────────────────────────────

[[nodiscard]] std::string serialize_state(const BanditState& state, std::string_view algorithm = {});

/// Errors are reported as ErrorCode::StatePersistence.
[[nodiscard]] Result<BanditState> parse_state(std::string_view document);

// ─────────────────────────────────────────────
// Implementations
// ─────────────────────────────────────────────

class InMemoryStateBackend : public IStateBackend {
public:
    InMemoryStateBackend() = default;
    explicit InMemoryStateBackend(BanditState initial);

    Result<BanditState> load() override;
    Result<void> save(const BanditState& state) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "memory"; }

    [[nodiscard]] size_t save_count() const noexcept { return saves_; }

private:
    BanditState state_;
    size_t saves_{0};
};

/**
 * @brief Local TOML file; writes go to a temp file that is renamed into place.
 */
class FileStateBackend : public IStateBackend {
public:
    explicit FileStateBackend(std::filesystem::path path, std::string algorithm = {});

    Result<BanditState> load() override;
    Result<void> save(const BanditState& state) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "file"; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::string algorithm_;
};

/**
 * @brief Remote object store reached through external commands.
 *
 * `fetch` must print the document on stdout (empty output = no state yet);
 * `store` receives the document on stdin. e.g.
 *   fetch = ["gsutil", "cat", "gs://bucket/bandit_state.toml"]
 *   store = ["gsutil", "cp", "-", "gs://bucket/bandit_state.toml"]
 */
class CommandStateBackend : public IStateBackend {
public:
    CommandStateBackend(std::vector<std::string> fetch_command,
                        std::vector<std::string> store_command,
                        uint32_t timeout_ms = 10000,
                        std::string algorithm = {});

    Result<BanditState> load() override;
    Result<void> save(const BanditState& state) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "command"; }

private:
    std::vector<std::string> fetch_command_;
    std::vector<std::string> store_command_;
    uint32_t timeout_ms_;
    std::string algorithm_;
};

static_assert(StateBackendLike<InMemoryStateBackend>);
static_assert(StateBackendLike<FileStateBackend>);
static_assert(StateBackendLike<CommandStateBackend>);

}  // namespace fleet_router
