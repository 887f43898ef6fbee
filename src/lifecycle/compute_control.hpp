/**
 * @file compute_control.hpp
 * @brief Power control for on-demand capacity (e.g. a cloud VM running a runner).
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_router {

/**
 * @brief Abstract interface for starting and stopping on-demand capacity.
 *
 * Both calls return a short human-readable detail on success and a
 * LifecycleControl error on failure. Neither is retried.
 */
class IComputeControl {
public:
    virtual ~IComputeControl() = default;
    virtual Result<std::string> start() = 0;
    virtual Result<std::string> stop() = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Runs configured commands, e.g.
 *   start = ["gcloud", "compute", "instances", "start", "runner-vm", "--zone", "europe-north1-a"]
 */
class CommandComputeControl : public IComputeControl {
public:
    CommandComputeControl(std::vector<std::string> start_command,
                          std::vector<std::string> stop_command,
                          uint32_t timeout_ms = 120000);

    Result<std::string> start() override;
    Result<std::string> stop() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "command"; }

private:
    Result<std::string> invoke(const std::vector<std::string>& command, std::string_view action);

    std::vector<std::string> start_command_;
    std::vector<std::string> stop_command_;
    uint32_t timeout_ms_;
};

/**
 * @brief Stand-in when no commands are configured; every call fails.
 */
class NullComputeControl : public IComputeControl {
public:
    Result<std::string> start() override;
    Result<std::string> stop() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "none"; }
};

/**
 * @brief Counting compute control for tests and the demo command.
 */
class MockComputeControl : public IComputeControl {
public:
    Result<std::string> start() override;
    Result<std::string> stop() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

    void set_start_fails(bool fails) noexcept { start_fails_ = fails; }
    void set_stop_fails(bool fails) noexcept { stop_fails_ = fails; }

    [[nodiscard]] size_t start_calls() const noexcept { return start_calls_; }
    [[nodiscard]] size_t stop_calls() const noexcept { return stop_calls_; }
    [[nodiscard]] bool running() const noexcept { return running_; }

private:
    bool start_fails_{false};
    bool stop_fails_{false};
    bool running_{false};
    size_t start_calls_{0};
    size_t stop_calls_{0};
};

static_assert(ComputeControlLike<CommandComputeControl>);
static_assert(ComputeControlLike<NullComputeControl>);
static_assert(ComputeControlLike<MockComputeControl>);

}  // namespace fleet_router
