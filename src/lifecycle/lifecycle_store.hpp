/**
 * @file lifecycle_store.hpp
 * @brief Lifecycle controller state and its persistence.
 *
 * One-shot CLI invocations (select, report, tick) each build a fresh
 * controller, so the auto-start flag and the pending shutdown deadline live in
 * a store rather than in the controller.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace fleet_router {

/**
 * @brief Invariant: auto_started == false ⟹ the controller never issues a stop.
 */
struct LifecycleState {
    bool auto_started{false};                 ///< capacity was started by this service
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> shutdown_deadline;

    bool operator==(const LifecycleState&) const = default;
};

class ILifecycleStore {
public:
    virtual ~ILifecycleStore() = default;
    virtual Result<LifecycleState> load() = 0;
    virtual Result<void> save(const LifecycleState& state) = 0;
};

class InMemoryLifecycleStore : public ILifecycleStore {
public:
    InMemoryLifecycleStore() = default;
    explicit InMemoryLifecycleStore(LifecycleState initial) : state_(std::move(initial)) {}

    Result<LifecycleState> load() override { return state_; }
    Result<void> save(const LifecycleState& state) override {
        state_ = state;
        return {};
    }

private:
    LifecycleState state_;
};

/**
 * @brief TOML file; timestamps stored as whole seconds since the epoch.
 *
 *   auto_started = true
 *   started_at = 1760000000
 *   shutdown_deadline = 1760000300
 */
class FileLifecycleStore : public ILifecycleStore {
public:
    explicit FileLifecycleStore(std::filesystem::path path);

    Result<LifecycleState> load() override;
    Result<void> save(const LifecycleState& state) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

static_assert(LifecycleStoreLike<InMemoryLifecycleStore>);
static_assert(LifecycleStoreLike<FileLifecycleStore>);

}  // namespace fleet_router
