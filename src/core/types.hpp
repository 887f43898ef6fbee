/**
 * @file types.hpp
 * @brief Fundamental vocabulary types used throughout FleetRouter.
 *
 * Runner identity, capability tokens, executor classes and the clock
 * abstraction used by the lifecycle controller.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace fleet_router {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using RunnerKey = std::string;
using Capability = std::string;

/// Ordered so that every rendering of a capability set is deterministic.
using CapabilitySet = std::set<Capability>;

using Timestamp = std::chrono::system_clock::time_point;
using Seconds = std::chrono::seconds;

/// Injected time source; tests drive deadlines through it.
using ClockFn = std::function<Timestamp()>;

[[nodiscard]] inline ClockFn system_clock_fn() {
    return [] { return std::chrono::system_clock::now(); };
}

// ─────────────────────────────────────────────
// Executor Class
// ─────────────────────────────────────────────

enum class ExecutorClass : uint8_t {
    Container,       ///< docker, docker+machine
    VirtualMachine,  ///< cloud or local VM with a shell executor
    Orchestrator,    ///< kubernetes
    Shell,           ///< bare host shell
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(ExecutorClass executor) noexcept {
    switch (executor) {
        case ExecutorClass::Container:      return "container";
        case ExecutorClass::VirtualMachine: return "vm";
        case ExecutorClass::Orchestrator:   return "orchestrator";
        case ExecutorClass::Shell:          return "shell";
        case ExecutorClass::Unknown:        return "unknown";
    }
    return "unknown";
}

[[nodiscard]] inline ExecutorClass executor_class_from_string(std::string_view name) noexcept {
    if (name == "container" || name == "docker") return ExecutorClass::Container;
    if (name == "vm" || name == "virtual_machine") return ExecutorClass::VirtualMachine;
    if (name == "orchestrator" || name == "kubernetes" || name == "k8s") {
        return ExecutorClass::Orchestrator;
    }
    if (name == "shell") return ExecutorClass::Shell;
    return ExecutorClass::Unknown;
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

[[nodiscard]] inline std::string to_lower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

[[nodiscard]] inline std::string join(const CapabilitySet& items, std::string_view sep = ", ") {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

}  // namespace fleet_router
