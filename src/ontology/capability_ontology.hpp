/**
 * @file capability_ontology.hpp
 * @brief Capability taxonomy, implication rules and the runner registry.
 *
 * The ontology is the symbolic half of the selector: every registered runner
 * carries a declared capability set and a closure of that set under the
 * implication rules (e.g. docker ⟹ linux). The constraint solver only ever
 * looks at closed sets.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_router {

// ─────────────────────────────────────────────
// Capability Taxonomy
// ─────────────────────────────────────────────

enum class CapabilityType : uint8_t {
    Executor,   ///< docker, shell, kubernetes
    Platform,   ///< linux, macos, windows
    Cloud,      ///< gcp, aws, azure
    Hardware,   ///< gpu, arm64
    Network,    ///< region / locality (eu-west, nordic)
    Custom
};

[[nodiscard]] constexpr std::string_view to_string(CapabilityType type) noexcept {
    switch (type) {
        case CapabilityType::Executor: return "executor";
        case CapabilityType::Platform: return "platform";
        case CapabilityType::Cloud:    return "cloud";
        case CapabilityType::Hardware: return "hardware";
        case CapabilityType::Network:  return "network";
        case CapabilityType::Custom:   return "custom";
    }
    return "custom";
}

// ─────────────────────────────────────────────
// Runner Profile
// ─────────────────────────────────────────────

struct RunnerProfile {
    RunnerKey key;                  ///< stable identity; statistics are keyed by it
    std::string display_name;
    std::vector<std::string> tags;  ///< raw tags as declared by the fleet
    CapabilitySet declared;
    CapabilitySet capabilities;     ///< closure of `declared`, maintained by the ontology
    double cost_per_minute{0.0};
    ExecutorClass executor{ExecutorClass::Unknown};
    bool on_demand{false};          ///< backed by capacity the lifecycle controller may start

    [[nodiscard]] bool has(const Capability& cap) const {
        return capabilities.contains(cap);
    }
};

// ─────────────────────────────────────────────
// CapabilityOntology
// ─────────────────────────────────────────────

/**
 * @brief Registry of runners and implication rules.
 *
 * Not thread-safe; the façade builds it once and then only reads from it.
 */
class CapabilityOntology {
public:
    using ImplicationMap = std::map<Capability, CapabilitySet>;

    /// @param with_standard_rules seed the standard taxonomy and implication rules
    explicit CapabilityOntology(bool with_standard_rules = true);

    // ── Rules ────────────────────────────────

    /// Add `from ⟹ to`. Closures of all registered runners are recomputed.
    void add_implication(std::string_view from, std::string_view to);
    [[nodiscard]] const ImplicationMap& implications() const noexcept { return implications_; }

    void define_capability(std::string_view name, CapabilityType type);
    [[nodiscard]] CapabilityType type_of(std::string_view name) const;

    /// Fixed-point closure of `declared` under the current rules.
    [[nodiscard]] CapabilitySet close(const CapabilitySet& declared) const;

    // ── Runners ──────────────────────────────

    /**
     * @brief Register or replace a runner.
     *
     * Capability names are lower-cased; `profile.capabilities` is ignored and
     * recomputed from `profile.declared`.
     */
    Result<void> register_runner(RunnerProfile profile);

    /// Shorthand for tests and tooling: key + declared capabilities.
    Result<void> register_runner(const RunnerKey& key, const CapabilitySet& declared,
                                 double cost_per_minute = 0.0);

    [[nodiscard]] Result<CapabilitySet> capabilities_of(const RunnerKey& key) const;
    [[nodiscard]] const RunnerProfile* find(const RunnerKey& key) const;
    [[nodiscard]] Result<RunnerProfile> profile(const RunnerKey& key) const;
    [[nodiscard]] bool contains(const RunnerKey& key) const;

    /// Sorted runner keys.
    [[nodiscard]] std::vector<RunnerKey> runner_keys() const;
    [[nodiscard]] const std::map<RunnerKey, RunnerProfile>& runners() const noexcept {
        return runners_;
    }
    [[nodiscard]] std::vector<RunnerKey> runners_with_capability(std::string_view cap) const;
    [[nodiscard]] size_t size() const noexcept { return runners_.size(); }

private:
    void seed_standard_rules();

    ImplicationMap implications_;
    std::map<Capability, CapabilityType> types_;
    std::map<RunnerKey, RunnerProfile> runners_;
};

}  // namespace fleet_router
