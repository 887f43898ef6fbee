/**
 * @file prober.hpp
 * @brief Fleet availability probing: interface and concrete implementations.
 *
 * Provides AssumeOnlineProber (no status source configured), StatusFileProber
 * (TOML status feed), CommandProber (external status command) and MockProber
 * (testing). A probe that cannot determine the fleet's status reports
 * ProbeStatus::Unknown; it never reports an empty online set in that case, so
 * the façade cannot mistake an outage of the status source for an outage of
 * the fleet.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "ontology/capability_ontology.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_router {

enum class ProbeStatus : uint8_t {
    Known,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(ProbeStatus status) noexcept {
    switch (status) {
        case ProbeStatus::Known:   return "known";
        case ProbeStatus::Unknown: return "unknown";
    }
    return "unknown";
}

struct ProbeResult {
    ProbeStatus status{ProbeStatus::Unknown};
    std::set<RunnerKey> online;
    std::set<RunnerKey> offline;
    std::string detail;             ///< failure reason when Unknown

    [[nodiscard]] bool known() const noexcept { return status == ProbeStatus::Known; }
    [[nodiscard]] bool is_online(const RunnerKey& key) const { return online.contains(key); }

    [[nodiscard]] static ProbeResult unknown(std::string reason) {
        ProbeResult result;
        result.status = ProbeStatus::Unknown;
        result.detail = std::move(reason);
        return result;
    }
};

/**
 * @brief Abstract interface for availability probes (runtime polymorphism).
 */
class IAvailabilityProber {
public:
    virtual ~IAvailabilityProber() = default;
    virtual ProbeResult probe() = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// "online" (case-insensitive) is online; every other status is offline.
[[nodiscard]] bool status_means_online(std::string_view status);

// ─────────────────────────────────────────────
// AssumeOnlineProber
// ─────────────────────────────────────────────

/**
 * @brief Used when no status source is configured: every registered runner
 *        is reported online.
 */
class AssumeOnlineProber : public IAvailabilityProber {
public:
    explicit AssumeOnlineProber(const CapabilityOntology& ontology);

    ProbeResult probe() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "assume_online"; }

private:
    const CapabilityOntology& ontology_;
};

// ─────────────────────────────────────────────
// StatusFileProber
// ─────────────────────────────────────────────

/**
 * @brief Reads a TOML status feed maintained by an external poller.
 *
 *   [runners]
 *   mac-docker = "online"
 *   gcp-shell = "offline"
 *
 * Missing or unparseable files, and files older than `max_age` (when
 * non-zero), yield Unknown.
 */
class StatusFileProber : public IAvailabilityProber {
public:
    explicit StatusFileProber(std::filesystem::path path,
                              std::chrono::seconds max_age = std::chrono::seconds{0});

    ProbeResult probe() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "status_file"; }

private:
    std::filesystem::path path_;
    std::chrono::seconds max_age_;
};

/// Parse a status feed document (the StatusFileProber format).
[[nodiscard]] ProbeResult parse_status_document(std::string_view document);

// ─────────────────────────────────────────────
// CommandProber
// ─────────────────────────────────────────────

/**
 * @brief Runs a status command; each output line is "<runner_key> <status>".
 *
 * Blank lines and lines starting with '#' are skipped. A non-zero exit,
 * a timeout or output without a single status line yields Unknown.
 */
class CommandProber : public IAvailabilityProber {
public:
    CommandProber(std::vector<std::string> command, uint32_t timeout_ms = 10000);

    ProbeResult probe() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "command"; }

private:
    std::vector<std::string> command_;
    uint32_t timeout_ms_;
};

/// Parse "<key> <status>" lines; Unknown when no line parses.
[[nodiscard]] ProbeResult parse_status_lines(std::string_view output);

// ─────────────────────────────────────────────
// MockProber
// ─────────────────────────────────────────────

/**
 * @brief Scripted prober for tests and the demo command.
 */
class MockProber : public IAvailabilityProber {
public:
    MockProber() = default;

    ProbeResult probe() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

    // Test helpers: configure what the next probes return
    void set_online(std::set<RunnerKey> online, std::set<RunnerKey> offline = {});
    void set_all_offline(std::set<RunnerKey> offline);
    void set_unknown(std::string reason);

    [[nodiscard]] size_t probe_count() const noexcept { return probes_; }

private:
    ProbeResult next_{ProbeResult::unknown("mock prober not configured")};
    size_t probes_{0};
};

// Verify concept satisfaction at compile time
static_assert(AvailabilityProberLike<AssumeOnlineProber>);
static_assert(AvailabilityProberLike<StatusFileProber>);
static_assert(AvailabilityProberLike<CommandProber>);
static_assert(AvailabilityProberLike<MockProber>);

}  // namespace fleet_router
