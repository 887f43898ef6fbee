/**
 * @file job_parser.hpp
 * @brief Translate CI job declarations into capability requirements.
 *
 * Tags are hard requirements and go through a fixed, case-insensitive tag
 * table; tags the table does not know are ignored. Image and service names
 * only ever produce soft preferences.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_router {

/**
 * @brief A single job as declared in a pipeline definition.
 */
struct JobDeclaration {
    std::string name;
    std::vector<std::string> tags;
    std::string image;
    std::vector<std::string> services;
    std::map<std::string, std::string> variables;
    std::string timeout;                    ///< "1h 30m", "45 minutes", "3600"
};

/**
 * @brief Capability constraints extracted from a JobDeclaration.
 */
struct JobRequirement {
    std::string job_name;
    CapabilitySet required;
    CapabilitySet preferred;
    std::map<std::string, std::string> resource_hints;   ///< "memory", "cpu"
    std::optional<int64_t> timeout_seconds;
    std::vector<std::string> tags;

    [[nodiscard]] bool is_feasible_for(const CapabilitySet& capabilities) const;

    /// Fraction of preferred capabilities present; 1.0 when nothing is preferred.
    [[nodiscard]] double preference_score(const CapabilitySet& capabilities) const;
};

// ─────────────────────────────────────────────
// RequirementParser
// ─────────────────────────────────────────────

class RequirementParser {
public:
    static constexpr int64_t kDefaultTimeoutSeconds = 3600;

    RequirementParser();

    /// Pure: the same declaration always yields the same requirement.
    [[nodiscard]] JobRequirement parse(const JobDeclaration& job) const;

    /// Add or replace the capabilities a tag maps to.
    void add_tag_mapping(std::string_view tag, std::vector<std::string> capabilities);

    /// Capabilities for a tag; empty when the tag is unknown.
    [[nodiscard]] CapabilitySet capabilities_for_tag(std::string_view tag) const;
    [[nodiscard]] bool knows_tag(std::string_view tag) const;

    /// Parse "1h 30m" / "90" / "45 minutes" / "30s"; unparseable yields 3600.
    [[nodiscard]] static int64_t parse_timeout(std::string_view text);

private:
    std::map<std::string, CapabilitySet> tag_table_;
};

/**
 * @brief Load jobs from a TOML pipeline document.
 *
 * Layout:
 *   [default]
 *   tags = ["docker"]
 *
 *   [job.build]
 *   tags = ["docker", "gcp"]
 *   image = "ubuntu:22.04"
 *   services = ["postgres:15"]
 *   timeout = "1h 30m"
 *   [job.build.variables]
 *   CI_RUNNER_MEMORY = "4G"
 *
 * Jobs without tags inherit `[default] tags`. Jobs are returned in name order.
 */
[[nodiscard]] Result<std::vector<JobDeclaration>> load_job_declarations(
    const std::filesystem::path& path);

[[nodiscard]] Result<std::vector<JobDeclaration>> parse_job_declarations(std::string_view toml_text);

}  // namespace fleet_router
