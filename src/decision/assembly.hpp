/**
 * @file assembly.hpp
 * @brief Build a RunnerSelector's collaborators from configuration.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "decision/runner_selector.hpp"
#include "ontology/capability_ontology.hpp"
#include "parser/job_parser.hpp"

#include <memory>

namespace fleet_router {

/**
 * @brief Register every `[[runner]]` of `config` in `ontology`.
 *
 * A runner without explicit capabilities gets the capabilities its tags map
 * to through `parser`. Applies `[ontology.implications]` first.
 */
Result<void> load_fleet(const Config& config, const RequirementParser& parser,
                        CapabilityOntology& ontology);

/// Parser with the default tag table plus `[parser.tag_mappings]`.
[[nodiscard]] RequirementParser make_parser(const Config& config);

/**
 * @brief Assemble selector options: ontology, strategy, state backend, prober,
 *        compute control, lifecycle store, log and telemetry sinks.
 */
Result<RunnerSelector::Options> build_selector_options(const Config& config);

/// Convenience: build_selector_options() + construct.
Result<std::unique_ptr<RunnerSelector>> build_selector(const Config& config);

[[nodiscard]] std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry);

}  // namespace fleet_router
