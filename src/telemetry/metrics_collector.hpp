/**
 * @file metrics_collector.hpp
 * @brief Structured decision events for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace fleet_router {

struct SelectionEvent {
    std::string job_name;
    std::optional<RunnerKey> runner;
    size_t feasible_count{0};
    double confidence{0.0};
    std::string algorithm;
    double solve_time_ms{0.0};
    bool capacity_started{false};
    bool degraded{false};
};

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Events: runner_selected, outcome_recorded, capacity_start, capacity_stop,
 * plus free-form custom events.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_selection(const SelectionEvent& event);
    void record_outcome(const RunnerKey& runner, bool success, double duration_seconds,
                        double reward, bool persisted);
    void record_capacity_event(std::string_view event_type, std::string_view outcome,
                               std::string_view detail);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

    [[nodiscard]] uint64_t events_emitted() const noexcept { return emitted_; }

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    uint64_t emitted_{0};

    void emit(std::string_view json_line);
};

}  // namespace fleet_router
