/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace fleet_router {

namespace {

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_selection(const SelectionEvent& event) {
    std::ostringstream oss;
    oss << R"({"event":"runner_selected")"
        << R"(,"ts_ms":)" << now_epoch_ms()
        << R"(,"job":")" << json_escape(event.job_name) << "\""
        << R"(,"runner":)";
    if (event.runner) {
        oss << "\"" << json_escape(*event.runner) << "\"";
    } else {
        oss << "null";
    }
    oss << R"(,"feasible":)" << event.feasible_count
        << R"(,"confidence":)" << event.confidence
        << R"(,"algorithm":")" << json_escape(event.algorithm) << "\""
        << R"(,"solve_time_ms":)" << event.solve_time_ms
        << R"(,"capacity_started":)" << (event.capacity_started ? "true" : "false")
        << R"(,"degraded":)" << (event.degraded ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_outcome(const RunnerKey& runner, bool success,
                                      double duration_seconds, double reward, bool persisted) {
    std::ostringstream oss;
    oss << R"({"event":"outcome_recorded")"
        << R"(,"ts_ms":)" << now_epoch_ms()
        << R"(,"runner":")" << json_escape(runner) << "\""
        << R"(,"success":)" << (success ? "true" : "false")
        << R"(,"duration_s":)" << duration_seconds
        << R"(,"reward":)" << reward
        << R"(,"persisted":)" << (persisted ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_capacity_event(std::string_view event_type,
                                             std::string_view outcome,
                                             std::string_view detail) {
    std::ostringstream oss;
    oss << R"({"event":"capacity_)" << event_type << "\""
        << R"(,"ts_ms":)" << now_epoch_ms()
        << R"(,"outcome":")" << json_escape(outcome) << "\""
        << R"(,"detail":")" << json_escape(detail) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++emitted_;
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace fleet_router
