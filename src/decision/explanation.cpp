/**
 * @file explanation.cpp
 * @brief Explanation rendering.
 */

#include "decision/explanation.hpp"

#include "core/logger.hpp"

#include <iomanip>
#include <sstream>

namespace fleet_router {

namespace {

void indent_block(std::ostringstream& oss, const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) oss << "  " << line << '\n';
    }
}

}  // anonymous namespace

std::string Explanation::to_string() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (!job_name.empty()) oss << "Job: " << job_name << '\n';
    if (selected_runner) {
        oss << "Selected runner: " << *selected_runner
            << " (confidence " << confidence << ")\n";
    } else {
        oss << "Selected runner: none\n";
    }

    oss << "Feasible runners (" << feasible_runners.size() << "):";
    for (size_t i = 0; i < feasible_runners.size(); ++i) {
        oss << (i == 0 ? " " : ", ") << feasible_runners[i];
    }
    oss << '\n';

    oss << "Symbolic reasoning:\n";
    indent_block(oss, symbolic_reasoning);
    oss << "Statistical reasoning:\n";
    indent_block(oss, statistical_reasoning);

    if (capacity_started) oss << "On-demand capacity was started for this job.\n";
    for (const auto& note : degraded_notes) {
        oss << "Degraded: " << note << '\n';
    }

    oss << std::setprecision(3)
        << "Solve time: " << solve_time_ms << " ms";
    if (!algorithm.empty()) oss << " (algorithm " << algorithm << ")";
    oss << '\n';
    return oss.str();
}

std::string Explanation::to_json() const {
    std::ostringstream oss;
    oss << R"({"job":")" << json_escape(job_name) << "\"";

    oss << R"(,"selected_runner":)";
    if (selected_runner) {
        oss << "\"" << json_escape(*selected_runner) << "\"";
    } else {
        oss << "null";
    }

    oss << R"(,"feasible_runners":[)";
    for (size_t i = 0; i < feasible_runners.size(); ++i) {
        if (i > 0) oss << ',';
        oss << "\"" << json_escape(feasible_runners[i]) << "\"";
    }
    oss << "]";

    oss << R"(,"confidence":)" << confidence
        << R"(,"symbolic_reasoning":")" << json_escape(symbolic_reasoning) << "\""
        << R"(,"statistical_reasoning":")" << json_escape(statistical_reasoning) << "\""
        << R"(,"solve_time_ms":)" << solve_time_ms
        << R"(,"algorithm":")" << json_escape(algorithm) << "\""
        << R"(,"capacity_started":)" << (capacity_started ? "true" : "false");

    oss << R"(,"degraded_notes":[)";
    for (size_t i = 0; i < degraded_notes.size(); ++i) {
        if (i > 0) oss << ',';
        oss << "\"" << json_escape(degraded_notes[i]) << "\"";
    }
    oss << "]}";
    return oss.str();
}

}  // namespace fleet_router
