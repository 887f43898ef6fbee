/**
 * @file status_probers.cpp
 * @brief AssumeOnlineProber, StatusFileProber and CommandProber.
 */

#include "availability/prober.hpp"

#include "platform/command_runner.hpp"

#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace fleet_router {

bool status_means_online(std::string_view status) {
    return to_lower(status) == "online";
}

// ─────────────────────────────────────────────
// AssumeOnlineProber
// ─────────────────────────────────────────────

AssumeOnlineProber::AssumeOnlineProber(const CapabilityOntology& ontology)
    : ontology_(ontology) {}

ProbeResult AssumeOnlineProber::probe() {
    ProbeResult result;
    result.status = ProbeStatus::Known;
    for (const auto& key : ontology_.runner_keys()) result.online.insert(key);
    return result;
}

// ─────────────────────────────────────────────
// StatusFileProber
// ─────────────────────────────────────────────

ProbeResult parse_status_document(std::string_view document) {
    try {
        auto root = toml::parse(document);
        const auto* runners = root["runners"].as_table();
        if (!runners) {
            return ProbeResult::unknown("status document has no [runners] table");
        }

        ProbeResult result;
        result.status = ProbeStatus::Known;
        for (const auto& [key, node] : *runners) {
            auto status = node.value<std::string>();
            if (!status) continue;
            std::string runner{key.str()};
            if (status_means_online(*status)) {
                result.online.insert(runner);
            } else {
                result.offline.insert(runner);
            }
        }
        return result;
    } catch (const toml::parse_error& err) {
        return ProbeResult::unknown("status document parse error: "
                                    + std::string{err.description()});
    }
}

StatusFileProber::StatusFileProber(std::filesystem::path path, std::chrono::seconds max_age)
    : path_(std::move(path)), max_age_(max_age) {}

ProbeResult StatusFileProber::probe() {
    std::error_code ec;
    auto modified = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        return ProbeResult::unknown("status file unavailable: " + path_.string()
                                    + " (" + ec.message() + ")");
    }

    if (max_age_.count() > 0) {
        auto age = std::filesystem::file_time_type::clock::now() - modified;
        if (age > max_age_) {
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(age).count();
            return ProbeResult::unknown("status file is stale (" + std::to_string(seconds)
                                        + "s old)");
        }
    }

    std::ifstream in(path_);
    if (!in) {
        return ProbeResult::unknown("cannot open status file: " + path_.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_status_document(buffer.str());
}

// ─────────────────────────────────────────────
// CommandProber
// ─────────────────────────────────────────────

ProbeResult parse_status_lines(std::string_view output) {
    ProbeResult result;
    result.status = ProbeStatus::Known;
    size_t parsed = 0;

    std::istringstream lines{std::string{output}};
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string key;
        if (!(fields >> key) || key.front() == '#') continue;

        std::string status;
        std::string token;
        while (fields >> token) status = token;
        if (status.empty()) continue;

        if (status_means_online(status)) {
            result.online.insert(key);
        } else {
            result.offline.insert(key);
        }
        ++parsed;
    }

    if (parsed == 0) return ProbeResult::unknown("status command produced no status lines");
    return result;
}

CommandProber::CommandProber(std::vector<std::string> command, uint32_t timeout_ms)
    : command_(std::move(command)), timeout_ms_(timeout_ms) {}

ProbeResult CommandProber::probe() {
    auto run = run_command(CommandSpec{.argv = command_, .timeout_ms = timeout_ms_});
    if (!run) {
        return ProbeResult::unknown("status command could not start: " + run.error().message);
    }
    if (run->timed_out) {
        return ProbeResult::unknown("status command timed out after "
                                    + std::to_string(timeout_ms_) + "ms");
    }
    if (run->exit_code != 0) {
        return ProbeResult::unknown("status command exited " + std::to_string(run->exit_code)
                                    + ": " + run->stderr_text);
    }
    return parse_status_lines(run->stdout_text);
}

}  // namespace fleet_router
