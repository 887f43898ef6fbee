/**
 * @file job_parser.cpp
 * @brief RequirementParser and TOML job-file loading.
 */

#include "parser/job_parser.hpp"

#include <toml++/toml.hpp>

#include <cctype>
#include <charconv>
#include <limits>

namespace fleet_router {

namespace {

struct TagMapping {
    std::string_view tag;
    std::string_view capability;
    std::string_view also{};
};

constexpr TagMapping kDefaultTagTable[] = {
    {"docker-any", "docker"},
    {"docker", "docker"},
    {"shell", "shell"},
    {"kubernetes", "kubernetes"},
    {"k8s", "kubernetes"},
    {"gcp", "gcp"},
    {"aws", "aws"},
    {"azure", "azure"},
    {"gpu", "gpu"},
    {"nordic", "nordic", "gcp"},
    {"macos", "macos", "shell"},
    {"windows", "windows"},
    {"linux", "linux"},
    {"arm64", "arm64"},
    {"local", "local"},
};

struct SubstringRule {
    std::string_view needle;
    std::string_view capability;
};

// Image name fragments → preferred capability.
constexpr SubstringRule kImageRules[] = {
    {"nvidia", "gpu"},
    {"cuda", "gpu"},
    {"arm64", "arm64"},
    {"aarch64", "arm64"},
    {"windows", "windows"},
    {"alpine", "linux"},
    {"ubuntu", "linux"},
    {"debian", "linux"},
    {"centos", "linux"},
};

// Service name fragments → preferred capability.
constexpr SubstringRule kServiceRules[] = {
    {"docker:dind", "docker"},
    {"postgres", "linux"},
    {"mysql", "linux"},
    {"redis", "linux"},
    {"mongo", "linux"},
};

bool contains_ci(std::string_view haystack, std::string_view needle) {
    return to_lower(haystack).find(needle) != std::string::npos;
}

std::string trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string{text.substr(begin, end - begin)};
}

std::vector<std::string> string_list(const toml::node* node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (auto single = node->value<std::string>()) {
        out.push_back(*single);
    } else if (auto arr = node->as_array()) {
        for (const auto& element : *arr) {
            if (auto text = element.value<std::string>()) out.push_back(*text);
        }
    }
    return out;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// JobRequirement
// ─────────────────────────────────────────────

bool JobRequirement::is_feasible_for(const CapabilitySet& capabilities) const {
    for (const auto& cap : required) {
        if (!capabilities.contains(cap)) return false;
    }
    return true;
}

double JobRequirement::preference_score(const CapabilitySet& capabilities) const {
    if (preferred.empty()) return 1.0;
    size_t matched = 0;
    for (const auto& cap : preferred) {
        if (capabilities.contains(cap)) ++matched;
    }
    return static_cast<double>(matched) / static_cast<double>(preferred.size());
}

// ─────────────────────────────────────────────
// RequirementParser
// ─────────────────────────────────────────────

RequirementParser::RequirementParser() {
    for (const auto& mapping : kDefaultTagTable) {
        auto& caps = tag_table_[std::string{mapping.tag}];
        caps.insert(std::string{mapping.capability});
        if (!mapping.also.empty()) caps.insert(std::string{mapping.also});
    }
}

JobRequirement RequirementParser::parse(const JobDeclaration& job) const {
    JobRequirement req;
    req.job_name = job.name;
    req.tags = job.tags;

    for (const auto& tag : job.tags) {
        auto it = tag_table_.find(to_lower(trim(tag)));
        if (it == tag_table_.end()) continue;
        req.required.insert(it->second.begin(), it->second.end());
    }

    if (!job.image.empty()) {
        for (const auto& rule : kImageRules) {
            if (contains_ci(job.image, rule.needle)) {
                req.preferred.insert(std::string{rule.capability});
            }
        }
    }

    for (const auto& service : job.services) {
        for (const auto& rule : kServiceRules) {
            if (contains_ci(service, rule.needle)) {
                req.preferred.insert(std::string{rule.capability});
            }
        }
    }

    if (auto it = job.variables.find("CI_RUNNER_MEMORY"); it != job.variables.end()) {
        req.resource_hints["memory"] = it->second;
    }
    if (auto it = job.variables.find("CI_RUNNER_CPU"); it != job.variables.end()) {
        req.resource_hints["cpu"] = it->second;
    }

    if (!trim(job.timeout).empty()) {
        req.timeout_seconds = parse_timeout(job.timeout);
    }

    return req;
}

void RequirementParser::add_tag_mapping(std::string_view tag,
                                        std::vector<std::string> capabilities) {
    CapabilitySet caps;
    for (auto& cap : capabilities) {
        if (!cap.empty()) caps.insert(to_lower(cap));
    }
    tag_table_[to_lower(tag)] = std::move(caps);
}

CapabilitySet RequirementParser::capabilities_for_tag(std::string_view tag) const {
    auto it = tag_table_.find(to_lower(trim(tag)));
    return it != tag_table_.end() ? it->second : CapabilitySet{};
}

bool RequirementParser::knows_tag(std::string_view tag) const {
    return tag_table_.contains(to_lower(trim(tag)));
}

int64_t RequirementParser::parse_timeout(std::string_view text) {
    auto trimmed = trim(text);
    if (trimmed.empty() || trimmed.front() == '-') return kDefaultTimeoutSeconds;

    const char* first = trimmed.data();
    const char* last = trimmed.data() + trimmed.size();

    int64_t plain = 0;
    auto [end, ec] = std::from_chars(first, last, plain);
    if (ec == std::errc{} && end == last) {
        return plain;
    }

    // Scan "<digits><spaces><unit>" groups; the first letter of the unit decides.
    // Any group that does not fit in int64_t invalidates the whole string.
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t total = 0;
    bool matched = false;
    const char* p = first;
    while (p < last) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) {
            ++p;
            continue;
        }
        int64_t value = 0;
        auto [digits_end, digits_ec] = std::from_chars(p, last, value);
        if (digits_ec != std::errc{}) return kDefaultTimeoutSeconds;
        p = digits_end;
        while (p < last && std::isspace(static_cast<unsigned char>(*p))) ++p;
        if (p >= last) break;

        int64_t unit = 0;
        switch (std::tolower(static_cast<unsigned char>(*p))) {
            case 'h': unit = 3600; break;
            case 'm': unit = 60; break;
            case 's': unit = 1; break;
            default: continue;
        }
        if (value > (kMax - total) / unit) return kDefaultTimeoutSeconds;
        total += value * unit;
        matched = true;
    }
    return matched ? total : kDefaultTimeoutSeconds;
}

// ─────────────────────────────────────────────
// Job files
// ─────────────────────────────────────────────

namespace {

std::vector<JobDeclaration> jobs_from_table(const toml::table& doc) {
    std::vector<std::string> default_tags;
    if (const auto* defaults = doc["default"].as_table()) {
        default_tags = string_list(defaults->get("tags"));
    }

    std::vector<JobDeclaration> jobs;
    const auto* job_tables = doc["job"].as_table();
    if (!job_tables) return jobs;

    for (const auto& [name, node] : *job_tables) {
        const auto* entry = node.as_table();
        if (!entry) continue;

        JobDeclaration job;
        job.name = std::string{name.str()};
        if (entry->contains("tags")) {
            job.tags = string_list(entry->get("tags"));
        } else {
            job.tags = default_tags;
        }
        if (auto image = entry->get("image")) {
            job.image = image->value_or(std::string{});
        }
        job.services = string_list(entry->get("services"));

        if (const auto* vars = entry->get("variables"); vars && vars->is_table()) {
            for (const auto& [var_name, var_value] : *vars->as_table()) {
                if (auto text = var_value.value<std::string>()) {
                    job.variables[std::string{var_name.str()}] = *text;
                } else if (auto number = var_value.value<int64_t>()) {
                    job.variables[std::string{var_name.str()}] = std::to_string(*number);
                }
            }
        }

        if (const auto* timeout = entry->get("timeout")) {
            if (auto text = timeout->value<std::string>()) {
                job.timeout = *text;
            } else if (auto seconds = timeout->value<int64_t>()) {
                job.timeout = std::to_string(*seconds);
            }
        }
        jobs.push_back(std::move(job));
    }
    return jobs;
}

}  // anonymous namespace

Result<std::vector<JobDeclaration>> load_job_declarations(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "job file not found: " + path.string()};
    }
    try {
        auto doc = toml::parse_file(path.string());
        return jobs_from_table(doc);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidArgument,
                     "job file parse error: " + std::string{err.description()}};
    }
}

Result<std::vector<JobDeclaration>> parse_job_declarations(std::string_view toml_text) {
    try {
        auto doc = toml::parse(toml_text);
        return jobs_from_table(doc);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidArgument,
                     "job file parse error: " + std::string{err.description()}};
    }
}

}  // namespace fleet_router
