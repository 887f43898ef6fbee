/**
 * @file capability_ontology.cpp
 * @brief CapabilityOntology implementation: fixed-point closure over implication rules.
 */

#include "ontology/capability_ontology.hpp"

#include <cmath>

namespace fleet_router {

namespace {

struct StandardCapability {
    std::string_view name;
    CapabilityType type;
};

constexpr StandardCapability kStandardCapabilities[] = {
    {"docker", CapabilityType::Executor},
    {"shell", CapabilityType::Executor},
    {"kubernetes", CapabilityType::Executor},
    {"container", CapabilityType::Executor},
    {"linux", CapabilityType::Platform},
    {"macos", CapabilityType::Platform},
    {"windows", CapabilityType::Platform},
    {"gcp", CapabilityType::Cloud},
    {"aws", CapabilityType::Cloud},
    {"azure", CapabilityType::Cloud},
    {"cloud", CapabilityType::Cloud},
    {"gpu", CapabilityType::Hardware},
    {"arm64", CapabilityType::Hardware},
    {"local", CapabilityType::Network},
    {"nordic", CapabilityType::Network},
    {"eu-west", CapabilityType::Network},
};

struct StandardRule {
    std::string_view from;
    std::string_view to;
};

constexpr StandardRule kStandardRules[] = {
    {"docker", "linux"},
    {"kubernetes", "container"},
    {"gcp", "cloud"},
    {"aws", "cloud"},
    {"azure", "cloud"},
    {"nordic", "eu-west"},
    {"nordic", "gcp"},
};

CapabilitySet lowered(const CapabilitySet& caps) {
    CapabilitySet out;
    for (const auto& cap : caps) {
        if (!cap.empty()) out.insert(to_lower(cap));
    }
    return out;
}

}  // anonymous namespace

CapabilityOntology::CapabilityOntology(bool with_standard_rules) {
    if (with_standard_rules) seed_standard_rules();
}

void CapabilityOntology::seed_standard_rules() {
    for (const auto& cap : kStandardCapabilities) {
        types_[std::string{cap.name}] = cap.type;
    }
    for (const auto& rule : kStandardRules) {
        implications_[std::string{rule.from}].insert(std::string{rule.to});
    }
}

void CapabilityOntology::add_implication(std::string_view from, std::string_view to) {
    auto lhs = to_lower(from);
    auto rhs = to_lower(to);
    if (lhs.empty() || rhs.empty() || lhs == rhs) return;
    implications_[lhs].insert(rhs);

    for (auto& [key, profile] : runners_) {
        profile.capabilities = close(profile.declared);
    }
}

void CapabilityOntology::define_capability(std::string_view name, CapabilityType type) {
    types_[to_lower(name)] = type;
}

CapabilityType CapabilityOntology::type_of(std::string_view name) const {
    auto it = types_.find(to_lower(name));
    return it != types_.end() ? it->second : CapabilityType::Custom;
}

CapabilitySet CapabilityOntology::close(const CapabilitySet& declared) const {
    CapabilitySet closure = declared;
    bool changed = true;
    while (changed) {
        changed = false;
        CapabilitySet additions;
        for (const auto& cap : closure) {
            auto it = implications_.find(cap);
            if (it == implications_.end()) continue;
            for (const auto& implied : it->second) {
                if (!closure.contains(implied)) additions.insert(implied);
            }
        }
        if (!additions.empty()) {
            closure.merge(additions);
            changed = true;
        }
    }
    return closure;
}

Result<void> CapabilityOntology::register_runner(RunnerProfile profile) {
    if (profile.key.empty()) {
        return Error{ErrorCode::InvalidArgument, "runner key must not be empty"};
    }
    if (!std::isfinite(profile.cost_per_minute) || profile.cost_per_minute < 0.0) {
        return Error{ErrorCode::InvalidArgument,
                     "runner '" + profile.key + "' has invalid cost_per_minute"};
    }
    if (profile.display_name.empty()) profile.display_name = profile.key;

    profile.declared = lowered(profile.declared);
    profile.capabilities = close(profile.declared);

    auto key = profile.key;
    runners_.insert_or_assign(std::move(key), std::move(profile));
    return {};
}

Result<void> CapabilityOntology::register_runner(const RunnerKey& key,
                                                 const CapabilitySet& declared,
                                                 double cost_per_minute) {
    RunnerProfile profile;
    profile.key = key;
    profile.declared = declared;
    profile.cost_per_minute = cost_per_minute;
    return register_runner(std::move(profile));
}

Result<CapabilitySet> CapabilityOntology::capabilities_of(const RunnerKey& key) const {
    auto it = runners_.find(key);
    if (it == runners_.end()) {
        return Error{ErrorCode::NotFound, "unknown runner: " + key};
    }
    return it->second.capabilities;
}

const RunnerProfile* CapabilityOntology::find(const RunnerKey& key) const {
    auto it = runners_.find(key);
    return it != runners_.end() ? &it->second : nullptr;
}

Result<RunnerProfile> CapabilityOntology::profile(const RunnerKey& key) const {
    if (const auto* found = find(key)) return *found;
    return Error{ErrorCode::NotFound, "unknown runner: " + key};
}

bool CapabilityOntology::contains(const RunnerKey& key) const {
    return runners_.contains(key);
}

std::vector<RunnerKey> CapabilityOntology::runner_keys() const {
    std::vector<RunnerKey> keys;
    keys.reserve(runners_.size());
    for (const auto& [key, profile] : runners_) keys.push_back(key);
    return keys;
}

std::vector<RunnerKey> CapabilityOntology::runners_with_capability(std::string_view cap) const {
    auto wanted = to_lower(cap);
    std::vector<RunnerKey> keys;
    for (const auto& [key, profile] : runners_) {
        if (profile.capabilities.contains(wanted)) keys.push_back(key);
    }
    return keys;
}

}  // namespace fleet_router
