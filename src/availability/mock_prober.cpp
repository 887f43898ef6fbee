/**
 * @file mock_prober.cpp
 * @brief MockProber implementation: scripted availability for testing.
 */

#include "availability/prober.hpp"

namespace fleet_router {

ProbeResult MockProber::probe() {
    ++probes_;
    return next_;
}

void MockProber::set_online(std::set<RunnerKey> online, std::set<RunnerKey> offline) {
    next_ = ProbeResult{};
    next_.status = ProbeStatus::Known;
    next_.online = std::move(online);
    next_.offline = std::move(offline);
}

void MockProber::set_all_offline(std::set<RunnerKey> offline) {
    set_online({}, std::move(offline));
}

void MockProber::set_unknown(std::string reason) {
    next_ = ProbeResult::unknown(std::move(reason));
}

}  // namespace fleet_router
