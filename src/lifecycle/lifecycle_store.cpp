/**
 * @file lifecycle_store.cpp
 * @brief FileLifecycleStore: TOML persistence of the lifecycle state.
 */

#include "lifecycle/lifecycle_store.hpp"

#include <toml++/toml.hpp>

#include <fstream>
#include <system_error>
#include <unistd.h>

namespace fleet_router {

namespace {

int64_t to_epoch_seconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_seconds(int64_t seconds) {
    return Timestamp{std::chrono::seconds{seconds}};
}

}  // anonymous namespace

FileLifecycleStore::FileLifecycleStore(std::filesystem::path path) : path_(std::move(path)) {}

Result<LifecycleState> FileLifecycleStore::load() {
    LifecycleState state;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return state;

    try {
        auto root = toml::parse_file(path_.string());
        state.auto_started = root["auto_started"].value_or(false);
        if (auto started = root["started_at"].value<int64_t>()) {
            state.started_at = from_epoch_seconds(*started);
        }
        if (auto deadline = root["shutdown_deadline"].value<int64_t>()) {
            state.shutdown_deadline = from_epoch_seconds(*deadline);
        }
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::LifecycleControl,
                     "corrupt lifecycle state " + path_.string() + ": "
                     + std::string{err.description()}};
    }
    return state;
}

Result<void> FileLifecycleStore::save(const LifecycleState& state) {
    toml::table root;
    root.insert_or_assign("auto_started", state.auto_started);
    if (state.started_at) {
        root.insert_or_assign("started_at", to_epoch_seconds(*state.started_at));
    }
    if (state.shutdown_deadline) {
        root.insert_or_assign("shutdown_deadline", to_epoch_seconds(*state.shutdown_deadline));
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    auto temp = path_;
    temp += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::LifecycleControl, "cannot write " + temp.string()};
        }
        out << root << '\n';
        if (!out.flush()) {
            return Error{ErrorCode::LifecycleControl, "short write to " + temp.string()};
        }
    }
    std::filesystem::rename(temp, path_, ec);
    if (ec) {
        return Error{ErrorCode::LifecycleControl,
                     "cannot replace " + path_.string() + ": " + ec.message()};
    }
    return {};
}

}  // namespace fleet_router
