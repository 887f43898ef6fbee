/**
 * @file test_lifecycle.cpp
 * @brief Unit tests for LifecycleController, its stores and compute controls.
 */

#include "lifecycle/compute_control.hpp"
#include "lifecycle/lifecycle_controller.hpp"
#include "lifecycle/lifecycle_store.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace fleet_router;
using namespace std::chrono_literals;

class LifecycleTest : public ::testing::Test {
protected:
    Timestamp now_ = Timestamp{std::chrono::seconds{1'760'000'000}};
    MockComputeControl compute_;
    InMemoryLifecycleStore store_;
    Logger logger_{std::make_unique<NullSink>()};
    LifecycleController controller_{compute_, store_, logger_, [this] { return now_; }};

    LifecycleState stored() { return *store_.load(); }
};

TEST_F(LifecycleTest, StartsCapacityOnce) {
    auto first = controller_.ensure_capacity();
    EXPECT_EQ(first.outcome, CapacityOutcome::Started);
    EXPECT_TRUE(first.capacity_available());
    EXPECT_EQ(first.detail, "mock capacity started");
    EXPECT_TRUE(stored().auto_started);
    EXPECT_EQ(stored().started_at, now_);

    auto second = controller_.ensure_capacity();
    EXPECT_EQ(second.outcome, CapacityOutcome::AlreadyStarted);
    EXPECT_EQ(compute_.start_calls(), 1u);
}

TEST_F(LifecycleTest, StartFailureLeavesStateUntouched) {
    compute_.set_start_fails(true);
    auto result = controller_.ensure_capacity();
    EXPECT_EQ(result.outcome, CapacityOutcome::Failed);
    EXPECT_FALSE(result.capacity_available());
    EXPECT_EQ(result.detail, "mock start failure");
    EXPECT_EQ(stored(), LifecycleState{});

    compute_.set_start_fails(false);
    EXPECT_EQ(controller_.ensure_capacity().outcome, CapacityOutcome::Started);
    EXPECT_EQ(compute_.start_calls(), 2u);
}

TEST_F(LifecycleTest, IdleShutdownAfterDelay) {
    ASSERT_EQ(controller_.ensure_capacity().outcome, CapacityOutcome::Started);
    ASSERT_TRUE(controller_.arm_idle_shutdown(300s));
    EXPECT_EQ(stored().shutdown_deadline, now_ + 300s);

    now_ += 299s;
    EXPECT_EQ(controller_.tick().outcome, StopOutcome::NotDue);
    EXPECT_EQ(compute_.stop_calls(), 0u);

    now_ += 1s;
    auto stop = controller_.tick();
    EXPECT_EQ(stop.outcome, StopOutcome::Stopped);
    EXPECT_EQ(compute_.stop_calls(), 1u);
    EXPECT_FALSE(compute_.running());
    EXPECT_EQ(stored(), LifecycleState{});

    now_ += 600s;
    EXPECT_EQ(controller_.tick().outcome, StopOutcome::NotDue);
    EXPECT_EQ(compute_.stop_calls(), 1u);
}

TEST_F(LifecycleTest, ActivityPushesDeadlineBack) {
    ASSERT_EQ(controller_.ensure_capacity().outcome, CapacityOutcome::Started);
    ASSERT_TRUE(controller_.arm_idle_shutdown(300s));

    now_ += 200s;
    ASSERT_TRUE(controller_.arm_idle_shutdown(300s));

    now_ += 200s;
    EXPECT_EQ(controller_.tick().outcome, StopOutcome::NotDue);
    now_ += 100s;
    EXPECT_EQ(controller_.tick().outcome, StopOutcome::Stopped);
    EXPECT_EQ(compute_.stop_calls(), 1u);
}

TEST_F(LifecycleTest, EnsureCapacityCancelsPendingShutdown) {
    ASSERT_EQ(controller_.ensure_capacity().outcome, CapacityOutcome::Started);
    ASSERT_TRUE(controller_.arm_idle_shutdown(300s));

    EXPECT_EQ(controller_.ensure_capacity().outcome, CapacityOutcome::AlreadyStarted);
    EXPECT_FALSE(stored().shutdown_deadline.has_value());

    now_ += 1h;
    EXPECT_EQ(controller_.tick().outcome, StopOutcome::NotDue);
    EXPECT_EQ(compute_.stop_calls(), 0u);
}

TEST_F(LifecycleTest, NeverStopsCapacityItDidNotStart) {
    EXPECT_FALSE(controller_.arm_idle_shutdown(300s));
    EXPECT_FALSE(stored().shutdown_deadline.has_value());

    auto result = controller_.on_idle_timeout();
    EXPECT_EQ(result.outcome, StopOutcome::NotAutoStarted);
    EXPECT_EQ(compute_.stop_calls(), 0u);
}

TEST_F(LifecycleTest, StrayDeadlineWithoutAutoStartIsCleared) {
    LifecycleState stray;
    stray.shutdown_deadline = now_ - 10s;
    ASSERT_TRUE(store_.save(stray));

    EXPECT_EQ(controller_.tick().outcome, StopOutcome::NotAutoStarted);
    EXPECT_EQ(compute_.stop_calls(), 0u);
    EXPECT_FALSE(stored().shutdown_deadline.has_value());
}

TEST_F(LifecycleTest, StopFailureRetriesOnNextTick) {
    ASSERT_EQ(controller_.ensure_capacity().outcome, CapacityOutcome::Started);
    ASSERT_TRUE(controller_.arm_idle_shutdown(60s));
    compute_.set_stop_fails(true);

    now_ += 61s;
    EXPECT_EQ(controller_.tick().outcome, StopOutcome::Failed);
    EXPECT_TRUE(stored().auto_started);
    EXPECT_TRUE(stored().shutdown_deadline.has_value());

    compute_.set_stop_fails(false);
    EXPECT_EQ(controller_.tick().outcome, StopOutcome::Stopped);
    EXPECT_EQ(compute_.stop_calls(), 2u);
    EXPECT_FALSE(stored().auto_started);
}

TEST_F(LifecycleTest, StatusReportsRemainingTime) {
    auto idle = controller_.status();
    EXPECT_TRUE(idle.enabled);
    EXPECT_FALSE(idle.until_shutdown.has_value());

    ASSERT_EQ(controller_.ensure_capacity().outcome, CapacityOutcome::Started);
    ASSERT_TRUE(controller_.arm_idle_shutdown(300s));
    now_ += 100s;
    auto status = controller_.status();
    EXPECT_TRUE(status.state.auto_started);
    ASSERT_TRUE(status.until_shutdown.has_value());
    EXPECT_EQ(status.until_shutdown->count(), 200);
}

TEST(LifecycleDisabledTest, DisabledControllerDoesNothing) {
    MockComputeControl compute;
    InMemoryLifecycleStore store;
    Logger logger{std::make_unique<NullSink>()};
    LifecycleController controller(compute, store, logger, system_clock_fn(), false);

    EXPECT_EQ(controller.ensure_capacity().outcome, CapacityOutcome::Disabled);
    EXPECT_FALSE(controller.arm_idle_shutdown(1s));
    EXPECT_EQ(controller.tick().outcome, StopOutcome::NotDue);
    EXPECT_FALSE(controller.enabled());
    EXPECT_EQ(compute.start_calls(), 0u);
}

// ─── FileLifecycleStore ──────────────────────

class FileLifecycleStoreTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "fr_test_lifecycle";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(FileLifecycleStoreTest, MissingFileIsInitialState) {
    FileLifecycleStore store(temp_dir_ / "lifecycle.toml");
    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(*loaded, LifecycleState{});
}

TEST_F(FileLifecycleStoreTest, PersistsAcrossInstances) {
    auto path = temp_dir_ / "state" / "lifecycle.toml";
    LifecycleState state;
    state.auto_started = true;
    state.started_at = Timestamp{std::chrono::seconds{1'760'000'000}};
    state.shutdown_deadline = Timestamp{std::chrono::seconds{1'760'000'300}};
    ASSERT_TRUE(FileLifecycleStore(path).save(state));

    auto loaded = FileLifecycleStore(path).load();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(*loaded, state);

    ASSERT_TRUE(FileLifecycleStore(path).save(LifecycleState{}));
    EXPECT_EQ(*FileLifecycleStore(path).load(), LifecycleState{});
}

TEST_F(FileLifecycleStoreTest, CorruptFileIsAnError) {
    std::filesystem::create_directories(temp_dir_);
    auto path = temp_dir_ / "lifecycle.toml";
    std::ofstream(path) << "auto_started = maybe";

    auto loaded = FileLifecycleStore(path).load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::LifecycleControl);
}

TEST_F(FileLifecycleStoreTest, ControllerTreatsCorruptStateAsNothingStarted) {
    std::filesystem::create_directories(temp_dir_);
    auto path = temp_dir_ / "lifecycle.toml";
    std::ofstream(path) << "auto_started = maybe";

    MockComputeControl compute;
    FileLifecycleStore store(path);
    Logger logger{std::make_unique<NullSink>()};
    LifecycleController controller(compute, store, logger);

    EXPECT_EQ(controller.on_idle_timeout().outcome, StopOutcome::NotAutoStarted);
    EXPECT_EQ(compute.stop_calls(), 0u);
}

// ─── Compute controls ────────────────────────

TEST(ComputeControlTest, CommandControlRunsCommands) {
    CommandComputeControl control({"/bin/sh", "-c", "exit 0"}, {"/bin/sh", "-c", "exit 4"}, 5000);
    auto started = control.start();
    ASSERT_TRUE(started.has_value()) << started.error().message;
    EXPECT_EQ(*started, "/bin/sh -c exit 0");

    auto stopped = control.stop();
    ASSERT_FALSE(stopped.has_value());
    EXPECT_EQ(stopped.error().code, ErrorCode::LifecycleControl);
    EXPECT_NE(stopped.error().message.find("exited 4"), std::string::npos);
}

TEST(ComputeControlTest, CommandControlWithoutCommandFails) {
    CommandComputeControl control({}, {"/bin/sh", "-c", "true"});
    auto started = control.start();
    ASSERT_FALSE(started.has_value());
    EXPECT_NE(started.error().message.find("start_command"), std::string::npos);
}

TEST(ComputeControlTest, NullControlAlwaysFails) {
    NullComputeControl control;
    EXPECT_FALSE(control.start().has_value());
    EXPECT_FALSE(control.stop().has_value());
    EXPECT_EQ(control.name(), "none");
}
