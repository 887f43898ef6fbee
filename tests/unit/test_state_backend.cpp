/**
 * @file test_state_backend.cpp
 * @brief Unit tests for the state document codec and the state backends.
 */

#include "bandit/state_backend.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace fleet_router;

namespace {

BanditState sample_state() {
    BanditState state;
    state["mac-docker"].record(true, 30.0, 1.0 / 0.6);
    state["mac-docker"].record(true, 30.0, 1.0 / 0.6);
    state["gcp-shell"].record(false, 120.0, 0.0);
    return state;
}

}  // namespace

// ─── Codec ───────────────────────────────────

TEST(StateCodecTest, SerializedDocumentParsesBack) {
    auto state = sample_state();
    auto text = serialize_state(state, "ucb1");
    EXPECT_NE(text.find("algorithm"), std::string::npos);
    EXPECT_NE(text.find("ucb1"), std::string::npos);
    EXPECT_NE(text.find("total_pulls = 3"), std::string::npos);

    auto parsed = parse_state(text);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(*parsed, state);
}

TEST(StateCodecTest, RewardsSurviveWithFullPrecision) {
    BanditState state;
    state["r1"].record(true, 0.1, 1.0 / 3.0);
    state["r1"].record(true, 1e-7, 1.0 / 0.7);
    state["r2"].record(false, 12345.678901234567, 0.0);

    auto parsed = parse_state(serialize_state(state, "thompson"));
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(parsed->at("r1").total_reward, state.at("r1").total_reward);
    EXPECT_EQ(parsed->at("r1").total_duration_seconds, state.at("r1").total_duration_seconds);
    EXPECT_EQ(*parsed, state);
}

TEST(StateCodecTest, MissingFieldsDefaultToZero) {
    auto parsed = parse_state(R"(
        [runners.r1]
        pulls = 4
        total_reward = 2.5
    )");
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    const auto& arm = parsed->at("r1");
    EXPECT_EQ(arm.pulls, 4u);
    EXPECT_DOUBLE_EQ(arm.total_reward, 2.5);
    EXPECT_EQ(arm.successes, 0u);
    EXPECT_EQ(arm.failures, 0u);
    EXPECT_DOUBLE_EQ(arm.total_duration_seconds, 0.0);
    EXPECT_DOUBLE_EQ(arm.mean_reward(), 0.625);
}

TEST(StateCodecTest, EmptyDocumentIsEmptyState) {
    auto parsed = parse_state("");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->empty());
}

TEST(StateCodecTest, CorruptDocument) {
    auto parsed = parse_state("runners = [[[");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::StatePersistence);

    auto wrong_shape = parse_state("[runners]\nr1 = 5\n");
    ASSERT_FALSE(wrong_shape.has_value());
    EXPECT_EQ(wrong_shape.error().code, ErrorCode::StatePersistence);
}

// ─── InMemory ────────────────────────────────

TEST(InMemoryStateBackendTest, SaveThenLoad) {
    InMemoryStateBackend backend;
    EXPECT_TRUE(backend.load()->empty());

    ASSERT_TRUE(backend.save(sample_state()));
    EXPECT_EQ(*backend.load(), sample_state());
    EXPECT_EQ(backend.save_count(), 1u);
    EXPECT_EQ(backend.name(), "memory");
}

// ─── File ────────────────────────────────────

class FileStateBackendTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "fr_test_state";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(FileStateBackendTest, MissingFileIsEmptyState) {
    FileStateBackend backend(temp_dir_ / "absent.toml");
    auto loaded = backend.load();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_TRUE(loaded->empty());
}

TEST_F(FileStateBackendTest, SaveCreatesDirectoriesAndPersists) {
    auto path = temp_dir_ / "nested" / "bandit_state.toml";
    {
        FileStateBackend backend(path, "thompson");
        ASSERT_TRUE(backend.save(sample_state()));
    }
    EXPECT_TRUE(std::filesystem::exists(path));

    FileStateBackend reopened(path);
    auto loaded = reopened.load();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded->size(), 2u);
    EXPECT_EQ(loaded->at("mac-docker").pulls, 2u);

    // No temp files left behind.
    size_t entries = 0;
    for ([[maybe_unused]] const auto& entry :
         std::filesystem::directory_iterator(path.parent_path())) {
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(FileStateBackendTest, SavingLoadedStateLeavesDocumentUnchanged) {
    auto path = temp_dir_ / "bandit_state.toml";
    FileStateBackend backend(path, "ucb1");
    ASSERT_TRUE(backend.save(sample_state()));

    auto read_text = [&] {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    };
    auto first = read_text();

    auto loaded = backend.load();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(*loaded, sample_state());
    ASSERT_TRUE(backend.save(*loaded));
    EXPECT_EQ(read_text(), first);

    auto reloaded = backend.load();
    ASSERT_TRUE(reloaded.has_value()) << reloaded.error().message;
    EXPECT_EQ(*reloaded, sample_state());
}

TEST_F(FileStateBackendTest, CorruptFileIsAnError) {
    std::filesystem::create_directories(temp_dir_);
    auto path = temp_dir_ / "corrupt.toml";
    std::ofstream(path) << "this is not toml [[[";

    FileStateBackend backend(path);
    auto loaded = backend.load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::StatePersistence);
}

// ─── Command ─────────────────────────────────

TEST_F(FileStateBackendTest, CommandBackendRoundTripsThroughShell) {
    std::filesystem::create_directories(temp_dir_);
    auto blob = (temp_dir_ / "remote.toml").string();
    CommandStateBackend backend(
        {"/bin/sh", "-c", "cat \"$0\" 2>/dev/null || true", blob},
        {"/bin/sh", "-c", "cat > \"$0\"", blob},
        5000, "ucb1");

    auto empty = backend.load();
    ASSERT_TRUE(empty.has_value()) << empty.error().message;
    EXPECT_TRUE(empty->empty());

    ASSERT_TRUE(backend.save(sample_state()));
    auto loaded = backend.load();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded->at("mac-docker").successes, 2u);
    EXPECT_EQ(backend.name(), "command");
}

TEST(CommandStateBackendTest, FetchFailureIsAnError) {
    CommandStateBackend backend({"/bin/sh", "-c", "echo denied 1>&2; exit 1"},
                                {"/bin/sh", "-c", "cat > /dev/null"});
    auto loaded = backend.load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::StatePersistence);
    EXPECT_NE(loaded.error().message.find("denied"), std::string::npos);
}

TEST(CommandStateBackendTest, StoreFailureIsAnError) {
    CommandStateBackend backend({"/bin/sh", "-c", "true"},
                                {"/bin/sh", "-c", "cat > /dev/null; exit 2"});
    auto saved = backend.save(BanditState{});
    ASSERT_FALSE(saved);
    EXPECT_EQ(saved.error().code, ErrorCode::StatePersistence);
}
