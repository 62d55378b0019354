#include <gtest/gtest.h>
#include "persistence/snapshot_store.hpp"
#include "learning/sarsa_learner.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using namespace uavrl;
namespace fs = std::filesystem;

class SnapshotTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() /
               ("uavrl_snapshot_" + std::to_string(tick) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    TabularConfig config() const {
        TabularConfig cfg;
        cfg.seed = 1;
        cfg.snapshot_dir = dir_.string();
        return cfg;
    }

    void writeFile(const fs::path& path, const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    fs::path dir_;
    std::ostringstream quiet_;
};

TEST_F(SnapshotTest, SaveThenLoadRoundTrip) {
    SarsaLearner writer(4, true, config());
    writer.setLog(quiet_);
    writer.table().assign("(2,3,1)", {0.1, 0.2, 0.3, 0.4});
    writer.epsilon().setValue(0.4321);

    ASSERT_TRUE(writer.saveData(7));
    const std::string saved = writer.lastSnapshotPath();
    ASSERT_TRUE(fs::exists(saved));

    fs::copy_file(saved, dir_ / "SARSA-load.json");

    SarsaLearner reader(4, true, config());
    reader.setLog(quiet_);
    EXPECT_EQ(reader.loadData(), 7);
    EXPECT_EQ(reader.table().get("(2,3,1)"), (std::vector<double>{0.1, 0.2, 0.3, 0.4}));
    EXPECT_EQ(reader.table().size(), 1u);
    EXPECT_DOUBLE_EQ(reader.epsilon().value(), 0.4321);
}

TEST_F(SnapshotTest, SavedFileHasReservedKeys) {
    SarsaLearner writer(4, true, config());
    writer.table().assign("(0,14,0)", {1.0, 2.0, 3.0, 4.0});
    ASSERT_TRUE(writer.saveData(12));

    std::ifstream in(writer.lastSnapshotPath());
    nlohmann::json doc = nlohmann::json::parse(in);
    EXPECT_EQ(doc["round"].get<int>(), 12);
    EXPECT_TRUE(doc["epsilon"].is_number());
    ASSERT_TRUE(doc["(0,14,0)"].is_array());
    EXPECT_EQ(doc["(0,14,0)"].size(), 4u);

    const std::string filename = fs::path(writer.lastSnapshotPath()).filename().string();
    EXPECT_EQ(filename.rfind("SARSA-[", 0), 0);
    EXPECT_EQ(filename.substr(filename.size() - 5), ".json");
}

TEST_F(SnapshotTest, MissingSnapshotLeavesLearnerUntouched) {
    SarsaLearner learner(4, true, config());
    learner.setLog(quiet_);
    learner.table().set("(1,1,1)", 0, 5.0);
    const double eps = learner.epsilon().value();

    EXPECT_EQ(learner.loadData(), -1);
    EXPECT_DOUBLE_EQ(learner.table().get("(1,1,1)", 0), 5.0);
    EXPECT_DOUBLE_EQ(learner.epsilon().value(), eps);
    EXPECT_NE(quiet_.str().find("not found"), std::string::npos);
}

TEST_F(SnapshotTest, InvalidJsonIsRejected) {
    writeFile(dir_ / "SARSA-load.json", "{ \"(0,0,0)\": [1, 2, 3, 4], ");

    SarsaLearner learner(4, true, config());
    learner.table().set("(1,1,1)", 0, 5.0);
    EXPECT_THROW(learner.loadData(), SnapshotError);
    EXPECT_DOUBLE_EQ(learner.table().get("(1,1,1)", 0), 5.0);
}

TEST_F(SnapshotTest, WrongRowWidthIsRejected) {
    writeFile(dir_ / "SARSA-load.json",
              R"json({"(0,0,0)": [1, 2, 3], "round": 3, "epsilon": 0.5})json");
    SarsaLearner learner(4, true, config());
    EXPECT_THROW(learner.loadData(), SnapshotError);
    EXPECT_EQ(learner.table().size(), 0u);
}

TEST_F(SnapshotTest, NonNumericRowIsRejected) {
    writeFile(dir_ / "SARSA-load.json",
              R"json({"(0,0,0)": [1, "x", 3, 4], "round": 3, "epsilon": 0.5})json");
    SarsaLearner learner(4, true, config());
    EXPECT_THROW(learner.loadData(), SnapshotError);
}

TEST_F(SnapshotTest, ReservedKeysAreRequired) {
    SnapshotStore store(dir_.string());

    writeFile(dir_ / "no_round.json", R"json({"(0,0,0)": [1, 2, 3, 4], "epsilon": 0.5})json");
    EXPECT_THROW(store.load((dir_ / "no_round.json").string(), 4), SnapshotError);

    writeFile(dir_ / "no_eps.json", R"json({"(0,0,0)": [1, 2, 3, 4], "round": 2})json");
    EXPECT_THROW(store.load((dir_ / "no_eps.json").string(), 4), SnapshotError);

    writeFile(dir_ / "bad_round.json", R"({"round": 2.5, "epsilon": 0.5})");
    EXPECT_THROW(store.load((dir_ / "bad_round.json").string(), 4), SnapshotError);

    writeFile(dir_ / "array.json", R"([1, 2, 3])");
    EXPECT_THROW(store.load((dir_ / "array.json").string(), 4), SnapshotError);
}

TEST_F(SnapshotTest, SavesNeverOverwrite) {
    SnapshotStore store(dir_.string());
    SnapshotData first;
    first.round = 1;
    SnapshotData second;
    second.round = 2;

    const std::time_t when = 1700000000;
    const std::string p1 = store.save("SARSA", first, when);
    const std::string p2 = store.save("SARSA", second, when);

    EXPECT_NE(p1, p2);
    ASSERT_TRUE(fs::exists(p1));
    ASSERT_TRUE(fs::exists(p2));

    auto loaded1 = store.load(p1, 4);
    auto loaded2 = store.load(p2, 4);
    ASSERT_TRUE(loaded1.has_value());
    ASSERT_TRUE(loaded2.has_value());
    EXPECT_EQ(loaded1->round, 1);
    EXPECT_EQ(loaded2->round, 2);

    for (const auto& entry : fs::directory_iterator(dir_)) {
        EXPECT_NE(entry.path().extension(), ".tmp");
    }
}

TEST_F(SnapshotTest, LoadPathUsesLearnerName) {
    SnapshotStore store(dir_.string());
    EXPECT_EQ(fs::path(store.loadPath("Q-Learning")).filename().string(), "Q-Learning-load.json");
}

TEST_F(SnapshotTest, UnrepresentableTimeIsAnError) {
    SnapshotStore store(dir_.string());
    const std::time_t never = std::numeric_limits<std::time_t>::max();

    EXPECT_THROW(store.uniquePath("SARSA", never), std::runtime_error);
    EXPECT_THROW(store.save("SARSA", SnapshotData{}, never), std::runtime_error);

    for (const auto& entry : fs::directory_iterator(dir_)) {
        ADD_FAILURE() << "unexpected file " << entry.path();
    }
}
