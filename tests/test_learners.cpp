#include <gtest/gtest.h>
#include "learning/sarsa_learner.hpp"
#include "learning/q_learner.hpp"
#include "learning/random_learner.hpp"

#include <set>
#include <sstream>
#include <stdexcept>

using namespace uavrl;

// Minimal state for driving learners directly
class FakeState : public State {
public:
    FakeState(std::string key, std::vector<int> valid)
        : key_(std::move(key)), valid_(std::move(valid)) {}
    const std::vector<int>& validActions() const override { return valid_; }
    std::string key() const override { return key_; }

private:
    std::string key_;
    std::vector<int> valid_;
};

static TabularConfig greedyConfig(double alpha, uint32_t seed = 7) {
    TabularConfig cfg;
    cfg.alpha = alpha;
    cfg.gamma = 0.9;
    cfg.seed = seed;
    return cfg;
}

static TabularConfig alwaysExploreConfig(double alpha, uint32_t seed) {
    TabularConfig cfg = greedyConfig(alpha, seed);
    cfg.exploration.initial = 1.0;
    cfg.exploration.factor = std::nullopt;
    cfg.exploration.floor = std::nullopt;
    return cfg;
}

// ─── SARSA update rule ─────────────────────────────────────────

TEST(SarsaTest, DefaultHyperparameters) {
    SarsaLearner sarsa(4);
    EXPECT_EQ(sarsa.name(), "SARSA");
    EXPECT_DOUBLE_EQ(sarsa.config().alpha, 0.3);
    EXPECT_DOUBLE_EQ(sarsa.config().gamma, 0.9);
    EXPECT_DOUBLE_EQ(sarsa.epsilon().value(), 0.9);
    EXPECT_TRUE(sarsa.isExploration());
}

TEST(SarsaTest, FirstCallSkipsUpdate) {
    SarsaLearner sarsa(4, false, greedyConfig(0.5));
    FakeState s("A", {0, 1});
    EXPECT_FALSE(sarsa.hasPrior());

    sarsa.getAction(s, 10.0);

    EXPECT_TRUE(sarsa.hasPrior());
    for (const auto& [key, row] : sarsa.table().rows()) {
        for (double v : row) EXPECT_DOUBLE_EQ(v, 0.0);
    }
}

TEST(SarsaTest, UpdateMovesTowardTarget) {
    SarsaLearner sarsa(4, false, greedyConfig(0.5));
    FakeState a("A", {0});
    FakeState b("B", {0, 1});
    sarsa.table().set("B", 1, 2.0);

    EXPECT_EQ(sarsa.getAction(a, std::nullopt), 0);
    EXPECT_EQ(sarsa.getAction(b, 1.0), 1);

    // target = 1 + 0.9 * Q(B,1) = 2.8, halfway from 0 is 1.4
    double q = sarsa.table().get("A", 0);
    EXPECT_DOUBLE_EQ(q, 1.4);
    EXPECT_GT(q, 0.0);
    EXPECT_LT(q, 2.8);
}

TEST(SarsaTest, ZeroLearningRateLeavesValueUnchanged) {
    SarsaLearner sarsa(4, false, greedyConfig(0.0));
    FakeState a("A", {0});
    FakeState b("B", {0, 1});
    sarsa.table().set("A", 0, 3.25);
    sarsa.table().set("B", 1, 2.0);

    sarsa.getAction(a, std::nullopt);
    sarsa.getAction(b, 100.0);

    EXPECT_DOUBLE_EQ(sarsa.table().get("A", 0), 3.25);
}

TEST(SarsaTest, MissingRewardSkipsUpdate) {
    SarsaLearner sarsa(4, false, greedyConfig(0.5));
    FakeState a("A", {0});
    FakeState b("B", {0});
    sarsa.getAction(a, std::nullopt);
    sarsa.getAction(b, std::nullopt);
    EXPECT_DOUBLE_EQ(sarsa.table().get("A", 0), 0.0);
}

TEST(SarsaTest, PriorPairSurvivesEpisodeBoundary) {
    // A -> T is one episode; the next one starts again in A with the
    // last reward still pending, so the terminal row T is learned too.
    SarsaLearner sarsa(4, false, greedyConfig(0.5));
    FakeState a("A", {0});
    FakeState t("T", {0});

    sarsa.getAction(a, std::nullopt);
    sarsa.getAction(t, 2.0);
    EXPECT_DOUBLE_EQ(sarsa.table().get("A", 0), 1.0);
    EXPECT_TRUE(sarsa.hasPrior());

    sarsa.getAction(a, 2.0);
    EXPECT_DOUBLE_EQ(sarsa.table().get("T", 0), 1.45);
}

TEST(SarsaTest, BootstrapUsesChosenAction) {
    // With uniform exploration the successor is valued by whichever
    // action was drawn, so both Q(B,0)=0 and Q(B,1)=10 show up.
    std::set<double> observed;
    for (uint32_t seed = 0; seed < 64; seed++) {
        SarsaLearner sarsa(4, true, alwaysExploreConfig(0.5, seed));
        FakeState a("A", {0});
        FakeState b("B", {0, 1});
        sarsa.table().set("B", 1, 10.0);

        sarsa.getAction(a, std::nullopt);
        sarsa.getAction(b, 0.0);
        observed.insert(sarsa.table().get("A", 0));
    }
    EXPECT_EQ(observed, (std::set<double>{0.0, 4.5}));
}

TEST(QLearnerTest, BootstrapUsesBestAction) {
    for (uint32_t seed = 0; seed < 32; seed++) {
        QLearner q(4, true, alwaysExploreConfig(0.5, seed));
        FakeState a("A", {0});
        FakeState b("B", {0, 1});
        q.table().set("B", 1, 10.0);

        q.getAction(a, std::nullopt);
        q.getAction(b, 0.0);
        EXPECT_DOUBLE_EQ(q.table().get("A", 0), 4.5);
    }
    EXPECT_EQ(QLearner(4).name(), "Q-Learning");
}

TEST(QLearnerTest, BestActionIgnoresInvalidMoves) {
    QLearner q(4, false, greedyConfig(1.0));
    FakeState a("A", {0});
    FakeState b("B", {0, 1});
    q.table().set("B", 2, 50.0);  // not valid in B
    q.table().set("B", 1, 1.0);

    q.getAction(a, std::nullopt);
    q.getAction(b, 0.0);
    EXPECT_DOUBLE_EQ(q.table().get("A", 0), 0.9);
}

// ─── Action selection ──────────────────────────────────────────

TEST(SarsaTest, GreedyPicksMaximumAmongValid) {
    SarsaLearner sarsa(4, false, greedyConfig(0.3));
    FakeState s("S", {0, 2});
    sarsa.table().set("S", 1, 100.0);  // invalid here
    sarsa.table().set("S", 2, 1.0);
    for (int i = 0; i < 20; i++) {
        EXPECT_EQ(sarsa.getAction(s, std::nullopt), 2);
    }
}

TEST(SarsaTest, TwoWayTieIsSplitEvenly) {
    SarsaLearner sarsa(4, false, greedyConfig(0.3, 12345));
    FakeState s("T", {1, 3});

    int ones = 0, threes = 0;
    const int trials = 10000;
    for (int i = 0; i < trials; i++) {
        int a = sarsa.getAction(s, std::nullopt);
        ASSERT_TRUE(a == 1 || a == 3);
        (a == 1 ? ones : threes)++;
    }
    EXPECT_NEAR(static_cast<double>(ones) / trials, 0.5, 0.05);
    EXPECT_NEAR(static_cast<double>(threes) / trials, 0.5, 0.05);
}

TEST(SarsaTest, ExplorationStaysWithinValidActions) {
    SarsaLearner sarsa(4, true, alwaysExploreConfig(0.3, 3));
    FakeState s("S", {2, 3});
    for (int i = 0; i < 200; i++) {
        int a = sarsa.getAction(s, std::nullopt);
        EXPECT_TRUE(a == 2 || a == 3);
    }
}

TEST(SarsaTest, DecaysOncePerCallInBothModes) {
    for (bool explore : {true, false}) {
        TabularConfig cfg = greedyConfig(0.3);
        cfg.exploration.initial = 0.8;
        cfg.exploration.factor = 0.5;
        cfg.exploration.floor = std::nullopt;
        SarsaLearner sarsa(4, explore, cfg);
        FakeState s("S", {0, 1});

        for (int i = 0; i < 3; i++) sarsa.getAction(s, 1.0);
        EXPECT_DOUBLE_EQ(sarsa.epsilon().value(), 0.1);
        ASSERT_TRUE(sarsa.explorationValue().has_value());
        EXPECT_DOUBLE_EQ(*sarsa.explorationValue(), 0.1);
    }
}

TEST(SarsaTest, SetExplorationReturnsPrevious) {
    SarsaLearner sarsa(4, true);
    EXPECT_TRUE(sarsa.setExploration(false));
    EXPECT_FALSE(sarsa.isExploration());
    EXPECT_FALSE(sarsa.setExploration(true));
    EXPECT_TRUE(sarsa.isExploration());
}

TEST(SarsaTest, StateWithoutActionsIsRejected) {
    SarsaLearner sarsa(4, false, greedyConfig(0.3));
    FakeState stuck("X", {});
    EXPECT_THROW(sarsa.getAction(stuck, std::nullopt), std::logic_error);
}

// ─── Random policy ─────────────────────────────────────────────

TEST(RandomLearnerTest, ChoosesOnlyValidActions) {
    RandomLearner random(99);
    FakeState s("S", {0, 3});
    std::set<int> seen;
    for (int i = 0; i < 200; i++) {
        seen.insert(random.getAction(s, 1.0));
    }
    EXPECT_EQ(seen, (std::set<int>{0, 3}));
    EXPECT_EQ(random.loadData(), -1);
    EXPECT_FALSE(random.saveData(3));
    EXPECT_FALSE(random.explorationValue().has_value());
    EXPECT_EQ(random.name(), "Random Action");
}
