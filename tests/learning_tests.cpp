#include <gtest/gtest.h>
#include "modules/LearningPolicy.h"
#include "ScriptedRandom.h"

namespace {
Observation makeObservation(double energy, int nearby, int infected, double resource, int age = 0,
                            HealthStatus status = HealthStatus::Susceptible) {
    Observation obs;
    obs.energy = energy;
    obs.nearbyCount = nearby;
    obs.nearbyInfected = infected;
    obs.nearestResourceDistance = resource;
    obs.age = age;
    obs.status = status;
    return obs;
}
}

TEST(LearningPolicyTest, StateKeyBuckets) {
    EXPECT_EQ(LearningPolicy::discretizeState(makeObservation(60, 5, 3, 4, 0, HealthStatus::Infected)),
              "2_3_2_0_Infected");
    EXPECT_EQ(LearningPolicy::discretizeState(makeObservation(100, 1, 0, 5)), "4_1_0_1_Susceptible");
    EXPECT_EQ(LearningPolicy::discretizeState(makeObservation(24.9, 0, 1, 100, 0, HealthStatus::Recovered)),
              "0_0_1_1_Recovered");
}

TEST(LearningPolicyTest, RewardTerms) {
    EXPECT_NEAR(LearningPolicy::reward(makeObservation(40, 0, 1, 5, 100)), 0.4 - 2.0 + 5.0 - 0.1, 1e-12);
    // no food bonus when well fed or far from food
    EXPECT_NEAR(LearningPolicy::reward(makeObservation(80, 0, 0, 5, 0)), 0.8, 1e-12);
    EXPECT_NEAR(LearningPolicy::reward(makeObservation(20, 0, 0, 10, 0)), 0.2, 1e-12);
}

TEST(LearningPolicyTest, UnseenPairsAreZeroAndTiesFollowEnumeration) {
    LearningPolicy policy;
    EXPECT_DOUBLE_EQ(policy.qValue("0_0_0_0_Susceptible", ActionType::Flee), 0.0);
    EXPECT_EQ(policy.bestAction("0_0_0_0_Susceptible"), ActionType::Forage);

    policy.setQValue("s", ActionType::Flee, 0.5);
    policy.setQValue("s", ActionType::Explore, 0.5);
    EXPECT_EQ(policy.bestAction("s"), ActionType::Explore);
}

TEST(LearningPolicyTest, GreedySelectionUsesTable) {
    LearningPolicy policy;
    const Observation obs = makeObservation(60, 0, 0, 50);
    policy.setQValue(LearningPolicy::discretizeState(obs), ActionType::Flee, 1.0);

    ScriptedRandom rng({0.5, 0.0});   // no exploration, then speed draw
    const Intent intent = policy.selectAction(obs, rng);
    EXPECT_EQ(intent.type, ActionType::Flee);
    EXPECT_DOUBLE_EQ(intent.speed, 0.5);
}

TEST(LearningPolicyTest, ExplorationPicksRandomTypeAndSlowReproduce) {
    LearningPolicy policy;
    ScriptedRandom rng({0.1, 0.8});   // explore, index 3
    const Intent intent = policy.selectAction(makeObservation(60, 0, 0, 50), rng);
    EXPECT_EQ(intent.type, ActionType::Reproduce);
    EXPECT_DOUBLE_EQ(intent.speed, 0.2);
    EXPECT_EQ(rng.consumed(), 2u);
}

TEST(LearningPolicyTest, TemporalDifferenceUpdate) {
    LearningPolicy policy;
    const Observation first = makeObservation(30, 0, 0, 50);
    const Observation second = makeObservation(80, 0, 0, 50, 10);
    const std::string s1 = LearningPolicy::discretizeState(first);
    const std::string s2 = LearningPolicy::discretizeState(second);
    ASSERT_NE(s1, s2);
    policy.setQValue(s2, ActionType::Explore, 2.0);

    ScriptedRandom rng({}, 0.5);
    EXPECT_EQ(policy.selectAction(first, rng).type, ActionType::Forage);
    policy.selectAction(second, rng);

    // 0.1 * (0.79 + 0.9 * 2.0 - 0)
    EXPECT_NEAR(policy.qValue(s1, ActionType::Forage), 0.259, 1e-12);
    EXPECT_EQ(policy.lastState().value_or(""), s2);
}

TEST(LearningPolicyTest, SpeedIsNeverLearned) {
    LearningPolicy policy;
    SeededRandom rng(3);
    const Observation obs = makeObservation(70, 2, 0, 3);
    for (int i = 0; i < 100; ++i) {
        const Intent intent = policy.selectAction(obs, rng);
        if (intent.type == ActionType::Reproduce) {
            EXPECT_DOUBLE_EQ(intent.speed, 0.2);
        } else {
            EXPECT_GE(intent.speed, 0.5);
            EXPECT_LT(intent.speed, 1.0);
        }
    }
    EXPECT_LE(policy.tableSize(), 4u);
}
