#include <gtest/gtest.h>
#include <cmath>
#include "modules/Environment.h"
#include "utils/IdGenerator.h"
#include "ScriptedRandom.h"

namespace {
Resource makeResource(const std::string& id, double x, double z, double value = 20.0) {
    Resource r;
    r.id = id;
    r.position = {x, z};
    r.value = value;
    r.quality = 0.5;
    return r;
}
}

TEST(EnvironmentTest, ThresholdAndPressure) {
    Environment env(100.0);
    EXPECT_DOUBLE_EQ(env.survivalThreshold(10), 10.0);
    EXPECT_DOUBLE_EQ(env.survivalThreshold(50), 15.0);
    EXPECT_DOUBLE_EQ(env.pressure(50), 0.5);
    EXPECT_DOUBLE_EQ(env.pressure(250), 2.0);

    Environment crowded(20.0);
    EXPECT_DOUBLE_EQ(crowded.survivalThreshold(20), 30.0);
    EXPECT_DOUBLE_EQ(crowded.pressure(20), 1.0);
}

TEST(EnvironmentTest, SeasonalCeiling) {
    Environment env;
    EXPECT_EQ(env.season(), Season::Spring);
    EXPECT_EQ(env.maxResources(), 84);
    EXPECT_DOUBLE_EQ(Environment::seasonMultiplier(Season::Winter), 0.6);
    EXPECT_DOUBLE_EQ(Environment::seasonMultiplier(Season::Summer), 1.2);
    EXPECT_DOUBLE_EQ(Environment::seasonMultiplier(Season::Autumn), 1.0);
}

TEST(EnvironmentTest, StartsEmpty) {
    Environment env;
    EXPECT_TRUE(env.resources().empty());
    EXPECT_EQ(env.cycleStep(), 0u);
    double d = 0.0;
    EXPECT_EQ(env.nearestResource({0, 1, 0}, &d), nullptr);
    EXPECT_TRUE(std::isinf(d));
}

TEST(EnvironmentTest, SeasonCycle) {
    Environment env;
    ScriptedRandom rng({}, 0.99);
    IdGenerator ids;
    for (int i = 0; i < 149; ++i) env.update(rng, ids);
    EXPECT_EQ(env.season(), Season::Spring);

    env.update(rng, ids);
    EXPECT_EQ(env.cycleStep(), 150u);
    EXPECT_EQ(env.season(), Season::Summer);
    EXPECT_NEAR(env.temperature(), 20.0, 1e-9);

    for (int i = 150; i < 300; ++i) env.update(rng, ids);
    EXPECT_EQ(env.season(), Season::Autumn);

    for (int i = 300; i < 450; ++i) env.update(rng, ids);
    EXPECT_EQ(env.season(), Season::Winter);
    EXPECT_EQ(env.maxResources(), 24);

    for (int i = 450; i < 600; ++i) env.update(rng, ids);
    EXPECT_EQ(env.season(), Season::Spring);
    EXPECT_EQ(env.weather(), Weather::Clear);
}

TEST(EnvironmentTest, EmergencyFloorWhenRegenerationMisses) {
    Environment env;
    ScriptedRandom rng({}, 0.99);
    IdGenerator ids;
    env.update(rng, ids);

    ASSERT_EQ(env.resources().size(), 5u);
    for (const auto& r : env.resources()) {
        EXPECT_DOUBLE_EQ(r.value, 25.0);
        EXPECT_DOUBLE_EQ(r.quality, 0.8);
        EXPECT_NEAR(r.position.x, 9.8, 1e-9);
        EXPECT_EQ(r.id.rfind("emergency_", 0), 0u);
    }
    EXPECT_EQ(env.resources().front().id, "emergency_0");

    env.update(rng, ids);
    EXPECT_EQ(env.resources().size(), 10u);
    env.update(rng, ids);
    EXPECT_EQ(env.resources().size(), 10u);
}

TEST(EnvironmentTest, RegenerationBatchThenEmergency) {
    Environment env;
    ScriptedRandom rng({}, 0.0);
    IdGenerator ids;
    env.update(rng, ids);

    // batch of three plus the emergency five, both judged on the empty start
    ASSERT_EQ(env.resources().size(), 8u);
    const Resource& first = env.resources().front();
    EXPECT_EQ(first.id, "resource_0");
    EXPECT_DOUBLE_EQ(first.value, 10.0);
    EXPECT_NEAR(first.position.x, 3.0, 1e-12);
    EXPECT_NEAR(first.position.z, 0.0, 1e-12);
    EXPECT_EQ(env.resources()[3].id, "emergency_3");
}

TEST(EnvironmentTest, ConsumeAndQuery) {
    Environment env;
    env.resourcesMut().push_back(makeResource("a", 3.0, 0.0));
    env.resourcesMut().push_back(makeResource("b", 2.9, 0.0));
    env.resourcesMut().push_back(makeResource("c", -10.0, 4.0));

    const auto near = env.resourcesWithin({0, 1, 0}, 3.0);
    ASSERT_EQ(near.size(), 1u);
    EXPECT_EQ(near.front(), "b");

    double d = 0.0;
    const Resource* nearest = env.nearestResource({0, 1, 0}, &d);
    ASSERT_NE(nearest, nullptr);
    EXPECT_EQ(nearest->id, "b");
    EXPECT_NEAR(d, 2.9, 1e-12);

    EXPECT_TRUE(env.consume("b"));
    EXPECT_FALSE(env.consume("b"));
    EXPECT_EQ(env.find("b"), nullptr);
    ASSERT_NE(env.find("c"), nullptr);
    EXPECT_EQ(env.resources().size(), 2u);
}

TEST(EnvironmentTest, ResetClearsState) {
    Environment env;
    ScriptedRandom rng({}, 0.0);
    IdGenerator ids;
    for (int i = 0; i < 10; ++i) env.update(rng, ids);
    env.reset();
    EXPECT_TRUE(env.resources().empty());
    EXPECT_EQ(env.cycleStep(), 0u);
    EXPECT_EQ(env.season(), Season::Spring);
    EXPECT_EQ(env.weather(), Weather::Clear);
}
