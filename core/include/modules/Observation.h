#pragma once

#include <array>
#include <cstdint>

#include "modules/Health.h"
#include "utils/Geometry.h"

// Semantic action types shared by the learning policy and the reasoning
// engine. Enumeration order is the greedy tie-break order.
enum class ActionType : std::uint8_t {
    Forage = 0,
    Explore = 1,
    Flee = 2,
    Reproduce = 3,
    COUNT
};

constexpr std::array<ActionType, 4> kAllActionTypes = {
    ActionType::Forage, ActionType::Explore, ActionType::Flee, ActionType::Reproduce
};

const char* actionTypeName(ActionType type);

// A selected behaviour for one tick. speed is a 0..1 fraction of the agent's
// maximum speed.
struct Intent {
    ActionType type = ActionType::Explore;
    double speed = 0.6;
};

// What an agent perceives about its surroundings at one instant.
struct Observation {
    Vec3 position{};
    double energy = 0.0;
    int age = 0;
    HealthStatus status = HealthStatus::Susceptible;
    int nearbyCount = 0;              // other agents within kObservationRadius
    int nearbyInfected = 0;           // infected among them
    double nearestResourceDistance = 100.0;
};

namespace ObservationConstants {
    constexpr double kObservationRadius = 8.0;
    constexpr double kNoResourceDistance = 100.0;
}
