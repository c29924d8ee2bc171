#ifndef AGENT_BEHAVIOR_H
#define AGENT_BEHAVIOR_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "kernel/Agent.h"
#include "modules/Environment.h"
#include "modules/Health.h"

class RandomSource;
class IdGenerator;
class EventLog;
class ReasoningQueue;

enum class StepOutcome : std::uint8_t {
    Continue = 0,
    Die,
    Reproduce
};

namespace AgentConstants {
    constexpr double kWorldBound = 20.0;
    constexpr double kVelocityDamping = 0.8;
    constexpr double kBounceFactor = -0.5;

    constexpr double kFleeRadius = 10.0;
    constexpr double kExploreScale = 0.7;
    constexpr double kWanderScale = 0.3;
    constexpr double kTipHungerThreshold = 40.0;
    constexpr double kDangerZoneReach = 2.0;          // multiple of zone radius

    constexpr double kTargetArrivalRadius = 0.5;
    constexpr double kArrivalDamping = 0.5;

    constexpr int kHardPopulationCap = 200;
    constexpr double kBaseReproductionRate = 0.01;
    constexpr double kMinReproductionEnergy = 30.0;
    constexpr double kReproductionMargin = 10.0;
    constexpr int kMinReproductionAge = 20;
    constexpr int kReproductionCooldown = 60;
    constexpr double kReproductionCost = 15.0;
    constexpr double kOffspringJitter = 3.0;

    constexpr double kCommunicationChance = 0.4;
}

// Everything an agent update may read or write besides the agent itself.
// `agents` is the in-progress list; its size is the population used for
// pressure and thresholds.
struct TickContext {
    std::uint64_t tick = 0;
    Environment& environment;
    std::vector<Agent>& agents;
    RandomSource& rng;
    IdGenerator& ids;
    ReasoningQueue& reasoning;
    EventLog& events;

    int hardCap = AgentConstants::kHardPopulationCap;
    double reasoningFrequency = ReasoningConstants::kDefaultFrequency;
    double communicationChance = AgentConstants::kCommunicationChance;
};

// Per-kind constants and update routine.
struct AgentBehavior {
    const char* name;
    UpkeepProfile upkeep;
    MortalityProfile mortality;
    InfectionProfile infection;
    bool social;        // messaging and reasoning
    bool reproduces;
    StepOutcome (*update)(std::size_t index, TickContext& ctx);
};

const AgentBehavior& behaviorFor(AgentKind kind);

// Runs one tick for agents[index] through its kind's behaviour.
StepOutcome updateAgent(std::size_t index, TickContext& ctx);

// Draws a position, genotype and (causal) personality in that order.
Agent spawnAgent(AgentKind kind, std::string id, RandomSource& rng, double spread);
Agent makeAgent(AgentKind kind, std::string id, const Vec3& position,
                const Genotype& genotype, RandomSource& rng);

Observation observe(const Agent& self, const Environment& env, const std::vector<Agent>& agents);

// Snapshot of a causal agent's situation for the reasoning engine.
ReasoningRequest buildReasoningRequest(const Agent& self, const Environment& env,
                                       const std::vector<Agent>& agents, std::uint64_t tick);

// Consumes every resource strictly within the forage radius. Returns the
// number consumed.
int forage(Agent& self, Environment& env);

// Adds the intent's velocity delta. Causal agents use shared tips and danger
// zones. Inactive agents are left untouched.
void applySteering(Agent& self, const Intent& intent, const Environment& env,
                   const std::vector<Agent>& agents, RandomSource& rng);

// Integrates position, damps velocity and reflects at the world bounds.
void updatePosition(Agent& self);

// Replaces velocity with a heading toward the player's target, or clears the
// target on arrival. No-op for other kinds or without a target.
void steerPlayer(Agent& self);

// Checks each nearby unchecked tip and danger zone once against ground truth
// and records the outcome against its source.
void verifyInformation(Agent& self, const Environment& env,
                       const std::vector<Agent>& agents, std::uint64_t tick);

std::optional<OutgoingMessage> decideToCommunicate(const Agent& self, const std::vector<Agent>& agents,
                                                   const Environment& env, RandomSource& rng,
                                                   IdGenerator& ids, std::uint64_t tick);

// Delivers to every other causal agent within the message range, inclusive.
// Returns the recipient count.
int broadcastMessage(std::size_t senderIndex, const Message& message,
                     std::vector<Agent>& agents, std::uint64_t tick);

// Offspring of the same kind with a mutated genotype. The parent pays the
// cooldown and energy cost.
Agent reproduce(Agent& parent, RandomSource& rng, IdGenerator& ids);

// Colour class for renderers: infected, recovered, player, causal or basic.
const char* colorClass(const Agent& agent);

#endif
