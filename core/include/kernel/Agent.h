#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include "modules/Genetics.h"
#include "modules/Health.h"
#include "modules/LearningPolicy.h"
#include "modules/Messaging.h"
#include "modules/Reasoning.h"
#include "modules/SocialMemory.h"
#include "utils/Geometry.h"

enum class AgentKind : std::uint8_t {
    Basic = 0,     // learning agent
    Causal = 1,    // learning agent with messaging and reasoning
    Player = 2
};

const char* agentKindName(AgentKind kind);

struct LastCommunication {
    MessageType type = MessageType::KnowledgeShare;
    std::string text;
    int recipients = 0;
    int age = 0;                // sender age when sent
    std::uint64_t tick = 0;
};

// ---------- Causal payload ----------
struct CausalState {
    Personality personality = Personality::Cautious;   // fixed at birth
    SocialMemory memory;
    SocialKnowledge knowledge;
    int communicationCooldown = 0;

    // Reasoning: at most one job in flight; a resolved intent waits in
    // queuedIntent and replaces the learning policy for one tick.
    bool pendingReasoning = false;
    std::optional<Intent> queuedIntent;
    std::optional<ReasoningTrace> lastReasoning;
    std::deque<ReasoningTrace> history;    // newest last
    int decisionCount = 0;

    std::optional<LastCommunication> lastCommunication;
};

// ---------- Player payload ----------
struct PlayerState {
    std::optional<PlanarPoint> target;
    double moveSpeed = 2.0;
};

// ---------- Agent Structure ----------
// One record for every kind; the payload matching `kind` is engaged.
struct Agent {
    // Identity
    std::string id;
    AgentKind kind = AgentKind::Basic;

    // Kinematics (y stays at 1)
    Vec3 position{0.0, 1.0, 0.0};
    Vec3 velocity{};

    Genotype genotype;
    Phenotype phenotype;

    int age = 0;
    double energy = 100.0;
    HealthState health;
    int reproductionCooldown = 0;
    bool isActive = false;

    LearningPolicy policy;

    std::optional<CausalState> causal;
    std::optional<PlayerState> player;

    bool isCausal() const { return kind == AgentKind::Causal; }
    bool isPlayer() const { return kind == AgentKind::Player; }
    int lifespan() const { return genotype.lifespan; }
};
