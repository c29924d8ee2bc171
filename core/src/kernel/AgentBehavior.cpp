#include "kernel/AgentBehavior.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <utility>

#include "modules/Reasoning.h"
#include "utils/EventLog.h"
#include "utils/IdGenerator.h"
#include "utils/Random.h"
#include "utils/Validation.h"

namespace {
constexpr double kPi = 3.14159265358979323846;

void pushToward(Vec3& velocity, double dx, double dz, double speed) {
    double mag = std::hypot(dx, dz);
    if (mag == 0.0) mag = 1.0;
    velocity.x += (dx / mag) * speed;
    velocity.z += (dz / mag) * speed;
}

// Nearest infected agent other than self, or nullptr.
const Agent* nearestInfected(const Agent& self, const std::vector<Agent>& agents, double* distance) {
    const Agent* threat = nullptr;
    double best = std::numeric_limits<double>::infinity();
    for (const auto& other : agents) {
        if (&other == &self || other.health.status != HealthStatus::Infected) continue;
        const double d = planarDistance(self.position, other.position);
        if (d < best) {
            best = d;
            threat = &other;
        }
    }
    if (distance) *distance = best;
    return threat;
}

void applyUpkeep(Agent& self, const AgentBehavior& behavior, double pressure) {
    self.age++;
    const double cost = upkeepCost(behavior.upkeep, self.health.status, self.age, self.lifespan(), pressure);
    validation::checkNonNegative(cost, "upkeep cost", "applyUpkeep");
    self.energy = std::max(0.0, self.energy - cost);
    self.reproductionCooldown = std::max(0, self.reproductionCooldown - 1);
    if (self.causal) {
        self.causal->communicationCooldown = std::max(0, self.causal->communicationCooldown - 1);
    }
}

void updateHealth(Agent& self, const AgentBehavior& behavior, TickContext& ctx) {
    if (progressInfection(self.health, self.energy, behavior.infection)) {
        ctx.events.logRecovery(ctx.tick, self.id);
    }
    if (self.health.status != HealthStatus::Susceptible) return;

    const bool exposed = std::any_of(ctx.agents.begin(), ctx.agents.end(), [&](const Agent& other) {
        return other.health.status == HealthStatus::Infected &&
               planarDistance(self.position, other.position) < self.phenotype.socialDistance;
    });
    // one trial per tick, however many neighbours are infected
    if (exposed && ctx.rng.chance(exposureProbability(behavior.infection, self.phenotype.resistance))) {
        infect(self.health);
        ctx.events.logInfection(ctx.tick, self.id);
    }
}

// Message handling, verification, communication and reasoning scheduling.
void socialStep(std::size_t index, TickContext& ctx) {
    Agent& self = ctx.agents[index];
    CausalState& cs = *self.causal;

    processPendingMessages(cs.knowledge, cs.memory, self.energy, cs.personality, ctx.tick);
    verifyInformation(self, ctx.environment, ctx.agents, ctx.tick);

    if (ctx.rng.chance(ctx.communicationChance) && cs.communicationCooldown == 0) {
        auto outgoing = decideToCommunicate(self, ctx.agents, ctx.environment, ctx.rng, ctx.ids, ctx.tick);
        if (outgoing) {
            cs.communicationCooldown = outgoing->cooldown;
            const int recipients = broadcastMessage(index, outgoing->message, ctx.agents, ctx.tick);
            ctx.events.logMessage(ctx.tick, self.id, messageTypeName(outgoing->message.type), recipients);
        }
    }

    if (ctx.rng.chance(ctx.reasoningFrequency) && !cs.pendingReasoning) {
        ReasoningRequest req = buildReasoningRequest(self, ctx.environment, ctx.agents, ctx.tick);
        req.confidence = ctx.rng.uniform(ReasoningConstants::kConfidenceMin, ReasoningConstants::kConfidenceMax);
        ctx.reasoning.enqueue(std::move(req));
        cs.pendingReasoning = true;
    }
}

StepOutcome updateLiving(std::size_t index, TickContext& ctx) {
    Agent& self = ctx.agents[index];
    const AgentBehavior& behavior = behaviorFor(self.kind);
    Environment& env = ctx.environment;
    const std::size_t population = ctx.agents.size();
    const double pressure = env.pressure(population);

    const int ageBefore = self.age;
    applyUpkeep(self, behavior, pressure);
    validation::checkMonotonic(ageBefore, self.age, "age", "updateLiving");

    const double threshold = env.survivalThreshold(population);
    const double pDeath = deathProbability(behavior.mortality, self.age, self.lifespan(), self.energy, threshold);
    if (ctx.rng.uniform01() < pDeath) {
        return StepOutcome::Die;
    }

    updateHealth(self, behavior, ctx);
    forage(self, env);

    if (behavior.social && self.causal) {
        socialStep(index, ctx);
    }

    Intent intent;
    if (self.causal && self.causal->queuedIntent) {
        intent = *self.causal->queuedIntent;
        self.causal->queuedIntent.reset();
    } else {
        intent = self.policy.selectAction(observe(self, env, ctx.agents), ctx.rng);
    }
    applySteering(self, intent, env, ctx.agents, ctx.rng);
    updatePosition(self);

    validation::checkEnergy(self.energy, "updateLiving");

    using namespace AgentConstants;
    const double minEnergy = std::max(kMinReproductionEnergy, threshold + kReproductionMargin);
    if (behavior.reproduces &&
        population < static_cast<std::size_t>(ctx.hardCap) &&
        self.energy > minEnergy &&
        self.reproductionCooldown == 0 &&
        self.age > kMinReproductionAge &&
        ctx.rng.chance(kBaseReproductionRate / (1.0 + pressure))) {
        return StepOutcome::Reproduce;
    }
    return StepOutcome::Continue;
}

StepOutcome updatePlayer(std::size_t index, TickContext& ctx) {
    Agent& self = ctx.agents[index];
    const AgentBehavior& behavior = behaviorFor(self.kind);
    Environment& env = ctx.environment;
    const std::size_t population = ctx.agents.size();

    applyUpkeep(self, behavior, env.pressure(population));

    const double threshold = env.survivalThreshold(population);
    const double pDeath = deathProbability(behavior.mortality, self.age, self.lifespan(), self.energy, threshold);
    if (ctx.rng.uniform01() < pDeath) {
        return StepOutcome::Die;
    }

    updateHealth(self, behavior, ctx);
    forage(self, env);
    steerPlayer(self);
    updatePosition(self);

    validation::checkEnergy(self.energy, "updatePlayer");
    return StepOutcome::Continue;
}

const std::array<AgentBehavior, 3> kBehaviors = {{
    {"basic", UpkeepProfile{}, MortalityProfile{}, InfectionProfile{}, false, true, &updateLiving},
    {"causal", UpkeepProfile{}, MortalityProfile{}, InfectionProfile{}, true, true, &updateLiving},
    {"player", UpkeepProfile{0.25, 0.3, 0.2, 0.8}, MortalityProfile{0.05, 0.015, 0.03},
     InfectionProfile{0.02, 40, 15.0}, false, false, &updatePlayer},
}};
}

const char* agentKindName(AgentKind kind) {
    return behaviorFor(kind).name;
}

const AgentBehavior& behaviorFor(AgentKind kind) {
    return kBehaviors[static_cast<std::size_t>(kind)];
}

StepOutcome updateAgent(std::size_t index, TickContext& ctx) {
    return behaviorFor(ctx.agents[index].kind).update(index, ctx);
}

Agent makeAgent(AgentKind kind, std::string id, const Vec3& position,
                const Genotype& genotype, RandomSource& rng) {
    Agent a;
    a.id = std::move(id);
    a.kind = kind;
    a.position = {position.x, 1.0, position.z};
    a.genotype = genotype;
    a.phenotype = expressPhenotype(genotype);
    if (kind == AgentKind::Causal) {
        a.causal.emplace();
        a.causal->personality = randomPersonality(rng);
    } else if (kind == AgentKind::Player) {
        a.player.emplace();
    }
    return a;
}

Agent spawnAgent(AgentKind kind, std::string id, RandomSource& rng, double spread) {
    Vec3 position;
    position.x = (rng.uniform01() - 0.5) * spread;
    position.z = (rng.uniform01() - 0.5) * spread;
    const Genotype genotype = randomGenotype(rng);
    return makeAgent(kind, std::move(id), position, genotype, rng);
}

Observation observe(const Agent& self, const Environment& env, const std::vector<Agent>& agents) {
    Observation obs;
    obs.position = self.position;
    obs.energy = self.energy;
    obs.age = self.age;
    obs.status = self.health.status;
    for (const auto& other : agents) {
        if (&other == &self || other.id == self.id) continue;
        if (planarDistance(self.position, other.position) < ObservationConstants::kObservationRadius) {
            obs.nearbyCount++;
            if (other.health.status == HealthStatus::Infected) obs.nearbyInfected++;
        }
    }
    double distance = ObservationConstants::kNoResourceDistance;
    if (env.nearestResource(self.position, &distance)) {
        obs.nearestResourceDistance = distance;
    }
    return obs;
}

ReasoningRequest buildReasoningRequest(const Agent& self, const Environment& env,
                                       const std::vector<Agent>& agents, std::uint64_t tick) {
    ReasoningRequest req;
    req.agentId = self.id;
    req.tick = tick;
    req.observation = observe(self, env, agents);
    req.personality = self.causal->personality;
    req.age = self.age;
    req.lifespan = self.lifespan();
    req.reproductionCooldown = self.reproductionCooldown;
    for (const auto& other : agents) {
        if (&other != &self && other.health.status == HealthStatus::Infected &&
            planarDistance(self.position, other.position) < ReasoningConstants::kThreatRadius) {
            req.nearbyThreats++;
        }
    }
    for (const auto& m : self.causal->memory.recentMessages(3)) {
        req.recentMessages.push_back(std::string(messageTypeName(m.type)) + ": " + m.content.text);
    }
    return req;
}

int forage(Agent& self, Environment& env) {
    const double bonus = self.health.status == HealthStatus::Recovered
                             ? HealthConstants::kRecoveredForageBonus : 1.0;
    int eaten = 0;
    for (const auto& id : env.resourcesWithin(self.position, EnvironmentConstants::kForageRadius)) {
        const Resource* r = env.find(id);
        if (!r) continue;
        self.energy = std::min(HealthConstants::kMaxEnergy, self.energy + r->value * self.phenotype.efficiency * bonus);
        env.consume(id);
        ++eaten;
    }
    return eaten;
}

void applySteering(Agent& self, const Intent& intent, const Environment& env,
                   const std::vector<Agent>& agents, RandomSource& rng) {
    using namespace AgentConstants;
    if (!self.isActive) return;
    const double speed = std::clamp(intent.speed, 0.0, 1.0) * self.phenotype.maxSpeed;

    switch (intent.type) {
        case ActionType::Forage: {
            std::optional<PlanarPoint> target;
            if (self.causal && self.energy < kTipHungerThreshold) {
                if (const ResourceTip* tip = bestResourceTip(self.causal->knowledge, self.age)) {
                    target = tip->location;
                }
            }
            if (!target) {
                if (const Resource* r = env.nearestResource(self.position)) target = r->position;
            }
            if (target) {
                pushToward(self.velocity, target->x - self.position.x, target->z - self.position.z, speed);
            }
            break;
        }
        case ActionType::Flee: {
            double ax = 0.0;
            double az = 0.0;
            if (self.causal) {
                for (const auto& zone : self.causal->knowledge.dangerZones) {
                    const double dx = self.position.x - zone.location.x;
                    const double dz = self.position.z - zone.location.z;
                    double dist = std::hypot(dx, dz);
                    if (dist == 0.0) dist = 1.0;
                    if (dist < zone.radius * kDangerZoneReach) {
                        ax += dx / dist;
                        az += dz / dist;
                    }
                }
            }
            if (ax == 0.0 && az == 0.0) {
                double d = 0.0;
                const Agent* threat = nearestInfected(self, agents, &d);
                if (threat && d < kFleeRadius) {
                    ax = self.position.x - threat->position.x;
                    az = self.position.z - threat->position.z;
                }
            }
            if (ax != 0.0 || az != 0.0) {
                pushToward(self.velocity, ax, az, speed);
            }
            break;
        }
        case ActionType::Explore: {
            const double dir = rng.uniform01() * 2.0 * kPi;
            self.velocity.x += std::cos(dir) * speed * kExploreScale;
            self.velocity.z += std::sin(dir) * speed * kExploreScale;
            break;
        }
        case ActionType::Reproduce:
            self.velocity.x += (rng.uniform01() - 0.5) * speed * kWanderScale;
            self.velocity.z += (rng.uniform01() - 0.5) * speed * kWanderScale;
            break;
        default:
            break;
    }
}

void updatePosition(Agent& self) {
    using namespace AgentConstants;
    if (!self.isActive && !self.isPlayer()) return;

    self.position.x += self.velocity.x;
    self.position.z += self.velocity.z;
    self.velocity.x *= kVelocityDamping;
    self.velocity.z *= kVelocityDamping;

    if (std::abs(self.position.x) > kWorldBound) {
        self.position.x = std::copysign(kWorldBound, self.position.x);
        self.velocity.x *= kBounceFactor;
    }
    if (std::abs(self.position.z) > kWorldBound) {
        self.position.z = std::copysign(kWorldBound, self.position.z);
        self.velocity.z *= kBounceFactor;
    }
}

void steerPlayer(Agent& self) {
    if (!self.player || !self.player->target) return;
    const PlanarPoint target = *self.player->target;
    const double dx = target.x - self.position.x;
    const double dz = target.z - self.position.z;
    const double distance = std::hypot(dx, dz);
    if (distance > AgentConstants::kTargetArrivalRadius) {
        self.velocity.x = (dx / distance) * self.player->moveSpeed;
        self.velocity.z = (dz / distance) * self.player->moveSpeed;
    } else {
        self.player->target.reset();
        self.velocity.x *= AgentConstants::kArrivalDamping;
        self.velocity.z *= AgentConstants::kArrivalDamping;
    }
}

void verifyInformation(Agent& self, const Environment& env,
                       const std::vector<Agent>& agents, std::uint64_t tick) {
    if (!self.causal) return;
    CausalState& cs = *self.causal;

    for (auto& tip : cs.knowledge.resourceTips) {
        if (tip.checked || planarDistance(self.position, tip.location) >= MessagingConstants::kTipVerifyRadius) {
            continue;
        }
        double distance = 0.0;
        const bool accurate = env.nearestResource(self.position, &distance) != nullptr &&
                              distance < MessagingConstants::kTipAccuracyRadius;
        tip.checked = true;
        tip.verified = accurate;
        if (!tip.source.empty()) {
            cs.memory.recordVerification(tip.source, accurate, "resource", tick);
        }
    }

    std::optional<bool> infectedInView;
    for (auto& zone : cs.knowledge.dangerZones) {
        if (zone.checked ||
            planarDistance(self.position, zone.location) >= zone.radius * MessagingConstants::kZoneVerifyFactor) {
            continue;
        }
        if (!infectedInView) {
            infectedInView = observe(self, env, agents).nearbyInfected > 0;
        }
        zone.checked = true;
        zone.verified = *infectedInView;
        if (!zone.source.empty()) {
            cs.memory.recordVerification(zone.source, *infectedInView, "threat", tick);
        }
    }
}

std::optional<OutgoingMessage> decideToCommunicate(const Agent& self, const std::vector<Agent>& agents,
                                                   const Environment& env, RandomSource& rng,
                                                   IdGenerator& ids, std::uint64_t tick) {
    if (!self.causal || self.causal->communicationCooldown > 0) {
        return std::nullopt;
    }
    const bool audience = std::any_of(agents.begin(), agents.end(), [&](const Agent& other) {
        return &other != &self && other.isCausal() &&
               planarDistance(self.position, other.position) < MessagingConstants::kMessageRange;
    });
    if (!audience) {
        return std::nullopt;
    }

    CommunicationContext ctx;
    ctx.self = self.id;
    ctx.position = self.position;
    ctx.observation = observe(self, env, agents);
    ctx.personality = self.causal->personality;
    ctx.age = self.age;
    ctx.tick = tick;
    return composeMessage(ctx, self.causal->knowledge, rng, ids);
}

int broadcastMessage(std::size_t senderIndex, const Message& message,
                     std::vector<Agent>& agents, std::uint64_t tick) {
    Agent& sender = agents[senderIndex];
    if (!sender.causal) return 0;

    int recipients = 0;
    for (std::size_t j = 0; j < agents.size(); ++j) {
        if (j == senderIndex) continue;
        Agent& other = agents[j];
        if (!other.causal || planarDistance(sender.position, other.position) > message.range) continue;
        receiveMessage(other.causal->knowledge, other.causal->memory, message, other.age, tick);
        sender.causal->memory.rememberAgent(other.id, tick, &message);
        ++recipients;
    }

    LastCommunication last;
    last.type = message.type;
    last.text = message.content.text;
    last.recipients = recipients;
    last.age = sender.age;
    last.tick = tick;
    sender.causal->lastCommunication = std::move(last);
    return recipients;
}

Agent reproduce(Agent& parent, RandomSource& rng, IdGenerator& ids) {
    using namespace AgentConstants;
    const Genotype genotype = mutateGenotype(parent.genotype, rng);
    Vec3 position;
    position.x = parent.position.x + (rng.uniform01() - 0.5) * kOffspringJitter;
    position.z = parent.position.z + (rng.uniform01() - 0.5) * kOffspringJitter;

    const AgentKind kind = parent.kind == AgentKind::Player ? AgentKind::Basic : parent.kind;
    Agent child = makeAgent(kind, ids.next("agent"), position, genotype, rng);

    parent.reproductionCooldown = kReproductionCooldown;
    parent.energy = std::max(0.0, parent.energy - kReproductionCost);
    return child;
}

const char* colorClass(const Agent& agent) {
    switch (agent.health.status) {
        case HealthStatus::Infected: return "infected";
        case HealthStatus::Recovered: return "recovered";
        default: break;
    }
    return agentKindName(agent.kind);
}
