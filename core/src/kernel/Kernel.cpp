#include "kernel/Kernel.h"
#include "utils/Validation.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace {
void requireProbability(double p, const char* name) {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::invalid_argument(std::string(name) + " must be in [0, 1] (got " + std::to_string(p) + ")");
    }
}
}

void validateConfig(const KernelConfig& cfg) {
    if (cfg.hardCap <= 0) {
        throw std::invalid_argument("hardCap must be > 0 (got " + std::to_string(cfg.hardCap) + ")");
    }
    if (!(cfg.carryingCapacity > 0.0)) {
        throw std::invalid_argument("carryingCapacity must be > 0 (got " +
                                    std::to_string(cfg.carryingCapacity) + ")");
    }
    if (cfg.causalAgents < 0 || cfg.learningAgents < 0) {
        throw std::invalid_argument("agent counts must be >= 0 (got causal=" +
                                    std::to_string(cfg.causalAgents) + ", learning=" +
                                    std::to_string(cfg.learningAgents) + ")");
    }
    const long initial = static_cast<long>(cfg.causalAgents) + cfg.learningAgents + (cfg.includePlayer ? 1 : 0);
    if (initial > cfg.hardCap) {
        throw std::invalid_argument("initial population " + std::to_string(initial) +
                                    " exceeds hardCap " + std::to_string(cfg.hardCap));
    }
    requireProbability(cfg.reasoningFrequency, "reasoningFrequency");
    requireProbability(cfg.communicationChance, "communicationChance");
    if (cfg.historyInterval <= 0) {
        throw std::invalid_argument("historyInterval must be > 0 (got " +
                                    std::to_string(cfg.historyInterval) + ")");
    }
    if (cfg.spawnSpread < 0.0) {
        throw std::invalid_argument("spawnSpread must be >= 0");
    }
}

Kernel::Kernel(const KernelConfig& cfg) : cfg_(cfg), rng_(cfg.seed), environment_(cfg.carryingCapacity) {
    reset(cfg);
}

void Kernel::reset() {
    reset(cfg_);
}

void Kernel::reset(const KernelConfig& cfg) {
    validateConfig(cfg);

    cfg_ = cfg;
    rng_.seed(cfg.seed);
    ids_.reset();
    tick_ = 0;
    gameOver_ = false;
    extinct_ = false;
    running_ = cfg.startRunning;

    environment_ = Environment(cfg.carryingCapacity);
    reasoning_.clear();
    history_.clear();

    event_log_.clear();
    event_log_.setCapacity(cfg.eventLogCapacity);
    event_log_.setEcho(cfg.verbose ? &std::cerr : nullptr);

    initAgents();
}

void Kernel::initAgents() {
    agents_.clear();
    agents_.reserve(static_cast<std::size_t>(cfg_.hardCap));

    if (cfg_.includePlayer) {
        const Genotype genotype = randomGenotype(rng_);
        agents_.push_back(makeAgent(AgentKind::Player, "player", Vec3{0.0, 1.0, 0.0}, genotype, rng_));
    }

    const int total = cfg_.causalAgents + cfg_.learningAgents;
    for (int i = 0; i < total; ++i) {
        const bool causal = i < cfg_.causalAgents;
        const std::string id = (causal ? "causal_" : "rl_") + std::to_string(i);
        Agent a = spawnAgent(causal ? AgentKind::Causal : AgentKind::Basic, id, rng_, cfg_.spawnSpread);
        if (i == 0 && cfg_.preInfectFirst) {
            infect(a.health);
        }
        agents_.push_back(std::move(a));
    }

    for (auto& a : agents_) {
        a.isActive = running_;
    }
}

WorldView Kernel::step() {
    if (!running_) {
        stepPaused();
        return view();
    }

    const std::uint64_t now = tick_ + 1;

    for (auto& a : agents_) {
        a.isActive = true;
    }

    TickContext ctx{now, environment_, agents_, rng_, ids_, reasoning_, event_log_,
                    cfg_.hardCap, cfg_.reasoningFrequency, cfg_.communicationChance};

    std::vector<std::size_t> deaths;
    std::vector<Agent> births;

    // The list is not resized during the pass, so references stay valid.
    const std::size_t count = agents_.size();
    for (std::size_t i = 0; i < count; ++i) {
        const StepOutcome outcome = updateAgent(i, ctx);
        Agent& agent = agents_[i];

        if (outcome == StepOutcome::Die) {
            deaths.push_back(i);
            event_log_.logDeath(now, agent.id, agent.age, agent.energy);
            if (agent.isPlayer()) {
                gameOver_ = true;
                running_ = false;
                event_log_.logGameOver(now, agent.id);
            }
        } else if (outcome == StepOutcome::Reproduce) {
            const double threshold = environment_.survivalThreshold(agents_.size());
            if (agents_.size() + births.size() < static_cast<std::size_t>(cfg_.hardCap) &&
                agent.energy > std::max(15.0, threshold * 0.5)) {
                births.push_back(reproduce(agent, rng_, ids_));
                event_log_.logBirth(now, births.back().id, agent.id);
            }
        }
    }

    // Removals in descending index order, then births.
    for (auto it = deaths.rbegin(); it != deaths.rend(); ++it) {
        agents_.erase(agents_.begin() + static_cast<std::ptrdiff_t>(*it));
    }
    for (auto& child : births) {
        child.isActive = true;
        agents_.push_back(std::move(child));
    }
    validation::checkPopulationCap(agents_.size(), static_cast<std::size_t>(cfg_.hardCap), "Kernel::step");

    resolveReasoning();

    tick_ = now;
    if (tick_ % static_cast<std::uint64_t>(cfg_.historyInterval) == 0) {
        recordHistory();
    }

    environment_.update(rng_, ids_);

    if (agents_.empty() && !extinct_) {
        extinct_ = true;
        running_ = false;
        event_log_.logExtinction(now);
    }

    return view();
}

void Kernel::stepN(int n) {
    for (int i = 0; i < n; ++i) {
        step();
    }
}

// Paused: only the player may walk toward a pending target.
void Kernel::stepPaused() {
    for (auto& a : agents_) {
        if (a.isPlayer() && a.player && a.player->target) {
            steerPlayer(a);
            updatePosition(a);
        }
    }
}

void Kernel::resolveReasoning() {
    if (reasoning_.empty()) return;

    std::unordered_map<std::string, std::size_t> index;
    index.reserve(agents_.size());
    for (std::size_t i = 0; i < agents_.size(); ++i) {
        index.emplace(agents_[i].id, i);
    }

    for (auto& outcome : reasoning_.resolveAll(engine_)) {
        auto it = index.find(outcome.agentId);
        if (it == index.end()) continue;   // agent died this tick
        Agent& agent = agents_[it->second];
        if (!agent.causal) continue;

        CausalState& cs = *agent.causal;
        cs.pendingReasoning = false;
        if (!outcome.trace) continue;

        cs.queuedIntent = outcome.trace->intent;
        cs.decisionCount++;
        cs.history.push_back(*outcome.trace);
        while (cs.history.size() > cfg_.reasoningHistoryWindow) {
            cs.history.pop_front();
        }
        event_log_.logReasoning(outcome.trace->tick, agent.id, actionTypeName(outcome.trace->intent.type));
        cs.lastReasoning = std::move(outcome.trace);
    }
}

void Kernel::recordHistory() {
    PopulationSample sample;
    sample.tick = tick_;
    sample.total = agents_.size();
    for (const auto& a : agents_) {
        switch (a.health.status) {
            case HealthStatus::Susceptible: sample.susceptible++; break;
            case HealthStatus::Infected: sample.infected++; break;
            case HealthStatus::Recovered: sample.recovered++; break;
        }
    }
    history_.push_back(sample);
    while (history_.size() > cfg_.historyWindow) {
        history_.pop_front();
    }
}

void Kernel::setRunning(bool running) {
    // game over and extinction are terminal until reset
    if (running && (gameOver_ || extinct_)) return;
    running_ = running;
    for (auto& a : agents_) {
        a.isActive = running;
    }
}

bool Kernel::setPlayerTarget(double x, double z) {
    for (auto& a : agents_) {
        if (a.isPlayer() && a.player) {
            const double bound = AgentConstants::kWorldBound;
            a.player->target = PlanarPoint{std::clamp(x, -bound, bound), std::clamp(z, -bound, bound)};
            return true;
        }
    }
    return false;
}

const Agent* Kernel::findAgent(const std::string& id) const {
    auto it = std::find_if(agents_.begin(), agents_.end(), [&](const Agent& a) { return a.id == id; });
    return it == agents_.end() ? nullptr : &*it;
}

const Agent* Kernel::player() const {
    auto it = std::find_if(agents_.begin(), agents_.end(), [](const Agent& a) { return a.isPlayer(); });
    return it == agents_.end() ? nullptr : &*it;
}

WorldView Kernel::view() const {
    WorldView v;
    v.tick = tick_;
    v.running = running_;
    v.gameOver = gameOver_;
    v.extinct = extinct_;
    v.agents.reserve(agents_.size());
    for (const auto& a : agents_) {
        AgentView av;
        av.id = a.id;
        av.kind = a.kind;
        av.position = a.position;
        av.status = a.health.status;
        av.colorClass = colorClass(a);
        av.energy = a.energy;
        av.age = a.age;
        av.isActive = a.isActive;
        if (a.causal) {
            av.lastReasoning = a.causal->lastReasoning;
            av.lastCommunication = a.causal->lastCommunication;
        }
        v.agents.push_back(std::move(av));
    }
    v.environment.season = environment_.season();
    v.environment.weather = environment_.weather();
    v.environment.temperature = environment_.temperature();
    v.environment.cycleStep = environment_.cycleStep();
    v.environment.resources = environment_.resources();
    return v;
}

std::optional<AgentInspection> Kernel::inspectAgent(const std::string& id) const {
    const Agent* a = findAgent(id);
    if (!a) return std::nullopt;

    AgentInspection info;
    info.id = a->id;
    info.kind = a->kind;
    info.position = a->position;
    info.genotype = a->genotype;
    info.status = a->health.status;
    info.infectionTimer = a->health.infectionTimer;
    info.energy = a->energy;
    info.age = a->age;
    info.reproductionCooldown = a->reproductionCooldown;
    info.qTableSize = a->policy.tableSize();

    if (a->causal) {
        const CausalState& cs = *a->causal;
        info.personality = cs.personality;
        info.lastReasoning = cs.lastReasoning;
        info.reasoningHistory.assign(cs.history.begin(), cs.history.end());
        info.recentMessages = cs.memory.recentMessages(5);
        info.lastCommunication = cs.lastCommunication;
        info.decisionCount = cs.decisionCount;
        info.reasoningPending = cs.pendingReasoning;
        info.communicationCooldown = cs.communicationCooldown;
        info.resourceTips = cs.knowledge.resourceTips.size();
        info.dangerZones = cs.knowledge.dangerZones.size();
        info.helpRequests = cs.knowledge.helpRequests.size();
        info.verifiedTips = static_cast<std::size_t>(std::count_if(
            cs.knowledge.resourceTips.begin(), cs.knowledge.resourceTips.end(),
            [](const ResourceTip& t) { return t.verified; }));
        info.knownAgents = cs.memory.knownCount();
        info.averageTrust = cs.memory.averageTrust();
        for (const auto& [source, record] : cs.memory.known()) {
            info.trustBySource[source] = record.trust();
        }
        info.reasoningPrompt = ReasoningEngine::buildPrompt(
            buildReasoningRequest(*a, environment_, agents_, tick_));
    }
    if (a->player) {
        info.target = a->player->target;
    }
    return info;
}

Kernel::Statistics Kernel::statistics() const {
    Statistics s;
    s.tick = tick_;
    s.total = agents_.size();
    s.resources = environment_.resources().size();
    s.season = environment_.season();
    s.weather = environment_.weather();
    s.temperature = environment_.temperature();

    double totalAge = 0.0;
    double totalEnergy = 0.0;
    double trustSum = 0.0;
    for (const auto& a : agents_) {
        switch (a.health.status) {
            case HealthStatus::Susceptible: s.susceptible++; break;
            case HealthStatus::Infected: s.infected++; break;
            case HealthStatus::Recovered: s.recovered++; break;
        }
        totalAge += a.age;
        totalEnergy += a.energy;

        switch (a.kind) {
            case AgentKind::Player: s.playerAlive = true; break;
            case AgentKind::Basic: s.learningAgents++; break;
            case AgentKind::Causal: {
                s.causalAgents++;
                const CausalState& cs = *a.causal;
                s.reasoningEvents += cs.decisionCount;
                s.communicationEvents += static_cast<long>(cs.memory.inbox().size());
                if (cs.lastCommunication && a.age - cs.lastCommunication->age < 10) {
                    s.activeMessages++;
                }
                trustSum += cs.memory.averageTrust();
                break;
            }
        }
    }

    if (!agents_.empty()) {
        s.avgAge = totalAge / static_cast<double>(agents_.size());
        s.avgEnergy = totalEnergy / static_cast<double>(agents_.size());
    }
    if (s.causalAgents > 0) {
        s.averageTrust = trustSum / static_cast<double>(s.causalAgents);
    }
    return s;
}
