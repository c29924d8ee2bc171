#ifndef KERNEL_H
#define KERNEL_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "kernel/Agent.h"
#include "kernel/AgentBehavior.h"
#include "modules/Environment.h"
#include "modules/Reasoning.h"
#include "utils/EventLog.h"
#include "utils/IdGenerator.h"
#include "utils/Random.h"

// ---------- Configuration ----------
struct KernelConfig {
    std::uint64_t seed = 42;

    // Initial population
    bool includePlayer = true;
    int causalAgents = 9;
    int learningAgents = 15;
    bool preInfectFirst = true;         // first non-player agent starts infected
    double spawnSpread = 30.0;          // initial positions in [-spread/2, spread/2)

    int hardCap = AgentConstants::kHardPopulationCap;
    double carryingCapacity = EnvironmentConstants::kCarryingCapacity;

    double reasoningFrequency = ReasoningConstants::kDefaultFrequency;
    double communicationChance = AgentConstants::kCommunicationChance;
    std::size_t reasoningHistoryWindow = ReasoningConstants::kHistoryWindow;

    int historyInterval = 10;           // ticks between population samples
    std::size_t historyWindow = 50;     // samples retained

    std::size_t eventLogCapacity = 512;
    bool verbose = false;               // echo events to stderr
    bool startRunning = true;
};

// Throws std::invalid_argument naming the first bad field.
void validateConfig(const KernelConfig& cfg);

// ---------- Views ----------
struct AgentView {
    std::string id;
    AgentKind kind = AgentKind::Basic;
    Vec3 position{};
    HealthStatus status = HealthStatus::Susceptible;
    const char* colorClass = "basic";
    double energy = 0.0;
    int age = 0;
    bool isActive = false;
    std::optional<ReasoningTrace> lastReasoning;
    std::optional<LastCommunication> lastCommunication;
};

struct EnvironmentView {
    Season season = Season::Spring;
    Weather weather = Weather::Clear;
    double temperature = 0.0;
    std::uint64_t cycleStep = 0;
    std::vector<Resource> resources;
};

// What a renderer needs after one tick.
struct WorldView {
    std::uint64_t tick = 0;
    bool running = false;
    bool gameOver = false;
    bool extinct = false;
    std::vector<AgentView> agents;
    EnvironmentView environment;
};

struct PopulationSample {
    std::uint64_t tick = 0;
    std::size_t total = 0;
    std::size_t susceptible = 0;
    std::size_t infected = 0;
    std::size_t recovered = 0;
};

// Read-only detail for one agent.
struct AgentInspection {
    std::string id;
    AgentKind kind = AgentKind::Basic;
    std::optional<Personality> personality;
    Vec3 position{};
    Genotype genotype;
    HealthStatus status = HealthStatus::Susceptible;
    int infectionTimer = 0;
    double energy = 0.0;
    int age = 0;
    int reproductionCooldown = 0;
    std::size_t qTableSize = 0;

    // causal only
    std::optional<ReasoningTrace> lastReasoning;
    std::vector<ReasoningTrace> reasoningHistory;
    std::vector<Message> recentMessages;
    std::optional<LastCommunication> lastCommunication;
    int decisionCount = 0;
    bool reasoningPending = false;
    int communicationCooldown = 0;
    std::size_t resourceTips = 0;
    std::size_t dangerZones = 0;
    std::size_t helpRequests = 0;
    std::size_t verifiedTips = 0;
    std::size_t knownAgents = 0;
    double averageTrust = TrustConstants::kBaseTrust;
    std::map<std::string, double> trustBySource;
    std::string reasoningPrompt;   // prompt for the agent's current situation

    // player only
    std::optional<PlanarPoint> target;
};

// ---------- Kernel Engine ----------
class Kernel {
public:
    explicit Kernel(const KernelConfig& cfg = KernelConfig{});

    // Lifecycle
    void reset();
    void reset(const KernelConfig& cfg);
    WorldView step();
    void stepN(int n);

    // Input
    void setRunning(bool running);
    // Clamped to the world bounds. Returns false when there is no player.
    bool setPlayerTarget(double x, double z);

    // Access
    const std::vector<Agent>& agents() const { return agents_; }
    std::vector<Agent>& agentsMut() { return agents_; }
    const Environment& environment() const { return environment_; }
    Environment& environmentMut() { return environment_; }
    const KernelConfig& config() const { return cfg_; }
    std::uint64_t tick() const { return tick_; }
    bool running() const { return running_; }
    bool gameOver() const { return gameOver_; }
    bool extinct() const { return extinct_; }
    std::size_t pendingReasoningJobs() const { return reasoning_.size(); }

    const Agent* findAgent(const std::string& id) const;
    const Agent* player() const;

    // Event log access
    EventLog& eventLog() { return event_log_; }
    const EventLog& eventLog() const { return event_log_; }

    WorldView view() const;
    std::optional<AgentInspection> inspectAgent(const std::string& id) const;

    struct Statistics {
        std::uint64_t tick = 0;
        std::size_t total = 0;
        std::size_t susceptible = 0;
        std::size_t infected = 0;
        std::size_t recovered = 0;
        std::size_t causalAgents = 0;
        std::size_t learningAgents = 0;
        bool playerAlive = false;
        double avgAge = 0.0;
        double avgEnergy = 0.0;
        long reasoningEvents = 0;       // decisions across living causal agents
        long communicationEvents = 0;   // inbox entries across living causal agents
        int activeMessages = 0;         // causal agents that spoke in the last 10 ticks of their life
        double averageTrust = TrustConstants::kBaseTrust;
        std::size_t resources = 0;
        Season season = Season::Spring;
        Weather weather = Weather::Clear;
        double temperature = 0.0;
    };
    Statistics statistics() const;

    const std::deque<PopulationSample>& populationHistory() const { return history_; }

private:
    void initAgents();
    void stepPaused();
    void resolveReasoning();
    void recordHistory();

    KernelConfig cfg_;
    SeededRandom rng_;
    IdGenerator ids_;
    Environment environment_;
    ReasoningEngine engine_;
    ReasoningQueue reasoning_;
    EventLog event_log_;

    std::vector<Agent> agents_;
    std::deque<PopulationSample> history_;

    std::uint64_t tick_ = 0;
    bool running_ = false;
    bool gameOver_ = false;
    bool extinct_ = false;
};

#endif
