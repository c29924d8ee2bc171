#ifndef REASONING_ENGINE_H
#define REASONING_ENGINE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "modules/Messaging.h"
#include "modules/Observation.h"

struct Thought {
    int step = 0;
    std::string type;      // situation_analysis, goal_prioritization, ...
    std::string content;
};

struct ChainOfThought {
    std::vector<Thought> thoughts;
    std::string conclusion;
    double planConfidence = 0.5;
};

struct Goal {
    std::string name;
    std::string priority;
    double urgency = 0.0;
};

struct Situation {
    std::string energyStatus;   // critical, moderate, abundant
    int nearbyThreats = 0;
    double resourceDistance = 0.0;
    int populationDensity = 0;
    int age = 0;
};

struct RiskAssessment {
    std::string level;          // low, moderate, high
    std::vector<std::string> factors;
    double score = 0.0;
};

struct ActionPlan {
    std::string action = "explore";
    std::string description;
    std::string expectedOutcome;
    std::string justification;
    std::vector<std::string> alternatives;
    double confidence = 0.5;
};

// Everything the pipeline reads, frozen when the job is scheduled.
struct ReasoningRequest {
    std::string agentId;
    std::uint64_t tick = 0;
    Observation observation{};
    Personality personality = Personality::Cautious;
    int age = 0;
    int lifespan = 0;
    int reproductionCooldown = 0;
    int nearbyThreats = 0;          // infected within kThreatRadius
    double confidence = 0.6;        // reported only, drawn at scheduling time
    std::vector<std::string> recentMessages;
};

struct ReasoningTrace {
    ChainOfThought chain;
    Intent intent{};
    double confidence = 0.0;
    std::string reasoning;
    std::uint64_t tick = 0;
    int age = 0;
};

namespace ReasoningConstants {
    constexpr double kDefaultFrequency = 0.3;
    constexpr double kThreatRadius = 5.0;
    constexpr double kConfidenceMin = 0.6;
    constexpr double kConfidenceMax = 1.0;
    constexpr std::size_t kHistoryWindow = 10;
}

// Deterministic five-stage chain of thought standing in for a language model:
// situation, goals, risks, plan, conclusion. The conclusion text is parsed
// back into an intent.
class ReasoningEngine {
public:
    static Situation analyzeSituation(const ReasoningRequest& req);
    static std::vector<Goal> defineGoals(const ReasoningRequest& req);
    static RiskAssessment assessRisks(const ReasoningRequest& req);
    static ActionPlan planAction(const ReasoningRequest& req, const Goal* primaryGoal);
    static ChainOfThought generateChainOfThought(const ReasoningRequest& req);

    // Reads "Decision: <action>" from the conclusion thought.
    static std::optional<Intent> reasonToAction(const ChainOfThought& chain);

    // Returns no trace when the pipeline produces no usable decision.
    std::optional<ReasoningTrace> reason(const ReasoningRequest& req) const;

    // Prompt text built from the same stages; shown by agent inspection.
    static std::string buildPrompt(const ReasoningRequest& req);
};

struct ReasoningOutcome {
    std::string agentId;
    std::optional<ReasoningTrace> trace;
    bool failed = false;
};

// Scheduled jobs awaiting resolution. Jobs only read their own request, so a
// batch resolves in parallel; outcomes keep enqueue order.
class ReasoningQueue {
public:
    void enqueue(ReasoningRequest request);
    std::vector<ReasoningOutcome> resolveAll(const ReasoningEngine& engine);

    std::size_t size() const { return jobs_.size(); }
    bool empty() const { return jobs_.empty(); }
    void clear() { jobs_.clear(); }

    static int workerCount();

private:
    std::vector<ReasoningRequest> jobs_;
};

#endif
