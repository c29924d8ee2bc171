#include "modules/Reasoning.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <omp.h>

namespace {
std::string joinList(const std::vector<std::string>& items, const char* sep, const char* empty) {
    if (items.empty()) return empty;
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

long rounded(double v) {
    return std::lround(v);
}

std::string explainGoal(const Goal* goal, const Observation& obs) {
    if (!goal) return "survival is the baseline imperative";
    if (goal->name == "find_food") {
        return std::string("energy is ") + (obs.energy < 20.0 ? "critically" : "dangerously") + " low";
    }
    if (goal->name == "avoid_infection") return "infection would severely compromise survival chances";
    if (goal->name == "reproduce") return "energy reserves allow for genetic contribution to next generation";
    return "exploration maintains adaptive flexibility";
}
}

Situation ReasoningEngine::analyzeSituation(const ReasoningRequest& req) {
    const Observation& obs = req.observation;
    Situation s;
    s.energyStatus = obs.energy < 30.0 ? "critical" : obs.energy > 70.0 ? "abundant" : "moderate";
    s.nearbyThreats = req.nearbyThreats;
    s.resourceDistance = obs.nearestResourceDistance;
    s.populationDensity = obs.nearbyCount;
    s.age = obs.age;
    return s;
}

std::vector<Goal> ReasoningEngine::defineGoals(const ReasoningRequest& req) {
    const Observation& obs = req.observation;
    std::vector<Goal> goals;
    if (obs.energy < 40.0) {
        goals.push_back({"find_food", "high", 10.0 - obs.energy / 10.0});
    }
    if (obs.nearbyInfected > 0) {
        goals.push_back({"avoid_infection", "high", obs.nearbyInfected * 2.0});
    }
    if (obs.energy > 60.0 && req.age > 30) {
        goals.push_back({"reproduce", "medium", 3.0});
    }
    goals.push_back({"explore", "low", 1.0});
    std::stable_sort(goals.begin(), goals.end(), [](const Goal& a, const Goal& b) {
        return a.urgency > b.urgency;
    });
    return goals;
}

RiskAssessment ReasoningEngine::assessRisks(const ReasoningRequest& req) {
    const Observation& obs = req.observation;
    RiskAssessment risk;
    if (obs.energy < 30.0) {
        risk.factors.push_back("energy depletion");
        risk.score += 3.0;
    }
    if (obs.nearbyInfected > 0) {
        risk.factors.push_back("infection exposure");
        risk.score += obs.nearbyInfected * 2.0;
    }
    if (obs.nearbyCount > 5) {
        risk.factors.push_back("resource competition");
        risk.score += 1.0;
    }
    if (req.age > req.lifespan * 0.8) {
        risk.factors.push_back("advanced age");
        risk.score += 2.0;
    }
    risk.level = risk.score < 2.0 ? "low" : risk.score < 5.0 ? "moderate" : "high";
    return risk;
}

ActionPlan ReasoningEngine::planAction(const ReasoningRequest& req, const Goal* primaryGoal) {
    const Observation& obs = req.observation;
    ActionPlan plan;
    plan.description = "Continue current behavior";
    plan.expectedOutcome = "Maintain status quo";
    plan.justification = "Default action when no clear priority emerges";

    if (primaryGoal && primaryGoal->name == "find_food" && obs.nearestResourceDistance < 10.0) {
        plan.action = "forage";
        plan.description = "Move toward nearest resource";
        plan.expectedOutcome = "Energy restoration";
        plan.justification = "Food is accessible (" + std::to_string(rounded(obs.nearestResourceDistance)) + " units)";
        plan.confidence = 0.8;
    } else if (obs.nearbyInfected > 0 && req.observation.status == HealthStatus::Susceptible) {
        plan.action = "avoid";
        plan.description = "Maintain distance from infected agents";
        plan.expectedOutcome = "Reduce infection probability";
        plan.justification = std::to_string(obs.nearbyInfected) + " infected nearby";
        plan.confidence = 0.9;
    } else if (obs.energy > 70.0 && req.reproductionCooldown == 0 && req.age > 30) {
        plan.action = "reproduce";
        plan.description = "Seek reproduction opportunity";
        plan.expectedOutcome = "Genetic propagation";
        plan.justification = "High energy reserves and maturity";
        plan.confidence = 0.7;
    }

    for (const char* alt : {"explore", "rest", "forage", "socialize", "isolate"}) {
        if (plan.action != alt) plan.alternatives.push_back(alt);
    }
    return plan;
}

ChainOfThought ReasoningEngine::generateChainOfThought(const ReasoningRequest& req) {
    const Observation& obs = req.observation;
    ChainOfThought chain;

    const Situation situation = analyzeSituation(req);
    std::ostringstream s1;
    s1 << std::fixed << std::setprecision(1)
       << "Current situation: Energy at " << obs.energy << "% (" << situation.energyStatus << "), "
       << obs.nearbyInfected << " infected nearby (" << situation.nearbyThreats << " within "
       << rounded(ReasoningConstants::kThreatRadius) << " units), nearest resource "
       << rounded(obs.nearestResourceDistance) << " units away, " << situation.populationDensity
       << " agents around.";
    chain.thoughts.push_back({1, "situation_analysis", s1.str()});

    const std::vector<Goal> goals = defineGoals(req);
    const Goal* primary = goals.empty() ? nullptr : &goals.front();
    std::ostringstream s2;
    s2 << std::setprecision(3) << "Primary goal: " << (primary ? primary->name : "survive")
       << " (urgency: " << (primary ? primary->urgency : 1.0) << "). This takes priority because "
       << explainGoal(primary, obs) << ".";
    chain.thoughts.push_back({2, "goal_prioritization", s2.str()});

    const RiskAssessment risk = assessRisks(req);
    chain.thoughts.push_back({3, "risk_assessment",
        "Risk assessment: " + risk.level + " risk. Main concerns: " + joinList(risk.factors, ", ", "none") +
        ". Risk tolerance based on " + personalityName(req.personality) + " personality."});

    const ActionPlan plan = planAction(req, primary);
    chain.thoughts.push_back({4, "action_planning",
        "Action plan: " + plan.description + ". Expected outcome: " + plan.expectedOutcome +
        ". Alternatives considered: " + joinList(plan.alternatives, ", ", "none") + "."});

    chain.thoughts.push_back({5, "conclusion", "Decision: " + plan.action + ". Reasoning: " + plan.justification});
    chain.conclusion = plan.justification;
    chain.planConfidence = plan.confidence;
    return chain;
}

std::optional<Intent> ReasoningEngine::reasonToAction(const ChainOfThought& chain) {
    auto it = std::find_if(chain.thoughts.begin(), chain.thoughts.end(),
                           [](const Thought& t) { return t.type == "conclusion"; });
    if (it == chain.thoughts.end()) {
        return std::nullopt;
    }
    static const std::string kMarker = "Decision: ";
    const auto pos = it->content.find(kMarker);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string word;
    for (std::size_t i = pos + kMarker.size(); i < it->content.size(); ++i) {
        const char c = it->content[i];
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) break;
        word.push_back(c);
    }

    if (word == "forage") return Intent{ActionType::Forage, 0.9};
    if (word == "avoid") return Intent{ActionType::Flee, 0.8};
    if (word == "reproduce") return Intent{ActionType::Reproduce, 0.3};
    if (word == "explore") return Intent{ActionType::Explore, 0.5};
    return std::nullopt;
}

std::optional<ReasoningTrace> ReasoningEngine::reason(const ReasoningRequest& req) const {
    ChainOfThought chain = generateChainOfThought(req);
    std::optional<Intent> intent = reasonToAction(chain);
    if (!intent) {
        return std::nullopt;
    }
    ReasoningTrace trace;
    trace.intent = *intent;
    trace.confidence = req.confidence;
    trace.reasoning = chain.conclusion;
    trace.tick = req.tick;
    trace.age = req.age;
    trace.chain = std::move(chain);
    return trace;
}

std::string ReasoningEngine::buildPrompt(const ReasoningRequest& req) {
    const Observation& obs = req.observation;
    const Situation situation = analyzeSituation(req);
    const std::vector<Goal> goals = defineGoals(req);

    std::ostringstream os;
    os << std::fixed << std::setprecision(1);
    os << "You are a " << personalityName(req.personality) << " agent in a survival ecosystem.\n\n";
    os << "CURRENT SITUATION:\n";
    os << "- Energy: " << obs.energy << "% ("
       << (obs.energy < 30.0 ? "CRITICAL" : obs.energy < 60.0 ? "LOW" : "GOOD") << ")\n";
    os << "- Health Status: " << healthStatusName(obs.status) << "\n";
    os << "- Age: " << obs.age << " steps\n";
    os << "- Nearby Agents: " << obs.nearbyCount << " (" << obs.nearbyInfected << " infected)\n";
    os << "- Nearest Resource: " << rounded(obs.nearestResourceDistance) << " units away\n";
    os << "- Location: (" << rounded(obs.position.x) << ", " << rounded(obs.position.z) << ")\n\n";
    os << "ENVIRONMENT:\n";
    os << "- Population Density: "
       << (situation.populationDensity < 3 ? "sparse" : situation.populationDensity < 7 ? "moderate" : "crowded")
       << "\n\n";
    os << "PRIMARY GOALS (by priority):\n";
    for (std::size_t i = 0; i < goals.size() && i < 3; ++i) {
        os << (i + 1) << ". " << goals[i].name << " (urgency: " << goals[i].urgency << ")\n";
    }
    os << "\nRecent messages received: " << joinList(req.recentMessages, "; ", "none") << "\n";
    return os.str();
}

void ReasoningQueue::enqueue(ReasoningRequest request) {
    jobs_.push_back(std::move(request));
}

std::vector<ReasoningOutcome> ReasoningQueue::resolveAll(const ReasoningEngine& engine) {
    std::vector<ReasoningOutcome> outcomes(jobs_.size());
    const std::ptrdiff_t n = static_cast<std::ptrdiff_t>(jobs_.size());

    #pragma omp parallel for schedule(dynamic) if (n > 8)
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        auto& outcome = outcomes[static_cast<std::size_t>(i)];
        const auto& job = jobs_[static_cast<std::size_t>(i)];
        outcome.agentId = job.agentId;
        try {
            outcome.trace = engine.reason(job);
        } catch (const std::exception&) {
            // a failed job yields no action; the learning policy governs instead
            outcome.trace.reset();
            outcome.failed = true;
        }
    }

    jobs_.clear();
    return outcomes;
}

int ReasoningQueue::workerCount() {
    return omp_get_max_threads();
}
