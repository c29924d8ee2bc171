#ifndef LEARNING_POLICY_H
#define LEARNING_POLICY_H

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "modules/Observation.h"

class RandomSource;

struct LearningParams {
    double epsilon = 0.15;  // exploration probability
    double alpha = 0.1;     // learning rate
    double gamma = 0.9;     // discount
};

// Tabular Q-learning over action types. The value table is keyed by the
// discretised state; the speed parameter of an intent is sampled separately
// and never learned.
class LearningPolicy {
public:
    LearningPolicy() = default;
    explicit LearningPolicy(const LearningParams& params) : params_(params) {}

    // Updates the value of the previous (state, action) against this
    // observation, then selects the next intent epsilon-greedily.
    Intent selectAction(const Observation& obs, RandomSource& rng);

    static std::string discretizeState(const Observation& obs);
    static double reward(const Observation& obs);

    double qValue(const std::string& state, ActionType action) const;
    double maxQValue(const std::string& state) const;
    ActionType bestAction(const std::string& state) const;

    void setQValue(const std::string& state, ActionType action, double value);

    std::size_t tableSize() const { return table_.size(); }
    const std::optional<std::string>& lastState() const { return lastState_; }
    const LearningParams& params() const { return params_; }

private:
    void update(const std::string& state, ActionType action, double r, const std::string& nextState);
    static std::string key(const std::string& state, ActionType action);

    LearningParams params_{};
    std::unordered_map<std::string, double> table_;
    std::optional<std::string> lastState_;
    ActionType lastAction_ = ActionType::Forage;
};

#endif
