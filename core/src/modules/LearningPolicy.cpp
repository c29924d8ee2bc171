#include "modules/LearningPolicy.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "utils/Random.h"

const char* actionTypeName(ActionType type) {
    switch (type) {
        case ActionType::Forage: return "FORAGE";
        case ActionType::Explore: return "EXPLORE";
        case ActionType::Flee: return "FLEE";
        case ActionType::Reproduce: return "REPRODUCE";
        default: return "EXPLORE";
    }
}

Intent LearningPolicy::selectAction(const Observation& obs, RandomSource& rng) {
    const std::string state = discretizeState(obs);

    if (lastState_) {
        update(*lastState_, lastAction_, reward(obs), state);
    }

    ActionType selected;
    if (rng.chance(params_.epsilon)) {
        selected = kAllActionTypes[rng.index(kAllActionTypes.size())];
    } else {
        selected = bestAction(state);
    }

    lastState_ = state;
    lastAction_ = selected;

    Intent intent;
    intent.type = selected;
    intent.speed = selected == ActionType::Reproduce ? 0.2 : rng.uniform(0.5, 1.0);
    return intent;
}

std::string LearningPolicy::discretizeState(const Observation& obs) {
    const int energyBucket = static_cast<int>(std::floor(obs.energy / 25.0));
    const int nearbyBucket = std::min(3, obs.nearbyCount);
    const int infectedBucket = std::min(2, obs.nearbyInfected);
    const int resourceBucket = obs.nearestResourceDistance < 5.0 ? 0 : 1;
    return std::to_string(energyBucket) + "_" + std::to_string(nearbyBucket) + "_" +
           std::to_string(infectedBucket) + "_" + std::to_string(resourceBucket) + "_" +
           healthStatusName(obs.status);
}

double LearningPolicy::reward(const Observation& obs) {
    double r = obs.energy * 0.01;
    r -= obs.nearbyInfected * 2.0;
    if (obs.energy < 50.0 && obs.nearestResourceDistance < 10.0) {
        r += 5.0;
    }
    r -= obs.age * 0.001;
    return r;
}

double LearningPolicy::qValue(const std::string& state, ActionType action) const {
    auto it = table_.find(key(state, action));
    return it == table_.end() ? 0.0 : it->second;
}

double LearningPolicy::maxQValue(const std::string& state) const {
    double best = -std::numeric_limits<double>::infinity();
    for (ActionType a : kAllActionTypes) {
        best = std::max(best, qValue(state, a));
    }
    return best;
}

ActionType LearningPolicy::bestAction(const std::string& state) const {
    ActionType best = kAllActionTypes[0];
    double bestQ = -std::numeric_limits<double>::infinity();
    for (ActionType a : kAllActionTypes) {
        const double q = qValue(state, a);
        if (q > bestQ) {  // strict: earlier enumeration wins ties
            bestQ = q;
            best = a;
        }
    }
    return best;
}

void LearningPolicy::setQValue(const std::string& state, ActionType action, double value) {
    table_[key(state, action)] = value;
}

void LearningPolicy::update(const std::string& state, ActionType action, double r, const std::string& nextState) {
    const double current = qValue(state, action);
    const double target = r + params_.gamma * maxQValue(nextState);
    table_[key(state, action)] = current + params_.alpha * (target - current);
}

std::string LearningPolicy::key(const std::string& state, ActionType action) {
    return state + "_" + actionTypeName(action);
}
