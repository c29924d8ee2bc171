#include "modules/Health.h"

#include <algorithm>

const char* healthStatusName(HealthStatus status) {
    switch (status) {
        case HealthStatus::Susceptible: return "Susceptible";
        case HealthStatus::Infected: return "Infected";
        case HealthStatus::Recovered: return "Recovered";
    }
    return "Susceptible";
}

double upkeepCost(const UpkeepProfile& profile, HealthStatus status, int age, int lifespan, double pressure) {
    const double base = profile.baseLoss * (1.0 + pressure * 0.5);
    const double infection = status == HealthStatus::Infected ? profile.infectionPenalty : 0.0;
    const double aging = age > lifespan * profile.agePenaltyFraction ? profile.agePenalty : 0.0;
    return base + infection + aging;
}

double deathProbability(const MortalityProfile& profile, int age, int lifespan,
                        double energy, double survivalThreshold) {
    double p = 0.0;
    if (age >= lifespan) {
        p += profile.oldAge;
    }
    if (energy < survivalThreshold) {
        p += ((survivalThreshold - energy) / std::max(1.0, survivalThreshold)) * profile.belowThreshold;
    }
    if (energy <= HealthConstants::kCriticalEnergy) {
        p += (HealthConstants::kCriticalEnergy - energy) * profile.critical;
    }
    return p;
}

double exposureProbability(const InfectionProfile& profile, double resistance) {
    return profile.transmission * (1.0 - resistance);
}

bool progressInfection(HealthState& health, double& energy, const InfectionProfile& profile) {
    if (health.status != HealthStatus::Infected) {
        return false;
    }
    health.infectionTimer++;
    if (health.infectionTimer > profile.recoveryTicks) {
        health.status = HealthStatus::Recovered;
        energy = std::min(HealthConstants::kMaxEnergy, energy + profile.recoveryBonus);
        return true;
    }
    return false;
}

bool infect(HealthState& health) {
    if (health.status != HealthStatus::Susceptible) {
        return false;
    }
    health.status = HealthStatus::Infected;
    health.infectionTimer = 0;
    return true;
}
