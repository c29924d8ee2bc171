#ifndef HEALTH_MODULE_H
#define HEALTH_MODULE_H

#include <cstdint>

enum class HealthStatus : std::uint8_t {
    Susceptible = 0,
    Infected = 1,
    Recovered = 2
};

const char* healthStatusName(HealthStatus status);

// SIR parameters for one agent variant.
struct InfectionProfile {
    double transmission = 0.03;     // per-tick exposure probability before resistance
    int recoveryTicks = 40;         // recovered once the timer exceeds this
    double recoveryBonus = 10.0;    // energy restored on recovery
};

// Energy upkeep parameters for one agent variant.
struct UpkeepProfile {
    double baseLoss = 0.3;
    double infectionPenalty = 0.4;
    double agePenalty = 0.2;
    double agePenaltyFraction = 0.8;  // share of lifespan after which agePenalty applies
};

// Per-tick death odds for one agent variant.
struct MortalityProfile {
    double oldAge = 0.1;            // flat term once age >= lifespan
    double belowThreshold = 0.02;   // scales the shortfall under the survival threshold
    double critical = 0.05;         // per unit of energy under kCriticalEnergy
};

struct HealthState {
    HealthStatus status = HealthStatus::Susceptible;
    int infectionTimer = 0;
};

namespace HealthConstants {
    constexpr double kCriticalEnergy = 5.0;
    constexpr double kMaxEnergy = 100.0;
    constexpr double kRecoveredForageBonus = 1.2;
}

double upkeepCost(const UpkeepProfile& profile, HealthStatus status, int age, int lifespan, double pressure);

double deathProbability(const MortalityProfile& profile, int age, int lifespan,
                        double energy, double survivalThreshold);

// Probability of catching the infection this tick, given at least one
// infected neighbour. The number of neighbours does not compound it.
double exposureProbability(const InfectionProfile& profile, double resistance);

// Advances an infected agent by one tick. Returns true when it recovers;
// the recovery bonus is added to energy, capped at kMaxEnergy.
bool progressInfection(HealthState& health, double& energy, const InfectionProfile& profile);

// Marks a susceptible agent infected. Recovered agents are never reinfected.
bool infect(HealthState& health);

#endif
