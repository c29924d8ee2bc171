#include "modules/Genetics.h"

#include <algorithm>
#include <cmath>

#include "utils/Random.h"

namespace {
double clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

// Draws the mutation roll for one trait and returns the scale to apply.
double mutationScale(RandomSource& rng, double rate) {
    if (!rng.chance(rate)) {
        return 1.0;
    }
    return rng.uniform(GeneticsConstants::kMutationFactorMin, GeneticsConstants::kMutationFactorMax);
}
}

Genotype randomGenotype(RandomSource& rng) {
    Genotype g;
    g.speed = rng.uniform(0.5, 2.5);
    g.size = rng.uniform(0.2, 0.5);
    g.socialRadius = rng.uniform(2.0, 7.0);
    g.infectionResistance = rng.uniform01();
    g.lifespan = static_cast<int>(std::floor(rng.uniform(100.0, 300.0)));
    g.reproductionThreshold = rng.uniform(50.0, 80.0);
    g.aggressiveness = rng.uniform01();
    g.forageEfficiency = rng.uniform01();
    return g;
}

Phenotype expressPhenotype(const Genotype& g) {
    Phenotype p;
    p.maxSpeed = g.speed;
    p.radius = g.size;
    p.socialDistance = g.socialRadius;
    p.resistance = g.infectionResistance;
    p.aggression = g.aggressiveness;
    p.efficiency = g.forageEfficiency;
    return p;
}

Genotype mutateGenotype(const Genotype& parent, RandomSource& rng, double rate) {
    Genotype child = parent;
    child.speed *= mutationScale(rng, rate);
    child.size *= mutationScale(rng, rate);
    child.socialRadius *= mutationScale(rng, rate);
    child.infectionResistance = clamp01(child.infectionResistance * mutationScale(rng, rate));
    // lifespan stays integral; a scaled value is truncated
    child.lifespan = static_cast<int>(child.lifespan * mutationScale(rng, rate));
    child.reproductionThreshold *= mutationScale(rng, rate);
    child.aggressiveness = clamp01(child.aggressiveness * mutationScale(rng, rate));
    child.forageEfficiency = clamp01(child.forageEfficiency * mutationScale(rng, rate));
    return child;
}
