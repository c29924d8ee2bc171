#ifndef GENETICS_MODULE_H
#define GENETICS_MODULE_H

class RandomSource;

// Heritable traits. Only reproduction produces a new genotype.
struct Genotype {
    double speed = 1.5;
    double size = 0.35;
    double socialRadius = 4.5;
    double infectionResistance = 0.5;   // 0..1
    int lifespan = 200;                 // ticks
    double reproductionThreshold = 65.0;
    double aggressiveness = 0.5;        // 0..1
    double forageEfficiency = 0.5;      // 0..1
};

// Behavioural projection of a genotype, computed once per agent.
struct Phenotype {
    double maxSpeed = 1.5;
    double radius = 0.35;
    double socialDistance = 4.5;
    double resistance = 0.5;
    double aggression = 0.5;
    double efficiency = 0.5;
};

namespace GeneticsConstants {
    constexpr double kMutationRate = 0.15;      // per-trait mutation probability
    constexpr double kMutationFactorMin = 0.8;
    constexpr double kMutationFactorMax = 1.2;
}

Genotype randomGenotype(RandomSource& rng);
Phenotype expressPhenotype(const Genotype& g);

// Copy of the parent genotype with each trait independently scaled by a
// factor in [0.8, 1.2] with probability `rate`. Unit-interval traits are
// re-clamped after scaling.
Genotype mutateGenotype(const Genotype& parent, RandomSource& rng,
                        double rate = GeneticsConstants::kMutationRate);

#endif
