#ifndef RANDOM_SOURCE_H
#define RANDOM_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <random>

// Every stochastic branch in the simulation draws from a RandomSource so a run
// can be replayed from a seed, or scripted in tests.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform draw in [0, 1).
    virtual double uniform01() = 0;

    double uniform(double lo, double hi) { return lo + (hi - lo) * uniform01(); }

    // Uniform index in [0, n). n must be > 0.
    std::size_t index(std::size_t n) {
        auto i = static_cast<std::size_t>(uniform01() * static_cast<double>(n));
        return i < n ? i : n - 1;
    }

    bool chance(double p) { return uniform01() < p; }
};

class SeededRandom : public RandomSource {
public:
    explicit SeededRandom(std::uint64_t seed = 42) : rng_(seed) {}

    void seed(std::uint64_t s) { rng_.seed(s); }

    double uniform01() override { return dist_(rng_); }

private:
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

#endif
