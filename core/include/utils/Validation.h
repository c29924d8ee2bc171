#ifndef VALIDATION_H
#define VALIDATION_H

#include <cstddef>
#include <stdexcept>
#include <string>

// Invariant checks for the simulation core. Active unless NDEBUG is defined;
// a failure is a core bug, never an expected outcome.
namespace validation {

#ifndef NDEBUG
constexpr bool kEnabled = true;
#else
constexpr bool kEnabled = false;
#endif

inline void fail(const std::string& what, const char* where) {
    throw std::logic_error(std::string("invariant violated in ") + where + ": " + what);
}

inline void checkRange(double value, double lo, double hi, const char* name, const char* where) {
    if (!kEnabled) return;
    if (!(value >= lo && value <= hi)) {
        fail(std::string(name) + "=" + std::to_string(value) + " outside [" +
             std::to_string(lo) + ", " + std::to_string(hi) + "]", where);
    }
}

inline void checkEnergy(double energy, const char* where) {
    checkRange(energy, 0.0, 100.0, "energy", where);
}

inline void checkNonNegative(double value, const char* name, const char* where = "unknown") {
    if (!kEnabled) return;
    if (!(value >= 0.0)) {
        fail(std::string(name) + " negative (" + std::to_string(value) + ")", where);
    }
}

inline void checkMonotonic(long before, long after, const char* name, const char* where) {
    if (!kEnabled) return;
    if (after < before) {
        fail(std::string(name) + " decreased from " + std::to_string(before) +
             " to " + std::to_string(after), where);
    }
}

inline void checkPopulationCap(std::size_t population, std::size_t cap, const char* where) {
    if (!kEnabled) return;
    if (population > cap) {
        fail("population " + std::to_string(population) + " exceeds cap " + std::to_string(cap), where);
    }
}

}  // namespace validation

#endif
