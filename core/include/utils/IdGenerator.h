#ifndef ID_GENERATOR_H
#define ID_GENERATOR_H

#include <cstdint>
#include <string>

// Monotonic id source shared by agents, resources and messages.
// Ids are "<prefix>_<n>" with one counter for all prefixes.
class IdGenerator {
public:
    std::string next(const std::string& prefix) {
        return prefix + "_" + std::to_string(counter_++);
    }

    void reset(std::uint64_t start = 0) { counter_ = start; }
    std::uint64_t issued() const { return counter_; }

private:
    std::uint64_t counter_ = 0;
};

#endif
