#ifndef SCRIPTED_RANDOM_H
#define SCRIPTED_RANDOM_H

#include <cstddef>
#include <initializer_list>
#include <vector>

#include "utils/Random.h"

// Replays a fixed list of draws, then repeats a fallback value.
class ScriptedRandom : public RandomSource {
public:
    explicit ScriptedRandom(std::initializer_list<double> values = {}, double fallback = 0.5)
        : values_(values), fallback_(fallback) {}

    double uniform01() override {
        ++consumed_;
        if (next_ < values_.size()) return values_[next_++];
        return fallback_;
    }

    void push(double value) { values_.push_back(value); }
    void setFallback(double value) { fallback_ = value; }
    std::size_t consumed() const { return consumed_; }

private:
    std::vector<double> values_;
    std::size_t next_ = 0;
    double fallback_;
    std::size_t consumed_ = 0;
};

#endif
