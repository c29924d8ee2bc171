#include "modules/Environment.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include "utils/IdGenerator.h"
#include "utils/Random.h"

namespace {
constexpr double kPi = 3.14159265358979323846;
}

const char* seasonName(Season s) {
    switch (s) {
        case Season::Spring: return "spring";
        case Season::Summer: return "summer";
        case Season::Autumn: return "autumn";
        case Season::Winter: return "winter";
    }
    return "unknown";
}

const char* weatherName(Weather w) {
    switch (w) {
        case Weather::Clear: return "clear";
        case Weather::Rain: return "rain";
        case Weather::Storm: return "storm";
    }
    return "unknown";
}

Environment::Environment(double carryingCapacity)
    : carryingCapacity_(carryingCapacity) {}

void Environment::reset() {
    resources_.clear();
    season_ = Season::Spring;
    weather_ = Weather::Clear;
    temperature_ = EnvironmentConstants::kBaseTemperature;
    cycleStep_ = 0;
}

void Environment::update(RandomSource& rng, IdGenerator& ids) {
    using namespace EnvironmentConstants;

    ++cycleStep_;
    const double phase = static_cast<double>(cycleStep_ % (kSeasonLength * 4)) / kSeasonLength;
    if (phase < 1.0) season_ = Season::Spring;
    else if (phase < 2.0) season_ = Season::Summer;
    else if (phase < 3.0) season_ = Season::Autumn;
    else season_ = Season::Winter;

    temperature_ = kBaseTemperature + std::sin((phase - 1.0) * kPi) * kTemperatureAmplitude;

    regenerate(rng, ids);

    if (rng.chance(kWeatherChangeChance)) {
        if (rng.chance(kClearWeatherShare)) {
            weather_ = Weather::Clear;
        } else {
            weather_ = rng.chance(0.5) ? Weather::Rain : Weather::Storm;
        }
    }
}

void Environment::regenerate(RandomSource& rng, IdGenerator& ids) {
    using namespace EnvironmentConstants;

    // Both rules look at the count from before this tick's growth.
    const std::size_t count = resources_.size();
    const int ceiling = maxResources();

    if (static_cast<int>(count) < ceiling && rng.chance(kRegenerationChance)) {
        const int batch = std::min(kMaxBatch, ceiling - static_cast<int>(count));
        for (int i = 0; i < batch; ++i) {
            Resource r;
            r.quality = rng.uniform01();
            r.value = r.quality * 20.0 + 10.0;
            const double distance = rng.uniform01() * kSpawnBand + kSpawnInnerRadius;
            const double angle = rng.uniform01() * 2.0 * kPi;
            r.position = {std::cos(angle) * distance, std::sin(angle) * distance};
            r.id = ids.next("resource");
            resources_.push_back(std::move(r));
        }
    }

    if (count < kEmergencyFloor) {
        for (int i = 0; i < kEmergencyBatch; ++i) {
            Resource r;
            r.position.x = (rng.uniform01() - 0.5) * kEmergencySpread;
            r.position.z = (rng.uniform01() - 0.5) * kEmergencySpread;
            r.value = kEmergencyValue;
            r.quality = kEmergencyQuality;
            r.id = ids.next("emergency");
            resources_.push_back(std::move(r));
        }
    }
}

bool Environment::consume(const std::string& id) {
    auto it = std::find_if(resources_.begin(), resources_.end(),
                           [&](const Resource& r) { return r.id == id; });
    if (it == resources_.end()) return false;
    resources_.erase(it);
    return true;
}

const Resource* Environment::find(const std::string& id) const {
    auto it = std::find_if(resources_.begin(), resources_.end(),
                           [&](const Resource& r) { return r.id == id; });
    return it == resources_.end() ? nullptr : &*it;
}

const Resource* Environment::nearestResource(const Vec3& from, double* distance) const {
    const Resource* best = nullptr;
    double bestDist = std::numeric_limits<double>::infinity();
    for (const auto& r : resources_) {
        const double d = planarDistance(from, r.position);
        if (d < bestDist) {
            bestDist = d;
            best = &r;
        }
    }
    if (distance) *distance = bestDist;
    return best;
}

std::vector<std::string> Environment::resourcesWithin(const Vec3& from, double radius) const {
    std::vector<std::string> ids;
    for (const auto& r : resources_) {
        if (planarDistance(from, r.position) < radius) ids.push_back(r.id);
    }
    return ids;
}

double Environment::survivalThreshold(std::size_t population) const {
    using namespace EnvironmentConstants;
    return std::max(kMinSurvivalThreshold,
                    kSurvivalThresholdScale * static_cast<double>(population) / carryingCapacity_);
}

double Environment::pressure(std::size_t population) const {
    return std::min(EnvironmentConstants::kMaxPressure,
                    static_cast<double>(population) / carryingCapacity_);
}

double Environment::seasonMultiplier(Season s) {
    switch (s) {
        case Season::Winter: return 0.6;
        case Season::Spring: return 1.4;
        case Season::Summer: return 1.2;
        case Season::Autumn: return 1.0;
    }
    return 1.0;
}

int Environment::maxResources() const {
    using namespace EnvironmentConstants;
    const int base = season_ == Season::Winter ? kWinterBaseCapacity : kBaseCapacity;
    return static_cast<int>(std::floor(base * seasonMultiplier(season_)));
}
