#ifndef ENVIRONMENT_MODULE_H
#define ENVIRONMENT_MODULE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "utils/Geometry.h"

class RandomSource;
class IdGenerator;

enum class Season : std::uint8_t {
    Spring = 0,
    Summer,
    Autumn,
    Winter
};

enum class Weather : std::uint8_t {
    Clear = 0,
    Rain,
    Storm
};

const char* seasonName(Season s);
const char* weatherName(Weather w);

struct Resource {
    std::string id;
    PlanarPoint position;
    double value = 0.0;
    double quality = 0.0;   // 0..1
};

namespace EnvironmentConstants {
    constexpr int kSeasonLength = 150;              // ticks per season, four per cycle
    constexpr double kBaseTemperature = 20.0;
    constexpr double kTemperatureAmplitude = 15.0;

    constexpr double kRegenerationChance = 0.6;
    constexpr int kMaxBatch = 3;
    constexpr int kWinterBaseCapacity = 40;
    constexpr int kBaseCapacity = 60;
    constexpr double kSpawnInnerRadius = 3.0;
    constexpr double kSpawnBand = 15.0;

    constexpr std::size_t kEmergencyFloor = 10;
    constexpr int kEmergencyBatch = 5;
    constexpr double kEmergencySpread = 20.0;
    constexpr double kEmergencyValue = 25.0;
    constexpr double kEmergencyQuality = 0.8;

    constexpr double kWeatherChangeChance = 0.02;
    constexpr double kClearWeatherShare = 0.7;

    constexpr double kCarryingCapacity = 100.0;
    constexpr double kMinSurvivalThreshold = 10.0;
    constexpr double kSurvivalThresholdScale = 30.0;
    constexpr double kMaxPressure = 2.0;

    constexpr double kForageRadius = 3.0;
}

// Resources, seasons and weather. Resources are kept in creation order; ids
// come from the shared generator.
class Environment {
public:
    explicit Environment(double carryingCapacity = EnvironmentConstants::kCarryingCapacity);

    void reset();

    // One tick: cycle step, season, temperature, regeneration, weather.
    void update(RandomSource& rng, IdGenerator& ids);

    // Removes a resource. Returns false if the id is unknown.
    bool consume(const std::string& id);

    const Resource* find(const std::string& id) const;
    const Resource* nearestResource(const Vec3& from, double* distance = nullptr) const;

    // Ids of every resource strictly within radius of a point, in creation order.
    std::vector<std::string> resourcesWithin(const Vec3& from, double radius) const;

    // max(10, 30 * population / carryingCapacity)
    double survivalThreshold(std::size_t population) const;
    // min(2, population / carryingCapacity)
    double pressure(std::size_t population) const;

    // Resource ceiling for the current season.
    int maxResources() const;
    static double seasonMultiplier(Season s);

    const std::vector<Resource>& resources() const { return resources_; }
    std::vector<Resource>& resourcesMut() { return resources_; }
    double carryingCapacity() const { return carryingCapacity_; }
    Season season() const { return season_; }
    Weather weather() const { return weather_; }
    double temperature() const { return temperature_; }
    std::uint64_t cycleStep() const { return cycleStep_; }

private:
    void regenerate(RandomSource& rng, IdGenerator& ids);

    std::vector<Resource> resources_;
    double carryingCapacity_;
    Season season_ = Season::Spring;
    Weather weather_ = Weather::Clear;
    double temperature_ = EnvironmentConstants::kBaseTemperature;
    std::uint64_t cycleStep_ = 0;
};

#endif
