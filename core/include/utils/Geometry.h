#pragma once

#include <cmath>

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

// Ground-plane location carried by messages and social records.
struct PlanarPoint {
    double x = 0.0;
    double z = 0.0;
};

// All proximity checks ignore height.
inline double planarDistance(const Vec3& a, const Vec3& b) {
    const double dx = a.x - b.x;
    const double dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

inline double planarDistance(const Vec3& a, const PlanarPoint& b) {
    const double dx = a.x - b.x;
    const double dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}
