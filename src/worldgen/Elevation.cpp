// src/worldgen/Elevation.cpp
#include "worldgen/Elevation.hpp"
#include "worldgen/Math.hpp"
#include "worldgen/Planet.hpp"
#include "worldgen/Random.hpp"
#include "worldgen/SurfaceGeometry.hpp"

#include <algorithm>
#include <cmath>

namespace geosphere::worldgen {

double computeMaxElevation(double surfaceGravity, bool flatSurface, double constant, Pcg32* randomizer) noexcept
{
    if (flatSurface || !(surfaceGravity > 0.0))
        return 0.0;

    double maxElevation = constant / surfaceGravity;
    if (randomizer) {
        double sum = 0.0;
        for (int i = 0; i < 5; ++i)
            sum += randd(*randomizer, 0.5, 1.5);
        maxElevation *= sum / 5.0;
    }
    return maxElevation;
}

double normalizedElevationAt(const Planet& planet, const Vec3d& position) noexcept
{
    if (nearlyZero(planet.maxElevation(), 1e-9))
        return 0.0;

    const double s = planet.tuning().elevationNoiseScale;
    const double x = position.x * s;
    const double y = position.y * s;
    const double z = position.z * s;

    const double base = planet.elevationNoise().sample(x, y, z);
    const double irr1 = std::abs(planet.irregularityNoise1().sample(x, y, z));
    const double irr2 = std::abs(planet.irregularityNoise2().sample(x, y, z));

    const double e = 6.0 * base * irr1 * irr2 - planet.normalizedSeaLevel();
    return std::clamp(e, -1.0, 1.0);
}

double elevationAt(const Planet& planet, const Vec3d& position) noexcept
{
    return normalizedElevationAt(planet, position) * planet.maxElevation();
}

double elevationAt(const Planet& planet, double latitude, double longitude) noexcept
{
    return elevationAt(planet, latLonToVector(planet, latitude, longitude));
}

bool isLand(const Planet& planet, double normalizedElevation) noexcept
{
    return !planet.hasHydrosphere() || normalizedElevation > 0.0;
}

} // namespace geosphere::worldgen
