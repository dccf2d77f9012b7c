// src/worldgen/Elevation.hpp
#pragma once
#include "worldgen/Vec3.hpp"

namespace geosphere::worldgen {

class Planet;
struct Pcg32;

// K / g, optionally scaled by the mean of five uniform draws in [0.5, 1.5].
// Flat bodies and non-positive gravity yield 0.
[[nodiscard]] double computeMaxElevation(double surfaceGravity,
                                         bool flatSurface,
                                         double constant,
                                         Pcg32* randomizer) noexcept;

// Sea-level-relative elevation in [-1, 1]:
//   6 * n1(s*p) * |n2(s*p)| * |n3(s*p)| - normalizedSeaLevel
// Identically 0 when the planet's max elevation is (nearly) zero.
[[nodiscard]] double normalizedElevationAt(const Planet& planet, const Vec3d& position) noexcept;

// Meters: normalizedElevationAt(...) * maxElevation.
[[nodiscard]] double elevationAt(const Planet& planet, const Vec3d& position) noexcept;
[[nodiscard]] double elevationAt(const Planet& planet, double latitude, double longitude) noexcept;

// Without a hydrosphere every cell counts as land.
[[nodiscard]] bool isLand(const Planet& planet, double normalizedElevation) noexcept;

} // namespace geosphere::worldgen
