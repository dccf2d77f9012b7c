// src/worldgen/SurfaceGeometry.hpp
#pragma once
#include "worldgen/Math.hpp"
#include "worldgen/Vec3.hpp"

namespace geosphere::worldgen {

class Planet;

struct LatLon {
    double latitude = 0.0;  // rad, [-pi/2, pi/2]
    double longitude = 0.0; // rad, (-pi, pi]
};

inline constexpr double kArcSecond = kPi / 648000.0;

// Orientation of the rotation axis: precession (about +Y) picks the tilt
// direction, then the body is tilted by `axialTilt` about that direction.
// Returns q; the planet's axisRotation() is conj(q).
[[nodiscard]] Quatd axisOrientation(double axialTilt, double axialPrecession) noexcept;

[[nodiscard]] Vec3d latLonToVector(const Planet& planet, double latitude, double longitude) noexcept;
[[nodiscard]] double vectorToLatitude(const Planet& planet, const Vec3d& v) noexcept;
// 0 at the poles, where longitude is undefined.
[[nodiscard]] double vectorToLongitude(const Planet& planet, const Vec3d& v) noexcept;
[[nodiscard]] LatLon vectorToLatLon(const Planet& planet, const Vec3d& v) noexcept;

// Sea-level distance along the surface, in meters. atan2 form stays accurate
// for both nearby and antipodal points.
[[nodiscard]] double greatCircleDistance(const Planet& planet, const Vec3d& a, const Vec3d& b) noexcept;
[[nodiscard]] double distanceBetween(const Planet& planet,
                                     double lat1, double lon1,
                                     double lat2, double lon2) noexcept;

// Point reached by travelling `distance` meters from (lat, lon) along the
// initial `bearing` (rad, clockwise from north).
[[nodiscard]] LatLon destinationOnGreatCircle(const Planet& planet,
                                              double latitude, double longitude,
                                              double distance, double bearing) noexcept;

// Moves `latitude` by `delta`, reflecting across a pole (and shifting the
// longitude by pi) when it overshoots.
[[nodiscard]] LatLon offsetLatitude(double latitude, double longitude, double delta) noexcept;

// Max rise/run over the four neighbours one arc-second away (unitless).
[[nodiscard]] double slope(const Planet& planet, double latitude, double longitude) noexcept;

[[nodiscard]] bool isMountainous(const Planet& planet, double latitude, double longitude) noexcept;

} // namespace geosphere::worldgen
