// src/worldgen/SurfaceGeometry.cpp
#include "worldgen/SurfaceGeometry.hpp"
#include "worldgen/Elevation.hpp"
#include "worldgen/Planet.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace geosphere::worldgen {

Quatd axisOrientation(double axialTilt, double axialPrecession) noexcept
{
    const Quatd precession = Quatd::yaw(axialPrecession);
    const Vec3d tiltAxis = precession.rotate(Vec3d::unitX());
    return Quatd::axisAngle(tiltAxis, axialTilt);
}

Vec3d latLonToVector(const Planet& planet, double latitude, double longitude) noexcept
{
    const double cosLat = std::cos(latitude);
    const Vec3d local{cosLat * std::sin(longitude), std::sin(latitude), cosLat * std::cos(longitude)};
    return normalize(planet.axisRotation().conjugate().rotate(local));
}

double vectorToLatitude(const Planet& planet, const Vec3d& v) noexcept
{
    return kHalfPi - angleBetween(planet.axis(), v);
}

double vectorToLongitude(const Planet& planet, const Vec3d& v) noexcept
{
    const Vec3d local = planet.axisRotation().rotate(v);
    if (nearlyZero(local.x, 1e-15) && nearlyZero(local.z, 1e-15))
        return 0.0;
    return std::atan2(local.x, local.z);
}

LatLon vectorToLatLon(const Planet& planet, const Vec3d& v) noexcept
{
    return {vectorToLatitude(planet, v), vectorToLongitude(planet, v)};
}

double greatCircleDistance(const Planet& planet, const Vec3d& a, const Vec3d& b) noexcept
{
    return planet.radius() * angleBetween(a, b);
}

double distanceBetween(const Planet& planet, double lat1, double lon1, double lat2, double lon2) noexcept
{
    return greatCircleDistance(planet, latLonToVector(planet, lat1, lon1), latLonToVector(planet, lat2, lon2));
}

LatLon destinationOnGreatCircle(const Planet& planet,
                                double latitude, double longitude,
                                double distance, double bearing) noexcept
{
    const double delta = distance / planet.radius();
    const double sinLat = std::sin(latitude);
    const double cosLat = std::cos(latitude);
    const double sinDelta = std::sin(delta);
    const double cosDelta = std::cos(delta);

    const double sinLat2 = std::clamp(sinLat * cosDelta + cosLat * sinDelta * std::cos(bearing), -1.0, 1.0);
    const double lat2 = std::asin(sinLat2);
    const double lon2 = longitude + std::atan2(std::sin(bearing) * sinDelta * cosLat,
                                               cosDelta - sinLat * sinLat2);
    return {lat2, normalizeLongitude(lon2)};
}

LatLon offsetLatitude(double latitude, double longitude, double delta) noexcept
{
    double lat = latitude + delta;
    double lon = longitude;
    if (lat > kHalfPi) {
        lat = kPi - lat;
        lon += kPi;
    } else if (lat < -kHalfPi) {
        lat = -kPi - lat;
        lon += kPi;
    }
    return {lat, normalizeLongitude(lon)};
}

double slope(const Planet& planet, double latitude, double longitude) noexcept
{
    const double maxElevation = planet.maxElevation();
    if (nearlyZero(maxElevation, 1e-9))
        return 0.0;

    const double here = normalizedElevationAt(planet, latLonToVector(planet, latitude, longitude));

    const std::array<LatLon, 4> neighbours{
        offsetLatitude(latitude, longitude, kArcSecond),                         // north
        LatLon{latitude, normalizeLongitude(longitude + kArcSecond)},            // east
        offsetLatitude(latitude, longitude, -kArcSecond),                        // south
        LatLon{latitude, normalizeLongitude(longitude - kArcSecond)},            // west
    };

    double best = 0.0;
    for (const LatLon& n : neighbours) {
        const double run = distanceBetween(planet, latitude, longitude, n.latitude, n.longitude);
        if (!(run > 1e-9))
            continue; // east/west collapse onto the pole
        const double e = normalizedElevationAt(planet, latLonToVector(planet, n.latitude, n.longitude));
        best = std::max(best, std::abs(e - here) * maxElevation / run);
    }
    return best;
}

bool isMountainous(const Planet& planet, double latitude, double longitude) noexcept
{
    const double e = normalizedElevationAt(planet, latLonToVector(planet, latitude, longitude));
    if (e < 0.035)
        return false;
    if (e > 0.085)
        return true;
    const double s = slope(planet, latitude, longitude);
    if (e > 0.05)
        return s > 0.035;
    return s > 0.0875;
}

} // namespace geosphere::worldgen
