// src/worldgen/Temperature.cpp
#include "worldgen/Temperature.hpp"
#include "worldgen/Math.hpp"
#include "worldgen/PhysicalConstants.hpp"
#include "worldgen/Planet.hpp"

#include <algorithm>
#include <cmath>

namespace geosphere::worldgen {

double areaRatioFactor(double rotationalPeriod) noexcept
{
    double ratio = 1.0;
    if (rotationalPeriod <= 2500.0)
        ratio = 1.0;
    else if (rotationalPeriod <= 75000.0)
        ratio = 0.25;
    else if (rotationalPeriod <= 150000.0)
        ratio = 1.0 / 3.0;
    else if (rotationalPeriod <= 300000.0)
        ratio = 0.5;
    return std::pow(ratio, 0.25);
}

double blackbodyTemperature(double luminosity, double albedo, double distance, double rotationalPeriod) noexcept
{
    if (!(distance > 0.0) || !(luminosity > 0.0))
        return 0.0;
    const double absorbed = luminosity * (1.0 - albedo) / (4.0 * kPi * phys::kStefanBoltzmann * distance * distance);
    return std::pow(std::max(0.0, absorbed), 0.25) * areaRatioFactor(rotationalPeriod);
}

double orbitalDistanceAt(const OrbitParams& orbit, double trueAnomaly) noexcept
{
    const double e = orbit.eccentricity;
    return orbit.semiMajorAxis * (1.0 - e * e) / (1.0 + e * std::cos(trueAnomaly));
}

double polarAirMass(double radius, double scaleHeight, double polarCosine) noexcept
{
    if (!(scaleHeight > 0.0))
        return 1.0;
    const double r = radius / scaleHeight;
    const double rc = r * polarCosine;
    return std::sqrt(rc * rc + 2.0 * r + 1.0) - rc;
}

double insolationFactor(double atmosphereMass, double planetMass, double airMass, bool polar) noexcept
{
    if (!(atmosphereMass > 0.0) || !(planetMass > 0.0))
        return 1.0;
    const double attenuation = polar ? std::pow(0.7, std::pow(airMass, 0.678)) : 0.7;
    return std::pow(1320000.0 * atmosphereMass * attenuation / planetMass, 0.25);
}

double greenhouseEffect(double averageBlackbody, double equatorialFactor, double greenhouseFactor) noexcept
{
    return std::max(0.0, averageBlackbody * equatorialFactor * greenhouseFactor - averageBlackbody);
}

double dryLapseRate(double surfaceGravity) noexcept
{
    return surfaceGravity / phys::kSpecificHeatDryAir;
}

double moistLapseRate(double surfaceGravity, double surfaceTemperature, double waterVaporRatio) noexcept
{
    const double T = surfaceTemperature;
    const double w = waterVaporRatio;
    const double Rsd = phys::kSpecificGasConstantDryAir;
    const double Hv = phys::kHeatOfVaporizationWater;

    const double numerator = surfaceGravity * (Rsd * T * T + Hv * w * T);
    const double denominator = phys::kSpecificHeatDryAir * Rsd * T * T
                             + Hv * Hv * w * phys::kMolarMassRatioVaporDryAir;
    if (nearlyZero(denominator, 1e-9))
        return dryLapseRate(surfaceGravity);
    return numerator / denominator;
}

double blackbodyTemperatureAt(const Planet& planet, double trueAnomaly) noexcept
{
    const double distance = planet.hasOrbit()
        ? orbitalDistanceAt(*planet.orbit(), trueAnomaly)
        : planet.params().starDistance;
    return blackbodyTemperature(planet.starLuminosity(), planet.albedo(), distance, planet.rotationalPeriod());
}

double insolationFactorAt(const Planet& planet, double latitude) noexcept
{
    const double polar = planet.insolationFactorPolar();
    const double eq = planet.insolationFactorEquatorial();
    return polar + (eq - polar) * std::cos(std::abs(latitude) * planet.tuning().insolationLatitudeFactor);
}

double surfaceTemperatureAt(const Planet& planet, double trueAnomaly, double seasonalLat) noexcept
{
    return blackbodyTemperatureAt(planet, trueAnomaly) * insolationFactorAt(planet, seasonalLat)
         + planet.greenhouseEffect();
}

double solarDeclination(const Planet& planet, double trueAnomaly) noexcept
{
    if (!planet.hasOrbit())
        return 0.0;
    const double eclipticLongitude = trueAnomaly - planet.axialPrecession();
    return std::asin(std::clamp(-std::sin(planet.axialTilt()) * std::sin(eclipticLongitude), -1.0, 1.0));
}

double seasonalLatitude(double latitude, double declination) noexcept
{
    const double s = latitude + declination;
    if (s > kHalfPi)
        return kPi - s;
    if (s < -kHalfPi)
        return -s - kPi;
    return s;
}

double lapseRate(const Planet& planet, double surfaceTemperature) noexcept
{
    const double g = planet.surfaceGravity();
    const double w = planet.atmosphere().waterVaporRatio;
    if (w > 0.0)
        return moistLapseRate(g, surfaceTemperature, w);
    return dryLapseRate(g);
}

double temperatureAtElevation(const Planet& planet, double surfaceTemperature, double elevation) noexcept
{
    if (!planet.hasAtmosphere())
        return surfaceTemperature;
    if (elevation >= planet.atmosphere().atmosphericHeight)
        return planet.averageBlackbodyTemperature();
    if (elevation <= 0.0)
        return surfaceTemperature;
    return surfaceTemperature - elevation * lapseRate(planet, surfaceTemperature);
}

TemperatureRange temperatureRangeAt(const Planet& planet, double latitude, double elevation) noexcept
{
    const double winterAnomaly = planet.winterSolsticeTrueAnomaly();
    const double summerAnomaly = planet.summerSolsticeTrueAnomaly();

    const double winterLat = seasonalLatitude(latitude, solarDeclination(planet, winterAnomaly));
    const double summerLat = seasonalLatitude(latitude, solarDeclination(planet, summerAnomaly));

    const double winter = temperatureAtElevation(planet, surfaceTemperatureAt(planet, winterAnomaly, winterLat), elevation);
    const double summer = temperatureAtElevation(planet, surfaceTemperatureAt(planet, summerAnomaly, summerLat), elevation);

    TemperatureRange r;
    r.min = std::min(winter, summer);
    r.max = std::max(winter, summer);
    r.average = (r.min + r.max) * 0.5;
    return r;
}

double seasonalTemperature(const TemperatureRange& range, double summerProportion) noexcept
{
    return lerp(range.min, range.max, std::clamp(summerProportion, 0.0, 1.0));
}

double summerProportionAt(double positionInYear, double latitude) noexcept
{
    double p = positionInYear - std::floor(positionInYear);
    if (latitude < 0.0) {
        p += 0.5;
        if (p >= 1.0) p -= 1.0;
    }
    return 1.0 - std::abs(0.5 - p) / 0.5;
}

} // namespace geosphere::worldgen
