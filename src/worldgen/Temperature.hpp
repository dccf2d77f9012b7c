// src/worldgen/Temperature.hpp
#pragma once

namespace geosphere::worldgen {

class Planet;
struct OrbitParams;

// Yearly temperature range at one location, K.
struct TemperatureRange {
    double min = 0.0;
    double max = 0.0;
    double average = 0.0;

    friend bool operator==(const TemperatureRange&, const TemperatureRange&) = default;
};

// ----- Body-level physics (no Planet needed; used while a Planet is being built) -----

// Rotational regime ratio raised to 1/4: fast rotators spread insolation
// over the whole surface, slow rotators over less of it.
[[nodiscard]] double areaRatioFactor(double rotationalPeriod) noexcept;

// (L (1 - A) / (4 pi sigma d^2))^(1/4) * areaRatioFactor(period); 0 for d <= 0.
[[nodiscard]] double blackbodyTemperature(double luminosity, double albedo,
                                          double distance, double rotationalPeriod) noexcept;

// r(nu) = a (1 - e^2) / (1 + e cos nu)
[[nodiscard]] double orbitalDistanceAt(const OrbitParams& orbit, double trueAnomaly) noexcept;

// Relative path length through the atmosphere at the pole.
[[nodiscard]] double polarAirMass(double radius, double scaleHeight, double polarCosine) noexcept;

// (1320000 * atmMass * attenuation / planetMass)^(1/4), attenuation being
// 0.7 at the equator and 0.7^(airMass^0.678) at the pole. An airless body
// gets 1 (no atmospheric contribution).
[[nodiscard]] double insolationFactor(double atmosphereMass, double planetMass,
                                      double airMass, bool polar) noexcept;

// max(0, avgBB * eqFactor * greenhouseFactor - avgBB)
[[nodiscard]] double greenhouseEffect(double averageBlackbody, double equatorialFactor,
                                      double greenhouseFactor) noexcept;

// Dry adiabatic lapse rate g / cp, K/m.
[[nodiscard]] double dryLapseRate(double surfaceGravity) noexcept;

// Moist (saturated) lapse rate; falls back to the dry rate when the
// denominator degenerates.
[[nodiscard]] double moistLapseRate(double surfaceGravity, double surfaceTemperature,
                                    double waterVaporRatio) noexcept;

// ----- Planet-level queries -----

[[nodiscard]] double blackbodyTemperatureAt(const Planet& planet, double trueAnomaly) noexcept;

// polar + (eq - polar) * cos(|lat| * c)
[[nodiscard]] double insolationFactorAt(const Planet& planet, double latitude) noexcept;

[[nodiscard]] double surfaceTemperatureAt(const Planet& planet, double trueAnomaly,
                                          double seasonalLatitude) noexcept;

// asin(-sin(tilt) sin(nu - precession)); 0 without an orbit.
[[nodiscard]] double solarDeclination(const Planet& planet, double trueAnomaly) noexcept;

// latitude + declination, reflected back into [-pi/2, pi/2].
[[nodiscard]] double seasonalLatitude(double latitude, double solarDeclination) noexcept;

[[nodiscard]] double lapseRate(const Planet& planet, double surfaceTemperature) noexcept;

// Applies the lapse rate above sea level; at or above the top of the
// atmosphere the average blackbody temperature is returned.
[[nodiscard]] double temperatureAtElevation(const Planet& planet, double surfaceTemperature,
                                            double elevation) noexcept;

// Solstice temperatures at `elevation` meters, ordered into min/max.
[[nodiscard]] TemperatureRange temperatureRangeAt(const Planet& planet, double latitude,
                                                  double elevation) noexcept;

// lerp(min, max, summerProportion)
[[nodiscard]] double seasonalTemperature(const TemperatureRange& range, double summerProportion) noexcept;

// How far into summer a point of the year is (0 at the winter solstice, 1
// at the summer solstice); the southern hemisphere runs half a year out of phase.
[[nodiscard]] double summerProportionAt(double positionInYear, double latitude) noexcept;

} // namespace geosphere::worldgen
