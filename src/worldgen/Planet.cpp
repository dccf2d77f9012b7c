// src/worldgen/Planet.cpp
#include "worldgen/Planet.hpp"
#include "worldgen/Elevation.hpp"
#include "worldgen/Hash.hpp"
#include "worldgen/Random.hpp"
#include "worldgen/SurfaceGeometry.hpp"
#include "worldgen/Temperature.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

namespace geosphere::worldgen {

namespace {

// Stream ids for derive_pcg_seed; keep stable, they pin planet output to a seed.
constexpr std::uint64_t kStreamNoiseSeeds = 0x4e4f495345ull; // "NOISE"
constexpr std::uint64_t kStreamPlanet     = 0x504c414e4554ull; // "PLANET"

const std::array<PlanetKindTraits, 4> kKindTraits{{
    // minDensity maxDensity sats ring  core  mantle crust solid
    {3750.0,  5500.0,   5, 0.10, 0.15, 0.56, 0.29, true },  // Rocky
    {1500.0,  3000.0,   5, 0.20, 0.30, 0.50, 0.20, true },  // Icy
    { 600.0,  1600.0,  20, 0.90, 0.02, 0.98, 0.00, false},  // GasGiant
    { 300.0,   700.0,   0, 0.00, 0.20, 0.60, 0.20, true },  // Comet
}};

void require(bool ok, const char* what)
{
    if (!ok)
        throw std::invalid_argument(std::string("PlanetParams: ") + what);
}

void validate(const PlanetParams& p)
{
    require(std::isfinite(p.radius) && p.radius > 0.0, "radius must be positive");
    require(!p.mass || (std::isfinite(*p.mass) && *p.mass > 0.0), "mass must be positive");
    require(std::isfinite(p.rotationalPeriod) && p.rotationalPeriod > 0.0, "rotational period must be positive");
    require(std::isfinite(p.axialTilt) && std::abs(p.axialTilt) <= kPi, "axial tilt must be within [-pi, pi]");
    require(std::isfinite(p.axialPrecession), "axial precession must be finite");
    require(p.albedo >= 0.0 && p.albedo <= 1.0, "albedo must be within [0, 1]");
    require(p.starLuminosity >= 0.0, "star luminosity must not be negative");
    require(p.internalTemperature >= 0.0, "internal temperature must not be negative");
    require(p.hydrosphereProportion >= 0.0 && p.hydrosphereProportion <= 1.0, "hydrosphere proportion must be within [0, 1]");
    require(p.normalizedSeaLevel >= -1.0 && p.normalizedSeaLevel <= 1.0, "normalized sea level must be within [-1, 1]");
    require(!p.maxElevation || *p.maxElevation >= 0.0, "max elevation must not be negative");
    if (p.orbit) {
        require(p.orbit->semiMajorAxis > 0.0, "orbit semi-major axis must be positive");
        require(p.orbit->eccentricity >= 0.0 && p.orbit->eccentricity < 1.0, "orbit eccentricity must be within [0, 1)");
        require(p.orbit->period > 0.0, "orbit period must be positive");
    } else {
        require(p.starDistance > 0.0, "star distance must be positive without an orbit");
    }
    if (p.atmosphere) {
        require(p.atmosphere->surfacePressure >= 0.0, "surface pressure must not be negative");
        require(p.atmosphere->greenhouseFactor >= 0.0, "greenhouse factor must not be negative");
        require(p.atmosphere->waterVaporRatio >= 0.0, "water vapor ratio must not be negative");
        require(!p.atmosphere->averagePrecipitation || *p.atmosphere->averagePrecipitation >= 0.0,
                "average precipitation must not be negative");
    }
}

NoiseSeeds deriveSeeds(std::uint64_t worldSeed) noexcept
{
    std::array<std::uint64_t, 5> s{};
    for (std::size_t i = 0; i < s.size(); ++i)
        s[i] = derive_pcg_seed(worldSeed, 0, static_cast<std::int64_t>(i), kStreamNoiseSeeds).first;
    return {s[0], s[1], s[2], s[3], s[4]};
}

} // namespace

const PlanetKindTraits& traitsOf(PlanetKind kind) noexcept
{
    const auto i = static_cast<std::size_t>(kind);
    return kKindTraits[i < kKindTraits.size() ? i : 0];
}

std::string_view toString(PlanetKind kind) noexcept
{
    switch (kind) {
        case PlanetKind::Rocky:    return "rocky";
        case PlanetKind::Icy:      return "icy";
        case PlanetKind::GasGiant: return "gas_giant";
        case PlanetKind::Comet:    return "comet";
    }
    return "rocky";
}

bool parsePlanetKind(std::string_view s, PlanetKind& out) noexcept
{
    if (s == "rocky")     { out = PlanetKind::Rocky;    return true; }
    if (s == "icy")       { out = PlanetKind::Icy;      return true; }
    if (s == "gas_giant") { out = PlanetKind::GasGiant; return true; }
    if (s == "comet")     { out = PlanetKind::Comet;    return true; }
    return false;
}

Planet Planet::create(const PlanetParams& params)
{
    validate(params);

    Planet p;
    p.params_ = params;
    const PlanetKindTraits& traits = traitsOf(params.kind);

    p.seeds_ = params.seeds ? *params.seeds : deriveSeeds(params.seed);
    p.params_.seeds = p.seeds_;

    auto [state, stream] = derive_pcg_seed(params.seed, 0, 0, kStreamPlanet);
    Pcg32 rng(state, stream);

    // Mass: explicit, or sampled density times volume.
    const double volume = 4.0 / 3.0 * kPi * params.radius * params.radius * params.radius;
    const double density = randd(rng, traits.minDensity, traits.maxDensity);
    p.mass_ = params.mass ? *params.mass : density * volume;
    p.params_.mass = p.mass_;
    p.surfaceGravity_ = phys::kGravitationalConstant * p.mass_ / (params.radius * params.radius);

    // Terrain.
    p.flat_ = params.flatSurface || !traits.solidSurface;
    require(!(p.flat_ && params.maxElevation && *params.maxElevation > 0.0),
            "a flat surface cannot have a positive max elevation");
    if (params.maxElevation) {
        p.maxElevation_ = p.flat_ ? 0.0 : *params.maxElevation;
    } else {
        p.maxElevation_ = computeMaxElevation(p.surfaceGravity_, p.flat_,
                                              params.tuning.maxElevationConstant,
                                              params.randomizeMaxElevation ? &rng : nullptr);
    }

    // Rotation axis.
    const Quatd q = axisOrientation(params.axialTilt, params.axialPrecession);
    p.axisRotation_ = q.conjugate();
    p.axis_ = normalize(q.rotate(Vec3d::unitY()));

    // Noise fields.
    p.noise1_ = NoiseField(p.seeds_.elevation,           NoiseSettings{0.01, 6, 2.0, 0.5, FractalType::Fbm});
    p.noise2_ = NoiseField(p.seeds_.irregularity1,       NoiseSettings{0.02, 5, 2.0, 0.5, FractalType::Billow});
    p.noise3_ = NoiseField(p.seeds_.irregularity2,       NoiseSettings{0.03, 4, 2.0, 0.5, FractalType::Fbm});
    p.noise4_ = NoiseField(p.seeds_.precipitationDetail, NoiseSettings{0.01, 3, 2.0, 0.5, FractalType::Fbm});
    p.noise5_ = NoiseField(p.seeds_.precipitationSmooth, NoiseSettings{0.004, 1, 2.0, 0.5, FractalType::Fbm});

    // Blackbody temperatures.
    if (params.orbit) {
        const OrbitParams& o = *params.orbit;
        const double periapsis = o.semiMajorAxis * (1.0 - o.eccentricity);
        const double apoapsis = o.semiMajorAxis * (1.0 + o.eccentricity);
        p.bbPeriapsis_ = blackbodyTemperature(params.starLuminosity, params.albedo, periapsis, params.rotationalPeriod);
        p.bbApoapsis_ = blackbodyTemperature(params.starLuminosity, params.albedo, apoapsis, params.rotationalPeriod);
        p.bbAverage_ = blackbodyTemperature(params.starLuminosity, params.albedo,
                                            (periapsis + apoapsis) * 0.5, params.rotationalPeriod);
    } else {
        p.bbAverage_ = blackbodyTemperature(params.starLuminosity, params.albedo, params.starDistance, params.rotationalPeriod);
        p.bbPeriapsis_ = p.bbAverage_;
        p.bbApoapsis_ = p.bbAverage_;
    }

    // Atmosphere.
    AtmosphereState& atm = p.atmosphere_;
    if (params.atmosphere && params.atmosphere->surfacePressure > 0.0 && p.surfaceGravity_ > 0.0) {
        const AtmosphereParams& a = *params.atmosphere;
        const double g = p.surfaceGravity_;
        atm.surfacePressure = a.surfacePressure;
        atm.mass = a.surfacePressure * 1000.0 * 4.0 * kPi * params.radius * params.radius / g;
        atm.scaleHeight = phys::kIdealGasConstant * p.bbAverage_ / (g * phys::kMolarMassOfAir);
        atm.greenhouseFactor = a.greenhouseFactor;
        atm.waterVaporRatio = a.waterVaporRatio;
        atm.averagePrecipitation = a.averagePrecipitation.value_or(
            params.hydrosphereProportion > 0.0 ? phys::kEarthAveragePrecipitation : 0.0);
        atm.maxPrecipitation = atm.averagePrecipitation * (0.05 + std::exp(1.25));
        atm.snowToRainRatio = params.tuning.snowToRainRatio;

        const double airMass = polarAirMass(params.radius, atm.scaleHeight, params.tuning.polarCosine);
        p.insolationEquatorial_ = insolationFactor(atm.mass, p.mass_, airMass, false);
        p.insolationPolar_ = insolationFactor(atm.mass, p.mass_, airMass, true);
        p.greenhouseEffect_ = worldgen::greenhouseEffect(p.bbAverage_, p.insolationEquatorial_, a.greenhouseFactor);
    }

    p.averageSurfaceTemperature_ = p.bbAverage_ * p.insolationEquatorial_ + p.greenhouseEffect_;

    if (atm.mass > 0.0 && atm.surfacePressure > phys::kAtmosphereTopPressure) {
        atm.atmosphericHeight = std::log(phys::kAtmosphereTopPressure / atm.surfacePressure)
                              * phys::kIdealGasConstant * p.averageSurfaceTemperature_
                              / (-p.surfaceGravity_ * phys::kMolarMassOfAir);
    }

    // Diurnal variation and extremes.
    const double timeFactor = std::clamp(1.0 - (params.rotationalPeriod - 2500.0) / 595000.0, 0.0, 1.0);
    const double darkSurface = (p.bbAverage_ * p.insolationEquatorial_ - params.internalTemperature) * timeFactor
                             + params.internalTemperature + p.greenhouseEffect_;
    p.diurnalVariation_ = p.averageSurfaceTemperature_ - darkSurface;
    p.maxSurfaceTemperature_ = p.bbPeriapsis_ * p.insolationEquatorial_ + p.greenhouseEffect_;
    p.minSurfaceTemperature_ = p.bbApoapsis_ * p.insolationPolar_ + p.greenhouseEffect_ - p.diurnalVariation_;

    return p;
}

Planet Planet::withMaxElevation(double meters) const
{
    PlanetParams next = params_;
    next.maxElevation = meters;
    return create(next);
}

Planet Planet::withSeaLevel(double meters) const
{
    PlanetParams next = params_;
    next.maxElevation = maxElevation_;
    if (nearlyZero(maxElevation_, 1e-9)) {
        require(nearlyZero(meters, 1e-9), "sea level must be 0 on a body without relief");
        next.normalizedSeaLevel = 0.0;
    } else {
        next.normalizedSeaLevel = meters / maxElevation_;
    }
    return create(next);
}

double Planet::winterSolsticeTrueAnomaly() const noexcept
{
    return normalizeAngle(params_.axialPrecession + 3.0 * kHalfPi);
}

double Planet::summerSolsticeTrueAnomaly() const noexcept
{
    return normalizeAngle(params_.axialPrecession + kHalfPi);
}

} // namespace geosphere::worldgen
