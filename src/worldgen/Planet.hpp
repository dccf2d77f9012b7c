// src/worldgen/Planet.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "worldgen/Math.hpp"
#include "worldgen/Noise.hpp"
#include "worldgen/PhysicalConstants.hpp"
#include "worldgen/Vec3.hpp"

namespace geosphere::worldgen {

// Closed set of planet kinds. Only the parameters that differ per kind live in
// PlanetKindTraits; everything else is shared by the single Planet record.
enum class PlanetKind : std::uint8_t {
    Rocky    = 0,
    Icy      = 1,
    GasGiant = 2,
    Comet    = 3
};

struct PlanetKindTraits {
    double minDensity = 0.0;       // kg/m^3
    double maxDensity = 0.0;
    int    maxSatellites = 0;
    double ringChance = 0.0;       // 0..1
    double coreProportion = 0.0;   // of radius
    double mantleProportion = 0.0;
    double crustProportion = 0.0;
    bool   solidSurface = true;    // false => always flat (no terrain)
};

[[nodiscard]] const PlanetKindTraits& traitsOf(PlanetKind kind) noexcept;
[[nodiscard]] std::string_view toString(PlanetKind kind) noexcept;
[[nodiscard]] bool parsePlanetKind(std::string_view s, PlanetKind& out) noexcept;

// The five noise seeds. Fixed at creation, never regenerated.
struct NoiseSeeds {
    std::uint64_t elevation = 0;            // base terrain
    std::uint64_t irregularity1 = 0;        // terrain modulation
    std::uint64_t irregularity2 = 0;
    std::uint64_t precipitationDetail = 0;  // fine precipitation texture
    std::uint64_t precipitationSmooth = 0;  // broad precipitation texture

    friend bool operator==(const NoiseSeeds&, const NoiseSeeds&) = default;
};

struct OrbitParams {
    double semiMajorAxis = phys::kAstronomicalUnit;   // m
    double eccentricity  = phys::kEarthOrbitalEccentricity;
    double period        = phys::kEarthOrbitalPeriod; // s

    friend bool operator==(const OrbitParams&, const OrbitParams&) = default;
};

struct AtmosphereParams {
    double surfacePressure  = phys::kEarthSurfacePressure; // kPa
    double greenhouseFactor = 1.22;
    double waterVaporRatio  = 0.0025;                      // kg vapor / kg dry air
    std::optional<double> averagePrecipitation;            // mm/yr; derived from hydrosphere if unset

    friend bool operator==(const AtmosphereParams&, const AtmosphereParams&) = default;
};

// Empirical constants. These are tuning knobs, not physical law.
struct ClimateTuning {
    double insolationLatitudeFactor = 0.8;        // c in cos(|lat| * c)
    double polarCosine              = 0.095;      // cosine of the polar incidence used for air mass
    double hadleyPolarOffset        = kPi / 36.0; // dead zone subtracted from |lat|
    double coldHumidityRamp         = 16.0;       // K below melting point where humidity reaches 0
    double itczBoost                = 0.4;        // max extra humidity at the equator
    double itczHalfWidth            = kPi / 16.0;
    double maxElevationConstant     = 2.0e5;      // maxElevation = K / g
    double snowToRainRatio          = 13.0;
    double elevationNoiseScale      = 100.0;
    double precipitationNoiseScale  = 1000.0;

    friend bool operator==(const ClimateTuning&, const ClimateTuning&) = default;
};

// Builder input for Planet::create. Plain data; everything derived is computed by create().
struct PlanetParams {
    PlanetKind kind = PlanetKind::Rocky;

    std::uint64_t seed = 0;               // world seed; derives noise seeds and sampled values
    std::optional<NoiseSeeds> seeds;      // explicit seeds win over derived ones

    double radius = phys::kEarthRadius;   // m
    std::optional<double> mass;           // kg; sampled from the kind's density range if unset

    double axialTilt        = phys::kEarthAxialTilt; // rad
    double axialPrecession  = 0.0;                   // rad
    double rotationalPeriod = phys::kEarthRotationalPeriod; // s

    std::optional<OrbitParams> orbit = OrbitParams{};
    double starLuminosity = phys::kSolarLuminosity; // W
    double starDistance   = phys::kAstronomicalUnit; // m, used when there is no orbit
    double albedo         = phys::kEarthAlbedo;
    double internalTemperature = 0.0;               // K

    std::optional<AtmosphereParams> atmosphere = AtmosphereParams{};

    double hydrosphereProportion = 0.7; // 0 => no hydrosphere
    double normalizedSeaLevel    = 0.0; // [-1, 1]

    bool flatSurface = false;
    bool randomizeMaxElevation = false;
    std::optional<double> maxElevation; // explicit override, meters

    ClimateTuning tuning{};

    friend bool operator==(const PlanetParams&, const PlanetParams&) = default;
};

// Derived atmosphere state; all-zero for an airless body.
struct AtmosphereState {
    double surfacePressure = 0.0;      // kPa
    double mass = 0.0;                 // kg
    double scaleHeight = 0.0;          // m
    double atmosphericHeight = 0.0;    // m
    double greenhouseFactor = 1.0;
    double waterVaporRatio = 0.0;
    double averagePrecipitation = 0.0; // mm/yr
    double maxPrecipitation = 0.0;     // mm/yr
    double snowToRainRatio = 0.0;
};

// Immutable planet record. Construct with Planet::create; every derived
// quantity (gravity, max elevation, atmosphere, insolation, noise fields)
// is computed eagerly there.
class Planet {
public:
    // Throws std::invalid_argument on out-of-range parameters.
    [[nodiscard]] static Planet create(const PlanetParams& params);

    // Copies with one side of the elevation / sea-level relation changed.
    // The normalized sea level is kept when the max elevation changes.
    [[nodiscard]] Planet withMaxElevation(double meters) const;
    [[nodiscard]] Planet withSeaLevel(double meters) const;

    // Params with the derived seeds and mass pinned, so create(params()) reproduces this planet.
    [[nodiscard]] const PlanetParams& params() const noexcept { return params_; }

    [[nodiscard]] PlanetKind kind() const noexcept { return params_.kind; }
    [[nodiscard]] std::uint64_t seed() const noexcept { return params_.seed; }
    [[nodiscard]] const NoiseSeeds& seeds() const noexcept { return seeds_; }
    [[nodiscard]] const ClimateTuning& tuning() const noexcept { return params_.tuning; }

    [[nodiscard]] double radius() const noexcept { return params_.radius; }
    [[nodiscard]] double mass() const noexcept { return mass_; }
    [[nodiscard]] double surfaceGravity() const noexcept { return surfaceGravity_; }
    [[nodiscard]] double rotationalPeriod() const noexcept { return params_.rotationalPeriod; }
    [[nodiscard]] double axialTilt() const noexcept { return params_.axialTilt; }
    [[nodiscard]] double axialPrecession() const noexcept { return params_.axialPrecession; }

    // Rotation taking world vectors into the planet frame (inverse of the axis orientation).
    [[nodiscard]] const Quatd& axisRotation() const noexcept { return axisRotation_; }
    [[nodiscard]] const Vec3d& axis() const noexcept { return axis_; }

    [[nodiscard]] bool hasOrbit() const noexcept { return params_.orbit.has_value(); }
    [[nodiscard]] const std::optional<OrbitParams>& orbit() const noexcept { return params_.orbit; }
    [[nodiscard]] double starLuminosity() const noexcept { return params_.starLuminosity; }
    [[nodiscard]] double albedo() const noexcept { return params_.albedo; }

    [[nodiscard]] bool hasAtmosphere() const noexcept { return atmosphere_.mass > 0.0; }
    [[nodiscard]] const AtmosphereState& atmosphere() const noexcept { return atmosphere_; }

    [[nodiscard]] double hydrosphereProportion() const noexcept { return params_.hydrosphereProportion; }
    [[nodiscard]] bool hasHydrosphere() const noexcept { return params_.hydrosphereProportion > 0.0; }

    [[nodiscard]] bool hasFlatSurface() const noexcept { return flat_; }
    [[nodiscard]] double maxElevation() const noexcept { return maxElevation_; }
    [[nodiscard]] double normalizedSeaLevel() const noexcept { return params_.normalizedSeaLevel; }
    [[nodiscard]] double seaLevel() const noexcept { return params_.normalizedSeaLevel * maxElevation_; }

    [[nodiscard]] const NoiseField& elevationNoise() const noexcept { return noise1_; }
    [[nodiscard]] const NoiseField& irregularityNoise1() const noexcept { return noise2_; }
    [[nodiscard]] const NoiseField& irregularityNoise2() const noexcept { return noise3_; }
    [[nodiscard]] const NoiseField& precipitationDetailNoise() const noexcept { return noise4_; }
    [[nodiscard]] const NoiseField& precipitationSmoothNoise() const noexcept { return noise5_; }

    // Temperature summaries (K).
    [[nodiscard]] double blackbodyTemperatureAtPeriapsis() const noexcept { return bbPeriapsis_; }
    [[nodiscard]] double blackbodyTemperatureAtApoapsis() const noexcept { return bbApoapsis_; }
    [[nodiscard]] double averageBlackbodyTemperature() const noexcept { return bbAverage_; }
    [[nodiscard]] double insolationFactorEquatorial() const noexcept { return insolationEquatorial_; }
    [[nodiscard]] double insolationFactorPolar() const noexcept { return insolationPolar_; }
    [[nodiscard]] double greenhouseEffect() const noexcept { return greenhouseEffect_; }
    [[nodiscard]] double averageSurfaceTemperature() const noexcept { return averageSurfaceTemperature_; }
    [[nodiscard]] double maxSurfaceTemperature() const noexcept { return maxSurfaceTemperature_; }
    [[nodiscard]] double minSurfaceTemperature() const noexcept { return minSurfaceTemperature_; }
    [[nodiscard]] double diurnalTemperatureVariation() const noexcept { return diurnalVariation_; }

    // True anomalies of the solstices (rad).
    [[nodiscard]] double winterSolsticeTrueAnomaly() const noexcept;
    [[nodiscard]] double summerSolsticeTrueAnomaly() const noexcept;

    friend bool operator==(const Planet& a, const Planet& b) noexcept { return a.params_ == b.params_; }

private:
    Planet() = default;

    PlanetParams params_{};
    NoiseSeeds   seeds_{};

    double mass_ = 0.0;
    double surfaceGravity_ = 0.0;
    double maxElevation_ = 0.0;
    bool   flat_ = false;

    Quatd axisRotation_{};
    Vec3d axis_{0.0, 1.0, 0.0};

    AtmosphereState atmosphere_{};

    double bbPeriapsis_ = 0.0;
    double bbApoapsis_ = 0.0;
    double bbAverage_ = 0.0;
    double insolationEquatorial_ = 1.0;
    double insolationPolar_ = 1.0;
    double greenhouseEffect_ = 0.0;
    double averageSurfaceTemperature_ = 0.0;
    double maxSurfaceTemperature_ = 0.0;
    double minSurfaceTemperature_ = 0.0;
    double diurnalVariation_ = 0.0;

    NoiseField noise1_;
    NoiseField noise2_;
    NoiseField noise3_;
    NoiseField noise4_;
    NoiseField noise5_;
};

} // namespace geosphere::worldgen
