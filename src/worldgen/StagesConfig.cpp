#include "worldgen/StagesConfig.hpp"
#include "worldgen/Math.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace geosphere::worldgen {

namespace
{
    constexpr double kDegToRad = kPi / 180.0;

    // Missing keys fall back; a present key of the wrong type is an error.
    template <typename T>
    T GetOr(const json& j, const char* key, const T& fallback)
    {
        if (!j.is_object())
            return fallback;
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return fallback;
        try
        {
            return it->get<T>();
        }
        catch (const json::type_error& e)
        {
            throw std::invalid_argument(std::string("config key '") + key + "': " + e.what());
        }
    }

    template <typename T>
    std::optional<T> GetOpt(const json& j, const char* key, const std::optional<T>& fallback)
    {
        if (!j.is_object() || !j.contains(key))
            return fallback;
        if (j.at(key).is_null())
            return std::nullopt;
        return GetOr<T>(j, key, T{});
    }

    json Section(const json& root, const char* name)
    {
        json s = root.value(name, json::object());
        if (!s.is_object())
            throw std::invalid_argument(std::string("config section '") + name + "' must be an object");
        return s;
    }

    double Degrees(const json& j, const char* key, double fallbackRadians)
    {
        return GetOr<double>(j, key, fallbackRadians / kDegToRad) * kDegToRad;
    }
}

GeneratorConfig StagesConfig::from_json(const json& root)
{
    if (!root.is_object())
        throw std::invalid_argument("config root must be an object");

    GeneratorConfig cfg{};
    PlanetParams& p = cfg.planet;

    // [planet]
    const json planet = Section(root, "planet");
    const std::string kind = GetOr<std::string>(planet, "kind", std::string(toString(p.kind)));
    if (!parsePlanetKind(kind, p.kind))
        throw std::invalid_argument("config key 'kind': unknown planet kind '" + kind + "'");
    p.seed                  = GetOr<std::uint64_t>(planet, "seed",                   p.seed);
    p.radius                = GetOr<double>       (planet, "radius",                 p.radius);
    p.mass                  = GetOpt<double>      (planet, "mass",                   p.mass);
    p.axialTilt             = Degrees             (planet, "axial_tilt_deg",         p.axialTilt);
    p.axialPrecession       = Degrees             (planet, "axial_precession_deg",   p.axialPrecession);
    p.rotationalPeriod      = GetOr<double>       (planet, "rotational_period",      p.rotationalPeriod);
    p.starLuminosity        = GetOr<double>       (planet, "star_luminosity",        p.starLuminosity);
    p.starDistance          = GetOr<double>       (planet, "star_distance",          p.starDistance);
    p.albedo                = GetOr<double>       (planet, "albedo",                 p.albedo);
    p.internalTemperature   = GetOr<double>       (planet, "internal_temperature",   p.internalTemperature);
    p.hydrosphereProportion = GetOr<double>       (planet, "hydrosphere_proportion", p.hydrosphereProportion);
    p.normalizedSeaLevel    = GetOr<double>       (planet, "normalized_sea_level",   p.normalizedSeaLevel);
    p.flatSurface           = GetOr<bool>         (planet, "flat_surface",           p.flatSurface);
    p.randomizeMaxElevation = GetOr<bool>         (planet, "randomize_max_elevation", p.randomizeMaxElevation);
    p.maxElevation          = GetOpt<double>      (planet, "max_elevation",          p.maxElevation);

    // [atmosphere]
    const json atmosphere = Section(root, "atmosphere");
    if (!GetOr<bool>(atmosphere, "enabled", true)) {
        p.atmosphere.reset();
    } else {
        AtmosphereParams a = p.atmosphere.value_or(AtmosphereParams{});
        a.surfacePressure      = GetOr<double> (atmosphere, "surface_pressure",      a.surfacePressure);
        a.greenhouseFactor     = GetOr<double> (atmosphere, "greenhouse_factor",     a.greenhouseFactor);
        a.waterVaporRatio      = GetOr<double> (atmosphere, "water_vapor_ratio",     a.waterVaporRatio);
        a.averagePrecipitation = GetOpt<double>(atmosphere, "average_precipitation", a.averagePrecipitation);
        p.atmosphere = a;
    }

    // [orbit]
    const json orbit = Section(root, "orbit");
    if (!GetOr<bool>(orbit, "enabled", true)) {
        p.orbit.reset();
    } else {
        OrbitParams o = p.orbit.value_or(OrbitParams{});
        o.semiMajorAxis = GetOr<double>(orbit, "semi_major_axis", o.semiMajorAxis);
        o.eccentricity  = GetOr<double>(orbit, "eccentricity",    o.eccentricity);
        o.period        = GetOr<double>(orbit, "period",          o.period);
        p.orbit = o;
    }

    // [map]
    const json map = Section(root, "map");
    SurfaceMapRequest& m = cfg.map;
    m.resolution       = GetOr<int> (map, "resolution", m.resolution);
    m.seasons          = GetOr<int> (map, "seasons",    m.seasons);
    m.computeHydrology = GetOr<bool>(map, "hydrology",  m.computeHydrology);
    m.projection.equalArea       = GetOr<bool>(map, "equal_area", m.projection.equalArea);
    m.projection.centralMeridian = Degrees(map, "central_meridian_deg", m.projection.centralMeridian);
    m.projection.centralParallel = Degrees(map, "central_parallel_deg", m.projection.centralParallel);
    if (auto sp = GetOpt<double>(map, "standard_parallels_deg", std::nullopt))
        m.projection.standardParallels = *sp * kDegToRad;
    if (auto r = GetOpt<double>(map, "range_deg", std::nullopt))
        m.projection.range = *r * kDegToRad;

    // [noise]
    const json noise = Section(root, "noise");
    ClimateTuning& t = p.tuning;
    t.elevationNoiseScale     = GetOr<double>(noise, "elevation_scale",     t.elevationNoiseScale);
    t.precipitationNoiseScale = GetOr<double>(noise, "precipitation_scale", t.precipitationNoiseScale);

    // [tuning]
    const json tuning = Section(root, "tuning");
    t.insolationLatitudeFactor = GetOr<double>(tuning, "insolation_latitude_factor", t.insolationLatitudeFactor);
    t.polarCosine              = GetOr<double>(tuning, "polar_cosine",               t.polarCosine);
    t.hadleyPolarOffset        = GetOr<double>(tuning, "hadley_polar_offset",        t.hadleyPolarOffset);
    t.coldHumidityRamp         = GetOr<double>(tuning, "cold_humidity_ramp",         t.coldHumidityRamp);
    t.itczBoost                = GetOr<double>(tuning, "itcz_boost",                 t.itczBoost);
    t.itczHalfWidth            = GetOr<double>(tuning, "itcz_half_width",            t.itczHalfWidth);
    t.maxElevationConstant     = GetOr<double>(tuning, "max_elevation_constant",     t.maxElevationConstant);
    t.snowToRainRatio          = GetOr<double>(tuning, "snow_to_rain_ratio",         t.snowToRainRatio);

    // [logging]
    const json logging = Section(root, "logging");
    cfg.logging.level = GetOr<std::string>(logging, "level", cfg.logging.level);
    cfg.logging.file  = GetOr<std::string>(logging, "file",  cfg.logging.file);

    return cfg;
}

GeneratorConfig StagesConfig::load(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f)
        throw std::runtime_error("Failed to open config: " + path);

    json root;
    try
    {
        f >> root;
    }
    catch (const json::parse_error& e)
    {
        throw std::runtime_error("Failed to parse config " + path + ": " + e.what());
    }
    return from_json(root);
}

bool StagesConfig::try_load(const std::string& path, GeneratorConfig& out)
{
    try
    {
        out = load(path);
        return true;
    }
    catch (const std::exception& e)
    {
        spdlog::warn("config: {}", e.what());
        return false;
    }
}

std::string StagesConfig::default_path()
{
    return "assets/config/geosphere.json";
}

} // namespace geosphere::worldgen
