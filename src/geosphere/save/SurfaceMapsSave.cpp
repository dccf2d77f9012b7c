// src/geosphere/save/SurfaceMapsSave.cpp
#include "geosphere/save/SurfaceMapsSave.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace geosphere::worldgen {

// ---------- helpers ----------

namespace {

template <class T>
json optional_to_json(const std::optional<T>& v)
{
    return v ? json(*v) : json(nullptr);
}

template <class T>
std::optional<T> optional_from_json(const json& j, const char* key)
{
    const json& v = j.at(key);
    if (v.is_null())
        return std::nullopt;
    return v.get<T>();
}

template <class E>
E enum_from_json(const json& j, int maxValue, const char* what)
{
    const int v = j.get<int>();
    if (v < 0 || v > maxValue)
        throw json::type_error::create(302, std::string(what) + " value out of range: " + std::to_string(v), &j);
    return static_cast<E>(v);
}

template <class E>
json enum_to_json(E v)
{
    return static_cast<int>(v);
}

} // namespace

// ---------- tagged enums ----------

void to_json(json& j, PlanetKind v) { j = std::string(toString(v)); }
void from_json(const json& j, PlanetKind& v)
{
    const auto s = j.get<std::string>();
    if (!parsePlanetKind(s, v))
        throw json::type_error::create(302, "unknown planet kind '" + s + "'", &j);
}

void to_json(json& j, FractalType v) { j = std::string(toString(v)); }
void from_json(const json& j, FractalType& v)
{
    const auto s = j.get<std::string>();
    if (!parseFractalType(s, v))
        throw json::type_error::create(302, "unknown fractal type '" + s + "'", &j);
}

// ---------- NoiseSettings ----------
void to_json(json& j, const NoiseSettings& v) {
    j = json::object({
        {"frequency",         v.frequency},
        {"octaves",           v.octaves},
        {"lacunarity",        v.lacunarity},
        {"gain",              v.gain},
        {"fractal",           v.fractal},
        {"perturb_amplitude", v.perturbAmplitude},
        {"perturb_frequency", v.perturbFrequency}
    });
}
void from_json(const json& j, NoiseSettings& v) {
    v.frequency        = j.at("frequency").get<double>();
    v.octaves          = j.at("octaves").get<int>();
    v.lacunarity       = j.at("lacunarity").get<double>();
    v.gain             = j.at("gain").get<double>();
    v.fractal          = j.at("fractal").get<FractalType>();
    v.perturbAmplitude = j.value("perturb_amplitude", 0.0);
    v.perturbFrequency = j.value("perturb_frequency", 1.0);
}

// ---------- NoiseSeeds ----------
void to_json(json& j, const NoiseSeeds& v) {
    j = json::array({ v.elevation, v.irregularity1, v.irregularity2,
                      v.precipitationDetail, v.precipitationSmooth });
}
void from_json(const json& j, NoiseSeeds& v) {
    if (!j.is_array() || j.size() != 5)
        throw json::type_error::create(302, "NoiseSeeds expects array[5]", &j);
    v.elevation           = j.at(0).get<std::uint64_t>();
    v.irregularity1       = j.at(1).get<std::uint64_t>();
    v.irregularity2       = j.at(2).get<std::uint64_t>();
    v.precipitationDetail = j.at(3).get<std::uint64_t>();
    v.precipitationSmooth = j.at(4).get<std::uint64_t>();
}

// ---------- OrbitParams ----------
void to_json(json& j, const OrbitParams& v) {
    j = json::object({
        {"semi_major_axis", v.semiMajorAxis},
        {"eccentricity",    v.eccentricity},
        {"period",          v.period}
    });
}
void from_json(const json& j, OrbitParams& v) {
    v.semiMajorAxis = j.at("semi_major_axis").get<double>();
    v.eccentricity  = j.at("eccentricity").get<double>();
    v.period        = j.at("period").get<double>();
}

// ---------- AtmosphereParams ----------
void to_json(json& j, const AtmosphereParams& v) {
    j = json::object({
        {"surface_pressure",      v.surfacePressure},
        {"greenhouse_factor",     v.greenhouseFactor},
        {"water_vapor_ratio",     v.waterVaporRatio},
        {"average_precipitation", optional_to_json(v.averagePrecipitation)}
    });
}
void from_json(const json& j, AtmosphereParams& v) {
    v.surfacePressure      = j.at("surface_pressure").get<double>();
    v.greenhouseFactor     = j.at("greenhouse_factor").get<double>();
    v.waterVaporRatio      = j.at("water_vapor_ratio").get<double>();
    v.averagePrecipitation = optional_from_json<double>(j, "average_precipitation");
}

// ---------- ClimateTuning ----------
void to_json(json& j, const ClimateTuning& v) {
    j = json::object({
        {"insolation_latitude_factor", v.insolationLatitudeFactor},
        {"polar_cosine",               v.polarCosine},
        {"hadley_polar_offset",        v.hadleyPolarOffset},
        {"cold_humidity_ramp",         v.coldHumidityRamp},
        {"itcz_boost",                 v.itczBoost},
        {"itcz_half_width",            v.itczHalfWidth},
        {"max_elevation_constant",     v.maxElevationConstant},
        {"snow_to_rain_ratio",         v.snowToRainRatio},
        {"elevation_noise_scale",      v.elevationNoiseScale},
        {"precipitation_noise_scale",  v.precipitationNoiseScale}
    });
}
void from_json(const json& j, ClimateTuning& v) {
    // Older files may predate a knob; keep the default for anything absent.
    const ClimateTuning d{};
    v.insolationLatitudeFactor = j.value("insolation_latitude_factor", d.insolationLatitudeFactor);
    v.polarCosine              = j.value("polar_cosine",               d.polarCosine);
    v.hadleyPolarOffset        = j.value("hadley_polar_offset",        d.hadleyPolarOffset);
    v.coldHumidityRamp         = j.value("cold_humidity_ramp",         d.coldHumidityRamp);
    v.itczBoost                = j.value("itcz_boost",                 d.itczBoost);
    v.itczHalfWidth            = j.value("itcz_half_width",            d.itczHalfWidth);
    v.maxElevationConstant     = j.value("max_elevation_constant",     d.maxElevationConstant);
    v.snowToRainRatio          = j.value("snow_to_rain_ratio",         d.snowToRainRatio);
    v.elevationNoiseScale      = j.value("elevation_noise_scale",      d.elevationNoiseScale);
    v.precipitationNoiseScale  = j.value("precipitation_noise_scale",  d.precipitationNoiseScale);
}

// ---------- PlanetParams ----------
void to_json(json& j, const PlanetParams& v) {
    j = json::object({
        {"kind",                    v.kind},
        {"seed",                    v.seed},
        {"seeds",                   optional_to_json(v.seeds)},
        {"radius",                  v.radius},
        {"mass",                    optional_to_json(v.mass)},
        {"axial_tilt",              v.axialTilt},
        {"axial_precession",        v.axialPrecession},
        {"rotational_period",       v.rotationalPeriod},
        {"orbit",                   optional_to_json(v.orbit)},
        {"star_luminosity",         v.starLuminosity},
        {"star_distance",           v.starDistance},
        {"albedo",                  v.albedo},
        {"internal_temperature",    v.internalTemperature},
        {"atmosphere",              optional_to_json(v.atmosphere)},
        {"hydrosphere_proportion",  v.hydrosphereProportion},
        {"normalized_sea_level",    v.normalizedSeaLevel},
        {"flat_surface",            v.flatSurface},
        {"randomize_max_elevation", v.randomizeMaxElevation},
        {"max_elevation",           optional_to_json(v.maxElevation)},
        {"tuning",                  v.tuning}
    });
}
void from_json(const json& j, PlanetParams& v) {
    v.kind                  = j.at("kind").get<PlanetKind>();
    v.seed                  = j.at("seed").get<std::uint64_t>();
    v.seeds                 = optional_from_json<NoiseSeeds>(j, "seeds");
    v.radius                = j.at("radius").get<double>();
    v.mass                  = optional_from_json<double>(j, "mass");
    v.axialTilt             = j.at("axial_tilt").get<double>();
    v.axialPrecession       = j.at("axial_precession").get<double>();
    v.rotationalPeriod      = j.at("rotational_period").get<double>();
    v.orbit                 = optional_from_json<OrbitParams>(j, "orbit");
    v.starLuminosity        = j.at("star_luminosity").get<double>();
    v.starDistance          = j.at("star_distance").get<double>();
    v.albedo                = j.at("albedo").get<double>();
    v.internalTemperature   = j.at("internal_temperature").get<double>();
    v.atmosphere            = optional_from_json<AtmosphereParams>(j, "atmosphere");
    v.hydrosphereProportion = j.at("hydrosphere_proportion").get<double>();
    v.normalizedSeaLevel    = j.at("normalized_sea_level").get<double>();
    v.flatSurface           = j.at("flat_surface").get<bool>();
    v.randomizeMaxElevation = j.at("randomize_max_elevation").get<bool>();
    v.maxElevation          = optional_from_json<double>(j, "max_elevation");
    v.tuning                = j.value("tuning", ClimateTuning{});
}

// ---------- MapProjectionOptions ----------
void to_json(json& j, const MapProjectionOptions& v) {
    j = json::object({
        {"central_meridian",   v.centralMeridian},
        {"central_parallel",   v.centralParallel},
        {"standard_parallels", optional_to_json(v.standardParallels)},
        {"range",              optional_to_json(v.range)},
        {"equal_area",         v.equalArea}
    });
}
void from_json(const json& j, MapProjectionOptions& v) {
    v.centralMeridian   = j.at("central_meridian").get<double>();
    v.centralParallel   = j.at("central_parallel").get<double>();
    v.standardParallels = optional_from_json<double>(j, "standard_parallels");
    v.range             = optional_from_json<double>(j, "range");
    v.equalArea         = j.at("equal_area").get<bool>();
}

// ---------- cell values ----------
void to_json(json& j, const TemperatureRange& v) {
    j = json::array({ v.min, v.max, v.average });
}
void from_json(const json& j, TemperatureRange& v) {
    if (!j.is_array() || j.size() != 3)
        throw json::type_error::create(302, "TemperatureRange expects array[3]", &j);
    v.min     = j.at(0).get<double>();
    v.max     = j.at(1).get<double>();
    v.average = j.at(2).get<double>();
}

void to_json(json& j, const SeasonalRange& v) {
    j = json::array({ v.start, v.end });
}
void from_json(const json& j, SeasonalRange& v) {
    if (!j.is_array() || j.size() != 2)
        throw json::type_error::create(302, "SeasonalRange expects array[2]", &j);
    v.start = j.at(0).get<double>();
    v.end   = j.at(1).get<double>();
}

void to_json(json& j, ClimateType v)  { j = enum_to_json(v); }
void to_json(json& j, HumidityType v) { j = enum_to_json(v); }
void to_json(json& j, EcologyType v)  { j = enum_to_json(v); }
void to_json(json& j, BiomeType v)    { j = enum_to_json(v); }

void from_json(const json& j, ClimateType& v) {
    v = enum_from_json<ClimateType>(j, static_cast<int>(ClimateType::Supertropical), "ClimateType");
}
void from_json(const json& j, HumidityType& v) {
    v = enum_from_json<HumidityType>(j, static_cast<int>(HumidityType::Superhumid), "HumidityType");
}
void from_json(const json& j, EcologyType& v) {
    v = enum_from_json<EcologyType>(j, static_cast<int>(EcologyType::Sea), "EcologyType");
}
void from_json(const json& j, BiomeType& v) {
    // Flags: any combination of the defined bits.
    v = enum_from_json<BiomeType>(j, static_cast<int>((static_cast<std::uint32_t>(BiomeType::SeaIce) << 1) - 1), "BiomeType");
}

// ---------- SeasonMaps ----------
void to_json(json& j, const SeasonMaps& v) {
    j = json::object({
        {"index",              v.index},
        {"proportion_of_year", v.proportionOfYear},
        {"position_in_year",   v.positionInYear},
        {"true_anomaly",       v.trueAnomaly},
        {"temperature",        v.temperature},
        {"precipitation",      v.precipitation},
        {"snowfall",           v.snowfall}
    });
}
void from_json(const json& j, SeasonMaps& v) {
    v.index            = j.at("index").get<int>();
    v.proportionOfYear = j.at("proportion_of_year").get<double>();
    v.positionInYear   = j.at("position_in_year").get<double>();
    v.trueAnomaly      = j.at("true_anomaly").get<double>();
    v.temperature      = j.at("temperature").get<Grid2D<float>>();
    v.precipitation    = j.at("precipitation").get<Grid2D<float>>();
    v.snowfall         = j.at("snowfall").get<Grid2D<float>>();
}

// ---------- SurfaceMaps ----------
void to_json(json& j, const SurfaceMaps& v) {
    j = json::object({
        {"schema_version", save::kSchemaVersion},
        {"projection",     v.projection},
        {"resolution",     v.resolution},
        {"width",          v.width},
        {"height",         v.height},
        {"seed",           v.seed},
        {"max_elevation",  v.maxElevation},

        {"elevation",         v.elevation},
        {"temperature_range", v.temperatureRange},
        {"seasons",           v.seasons},

        {"total_precipitation",   v.totalPrecipitation},
        {"average_precipitation", v.averagePrecipitation},
        {"total_snowfall",        v.totalSnowfall},

        {"climate",    v.climate},
        {"humidity",   v.humidity},
        {"ecology",    v.ecology},
        {"biome",      v.biome},
        {"sea_ice",    v.seaIce},
        {"snow_cover", v.snowCover},
        {"flow",       v.flow},
        {"lake_depth", v.lakeDepth},

        {"summary", json::object({
            {"average_elevation",   v.averageElevation},
            {"temperature",         v.overallTemperature},
            {"precipitation",       json::array({ v.precipitation.min, v.precipitation.average, v.precipitation.max })},
            {"land_cell_count",     v.landCellCount},
            {"climate",             v.overallClimate},
            {"humidity",            v.overallHumidity},
            {"ecology",             v.overallEcology},
            {"biome",               v.overallBiome}
        })}
    });
}

namespace {

template <class T>
void require_shape(const json& j, const Grid2D<T>& g, int w, int h, bool allowEmpty, const char* what)
{
    if (allowEmpty && g.empty())
        return;
    if (!g.sameShape(w, h))
        throw json::type_error::create(302, std::string("grid '") + what + "' does not match the map size", &j);
}

} // namespace

void from_json(const json& j, SurfaceMaps& v) {
    v.projection   = j.at("projection").get<MapProjectionOptions>();
    v.resolution   = j.at("resolution").get<int>();
    v.width        = j.at("width").get<int>();
    v.height       = j.at("height").get<int>();
    v.seed         = j.at("seed").get<std::uint64_t>();
    v.maxElevation = j.at("max_elevation").get<double>();

    v.elevation        = j.at("elevation").get<Grid2D<float>>();
    v.temperatureRange = j.at("temperature_range").get<Grid2D<TemperatureRange>>();
    v.seasons          = j.at("seasons").get<std::vector<SeasonMaps>>();

    v.totalPrecipitation   = j.at("total_precipitation").get<Grid2D<float>>();
    v.averagePrecipitation = j.at("average_precipitation").get<Grid2D<float>>();
    v.totalSnowfall        = j.at("total_snowfall").get<Grid2D<float>>();

    v.climate   = j.at("climate").get<Grid2D<ClimateType>>();
    v.humidity  = j.at("humidity").get<Grid2D<HumidityType>>();
    v.ecology   = j.at("ecology").get<Grid2D<EcologyType>>();
    v.biome     = j.at("biome").get<Grid2D<BiomeType>>();
    v.seaIce    = j.at("sea_ice").get<Grid2D<SeasonalRange>>();
    v.snowCover = j.at("snow_cover").get<Grid2D<SeasonalRange>>();
    v.flow      = j.at("flow").get<Grid2D<float>>();
    v.lakeDepth = j.at("lake_depth").get<Grid2D<float>>();

    const json& s = j.at("summary");
    v.averageElevation   = s.at("average_elevation").get<double>();
    v.overallTemperature = s.at("temperature").get<TemperatureRange>();
    const json& p = s.at("precipitation");
    if (!p.is_array() || p.size() != 3)
        throw json::type_error::create(302, "precipitation summary expects array[3]", &p);
    v.precipitation   = PrecipitationSummary{ p.at(0).get<double>(), p.at(1).get<double>(), p.at(2).get<double>() };
    v.landCellCount   = s.at("land_cell_count").get<int>();
    v.overallClimate  = s.at("climate").get<ClimateType>();
    v.overallHumidity = s.at("humidity").get<HumidityType>();
    v.overallEcology  = s.at("ecology").get<EcologyType>();
    v.overallBiome    = s.at("biome").get<BiomeType>();

    // Every grid of one run shares the map size.
    const int w = v.width;
    const int h = v.height;
    require_shape(j, v.elevation, w, h, false, "elevation");
    require_shape(j, v.temperatureRange, w, h, false, "temperature_range");
    require_shape(j, v.totalPrecipitation, w, h, false, "total_precipitation");
    require_shape(j, v.averagePrecipitation, w, h, false, "average_precipitation");
    require_shape(j, v.totalSnowfall, w, h, false, "total_snowfall");
    require_shape(j, v.climate, w, h, false, "climate");
    require_shape(j, v.humidity, w, h, false, "humidity");
    require_shape(j, v.ecology, w, h, false, "ecology");
    require_shape(j, v.biome, w, h, false, "biome");
    require_shape(j, v.seaIce, w, h, false, "sea_ice");
    require_shape(j, v.snowCover, w, h, false, "snow_cover");
    require_shape(j, v.flow, w, h, true, "flow");
    require_shape(j, v.lakeDepth, w, h, true, "lake_depth");
    for (std::size_t i = 0; i < v.seasons.size(); ++i) {
        const SeasonMaps& season = v.seasons[i];
        if (season.index != static_cast<int>(i))
            throw json::type_error::create(302, "season " + std::to_string(i) + " is stored out of order", &j);
        require_shape(j, season.temperature, w, h, false, "season temperature");
        require_shape(j, season.precipitation, w, h, false, "season precipitation");
        require_shape(j, season.snowfall, w, h, false, "season snowfall");
    }
}

} // namespace geosphere::worldgen

namespace geosphere::save {

using worldgen::Planet;
using worldgen::PlanetParams;
using worldgen::SurfaceMaps;

// ---------- Migration (JSON-level) ----------
// Update raw JSON from older schema versions to the current one.
bool MigrateJsonInPlace(json& j, int target_schema_version, std::string& outError)
{
    try {
        int file_ver = j.value("schema_version", 1);
        if (file_ver > target_schema_version) {
            outError = "File schema_version=" + std::to_string(file_ver)
                     + " is newer than supported version " + std::to_string(target_schema_version);
            return false;
        }
        if (file_ver < target_schema_version) {
            // No known migration path
            outError = "No migration path for schema_version=" + std::to_string(file_ver);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        outError = e.what();
        return false;
    }
}

// ---------- I/O ----------

namespace {

std::expected<json, SaveError> ReadDocument(const std::filesystem::path& file)
{
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) {
        return std::unexpected(SaveError{ SaveError::Code::IoOpenFail, "Cannot open file: " + file.string() });
    }
    try {
        json doc = json::parse(ifs); // throws on malformed JSON
        // Basic shape check to avoid surprising type errors later
        if (!doc.is_object()) {
            return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, "Root JSON must be an object" });
        }
        std::string migErr;
        if (!MigrateJsonInPlace(doc, kSchemaVersion, migErr)) {
            return std::unexpected(SaveError{ SaveError::Code::MigrationFailed, migErr });
        }
        return doc;
    }
    catch (const json::parse_error& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonParseError, e.what() });
    }
}

// Write to <file>.tmp and then rename over the destination.
std::expected<void, SaveError> WriteFileAtomically(const std::filesystem::path& finalPath,
                                                   const std::string& data)
{
    const auto dir = finalPath.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return std::unexpected(SaveError{ SaveError::Code::IoWriteFail,
                "Cannot create directory " + dir.string() + ": " + ec.message() });
        }
    }

    std::filesystem::path tmpPath = finalPath;
    tmpPath += ".tmp";
    {
        std::ofstream ofs(tmpPath, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return std::unexpected(SaveError{ SaveError::Code::IoWriteFail, "Cannot open for write: " + tmpPath.string() });
        }
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs) {
            std::error_code ignored;
            std::filesystem::remove(tmpPath, ignored);
            return std::unexpected(SaveError{ SaveError::Code::IoWriteFail, "Write failed for: " + tmpPath.string() });
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        return std::unexpected(SaveError{ SaveError::Code::IoWriteFail,
            "Cannot replace " + finalPath.string() + ": " + ec.message() });
    }
    return {};
}

} // namespace

json SerializeSurfaceMaps(const SurfaceMaps& maps)
{
    return json(maps);
}

std::expected<SurfaceMaps, SaveError> DeserializeSurfaceMaps(json doc)
{
    try {
        if (!doc.is_object()) {
            return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, "Root JSON must be an object" });
        }
        std::string migErr;
        if (!MigrateJsonInPlace(doc, kSchemaVersion, migErr)) {
            return std::unexpected(SaveError{ SaveError::Code::MigrationFailed, migErr });
        }
        return doc.get<SurfaceMaps>(); // uses from_json() for each type
    }
    catch (const json::type_error& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, e.what() });
    }
    catch (const json::out_of_range& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonSchemaInvalid, e.what() });
    }
    catch (const json::exception& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonSchemaInvalid, e.what() });
    }
}

std::expected<SurfaceMaps, SaveError>
LoadSurfaceMaps(const std::filesystem::path& file)
{
    auto doc = ReadDocument(file);
    if (!doc)
        return std::unexpected(doc.error());
    return DeserializeSurfaceMaps(std::move(*doc));
}

std::expected<void, SaveError>
SaveSurfaceMaps(const SurfaceMaps& maps, const std::filesystem::path& file)
{
    try {
        const std::string serialized = SerializeSurfaceMaps(maps).dump();
        auto written = WriteFileAtomically(file, serialized);
        if (written)
            spdlog::info("save: wrote surface maps to {} ({} bytes)", file.string(), serialized.size());
        return written;
    }
    catch (const std::exception& e) {
        return std::unexpected(SaveError{ SaveError::Code::IoWriteFail, e.what() });
    }
}

std::expected<Planet, SaveError>
LoadPlanet(const std::filesystem::path& file)
{
    auto doc = ReadDocument(file);
    if (!doc)
        return std::unexpected(doc.error());
    try {
        const PlanetParams params = doc->at("planet").get<PlanetParams>();
        return Planet::create(params);
    }
    catch (const json::type_error& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, e.what() });
    }
    catch (const json::out_of_range& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonSchemaInvalid, e.what() });
    }
    catch (const std::invalid_argument& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonSchemaInvalid, e.what() });
    }
    catch (const json::exception& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonSchemaInvalid, e.what() });
    }
}

std::expected<void, SaveError>
SavePlanet(const Planet& planet, const std::filesystem::path& file)
{
    try {
        json j = json::object({
            {"schema_version", kSchemaVersion},
            {"planet",         planet.params()}
        });
        return WriteFileAtomically(file, j.dump(2));
    }
    catch (const std::exception& e) {
        return std::unexpected(SaveError{ SaveError::Code::IoWriteFail, e.what() });
    }
}

} // namespace geosphere::save
