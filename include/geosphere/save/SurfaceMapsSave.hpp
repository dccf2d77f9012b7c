#pragma once
// include/geosphere/save/SurfaceMapsSave.hpp
//
// Versioned JSON persistence for planets and generated surface maps.
// Uses nlohmann::json for (de)serialization; required fields are read with
// at(), so a missing field fails the whole load.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>                         // C++23
#include <filesystem>
#include <string>
#include <vector>

#include "worldgen/Grid2D.hpp"
#include "worldgen/Noise.hpp"
#include "worldgen/Planet.hpp"
#include "worldgen/SurfaceMaps.hpp"

namespace geosphere::worldgen {

using json = nlohmann::json;

// ---------- JSON (de)serialization ----------
// Declared next to the types so nlohmann finds them by ADL.

void to_json(json& j, PlanetKind v);
void from_json(const json& j, PlanetKind& v);

void to_json(json& j, FractalType v);
void from_json(const json& j, FractalType& v);

void to_json(json& j, const NoiseSettings& v);
void from_json(const json& j, NoiseSettings& v);

void to_json(json& j, const NoiseSeeds& v);
void from_json(const json& j, NoiseSeeds& v);

void to_json(json& j, const OrbitParams& v);
void from_json(const json& j, OrbitParams& v);

void to_json(json& j, const AtmosphereParams& v);
void from_json(const json& j, AtmosphereParams& v);

void to_json(json& j, const ClimateTuning& v);
void from_json(const json& j, ClimateTuning& v);

void to_json(json& j, const PlanetParams& v);
void from_json(const json& j, PlanetParams& v);

void to_json(json& j, const MapProjectionOptions& v);
void from_json(const json& j, MapProjectionOptions& v);

void to_json(json& j, const TemperatureRange& v);
void from_json(const json& j, TemperatureRange& v);

void to_json(json& j, const SeasonalRange& v);
void from_json(const json& j, SeasonalRange& v);

void to_json(json& j, ClimateType v);
void from_json(const json& j, ClimateType& v);

void to_json(json& j, HumidityType v);
void from_json(const json& j, HumidityType& v);

void to_json(json& j, EcologyType v);
void from_json(const json& j, EcologyType& v);

void to_json(json& j, BiomeType v);
void from_json(const json& j, BiomeType& v);

void to_json(json& j, const SeasonMaps& v);
void from_json(const json& j, SeasonMaps& v);

void to_json(json& j, const SurfaceMaps& v);
void from_json(const json& j, SurfaceMaps& v);

template <class T>
void to_json(json& j, const Grid2D<T>& g)
{
    j = json::object({
        {"width",  g.width()},
        {"height", g.height()},
        {"values", g.values()}
    });
}

template <class T>
void from_json(const json& j, Grid2D<T>& g)
{
    const int w = j.at("width").get<int>();
    const int h = j.at("height").get<int>();
    auto values = j.at("values").get<std::vector<T>>();
    if (w < 0 || h < 0 || values.size() != static_cast<std::size_t>(w) * static_cast<std::size_t>(h))
        throw json::type_error::create(302, "grid values do not match width * height", &j);
    g.assign(w, h, std::move(values));
}

} // namespace geosphere::worldgen

namespace geosphere::save {

using json = nlohmann::json;

// Bump this when the file layout changes (and write a migration step).
inline constexpr int kSchemaVersion = 1;

struct SaveError {
    enum class Code {
        IoOpenFail,
        IoWriteFail,
        JsonParseError,
        JsonTypeError,
        JsonSchemaInvalid,
        MigrationFailed
    } code{};
    std::string message;
};

// ---------- I/O API ----------
std::expected<worldgen::SurfaceMaps, SaveError>
LoadSurfaceMaps(const std::filesystem::path& file);

std::expected<void, SaveError>
SaveSurfaceMaps(const worldgen::SurfaceMaps& maps, const std::filesystem::path& file);

// A planet is stored as its builder parameters with seeds and mass pinned,
// so loading re-derives an identical record.
std::expected<worldgen::Planet, SaveError>
LoadPlanet(const std::filesystem::path& file);

std::expected<void, SaveError>
SavePlanet(const worldgen::Planet& planet, const std::filesystem::path& file);

// In-memory forms of the above, for embedding in other documents.
json SerializeSurfaceMaps(const worldgen::SurfaceMaps& maps);
std::expected<worldgen::SurfaceMaps, SaveError> DeserializeSurfaceMaps(json doc);

// Migration hook: updates raw JSON in-place from older versions to current.
bool MigrateJsonInPlace(json& j, int target_schema_version, std::string& outError);

} // namespace geosphere::save
