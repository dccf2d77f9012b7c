// src/worldgen/SurfaceMaps.hpp
#pragma once
#include <cstdint>
#include <vector>

#include "worldgen/Biomes.hpp"
#include "worldgen/Grid2D.hpp"
#include "worldgen/MapProjection.hpp"
#include "worldgen/Temperature.hpp"

namespace geosphere::worldgen {

// One slice of the year.
struct SeasonMaps {
    int    index = 0;
    double proportionOfYear = 0.0;
    double positionInYear = 0.0;  // start of the season, [0, 1)
    double trueAnomaly = 0.0;     // rad, at the middle of the season

    Grid2D<float> temperature;    // K
    Grid2D<float> precipitation;  // mm over the season
    Grid2D<float> snowfall;       // mm over the season

    friend bool operator==(const SeasonMaps&, const SeasonMaps&) = default;
};

struct PrecipitationSummary {
    double min = 0.0;
    double average = 0.0;
    double max = 0.0;

    friend bool operator==(const PrecipitationSummary&, const PrecipitationSummary&) = default;
};

// Everything one generation run produces. Immutable once returned.
struct SurfaceMaps {
    MapProjectionOptions projection;
    int resolution = 0;
    int width = 0;
    int height = 0;
    std::uint64_t seed = 0;
    double maxElevation = 0.0;

    Grid2D<float>            elevation;        // normalized, [-1, 1]
    Grid2D<TemperatureRange> temperatureRange; // K

    std::vector<SeasonMaps> seasons;

    Grid2D<float> totalPrecipitation;   // mm / year
    Grid2D<float> averagePrecipitation; // mm / season
    Grid2D<float> totalSnowfall;        // mm / year

    Grid2D<ClimateType>  climate;
    Grid2D<HumidityType> humidity;
    Grid2D<EcologyType>  ecology;
    Grid2D<BiomeType>    biome;

    Grid2D<SeasonalRange> seaIce;
    Grid2D<SeasonalRange> snowCover;

    // Empty when hydrology is disabled.
    Grid2D<float> flow;       // m^3/s accumulated runoff
    Grid2D<float> lakeDepth;  // normalized elevation units

    // Planet-wide summaries.
    double           averageElevation = 0.0;
    TemperatureRange overallTemperature;
    PrecipitationSummary precipitation;
    int          landCellCount = 0;
    ClimateType  overallClimate = ClimateType::Polar;
    HumidityType overallHumidity = HumidityType::Superarid;
    EcologyType  overallEcology = EcologyType::Desert;
    BiomeType    overallBiome = BiomeType::None; // every biome present, OR-ed

    [[nodiscard]] int seasonCount() const noexcept { return static_cast<int>(seasons.size()); }

    friend bool operator==(const SurfaceMaps&, const SurfaceMaps&) = default;
};

} // namespace geosphere::worldgen
