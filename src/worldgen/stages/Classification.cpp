// src/worldgen/stages/Classification.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Biomes.hpp"

#include <mutex>

namespace geosphere::worldgen {

void ClassificationStage::generate(StageContext& ctx)
{
    SurfaceMaps& out = ctx.out;
    detail::requireGrid(ctx, out.elevation, "elevation");
    detail::requireGrid(ctx, out.temperatureRange, "temperature range");
    detail::requireGrid(ctx, out.totalPrecipitation, "total precipitation");

    const bool water = ctx.planet.hasHydrosphere();
    const double maxElevation = ctx.planet.maxElevation();
    std::mutex biomeMutex;
    BiomeType present = BiomeType::None;

    ctx.forEachRow([&](int y) {
        BiomeType rowBiomes = BiomeType::None;
        for (int x = 0; x < ctx.width; ++x) {
            const TemperatureRange& range = out.temperatureRange.at(x, y);
            const double elevation = out.elevation.at(x, y);
            const double latitude = ctx.latLon.at(x, y).latitude;

            const Classification c = classifyCell(range, out.totalPrecipitation.at(x, y),
                                                  elevation, maxElevation, water);
            out.climate.at(x, y) = c.climate;
            out.humidity.at(x, y) = c.humidity;
            out.ecology.at(x, y) = c.ecology;
            out.biome.at(x, y) = c.biome;
            rowBiomes = rowBiomes | c.biome;

            out.seaIce.at(x, y) = seaIceRange(range, latitude, elevation, water);
            out.snowCover.at(x, y) = snowCoverRange(range, latitude, elevation, c.humidity, water);
        }
        std::lock_guard<std::mutex> lock(biomeMutex);
        present = present | rowBiomes;
    });

    out.overallClimate = climateTypeFor(out.overallTemperature.average);
    out.overallHumidity = humidityTypeFor(out.precipitation.average);
    out.overallEcology = ecologyTypeFor(out.overallClimate, out.overallHumidity);
    out.overallBiome = present;
}

} // namespace geosphere::worldgen
