// src/worldgen/stages/Temperature.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Temperature.hpp"

namespace geosphere::worldgen {

void TemperatureStage::generate(StageContext& ctx)
{
    SurfaceMaps& out = ctx.out;
    detail::requireGrid(ctx, out.elevation, "elevation");
    detail::requireGrid(ctx, out.temperatureRange, "temperature range");

    const Planet& planet = ctx.planet;
    const double maxElevation = planet.maxElevation();

    ctx.forEachRow([&](int y) {
        const LatLon* ll = ctx.latLon.rowPtr(y);
        const float* elev = out.elevation.rowPtr(y);
        TemperatureRange* range = out.temperatureRange.rowPtr(y);
        for (int x = 0; x < ctx.width; ++x) {
            // Ocean surfaces sit at sea level.
            const double meters = std::max(0.0, static_cast<double>(elev[x])) * maxElevation;
            range[x] = temperatureRangeAt(planet, ll[x].latitude, meters);
        }
    });

    for (SeasonMaps& season : out.seasons) {
        detail::requireGrid(ctx, season.temperature, "season temperature");
        const double midpoint = season.positionInYear + season.proportionOfYear * 0.5;
        ctx.forEachRow([&](int y) {
            const LatLon* ll = ctx.latLon.rowPtr(y);
            const TemperatureRange* range = out.temperatureRange.rowPtr(y);
            float* t = season.temperature.rowPtr(y);
            for (int x = 0; x < ctx.width; ++x) {
                const double p = summerProportionAt(midpoint, ll[x].latitude);
                t[x] = static_cast<float>(seasonalTemperature(range[x], p));
            }
        });
    }
}

} // namespace geosphere::worldgen
