// src/worldgen/stages/Precipitation.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Precipitation.hpp"
#include "worldgen/Temperature.hpp"

namespace geosphere::worldgen {

void PrecipitationStage::generate(StageContext& ctx)
{
    const Planet& planet = ctx.planet;

    for (SeasonMaps& season : ctx.out.seasons) {
        detail::requireGrid(ctx, season.temperature, "season temperature");
        detail::requireGrid(ctx, season.precipitation, "season precipitation");

        const double declination = solarDeclination(planet, season.trueAnomaly);
        ctx.forEachRow([&](int y) {
            const LatLon* ll = ctx.latLon.rowPtr(y);
            const Vec3d* pos = ctx.positions.rowPtr(y);
            const float* t = season.temperature.rowPtr(y);
            float* p = season.precipitation.rowPtr(y);
            for (int x = 0; x < ctx.width; ++x) {
                const double lat = seasonalLatitude(ll[x].latitude, declination);
                const PrecipitationSample s = precipitationAt(planet, pos[x], lat, t[x],
                                                              season.proportionOfYear, ctx.hadley);
                p[x] = static_cast<float>(s.precipitation);
            }
        });
    }
}

} // namespace geosphere::worldgen
