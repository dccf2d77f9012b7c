// src/worldgen/stages/Snowfall.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Precipitation.hpp"

namespace geosphere::worldgen {

void SnowfallStage::generate(StageContext& ctx)
{
    const Planet& planet = ctx.planet;

    for (SeasonMaps& season : ctx.out.seasons) {
        detail::requireGrid(ctx, season.temperature, "season temperature");
        detail::requireGrid(ctx, season.precipitation, "season precipitation");
        detail::requireGrid(ctx, season.snowfall, "season snowfall");

        ctx.forEachRow([&](int y) {
            const float* t = season.temperature.rowPtr(y);
            const float* p = season.precipitation.rowPtr(y);
            float* s = season.snowfall.rowPtr(y);
            for (int x = 0; x < ctx.width; ++x)
                s[x] = static_cast<float>(snowfallFor(planet, p[x], t[x]));
        });
    }
}

} // namespace geosphere::worldgen
