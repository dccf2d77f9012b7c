// src/worldgen/stages/Elevation.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Elevation.hpp"

namespace geosphere::worldgen {

void ElevationStage::generate(StageContext& ctx)
{
    detail::requireGrid(ctx, ctx.out.elevation, "elevation");

    const Planet& planet = ctx.planet;
    ctx.forEachRow([&](int y) {
        const Vec3d* pos = ctx.positions.rowPtr(y);
        float* row = ctx.out.elevation.rowPtr(y);
        for (int x = 0; x < ctx.width; ++x)
            row[x] = static_cast<float>(normalizedElevationAt(planet, pos[x]));
    });
}

} // namespace geosphere::worldgen
