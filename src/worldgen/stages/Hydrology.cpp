// src/worldgen/stages/Hydrology.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Hydrology.hpp"
#include "worldgen/PhysicalConstants.hpp"

#include <utility>

namespace geosphere::worldgen {

void HydrologyStage::generate(StageContext& ctx)
{
    SurfaceMaps& out = ctx.out;
    detail::requireGrid(ctx, out.elevation, "elevation");
    detail::requireGrid(ctx, out.totalPrecipitation, "total precipitation");

    const Planet& planet = ctx.planet;
    const double year = planet.orbit() ? planet.orbit()->period : phys::kEarthOrbitalPeriod;

    const Grid2D<float> runoff = runoffFromPrecipitation(out.totalPrecipitation, out.elevation,
                                                         ctx.projection, planet.radius(), year,
                                                         planet.hasHydrosphere());
    DrainageMap drainage = computeDrainage(out.elevation, runoff, planet.hasHydrosphere());

    out.flow = std::move(drainage.flow);
    out.lakeDepth = std::move(drainage.lakeDepth);
}

} // namespace geosphere::worldgen
