#pragma once
#include "worldgen/WorldGen.hpp"      // StageId + IWorldGenStage + default stages
#include "worldgen/StageContext.hpp"  // StageContext
#include "worldgen/Planet.hpp"        // complete type for ctx.planet
#include "worldgen/Math.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace geosphere::worldgen::detail {

// Input check shared by the passes; the generator turns the throw into a StageError.
template <class T>
inline void requireGrid(const StageContext& ctx, const Grid2D<T>& grid, const char* what)
{
    if (!grid.sameShape(ctx.width, ctx.height))
        throw std::runtime_error(std::string("input grid '") + what + "' is "
                                 + std::to_string(grid.width()) + "x" + std::to_string(grid.height())
                                 + ", expected " + std::to_string(ctx.width) + "x"
                                 + std::to_string(ctx.height));
}

// Row area weights for planet-wide averages (unit sphere).
inline double rowWeight(const StageContext& ctx, int y) noexcept
{
    return ctx.projection.cellArea(0, y, 1.0);
}

} // namespace geosphere::worldgen::detail
