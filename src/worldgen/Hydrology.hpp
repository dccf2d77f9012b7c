// src/worldgen/Hydrology.hpp
#pragma once

// Drainage over a projected elevation grid. Longitude wraps, latitude does not.

#include "worldgen/Grid2D.hpp"

namespace geosphere::worldgen {

class MapProjection;

struct DrainageMap {
    Grid2D<int>   downstream; // flat index of the receiving cell; -1 for outlets
    Grid2D<int>   basin;      // flat index of the outlet each cell drains to
    Grid2D<float> filled;     // depression-filled surface (normalized units)
    Grid2D<float> lakeDepth;  // filled - elevation; > 0 inside lakes
    Grid2D<float> flow;       // accumulated runoff, units of `runoff`

    [[nodiscard]] bool valid() const noexcept { return !filled.empty(); }
};

// Priority-flood depression fill. Ocean cells (elevation <= 0 when
// `hasHydrosphere`) seed the flood; without a hydrosphere the lowest cell does.
// Every non-outlet cell drains to its lowest neighbour (8-connected) on the
// filled surface, ties broken by flood order, so the graph is acyclic.
[[nodiscard]] DrainageMap computeDrainage(const Grid2D<float>& elevation,
                                          const Grid2D<float>& runoff,
                                          bool hasHydrosphere);

// Land-cell runoff in m^3/s from annual precipitation in mm:
// precipitation * 0.001 * cellArea / yearSeconds. Ocean cells yield 0.
[[nodiscard]] Grid2D<float> runoffFromPrecipitation(const Grid2D<float>& annualPrecipitation,
                                                    const Grid2D<float>& elevation,
                                                    const MapProjection& projection,
                                                    double planetRadius,
                                                    double yearSeconds,
                                                    bool hasHydrosphere);

} // namespace geosphere::worldgen
