// src/worldgen/GeneratorSettings.hpp
#pragma once
#include "worldgen/MapProjection.hpp"

namespace geosphere::worldgen {

// One surface-map run. Keep POD-like for cheap copies.
struct SurfaceMapRequest {
    int                  resolution       = 90; // grid height in cells
    int                  seasons          = 4;  // 0 skips precipitation entirely
    MapProjectionOptions projection;
    bool                 computeHydrology = true;

    friend bool operator==(const SurfaceMapRequest&, const SurfaceMapRequest&) = default;
};

} // namespace geosphere::worldgen
