// src/worldgen/StageContext.hpp
#pragma once
#include <utility>

#include "jobs/JobSystem.h"
#include "worldgen/GeneratorSettings.hpp"
#include "worldgen/Grid2D.hpp"
#include "worldgen/MapProjection.hpp"
#include "worldgen/SurfaceGeometry.hpp"
#include "worldgen/SurfaceMaps.hpp"
#include "worldgen/Vec3.hpp"

namespace geosphere::worldgen {

class Planet;
class HadleyCache;

// Everything a pass reads or writes during one run.
struct StageContext {
  // Grid dimensions (filled by the .cpp ctor from the projection).
  int width  = 0;
  int height = 0;

  const Planet&            planet;
  const SurfaceMapRequest& request;
  const MapProjection&     projection;

  // Cell-centre coordinates and surface positions, computed once per run.
  Grid2D<LatLon> latLon;
  Grid2D<Vec3d>  positions;

  jobs::JobSystem& jobs;
  HadleyCache&     hadley;

  // Writable output bundle.
  SurfaceMaps& out;

  StageContext(const Planet& p,
               const SurfaceMapRequest& r,
               const MapProjection& proj,
               jobs::JobSystem& j,
               HadleyCache& cache,
               SurfaceMaps& o);

  // Runs fn(y) for every row in parallel; rethrows the first failure.
  template <typename F>
  void forEachRow(F&& fn) const {
    jobs.ParallelForIndex(0, height, 1, std::forward<F>(fn));
  }
};

} // namespace geosphere::worldgen
