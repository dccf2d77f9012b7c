#include "worldgen/StageContext.hpp"
#include "worldgen/Planet.hpp"

namespace geosphere::worldgen {

StageContext::StageContext(const Planet& p,
                           const SurfaceMapRequest& r,
                           const MapProjection& proj,
                           jobs::JobSystem& j,
                           HadleyCache& cache,
                           SurfaceMaps& o)
    : width(proj.width()), height(proj.height()),
      planet(p), request(r), projection(proj),
      latLon(proj.width(), proj.height()), positions(proj.width(), proj.height()),
      jobs(j), hadley(cache), out(o)
{
    forEachRow([this](int y) {
        LatLon* ll = latLon.rowPtr(y);
        Vec3d* pos = positions.rowPtr(y);
        for (int x = 0; x < width; ++x) {
            ll[x] = projection.latLonAt(x, y);
            pos[x] = latLonToVector(planet, ll[x].latitude, ll[x].longitude);
        }
    });
}

} // namespace geosphere::worldgen
