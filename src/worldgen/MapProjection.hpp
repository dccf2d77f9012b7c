// src/worldgen/MapProjection.hpp
#pragma once
#include <optional>

#include "worldgen/Grid2D.hpp"
#include "worldgen/SurfaceGeometry.hpp"

namespace geosphere::worldgen {

struct MapProjectionOptions {
    double centralMeridian = 0.0;           // rad
    double centralParallel = 0.0;           // rad
    std::optional<double> standardParallels; // rad; defaults to the central parallel
    std::optional<double> range;            // rad of latitude covered; whole globe when empty
    bool equalArea = false;                 // cylindrical equal-area instead of equirectangular

    [[nodiscard]] double scaleFactor() const noexcept;
    [[nodiscard]] double aspectRatio() const noexcept;

    friend bool operator==(const MapProjectionOptions&, const MapProjectionOptions&) = default;
};

// Maps grid cells to latitude/longitude and back for one projection and
// resolution. Height == resolution; width == floor(resolution * aspect).
class MapProjection {
public:
    // Throws std::invalid_argument for resolution <= 0, or an odd resolution
    // on an equal-area projection.
    MapProjection(const MapProjectionOptions& options, int resolution);

    [[nodiscard]] const MapProjectionOptions& options() const noexcept { return options_; }
    [[nodiscard]] int resolution() const noexcept { return height_; }
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }

    // Cell centre.
    [[nodiscard]] LatLon latLonAt(int x, int y) const noexcept;

    // Nearest cell, clamped to the grid.
    void cellAt(double latitude, double longitude, int& x, int& y) const noexcept;

    // Surface area of the cell on a sphere of `radius` meters, m^2.
    [[nodiscard]] double cellArea(int x, int y, double radius) const noexcept;

private:
    [[nodiscard]] double latitudeAtEdge(double y) const noexcept;

    MapProjectionOptions options_;
    int width_ = 0;
    int height_ = 0;
    double scale_ = 1.0;   // SF
    double step_ = 0.0;    // radians (equirectangular) or sin-units (equal area) per cell
};

// Nearest-neighbour copy of `source` (laid out by `from`) onto `to`.
template <class T>
[[nodiscard]] Grid2D<T> reproject(const Grid2D<T>& source,
                                  const MapProjection& from,
                                  const MapProjection& to)
{
    Grid2D<T> out(to.width(), to.height());
    for (int y = 0; y < to.height(); ++y) {
        for (int x = 0; x < to.width(); ++x) {
            const LatLon ll = to.latLonAt(x, y);
            int sx = 0, sy = 0;
            from.cellAt(ll.latitude, ll.longitude, sx, sy);
            out.at(x, y) = source.sampleClamped(sx, sy);
        }
    }
    return out;
}

// Same projection, different resolution.
template <class T>
[[nodiscard]] Grid2D<T> resample(const Grid2D<T>& source,
                                 const MapProjection& projection,
                                 int resolution)
{
    const MapProjection target(projection.options(), resolution);
    return reproject(source, projection, target);
}

} // namespace geosphere::worldgen
