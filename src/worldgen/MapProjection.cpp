// src/worldgen/MapProjection.cpp
#include "worldgen/MapProjection.hpp"
#include "worldgen/Math.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace geosphere::worldgen {

double MapProjectionOptions::scaleFactor() const noexcept
{
    return std::cos(standardParallels.value_or(centralParallel));
}

double MapProjectionOptions::aspectRatio() const noexcept
{
    const double sf = scaleFactor();
    return equalArea ? kPi * sf * sf : 2.0 * sf;
}

MapProjection::MapProjection(const MapProjectionOptions& options, int resolution)
    : options_(options)
{
    if (resolution <= 0)
        throw std::invalid_argument("MapProjection: resolution must be positive, got " + std::to_string(resolution));
    if (options.equalArea && (resolution % 2) != 0)
        throw std::invalid_argument("MapProjection: equal-area resolution must be even, got " + std::to_string(resolution));
    if (options.range && !(*options.range > 0.0 && *options.range <= kPi))
        throw std::invalid_argument("MapProjection: range must be within (0, pi]");

    scale_ = options.scaleFactor();
    if (!(scale_ > 1e-9))
        throw std::invalid_argument("MapProjection: standard parallel must not be a pole");

    height_ = resolution;
    width_ = static_cast<int>(std::floor(resolution * options.aspectRatio()));
    if (width_ <= 0)
        throw std::invalid_argument("MapProjection: projection has no columns at this resolution");

    const double r = static_cast<double>(resolution);
    if (options.equalArea) {
        const double v = options.range ? 2.0 * std::sin(*options.range * 0.5) / scale_ : 2.0 / scale_;
        step_ = v / r;
    } else {
        step_ = (options.range ? *options.range : kPi) / r;
    }
}

double MapProjection::latitudeAtEdge(double y) const noexcept
{
    const double offset = static_cast<double>(height_) * 0.5 - y;
    if (options_.equalArea)
        return options_.centralParallel + std::asin(std::clamp(offset * step_ * scale_, -1.0, 1.0));
    return options_.centralParallel + offset * step_;
}

LatLon MapProjection::latLonAt(int x, int y) const noexcept
{
    LatLon out;
    out.latitude = std::clamp(latitudeAtEdge(y + 0.5), -kHalfPi, kHalfPi);
    const double col = x + 0.5 - static_cast<double>(width_) * 0.5;
    out.longitude = normalizeLongitude(options_.centralMeridian + col * step_ / scale_);
    return out;
}

void MapProjection::cellAt(double latitude, double longitude, int& x, int& y) const noexcept
{
    const double halfH = static_cast<double>(height_) * 0.5;
    const double halfW = static_cast<double>(width_) * 0.5;

    double row = 0.0;
    if (options_.equalArea)
        row = halfH - std::sin(latitude - options_.centralParallel) / (scale_ * step_);
    else
        row = halfH - (latitude - options_.centralParallel) / step_;

    const double col = normalizeLongitude(longitude - options_.centralMeridian) * scale_ / step_ + halfW;

    y = std::clamp(static_cast<int>(std::floor(row)), 0, height_ - 1);
    x = std::clamp(static_cast<int>(std::floor(col)), 0, width_ - 1);
}

double MapProjection::cellArea(int /*x*/, int y, double radius) const noexcept
{
    const double top = std::clamp(latitudeAtEdge(y), -kHalfPi, kHalfPi);
    const double bottom = std::clamp(latitudeAtEdge(y + 1.0), -kHalfPi, kHalfPi);
    const double dLon = step_ / scale_;
    return radius * radius * std::abs(std::sin(top) - std::sin(bottom)) * dLon;
}

} // namespace geosphere::worldgen
