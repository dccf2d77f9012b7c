// src/worldgen/Precipitation.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "worldgen/Vec3.hpp"

namespace geosphere::worldgen {

class Planet;

// Memo of the Hadley-cell humidity curve keyed by latitude rounded to 1e-3 rad.
// The curve does not depend on the planet, so one cache may be shared by any
// number of runs; a race only recomputes the same value.
class HadleyCache {
public:
    [[nodiscard]] double valueAt(double roundedLatitude);

    [[nodiscard]] std::size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::int64_t, double> values_;
};

// cos(1.25 pi L + pi) + max(0, 1 / (1.5 (L + 0.05)) - 2.5)
[[nodiscard]] double hadleyValue(double latitude) noexcept;

struct PrecipitationSample {
    double precipitation = 0.0; // mm over the sampled part of the year
    double snow = 0.0;          // mm of snow (precipitation * snow-to-rain ratio when freezing)
};

// Relative humidity before scaling by the precipitation budget.
[[nodiscard]] double relativeHumidityAt(const Planet& planet,
                                        const Vec3d& position,
                                        double seasonalLatitude,
                                        double temperature,
                                        HadleyCache& cache);

// Precipitation and snowfall for one season. Always >= 0.
[[nodiscard]] PrecipitationSample precipitationAt(const Planet& planet,
                                                  const Vec3d& position,
                                                  double seasonalLatitude,
                                                  double temperature,
                                                  double proportionOfYear,
                                                  HadleyCache& cache);

// precipitation * snowToRainRatio at or below the freezing point, else 0.
[[nodiscard]] double snowfallFor(const Planet& planet, double precipitation, double temperature) noexcept;

} // namespace geosphere::worldgen
