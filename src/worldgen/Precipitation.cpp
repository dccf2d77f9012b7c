// src/worldgen/Precipitation.cpp
#include "worldgen/Precipitation.hpp"
#include "worldgen/Math.hpp"
#include "worldgen/PhysicalConstants.hpp"
#include "worldgen/Planet.hpp"

#include <algorithm>
#include <cmath>

namespace geosphere::worldgen {

double hadleyValue(double latitude) noexcept
{
    return std::cos(1.25 * kPi * latitude + kPi)
         + std::max(0.0, 1.0 / (1.5 * (latitude + 0.05)) - 2.5);
}

double HadleyCache::valueAt(double roundedLatitude)
{
    const auto key = static_cast<std::int64_t>(std::llround(roundedLatitude * 1000.0));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = values_.find(key); it != values_.end())
            return it->second;
    }
    // Compute outside the lock; concurrent misses produce identical values.
    const double v = hadleyValue(static_cast<double>(key) / 1000.0);
    std::lock_guard<std::mutex> lock(mutex_);
    values_.emplace(key, v);
    return v;
}

std::size_t HadleyCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

void HadleyCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

double relativeHumidityAt(const Planet& planet,
                          const Vec3d& position,
                          double seasonalLat,
                          double temperature,
                          HadleyCache& cache)
{
    const ClimateTuning& tuning = planet.tuning();
    const double s = tuning.precipitationNoiseScale;
    const double x = position.x * s;
    const double y = position.y * s;
    const double z = position.z * s;

    const double r1 = 0.3 + 0.7 * planet.precipitationSmoothNoise().sample(x, y, z);
    const double r2 = 0.9 + 0.1 * planet.precipitationDetailNoise().sample(x, y, z);
    const double r = r1 * r2;

    const double absLat = std::abs(seasonalLat);
    const double L = roundTo(std::max(0.0, absLat - tuning.hadleyPolarOffset), 3);

    double rh = std::max(0.0, r + cache.valueAt(L));

    // Linear ramp to zero below the cold threshold.
    const double cold = phys::kWaterMeltingPoint - tuning.coldHumidityRamp;
    rh *= std::clamp((temperature - cold) / tuning.coldHumidityRamp, 0.0, 1.0);

    // Inter-tropical convergence zone.
    if (absLat < tuning.itczHalfWidth)
        rh *= 1.0 + tuning.itczBoost * (1.0 - absLat / tuning.itczHalfWidth);

    return rh;
}

PrecipitationSample precipitationAt(const Planet& planet,
                                    const Vec3d& position,
                                    double seasonalLat,
                                    double temperature,
                                    double proportionOfYear,
                                    HadleyCache& cache)
{
    PrecipitationSample out;
    const AtmosphereState& atm = planet.atmosphere();
    if (!(atm.averagePrecipitation > 0.0) || !(proportionOfYear > 0.0))
        return out;

    const double rh = relativeHumidityAt(planet, position, seasonalLat, temperature, cache);
    const double budget = atm.averagePrecipitation * proportionOfYear;
    const double cap = atm.maxPrecipitation * proportionOfYear;

    out.precipitation = std::clamp(budget * rh, 0.0, cap);
    out.snow = snowfallFor(planet, out.precipitation, temperature);
    return out;
}

double snowfallFor(const Planet& planet, double precipitation, double temperature) noexcept
{
    if (temperature > phys::kWaterMeltingPoint || !(precipitation > 0.0))
        return 0.0;
    return precipitation * planet.atmosphere().snowToRainRatio;
}

} // namespace geosphere::worldgen
