// src/worldgen/stages/Aggregate.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Elevation.hpp"

#include <limits>

namespace geosphere::worldgen {

void AggregateStage::generate(StageContext& ctx)
{
    SurfaceMaps& out = ctx.out;
    detail::requireGrid(ctx, out.elevation, "elevation");
    detail::requireGrid(ctx, out.temperatureRange, "temperature range");
    detail::requireGrid(ctx, out.totalPrecipitation, "total precipitation");
    detail::requireGrid(ctx, out.averagePrecipitation, "average precipitation");
    detail::requireGrid(ctx, out.totalSnowfall, "total snowfall");
    for (const SeasonMaps& season : out.seasons) {
        detail::requireGrid(ctx, season.precipitation, "season precipitation");
        detail::requireGrid(ctx, season.snowfall, "season snowfall");
    }

    const int n = out.seasonCount();
    ctx.forEachRow([&](int y) {
        float* total = out.totalPrecipitation.rowPtr(y);
        float* avg = out.averagePrecipitation.rowPtr(y);
        float* snow = out.totalSnowfall.rowPtr(y);
        for (int x = 0; x < ctx.width; ++x) {
            double p = 0.0;
            double s = 0.0;
            for (const SeasonMaps& season : out.seasons) {
                p += season.precipitation.rowPtr(y)[x];
                s += season.snowfall.rowPtr(y)[x];
            }
            total[x] = static_cast<float>(p);
            avg[x] = n > 0 ? static_cast<float>(p / n) : 0.0f;
            snow[x] = static_cast<float>(s);
        }
    });

    // Planet-wide summaries, area weighted. Sequential so the sums are reproducible.
    double weightSum = 0.0;
    double elevationSum = 0.0;
    double temperatureSum = 0.0;
    double precipitationSum = 0.0;
    double tMin = std::numeric_limits<double>::infinity();
    double tMax = -std::numeric_limits<double>::infinity();
    double pMin = std::numeric_limits<double>::infinity();
    double pMax = -std::numeric_limits<double>::infinity();
    int land = 0;

    for (int y = 0; y < ctx.height; ++y) {
        const double w = detail::rowWeight(ctx, y);
        for (int x = 0; x < ctx.width; ++x) {
            const double e = out.elevation.at(x, y);
            const TemperatureRange& t = out.temperatureRange.at(x, y);
            const double p = out.totalPrecipitation.at(x, y);

            weightSum += w;
            elevationSum += e * w;
            temperatureSum += t.average * w;
            precipitationSum += p * w;
            tMin = std::min(tMin, t.min);
            tMax = std::max(tMax, t.max);
            pMin = std::min(pMin, p);
            pMax = std::max(pMax, p);
            if (isLand(ctx.planet, e))
                ++land;
        }
    }

    if (weightSum > 0.0) {
        out.averageElevation = elevationSum / weightSum;
        out.overallTemperature = TemperatureRange{tMin, tMax, temperatureSum / weightSum};
        out.precipitation = PrecipitationSummary{pMin, precipitationSum / weightSum, pMax};
    }
    out.landCellCount = land;
}

} // namespace geosphere::worldgen
