// tests/worldgen/test_surface_map_generator.cpp
#include <doctest/doctest.h>

#include "test_support/test_planets.h"
#include "worldgen/Biomes.hpp"
#include "worldgen/Precipitation.hpp"
#include "worldgen/StageContext.hpp"
#include "worldgen/WorldGen.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace wg = geosphere::worldgen;

namespace {

wg::SurfaceMapRequest smallRequest(int seasons = 4)
{
    wg::SurfaceMapRequest r{};
    r.resolution = 24;
    r.seasons = seasons;
    return r;
}

class ExplodingStage final : public wg::IWorldGenStage {
public:
    wg::StageId id() const noexcept override { return wg::StageId::Aggregate; }
    const char* name() const noexcept override { return "Exploding"; }
    void generate(wg::StageContext&) override { throw std::runtime_error("boom"); }
};

// Leaves the elevation grid the wrong size for later passes.
class ShrinkElevationStage final : public wg::IWorldGenStage {
public:
    wg::StageId id() const noexcept override { return wg::StageId::Elevation; }
    const char* name() const noexcept override { return "ShrinkElevation"; }
    void generate(wg::StageContext& ctx) override { ctx.out.elevation = wg::Grid2D<float>(1, 1, 0.0f); }
};

} // namespace

TEST_CASE("SurfaceMapGenerator: default pipeline") {
    CHECK(wg::SurfaceMapGenerator(smallRequest()).stageCount() == 7);

    wg::SurfaceMapRequest noHydro = smallRequest();
    noHydro.computeHydrology = false;
    CHECK(wg::SurfaceMapGenerator(noHydro).stageCount() == 6);

    // Summaries feed the overall classification, so Aggregate runs first.
    using S = wg::StageId;
    const std::vector<S> expected{ S::Elevation, S::Temperature, S::Precipitation, S::Snowfall,
                                   S::Aggregate, S::Classification, S::Hydrology };
    CHECK(wg::SurfaceMapGenerator(smallRequest()).stageOrder() == expected);
}

TEST_CASE("SurfaceMapGenerator: grids share the projected size") {
    const wg::Planet earth = geosphere::test::EarthLike();
    const wg::SurfaceMaps maps = wg::SurfaceMapGenerator(smallRequest()).generate(earth);

    CHECK(maps.height == 24);
    CHECK(maps.width == 48);
    CHECK(maps.seed == earth.seed());
    CHECK(maps.maxElevation == earth.maxElevation());
    CHECK(maps.elevation.sameShape(48, 24));
    CHECK(maps.temperatureRange.sameShape(48, 24));
    CHECK(maps.biome.sameShape(48, 24));
    CHECK(maps.snowCover.sameShape(48, 24));
    CHECK(maps.flow.sameShape(48, 24));
    CHECK(maps.lakeDepth.sameShape(48, 24));
    REQUIRE(maps.seasonCount() == 4);
    for (const wg::SeasonMaps& s : maps.seasons) {
        CHECK(s.temperature.sameShape(48, 24));
        CHECK(s.precipitation.sameShape(48, 24));
        CHECK(s.snowfall.sameShape(48, 24));
    }
}

TEST_CASE("SurfaceMapGenerator: seasons partition the year") {
    const wg::Planet earth = geosphere::test::EarthLike();
    const wg::SurfaceMaps maps = wg::SurfaceMapGenerator(smallRequest(4)).generate(earth);

    double proportion = 0.0;
    for (int i = 0; i < maps.seasonCount(); ++i) {
        const wg::SeasonMaps& s = maps.seasons[static_cast<std::size_t>(i)];
        CHECK(s.index == i);
        CHECK(s.positionInYear == doctest::Approx(i * 0.25));
        CHECK(s.proportionOfYear == doctest::Approx(0.25));
        CHECK(s.trueAnomaly >= 0.0);
        CHECK(s.trueAnomaly < wg::kTwoPi);
        proportion += s.proportionOfYear;
    }
    CHECK(proportion == doctest::Approx(1.0));

    // Season midpoints are spaced a quarter orbit apart.
    const double gap = wg::normalizeAngle(maps.seasons[1].trueAnomaly - maps.seasons[0].trueAnomaly);
    CHECK(gap == doctest::Approx(wg::kHalfPi));
}

TEST_CASE("SurfaceMapGenerator: annual maps are sums and averages of the seasons") {
    const wg::Planet earth = geosphere::test::EarthLike();
    const wg::SurfaceMaps maps = wg::SurfaceMapGenerator(smallRequest(4)).generate(earth);

    float wettest = 0.0f;
    for (int y = 0; y < maps.height; ++y) {
        for (int x = 0; x < maps.width; ++x) {
            double p = 0.0, s = 0.0;
            for (const wg::SeasonMaps& season : maps.seasons) {
                p += season.precipitation.at(x, y);
                s += season.snowfall.at(x, y);
                if (season.temperature.at(x, y) > wg::phys::kWaterMeltingPoint)
                    CHECK(season.snowfall.at(x, y) == 0.0f);
            }
            CHECK(maps.totalPrecipitation.at(x, y) == doctest::Approx(p));
            CHECK(maps.averagePrecipitation.at(x, y) == doctest::Approx(p / 4.0));
            CHECK(maps.totalSnowfall.at(x, y) == doctest::Approx(s));

            const wg::TemperatureRange& r = maps.temperatureRange.at(x, y);
            CHECK(r.min <= r.max);
            for (const wg::SeasonMaps& season : maps.seasons) {
                CHECK(season.temperature.at(x, y) >= doctest::Approx(r.min));
                CHECK(season.temperature.at(x, y) <= doctest::Approx(r.max));
            }
            wettest = std::max(wettest, maps.totalPrecipitation.at(x, y));
        }
    }
    CHECK(wettest > 0.0f);
    CHECK(maps.precipitation.max == doctest::Approx(wettest));
    CHECK(maps.overallTemperature.min <= maps.overallTemperature.average);
    CHECK(maps.overallTemperature.average <= maps.overallTemperature.max);
}

TEST_CASE("SurfaceMapGenerator: zero seasons skips precipitation") {
    const wg::Planet earth = geosphere::test::EarthLike();
    const wg::SurfaceMaps maps = wg::SurfaceMapGenerator(smallRequest(0)).generate(earth);

    CHECK(maps.seasonCount() == 0);
    for (int y = 0; y < maps.height; ++y) {
        for (int x = 0; x < maps.width; ++x) {
            CHECK(maps.totalPrecipitation.at(x, y) == 0.0f);
            CHECK(maps.averagePrecipitation.at(x, y) == 0.0f);
            CHECK(maps.humidity.at(x, y) == wg::HumidityType::Superarid);
        }
    }
    CHECK(maps.overallHumidity == wg::HumidityType::Superarid);
}

TEST_CASE("SurfaceMapGenerator: a flat wet planet is all ocean") {
    const wg::Planet flat = geosphere::test::Flat();
    const wg::SurfaceMaps maps = wg::SurfaceMapGenerator(smallRequest(2)).generate(flat);

    CHECK(maps.landCellCount == 0);
    CHECK(maps.averageElevation == 0.0);
    for (int y = 0; y < maps.height; ++y) {
        for (int x = 0; x < maps.width; ++x) {
            CHECK(maps.elevation.at(x, y) == 0.0f);
            const wg::BiomeType b = maps.biome.at(x, y);
            CHECK((b == wg::BiomeType::Sea || b == wg::BiomeType::SeaIce));
            CHECK(maps.snowCover.at(x, y).isNever());
        }
    }
    CHECK_FALSE(wg::hasFlag(maps.overallBiome, wg::BiomeType::RainForest));
}

TEST_CASE("SurfaceMapGenerator: airless bodies are all land and need zero seasons") {
    const wg::Planet rock = geosphere::test::Airless();
    CHECK_THROWS_AS((void)wg::SurfaceMapGenerator(smallRequest(4)).generate(rock), std::invalid_argument);

    const wg::SurfaceMaps maps = wg::SurfaceMapGenerator(smallRequest(0)).generate(rock);
    CHECK(maps.landCellCount == maps.width * maps.height);
    for (int y = 0; y < maps.height; ++y) {
        for (int x = 0; x < maps.width; ++x) {
            CHECK(maps.seaIce.at(x, y).isNever());
            CHECK(maps.biome.at(x, y) != wg::BiomeType::Sea);
        }
    }
}

TEST_CASE("SurfaceMapGenerator: invalid requests are rejected before any pass runs") {
    const wg::Planet earth = geosphere::test::EarthLike();

    wg::SurfaceMapRequest r = smallRequest();
    r.resolution = 0;
    CHECK_THROWS_AS((void)wg::SurfaceMapGenerator(r).generate(earth), std::invalid_argument);

    r = smallRequest();
    r.seasons = -1;
    CHECK_THROWS_AS((void)wg::SurfaceMapGenerator(r).generate(earth), std::invalid_argument);

    r = smallRequest();
    r.resolution = 25;
    r.projection.equalArea = true;
    CHECK_THROWS_AS((void)wg::SurfaceMapGenerator(r).generate(earth), std::invalid_argument);
}

TEST_CASE("SurfaceMapGenerator: equal-area maps") {
    const wg::Planet earth = geosphere::test::EarthLike();
    wg::SurfaceMapRequest r = smallRequest(2);
    r.projection.equalArea = true;
    const wg::SurfaceMaps maps = wg::SurfaceMapGenerator(r).generate(earth);
    CHECK(maps.width == 75); // floor(24 * pi)
    CHECK(maps.projection.equalArea);
}

TEST_CASE("SurfaceMapGenerator: hydrology can be switched off") {
    const wg::Planet earth = geosphere::test::EarthLike();
    wg::SurfaceMapRequest r = smallRequest(1);
    r.computeHydrology = false;
    const wg::SurfaceMaps maps = wg::SurfaceMapGenerator(r).generate(earth);
    CHECK(maps.flow.empty());
    CHECK(maps.lakeDepth.empty());
}

TEST_CASE("SurfaceMapGenerator: a failing pass surfaces as StageError with its context") {
    const wg::Planet earth = geosphere::test::EarthLike(314);
    wg::SurfaceMapGenerator gen(smallRequest(2));
    gen.clearStages();
    gen.addStage(std::make_unique<wg::ElevationStage>());
    gen.addStage(std::make_unique<ExplodingStage>());

    try {
        (void)gen.generate(earth);
        FAIL("expected StageError");
    } catch (const wg::StageError& e) {
        CHECK(e.stage() == wg::StageId::Aggregate);
        CHECK(e.stageName() == "Exploding");
        CHECK(e.resolution() == 24);
        CHECK(e.seasons() == 2);
        CHECK(e.seed() == 314);
        CHECK(std::string(e.what()).find("boom") != std::string::npos);
    }
}

TEST_CASE("SurfaceMapGenerator: passes reject inputs of the wrong shape") {
    const wg::Planet earth = geosphere::test::EarthLike();
    wg::SurfaceMapGenerator gen(smallRequest(1));
    gen.clearStages();
    gen.addStage(std::make_unique<ShrinkElevationStage>());
    gen.addStage(std::make_unique<wg::TemperatureStage>());

    try {
        (void)gen.generate(earth);
        FAIL("expected StageError");
    } catch (const wg::StageError& e) {
        CHECK(e.stage() == wg::StageId::Temperature);
        CHECK(std::string(e.what()).find("elevation") != std::string::npos);
    }
}

TEST_CASE("SurfaceMapGenerator: a shared Hadley cache does not change results") {
    const wg::Planet earth = geosphere::test::EarthLike(8);
    const wg::SurfaceMapGenerator gen(smallRequest(2));

    wg::HadleyCache cache;
    const wg::SurfaceMaps first = gen.generate(earth, cache);
    CHECK(cache.size() > 0);
    const wg::SurfaceMaps second = gen.generate(earth, cache);
    const wg::SurfaceMaps fresh = gen.generate(earth);

    CHECK(first == second);
    CHECK(first == fresh);
}
