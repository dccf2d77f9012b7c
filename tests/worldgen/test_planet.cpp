// tests/worldgen/test_planet.cpp
#include <doctest/doctest.h>

#include "test_support/test_planets.h"
#include "worldgen/Elevation.hpp"
#include "worldgen/Planet.hpp"
#include "worldgen/Random.hpp"

#include <cmath>
#include <stdexcept>

namespace wg = geosphere::worldgen;
using geosphere::test::EarthLikeParams;

TEST_CASE("Planet: same params give the same planet") {
    const wg::Planet a = wg::Planet::create(EarthLikeParams(5));
    const wg::Planet b = wg::Planet::create(EarthLikeParams(5));
    CHECK(a == b);
    CHECK(a.seeds() == b.seeds());
    CHECK(a.maxElevation() == b.maxElevation());
    CHECK(a.averageSurfaceTemperature() == b.averageSurfaceTemperature());
}

TEST_CASE("Planet: params() pins derived seeds and mass") {
    wg::PlanetParams p = EarthLikeParams(77);
    p.mass.reset();
    const wg::Planet a = wg::Planet::create(p);

    REQUIRE(a.params().seeds.has_value());
    REQUIRE(a.params().mass.has_value());
    CHECK(*a.params().mass == a.mass());

    const wg::Planet b = wg::Planet::create(a.params());
    CHECK(b.seeds() == a.seeds());
    CHECK(b.mass() == a.mass());
    CHECK(b.surfaceGravity() == a.surfaceGravity());
}

TEST_CASE("Planet: different seeds give different noise seeds") {
    const wg::Planet a = wg::Planet::create(EarthLikeParams(1));
    const wg::Planet b = wg::Planet::create(EarthLikeParams(2));
    CHECK_FALSE(a.seeds() == b.seeds());
}

TEST_CASE("Planet: explicit seeds win over derived ones") {
    wg::PlanetParams p = EarthLikeParams(1);
    p.seeds = wg::NoiseSeeds{1, 2, 3, 4, 5};
    const wg::Planet planet = wg::Planet::create(p);
    CHECK(planet.seeds() == wg::NoiseSeeds{1, 2, 3, 4, 5});
    CHECK(planet.elevationNoise().seed() == 1);
    CHECK(planet.precipitationSmoothNoise().seed() == 5);
}

TEST_CASE("Planet: out-of-range parameters are rejected") {
    auto rejects = [](auto mutate) {
        wg::PlanetParams p = EarthLikeParams();
        mutate(p);
        CHECK_THROWS_AS((void)wg::Planet::create(p), std::invalid_argument);
    };
    rejects([](wg::PlanetParams& p) { p.radius = 0.0; });
    rejects([](wg::PlanetParams& p) { p.mass = -1.0; });
    rejects([](wg::PlanetParams& p) { p.albedo = 1.5; });
    rejects([](wg::PlanetParams& p) { p.hydrosphereProportion = -0.1; });
    rejects([](wg::PlanetParams& p) { p.normalizedSeaLevel = 2.0; });
    rejects([](wg::PlanetParams& p) { p.orbit->eccentricity = 1.0; });
    rejects([](wg::PlanetParams& p) { p.flatSurface = true; p.maxElevation = 100.0; });
}

TEST_CASE("Planet: max elevation is K / g unless overridden") {
    const wg::Planet earth = geosphere::test::EarthLike();
    CHECK(earth.maxElevation() == doctest::Approx(2.0e5 / earth.surfaceGravity()));

    const wg::Planet custom = earth.withMaxElevation(5000.0);
    CHECK(custom.maxElevation() == doctest::Approx(5000.0));
    CHECK(custom.normalizedSeaLevel() == earth.normalizedSeaLevel());
    CHECK(custom.seeds() == earth.seeds());
}

TEST_CASE("Planet: withSeaLevel keeps max elevation") {
    const wg::Planet earth = geosphere::test::EarthLike().withMaxElevation(10000.0);
    const wg::Planet raised = earth.withSeaLevel(2500.0);
    CHECK(raised.maxElevation() == doctest::Approx(10000.0));
    CHECK(raised.normalizedSeaLevel() == doctest::Approx(0.25));
    CHECK(raised.seaLevel() == doctest::Approx(2500.0));
}

TEST_CASE("Planet: flat bodies have no relief") {
    const wg::Planet flat = geosphere::test::Flat();
    CHECK(flat.hasFlatSurface());
    CHECK(flat.maxElevation() == 0.0);
    for (double lat = -1.5; lat <= 1.5; lat += 0.25)
        CHECK(wg::elevationAt(flat, lat, 0.3) == 0.0);
    CHECK_THROWS_AS((void)flat.withSeaLevel(10.0), std::invalid_argument);
}

TEST_CASE("Planet: gas giants are always flat") {
    wg::PlanetParams p = EarthLikeParams();
    p.kind = wg::PlanetKind::GasGiant;
    const wg::Planet giant = wg::Planet::create(p);
    CHECK(giant.hasFlatSurface());
    CHECK(giant.maxElevation() == 0.0);
}

TEST_CASE("Planet: airless body has no greenhouse and unit insolation factors") {
    const wg::Planet rock = geosphere::test::Airless();
    CHECK_FALSE(rock.hasAtmosphere());
    CHECK_FALSE(rock.hasHydrosphere());
    CHECK(rock.greenhouseEffect() == 0.0);
    CHECK(rock.insolationFactorEquatorial() == 1.0);
    CHECK(rock.insolationFactorPolar() == 1.0);
    CHECK(rock.averageSurfaceTemperature() == doctest::Approx(rock.averageBlackbodyTemperature()));
}

TEST_CASE("Planet: atmosphere state is derived") {
    const wg::Planet earth = geosphere::test::EarthLike();
    REQUIRE(earth.hasAtmosphere());
    const wg::AtmosphereState& atm = earth.atmosphere();
    CHECK(atm.mass > 0.0);
    CHECK(atm.scaleHeight > 0.0);
    CHECK(atm.atmosphericHeight > atm.scaleHeight);
    CHECK(atm.averagePrecipitation == doctest::Approx(990.0));
    CHECK(atm.maxPrecipitation > atm.averagePrecipitation);
    CHECK(earth.insolationFactorPolar() < earth.insolationFactorEquatorial());
    CHECK(earth.greenhouseEffect() >= 0.0);
}

TEST_CASE("Planet: solstices are half an orbit apart") {
    wg::PlanetParams p = EarthLikeParams();
    p.axialPrecession = 0.4;
    const wg::Planet planet = wg::Planet::create(p);
    const double d = wg::normalizeAngle(planet.winterSolsticeTrueAnomaly() - planet.summerSolsticeTrueAnomaly());
    CHECK(d == doctest::Approx(wg::kPi));
}

TEST_CASE("PlanetKind: string tags") {
    wg::PlanetKind k = wg::PlanetKind::Rocky;
    CHECK(wg::parsePlanetKind("gas_giant", k));
    CHECK(k == wg::PlanetKind::GasGiant);
    CHECK(wg::toString(wg::PlanetKind::Icy) == "icy");
    CHECK_FALSE(wg::parsePlanetKind("GasGiant", k));
}

TEST_CASE("computeMaxElevation: randomizer scales within [0.5, 1.5]") {
    wg::Pcg32 rng(123, 7);
    for (int i = 0; i < 50; ++i) {
        const double m = wg::computeMaxElevation(9.81, false, 2.0e5, &rng);
        CHECK(m >= 0.5 * 2.0e5 / 9.81);
        CHECK(m <= 1.5 * 2.0e5 / 9.81);
    }
    CHECK(wg::computeMaxElevation(9.81, true, 2.0e5, &rng) == 0.0);
    CHECK(wg::computeMaxElevation(0.0, false, 2.0e5, nullptr) == 0.0);
}
