// tests/test_stages_config.cpp
#include <doctest/doctest.h>

#include "worldgen/Math.hpp"
#include "worldgen/StagesConfig.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <stdexcept>

namespace wg = geosphere::worldgen;
using nlohmann::json;

namespace {
constexpr double kDeg = wg::kPi / 180.0;
}

TEST_CASE("StagesConfig: empty document keeps every default")
{
    const wg::GeneratorConfig cfg = wg::StagesConfig::from_json(json::object());
    const wg::GeneratorConfig defaults{};
    CHECK(cfg.planet == defaults.planet);
    CHECK(cfg.map == defaults.map);
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.logging.file.empty());
}

TEST_CASE("StagesConfig: angles are read in degrees")
{
    const json root = {
        {"planet", {{"axial_tilt_deg", 30.0}, {"axial_precession_deg", 90.0}}},
        {"map",    {{"central_meridian_deg", 45.0}, {"standard_parallels_deg", 30.0}, {"range_deg", 120.0}}}
    };
    const wg::GeneratorConfig cfg = wg::StagesConfig::from_json(root);
    CHECK(cfg.planet.axialTilt == doctest::Approx(30.0 * kDeg));
    CHECK(cfg.planet.axialPrecession == doctest::Approx(wg::kHalfPi));
    CHECK(cfg.map.projection.centralMeridian == doctest::Approx(wg::kPi / 4.0));
    REQUIRE(cfg.map.projection.standardParallels.has_value());
    CHECK(*cfg.map.projection.standardParallels == doctest::Approx(30.0 * kDeg));
    REQUIRE(cfg.map.projection.range.has_value());
    CHECK(*cfg.map.projection.range == doctest::Approx(120.0 * kDeg));
}

TEST_CASE("StagesConfig: disabled sections drop the atmosphere and orbit")
{
    const json root = {
        {"atmosphere", {{"enabled", false}, {"greenhouse_factor", 3.0}}},
        {"orbit",      {{"enabled", false}}}
    };
    const wg::GeneratorConfig cfg = wg::StagesConfig::from_json(root);
    CHECK_FALSE(cfg.planet.atmosphere.has_value());
    CHECK_FALSE(cfg.planet.orbit.has_value());
}

TEST_CASE("StagesConfig: optional keys accept null")
{
    const json root = {
        {"planet",     {{"mass", nullptr}, {"max_elevation", 1200.0}}},
        {"atmosphere", {{"average_precipitation", nullptr}}}
    };
    const wg::GeneratorConfig cfg = wg::StagesConfig::from_json(root);
    CHECK_FALSE(cfg.planet.mass.has_value());
    REQUIRE(cfg.planet.maxElevation.has_value());
    CHECK(*cfg.planet.maxElevation == 1200.0);
    REQUIRE(cfg.planet.atmosphere.has_value());
    CHECK_FALSE(cfg.planet.atmosphere->averagePrecipitation.has_value());
}

TEST_CASE("StagesConfig: malformed values are rejected")
{
    SUBCASE("wrong value type") {
        const json root = {{"map", {{"resolution", "ninety"}}}};
        CHECK_THROWS_AS((void)wg::StagesConfig::from_json(root), std::invalid_argument);
    }
    SUBCASE("unknown planet kind") {
        const json root = {{"planet", {{"kind", "brown_dwarf"}}}};
        CHECK_THROWS_AS((void)wg::StagesConfig::from_json(root), std::invalid_argument);
    }
    SUBCASE("section that is not an object") {
        const json root = {{"tuning", json::array({1, 2})}};
        CHECK_THROWS_AS((void)wg::StagesConfig::from_json(root), std::invalid_argument);
    }
    SUBCASE("root that is not an object") {
        CHECK_THROWS_AS((void)wg::StagesConfig::from_json(json(3)), std::invalid_argument);
    }
}

TEST_CASE("StagesConfig: kind tags select the planet kind")
{
    const json root = {{"planet", {{"kind", "gas_giant"}}}};
    CHECK(wg::StagesConfig::from_json(root).planet.kind == wg::PlanetKind::GasGiant);
}

TEST_CASE("StagesConfig: try_load reports a missing file without throwing")
{
    wg::GeneratorConfig cfg{};
    cfg.map.resolution = 17;
    CHECK_FALSE(wg::StagesConfig::try_load("does/not/exist/geosphere.json", cfg));
    CHECK(cfg.map.resolution == 17);
    CHECK_THROWS_AS((void)wg::StagesConfig::load("does/not/exist/geosphere.json"), std::runtime_error);
}

TEST_CASE("StagesConfig: the shipped config loads")
{
    const auto path = std::filesystem::path(__FILE__).parent_path().parent_path()
                    / "assets" / "config" / "geosphere.json";
    const wg::GeneratorConfig cfg = wg::StagesConfig::load(path.string());

    CHECK(cfg.planet.kind == wg::PlanetKind::Rocky);
    CHECK(cfg.planet.seed == 42u);
    CHECK(cfg.planet.axialTilt == doctest::Approx(23.44 * kDeg));
    CHECK_FALSE(cfg.planet.maxElevation.has_value());
    REQUIRE(cfg.planet.atmosphere.has_value());
    REQUIRE(cfg.planet.atmosphere->averagePrecipitation.has_value());
    CHECK(*cfg.planet.atmosphere->averagePrecipitation == doctest::Approx(990.0));
    CHECK(cfg.map.resolution == 90);
    CHECK(cfg.map.seasons == 4);
    CHECK(cfg.map.computeHydrology);
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.logging.file == "logs/geosphere.log");
}
