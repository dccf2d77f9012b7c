// tests/test_surface_maps_save.cpp
//
// Save/load coverage for geosphere/save/SurfaceMapsSave.hpp: full round trips
// through disk, schema-version handling, and rejection of malformed files.

#include <doctest/doctest.h>

#include "geosphere/save/SurfaceMapsSave.hpp"
#include "test_support/test_planets.h"
#include "worldgen/WorldGen.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
namespace wg = geosphere::worldgen;
namespace save = geosphere::save;
using nlohmann::json;

namespace {

fs::path make_unique_temp_dir(const char* tag)
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    fs::path dir = base / ("geosphere_tests_" + std::to_string(::getpid()) + "_" + tag);
    fs::create_directories(dir, ec);
    return dir;
}

void write_text(const fs::path& p, const std::string& text)
{
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << text;
}

const wg::SurfaceMaps& sample_maps()
{
    static const wg::SurfaceMaps maps = [] {
        wg::SurfaceMapRequest r{};
        r.resolution = 12;
        r.seasons = 2;
        return wg::SurfaceMapGenerator(r).generate(geosphere::test::EarthLike(2718));
    }();
    return maps;
}

} // namespace

TEST_CASE("SurfaceMapsSave: maps round-trip through a file")
{
    const fs::path dir = make_unique_temp_dir("maps");
    const fs::path p = dir / "maps.json";

    const auto saved = save::SaveSurfaceMaps(sample_maps(), p);
    REQUIRE_MESSAGE(saved.has_value(), saved.error().message);
    CHECK(fs::exists(p));
    CHECK_FALSE(fs::exists(fs::path(p.string() + ".tmp")));

    const auto loaded = save::LoadSurfaceMaps(p);
    REQUIRE_MESSAGE(loaded.has_value(), loaded.error().message);
    CHECK(*loaded == sample_maps());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("SurfaceMapsSave: documents carry the schema version and a summary")
{
    const json doc = save::SerializeSurfaceMaps(sample_maps());
    CHECK(doc.at("schema_version").get<int>() == save::kSchemaVersion);
    CHECK(doc.at("width").get<int>() == sample_maps().width);
    CHECK(doc.at("seasons").size() == 2);
    CHECK(doc.at("summary").at("land_cell_count").get<int>() == sample_maps().landCellCount);
    CHECK(doc.at("projection").at("standard_parallels").is_null());
}

TEST_CASE("SurfaceMapsSave: reloading and saving again reproduces the same text")
{
    const std::string text = save::SerializeSurfaceMaps(sample_maps()).dump();

    const auto reloaded = save::DeserializeSurfaceMaps(json::parse(text));
    REQUIRE_MESSAGE(reloaded.has_value(), reloaded.error().message);
    CHECK(save::SerializeSurfaceMaps(*reloaded).dump() == text);

    // A second generation through the text form is stable too.
    const auto again = save::DeserializeSurfaceMaps(json::parse(save::SerializeSurfaceMaps(*reloaded).dump()));
    REQUIRE(again.has_value());
    CHECK(save::SerializeSurfaceMaps(*again).dump() == text);
}

TEST_CASE("SurfaceMapsSave: junk field values never escape as exceptions")
{
    const json good = save::SerializeSurfaceMaps(sample_maps());
    const json junk[] = { json(nullptr), json(true), json(-7), json(2.5), json("text"),
                          json::array(), json::array({1, 2, 3}), json::object() };

    for (const auto& item : good.items()) {
        if (item.key() == "schema_version")
            continue;
        for (const json& value : junk) {
            json doc = good;
            doc[item.key()] = value;
            CHECK_NOTHROW((void)save::DeserializeSurfaceMaps(doc));
        }
    }
}

TEST_CASE("SurfaceMapsSave: missing file reports IoOpenFail")
{
    const auto r = save::LoadSurfaceMaps(make_unique_temp_dir("missing") / "nope.json");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == save::SaveError::Code::IoOpenFail);
}

TEST_CASE("SurfaceMapsSave: malformed JSON reports JsonParseError")
{
    const fs::path p = make_unique_temp_dir("parse") / "broken.json";
    write_text(p, "{ \"schema_version\": 1, ");
    const auto r = save::LoadSurfaceMaps(p);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == save::SaveError::Code::JsonParseError);
}

TEST_CASE("SurfaceMapsSave: newer schema versions are refused")
{
    json doc = save::SerializeSurfaceMaps(sample_maps());
    doc["schema_version"] = save::kSchemaVersion + 1;
    const auto r = save::DeserializeSurfaceMaps(doc);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == save::SaveError::Code::MigrationFailed);
}

TEST_CASE("SurfaceMapsSave: missing fields and wrong shapes are rejected")
{
    SUBCASE("missing grid") {
        json doc = save::SerializeSurfaceMaps(sample_maps());
        doc.erase("biome");
        const auto r = save::DeserializeSurfaceMaps(doc);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == save::SaveError::Code::JsonSchemaInvalid);
    }
    SUBCASE("grid value count does not match its size") {
        json doc = save::SerializeSurfaceMaps(sample_maps());
        doc["elevation"]["values"].erase(0);
        const auto r = save::DeserializeSurfaceMaps(doc);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == save::SaveError::Code::JsonTypeError);
    }
    SUBCASE("grid of the wrong size for the map") {
        json doc = save::SerializeSurfaceMaps(sample_maps());
        doc["climate"] = json::object({{"width", 1}, {"height", 1}, {"values", json::array({0})}});
        const auto r = save::DeserializeSurfaceMaps(doc);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == save::SaveError::Code::JsonTypeError);
    }
    SUBCASE("enum out of range") {
        json doc = save::SerializeSurfaceMaps(sample_maps());
        doc["ecology"]["values"][0] = 200;
        const auto r = save::DeserializeSurfaceMaps(doc);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == save::SaveError::Code::JsonTypeError);
    }
    SUBCASE("root is not an object") {
        const auto r = save::DeserializeSurfaceMaps(json::array());
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == save::SaveError::Code::JsonTypeError);
    }
}

TEST_CASE("SurfaceMapsSave: planets round-trip with pinned seeds and mass")
{
    const fs::path dir = make_unique_temp_dir("planet");
    const fs::path p = dir / "planet.json";

    wg::PlanetParams params = geosphere::test::EarthLikeParams(99);
    params.mass.reset();
    params.axialPrecession = 0.3;
    params.atmosphere->averagePrecipitation.reset();
    const wg::Planet planet = wg::Planet::create(params);

    const auto saved = save::SavePlanet(planet, p);
    REQUIRE_MESSAGE(saved.has_value(), saved.error().message);

    const auto loaded = save::LoadPlanet(p);
    REQUIRE_MESSAGE(loaded.has_value(), loaded.error().message);
    CHECK(*loaded == planet);
    CHECK(loaded->mass() == planet.mass());
    CHECK(loaded->seeds() == planet.seeds());
    CHECK(loaded->maxElevation() == planet.maxElevation());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("SurfaceMapsSave: planet files with invalid values report JsonSchemaInvalid")
{
    const fs::path p = make_unique_temp_dir("badplanet") / "planet.json";
    json j = geosphere::test::EarthLikeParams();
    j["albedo"] = 4.0;
    write_text(p, json::object({{"schema_version", 1}, {"planet", j}}).dump());

    const auto r = save::LoadPlanet(p);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == save::SaveError::Code::JsonSchemaInvalid);
}

TEST_CASE("SurfaceMapsSave: unknown planet kind is a type error")
{
    json j = geosphere::test::EarthLikeParams();
    j["kind"] = "dyson_sphere";
    CHECK_THROWS_AS((void)j.get<wg::PlanetParams>(), json::type_error);
}
