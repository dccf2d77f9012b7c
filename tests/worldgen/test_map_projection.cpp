// tests/worldgen/test_map_projection.cpp
#include <doctest/doctest.h>

#include "worldgen/MapProjection.hpp"
#include "worldgen/Math.hpp"

#include <stdexcept>

namespace wg = geosphere::worldgen;

namespace {

double totalArea(const wg::MapProjection& proj, double radius)
{
    double sum = 0.0;
    for (int y = 0; y < proj.height(); ++y)
        for (int x = 0; x < proj.width(); ++x)
            sum += proj.cellArea(x, y, radius);
    return sum;
}

wg::MapProjectionOptions equalArea()
{
    wg::MapProjectionOptions o{};
    o.equalArea = true;
    return o;
}

} // namespace

TEST_CASE("MapProjection: equirectangular grid is twice as wide as tall") {
    const wg::MapProjection proj(wg::MapProjectionOptions{}, 90);
    CHECK(proj.height() == 90);
    CHECK(proj.width() == 180);
    CHECK(proj.resolution() == 90);
}

TEST_CASE("MapProjection: equal-area width is floor(resolution * pi)") {
    const wg::MapProjection proj(equalArea(), 90);
    CHECK(proj.height() == 90);
    CHECK(proj.width() == 282);
}

TEST_CASE("MapProjection: invalid requests throw") {
    CHECK_THROWS_AS(wg::MapProjection(wg::MapProjectionOptions{}, 0), std::invalid_argument);
    CHECK_THROWS_AS(wg::MapProjection(wg::MapProjectionOptions{}, -4), std::invalid_argument);
    CHECK_THROWS_AS(wg::MapProjection(equalArea(), 91), std::invalid_argument);

    wg::MapProjectionOptions polar{};
    polar.standardParallels = wg::kHalfPi;
    CHECK_THROWS_AS(wg::MapProjection(polar, 10), std::invalid_argument);

    wg::MapProjectionOptions wide{};
    wide.range = 4.0;
    CHECK_THROWS_AS(wg::MapProjection(wide, 10), std::invalid_argument);
}

TEST_CASE("MapProjection: cell centres map back to their cells") {
    for (const bool ea : {false, true}) {
        wg::MapProjectionOptions o{};
        o.equalArea = ea;
        o.centralMeridian = 0.7;
        const wg::MapProjection proj(o, 36);
        for (int y = 0; y < proj.height(); ++y) {
            for (int x = 0; x < proj.width(); ++x) {
                const wg::LatLon ll = proj.latLonAt(x, y);
                int cx = -1, cy = -1;
                proj.cellAt(ll.latitude, ll.longitude, cx, cy);
                REQUIRE(cx == x);
                REQUIRE(cy == y);
            }
        }
    }
}

TEST_CASE("MapProjection: row 0 is the northern edge") {
    const wg::MapProjection proj(wg::MapProjectionOptions{}, 10);
    CHECK(proj.latLonAt(0, 0).latitude > 0.0);
    CHECK(proj.latLonAt(0, 9).latitude < 0.0);
    CHECK(proj.latLonAt(0, 0).latitude == doctest::Approx(-proj.latLonAt(0, 9).latitude));
    CHECK(proj.latLonAt(0, 0).latitude == doctest::Approx(wg::kHalfPi - wg::kPi / 20.0));
}

TEST_CASE("MapProjection: cellAt clamps out-of-range latitudes") {
    wg::MapProjectionOptions o{};
    o.range = wg::kHalfPi; // +-45 degrees
    const wg::MapProjection proj(o, 20);
    int x = 0, y = 0;
    proj.cellAt(1.5, 0.0, x, y);
    CHECK(y == 0);
    proj.cellAt(-1.5, 0.0, x, y);
    CHECK(y == proj.height() - 1);
}

TEST_CASE("MapProjection: equirectangular cells cover the whole sphere") {
    const wg::MapProjection proj(wg::MapProjectionOptions{}, 90);
    CHECK(totalArea(proj, 1.0) == doctest::Approx(4.0 * wg::kPi).epsilon(1e-9));
}

TEST_CASE("MapProjection: equal-area cells share one area and cover the sphere") {
    const wg::MapProjection proj(equalArea(), 90);
    const double first = proj.cellArea(0, 0, 1.0);
    for (int y = 1; y < proj.height(); ++y)
        CHECK(proj.cellArea(0, y, 1.0) == doctest::Approx(first).epsilon(1e-9));

    // Width is truncated to whole cells.
    CHECK(totalArea(proj, 1.0) == doctest::Approx(4.0 * wg::kPi).epsilon(0.005));
}

TEST_CASE("reproject: equirectangular to equal-area keeps hemispheres") {
    const wg::MapProjection from(wg::MapProjectionOptions{}, 20);
    const wg::MapProjection to(equalArea(), 20);

    wg::Grid2D<int> src(from.width(), from.height(), 0);
    for (int y = 0; y < from.height(); ++y)
        for (int x = 0; x < from.width(); ++x)
            src.at(x, y) = from.latLonAt(x, y).latitude > 0.0 ? 1 : -1;

    const wg::Grid2D<int> out = wg::reproject(src, from, to);
    REQUIRE(out.sameShape(to.width(), to.height()));
    for (int y = 0; y < to.height(); ++y)
        for (int x = 0; x < to.width(); ++x)
            CHECK(out.at(x, y) == (to.latLonAt(x, y).latitude > 0.0 ? 1 : -1));
}

TEST_CASE("resample: doubling resolution repeats each cell") {
    const wg::MapProjection proj(wg::MapProjectionOptions{}, 4);
    wg::Grid2D<int> src(proj.width(), proj.height(), 0);
    for (int y = 0; y < proj.height(); ++y)
        for (int x = 0; x < proj.width(); ++x)
            src.at(x, y) = y * 100 + x;

    const wg::Grid2D<int> out = wg::resample(src, proj, 8);
    REQUIRE(out.sameShape(16, 8));
    for (int y = 0; y < 8; ++y)
        for (int x = 0; x < 16; ++x)
            CHECK(out.at(x, y) == src.at(x / 2, y / 2));
}
