// tests/worldgen/test_math_and_noise.cpp
//
// IMPORTANT:
//   Do NOT define DOCTEST_CONFIG_IMPLEMENT or DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN in this file.
//   The doctest implementation + test runner main() are provided by tests/test_main.cpp.
//
#if defined(DOCTEST_CONFIG_IMPLEMENT) || defined(DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN)
    #error "Do not define DOCTEST_CONFIG_IMPLEMENT* in individual test translation units. Define it only in tests/test_main.cpp."
#endif

#include <doctest/doctest.h>

#include "worldgen/Math.hpp"
#include "worldgen/Noise.hpp"

#include <cmath>

namespace wg = geosphere::worldgen;

// ---------------------- lerp ----------------------
TEST_CASE("lerp: identities, midpoint, monotonicity") {
    CHECK(wg::lerp(1.0f, 5.0f, 0.0f) == doctest::Approx(1.0f));
    CHECK(wg::lerp(1.0f, 5.0f, 1.0f) == doctest::Approx(5.0f));
    CHECK(wg::lerp(-2.0, 2.0, 0.5) == doctest::Approx(0.0));
    CHECK(wg::lerp(10.0, -2.0, 0.5) == doctest::Approx(4.0));

    CHECK(wg::lerp(2.0, 8.0, 0.25) < wg::lerp(2.0, 8.0, 0.75));
    CHECK(wg::lerp(8.0, 2.0, 0.25) > wg::lerp(8.0, 2.0, 0.75));

    CHECK(wg::inverseLerp(2.0, 6.0, 3.0) == doctest::Approx(0.25));
    CHECK(wg::inverseLerp(2.0, 2.0, 3.0) == 0.0);
}

// ---------------------- smoothstep ----------------------
TEST_CASE("smoothstep: clamps outside [a,b] and is symmetric") {
    CHECK(wg::smoothstep(0.0f, 1.0f, -1.0f) == 0.0f);
    CHECK(wg::smoothstep(0.0f, 1.0f, 2.0f) == 1.0f);
    CHECK(wg::smoothstep(0.0f, 1.0f, 0.5f) == doctest::Approx(0.5f));
    CHECK(wg::smoothstep(0.0f, 1.0f, 0.25f) + wg::smoothstep(0.0f, 1.0f, 0.75f) == doctest::Approx(1.0f));
}

// ---------------------- angles ----------------------
TEST_CASE("normalizeLongitude: result in (-pi, pi]") {
    CHECK(wg::normalizeLongitude(0.0) == 0.0);
    CHECK(wg::normalizeLongitude(wg::kPi) == doctest::Approx(wg::kPi));
    CHECK(wg::normalizeLongitude(-wg::kPi) == doctest::Approx(wg::kPi));
    CHECK(wg::normalizeLongitude(3.0 * wg::kPi / 2.0) == doctest::Approx(-wg::kHalfPi));
    for (double a = -20.0; a < 20.0; a += 0.37) {
        const double n = wg::normalizeLongitude(a);
        CHECK(n > -wg::kPi);
        CHECK(n <= wg::kPi);
    }
}

TEST_CASE("normalizeAngle: result in [0, 2pi)") {
    CHECK(wg::normalizeAngle(-wg::kHalfPi) == doctest::Approx(3.0 * wg::kHalfPi));
    CHECK(wg::normalizeAngle(wg::kTwoPi) == doctest::Approx(0.0));
    for (double a = -20.0; a < 20.0; a += 0.37) {
        const double n = wg::normalizeAngle(a);
        CHECK(n >= 0.0);
        CHECK(n < wg::kTwoPi);
    }
}

TEST_CASE("roundTo: half away from zero") {
    CHECK(wg::roundTo(0.12345, 3) == doctest::Approx(0.123));
    CHECK(wg::roundTo(-0.0125, 2) == doctest::Approx(-0.01));
    CHECK(wg::roundTo(2.5, 0) == 3.0);
}

// ---------------------- noise ----------------------
TEST_CASE("NoiseField: same seed and settings give identical samples") {
    const wg::NoiseSettings settings{0.5, 4, 2.0, 0.5, wg::FractalType::Fbm};
    const wg::NoiseField a(1234, settings);
    const wg::NoiseField b(1234, settings);
    const wg::NoiseField c(4321, settings);

    int differing = 0;
    for (int i = 0; i < 64; ++i) {
        const double x = i * 0.731, y = i * -0.417, z = i * 0.113;
        CHECK(a.sample(x, y, z) == b.sample(x, y, z));
        if (a.sample(x, y, z) != c.sample(x, y, z))
            ++differing;
    }
    CHECK(differing > 32);
}

TEST_CASE("NoiseField: samples are finite and roughly bounded for every fractal type") {
    for (const auto type : {wg::FractalType::Fbm, wg::FractalType::Billow, wg::FractalType::RigidMulti}) {
        const wg::NoiseField field(99, wg::NoiseSettings{1.3, 6, 2.0, 0.5, type});
        for (int i = 0; i < 200; ++i) {
            const double v = field.sample(i * 0.37, i * 0.11 - 5.0, i * -0.53);
            CHECK(std::isfinite(v));
            CHECK(std::abs(v) <= 1.5);
        }
    }
}

TEST_CASE("FractalType: string tags") {
    wg::FractalType t = wg::FractalType::Fbm;
    CHECK(wg::parseFractalType("rigid_multi", t));
    CHECK(t == wg::FractalType::RigidMulti);
    CHECK(wg::toString(wg::FractalType::Billow) == "billow");
    CHECK_FALSE(wg::parseFractalType("perlin", t));
    CHECK(t == wg::FractalType::RigidMulti);
}
