// src/worldgen/Math.hpp
#pragma once
#include <algorithm> // clamp
#include <cmath>
#include <numbers>

namespace geosphere::worldgen {

inline constexpr double kPi     = std::numbers::pi;
inline constexpr double kHalfPi = std::numbers::pi / 2.0;
inline constexpr double kTwoPi  = std::numbers::pi * 2.0;

// Single, inline definitions avoid multiple-definition/linkage problems.
inline constexpr float lerp(float a, float b, float t) noexcept {
    return a + (b - a) * t;
}

inline constexpr double lerp(double a, double b, double t) noexcept {
    return a + (b - a) * t;
}

// Position of x between a and b; 0 when the interval is empty.
inline constexpr double inverseLerp(double a, double b, double x) noexcept {
    return (b == a) ? 0.0 : (x - a) / (b - a);
}

inline float smoothstep(float edge0, float edge1, float x) noexcept {
    if (edge0 == edge1) return x <= edge0 ? 0.0f : 1.0f;
    float t = std::clamp((x - edge0) / (edge1 - edge0), 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

inline bool nearlyZero(double v, double eps = 1e-12) noexcept {
    return std::abs(v) <= eps;
}

// Round half away from zero to `digits` decimal places.
inline double roundTo(double v, int digits) noexcept {
    const double scale = std::pow(10.0, digits);
    return std::round(v * scale) / scale;
}

// Wraps an angle into (-pi, pi].
inline double normalizeLongitude(double lon) noexcept {
    double r = std::remainder(lon, kTwoPi); // [-pi, pi]
    if (r <= -kPi) r += kTwoPi;
    return r;
}

// Wraps an angle into [0, 2pi).
inline double normalizeAngle(double a) noexcept {
    double r = std::fmod(a, kTwoPi);
    if (r < 0.0) r += kTwoPi;
    if (r >= kTwoPi) r -= kTwoPi;
    return r;
}

} // namespace geosphere::worldgen
