// src/worldgen/Vec3.hpp
#pragma once
#include <cmath>

namespace geosphere::worldgen {

// Double-precision vector for positions on the unit sphere.
struct Vec3d {
    double x = 0.0, y = 0.0, z = 0.0;
    Vec3d() = default;
    constexpr Vec3d(double _x, double _y, double _z) : x(_x), y(_y), z(_z) {}

    friend constexpr Vec3d operator+(const Vec3d& a, const Vec3d& b) noexcept { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
    friend constexpr Vec3d operator-(const Vec3d& a, const Vec3d& b) noexcept { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
    friend constexpr Vec3d operator*(const Vec3d& a, double s) noexcept { return {a.x * s, a.y * s, a.z * s}; }
    friend constexpr Vec3d operator*(double s, const Vec3d& a) noexcept { return {a.x * s, a.y * s, a.z * s}; }
    friend constexpr bool operator==(const Vec3d&, const Vec3d&) = default;

    static constexpr Vec3d unitX() noexcept { return {1.0, 0.0, 0.0}; }
    static constexpr Vec3d unitY() noexcept { return {0.0, 1.0, 0.0}; }
    static constexpr Vec3d unitZ() noexcept { return {0.0, 0.0, 1.0}; }
};

inline constexpr double dot(const Vec3d& a, const Vec3d& b) noexcept { return a.x*b.x + a.y*b.y + a.z*b.z; }
inline constexpr Vec3d cross(const Vec3d& a, const Vec3d& b) noexcept {
    return {a.y*b.z - a.z*b.y, a.z*b.x - a.x*b.z, a.x*b.y - a.y*b.x};
}
inline double length(const Vec3d& v) noexcept { return std::sqrt(dot(v, v)); }
inline Vec3d  normalize(const Vec3d& v) noexcept {
    const double L = length(v);
    return L > 0.0 ? Vec3d{v.x / L, v.y / L, v.z / L} : Vec3d{};
}

// Angle between two vectors, robust near 0 and pi.
inline double angleBetween(const Vec3d& a, const Vec3d& b) noexcept {
    return std::atan2(length(cross(a, b)), dot(a, b));
}

// Unit quaternion (w + xi + yj + zk) for axis rotations.
struct Quatd {
    double w = 1.0, x = 0.0, y = 0.0, z = 0.0;

    static Quatd axisAngle(const Vec3d& axis, double angle) noexcept {
        const Vec3d n = normalize(axis);
        const double h = angle * 0.5;
        const double s = std::sin(h);
        return {std::cos(h), n.x * s, n.y * s, n.z * s};
    }

    // Rotation about +Y.
    static Quatd yaw(double angle) noexcept { return axisAngle(Vec3d::unitY(), angle); }

    [[nodiscard]] constexpr Quatd conjugate() const noexcept { return {w, -x, -y, -z}; }

    friend constexpr Quatd operator*(const Quatd& a, const Quatd& b) noexcept {
        return {
            a.w*b.w - a.x*b.x - a.y*b.y - a.z*b.z,
            a.w*b.x + a.x*b.w + a.y*b.z - a.z*b.y,
            a.w*b.y - a.x*b.z + a.y*b.w + a.z*b.x,
            a.w*b.z + a.x*b.y - a.y*b.x + a.z*b.w
        };
    }

    // q * v * q^-1 for a unit quaternion.
    [[nodiscard]] constexpr Vec3d rotate(const Vec3d& v) const noexcept {
        const Vec3d u{x, y, z};
        const Vec3d t = 2.0 * cross(u, v);
        return v + w * t + cross(u, t);
    }

    friend constexpr bool operator==(const Quatd&, const Quatd&) = default;
};

} // namespace geosphere::worldgen
