// src/worldgen/Noise.hpp
#pragma once
#include <array>
#include <cstdint>
#include <string_view>

namespace geosphere::worldgen {

enum class FractalType : std::uint8_t {
    Fbm        = 0, // plain fractal sum
    Billow     = 1, // |n| folded, puffy ridges
    RigidMulti = 2  // 1 - |n|, sharp crests
};

[[nodiscard]] std::string_view toString(FractalType t) noexcept;
// Returns false for unknown names; `out` is untouched then.
[[nodiscard]] bool parseFractalType(std::string_view s, FractalType& out) noexcept;

struct NoiseSettings {
    double      frequency   = 1.0;
    int         octaves     = 1;
    double      lacunarity  = 2.0;
    double      gain        = 0.5;
    FractalType fractal     = FractalType::Fbm;

    // Optional gradient perturbation (domain warp) applied before the fractal sum.
    double perturbAmplitude = 0.0;
    double perturbFrequency = 1.0;

    friend bool operator==(const NoiseSettings&, const NoiseSettings&) = default;
};

// Seeded 3D gradient noise (improved Perlin) with a fractal layer on top.
// The permutation table is derived from the seed once, in the constructor;
// sample() is a pure function of (seed, settings, x, y, z) and safe to call
// from any number of threads.
class NoiseField {
public:
    NoiseField() : NoiseField(0, NoiseSettings{}) {}
    NoiseField(std::uint64_t seed, const NoiseSettings& settings);

    // Approximately [-1, 1]; finite for finite input.
    [[nodiscard]] double sample(double x, double y, double z) const noexcept;

    // Single octave of raw gradient noise at unit frequency, ~[-1, 1].
    [[nodiscard]] double gradient(double x, double y, double z) const noexcept;

    [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }
    [[nodiscard]] const NoiseSettings& settings() const noexcept { return settings_; }

private:
    std::uint64_t seed_ = 0;
    NoiseSettings settings_{};
    std::array<std::uint8_t, 512> perm_{};
};

} // namespace geosphere::worldgen
