// src/worldgen/Noise.cpp
#include "worldgen/Noise.hpp"
#include "worldgen/Random.hpp"
#include "worldgen/SeedHash.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numeric>

namespace geosphere::worldgen {
namespace {

// Ken Perlin-style fade curve
inline double fade(double t) noexcept { return t * t * t * (t * (t * 6.0 - 15.0) + 10.0); }

inline double lerpd(double a, double b, double t) noexcept { return a + (b - a) * t; }

// 12 cube-edge gradients, padded to 16 (improved noise, 2002).
inline double grad3(std::uint8_t h, double x, double y, double z) noexcept {
  const int k = h & 15;
  const double u = k < 8 ? x : y;
  const double v = k < 4 ? y : (k == 12 || k == 14 ? x : z);
  return ((k & 1) ? -u : u) + ((k & 2) ? -v : v);
}

// Per-octave offset keeps octaves from sharing lattice points at the origin.
constexpr double kOctaveOffset = 37.719;

} // namespace

std::string_view toString(FractalType t) noexcept {
  switch (t) {
    case FractalType::Fbm:        return "fbm";
    case FractalType::Billow:     return "billow";
    case FractalType::RigidMulti: return "rigid_multi";
  }
  return "fbm";
}

bool parseFractalType(std::string_view s, FractalType& out) noexcept {
  if (s == "fbm")         { out = FractalType::Fbm;        return true; }
  if (s == "billow")      { out = FractalType::Billow;     return true; }
  if (s == "rigid_multi") { out = FractalType::RigidMulti; return true; }
  return false;
}

NoiseField::NoiseField(std::uint64_t seed, const NoiseSettings& settings)
    : seed_(seed), settings_(settings)
{
  std::array<std::uint8_t, 256> p{};
  std::iota(p.begin(), p.end(), std::uint8_t{0});

  // Fisher-Yates with a seed-derived PCG stream.
  Pcg32 rng(detail::splitmix64(seed), detail::splitmix64(seed ^ 0x5eed5eedull));
  for (std::uint32_t i = 255; i > 0; --i) {
    const std::uint32_t j = rng.next_bounded(i + 1);
    std::swap(p[i], p[j]);
  }
  for (std::size_t i = 0; i < 512; ++i)
    perm_[i] = p[i & 255];

  if (settings_.octaves < 1) settings_.octaves = 1;
}

double NoiseField::gradient(double x, double y, double z) const noexcept {
  const double fx = std::floor(x);
  const double fy = std::floor(y);
  const double fz = std::floor(z);

  const int X = static_cast<int>(static_cast<std::int64_t>(fx) & 255);
  const int Y = static_cast<int>(static_cast<std::int64_t>(fy) & 255);
  const int Z = static_cast<int>(static_cast<std::int64_t>(fz) & 255);

  x -= fx; y -= fy; z -= fz;

  const double u = fade(x);
  const double v = fade(y);
  const double w = fade(z);

  const auto& P = perm_;
  const int A  = P[X] + Y,     AA = P[A] + Z, AB = P[A + 1] + Z;
  const int B  = P[X + 1] + Y, BA = P[B] + Z, BB = P[B + 1] + Z;

  const double r = lerpd(
      lerpd(lerpd(grad3(P[AA],     x,       y,       z),
                  grad3(P[BA],     x - 1.0, y,       z), u),
            lerpd(grad3(P[AB],     x,       y - 1.0, z),
                  grad3(P[BB],     x - 1.0, y - 1.0, z), u), v),
      lerpd(lerpd(grad3(P[AA + 1], x,       y,       z - 1.0),
                  grad3(P[BA + 1], x - 1.0, y,       z - 1.0), u),
            lerpd(grad3(P[AB + 1], x,       y - 1.0, z - 1.0),
                  grad3(P[BB + 1], x - 1.0, y - 1.0, z - 1.0), u), v),
      w);
  return std::clamp(r, -1.0, 1.0);
}

double NoiseField::sample(double x, double y, double z) const noexcept {
  const NoiseSettings& s = settings_;

  double px = x * s.frequency;
  double py = y * s.frequency;
  double pz = z * s.frequency;

  if (s.perturbAmplitude != 0.0) {
    const double pf = s.perturbFrequency;
    const double wx = gradient(x * pf + 11.3, y * pf + 47.1, z * pf + 5.9);
    const double wy = gradient(x * pf + 71.7, y * pf + 13.3, z * pf + 29.5);
    const double wz = gradient(x * pf + 23.1, y * pf + 61.9, z * pf + 89.3);
    px += s.perturbAmplitude * wx;
    py += s.perturbAmplitude * wy;
    pz += s.perturbAmplitude * wz;
  }

  double amp = 1.0;
  double sum = 0.0;
  double norm = 0.0;
  for (int i = 0; i < s.octaves; ++i) {
    const double o = kOctaveOffset * static_cast<double>(i);
    const double n = gradient(px + o, py + o, pz + o);
    switch (s.fractal) {
      case FractalType::Fbm:        sum += amp * n;                         break;
      case FractalType::Billow:     sum += amp * (std::abs(n) * 2.0 - 1.0); break;
      case FractalType::RigidMulti: sum += amp * (1.0 - std::abs(n) * 2.0); break;
    }
    norm += amp;
    px *= s.lacunarity; py *= s.lacunarity; pz *= s.lacunarity;
    amp *= s.gain;
  }
  return norm > 0.0 ? sum / norm : 0.0;
}

} // namespace geosphere::worldgen
