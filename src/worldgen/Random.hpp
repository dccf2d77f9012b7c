// src/worldgen/Random.hpp
#pragma once
#include <cstdint>

namespace geosphere::worldgen {

// Minimal PCG32 RNG (O'Neill). 32-bit outputs, 64-bit state/stream.
// Drives planet parameter sampling and noise permutation shuffles.
struct Pcg32 {
  using result_type = uint32_t;

  uint64_t state = 0x853c49e6748fea9bULL;
  uint64_t inc   = 0xda3e39cb94b95bdbULL; // must be odd

  Pcg32() = default;
  explicit Pcg32(uint64_t seed, uint64_t seq = 1u) noexcept { seed_rng(seed, seq); }

  static constexpr result_type min() noexcept { return 0u; }
  static constexpr result_type max() noexcept { return 0xFFFFFFFFu; }

  // `seq` selects the stream; inc = (seq << 1) | 1 keeps it odd.
  inline void seed_rng(uint64_t seed, uint64_t seq = 1u) noexcept {
    state = 0u;
    inc   = (seq << 1u) | 1u;
    next();
    state += seed;
    next();
  }

  inline result_type next() noexcept {
    const uint64_t old = state;
    state = old * 6364136223846793005ULL + inc;

    const uint32_t xorshifted = static_cast<uint32_t>(((old >> 18u) ^ old) >> 27u);
    const uint32_t rot        = static_cast<uint32_t>(old >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-static_cast<int32_t>(rot)) & 31));
  }

  inline result_type operator()() noexcept { return next(); }

  // Uniform in [0, bound) without modulo bias (like PCG reference).
  inline uint32_t next_bounded(uint32_t bound) noexcept {
    if (bound == 0u) return 0u;
    uint64_t m = static_cast<uint64_t>(next()) * static_cast<uint64_t>(bound);
    uint32_t l = static_cast<uint32_t>(m);
    const uint32_t thresh = static_cast<uint32_t>(-bound) % bound;
    if (l < thresh) {
      do {
        m = static_cast<uint64_t>(next()) * static_cast<uint64_t>(bound);
        l = static_cast<uint32_t>(m);
      } while (l < thresh);
    }
    return static_cast<uint32_t>(m >> 32);
  }

  // [0,1) with 53 bits of precision.
  inline double next_double01() noexcept {
    const uint64_t v = (static_cast<uint64_t>(next()) << 32) | next();
    constexpr double INV_2_53 = 1.0 / 9007199254740992.0; // 2^-53
    return static_cast<double>(v >> 11) * INV_2_53;
  }
};

inline double randd(Pcg32& rng, double lo, double hi) noexcept {
  return lo + (hi - lo) * rng.next_double01();
}

} // namespace geosphere::worldgen
