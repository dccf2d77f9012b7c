#pragma once
#include <cstdint>
#include <utility>
#include "SeedHash.hpp"

namespace geosphere::worldgen {

// Combine a world seed, a 2D salt and a stream id into a (state, inc) pair for PCG32.
// Planets use (cx, cy) = (0, noise slot).
inline std::pair<std::uint64_t, std::uint64_t>
derive_pcg_seed(std::uint64_t worldSeed, std::int64_t cx, std::int64_t cy, std::uint64_t streamId) noexcept {
    using geosphere::worldgen::detail::splitmix64;

    const std::uint64_t a = splitmix64(worldSeed ^ 0x6a09e667f3bcc909ull);
    const std::uint64_t b = splitmix64(static_cast<std::uint64_t>(cx) ^ 0xbb67ae8584caa73bull);
    const std::uint64_t c = splitmix64(static_cast<std::uint64_t>(cy) ^ 0x3c6ef372fe94f82bull);
    const std::uint64_t d = splitmix64(streamId ^ 0xa54ff53a5f1d36f1ull);

    const std::uint64_t state  = splitmix64(a ^ (b << 1) ^ (c << 7) ^ (d << 13));
    const std::uint64_t stream = splitmix64(d ^ (a << 17) ^ (b << 9) ^ (c << 3));
    // PCG requires stream increment to be odd; Pcg32::seed_rng forces (stream<<1)|1.
    return { state, stream };
}

} // namespace geosphere::worldgen
