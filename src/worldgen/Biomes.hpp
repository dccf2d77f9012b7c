#pragma once
// -----------------------------------------------------------------------------
// src/worldgen/Biomes.hpp
// Climate / humidity / ecology / biome classification (Holdridge-style tables)
// plus the sea-ice and snow-cover seasons. Pure functions of their inputs.
// -----------------------------------------------------------------------------

#include <cstdint>
#include <string_view>

#include "worldgen/Temperature.hpp"

namespace geosphere::worldgen {

enum class ClimateType : std::uint8_t {
    Polar = 0, Subpolar, Boreal, CoolTemperate, WarmTemperate, Subtropical, Tropical, Supertropical
};

enum class HumidityType : std::uint8_t {
    Superarid = 0, Perarid, Arid, Semiarid, Subhumid, Humid, Perhumid, Superhumid
};

enum class EcologyType : std::uint8_t {
    Desert = 0,
    DryTundra, MoistTundra, WetTundra, RainTundra,
    DesertScrub, DryScrub, Steppe, ThornScrub, ThornWoodland,
    VeryDryForest, DryForest, MoistForest, WetForest, RainForest,
    Ice, Sea
};

// Bit flags so overall summaries can combine several biomes.
enum class BiomeType : std::uint32_t {
    None            = 0,
    Polar           = 1u << 0,
    Tundra          = 1u << 1,
    Alpine          = 1u << 2,
    Subalpine       = 1u << 3,
    LichenWoodland  = 1u << 4,
    ConiferousForest= 1u << 5,
    MixedForest     = 1u << 6,
    Steppe          = 1u << 7,
    ColdDesert      = 1u << 8,
    DeciduousForest = 1u << 9,
    Shrubland       = 1u << 10,
    HotDesert       = 1u << 11,
    Savanna         = 1u << 12,
    MonsoonForest   = 1u << 13,
    RainForest      = 1u << 14,
    Sea             = 1u << 15,
    SeaIce          = 1u << 16
};

inline constexpr BiomeType operator|(BiomeType a, BiomeType b) noexcept {
    return static_cast<BiomeType>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}
inline constexpr BiomeType operator&(BiomeType a, BiomeType b) noexcept {
    return static_cast<BiomeType>(static_cast<std::uint32_t>(a) & static_cast<std::uint32_t>(b));
}
inline constexpr bool hasFlag(BiomeType set, BiomeType flag) noexcept {
    return (set & flag) == flag && flag != BiomeType::None;
}

[[nodiscard]] std::string_view toString(ClimateType t) noexcept;
[[nodiscard]] std::string_view toString(HumidityType t) noexcept;
[[nodiscard]] std::string_view toString(EcologyType t) noexcept;
[[nodiscard]] std::string_view toString(BiomeType t) noexcept;

// Average annual temperature (K) -> climate zone.
[[nodiscard]] ClimateType climateTypeFor(double averageTemperature) noexcept;

// Annual precipitation (mm) -> humidity band.
[[nodiscard]] HumidityType humidityTypeFor(double annualPrecipitation) noexcept;

[[nodiscard]] EcologyType ecologyTypeFor(ClimateType climate, HumidityType humidity) noexcept;
[[nodiscard]] BiomeType   biomeTypeFor(ClimateType climate, HumidityType humidity) noexcept;

struct Classification {
    ClimateType  climate  = ClimateType::Polar;
    HumidityType humidity = HumidityType::Superarid;
    EcologyType  ecology  = EcologyType::Desert;
    BiomeType    biome    = BiomeType::Polar;

    friend bool operator==(const Classification&, const Classification&) = default;
};

// Normalized elevation (elevation / maxElevation) at which cold land turns
// Alpine (Polar) or Subalpine (Subpolar).
inline constexpr double kAlpineElevation = 0.15;

// Land biome; high Polar and Subpolar cells become Alpine and Subalpine.
[[nodiscard]] BiomeType biomeTypeFor(ClimateType climate, HumidityType humidity,
                                     double normalizedElevation) noexcept;

// Ocean cells (hydrosphere present, elevation <= 0) skip the terrestrial
// tables and become Sea, or Ice / SeaIce at or below sea water's freezing point.
// `elevation` is in meters above sea level; a zero `maxElevation` (flat body)
// never counts as high ground.
[[nodiscard]] Classification classifyCell(const TemperatureRange& range,
                                          double annualPrecipitation,
                                          double elevation,
                                          double maxElevation,
                                          bool hasHydrosphere) noexcept;

// Part of the year (proportions in [0, 1]) during which something is present.
// start > end wraps through the year boundary.
struct SeasonalRange {
    double start = 0.0;
    double end = 0.0;

    [[nodiscard]] bool isNever() const noexcept { return start == end; }
    [[nodiscard]] bool isAllYear() const noexcept { return start == 0.0 && end == 1.0; }

    friend bool operator==(const SeasonalRange&, const SeasonalRange&) = default;
};

// Sea ice on ocean cells.
[[nodiscard]] SeasonalRange seaIceRange(const TemperatureRange& range, double latitude,
                                        double elevation, bool hasHydrosphere) noexcept;

// Snow cover on land cells that receive snow.
[[nodiscard]] SeasonalRange snowCoverRange(const TemperatureRange& range, double latitude,
                                           double elevation, HumidityType humidity,
                                           bool hasHydrosphere) noexcept;

} // namespace geosphere::worldgen
