// -----------------------------------------------------------------------------
// src/worldgen/Biomes.cpp
// -----------------------------------------------------------------------------
#include "worldgen/Biomes.hpp"
#include "worldgen/Math.hpp"
#include "worldgen/PhysicalConstants.hpp"


namespace geosphere::worldgen {

std::string_view toString(ClimateType t) noexcept
{
    switch (t) {
        case ClimateType::Polar:         return "Polar";
        case ClimateType::Subpolar:      return "Subpolar";
        case ClimateType::Boreal:        return "Boreal";
        case ClimateType::CoolTemperate: return "CoolTemperate";
        case ClimateType::WarmTemperate: return "WarmTemperate";
        case ClimateType::Subtropical:   return "Subtropical";
        case ClimateType::Tropical:      return "Tropical";
        case ClimateType::Supertropical: return "Supertropical";
    }
    return "Unknown";
}

std::string_view toString(HumidityType t) noexcept
{
    switch (t) {
        case HumidityType::Superarid:  return "Superarid";
        case HumidityType::Perarid:    return "Perarid";
        case HumidityType::Arid:       return "Arid";
        case HumidityType::Semiarid:   return "Semiarid";
        case HumidityType::Subhumid:   return "Subhumid";
        case HumidityType::Humid:      return "Humid";
        case HumidityType::Perhumid:   return "Perhumid";
        case HumidityType::Superhumid: return "Superhumid";
    }
    return "Unknown";
}

std::string_view toString(EcologyType t) noexcept
{
    switch (t) {
        case EcologyType::Desert:        return "Desert";
        case EcologyType::DryTundra:     return "DryTundra";
        case EcologyType::MoistTundra:   return "MoistTundra";
        case EcologyType::WetTundra:     return "WetTundra";
        case EcologyType::RainTundra:    return "RainTundra";
        case EcologyType::DesertScrub:   return "DesertScrub";
        case EcologyType::DryScrub:      return "DryScrub";
        case EcologyType::Steppe:        return "Steppe";
        case EcologyType::ThornScrub:    return "ThornScrub";
        case EcologyType::ThornWoodland: return "ThornWoodland";
        case EcologyType::VeryDryForest: return "VeryDryForest";
        case EcologyType::DryForest:     return "DryForest";
        case EcologyType::MoistForest:   return "MoistForest";
        case EcologyType::WetForest:     return "WetForest";
        case EcologyType::RainForest:    return "RainForest";
        case EcologyType::Ice:           return "Ice";
        case EcologyType::Sea:           return "Sea";
    }
    return "Unknown";
}

std::string_view toString(BiomeType t) noexcept
{
    switch (t) {
        case BiomeType::None:             return "None";
        case BiomeType::Polar:            return "Polar";
        case BiomeType::Tundra:           return "Tundra";
        case BiomeType::Alpine:           return "Alpine";
        case BiomeType::Subalpine:        return "Subalpine";
        case BiomeType::LichenWoodland:   return "LichenWoodland";
        case BiomeType::ConiferousForest: return "ConiferousForest";
        case BiomeType::MixedForest:      return "MixedForest";
        case BiomeType::Steppe:           return "Steppe";
        case BiomeType::ColdDesert:       return "ColdDesert";
        case BiomeType::DeciduousForest:  return "DeciduousForest";
        case BiomeType::Shrubland:        return "Shrubland";
        case BiomeType::HotDesert:        return "HotDesert";
        case BiomeType::Savanna:          return "Savanna";
        case BiomeType::MonsoonForest:    return "MonsoonForest";
        case BiomeType::RainForest:       return "RainForest";
        case BiomeType::Sea:              return "Sea";
        case BiomeType::SeaIce:           return "SeaIce";
    }
    return "Mixed";
}

ClimateType climateTypeFor(double averageTemperature) noexcept
{
    const double t = averageTemperature - phys::kWaterMeltingPoint;
    if (t <= 1.5)  return ClimateType::Polar;
    if (t <= 3.0)  return ClimateType::Subpolar;
    if (t <= 6.0)  return ClimateType::Boreal;
    if (t <= 12.0) return ClimateType::CoolTemperate;
    if (t <= 18.0) return ClimateType::WarmTemperate;
    if (t <= 24.0) return ClimateType::Subtropical;
    if (t <= 68.0) return ClimateType::Tropical;
    return ClimateType::Supertropical;
}

HumidityType humidityTypeFor(double annualPrecipitation) noexcept
{
    const double p = annualPrecipitation;
    if (p < 125.0)  return HumidityType::Superarid;
    if (p < 250.0)  return HumidityType::Perarid;
    if (p < 500.0)  return HumidityType::Arid;
    if (p < 1000.0) return HumidityType::Semiarid;
    if (p < 2000.0) return HumidityType::Subhumid;
    if (p < 4000.0) return HumidityType::Humid;
    if (p < 8000.0) return HumidityType::Perhumid;
    return HumidityType::Superhumid;
}

EcologyType ecologyTypeFor(ClimateType climate, HumidityType humidity) noexcept
{
    using H = HumidityType;
    using E = EcologyType;
    switch (climate) {
        case ClimateType::Polar:
            return humidity <= H::Perarid ? E::Desert : E::Ice;
        case ClimateType::Subpolar:
            switch (humidity) {
                case H::Superarid: return E::DryTundra;
                case H::Perarid:   return E::MoistTundra;
                case H::Arid:      return E::WetTundra;
                default:           return E::RainTundra;
            }
        case ClimateType::Boreal:
            switch (humidity) {
                case H::Superarid: return E::Desert;
                case H::Perarid:   return E::DryScrub;
                case H::Arid:      return E::MoistForest;
                case H::Semiarid:  return E::WetForest;
                default:           return E::RainForest;
            }
        case ClimateType::CoolTemperate:
            switch (humidity) {
                case H::Superarid: return E::Desert;
                case H::Perarid:   return E::DesertScrub;
                case H::Arid:      return E::Steppe;
                case H::Semiarid:  return E::MoistForest;
                case H::Subhumid:  return E::WetForest;
                default:           return E::RainForest;
            }
        case ClimateType::WarmTemperate:
            switch (humidity) {
                case H::Superarid: return E::Desert;
                case H::Perarid:   return E::DesertScrub;
                case H::Arid:      return E::ThornScrub;
                case H::Semiarid:  return E::DryForest;
                case H::Subhumid:  return E::MoistForest;
                case H::Humid:     return E::WetForest;
                default:           return E::RainForest;
            }
        case ClimateType::Subtropical:
            switch (humidity) {
                case H::Superarid: return E::Desert;
                case H::Perarid:   return E::DesertScrub;
                case H::Arid:      return E::ThornWoodland;
                case H::Semiarid:  return E::DryForest;
                case H::Subhumid:  return E::MoistForest;
                case H::Humid:     return E::WetForest;
                default:           return E::RainForest;
            }
        case ClimateType::Tropical:
            switch (humidity) {
                case H::Superarid: return E::Desert;
                case H::Perarid:   return E::DesertScrub;
                case H::Arid:      return E::ThornWoodland;
                case H::Semiarid:  return E::VeryDryForest;
                case H::Subhumid:  return E::DryForest;
                case H::Humid:     return E::MoistForest;
                case H::Perhumid:  return E::WetForest;
                default:           return E::RainForest;
            }
        case ClimateType::Supertropical:
            break;
    }
    return E::Desert;
}

BiomeType biomeTypeFor(ClimateType climate, HumidityType humidity) noexcept
{
    using H = HumidityType;
    using B = BiomeType;
    switch (climate) {
        case ClimateType::Polar:
            return B::Polar;
        case ClimateType::Subpolar:
            return B::Tundra;
        case ClimateType::Boreal:
            return humidity <= H::Arid ? B::LichenWoodland : B::ConiferousForest;
        case ClimateType::CoolTemperate:
            if (humidity <= H::Perarid) return B::ColdDesert;
            if (humidity == H::Arid)    return B::Steppe;
            return B::MixedForest;
        case ClimateType::WarmTemperate:
            if (humidity <= H::Perarid)  return B::HotDesert;
            if (humidity <= H::Semiarid) return B::Shrubland;
            return B::DeciduousForest;
        case ClimateType::Subtropical:
            if (humidity <= H::Perarid)  return B::HotDesert;
            if (humidity == H::Arid)     return B::Savanna;
            if (humidity <= H::Subhumid) return B::MonsoonForest;
            return B::RainForest;
        case ClimateType::Tropical:
            if (humidity <= H::Perarid)  return B::HotDesert;
            if (humidity <= H::Semiarid) return B::Savanna;
            if (humidity == H::Subhumid) return B::MonsoonForest;
            return B::RainForest;
        case ClimateType::Supertropical:
            break;
    }
    return B::HotDesert;
}

BiomeType biomeTypeFor(ClimateType climate, HumidityType humidity, double normalizedElevation) noexcept
{
    if (normalizedElevation >= kAlpineElevation) {
        if (climate == ClimateType::Polar)    return BiomeType::Alpine;
        if (climate == ClimateType::Subpolar) return BiomeType::Subalpine;
    }
    return biomeTypeFor(climate, humidity);
}

Classification classifyCell(const TemperatureRange& range,
                            double annualPrecipitation,
                            double elevation,
                            double maxElevation,
                            bool hasHydrosphere) noexcept
{
    Classification c;
    c.climate = climateTypeFor(range.average);
    c.humidity = humidityTypeFor(annualPrecipitation);

    if (hasHydrosphere && elevation <= 0.0) {
        const bool frozen = range.average <= phys::kSeaWaterFreezingPoint;
        c.ecology = frozen ? EcologyType::Ice : EcologyType::Sea;
        c.biome = frozen ? BiomeType::SeaIce : BiomeType::Sea;
        return c;
    }

    const double normalized = nearlyZero(maxElevation) ? 0.0 : elevation / maxElevation;
    c.ecology = ecologyTypeFor(c.climate, c.humidity);
    c.biome = biomeTypeFor(c.climate, c.humidity, normalized);
    return c;
}

namespace {

// Freeze window for a point that crosses `freezing` during the year.
SeasonalRange freezeWindow(const TemperatureRange& range, double latitude, double freezing) noexcept
{
    if (range.max < freezing)
        return {0.0, 1.0};

    const double proportion = inverseLerp(range.min, range.max, freezing) * 0.8 - 0.1;
    if (!(proportion > 0.0))
        return {};

    double start = 1.0 - proportion / 4.0;
    double end = proportion * 3.0 / 4.0;
    if (latitude < 0.0) {
        start += 0.5;
        if (start > 1.0) start -= 1.0;
        end += 0.5;
        if (end > 1.0) end -= 1.0;
    }
    return {start, end};
}

} // namespace

SeasonalRange seaIceRange(const TemperatureRange& range, double latitude,
                          double elevation, bool hasHydrosphere) noexcept
{
    if (!hasHydrosphere || elevation > 0.0 || range.min >= phys::kSeaWaterFreezingPoint)
        return {};
    return freezeWindow(range, latitude, phys::kSeaWaterFreezingPoint);
}

SeasonalRange snowCoverRange(const TemperatureRange& range, double latitude,
                             double elevation, HumidityType humidity,
                             bool hasHydrosphere) noexcept
{
    const bool land = !hasHydrosphere || elevation > 0.0;
    if (!land || humidity <= HumidityType::Perarid || range.min > phys::kWaterMeltingPoint)
        return {};
    return freezeWindow(range, latitude, phys::kWaterMeltingPoint);
}

} // namespace geosphere::worldgen
