// src/worldgen/PhysicalConstants.hpp
#pragma once

namespace geosphere::worldgen::phys {

inline constexpr double kStefanBoltzmann        = 5.670374419e-8;  // W m^-2 K^-4
inline constexpr double kGravitationalConstant  = 6.67430e-11;     // m^3 kg^-1 s^-2
inline constexpr double kIdealGasConstant       = 8.314462618;     // J mol^-1 K^-1
inline constexpr double kMolarMassOfAir         = 0.0289644;       // kg mol^-1
inline constexpr double kSpecificHeatDryAir     = 1004.0;          // J kg^-1 K^-1
inline constexpr double kSpecificGasConstantDryAir = 287.058;      // J kg^-1 K^-1
inline constexpr double kHeatOfVaporizationWater = 2501000.0;      // J kg^-1
inline constexpr double kMolarMassRatioVaporDryAir = 0.622;

inline constexpr double kWaterMeltingPoint      = 273.15;          // K
inline constexpr double kSeaWaterFreezingPoint  = 271.35;          // K

inline constexpr double kAstronomicalUnit       = 1.495978707e11;  // m
inline constexpr double kSolarLuminosity        = 3.828e26;        // W

inline constexpr double kEarthRadius            = 6371000.0;       // m
inline constexpr double kEarthMass              = 5.972e24;        // kg
inline constexpr double kEarthRotationalPeriod  = 86164.0905;      // s
inline constexpr double kEarthOrbitalPeriod     = 31558149.8;      // s
inline constexpr double kEarthOrbitalEccentricity = 0.0167086;
inline constexpr double kEarthAxialTilt         = 0.4090926;       // rad
inline constexpr double kEarthAlbedo            = 0.306;
inline constexpr double kEarthSurfacePressure   = 101.325;         // kPa
inline constexpr double kEarthAveragePrecipitation = 990.0;        // mm / year

// Upper pressure bound used to define the top of an atmosphere (kPa).
inline constexpr double kAtmosphereTopPressure  = 5.0e-4;

} // namespace geosphere::worldgen::phys
