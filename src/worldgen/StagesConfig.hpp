#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "worldgen/GeneratorSettings.hpp"  // SurfaceMapRequest
#include "worldgen/Planet.hpp"             // PlanetParams

namespace geosphere::worldgen {

// Matches the [logging] section.
struct LoggingParams {
    std::string level = "info";
    std::string file;             // empty: console only
};

// Aggregate runtime config loaded from JSON. Angles in the file are degrees;
// everything here is radians and SI units.
struct GeneratorConfig {
    PlanetParams      planet{};
    SurfaceMapRequest map{};
    LoggingParams     logging{};
};

class StagesConfig {
public:
    // Load or throw: std::runtime_error on I/O or parse failure,
    // std::invalid_argument on a value of the wrong type or an unknown tag.
    static GeneratorConfig load(const std::string& path);

    // Load but never throw; returns false (and leaves `out` untouched) on any failure.
    static bool try_load(const std::string& path, GeneratorConfig& out);

    // Sections missing from `root` keep their defaults.
    static GeneratorConfig from_json(const nlohmann::json& root);

    // assets/config/geosphere.json, relative to the working directory.
    static std::string default_path();
};

} // namespace geosphere::worldgen
