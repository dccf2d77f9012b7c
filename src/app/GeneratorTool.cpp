// src/app/GeneratorTool.cpp
#include "app/GeneratorTool.h"

#include "geosphere/save/SurfaceMapsSave.hpp"
#include "logging/Log.h"
#include "worldgen/Planet.hpp"
#include "worldgen/StagesConfig.hpp"
#include "worldgen/WorldGen.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace geosphere::app {

namespace
{
    bool LoadConfig(const CommandLineArgs& args, worldgen::GeneratorConfig& cfg)
    {
        if (args.configPath) {
            try {
                cfg = worldgen::StagesConfig::load(*args.configPath);
            } catch (const std::exception& e) {
                std::fprintf(stderr, "geosphere: %s\n", e.what());
                return false;
            }
            return true;
        }

        // The default config is optional; built-in defaults apply without it.
        const std::string path = worldgen::StagesConfig::default_path();
        std::error_code ec;
        if (std::filesystem::exists(path, ec) && !worldgen::StagesConfig::try_load(path, cfg))
            return false;
        return true;
    }

    void ApplyOverrides(const CommandLineArgs& args, worldgen::GeneratorConfig& cfg)
    {
        if (args.seed)       cfg.planet.seed = *args.seed;
        if (args.resolution) cfg.map.resolution = *args.resolution;
        if (args.seasons)    cfg.map.seasons = *args.seasons;
        if (args.equalArea)  cfg.map.projection.equalArea = *args.equalArea;
        if (args.hydrology)  cfg.map.computeHydrology = *args.hydrology;
        if (args.logFile)    cfg.logging.file = *args.logFile;
        if (args.verbose)    cfg.logging.level = "debug";
    }

    void LogSummary(const worldgen::SurfaceMaps& maps)
    {
        const auto cells = static_cast<double>(maps.width) * static_cast<double>(maps.height);
        spdlog::info("map {}x{}, {} season(s), land {:.1f}% of cells",
                     maps.width, maps.height, maps.seasonCount(),
                     cells > 0.0 ? 100.0 * maps.landCellCount / cells : 0.0);
        spdlog::info("temperature min {:.1f} K, avg {:.1f} K, max {:.1f} K",
                     maps.overallTemperature.min, maps.overallTemperature.average,
                     maps.overallTemperature.max);
        spdlog::info("precipitation avg {:.0f} mm/yr, climate {}, humidity {}, ecology {}",
                     maps.precipitation.average,
                     worldgen::toString(maps.overallClimate),
                     worldgen::toString(maps.overallHumidity),
                     worldgen::toString(maps.overallEcology));
    }

    int Generate(const CommandLineArgs& args, const worldgen::GeneratorConfig& cfg)
    {
        try {
            const worldgen::Planet planet = worldgen::Planet::create(cfg.planet);
            spdlog::info("planet: {} seed {}, radius {:.0f} m, max elevation {:.0f} m",
                         worldgen::toString(planet.kind()), planet.seed(), planet.radius(),
                         planet.maxElevation());

            const worldgen::SurfaceMapGenerator generator(cfg.map);
            const worldgen::SurfaceMaps maps = generator.generate(planet);
            LogSummary(maps);

            if (args.planetOut) {
                if (auto r = save::SavePlanet(planet, *args.planetOut); !r) {
                    spdlog::error("save planet: {}", r.error().message);
                    return 1;
                }
            }
            if (args.outPath) {
                if (auto r = save::SaveSurfaceMaps(maps, *args.outPath); !r) {
                    spdlog::error("save maps: {}", r.error().message);
                    return 1;
                }
            }
        } catch (const std::invalid_argument& e) {
            spdlog::error("invalid parameters: {}", e.what());
            return 2;
        } catch (const worldgen::StageError& e) {
            // Already logged by the generator with its context.
            spdlog::debug("aborting after {} pass failure", e.stageName());
            return 1;
        } catch (const std::exception& e) {
            spdlog::error("{}", e.what());
            return 1;
        }

        return 0;
    }
} // namespace

int RunGeneratorTool(const CommandLineArgs& args)
{
    if (args.showHelp) {
        std::fputs(BuildCommandLineHelpText().c_str(), stdout);
        return 0;
    }
    if (!args.unknown.empty()) {
        for (const auto& u : args.unknown)
            std::fprintf(stderr, "geosphere: unrecognised or malformed argument '%s'\n", u.c_str());
        std::fputs("Run with --help for usage.\n", stderr);
        return 2;
    }

    worldgen::GeneratorConfig cfg{};
    if (!LoadConfig(args, cfg))
        return 2;
    ApplyOverrides(args, cfg);

    logsys::LogOptions logOptions{};
    logOptions.file = cfg.logging.file;
    if (!logsys::parse_level(cfg.logging.level, logOptions.level)) {
        std::fprintf(stderr, "geosphere: unknown log level '%s'\n", cfg.logging.level.c_str());
        return 2;
    }
    logsys::init(logOptions);

    const int code = Generate(args, cfg);
    if (auto logger = logsys::get())
        logger->flush();
    return code;
}

} // namespace geosphere::app
