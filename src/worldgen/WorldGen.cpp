// src/worldgen/WorldGen.cpp
#include "worldgen/WorldGen.hpp"
#include "worldgen/Math.hpp"
#include "worldgen/Planet.hpp"
#include "worldgen/Precipitation.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace geosphere::worldgen {

namespace {

std::string describeRun(std::string_view stage, int resolution, int seasons, std::uint64_t seed)
{
    return "pass " + std::string(stage) + " failed (resolution " + std::to_string(resolution)
         + ", seasons " + std::to_string(seasons) + ", seed " + std::to_string(seed) + ")";
}

} // namespace

StageError::StageError(StageId stage, std::string stageName, int resolution, int seasons,
                       std::uint64_t seed, const std::string& cause)
    : std::runtime_error(describeRun(stageName, resolution, seasons, seed) + ": " + cause),
      stage_(stage), stageName_(std::move(stageName)),
      resolution_(resolution), seasons_(seasons), seed_(seed)
{
}

void validateRequest(const Planet& planet, const SurfaceMapRequest& request)
{
    if (request.resolution <= 0)
        throw std::invalid_argument("SurfaceMapRequest: resolution must be positive, got "
                                    + std::to_string(request.resolution));
    if (request.seasons < 0)
        throw std::invalid_argument("SurfaceMapRequest: seasons must not be negative, got "
                                    + std::to_string(request.seasons));
    if (request.seasons > 0 && !planet.hasAtmosphere())
        throw std::invalid_argument("SurfaceMapRequest: seasonal precipitation requires an atmosphere");
}

// -------------------- SurfaceMapGenerator --------------------

SurfaceMapGenerator::SurfaceMapGenerator(SurfaceMapRequest request) : request_(std::move(request)) {
    // Default pipeline
    stages_.emplace_back(std::make_unique<ElevationStage>());
    stages_.emplace_back(std::make_unique<TemperatureStage>());
    stages_.emplace_back(std::make_unique<PrecipitationStage>());
    stages_.emplace_back(std::make_unique<SnowfallStage>());
    stages_.emplace_back(std::make_unique<AggregateStage>());
    stages_.emplace_back(std::make_unique<ClassificationStage>());
    if (request_.computeHydrology)
        stages_.emplace_back(std::make_unique<HydrologyStage>());
}

void SurfaceMapGenerator::clearStages() { stages_.clear(); }

std::vector<StageId> SurfaceMapGenerator::stageOrder() const
{
    std::vector<StageId> ids;
    ids.reserve(stages_.size());
    for (const auto& stage : stages_)
        ids.push_back(stage->id());
    return ids;
}
void SurfaceMapGenerator::addStage(StagePtr stage) { stages_.emplace_back(std::move(stage)); }

SurfaceMaps SurfaceMapGenerator::makeEmptyMaps_(const Planet& planet, const MapProjection& projection) const {
    const int w = projection.width();
    const int h = projection.height();

    SurfaceMaps m{};
    m.projection = request_.projection;
    m.resolution = request_.resolution;
    m.width = w;
    m.height = h;
    m.seed = planet.seed();
    m.maxElevation = planet.maxElevation();

    m.elevation = Grid2D<float>(w, h, 0.0f);
    m.temperatureRange = Grid2D<TemperatureRange>(w, h);

    const int n = request_.seasons;
    const double winter = planet.winterSolsticeTrueAnomaly();
    m.seasons.resize(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        SeasonMaps& s = m.seasons[static_cast<std::size_t>(i)];
        s.index = i;
        s.proportionOfYear = 1.0 / n;
        s.positionInYear = static_cast<double>(i) / n;
        s.trueAnomaly = normalizeAngle(winter + kTwoPi * (i + 0.5) / n);
        s.temperature = Grid2D<float>(w, h, 0.0f);
        s.precipitation = Grid2D<float>(w, h, 0.0f);
        s.snowfall = Grid2D<float>(w, h, 0.0f);
    }

    m.totalPrecipitation = Grid2D<float>(w, h, 0.0f);
    m.averagePrecipitation = Grid2D<float>(w, h, 0.0f);
    m.totalSnowfall = Grid2D<float>(w, h, 0.0f);

    m.climate = Grid2D<ClimateType>(w, h, ClimateType::Polar);
    m.humidity = Grid2D<HumidityType>(w, h, HumidityType::Superarid);
    m.ecology = Grid2D<EcologyType>(w, h, EcologyType::Desert);
    m.biome = Grid2D<BiomeType>(w, h, BiomeType::None);
    m.seaIce = Grid2D<SeasonalRange>(w, h);
    m.snowCover = Grid2D<SeasonalRange>(w, h);

    if (request_.computeHydrology) {
        m.flow = Grid2D<float>(w, h, 0.0f);
        m.lakeDepth = Grid2D<float>(w, h, 0.0f);
    }
    return m;
}

void SurfaceMapGenerator::run_(StageContext& ctx) const {
    for (const auto& st : stages_) {
        const auto started = std::chrono::steady_clock::now();
        spdlog::debug("worldgen: {} pass started", st->name());
        try {
            st->generate(ctx);
        } catch (const StageError&) {
            throw;
        } catch (const std::exception& e) {
            StageError err(st->id(), st->name(), request_.resolution, request_.seasons,
                           ctx.planet.seed(), e.what());
            spdlog::error("worldgen: {}", err.what());
            throw err;
        }
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        spdlog::debug("worldgen: {} pass finished in {} ms", st->name(), ms);
    }
}

SurfaceMaps SurfaceMapGenerator::generate(const Planet& planet) const {
    HadleyCache cache;
    return generate(planet, cache);
}

SurfaceMaps SurfaceMapGenerator::generate(const Planet& planet, HadleyCache& cache) const {
    validateRequest(planet, request_);
    const MapProjection projection(request_.projection, request_.resolution);

    SurfaceMaps maps = makeEmptyMaps_(planet, projection);
    StageContext ctx{ planet, request_, projection, jobs::JobSystem::Instance(), cache, maps };
    run_(ctx);

    spdlog::info("worldgen: {}x{} surface maps, {} seasons, seed {}: {} land cells, "
                 "temperature {:.1f}..{:.1f} K, precipitation avg {:.0f} mm",
                 maps.width, maps.height, maps.seasonCount(), maps.seed, maps.landCellCount,
                 maps.overallTemperature.min, maps.overallTemperature.max, maps.precipitation.average);
    return maps;
}

} // namespace geosphere::worldgen
