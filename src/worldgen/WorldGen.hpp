#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "worldgen/GeneratorSettings.hpp"
#include "worldgen/StageContext.hpp"
#include "worldgen/StagesApi.hpp"
#include "worldgen/SurfaceMaps.hpp"

namespace geosphere::worldgen {

class Planet;
class HadleyCache;

// A pass failed. Carries enough of the run to reproduce it.
class StageError : public std::runtime_error {
public:
    StageError(StageId stage, std::string stageName, int resolution, int seasons,
               std::uint64_t seed, const std::string& cause);

    [[nodiscard]] StageId stage() const noexcept { return stage_; }
    [[nodiscard]] const std::string& stageName() const noexcept { return stageName_; }
    [[nodiscard]] int resolution() const noexcept { return resolution_; }
    [[nodiscard]] int seasons() const noexcept { return seasons_; }
    [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

private:
    StageId       stage_;
    std::string   stageName_;
    int           resolution_ = 0;
    int           seasons_ = 0;
    std::uint64_t seed_ = 0;
};

// Throws std::invalid_argument when `request` cannot run on `planet`.
void validateRequest(const Planet& planet, const SurfaceMapRequest& request);

class SurfaceMapGenerator {
public:
    explicit SurfaceMapGenerator(SurfaceMapRequest request);

    // Register/override stages (call before generating)
    void clearStages();
    void addStage(StagePtr stage); // appended in order

    // Synchronous generation (pure & deterministic). Uses a fresh Hadley cache.
    [[nodiscard]] SurfaceMaps generate(const Planet& planet) const;

    // Same, sharing a caller-owned cache across runs.
    [[nodiscard]] SurfaceMaps generate(const Planet& planet, HadleyCache& cache) const;

    [[nodiscard]] const SurfaceMapRequest& request() const noexcept { return request_; }
    [[nodiscard]] std::size_t stageCount() const noexcept { return stages_.size(); }
    [[nodiscard]] std::vector<StageId> stageOrder() const;

private:
    [[nodiscard]] SurfaceMaps makeEmptyMaps_(const Planet& planet, const MapProjection& projection) const;
    void run_(StageContext& ctx) const;

private:
    SurfaceMapRequest request_;
    std::vector<StagePtr> stages_;
};

// ----- Default stages -----

class ElevationStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Elevation; }
    const char* name() const noexcept override { return "Elevation"; }
    void generate(StageContext& ctx) override;
};

// Winter and summer solstice ranges, then each season's temperature.
class TemperatureStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Temperature; }
    const char* name() const noexcept override { return "Temperature"; }
    void generate(StageContext& ctx) override;
};

// One sub-pass per season, in index order.
class PrecipitationStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Precipitation; }
    const char* name() const noexcept override { return "Precipitation"; }
    void generate(StageContext& ctx) override;
};

class SnowfallStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Snowfall; }
    const char* name() const noexcept override { return "Snowfall"; }
    void generate(StageContext& ctx) override;
};

// Season totals and averages plus the planet-wide summaries.
class AggregateStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Aggregate; }
    const char* name() const noexcept override { return "Aggregate"; }
    void generate(StageContext& ctx) override;
};

class ClassificationStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Classification; }
    const char* name() const noexcept override { return "Classification"; }
    void generate(StageContext& ctx) override;
};

class HydrologyStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Hydrology; }
    const char* name() const noexcept override { return "Hydrology"; }
    void generate(StageContext& ctx) override;
};

} // namespace geosphere::worldgen
