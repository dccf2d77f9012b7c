// src/worldgen/StagesApi.hpp
#pragma once
#include <cstdint>
#include <memory>

namespace geosphere::worldgen {

// Keep this scoped enum stable; values are logged and name passes in errors.
enum class StageId : std::uint32_t {
    Elevation      = 1,
    Temperature    = 2,
    Precipitation  = 3,
    Snowfall       = 4,
    Aggregate      = 5,
    Classification = 6,
    Hydrology      = 7
};

struct StageContext; // forward declare (definition in StageContext.hpp)

// Polymorphic interface for all surface-map passes.
struct IWorldGenStage {
    virtual ~IWorldGenStage() = default;

    virtual StageId     id()   const noexcept = 0;
    virtual const char* name() const noexcept = 0;
    virtual void        generate(StageContext& ctx) = 0;
};

// Owning pointer for stages.
using StagePtr = std::unique_ptr<IWorldGenStage>;

} // namespace geosphere::worldgen
