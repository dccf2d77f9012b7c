#pragma once

#include "app/CommandLineArgs.h"

namespace geosphere::app {

// Runs the generator for already-parsed arguments: config + overrides ->
// Planet -> SurfaceMaps -> JSON. Returns the process exit code
// (0 ok, 1 generation or I/O failure, 2 bad command line or config).
// The log is flushed before any return once logging has started.
[[nodiscard]] int RunGeneratorTool(const CommandLineArgs& args);

} // namespace geosphere::app
