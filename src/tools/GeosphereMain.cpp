// src/tools/GeosphereMain.cpp
//
// Command-line front end for the geosphere generator.

#include "app/CommandLineArgs.h"
#include "app/GeneratorTool.h"

#include <spdlog/spdlog.h>

int main(int argc, char** argv)
{
    const auto args = geosphere::app::ParseCommandLineArgs(argc, argv);
    const int code = geosphere::app::RunGeneratorTool(args);

    // Single exit point: every code path ends with the sinks flushed and closed.
    spdlog::shutdown();
    return code;
}
