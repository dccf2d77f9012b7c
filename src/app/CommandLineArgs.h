#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geosphere::app {

// Parsed command-line arguments for the geosphere tool.
//
// Notes:
//   - All option names are case-insensitive.
//   - "--opt=value", "--opt:value" and "--opt value" are all accepted.
//   - Values given here override the config file.
struct CommandLineArgs
{
    bool showHelp = false;                 // --help / -h / -?
    bool verbose = false;                  // --verbose / -v (debug logging)

    std::optional<std::string> configPath; // --config <file.json>
    std::optional<std::string> outPath;    // --out <maps.json>
    std::optional<std::string> planetOut;  // --planet-out <planet.json>
    std::optional<std::string> logFile;    // --log <file>

    std::optional<std::uint64_t> seed;     // --seed <n>
    std::optional<int> resolution;         // --resolution <rows>
    std::optional<int> seasons;            // --seasons <n>
    std::optional<bool> equalArea;         // --equal-area / --equirectangular
    std::optional<bool> hydrology;         // --hydrology / --no-hydrology

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

// argv[0] (the program name) is skipped in both forms.
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace geosphere::app
