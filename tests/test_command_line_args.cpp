// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.{h,cpp}.
//
// Goals:
//   - Options are case-insensitive, values keep their case
//   - "--opt value", "--opt=value" and "--opt:value" are all supported
//   - Unknown options and bad values are reported in a predictable order

#include <doctest/doctest.h>

#include "app/CommandLineArgs.h"

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] geosphere::app::CommandLineArgs Parse(std::initializer_list<std::string_view> argv)
{
    return geosphere::app::ParseCommandLineArgsFromArgv(std::vector<std::string_view>(argv));
}

} // namespace

TEST_CASE("CommandLineArgs parses basic flags (case-insensitive)")
{
    const auto args = Parse({"geosphere", "--VERBOSE", "--Equal-Area", "--NO-HYDROLOGY"});

    CHECK(args.verbose);
    REQUIRE(args.equalArea.has_value());
    CHECK(*args.equalArea);
    REQUIRE(args.hydrology.has_value());
    CHECK_FALSE(*args.hydrology);
    CHECK(args.unknown.empty());
    CHECK_FALSE(args.showHelp);
}

TEST_CASE("CommandLineArgs leaves unset options empty")
{
    const auto args = Parse({"geosphere"});
    CHECK_FALSE(args.seed.has_value());
    CHECK_FALSE(args.resolution.has_value());
    CHECK_FALSE(args.configPath.has_value());
    CHECK_FALSE(args.equalArea.has_value());
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs supports --opt value, --opt=value and --opt:value")
{
    const auto args = Parse({
        "geosphere",
        "--seed", "18446744073709551615",
        "--resolution=180",
        "--seasons:6",
    });

    REQUIRE(args.seed.has_value());
    CHECK(*args.seed == 18446744073709551615ull);
    REQUIRE(args.resolution.has_value());
    CHECK(*args.resolution == 180);
    REQUIRE(args.seasons.has_value());
    CHECK(*args.seasons == 6);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs keeps the case of path values")
{
    const auto args = Parse({
        "geosphere",
        "--CONFIG=Configs/Mars.json",
        "--out", "Out/Maps.JSON",
        "--planet-out:Out/Planet.json",
        "--log", "Logs/Run.log",
    });

    CHECK(args.configPath.value_or("") == "Configs/Mars.json");
    CHECK(args.outPath.value_or("") == "Out/Maps.JSON");
    CHECK(args.planetOut.value_or("") == "Out/Planet.json");
    CHECK(args.logFile.value_or("") == "Logs/Run.log");
}

TEST_CASE("CommandLineArgs help aliases")
{
    CHECK(Parse({"geosphere", "--help"}).showHelp);
    CHECK(Parse({"geosphere", "-H"}).showHelp);
    CHECK(Parse({"geosphere", "-?"}).showHelp);
}

TEST_CASE("CommandLineArgs reports unknown args and bad values in order")
{
    const auto args = Parse({
        "geosphere",
        "--bogus",
        "--resolution", "lots",
        "--seed=-3",
        "--seasons",
    });

    REQUIRE(args.unknown.size() == 4);
    CHECK(args.unknown[0] == "--bogus");
    CHECK(args.unknown[1] == "--resolution");
    CHECK(args.unknown[2] == "--seed=-3");
    CHECK(args.unknown[3] == "--seasons");
    CHECK_FALSE(args.resolution.has_value());
    CHECK_FALSE(args.seed.has_value());
}

TEST_CASE("CommandLineArgs later values override earlier ones")
{
    const auto args = Parse({"geosphere", "--equal-area", "--equirectangular", "--seed", "1", "--seed=2"});
    REQUIRE(args.equalArea.has_value());
    CHECK_FALSE(*args.equalArea);
    CHECK(args.seed.value_or(0) == 2);
}

TEST_CASE("CommandLineArgs help text lists every option")
{
    const std::string help = geosphere::app::BuildCommandLineHelpText();
    for (const char* opt : {"--config", "--seed", "--resolution", "--seasons", "--equal-area",
                            "--no-hydrology", "--out", "--planet-out", "--log", "--verbose", "--help"})
        CHECK_MESSAGE(help.find(opt) != std::string::npos, opt);
}
