// tests/test_log_levels.cpp
#include <doctest/doctest.h>

#include "logging/Log.h"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

TEST_CASE("logsys: level names parse")
{
    spdlog::level::level_enum lvl = spdlog::level::info;

    CHECK(geosphere::logsys::parse_level("debug", lvl));
    CHECK(lvl == spdlog::level::debug);

    CHECK(geosphere::logsys::parse_level("off", lvl));
    CHECK(lvl == spdlog::level::off);
}

TEST_CASE("logsys: unknown level names are rejected and leave the level alone")
{
    spdlog::level::level_enum lvl = spdlog::level::warn;
    CHECK_FALSE(geosphere::logsys::parse_level("chatty", lvl));
    CHECK(lvl == spdlog::level::warn);
}

TEST_CASE("logsys: a log directory that cannot be created leaves console logging")
{
    std::error_code ec;
    const fs::path dir = fs::temp_directory_path(ec) / ("geosphere_tests_" + std::to_string(::getpid()) + "_log");
    fs::create_directories(dir, ec);

    // A regular file where the log directory should go.
    const fs::path blocker = dir / "blocker";
    std::ofstream(blocker) << "not a directory";

    const auto previous = spdlog::default_logger();

    geosphere::logsys::LogOptions options;
    options.file = (blocker / "logs" / "geosphere.log").string();
    options.level = spdlog::level::off;
    CHECK_NOTHROW(geosphere::logsys::init(options));

    const auto logger = geosphere::logsys::get();
    REQUIRE(logger != nullptr);
    CHECK(logger->name() == "geosphere");
    CHECK(logger->sinks().size() == 1);
    CHECK_FALSE(fs::exists(options.file));

    spdlog::set_default_logger(previous);
    fs::remove_all(dir, ec);
}
