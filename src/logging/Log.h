#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace geosphere::logsys {

struct LogOptions {
    std::string file;                              // empty: console only
    spdlog::level::level_enum level = spdlog::level::info;
    bool console = true;
};

// Installs "geosphere" as the default logger. A file that cannot be opened
// is skipped with a warning; the console sink still works.
void init(const LogOptions& options);
std::shared_ptr<spdlog::logger> get();             // "geosphere"; nullptr before init

// "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off"
[[nodiscard]] bool parse_level(const std::string& name, spdlog::level::level_enum& out);

} // namespace geosphere::logsys
