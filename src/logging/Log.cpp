#include "Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace geosphere::logsys {

static std::shared_ptr<spdlog::logger> g_logger;

void init(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    if (options.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    // A log file that cannot be opened leaves the console sink only.
    std::string fileProblem;
    if (!options.file.empty()) {
        const fs::path dir = fs::path(options.file).parent_path();
        std::error_code ec;
        if (!dir.empty())
            fs::create_directories(dir, ec);
        if (ec) {
            fileProblem = "cannot create " + dir.string() + ": " + ec.message();
        } else {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(options.file, 1 << 20, 4)); // 1MB * 4
            } catch (const spdlog::spdlog_ex& e) {
                fileProblem = e.what();
            }
        }
    }

    if (g_logger)
        spdlog::drop(g_logger->name());
    g_logger = std::make_shared<spdlog::logger>("geosphere", sinks.begin(), sinks.end());
    g_logger->set_level(options.level);
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    spdlog::info("Logging started");
    if (!fileProblem.empty())
        spdlog::warn("log file '{}' disabled: {}", options.file, fileProblem);
}

std::shared_ptr<spdlog::logger> get() { return g_logger; }

bool parse_level(const std::string& name, spdlog::level::level_enum& out) {
    const auto lvl = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only accept "off" when asked for.
    if (lvl == spdlog::level::off && name != "off")
        return false;
    out = lvl;
    return true;
}

} // namespace geosphere::logsys
