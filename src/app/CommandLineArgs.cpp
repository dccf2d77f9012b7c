#include "app/CommandLineArgs.h"

#include <cctype>
#include <charconv>
#include <sstream>
#include <string_view>
#include <type_traits>

namespace geosphere::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Accept either:
//   --opt=value
//   --opt:value
[[nodiscard]] bool ConsumeValue(std::string_view arg,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (arg.size() == n)
        return false;

    const char sep = arg[n];
    if (sep != '=' && sep != ':')
        return false;

    outValue = arg.substr(n + 1);
    return true;
}

template <typename T>
[[nodiscard]] std::optional<T> ParseNumber(std::string_view s)
{
    if (s.empty())
        return std::nullopt;
    if (s[0] == '+')
        s.remove_prefix(1);

    T v{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;
    const int argc = static_cast<int>(argv.size());

    for (int i = 1; i < argc; ++i)
    {
        const std::string raw(argv[static_cast<std::size_t>(i)]);
        if (raw.empty())
            continue;

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        auto addUnknown = [&] { out.unknown.push_back(raw); };

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") { out.showHelp = true; continue; }

        // Simple flags
        if (arg == "--verbose" || arg == "-v") { out.verbose = true; continue; }
        if (arg == "--equal-area") { out.equalArea = true; continue; }
        if (arg == "--equirectangular") { out.equalArea = false; continue; }
        if (arg == "--hydrology") { out.hydrology = true; continue; }
        if (arg == "--no-hydrology") { out.hydrology = false; continue; }

        // Options with values. Paths keep their original case, so values
        // are cut from `raw` at the same offset as in `arg`.
        std::string_view value;

        const auto nextValue = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc)
                return std::nullopt;
            ++i;
            return std::string(argv[static_cast<std::size_t>(i)]);
        };

        const auto inlineValue = [&](std::string_view v) {
            return raw.substr(raw.size() - v.size());
        };

        const auto takeString = [&](std::string_view name, std::optional<std::string>& dst) -> bool {
            if (arg == name) {
                if (auto v = nextValue()) dst = *v; else addUnknown();
                return true;
            }
            if (ConsumeValue(arg, name, value)) {
                if (value.empty()) addUnknown(); else dst = inlineValue(value);
                return true;
            }
            return false;
        };

        const auto takeNumber = [&](std::string_view name, auto& dst) -> bool {
            using T = typename std::remove_reference_t<decltype(dst)>::value_type;
            std::optional<std::string> text;
            if (arg == name) {
                text = nextValue();
            } else if (ConsumeValue(arg, name, value)) {
                text = std::string(value);
            } else {
                return false;
            }
            const auto parsed = text ? ParseNumber<T>(*text) : std::nullopt;
            if (parsed) dst = *parsed; else addUnknown();
            return true;
        };

        if (takeString("--config", out.configPath)) continue;
        if (takeString("--out", out.outPath)) continue;
        if (takeString("--planet-out", out.planetOut)) continue;
        if (takeString("--log", out.logFile)) continue;

        if (takeNumber("--seed", out.seed)) continue;
        if (takeNumber("--resolution", out.resolution)) continue;
        if (takeNumber("--seasons", out.seasons)) continue;

        // Anything else is unknown.
        addUnknown();
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    std::vector<std::string_view> v;
    v.reserve(static_cast<std::size_t>(argc > 0 ? argc : 0));
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "geosphere - procedural planet surface maps\n\n";
    oss << "Input\n";
    oss << "  --config <file>               JSON config (default assets/config/geosphere.json)\n";
    oss << "  --seed <n>                    World seed (overrides the config)\n\n";

    oss << "Map\n";
    oss << "  --resolution <rows>           Map height in cells\n";
    oss << "  --seasons <n>                 Number of seasons (0 = annual maps only)\n";
    oss << "  --equal-area                  Cylindrical equal-area projection\n";
    oss << "  --equirectangular             Equirectangular projection\n";
    oss << "  --hydrology / --no-hydrology  Toggle the drainage pass\n\n";

    oss << "Output\n";
    oss << "  --out <file>                  Write the surface maps as JSON\n";
    oss << "  --planet-out <file>           Write the planet parameters as JSON\n";
    oss << "  --log <file>                  Also log to a rotating file\n";
    oss << "  --verbose, -v                 Debug logging\n\n";

    oss << "Misc\n";
    oss << "  --help, -h                    Show this help\n\n";

    oss << "Examples\n";
    oss << "  geosphere --seed 7 --resolution 180 --out maps.json\n";
    oss << "  geosphere --config mars.json --seasons 0 --no-hydrology\n";
    return oss.str();
}

} // namespace geosphere::app
