#include "app/CommandLineArgs.h"

#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace aquarium::app {

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

// Matches "--opt=value" / "--opt:value" against the lowered arg and returns the
// value sliced from the original spelling.
[[nodiscard]] bool ConsumeValue(std::string_view lowered,
                                std::string_view raw,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(lowered, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (lowered.size() == n)
        return false;

    const char sep = lowered[n];
    if (sep != '=' && sep != ':')
        return false;

    outValue = raw.substr(n + 1);
    return true;
}

template <class T>
[[nodiscard]] std::optional<T> ParseNumber(std::string_view s)
{
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    if (s.empty())
        return std::nullopt;

    T v{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv)
{
    CommandLineArgs out;

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        std::string_view value;

        // "--opt value": the value token is consumed only when it parses.
        const auto takeNext = [&](auto& dst, auto parse) {
            if (i + 1 >= argv.size()) {
                addUnknown(raw);
                return;
            }
            auto parsed = parse(argv[i + 1]);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = std::move(*parsed);
            ++i;
        };

        const auto parseValueInto = [&](auto& dst, auto parse, std::string_view v) {
            auto parsed = parse(v);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = std::move(*parsed);
        };

        const auto asU64 = [](std::string_view s) { return ParseNumber<std::uint64_t>(s); };
        const auto asInt = [](std::string_view s) { return ParseNumber<int>(s); };
        const auto asText = [](std::string_view s) -> std::optional<std::string> {
            if (s.empty())
                return std::nullopt;
            return std::string(s);
        };

        if (arg == "--seed") { takeNext(out.seed, asU64); continue; }
        if (ConsumeValue(arg, raw, "--seed", value)) { parseValueInto(out.seed, asU64, value); continue; }

        if (arg == "--rounds" || arg == "-r") { takeNext(out.rounds, asInt); continue; }
        if (ConsumeValue(arg, raw, "--rounds", value)) { parseValueInto(out.rounds, asInt, value); continue; }

        if (arg == "--config" || arg == "-c") { takeNext(out.configPath, asText); continue; }
        if (ConsumeValue(arg, raw, "--config", value)) { parseValueInto(out.configPath, asText, value); continue; }

        if (arg == "--catalog") { takeNext(out.catalogPath, asText); continue; }
        if (ConsumeValue(arg, raw, "--catalog", value)) { parseValueInto(out.catalogPath, asText, value); continue; }

        if (arg == "--log-level") { takeNext(out.logLevel, asText); continue; }
        if (ConsumeValue(arg, raw, "--log-level", value)) { parseValueInto(out.logLevel, asText, value); continue; }

        if (arg == "--log-file") { takeNext(out.logFile, asText); continue; }
        if (ConsumeValue(arg, raw, "--log-file", value)) { parseValueInto(out.logFile, asText, value); continue; }

        if (arg == "--json-out") { takeNext(out.jsonOut, asText); continue; }
        if (ConsumeValue(arg, raw, "--json-out", value)) { parseValueInto(out.jsonOut, asText, value); continue; }

        // Anything else is unknown.
        addUnknown(raw);
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
    oss << "aquarium_duel - headless aquarium autobattler match\n\n";
    oss << "Match\n";
    oss << "  --seed <n>                Random seed (default from config, else 1)\n";
    oss << "  --rounds <n>              Number of rounds to play\n";
    oss << "  --catalog <path>          Piece catalog JSON (default: built-in catalog)\n\n";

    oss << "Files / logging\n";
    oss << "  --config <path>           INI config file (key=value)\n";
    oss << "  --log-level <level>       trace|debug|info|warn|error|critical|off\n";
    oss << "  --log-file <path>         Log file (truncated on start)\n";
    oss << "  --json-out <path>         Write every battle log as JSON\n\n";

    oss << "Misc\n";
    oss << "  --help, -h                Show this help\n\n";

    oss << "Examples\n";
    oss << "  aquarium_duel --seed 42 --rounds 12\n";
    oss << "  aquarium_duel --config duel.ini --json-out battles.json\n";
    return oss.str();
}

} // namespace aquarium::app
