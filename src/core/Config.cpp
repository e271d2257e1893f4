#include "Config.h"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>

namespace aquarium::core {

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

template <class T>
static bool ParseNumber(std::string_view sv, T& out) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);

    T v{};
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || begin == end)
        return false;

    out = v;
    return true;
}

// Strip trailing inline comments, e.g. `rounds=10  # per match`.
static void StripInlineComment(std::string& v)
{
    std::size_t cut = std::string::npos;
    auto consider = [&](std::size_t p)
    {
        if (p == std::string::npos) return;
        if (cut == std::string::npos || p < cut) cut = p;
    };

    consider(v.find('#'));
    consider(v.find(';'));
    consider(v.find("//"));

    if (cut != std::string::npos)
    {
        v.erase(cut);
        TrimInPlace(v);
    }
}

static void AssignInt(const std::string& key, const std::string& value, int& field)
{
    int parsed = field;
    if (ParseNumber(value, parsed))
        field = parsed;
    else
        spdlog::warn("LoadConfig: ignoring non-integer value '{}' for {}", value, key);
}

// Tiny INI-style parser: key=value lines
bool LoadConfig(Config& cfg, const std::filesystem::path& file)
{
    std::ifstream f(file, std::ios::binary);
    if (!f) return false;
    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // Tolerate a UTF-8 BOM from Windows editors.
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0)
        text.erase(0, 3);

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line))
    {
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';' || tmp[0] == '[') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);
        StripInlineComment(v);

        if (k.empty()) continue;

        if (k == "seed")
        {
            std::uint64_t parsed = cfg.seed;
            if (ParseNumber(v, parsed))
                cfg.seed = parsed;
            else
                spdlog::warn("LoadConfig: ignoring invalid seed '{}'", v);
        }
        else if (k == "rounds")           AssignInt(k, v, cfg.rounds);
        else if (k == "startingGold")     AssignInt(k, v, cfg.startingGold);
        else if (k == "goldPerRound")     AssignInt(k, v, cfg.goldPerRound);
        else if (k == "baseWaterQuality") AssignInt(k, v, cfg.baseWaterQuality);
        else if (k == "catalogPath")      cfg.catalogPath = v;
        else if (k == "logLevel")         cfg.logLevel = v;
        else if (k == "logFile")          cfg.logFile = v;
        else if (k == "battleLogJson")    cfg.battleLogJson = v;
        else
            spdlog::debug("LoadConfig: unknown key '{}' in {}", k, file.string());
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& file)
{
    if (file.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec)
        {
            spdlog::error("SaveConfig: create_directories failed for {} ({}: {})",
                          file.parent_path().string(), ec.value(), ec.message());
            return false;
        }
    }

    std::ostringstream oss;
    oss << "seed="             << cfg.seed             << "\n";
    oss << "rounds="           << cfg.rounds           << "\n";
    oss << "startingGold="     << cfg.startingGold     << "\n";
    oss << "goldPerRound="     << cfg.goldPerRound     << "\n";
    oss << "baseWaterQuality=" << cfg.baseWaterQuality << "\n";
    oss << "catalogPath="      << cfg.catalogPath      << "\n";
    oss << "logLevel="         << cfg.logLevel         << "\n";
    oss << "logFile="          << cfg.logFile          << "\n";
    oss << "battleLogJson="    << cfg.battleLogJson    << "\n";
    const std::string text = oss.str();

    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

} // namespace aquarium::core
