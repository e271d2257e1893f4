#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace aquarium::core {

struct Config {
    std::uint64_t seed             = 1;
    int           rounds           = 15;   // battles per match
    int           startingGold     = 10;
    int           goldPerRound     = 5;
    int           baseWaterQuality = 5;
    std::string   catalogPath;          // empty = built-in catalog
    std::string   logLevel         = "info";
    std::string   logFile          = "aquarium.log";
    std::string   battleLogJson;        // empty = no export
};

// Missing file returns false and leaves cfg untouched. Bad values keep their defaults.
bool LoadConfig(Config& cfg, const std::filesystem::path& file);
bool SaveConfig(const Config& cfg, const std::filesystem::path& file);

} // namespace aquarium::core
