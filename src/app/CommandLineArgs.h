#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace aquarium::app {

// Parsed command-line arguments for aquarium_duel.
//
// Notes:
//   - All option names are case-insensitive (values keep their case).
//   - "--opt value", "--opt=value" and "--opt:value" are all accepted.
//   - Anything given here overrides the config file.
struct CommandLineArgs
{
    bool showHelp = false;                  // --help / -h / -?

    std::optional<std::uint64_t> seed;      // --seed <n>
    std::optional<int> rounds;              // --rounds <n>
    std::optional<std::string> configPath;  // --config <path>
    std::optional<std::string> catalogPath; // --catalog <path>
    std::optional<std::string> logLevel;    // --log-level <level>
    std::optional<std::string> logFile;     // --log-file <path>
    std::optional<std::string> jsonOut;     // --json-out <path>

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace aquarium::app
