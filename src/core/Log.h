// src/core/Log.h
#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/common.h>

namespace spdlog { class logger; }

namespace aquarium::core {

struct LogOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::filesystem::path     file;            // empty = console only
    bool                      console = true;
};

// Builds the "aquarium" logger and installs it as spdlog's default.
std::shared_ptr<spdlog::logger> InitLogging(const LogOptions& opts);
void ShutdownLogging();

// Accepts trace|debug|info|warn|warning|error|critical|off (case-insensitive).
bool ParseLogLevel(std::string_view text, spdlog::level::level_enum& out) noexcept;

} // namespace aquarium::core
