#include "Log.h"

#include <cctype>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace aquarium::core {

namespace {

constexpr const char* kLoggerName = "aquarium";

// Common default logger configuration.
void configure_default_logger(const std::shared_ptr<spdlog::logger>& logger, spdlog::level::level_enum level) {
  spdlog::set_default_logger(logger);
  spdlog::set_level(level);
  spdlog::flush_on(spdlog::level::warn);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

bool equals_i(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

} // namespace

std::shared_ptr<spdlog::logger> InitLogging(const LogOptions& opts) {
  std::vector<spdlog::sink_ptr> sinks;

  if (opts.console) sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!opts.file.empty()) {
    if (opts.file.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(opts.file.parent_path(), ec);
      // On failure the sink constructor below reports the real error.
    }
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.file.string(), true));
    } catch (const spdlog::spdlog_ex& ex) {
      if (sinks.empty()) throw;
      spdlog::drop(kLoggerName);
      auto fallback = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
      configure_default_logger(fallback, opts.level);
      spdlog::warn("Could not open log file {}: {}", opts.file.string(), ex.what());
      return fallback;
    }
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  configure_default_logger(logger, opts.level);
  return logger;
}

void ShutdownLogging() {
  if (auto logger = spdlog::get(kLoggerName)) logger->flush();
  spdlog::shutdown();
}

bool ParseLogLevel(std::string_view text, spdlog::level::level_enum& out) noexcept {
  static constexpr std::pair<std::string_view, spdlog::level::level_enum> kLevels[] = {
      {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
      {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
      {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
      {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
  };

  for (const auto& [name, level] : kLevels) {
    if (equals_i(text, name)) {
      out = level;
      return true;
    }
  }
  return false;
}

} // namespace aquarium::core
