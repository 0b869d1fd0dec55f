#pragma once
#include "devpulse/core/config.hpp"

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace devpulse::core {

// One logger per subsystem. The first entry becomes the default logger.
inline constexpr std::array<std::string_view, 4> LoggerNames{
    "server",
    "github",
    "leetcode",
    "game",
};

inline constexpr std::string_view LogPattern =
    "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
inline constexpr std::size_t LogFileBytes = 10 * 1024 * 1024;
inline constexpr std::size_t LogFileCount = 3;

inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> consoleSink() {
  static auto Sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  return Sink;
}

// Console plus {LogDir}/{Name}.log when LogDir is set. A log directory that
// cannot be created leaves the logger console-only.
inline std::shared_ptr<spdlog::logger>
createLogger(std::string_view Name, const Config &Cfg) {
  std::vector<spdlog::sink_ptr> Sinks{consoleSink()};

  std::error_code DirError;
  if (Cfg.LogDir) {
    std::filesystem::path Dir{*Cfg.LogDir};
    std::filesystem::create_directories(Dir, DirError);
    if (!DirError) {
      Sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          (Dir / std::format("{}.log", Name)).string(),
          LogFileBytes,
          LogFileCount
      ));
    }
  }

  auto Logger = std::make_shared<spdlog::logger>(
      std::string(Name), Sinks.begin(), Sinks.end()
  );
  Logger->set_pattern(std::string(LogPattern));
  Logger->set_level(spdlog::level::from_str(Cfg.LogLevel));
  spdlog::register_logger(Logger);

  if (DirError) {
    Logger->warn(
        "Cannot create log directory {}: {}",
        *Cfg.LogDir,
        DirError.message()
    );
  }
  return Logger;
}

// Registered logger by name, or the default logger when setupLogging has not
// run (unit tests).
inline std::shared_ptr<spdlog::logger> logger(std::string_view Name) {
  if (auto Logger = spdlog::get(std::string(Name))) {
    return Logger;
  }
  return spdlog::default_logger();
}

inline void setupLogging(const Config &Cfg) {
  for (auto Name : LoggerNames) {
    auto Logger = createLogger(Name, Cfg);
    if (Name == LoggerNames.front()) {
      spdlog::set_default_logger(Logger);
    }
  }

  spdlog::flush_on(spdlog::level::warn);
  spdlog::flush_every(std::chrono::seconds(1));
}

} // namespace devpulse::core
