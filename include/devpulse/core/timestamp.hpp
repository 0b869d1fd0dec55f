#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace devpulse::core {

using Timestamp = std::chrono::system_clock::time_point;

// Parses an ISO-8601 UTC timestamp such as "2011-01-25T18:44:36Z".
// Fractional seconds and the zone designator are ignored.
inline std::optional<Timestamp> parseTimestamp(std::string_view Str) {
  std::tm Tm = {};
  std::istringstream Ss{std::string(Str)};
  Ss >> std::get_time(&Tm, "%Y-%m-%dT%H:%M:%S");
  if (Ss.fail()) {
    return std::nullopt;
  }

  auto Date = std::chrono::year{Tm.tm_year + 1900} /
              std::chrono::month{static_cast<unsigned>(Tm.tm_mon + 1)} /
              std::chrono::day{static_cast<unsigned>(Tm.tm_mday)};
  if (!Date.ok()) {
    return std::nullopt;
  }

  return std::chrono::sys_days{Date} + std::chrono::hours{Tm.tm_hour} +
         std::chrono::minutes{Tm.tm_min} + std::chrono::seconds{Tm.tm_sec};
}

// Whole days elapsed from Then to Now, truncated. Instants in the future
// count as zero days.
inline long long daysBetween(Timestamp Then, Timestamp Now) {
  if (Then >= Now) {
    return 0;
  }
  return std::chrono::duration_cast<std::chrono::days>(Now - Then).count();
}

} // namespace devpulse::core
