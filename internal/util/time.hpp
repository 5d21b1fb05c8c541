#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bibmirror::util {

/*
  Time utilities: the single place to control clock source and the catalog
  timestamp format ("YYYY-MM-DD HH:MM:SS", UTC).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::seconds>;

TimePoint Now();

// Accepts "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS" and "YYYY-MM-DD".
// MySQL zero dates ("0000-00-00 ...") parse to the epoch.
std::optional<TimePoint> ParseTimestamp(std::string_view text);

std::string FormatTimestamp(TimePoint tp);

uint64_t ToUnixMillis(Clock::time_point tp);

} // namespace bibmirror::util
