#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace stackctl::util {

/*
  Time utilities; the single place that reads the clock.

  Artifact timestamps are always rendered in UTC so that lexical
  ordering of file names matches chronological ordering on any host.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// YYYYMMDD_HHMMSS (UTC)
std::string FormatCompact(TimePoint tp);
std::optional<TimePoint> ParseCompact(std::string_view text);

// YYYY-MM-DDTHH:MM:SSZ
std::string FormatIso8601(TimePoint tp);

} // namespace stackctl::util
