#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mapper::util {

/*
  Time utilities. Single place to control the clock source.

  Timestamps stored by the engine carry microsecond precision so that every
  backend round-trips them exactly.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Current time, truncated to microseconds.
TimePoint Now();

TimePoint TruncateToMicros(TimePoint tp);

int64_t   ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(int64_t micros);

// UTC, "YYYY-MM-DDTHH:MM:SS[.ffffff]Z".
std::string FormatIso8601(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fraction (up to 6 digits) and
// optional trailing 'Z'. A space may replace the 'T'.
std::optional<TimePoint> ParseIso8601(const std::string& text);

} // namespace mapper::util
