#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

#include "types.h"

namespace cloudpulse {

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
// optional "Z" or "+HH:MM"/"-HH:MM" suffix. Fractional seconds are dropped.
auto ParseIsoTime(const std::string& iso) -> std::optional<TimePoint>;

// "YYYY-MM-DDTHH:MM:SSZ"
auto FormatIsoTime(TimePoint tp) -> std::string;

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
auto FormatIsoTimeMillis(TimePoint tp) -> std::string;

// strftime over the UTC calendar fields of tp.
auto FormatUtc(TimePoint tp, const char* pattern) -> std::string;

auto FloorToHour(TimePoint tp) -> TimePoint;

// Resolves an invocation's optional bounds into a window. Missing bounds
// default to a one hour span ending at `now` (or anchored on the bound that
// was given). Throws std::invalid_argument for unparseable or inverted bounds.
auto ResolveWindow(const std::optional<std::string>& start_time,
                   const std::optional<std::string>& end_time,
                   TimePoint now) -> TimeWindow;

} // namespace cloudpulse
