// Repository: BellWatch
// Component: Time Formatting
// Purpose: Display strings for epoch-millisecond timestamps.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_UTIL_TIME_FORMAT_HPP_
#define BELLWATCH_UTIL_TIME_FORMAT_HPP_

#include <cstdint>
#include <string>

namespace bellwatch::util {

// Local wall time "HH:MM:SS". Empty string if the conversion fails.
std::string FormatLocalTimeOfDay(int64_t epoch_ms);

// UTC "YYYY-MM-DDTHH:MM:SS.mmmZ". Empty string if the conversion fails.
std::string FormatUtcIso8601(int64_t epoch_ms);

}  // namespace bellwatch::util

#endif  // BELLWATCH_UTIL_TIME_FORMAT_HPP_
