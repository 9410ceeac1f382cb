// Repository: BellWatch
// Component: Time Formatting
// Copyright (c) 2026 BellWatch

#include "bellwatch/util/TimeFormat.hpp"

#include <cstdio>
#include <ctime>

namespace bellwatch::util {

namespace {

int64_t FloorDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

}  // namespace

std::string FormatLocalTimeOfDay(int64_t epoch_ms) {
  time_t s = static_cast<time_t>(FloorDiv(epoch_ms, 1000));
  struct tm tm;
  if (localtime_r(&s, &tm) == nullptr) return "";
  char buf[16];
  int n = snprintf(buf, sizeof(buf), "%02d:%02d:%02d",
                   tm.tm_hour, tm.tm_min, tm.tm_sec);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

std::string FormatUtcIso8601(int64_t epoch_ms) {
  const int64_t secs = FloorDiv(epoch_ms, 1000);
  const int frac_ms = static_cast<int>(epoch_ms - secs * 1000);
  time_t s = static_cast<time_t>(secs);
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) return "";
  char buf[64];
  int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

}  // namespace bellwatch::util
