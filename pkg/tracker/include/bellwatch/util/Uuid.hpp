// Repository: BellWatch
// Component: Identifier Generation
// Purpose: Random UUID v4 strings for sessions, bell events and timeline entries.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_UTIL_UUID_HPP_
#define BELLWATCH_UTIL_UUID_HPP_

#include <string>

namespace bellwatch::util {

// Lower-case 8-4-4-4-12 form. Thread-safe (per-thread generator).
std::string GenerateUuidV4();

}  // namespace bellwatch::util

#endif  // BELLWATCH_UTIL_UUID_HPP_
