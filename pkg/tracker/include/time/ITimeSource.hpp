// Repository: BellWatch
// Component: Time Source Interface
// Purpose: Injected wall clock for session timestamps, revert deadlines
//          and export metadata.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_TIME_ITIME_SOURCE_HPP_
#define BELLWATCH_TIME_ITIME_SOURCE_HPP_

#include <cstdint>

namespace bellwatch {

// Epoch milliseconds. Implementations must be callable from any thread.
class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace bellwatch

#endif  // BELLWATCH_TIME_ITIME_SOURCE_HPP_
