// Repository: BellWatch
// Component: System Time Source
// Purpose: Production ITimeSource backed by std::chrono::system_clock.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_TIME_SYSTEM_TIME_SOURCE_HPP_
#define BELLWATCH_TIME_SYSTEM_TIME_SOURCE_HPP_

#include <chrono>

#include "time/ITimeSource.hpp"

namespace bellwatch {

class SystemTimeSource final : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

}  // namespace bellwatch

#endif  // BELLWATCH_TIME_SYSTEM_TIME_SOURCE_HPP_
