// Repository: BellWatch
// Component: Bell Event Types
// Copyright (c) 2026 BellWatch

#include "bellwatch/runtime/BellTypes.hpp"

namespace bellwatch::runtime {

const char* BellTypeName(BellType type) {
  switch (type) {
    case BellType::kSingle:
      return "single";
    case BellType::kDouble:
      return "double";
  }
  return "unknown";
}

const char* BusStatusName(BusStatus status) {
  switch (status) {
    case BusStatus::kIdle:
      return "idle";
    case BusStatus::kStopping:
      return "stopping";
    case BusStatus::kStarting:
      return "starting";
  }
  return "unknown";
}

const char* TimelineTypeName(TimelineType type) {
  switch (type) {
    case TimelineType::kStopping:
      return "stopping";
    case TimelineType::kStarting:
      return "starting";
  }
  return "unknown";
}

}  // namespace bellwatch::runtime
