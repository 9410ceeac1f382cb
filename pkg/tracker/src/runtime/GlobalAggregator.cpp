// Repository: BellWatch
// Component: Global Aggregator
// Copyright (c) 2026 BellWatch

#include "bellwatch/runtime/GlobalAggregator.hpp"

namespace bellwatch::runtime {

void GlobalAggregator::OnSessionCreated() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.total_sessions;
  ++stats_.active_users;
}

void GlobalAggregator::OnSessionDeleted() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stats_.active_users > 0) {
    --stats_.active_users;
  }
}

void GlobalAggregator::OnBellApplied(BellType type) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.total_bells_detected;
  if (type == BellType::kDouble) {
    ++stats_.total_stops;
  }
}

GlobalStatsSnapshot GlobalAggregator::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace bellwatch::runtime
