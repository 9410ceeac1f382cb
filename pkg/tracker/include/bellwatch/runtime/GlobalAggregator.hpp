// Repository: BellWatch
// Component: Global Aggregator
// Purpose: Process-wide counters folded from session lifecycle and bell events.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_GLOBAL_AGGREGATOR_HPP_
#define BELLWATCH_RUNTIME_GLOBAL_AGGREGATOR_HPP_

#include <mutex>

#include "bellwatch/runtime/BellTypes.hpp"

namespace bellwatch::runtime {

// Mutated only by SessionStore (create/delete) and SessionStateMachine
// (apply). Counters live for the process and are never persisted.
class GlobalAggregator {
 public:
  GlobalAggregator() = default;

  GlobalAggregator(const GlobalAggregator&) = delete;
  GlobalAggregator& operator=(const GlobalAggregator&) = delete;

  void OnSessionCreated();
  // active_users is floored at 0.
  void OnSessionDeleted();
  void OnBellApplied(BellType type);

  [[nodiscard]] GlobalStatsSnapshot Snapshot() const;

 private:
  mutable std::mutex mutex_;
  GlobalStatsSnapshot stats_;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_GLOBAL_AGGREGATOR_HPP_
