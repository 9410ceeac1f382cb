// Repository: BellWatch
// Component: Session State Machine
// Purpose: Sole mutator of event-driven session state; owns the idle-revert rule.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_SESSION_STATE_MACHINE_HPP_
#define BELLWATCH_RUNTIME_SESSION_STATE_MACHINE_HPP_

#include <cstdint>
#include <memory>

#include "bellwatch/runtime/BellTypes.hpp"
#include "bellwatch/runtime/EngineConfig.hpp"
#include "bellwatch/runtime/GlobalAggregator.hpp"
#include "bellwatch/runtime/IRevertScheduler.hpp"
#include "bellwatch/runtime/SessionState.hpp"

namespace bellwatch::runtime {

// Transitions:
//
//   any --single--> stopping   single_bells += 1
//   any --double--> starting   double_bells += 1, total_stops += 1,
//                              single_bells -= 1 if the bell that was newest
//                              before this one is a single (floored at 0)
//
// Every Apply front-inserts a BellEvent and a TimelineEvent (timeline trimmed
// to timeline_capacity), stamps status_changed with the event timestamp and
// schedules a revert to idle at timestamp + revert_delay_ms. The revert only
// takes effect if status_changed still equals the value captured at schedule
// time, so superseded reverts are no-ops.
class SessionStateMachine {
 public:
  SessionStateMachine(const EngineConfig& config,
                      GlobalAggregator& aggregator,
                      IRevertScheduler& scheduler);

  SessionStateMachine(const SessionStateMachine&) = delete;
  SessionStateMachine& operator=(const SessionStateMachine&) = delete;

  // Caller holds session->mutex. Total: never fails for a live session.
  ApplyResult Apply(const std::shared_ptr<SessionState>& session,
                    const ClassifiedEvent& event);

  // Caller holds session.mutex. Returns true if the bus went back to idle.
  static bool RevertIfCurrent(SessionState& session, int64_t guard_ms);

 private:
  void ScheduleRevert(const std::shared_ptr<SessionState>& session, int64_t guard_ms);

  int64_t revert_delay_ms_;
  std::size_t timeline_capacity_;
  GlobalAggregator& aggregator_;
  IRevertScheduler& scheduler_;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_SESSION_STATE_MACHINE_HPP_
