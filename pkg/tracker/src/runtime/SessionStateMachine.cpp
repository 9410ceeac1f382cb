// Repository: BellWatch
// Component: Session State Machine
// Copyright (c) 2026 BellWatch

#include "bellwatch/runtime/SessionStateMachine.hpp"

#include <limits>
#include <sstream>

#include "bellwatch/util/Logger.hpp"
#include "bellwatch/util/TimeFormat.hpp"
#include "bellwatch/util/Uuid.hpp"

namespace bellwatch::runtime {

using bellwatch::util::Logger;

namespace {

constexpr char kStoppingText[] = "Bus is stopping";

// Saturates instead of overflowing; a revert due at INT64_MAX never fires.
int64_t RevertDueMs(int64_t guard_ms, int64_t delay_ms) {
  if (delay_ms > 0 && guard_ms > std::numeric_limits<int64_t>::max() - delay_ms) {
    return std::numeric_limits<int64_t>::max();
  }
  return guard_ms + delay_ms;
}
constexpr char kStartingText[] = "Bus is starting";

}  // namespace

SessionStateMachine::SessionStateMachine(const EngineConfig& config,
                                         GlobalAggregator& aggregator,
                                         IRevertScheduler& scheduler)
    : revert_delay_ms_(config.revert_delay_ms),
      timeline_capacity_(config.timeline_capacity),
      aggregator_(aggregator),
      scheduler_(scheduler) {}

ApplyResult SessionStateMachine::Apply(const std::shared_ptr<SessionState>& session,
                                       const ClassifiedEvent& event) {
  SessionState& s = *session;
  const bool is_double = event.type == BellType::kDouble;

  // Read before the new bell is inserted: the "previous" bell is the current
  // front of the history.
  const bool completes_single =
      is_double && !s.bell_history.empty() &&
      s.bell_history.front().type == BellType::kSingle;

  BellEvent bell;
  bell.id = util::GenerateUuidV4();
  bell.type = event.type;
  bell.timestamp_ms = event.timestamp_ms;
  bell.confidence = event.confidence;
  bell.frequency_hz = event.frequency_hz;
  bell.duration_ms = event.duration_ms;
  bell.time = util::FormatLocalTimeOfDay(event.timestamp_ms);
  s.bell_history.push_front(bell);

  s.last_bell_time_ms = event.timestamp_ms;
  s.last_activity_ms = event.timestamp_ms;

  if (is_double) {
    ++s.double_bells;
    ++s.total_stops;
    if (completes_single && s.single_bells > 0) {
      --s.single_bells;
    }
    s.bus_status = BusStatus::kStarting;
  } else {
    ++s.single_bells;
    s.bus_status = BusStatus::kStopping;
  }
  s.status_changed_ms = event.timestamp_ms;

  TimelineEvent entry;
  entry.id = util::GenerateUuidV4();
  entry.type = is_double ? TimelineType::kStarting : TimelineType::kStopping;
  entry.text = is_double ? kStartingText : kStoppingText;
  entry.timestamp_ms = event.timestamp_ms;
  entry.time = bell.time;
  entry.confidence = event.confidence;
  s.timeline.push_front(entry);
  while (s.timeline.size() > timeline_capacity_) {
    s.timeline.pop_back();
  }

  ScheduleRevert(session, event.timestamp_ms);

  aggregator_.OnBellApplied(event.type);

  ApplyResult result;
  result.session_id = s.id;
  result.bell_event = std::move(bell);
  result.timeline_event = std::move(entry);
  result.session_stats = s.StatsLocked();
  return result;
}

bool SessionStateMachine::RevertIfCurrent(SessionState& session, int64_t guard_ms) {
  if (!session.status_changed_ms.has_value() || *session.status_changed_ms != guard_ms) {
    return false;
  }
  session.bus_status = BusStatus::kIdle;
  return true;
}

void SessionStateMachine::ScheduleRevert(const std::shared_ptr<SessionState>& session,
                                         int64_t guard_ms) {
  std::weak_ptr<SessionState> weak = session;
  const std::string session_id = session->id;
  const int64_t due_ms = RevertDueMs(guard_ms, revert_delay_ms_);
  scheduler_.Schedule(session_id, due_ms, [weak, session_id, guard_ms]() {
    auto live = weak.lock();
    if (!live) return;  // session deleted
    bool reverted = false;
    {
      std::lock_guard<std::mutex> lock(live->mutex);
      reverted = RevertIfCurrent(*live, guard_ms);
    }
    if (reverted) {
      std::ostringstream oss;
      oss << "[SessionStateMachine] REVERT_IDLE session=" << session_id
          << " guard_ms=" << guard_ms;
      Logger::Debug(oss.str());
    }
  });
}

}  // namespace bellwatch::runtime
