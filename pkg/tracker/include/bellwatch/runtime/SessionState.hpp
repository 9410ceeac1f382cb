// Repository: BellWatch
// Component: Session State
// Purpose: Per-session mutable record owned by SessionStore.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_SESSION_STATE_HPP_
#define BELLWATCH_RUNTIME_SESSION_STATE_HPP_

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "bellwatch/runtime/BellTypes.hpp"

namespace bellwatch::runtime {

// SessionState is shared between the store, in-flight ingest calls and
// pending revert actions (which hold it weakly).
//
// `ingest_mutex` orders detections: it is held from the detector call
// through apply and publish, so bells are applied in detection order.
// Queries never take it.
//
// `mutex` guards every mutable field below it and is held across
// classify + apply. Lock order: ingest_mutex, then mutex.
// id, connection_id and start_time_ms are fixed at creation.
struct SessionState {
  SessionState(std::string session_id, std::string connection, int64_t created_ms)
      : id(std::move(session_id)),
        connection_id(std::move(connection)),
        start_time_ms(created_ms),
        last_activity_ms(created_ms) {}

  SessionState(const SessionState&) = delete;
  SessionState& operator=(const SessionState&) = delete;

  const std::string id;
  const std::string connection_id;
  const int64_t start_time_ms;

  std::mutex ingest_mutex;
  mutable std::mutex mutex;

  // Set by SessionStore::Delete before the session leaves the map. Nothing
  // is applied to a closed session.
  bool closed = false;

  bool is_recording = false;
  uint64_t single_bells = 0;
  uint64_t double_bells = 0;
  uint64_t total_stops = 0;
  BusStatus bus_status = BusStatus::kIdle;
  std::optional<int64_t> status_changed_ms;
  std::optional<int64_t> last_bell_time_ms;

  // Newest first.
  std::deque<BellEvent> bell_history;
  std::deque<TimelineEvent> timeline;

  int64_t last_activity_ms;

  // Requires mutex held.
  SessionStats StatsLocked() const {
    SessionStats stats;
    stats.single_bells = single_bells;
    stats.double_bells = double_bells;
    stats.total_stops = total_stops;
    stats.bus_status = bus_status;
    return stats;
  }
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_SESSION_STATE_HPP_
