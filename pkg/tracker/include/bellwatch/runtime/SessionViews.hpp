// Repository: BellWatch
// Component: Session Views
// Purpose: Read-side shapes returned by BellEngine queries.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_SESSION_VIEWS_HPP_
#define BELLWATCH_RUNTIME_SESSION_VIEWS_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bellwatch/runtime/BellTypes.hpp"

namespace bellwatch::runtime {

// GetSession: history and timeline clipped to the newest N entries.
struct SessionView {
  std::string id;
  int64_t start_time_ms = 0;
  bool is_recording = false;
  SessionStats stats;
  std::vector<BellEvent> bell_history;
  std::vector<TimelineEvent> timeline;
  int64_t last_activity_ms = 0;
};

// ExportSession: untrimmed history and timeline plus export metadata.
struct SessionExport {
  static constexpr const char* kVersion = "1.0";
  static constexpr const char* kFormat = "JSON";

  std::string session_id;
  int64_t start_time_ms = 0;
  int64_t export_time_ms = 0;
  int64_t duration_ms = 0;
  SessionStats stats;
  std::vector<BellEvent> bell_history;
  std::vector<TimelineEvent> timeline;

  // Filled when an export writer is configured.
  bool written = false;
  std::string written_path;
};

// Bounds are inclusive; unset fields do not filter.
struct HistoryQuery {
  std::optional<int64_t> start_ms;
  std::optional<int64_t> end_ms;
  std::optional<BellType> type;
};

struct HistoryEntry {
  BellEvent bell;
  std::string session_id;
};

struct HistoryResult {
  std::vector<HistoryEntry> entries;  // newest first, clipped to the limit
  std::size_t total = 0;              // matches before clipping
  HistoryQuery filters;
};

struct StatsView {
  GlobalStatsSnapshot global;
  std::size_t active_sessions = 0;
  int64_t timestamp_ms = 0;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_SESSION_VIEWS_HPP_
