// Repository: BellWatch
// Component: Bell Event Types
// Purpose: Value types shared by the classifier, the session state machine,
//          the gRPC layer and the exporter.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_BELL_TYPES_HPP_
#define BELLWATCH_RUNTIME_BELL_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace bellwatch::runtime {

enum class BellType {
  kSingle = 0,
  kDouble = 1,
};

enum class BusStatus {
  kIdle = 0,
  kStopping = 1,
  kStarting = 2,
};

enum class TimelineType {
  kStopping = 0,
  kStarting = 1,
};

const char* BellTypeName(BellType type);
const char* BusStatusName(BusStatus status);
const char* TimelineTypeName(TimelineType type);

// Detector output. Carries no semantic bell type; the classifier derives it.
struct RawDetection {
  int64_t timestamp_ms = 0;
  double confidence = 0.0;
  double frequency_hz = 0.0;
  double duration_ms = 0.0;
};

struct ClassifiedEvent {
  BellType type = BellType::kSingle;
  int64_t timestamp_ms = 0;
  double confidence = 0.0;
  double frequency_hz = 0.0;
  double duration_ms = 0.0;
};

struct BellEvent {
  std::string id;
  BellType type = BellType::kSingle;
  int64_t timestamp_ms = 0;
  double confidence = 0.0;
  double frequency_hz = 0.0;
  double duration_ms = 0.0;
  std::string time;  // local HH:MM:SS
};

struct TimelineEvent {
  std::string id;
  TimelineType type = TimelineType::kStopping;
  std::string text;
  int64_t timestamp_ms = 0;
  std::string time;
  double confidence = 0.0;
};

struct SessionStats {
  uint64_t single_bells = 0;
  uint64_t double_bells = 0;
  uint64_t total_stops = 0;
  BusStatus bus_status = BusStatus::kIdle;
};

// Result of applying one classified event; this is what subscribers receive.
struct ApplyResult {
  std::string session_id;
  BellEvent bell_event;
  TimelineEvent timeline_event;
  SessionStats session_stats;
};

struct GlobalStatsSnapshot {
  uint64_t total_sessions = 0;
  uint64_t total_bells_detected = 0;
  uint64_t total_stops = 0;
  uint64_t active_users = 0;
};

// Opaque audio handed to the detector. mime_type/filename are only known for
// uploads; streamed chunks leave them empty.
struct AudioPayload {
  std::string mime_type;
  std::string filename;
  std::vector<uint8_t> data;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_BELL_TYPES_HPP_
