// Repository: BellWatch
// Component: Bell Engine
// Copyright (c) 2026 BellWatch

#include "bellwatch/runtime/BellEngine.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <exception>
#include <sstream>
#include <vector>

#include "bellwatch/util/Logger.hpp"

namespace bellwatch::runtime {

using bellwatch::util::Logger;

namespace {

EngineResult NotFound(const std::string& session_id) {
  return EngineResult(false, "Session not found: " + session_id, ResultCode::kNotFound);
}

template <typename T>
std::vector<T> Newest(const std::deque<T>& items, std::size_t limit) {
  const std::size_t n = std::min(items.size(), limit);
  return std::vector<T>(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(n));
}

bool MatchesQuery(const BellEvent& bell, const HistoryQuery& query) {
  if (query.start_ms && bell.timestamp_ms < *query.start_ms) return false;
  if (query.end_ms && bell.timestamp_ms > *query.end_ms) return false;
  if (query.type && bell.type != *query.type) return false;
  return true;
}

}  // namespace

const char* ResultCodeName(ResultCode code) {
  switch (code) {
    case ResultCode::kUnspecified: return "UNSPECIFIED";
    case ResultCode::kOk: return "OK";
    case ResultCode::kNotFound: return "NOT_FOUND";
    case ResultCode::kInvalidInput: return "INVALID_INPUT";
    case ResultCode::kNotRecording: return "NOT_RECORDING";
    case ResultCode::kDetectorFailure: return "DETECTOR_FAILURE";
  }
  return "UNKNOWN";
}

BellEngine::BellEngine(EngineConfig config,
                       std::shared_ptr<ITimeSource> time_source,
                       std::shared_ptr<detect::IDetector> detector,
                       std::shared_ptr<IRevertScheduler> scheduler,
                       std::unique_ptr<exporter::SessionExportWriter> export_writer)
    : config_(std::move(config)),
      time_source_(std::move(time_source)),
      detector_(std::move(detector)),
      scheduler_(std::move(scheduler)),
      export_writer_(std::move(export_writer)),
      store_(time_source_, aggregator_, *scheduler_),
      state_machine_(config_, aggregator_, *scheduler_),
      classifier_(config_.classifier),
      validator_(config_.max_payload_bytes),
      probes_(config_.probe_interval_ms,
              config_.probe_probability,
              config_.probe_seed,
              [this](const std::string& session_id) { return RunProbe(session_id); }) {}

BellEngine::~BellEngine() {
  Shutdown();
}

void BellEngine::Shutdown() {
  probes_.StopAll();
}

SessionInfo BellEngine::OpenSession(const std::string& connection_id) {
  auto session = store_.Create(connection_id);

  std::ostringstream oss;
  oss << "[BellEngine] SESSION_CREATED session=" << session->id
      << " connection=" << connection_id;
  Logger::Info(oss.str());

  return SessionInfo{session->id, session->start_time_ms};
}

EngineResult BellEngine::CloseSession(const std::string& session_id) {
  // Join the probe first so no synthetic ingest races the delete.
  probes_.Stop(session_id);
  if (!store_.Delete(session_id)) {
    return NotFound(session_id);
  }
  bus_.CloseSession(session_id);

  std::ostringstream oss;
  oss << "[BellEngine] SESSION_CLOSED session=" << session_id
      << " active_sessions=" << store_.Size();
  Logger::Info(oss.str());
  return EngineResult(true, "Session closed", ResultCode::kOk);
}

EngineResult BellEngine::CloseConnection(const std::string& connection_id) {
  auto session = store_.FindByConnection(connection_id);
  if (!session) {
    return EngineResult(false, "No session for connection: " + connection_id,
                        ResultCode::kNotFound);
  }
  return CloseSession(session->id);
}

EngineResult BellEngine::StartRecording(const std::string& session_id) {
  auto session = store_.Get(session_id);
  if (!session) return NotFound(session_id);
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->closed) return NotFound(session_id);
    session->is_recording = true;
    Touch(*session);
  }
  probes_.Start(session_id);

  Logger::Info("[BellEngine] RECORDING_START session=" + session_id);
  return EngineResult(true, "Recording started", ResultCode::kOk);
}

EngineResult BellEngine::StopRecording(const std::string& session_id) {
  auto session = store_.Get(session_id);
  if (!session) return NotFound(session_id);
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->closed) return NotFound(session_id);
    session->is_recording = false;
    Touch(*session);
  }
  // Session mutex must be released here: the probe may be waiting on it.
  probes_.Stop(session_id);

  Logger::Info("[BellEngine] RECORDING_STOP session=" + session_id);
  return EngineResult(true, "Recording stopped", ResultCode::kOk);
}

IngestResult BellEngine::IngestAudio(const std::string& session_id,
                                     const AudioPayload& payload) {
  IngestResult result;
  auto session = store_.Get(session_id);
  if (!session) {
    result.status = NotFound(session_id);
    return result;
  }

  auto validation = validator_.ValidateUpload(payload);
  if (!validation.valid) {
    std::ostringstream oss;
    oss << "[BellEngine] UPLOAD_REJECTED session=" << session_id
        << " reason=" << PayloadErrorName(validation.error)
        << " detail=" << validation.detail;
    Logger::Warn(oss.str());
    result.status = EngineResult(false, validation.detail, ResultCode::kInvalidInput);
    return result;
  }

  return DetectAndApply(session, payload, "upload");
}

IngestResult BellEngine::IngestStreamChunk(const std::string& session_id,
                                           const AudioPayload& payload) {
  IngestResult result;
  auto session = store_.Get(session_id);
  if (!session) {
    result.status = NotFound(session_id);
    return result;
  }

  auto validation = validator_.ValidateChunk(payload);
  if (!validation.valid) {
    result.status = EngineResult(false, validation.detail, ResultCode::kInvalidInput);
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(session->mutex);
    if (!session->is_recording) {
      result.status = EngineResult(false, "Session is not recording",
                                   ResultCode::kNotRecording);
      return result;
    }
  }

  return DetectAndApply(session, payload, "stream");
}

std::optional<RawDetection> BellEngine::RunDetector(const std::string& session_id,
                                                    const AudioPayload& payload,
                                                    std::string* failure) {
  try {
    return detector_->Detect(payload, session_id);
  } catch (const detect::DetectorError& e) {
    *failure = e.what();
  } catch (const std::exception& e) {
    *failure = std::string("unexpected: ") + e.what();
  }

  std::ostringstream oss;
  oss << "[BellEngine] DETECTOR_FAILED session=" << session_id << " error=" << *failure;
  Logger::Warn(oss.str());
  return std::nullopt;
}

IngestResult BellEngine::DetectAndApply(const std::shared_ptr<SessionState>& session,
                                        const AudioPayload& payload,
                                        const char* source) {
  IngestResult result;

  // Held through publish: a second detection for this session waits until
  // the first is applied, so lastBellTime only moves forward.
  std::lock_guard<std::mutex> ingest_lock(session->ingest_mutex);

  std::string failure;
  auto raw = RunDetector(session->id, payload, &failure);

  ApplyResult applied;
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    // The session may have been closed while the detector ran.
    if (session->closed) {
      result.status = NotFound(session->id);
      return result;
    }
    if (!raw) {
      Touch(*session);
      if (!failure.empty()) {
        result.status = EngineResult(true, "Detector failure: " + failure,
                                     ResultCode::kDetectorFailure);
      } else {
        result.status = EngineResult(true, "No bell detected", ResultCode::kOk);
      }
      return result;
    }
    ClassifiedEvent event = classifier_.Classify(*raw, session->last_bell_time_ms);
    applied = state_machine_.Apply(session, event);
  }

  bus_.Publish(applied);

  std::ostringstream oss;
  oss << "[BellEngine] BELL_APPLIED session=" << applied.session_id
      << " source=" << source
      << " type=" << BellTypeName(applied.bell_event.type)
      << " confidence=" << applied.bell_event.confidence
      << " status=" << BusStatusName(applied.session_stats.bus_status)
      << " single=" << applied.session_stats.single_bells
      << " double=" << applied.session_stats.double_bells
      << " stops=" << applied.session_stats.total_stops;
  Logger::Info(oss.str());

  result.status = EngineResult(true, "Bell detected", ResultCode::kOk);
  result.detection = std::move(applied);
  return result;
}

bool BellEngine::RunProbe(const std::string& session_id) {
  auto session = store_.Get(session_id);
  if (!session) return false;
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    if (!session->is_recording) return false;
  }

  AudioPayload silence;
  silence.data.assign(config_.probe_payload_bytes, 0);
  auto result = IngestStreamChunk(session_id, silence);
  if (!result.status.success) {
    std::ostringstream oss;
    oss << "[BellEngine] PROBE_REJECTED session=" << session_id
        << " code=" << ResultCodeName(result.status.result_code);
    Logger::Debug(oss.str());
    return result.status.result_code != ResultCode::kNotFound &&
           result.status.result_code != ResultCode::kNotRecording;
  }
  return true;
}

void BellEngine::Touch(SessionState& session) {
  session.last_activity_ms = time_source_->NowUtcMs();
}

std::optional<SessionView> BellEngine::GetSession(const std::string& session_id) const {
  auto session = store_.Get(session_id);
  if (!session) return std::nullopt;

  std::lock_guard<std::mutex> lock(session->mutex);
  SessionView view;
  view.id = session->id;
  view.start_time_ms = session->start_time_ms;
  view.is_recording = session->is_recording;
  view.stats = session->StatsLocked();
  view.bell_history = Newest(session->bell_history, config_.session_view_history_limit);
  view.timeline = Newest(session->timeline, config_.session_view_timeline_limit);
  view.last_activity_ms = session->last_activity_ms;
  return view;
}

std::optional<SessionExport> BellEngine::ExportSession(const std::string& session_id) {
  auto session = store_.Get(session_id);
  if (!session) return std::nullopt;

  SessionExport snapshot;
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    snapshot.session_id = session->id;
    snapshot.start_time_ms = session->start_time_ms;
    snapshot.stats = session->StatsLocked();
    snapshot.bell_history.assign(session->bell_history.begin(), session->bell_history.end());
    snapshot.timeline.assign(session->timeline.begin(), session->timeline.end());
    Touch(*session);
  }
  snapshot.export_time_ms = time_source_->NowUtcMs();
  snapshot.duration_ms = snapshot.export_time_ms - snapshot.start_time_ms;

  if (export_writer_) {
    auto write = export_writer_->Write(snapshot);
    snapshot.written = write.written;
    snapshot.written_path = write.path;
  }

  std::ostringstream oss;
  oss << "[BellEngine] SESSION_EXPORTED session=" << session_id
      << " bells=" << snapshot.bell_history.size()
      << " written=" << (snapshot.written ? "true" : "false");
  Logger::Info(oss.str());
  return snapshot;
}

HistoryResult BellEngine::QueryHistory(const HistoryQuery& query) const {
  HistoryResult result;
  result.filters = query;

  for (const auto& session : store_.Snapshot()) {
    std::lock_guard<std::mutex> lock(session->mutex);
    for (const auto& bell : session->bell_history) {
      if (MatchesQuery(bell, query)) {
        result.entries.push_back(HistoryEntry{bell, session->id});
      }
    }
  }

  std::stable_sort(result.entries.begin(), result.entries.end(),
                   [](const HistoryEntry& a, const HistoryEntry& b) {
                     return a.bell.timestamp_ms > b.bell.timestamp_ms;
                   });
  result.total = result.entries.size();
  if (result.entries.size() > config_.history_query_limit) {
    result.entries.resize(config_.history_query_limit);
  }
  return result;
}

StatsView BellEngine::GetStats() const {
  StatsView view;
  view.global = aggregator_.Snapshot();
  view.active_sessions = store_.Size();
  view.timestamp_ms = time_source_->NowUtcMs();
  return view;
}

uint64_t BellEngine::Subscribe(const std::string& session_id,
                               BellEventBus::EventCallback on_event,
                               BellEventBus::ClosedCallback on_closed) {
  if (!store_.Get(session_id)) return 0;
  const uint64_t token = bus_.Subscribe(session_id, std::move(on_event), std::move(on_closed));
  // Closed between the lookup and the subscribe: CloseSession may already
  // have swept the bus.
  if (!store_.Get(session_id)) {
    bus_.Unsubscribe(token);
    return 0;
  }
  return token;
}

void BellEngine::Unsubscribe(uint64_t token) {
  bus_.Unsubscribe(token);
}

bool BellEngine::IsProbing(const std::string& session_id) const {
  return probes_.IsProbing(session_id);
}

std::size_t BellEngine::SubscriberCount(const std::string& session_id) const {
  return bus_.SubscriberCount(session_id);
}

}  // namespace bellwatch::runtime
