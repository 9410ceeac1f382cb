// Repository: BellWatch
// Component: Bell Engine
// Purpose: Session event-correlation engine; the one surface the transport talks to.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_BELL_ENGINE_HPP_
#define BELLWATCH_RUNTIME_BELL_ENGINE_HPP_

// BellEngine
//
// BellEngine owns the session store, the global counters and the
// per-session publish channel. Every bell goes through the same path:
//
//   validate -> lock ingest -> detector -> lock session ->
//   classify -> apply -> unlock session -> publish -> unlock ingest
//
// Detections for one session are applied in the order the detector
// produced them. Queries take only the session mutex and never wait on
// the detector.
//
// BellEngine does NOT:
// - know about gRPC or any other transport
// - retry detector failures
// - persist anything except explicit exports

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "bellwatch/detect/IDetector.hpp"
#include "bellwatch/exporter/SessionExportWriter.hpp"
#include "bellwatch/runtime/AudioPayloadValidator.hpp"
#include "bellwatch/runtime/BellClassifier.hpp"
#include "bellwatch/runtime/BellEventBus.hpp"
#include "bellwatch/runtime/BellTypes.hpp"
#include "bellwatch/runtime/EngineConfig.hpp"
#include "bellwatch/runtime/GlobalAggregator.hpp"
#include "bellwatch/runtime/IRevertScheduler.hpp"
#include "bellwatch/runtime/SessionStateMachine.hpp"
#include "bellwatch/runtime/SessionStore.hpp"
#include "bellwatch/runtime/SessionViews.hpp"
#include "bellwatch/runtime/SyntheticProbeRunner.hpp"
#include "time/ITimeSource.hpp"

namespace bellwatch::runtime {

// Typed result codes mirrored by the gRPC status mapping.
enum class ResultCode {
  kUnspecified = 0,
  kOk = 1,
  kNotFound = 2,         // unknown session; nothing mutated
  kInvalidInput = 3,     // empty, oversized or non-audio payload
  kNotRecording = 4,     // streamed chunk while not recording
  kDetectorFailure = 5,  // detector threw; reported as "no detection"
};

const char* ResultCodeName(ResultCode code);

struct EngineResult {
  bool success;
  std::string message;
  ResultCode result_code = ResultCode::kUnspecified;

  EngineResult(bool s, const std::string& msg, ResultCode code = ResultCode::kUnspecified)
      : success(s), message(msg), result_code(code) {}
};

struct SessionInfo {
  std::string session_id;
  int64_t start_time_ms = 0;
};

struct IngestResult {
  EngineResult status{false, ""};
  // Set only when a bell was detected and applied.
  std::optional<ApplyResult> detection;
};

class BellEngine {
 public:
  // export_writer may be null (exports are returned but not written).
  BellEngine(EngineConfig config,
             std::shared_ptr<ITimeSource> time_source,
             std::shared_ptr<detect::IDetector> detector,
             std::shared_ptr<IRevertScheduler> scheduler,
             std::unique_ptr<exporter::SessionExportWriter> export_writer = nullptr);

  ~BellEngine();

  BellEngine(const BellEngine&) = delete;
  BellEngine& operator=(const BellEngine&) = delete;

  // Connection established.
  SessionInfo OpenSession(const std::string& connection_id);

  // Connection closed: stops probing, deletes the session, ends subscriptions.
  EngineResult CloseSession(const std::string& session_id);
  EngineResult CloseConnection(const std::string& connection_id);

  EngineResult StartRecording(const std::string& session_id);
  EngineResult StopRecording(const std::string& session_id);

  // Upload path: requires an audio/* MIME type. Recording state is not checked.
  IngestResult IngestAudio(const std::string& session_id, const AudioPayload& payload);

  // Streaming path: only processed while the session is recording.
  IngestResult IngestStreamChunk(const std::string& session_id, const AudioPayload& payload);

  std::optional<SessionView> GetSession(const std::string& session_id) const;
  std::optional<SessionExport> ExportSession(const std::string& session_id);
  HistoryResult QueryHistory(const HistoryQuery& query) const;
  StatsView GetStats() const;

  // Returns 0 if the session is unknown. on_closed runs when the session is
  // closed while the subscription is live.
  uint64_t Subscribe(const std::string& session_id,
                     BellEventBus::EventCallback on_event,
                     BellEventBus::ClosedCallback on_closed = nullptr);
  void Unsubscribe(uint64_t token);

  // Stops every probe thread. Idempotent; also run by the destructor.
  void Shutdown();

  [[nodiscard]] int64_t NowMs() const { return time_source_->NowUtcMs(); }
  [[nodiscard]] const EngineConfig& config() const { return config_; }
  [[nodiscard]] bool IsProbing(const std::string& session_id) const;
  [[nodiscard]] std::size_t SubscriberCount(const std::string& session_id) const;

 private:
  // Runs the detector; DetectorError and other exceptions become nullopt
  // with *failure filled in.
  std::optional<RawDetection> RunDetector(const std::string& session_id,
                                          const AudioPayload& payload,
                                          std::string* failure);

  IngestResult DetectAndApply(const std::shared_ptr<SessionState>& session,
                              const AudioPayload& payload,
                              const char* source);

  // Synthetic probe body. False ends the probe loop.
  bool RunProbe(const std::string& session_id);

  void Touch(SessionState& session);

  EngineConfig config_;
  std::shared_ptr<ITimeSource> time_source_;
  std::shared_ptr<detect::IDetector> detector_;
  std::shared_ptr<IRevertScheduler> scheduler_;
  std::unique_ptr<exporter::SessionExportWriter> export_writer_;

  GlobalAggregator aggregator_;
  SessionStore store_;
  SessionStateMachine state_machine_;
  BellClassifier classifier_;
  AudioPayloadValidator validator_;
  BellEventBus bus_;

  // Declared last: probe threads call back into the members above and are
  // joined before those are destroyed.
  SyntheticProbeRunner probes_;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_BELL_ENGINE_HPP_
