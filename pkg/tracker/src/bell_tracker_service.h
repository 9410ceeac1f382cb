// Repository: BellWatch
// Component: BellTracker gRPC Service Implementation
// Purpose: Implements the BellTracker service interface over BellEngine.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_BELL_TRACKER_SERVICE_H_
#define BELLWATCH_BELL_TRACKER_SERVICE_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "bell_tracker.grpc.pb.h"
#include "bell_tracker.pb.h"
#include "bellwatch/runtime/BellEngine.hpp"

namespace bellwatch {
namespace tracker {

// Maps an engine result to the status returned to the client.
// Detector failures are reported as OK (the caller sees "no detection").
grpc::Status ToGrpcStatus(const runtime::EngineResult& result);

// BellTrackerImpl implements the gRPC service defined in bell_tracker.proto.
// This is a thin adapter that delegates to BellEngine.
class BellTrackerImpl final : public BellTracker::Service {
 public:
  static constexpr const char* kServerVersion = "1.0.0";

  explicit BellTrackerImpl(std::shared_ptr<runtime::BellEngine> engine);
  ~BellTrackerImpl() override;

  // Disable copy and move
  BellTrackerImpl(const BellTrackerImpl&) = delete;
  BellTrackerImpl& operator=(const BellTrackerImpl&) = delete;

  // RPC implementations
  grpc::Status OpenSession(grpc::ServerContext* context,
                           const OpenSessionRequest* request,
                           SessionCreated* response) override;

  grpc::Status CloseSession(grpc::ServerContext* context,
                            const CloseSessionRequest* request,
                            CloseSessionResponse* response) override;

  // Holds the session for as long as the client keeps the stream open.
  grpc::Status Connect(grpc::ServerContext* context,
                       const OpenSessionRequest* request,
                       grpc::ServerWriter<ConnectionEvent>* writer) override;

  grpc::Status StartRecording(grpc::ServerContext* context,
                              const RecordingRequest* request,
                              RecordingAck* response) override;

  grpc::Status StopRecording(grpc::ServerContext* context,
                             const RecordingRequest* request,
                             RecordingAck* response) override;

  grpc::Status UploadAudio(grpc::ServerContext* context,
                           const UploadAudioRequest* request,
                           UploadAudioResponse* response) override;

  grpc::Status StreamAudio(grpc::ServerContext* context,
                           grpc::ServerReader<AudioChunk>* reader,
                           StreamAudioSummary* response) override;

  grpc::Status GetSession(grpc::ServerContext* context,
                          const GetSessionRequest* request,
                          SessionDetail* response) override;

  grpc::Status ExportSession(grpc::ServerContext* context,
                             const ExportSessionRequest* request,
                             SessionExport* response) override;

  grpc::Status GetStats(grpc::ServerContext* context,
                        const GetStatsRequest* request,
                        StatsResponse* response) override;

  grpc::Status GetHistory(grpc::ServerContext* context,
                          const GetHistoryRequest* request,
                          HistoryResponse* response) override;

  grpc::Status SubscribeBellEvents(grpc::ServerContext* context,
                                   const SubscribeBellEventsRequest* request,
                                   grpc::ServerWriter<BellDetected>* writer) override;

  grpc::Status GetHealth(grpc::ServerContext* context,
                         const HealthRequest* request,
                         HealthResponse* response) override;

  // Ends open SubscribeBellEvents and Connect streams so server shutdown
  // does not wait on them. Call before grpc::Server::Shutdown().
  void Shutdown();

 private:
  std::shared_ptr<runtime::BellEngine> engine_;
  int64_t started_ms_;
  std::atomic<bool> shutting_down_{false};
};

}  // namespace tracker
}  // namespace bellwatch

#endif  // BELLWATCH_BELL_TRACKER_SERVICE_H_
