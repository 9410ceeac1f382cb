// Repository: BellWatch
// Component: BellTracker gRPC Service Contract Tests
// Purpose: Verify the gRPC adapter over an in-process server.
// Copyright (c) 2026 BellWatch

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "bell_tracker.grpc.pb.h"
#include "bell_tracker_service.h"
#include "bellwatch/runtime/BellEngine.hpp"
#include "fixtures/ScriptedDetector.h"
#include "support/DeterministicTimeSource.hpp"
#include "support/ManualRevertScheduler.hpp"

namespace bellwatch::tests::contracts {

namespace {

constexpr int64_t kStartMs = 1'700'000'000'000;

}  // namespace

// Runs the service in-process and talks to it through a real stub.
class BellTrackerServiceContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    runtime::EngineConfig config;
    config.probe_interval_ms = 0;
    clock_ = std::make_shared<DeterministicTimeSource>(kStartMs);
    detector_ = std::make_shared<fixtures::ScriptedDetector>();
    scheduler_ = std::make_shared<support::ManualRevertScheduler>();
    engine_ = std::make_shared<runtime::BellEngine>(config, clock_, detector_, scheduler_);
    service_ = std::make_unique<tracker::BellTrackerImpl>(engine_);

    grpc::ServerBuilder builder;
    builder.RegisterService(service_.get());
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);
    stub_ = tracker::BellTracker::NewStub(server_->InProcessChannel(grpc::ChannelArguments()));
  }

  void TearDown() override {
    service_->Shutdown();
    server_->Shutdown();
    server_.reset();
    engine_->Shutdown();
  }

  std::string Open(const std::string& connection_id = "conn-1") {
    grpc::ClientContext ctx;
    tracker::OpenSessionRequest request;
    request.set_connection_id(connection_id);
    tracker::SessionCreated response;
    EXPECT_TRUE(stub_->OpenSession(&ctx, request, &response).ok());
    return response.session_id();
  }

  grpc::Status Upload(const std::string& session_id,
                      tracker::UploadAudioResponse* response,
                      const std::string& mime = "audio/wav") {
    grpc::ClientContext ctx;
    tracker::UploadAudioRequest request;
    request.set_session_id(session_id);
    request.set_mime_type(mime);
    request.set_filename("clip.wav");
    request.set_data(std::string(64, '\x01'));
    return stub_->UploadAudio(&ctx, request, response);
  }

  std::shared_ptr<DeterministicTimeSource> clock_;
  std::shared_ptr<fixtures::ScriptedDetector> detector_;
  std::shared_ptr<support::ManualRevertScheduler> scheduler_;
  std::shared_ptr<runtime::BellEngine> engine_;
  std::unique_ptr<tracker::BellTrackerImpl> service_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<tracker::BellTracker::Stub> stub_;
};

TEST_F(BellTrackerServiceContractTest, SVC_001_ResultCodesMapToGrpcStatus) {
  using runtime::EngineResult;
  using runtime::ResultCode;
  EXPECT_EQ(tracker::ToGrpcStatus(EngineResult(false, "x", ResultCode::kNotFound)).error_code(),
            grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(tracker::ToGrpcStatus(EngineResult(false, "x", ResultCode::kInvalidInput)).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(tracker::ToGrpcStatus(EngineResult(false, "x", ResultCode::kNotRecording)).error_code(),
            grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_TRUE(tracker::ToGrpcStatus(EngineResult(true, "x", ResultCode::kDetectorFailure)).ok());
  EXPECT_EQ(tracker::ToGrpcStatus(EngineResult(false, "x")).error_code(),
            grpc::StatusCode::INTERNAL);
}

TEST_F(BellTrackerServiceContractTest, SVC_002_UploadDetectsAndReportsStats) {
  const std::string id = Open();
  ASSERT_FALSE(id.empty());

  detector_->QueueHit(kStartMs + 100, 0.9);
  detector_->QueueHit(kStartMs + 400, 0.95);

  tracker::UploadAudioResponse first;
  ASSERT_TRUE(Upload(id, &first).ok());
  EXPECT_TRUE(first.success());
  EXPECT_TRUE(first.detected());
  EXPECT_EQ(first.detection().bell().type(), tracker::BELL_TYPE_SINGLE);
  EXPECT_EQ(first.detection().session_stats().bus_status(), tracker::BUS_STATUS_STOPPING);

  tracker::UploadAudioResponse second;
  ASSERT_TRUE(Upload(id, &second).ok());
  EXPECT_EQ(second.detection().bell().type(), tracker::BELL_TYPE_DOUBLE);
  EXPECT_DOUBLE_EQ(second.detection().bell().confidence(), 1.0);
  EXPECT_EQ(second.detection().timeline_event().text(), "Bus is starting");
  EXPECT_EQ(second.detection().session_stats().single_bells(), 0u);
  EXPECT_EQ(second.detection().session_stats().total_stops(), 1u);

  grpc::ClientContext ctx;
  tracker::StatsResponse stats;
  ASSERT_TRUE(stub_->GetStats(&ctx, tracker::GetStatsRequest(), &stats).ok());
  EXPECT_EQ(stats.total_sessions(), 1u);
  EXPECT_EQ(stats.total_bells_detected(), 2u);
  EXPECT_EQ(stats.total_stops(), 1u);
  EXPECT_EQ(stats.active_sessions(), 1u);
}

TEST_F(BellTrackerServiceContractTest, SVC_003_UploadErrorsCarryStatusCodes) {
  const std::string id = Open();

  tracker::UploadAudioResponse missing;
  EXPECT_EQ(Upload("missing", &missing).error_code(), grpc::StatusCode::NOT_FOUND);

  tracker::UploadAudioResponse not_audio;
  EXPECT_EQ(Upload(id, &not_audio, "image/png").error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);

  detector_->QueueFailure("model offline");
  tracker::UploadAudioResponse failed;
  ASSERT_TRUE(Upload(id, &failed).ok());
  EXPECT_FALSE(failed.detected());
}

TEST_F(BellTrackerServiceContractTest, SVC_004_StreamAudioHonoursRecordingState) {
  const std::string id = Open();
  detector_->QueueHit(kStartMs + 10);

  auto stream_chunks = [&](int count) {
    grpc::ClientContext ctx;
    tracker::StreamAudioSummary summary;
    auto writer = stub_->StreamAudio(&ctx, &summary);
    for (int i = 0; i < count; ++i) {
      tracker::AudioChunk chunk;
      if (i == 0) chunk.set_session_id(id);
      chunk.set_data(std::string(32, '\x02'));
      EXPECT_TRUE(writer->Write(chunk));
    }
    writer->WritesDone();
    EXPECT_TRUE(writer->Finish().ok());
    return summary;
  };

  auto idle = stream_chunks(2);
  EXPECT_EQ(idle.chunks_received(), 2u);
  EXPECT_EQ(idle.chunks_rejected(), 2u);
  EXPECT_EQ(detector_->CallCount(), 0u);

  {
    grpc::ClientContext ctx;
    tracker::RecordingRequest request;
    request.set_session_id(id);
    tracker::RecordingAck ack;
    ASSERT_TRUE(stub_->StartRecording(&ctx, request, &ack).ok());
    EXPECT_TRUE(ack.is_recording());
    EXPECT_EQ(ack.timestamp_ms(), kStartMs);
  }

  auto recording = stream_chunks(3);
  EXPECT_EQ(recording.chunks_processed(), 3u);
  EXPECT_EQ(recording.detections(), 1u);
}

TEST_F(BellTrackerServiceContractTest, SVC_005_SessionHistoryAndExportQueries) {
  const std::string id = Open();
  detector_->QueueHit(1'000);
  detector_->QueueHit(1'200);
  tracker::UploadAudioResponse r1;
  tracker::UploadAudioResponse r2;
  ASSERT_TRUE(Upload(id, &r1).ok());
  ASSERT_TRUE(Upload(id, &r2).ok());

  {
    grpc::ClientContext ctx;
    tracker::GetSessionRequest request;
    request.set_session_id(id);
    tracker::SessionDetail detail;
    ASSERT_TRUE(stub_->GetSession(&ctx, request, &detail).ok());
    EXPECT_EQ(detail.id(), id);
    ASSERT_EQ(detail.bell_history_size(), 2);
    EXPECT_EQ(detail.bell_history(0).timestamp_ms(), 1'200);
    EXPECT_EQ(detail.timeline_size(), 2);
    EXPECT_EQ(detail.stats().bus_status(), tracker::BUS_STATUS_STARTING);
  }
  {
    grpc::ClientContext ctx;
    tracker::GetHistoryRequest request;
    request.set_type(tracker::BELL_TYPE_SINGLE);
    request.set_end_ms(1'000);
    tracker::HistoryResponse history;
    ASSERT_TRUE(stub_->GetHistory(&ctx, request, &history).ok());
    ASSERT_EQ(history.bells_size(), 1);
    EXPECT_EQ(history.bells(0).session_id(), id);
    EXPECT_EQ(history.total(), 1u);
    EXPECT_TRUE(history.filters().has_end_ms());
    EXPECT_FALSE(history.filters().has_start_ms());
  }
  {
    clock_->AdvanceMs(5'000);
    grpc::ClientContext ctx;
    tracker::ExportSessionRequest request;
    request.set_session_id(id);
    tracker::SessionExport exported;
    ASSERT_TRUE(stub_->ExportSession(&ctx, request, &exported).ok());
    EXPECT_EQ(exported.duration_ms(), 5'000);
    EXPECT_EQ(exported.metadata().version(), "1.0");
    EXPECT_EQ(exported.metadata().format(), "JSON");
    EXPECT_FALSE(exported.written());
  }
  {
    grpc::ClientContext ctx;
    tracker::GetSessionRequest request;
    request.set_session_id("missing");
    tracker::SessionDetail detail;
    EXPECT_EQ(stub_->GetSession(&ctx, request, &detail).error_code(),
              grpc::StatusCode::NOT_FOUND);
  }
}

TEST_F(BellTrackerServiceContractTest, SVC_006_SubscriptionStreamsUntilSessionCloses) {
  const std::string id = Open();

  std::vector<tracker::BellDetected> received;
  grpc::Status stream_status;
  std::thread reader_thread([&] {
    grpc::ClientContext ctx;
    tracker::SubscribeBellEventsRequest request;
    request.set_session_id(id);
    auto reader = stub_->SubscribeBellEvents(&ctx, request);
    tracker::BellDetected event;
    while (reader->Read(&event)) {
      received.push_back(event);
    }
    stream_status = reader->Finish();
  });

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (engine_->SubscriberCount(id) == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_EQ(engine_->SubscriberCount(id), 1u);

  detector_->QueueHit(kStartMs + 100);
  tracker::UploadAudioResponse uploaded;
  ASSERT_TRUE(Upload(id, &uploaded).ok());

  // Give the stream a moment to flush before the session goes away.
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  {
    grpc::ClientContext ctx;
    tracker::CloseSessionRequest request;
    request.set_session_id(id);
    tracker::CloseSessionResponse response;
    ASSERT_TRUE(stub_->CloseSession(&ctx, request, &response).ok());
    EXPECT_TRUE(response.success());
  }
  reader_thread.join();

  EXPECT_TRUE(stream_status.ok());
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].session_id(), id);
  EXPECT_EQ(received[0].bell().id(), uploaded.detection().bell().id());
}

TEST_F(BellTrackerServiceContractTest, SVC_007_SubscribeUnknownSessionIsNotFound) {
  grpc::ClientContext ctx;
  tracker::SubscribeBellEventsRequest request;
  request.set_session_id("missing");
  auto reader = stub_->SubscribeBellEvents(&ctx, request);
  tracker::BellDetected event;
  EXPECT_FALSE(reader->Read(&event));
  EXPECT_EQ(reader->Finish().error_code(), grpc::StatusCode::NOT_FOUND);
}

TEST_F(BellTrackerServiceContractTest, SVC_008_HealthReportsUptime) {
  clock_->AdvanceMs(65'000);
  grpc::ClientContext ctx;
  tracker::HealthResponse health;
  ASSERT_TRUE(stub_->GetHealth(&ctx, tracker::HealthRequest(), &health).ok());
  EXPECT_EQ(health.status(), "healthy");
  EXPECT_EQ(health.uptime_s(), 65);
  EXPECT_EQ(health.version(), tracker::BellTrackerImpl::kServerVersion);
}

TEST_F(BellTrackerServiceContractTest, SVC_009_DroppedConnectionClosesItsSession) {
  grpc::ClientContext connect_ctx;
  tracker::OpenSessionRequest request;
  request.set_connection_id("conn-live");
  auto reader = stub_->Connect(&connect_ctx, request);

  tracker::ConnectionEvent event;
  ASSERT_TRUE(reader->Read(&event));
  ASSERT_TRUE(event.has_session_created());
  const std::string id = event.session_created().session_id();
  EXPECT_EQ(event.session_created().start_time_ms(), kStartMs);
  EXPECT_EQ(engine_->GetStats().global.active_users, 1u);

  detector_->QueueHit(kStartMs + 100);
  tracker::UploadAudioResponse uploaded;
  ASSERT_TRUE(Upload(id, &uploaded).ok());
  EXPECT_EQ(scheduler_->PendingCount(), 1u);

  connect_ctx.TryCancel();
  EXPECT_FALSE(reader->Read(&event));
  EXPECT_EQ(reader->Finish().error_code(), grpc::StatusCode::CANCELLED);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (engine_->GetStats().active_sessions != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  grpc::ClientContext stats_ctx;
  tracker::StatsResponse stats;
  ASSERT_TRUE(stub_->GetStats(&stats_ctx, tracker::GetStatsRequest(), &stats).ok());
  EXPECT_EQ(stats.active_users(), 0u);
  EXPECT_EQ(stats.active_sessions(), 0u);
  EXPECT_EQ(stats.total_sessions(), 1u);
  EXPECT_EQ(scheduler_->PendingCount(), 0u);

  grpc::ClientContext get_ctx;
  tracker::GetSessionRequest get;
  get.set_session_id(id);
  tracker::SessionDetail detail;
  EXPECT_EQ(stub_->GetSession(&get_ctx, get, &detail).error_code(), grpc::StatusCode::NOT_FOUND);
}

TEST_F(BellTrackerServiceContractTest, SVC_010_CloseSessionEndsConnectStream) {
  grpc::ClientContext connect_ctx;
  auto reader = stub_->Connect(&connect_ctx, tracker::OpenSessionRequest());

  tracker::ConnectionEvent event;
  ASSERT_TRUE(reader->Read(&event));
  ASSERT_TRUE(event.has_session_created());
  const std::string id = event.session_created().session_id();

  {
    grpc::ClientContext ctx;
    tracker::CloseSessionRequest request;
    request.set_session_id(id);
    tracker::CloseSessionResponse response;
    ASSERT_TRUE(stub_->CloseSession(&ctx, request, &response).ok());
  }

  ASSERT_TRUE(reader->Read(&event));
  ASSERT_TRUE(event.has_session_closed());
  EXPECT_EQ(event.session_closed().session_id(), id);
  EXPECT_EQ(event.session_closed().reason(), "closed");
  EXPECT_FALSE(reader->Read(&event));
  EXPECT_TRUE(reader->Finish().ok());
  EXPECT_EQ(engine_->GetStats().global.active_users, 0u);
}

}  // namespace bellwatch::tests::contracts
