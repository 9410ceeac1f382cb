// Repository: BellWatch
// Component: BellTracker gRPC Service Implementation
// Purpose: Implements the BellTracker service interface over BellEngine.
// Copyright (c) 2026 BellWatch

#include "bell_tracker_service.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <sstream>
#include <utility>

#include "bellwatch/util/Logger.hpp"

namespace bellwatch
{
  namespace tracker
  {

    using bellwatch::util::Logger;

    namespace
    {
      // SubscribeBellEvents and Connect poll at this interval for cancellation.
      constexpr auto kSubscriberPollInterval = std::chrono::milliseconds(100);

      BellType ToProto(runtime::BellType type)
      {
        return type == runtime::BellType::kDouble ? BELL_TYPE_DOUBLE : BELL_TYPE_SINGLE;
      }

      BusStatus ToProto(runtime::BusStatus status)
      {
        switch (status)
        {
        case runtime::BusStatus::kStopping:
          return BUS_STATUS_STOPPING;
        case runtime::BusStatus::kStarting:
          return BUS_STATUS_STARTING;
        case runtime::BusStatus::kIdle:
          break;
        }
        return BUS_STATUS_IDLE;
      }

      TimelineType ToProto(runtime::TimelineType type)
      {
        return type == runtime::TimelineType::kStarting ? TIMELINE_TYPE_STARTING
                                                        : TIMELINE_TYPE_STOPPING;
      }

      void FillBell(const runtime::BellEvent &in, tracker::BellEvent *out)
      {
        out->set_id(in.id);
        out->set_type(ToProto(in.type));
        out->set_timestamp_ms(in.timestamp_ms);
        out->set_confidence(in.confidence);
        out->set_frequency_hz(in.frequency_hz);
        out->set_duration_ms(in.duration_ms);
        out->set_time(in.time);
      }

      void FillTimeline(const runtime::TimelineEvent &in, tracker::TimelineEvent *out)
      {
        out->set_id(in.id);
        out->set_type(ToProto(in.type));
        out->set_text(in.text);
        out->set_timestamp_ms(in.timestamp_ms);
        out->set_time(in.time);
        out->set_confidence(in.confidence);
      }

      void FillStats(const runtime::SessionStats &in, tracker::SessionStats *out)
      {
        out->set_single_bells(in.single_bells);
        out->set_double_bells(in.double_bells);
        out->set_total_stops(in.total_stops);
        out->set_bus_status(ToProto(in.bus_status));
      }

      void FillDetection(const runtime::ApplyResult &in, BellDetected *out)
      {
        out->set_session_id(in.session_id);
        FillBell(in.bell_event, out->mutable_bell());
        FillTimeline(in.timeline_event, out->mutable_timeline_event());
        FillStats(in.session_stats, out->mutable_session_stats());
      }

      runtime::AudioPayload ToPayload(const std::string &mime_type,
                                      const std::string &filename,
                                      const std::string &data)
      {
        runtime::AudioPayload payload;
        payload.mime_type = mime_type;
        payload.filename = filename;
        payload.data.assign(data.begin(), data.end());
        return payload;
      }

      // Per-stream handoff between the publishing thread and the RPC thread.
      // Connect uses only the closed flag.
      struct SubscriberQueue
      {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<BellDetected> pending;
        bool closed = false;
      };

    } // namespace

    grpc::Status ToGrpcStatus(const runtime::EngineResult &result)
    {
      if (result.success)
      {
        return grpc::Status::OK;
      }
      grpc::StatusCode code = grpc::StatusCode::INTERNAL;
      switch (result.result_code)
      {
      case runtime::ResultCode::kNotFound:
        code = grpc::StatusCode::NOT_FOUND;
        break;
      case runtime::ResultCode::kInvalidInput:
        code = grpc::StatusCode::INVALID_ARGUMENT;
        break;
      case runtime::ResultCode::kNotRecording:
        code = grpc::StatusCode::FAILED_PRECONDITION;
        break;
      case runtime::ResultCode::kDetectorFailure:
      case runtime::ResultCode::kOk:
        return grpc::Status::OK;
      case runtime::ResultCode::kUnspecified:
        break;
      }
      return grpc::Status(code, result.message);
    }

    BellTrackerImpl::BellTrackerImpl(std::shared_ptr<runtime::BellEngine> engine)
        : engine_(std::move(engine)),
          started_ms_(engine_->NowMs())
    {
    }

    BellTrackerImpl::~BellTrackerImpl()
    {
      Shutdown();
    }

    void BellTrackerImpl::Shutdown()
    {
      shutting_down_.store(true, std::memory_order_release);
    }

    grpc::Status BellTrackerImpl::OpenSession(grpc::ServerContext *context,
                                              const OpenSessionRequest *request,
                                              SessionCreated *response)
    {
      std::string connection_id = request->connection_id();
      if (connection_id.empty() && context != nullptr)
      {
        connection_id = context->peer();
      }

      auto info = engine_->OpenSession(connection_id);
      response->set_session_id(info.session_id);
      response->set_start_time_ms(info.start_time_ms);
      return grpc::Status::OK;
    }

    grpc::Status BellTrackerImpl::CloseSession(grpc::ServerContext *context,
                                               const CloseSessionRequest *request,
                                               CloseSessionResponse *response)
    {
      auto result = engine_->CloseSession(request->session_id());
      response->set_success(result.success);
      response->set_message(result.message);
      return ToGrpcStatus(result);
    }

    grpc::Status BellTrackerImpl::Connect(grpc::ServerContext *context,
                                          const OpenSessionRequest *request,
                                          grpc::ServerWriter<ConnectionEvent> *writer)
    {
      std::string connection_id = request->connection_id();
      if (connection_id.empty())
      {
        connection_id = context->peer();
      }

      const auto info = engine_->OpenSession(connection_id);
      auto queue = std::make_shared<SubscriberQueue>();
      const uint64_t token = engine_->Subscribe(
          info.session_id, nullptr,
          [queue]()
          {
            {
              std::lock_guard<std::mutex> lock(queue->mutex);
              queue->closed = true;
            }
            queue->cv.notify_one();
          });

      ConnectionEvent created;
      created.mutable_session_created()->set_session_id(info.session_id);
      created.mutable_session_created()->set_start_time_ms(info.start_time_ms);
      bool client_gone = !writer->Write(created);
      bool closed = token == 0;

      while (!client_gone && !closed)
      {
        {
          std::unique_lock<std::mutex> lock(queue->mutex);
          queue->cv.wait_for(lock, kSubscriberPollInterval,
                             [&queue]
                             { return queue->closed; });
          closed = queue->closed;
        }
        if (closed || shutting_down_.load(std::memory_order_acquire))
        {
          break;
        }
        client_gone = context->IsCancelled();
      }
      engine_->Unsubscribe(token);

      if (client_gone)
      {
        // Connection lost: same teardown as an explicit CloseSession.
        auto result = engine_->CloseSession(info.session_id);
        std::ostringstream oss;
        oss << "[Connect] CONNECTION_LOST session=" << info.session_id
            << " connection=" << connection_id
            << " closed=" << (result.success ? "true" : "false");
        Logger::Info(oss.str());
        return grpc::Status(grpc::StatusCode::CANCELLED, "client disconnected");
      }

      ConnectionEvent ended;
      ended.mutable_session_closed()->set_session_id(info.session_id);
      ended.mutable_session_closed()->set_reason(closed ? "closed" : "shutdown");
      if (!writer->Write(ended))
      {
        Logger::Debug("[Connect] SESSION_CLOSED_NOT_DELIVERED session=" + info.session_id);
      }
      return grpc::Status::OK;
    }

    grpc::Status BellTrackerImpl::StartRecording(grpc::ServerContext *context,
                                                 const RecordingRequest *request,
                                                 RecordingAck *response)
    {
      auto result = engine_->StartRecording(request->session_id());
      if (!result.success)
      {
        return ToGrpcStatus(result);
      }
      response->set_session_id(request->session_id());
      response->set_timestamp_ms(engine_->NowMs());
      response->set_is_recording(true);
      return grpc::Status::OK;
    }

    grpc::Status BellTrackerImpl::StopRecording(grpc::ServerContext *context,
                                                const RecordingRequest *request,
                                                RecordingAck *response)
    {
      auto result = engine_->StopRecording(request->session_id());
      if (!result.success)
      {
        return ToGrpcStatus(result);
      }
      response->set_session_id(request->session_id());
      response->set_timestamp_ms(engine_->NowMs());
      response->set_is_recording(false);
      return grpc::Status::OK;
    }

    grpc::Status BellTrackerImpl::UploadAudio(grpc::ServerContext *context,
                                              const UploadAudioRequest *request,
                                              UploadAudioResponse *response)
    {
      auto payload = ToPayload(request->mime_type(), request->filename(), request->data());
      auto result = engine_->IngestAudio(request->session_id(), payload);

      response->set_success(result.status.success);
      response->set_message(result.status.message);
      response->set_detected(result.detection.has_value());
      if (result.detection)
      {
        FillDetection(*result.detection, response->mutable_detection());
      }
      return ToGrpcStatus(result.status);
    }

    grpc::Status BellTrackerImpl::StreamAudio(grpc::ServerContext *context,
                                              grpc::ServerReader<AudioChunk> *reader,
                                              StreamAudioSummary *response)
    {
      AudioChunk chunk;
      std::string session_id;
      uint64_t received = 0;
      uint64_t processed = 0;
      uint64_t rejected = 0;
      uint64_t detections = 0;

      while (reader->Read(&chunk))
      {
        ++received;
        if (session_id.empty())
        {
          session_id = chunk.session_id();
          if (session_id.empty())
          {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                "first chunk must carry session_id");
          }
        }

        auto result = engine_->IngestStreamChunk(session_id, ToPayload("", "", chunk.data()));
        if (result.status.result_code == runtime::ResultCode::kNotFound)
        {
          return ToGrpcStatus(result.status);
        }
        if (!result.status.success)
        {
          ++rejected;
          continue;
        }
        ++processed;
        if (result.detection)
        {
          ++detections;
        }
      }

      response->set_session_id(session_id);
      response->set_chunks_received(received);
      response->set_chunks_processed(processed);
      response->set_chunks_rejected(rejected);
      response->set_detections(detections);

      std::ostringstream oss;
      oss << "[StreamAudio] STREAM_END session=" << session_id << " received=" << received
          << " processed=" << processed << " rejected=" << rejected
          << " detections=" << detections;
      Logger::Info(oss.str());
      return grpc::Status::OK;
    }

    grpc::Status BellTrackerImpl::GetSession(grpc::ServerContext *context,
                                             const GetSessionRequest *request,
                                             SessionDetail *response)
    {
      auto view = engine_->GetSession(request->session_id());
      if (!view)
      {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "Session not found: " + request->session_id());
      }

      response->set_id(view->id);
      response->set_start_time_ms(view->start_time_ms);
      response->set_is_recording(view->is_recording);
      FillStats(view->stats, response->mutable_stats());
      for (const auto &bell : view->bell_history)
      {
        FillBell(bell, response->add_bell_history());
      }
      for (const auto &entry : view->timeline)
      {
        FillTimeline(entry, response->add_timeline());
      }
      response->set_last_activity_ms(view->last_activity_ms);
      return grpc::Status::OK;
    }

    grpc::Status BellTrackerImpl::ExportSession(grpc::ServerContext *context,
                                                const ExportSessionRequest *request,
                                                SessionExport *response)
    {
      auto snapshot = engine_->ExportSession(request->session_id());
      if (!snapshot)
      {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "Session not found: " + request->session_id());
      }

      response->set_session_id(snapshot->session_id);
      response->set_start_time_ms(snapshot->start_time_ms);
      response->set_export_time_ms(snapshot->export_time_ms);
      response->set_duration_ms(snapshot->duration_ms);
      FillStats(snapshot->stats, response->mutable_stats());
      for (const auto &bell : snapshot->bell_history)
      {
        FillBell(bell, response->add_bell_history());
      }
      for (const auto &entry : snapshot->timeline)
      {
        FillTimeline(entry, response->add_timeline());
      }
      response->mutable_metadata()->set_version(runtime::SessionExport::kVersion);
      response->mutable_metadata()->set_format(runtime::SessionExport::kFormat);
      response->set_written(snapshot->written);
      response->set_written_path(snapshot->written_path);
      return grpc::Status::OK;
    }

    grpc::Status BellTrackerImpl::GetStats(grpc::ServerContext *context,
                                           const GetStatsRequest *request,
                                           StatsResponse *response)
    {
      auto stats = engine_->GetStats();
      response->set_total_sessions(stats.global.total_sessions);
      response->set_total_bells_detected(stats.global.total_bells_detected);
      response->set_total_stops(stats.global.total_stops);
      response->set_active_users(stats.global.active_users);
      response->set_active_sessions(stats.active_sessions);
      response->set_timestamp_ms(stats.timestamp_ms);
      return grpc::Status::OK;
    }

    grpc::Status BellTrackerImpl::GetHistory(grpc::ServerContext *context,
                                             const GetHistoryRequest *request,
                                             HistoryResponse *response)
    {
      runtime::HistoryQuery query;
      if (request->has_start_ms())
      {
        query.start_ms = request->start_ms();
      }
      if (request->has_end_ms())
      {
        query.end_ms = request->end_ms();
      }
      if (request->type() == BELL_TYPE_SINGLE)
      {
        query.type = runtime::BellType::kSingle;
      }
      else if (request->type() == BELL_TYPE_DOUBLE)
      {
        query.type = runtime::BellType::kDouble;
      }

      auto result = engine_->QueryHistory(query);
      for (const auto &entry : result.entries)
      {
        auto *out = response->add_bells();
        FillBell(entry.bell, out->mutable_bell());
        out->set_session_id(entry.session_id);
      }
      response->set_total(result.total);

      auto *filters = response->mutable_filters();
      if (query.start_ms)
      {
        filters->set_start_ms(*query.start_ms);
      }
      if (query.end_ms)
      {
        filters->set_end_ms(*query.end_ms);
      }
      filters->set_type(request->type());
      return grpc::Status::OK;
    }

    grpc::Status BellTrackerImpl::SubscribeBellEvents(grpc::ServerContext *context,
                                                      const SubscribeBellEventsRequest *request,
                                                      grpc::ServerWriter<BellDetected> *writer)
    {
      const std::string session_id = request->session_id();
      auto queue = std::make_shared<SubscriberQueue>();

      const uint64_t token = engine_->Subscribe(
          session_id,
          [queue](const runtime::ApplyResult &result)
          {
            BellDetected event;
            FillDetection(result, &event);
            {
              std::lock_guard<std::mutex> lock(queue->mutex);
              queue->pending.push_back(std::move(event));
            }
            queue->cv.notify_one();
          },
          [queue]()
          {
            {
              std::lock_guard<std::mutex> lock(queue->mutex);
              queue->closed = true;
            }
            queue->cv.notify_one();
          });
      if (token == 0)
      {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "Session not found: " + session_id);
      }

      Logger::Info("[SubscribeBellEvents] SUBSCRIBED session=" + session_id);

      bool writer_ok = true;
      while (writer_ok)
      {
        std::deque<BellDetected> batch;
        bool closed = false;
        {
          std::unique_lock<std::mutex> lock(queue->mutex);
          queue->cv.wait_for(lock, kSubscriberPollInterval,
                             [&queue]
                             { return !queue->pending.empty() || queue->closed; });
          batch.swap(queue->pending);
          closed = queue->closed;
        }

        for (const auto &event : batch)
        {
          if (!writer->Write(event))
          {
            writer_ok = false;
            break;
          }
        }

        if (closed || context->IsCancelled() ||
            shutting_down_.load(std::memory_order_acquire))
        {
          break;
        }
      }

      engine_->Unsubscribe(token);
      Logger::Info("[SubscribeBellEvents] UNSUBSCRIBED session=" + session_id);
      return grpc::Status::OK;
    }

    grpc::Status BellTrackerImpl::GetHealth(grpc::ServerContext *context,
                                            const HealthRequest *request,
                                            HealthResponse *response)
    {
      const int64_t now_ms = engine_->NowMs();
      response->set_status("healthy");
      response->set_timestamp_ms(now_ms);
      response->set_uptime_s((now_ms - started_ms_) / 1000);
      response->set_version(kServerVersion);
      return grpc::Status::OK;
    }

  } // namespace tracker
} // namespace bellwatch
