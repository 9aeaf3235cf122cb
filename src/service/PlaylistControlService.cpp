// Repository: Reelkit-playlist
// Component: PlaylistControl gRPC Service Implementation
// Purpose: Exposes one PlaylistController over the PlaylistControl service.
// Copyright (c) 2025 RetroVue

#include "PlaylistControlService.h"

#include <chrono>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

#include "reelkit/util/Logger.hpp"

namespace reelkit {
namespace service {

namespace {

using reelkit::util::LogLine;
using reelkit::util::Logger;

namespace v1 = reelkit::v1;

constexpr auto kStreamPollInterval = std::chrono::milliseconds(100);

v1::ItemStatus StatusToProto(playlist::ItemStatus status) {
  switch (status) {
    case playlist::ItemStatus::kLoading: return v1::ITEM_STATUS_LOADING;
    case playlist::ItemStatus::kReady:   return v1::ITEM_STATUS_READY;
    case playlist::ItemStatus::kError:   return v1::ITEM_STATUS_ERROR;
  }
  return v1::ITEM_STATUS_LOADING;
}

v1::PlaybackNotification::Kind NotificationKindToProto(
    notify::PlaybackEventKind kind) {
  switch (kind) {
    case notify::PlaybackEventKind::kVideoRequested:
      return v1::PlaybackNotification::VIDEO_REQUESTED;
    case notify::PlaybackEventKind::kVideoStarted:
      return v1::PlaybackNotification::VIDEO_STARTED;
    case notify::PlaybackEventKind::kVideoStalled:
      return v1::PlaybackNotification::VIDEO_STALLED;
    case notify::PlaybackEventKind::kVideoError:
      return v1::PlaybackNotification::VIDEO_ERROR;
  }
  return v1::PlaybackNotification::VIDEO_ERROR;
}

bool BehaviorFromProto(const v1::Behavior& in, playlist::Behavior* out,
                       std::string* error) {
  switch (in.kind()) {
    case v1::Behavior::LOOP:
      *out = playlist::Behavior::Loop();
      return true;
    case v1::Behavior::REPEAT:
      if (in.count() < 1) {
        *error = "repeat count must be >= 1";
        return false;
      }
      *out = playlist::Behavior::Repeat(in.count());
      return true;
    default:
      *out = playlist::Behavior::PlayOnce();
      return true;
  }
}

}  // namespace

bool ItemFromProto(const v1::PlaylistItem& in, playlist::PlaylistItem* out,
                   std::string* error) {
  playlist::Behavior behavior;
  if (!BehaviorFromProto(in.behavior(), &behavior, error)) return false;

  switch (in.kind()) {
    case v1::PlaylistItem::IMAGE:
      if (in.url().empty()) {
        *error = "image item requires a url";
        return false;
      }
      if (!(in.duration_s() > 0.0) || !std::isfinite(in.duration_s())) {
        *error = "image item requires a positive duration_s";
        return false;
      }
      *out = playlist::PlaylistItem::Image(in.url(), in.duration_s(),
                                           behavior, in.id());
      return true;
    case v1::PlaylistItem::VIDEO:
      if (in.url().empty()) {
        *error = "video item requires a url";
        return false;
      }
      *out = playlist::PlaylistItem::Video(in.url(), behavior, in.id());
      return true;
    case v1::PlaylistItem::CUSTOM:
      if (!(in.duration_s() > 0.0) || !std::isfinite(in.duration_s())) {
        *error = "custom item requires a positive duration_s";
        return false;
      }
      *out = playlist::PlaylistItem::Custom(in.duration_s(), behavior, in.id());
      return true;
    case v1::PlaylistItem::ERROR:
      *out = playlist::PlaylistItem::Error(behavior, in.id());
      return true;
    default:
      *error = "unknown item kind";
      return false;
  }
}

void ItemToProto(const playlist::PlaylistItem& in, v1::PlaylistItem* out) {
  out->set_id(in.id);
  switch (in.Kind()) {
    case playlist::ItemKind::kImage:  out->set_kind(v1::PlaylistItem::IMAGE); break;
    case playlist::ItemKind::kVideo:  out->set_kind(v1::PlaylistItem::VIDEO); break;
    case playlist::ItemKind::kCustom: out->set_kind(v1::PlaylistItem::CUSTOM); break;
    case playlist::ItemKind::kError:  out->set_kind(v1::PlaylistItem::ERROR); break;
  }
  out->set_url(in.Url());
  out->set_duration_s(in.FixedDurationSeconds());
  auto* behavior = out->mutable_behavior();
  switch (in.behavior.kind) {
    case playlist::Behavior::Kind::kPlayOnce:
      behavior->set_kind(v1::Behavior::PLAY_ONCE);
      break;
    case playlist::Behavior::Kind::kLoop:
      behavior->set_kind(v1::Behavior::LOOP);
      break;
    case playlist::Behavior::Kind::kRepeat:
      behavior->set_kind(v1::Behavior::REPEAT);
      behavior->set_count(in.behavior.count);
      break;
  }
}

PlaylistControlImpl::PlaylistControlImpl(runtime::EventLoop* loop,
                                         playlist::PlaylistController* controller,
                                         bandwidth::BandwidthEstimator* bandwidth)
    : loop_(loop), controller_(controller), bandwidth_(bandwidth) {
  if (!loop_ || !controller_) {
    throw std::invalid_argument("PlaylistControlImpl: loop and controller required");
  }

  const bool subscribed = loop_->InvokeAndWait([this] {
    auto on_state = [this](const auto&) { ScheduleStateEvent(); };
    subscriptions_.push_back(controller_->Items().Subscribe(on_state));
    subscriptions_.push_back(controller_->CurrentIndex().Subscribe(on_state));
    subscriptions_.push_back(controller_->Rate().Subscribe(on_state));
    subscriptions_.push_back(controller_->IsFocused().Subscribe(on_state));
    subscriptions_.push_back(controller_->IsPlaying().Subscribe(on_state));
    subscriptions_.push_back(controller_->Status().Subscribe(on_state));
    subscriptions_.push_back(controller_->ProgressSeconds().Subscribe(on_state));
    subscriptions_.push_back(controller_->DurationSeconds().Subscribe(on_state));

    subscriptions_.push_back(controller_->ItemReachedEnd().Subscribe(
        [this](const playlist::PlaylistItem& item) {
          v1::PlaylistEvent event;
          auto* ended = event.mutable_item_reached_end();
          ended->set_item_id(item.id);
          ended->set_index(controller_->CurrentIndex().Get());
          Broadcast(event);
        }));

    subscriptions_.push_back(controller_->ReachedEnd().Subscribe([this] {
      v1::PlaylistEvent event;
      event.mutable_playlist_reached_end()->set_index(
          controller_->CurrentIndex().Get());
      Broadcast(event);
    }));

    subscriptions_.push_back(controller_->Notifier().Subscribe(
        [this](const notify::PlaybackEvent& e) {
          v1::PlaylistEvent event;
          auto* n = event.mutable_playback();
          n->set_kind(NotificationKindToProto(e.kind));
          n->set_timestamp_utc_ms(e.timestamp_utc_ms);
          n->set_url(e.url);
          if (e.error) n->set_error(*e.error);
          n->set_sequence(e.sequence);
          Broadcast(event);
        }));
  });
  if (!subscribed) {
    throw std::runtime_error("PlaylistControlImpl: event loop is not running");
  }
}

PlaylistControlImpl::~PlaylistControlImpl() {
  CloseEventStreams();
  // Handlers and posted tasks run on the loop; tear them down there.
  auto teardown = [this] {
    subscriptions_.clear();
    alive_.reset();
  };
  if (!loop_->InvokeAndWait(teardown)) {
    // Loop already stopped: nothing can run concurrently any more.
    teardown();
  }
}

grpc::Status PlaylistControlImpl::RunOnLoop(const char* rpc,
                                            const std::function<void()>& fn) {
  if (!loop_->InvokeAndWait(fn)) {
    Logger::Warn(LogLine(rpc, "LOOP_UNAVAILABLE").Str());
    return grpc::Status(grpc::StatusCode::UNAVAILABLE, "event loop stopped");
  }
  return grpc::Status::OK;
}

void PlaylistControlImpl::FillState(v1::PlaylistState* out) const {
  const playlist::PlaylistState s = controller_->Snapshot();
  out->set_status(StatusToProto(s.status));
  out->set_progress_s(s.progress_s);
  out->set_duration_s(s.duration_s);
  out->set_rate(s.rate);
  out->set_is_playing(s.is_playing);
  out->set_is_focused(s.is_focused);
  out->set_current_index(s.current_index);
  out->set_item_count(s.item_count);
  if (auto item = controller_->CurrentItem()) {
    out->set_current_item_id(item->id);
  }
  out->set_backward_buffer(controller_->WindowManager().BackwardBuffer());
  out->set_forward_buffer(controller_->WindowManager().ForwardBuffer());
  out->set_controller_id(controller_->Id());
}

// Several observables change per operation; coalesce them into one event
// that carries the settled snapshot.
void PlaylistControlImpl::ScheduleStateEvent() {
  if (state_event_pending_) return;
  state_event_pending_ = true;
  std::weak_ptr<bool> alive = alive_;
  loop_->Post([this, alive] {
    if (alive.expired()) return;
    state_event_pending_ = false;
    v1::PlaylistEvent event;
    FillState(event.mutable_state_changed());
    Broadcast(event);
  });
}

void PlaylistControlImpl::Broadcast(const v1::PlaylistEvent& event) {
  std::lock_guard<std::mutex> lock(event_mutex_);
  for (auto& stream : event_streams_) {
    {
      std::lock_guard<std::mutex> stream_lock(stream->mutex);
      if (stream->pending.size() >= kMaxPendingEvents) {
        stream->pending.pop_front();
      }
      stream->pending.push_back(event);
    }
    stream->cv.notify_one();
  }
}

void PlaylistControlImpl::CloseEventStreams() {
  streams_closed_.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(event_mutex_);
  for (auto& stream : event_streams_) {
    {
      std::lock_guard<std::mutex> stream_lock(stream->mutex);
      stream->closed = true;
    }
    stream->cv.notify_all();
  }
}

// ============================================================================
// RPCs
// ============================================================================

grpc::Status PlaylistControlImpl::SetItems(grpc::ServerContext* context,
                                           const v1::SetItemsRequest* request,
                                           v1::ControlResponse* response) {
  Logger::Info(LogLine("SetItems", "Request received")
                   .Kv("count", request->items_size())
                   .Str());

  std::vector<playlist::PlaylistItem> items;
  items.reserve(static_cast<size_t>(request->items_size()));
  for (int i = 0; i < request->items_size(); ++i) {
    playlist::PlaylistItem item;
    std::string error;
    if (!ItemFromProto(request->items(i), &item, &error)) {
      const std::string message =
          "item " + std::to_string(i) + ": " + error;
      response->set_success(false);
      response->set_message(message);
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, message);
    }
    items.push_back(std::move(item));
  }

  auto status = RunOnLoop("SetItems", [&] {
    controller_->SetItems(std::move(items));
    FillState(response->mutable_state());
  });
  response->set_success(status.ok());
  response->set_message(status.ok() ? "items set" : status.error_message());
  return status;
}

grpc::Status PlaylistControlImpl::AdvanceToNext(grpc::ServerContext* context,
                                                const v1::NavigateRequest* request,
                                                v1::ControlResponse* response) {
  Logger::Info(LogLine("AdvanceToNext", "Request received").Str());
  auto status = RunOnLoop("AdvanceToNext", [&] {
    controller_->AdvanceToNext();
    FillState(response->mutable_state());
  });
  response->set_success(status.ok());
  response->set_message(status.ok() ? "ok" : status.error_message());
  return status;
}

grpc::Status PlaylistControlImpl::MoveToPrevious(grpc::ServerContext* context,
                                                 const v1::NavigateRequest* request,
                                                 v1::ControlResponse* response) {
  Logger::Info(LogLine("MoveToPrevious", "Request received").Str());
  auto status = RunOnLoop("MoveToPrevious", [&] {
    controller_->MoveToPrevious();
    FillState(response->mutable_state());
  });
  response->set_success(status.ok());
  response->set_message(status.ok() ? "ok" : status.error_message());
  return status;
}

grpc::Status PlaylistControlImpl::SetCurrentIndex(
    grpc::ServerContext* context, const v1::SetCurrentIndexRequest* request,
    v1::ControlResponse* response) {
  const int32_t index = request->index();
  Logger::Info(LogLine("SetCurrentIndex", "Request received")
                   .Kv("index", index)
                   .Kv("animated", request->animated())
                   .Str());

  bool in_range = false;
  auto status = RunOnLoop("SetCurrentIndex", [&] {
    in_range = controller_->Store().IsValidIndex(index);
    if (in_range) controller_->SetCurrentIndex(index, request->animated());
    FillState(response->mutable_state());
  });
  if (!status.ok()) {
    response->set_success(false);
    response->set_message(status.error_message());
    return status;
  }
  if (!in_range) {
    const std::string message = "index " + std::to_string(index) +
                                " out of range";
    response->set_success(false);
    response->set_message(message);
    return grpc::Status(grpc::StatusCode::OUT_OF_RANGE, message);
  }
  response->set_success(true);
  response->set_message("ok");
  return grpc::Status::OK;
}

grpc::Status PlaylistControlImpl::SetFocus(grpc::ServerContext* context,
                                           const v1::SetFocusRequest* request,
                                           v1::ControlResponse* response) {
  Logger::Info(LogLine("SetFocus", "Request received")
                   .Kv("focused", request->focused())
                   .Str());
  auto status = RunOnLoop("SetFocus", [&] {
    controller_->SetFocus(request->focused());
    FillState(response->mutable_state());
  });
  response->set_success(status.ok());
  response->set_message(status.ok() ? "ok" : status.error_message());
  return status;
}

grpc::Status PlaylistControlImpl::Play(grpc::ServerContext* context,
                                       const v1::PlaybackRequest* request,
                                       v1::ControlResponse* response) {
  Logger::Info(LogLine("Play", "Request received").Str());
  auto status = RunOnLoop("Play", [&] {
    controller_->Play();
    FillState(response->mutable_state());
  });
  response->set_success(status.ok());
  response->set_message(status.ok() ? "ok" : status.error_message());
  return status;
}

grpc::Status PlaylistControlImpl::Pause(grpc::ServerContext* context,
                                        const v1::PlaybackRequest* request,
                                        v1::ControlResponse* response) {
  Logger::Info(LogLine("Pause", "Request received").Str());
  auto status = RunOnLoop("Pause", [&] {
    controller_->Pause();
    FillState(response->mutable_state());
  });
  response->set_success(status.ok());
  response->set_message(status.ok() ? "ok" : status.error_message());
  return status;
}

grpc::Status PlaylistControlImpl::SetRate(grpc::ServerContext* context,
                                          const v1::SetRateRequest* request,
                                          v1::ControlResponse* response) {
  const float rate = request->rate();
  Logger::Info(LogLine("SetRate", "Request received").Kv("rate", rate).Str());
  if (!std::isfinite(rate) || rate < 0.0f) {
    const std::string message = "rate must be a finite value >= 0";
    response->set_success(false);
    response->set_message(message);
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, message);
  }
  auto status = RunOnLoop("SetRate", [&] {
    controller_->SetRate(rate);
    FillState(response->mutable_state());
  });
  response->set_success(status.ok());
  response->set_message(status.ok() ? "ok" : status.error_message());
  return status;
}

grpc::Status PlaylistControlImpl::SetProgress(grpc::ServerContext* context,
                                              const v1::SetProgressRequest* request,
                                              v1::ControlResponse* response) {
  const double seconds = request->seconds();
  Logger::Info(LogLine("SetProgress", "Request received")
                   .Kv("seconds", seconds)
                   .Str());
  if (!std::isfinite(seconds)) {
    const std::string message = "seconds must be finite";
    response->set_success(false);
    response->set_message(message);
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, message);
  }
  auto status = RunOnLoop("SetProgress", [&] {
    controller_->SetProgress(seconds);
    FillState(response->mutable_state());
  });
  response->set_success(status.ok());
  response->set_message(status.ok() ? "ok" : status.error_message());
  return status;
}

grpc::Status PlaylistControlImpl::GetState(grpc::ServerContext* context,
                                           const v1::GetStateRequest* request,
                                           v1::ControlResponse* response) {
  auto status = RunOnLoop("GetState",
                          [&] { FillState(response->mutable_state()); });
  response->set_success(status.ok());
  response->set_message(status.ok() ? "ok" : status.error_message());
  return status;
}

grpc::Status PlaylistControlImpl::ReportBandwidth(
    grpc::ServerContext* context, const v1::ReportBandwidthRequest* request,
    v1::ControlResponse* response) {
  if (!bandwidth_) {
    const std::string message = "adaptive buffering disabled";
    response->set_success(false);
    response->set_message(message);
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, message);
  }

  switch (request->sample_case()) {
    case v1::ReportBandwidthRequest::kBitsPerSecond:
      Logger::Debug(LogLine("ReportBandwidth", "Request received")
                        .Kv("bps", request->bits_per_second())
                        .Str());
      bandwidth_->ReportSample(request->bits_per_second());
      break;
    case v1::ReportBandwidthRequest::kTransfer:
      Logger::Debug(LogLine("ReportBandwidth", "Request received")
                        .Kv("bytes", request->transfer().bytes())
                        .Kv("elapsed_ms", request->transfer().elapsed_ms())
                        .Str());
      bandwidth_->RecordTransfer(
          request->transfer().bytes(),
          std::chrono::milliseconds(request->transfer().elapsed_ms()));
      break;
    default: {
      const std::string message = "sample required";
      response->set_success(false);
      response->set_message(message);
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, message);
    }
  }

  // The estimator posts resize work to the loop; report state after it.
  auto status = RunOnLoop("ReportBandwidth",
                          [&] { FillState(response->mutable_state()); });
  response->set_success(status.ok());
  response->set_message(status.ok() ? "ok" : status.error_message());
  return status;
}

grpc::Status PlaylistControlImpl::GetMetrics(grpc::ServerContext* context,
                                             const v1::GetMetricsRequest* request,
                                             v1::GetMetricsResponse* response) {
  return RunOnLoop("GetMetrics", [&] {
    response->set_prometheus_text(controller_->Metrics().GeneratePrometheusText());
  });
}

grpc::Status PlaylistControlImpl::SubscribeEvents(
    grpc::ServerContext* context, const v1::SubscribeEventsRequest* request,
    grpc::ServerWriter<v1::PlaylistEvent>* writer) {
  Logger::Info(LogLine("SubscribeEvents", "Request received").Str());

  auto stream = std::make_shared<EventStream>();
  {
    std::lock_guard<std::mutex> lock(event_mutex_);
    if (streams_closed_.load(std::memory_order_acquire)) {
      return grpc::Status(grpc::StatusCode::UNAVAILABLE, "shutting down");
    }
    event_streams_.push_back(stream);
  }

  // Initial snapshot so the client does not wait for the first change.
  v1::PlaylistEvent initial;
  auto status = RunOnLoop("SubscribeEvents",
                          [&] { FillState(initial.mutable_state_changed()); });
  bool writable = status.ok() && writer->Write(initial);

  while (writable && !context->IsCancelled()) {
    std::deque<v1::PlaylistEvent> batch;
    {
      std::unique_lock<std::mutex> lock(stream->mutex);
      stream->cv.wait_for(lock, kStreamPollInterval, [&] {
        return stream->closed || !stream->pending.empty();
      });
      if (stream->closed) break;
      batch.swap(stream->pending);
    }
    for (const auto& event : batch) {
      if (!writer->Write(event)) {
        writable = false;
        break;
      }
    }
  }

  {
    std::lock_guard<std::mutex> lock(event_mutex_);
    for (auto it = event_streams_.begin(); it != event_streams_.end(); ++it) {
      if (*it == stream) {
        event_streams_.erase(it);
        break;
      }
    }
  }
  Logger::Info(LogLine("SubscribeEvents", "STREAM_CLOSED")
                   .Kv("cancelled", context->IsCancelled())
                   .Str());
  return status;
}

}  // namespace service
}  // namespace reelkit
