// Repository: Reelkit-playlist
// Component: PlaylistControl gRPC Service Implementation
// Purpose: Exposes one PlaylistController over the PlaylistControl service.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_PLAYLIST_CONTROL_SERVICE_H_
#define REELKIT_PLAYLIST_CONTROL_SERVICE_H_

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "playlist_control.grpc.pb.h"
#include "playlist_control.pb.h"
#include "reelkit/bandwidth/BandwidthEstimator.hpp"
#include "reelkit/playlist/PlaylistController.hpp"
#include "reelkit/runtime/EventLoop.hpp"
#include "reelkit/runtime/Observable.hpp"

namespace reelkit {
namespace service {

// Converts a wire item to the domain type.  Returns false and fills `error`
// for items that cannot be played as described (missing URL, non-positive
// duration, repeat count < 1).
bool ItemFromProto(const reelkit::v1::PlaylistItem& in,
                   playlist::PlaylistItem* out, std::string* error);
void ItemToProto(const playlist::PlaylistItem& in, reelkit::v1::PlaylistItem* out);

// PlaylistControlImpl implements the gRPC service defined in
// playlist_control.proto.  This is a thin adapter: every call is marshaled
// onto the event loop that owns the controller and blocks until it ran.
class PlaylistControlImpl final : public reelkit::v1::PlaylistControl::Service {
 public:
  // `loop`, `controller` and `bandwidth` must outlive the service.
  // `controller` must have been constructed on `loop`.  `bandwidth` may be
  // null, in which case ReportBandwidth fails with FAILED_PRECONDITION.
  PlaylistControlImpl(runtime::EventLoop* loop,
                      playlist::PlaylistController* controller,
                      bandwidth::BandwidthEstimator* bandwidth);
  ~PlaylistControlImpl() override;

  PlaylistControlImpl(const PlaylistControlImpl&) = delete;
  PlaylistControlImpl& operator=(const PlaylistControlImpl&) = delete;

  // RPC implementations
  grpc::Status SetItems(grpc::ServerContext* context,
                        const reelkit::v1::SetItemsRequest* request,
                        reelkit::v1::ControlResponse* response) override;

  grpc::Status AdvanceToNext(grpc::ServerContext* context,
                             const reelkit::v1::NavigateRequest* request,
                             reelkit::v1::ControlResponse* response) override;

  grpc::Status MoveToPrevious(grpc::ServerContext* context,
                              const reelkit::v1::NavigateRequest* request,
                              reelkit::v1::ControlResponse* response) override;

  grpc::Status SetCurrentIndex(grpc::ServerContext* context,
                               const reelkit::v1::SetCurrentIndexRequest* request,
                               reelkit::v1::ControlResponse* response) override;

  grpc::Status SetFocus(grpc::ServerContext* context,
                        const reelkit::v1::SetFocusRequest* request,
                        reelkit::v1::ControlResponse* response) override;

  grpc::Status Play(grpc::ServerContext* context,
                    const reelkit::v1::PlaybackRequest* request,
                    reelkit::v1::ControlResponse* response) override;

  grpc::Status Pause(grpc::ServerContext* context,
                     const reelkit::v1::PlaybackRequest* request,
                     reelkit::v1::ControlResponse* response) override;

  grpc::Status SetRate(grpc::ServerContext* context,
                       const reelkit::v1::SetRateRequest* request,
                       reelkit::v1::ControlResponse* response) override;

  grpc::Status SetProgress(grpc::ServerContext* context,
                           const reelkit::v1::SetProgressRequest* request,
                           reelkit::v1::ControlResponse* response) override;

  grpc::Status GetState(grpc::ServerContext* context,
                        const reelkit::v1::GetStateRequest* request,
                        reelkit::v1::ControlResponse* response) override;

  grpc::Status ReportBandwidth(grpc::ServerContext* context,
                               const reelkit::v1::ReportBandwidthRequest* request,
                               reelkit::v1::ControlResponse* response) override;

  grpc::Status GetMetrics(grpc::ServerContext* context,
                          const reelkit::v1::GetMetricsRequest* request,
                          reelkit::v1::GetMetricsResponse* response) override;

  grpc::Status SubscribeEvents(
      grpc::ServerContext* context,
      const reelkit::v1::SubscribeEventsRequest* request,
      grpc::ServerWriter<reelkit::v1::PlaylistEvent>* writer) override;

  // Ends every open event stream.  Called before server shutdown so that
  // streaming handlers return.
  void CloseEventStreams();

 private:
  // One per open SubscribeEvents call.  The loop thread pushes, the
  // handler thread drains and writes.
  struct EventStream {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<reelkit::v1::PlaylistEvent> pending;
    bool closed = false;
  };

  static constexpr size_t kMaxPendingEvents = 256;

  // Runs `fn` on the loop.  Returns UNAVAILABLE if the loop has stopped.
  grpc::Status RunOnLoop(const char* rpc, const std::function<void()>& fn);

  // Loop thread only.
  void FillState(reelkit::v1::PlaylistState* out) const;
  void ScheduleStateEvent();
  void Broadcast(const reelkit::v1::PlaylistEvent& event);

  runtime::EventLoop* loop_;
  playlist::PlaylistController* controller_;
  bandwidth::BandwidthEstimator* bandwidth_;

  // Loop thread only.
  std::vector<runtime::Subscription> subscriptions_;
  bool state_event_pending_ = false;
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

  // Event subscribers (for SubscribeEvents streaming)
  std::mutex event_mutex_;
  std::vector<std::shared_ptr<EventStream>> event_streams_;
  std::atomic<bool> streams_closed_{false};
};

}  // namespace service
}  // namespace reelkit

#endif  // REELKIT_PLAYLIST_CONTROL_SERVICE_H_
