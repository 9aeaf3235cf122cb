// Repository: Reelkit-playlist
// Component: Playback Notifier
// Purpose: Analytics side-channel for video lifecycle events.  Observers
//          only; nothing in playback depends on who listens.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_NOTIFY_PLAYBACK_NOTIFIER_HPP_
#define REELKIT_NOTIFY_PLAYBACK_NOTIFIER_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "reelkit/runtime/Observable.hpp"
#include "reelkit/time/ITimeSource.hpp"

namespace reelkit::notify {

enum class PlaybackEventKind {
  kVideoRequested,  // Renderer asked to open a video URL
  kVideoStarted,    // First frame presented
  kVideoStalled,    // Playback waiting on data
  kVideoError,      // Open or decode failure
};

const char* PlaybackEventKindName(PlaybackEventKind kind);

// All timestamps are epoch ms integers.
struct PlaybackEvent {
  PlaybackEventKind kind = PlaybackEventKind::kVideoRequested;
  int64_t timestamp_utc_ms = 0;
  std::string url;
  std::optional<std::string> error;
  uint64_t sequence = 0;
  std::string controller_id;
};

// Emits playback events to subscribers, stamping sequence and wall time.
// Called on the owner executor; subscribers run synchronously there.
class PlaybackNotifier {
 public:
  using Handler = std::function<void(const PlaybackEvent&)>;

  PlaybackNotifier(std::string controller_id,
                   const time::ITimeSource* clock);

  void EmitVideoRequested(const std::string& url);
  void EmitVideoStarted(const std::string& url);
  void EmitVideoStalled(const std::string& url);
  void EmitVideoError(const std::string& url, const std::string& error);

  [[nodiscard]] runtime::Subscription Subscribe(Handler handler);

  uint64_t CurrentSequence() const { return sequence_; }
  const std::string& ControllerId() const { return controller_id_; }

 private:
  void Emit(PlaybackEventKind kind, const std::string& url,
            std::optional<std::string> error);

  std::string controller_id_;
  const time::ITimeSource* clock_;
  uint64_t sequence_ = 0;
  runtime::Signal<PlaybackEvent> events_;
};

}  // namespace reelkit::notify

#endif  // REELKIT_NOTIFY_PLAYBACK_NOTIFIER_HPP_
