// Repository: Reelkit-playlist
// Component: Playlist Controller
// Purpose: Public API for one playback session.  Combines the playlist
//          store, the buffer window manager, and the play/focus/rate state
//          machine, and publishes the state of the current item.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_PLAYLIST_PLAYLIST_CONTROLLER_HPP_
#define REELKIT_PLAYLIST_PLAYLIST_CONTROLLER_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "reelkit/config/PlaylistConfig.hpp"
#include "reelkit/notify/PlaybackNotifier.hpp"
#include "reelkit/playlist/PlaylistItem.hpp"
#include "reelkit/playlist/PlaylistState.hpp"
#include "reelkit/playlist/PlaylistStore.hpp"
#include "reelkit/runtime/IExecutor.hpp"
#include "reelkit/runtime/Observable.hpp"
#include "reelkit/telemetry/PlaylistMetrics.hpp"
#include "reelkit/time/ITimeSource.hpp"
#include "reelkit/window/BufferWindowManager.hpp"

namespace reelkit::bandwidth {
class BandwidthEstimator;
}

namespace reelkit::playlist {

// PlaylistController owns the playlist store and the renderer pool.
//
// Threading: construct, call, destroy, and subscribe on `executor`.  Async
// completions from renderers and the image cache are marshaled there before
// they touch any state.
//
// State machine: {paused, playing} x {unfocused, focused}.
// - SetFocus(true): play intent on, window re-prepared, current resumes.
// - SetFocus(false): play intent off, current paused and rewound,
//   every other slot released.
// - Play()/Pause() toggle intent; no renderer effect while unfocused.
// - SetRate(r > 0) implies Play().
//
// Index changes rewind the outgoing item, shift the window, and resume the
// new current item after a settle delay.  The resume is dropped if the
// index has moved again in the meantime.
class PlaylistController {
 public:
  struct Options {
    std::string id;  // Generated when empty
    std::vector<PlaylistItem> items;
    int32_t initial_index = 0;
    std::optional<int32_t> backward_buffer;  // config value when unset
    std::optional<int32_t> forward_buffer;   // config value when unset
    bool is_focused = false;
    bool is_playing = false;
  };

  struct Dependencies {
    runtime::IExecutor* executor = nullptr;
    render::IRendererFactory* renderer_factory = nullptr;
    image::IImageCache* image_cache = nullptr;                // optional
    const time::ITimeSource* time_source = nullptr;           // optional
    bandwidth::BandwidthEstimator* bandwidth = nullptr;       // optional
  };

  // Throws std::invalid_argument if executor or renderer_factory is null.
  PlaylistController(const Options& options, const Dependencies& deps,
                     const config::PlaylistConfig& config);
  ~PlaylistController();

  PlaylistController(const PlaylistController&) = delete;
  PlaylistController& operator=(const PlaylistController&) = delete;

  // ---- Mutators ----

  // The store (items, index) updates immediately.  Renderer work is
  // debounced so bursts of updates cost one window sync.
  void SetItems(std::vector<PlaylistItem> items);

  void AdvanceToNext();
  void MoveToPrevious();

  // No-op when index is out of bounds or already current.
  void SetCurrentIndex(int32_t index, bool animated = false);

  void SetFocus(bool focused);
  void Play();
  void Pause();
  void SetRate(float rate);

  // Seek request for the current item (timer offset for non-media items).
  void SetProgress(double seconds);

  // Application lifecycle.  Suspension pauses the renderer but keeps the
  // play intent; resumption restores it.
  void OnHostSuspended();
  void OnHostResumed();

  void SetAdvanceMode(config::AdvanceMode mode) { advance_mode_ = mode; }

  // Explicit window resize; the bandwidth estimator drives the same path.
  // Returns false if the sizes are unchanged or invalid.
  bool ResizeWindow(int32_t backward_buffer, int32_t forward_buffer);

  // ---- Observable state ----

  const runtime::ObservableValue<std::vector<PlaylistItem>>& Items() const {
    return items_;
  }
  const runtime::ObservableValue<int32_t>& CurrentIndex() const {
    return current_index_;
  }
  const runtime::ObservableValue<float>& Rate() const { return rate_; }
  const runtime::ObservableValue<bool>& IsFocused() const {
    return is_focused_;
  }
  const runtime::ObservableValue<bool>& IsPlaying() const {
    return is_playing_;
  }
  const runtime::ObservableValue<ItemStatus>& Status() const {
    return status_;
  }
  const runtime::ObservableValue<double>& ProgressSeconds() const {
    return progress_s_;
  }
  const runtime::ObservableValue<double>& DurationSeconds() const {
    return duration_s_;
  }

  // Last item finished and the playlist did not advance.
  const runtime::Signal<>& ReachedEnd() const { return reached_end_; }
  // Every time the current item finishes, including loop replays.
  const runtime::Signal<PlaylistItem>& ItemReachedEnd() const {
    return item_reached_end_;
  }

  PlaylistState Snapshot() const;

  // ---- Introspection ----

  const std::string& Id() const { return id_; }
  std::optional<PlaylistItem> CurrentItem() const {
    return store_.CurrentItem();
  }
  std::vector<std::optional<PlaylistItem>> RangedItems() const;
  bool LastChangeAnimated() const { return store_.LastChangeAnimated(); }
  config::AdvanceMode CurrentAdvanceMode() const { return advance_mode_; }
  bool IsHostSuspended() const { return host_suspended_; }

  const PlaylistStore& Store() const { return store_; }
  const window::BufferWindowManager& WindowManager() const {
    return *window_;
  }
  notify::PlaybackNotifier& Notifier() { return notifier_; }
  const telemetry::PlaylistMetrics& Metrics() const { return metrics_; }

 private:
  void OnIndexChanged();
  void ApplyPendingItems(uint64_t epoch);
  void ScheduleResume();
  void ResumeIfCurrent(uint64_t sequence, int32_t index);
  void PlayCurrentIfAllowed();
  void RefreshProjection();
  void OnItemEnded(const PlaylistItem& item, bool replaying);
  void OnBandwidthEstimate(double bits_per_second);
  void PublishStoreState();

  const config::PlaylistConfig config_;
  const std::string id_;
  runtime::IExecutor* executor_;

  std::unique_ptr<time::ITimeSource> owned_clock_;
  const time::ITimeSource* clock_;

  telemetry::PlaylistMetrics metrics_;
  notify::PlaybackNotifier notifier_;
  PlaylistStore store_;
  std::unique_ptr<window::BufferWindowManager> window_;

  runtime::ObservableValue<std::vector<PlaylistItem>> items_;
  runtime::ObservableValue<int32_t> current_index_;
  runtime::ObservableValue<float> rate_{1.0f};
  runtime::ObservableValue<bool> is_focused_;
  runtime::ObservableValue<bool> is_playing_;
  runtime::ObservableValue<ItemStatus> status_{ItemStatus::kLoading};
  runtime::ObservableValue<double> progress_s_;
  runtime::ObservableValue<double> duration_s_;
  runtime::Signal<> reached_end_;
  runtime::Signal<PlaylistItem> item_reached_end_;

  config::AdvanceMode advance_mode_;
  bool host_suspended_ = false;
  uint64_t items_epoch_ = 0;
  uint64_t resume_sequence_ = 0;

  runtime::Subscription bandwidth_subscription_;

  // Posted tasks hold a weak_ptr to this token and bail out once the
  // controller is gone.
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace reelkit::playlist

#endif  // REELKIT_PLAYLIST_PLAYLIST_CONTROLLER_HPP_
