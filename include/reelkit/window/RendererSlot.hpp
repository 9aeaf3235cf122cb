// Repository: Reelkit-playlist
// Component: Renderer Slot
// Purpose: One entry of the renderer pool.  Owns a renderer, tracks the item
//          it is bound to, and applies the per-variant prepare/play policy.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_WINDOW_RENDERER_SLOT_HPP_
#define REELKIT_WINDOW_RENDERER_SLOT_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "reelkit/config/PlaylistConfig.hpp"
#include "reelkit/image/IImageCache.hpp"
#include "reelkit/playlist/PlaylistItem.hpp"
#include "reelkit/playlist/PlaylistState.hpp"
#include "reelkit/render/IMediaRenderer.hpp"
#include "reelkit/runtime/IExecutor.hpp"

namespace reelkit::notify {
class PlaybackNotifier;
}
namespace reelkit::telemetry {
struct PlaylistMetrics;
}

namespace reelkit::window {

// idle -> loading -> {ready, error};  ready/error -> idle on Clear() or
// rebind.  Only Prepare() enters loading.
enum class SlotStatus {
  kIdle,
  kLoading,
  kReady,
  kError,
};

const char* SlotStatusName(SlotStatus status);

// Public projection: an idle slot reads as loading.
playlist::ItemStatus ProjectStatus(SlotStatus status);

// Collaborators shared by every slot of one pool.  Owned by the window
// manager; outlives its slots.
struct SlotContext {
  runtime::IExecutor* executor = nullptr;
  image::IImageCache* image_cache = nullptr;
  notify::PlaybackNotifier* notifier = nullptr;
  telemetry::PlaylistMetrics* metrics = nullptr;
  config::PlaylistConfig config;
};

// RendererSlot is created through Create() and shared with the async
// completions it schedules (they hold a weak_ptr).  Every mutating call must
// run on context.executor.
//
// Each bind or clear bumps the slot generation.  A completion carries the
// generation it was issued under and is discarded if the slot has moved on.
class RendererSlot : public std::enable_shared_from_this<RendererSlot> {
 public:
  using SlotFn = std::function<void(RendererSlot&)>;

  static std::shared_ptr<RendererSlot> Create(
      int32_t slot_id, std::unique_ptr<render::IMediaRenderer> renderer,
      const SlotContext* context);

  ~RendererSlot();

  RendererSlot(const RendererSlot&) = delete;
  RendererSlot& operator=(const RendererSlot&) = delete;

  // Status, progress or duration changed.
  void SetOnChanged(SlotFn fn) { on_changed_ = std::move(fn); }
  // Natural end of the bound item reached while playing.
  void SetOnEnded(SlotFn fn) { on_ended_ = std::move(fn); }

  // Binds to item and starts loading.  No-op (returns false) if already
  // bound to an equal item.
  bool Prepare(const playlist::PlaylistItem& item);

  // Cancels in-flight work, releases media, returns to idle.
  void Clear();

  // Play intent.  Playback starts once the slot is ready (or failed, in
  // which case the fallback timer runs).
  void Play();
  void Pause();
  void SetRate(float rate);

  // Clamped to [0, duration].  Timer-driven items echo the new position
  // synchronously; video reports it after the renderer completes the seek.
  void Seek(double position_s);

  // Pause, seek to zero, and restart the repeat count.
  void Rewind();

  // Restart the current item from zero without dropping play intent.
  // Counts toward repeat(n).
  void Replay();

  void SetVisible(bool visible) { visible_ = visible; }

  int32_t SlotId() const { return slot_id_; }
  const std::optional<playlist::PlaylistItem>& BoundItem() const {
    return item_;
  }
  bool IsBoundTo(const playlist::PlaylistItem& item) const {
    return item_.has_value() && *item_ == item;
  }
  SlotStatus Status() const { return status_; }
  double ProgressSeconds() const { return progress_s_; }
  double DurationSeconds() const { return duration_s_; }
  float Rate() const { return rate_; }
  bool IsPlaying() const { return want_play_; }
  bool IsVisible() const { return visible_; }
  uint64_t Generation() const { return generation_; }
  int32_t ReplayCount() const { return replays_; }
  std::shared_ptr<const image::DecodedImage> Image() const { return image_; }

 private:
  RendererSlot(int32_t slot_id, std::unique_ptr<render::IMediaRenderer> renderer,
               const SlotContext* context);

  void Teardown();
  void BeginImage(const playlist::PlaylistItem& item);
  void BeginVideo(const playlist::PlaylistItem& item);

  void OnImageResult(const image::FetchResult& result);
  void OnVideoReady(double duration_s);
  void OnVideoProgress(double position_s);
  void OnVideoEnded();
  void OnLoadFailure(const std::string& reason);

  // Runs fn on the executor if this slot still has generation gen.
  void PostIfCurrent(uint64_t gen, std::function<void(RendererSlot&)> fn);

  bool DrivenByTimer() const;
  void ApplyPlayback();
  void StartTimer();
  void StopTimer();
  void OnTimerTick(uint64_t epoch);
  void NotifyChanged();
  void SignalEnded();

  const int32_t slot_id_;
  std::unique_ptr<render::IMediaRenderer> renderer_;
  const SlotContext* context_;

  std::optional<playlist::PlaylistItem> item_;
  SlotStatus status_ = SlotStatus::kIdle;
  double progress_s_ = 0.0;
  double duration_s_ = 0.0;
  float rate_ = 1.0f;
  bool want_play_ = false;
  // Set at a natural end, cleared by any seek, rewind, replay or rebind.
  bool ended_ = false;
  bool visible_ = false;
  bool renderer_open_ = false;
  bool video_failed_ = false;
  uint64_t generation_ = 0;
  uint64_t timer_epoch_ = 0;
  bool timer_running_ = false;
  int32_t replays_ = 0;
  std::shared_ptr<const image::DecodedImage> image_;

  SlotFn on_changed_;
  SlotFn on_ended_;
};

}  // namespace reelkit::window

#endif  // REELKIT_WINDOW_RENDERER_SLOT_HPP_
