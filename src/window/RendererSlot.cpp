// Repository: Reelkit-playlist
// Component: Renderer Slot
// Purpose: Per-variant prepare/play policy and stale-result discipline.
// Copyright (c) 2025 RetroVue

#include "reelkit/window/RendererSlot.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

#include "reelkit/notify/PlaybackNotifier.hpp"
#include "reelkit/telemetry/PlaylistMetrics.hpp"
#include "reelkit/util/Logger.hpp"

namespace reelkit::window {

using playlist::ItemKind;
using playlist::ItemStatus;
using playlist::PlaylistItem;
using reelkit::util::Logger;
using reelkit::util::LogLine;

namespace {

// Absorbs accumulated rounding from repeated tick additions.
constexpr double kEndToleranceSeconds = 1e-6;

double NormalizeDuration(double seconds) {
  if (std::isnan(seconds) || std::isinf(seconds) || seconds < 0.0) return 0.0;
  return seconds;
}

}  // namespace

const char* SlotStatusName(SlotStatus status) {
  switch (status) {
    case SlotStatus::kIdle:    return "idle";
    case SlotStatus::kLoading: return "loading";
    case SlotStatus::kReady:   return "ready";
    case SlotStatus::kError:   return "error";
  }
  return "unknown";
}

ItemStatus ProjectStatus(SlotStatus status) {
  switch (status) {
    case SlotStatus::kIdle:
    case SlotStatus::kLoading:
      return ItemStatus::kLoading;
    case SlotStatus::kReady:
      return ItemStatus::kReady;
    case SlotStatus::kError:
      return ItemStatus::kError;
  }
  return ItemStatus::kLoading;
}

std::shared_ptr<RendererSlot> RendererSlot::Create(
    int32_t slot_id, std::unique_ptr<render::IMediaRenderer> renderer,
    const SlotContext* context) {
  if (context == nullptr || context->executor == nullptr) {
    throw std::invalid_argument("RendererSlot requires an executor");
  }
  if (!renderer) {
    throw std::invalid_argument("RendererSlot requires a renderer");
  }
  return std::shared_ptr<RendererSlot>(
      new RendererSlot(slot_id, std::move(renderer), context));
}

RendererSlot::RendererSlot(int32_t slot_id,
                           std::unique_ptr<render::IMediaRenderer> renderer,
                           const SlotContext* context)
    : slot_id_(slot_id), renderer_(std::move(renderer)), context_(context) {}

RendererSlot::~RendererSlot() {
  if (renderer_open_) {
    renderer_->Cancel();
  }
}

// =============================================================================
// Binding
// =============================================================================

bool RendererSlot::Prepare(const PlaylistItem& item) {
  if (IsBoundTo(item)) return false;

  Teardown();
  item_ = item;
  status_ = SlotStatus::kLoading;
  if (context_->metrics) context_->metrics->slot_binds_total++;

  Logger::Debug(LogLine("RendererSlot", "BIND")
                    .Kv("slot", slot_id_)
                    .Kv("gen", generation_)
                    .Kv("kind", playlist::ItemKindName(item.Kind()))
                    .Kv("id", item.id)
                    .Str());

  switch (item.Kind()) {
    case ItemKind::kImage:
      BeginImage(item);
      break;
    case ItemKind::kVideo:
      BeginVideo(item);
      break;
    case ItemKind::kCustom:
      duration_s_ = NormalizeDuration(item.FixedDurationSeconds());
      status_ = SlotStatus::kReady;
      break;
    case ItemKind::kError:
      duration_s_ = context_->config.error_fallback_duration_s;
      status_ = SlotStatus::kError;
      break;
  }
  NotifyChanged();
  return true;
}

void RendererSlot::Clear() {
  if (!item_ && status_ == SlotStatus::kIdle) return;
  Teardown();
  if (context_->metrics) context_->metrics->slot_clears_total++;
  NotifyChanged();
}

// Resets to idle and invalidates everything issued under the old binding.
void RendererSlot::Teardown() {
  ++generation_;
  StopTimer();
  if (renderer_open_) {
    renderer_->Cancel();
    renderer_open_ = false;
  }
  item_.reset();
  image_.reset();
  status_ = SlotStatus::kIdle;
  progress_s_ = 0.0;
  duration_s_ = 0.0;
  want_play_ = false;
  ended_ = false;
  video_failed_ = false;
  replays_ = 0;
}

void RendererSlot::BeginImage(const PlaylistItem& item) {
  const double fixed = item.FixedDurationSeconds();
  duration_s_ = fixed > 0.0 ? fixed : context_->config.default_image_duration_s;

  if (context_->image_cache == nullptr) {
    OnLoadFailure("no image cache");
    return;
  }

  const uint64_t gen = generation_;
  std::weak_ptr<RendererSlot> weak = weak_from_this();
  runtime::IExecutor* executor = context_->executor;
  context_->image_cache->FetchAsync(
      item.Url(), [weak, gen, executor](const image::FetchResult& result) {
        executor->Post([weak, gen, result] {
          auto self = weak.lock();
          if (!self) return;
          if (self->generation_ != gen) {
            if (self->context_->metrics) {
              self->context_->metrics->stale_results_discarded_total++;
            }
            Logger::Debug(LogLine("RendererSlot", "STALE_IMAGE_DISCARDED")
                              .Kv("slot", self->slot_id_)
                              .Kv("issued_gen", gen)
                              .Kv("gen", self->generation_)
                              .Str());
            return;
          }
          self->OnImageResult(result);
        });
      });
}

void RendererSlot::BeginVideo(const PlaylistItem& item) {
  duration_s_ = 0.0;
  if (context_->notifier) context_->notifier->EmitVideoRequested(item.Url());

  const uint64_t gen = generation_;
  render::RendererCallbacks callbacks;
  callbacks.on_ready = [this, gen](double duration_s) {
    PostIfCurrent(gen, [duration_s](RendererSlot& s) {
      s.OnVideoReady(duration_s);
    });
  };
  callbacks.on_error = [this, gen](const std::string& error) {
    PostIfCurrent(gen, [error](RendererSlot& s) { s.OnLoadFailure(error); });
  };
  callbacks.on_progress = [this, gen](double position_s) {
    PostIfCurrent(gen, [position_s](RendererSlot& s) {
      s.OnVideoProgress(position_s);
    });
  };
  callbacks.on_ended = [this, gen] {
    PostIfCurrent(gen, [](RendererSlot& s) { s.OnVideoEnded(); });
  };
  callbacks.on_stalled = [this, gen] {
    PostIfCurrent(gen, [](RendererSlot& s) {
      if (s.context_->notifier && s.item_) {
        s.context_->notifier->EmitVideoStalled(s.item_->Url());
      }
    });
  };
  callbacks.on_started = [this, gen] {
    PostIfCurrent(gen, [](RendererSlot& s) {
      if (s.context_->notifier && s.item_) {
        s.context_->notifier->EmitVideoStarted(s.item_->Url());
      }
    });
  };

  renderer_open_ = true;
  renderer_->SetRate(rate_);
  renderer_->Open(item.Url(), std::move(callbacks));
}

// The renderer stops invoking callbacks once Cancel() returns, and the slot
// cancels its renderer before it is destroyed, so capturing `this` for the
// hop onto the executor is safe.  The posted task itself only holds a
// weak_ptr.
void RendererSlot::PostIfCurrent(uint64_t gen,
                                 std::function<void(RendererSlot&)> fn) {
  std::weak_ptr<RendererSlot> weak = weak_from_this();
  context_->executor->Post([weak, gen, fn = std::move(fn)] {
    auto self = weak.lock();
    if (!self) return;
    if (self->generation_ != gen) {
      if (self->context_->metrics) {
        self->context_->metrics->stale_results_discarded_total++;
      }
      Logger::Debug(LogLine("RendererSlot", "STALE_RESULT_DISCARDED")
                        .Kv("slot", self->slot_id_)
                        .Kv("issued_gen", gen)
                        .Kv("gen", self->generation_)
                        .Str());
      return;
    }
    fn(*self);
  });
}

// =============================================================================
// Async completions (on the executor, generation already checked)
// =============================================================================

void RendererSlot::OnImageResult(const image::FetchResult& result) {
  if (!result.ok()) {
    OnLoadFailure(result.message.empty()
                      ? image::FetchErrorName(result.error)
                      : result.message);
    return;
  }
  image_ = result.image;
  status_ = SlotStatus::kReady;
  NotifyChanged();
  ApplyPlayback();
}

void RendererSlot::OnVideoReady(double duration_s) {
  if (status_ != SlotStatus::kLoading) return;
  duration_s_ = NormalizeDuration(duration_s);
  status_ = SlotStatus::kReady;
  Logger::Debug(LogLine("RendererSlot", "VIDEO_READY")
                    .Kv("slot", slot_id_)
                    .Kv("duration_s", duration_s_)
                    .Str());
  NotifyChanged();
  ApplyPlayback();
}

void RendererSlot::OnVideoProgress(double position_s) {
  if (video_failed_) return;
  progress_s_ = std::max(0.0, position_s);
  NotifyChanged();
}

void RendererSlot::OnVideoEnded() {
  if (video_failed_ || status_ != SlotStatus::kReady || !want_play_) return;
  if (duration_s_ > 0.0) progress_s_ = duration_s_;
  SignalEnded();
}

void RendererSlot::OnLoadFailure(const std::string& reason) {
  if (!item_) return;
  const bool is_video = item_->Kind() == ItemKind::kVideo;
  if (is_video) {
    if (renderer_open_) {
      renderer_->Cancel();
      renderer_open_ = false;
    }
    video_failed_ = true;
    if (context_->notifier) {
      context_->notifier->EmitVideoError(item_->Url(), reason);
    }
  }
  if (context_->metrics) context_->metrics->load_failures_total++;

  Logger::Warn(LogLine("RendererSlot", "LOAD_FAILURE")
                   .Kv("slot", slot_id_)
                   .Kv("kind", playlist::ItemKindName(item_->Kind()))
                   .Kv("url", item_->Url())
                   .Kv("reason", reason)
                   .Str());

  StopTimer();
  status_ = SlotStatus::kError;
  progress_s_ = 0.0;
  duration_s_ = context_->config.error_fallback_duration_s;
  NotifyChanged();
  ApplyPlayback();
}

// =============================================================================
// Playback
// =============================================================================

bool RendererSlot::DrivenByTimer() const {
  if (!item_) return false;
  return item_->Kind() != ItemKind::kVideo || video_failed_;
}

// Play after a natural end restarts the item from zero.
void RendererSlot::Play() {
  if (!item_) return;
  if (ended_) {
    want_play_ = true;
    Seek(0.0);
    return;
  }
  if (want_play_) return;
  want_play_ = true;
  ApplyPlayback();
}

void RendererSlot::Pause() {
  want_play_ = false;
  StopTimer();
  if (renderer_open_) renderer_->Pause();
}

void RendererSlot::SetRate(float rate) {
  rate_ = rate;
  if (renderer_open_) renderer_->SetRate(rate);
}

void RendererSlot::ApplyPlayback() {
  if (!want_play_ || !item_) return;
  if (status_ != SlotStatus::kReady && status_ != SlotStatus::kError) return;

  if (DrivenByTimer()) {
    if (!timer_running_) StartTimer();
    return;
  }
  renderer_->SetRate(rate_);
  renderer_->Play();
}

void RendererSlot::Seek(double position_s) {
  if (!item_) return;
  double target = std::max(0.0, position_s);
  if (duration_s_ > 0.0) target = std::min(target, duration_s_);

  const bool was_ended = ended_;
  ended_ = false;

  if (DrivenByTimer()) {
    progress_s_ = target;
    if (timer_running_) {
      StopTimer();
      StartTimer();
    }
    NotifyChanged();
    if (was_ended) ApplyPlayback();
    return;
  }
  if (renderer_open_) renderer_->Seek(target);
  if (was_ended) ApplyPlayback();
}

void RendererSlot::Rewind() {
  Pause();
  replays_ = 0;
  ended_ = false;
  if (!item_) return;
  if (renderer_open_ && !video_failed_) renderer_->Seek(0.0);
  if (progress_s_ != 0.0) {
    progress_s_ = 0.0;
    NotifyChanged();
  }
}

void RendererSlot::Replay() {
  if (!item_) return;
  ++replays_;
  if (context_->metrics) context_->metrics->loop_replays_total++;
  ended_ = false;
  progress_s_ = 0.0;
  if (DrivenByTimer()) {
    StopTimer();
    NotifyChanged();
    ApplyPlayback();
    return;
  }
  renderer_->Seek(0.0);
  NotifyChanged();
  ApplyPlayback();
}

// =============================================================================
// Timer (image, custom, error, failed video)
// =============================================================================

void RendererSlot::StartTimer() {
  timer_running_ = true;
  const uint64_t epoch = ++timer_epoch_;
  std::weak_ptr<RendererSlot> weak = weak_from_this();
  context_->executor->PostDelayed(
      std::chrono::milliseconds(context_->config.timer_tick_ms),
      [weak, epoch] {
        if (auto self = weak.lock()) self->OnTimerTick(epoch);
      });
}

void RendererSlot::StopTimer() {
  ++timer_epoch_;
  timer_running_ = false;
}

void RendererSlot::OnTimerTick(uint64_t epoch) {
  if (epoch != timer_epoch_ || !timer_running_) return;

  const double tick_s = context_->config.timer_tick_ms / 1000.0;
  progress_s_ += tick_s * static_cast<double>(rate_);
  if (progress_s_ + kEndToleranceSeconds >= duration_s_) {
    progress_s_ = duration_s_;
    timer_running_ = false;
    NotifyChanged();
    SignalEnded();
    return;
  }
  NotifyChanged();

  timer_running_ = false;
  StartTimer();
}

void RendererSlot::NotifyChanged() {
  if (on_changed_) on_changed_(*this);
}

void RendererSlot::SignalEnded() {
  Logger::Debug(LogLine("RendererSlot", "ITEM_ENDED")
                    .Kv("slot", slot_id_)
                    .Kv("replays", replays_)
                    .Str());
  ended_ = true;
  if (on_ended_) on_ended_(*this);
}

}  // namespace reelkit::window
