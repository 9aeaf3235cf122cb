// Repository: Reelkit-playlist
// Component: Playlist Controller
// Purpose: Navigation/focus state machine and public state projection.
// Copyright (c) 2025 RetroVue

#include "reelkit/playlist/PlaylistController.hpp"

#include <chrono>
#include <stdexcept>

#include "reelkit/bandwidth/BandwidthEstimator.hpp"
#include "reelkit/bandwidth/BufferWindowPolicy.hpp"
#include "reelkit/time/SystemTimeSource.hpp"
#include "reelkit/util/Logger.hpp"

namespace reelkit::playlist {

using reelkit::util::Logger;
using reelkit::util::LogLine;
using window::RendererSlot;

namespace {

std::string EnsureControllerId(const std::string& id) {
  return id.empty() ? GenerateItemId() : id;
}

runtime::IExecutor* RequireExecutor(runtime::IExecutor* executor) {
  if (executor == nullptr) {
    throw std::invalid_argument("PlaylistController requires an executor");
  }
  return executor;
}

std::unique_ptr<time::ITimeSource> DefaultClockIfMissing(
    const time::ITimeSource* given) {
  if (given != nullptr) return nullptr;
  return std::make_unique<time::SystemTimeSource>();
}

}  // namespace

PlaylistController::PlaylistController(const Options& options,
                                       const Dependencies& deps,
                                       const config::PlaylistConfig& config)
    : config_(config),
      id_(EnsureControllerId(options.id)),
      executor_(RequireExecutor(deps.executor)),
      owned_clock_(DefaultClockIfMissing(deps.time_source)),
      clock_(deps.time_source ? deps.time_source : owned_clock_.get()),
      notifier_(id_, clock_),
      store_(options.items, options.initial_index),
      is_focused_(options.is_focused),
      is_playing_(options.is_playing),
      advance_mode_(config.advance_mode) {
  metrics_.controller_id = id_;

  window::BufferWindowManager::Dependencies window_deps;
  window_deps.executor = executor_;
  window_deps.renderer_factory = deps.renderer_factory;
  window_deps.image_cache = deps.image_cache;
  window_deps.notifier = &notifier_;
  window_deps.metrics = &metrics_;
  window_ = std::make_unique<window::BufferWindowManager>(
      window_deps, config_, &store_,
      options.backward_buffer.value_or(config_.backward_buffer),
      options.forward_buffer.value_or(config_.forward_buffer));

  window_->SetOnCurrentChanged([this] { RefreshProjection(); });
  window_->SetOnItemEnded([this](const PlaylistItem& item, bool replaying) {
    OnItemEnded(item, replaying);
  });

  PublishStoreState();

  Logger::Info(LogLine("PlaylistController", "CREATED")
                   .Kv("id", id_)
                   .Kv("items", store_.Count())
                   .Kv("index", store_.CurrentIndex())
                   .Kv("backward", window_->BackwardBuffer())
                   .Kv("forward", window_->ForwardBuffer())
                   .Kv("focused", is_focused_.Get())
                   .Kv("playing", is_playing_.Get())
                   .Kv("advance_mode", config::AdvanceModeName(advance_mode_))
                   .Str());

  window_->SyncWindow(is_focused_.Get());
  if (RendererSlot* current = window_->CurrentSlot()) {
    current->SetRate(rate_.Get());
  }
  PlayCurrentIfAllowed();
  RefreshProjection();

  if (deps.bandwidth != nullptr && config_.adaptive_buffering) {
    std::weak_ptr<bool> alive = alive_;
    runtime::IExecutor* executor = executor_;
    bandwidth_subscription_ = deps.bandwidth->Subscribe(
        [this, alive, executor](const double& bits_per_second) {
          executor->Post([this, alive, bits_per_second] {
            if (alive.expired()) return;
            OnBandwidthEstimate(bits_per_second);
          });
        });
    if (auto estimate = deps.bandwidth->LastEstimate()) {
      OnBandwidthEstimate(*estimate);
    }
  }
}

PlaylistController::~PlaylistController() {
  bandwidth_subscription_.Reset();
  alive_.reset();
  window_.reset();
  Logger::Debug(LogLine("PlaylistController", "DESTROYED").Kv("id", id_).Str());
}

// =============================================================================
// Items and navigation
// =============================================================================

void PlaylistController::SetItems(std::vector<PlaylistItem> items) {
  const int32_t old_index = store_.CurrentIndex();
  const bool index_reset = store_.SetItems(std::move(items));
  PublishStoreState();

  Logger::Debug(LogLine("PlaylistController", "ITEMS_REPLACED")
                    .Kv("count", store_.Count())
                    .Kv("index_reset", index_reset)
                    .Kv("old_index", old_index)
                    .Str());

  const uint64_t epoch = ++items_epoch_;
  std::weak_ptr<bool> alive = alive_;
  executor_->PostDelayed(std::chrono::milliseconds(config_.items_debounce_ms),
                         [this, alive, epoch] {
                           if (alive.expired()) return;
                           ApplyPendingItems(epoch);
                         });
}

void PlaylistController::ApplyPendingItems(uint64_t epoch) {
  if (epoch != items_epoch_) return;

  RendererSlot* current = window_->CurrentSlot();
  const std::optional<PlaylistItem> before =
      current ? current->BoundItem() : std::nullopt;

  const auto result = window_->SyncWindow(is_focused_.Get());
  Logger::Info(LogLine("PlaylistController", "ITEMS_APPLIED")
                   .Kv("count", store_.Count())
                   .Kv("sync", window::WindowSyncKindName(result.kind))
                   .Kv("rebinds", result.rebinds)
                   .Str());

  current = window_->CurrentSlot();
  const std::optional<PlaylistItem> after =
      current ? current->BoundItem() : std::nullopt;
  if (before != after) {
    if (current) current->SetRate(rate_.Get());
    ScheduleResume();
  }
  RefreshProjection();
}

void PlaylistController::AdvanceToNext() {
  if (store_.AdvanceToNext()) OnIndexChanged();
}

void PlaylistController::MoveToPrevious() {
  if (store_.MoveToPrevious()) OnIndexChanged();
}

void PlaylistController::SetCurrentIndex(int32_t index, bool animated) {
  if (store_.SetCurrentIndex(index, animated)) OnIndexChanged();
}

void PlaylistController::OnIndexChanged() {
  // The store has already moved; the pool still reflects the old window.
  window_->RewindCurrent();
  window_->SyncWindow(is_focused_.Get());
  if (RendererSlot* current = window_->CurrentSlot()) {
    current->SetRate(rate_.Get());
  }
  PublishStoreState();
  RefreshProjection();
  ScheduleResume();
}

void PlaylistController::PublishStoreState() {
  items_.Set(store_.Items());
  current_index_.Set(store_.CurrentIndex());
  metrics_.current_index = store_.CurrentIndex();
}

// =============================================================================
// Settle-delay resume
// =============================================================================

void PlaylistController::ScheduleResume() {
  const uint64_t sequence = ++resume_sequence_;
  const int32_t index = store_.CurrentIndex();
  std::weak_ptr<bool> alive = alive_;
  executor_->PostDelayed(std::chrono::milliseconds(config_.settle_delay_ms),
                         [this, alive, sequence, index] {
                           if (alive.expired()) return;
                           ResumeIfCurrent(sequence, index);
                         });
}

void PlaylistController::ResumeIfCurrent(uint64_t sequence, int32_t index) {
  if (sequence != resume_sequence_ || index != store_.CurrentIndex()) {
    Logger::Debug(LogLine("PlaylistController", "STALE_RESUME_DROPPED")
                      .Kv("issued_index", index)
                      .Kv("index", store_.CurrentIndex())
                      .Str());
    return;
  }
  PlayCurrentIfAllowed();
}

void PlaylistController::PlayCurrentIfAllowed() {
  if (!is_focused_.Get() || !is_playing_.Get() || host_suspended_) return;
  if (RendererSlot* current = window_->CurrentSlot()) current->Play();
}

// =============================================================================
// Play / focus / rate
// =============================================================================

void PlaylistController::SetFocus(bool focused) {
  if (focused == is_focused_.Get()) return;
  is_focused_.Set(focused);

  Logger::Info(LogLine("PlaylistController", focused ? "FOCUS_GAINED"
                                                     : "FOCUS_LOST")
                   .Kv("id", id_)
                   .Kv("index", store_.CurrentIndex())
                   .Str());

  if (focused) {
    is_playing_.Set(true);
    window_->ApplyFocus(true);
    if (RendererSlot* current = window_->CurrentSlot()) {
      current->SetRate(rate_.Get());
    }
    PlayCurrentIfAllowed();
  } else {
    is_playing_.Set(false);
    window_->ApplyFocus(false);
  }
  RefreshProjection();
}

void PlaylistController::Play() {
  is_playing_.Set(true);
  PlayCurrentIfAllowed();
}

void PlaylistController::Pause() {
  is_playing_.Set(false);
  if (RendererSlot* current = window_->CurrentSlot()) current->Pause();
}

void PlaylistController::SetRate(float rate) {
  rate_.Set(rate);
  if (RendererSlot* current = window_->CurrentSlot()) current->SetRate(rate);
  if (rate > 0.0f) Play();
}

void PlaylistController::SetProgress(double seconds) {
  if (RendererSlot* current = window_->CurrentSlot()) current->Seek(seconds);
  RefreshProjection();
}

void PlaylistController::OnHostSuspended() {
  if (host_suspended_) return;
  host_suspended_ = true;
  if (RendererSlot* current = window_->CurrentSlot()) current->Pause();
  Logger::Info(LogLine("PlaylistController", "HOST_SUSPENDED")
                   .Kv("id", id_)
                   .Kv("playing", is_playing_.Get())
                   .Str());
}

void PlaylistController::OnHostResumed() {
  if (!host_suspended_) return;
  host_suspended_ = false;
  Logger::Info(LogLine("PlaylistController", "HOST_RESUMED")
                   .Kv("id", id_)
                   .Kv("playing", is_playing_.Get())
                   .Str());
  PlayCurrentIfAllowed();
}

// =============================================================================
// Window sizing
// =============================================================================

bool PlaylistController::ResizeWindow(int32_t backward_buffer,
                                      int32_t forward_buffer) {
  if (!window_->Resize(backward_buffer, forward_buffer, is_focused_.Get())) {
    return false;
  }
  RefreshProjection();
  return true;
}

void PlaylistController::OnBandwidthEstimate(double bits_per_second) {
  const auto sizes = bandwidth::BufferWindowPolicy::ForBandwidth(bits_per_second);
  Logger::Debug(LogLine("PlaylistController", "BANDWIDTH_ESTIMATE")
                    .Kv("bps", static_cast<int64_t>(bits_per_second))
                    .Kv("backward", sizes.backward)
                    .Kv("forward", sizes.forward)
                    .Str());
  ResizeWindow(sizes.backward, sizes.forward);
}

// =============================================================================
// Projection and end of item
// =============================================================================

void PlaylistController::RefreshProjection() {
  const RendererSlot* current = window_->CurrentSlot();
  if (current == nullptr) return;
  status_.Set(window::ProjectStatus(current->Status()));
  progress_s_.Set(current->ProgressSeconds());
  duration_s_.Set(current->DurationSeconds());
}

void PlaylistController::OnItemEnded(const PlaylistItem& item, bool replaying) {
  item_reached_end_.Emit(item);
  if (replaying) return;

  if (advance_mode_ == config::AdvanceMode::kLoopCurrent) {
    window_->ReplayCurrent();
    return;
  }

  if (store_.IsAtLastItem()) {
    metrics_.playlist_reached_end_total++;
    Logger::Info(LogLine("PlaylistController", "PLAYLIST_REACHED_END")
                     .Kv("id", id_)
                     .Kv("index", store_.CurrentIndex())
                     .Str());
    reached_end_.Emit();
    return;
  }

  metrics_.auto_advances_total++;
  Logger::Info(LogLine("PlaylistController", "AUTO_ADVANCE")
                   .Kv("id", id_)
                   .Kv("from", store_.CurrentIndex())
                   .Kv("item", item.id)
                   .Str());
  AdvanceToNext();
}

PlaylistState PlaylistController::Snapshot() const {
  PlaylistState state;
  state.status = status_.Get();
  state.progress_s = progress_s_.Get();
  state.duration_s = duration_s_.Get();
  state.rate = rate_.Get();
  state.is_playing = is_playing_.Get();
  state.is_focused = is_focused_.Get();
  state.current_index = current_index_.Get();
  state.item_count = static_cast<int32_t>(store_.Count());
  return state;
}

std::vector<std::optional<PlaylistItem>> PlaylistController::RangedItems()
    const {
  return store_.RangedItems(window_->BackwardBuffer(),
                            window_->ForwardBuffer());
}

}  // namespace reelkit::playlist
