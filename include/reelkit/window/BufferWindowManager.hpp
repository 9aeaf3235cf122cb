// Repository: Reelkit-playlist
// Component: Buffer Window Manager
// Purpose: Owns the renderer pool, maps the window around the current index
//          onto pool slots, reuses slots as the index moves, and resizes the
//          pool when the buffer sizes change.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_WINDOW_BUFFER_WINDOW_MANAGER_HPP_
#define REELKIT_WINDOW_BUFFER_WINDOW_MANAGER_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "reelkit/config/PlaylistConfig.hpp"
#include "reelkit/playlist/PlaylistItem.hpp"
#include "reelkit/playlist/PlaylistStore.hpp"
#include "reelkit/render/IMediaRenderer.hpp"
#include "reelkit/runtime/IExecutor.hpp"
#include "reelkit/window/RendererSlot.hpp"

namespace reelkit::window {

// Outcome of one SyncWindow() pass.  Used for logging and tests.
struct WindowSyncResult {
  enum class Kind {
    kUnchanged,   // Every slot already bound to its window item
    kRotated,     // Pool rotated by `diff`, exposed positions re-prepared
    kInPlace,     // diff == 0, some positions re-prepared (items replaced)
    kFullRebind,  // No surviving slot; every position re-prepared
  };
  Kind kind = Kind::kUnchanged;
  int32_t diff = 0;
  int32_t rebinds = 0;
  int32_t clears = 0;
};

const char* WindowSyncKindName(WindowSyncResult::Kind kind);

// BufferWindowManager keeps exactly backward + forward + 1 slots.  Slot
// position p holds the item at index (current - backward + p); the current
// slot sits at position `backward`.
//
// Only the current slot is ever played.  While unfocused, positions other
// than the current one are kept cleared.
//
// Every method must run on the executor passed at construction.
class BufferWindowManager {
 public:
  struct Dependencies {
    runtime::IExecutor* executor = nullptr;
    render::IRendererFactory* renderer_factory = nullptr;
    image::IImageCache* image_cache = nullptr;         // optional
    notify::PlaybackNotifier* notifier = nullptr;      // optional
    telemetry::PlaylistMetrics* metrics = nullptr;     // optional
  };

  // Current slot's status, progress or duration changed, or a different
  // slot became current.
  using CurrentChangedFn = std::function<void()>;
  // Current item finished.  `replaying` is true when a loop/repeat behavior
  // has already restarted it; otherwise the caller makes the advance
  // decision.
  using ItemEndedFn = std::function<void(const playlist::PlaylistItem& item,
                                         bool replaying)>;

  // Throws std::invalid_argument if executor, renderer_factory or store is
  // null.
  BufferWindowManager(const Dependencies& deps,
                      const config::PlaylistConfig& config,
                      const playlist::PlaylistStore* store,
                      int32_t backward_buffer, int32_t forward_buffer);
  ~BufferWindowManager();

  BufferWindowManager(const BufferWindowManager&) = delete;
  BufferWindowManager& operator=(const BufferWindowManager&) = delete;

  void SetOnCurrentChanged(CurrentChangedFn fn) {
    on_current_changed_ = std::move(fn);
  }
  void SetOnItemEnded(ItemEndedFn fn) { on_item_ended_ = std::move(fn); }

  // Re-maps the pool onto the store's current window.  Call after the
  // index or the item list changed.  The current position is always
  // prepared; other positions are prepared when focused, cleared otherwise.
  WindowSyncResult SyncWindow(bool focused);

  // Pauses and rewinds the current slot.  Call before the index moves so a
  // later return to that item starts from zero.
  void RewindCurrent();

  // Changes the buffer sizes.  Head changes add or remove slots at the
  // front, tail changes at the back, so the current slot object is kept.
  // Returns false (and touches nothing) if both sizes are unchanged or
  // either is negative.  New slots start idle and are prepared by the
  // SyncWindow that ends every resize, so while unfocused only the current
  // position is filled.
  bool Resize(int32_t backward_buffer, int32_t forward_buffer, bool focused);

  // Focus lost: pause and rewind the current slot, clear all others.
  // Focus gained: re-prepare the window.
  void ApplyFocus(bool focused);

  // Replays the current item from zero (kLoopCurrent advance mode).
  void ReplayCurrent();

  RendererSlot* CurrentSlot() const;
  const std::vector<std::shared_ptr<RendererSlot>>& Slots() const {
    return slots_;
  }
  int32_t BackwardBuffer() const { return backward_; }
  int32_t ForwardBuffer() const { return forward_; }
  int32_t PoolSize() const { return static_cast<int32_t>(slots_.size()); }

 private:
  std::shared_ptr<RendererSlot> MakeSlot();
  void WireSlot(const std::shared_ptr<RendererSlot>& slot);
  void OnSlotChanged(RendererSlot& slot);
  void OnSlotEnded(RendererSlot& slot);
  bool IsCurrent(const RendererSlot& slot) const;
  void UpdateVisibility();
  void UpdateGauges();

  // Signed offset that re-aligns the most surviving slots with the new
  // window, or nullopt if no slot's item is still in it.
  std::optional<int32_t> FindAnchorDiff(
      const std::vector<std::optional<playlist::PlaylistItem>>& window) const;

  runtime::IExecutor* executor_;
  render::IRendererFactory* factory_;
  const playlist::PlaylistStore* store_;
  SlotContext context_;

  int32_t backward_;
  int32_t forward_;
  int32_t next_slot_id_ = 0;
  std::vector<std::shared_ptr<RendererSlot>> slots_;
  RendererSlot* last_current_ = nullptr;

  CurrentChangedFn on_current_changed_;
  ItemEndedFn on_item_ended_;
};

}  // namespace reelkit::window

#endif  // REELKIT_WINDOW_BUFFER_WINDOW_MANAGER_HPP_
