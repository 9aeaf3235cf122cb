// Repository: Reelkit-playlist
// Component: Playlist Store
// Purpose: Ordered item sequence, current index, and clamped navigation.
//          Owns no renderers; callers observe index/item changes and react.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_PLAYLIST_PLAYLIST_STORE_HPP_
#define REELKIT_PLAYLIST_PLAYLIST_STORE_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "reelkit/playlist/PlaylistItem.hpp"

namespace reelkit::playlist {

// PlaylistStore invariants:
// - Non-empty items: current index is within [0, count-1].
// - Empty items: current index is whatever the caller supplied (deferred
//   validity); every lookup returns std::nullopt.
// - Navigation clamps, never wraps.  Out-of-range requests are no-ops.
//
// Not thread-safe.  Owned by the controller and touched only on its executor.
class PlaylistStore {
 public:
  PlaylistStore() = default;
  PlaylistStore(std::vector<PlaylistItem> items, int32_t initial_index);

  // Replaces the sequence.  Resets the index to 0 if it is no longer valid.
  // Returns true if the index was reset.
  bool SetItems(std::vector<PlaylistItem> items);

  // Each returns true if the current index changed.
  bool AdvanceToNext();
  bool MoveToPrevious();
  bool SetCurrentIndex(int32_t index, bool animated);

  const std::vector<PlaylistItem>& Items() const { return items_; }
  int32_t CurrentIndex() const { return current_index_; }
  size_t Count() const { return items_.size(); }
  bool IsEmpty() const { return items_.empty(); }
  bool IsValidIndex(int64_t index) const {
    return index >= 0 && index < static_cast<int64_t>(items_.size());
  }
  bool IsAtLastItem() const {
    return !items_.empty() &&
           current_index_ == static_cast<int32_t>(items_.size()) - 1;
  }

  // Presentation hint recorded by the last SetCurrentIndex() that changed
  // the index.  Step navigation clears it.
  bool LastChangeAnimated() const { return animated_; }

  std::optional<PlaylistItem> ItemAt(int64_t index) const;
  std::optional<PlaylistItem> CurrentItem() const {
    return ItemAt(current_index_);
  }

  // Items at [current - backward, current + forward], one entry per window
  // position.  Positions outside the sequence are std::nullopt.
  // Result size is always backward + forward + 1.
  std::vector<std::optional<PlaylistItem>> RangedItems(int32_t backward,
                                                       int32_t forward) const;

 private:
  std::vector<PlaylistItem> items_;
  int32_t current_index_ = 0;
  bool animated_ = false;
};

}  // namespace reelkit::playlist

#endif  // REELKIT_PLAYLIST_PLAYLIST_STORE_HPP_
