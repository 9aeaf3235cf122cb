// Repository: Reelkit-playlist
// Component: Playlist State Projection
// Purpose: Public snapshot of the current item's status and the controller's
//          play/focus/rate state.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_PLAYLIST_PLAYLIST_STATE_HPP_
#define REELKIT_PLAYLIST_PLAYLIST_STATE_HPP_

#include <cstdint>

namespace reelkit::playlist {

enum class ItemStatus : int32_t {
  kLoading = 0,
  kReady = 1,
  kError = 2,
};

inline const char* ItemStatusName(ItemStatus s) {
  switch (s) {
    case ItemStatus::kLoading: return "loading";
    case ItemStatus::kReady:   return "ready";
    case ItemStatus::kError:   return "error";
  }
  return "unknown";
}

struct PlaylistState {
  ItemStatus status = ItemStatus::kReady;
  double progress_s = 0.0;
  double duration_s = 0.0;
  float rate = 1.0f;
  bool is_playing = false;
  bool is_focused = false;
  int32_t current_index = 0;
  int32_t item_count = 0;

  bool operator==(const PlaylistState& o) const {
    return status == o.status && progress_s == o.progress_s &&
           duration_s == o.duration_s && rate == o.rate &&
           is_playing == o.is_playing && is_focused == o.is_focused &&
           current_index == o.current_index && item_count == o.item_count;
  }
  bool operator!=(const PlaylistState& o) const { return !(*this == o); }
};

}  // namespace reelkit::playlist

#endif  // REELKIT_PLAYLIST_PLAYLIST_STATE_HPP_
