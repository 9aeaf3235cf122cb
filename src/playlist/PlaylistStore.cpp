// Repository: Reelkit-playlist
// Component: Playlist Store
// Copyright (c) 2025 RetroVue

#include "reelkit/playlist/PlaylistStore.hpp"

#include <algorithm>

#include "reelkit/util/Logger.hpp"

namespace reelkit::playlist {

using reelkit::util::Logger;
using reelkit::util::LogLine;

PlaylistStore::PlaylistStore(std::vector<PlaylistItem> items,
                             int32_t initial_index)
    : items_(std::move(items)), current_index_(initial_index) {
  if (!items_.empty() && !IsValidIndex(initial_index)) {
    Logger::Debug(LogLine("PlaylistStore", "INITIAL_INDEX_CLAMPED")
                      .Kv("requested", initial_index)
                      .Kv("count", items_.size())
                      .Str());
    current_index_ = 0;
  }
}

bool PlaylistStore::SetItems(std::vector<PlaylistItem> items) {
  items_ = std::move(items);
  if (IsValidIndex(current_index_)) return false;
  current_index_ = 0;
  animated_ = false;
  return true;
}

bool PlaylistStore::AdvanceToNext() {
  if (items_.empty()) return false;
  const int32_t last = static_cast<int32_t>(items_.size()) - 1;
  const int32_t next = std::min(current_index_ + 1, last);
  if (next == current_index_) return false;
  current_index_ = next;
  animated_ = false;
  return true;
}

bool PlaylistStore::MoveToPrevious() {
  if (items_.empty()) return false;
  const int32_t prev = std::max(current_index_ - 1, 0);
  if (prev == current_index_) return false;
  current_index_ = prev;
  animated_ = false;
  return true;
}

bool PlaylistStore::SetCurrentIndex(int32_t index, bool animated) {
  if (index == current_index_) return false;
  if (!IsValidIndex(index)) {
    Logger::Debug(LogLine("PlaylistStore", "INDEX_OUT_OF_BOUNDS")
                      .Kv("requested", index)
                      .Kv("count", items_.size())
                      .Str());
    return false;
  }
  current_index_ = index;
  animated_ = animated;
  return true;
}

std::optional<PlaylistItem> PlaylistStore::ItemAt(int64_t index) const {
  if (!IsValidIndex(index)) return std::nullopt;
  return items_[static_cast<size_t>(index)];
}

std::vector<std::optional<PlaylistItem>> PlaylistStore::RangedItems(
    int32_t backward, int32_t forward) const {
  std::vector<std::optional<PlaylistItem>> window;
  window.reserve(static_cast<size_t>(backward + forward + 1));
  const int64_t first = static_cast<int64_t>(current_index_) - backward;
  const int64_t last = static_cast<int64_t>(current_index_) + forward;
  for (int64_t i = first; i <= last; ++i) {
    window.push_back(ItemAt(i));
  }
  return window;
}

}  // namespace reelkit::playlist
