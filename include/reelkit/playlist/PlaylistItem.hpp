// Repository: Reelkit-playlist
// Component: Playlist Item Model
// Purpose: Immutable value type for one entry of a playlist (image, video,
//          custom placeholder, or error sentinel) and its end-of-item
//          behavior.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_PLAYLIST_PLAYLIST_ITEM_HPP_
#define REELKIT_PLAYLIST_PLAYLIST_ITEM_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace reelkit::playlist {

// =============================================================================
// Behavior
// What happens when an item's natural duration elapses.
// =============================================================================

struct Behavior {
  enum class Kind : int32_t {
    kPlayOnce = 0,  // Fall through to the advance decision
    kLoop = 1,      // Rewind and replay indefinitely
    kRepeat = 2,    // Rewind and replay `count` times, then fall through
  };

  Kind kind = Kind::kPlayOnce;
  int32_t count = 0;  // Only meaningful for kRepeat

  static Behavior PlayOnce() { return Behavior{}; }
  static Behavior Loop() { return Behavior{Kind::kLoop, 0}; }
  static Behavior Repeat(int32_t n) { return Behavior{Kind::kRepeat, n}; }

  bool operator==(const Behavior& o) const {
    return kind == o.kind && (kind != Kind::kRepeat || count == o.count);
  }
  bool operator!=(const Behavior& o) const { return !(*this == o); }
};

const char* BehaviorName(Behavior::Kind kind);

// =============================================================================
// Variant content
// =============================================================================

struct ImageContent {
  std::string url;
  double duration_s = 0.0;
  bool operator==(const ImageContent& o) const {
    return url == o.url && duration_s == o.duration_s;
  }
};

struct VideoContent {
  std::string url;
  bool operator==(const VideoContent& o) const { return url == o.url; }
};

// Non-media placeholder that advances on a timer.
struct CustomContent {
  double duration_s = 0.0;
  bool operator==(const CustomContent& o) const {
    return duration_s == o.duration_s;
  }
};

// Sentinel for a load or playback failure.
struct ErrorContent {
  bool operator==(const ErrorContent&) const { return true; }
};

using ItemContent =
    std::variant<ImageContent, VideoContent, CustomContent, ErrorContent>;

enum class ItemKind : int32_t {
  kImage = 0,
  kVideo = 1,
  kCustom = 2,
  kError = 3,
};

inline const char* ItemKindName(ItemKind k) {
  switch (k) {
    case ItemKind::kImage:  return "IMAGE";
    case ItemKind::kVideo:  return "VIDEO";
    case ItemKind::kCustom: return "CUSTOM";
    case ItemKind::kError:  return "ERROR";
  }
  return "UNKNOWN";
}

// =============================================================================
// PlaylistItem
// `id` disambiguates duplicate content.  Equality and hash cover the id and
// the variant fields, so two items with the same URL but different ids are
// different items.
// =============================================================================

struct PlaylistItem {
  std::string id;
  Behavior behavior;
  ItemContent content = ErrorContent{};

  // Factories.  An empty id is replaced with a freshly generated one.
  static PlaylistItem Image(std::string url, double duration_s,
                            Behavior behavior = Behavior::PlayOnce(),
                            std::string id = {});
  static PlaylistItem Video(std::string url,
                            Behavior behavior = Behavior::PlayOnce(),
                            std::string id = {});
  static PlaylistItem Custom(double duration_s,
                             Behavior behavior = Behavior::PlayOnce(),
                             std::string id = {});
  static PlaylistItem Error(Behavior behavior = Behavior::PlayOnce(),
                            std::string id = {});

  ItemKind Kind() const { return static_cast<ItemKind>(content.index()); }

  // Media URL for image/video items; empty otherwise.
  const std::string& Url() const;

  // Duration fixed by the item itself (image, custom).  0 for video and
  // error items, whose duration comes from the media or from configuration.
  double FixedDurationSeconds() const;

  size_t Hash() const;

  bool operator==(const PlaylistItem& o) const {
    return id == o.id && behavior == o.behavior && content == o.content;
  }
  bool operator!=(const PlaylistItem& o) const { return !(*this == o); }
};

// Random (version 4) UUID string, lower-case, 36 characters.
std::string GenerateItemId();

struct PlaylistItemHash {
  size_t operator()(const PlaylistItem& item) const { return item.Hash(); }
};

}  // namespace reelkit::playlist

namespace std {
template <>
struct hash<reelkit::playlist::PlaylistItem> {
  size_t operator()(const reelkit::playlist::PlaylistItem& item) const {
    return item.Hash();
  }
};
}  // namespace std

#endif  // REELKIT_PLAYLIST_PLAYLIST_ITEM_HPP_
