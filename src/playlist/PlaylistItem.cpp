// Repository: Reelkit-playlist
// Component: Playlist Item Model
// Copyright (c) 2025 RetroVue

#include "reelkit/playlist/PlaylistItem.hpp"

#include <cstdio>
#include <mutex>
#include <random>

namespace reelkit::playlist {

namespace {

const std::string kEmptyUrl;

void HashCombine(size_t& seed, size_t value) {
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

std::string EnsureId(std::string id) {
  return id.empty() ? GenerateItemId() : id;
}

}  // namespace

const char* BehaviorName(Behavior::Kind kind) {
  switch (kind) {
    case Behavior::Kind::kPlayOnce: return "play_once";
    case Behavior::Kind::kLoop:     return "loop";
    case Behavior::Kind::kRepeat:   return "repeat";
  }
  return "unknown";
}

PlaylistItem PlaylistItem::Image(std::string url, double duration_s,
                                 Behavior behavior, std::string id) {
  return PlaylistItem{EnsureId(std::move(id)), behavior,
                      ImageContent{std::move(url), duration_s}};
}

PlaylistItem PlaylistItem::Video(std::string url, Behavior behavior,
                                 std::string id) {
  return PlaylistItem{EnsureId(std::move(id)), behavior,
                      VideoContent{std::move(url)}};
}

PlaylistItem PlaylistItem::Custom(double duration_s, Behavior behavior,
                                  std::string id) {
  return PlaylistItem{EnsureId(std::move(id)), behavior,
                      CustomContent{duration_s}};
}

PlaylistItem PlaylistItem::Error(Behavior behavior, std::string id) {
  return PlaylistItem{EnsureId(std::move(id)), behavior, ErrorContent{}};
}

const std::string& PlaylistItem::Url() const {
  if (const auto* image = std::get_if<ImageContent>(&content)) {
    return image->url;
  }
  if (const auto* video = std::get_if<VideoContent>(&content)) {
    return video->url;
  }
  return kEmptyUrl;
}

double PlaylistItem::FixedDurationSeconds() const {
  if (const auto* image = std::get_if<ImageContent>(&content)) {
    return image->duration_s;
  }
  if (const auto* custom = std::get_if<CustomContent>(&content)) {
    return custom->duration_s;
  }
  return 0.0;
}

size_t PlaylistItem::Hash() const {
  size_t seed = std::hash<std::string>{}(id);
  HashCombine(seed, static_cast<size_t>(behavior.kind));
  if (behavior.kind == Behavior::Kind::kRepeat) {
    HashCombine(seed, static_cast<size_t>(behavior.count));
  }
  HashCombine(seed, content.index());
  HashCombine(seed, std::hash<std::string>{}(Url()));
  HashCombine(seed, std::hash<double>{}(FixedDurationSeconds()));
  return seed;
}

std::string GenerateItemId() {
  static std::mutex mutex;
  static std::mt19937_64 engine{std::random_device{}()};

  uint64_t hi;
  uint64_t lo;
  {
    std::lock_guard<std::mutex> lock(mutex);
    hi = engine();
    lo = engine();
  }
  // Version 4, RFC 4122 variant.
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return std::string(buf);
}

}  // namespace reelkit::playlist
