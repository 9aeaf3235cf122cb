// Repository: Reelkit-playlist
// Component: Playback Notifier
// Copyright (c) 2025 RetroVue

#include "reelkit/notify/PlaybackNotifier.hpp"

#include <stdexcept>

#include "reelkit/util/Logger.hpp"

namespace reelkit::notify {

using reelkit::util::Logger;
using reelkit::util::LogLine;

const char* PlaybackEventKindName(PlaybackEventKind kind) {
  switch (kind) {
    case PlaybackEventKind::kVideoRequested: return "video_requested";
    case PlaybackEventKind::kVideoStarted:   return "video_started";
    case PlaybackEventKind::kVideoStalled:   return "video_stalled";
    case PlaybackEventKind::kVideoError:     return "video_error";
  }
  return "unknown";
}

PlaybackNotifier::PlaybackNotifier(std::string controller_id,
                                   const time::ITimeSource* clock)
    : controller_id_(std::move(controller_id)), clock_(clock) {
  if (clock_ == nullptr) {
    throw std::invalid_argument("PlaybackNotifier requires a time source");
  }
}

void PlaybackNotifier::EmitVideoRequested(const std::string& url) {
  Emit(PlaybackEventKind::kVideoRequested, url, std::nullopt);
}

void PlaybackNotifier::EmitVideoStarted(const std::string& url) {
  Emit(PlaybackEventKind::kVideoStarted, url, std::nullopt);
}

void PlaybackNotifier::EmitVideoStalled(const std::string& url) {
  Emit(PlaybackEventKind::kVideoStalled, url, std::nullopt);
}

void PlaybackNotifier::EmitVideoError(const std::string& url,
                                      const std::string& error) {
  Emit(PlaybackEventKind::kVideoError, url, error);
}

runtime::Subscription PlaybackNotifier::Subscribe(Handler handler) {
  return events_.Subscribe(std::move(handler));
}

void PlaybackNotifier::Emit(PlaybackEventKind kind, const std::string& url,
                            std::optional<std::string> error) {
  PlaybackEvent event;
  event.kind = kind;
  event.timestamp_utc_ms = clock_->NowUtcMs();
  event.url = url;
  event.error = std::move(error);
  event.sequence = ++sequence_;
  event.controller_id = controller_id_;

  Logger::Debug(LogLine("PlaybackNotifier", "EMIT")
                    .Kv("kind", PlaybackEventKindName(kind))
                    .Kv("seq", event.sequence)
                    .Kv("url", url)
                    .Str());
  events_.Emit(event);
}

}  // namespace reelkit::notify
