// Repository: Reelkit-playlist
// Component: Playlist Configuration
// Copyright (c) 2025 RetroVue

#include "reelkit/config/PlaylistConfig.hpp"

#include <cstdlib>
#include <limits>

#include "reelkit/util/Logger.hpp"

namespace reelkit::config {

using reelkit::util::Logger;
using reelkit::util::LogLine;

namespace {

std::optional<int32_t> ParseInt(const char* text) {
  if (text == nullptr || *text == '\0') return std::nullopt;
  char* end = nullptr;
  const long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0') return std::nullopt;
  if (value < std::numeric_limits<int32_t>::min() ||
      value > std::numeric_limits<int32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<int32_t>(value);
}

std::optional<bool> ParseBool(const std::string& text) {
  if (text == "1" || text == "true" || text == "yes" || text == "on") {
    return true;
  }
  if (text == "0" || text == "false" || text == "no" || text == "off") {
    return false;
  }
  return std::nullopt;
}

void OverrideInt(const char* name, int32_t& field) {
  const char* raw = std::getenv(name);
  if (raw == nullptr) return;
  if (auto value = ParseInt(raw)) {
    field = *value;
    Logger::Info(LogLine("PlaylistConfig", "ENV_OVERRIDE")
                     .Kv("name", name)
                     .Kv("value", *value)
                     .Str());
    return;
  }
  Logger::Warn(LogLine("PlaylistConfig", "ENV_IGNORED")
                   .Kv("name", name)
                   .Kv("value", raw)
                   .Str());
}

}  // namespace

const char* AdvanceModeName(AdvanceMode mode) {
  switch (mode) {
    case AdvanceMode::kAutoAdvance: return "auto_advance";
    case AdvanceMode::kLoopCurrent: return "loop_current";
  }
  return "unknown";
}

std::optional<AdvanceMode> ParseAdvanceMode(const std::string& text) {
  if (text == "auto_advance" || text == "tap_through") {
    return AdvanceMode::kAutoAdvance;
  }
  if (text == "loop_current" || text == "vertical_feed") {
    return AdvanceMode::kLoopCurrent;
  }
  return std::nullopt;
}

void ApplyEnvOverrides(PlaylistConfig& config) {
  OverrideInt("REELKIT_BACKWARD_BUFFER", config.backward_buffer);
  OverrideInt("REELKIT_FORWARD_BUFFER", config.forward_buffer);
  OverrideInt("REELKIT_SETTLE_DELAY_MS", config.settle_delay_ms);
  OverrideInt("REELKIT_ITEMS_DEBOUNCE_MS", config.items_debounce_ms);
  OverrideInt("REELKIT_IMAGE_CACHE_CAPACITY", config.image_cache_capacity);

  if (const char* raw = std::getenv("REELKIT_ADAPTIVE_BUFFERING")) {
    if (auto value = ParseBool(raw)) {
      config.adaptive_buffering = *value;
    } else {
      Logger::Warn(LogLine("PlaylistConfig", "ENV_IGNORED")
                       .Kv("name", "REELKIT_ADAPTIVE_BUFFERING")
                       .Kv("value", raw)
                       .Str());
    }
  }
}

bool Normalize(PlaylistConfig& config) {
  bool clean = true;
  auto at_least = [&clean](auto& field, auto min) {
    if (field < min) {
      field = min;
      clean = false;
    }
  };
  at_least(config.backward_buffer, 0);
  at_least(config.forward_buffer, 0);
  at_least(config.settle_delay_ms, 0);
  at_least(config.items_debounce_ms, 0);
  at_least(config.timer_tick_ms, 1);
  at_least(config.image_cache_capacity, 1);
  at_least(config.bandwidth_window_ms, 1);
  at_least(config.error_fallback_duration_s, 0.0);
  at_least(config.default_image_duration_s, 0.0);
  at_least(config.video_forward_buffer_s, 0.0);
  return clean;
}

}  // namespace reelkit::config
