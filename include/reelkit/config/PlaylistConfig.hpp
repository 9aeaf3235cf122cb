// Repository: Reelkit-playlist
// Component: Playlist Configuration
// Purpose: Tunables for the buffer window manager and controller.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_CONFIG_PLAYLIST_CONFIG_HPP_
#define REELKIT_CONFIG_PLAYLIST_CONFIG_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace reelkit::config {

// End-of-item policy, chosen by the presentation surface.
enum class AdvanceMode {
  kAutoAdvance,  // Tap-through: advance, or signal end of playlist
  kLoopCurrent,  // Vertical feed: replay current; caller drives navigation
};

const char* AdvanceModeName(AdvanceMode mode);
std::optional<AdvanceMode> ParseAdvanceMode(const std::string& text);

struct PlaylistConfig {
  // Window
  int32_t backward_buffer = 2;
  int32_t forward_buffer = 5;
  bool adaptive_buffering = true;

  // Navigation timing
  int32_t settle_delay_ms = 100;
  int32_t items_debounce_ms = 100;

  // Non-media items
  double error_fallback_duration_s = 5.0;
  double default_image_duration_s = 10.0;
  int32_t timer_tick_ms = 100;

  // Collaborators
  int32_t image_cache_capacity = 10;
  int32_t bandwidth_window_ms = 10000;
  double video_forward_buffer_s = 2.5;

  AdvanceMode advance_mode = AdvanceMode::kAutoAdvance;
};

// Reads REELKIT_* overrides from the environment.  Malformed values are
// ignored with a warning.
void ApplyEnvOverrides(PlaylistConfig& config);

// Clamps fields into their usable range (buffers >= 0, tick >= 1 ms, ...).
// Returns false if anything had to be adjusted.
bool Normalize(PlaylistConfig& config);

}  // namespace reelkit::config

#endif  // REELKIT_CONFIG_PLAYLIST_CONFIG_HPP_
