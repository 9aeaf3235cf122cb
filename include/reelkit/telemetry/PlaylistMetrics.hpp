// Repository: Reelkit-playlist
// Component: Playlist Metrics
// Purpose: Passive observability counters for the buffer window manager
// Copyright (c) 2025 RetroVue
//
// Header-only.  All metric names use the "reelkit_playlist_" prefix.
// Mutated only on the controller's executor.  These metrics never affect
// window decisions or navigation.

#ifndef REELKIT_TELEMETRY_PLAYLIST_METRICS_HPP_
#define REELKIT_TELEMETRY_PLAYLIST_METRICS_HPP_

#include <cstdint>
#include <sstream>
#include <string>

namespace reelkit::telemetry {

struct PlaylistMetrics {
  // ---- Slot Binding ----
  int64_t slot_binds_total = 0;
  int64_t slot_clears_total = 0;

  // ---- Window Shift ----
  int64_t window_shifts_total = 0;
  int64_t rotations_total = 0;
  int64_t full_rebinds_total = 0;

  // ---- Resize ----
  int64_t pool_resizes_total = 0;

  // ---- Async Discipline ----
  int64_t stale_results_discarded_total = 0;
  int64_t load_failures_total = 0;

  // ---- Navigation ----
  int64_t auto_advances_total = 0;
  int64_t loop_replays_total = 0;
  int64_t playlist_reached_end_total = 0;

  // ---- Gauges ----
  int32_t pool_size = 0;
  int32_t backward_buffer = 0;
  int32_t forward_buffer = 0;
  int32_t current_index = 0;

  std::string controller_id;

  // Generate Prometheus text exposition format
  std::string GeneratePrometheusText() const {
    std::ostringstream oss;
    const std::string label = "{controller=\"" + controller_id + "\"} ";

    auto emit = [&](const char* name, const char* type, const char* help,
                    int64_t value) {
      oss << "# HELP reelkit_playlist_" << name << " " << help << "\n";
      oss << "# TYPE reelkit_playlist_" << name << " " << type << "\n";
      oss << "reelkit_playlist_" << name << label << value << "\n\n";
    };

    emit("slot_binds_total", "counter",
         "Slots bound (prepared) to a new item", slot_binds_total);
    emit("slot_clears_total", "counter",
         "Slots cancelled and returned to idle", slot_clears_total);
    emit("window_shifts_total", "counter",
         "Index changes handled by the window manager", window_shifts_total);
    emit("rotations_total", "counter",
         "Window shifts served by rotating the pool", rotations_total);
    emit("full_rebinds_total", "counter",
         "Window shifts with no surviving slot (every slot re-prepared)",
         full_rebinds_total);
    emit("pool_resizes_total", "counter",
         "Pool size changes from bandwidth or explicit resize",
         pool_resizes_total);
    emit("stale_results_discarded_total", "counter",
         "Async results dropped because the slot was rebound",
         stale_results_discarded_total);
    emit("load_failures_total", "counter",
         "Image fetch or media open failures", load_failures_total);
    emit("auto_advances_total", "counter",
         "Advances triggered by end of item", auto_advances_total);
    emit("loop_replays_total", "counter",
         "Replays from loop or repeat behaviors", loop_replays_total);
    emit("playlist_reached_end_total", "counter",
         "End of playlist events", playlist_reached_end_total);
    emit("pool_size", "gauge", "Renderer slots in the pool", pool_size);
    emit("backward_buffer", "gauge", "Backward buffer size", backward_buffer);
    emit("forward_buffer", "gauge", "Forward buffer size", forward_buffer);
    emit("current_index", "gauge", "Current playlist index", current_index);

    return oss.str();
  }
};

}  // namespace reelkit::telemetry

#endif  // REELKIT_TELEMETRY_PLAYLIST_METRICS_HPP_
