// Repository: Reelkit-playlist
// Component: FFmpeg Media Renderer
// Purpose: IMediaRenderer backed by a decode/pacing thread.  Buffers decoded
//          frames ahead of the play head (also while paused, so a prepared
//          slot is ready to start instantly) and presents them against a
//          rate-scaled media clock.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_RENDER_FFMPEG_MEDIA_RENDERER_HPP_
#define REELKIT_RENDER_FFMPEG_MEDIA_RENDERER_HPP_

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "reelkit/decode/FFmpegFrameReader.hpp"
#include "reelkit/image/IImageCache.hpp"
#include "reelkit/render/IMediaRenderer.hpp"

namespace reelkit::render {

struct FFmpegRendererConfig {
  double read_ahead_s = 2.5;        // Decoded frames kept ahead of the play head
  double stall_threshold_s = 0.25;  // Starvation before on_stalled fires
  int max_decode_threads = 0;       // 0 = auto
};

// FFmpegMediaRenderer owns one decode thread per opened URL.
//
// Lifecycle:
//   Open(url)  -> thread starts, opens input, decodes first frame, on_ready
//   Play()     -> presentation against the media clock, on_started once
//   end of media -> on_ended, playback pauses on the last frame
//   Cancel()   -> interrupts I/O, joins the thread; no callbacks afterwards
class FFmpegMediaRenderer : public IMediaRenderer {
 public:
  explicit FFmpegMediaRenderer(const FFmpegRendererConfig& config);
  ~FFmpegMediaRenderer() override;

  FFmpegMediaRenderer(const FFmpegMediaRenderer&) = delete;
  FFmpegMediaRenderer& operator=(const FFmpegMediaRenderer&) = delete;

  void Open(const std::string& url, RendererCallbacks callbacks) override;
  void Play() override;
  void Pause() override;
  void SetRate(float rate) override;
  void Seek(double position_s) override;
  void Cancel() override;

  // Most recently presented frame (the poster frame before Play()).
  std::shared_ptr<const image::DecodedImage> LatestFrame() const;

 private:
  void Run(std::string url, RendererCallbacks callbacks);
  void Publish(std::shared_ptr<const image::DecodedImage> frame);

  const FFmpegRendererConfig config_;
  std::thread thread_;
  std::atomic<bool> stop_{false};

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool playing_ = false;
  float rate_ = 1.0f;
  std::optional<double> pending_seek_;
  uint64_t control_version_ = 0;  // Bumped on every Play/Pause/rate/seek
  std::shared_ptr<const image::DecodedImage> latest_frame_;
};

class FFmpegRendererFactory : public IRendererFactory {
 public:
  explicit FFmpegRendererFactory(FFmpegRendererConfig config)
      : config_(config) {}

  std::unique_ptr<IMediaRenderer> CreateRenderer() override {
    return std::make_unique<FFmpegMediaRenderer>(config_);
  }

 private:
  FFmpegRendererConfig config_;
};

}  // namespace reelkit::render

#endif  // REELKIT_RENDER_FFMPEG_MEDIA_RENDERER_HPP_
