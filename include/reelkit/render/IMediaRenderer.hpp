// Repository: Reelkit-playlist
// Component: Media Renderer Interface
// Purpose: Backend contract for one playable surface in the renderer pool.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_RENDER_IMEDIA_RENDERER_HPP_
#define REELKIT_RENDER_IMEDIA_RENDERER_HPP_

#include <functional>
#include <memory>
#include <string>

namespace reelkit::render {

// Callbacks may be invoked on any thread (typically the backend's decode
// thread).  The renderer slot marshals them onto the owner executor.
// None are invoked after Cancel() returns.
struct RendererCallbacks {
  // First frame decodable.  duration_s may be NaN or infinite when the media
  // does not report one.
  std::function<void(double duration_s)> on_ready;
  // Open or decode failure.
  std::function<void(const std::string& error)> on_error;
  // Playback position after a frame is presented or a seek completes.
  std::function<void(double position_s)> on_progress;
  // Natural end of media reached while playing.
  std::function<void()> on_ended;
  // Playback waiting on data.
  std::function<void()> on_stalled;
  // First frame presented after Play().
  std::function<void()> on_started;
};

// IMediaRenderer is one decoder/presenter.  One instance per pool slot,
// reused across items via Open()/Cancel().
class IMediaRenderer {
 public:
  virtual ~IMediaRenderer() = default;

  // Begins loading url asynchronously; replaces any previous media.
  virtual void Open(const std::string& url, RendererCallbacks callbacks) = 0;

  virtual void Play() = 0;
  virtual void Pause() = 0;
  virtual void SetRate(float rate) = 0;

  // Asynchronous.  The post-seek position arrives through on_progress.
  virtual void Seek(double position_s) = 0;

  // Releases the media and decoder resources.  Blocks until no callback is
  // running.  The renderer may be Open()ed again afterwards.
  virtual void Cancel() = 0;
};

class IRendererFactory {
 public:
  virtual ~IRendererFactory() = default;
  virtual std::unique_ptr<IMediaRenderer> CreateRenderer() = 0;
};

}  // namespace reelkit::render

#endif  // REELKIT_RENDER_IMEDIA_RENDERER_HPP_
