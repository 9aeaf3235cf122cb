// Repository: Reelkit-playlist
// Component: FFmpeg Frame Reader
// Purpose: Opens a media URL with libavformat/libavcodec and yields decoded
//          video frames; converts frames to RGBA with libswscale.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_DECODE_FFMPEG_FRAME_READER_HPP_
#define REELKIT_DECODE_FFMPEG_FRAME_READER_HPP_

#include <atomic>
#include <memory>
#include <string>

#include "reelkit/image/IImageCache.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace reelkit::decode {

struct AVFrameDeleter {
  void operator()(AVFrame* frame) const;
};
using FramePtr = std::unique_ptr<AVFrame, AVFrameDeleter>;

struct FrameReaderConfig {
  int max_decode_threads = 0;  // 0 = auto
};

// FFmpegFrameReader decodes the best video stream of one input.
//
// Thread Safety:
// - Not thread-safe: use from a single decode thread.
// - SetInterruptFlag() lets another thread abort blocking I/O.
//
// Lifecycle:
// 1. Construct
// 2. Open(url)
// 3. ReadFrame() / Seek() repeatedly
// 4. Close() or rely on destructor
class FFmpegFrameReader {
 public:
  enum class ReadStatus { kFrame, kEndOfStream, kError };

  explicit FFmpegFrameReader(FrameReaderConfig config = {});
  ~FFmpegFrameReader();

  FFmpegFrameReader(const FFmpegFrameReader&) = delete;
  FFmpegFrameReader& operator=(const FFmpegFrameReader&) = delete;

  // Returns false with *error set on failure.
  bool Open(const std::string& url, std::string* error);
  void Close();
  bool IsOpen() const { return codec_ctx_ != nullptr; }

  // While *flag is true, blocking reads return promptly with an error.
  void SetInterruptFlag(const std::atomic<bool>* flag) {
    interrupt_flag_ = flag;
  }

  // Container duration; NaN when the container does not report one.
  double DurationSeconds() const;
  int Width() const;
  int Height() const;

  // On kFrame, *frame holds a new reference and *pts_s its presentation
  // time in seconds.
  ReadStatus ReadFrame(FramePtr* frame, double* pts_s, std::string* error);

  // Seeks to the keyframe at or before position_s and flushes the decoder.
  bool Seek(double position_s, std::string* error);

  // Tightly packed RGBA at the frame's native size.
  std::shared_ptr<image::DecodedImage> ToRgba(const AVFrame* frame,
                                              std::string* error);

  static std::string ErrorString(int averror);

 private:
  static int InterruptCallback(void* opaque);
  double FramePtsSeconds(const AVFrame* frame) const;

  FrameReaderConfig config_;
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
  int video_stream_index_ = -1;
  double time_base_ = 0.0;
  double start_time_s_ = 0.0;
  bool draining_ = false;
  const std::atomic<bool>* interrupt_flag_ = nullptr;
};

}  // namespace reelkit::decode

#endif  // REELKIT_DECODE_FFMPEG_FRAME_READER_HPP_
