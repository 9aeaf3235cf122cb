// Repository: Reelkit-playlist
// Component: FFmpeg Frame Reader
// Purpose: libavformat/libavcodec video decode and libswscale RGBA
//          conversion.
// Copyright (c) 2025 RetroVue

#include "reelkit/decode/FFmpegFrameReader.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "reelkit/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libswscale/swscale.h>
}

namespace reelkit::decode {

using reelkit::util::Logger;
using reelkit::util::LogLine;

void AVFrameDeleter::operator()(AVFrame* frame) const {
  av_frame_free(&frame);
}

std::string FFmpegFrameReader::ErrorString(int averror) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(averror, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

// FFmpeg interrupt callback: return non-zero to abort I/O.
int FFmpegFrameReader::InterruptCallback(void* opaque) {
  auto* self = static_cast<FFmpegFrameReader*>(opaque);
  if (self->interrupt_flag_ &&
      self->interrupt_flag_->load(std::memory_order_acquire)) {
    return 1;
  }
  return 0;
}

FFmpegFrameReader::FFmpegFrameReader(FrameReaderConfig config)
    : config_(config) {}

FFmpegFrameReader::~FFmpegFrameReader() {
  Close();
}

bool FFmpegFrameReader::Open(const std::string& url, std::string* error) {
  Close();

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    *error = "failed to allocate format context";
    return false;
  }
  format_ctx_->interrupt_callback.callback = &FFmpegFrameReader::InterruptCallback;
  format_ctx_->interrupt_callback.opaque = this;

  int ret = avformat_open_input(&format_ctx_, url.c_str(), nullptr, nullptr);
  if (ret < 0) {
    *error = "open_input: " + ErrorString(ret);
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    *error = "find_stream_info: " + ErrorString(ret);
    Close();
    return false;
  }

  ret = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (ret < 0) {
    *error = "no video stream";
    Close();
    return false;
  }
  video_stream_index_ = ret;
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
  if (codec == nullptr) {
    *error = "no decoder for video stream";
    Close();
    return false;
  }
  time_base_ = av_q2d(stream->time_base);
  start_time_s_ = stream->start_time != AV_NOPTS_VALUE
                      ? static_cast<double>(stream->start_time) * time_base_
                      : 0.0;

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    *error = "failed to allocate codec context";
    Close();
    return false;
  }
  ret = avcodec_parameters_to_context(codec_ctx_, stream->codecpar);
  if (ret < 0) {
    *error = "parameters_to_context: " + ErrorString(ret);
    Close();
    return false;
  }
  codec_ctx_->thread_count = config_.max_decode_threads;

  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    *error = "codec_open: " + ErrorString(ret);
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    *error = "failed to allocate packet";
    Close();
    return false;
  }

  draining_ = false;
  Logger::Debug(LogLine("FFmpegFrameReader", "OPENED")
                    .Kv("url", url)
                    .Kv("width", codec_ctx_->width)
                    .Kv("height", codec_ctx_->height)
                    .Kv("codec", codec->name)
                    .Str());
  return true;
}

void FFmpegFrameReader::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }
  video_stream_index_ = -1;
  draining_ = false;
}

double FFmpegFrameReader::DurationSeconds() const {
  if (!format_ctx_ || format_ctx_->duration == AV_NOPTS_VALUE ||
      format_ctx_->duration <= 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return static_cast<double>(format_ctx_->duration) / AV_TIME_BASE;
}

int FFmpegFrameReader::Width() const {
  return codec_ctx_ ? codec_ctx_->width : 0;
}

int FFmpegFrameReader::Height() const {
  return codec_ctx_ ? codec_ctx_->height : 0;
}

double FFmpegFrameReader::FramePtsSeconds(const AVFrame* frame) const {
  int64_t pts = frame->best_effort_timestamp;
  if (pts == AV_NOPTS_VALUE) pts = frame->pts;
  if (pts == AV_NOPTS_VALUE) return 0.0;
  return std::max(0.0, static_cast<double>(pts) * time_base_ - start_time_s_);
}

FFmpegFrameReader::ReadStatus FFmpegFrameReader::ReadFrame(
    FramePtr* frame, double* pts_s, std::string* error) {
  if (!IsOpen()) {
    *error = "reader not open";
    return ReadStatus::kError;
  }

  FramePtr decoded(av_frame_alloc());
  if (!decoded) {
    *error = "failed to allocate frame";
    return ReadStatus::kError;
  }

  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, decoded.get());
    if (ret == 0) {
      *pts_s = FramePtsSeconds(decoded.get());
      *frame = std::move(decoded);
      return ReadStatus::kFrame;
    }
    if (ret == AVERROR_EOF) return ReadStatus::kEndOfStream;
    if (ret != AVERROR(EAGAIN)) {
      *error = "receive_frame: " + ErrorString(ret);
      return ReadStatus::kError;
    }
    if (draining_) return ReadStatus::kEndOfStream;

    ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      // Flush: the decoder still holds delayed frames.
      draining_ = true;
      avcodec_send_packet(codec_ctx_, nullptr);
      continue;
    }
    if (ret < 0) {
      *error = "read_frame: " + ErrorString(ret);
      return ReadStatus::kError;
    }
    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }
    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      *error = "send_packet: " + ErrorString(ret);
      return ReadStatus::kError;
    }
  }
}

bool FFmpegFrameReader::Seek(double position_s, std::string* error) {
  if (!IsOpen()) {
    *error = "reader not open";
    return false;
  }
  const int64_t target = static_cast<int64_t>(
      (std::max(0.0, position_s) + start_time_s_) / time_base_);
  int ret = av_seek_frame(format_ctx_, video_stream_index_, target,
                          AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    *error = "seek: " + ErrorString(ret);
    return false;
  }
  avcodec_flush_buffers(codec_ctx_);
  draining_ = false;
  return true;
}

std::shared_ptr<image::DecodedImage> FFmpegFrameReader::ToRgba(
    const AVFrame* frame, std::string* error) {
  if (frame == nullptr || frame->width <= 0 || frame->height <= 0) {
    *error = "empty frame";
    return nullptr;
  }
  sws_ctx_ = sws_getCachedContext(
      sws_ctx_, frame->width, frame->height,
      static_cast<AVPixelFormat>(frame->format), frame->width, frame->height,
      AV_PIX_FMT_RGBA, SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    *error = "failed to create scaler";
    return nullptr;
  }

  auto out = std::make_shared<image::DecodedImage>();
  out->width = frame->width;
  out->height = frame->height;
  out->rgba.resize(static_cast<size_t>(frame->width) * frame->height * 4);

  uint8_t* dst_data[4] = {out->rgba.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {frame->width * 4, 0, 0, 0};
  sws_scale(sws_ctx_, frame->data, frame->linesize, 0, frame->height,
            dst_data, dst_linesize);
  return out;
}

}  // namespace reelkit::decode
