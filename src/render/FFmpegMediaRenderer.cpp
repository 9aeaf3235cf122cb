// Repository: Reelkit-playlist
// Component: FFmpeg Media Renderer
// Purpose: Decode-ahead and media-clock pacing for one renderer slot.
// Copyright (c) 2025 RetroVue

#include "reelkit/render/FFmpegMediaRenderer.hpp"

#include <algorithm>
#include <chrono>
#include <deque>

#include "reelkit/util/Logger.hpp"

namespace reelkit::render {

using reelkit::util::Logger;
using reelkit::util::LogLine;

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kIdlePoll = std::chrono::milliseconds(20);

struct PendingFrame {
  decode::FramePtr frame;
  double pts_s = 0.0;
};

}  // namespace

FFmpegMediaRenderer::FFmpegMediaRenderer(const FFmpegRendererConfig& config)
    : config_(config) {}

FFmpegMediaRenderer::~FFmpegMediaRenderer() {
  Cancel();
}

void FFmpegMediaRenderer::Open(const std::string& url,
                               RendererCallbacks callbacks) {
  Cancel();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    playing_ = false;
    pending_seek_.reset();
    latest_frame_.reset();
    control_version_++;
  }
  stop_.store(false, std::memory_order_release);
  thread_ = std::thread(&FFmpegMediaRenderer::Run, this, url,
                        std::move(callbacks));
}

void FFmpegMediaRenderer::Play() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    playing_ = true;
    control_version_++;
  }
  cv_.notify_all();
}

void FFmpegMediaRenderer::Pause() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    playing_ = false;
    control_version_++;
  }
  cv_.notify_all();
}

void FFmpegMediaRenderer::SetRate(float rate) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    rate_ = std::max(0.0f, rate);
    control_version_++;
  }
  cv_.notify_all();
}

void FFmpegMediaRenderer::Seek(double position_s) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_seek_ = std::max(0.0, position_s);
    control_version_++;
  }
  cv_.notify_all();
}

void FFmpegMediaRenderer::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_.store(true, std::memory_order_release);
    control_version_++;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

std::shared_ptr<const image::DecodedImage> FFmpegMediaRenderer::LatestFrame()
    const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_frame_;
}

void FFmpegMediaRenderer::Publish(
    std::shared_ptr<const image::DecodedImage> frame) {
  if (!frame) return;
  std::lock_guard<std::mutex> lock(mutex_);
  latest_frame_ = std::move(frame);
}

// =============================================================================
// Run: decode thread, one per Open()
// =============================================================================

void FFmpegMediaRenderer::Run(std::string url, RendererCallbacks cb) {
  decode::FrameReaderConfig reader_config;
  reader_config.max_decode_threads = config_.max_decode_threads;
  decode::FFmpegFrameReader reader(reader_config);
  reader.SetInterruptFlag(&stop_);

  auto stopping = [this] { return stop_.load(std::memory_order_acquire); };
  auto fail = [&](const std::string& error) {
    if (stopping()) return;
    Logger::Warn(LogLine("FFmpegMediaRenderer", "DECODE_FAILED")
                     .Kv("url", url)
                     .Kv("error", error)
                     .Str());
    if (cb.on_error) cb.on_error(error);
  };

  std::string error;
  if (!reader.Open(url, &error)) {
    fail(error);
    return;
  }

  std::deque<PendingFrame> queue;
  bool eof = false;

  // Returns false on a decode error (error is set).
  auto decode_one = [&]() -> bool {
    PendingFrame pending;
    const auto status = reader.ReadFrame(&pending.frame, &pending.pts_s, &error);
    if (status == decode::FFmpegFrameReader::ReadStatus::kFrame) {
      queue.push_back(std::move(pending));
      return true;
    }
    if (status == decode::FFmpegFrameReader::ReadStatus::kEndOfStream) {
      eof = true;
      return true;
    }
    return false;
  };

  auto present_front = [&]() -> double {
    const double pts = queue.front().pts_s;
    Publish(reader.ToRgba(queue.front().frame.get(), &error));
    queue.pop_front();
    return pts;
  };

  // Poster frame.
  if (!decode_one() || queue.empty()) {
    fail(error.empty() ? "no decodable frame" : error);
    return;
  }
  double position = present_front();
  if (stopping()) return;
  if (cb.on_ready) cb.on_ready(reader.DurationSeconds());

  bool started = false;
  bool ended = false;
  bool stalled = false;
  bool clock_running = false;
  double clock_base_pts = position;
  Clock::time_point clock_base_wall = Clock::now();
  float applied_rate = 1.0f;

  auto media_clock = [&]() -> double {
    if (!clock_running) return position;
    const double elapsed =
        std::chrono::duration<double>(Clock::now() - clock_base_wall).count();
    return clock_base_pts + elapsed * applied_rate;
  };
  auto rebase = [&](double pts) {
    clock_base_pts = pts;
    clock_base_wall = Clock::now();
  };
  auto needs_decode = [&]() {
    if (eof) return false;
    if (queue.empty()) return true;
    return queue.back().pts_s - media_clock() < config_.read_ahead_s;
  };

  while (!stopping()) {
    bool playing;
    float rate;
    std::optional<double> seek;
    uint64_t version;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      playing = playing_;
      rate = rate_;
      seek = pending_seek_;
      pending_seek_.reset();
      version = control_version_;
    }

    if (seek) {
      if (!reader.Seek(*seek, &error)) {
        Logger::Warn(LogLine("FFmpegMediaRenderer", "SEEK_FAILED")
                         .Kv("url", url)
                         .Kv("target_s", *seek)
                         .Kv("error", error)
                         .Str());
      } else {
        queue.clear();
        eof = false;
        ended = false;
        while (!stopping()) {
          if (!decode_one()) {
            fail(error);
            return;
          }
          if (eof || queue.back().pts_s + 0.001 >= *seek) break;
          queue.pop_back();
        }
        position = queue.empty() ? *seek : present_front();
      }
      rebase(position);
      if (cb.on_progress) cb.on_progress(position);
      continue;
    }

    if (playing && !clock_running && !ended) {
      clock_running = true;
      applied_rate = rate;
      rebase(position);
    } else if (!playing && clock_running) {
      clock_running = false;
    }
    if (clock_running && rate != applied_rate) {
      rebase(media_clock());
      applied_rate = rate;
    }

    if (needs_decode() && !decode_one()) {
      fail(error);
      return;
    }

    if (clock_running && !queue.empty()) {
      const double now_media = media_clock();
      if (queue.front().pts_s <= now_media) {
        // Catch up: skip frames that are already late.
        while (queue.size() > 1 && queue[1].pts_s <= now_media) {
          queue.pop_front();
        }
        position = present_front();
        if (stalled) {
          stalled = false;
          rebase(position);
        }
        if (!started) {
          started = true;
          if (cb.on_started) cb.on_started();
        }
        if (cb.on_progress) cb.on_progress(position);
      }
    }

    if (clock_running && queue.empty()) {
      if (eof) {
        ended = true;
        clock_running = false;
        {
          std::lock_guard<std::mutex> lock(mutex_);
          playing_ = false;
        }
        if (cb.on_ended) cb.on_ended();
        continue;
      }
      if (!stalled && media_clock() - position > config_.stall_threshold_s) {
        stalled = true;
        if (cb.on_stalled) cb.on_stalled();
      }
    }

    if (needs_decode()) continue;

    auto deadline = Clock::now() + kIdlePoll;
    if (clock_running && !queue.empty() && applied_rate > 0.0f) {
      const double wait_s =
          std::max(0.0, (queue.front().pts_s - media_clock()) / applied_rate);
      deadline = std::min(
          deadline, Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                       std::chrono::duration<double>(wait_s)));
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [&] {
      return stopping() || control_version_ != version;
    });
  }
}

}  // namespace reelkit::render
