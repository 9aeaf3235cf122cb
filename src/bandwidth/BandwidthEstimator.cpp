// Repository: Reelkit-playlist
// Component: Bandwidth Estimator
// Copyright (c) 2025 RetroVue

#include "reelkit/bandwidth/BandwidthEstimator.hpp"

#include <cmath>
#include <stdexcept>

#include "reelkit/util/Logger.hpp"

namespace reelkit::bandwidth {

using reelkit::util::Logger;
using reelkit::util::LogLine;

BandwidthEstimator::BandwidthEstimator(const time::ITimeSource* clock,
                                       std::chrono::milliseconds window)
    : clock_(clock), window_ms_(window.count()) {
  if (clock_ == nullptr) {
    throw std::invalid_argument("BandwidthEstimator requires a time source");
  }
}

void BandwidthEstimator::ReportSample(double bits_per_second) {
  std::optional<double> publish;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!(bits_per_second > 0.0) || std::isinf(bits_per_second) ||
        (last_sample_ && *last_sample_ == bits_per_second)) {
      ++dropped_;
      return;
    }
    last_sample_ = bits_per_second;
    ++accepted_;

    const int64_t now = clock_->NowMonotonicMs();
    if (!last_published_) {
      // Fast path: first usable sample goes out immediately and opens the
      // first aggregation window.
      last_published_ = bits_per_second;
      window_start_ms_ = now;
      publish = bits_per_second;
    } else {
      publish = CloseWindowLocked(now);
      window_sum_ += bits_per_second;
      window_count_++;
    }
  }
  if (publish) {
    Logger::Debug(LogLine("BandwidthEstimator", "PUBLISH")
                      .Kv("bps", static_cast<int64_t>(*publish))
                      .Str());
    published_.Emit(*publish);
  }
}

void BandwidthEstimator::RecordTransfer(uint64_t bytes,
                                        std::chrono::milliseconds elapsed) {
  if (elapsed.count() <= 0 || bytes == 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++dropped_;
    return;
  }
  const double seconds = static_cast<double>(elapsed.count()) / 1000.0;
  ReportSample(static_cast<double>(bytes) * 8.0 / seconds);
}

void BandwidthEstimator::Poll() {
  std::optional<double> publish;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_published_) return;
    publish = CloseWindowLocked(clock_->NowMonotonicMs());
  }
  if (publish) published_.Emit(*publish);
}

std::optional<double> BandwidthEstimator::CloseWindowLocked(int64_t now_ms) {
  if (now_ms - window_start_ms_ < window_ms_) return std::nullopt;

  std::optional<double> publish;
  if (window_count_ > 0) {
    const double mean = window_sum_ / static_cast<double>(window_count_);
    if (!last_published_ || *last_published_ != mean) {
      last_published_ = mean;
      publish = mean;
    }
  }
  window_sum_ = 0.0;
  window_count_ = 0;
  window_start_ms_ = now_ms;
  return publish;
}

std::optional<double> BandwidthEstimator::LastEstimate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_published_;
}

uint64_t BandwidthEstimator::AcceptedSampleCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accepted_;
}

uint64_t BandwidthEstimator::DroppedSampleCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

}  // namespace reelkit::bandwidth
