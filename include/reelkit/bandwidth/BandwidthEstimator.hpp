// Repository: Reelkit-playlist
// Component: Bandwidth Estimator
// Purpose: Turns raw throughput samples into a slow-moving published
//          estimate that drives adaptive buffer sizing.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_BANDWIDTH_BANDWIDTH_ESTIMATOR_HPP_
#define REELKIT_BANDWIDTH_BANDWIDTH_ESTIMATOR_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

#include "reelkit/runtime/Observable.hpp"
#include "reelkit/time/ITimeSource.hpp"

namespace reelkit::bandwidth {

// BandwidthEstimator publishes throughput estimates in bits/second.
//
// - Non-positive samples and samples equal to the previous accepted one are
//   dropped.
// - The first accepted sample is published immediately.
// - After that, samples are averaged over an aggregation window; the mean is
//   published when a sample (or Poll()) arrives after the window closed.
// - A published value equal to the previous one is not re-published.
//
// Thread-safe.  Subscribers run on the reporting thread.
class BandwidthEstimator {
 public:
  using Handler = std::function<void(const double& bits_per_second)>;

  BandwidthEstimator(const time::ITimeSource* clock,
                     std::chrono::milliseconds window);

  BandwidthEstimator(const BandwidthEstimator&) = delete;
  BandwidthEstimator& operator=(const BandwidthEstimator&) = delete;

  void ReportSample(double bits_per_second);

  // bytes transferred over elapsed, converted to bits/second.
  void RecordTransfer(uint64_t bytes, std::chrono::milliseconds elapsed);

  // Closes the aggregation window if it has expired.
  void Poll();

  [[nodiscard]] runtime::Subscription Subscribe(Handler handler) const {
    return published_.Subscribe(std::move(handler));
  }

  std::optional<double> LastEstimate() const;
  uint64_t AcceptedSampleCount() const;
  uint64_t DroppedSampleCount() const;

 private:
  // Returns the value to publish, if any.  Caller holds mutex_.
  std::optional<double> CloseWindowLocked(int64_t now_ms);

  const time::ITimeSource* clock_;
  const int64_t window_ms_;

  mutable std::mutex mutex_;
  std::optional<double> last_sample_;
  std::optional<double> last_published_;
  double window_sum_ = 0.0;
  uint64_t window_count_ = 0;
  int64_t window_start_ms_ = 0;
  uint64_t accepted_ = 0;
  uint64_t dropped_ = 0;

  runtime::Signal<double> published_;
};

}  // namespace reelkit::bandwidth

#endif  // REELKIT_BANDWIDTH_BANDWIDTH_ESTIMATOR_HPP_
