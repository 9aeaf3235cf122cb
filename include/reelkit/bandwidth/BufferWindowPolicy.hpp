// Repository: Reelkit-playlist
// Component: Buffer Window Policy
// Purpose: Maps measured throughput to backward/forward buffer sizes.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_BANDWIDTH_BUFFER_WINDOW_POLICY_HPP_
#define REELKIT_BANDWIDTH_BUFFER_WINDOW_POLICY_HPP_

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace reelkit::bandwidth {

struct BufferSizes {
  int32_t backward = 1;
  int32_t forward = 1;

  bool operator==(const BufferSizes& o) const {
    return backward == o.backward && forward == o.forward;
  }
  bool operator!=(const BufferSizes& o) const { return !(*this == o); }
};

// forward  = clamp(floor(Mbps),     1, 5)
// backward = clamp(floor(Mbps / 2), 1, 2)
// The two clamps are independent.
struct BufferWindowPolicy {
  static constexpr int32_t kMinForward = 1;
  static constexpr int32_t kMaxForward = 5;
  static constexpr int32_t kMinBackward = 1;
  static constexpr int32_t kMaxBackward = 2;

  static BufferSizes ForBandwidth(double bits_per_second) {
    if (!(bits_per_second > 0.0) || std::isinf(bits_per_second)) {
      bits_per_second = std::isinf(bits_per_second) ? 1e12 : 0.0;
    }
    const double mbps = bits_per_second / 1e6;
    BufferSizes sizes;
    sizes.forward = Clamp(mbps, kMinForward, kMaxForward);
    sizes.backward = Clamp(mbps / 2.0, kMinBackward, kMaxBackward);
    return sizes;
  }

 private:
  static int32_t Clamp(double value, int32_t lo, int32_t hi) {
    if (value >= static_cast<double>(hi)) return hi;
    return std::max(lo, static_cast<int32_t>(value));
  }
};

}  // namespace reelkit::bandwidth

#endif  // REELKIT_BANDWIDTH_BUFFER_WINDOW_POLICY_HPP_
