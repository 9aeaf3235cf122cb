#pragma once
#include <cstdint>

namespace reelkit::time {

class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  // Wall clock, milliseconds since Unix epoch.  Used for event timestamps.
  virtual int64_t NowUtcMs() const = 0;
  // Monotonic milliseconds.  Used for aggregation windows and deadlines.
  virtual int64_t NowMonotonicMs() const = 0;
};

}  // namespace reelkit::time
