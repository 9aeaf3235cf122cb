#pragma once
#include "reelkit/time/ITimeSource.hpp"
#include <chrono>

namespace reelkit::time {

class SystemTimeSource : public ITimeSource {
public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }

  int64_t NowMonotonicMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace reelkit::time
