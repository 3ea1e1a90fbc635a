// Repository: SkipTV
// Component: Time Source Interface
// Purpose: Decouple elapsed-time math from the wall clock.
//          Production: SystemTimeSource (steady_clock).
//          Tests: DeterministicTimeSource (manual advance, no sleep).
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_TIMING_ITIME_SOURCE_HPP_
#define SKIPTV_TIMING_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace skiptv::timing {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  // Monotonic microseconds; only differences are meaningful.
  virtual int64_t NowMonotonicUs() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowMonotonicUs() const override {
    using namespace std::chrono;
    return duration_cast<microseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace skiptv::timing

#endif  // SKIPTV_TIMING_ITIME_SOURCE_HPP_
