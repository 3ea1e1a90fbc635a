// Repository: SkipTV
// Component: Device
// Purpose: Configured screen identity and the per-session behavior policy.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_RUNTIME_DEVICE_HPP_
#define SKIPTV_RUNTIME_DEVICE_HPP_

#include <chrono>
#include <string>

namespace skiptv::runtime {

struct Device {
  std::string name;
  std::string screen_id;
  // Seconds subtracted from every computed skip delay.
  double offset_sec = 0.0;
};

struct SessionPolicy {
  bool mute_ads = false;
  bool skip_ads = false;
  bool auto_play = true;
  bool skip_count_tracking = true;

  std::chrono::milliseconds watchdog_window{35000};
  std::chrono::milliseconds reconnect_backoff{10000};
};

}  // namespace skiptv::runtime

#endif  // SKIPTV_RUNTIME_DEVICE_HPP_
