// Repository: SkipTV
// Component: EngineConfig
// Purpose: Engine configuration: devices, skip policy, cache and timing
//          knobs. Parsed from the JSON config file.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_CONFIG_ENGINE_CONFIG_HPP_
#define SKIPTV_CONFIG_ENGINE_CONFIG_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "skiptv/runtime/Device.hpp"
#include "skiptv/segments/SegmentResolver.hpp"

namespace skiptv::config {

struct EngineConfig {
  std::vector<runtime::Device> devices;
  std::vector<std::string> skip_categories{"sponsor"};
  std::vector<std::string> channel_whitelist;
  bool skip_count_tracking = true;
  bool mute_ads = false;
  bool skip_ads = false;
  bool auto_play = true;
  std::string api_key;
  bool debug = false;

  int64_t watchdog_window_ms = 35000;
  int64_t reconnect_backoff_ms = 10000;
  int64_t segment_cache_ttl_s = 300;
  int64_t segment_cache_capacity = 10;
  int64_t channel_cache_ttl_s = 3600;
  int64_t channel_cache_capacity = 100;

  // Returns nullopt if the text is not an object or has no usable devices.
  static std::optional<EngineConfig> FromJson(const std::string& json);

  // Human-readable problems; empty when the config is usable.
  std::vector<std::string> Validate() const;

  runtime::SessionPolicy ToSessionPolicy() const;
  segments::ResolverOptions ToResolverOptions() const;

  // Channel whitelisting needs the video metadata API.
  bool WhitelistEnabled() const { return !api_key.empty() && !channel_whitelist.empty(); }
};

}  // namespace skiptv::config

#endif  // SKIPTV_CONFIG_ENGINE_CONFIG_HPP_
