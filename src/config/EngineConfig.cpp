// Repository: SkipTV
// Component: EngineConfig
// Purpose: Config file parsing and validation.
// Copyright (c) 2026 SkipTV

#include "skiptv/config/EngineConfig.hpp"

#include <chrono>
#include <set>
#include <sstream>
#include <utility>

#include "skiptv/util/JsonScan.hpp"

namespace skiptv::config {

namespace json = skiptv::util::json;

namespace {

void ReadBool(const std::string& text, const char* key, bool* out) {
  bool value = false;
  if (json::ExtractBool(text, key, &value)) *out = value;
}

void ReadInt(const std::string& text, const char* key, int64_t* out) {
  int64_t value = 0;
  if (json::ExtractInt64(text, key, &value)) *out = value;
}

}  // namespace

std::optional<EngineConfig> EngineConfig::FromJson(const std::string& text) {
  const size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos || text[first] != '{') return std::nullopt;

  EngineConfig config;

  std::string devices_text;
  if (!json::ExtractArray(text, "devices", &devices_text)) return std::nullopt;
  for (const std::string& object : json::SplitObjectArray(devices_text)) {
    runtime::Device device;
    if (!json::ExtractString(object, "screen_id", &device.screen_id) ||
        device.screen_id.empty()) {
      return std::nullopt;
    }
    json::ExtractString(object, "name", &device.name);
    if (device.name.empty()) device.name = device.screen_id;
    double offset = 0.0;
    if (json::ExtractDouble(object, "offset", &offset)) device.offset_sec = offset;
    config.devices.push_back(std::move(device));
  }
  if (config.devices.empty()) return std::nullopt;

  std::string categories_text;
  if (json::ExtractArray(text, "skip_categories", &categories_text)) {
    config.skip_categories = json::SplitStringArray(categories_text);
  }

  std::string whitelist_text;
  if (json::ExtractArray(text, "channel_whitelist", &whitelist_text)) {
    for (const std::string& object : json::SplitObjectArray(whitelist_text)) {
      std::string id;
      if (json::ExtractString(object, "id", &id) && !id.empty()) {
        config.channel_whitelist.push_back(id);
      }
    }
  }

  json::ExtractString(text, "apikey", &config.api_key);
  ReadBool(text, "skip_count_tracking", &config.skip_count_tracking);
  ReadBool(text, "mute_ads", &config.mute_ads);
  ReadBool(text, "skip_ads", &config.skip_ads);
  ReadBool(text, "auto_play", &config.auto_play);
  ReadBool(text, "debug", &config.debug);

  ReadInt(text, "watchdog_window_ms", &config.watchdog_window_ms);
  ReadInt(text, "reconnect_backoff_ms", &config.reconnect_backoff_ms);
  ReadInt(text, "segment_cache_ttl_s", &config.segment_cache_ttl_s);
  ReadInt(text, "segment_cache_capacity", &config.segment_cache_capacity);
  ReadInt(text, "channel_cache_ttl_s", &config.channel_cache_ttl_s);
  ReadInt(text, "channel_cache_capacity", &config.channel_cache_capacity);

  return config;
}

std::vector<std::string> EngineConfig::Validate() const {
  std::vector<std::string> problems;

  if (devices.empty()) problems.push_back("no devices configured");
  std::set<std::string> screens;
  for (const auto& device : devices) {
    if (device.screen_id.empty()) {
      problems.push_back("device '" + device.name + "' has no screen_id");
    } else if (!screens.insert(device.screen_id).second) {
      problems.push_back("duplicate screen_id '" + device.screen_id + "'");
    }
  }

  if (skip_categories.empty()) problems.push_back("skip_categories is empty");

  auto require_positive = [&problems](const char* name, int64_t value) {
    if (value <= 0) {
      std::ostringstream oss;
      oss << name << " must be positive (got " << value << ")";
      problems.push_back(oss.str());
    }
  };
  auto require_non_negative = [&problems](const char* name, int64_t value) {
    if (value < 0) {
      std::ostringstream oss;
      oss << name << " must not be negative (got " << value << ")";
      problems.push_back(oss.str());
    }
  };
  require_positive("watchdog_window_ms", watchdog_window_ms);
  require_non_negative("reconnect_backoff_ms", reconnect_backoff_ms);
  require_non_negative("segment_cache_ttl_s", segment_cache_ttl_s);
  require_non_negative("segment_cache_capacity", segment_cache_capacity);
  require_non_negative("channel_cache_ttl_s", channel_cache_ttl_s);
  require_non_negative("channel_cache_capacity", channel_cache_capacity);

  return problems;
}

runtime::SessionPolicy EngineConfig::ToSessionPolicy() const {
  runtime::SessionPolicy policy;
  policy.mute_ads = mute_ads;
  policy.skip_ads = skip_ads;
  policy.auto_play = auto_play;
  policy.skip_count_tracking = skip_count_tracking;
  policy.watchdog_window = std::chrono::milliseconds(watchdog_window_ms);
  policy.reconnect_backoff = std::chrono::milliseconds(reconnect_backoff_ms);
  return policy;
}

segments::ResolverOptions EngineConfig::ToResolverOptions() const {
  segments::ResolverOptions options;
  options.categories = skip_categories;
  options.channel_whitelist = channel_whitelist;
  return options;
}

}  // namespace skiptv::config
