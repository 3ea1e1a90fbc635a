// Repository: SkipTV
// Component: Lounge event decoding
// Purpose: Raw lounge payload → LoungeEvent.
// Copyright (c) 2026 SkipTV

#include "skiptv/lounge/LoungeEvent.hpp"

#include <cerrno>
#include <cstdlib>
#include <utility>

#include "skiptv/util/JsonScan.hpp"
#include "skiptv/util/Overloaded.hpp"

namespace skiptv::lounge {

namespace json = skiptv::util::json;
using skiptv::util::Overloaded;

namespace {

const std::string* Field(const EventPayload& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end()) return nullptr;
  return &it->second;
}

std::optional<double> ParseDouble(const std::string& text) {
  if (text.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == text.c_str() || *end != '\0') return std::nullopt;
  return value;
}

std::optional<long> ParseLong(const std::string& text) {
  if (text.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') return std::nullopt;
  return value;
}

std::optional<bool> ParseBool(const std::string& text) {
  if (text == "true" || text == "1") return true;
  if (text == "false" || text == "0") return false;
  return std::nullopt;
}

std::optional<std::string> NonEmpty(const EventPayload& payload, const char* key) {
  const std::string* value = Field(payload, key);
  if (!value || value->empty()) return std::nullopt;
  return *value;
}

DecodeResult Decoded(LoungeEvent event) {
  DecodeResult result;
  result.status = DecodeStatus::kDecoded;
  result.event = std::move(event);
  return result;
}

DecodeResult Malformed(const std::string& error) {
  DecodeResult result;
  result.status = DecodeStatus::kMalformed;
  result.error = error;
  return result;
}

// currentTime is optional, but if present it must be numeric.
bool ReadOptionalTime(const EventPayload& payload, std::optional<double>* out) {
  const std::string* text = Field(payload, "currentTime");
  if (!text || text->empty()) return true;
  *out = ParseDouble(*text);
  return out->has_value();
}

DecodeResult DecodeStateChanged(const EventPayload& payload) {
  const std::string* state_text = Field(payload, "state");
  if (!state_text) return Malformed("missing state");
  auto state = ParsePlayerState(*state_text);
  if (!state) return Malformed("bad state '" + *state_text + "'");

  StateChanged event;
  event.state = *state;
  if (!ReadOptionalTime(payload, &event.current_time)) return Malformed("bad currentTime");
  event.video_id = NonEmpty(payload, "videoId");
  return Decoded(event);
}

DecodeResult DecodeNowPlaying(const EventPayload& payload) {
  NowPlaying event;
  event.video_id = NonEmpty(payload, "videoId");
  if (const std::string* state_text = Field(payload, "state")) {
    event.state = ParsePlayerState(*state_text);
    if (!event.state) return Malformed("bad state '" + *state_text + "'");
  }
  if (!ReadOptionalTime(payload, &event.current_time)) return Malformed("bad currentTime");
  return Decoded(event);
}

bool ReadSkipEnabled(const EventPayload& payload) {
  const std::string* text = Field(payload, "isSkipEnabled");
  if (!text) return false;
  return ParseBool(*text).value_or(false);
}

DecodeResult DecodeAdStateChanged(const EventPayload& payload) {
  const std::string* text = Field(payload, "adState");
  if (!text) return Malformed("missing adState");
  auto ad_state = ParseLong(*text);
  if (!ad_state) return Malformed("bad adState '" + *text + "'");

  AdStateChanged event;
  event.active = *ad_state != 0;
  event.skip_enabled = ReadSkipEnabled(payload);
  return Decoded(event);
}

DecodeResult DecodeAdPlaying(const EventPayload& payload) {
  AdPlaying event;
  event.content_video_id = NonEmpty(payload, "contentVideoId");
  event.skip_enabled = ReadSkipEnabled(payload);
  return Decoded(event);
}

DecodeResult DecodeVolumeChanged(const EventPayload& payload) {
  const std::string* volume_text = Field(payload, "volume");
  const std::string* muted_text = Field(payload, "muted");
  if (!volume_text || !muted_text) return Malformed("missing volume or muted");
  auto volume = ParseLong(*volume_text);
  auto muted = ParseBool(*muted_text);
  if (!volume || !muted) return Malformed("bad volume or muted");

  VolumeChanged event;
  event.volume = static_cast<int>(*volume);
  event.muted = *muted;
  return Decoded(event);
}

DecodeResult DecodeAutoplayUpNext(const EventPayload& payload) {
  AutoplayUpNext event;
  event.video_id = NonEmpty(payload, "videoId");
  return Decoded(event);
}

// "devices" is a JSON array; each element carries "type" and a "deviceInfo"
// field that is itself JSON encoded as a string.
DecodeResult DecodeLoungeStatus(const EventPayload& payload) {
  const std::string* devices_text = Field(payload, "devices");
  if (!devices_text) return Malformed("missing devices");

  std::string array_text = *devices_text;
  size_t first = array_text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos || array_text[first] != '[') {
    return Malformed("devices is not an array");
  }

  LoungeStatus event;
  for (const std::string& object : json::SplitObjectArray(array_text)) {
    ScreenDevice device;
    json::ExtractString(object, "type", &device.type);
    std::string info;
    if (json::ExtractString(object, "deviceInfo", &info)) {
      json::ExtractString(info, "clientName", &device.client_name);
    }
    event.devices.push_back(std::move(device));
  }
  return Decoded(event);
}

DecodeResult DecodeSubtitlesTrackChanged(const EventPayload& payload) {
  SubtitlesTrackChanged event;
  event.video_id = NonEmpty(payload, "videoId");
  return Decoded(event);
}

DecodeResult DecodeScreenDisconnected(const EventPayload& payload) {
  ScreenDisconnected event;
  if (const std::string* reason = Field(payload, "reason")) event.reason = *reason;
  return Decoded(event);
}

DecodeResult DecodeAutoplayModeChanged(const EventPayload& payload) {
  AutoplayModeChanged event;
  if (const std::string* mode = Field(payload, "autoplayMode")) {
    if (*mode == "ENABLED" || *mode == "true") {
      event.enabled = true;
    } else if (*mode == "DISABLED" || *mode == "false") {
      event.enabled = false;
    }
  }
  return Decoded(event);
}

DecodeResult DecodePlaybackSpeedChanged(const EventPayload& payload) {
  const std::string* text = Field(payload, "playbackSpeed");
  if (!text) text = Field(payload, "playbackRate");
  if (!text) return Malformed("missing playbackSpeed");
  auto speed = ParseDouble(*text);
  if (!speed || *speed <= 0.0) return Malformed("bad playbackSpeed '" + *text + "'");

  PlaybackSpeedChanged event;
  event.speed = *speed;
  return Decoded(event);
}

}  // namespace

std::optional<PlayerState> ParsePlayerState(const std::string& text) {
  auto value = ParseLong(text);
  if (!value) return std::nullopt;
  switch (*value) {
    case -1: return PlayerState::kUnstarted;
    case 0: return PlayerState::kEnded;
    case 1: return PlayerState::kPlaying;
    case 2: return PlayerState::kPaused;
    case 3: return PlayerState::kBuffering;
    case 5: return PlayerState::kCued;
    default: return std::nullopt;
  }
}

DecodeResult DecodeEvent(const RawEvent& raw) {
  const EventPayload& p = raw.payload;
  if (raw.name == "onStateChange") return DecodeStateChanged(p);
  if (raw.name == "nowPlaying") return DecodeNowPlaying(p);
  if (raw.name == "onAdStateChange") return DecodeAdStateChanged(p);
  if (raw.name == "adPlaying") return DecodeAdPlaying(p);
  if (raw.name == "onVolumeChanged") return DecodeVolumeChanged(p);
  if (raw.name == "autoplayUpNext") return DecodeAutoplayUpNext(p);
  if (raw.name == "loungeStatus") return DecodeLoungeStatus(p);
  if (raw.name == "onSubtitlesTrackChanged") return DecodeSubtitlesTrackChanged(p);
  if (raw.name == "loungeScreenDisconnected") return DecodeScreenDisconnected(p);
  if (raw.name == "onAutoplayModeChanged") return DecodeAutoplayModeChanged(p);
  if (raw.name == "onPlaybackSpeedChanged") return DecodePlaybackSpeedChanged(p);
  return DecodeResult{};
}

const char* EventName(const LoungeEvent& event) {
  return std::visit(
      Overloaded{
          [](const StateChanged&) { return "onStateChange"; },
          [](const NowPlaying&) { return "nowPlaying"; },
          [](const AdStateChanged&) { return "onAdStateChange"; },
          [](const AdPlaying&) { return "adPlaying"; },
          [](const VolumeChanged&) { return "onVolumeChanged"; },
          [](const AutoplayUpNext&) { return "autoplayUpNext"; },
          [](const LoungeStatus&) { return "loungeStatus"; },
          [](const SubtitlesTrackChanged&) { return "onSubtitlesTrackChanged"; },
          [](const ScreenDisconnected&) { return "loungeScreenDisconnected"; },
          [](const AutoplayModeChanged&) { return "onAutoplayModeChanged"; },
          [](const PlaybackSpeedChanged&) { return "onPlaybackSpeedChanged"; },
      },
      event);
}

}  // namespace skiptv::lounge
