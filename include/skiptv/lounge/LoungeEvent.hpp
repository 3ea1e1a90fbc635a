// Repository: SkipTV
// Component: Lounge event decoding
// Purpose: Closed set of inbound event types, decoded once from the raw
//          string payload at the classification boundary.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_LOUNGE_LOUNGE_EVENT_HPP_
#define SKIPTV_LOUNGE_LOUNGE_EVENT_HPP_

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "skiptv/lounge/ILoungeTransport.hpp"

namespace skiptv::lounge {

enum class PlayerState {
  kUnstarted = -1,
  kEnded = 0,
  kPlaying = 1,
  kPaused = 2,
  kBuffering = 3,
  kCued = 5,
};

std::optional<PlayerState> ParsePlayerState(const std::string& text);

// onStateChange
struct StateChanged {
  PlayerState state = PlayerState::kUnstarted;
  std::optional<double> current_time;
  std::optional<std::string> video_id;
};

// nowPlaying. An empty payload means nothing is loaded.
struct NowPlaying {
  std::optional<std::string> video_id;
  std::optional<PlayerState> state;
  std::optional<double> current_time;
};

// onAdStateChange
struct AdStateChanged {
  bool active = false;
  bool skip_enabled = false;
};

// adPlaying
struct AdPlaying {
  std::optional<std::string> content_video_id;
  bool skip_enabled = false;
};

// onVolumeChanged
struct VolumeChanged {
  int volume = 0;
  bool muted = false;
};

// autoplayUpNext
struct AutoplayUpNext {
  std::optional<std::string> video_id;
};

struct ScreenDevice {
  std::string type;
  std::string client_name;
};

// loungeStatus
struct LoungeStatus {
  std::vector<ScreenDevice> devices;
};

// onSubtitlesTrackChanged
struct SubtitlesTrackChanged {
  std::optional<std::string> video_id;
};

// loungeScreenDisconnected
struct ScreenDisconnected {
  std::string reason;
};

// onAutoplayModeChanged
struct AutoplayModeChanged {
  std::optional<bool> enabled;
};

// onPlaybackSpeedChanged
struct PlaybackSpeedChanged {
  double speed = 1.0;
};

using LoungeEvent = std::variant<StateChanged,
                                 NowPlaying,
                                 AdStateChanged,
                                 AdPlaying,
                                 VolumeChanged,
                                 AutoplayUpNext,
                                 LoungeStatus,
                                 SubtitlesTrackChanged,
                                 ScreenDisconnected,
                                 AutoplayModeChanged,
                                 PlaybackSpeedChanged>;

enum class DecodeStatus {
  kDecoded,
  kUnknown,    // event name outside the closed set
  kMalformed,  // known name, unusable fields
};

struct DecodeResult {
  DecodeStatus status = DecodeStatus::kUnknown;
  std::optional<LoungeEvent> event;
  std::string error;  // set when kMalformed
};

DecodeResult DecodeEvent(const RawEvent& raw);

// Event name on the wire for a decoded event.
const char* EventName(const LoungeEvent& event);

}  // namespace skiptv::lounge

#endif  // SKIPTV_LOUNGE_LOUNGE_EVENT_HPP_
