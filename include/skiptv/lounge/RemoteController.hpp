// Repository: SkipTV
// Component: RemoteController
// Purpose: Per-device command channel. Serializes every outbound command and
//          owns the device's volume/mute shadow.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_LOUNGE_REMOTE_CONTROLLER_HPP_
#define SKIPTV_LOUNGE_REMOTE_CONTROLLER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "skiptv/lounge/ILoungeTransport.hpp"

namespace skiptv::lounge {

// Last volume state reported by the device (onVolumeChanged) or set by us.
struct VolumeShadow {
  int volume = 100;
  bool muted = false;
  bool known = false;
};

// Command names understood by the lounge screen.
namespace commands {
inline constexpr const char* kSetVolume = "setVolume";
inline constexpr const char* kSkipAd = "skipAd";
inline constexpr const char* kSeekTo = "seekTo";
inline constexpr const char* kSetPlaylist = "setPlaylist";
inline constexpr const char* kGetNowPlaying = "getNowPlaying";
inline constexpr const char* kSetAutoplayMode = "setAutoplayMode";
}  // namespace commands

class RemoteController {
 public:
  struct Counters {
    uint64_t sent = 0;
    uint64_t failed = 0;
    uint64_t suppressed = 0;
  };

  RemoteController(std::string device_name,
                   std::string screen_id,
                   std::shared_ptr<ILoungeTransport> transport);

  RemoteController(const RemoteController&) = delete;
  RemoteController& operator=(const RemoteController&) = delete;

  // Without override, a request that matches the known shadow is dropped.
  // A non-zero ticket (from NextMuteTicket) orders requests issued from
  // different tasks: a ticket older than the last applied one is dropped, so
  // the device ends in the most recently requested state.
  bool Mute(bool mute, bool override_shadow, uint64_t ticket = 0);
  uint64_t NextMuteTicket();

  bool SetVolume(int volume);
  bool SkipAd();
  bool SeekTo(double position_sec);
  bool PlayVideo(const std::string& video_id);
  bool GetNowPlaying();
  bool SetAutoplayMode(bool enabled);

  void UpdateVolumeShadow(int volume, bool muted);
  VolumeShadow volume_shadow() const;

  Counters counters() const;
  const std::string& screen_id() const { return screen_id_; }

 private:
  bool SendLocked(const std::string& command, const CommandParams& params);

  const std::string device_name_;
  const std::string screen_id_;
  std::shared_ptr<ILoungeTransport> transport_;

  // Held for the whole send; one command in flight per device.
  std::mutex command_mutex_;
  uint64_t last_applied_mute_ticket_ = 0;  // Guarded by command_mutex_

  mutable std::mutex shadow_mutex_;
  VolumeShadow shadow_;
  Counters counters_;  // Guarded by shadow_mutex_

  std::atomic<uint64_t> mute_ticket_{0};
};

}  // namespace skiptv::lounge

#endif  // SKIPTV_LOUNGE_REMOTE_CONTROLLER_HPP_
