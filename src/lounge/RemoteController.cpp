// Repository: SkipTV
// Component: RemoteController
// Purpose: Per-device command channel implementation.
// Copyright (c) 2026 SkipTV

#include "skiptv/lounge/RemoteController.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "skiptv/util/Logger.hpp"

namespace skiptv::lounge {

using skiptv::util::Logger;

namespace {

std::string FormatSeconds(double seconds) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << seconds;
  return oss.str();
}

const char* BoolText(bool value) { return value ? "true" : "false"; }

}  // namespace

RemoteController::RemoteController(std::string device_name,
                                   std::string screen_id,
                                   std::shared_ptr<ILoungeTransport> transport)
    : device_name_(std::move(device_name)),
      screen_id_(std::move(screen_id)),
      transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("RemoteController requires a transport");
  }
}

uint64_t RemoteController::NextMuteTicket() {
  return mute_ticket_.fetch_add(1, std::memory_order_relaxed) + 1;
}

bool RemoteController::Mute(bool mute, bool override_shadow, uint64_t ticket) {
  std::lock_guard<std::mutex> lock(command_mutex_);

  if (ticket != 0) {
    if (ticket < last_applied_mute_ticket_) {
      std::lock_guard<std::mutex> shadow_lock(shadow_mutex_);
      ++counters_.suppressed;
      return true;
    }
    last_applied_mute_ticket_ = ticket;
  }

  int volume = 100;
  {
    std::lock_guard<std::mutex> shadow_lock(shadow_mutex_);
    if (!override_shadow && shadow_.known && shadow_.muted == mute) {
      ++counters_.suppressed;
      return true;
    }
    if (shadow_.known) volume = shadow_.volume;
  }

  CommandParams params{{"volume", std::to_string(volume)}, {"muted", BoolText(mute)}};
  if (!SendLocked(commands::kSetVolume, params)) return false;

  std::lock_guard<std::mutex> shadow_lock(shadow_mutex_);
  shadow_.volume = volume;
  shadow_.muted = mute;
  shadow_.known = true;
  return true;
}

bool RemoteController::SetVolume(int volume) {
  std::lock_guard<std::mutex> lock(command_mutex_);
  bool muted = false;
  {
    std::lock_guard<std::mutex> shadow_lock(shadow_mutex_);
    muted = shadow_.known && shadow_.muted;
  }
  CommandParams params{{"volume", std::to_string(volume)}, {"muted", BoolText(muted)}};
  if (!SendLocked(commands::kSetVolume, params)) return false;

  std::lock_guard<std::mutex> shadow_lock(shadow_mutex_);
  shadow_.volume = volume;
  shadow_.muted = muted;
  shadow_.known = true;
  return true;
}

bool RemoteController::SkipAd() {
  std::lock_guard<std::mutex> lock(command_mutex_);
  return SendLocked(commands::kSkipAd, {});
}

bool RemoteController::SeekTo(double position_sec) {
  std::lock_guard<std::mutex> lock(command_mutex_);
  return SendLocked(commands::kSeekTo, {{"newTime", FormatSeconds(position_sec)}});
}

bool RemoteController::PlayVideo(const std::string& video_id) {
  std::lock_guard<std::mutex> lock(command_mutex_);
  return SendLocked(commands::kSetPlaylist, {{"videoId", video_id}});
}

bool RemoteController::GetNowPlaying() {
  std::lock_guard<std::mutex> lock(command_mutex_);
  return SendLocked(commands::kGetNowPlaying, {});
}

bool RemoteController::SetAutoplayMode(bool enabled) {
  std::lock_guard<std::mutex> lock(command_mutex_);
  return SendLocked(commands::kSetAutoplayMode,
                    {{"autoplayMode", enabled ? "ENABLED" : "DISABLED"}});
}

void RemoteController::UpdateVolumeShadow(int volume, bool muted) {
  std::lock_guard<std::mutex> lock(shadow_mutex_);
  shadow_.volume = volume;
  shadow_.muted = muted;
  shadow_.known = true;
}

VolumeShadow RemoteController::volume_shadow() const {
  std::lock_guard<std::mutex> lock(shadow_mutex_);
  return shadow_;
}

RemoteController::Counters RemoteController::counters() const {
  std::lock_guard<std::mutex> lock(shadow_mutex_);
  return counters_;
}

bool RemoteController::SendLocked(const std::string& command, const CommandParams& params) {
  const bool ok = transport_->SendCommand(screen_id_, command, params);

  std::ostringstream oss;
  oss << "[RemoteController:" << device_name_ << "] "
      << (ok ? "COMMAND_SENT" : "COMMAND_FAILED") << " command=" << command;
  for (const auto& [key, value] : params) {
    oss << " " << key << "=" << value;
  }

  {
    std::lock_guard<std::mutex> shadow_lock(shadow_mutex_);
    if (ok) {
      ++counters_.sent;
    } else {
      ++counters_.failed;
    }
  }

  if (ok) {
    Logger::Debug(oss.str());
  } else {
    Logger::Warn(oss.str());
  }
  return ok;
}

}  // namespace skiptv::lounge
