// Repository: SkipTV
// Component: DeviceSession
// Purpose: Subscription lifecycle and event classification for one device.
// Copyright (c) 2026 SkipTV

#include "skiptv/runtime/DeviceSession.hpp"

#include <chrono>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <variant>

#include "skiptv/util/Logger.hpp"
#include "skiptv/util/Overloaded.hpp"

namespace skiptv::runtime {

using skiptv::util::Logger;
using skiptv::util::Overloaded;
using lounge::PlayerState;

namespace {

constexpr const char* kLoungeScreenType = "LOUNGE_SCREEN";
constexpr const char* kShortsDisconnectReason = "disconnectedByUserScreenInitiated";

}  // namespace

const char* ToString(DeviceSession::State state) {
  switch (state) {
    case DeviceSession::State::kIdle: return "IDLE";
    case DeviceSession::State::kSubscribing: return "SUBSCRIBING";
    case DeviceSession::State::kActive: return "ACTIVE";
    case DeviceSession::State::kStale: return "STALE";
    case DeviceSession::State::kError: return "ERROR";
    case DeviceSession::State::kStopped: return "STOPPED";
  }
  return "UNKNOWN";
}

const char* ToString(AdState state) {
  switch (state) {
    case AdState::kNone: return "NONE";
    case AdState::kAdPlaying: return "AD_PLAYING";
    case AdState::kAdSkippable: return "AD_SKIPPABLE";
  }
  return "UNKNOWN";
}

bool DeviceSession::IsBlacklistedClient(const std::string& client_name) {
  return client_name == "TVHTML5_FOR_KIDS";
}

DeviceSession::DeviceSession(Device device,
                             SessionPolicy policy,
                             std::shared_ptr<lounge::ILoungeTransport> transport,
                             std::shared_ptr<segments::SegmentResolver> resolver,
                             std::shared_ptr<segments::IViewedReporter> reporter,
                             std::shared_ptr<timing::ITimeSource> time_source)
    : device_(std::move(device)),
      policy_(policy),
      transport_(std::move(transport)),
      resolver_(std::move(resolver)),
      time_source_(std::move(time_source)),
      tasks_(device_.name) {
  if (!transport_ || !resolver_ || !time_source_) {
    throw std::invalid_argument("DeviceSession requires transport, resolver and time source");
  }
  controller_ = std::make_shared<lounge::RemoteController>(device_.name, device_.screen_id,
                                                           transport_);
  scheduler_ = std::make_unique<SkipScheduler>(
      device_, resolver_, controller_, policy_.skip_count_tracking ? std::move(reporter) : nullptr,
      time_source_, tasks_);
  metrics_.device_name = device_.name;
}

DeviceSession::~DeviceSession() {
  Stop();
  scheduler_->CancelPending();
  tasks_.CancelAll();
  tasks_.JoinAll();
}

std::string DeviceSession::LogPrefix() const {
  return "[DeviceSession:" + device_.name + "] ";
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void DeviceSession::Run() {
  if (ran_.exchange(true)) {
    Logger::Warn(LogPrefix() + "RUN_IGNORED reason=already_ran");
    return;
  }

  {
    std::ostringstream oss;
    oss << LogPrefix() << "SESSION_START screen=" << device_.screen_id
        << " watchdog_ms=" << policy_.watchdog_window.count()
        << " backoff_ms=" << policy_.reconnect_backoff.count();
    Logger::Info(oss.str());
  }

  while (!stop_.IsCancelled()) {
    TransitionTo(State::kSubscribing);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++metrics_.subscribe_attempts_total;
    }

    std::unique_ptr<lounge::ILoungeSubscription> subscription =
        transport_->Subscribe(device_.screen_id);
    if (!subscription) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        ++metrics_.subscribe_failures_total;
      }
      TransitionTo(State::kError);
      Logger::Warn(LogPrefix() + "SUBSCRIBE_FAILED");
      if (!stop_.WaitFor(policy_.reconnect_backoff)) break;
      std::lock_guard<std::mutex> lock(mutex_);
      ++metrics_.reconnect_total;
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(subscription_mutex_);
      subscription_ = subscription.get();
    }
    // Stop() may have run before the subscription was published.
    if (stop_.IsCancelled()) subscription->Close();

    TransitionTo(State::kActive);
    const SubscriptionEnd end = PumpSubscription(*subscription);
    DropSubscription();
    subscription->Close();
    subscription.reset();

    if (end == SubscriptionEnd::kStopped || stop_.IsCancelled()) break;

    if (end == SubscriptionEnd::kWatchdogExpired) {
      TransitionTo(State::kStale);
      std::lock_guard<std::mutex> lock(mutex_);
      ++metrics_.reconnect_total;
      continue;
    }

    TransitionTo(State::kError);
    if (!stop_.WaitFor(policy_.reconnect_backoff)) break;
    std::lock_guard<std::mutex> lock(mutex_);
    ++metrics_.reconnect_total;
  }

  scheduler_->CancelPending();
  tasks_.CancelAll();
  tasks_.JoinAll();
  TransitionTo(State::kStopped);
  Logger::Info(LogPrefix() + "SESSION_STOPPED");
}

void DeviceSession::Stop() {
  stop_.Cancel();
  std::lock_guard<std::mutex> lock(subscription_mutex_);
  if (subscription_) subscription_->Close();
}

void DeviceSession::DropSubscription() {
  std::lock_guard<std::mutex> lock(subscription_mutex_);
  subscription_ = nullptr;
}

DeviceSession::SubscriptionEnd DeviceSession::PumpSubscription(
    lounge::ILoungeSubscription& subscription) {
  using Clock = std::chrono::steady_clock;
  auto deadline = Clock::now() + policy_.watchdog_window;

  while (!stop_.IsCancelled()) {
    const auto now = Clock::now();
    if (now >= deadline) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        ++metrics_.watchdog_expired_total;
      }
      std::ostringstream oss;
      oss << LogPrefix() << "WATCHDOG_EXPIRED silence_ms=" << policy_.watchdog_window.count();
      Logger::Warn(oss.str());
      return SubscriptionEnd::kWatchdogExpired;
    }

    const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
    lounge::RawEvent event;
    const lounge::ReadStatus status = subscription.Next(event, remaining);
    if (status == lounge::ReadStatus::kTimeout) continue;
    if (status == lounge::ReadStatus::kClosed) {
      if (stop_.IsCancelled()) return SubscriptionEnd::kStopped;
      Logger::Info(LogPrefix() + "SUBSCRIPTION_CLOSED");
      return SubscriptionEnd::kClosed;
    }

    if (HandleEvent(event)) {
      deadline = Clock::now() + policy_.watchdog_window;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (disconnect_requested_) {
      disconnect_requested_ = false;
      return SubscriptionEnd::kForcedDisconnect;
    }
  }
  return SubscriptionEnd::kStopped;
}

void DeviceSession::TransitionTo(State next) {
  State previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == next) return;
    previous = state_;
    ++metrics_.transitions[{previous, next}];
    state_ = next;
  }
  std::ostringstream oss;
  oss << LogPrefix() << "STATE from=" << ToString(previous) << " to=" << ToString(next);
  Logger::Debug(oss.str());
}

DeviceSession::State DeviceSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

AdState DeviceSession::ad_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ad_state_;
}

double DeviceSession::playback_speed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return playback_speed_;
}

bool DeviceSession::shorts_disconnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return shorts_disconnected_;
}

std::string DeviceSession::current_video_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_video_id_;
}

DeviceSession::MetricsSnapshot DeviceSession::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MetricsSnapshot snapshot = metrics_;
  snapshot.state = state_;
  snapshot.ad_state = ad_state_;
  return snapshot;
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

bool DeviceSession::HandleEvent(const lounge::RawEvent& event) {
  lounge::DecodeResult result = lounge::DecodeEvent(event);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++metrics_.events_total;
    if (result.status == lounge::DecodeStatus::kUnknown) ++metrics_.unknown_events_total;
    if (result.status == lounge::DecodeStatus::kMalformed) ++metrics_.malformed_events_total;
  }

  switch (result.status) {
    case lounge::DecodeStatus::kUnknown:
      Logger::Debug(LogPrefix() + "EVENT_IGNORED name=" + event.name);
      return true;
    case lounge::DecodeStatus::kMalformed:
      Logger::Warn(LogPrefix() + "MALFORMED_EVENT name=" + event.name + " error=" + result.error);
      return false;
    case lounge::DecodeStatus::kDecoded:
      break;
  }

  Logger::Debug(LogPrefix() + "EVENT name=" + event.name);
  Classify(*result.event);
  return true;
}

void DeviceSession::Classify(const lounge::LoungeEvent& event) {
  std::visit(
      Overloaded{
          [this](const lounge::StateChanged& e) { OnStateChanged(e); },
          [this](const lounge::NowPlaying& e) { OnNowPlaying(e); },
          [this](const lounge::AdStateChanged& e) {
            if (e.active) {
              OnAdStarted(e.skip_enabled);
            } else {
              OnAdEnded();
            }
          },
          [this](const lounge::AdPlaying& e) {
            if (e.content_video_id) SpawnPrefetch(*e.content_video_id);
            OnAdStarted(e.skip_enabled);
          },
          [this](const lounge::VolumeChanged& e) {
            controller_->UpdateVolumeShadow(e.volume, e.muted);
          },
          [this](const lounge::AutoplayUpNext& e) {
            if (e.video_id) SpawnPrefetch(*e.video_id);
          },
          [this](const lounge::LoungeStatus& e) { OnLoungeStatus(e); },
          [this](const lounge::SubtitlesTrackChanged& e) { OnSubtitlesTrackChanged(e); },
          [this](const lounge::ScreenDisconnected& e) {
            if (e.reason != kShortsDisconnectReason) return;
            {
              std::lock_guard<std::mutex> lock(mutex_);
              shorts_disconnected_ = true;
            }
            Logger::Info(LogPrefix() + "SHORTS_DISCONNECT");
          },
          [this](const lounge::AutoplayModeChanged& e) {
            if (e.enabled && *e.enabled == policy_.auto_play) return;
            const bool enabled = policy_.auto_play;
            SpawnCommand("set-autoplay",
                         [enabled](lounge::RemoteController& c) { return c.SetAutoplayMode(enabled); });
          },
          [this](const lounge::PlaybackSpeedChanged& e) {
            {
              std::lock_guard<std::mutex> lock(mutex_);
              playback_speed_ = e.speed;
            }
            SpawnCommand("now-playing",
                         [](lounge::RemoteController& c) { return c.GetNowPlaying(); });
          },
      },
      event);
}

void DeviceSession::OnStateChanged(const lounge::StateChanged& event) {
  std::string video_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (event.video_id) current_video_id_ = *event.video_id;
    video_id = current_video_id_;
  }
  UpdatePlayback(event.state, event.current_time, video_id);
}

void DeviceSession::OnNowPlaying(const lounge::NowPlaying& event) {
  if (event.video_id) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      current_video_id_ = *event.video_id;
    }
    SpawnPrefetch(*event.video_id);
  }
  if (event.state) {
    UpdatePlayback(event.state, event.current_time, current_video_id());
  }
}

void DeviceSession::UpdatePlayback(std::optional<PlayerState> state,
                                   std::optional<double> position_sec,
                                   const std::string& video_id) {
  const bool playing = state == PlayerState::kPlaying;

  if (playing && policy_.mute_ads && ad_state() != AdState::kNone) {
    SpawnMute(false);
    SetAdState(AdState::kNone);
  }

  scheduler_->CancelPending();
  if (!playing || !position_sec) return;

  if (video_id.empty()) {
    Logger::Debug(LogPrefix() + "SKIP_UNSCHEDULED reason=no_video_id");
    return;
  }

  PlaybackSample sample;
  sample.video_id = video_id;
  sample.position_sec = *position_sec;
  sample.observed_at_us = time_source_->NowMonotonicUs();
  scheduler_->Schedule(std::move(sample));
}

void DeviceSession::OnAdStarted(bool skip_enabled) {
  // The content timeline is frozen while an ad plays.
  scheduler_->CancelPending();

  if (skip_enabled && policy_.skip_ads) {
    SpawnSkipAd();
    SetAdState(AdState::kAdSkippable);
    return;
  }
  if (policy_.mute_ads) SpawnMute(true);
  SetAdState(AdState::kAdPlaying);
}

void DeviceSession::OnAdEnded() {
  if (policy_.mute_ads) SpawnMute(false);
  SetAdState(AdState::kNone);
}

void DeviceSession::OnLoungeStatus(const lounge::LoungeStatus& event) {
  for (const auto& screen : event.devices) {
    if (screen.type != kLoungeScreenType || !IsBlacklistedClient(screen.client_name)) continue;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++metrics_.forced_disconnect_total;
      disconnect_requested_ = true;
    }
    Logger::Warn(LogPrefix() + "FORCED_DISCONNECT client=" + screen.client_name);
    return;
  }
}

void DeviceSession::OnSubtitlesTrackChanged(const lounge::SubtitlesTrackChanged& event) {
  if (!event.video_id) return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!shorts_disconnected_) return;
    shorts_disconnected_ = false;
  }
  const std::string video_id = *event.video_id;
  Logger::Info(LogPrefix() + "SHORTS_RESUME video=" + video_id);
  SpawnCommand("play-video",
               [video_id](lounge::RemoteController& c) { return c.PlayVideo(video_id); });
}

void DeviceSession::SetAdState(AdState next) {
  AdState previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = ad_state_;
    ad_state_ = next;
  }
  if (previous == next) return;
  std::ostringstream oss;
  oss << LogPrefix() << "AD_STATE from=" << ToString(previous) << " to=" << ToString(next);
  Logger::Debug(oss.str());
}

// ---------------------------------------------------------------------------
// Side effects
// ---------------------------------------------------------------------------

void DeviceSession::SpawnCommand(const std::string& name,
                                 std::function<bool(lounge::RemoteController&)> fn) {
  auto controller = controller_;
  const std::string prefix = LogPrefix();
  tasks_.Spawn(name, [controller, fn = std::move(fn), prefix, name](CancelFlag& cancel) {
    if (cancel.IsCancelled()) return;
    if (!fn(*controller)) {
      Logger::Debug(prefix + "REACTION_FAILED task=" + name);
    }
  });
}

void DeviceSession::SpawnMute(bool mute) {
  const uint64_t ticket = controller_->NextMuteTicket();
  SpawnCommand(mute ? "mute" : "unmute", [mute, ticket](lounge::RemoteController& c) {
    return c.Mute(mute, false, ticket);
  });
}

void DeviceSession::SpawnSkipAd() {
  const uint64_t ticket = controller_->NextMuteTicket();
  // The unmute is sent even when skipAd is rejected.
  SpawnCommand("skip-ad", [ticket](lounge::RemoteController& c) {
    const bool skipped = c.SkipAd();
    const bool unmuted = c.Mute(false, false, ticket);
    return skipped && unmuted;
  });
}

void DeviceSession::SpawnPrefetch(const std::string& video_id) {
  auto resolver = resolver_;
  const std::string prefix = LogPrefix();
  tasks_.Spawn("prefetch", [resolver, video_id, prefix](CancelFlag& cancel) {
    if (cancel.IsCancelled()) return;
    try {
      resolver->Resolve(video_id);
    } catch (const std::exception& e) {
      Logger::Warn(prefix + "PREFETCH_FAILED video=" + video_id + " error=" + e.what());
    }
  });
}

}  // namespace skiptv::runtime
