// Repository: SkipTV
// Component: DeviceSession
// Purpose: Per-device subscription lifecycle (subscribe, watchdog, backoff,
//          reconnect) and classification of inbound lounge events into
//          ad/mute/skip reactions.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_RUNTIME_DEVICE_SESSION_HPP_
#define SKIPTV_RUNTIME_DEVICE_SESSION_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "skiptv/lounge/ILoungeTransport.hpp"
#include "skiptv/lounge/LoungeEvent.hpp"
#include "skiptv/lounge/RemoteController.hpp"
#include "skiptv/runtime/CancelFlag.hpp"
#include "skiptv/runtime/Device.hpp"
#include "skiptv/runtime/SkipScheduler.hpp"
#include "skiptv/runtime/TaskGroup.hpp"
#include "skiptv/segments/IViewedReporter.hpp"
#include "skiptv/segments/SegmentResolver.hpp"
#include "skiptv/timing/ITimeSource.hpp"

namespace skiptv::runtime {

enum class AdState { kNone, kAdPlaying, kAdSkippable };

class DeviceSession {
 public:
  enum class State {
    kIdle = 0,
    kSubscribing = 1,
    kActive = 2,
    kStale = 3,
    kError = 4,
    kStopped = 5,
  };

  struct MetricsSnapshot {
    std::string device_name;
    std::map<std::pair<State, State>, uint64_t> transitions;
    uint64_t events_total = 0;
    uint64_t unknown_events_total = 0;
    uint64_t malformed_events_total = 0;
    uint64_t subscribe_attempts_total = 0;
    uint64_t subscribe_failures_total = 0;
    uint64_t watchdog_expired_total = 0;
    uint64_t reconnect_total = 0;
    uint64_t forced_disconnect_total = 0;
    State state = State::kIdle;
    AdState ad_state = AdState::kNone;
  };

  // Client names that must never be controlled.
  static bool IsBlacklistedClient(const std::string& client_name);

  // reporter may be null; it is ignored unless policy.skip_count_tracking.
  DeviceSession(Device device,
                SessionPolicy policy,
                std::shared_ptr<lounge::ILoungeTransport> transport,
                std::shared_ptr<segments::SegmentResolver> resolver,
                std::shared_ptr<segments::IViewedReporter> reporter,
                std::shared_ptr<timing::ITimeSource> time_source);
  ~DeviceSession();

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

  // Blocks in the subscribe/reconnect loop until Stop(). Call once.
  void Run();

  // Thread-safe and idempotent. Interrupts every wait of Run().
  void Stop();

  // Classifies one inbound event. Called by Run() for each event; exposed so
  // the reaction rules can be driven without a subscription.
  // Returns false for malformed events.
  bool HandleEvent(const lounge::RawEvent& event);

  State state() const;
  AdState ad_state() const;
  MetricsSnapshot Snapshot() const;

  const Device& device() const { return device_; }
  double playback_speed() const;
  bool shorts_disconnected() const;
  std::string current_video_id() const;

  SkipScheduler& scheduler() { return *scheduler_; }
  lounge::RemoteController& controller() { return *controller_; }
  TaskGroup& tasks() { return tasks_; }

 private:
  enum class SubscriptionEnd { kStopped, kClosed, kWatchdogExpired, kForcedDisconnect };

  SubscriptionEnd PumpSubscription(lounge::ILoungeSubscription& subscription);
  void DropSubscription();
  void TransitionTo(State next);

  void Classify(const lounge::LoungeEvent& event);
  void OnStateChanged(const lounge::StateChanged& event);
  void OnNowPlaying(const lounge::NowPlaying& event);
  void OnAdStarted(bool skip_enabled);
  void OnAdEnded();
  void OnLoungeStatus(const lounge::LoungeStatus& event);
  void OnSubtitlesTrackChanged(const lounge::SubtitlesTrackChanged& event);

  void UpdatePlayback(std::optional<lounge::PlayerState> state,
                      std::optional<double> position_sec,
                      const std::string& video_id);
  void SpawnMute(bool mute);
  void SpawnSkipAd();
  void SpawnPrefetch(const std::string& video_id);
  void SpawnCommand(const std::string& name, std::function<bool(lounge::RemoteController&)> fn);
  void SetAdState(AdState next);

  std::string LogPrefix() const;

  const Device device_;
  const SessionPolicy policy_;
  std::shared_ptr<lounge::ILoungeTransport> transport_;
  std::shared_ptr<segments::SegmentResolver> resolver_;
  std::shared_ptr<timing::ITimeSource> time_source_;

  std::shared_ptr<lounge::RemoteController> controller_;
  // Declared before scheduler_: tasks reference the scheduler, so the group
  // is joined explicitly in the destructor before members go away.
  TaskGroup tasks_;
  std::unique_ptr<SkipScheduler> scheduler_;

  CancelFlag stop_;

  std::mutex subscription_mutex_;
  lounge::ILoungeSubscription* subscription_ = nullptr;  // Guarded by subscription_mutex_

  // Session-thread state, readable from other threads.
  mutable std::mutex mutex_;
  State state_ = State::kIdle;                     // Guarded by mutex_
  AdState ad_state_ = AdState::kNone;              // Guarded by mutex_
  std::string current_video_id_;                   // Guarded by mutex_
  double playback_speed_ = 1.0;                    // Guarded by mutex_
  bool shorts_disconnected_ = false;               // Guarded by mutex_
  bool disconnect_requested_ = false;              // Guarded by mutex_
  MetricsSnapshot metrics_;                        // Guarded by mutex_

  std::atomic<bool> ran_{false};
};

const char* ToString(DeviceSession::State state);
const char* ToString(AdState state);

}  // namespace skiptv::runtime

#endif  // SKIPTV_RUNTIME_DEVICE_SESSION_HPP_
