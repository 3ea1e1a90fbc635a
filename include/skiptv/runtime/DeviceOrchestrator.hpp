// Repository: SkipTV
// Component: DeviceOrchestrator
// Purpose: Owns one DeviceSession per configured device, each on its own
//          thread, and tears all of them down together.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_RUNTIME_DEVICE_ORCHESTRATOR_HPP_
#define SKIPTV_RUNTIME_DEVICE_ORCHESTRATOR_HPP_

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "skiptv/lounge/ILoungeTransport.hpp"
#include "skiptv/runtime/Device.hpp"
#include "skiptv/runtime/DeviceSession.hpp"
#include "skiptv/segments/IViewedReporter.hpp"
#include "skiptv/segments/SegmentResolver.hpp"
#include "skiptv/timing/ITimeSource.hpp"

namespace skiptv::runtime {

class DeviceOrchestrator {
 public:
  DeviceOrchestrator(std::vector<Device> devices,
                     SessionPolicy policy,
                     std::shared_ptr<lounge::ILoungeTransport> transport,
                     std::shared_ptr<segments::SegmentResolver> resolver,
                     std::shared_ptr<segments::IViewedReporter> reporter,
                     std::shared_ptr<timing::ITimeSource> time_source);
  ~DeviceOrchestrator();

  DeviceOrchestrator(const DeviceOrchestrator&) = delete;
  DeviceOrchestrator& operator=(const DeviceOrchestrator&) = delete;

  // Starts one thread per session. No-op after the first call.
  void Start();

  // Stops every session and joins its thread. Idempotent.
  void Shutdown();

  bool IsRunning() const;
  size_t SessionCount() const { return sessions_.size(); }

  // nullptr if no device has this screen id.
  DeviceSession* FindSession(const std::string& screen_id);

  std::vector<DeviceSession::MetricsSnapshot> Snapshots() const;

 private:
  std::vector<std::unique_ptr<DeviceSession>> sessions_;
  std::vector<std::thread> threads_;

  mutable std::mutex mutex_;
  bool started_ = false;   // Guarded by mutex_
  bool shut_down_ = false;  // Guarded by mutex_
};

}  // namespace skiptv::runtime

#endif  // SKIPTV_RUNTIME_DEVICE_ORCHESTRATOR_HPP_
