// Repository: SkipTV
// Component: DeviceOrchestrator
// Purpose: Session threads and coordinated shutdown.
// Copyright (c) 2026 SkipTV

#include "skiptv/runtime/DeviceOrchestrator.hpp"

#include <sstream>
#include <utility>

#include "skiptv/util/Logger.hpp"

namespace skiptv::runtime {

using skiptv::util::Logger;

DeviceOrchestrator::DeviceOrchestrator(std::vector<Device> devices,
                                       SessionPolicy policy,
                                       std::shared_ptr<lounge::ILoungeTransport> transport,
                                       std::shared_ptr<segments::SegmentResolver> resolver,
                                       std::shared_ptr<segments::IViewedReporter> reporter,
                                       std::shared_ptr<timing::ITimeSource> time_source) {
  sessions_.reserve(devices.size());
  for (auto& device : devices) {
    sessions_.push_back(std::make_unique<DeviceSession>(std::move(device), policy, transport,
                                                        resolver, reporter, time_source));
  }
}

DeviceOrchestrator::~DeviceOrchestrator() { Shutdown(); }

void DeviceOrchestrator::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_ || shut_down_) return;
  started_ = true;

  threads_.reserve(sessions_.size());
  for (auto& session : sessions_) {
    DeviceSession* raw = session.get();
    threads_.emplace_back([raw] { raw->Run(); });
  }

  std::ostringstream oss;
  oss << "[DeviceOrchestrator] STARTED sessions=" << sessions_.size();
  Logger::Info(oss.str());
}

void DeviceOrchestrator::Shutdown() {
  std::vector<std::thread> joining;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) return;
    shut_down_ = true;
    joining.swap(threads_);
  }

  for (auto& session : sessions_) {
    session->Stop();
  }
  for (auto& thread : joining) {
    if (thread.joinable()) thread.join();
  }

  if (!joining.empty()) Logger::Info("[DeviceOrchestrator] SHUTDOWN_COMPLETE");
}

bool DeviceOrchestrator::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_ && !shut_down_;
}

DeviceSession* DeviceOrchestrator::FindSession(const std::string& screen_id) {
  for (auto& session : sessions_) {
    if (session->device().screen_id == screen_id) return session.get();
  }
  return nullptr;
}

std::vector<DeviceSession::MetricsSnapshot> DeviceOrchestrator::Snapshots() const {
  std::vector<DeviceSession::MetricsSnapshot> snapshots;
  snapshots.reserve(sessions_.size());
  for (const auto& session : sessions_) {
    snapshots.push_back(session->Snapshot());
  }
  return snapshots;
}

}  // namespace skiptv::runtime
