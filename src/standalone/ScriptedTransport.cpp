// Repository: SkipTV
// Component: ScriptedTransport
// Purpose: Scripted lounge transport for the replay harness.
// Copyright (c) 2026 SkipTV

#include "ScriptedTransport.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <sstream>
#include <utility>

#include "skiptv/util/JsonScan.hpp"
#include "skiptv/util/Logger.hpp"

namespace skiptv::standalone {

using skiptv::util::Logger;
namespace json = skiptv::util::json;

namespace {

class ScriptedSubscription : public lounge::ILoungeSubscription {
 public:
  using Clock = std::chrono::steady_clock;

  ScriptedSubscription(std::string screen_id, std::shared_ptr<void> owner,
                       std::mutex& queue_mutex, std::deque<ScriptEntry>& entries)
      : screen_id_(std::move(screen_id)),
        owner_(std::move(owner)),
        queue_mutex_(queue_mutex),
        entries_(entries) {
    ArmNext();
  }

  lounge::ReadStatus Next(lounge::RawEvent& out, std::chrono::milliseconds timeout) override {
    const auto deadline = Clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!closed_) {
      const auto now = Clock::now();
      if (next_due_ && now >= *next_due_) {
        if (PopFront(out)) {
          ArmNext();
          return lounge::ReadStatus::kEvent;
        }
        next_due_.reset();
      }
      if (now >= deadline) return lounge::ReadStatus::kTimeout;
      const auto wake = next_due_ ? std::min(deadline, *next_due_) : deadline;
      cv_.wait_until(lock, wake);
    }
    return lounge::ReadStatus::kClosed;
  }

  void Close() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

 private:
  bool PopFront(lounge::RawEvent& out) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (entries_.empty()) return false;
    out = std::move(entries_.front().event);
    entries_.pop_front();
    return true;
  }

  void ArmNext() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (entries_.empty()) {
      next_due_.reset();
      return;
    }
    next_due_ = Clock::now() + std::chrono::milliseconds(entries_.front().delay_ms);
  }

  const std::string screen_id_;
  std::shared_ptr<void> owner_;  // keeps the queue alive
  std::mutex& queue_mutex_;
  std::deque<ScriptEntry>& entries_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool closed_ = false;
  std::optional<Clock::time_point> next_due_;
};

}  // namespace

std::optional<ScriptEntry> ParseScriptLine(const std::string& line) {
  ScriptEntry entry;
  if (!json::ExtractString(line, "screen_id", &entry.screen_id) || entry.screen_id.empty()) {
    return std::nullopt;
  }
  if (!json::ExtractString(line, "event", &entry.event.name) || entry.event.name.empty()) {
    return std::nullopt;
  }
  json::ExtractInt64(line, "delay_ms", &entry.delay_ms);
  if (entry.delay_ms < 0) return std::nullopt;

  std::string payload_text;
  if (json::ExtractObject(line, "payload", &payload_text)) {
    auto payload = json::ParseFlatObject(payload_text);
    if (!payload) return std::nullopt;
    entry.event.payload = std::move(*payload);
  }
  return entry;
}

ScriptedTransport::ScriptedTransport(std::vector<ScriptEntry> script) {
  for (auto& entry : script) {
    auto& queue = queues_[entry.screen_id];
    if (!queue) queue = std::make_shared<Queue>();
    queue->entries.push_back(std::move(entry));
  }
}

std::unique_ptr<lounge::ILoungeSubscription> ScriptedTransport::Subscribe(
    const std::string& screen_id) {
  std::shared_ptr<Queue> queue;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = queues_[screen_id];
    if (!slot) slot = std::make_shared<Queue>();
    queue = slot;
  }
  Logger::Info("[ScriptedTransport] SUBSCRIBE screen=" + screen_id);
  return std::make_unique<ScriptedSubscription>(screen_id, queue, queue->mutex, queue->entries);
}

bool ScriptedTransport::SendCommand(const std::string& screen_id,
                                    const std::string& command,
                                    const lounge::CommandParams& params) {
  std::ostringstream oss;
  oss << "[ScriptedTransport] COMMAND screen=" << screen_id << " command=" << command;
  for (const auto& [key, value] : params) {
    oss << " " << key << "=" << value;
  }
  Logger::Info(oss.str());

  std::lock_guard<std::mutex> lock(mutex_);
  ++commands_sent_;
  return true;
}

uint64_t ScriptedTransport::commands_sent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return commands_sent_;
}

}  // namespace skiptv::standalone
