// Repository: SkipTV
// Component: ScriptedTransport
// Purpose: ILoungeTransport that replays a recorded event script per screen
//          and logs every outbound command instead of sending it.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_STANDALONE_SCRIPTED_TRANSPORT_HPP_
#define SKIPTV_STANDALONE_SCRIPTED_TRANSPORT_HPP_

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "skiptv/lounge/ILoungeTransport.hpp"

namespace skiptv::standalone {

// One line of the events file:
//   {"screen_id": "...", "delay_ms": 250, "event": "onStateChange",
//    "payload": {"state": "1", "currentTime": "12.5"}}
// delay_ms is relative to the previous event for the same screen.
struct ScriptEntry {
  std::string screen_id;
  int64_t delay_ms = 0;
  lounge::RawEvent event;
};

std::optional<ScriptEntry> ParseScriptLine(const std::string& line);

// Events are consumed once: a resubscribe continues where the previous
// subscription stopped. After the script for a screen is exhausted the
// subscription stays open and silent.
class ScriptedTransport : public lounge::ILoungeTransport {
 public:
  explicit ScriptedTransport(std::vector<ScriptEntry> script);

  std::unique_ptr<lounge::ILoungeSubscription> Subscribe(const std::string& screen_id) override;
  bool SendCommand(const std::string& screen_id,
                   const std::string& command,
                   const lounge::CommandParams& params) override;

  uint64_t commands_sent() const;

 private:
  struct Queue {
    std::mutex mutex;
    std::deque<ScriptEntry> entries;
  };

  std::map<std::string, std::shared_ptr<Queue>> queues_;
  mutable std::mutex mutex_;
  uint64_t commands_sent_ = 0;  // Guarded by mutex_
};

}  // namespace skiptv::standalone

#endif  // SKIPTV_STANDALONE_SCRIPTED_TRANSPORT_HPP_
