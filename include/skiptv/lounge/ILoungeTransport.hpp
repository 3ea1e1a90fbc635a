// Repository: SkipTV
// Component: Lounge transport interface
// Purpose: Thin contract over the remote control channel of one screen:
//          a long-lived event subscription plus fire-and-forget commands.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_LOUNGE_ILOUNGE_TRANSPORT_HPP_
#define SKIPTV_LOUNGE_ILOUNGE_TRANSPORT_HPP_

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace skiptv::lounge {

// Lounge payloads are flat string maps; nested structures arrive as JSON text.
using EventPayload = std::map<std::string, std::string>;
using CommandParams = std::map<std::string, std::string>;

struct RawEvent {
  std::string name;
  EventPayload payload;
};

enum class ReadStatus {
  kEvent,    // `out` holds the next event
  kTimeout,  // nothing arrived within the timeout; subscription still open
  kClosed,   // remote disconnect, network failure, or Close()
};

// One subscription. Events are delivered in the order the remote produced
// them; duplicates are possible. Once Next() returns kClosed it keeps doing so.
class ILoungeSubscription {
 public:
  virtual ~ILoungeSubscription() = default;

  virtual ReadStatus Next(RawEvent& out, std::chrono::milliseconds timeout) = 0;

  // Thread-safe; unblocks a concurrent Next().
  virtual void Close() = 0;
};

class ILoungeTransport {
 public:
  virtual ~ILoungeTransport() = default;

  // Returns nullptr when the subscription cannot be opened.
  virtual std::unique_ptr<ILoungeSubscription> Subscribe(const std::string& screen_id) = 0;

  // Returns false on send failure. Must be safe to call from several threads.
  virtual bool SendCommand(const std::string& screen_id,
                           const std::string& command,
                           const CommandParams& params) = 0;
};

}  // namespace skiptv::lounge

#endif  // SKIPTV_LOUNGE_ILOUNGE_TRANSPORT_HPP_
