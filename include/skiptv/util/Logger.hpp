// Repository: SkipTV
// Component: Thread-Safe Logger
// Purpose: Serialized line logging for all engine threads.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_UTIL_LOGGER_HPP_
#define SKIPTV_UTIL_LOGGER_HPP_

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace skiptv::util {

// Process-wide line logger shared by every device session, task and the
// replay harness. One static mutex covers emission, so a line is written
// and flushed whole before the next one starts.
//
//   Info   stdout
//   Debug  stdout, only with SKIPTV_DEBUG in the environment or after
//          SetDebugEnabled(true)
//   Warn   stderr, recoverable: a failed command, a dropped subscription
//   Error  stderr, unrecoverable
//
// Sinks see each Info/Warn/Error line before it is written; tests use them
// to assert on log events. Pass nullptr to remove one.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Forces Debug output on regardless of SKIPTV_DEBUG (config "debug": true).
  static void SetDebugEnabled(bool enabled);
  static bool DebugEnabled();

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::atomic<bool> debug_forced_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace skiptv::util

#endif  // SKIPTV_UTIL_LOGGER_HPP_
