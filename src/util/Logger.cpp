// Repository: SkipTV
// Component: Thread-Safe Logger
// Purpose: Serialized line logging for all engine threads.
// Copyright (c) 2026 SkipTV

#include "skiptv/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace skiptv::util {

std::mutex Logger::mutex_;
std::atomic<bool> Logger::debug_forced_{false};
std::function<void(const std::string&)> Logger::info_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::error_sink_;

void Logger::SetDebugEnabled(bool enabled) {
  debug_forced_.store(enabled, std::memory_order_relaxed);
}

bool Logger::DebugEnabled() {
  return debug_forced_.load(std::memory_order_relaxed) ||
         std::getenv("SKIPTV_DEBUG") != nullptr;
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

}  // namespace skiptv::util
