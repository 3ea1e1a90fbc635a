// Repository: SkipTV
// Component: CancelFlag
// Purpose: Cooperative cancellation token with an interruptible sleep.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_RUNTIME_CANCEL_FLAG_HPP_
#define SKIPTV_RUNTIME_CANCEL_FLAG_HPP_

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace skiptv::runtime {

class CancelFlag {
 public:
  CancelFlag() = default;

  CancelFlag(const CancelFlag&) = delete;
  CancelFlag& operator=(const CancelFlag&) = delete;

  void Cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  // Sleeps for `duration` unless cancelled first.
  // Returns true if the full duration elapsed, false if cancelled.
  template <class Rep, class Period>
  bool WaitFor(std::chrono::duration<Rep, Period> duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;  // Guarded by mutex_
};

}  // namespace skiptv::runtime

#endif  // SKIPTV_RUNTIME_CANCEL_FLAG_HPP_
