// Repository: SkipTV
// Component: TaskGroup
// Purpose: Tracked, cancellable background tasks for one device session.
//          Every side effect (skip, prefetch, mute, report) runs here so that
//          shutdown can cancel and join all of them.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_RUNTIME_TASK_GROUP_HPP_
#define SKIPTV_RUNTIME_TASK_GROUP_HPP_

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "skiptv/runtime/CancelFlag.hpp"

namespace skiptv::runtime {

class TaskGroup {
 public:
  using TaskFn = std::function<void(CancelFlag&)>;

  explicit TaskGroup(std::string owner);
  ~TaskGroup();

  TaskGroup(const TaskGroup&) = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;

  // Starts `fn` on its own thread and returns its cancel flag. Exceptions
  // derived from std::exception are logged and end the task. After
  // JoinAll() the group is closed: the task is not started and the returned
  // flag is already cancelled.
  std::shared_ptr<CancelFlag> Spawn(const std::string& name, TaskFn fn);

  void CancelAll();

  // Closes the group and joins every task. Idempotent.
  void JoinAll();

  // Tasks started and not yet finished.
  size_t ActiveCount() const;

 private:
  struct Task {
    std::string name;
    std::shared_ptr<CancelFlag> flag;
    std::shared_ptr<std::atomic<bool>> done;
    std::thread thread;
  };

  void ReapFinishedLocked();

  const std::string owner_;
  mutable std::mutex mutex_;
  std::list<Task> tasks_;  // Guarded by mutex_
  bool closed_ = false;    // Guarded by mutex_
};

}  // namespace skiptv::runtime

#endif  // SKIPTV_RUNTIME_TASK_GROUP_HPP_
