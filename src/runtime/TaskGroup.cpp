// Repository: SkipTV
// Component: TaskGroup
// Purpose: Tracked, cancellable background tasks.
// Copyright (c) 2026 SkipTV

#include "skiptv/runtime/TaskGroup.hpp"

#include <exception>
#include <sstream>
#include <utility>

#include "skiptv/util/Logger.hpp"

namespace skiptv::runtime {

using skiptv::util::Logger;

TaskGroup::TaskGroup(std::string owner) : owner_(std::move(owner)) {}

TaskGroup::~TaskGroup() {
  CancelAll();
  JoinAll();
}

std::shared_ptr<CancelFlag> TaskGroup::Spawn(const std::string& name, TaskFn fn) {
  auto flag = std::make_shared<CancelFlag>();

  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    flag->Cancel();
    std::ostringstream oss;
    oss << "[TaskGroup:" << owner_ << "] TASK_REJECTED name=" << name << " reason=closed";
    Logger::Debug(oss.str());
    return flag;
  }

  ReapFinishedLocked();

  auto done = std::make_shared<std::atomic<bool>>(false);
  Task task;
  task.name = name;
  task.flag = flag;
  task.done = done;
  task.thread = std::thread([owner = owner_, name, flag, done, fn = std::move(fn)] {
    try {
      fn(*flag);
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[TaskGroup:" << owner << "] TASK_FAILED name=" << name << " error=" << e.what();
      Logger::Warn(oss.str());
    }
    done->store(true, std::memory_order_release);
  });
  tasks_.push_back(std::move(task));
  return flag;
}

void TaskGroup::CancelAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& task : tasks_) {
    task.flag->Cancel();
  }
}

void TaskGroup::JoinAll() {
  std::list<Task> joining;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    joining.swap(tasks_);
  }
  for (auto& task : joining) {
    if (task.thread.joinable()) task.thread.join();
  }
}

size_t TaskGroup::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t active = 0;
  for (const auto& task : tasks_) {
    if (!task.done->load(std::memory_order_acquire)) ++active;
  }
  return active;
}

// Joins tasks that have already returned; their threads exit promptly.
void TaskGroup::ReapFinishedLocked() {
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    if (it->done->load(std::memory_order_acquire)) {
      if (it->thread.joinable()) it->thread.join();
      it = tasks_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace skiptv::runtime
