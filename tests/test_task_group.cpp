// Repository: SkipTV
// Component: TaskGroup unit tests

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "skiptv/runtime/TaskGroup.hpp"
#include "skiptv/util/Logger.hpp"
#include "support/WaitUntil.hpp"

namespace skiptv::runtime {
namespace {

using std::chrono::milliseconds;

TEST(TaskGroupTest, SpawnedTaskRuns) {
  TaskGroup group("test");
  std::atomic<int> ran{0};
  group.Spawn("inc", [&ran](CancelFlag&) { ran.fetch_add(1); });
  group.JoinAll();
  EXPECT_EQ(ran.load(), 1);
}

TEST(TaskGroupTest, CancelAllInterruptsWaits) {
  TaskGroup group("test");
  std::atomic<bool> completed_wait{true};
  group.Spawn("sleeper", [&completed_wait](CancelFlag& cancel) {
    completed_wait = cancel.WaitFor(std::chrono::seconds(30));
  });
  ASSERT_TRUE(WaitUntil([&group] { return group.ActiveCount() == 1; }));

  const auto start = std::chrono::steady_clock::now();
  group.CancelAll();
  group.JoinAll();
  EXPECT_FALSE(completed_wait.load());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST(TaskGroupTest, SpawnAfterJoinIsRejected) {
  TaskGroup group("test");
  group.JoinAll();
  std::atomic<bool> ran{false};
  auto flag = group.Spawn("late", [&ran](CancelFlag&) { ran = true; });
  EXPECT_TRUE(flag->IsCancelled());
  EXPECT_FALSE(ran.load());
}

TEST(TaskGroupTest, TaskExceptionIsLoggedNotPropagated) {
  std::vector<std::string> warnings;
  std::mutex mu;
  util::Logger::SetWarnSink([&](const std::string& line) {
    std::lock_guard<std::mutex> lock(mu);
    warnings.push_back(line);
  });

  {
    TaskGroup group("test");
    group.Spawn("boom", [](CancelFlag&) { throw std::runtime_error("kaboom"); });
    group.JoinAll();
  }
  util::Logger::SetWarnSink(nullptr);

  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("TASK_FAILED"), std::string::npos);
  EXPECT_NE(warnings[0].find("kaboom"), std::string::npos);
}

TEST(TaskGroupTest, FinishedTasksAreReaped) {
  TaskGroup group("test");
  for (int i = 0; i < 20; ++i) {
    group.Spawn("quick", [](CancelFlag&) {});
  }
  EXPECT_TRUE(WaitUntil([&group] { return group.ActiveCount() == 0; }));
}

TEST(CancelFlagTest, WaitForElapsesWithoutCancel) {
  CancelFlag flag;
  EXPECT_TRUE(flag.WaitFor(milliseconds(5)));
  flag.Cancel();
  EXPECT_TRUE(flag.IsCancelled());
  EXPECT_FALSE(flag.WaitFor(milliseconds(1000)));
}

}  // namespace
}  // namespace skiptv::runtime
