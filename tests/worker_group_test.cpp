#include <jsgraph/worker_group.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

namespace jsgraph {
namespace {

TEST(WorkerGroupTest, JoinAllWaitsForEveryWorker) {
  std::atomic<int> finished{0};
  WorkerGroup group;
  for (int i = 0; i < 4; ++i) {
    group.Spawn([&finished] { ++finished; });
  }

  group.JoinAll();

  EXPECT_EQ(4u, group.size());
  EXPECT_EQ(4, finished.load());
}

TEST(WorkerGroupTest, JoinsRunningWorkersWhenAnExceptionUnwinds) {
  std::atomic<bool> finished{false};
  try {
    WorkerGroup group;
    group.Spawn([&finished] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      finished = true;
    });
    throw std::runtime_error("starting the next worker failed");
  } catch (const std::runtime_error &) {
  }

  EXPECT_TRUE(finished.load());
}

TEST(WorkerGroupTest, JoinAllIsSafeToRepeat) {
  WorkerGroup group;
  group.Spawn([] {});

  group.JoinAll();
  group.JoinAll();

  EXPECT_EQ(1u, group.size());
}

} // namespace
} // namespace jsgraph
