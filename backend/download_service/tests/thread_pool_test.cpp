#include "common/thread_pool.hpp"

#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace std::chrono_literals;

TEST(ThreadPoolTest, CommitReturnsResult) {
  auto result = ThreadPool::getInstance().commit([](int a, int b) { return a + b; }, 2, 3);
  EXPECT_EQ(result.get(), 5);
}

TEST(ThreadPoolTest, DedicatedWorkRunsWhileEveryWorkerIsBusy) {
  auto& pool = ThreadPool::getInstance();
  std::promise<void> release;
  auto gate = release.get_future().share();

  std::vector<std::future<void>> busy;
  for (size_t i = 0; i < pool.size(); ++i) {
    busy.push_back(pool.commit([gate] { gate.wait(); }));
  }

  auto ran = std::make_shared<std::promise<void>>();
  auto ran_future = ran->get_future();
  pool.runDedicated([ran] { ran->set_value(); });
  EXPECT_EQ(ran_future.wait_for(2s), std::future_status::ready);

  release.set_value();
  for (auto& f : busy) {
    f.get();
  }
}
