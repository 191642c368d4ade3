#include <gtest/gtest.h>

#include <atomic>
#include <system_error>
#include <thread>

#include "core/util/WorkerPool.hpp"

using namespace zipcat;

namespace {

// Drains `total` work items from a shared cursor.
struct Counter {
  explicit Counter(int total) : total(total) {}

  std::function<void()> worker() {
    return [this] {
      while (cursor.fetch_add(1) < total) ++done;
    };
  }

  const int total;
  std::atomic<int> cursor{0};
  std::atomic<int> done{0};
};

// Starts `allowed` threads, then fails the way std::thread does when the
// process is out of threads.
ThreadFactory limitedFactory(int allowed, std::atomic<int>& attempts) {
  return [allowed, &attempts](std::function<void()> fn) {
    if (attempts++ >= allowed) {
      throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                              "thread limit");
    }
    return std::thread(std::move(fn));
  };
}

} // namespace

TEST(WorkerPool, ProcessesEveryItem) {
  Counter c(500);
  runWorkers(4, c.worker());
  EXPECT_EQ(c.done.load(), 500);
}

TEST(WorkerPool, SingleWorkerRunsOnTheCallingThread) {
  const auto caller = std::this_thread::get_id();
  std::thread::id ran;
  runWorkers(1, [&] { ran = std::this_thread::get_id(); });
  EXPECT_EQ(ran, caller);
}

TEST(WorkerPool, FailedSpawnLeavesStartedThreadsJoined) {
  Counter c(200);
  std::atomic<int> attempts{0};
  runWorkers(4, c.worker(), limitedFactory(1, attempts));
  EXPECT_EQ(attempts.load(), 2);
  EXPECT_EQ(c.done.load(), 200);
}

TEST(WorkerPool, NoThreadsMeansTheCallerDoesTheWork) {
  Counter c(50);
  std::atomic<int> attempts{0};
  const auto caller = std::this_thread::get_id();
  std::thread::id ran;
  runWorkers(3, [&] { ran = std::this_thread::get_id(); c.worker()(); }, limitedFactory(0, attempts));
  EXPECT_EQ(attempts.load(), 1);
  EXPECT_EQ(ran, caller);
  EXPECT_EQ(c.done.load(), 50);
}
