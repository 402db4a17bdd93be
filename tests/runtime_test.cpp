#include "relay/core/error.hpp"
#include "relay/core/runtime.hpp"
#include "test_utils.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>

#include "gtest/gtest.h"

using namespace relay;
using relay::test::wait_until;

namespace {
constexpr auto kRunningCheckDelay = std::chrono::milliseconds(50);
} // namespace

TEST(RuntimeTest, BasicStartStop) {
  Runtime rt(1);
  EXPECT_FALSE(rt.is_running());
  ASSERT_TRUE(rt.start());
  EXPECT_TRUE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());
}

TEST(RuntimeTest, ShardCount) {
  Runtime rt(1);
  EXPECT_EQ(rt.shard_count(), 1U);

  Runtime rt4(RuntimeOptions{.shards = 4});
  EXPECT_EQ(rt4.shard_count(), 4U);
}

TEST(RuntimeTest, ZeroShardsUsesHardware) {
  Runtime rt(0);
  EXPECT_GE(rt.shard_count(), 1U);
}

TEST(RuntimeTest, StopIsIdempotent) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start());
  rt.stop();
  EXPECT_FALSE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());
}

TEST(RuntimeTest, MultipleStartStops) {
  Runtime rt(1);
  std::atomic<int> count{0};

  ASSERT_TRUE(rt.start());
  rt.execute([&count] { count.fetch_add(1); });
  rt.stop();
  EXPECT_EQ(count.load(), 1);

  ASSERT_TRUE(rt.start());
  rt.execute([&count] { count.fetch_add(1); });
  rt.stop();
  EXPECT_EQ(count.load(), 2);
}

TEST(RuntimeTest, ExecuteRunsOffCallerThread) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());

  std::atomic<bool> off_caller{false};
  const auto caller = std::this_thread::get_id();
  rt.execute([&] { off_caller.store(std::this_thread::get_id() != caller); });
  EXPECT_TRUE(wait_until([&] { return off_caller.load(); }));

  rt.stop();
}

TEST(RuntimeTest, ExecuteRoundRobins) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());

  std::mutex mutex;
  std::map<std::thread::id, int> per_thread;
  for (int i = 0; i < 4; ++i) {
    rt.execute([&] {
      std::lock_guard lock(mutex);
      ++per_thread[std::this_thread::get_id()];
    });
  }
  rt.stop();

  ASSERT_EQ(per_thread.size(), 2U);
  for (const auto &[thread, count] : per_thread) {
    EXPECT_EQ(count, 2);
  }
}

TEST(RuntimeTest, StopRunsQueuedTasks) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start());

  std::atomic<int> count{0};
  rt.execute([] { std::this_thread::sleep_for(kRunningCheckDelay); });
  for (int i = 0; i < 3; ++i) {
    rt.execute([&count] { count.fetch_add(1); });
  }
  rt.stop();
  EXPECT_EQ(count.load(), 3);
}

TEST(RuntimeTest, ExecuteAfterStopThrows) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start());
  rt.stop();

  std::atomic<int> count{0};
  try {
    rt.execute([&count] { count.fetch_add(1); });
    FAIL() << "expected std::system_error";
  } catch (const std::system_error &e) {
    EXPECT_EQ(e.code(), make_error_code(Error::SystemNotRunning));
  }

  std::this_thread::sleep_for(kRunningCheckDelay);
  EXPECT_EQ(count.load(), 0);
}

TEST(RuntimeTest, DestructorDrains) {
  std::atomic<int> count{0};
  {
    Runtime rt(2);
    ASSERT_TRUE(rt.start());
    for (int i = 0; i < 4; ++i) {
      rt.execute([&count] {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        count.fetch_add(1);
      });
    }
  }
  EXPECT_EQ(count.load(), 4);
}
