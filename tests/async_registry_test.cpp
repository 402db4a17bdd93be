#include "relay/core/runtime.hpp"
#include "relay/event/async_registry.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace relay;

namespace {

constexpr auto kTaskTimeout = std::chrono::seconds(2);

class QueueExecutor final : public IExecutor {
public:
  auto execute(Task task) -> void override {
    pending.push_back(std::move(task));
  }
  auto run_all() -> void {
    // Tasks may enqueue more tasks.
    for (std::size_t i = 0; i < pending.size(); ++i) {
      auto task = std::move(pending[i]);
      task();
    }
    pending.clear();
  }
  std::vector<Task> pending;
};

class RuntimeFixture : public ::testing::Test {
protected:
  void SetUp() override {
    rt = std::make_shared<Runtime>(4);
    ASSERT_TRUE(rt->start());
  }
  void TearDown() override { rt->stop(); }

  std::shared_ptr<Runtime> rt;
};

} // namespace

TEST(AsyncRegistryTest, DefaultSchedulerIsDirect) {
  AsyncRegistry<int()> registry{reducers::plus};
  EXPECT_TRUE(is_direct(registry.scheduler().get()));
  EXPECT_EQ(AsyncRegistry<int()>::regime, Regime::Pooled);

  registry.register_handler([] { return 1; });
  registry.register_handler([] { return 2; });

  auto future = registry.fire();
  ASSERT_TRUE(is_ready(future));
  EXPECT_EQ(future.get(), 3);
}

TEST(AsyncRegistryTest, NullSchedulerFallsBackToDirect) {
  AsyncRegistry<int()> registry{reducers::plus, nullptr};
  EXPECT_TRUE(is_direct(registry.scheduler().get()));
}

TEST(AsyncRegistryTest, NoHandlersGivesEmptyResult) {
  AsyncRegistry<int(int)> registry{reducers::plus};
  auto future = registry.fire(1);
  EXPECT_EQ(future.get(), std::nullopt);
}

TEST(AsyncRegistryTest, FireDoesNotRunUntilScheduled) {
  auto queue = std::make_shared<QueueExecutor>();
  AsyncRegistry<int(int)> registry{reducers::plus, queue};
  registry.register_handler([](int x) { return x; });
  registry.register_handler([](int x) { return x * 10; });

  auto future = registry.fire(2);
  EXPECT_FALSE(is_ready(future));
  // Two handler tasks and the join.
  EXPECT_EQ(queue->pending.size(), 3U);

  queue->run_all();
  ASSERT_TRUE(is_ready(future));
  EXPECT_EQ(future.get(), 22);
}

TEST(AsyncRegistryTest, FoldsInRegistrationOrder) {
  AsyncRegistry<std::string()> registry{
      [](std::string a, std::string b) { return a + b; }};
  registry.register_handler([] { return std::string("x"); });
  registry.register_handler([] { return std::string("y"); });
  registry.register_handler([] { return std::string("z"); });
  EXPECT_EQ(registry.fire().get(), "xyz");
}

TEST(AsyncRegistryTest, FirstFailureInOrderWins) {
  std::atomic<int> ran{0};
  AsyncRegistry<int()> registry{reducers::plus};
  registry.register_handler([&ran] {
    ran.fetch_add(1);
    return 1;
  });
  registry.register_handler([&ran]() -> int {
    ran.fetch_add(1);
    throw std::invalid_argument("second handler");
  });
  registry.register_handler([&ran]() -> int {
    ran.fetch_add(1);
    throw std::runtime_error("third handler");
  });
  registry.register_handler([&ran] {
    ran.fetch_add(1);
    return 4;
  });

  auto future = registry.fire();
  EXPECT_THROW(future.get(), std::invalid_argument);
  EXPECT_EQ(ran.load(), 4);
}

TEST(AsyncRegistryTest, AbsentResultsSkipped) {
  AsyncRegistry<std::optional<int>()> registry{
      [](std::optional<int> a, std::optional<int> b) {
        return std::optional<int>(*a + *b);
      }};
  registry.register_handler([] { return std::optional<int>{}; });
  registry.register_handler([] { return std::optional<int>{5}; });
  registry.register_handler([] { return std::optional<int>{}; });
  registry.register_handler([] { return std::optional<int>{6}; });

  auto result = registry.fire().get();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 11);
}

TEST(AsyncRegistryTest, UnregisterAndClear) {
  AsyncRegistry<int()> registry{reducers::plus};
  int owner = 0;
  registry.register_handler([] { return 1; }, Key::of(owner));
  registry.register_handler([] { return 10; });
  registry.register_handler([] { return 100; }, Key::of(owner));

  EXPECT_EQ(registry.unregister(Key::of(owner)), 2U);
  EXPECT_EQ(registry.unregister(Key::unique()), 0U);
  EXPECT_EQ(registry.fire().get(), 10);

  registry.clear();
  EXPECT_TRUE(registry.empty());
  EXPECT_EQ(registry.fire().get(), std::nullopt);
}

TEST(AsyncRegistryTest, HandlerExecutorOverridesScheduler) {
  auto queue = std::make_shared<QueueExecutor>();
  AsyncRegistry<int()> registry{reducers::plus};
  registry.register_handler([] { return 1; });
  registry.register_handler([] { return 2; }, Key::unique(), queue);

  auto future = registry.fire();
  EXPECT_EQ(queue->pending.size(), 1U);
  queue->run_all();
  EXPECT_EQ(future.get(), 3);
}

TEST(AsyncRegistryTest, EmptyHandlerOrReducerRejected) {
  EXPECT_THROW(AsyncRegistry<int()>{AsyncRegistry<int()>::reducer_type{}},
               std::system_error);
  AsyncRegistry<int()> registry{reducers::plus};
  EXPECT_THROW(registry.register_handler(Handler<int()>{}), std::system_error);
}

TEST_F(RuntimeFixture, SumOfDelayedHandlers) {
  AsyncRegistry<int()> registry{reducers::plus, rt};
  for (int value : {1, 2, 3}) {
    registry.register_handler([value] {
      // Later registrations finish first.
      std::this_thread::sleep_for(std::chrono::milliseconds(30 / value));
      return value;
    });
  }

  auto future = registry.fire();
  ASSERT_EQ(future.wait_for(kTaskTimeout), std::future_status::ready);
  EXPECT_EQ(future.get(), 6);
}

TEST_F(RuntimeFixture, FailureStillLetsSiblingsComplete) {
  std::atomic<int> completed{0};
  AsyncRegistry<int()> registry{reducers::plus, rt};
  registry.register_handler([]() -> int { throw std::runtime_error("boom"); });
  for (int i = 0; i < 2; ++i) {
    registry.register_handler([&completed] {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      completed.fetch_add(1);
      return 1;
    });
  }

  auto future = registry.fire();
  ASSERT_EQ(future.wait_for(kTaskTimeout), std::future_status::ready);
  EXPECT_THROW(future.get(), std::runtime_error);
  EXPECT_EQ(completed.load(), 2);
}

TEST_F(RuntimeFixture, ConcurrentRegistrationKeepsEveryHandler) {
  AsyncRegistry<int()> registry{reducers::plus, rt};
  constexpr int kThreads = 4;
  constexpr int kPerThread = 25;

  std::vector<std::jthread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&registry] {
      for (int i = 0; i < kPerThread; ++i) {
        registry.register_handler([] { return 1; });
      }
    });
  }
  threads.clear();

  EXPECT_EQ(registry.size(), static_cast<std::size_t>(kThreads * kPerThread));
  auto future = registry.fire();
  ASSERT_EQ(future.wait_for(kTaskTimeout), std::future_status::ready);
  EXPECT_EQ(future.get(), kThreads * kPerThread);
}

TEST(AsyncRegistryTest, RuntimeStopDuringFireCompletesJoin) {
  auto rt = std::make_shared<Runtime>(2);
  ASSERT_TRUE(rt->start());

  // Occupies shard 0 so the second handler queues behind it while the join
  // waits on shard 1.
  rt->execute(
      [] { std::this_thread::sleep_for(std::chrono::milliseconds(300)); });

  AsyncRegistry<int()> registry{reducers::plus, rt};
  registry.register_handler([] { return 1; });
  registry.register_handler([] { return 2; });

  auto future = registry.fire();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  rt->stop();

  ASSERT_EQ(future.wait_for(std::chrono::seconds(0)),
            std::future_status::ready);
  EXPECT_EQ(future.get(), 3);
}
