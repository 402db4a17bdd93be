// bench_dispatch.cpp

#include "bench_utils.hpp"

#include "relay/event.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <latch>

namespace relay {
namespace {

void BM_ConfinedBroadcast(benchmark::State &state) {
  const auto handlers = static_cast<int>(state.range(0));
  auto registry = events::broadcast<std::uint64_t>();
  std::uint64_t sink = 0;
  for (int i = 0; i < handlers; ++i) {
    registry.register_handler([&sink](std::uint64_t x) { sink += x; });
  }
  const auto &invoke = registry.invoker();

  std::uint64_t payload = 0;
  for (auto _ : state) {
    invoke(++payload);
  }
  benchmark::DoNotOptimize(sink);
  state.SetItemsProcessed(state.iterations() * handlers);
}

void BM_SynchronizedBroadcast(benchmark::State &state) {
  const auto handlers = static_cast<int>(state.range(0));
  auto registry = events::synchronized_broadcast<std::uint64_t>();
  std::uint64_t sink = 0;
  for (int i = 0; i < handlers; ++i) {
    registry.register_handler([&sink](std::uint64_t x) { sink += x; });
  }

  std::uint64_t payload = 0;
  for (auto _ : state) {
    // Fetching the invoker per firing is the intended usage.
    registry.invoker()(++payload);
  }
  benchmark::DoNotOptimize(sink);
  state.SetItemsProcessed(state.iterations() * handlers);
}

void BM_SynchronizedRegister(benchmark::State &state) {
  const auto handlers = static_cast<int>(state.range(0));
  for (auto _ : state) {
    auto registry = events::synchronized_broadcast<int>();
    for (int i = 0; i < handlers; ++i) {
      registry.register_handler([](int) {});
    }
    benchmark::DoNotOptimize(registry.size());
  }
  state.SetItemsProcessed(state.iterations() * handlers);
}

void BM_ConfinedReduce(benchmark::State &state) {
  const auto handlers = static_cast<int>(state.range(0));
  auto registry = events::reduce<int, int>(reducers::max);
  for (int i = 0; i < handlers; ++i) {
    registry.register_handler([i](int x) { return x ^ i; });
  }
  const auto &invoke = registry.invoker();

  int payload = 0;
  for (auto _ : state) {
    auto result = invoke(++payload);
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations() * handlers);
}

void BM_AsyncDirectFire(benchmark::State &state) {
  const auto handlers = static_cast<int>(state.range(0));
  auto registry = events::async<int>(reducers::plus);
  for (int i = 0; i < handlers; ++i) {
    registry.register_handler([i] { return i; });
  }

  for (auto _ : state) {
    auto result = registry.fire().get();
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations() * handlers);
}

void BM_AsyncRuntimeFire(benchmark::State &state) {
  const auto shards = static_cast<unsigned>(state.range(0));
  const auto handlers = static_cast<int>(state.range(1));

  bench::RuntimeGuard guard(shards);
  auto registry = events::async<int>(reducers::plus, guard.runtime);
  for (int i = 0; i < handlers; ++i) {
    registry.register_handler([i] { return i; });
  }

  for (auto _ : state) {
    auto result = registry.fire().get();
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations() * handlers);
}

void BM_PooledBroadcast(benchmark::State &state) {
  const auto shards = static_cast<unsigned>(state.range(0));
  const auto handlers = static_cast<int>(state.range(1));

  bench::RuntimeGuard guard(shards);
  auto registry = events::pooled_broadcast<std::latch *>(guard.runtime);
  for (int i = 0; i < handlers; ++i) {
    registry.register_handler([](std::latch *done) { done->count_down(); });
  }

  for (auto _ : state) {
    std::latch done(handlers);
    registry.invoker()(&done);
    done.wait();
  }
  state.SetItemsProcessed(state.iterations() * handlers);
}

BENCHMARK(BM_ConfinedBroadcast)
    ->Arg(bench::kSmallSize)
    ->Arg(bench::kMediumSize)
    ->Arg(bench::kLargeSize)
    ->Unit(benchmark::kNanosecond);

BENCHMARK(BM_SynchronizedBroadcast)
    ->Arg(bench::kSmallSize)
    ->Arg(bench::kMediumSize)
    ->Arg(bench::kLargeSize)
    ->Unit(benchmark::kNanosecond);

BENCHMARK(BM_SynchronizedRegister)
    ->Arg(bench::kMediumSize)
    ->Arg(bench::kLargeSize)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_ConfinedReduce)
    ->Arg(bench::kSmallSize)
    ->Arg(bench::kMediumSize)
    ->Arg(bench::kLargeSize)
    ->Unit(benchmark::kNanosecond);

BENCHMARK(BM_AsyncDirectFire)
    ->Arg(bench::kSmallSize)
    ->Arg(bench::kMediumSize)
    ->Unit(benchmark::kNanosecond);

BENCHMARK(BM_AsyncRuntimeFire)
    ->Args({2, bench::kSmallSize})
    ->Args({4, bench::kMediumSize})
    ->Args({4, bench::kLargeSize})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_PooledBroadcast)
    ->Args({2, bench::kMediumSize})
    ->Args({4, bench::kLargeSize})
    ->Unit(benchmark::kMicrosecond);

} // namespace
} // namespace relay
