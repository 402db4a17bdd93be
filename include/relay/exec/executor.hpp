#pragma once

#include <chrono>
#include <concepts>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace relay {

using Task = std::move_only_function<void()>;

/// Capability to run a nullary task, now or later, on some thread.
class IExecutor {
public:
  virtual ~IExecutor() = default;

  virtual auto execute(Task task) -> void = 0;
};

/// Runs every task inline, before execute() returns.
class DirectExecutor final : public IExecutor {
public:
  auto execute(Task task) -> void override { task(); }
};

/// Shared stateless DirectExecutor. Handlers registered without an executor
/// and async registries constructed without a scheduler use it.
[[nodiscard]] auto direct_executor() -> std::shared_ptr<IExecutor>;

[[nodiscard]] auto is_direct(const IExecutor *executor) noexcept -> bool;

template <typename R>
[[nodiscard]] auto is_ready(const std::future<R> &future) -> bool {
  return future.wait_for(std::chrono::seconds(0)) ==
         std::future_status::ready;
}

/// Schedule `fn` on `executor`. The value or exception it produces lands in
/// the returned future. With a DirectExecutor the future is already ready.
template <typename F>
  requires std::invocable<std::decay_t<F> &>
[[nodiscard]] auto submit(IExecutor &executor, F &&fn)
    -> std::future<std::invoke_result_t<std::decay_t<F> &>> {
  using R = std::invoke_result_t<std::decay_t<F> &>;
  std::packaged_task<R()> task(std::forward<F>(fn));
  auto future = task.get_future();
  executor.execute([task = std::move(task)]() mutable { task(); });
  return future;
}

/// Wait for every future, then collect results in order. The first failure
/// (in order) is rethrown instead of returning partial results.
template <typename R>
auto join_all(std::vector<std::future<R>> &futures) {
  for (auto &f : futures) {
    f.wait();
  }
  if constexpr (std::is_void_v<R>) {
    for (auto &f : futures) {
      f.get();
    }
  } else {
    std::vector<R> results;
    results.reserve(futures.size());
    for (auto &f : futures) {
      results.push_back(f.get());
    }
    return results;
  }
}

/// Run a batch of tasks and wait for all of them.
template <typename F>
  requires std::invocable<F &>
auto invoke_all(IExecutor &executor, std::vector<F> tasks) {
  using R = std::invoke_result_t<F &>;
  std::vector<std::future<R>> futures;
  futures.reserve(tasks.size());
  for (auto &t : tasks) {
    futures.push_back(submit(executor, std::move(t)));
  }
  return join_all(futures);
}

} // namespace relay
