#pragma once

#include "relay/core/error.hpp"
#include "relay/core/key.hpp"
#include "relay/event/entry.hpp"
#include "relay/event/reducers.hpp"
#include "relay/event/regime.hpp"
#include "relay/exec/executor.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace relay {

template <typename Sig> class AsyncRegistry;

/// Fan-out/fan-in registry.
///
/// fire() hands one task per handler to the scheduler (or to the handler's
/// own executor) and a final join task that folds the answers with the
/// reducer in registration order. The returned future is ready once every
/// handler task and the join have run. A failing handler fails the combined
/// future with the first failure in registration order; the other handler
/// tasks still run to completion.
///
/// The handler list is copy-on-write behind an atomic pointer and updated
/// with compare-exchange, so registration and removal are safe from any
/// thread without a lock. A fire() racing with a removal may or may not see
/// the removed handler.
///
/// The join task blocks on the handler futures. On a bounded pool where every
/// worker can end up in a join, that can starve the handler tasks; give the
/// pool more workers than concurrent fires or use per-handler executors.
template <typename R, typename... Args> class AsyncRegistry<R(Args...)> {
  static_assert(!std::is_void_v<R>,
                "async registries fold results; use Broadcast for void");

public:
  static constexpr Regime regime = Regime::Pooled;

  using signature = R(Args...);
  using handler_type = Handler<signature>;
  using entry_type = HandlerEntry<signature>;
  using reducer_type = std::function<R(R, R)>;
  using result_type = std::optional<R>;

  explicit AsyncRegistry(reducer_type reducer,
                         std::shared_ptr<IExecutor> scheduler = direct_executor())
      : reducer_(std::move(reducer)),
        scheduler_(scheduler ? std::move(scheduler) : direct_executor()),
        entries_(std::make_shared<const EntryList<signature>>()) {
    if (!reducer_) {
      raise(Error::InvalidArgument, "async registry needs a reducer");
    }
  }

  AsyncRegistry(const AsyncRegistry &) = delete;
  auto operator=(const AsyncRegistry &) -> AsyncRegistry & = delete;

  auto register_handler(handler_type handler) -> Key {
    return register_handler(std::move(handler), Key::unique(), nullptr);
  }

  auto register_handler(handler_type handler, Key key) -> Key {
    return register_handler(std::move(handler), key, nullptr);
  }

  /// `executor` overrides the scheduler for this handler's task.
  auto register_handler(handler_type handler, Key key,
                        std::shared_ptr<IExecutor> executor) -> Key {
    if (!handler) {
      raise(Error::InvalidArgument, "cannot register an empty handler");
    }
    const entry_type entry{.handler = std::move(handler),
                           .key = key,
                           .executor = std::move(executor)};
    update([&entry](EntryList<signature> &list) {
      list.push_back(entry);
      return true;
    });
    return key;
  }

  auto unregister(const Key &key) -> std::size_t {
    std::size_t removed = 0;
    update([&](EntryList<signature> &list) {
      removed = erase_key(list, key);
      return removed > 0;
    });
    return removed;
  }

  auto clear() -> void {
    entries_.store(std::make_shared<const EntryList<signature>>(),
                   std::memory_order_release);
  }

  auto fire(Args... args) const -> std::future<result_type> {
    const auto snapshot = entries_.load(std::memory_order_acquire);

    std::vector<std::future<R>> futures;
    futures.reserve(snapshot->size());
    for (const auto &entry : *snapshot) {
      IExecutor &target = entry.executor ? *entry.executor : *scheduler_;
      futures.push_back(
          submit(target, [handler = entry.handler,
                          ... captured = args]() mutable {
            return handler(captured...);
          }));
    }

    return submit(*scheduler_, [futures = std::move(futures),
                                reducer = reducer_]() mutable -> result_type {
      for (auto &f : futures) {
        f.wait();
      }
      result_type result;
      for (auto &f : futures) {
        detail::fold_into(result, f.get(), reducer);
      }
      return result;
    });
  }

  [[nodiscard]] auto size() const -> std::size_t {
    return entries_.load(std::memory_order_acquire)->size();
  }
  [[nodiscard]] auto empty() const -> bool { return size() == 0; }

  [[nodiscard]] auto scheduler() const noexcept
      -> const std::shared_ptr<IExecutor> & {
    return scheduler_;
  }
  [[nodiscard]] auto reducer() const noexcept -> const reducer_type & {
    return reducer_;
  }

private:
  // Applies `mutate` to a private copy and publishes it. `mutate` returns
  // false when there is nothing to publish.
  template <typename Mutate> auto update(Mutate &&mutate) -> void {
    auto current = entries_.load(std::memory_order_acquire);
    for (;;) {
      auto next = std::make_shared<EntryList<signature>>(*current);
      if (!mutate(*next)) {
        return;
      }
      if (entries_.compare_exchange_weak(
              current, std::shared_ptr<const EntryList<signature>>(std::move(next)),
              std::memory_order_acq_rel, std::memory_order_acquire)) {
        return;
      }
    }
  }

  reducer_type reducer_;
  std::shared_ptr<IExecutor> scheduler_;
  std::atomic<std::shared_ptr<const EntryList<signature>>> entries_;
};

} // namespace relay
