#pragma once

#include "relay/core/error.hpp"
#include "relay/core/key.hpp"
#include "relay/event/entry.hpp"
#include "relay/event/invoker.hpp"
#include "relay/event/regime.hpp"
#include "relay/util/log.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>

namespace relay {

/// Registry that accepts registrations from any thread.
///
/// Mutations are serialized by a mutex and each one publishes a new immutable
/// snapshot of the entry list together with a new invoker. Firing never
/// locks: an invoker keeps dispatching to the snapshot it was created with,
/// so a firing in progress is unaffected by concurrent changes. Fetch the
/// invoker again after a mutation to see it.
///
/// With a default executor (see events::pooled_broadcast) handlers registered
/// without an executor of their own are dispatched through it.
template <typename Strategy> class SynchronizedRegistry {
public:
  static constexpr Regime regime = Regime::Synchronized;

  using strategy_type = Strategy;
  using signature = typename Strategy::signature;
  using handler_type = Handler<signature>;
  using entry_type = HandlerEntry<signature>;
  using invoker_type = Invoker<Strategy, SnapshotEntries<signature>>;

  explicit SynchronizedRegistry(
      Strategy strategy = Strategy{},
      std::shared_ptr<IExecutor> default_executor = nullptr)
      : strategy_(std::make_shared<const Strategy>(std::move(strategy))),
        default_executor_(normalize_executor(std::move(default_executor))) {
    publish(std::make_shared<const EntryList<signature>>());
  }

  SynchronizedRegistry(const SynchronizedRegistry &) = delete;
  auto operator=(const SynchronizedRegistry &)
      -> SynchronizedRegistry & = delete;

  auto register_handler(handler_type handler) -> Key {
    return register_handler(std::move(handler), Key::unique(), nullptr);
  }

  auto register_handler(handler_type handler, Key key) -> Key {
    return register_handler(std::move(handler), key, nullptr);
  }

  auto register_handler(handler_type handler, Key key,
                        std::shared_ptr<IExecutor> executor) -> Key {
    if (!handler) {
      raise(Error::InvalidArgument, "cannot register an empty handler");
    }
    auto resolved =
        executor ? normalize_executor(std::move(executor)) : default_executor_;

    std::lock_guard lock(mutex_);
    auto next = std::make_shared<EntryList<signature>>(*entries_);
    next->push_back(entry_type{.handler = std::move(handler),
                               .key = key,
                               .executor = std::move(resolved)});
    publish(std::move(next));
    return key;
  }

  /// Removes every handler registered under `key`; republishes only when
  /// something was removed.
  auto unregister(const Key &key) -> std::size_t {
    std::lock_guard lock(mutex_);
    auto next = std::make_shared<EntryList<signature>>(*entries_);
    const auto removed = erase_key(*next, key);
    if (removed > 0) {
      publish(std::move(next));
    }
    return removed;
  }

  auto clear() -> void {
    std::lock_guard lock(mutex_);
    publish(std::make_shared<const EntryList<signature>>());
  }

  /// The invoker for the most recently published snapshot.
  [[nodiscard]] auto invoker() const -> invoker_type {
    return *invoker_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto size() const -> std::size_t {
    return invoker_.load(std::memory_order_acquire)->handler_count();
  }
  [[nodiscard]] auto empty() const -> bool { return size() == 0; }

private:
  // Caller holds mutex_ (or is the constructor).
  auto publish(std::shared_ptr<const EntryList<signature>> entries) -> void {
    entries_ = entries;
    invoker_.store(std::make_shared<const invoker_type>(
                       strategy_, SnapshotEntries<signature>{std::move(entries)}),
                   std::memory_order_release);
    log::trace("{} registry published snapshot of {} handlers",
               to_string_view(regime), entries_->size());
  }

  std::shared_ptr<const Strategy> strategy_;
  std::shared_ptr<IExecutor> default_executor_;
  std::mutex mutex_;
  std::shared_ptr<const EntryList<signature>> entries_;
  std::atomic<std::shared_ptr<const invoker_type>> invoker_;
};

} // namespace relay
