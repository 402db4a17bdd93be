#pragma once

#include "relay/core/error.hpp"
#include "relay/core/key.hpp"
#include "relay/event/entry.hpp"
#include "relay/event/invoker.hpp"
#include "relay/event/regime.hpp"
#include "relay/util/log.hpp"

#include <cstddef>
#include <memory>
#include <thread>
#include <utility>

namespace relay {

/// Registry owned by a single thread.
///
/// No locks are taken. register_handler(), unregister() and clear() must run
/// on the thread that constructed the registry; any other thread gets a
/// std::system_error carrying Error::WrongThread. The invoker reads the live
/// entry list each time it is called, so it always reflects the latest
/// registrations, and it must not outlive the registry.
template <typename Strategy> class ConfinedRegistry {
public:
  static constexpr Regime regime = Regime::Confined;

  using strategy_type = Strategy;
  using signature = typename Strategy::signature;
  using handler_type = Handler<signature>;
  using entry_type = HandlerEntry<signature>;
  using invoker_type = Invoker<Strategy, LiveEntries<signature>>;

  explicit ConfinedRegistry(Strategy strategy = Strategy{})
      : entries_(std::make_unique<EntryList<signature>>()),
        invoker_(std::make_shared<const Strategy>(std::move(strategy)),
                 LiveEntries<signature>{entries_.get()}),
        owner_(std::this_thread::get_id()) {}

  ConfinedRegistry(ConfinedRegistry &&) noexcept = default;
  auto operator=(ConfinedRegistry &&) noexcept -> ConfinedRegistry & = default;
  ConfinedRegistry(const ConfinedRegistry &) = delete;
  auto operator=(const ConfinedRegistry &) -> ConfinedRegistry & = delete;

  /// Registers under a freshly minted key, which is returned.
  auto register_handler(handler_type handler) -> Key {
    return register_handler(std::move(handler), Key::unique(), nullptr);
  }

  auto register_handler(handler_type handler, Key key) -> Key {
    return register_handler(std::move(handler), key, nullptr);
  }

  /// `executor` only affects broadcast dispatch; other strategies need the
  /// handler's answer and call it inline.
  auto register_handler(handler_type handler, Key key,
                        std::shared_ptr<IExecutor> executor) -> Key {
    check_thread();
    if (!handler) {
      raise(Error::InvalidArgument, "cannot register an empty handler");
    }
    entries_->push_back(entry_type{.handler = std::move(handler),
                                   .key = key,
                                   .executor = normalize_executor(
                                       std::move(executor))});
    return key;
  }

  /// Removes every handler registered under `key`. Unknown keys are ignored.
  auto unregister(const Key &key) -> std::size_t {
    check_thread();
    return erase_key(*entries_, key);
  }

  auto clear() -> void {
    check_thread();
    entries_->clear();
  }

  [[nodiscard]] auto invoker() const noexcept -> const invoker_type & {
    return invoker_;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return entries_->size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return entries_->empty();
  }
  [[nodiscard]] auto owner_thread() const noexcept -> std::thread::id {
    return owner_;
  }

private:
  auto check_thread() const -> void {
    if (std::this_thread::get_id() != owner_) {
      log::error("{} registry touched off its owner thread",
                 to_string_view(regime));
      raise(Error::WrongThread,
            "registry must be modified on the thread that created it");
    }
  }

  std::unique_ptr<EntryList<signature>> entries_;
  invoker_type invoker_;
  std::thread::id owner_;
};

} // namespace relay
