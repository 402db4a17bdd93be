#pragma once

#include "relay/event/async_registry.hpp"
#include "relay/event/confined_registry.hpp"
#include "relay/event/reducers.hpp"
#include "relay/event/strategy.hpp"
#include "relay/event/synchronized_registry.hpp"

#include <functional>
#include <memory>
#include <utility>

// Shorthands for the common event shapes. Each returns a fresh, empty
// registry; pick the synchronized_ flavour when handlers are registered from
// more than one thread.
namespace relay::events {

template <typename... Args>
[[nodiscard]] auto broadcast() -> ConfinedRegistry<Broadcast<void(Args...)>> {
  return ConfinedRegistry<Broadcast<void(Args...)>>{};
}

template <typename... Args>
[[nodiscard]] auto synchronized_broadcast()
    -> SynchronizedRegistry<Broadcast<void(Args...)>> {
  return SynchronizedRegistry<Broadcast<void(Args...)>>{};
}

/// Broadcast whose handlers run on `executor` unless registered with an
/// executor of their own.
template <typename... Args>
[[nodiscard]] auto pooled_broadcast(std::shared_ptr<IExecutor> executor)
    -> SynchronizedRegistry<Broadcast<void(Args...)>> {
  return SynchronizedRegistry<Broadcast<void(Args...)>>{
      Broadcast<void(Args...)>{}, std::move(executor)};
}

template <typename T, typename... Rest>
[[nodiscard]] auto chain() -> ConfinedRegistry<Chain<T(T, Rest...)>> {
  return ConfinedRegistry<Chain<T(T, Rest...)>>{};
}

template <typename T, typename... Rest>
[[nodiscard]] auto synchronized_chain()
    -> SynchronizedRegistry<Chain<T(T, Rest...)>> {
  return SynchronizedRegistry<Chain<T(T, Rest...)>>{};
}

template <typename R, typename... Args>
[[nodiscard]] auto reduce(std::function<R(R, R)> reducer)
    -> ConfinedRegistry<Reduce<R(Args...)>> {
  return ConfinedRegistry<Reduce<R(Args...)>>{
      Reduce<R(Args...)>{std::move(reducer)}};
}

template <typename R, typename... Args>
[[nodiscard]] auto synchronized_reduce(std::function<R(R, R)> reducer)
    -> SynchronizedRegistry<Reduce<R(Args...)>> {
  return SynchronizedRegistry<Reduce<R(Args...)>>{
      Reduce<R(Args...)>{std::move(reducer)}};
}

/// Nullary handlers; the last registered handler with an answer wins.
template <typename R>
[[nodiscard]] auto supplier() -> ConfinedRegistry<Reduce<R()>> {
  return events::reduce<R>(reducers::last_wins);
}

template <typename... Args>
[[nodiscard]] auto vote(VotePolicy policy = VotePolicy::FavorFalse)
    -> ConfinedRegistry<Vote<bool(Args...)>> {
  return ConfinedRegistry<Vote<bool(Args...)>>{Vote<bool(Args...)>{policy}};
}

template <typename... Args>
[[nodiscard]] auto synchronized_vote(VotePolicy policy = VotePolicy::FavorFalse)
    -> SynchronizedRegistry<Vote<bool(Args...)>> {
  return SynchronizedRegistry<Vote<bool(Args...)>>{
      Vote<bool(Args...)>{policy}};
}

template <typename R, typename... Args>
[[nodiscard]] auto async(std::function<R(R, R)> reducer,
                         std::shared_ptr<IExecutor> scheduler = direct_executor())
    -> AsyncRegistry<R(Args...)> {
  return AsyncRegistry<R(Args...)>{std::move(reducer), std::move(scheduler)};
}

/// Async registry whose combined answer is the first registered handler's
/// (ignoring handlers that answer with nothing).
template <typename R, typename... Args>
[[nodiscard]] auto
first_takes_precedence(std::shared_ptr<IExecutor> scheduler = direct_executor())
    -> AsyncRegistry<R(Args...)> {
  return events::async<R, Args...>(reducers::first_wins, std::move(scheduler));
}

} // namespace relay::events
