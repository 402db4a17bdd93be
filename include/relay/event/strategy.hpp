#pragma once

#include "relay/core/error.hpp"
#include "relay/event/entry.hpp"
#include "relay/event/reducers.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>

namespace relay {

// Composition strategies. Each one is a small function object that knows the
// handler signature and turns "the entries visible right now" plus a payload
// into the invoker's result. Entries are indexed rather than iterated so the
// confined regime can observe handlers appended during a firing.

template <typename Sig> class Broadcast;

/// Calls every handler in registration order, through the handler's executor
/// when it has one. A throwing handler ends the pass.
template <typename... Args> class Broadcast<void(Args...)> {
public:
  using signature = void(Args...);
  using result_type = void;

  template <typename Entries>
  auto operator()(const Entries &entries, Args... args) const -> void {
    for (std::size_t i = 0; i < entries.size(); ++i) {
      decltype(auto) entry = entries[i];
      if (!entry.executor) {
        entry.handler(args...);
        continue;
      }
      entry.executor->execute(
          [handler = entry.handler, ... captured = args]() mutable {
            handler(captured...);
          });
    }
  }
};

template <typename Sig> class Chain;

/// Threads the first argument through every handler; each handler sees the
/// value returned by the one before it. No handlers returns the input.
template <typename T, typename... Rest> class Chain<T(T, Rest...)> {
public:
  using signature = T(T, Rest...);
  using result_type = T;

  template <typename Entries>
  auto operator()(const Entries &entries, T value, Rest... rest) const -> T {
    for (std::size_t i = 0; i < entries.size(); ++i) {
      decltype(auto) entry = entries[i];
      value = entry.handler(std::move(value), rest...);
    }
    return value;
  }
};

template <typename Sig> class Reduce;

/// Calls every handler with the same arguments and folds the answers left to
/// right: f(f(f(a, b), c), d). Absent answers are skipped; with no answer the
/// result is empty.
template <typename R, typename... Args> class Reduce<R(Args...)> {
public:
  using signature = R(Args...);
  using result_type = std::optional<R>;
  using reducer_type = std::function<R(R, R)>;

  explicit Reduce(reducer_type reducer) : reducer_(std::move(reducer)) {
    if (!reducer_) {
      raise(Error::InvalidArgument, "reduce needs a reducer");
    }
  }

  template <typename Entries>
  auto operator()(const Entries &entries, Args... args) const
      -> std::optional<R> {
    std::optional<R> result;
    for (std::size_t i = 0; i < entries.size(); ++i) {
      decltype(auto) entry = entries[i];
      detail::fold_into(result, entry.handler(args...), reducer_);
    }
    return result;
  }

  [[nodiscard]] auto reducer() const noexcept -> const reducer_type & {
    return reducer_;
  }

private:
  reducer_type reducer_;
};

template <typename Sig> class Vote;

/// Boolean reduction under a VotePolicy. Every handler is asked; there is no
/// short-circuit. No handlers votes false.
template <typename... Args> class Vote<bool(Args...)> {
public:
  using signature = bool(Args...);
  using result_type = bool;

  explicit Vote(VotePolicy policy = VotePolicy::FavorFalse) noexcept
      : policy_(policy) {}

  template <typename Entries>
  auto operator()(const Entries &entries, Args... args) const -> bool {
    bool result = false;
    for (std::size_t i = 0; i < entries.size(); ++i) {
      decltype(auto) entry = entries[i];
      const bool current = entry.handler(args...);
      result = i == 0 ? current : combine_votes(policy_, result, current);
    }
    return result;
  }

  [[nodiscard]] auto policy() const noexcept -> VotePolicy { return policy_; }

private:
  VotePolicy policy_;
};

} // namespace relay
