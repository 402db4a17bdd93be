#pragma once

#include "relay/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace relay {

/// How a boolean vote combines the answers of its handlers.
enum class VotePolicy : std::uint8_t {
  FavorFalse, // any false wins (AND)
  FavorTrue,  // any true wins (OR)
  Parity,     // XOR
};
BOOST_DESCRIBE_ENUM(VotePolicy, FavorFalse, FavorTrue, Parity)
RELAY_DEFINE_ENUM_SERDE(VotePolicy, VotePolicy::FavorFalse)

[[nodiscard]] constexpr auto combine_votes(VotePolicy policy, bool a,
                                           bool b) noexcept -> bool {
  switch (policy) {
  case VotePolicy::FavorFalse:
    return a && b;
  case VotePolicy::FavorTrue:
    return a || b;
  case VotePolicy::Parity:
    return a != b;
  }
  std::unreachable();
}

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

/// True for handler results that carry no answer: an empty optional or a
/// null pointer. Such results are skipped by reductions.
template <typename T>
[[nodiscard]] constexpr auto is_absent(const T &value) noexcept -> bool {
  if constexpr (is_optional<T>::value) {
    return !value.has_value();
  } else if constexpr (std::is_pointer_v<T> ||
                       requires { value == nullptr; }) {
    return value == nullptr;
  } else {
    return false;
  }
}

namespace detail {
template <typename R, typename Reducer>
auto fold_into(std::optional<R> &acc, R value, const Reducer &reducer)
    -> void {
  if (is_absent(value)) {
    return;
  }
  if (!acc) {
    acc.emplace(std::move(value));
  } else {
    acc = std::invoke(reducer, std::move(*acc), std::move(value));
  }
}
} // namespace detail

namespace reducers {

struct LastWins {
  template <typename T> auto operator()(T, T b) const -> T { return b; }
};

struct FirstWins {
  template <typename T> auto operator()(T a, T) const -> T { return a; }
};

struct Max {
  template <typename T> auto operator()(T a, T b) const -> T {
    return std::max(a, b);
  }
};

struct Min {
  template <typename T> auto operator()(T a, T b) const -> T {
    return std::min(a, b);
  }
};

inline constexpr LastWins last_wins{};
inline constexpr FirstWins first_wins{};
inline constexpr Max max{};
inline constexpr Min min{};
inline constexpr std::plus<> plus{};

} // namespace reducers

} // namespace relay
