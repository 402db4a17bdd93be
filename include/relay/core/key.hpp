#pragma once

#include "relay/util/hash.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <ostream>
#include <string>
#include <typeinfo>

namespace relay {

/// Identity token used to find registered handlers again.
///
/// Keys never compare by value: two keys are equal only when they were minted
/// by the same `unique()` call, or when both name the same object through
/// `of()`. Registering the same lambda twice therefore yields two keys that
/// can be unregistered independently.
///
/// Address keys also carry the static type they were made from, so an object
/// and its first member, which share an address, get distinct keys.
class Key {
public:
  Key() = default;

  /// Mint a fresh token that is equal only to its own copies.
  [[nodiscard]] static auto unique() -> Key;

  /// Key naming the identity (address and static type) of `object`. The
  /// object must outlive every registration made with the key.
  template <typename T>
  [[nodiscard]] static auto of(const T &object) noexcept -> Key {
    return Key{static_cast<const void *>(std::addressof(object)), 0,
               &typeid(T)};
  }

  /// Key naming the object owned by `ptr`, not the shared_ptr itself.
  template <typename T>
  [[nodiscard]] static auto of(const std::shared_ptr<T> &ptr) noexcept -> Key {
    return Key{static_cast<const void *>(ptr.get()), 0, &typeid(T)};
  }

  [[nodiscard]] auto is_valid() const noexcept -> bool {
    return address_ != nullptr || serial_ != 0;
  }
  [[nodiscard]] auto address() const noexcept -> const void * {
    return address_;
  }
  [[nodiscard]] auto serial() const noexcept -> std::uint64_t {
    return serial_;
  }

  /// Null for minted and default keys.
  [[nodiscard]] auto type() const noexcept -> const std::type_info * {
    return type_;
  }

  // type_info objects are compared, not their addresses, which may differ
  // across shared libraries.
  [[nodiscard]] friend auto operator==(const Key &lhs, const Key &rhs) noexcept
      -> bool {
    if (lhs.address_ != rhs.address_ || lhs.serial_ != rhs.serial_) {
      return false;
    }
    if (lhs.type_ == nullptr || rhs.type_ == nullptr) {
      return lhs.type_ == rhs.type_;
    }
    return *lhs.type_ == *rhs.type_;
  }

private:
  Key(const void *address, std::uint64_t serial,
      const std::type_info *type = nullptr) noexcept
      : address_(address), serial_(serial), type_(type) {}

  const void *address_{nullptr};
  std::uint64_t serial_{0};
  const std::type_info *type_{nullptr};
};

inline auto operator<<(std::ostream &os, const Key &key) -> std::ostream & {
  if (key.address() != nullptr) {
    return os << "key@" << key.address();
  }
  return os << "key#" << key.serial();
}

} // namespace relay

template <> struct std::hash<relay::Key> {
  auto operator()(const relay::Key &key) const noexcept -> std::size_t {
    auto seed = relay::util::hash_value(key.address());
    relay::util::mix_into(seed, key.serial());
    if (key.type() != nullptr) {
      relay::util::mix_into(seed, key.type()->hash_code());
    }
    return seed;
  }
};

template <> struct std::formatter<relay::Key> : std::formatter<std::string> {
  auto format(const relay::Key &key, std::format_context &ctx) const {
    if (key.address() != nullptr) {
      return std::formatter<std::string>::format(
          std::format("key@{}", key.address()), ctx);
    }
    return std::formatter<std::string>::format(
        std::format("key#{}", key.serial()), ctx);
  }
};
