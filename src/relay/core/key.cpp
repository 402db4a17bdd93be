#include "relay/core/key.hpp"

#include <atomic>

namespace relay {

namespace {
// Serial 0 is reserved for address keys and the null key.
std::atomic<std::uint64_t> next_serial{1};
} // namespace

auto Key::unique() -> Key {
  return Key{nullptr, next_serial.fetch_add(1, std::memory_order_relaxed)};
}

} // namespace relay
