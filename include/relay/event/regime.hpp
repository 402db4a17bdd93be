#pragma once

#include "relay/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string_view>

namespace relay {

/// Concurrency discipline of a registry.
enum class Regime : std::uint8_t {
  Confined,     // owner thread only, live dispatch
  Synchronized, // locked mutation, snapshot dispatch
  Pooled,       // lock-free mutation, dispatch on a task scheduler
};
BOOST_DESCRIBE_ENUM(Regime, Confined, Synchronized, Pooled)
RELAY_DEFINE_ENUM_SERDE(Regime, Regime::Confined)

} // namespace relay
