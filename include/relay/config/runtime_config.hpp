#pragma once

#include "relay/core/runtime.hpp"

#include <string>

namespace relay {

struct RuntimeConfig {
  int shards{0}; // 0 = auto (hardware_concurrency)

  auto operator==(const RuntimeConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file; // empty = stderr

  auto operator==(const LogConfig &) const -> bool = default;
};

struct RelayConfig {
  RuntimeConfig runtime;
  LogConfig log;

  auto operator==(const RelayConfig &) const -> bool = default;
};

[[nodiscard]] inline auto to_runtime_options(const RuntimeConfig &cfg)
    -> RuntimeOptions {
  return RuntimeOptions{.shards = static_cast<unsigned>(cfg.shards)};
}

} // namespace relay
