#pragma once

#include "relay/config/runtime_config.hpp"
#include "relay/core/error.hpp"

#include <string_view>

namespace relay {

/// Loads RelayConfig from TOML. RELAY_SHARDS, RELAY_STALL_THRESHOLD_MS,
/// RELAY_LOG_LEVEL and RELAY_LOG_FILE override the file.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<RelayConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<RelayConfig>;
};

/// Applies level and output file to the process logger. An empty file leaves
/// the output alone; a file can only be opened while the logger is stopped.
[[nodiscard]] auto apply_logging(const LogConfig &cfg) -> Result<void>;

} // namespace relay
