#include "relay/config/config.hpp"

#include "relay/core/error.hpp"
#include "relay/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <glaze/toml.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace relay {
namespace detail {

struct RuntimeToml {
  int shards{0};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct RelayToml {
  RuntimeToml runtime{};
  LogToml log{};
};

} // namespace detail
} // namespace relay

namespace glz {
template <> struct meta<relay::detail::RuntimeToml> {
  using T = relay::detail::RuntimeToml;
  static constexpr auto value = object("shards", &T::shards);
};

template <> struct meta<relay::detail::LogToml> {
  using T = relay::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<relay::detail::RelayToml> {
  using T = relay::detail::RelayToml;
  static constexpr auto value =
      object("runtime", &T::runtime, "log", &T::log);
};
} // namespace glz

namespace relay {
namespace {

// Sections other than [runtime] and [log] belong to the embedding
// application and are skipped.
constexpr auto kTomlOpts =
    glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};

[[nodiscard]] auto read_config_text(std::string_view path)
    -> Result<std::string> {
  std::ifstream in{std::string(path)};
  if (!in) {
    return fail(Error::FileNotFound);
  }
  std::ostringstream text;
  text << in.rdbuf();
  if (in.bad()) {
    log::error("I/O error while reading '{}'", path);
    return fail(Error::InvalidState);
  }
  return ok(std::move(text).str());
}

[[nodiscard]] auto parse_relay_toml(std::string_view toml_text)
    -> Result<detail::RelayToml> {
  detail::RelayToml raw{};
  if (auto ec = glz::read<kTomlOpts>(raw, toml_text); ec) {
    log::error("relay config: {}", glz::format_error(ec, toml_text));
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

auto apply_env_overrides(RelayConfig &cfg) -> void {
  if (const char *v = std::getenv("RELAY_SHARDS"); v != nullptr) {
    cfg.runtime.shards = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("RELAY_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("RELAY_LOG_FILE"); v != nullptr) {
    cfg.log.file = v;
  }
}

[[nodiscard]] auto validate(const RelayConfig &cfg) -> Result<void> {
  if (cfg.runtime.shards < 0) {
    log::error("runtime.shards must not be negative (got {})",
               cfg.runtime.shards);
    return fail(Error::InvalidArgument);
  }
  if (!log::parse_level(cfg.log.level)) {
    log::error("unknown log level '{}'", cfg.log.level);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<RelayConfig> {
  auto raw_result = parse_relay_toml(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  RelayConfig cfg{};
  cfg.runtime.shards = raw.runtime.shards;
  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  apply_env_overrides(cfg);

  if (auto valid = validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<RelayConfig> {
  auto text = read_config_text(path);
  if (!text) {
    log::error("cannot read configuration file '{}'", path);
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<RelayConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("invalid RELAY_* environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto apply_logging(const LogConfig &cfg) -> Result<void> {
  const auto level = log::parse_level(cfg.level);
  if (!level) {
    return fail(Error::InvalidArgument);
  }
  if (!cfg.file.empty() && !log::set_output_file(cfg.file)) {
    return fail(Error::InvalidState);
  }
  log::set_level(*level);
  return ok();
}

} // namespace relay
