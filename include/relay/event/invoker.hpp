#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <utility>

namespace relay {

/// The callable a registry hands out to fire its event.
///
/// `Source` decides what the invoker sees: LiveEntries reads the registry's
/// list at call time (confined regime), SnapshotEntries pins the immutable
/// list published by the last mutation (synchronized regime). Copies are
/// cheap; they share the strategy and the source.
template <typename Strategy, typename Source> class Invoker {
public:
  using strategy_type = Strategy;
  using source_type = Source;
  using result_type = typename Strategy::result_type;

  Invoker(std::shared_ptr<const Strategy> strategy, Source source)
      : strategy_(std::move(strategy)), source_(std::move(source)) {}

  template <typename... A>
    requires std::invocable<const Strategy &, const Source &, A...>
  auto operator()(A &&...args) const -> result_type {
    return (*strategy_)(source_, std::forward<A>(args)...);
  }

  /// Number of handlers a firing would reach right now.
  [[nodiscard]] auto handler_count() const noexcept -> std::size_t {
    return source_.size();
  }

private:
  std::shared_ptr<const Strategy> strategy_;
  Source source_;
};

} // namespace relay
