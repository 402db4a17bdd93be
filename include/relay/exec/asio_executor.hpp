#pragma once

#include "relay/exec/executor.hpp"

#include <boost/asio/execution/executor.hpp>
#include <boost/asio/post.hpp>

#include <memory>
#include <utility>

namespace relay {

/// IExecutor over any Boost.Asio executor: an io_context, a strand or a
/// thread_pool. Tasks are posted, never run inline.
template <typename Ex> class AsioExecutor final : public IExecutor {
public:
  explicit AsioExecutor(Ex executor) : executor_(std::move(executor)) {}

  auto execute(Task task) -> void override {
    boost::asio::post(executor_, std::move(task));
  }

  [[nodiscard]] auto get_executor() const noexcept -> const Ex & {
    return executor_;
  }

private:
  Ex executor_;
};

template <typename Ex>
  requires boost::asio::execution::executor<Ex>
[[nodiscard]] auto make_asio_executor(Ex executor)
    -> std::shared_ptr<IExecutor> {
  return std::make_shared<AsioExecutor<Ex>>(std::move(executor));
}

template <typename Context>
  requires requires(Context &ctx) { ctx.get_executor(); }
[[nodiscard]] auto make_asio_executor(Context &ctx)
    -> std::shared_ptr<IExecutor> {
  using Ex = decltype(ctx.get_executor());
  return std::make_shared<AsioExecutor<Ex>>(ctx.get_executor());
}

} // namespace relay
