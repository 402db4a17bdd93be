#include "relay/core/runtime.hpp"

#include "relay/util/log.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <ranges>
#include <thread>

namespace relay {

namespace {
[[nodiscard]] auto resolve_shard_count(unsigned requested) -> unsigned {
  if (requested != 0) {
    return requested;
  }
  return std::max(1U, std::thread::hardware_concurrency());
}
} // namespace

Runtime::Runtime(unsigned num_shards)
    : Runtime(RuntimeOptions{.shards = num_shards}) {}

Runtime::Runtime(RuntimeOptions options)
    : num_shards_(resolve_shard_count(options.shards)) {
  shards_.reserve(num_shards_);
  work_guards_.resize(num_shards_);
  for (auto i : std::views::iota(0U, num_shards_)) {
    shards_.emplace_back(std::make_unique<Shard>(i));
  }
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  log::debug("Starting runtime with {} shards", num_shards_);

  threads_.reserve(num_shards_);
  for (auto i : std::views::iota(0U, num_shards_)) {
    auto &ctx = shards_[i]->ctx();
    ctx.restart();
    work_guards_[i].emplace(boost::asio::make_work_guard(ctx));
    threads_.emplace_back([&ctx] { ctx.run(); });
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false))
    return;

  // Queued tasks must still run: a join task on one shard can be waiting on
  // handler futures queued on another. Without its work guard run() returns
  // once the queue is empty.
  for (auto &guard : work_guards_) {
    guard.reset();
  }

  // std::jthread auto-joins on destruction, just clear the vector
  threads_.clear();
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::execute(Task task) -> void {
  if (!is_running()) {
    raise(Error::SystemNotRunning, "runtime is not running");
  }
  auto target = static_cast<shard_id>(
      external_rr_.fetch_add(1, std::memory_order_relaxed) % num_shards_);
  boost::asio::post(shards_[target]->ctx().get_executor(), std::move(task));
}

} // namespace relay
