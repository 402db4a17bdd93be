#pragma once

#include "relay/core/error.hpp"
#include "relay/core/shard.hpp"
#include "relay/exec/executor.hpp"

#include <boost/asio/executor_work_guard.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace relay {

struct RuntimeOptions {
  unsigned shards{0}; // 0 = hardware_concurrency
};

/// Sharded worker pool: one io_context and one thread per shard.
///
/// Runtime is the pooled task scheduler handed to async registries and to
/// handler registrations that should run off the firing thread. It is never
/// created implicitly; the embedding application owns it.
///
/// stop() drains: every task accepted before it is called still runs, so a
/// join task blocked on handler futures always completes.
class Runtime final : public IExecutor {
public:
  explicit Runtime(unsigned num_shards = 0);
  explicit Runtime(RuntimeOptions options);
  ~Runtime() noexcept override;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  /// Stops accepting tasks, runs what is queued, then joins the workers.
  /// Must not be called from a task running on this runtime.
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  /// Round-robin the task onto a shard. Throws std::system_error with
  /// Error::SystemNotRunning when the runtime is stopped.
  auto execute(Task task) -> void override;

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return num_shards_;
  }

private:
  alignas(64) std::atomic<bool> running_{false};
  unsigned num_shards_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::vector<std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>>
      work_guards_;
  std::vector<std::jthread> threads_;
  alignas(64) std::atomic<std::uint64_t> external_rr_{0};
};

} // namespace relay
