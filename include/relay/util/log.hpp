#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace relay::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

inline constexpr std::array<std::string_view, 6> level_names = {
    "trace", "debug", "info", "warn", "error", "off"};

inline constexpr std::array<std::string_view, 6> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m", // error: red
    "",
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Thread-local buffer to reduce allocation
struct alignas(64) ThreadBuffer {
  std::string buffer;
  ThreadBuffer() noexcept { buffer.reserve(1024); }
};

inline thread_local ThreadBuffer t_buffer;

/// Process-wide logger. Until start() is called lines are written
/// synchronously; after it they are queued on a Boost concurrent_channel and
/// written in batches by a dedicated thread.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::size_t kBatchSize = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_messages_{0};
  // Guards output_ and file_. Held for every write so a file is never closed
  // under a writer.
  std::mutex sink_mutex_;
  FILE *output_{stderr};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;

  auto write_batch(const std::vector<std::string> &batch) -> void {
    std::lock_guard lock(sink_mutex_);
    for (const auto &msg : batch) {
      std::fwrite(msg.data(), 1, msg.size(), output_);
    }
    std::fflush(output_);
  }

  // Caller holds sink_mutex_.
  auto replace_output(FILE *file) noexcept -> void {
    output_ = file ? file : stderr;
    if (file_) {
      std::fclose(file_);
    }
    file_ = file;
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    while (running_.load(std::memory_order_acquire)) {
      std::optional<std::string> first;
      boost::system::error_code recv_ec;
      queue->async_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            recv_ec = ec;
            if (!ec) {
              first = std::move(item);
            }
          });

      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec || !first) {
        break;
      }
      batch.clear();
      batch.push_back(std::move(*first));

      while (batch.size() < kBatchSize) {
        std::optional<std::string> msg;
        if (!queue->try_receive(
                [&](const boost::system::error_code &ec, std::string item) {
                  if (!ec) {
                    msg = std::move(item);
                  }
                })) {
          break;
        }
        if (msg) {
          batch.push_back(std::move(*msg));
        }
      }
      write_batch(batch);
    }

    // Drain whatever is still buffered after close().
    batch.clear();
    for (;;) {
      std::optional<std::string> msg;
      if (!queue->try_receive(
              [&](const boost::system::error_code &ec, std::string item) {
                if (!ec) {
                  msg = std::move(item);
                }
              })) {
        break;
      }
      if (msg) {
        batch.push_back(std::move(*msg));
      }
    }
    write_batch(batch);
  }

  template <typename... Args>
  auto format_line(Level level, std::format_string<Args...> fmt,
                   Args &&...args) -> std::string & {
    auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    auto &buf = t_buffer.buffer;
    buf.clear();
    std::format_to(std::back_inserter(buf),
                   "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] [relay] ", time,
                   level_color(level), level_name(level), "\o{33}[0m", tid);
    std::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    buf.push_back('\n');
    return buf;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    std::lock_guard lock(sink_mutex_);
    replace_output(nullptr);
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel))
      return;
    queue_ctx_.restart();
    auto channel =
        std::make_shared<LogChannel>(queue_ctx_.get_executor(), kQueueCapacity);
    queue_.store(channel, std::memory_order_release);
    writer_ = std::jthread(
        [this, channel]() mutable { writer_loop(std::move(channel)); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel))
      return;
    auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel);
    if (queue) {
      queue->close();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto should_log(Level level) const noexcept -> bool {
    return level != Level::Off && level >= this->level();
  }

  auto set_output_stderr() -> void {
    std::lock_guard lock(sink_mutex_);
    replace_output(nullptr);
  }

  /// Redirect output to `path` (appending). Only allowed while the writer is
  /// stopped; an empty path restores stderr.
  auto set_output_file(std::string_view path) -> bool {
    if (running_.load(std::memory_order_acquire)) {
      return false;
    }
    FILE *f = nullptr;
    if (!path.empty()) {
      f = std::fopen(std::string(path).c_str(), "a");
      if (!f)
        return false;
      std::setvbuf(f, nullptr, _IOLBF, 0);
    }
    std::lock_guard lock(sink_mutex_);
    replace_output(f);
    return true;
  }

  [[nodiscard]] auto dropped_messages() const noexcept -> std::uint64_t {
    return dropped_messages_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (!should_log(level))
      return;

    auto &line = format_line(level, fmt, std::forward<Args>(args)...);
    auto queue = queue_.load(std::memory_order_acquire);
    if (queue && queue->try_send(boost::system::error_code{}, line)) {
      return;
    }
    std::lock_guard lock(sink_mutex_);
    // A full queue on a pipe means nobody is draining fast enough; drop
    // rather than block the calling thread.
    if (queue && ::isatty(::fileno(output_)) == 0) {
      dropped_messages_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    std::fwrite(line.data(), 1, line.size(), output_);
    std::fflush(output_);
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

[[nodiscard]] inline auto level() noexcept -> Level {
  return logger().level();
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace relay::log
