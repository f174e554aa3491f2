#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <variant>
#include <vector>

namespace shardline::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

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

// Writer-thread commands travel through the same queue as log lines so an
// output switch is ordered with respect to the lines around it.
struct SwitchToStdout {};
struct SwitchToFile {
  std::string path;
};
using Record = std::variant<std::string, SwitchToStdout, SwitchToFile>;

/// Async logger. Producers format on their own thread and hand the line to a
/// concurrent_channel; one writer thread batches lines to the output.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, Record)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stdout};
  std::atomic<std::uint64_t> dropped_{0};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;

  auto open_file(const std::string &path) -> bool {
    FILE *f = std::fopen(path.c_str(), "a");
    if (!f) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    output_.store(f, std::memory_order_release);
    if (file_) {
      std::fclose(file_);
    }
    file_ = f;
    return true;
  }

  auto use_stdout() -> void {
    output_.store(stdout, std::memory_order_release);
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  [[nodiscard]] auto current_output() const -> FILE * {
    auto *out = output_.load(std::memory_order_acquire);
    return out ? out : stdout;
  }

  auto apply(Record &record) -> void {
    std::visit(
        [this](auto &item) {
          using T = std::decay_t<decltype(item)>;
          if constexpr (std::is_same_v<T, std::string>) {
            std::fwrite(item.data(), 1, item.size(), current_output());
          } else if constexpr (std::is_same_v<T, SwitchToStdout>) {
            use_stdout();
          } else {
            (void)open_file(item.path);
          }
        },
        record);
  }

  auto try_take(LogChannel &queue) -> std::optional<Record> {
    std::optional<Record> out;
    (void)queue.try_receive(
        [&](const boost::system::error_code &ec, Record item) {
          if (!ec) {
            out = std::move(item);
          }
        });
    return out;
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<Record> batch;
    batch.reserve(kBatchSize);

    while (running_.load(std::memory_order_acquire)) {
      std::optional<Record> first;
      boost::system::error_code recv_ec;
      queue->async_receive(
          [&](const boost::system::error_code &ec, Record item) {
            recv_ec = ec;
            if (!ec) {
              first = std::move(item);
            }
          });

      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (!running_.load(std::memory_order_acquire) || recv_ec) {
        break;
      }
      if (!first) {
        continue;
      }

      batch.clear();
      batch.push_back(std::move(*first));
      while (batch.size() < kBatchSize) {
        auto next = try_take(*queue);
        if (!next) {
          break;
        }
        batch.push_back(std::move(*next));
      }

      for (auto &record : batch) {
        apply(record);
      }
      std::fflush(current_output());
    }

    while (auto rest = try_take(*queue)) {
      apply(*rest);
    }
    std::fflush(current_output());
  }

  [[nodiscard]] static auto should_drop_on_overflow(FILE *out) noexcept
      -> bool {
    if (out == nullptr) {
      return true;
    }
    const int fd = ::fileno(out);
    return fd < 0 || ::isatty(fd) == 0;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
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
    if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
      queue->close();
    }
    queue_ctx_.stop();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
  }

  auto set_output_file(std::string_view path) -> bool {
    auto q = queue_.load(std::memory_order_acquire);
    if (!q) {
      if (path.empty()) {
        use_stdout();
        return true;
      }
      return open_file(std::string(path));
    }
    Record cmd = path.empty() ? Record{SwitchToStdout{}}
                              : Record{SwitchToFile{std::string(path)}};
    return q->try_send(boost::system::error_code{}, std::move(cmd));
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    auto line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                            level_color(level), level_name(level), "\o{33}[0m",
                            tid, std::format(fmt, std::forward<Args>(args)...));

    auto queue = queue_.load(std::memory_order_acquire);
    if (queue && queue->try_send(boost::system::error_code{}, Record{line})) {
      return;
    }
    auto *out = current_output();
    // Without a writer thread, or with a full queue on a pipe, never block
    // the calling worker.
    if (queue && should_drop_on_overflow(out)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
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

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
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

} // namespace shardline::log
