#pragma once

#include "shardline/core/coroutine.hpp"
#include "shardline/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace shardline {

using worker_id = unsigned;

/// Pool of single-threaded io_contexts. Each gateway shard is pinned to one
/// worker so its read loop, heartbeat timer and writer never race.
class Runtime {
public:
  explicit Runtime(unsigned num_workers = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  /// Launch an awaitable coroutine on the given worker.
  template <typename T>
  auto spawn_on(worker_id target, task<T> coro) -> void {
    assert(target < num_workers_);
    co_spawn(contexts_[target]->get_executor(), std::move(coro), detached);
  }

  [[nodiscard]] auto worker_count() const noexcept -> unsigned {
    return num_workers_;
  }
  [[nodiscard]] auto stall_age_ms(worker_id id) const -> std::uint64_t;

  [[nodiscard]] auto executor_for(worker_id id)
      -> boost::asio::io_context::executor_type {
    assert(id < num_workers_);
    return contexts_[id]->get_executor();
  }

  /// Executor for the next worker in round-robin order.
  [[nodiscard]] auto next_executor() -> boost::asio::any_io_executor;

private:
  auto run_worker(worker_id id) -> void;
  auto start_tick_on_worker(worker_id id) -> void;
  auto start_stall_detection() -> void;
  auto stop_stall_detection() -> void;

  alignas(64) std::atomic<bool> running_{false};
  unsigned num_workers_;
  std::vector<std::unique_ptr<boost::asio::io_context>> contexts_;
  std::vector<std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>>
      work_guards_;
  std::vector<std::jthread> threads_;
  std::jthread stall_watchdog_thread_;
  std::vector<std::unique_ptr<std::atomic<std::uint64_t>>> last_tick_ms_;
  alignas(64) std::atomic<std::uint64_t> next_rr_{0};
};

} // namespace shardline
