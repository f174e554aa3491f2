#include "shardline/core/runtime.hpp"

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/util/log.hpp"

#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <chrono>
#include <ranges>

namespace shardline {

namespace {
[[nodiscard]] auto now_monotonic_ms() -> std::uint64_t {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

constexpr auto kTickInterval = std::chrono::milliseconds(50);
constexpr auto kWatchdogPollInterval = std::chrono::milliseconds(100);
constexpr std::uint64_t kStallThresholdMs = 200;
} // namespace

Runtime::Runtime(unsigned num_workers) {
  if (num_workers == 0) {
    num_workers = std::max(1U, std::thread::hardware_concurrency());
  }
  num_workers_ = num_workers;

  contexts_.reserve(num_workers);
  work_guards_.resize(num_workers);
  last_tick_ms_.reserve(num_workers);
  for (auto i : std::views::iota(0U, num_workers)) {
    (void)i;
    contexts_.emplace_back(std::make_unique<boost::asio::io_context>(1));
    last_tick_ms_.emplace_back(
        std::make_unique<std::atomic<std::uint64_t>>(now_monotonic_ms()));
  }
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  log::debug("Starting runtime with {} workers", num_workers_);

  threads_.reserve(num_workers_);
  for (auto i : std::views::iota(0U, num_workers_)) {
    auto &ctx = *contexts_[i];
    ctx.restart();
    work_guards_[i].emplace(boost::asio::make_work_guard(ctx));
    threads_.emplace_back([this, i] { run_worker(i); });
  }

  start_stall_detection();
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false))
    return;
  stop_stall_detection();

  for (auto i : std::views::iota(0U, num_workers_)) {
    if (work_guards_[i].has_value()) {
      work_guards_[i]->reset();
      work_guards_[i].reset();
    }
    contexts_[i]->stop();
  }

  // std::jthread joins on destruction
  threads_.clear();
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::next_executor() -> boost::asio::any_io_executor {
  auto target = static_cast<worker_id>(
      next_rr_.fetch_add(1, std::memory_order_relaxed) % num_workers_);
  return executor_for(target);
}

auto Runtime::run_worker(worker_id id) -> void {
  start_tick_on_worker(id);
  contexts_[id]->run();
}

auto Runtime::stall_age_ms(worker_id id) const -> std::uint64_t {
  if (id >= num_workers_) {
    return 0;
  }
  const auto last_tick = last_tick_ms_[id]->load(std::memory_order_acquire);
  const auto now_ms = now_monotonic_ms();
  return now_ms >= last_tick ? (now_ms - last_tick) : 0;
}

auto Runtime::start_tick_on_worker(worker_id id) -> void {
  auto tick = [](Runtime *self, worker_id w) -> spawn_task {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    while (self->running_.load(std::memory_order_acquire)) {
      self->last_tick_ms_[w]->store(now_monotonic_ms(),
                                    std::memory_order_release);
      timer.expires_after(kTickInterval);
      auto [ec] = co_await timer.async_wait(use_nothrow);
      if (ec) {
        co_return;
      }
    }
  };
  spawn_on(id, tick(this, id));
}

auto Runtime::start_stall_detection() -> void {
  for (auto &tick : last_tick_ms_) {
    tick->store(now_monotonic_ms(), std::memory_order_release);
  }

  stall_watchdog_thread_ = std::jthread([this](std::stop_token st) {
    std::vector<bool> warned(num_workers_, false);
    while (!st.stop_requested() && running_.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(kWatchdogPollInterval);
      if (!running_.load(std::memory_order_acquire)) {
        break;
      }

      for (auto i : std::views::iota(0U, num_workers_)) {
        const auto age_ms = stall_age_ms(i);
        if (age_ms > kStallThresholdMs) {
          if (!warned[i]) {
            log::error("Worker {} stalled ({} ms without tick). Possible "
                       "blocking call in a handler.",
                       i, age_ms);
            warned[i] = true;
          }
        } else {
          warned[i] = false;
        }
      }
    }
  });
}

auto Runtime::stop_stall_detection() -> void {
  if (stall_watchdog_thread_.joinable()) {
    stall_watchdog_thread_.request_stop();
    stall_watchdog_thread_.join();
  }
}

} // namespace shardline
