#pragma once

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/core/coroutine.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include <atomic>
#include <cstddef>
#include <utility>

namespace shardline {

/// Counting semaphore for coroutines. Each held slot is one buffered token
/// in a channel of capacity N, so acquire() suspends while N are out.
class CapacityLimiter {
public:
  CapacityLimiter(boost::asio::any_io_executor ex, std::size_t slots)
      : tokens_(std::move(ex), slots), capacity_(slots) {}

  CapacityLimiter(const CapacityLimiter &) = delete;
  auto operator=(const CapacityLimiter &) -> CapacityLimiter & = delete;

  auto acquire() -> task<Result<void>> {
    auto res = co_await co_as_result(
        tokens_.async_send(boost::system::error_code{}, use_nothrow));
    if (res) {
      in_use_.fetch_add(1, std::memory_order_relaxed);
    }
    co_return res;
  }

  auto release() -> void {
    if (tokens_.try_receive([](boost::system::error_code) {})) {
      in_use_.fetch_sub(1, std::memory_order_relaxed);
    }
  }

  auto close() -> void { tokens_.close(); }

  [[nodiscard]] auto in_use() const noexcept -> std::size_t {
    return in_use_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }

private:
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code)>
      tokens_;
  std::size_t capacity_;
  std::atomic<std::size_t> in_use_{0};
};

/// RAII guard returning a slot to its limiter on every exit path.
class SlotGuard {
public:
  explicit SlotGuard(CapacityLimiter &limiter) noexcept : limiter_(&limiter) {}
  ~SlotGuard() {
    if (limiter_) {
      limiter_->release();
    }
  }
  SlotGuard(SlotGuard &&other) noexcept
      : limiter_(std::exchange(other.limiter_, nullptr)) {}
  SlotGuard(const SlotGuard &) = delete;
  auto operator=(const SlotGuard &) -> SlotGuard & = delete;
  auto operator=(SlotGuard &&) -> SlotGuard & = delete;

private:
  CapacityLimiter *limiter_;
};

} // namespace shardline
