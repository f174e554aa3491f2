#pragma once

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/core/coroutine.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

namespace shardline {

/// Manual-reset event for coroutines sharing one executor. Any number of
/// coroutines may wait at once. Waiting is a timer wait, so it reacts to
/// cancellation like any other Asio operation.
class AsyncEvent {
public:
  explicit AsyncEvent(boost::asio::any_io_executor ex)
      : timer_(std::move(ex), boost::asio::steady_timer::time_point::max()) {}

  auto set() -> void {
    set_ = true;
    timer_.cancel();
  }

  auto reset() noexcept -> void { set_ = false; }

  [[nodiscard]] auto is_set() const noexcept -> bool { return set_; }

  auto wait() -> task<Result<void>> {
    // The expiry stays at max(); only set() wakes waiters, by cancelling.
    while (!set_) {
      auto [ec] = co_await timer_.async_wait(use_nothrow);
      (void)ec;
      if (set_) {
        break;
      }
      if (is_cancelled(co_await boost::asio::this_coro::cancellation_state)) {
        co_return fail(Error::Cancelled);
      }
    }
    co_return ok();
  }

private:
  boost::asio::steady_timer timer_;
  bool set_{false};
};

} // namespace shardline
