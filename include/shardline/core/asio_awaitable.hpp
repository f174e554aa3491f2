#pragma once

#include "shardline/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_state.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <tuple>

namespace shardline {

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

template <typename T>
[[nodiscard]] inline auto
as_result(std::tuple<boost::system::error_code, T> &&v) -> Result<T> {
  auto [ec, value] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto as_result(std::tuple<boost::system::error_code> &&v)
    -> Result<void> {
  auto [ec] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok();
}

template <typename T>
[[nodiscard]] inline auto co_as_result(
    boost::asio::awaitable<std::tuple<boost::system::error_code, T>> op)
    -> boost::asio::awaitable<Result<T>> {
  co_return as_result(co_await std::move(op));
}

[[nodiscard]] inline auto
co_as_result(boost::asio::awaitable<std::tuple<boost::system::error_code>> op)
    -> boost::asio::awaitable<Result<void>> {
  co_return as_result(co_await std::move(op));
}

/// True when an Asio completion reports cancellation or a closed channel.
[[nodiscard]] inline auto
is_cancellation(const boost::system::error_code &ec) noexcept -> bool {
  return ec == boost::asio::error::operation_aborted ||
         ec == boost::asio::experimental::error::channel_cancelled ||
         ec == boost::asio::experimental::error::channel_closed;
}

/// Use as `is_cancelled(co_await this_coro::cancellation_state)`.
[[nodiscard]] inline auto
is_cancelled(const boost::asio::cancellation_state &state) noexcept -> bool {
  return state.cancelled() != boost::asio::cancellation_type::none;
}

/// Suspend for `duration` on the current executor. Returns early, without
/// error, when cancelled.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> boost::asio::awaitable<void> {
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor,
                                  duration);
  auto [ec] = co_await timer.async_wait(use_nothrow);
  (void)ec;
}

} // namespace shardline
