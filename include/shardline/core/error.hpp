#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace shardline {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  NotFound,
  Timeout,
  Cancelled,
  InvalidState,
  QueueFull,
  InvalidUrl,
  ProtocolError,
  Unauthorized,
  ShardingRequired,
  DisallowedIntents,
  InvalidShard,
  RetryBudgetExhausted,
  ConnectionClosed,
  RateLimited,
  HttpError,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 20> messages = {
      "success",
      "file not found",
      "parse error",
      "invalid argument",
      "not found",
      "timeout",
      "cancelled",
      "invalid state transition",
      "queue full",
      "invalid URL",
      "gateway protocol error",
      "authentication failed",
      "sharding required",
      "disallowed intents",
      "shard id out of range",
      "reconnect retry budget exhausted",
      "connection closed",
      "rate limited",
      "HTTP request failed",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "shardline";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      std::unreachable();
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

/// Errors that end a shard for good. Everything else is retried.
[[nodiscard]] inline auto is_fatal(std::error_code ec) noexcept -> bool {
  return ec == Error::Unauthorized || ec == Error::ShardingRequired ||
         ec == Error::DisallowedIntents || ec == Error::RetryBudgetExhausted;
}

} // namespace shardline

template <> struct std::is_error_code_enum<shardline::Error> : std::true_type {};
