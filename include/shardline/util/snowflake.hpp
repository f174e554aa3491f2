#pragma once

#include "shardline/core/error.hpp"

#include <charconv>
#include <chrono>
#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace shardline {

/// 64-bit entity id. The upper 42 bits are milliseconds since the service
/// epoch (2015-01-01T00:00:00Z).
class Snowflake {
public:
  static constexpr std::uint64_t kEpochMs = 1420070400000ULL;

  constexpr Snowflake() = default;
  constexpr explicit Snowflake(std::uint64_t value) noexcept : value_(value) {}

  [[nodiscard]] static auto parse(std::string_view text) -> Result<Snowflake> {
    std::uint64_t v = 0;
    const auto *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, v);
    if (text.empty() || ec != std::errc{} || ptr != end) {
      return fail(Error::ParseError);
    }
    return Snowflake{v};
  }

  [[nodiscard]] constexpr auto value() const noexcept -> std::uint64_t {
    return value_;
  }

  [[nodiscard]] constexpr auto timestamp_ms() const noexcept -> std::uint64_t {
    return (value_ >> 22) + kEpochMs;
  }

  [[nodiscard]] auto created_at() const noexcept
      -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{timestamp_ms()}};
  }

  [[nodiscard]] auto str() const -> std::string {
    return std::to_string(value_);
  }

  [[nodiscard]] friend constexpr auto operator<=>(Snowflake,
                                                  Snowflake) = default;

private:
  std::uint64_t value_{0};
};

inline auto operator<<(std::ostream &os, Snowflake id) -> std::ostream & {
  return os << id.value();
}

} // namespace shardline

// Not marked is_avalanching: ankerl mixes the identity hash itself.
template <> struct std::hash<shardline::Snowflake> {
  auto operator()(shardline::Snowflake id) const noexcept -> std::size_t {
    return std::hash<std::uint64_t>{}(id.value());
  }
};

template <>
struct std::formatter<shardline::Snowflake> : std::formatter<std::uint64_t> {
  auto format(shardline::Snowflake id, auto &ctx) const {
    return std::formatter<std::uint64_t>::format(id.value(), ctx);
  }
};
