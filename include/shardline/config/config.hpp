#pragma once

#include "shardline/core/error.hpp"
#include "shardline/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace shardline {

enum class DispatcherMode : std::uint8_t { Task, Channel };
BOOST_DESCRIBE_ENUM(DispatcherMode, Task, Channel)
SHARDLINE_DEFINE_ENUM_SERDE(DispatcherMode, DispatcherMode::Task)

struct GatewaySettings {
  std::string token;
  std::uint32_t shard_count{0}; // 0 = REST recommendation
  std::uint64_t intents{(1ULL << 22) - 1};
  std::uint32_t large_threshold{50};
  int connect_timeout_ms{10000};
  int hello_timeout_ms{20000};
  int backoff_min_ms{1000};
  int backoff_max_ms{60000};
  int backoff_reset_after_ms{30000};
  int max_reconnect_attempts{10}; // 0 = unlimited
  std::uint32_t event_queue_capacity{32};
  std::uint32_t outbound_queue_capacity{64};
  std::string url_override;

  auto operator==(const GatewaySettings &) const -> bool = default;
};

struct DispatcherSettings {
  DispatcherMode mode{DispatcherMode::Task};
  int max_tasks{16};
  std::uint32_t channel_capacity{0};
  bool enable_chunking{true};

  auto operator==(const DispatcherSettings &) const -> bool = default;
};

struct RestSettings {
  std::string base_url{"https://discord.com/api/v10"};
  int timeout_ms{15000};

  auto operator==(const RestSettings &) const -> bool = default;
};

struct LogSettings {
  std::string level{"info"};
  std::string file; // empty = stdout

  auto operator==(const LogSettings &) const -> bool = default;
};

struct ClientConfig {
  GatewaySettings gateway;
  DispatcherSettings dispatcher;
  RestSettings rest;
  LogSettings log;

  auto operator==(const ClientConfig &) const -> bool = default;
};

class ConfigLoader {
public:
  /// Reads the file, applies SHARDLINE_* environment overrides and
  /// validates. FileNotFound when unreadable, ParseError otherwise.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<ClientConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<ClientConfig>;

  [[nodiscard]] static auto validate(const ClientConfig &cfg) -> Result<void>;
};

} // namespace shardline
