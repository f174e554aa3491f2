#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace shardline::cli {

struct RunOptions {
  std::string config_file;
  std::optional<std::string> log_level;
  std::optional<std::uint32_t> shards;
  std::optional<std::string> dispatcher; // task|channel
  unsigned workers{0};                   // 0 = hardware concurrency
};

struct CheckConfigOptions {
  std::string config_file;
};

struct GatewayInfoOptions {
  std::string config_file;
};

auto cmd_run(const RunOptions &opts) -> int;
auto cmd_check_config(const CheckConfigOptions &opts) -> int;
auto cmd_gateway_info(const GatewayInfoOptions &opts) -> int;

} // namespace shardline::cli
