#include "shardline/cli/commands.hpp"
#include "shardline/config/config.hpp"
#include "shardline/util/log.hpp"

#include <print>
#include <string>

namespace shardline::cli {
namespace {

auto mask(const std::string &secret) -> std::string {
  if (secret.size() <= 8) {
    return std::string(secret.size(), '*');
  }
  return secret.substr(0, 4) + std::string(secret.size() - 4, '*');
}

auto or_default(const std::string &value, std::string_view fallback)
    -> std::string_view {
  return value.empty() ? fallback : std::string_view(value);
}

} // namespace

auto cmd_check_config(const CheckConfigOptions &opts) -> int {
  log::set_output_stderr();
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }
  const auto &cfg = *config_res;
  const auto &gw = cfg.gateway;

  std::println("[gateway]");
  std::println("  token                   = {}", mask(gw.token));
  if (gw.shard_count == 0) {
    std::println("  shard_count             = recommended");
  } else {
    std::println("  shard_count             = {}", gw.shard_count);
  }
  std::println("  intents                 = {}", gw.intents);
  std::println("  large_threshold         = {}", gw.large_threshold);
  std::println("  connect_timeout_ms      = {}", gw.connect_timeout_ms);
  std::println("  hello_timeout_ms        = {}", gw.hello_timeout_ms);
  std::println("  backoff_ms              = {}..{}", gw.backoff_min_ms,
               gw.backoff_max_ms);
  std::println("  backoff_reset_after_ms  = {}", gw.backoff_reset_after_ms);
  std::println("  max_reconnect_attempts  = {}", gw.max_reconnect_attempts);
  std::println("  event_queue_capacity    = {}", gw.event_queue_capacity);
  std::println("  outbound_queue_capacity = {}", gw.outbound_queue_capacity);
  std::println("  url_override            = {}",
               or_default(gw.url_override, "(none)"));
  std::println("[dispatcher]");
  std::println("  mode                    = {}",
               to_string_view(cfg.dispatcher.mode));
  std::println("  max_tasks               = {}", cfg.dispatcher.max_tasks);
  std::println("  channel_capacity        = {}",
               cfg.dispatcher.channel_capacity);
  std::println("  enable_chunking         = {}",
               cfg.dispatcher.enable_chunking);
  std::println("[rest]");
  std::println("  base_url                = {}", cfg.rest.base_url);
  std::println("  timeout_ms              = {}", cfg.rest.timeout_ms);
  std::println("[log]");
  std::println("  level                   = {}", cfg.log.level);
  std::println("  file                    = {}",
               or_default(cfg.log.file, "(stdout)"));
  return 0;
}

} // namespace shardline::cli
