#include "shardline/cli/commands.hpp"
#include "shardline/config/config.hpp"
#include "shardline/http/rest_client.hpp"
#include "shardline/util/log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <print>

namespace shardline::cli {

auto cmd_gateway_info(const GatewayInfoOptions &opts) -> int {
  log::set_output_stderr();
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }
  const auto &cfg = *config_res;
  log::set_level(cfg.log.level);

  boost::asio::io_context ctx{1};
  http::RestClient rest(
      ctx.get_executor(),
      http::RestConfig{.base_url = cfg.rest.base_url,
                       .token = cfg.gateway.token,
                       .timeout = std::chrono::milliseconds{cfg.rest.timeout_ms}});
  auto pending =
      co_spawn(ctx, rest.get_gateway_bot(), boost::asio::use_future);
  ctx.run();
  auto info = pending.get();
  if (!info) {
    std::println(stderr, "Error: {}", info.error().message());
    if (info.error() == Error::RateLimited) {
      std::println(stderr, "Retry after {}s",
                   rest.last_retry_after().value_or(0.0));
    }
    return 1;
  }

  const auto &limit = info->session_start_limit;
  std::println("url                = {}", info->url);
  std::println("recommended shards = {}", info->shards);
  std::println("session starts     = {}/{} remaining", limit.remaining,
               limit.total);
  std::println("limit resets after = {} ms", limit.reset_after);
  std::println("max concurrency    = {}", limit.max_concurrency);
  return 0;
}

} // namespace shardline::cli
