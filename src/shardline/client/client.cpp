#include "shardline/client/client.hpp"

#include "shardline/dispatch/channel_dispatcher.hpp"
#include "shardline/dispatch/task_dispatcher.hpp"
#include "shardline/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace shardline {

using namespace awaitable_ops;

Client::Client(boost::asio::any_io_executor ex, ClientConfig cfg)
    : ex_(std::move(ex)), cfg_(std::move(cfg)),
      rest_(ex_,
            http::RestConfig{
                .base_url = cfg_.rest.base_url,
                .token = cfg_.gateway.token,
                .timeout = std::chrono::milliseconds{cfg_.rest.timeout_ms}}),
      factory_(this), parser_(cache_, factory_) {
  if (cfg_.dispatcher.enable_chunking) {
    chunker_ = std::make_unique<event::GuildChunker>(ex_);
  }
}

Client::~Client() = default;

auto Client::connect() -> task<Result<http::GatewayInfo>> {
  const auto &gw = cfg_.gateway;
  if (!gw.url_override.empty() && gw.shard_count > 0) {
    gateway_info_ =
        http::GatewayInfo{.url = gw.url_override, .shards = gw.shard_count};
    co_return *gateway_info_;
  }

  auto info = co_await rest_.get_gateway_bot();
  if (!info) {
    log::error("Failed to resolve gateway endpoint: {}",
               info.error().message());
    co_return info;
  }
  const auto &limit = info->session_start_limit;
  log::info("Gateway {} recommends {} shard(s); {}/{} session starts left",
            info->url, info->shards, limit.remaining, limit.total);
  if (limit.total > 0 && limit.remaining == 0) {
    log::warn("Session start limit exhausted, resets in {} ms",
              limit.reset_after);
  }
  if (!gw.url_override.empty()) {
    info->url = gw.url_override;
  }
  if (gw.shard_count > 0) {
    info->shards = gw.shard_count;
  }
  gateway_info_ = *info;
  co_return info;
}

auto Client::connection_config(const ClientConfig &cfg,
                               std::string gateway_url)
    -> gateway::ConnectionConfig {
  const auto &gw = cfg.gateway;
  gateway::ConnectionConfig out;
  out.token = gw.token;
  out.gateway_url = std::move(gateway_url);
  out.intents = gw.intents;
  out.large_threshold = gw.large_threshold;
  out.connect_timeout = std::chrono::milliseconds{gw.connect_timeout_ms};
  out.hello_timeout = std::chrono::milliseconds{gw.hello_timeout_ms};
  out.backoff.min_delay = std::chrono::milliseconds{gw.backoff_min_ms};
  out.backoff.max_delay = std::chrono::milliseconds{gw.backoff_max_ms};
  out.backoff_reset_after =
      std::chrono::milliseconds{gw.backoff_reset_after_ms};
  out.max_reconnect_attempts = gw.max_reconnect_attempts;
  out.event_queue_capacity = gw.event_queue_capacity;
  out.outbound_queue_capacity = gw.outbound_queue_capacity;
  return out;
}

auto Client::make_collection(gateway::TransportFactory factory,
                             gateway::ExecutorPicker pick)
    -> Result<std::unique_ptr<gateway::ShardCollection>> {
  if (!gateway_info_) {
    log::error("make_collection called before connect");
    return fail(Error::InvalidState);
  }
  gateway::CollectionConfig cfg{
      .connection = connection_config(cfg_, gateway_info_->url),
      .shard_count = std::max<std::uint32_t>(gateway_info_->shards, 1),
      .merged_capacity = std::max<std::size_t>(
          cfg_.gateway.event_queue_capacity, 1)};
  return std::make_unique<gateway::ShardCollection>(
      ex_, std::move(cfg), std::move(factory), std::move(pick));
}

auto Client::make_dispatcher() -> std::unique_ptr<dispatch::EventDispatcher> {
  switch (cfg_.dispatcher.mode) {
  case DispatcherMode::Channel:
    return std::make_unique<dispatch::ChannelDispatcher>(ex_, parser_, this,
                                                         chunker_.get());
  case DispatcherMode::Task:
    break;
  }
  return std::make_unique<dispatch::TaskDispatcher>(
      ex_, parser_, static_cast<std::size_t>(cfg_.dispatcher.max_tasks), this,
      chunker_.get());
}

auto Client::run(gateway::ShardCollection &collection,
                 dispatch::EventDispatcher &dispatcher) -> task<Result<void>> {
  if (!chunker_) {
    co_return co_await (collection.run() && drive(collection, dispatcher));
  }
  auto [result, finished] =
      co_await (collection.run() &&
                (drive(collection, dispatcher) || chunker_->run(collection)));
  (void)finished;
  chunker_->stop();
  co_return result;
}

auto Client::drive(gateway::ShardCollection &collection,
                   dispatch::EventDispatcher &dispatcher) -> task<void> {
  co_await dispatcher.run(collection.events(), collection.shard_count());
  // The dispatcher may have been stopped on its own; the shards follow.
  collection.stop();
}

auto Client::send_message(const models::StatefulChannel &channel,
                          std::string content)
    -> task<Result<models::StatefulMessage>> {
  if (!channel || !channel->is_textual()) {
    co_return fail(Error::InvalidArgument);
  }
  auto json = co_await rest_.create_message(channel.id(), std::move(content));
  if (!json) {
    co_return fail(json.error());
  }
  auto message = factory_.parse_message(*json);
  if (!message) {
    log::warn("Created message in channel {} could not be parsed",
              channel.id());
    co_return fail(message.error());
  }
  co_return factory_.upgrade(std::move(*message));
}

} // namespace shardline
