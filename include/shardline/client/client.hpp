#pragma once

#include "shardline/cache/object_cache.hpp"
#include "shardline/config/config.hpp"
#include "shardline/core/coroutine.hpp"
#include "shardline/core/error.hpp"
#include "shardline/dispatch/dispatcher.hpp"
#include "shardline/event/chunker.hpp"
#include "shardline/event/parser.hpp"
#include "shardline/gateway/collection.hpp"
#include "shardline/gateway/connection.hpp"
#include "shardline/gateway/transport.hpp"
#include "shardline/http/rest_client.hpp"
#include "shardline/models/factory.hpp"
#include "shardline/models/stateful.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <optional>
#include <string>

namespace shardline {

/// Owns everything shared by the shards of one bot: REST access, the model
/// factory, the object cache and the event parser. Stateful models handed
/// to handlers point back here.
class Client {
public:
  Client(boost::asio::any_io_executor ex, ClientConfig cfg);
  ~Client();

  Client(const Client &) = delete;
  auto operator=(const Client &) -> Client & = delete;

  /// Resolves the gateway URL and shard count. With both a URL override and
  /// an explicit shard count configured no request is made.
  auto connect() -> task<Result<http::GatewayInfo>>;

  /// Requires a successful connect(). Shards are placed with `pick`.
  [[nodiscard]] auto
  make_collection(gateway::TransportFactory factory =
                      gateway::make_websocket_factory(),
                  gateway::ExecutorPicker pick = {})
      -> Result<std::unique_ptr<gateway::ShardCollection>>;

  /// Builds the dispatcher selected by the configuration, wired to the
  /// parser, this client and the chunker when chunking is enabled.
  [[nodiscard]] auto make_dispatcher()
      -> std::unique_ptr<dispatch::EventDispatcher>;

  /// Runs the shards, the dispatcher and the chunker together. Returns when
  /// the shards have stopped and the dispatcher has drained, with the first
  /// fatal shard error if there was one.
  auto run(gateway::ShardCollection &collection,
           dispatch::EventDispatcher &dispatcher) -> task<Result<void>>;

  /// Fails with InvalidArgument for a channel that cannot hold messages.
  auto send_message(const models::StatefulChannel &channel,
                    std::string content) -> task<Result<models::StatefulMessage>>;

  [[nodiscard]] static auto connection_config(const ClientConfig &cfg,
                                              std::string gateway_url)
      -> gateway::ConnectionConfig;

  [[nodiscard]] auto config() const noexcept -> const ClientConfig & {
    return cfg_;
  }
  [[nodiscard]] auto cache() noexcept -> cache::ObjectCache & { return cache_; }
  [[nodiscard]] auto factory() const noexcept -> const models::ModelFactory & {
    return factory_;
  }
  [[nodiscard]] auto parser() noexcept -> event::EventParser & {
    return parser_;
  }
  [[nodiscard]] auto rest() noexcept -> http::RestClient & { return rest_; }
  [[nodiscard]] auto chunker() noexcept -> event::GuildChunker * {
    return chunker_.get();
  }
  [[nodiscard]] auto gateway_info() const noexcept
      -> const std::optional<http::GatewayInfo> & {
    return gateway_info_;
  }

private:
  auto drive(gateway::ShardCollection &collection,
             dispatch::EventDispatcher &dispatcher) -> task<void>;

  boost::asio::any_io_executor ex_;
  ClientConfig cfg_;
  http::RestClient rest_;
  models::ModelFactory factory_;
  cache::ObjectCache cache_;
  event::EventParser parser_;
  std::unique_ptr<event::GuildChunker> chunker_;
  std::optional<http::GatewayInfo> gateway_info_;
};

} // namespace shardline
