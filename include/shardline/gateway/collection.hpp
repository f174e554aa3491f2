#pragma once

#include "shardline/core/coroutine.hpp"
#include "shardline/core/error.hpp"
#include "shardline/gateway/connection.hpp"
#include "shardline/gateway/event.hpp"
#include "shardline/gateway/transport.hpp"
#include "shardline/util/snowflake.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <system_error>
#include <vector>

namespace shardline::gateway {

struct CollectionConfig {
  /// Template for every shard; the identity is filled in per shard.
  ConnectionConfig connection;
  std::uint32_t shard_count{1};
  std::size_t merged_capacity{64};
};

/// Chooses the executor a shard's connection lives on.
using ExecutorPicker = std::function<boost::asio::any_io_executor()>;

/// All shards of one bot. Merges their incoming events into one stream and
/// routes outgoing events to the owning shard.
class ShardCollection {
public:
  /// Shards run on executors from `pick`, or on `home` when it is empty.
  ShardCollection(boost::asio::any_io_executor home, CollectionConfig cfg,
                  TransportFactory factory, ExecutorPicker pick = {});
  ~ShardCollection();

  ShardCollection(const ShardCollection &) = delete;
  auto operator=(const ShardCollection &) -> ShardCollection & = delete;

  /// Runs every shard until all have exited. The first fatal shard error
  /// stops the others and is returned. The merged stream is closed last.
  auto run() -> task<Result<void>>;

  /// Thread-safe and idempotent.
  auto stop() -> void;

  /// Queue an event on a shard. Fails with InvalidShard for an out-of-range
  /// index and InvalidArgument for an invalid event, without sending.
  auto send(shard_id shard, OutgoingGatewayEvent evt) -> task<Result<void>>;

  /// Queue an event on the shard responsible for `entity_id`.
  auto send_routed(Snowflake entity_id, OutgoingGatewayEvent evt)
      -> task<Result<void>>;

  [[nodiscard]] auto shard_for(Snowflake entity_id) const noexcept
      -> shard_id {
    return static_cast<shard_id>(entity_id.value() % shard_count());
  }

  [[nodiscard]] auto events() noexcept -> IncomingChannel & { return *merged_; }
  [[nodiscard]] auto shard_count() const noexcept -> std::uint32_t {
    return static_cast<std::uint32_t>(connections_.size());
  }
  [[nodiscard]] auto connection(shard_id shard) -> GatewayConnection & {
    return *connections_.at(shard);
  }

private:
  struct ShardExit {
    shard_id shard{0};
    bool forwarder{false};
    std::error_code error;
  };
  using JoinChannel = boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code, ShardExit)>;

  auto forward(shard_id shard) -> task<void>;
  auto join_one(ShardExit exit) -> void;

  boost::asio::any_io_executor home_;
  std::vector<std::unique_ptr<GatewayConnection>> connections_;
  std::shared_ptr<IncomingChannel> merged_;
  std::shared_ptr<JoinChannel> join_;
  std::atomic<bool> stopping_{false};
  bool started_{false};
};

} // namespace shardline::gateway
