#include "shardline/gateway/collection.hpp"

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>

#include <algorithm>
#include <exception>
#include <utility>

namespace shardline::gateway {

ShardCollection::ShardCollection(boost::asio::any_io_executor home,
                                 CollectionConfig cfg,
                                 TransportFactory factory, ExecutorPicker pick)
    : home_(std::move(home)),
      merged_(std::make_shared<IncomingChannel>(home_, cfg.merged_capacity)) {
  const auto count = std::max<std::uint32_t>(cfg.shard_count, 1);
  connections_.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    auto conn_cfg = cfg.connection;
    conn_cfg.identity = ShardIdentity{.id = i, .count = count};
    auto ex = pick ? pick() : home_;
    connections_.push_back(std::make_unique<GatewayConnection>(
        std::move(ex), std::move(conn_cfg), factory));
  }
  // Room for every completion so try_send from a handler never fails.
  join_ = std::make_shared<JoinChannel>(home_, 2 * connections_.size());
}

ShardCollection::~ShardCollection() = default;

auto ShardCollection::run() -> task<Result<void>> {
  if (std::exchange(started_, true)) {
    co_return fail(Error::InvalidState);
  }

  log::info("starting {} shard(s)", connections_.size());
  for (shard_id i = 0; i < connections_.size(); ++i) {
    auto &conn = *connections_[i];
    boost::asio::co_spawn(
        conn.executor(), conn.run(),
        [this, i](std::exception_ptr ep, Result<void> r) {
          ShardExit exit{.shard = i};
          if (ep) {
            exit.error = make_error_code(Error::Unknown);
          } else if (!r) {
            exit.error = r.error();
          }
          join_one(exit);
        });
    boost::asio::co_spawn(conn.executor(), forward(i),
                          [this, i](std::exception_ptr) {
                            join_one(ShardExit{.shard = i, .forwarder = true});
                          });
  }

  std::error_code first_fatal;
  std::size_t remaining = 2 * connections_.size();
  while (remaining > 0) {
    auto [ec, exit] = co_await join_->async_receive(use_nothrow);
    if (ec) {
      // Cancelled from outside: shut down and keep joining so no shard task
      // outlives this call.
      stop();
      co_await boost::asio::this_coro::reset_cancellation_state(
          boost::asio::disable_cancellation());
      continue;
    }
    --remaining;
    if (exit.forwarder || !exit.error) {
      continue;
    }
    log::error("shard {} stopped: {}", exit.shard, exit.error.message());
    if (!first_fatal) {
      first_fatal = exit.error;
      stop();
    }
  }

  merged_->close();
  log::info("all shards stopped");
  if (first_fatal) {
    co_return fail(first_fatal);
  }
  co_return ok();
}

auto ShardCollection::stop() -> void {
  if (stopping_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  for (auto &conn : connections_) {
    conn->stop();
  }
  // Unblock forwarders waiting on a consumer that is going away.
  merged_->cancel();
}

auto ShardCollection::send(shard_id shard, OutgoingGatewayEvent evt)
    -> task<Result<void>> {
  if (shard >= connections_.size()) {
    log::warn("send to shard {} rejected: only {} shard(s)", shard,
              connections_.size());
    co_return fail(Error::InvalidShard);
  }
  if (auto valid = validate_user_event(evt); !valid) {
    co_return valid;
  }
  co_return co_await connections_[shard]->submit(std::move(evt));
}

auto ShardCollection::send_routed(Snowflake entity_id,
                                  OutgoingGatewayEvent evt)
    -> task<Result<void>> {
  co_return co_await send(shard_for(entity_id), std::move(evt));
}

auto ShardCollection::forward(shard_id shard) -> task<void> {
  auto &source = connections_[shard]->events();
  for (;;) {
    auto [ec, evt] = co_await source.async_receive(use_nothrow);
    if (ec || stopping_.load(std::memory_order_acquire)) {
      co_return;
    }
    if (is_voidable(evt)) {
      (void)merged_->try_send(boost::system::error_code{}, std::move(evt));
      continue;
    }
    auto [send_ec] = co_await merged_->async_send(
        boost::system::error_code{}, std::move(evt), use_nothrow);
    if (send_ec) {
      co_return;
    }
  }
}

auto ShardCollection::join_one(ShardExit exit) -> void {
  if (!join_->try_send(boost::system::error_code{}, exit)) {
    log::error("shard {} exit could not be recorded", exit.shard);
  }
}

} // namespace shardline::gateway
