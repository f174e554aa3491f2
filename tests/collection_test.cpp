#include "shardline/gateway/collection.hpp"

#include "mock_gateway.hpp"
#include "test_utils.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/io_context.hpp>

#include "gtest/gtest.h"

#include <chrono>
#include <set>
#include <vector>

using namespace shardline;
using namespace shardline::gateway;
using namespace shardline::test;
using namespace boost::asio::experimental::awaitable_operators;
using namespace std::chrono_literals;

namespace {

auto test_config(std::uint32_t shards) -> CollectionConfig {
  CollectionConfig cfg;
  cfg.shard_count = shards;
  cfg.connection.token = "token";
  cfg.connection.gateway_url = "wss://gateway.test";
  cfg.connection.connect_timeout = 1s;
  cfg.connection.hello_timeout = 1s;
  cfg.connection.backoff = ExponentialBackoff::Config{
      .min_delay = 1ms, .max_delay = 5ms, .multiplier = 2.0, .jitter = 0.0};
  cfg.connection.first_heartbeat_jitter = [] { return 0.0; };
  return cfg;
}

// Shard index announced in the socket's Identify, or -1.
auto identified_shard(const ScriptedSocket &socket) -> std::int64_t {
  auto identify = socket.frames_with_op(2);
  if (identify.empty()) {
    return -1;
  }
  const auto *d = json::get_object(identify.front(), "d");
  const auto *shard = d ? json::get_array(*d, "shard") : nullptr;
  if (!shard || shard->empty()) {
    return -1;
  }
  return json::as_int(shard->front()).value_or(-1);
}

auto drain(ShardCollection &shards, std::vector<IncomingGatewayEvent> &out)
    -> task<void> {
  for (;;) {
    auto [ec, evt] = co_await shards.events().async_receive(use_nothrow);
    if (ec) {
      co_return;
    }
    out.push_back(std::move(evt));
  }
}

auto all_steady(ShardCollection &shards) -> bool {
  for (shard_id i = 0; i < shards.shard_count(); ++i) {
    if (shards.connection(i).state() != ConnectionState::SteadyState) {
      return false;
    }
  }
  return true;
}

} // namespace

TEST(CollectionTest, RoutesByEntityId) {
  boost::asio::io_context io;
  ScriptedGateway gw;
  gw.on_create = [](ScriptedSocket &s) {
    s.push_text(frames::hello(41250));
    s.push_text(frames::ready("sess", 1));
    s.on_send = auto_ack;
  };
  ShardCollection shards(io.get_executor(), test_config(2), gw.factory());
  std::vector<IncomingGatewayEvent> seen;

  EXPECT_EQ(shards.shard_for(Snowflake{4}), 0u);
  EXPECT_EQ(shards.shard_for(Snowflake{5}), 1u);

  auto script = [&]() -> task<void> {
    EXPECT_TRUE(co_await wait_until([&] { return all_steady(shards); }, 1s));

    auto routed = co_await shards.send_routed(
        Snowflake{5}, MemberChunkRequest{.guild_id = Snowflake{5},
                                         .query = "",
                                         .limit = 0});
    EXPECT_TRUE(routed.has_value());
    EXPECT_TRUE(co_await wait_until(
        [&] {
          for (const auto &s : gw.sockets) {
            if (!s->frames_with_op(8).empty()) {
              return true;
            }
          }
          return false;
        },
        1s));
    for (const auto &s : gw.sockets) {
      const bool owner = identified_shard(*s) == 1;
      EXPECT_EQ(s->frames_with_op(8).size(), owner ? 1u : 0u);
    }

    auto rejected = co_await shards.send(
        2, MemberChunkRequest{.guild_id = Snowflake{5}, .query = "", .limit = 0});
    EXPECT_FALSE(rejected.has_value());
    if (!rejected) {
      EXPECT_EQ(rejected.error(), Error::InvalidShard);
    }

    auto invalid = co_await shards.send(0, MemberChunkRequest{.guild_id = Snowflake{4}});
    EXPECT_FALSE(invalid.has_value());
    shards.stop();
  };
  auto scenario = [&]() -> task<Result<void>> {
    co_return co_await (shards.run() && script() && drain(shards, seen));
  };

  EXPECT_TRUE(run_on(io, scenario()).has_value());
  EXPECT_EQ(gw.sockets.size(), 2u);
  std::size_t chunk_frames = 0;
  for (const auto &s : gw.sockets) {
    chunk_frames += s->frames_with_op(8).size();
  }
  EXPECT_EQ(chunk_frames, 1u);
}

TEST(CollectionTest, MergesEventsFromEveryShard) {
  boost::asio::io_context io;
  ScriptedGateway gw;
  gw.on_create = [](ScriptedSocket &s) {
    s.push_text(frames::hello(41250));
    s.push_text(frames::ready("sess", 1));
    s.push_text(frames::dispatch("MESSAGE_CREATE", 2, "{}"));
    s.on_send = auto_ack;
  };
  ShardCollection shards(io.get_executor(), test_config(3), gw.factory());
  std::vector<IncomingGatewayEvent> seen;

  auto script = [&]() -> task<void> {
    EXPECT_TRUE(co_await wait_until(
        [&] {
          std::size_t dispatches = 0;
          for (const auto &evt : seen) {
            dispatches += std::holds_alternative<GatewayDispatch>(evt) ? 1 : 0;
          }
          return dispatches == 6;
        },
        1s));
    shards.stop();
  };
  auto scenario = [&]() -> task<Result<void>> {
    co_return co_await (shards.run() && script() && drain(shards, seen));
  };
  EXPECT_TRUE(run_on(io, scenario()).has_value());

  std::set<shard_id> ready_from;
  std::vector<std::int64_t> per_shard_last(3, 0);
  for (const auto &evt : seen) {
    const auto *d = std::get_if<GatewayDispatch>(&evt);
    if (!d) {
      continue;
    }
    // Per-shard order is preserved through the merge.
    EXPECT_GT(d->sequence, per_shard_last[d->shard]);
    per_shard_last[d->shard] = d->sequence;
    if (d->event_name == "READY") {
      ready_from.insert(d->shard);
    }
  }
  EXPECT_EQ(ready_from, (std::set<shard_id>{0, 1, 2}));
}

TEST(CollectionTest, FatalShardStopsTheRest) {
  boost::asio::io_context io;
  ScriptedGateway gw;
  gw.on_create = [&gw](ScriptedSocket &s) {
    s.push_text(frames::hello(41250));
    s.on_send = auto_ack;
    if (gw.sockets.size() == 2) {
      s.push_close(4014);
    } else {
      s.push_text(frames::ready("sess", 1));
    }
  };
  ShardCollection shards(io.get_executor(), test_config(2), gw.factory());
  std::vector<IncomingGatewayEvent> seen;

  auto scenario = [&]() -> task<Result<void>> {
    co_return co_await (shards.run() && drain(shards, seen));
  };
  auto result = run_on(io, scenario());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::DisallowedIntents);
  EXPECT_EQ(shards.connection(0).state(), ConnectionState::Closed);
  EXPECT_EQ(shards.connection(1).state(), ConnectionState::Closed);
}

TEST(CollectionTest, RunTwiceIsRejected) {
  boost::asio::io_context io;
  ScriptedGateway gw;
  gw.on_create = [](ScriptedSocket &s) { s.push_text(frames::hello(41250)); };
  ShardCollection shards(io.get_executor(), test_config(1), gw.factory());
  std::vector<IncomingGatewayEvent> seen;

  auto script = [&]() -> task<void> {
    auto second = co_await shards.run();
    EXPECT_FALSE(second.has_value());
    EXPECT_EQ(second.error(), Error::InvalidState);
    shards.stop();
  };
  auto scenario = [&]() -> task<Result<void>> {
    co_return co_await (shards.run() && script() && drain(shards, seen));
  };
  EXPECT_TRUE(run_on(io, scenario()).has_value());
}
