#pragma once

#include "shardline/core/error.hpp"
#include "shardline/util/json.hpp"
#include "shardline/util/snowflake.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace shardline::gateway {

using shard_id = std::uint32_t;

/// Fixed for the lifetime of a connection.
struct ShardIdentity {
  shard_id id{0};
  std::uint32_t count{1};

  auto operator==(const ShardIdentity &) const -> bool = default;
};

// Incoming events. Every alternative carries the shard that produced it.

struct GatewayHello {
  shard_id shard{0};
  std::chrono::milliseconds heartbeat_interval{0};
};

struct GatewayDispatch {
  shard_id shard{0};
  std::string event_name;
  std::int64_t sequence{0};
  /// Shared so fan-out copies do not deep-copy the payload.
  std::shared_ptr<const JsonValue> payload;
};

struct GatewayHeartbeatAck {
  shard_id shard{0};
  std::uint64_t heartbeat_ack_count{0};
};

struct GatewayInvalidateSession {
  shard_id shard{0};
  bool resumable{false};
};

struct GatewayReconnectRequested {
  shard_id shard{0};
};

struct GatewayHeartbeatSent {
  shard_id shard{0};
  std::uint64_t heartbeat_count{0};
  std::optional<std::int64_t> sequence;
};

using IncomingGatewayEvent =
    std::variant<GatewayHello, GatewayDispatch, GatewayHeartbeatAck,
                 GatewayInvalidateSession, GatewayReconnectRequested,
                 GatewayHeartbeatSent>;

/// Voidable events may be dropped when the consumer is behind; only
/// dispatches carry state the application cannot reconstruct.
[[nodiscard]] inline auto is_voidable(const IncomingGatewayEvent &evt) noexcept
    -> bool {
  return !std::holds_alternative<GatewayDispatch>(evt);
}

[[nodiscard]] inline auto shard_of(const IncomingGatewayEvent &evt) noexcept
    -> shard_id {
  return std::visit([](const auto &e) { return e.shard; }, evt);
}

[[nodiscard]] inline auto event_name(const IncomingGatewayEvent &evt)
    -> std::string_view {
  return std::visit(
      [](const auto &e) -> std::string_view {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, GatewayHello>)
          return "hello";
        else if constexpr (std::is_same_v<T, GatewayDispatch>)
          return e.event_name;
        else if constexpr (std::is_same_v<T, GatewayHeartbeatAck>)
          return "heartbeat_ack";
        else if constexpr (std::is_same_v<T, GatewayInvalidateSession>)
          return "invalidate_session";
        else if constexpr (std::is_same_v<T, GatewayReconnectRequested>)
          return "reconnect_requested";
        else
          return "heartbeat_sent";
      },
      evt);
}

// Outgoing events.

struct Identify {
  std::string token;
  ShardIdentity shard;
  std::uint64_t intents{0};
  std::uint32_t large_threshold{50};
};

struct Resume {
  std::string token;
  std::string session_id;
  std::int64_t sequence{0};
};

struct Heartbeat {
  std::optional<std::int64_t> sequence;
};

struct MemberChunkRequest {
  Snowflake guild_id;
  std::optional<std::string> query;
  std::optional<std::uint32_t> limit;
  bool presences{false};
  std::vector<Snowflake> user_ids;
  std::optional<std::string> nonce;

  /// Either a query or a user id list is required; a query needs a limit.
  [[nodiscard]] auto validate() const -> Result<void> {
    if (!query && user_ids.empty()) {
      return fail(Error::InvalidArgument);
    }
    if (query && !limit) {
      return fail(Error::InvalidArgument);
    }
    if (nonce && nonce->size() > 32) {
      return fail(Error::InvalidArgument);
    }
    return ok();
  }
};

using OutgoingGatewayEvent =
    std::variant<Identify, Resume, Heartbeat, MemberChunkRequest>;

/// Identify, Resume and Heartbeat are generated by the connection itself;
/// callers may not inject them.
[[nodiscard]] inline auto validate_user_event(const OutgoingGatewayEvent &evt)
    -> Result<void> {
  if (!std::holds_alternative<MemberChunkRequest>(evt)) {
    return fail(Error::InvalidArgument);
  }
  if (const auto *req = std::get_if<MemberChunkRequest>(&evt)) {
    return req->validate();
  }
  return ok();
}

using IncomingChannel = boost::asio::experimental::concurrent_channel<void(
    boost::system::error_code, IncomingGatewayEvent)>;
using OutgoingChannel = boost::asio::experimental::concurrent_channel<void(
    boost::system::error_code, OutgoingGatewayEvent)>;

} // namespace shardline::gateway
