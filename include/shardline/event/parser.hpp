#pragma once

#include "shardline/cache/object_cache.hpp"
#include "shardline/core/error.hpp"
#include "shardline/event/model.hpp"
#include "shardline/gateway/event.hpp"
#include "shardline/models/factory.hpp"
#include "shardline/util/json.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace shardline::event {

/// Turns dispatches into domain events, updating the cache as it goes.
///
/// Holds no state of its own; everything that must survive between
/// dispatches lives in the ObjectCache. Unknown dispatch names produce no
/// events. A malformed payload is logged and produces no events and no
/// cache changes.
class EventParser {
public:
  EventParser(cache::ObjectCache &cache, const models::ModelFactory &factory)
      : cache_(cache), factory_(factory) {}

  [[nodiscard]] auto parse(const gateway::GatewayDispatch &dispatch)
      -> std::vector<DispatchedEvent>;

  [[nodiscard]] static auto is_known(std::string_view event_name) noexcept
      -> bool;

private:
  using Out = std::vector<DispatchedEvent>;
  using Handler = auto (EventParser::*)(gateway::shard_id, const JsonValue &,
                                        Out &) -> Result<void>;
  struct Route {
    std::string_view name;
    Handler handler;
  };

  [[nodiscard]] static auto find_route(std::string_view event_name) noexcept
      -> const Route *;

  auto parse_ready(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_guild_create(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_guild_delete(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_message_create(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_message_update(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_message_delete(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_message_delete_bulk(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_channel_create(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_channel_update(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_channel_delete(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_member_add(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_member_remove(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_member_update(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_members_chunk(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;
  auto parse_emojis_update(gateway::shard_id, const JsonValue &, Out &)
      -> Result<void>;

  [[nodiscard]] auto message_channel(Snowflake channel_id) const
      -> std::optional<models::StatefulChannel>;
  [[nodiscard]] auto optional_guild(const JsonValue &d) const
      -> std::optional<models::StatefulGuild>;

  cache::ObjectCache &cache_;
  const models::ModelFactory &factory_;

  static const std::array<Route, 15> kRoutes;
};

} // namespace shardline::event
