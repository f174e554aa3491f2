#include "shardline/event/parser.hpp"

#include "shardline/util/log.hpp"

#include <algorithm>
#include <utility>

namespace shardline::event {

using models::Guild;
using models::StatefulGuild;

const std::array<EventParser::Route, 15> EventParser::kRoutes = {{
    {"READY", &EventParser::parse_ready},
    {"GUILD_CREATE", &EventParser::parse_guild_create},
    {"GUILD_DELETE", &EventParser::parse_guild_delete},
    {"MESSAGE_CREATE", &EventParser::parse_message_create},
    {"MESSAGE_UPDATE", &EventParser::parse_message_update},
    {"MESSAGE_DELETE", &EventParser::parse_message_delete},
    {"MESSAGE_DELETE_BULK", &EventParser::parse_message_delete_bulk},
    {"CHANNEL_CREATE", &EventParser::parse_channel_create},
    {"CHANNEL_UPDATE", &EventParser::parse_channel_update},
    {"CHANNEL_DELETE", &EventParser::parse_channel_delete},
    {"GUILD_MEMBER_ADD", &EventParser::parse_member_add},
    {"GUILD_MEMBER_REMOVE", &EventParser::parse_member_remove},
    {"GUILD_MEMBER_UPDATE", &EventParser::parse_member_update},
    {"GUILD_MEMBERS_CHUNK", &EventParser::parse_members_chunk},
    {"GUILD_EMOJIS_UPDATE", &EventParser::parse_emojis_update},
}};

auto EventParser::find_route(std::string_view event_name) noexcept
    -> const Route * {
  const auto *it = std::ranges::find(kRoutes, event_name, &Route::name);
  return it == kRoutes.end() ? nullptr : it;
}

auto EventParser::is_known(std::string_view event_name) noexcept -> bool {
  return find_route(event_name) != nullptr;
}

auto EventParser::parse(const gateway::GatewayDispatch &dispatch)
    -> std::vector<DispatchedEvent> {
  Out out;
  const auto *route = find_route(dispatch.event_name);
  if (!route) {
    log::info("shard {}: no parser for dispatch {}", dispatch.shard,
              dispatch.event_name);
    return out;
  }
  if (!dispatch.payload) {
    log::warn("shard {}: dispatch {} has no payload", dispatch.shard,
              dispatch.event_name);
    return out;
  }
  if (auto r = (this->*(route->handler))(dispatch.shard, *dispatch.payload,
                                         out);
      !r) {
    log::warn("shard {}: skipping malformed {} (seq {}): {}", dispatch.shard,
              dispatch.event_name, dispatch.sequence, r.error().message());
    out.clear();
  }
  return out;
}

auto EventParser::message_channel(Snowflake channel_id) const
    -> std::optional<models::StatefulChannel> {
  return cache_.channel(channel_id);
}

auto EventParser::optional_guild(const JsonValue &d) const
    -> std::optional<StatefulGuild> {
  if (auto gid = models::get_snowflake(d, "guild_id")) {
    return cache_.guild(*gid);
  }
  return std::nullopt;
}

auto EventParser::parse_ready(gateway::shard_id shard, const JsonValue &d,
                              Out &out) -> Result<void> {
  const auto *guilds = json::get_array(d, "guilds");
  if (!guilds) {
    return fail(Error::ParseError);
  }
  std::vector<Guild> stubs;
  stubs.reserve(guilds->size());
  for (const auto &g : *guilds) {
    auto stub = factory_.parse_guild(g);
    if (!stub) {
      return fail(stub.error());
    }
    stubs.push_back(std::move(*stub));
  }

  std::vector<Snowflake> ids;
  ids.reserve(stubs.size());
  for (auto &stub : stubs) {
    ids.push_back(stub.id);
    cache_.put_guild(factory_.upgrade(std::move(stub)));
  }
  if (const auto *self = json::get_object(d, "user")) {
    if (auto user = factory_.parse_user(*self)) {
      cache_.put_user(factory_.upgrade(std::move(*user)));
    }
  }

  out.emplace_back(Connected{});
  if (!cache_.startup_done(shard)) {
    if (ids.empty()) {
      cache_.mark_startup_done(shard);
      out.emplace_back(ShardReady{});
    } else {
      cache_.begin_streaming(shard, std::move(ids));
    }
  }
  return ok();
}

auto EventParser::parse_guild_create(gateway::shard_id shard,
                                     const JsonValue &d, Out &out)
    -> Result<void> {
  auto guild = factory_.parse_guild(d);
  if (!guild) {
    return fail(guild.error());
  }
  if (guild->unavailable) {
    log::debug("shard {}: guild {} created while unavailable", shard,
               guild->id);
    // An outage during startup retires the guild without streaming it; its
    // cached stub turns the later GUILD_CREATE into GuildAvailable.
    if (auto remaining = cache_.finish_streamed(shard, guild->id)) {
      if (!cache_.has_guild(guild->id)) {
        cache_.put_guild(factory_.upgrade(std::move(*guild)));
      }
      if (*remaining == 0) {
        out.emplace_back(ShardReady{});
      }
    }
    return ok();
  }

  const auto id = guild->id;
  auto channels = factory_.parse_guild_channels(d, id);
  const bool existed = cache_.has_guild(id);

  auto stateful = factory_.upgrade(std::move(*guild));
  for (const auto &[_, member] : stateful->members) {
    cache_.put_user(factory_.upgrade(member.user));
  }
  for (auto &channel : channels) {
    cache_.put_channel(factory_.upgrade(std::move(channel)));
  }
  cache_.put_guild(stateful);

  if (!existed) {
    out.emplace_back(GuildJoined{std::move(stateful)});
    return ok();
  }
  if (auto remaining = cache_.finish_streamed(shard, id)) {
    out.emplace_back(GuildStreamed{std::move(stateful)});
    if (*remaining == 0) {
      out.emplace_back(ShardReady{});
    }
    return ok();
  }
  out.emplace_back(GuildAvailable{std::move(stateful)});
  return ok();
}

auto EventParser::parse_guild_delete(gateway::shard_id shard,
                                     const JsonValue &d, Out & /*out*/)
    -> Result<void> {
  auto id = models::get_snowflake(d, "id");
  if (!id) {
    return fail(Error::ParseError);
  }
  // Outage: keep a stub so the guild's return reads as GuildAvailable.
  if (json::get_bool(d, "unavailable").value_or(false)) {
    cache_.put_guild(factory_.upgrade(Guild{.id = *id, .unavailable = true}));
    log::info("shard {}: guild {} became unavailable", shard, *id);
  } else if (auto removed = cache_.remove_guild(*id)) {
    for (auto cid : (*removed)->channel_ids) {
      (void)cache_.remove_channel(cid);
    }
    log::info("shard {}: left guild {}", shard, *id);
  }
  return ok();
}

auto EventParser::parse_message_create(gateway::shard_id /*shard*/,
                                       const JsonValue &d, Out &out)
    -> Result<void> {
  auto message = factory_.parse_message(d);
  if (!message) {
    return fail(message.error());
  }
  cache_.put_user(factory_.upgrade(message->author));
  auto channel = message_channel(message->channel_id);
  out.emplace_back(MessageCreate{.message = factory_.upgrade(std::move(*message)),
                                 .channel = std::move(channel)});
  return ok();
}

auto EventParser::parse_message_update(gateway::shard_id /*shard*/,
                                       const JsonValue &d, Out &out)
    -> Result<void> {
  auto message = factory_.parse_message(d);
  if (!message) {
    return fail(message.error());
  }
  auto channel = message_channel(message->channel_id);
  out.emplace_back(MessageUpdate{.message = factory_.upgrade(std::move(*message)),
                                 .channel = std::move(channel)});
  return ok();
}

auto EventParser::parse_message_delete(gateway::shard_id /*shard*/,
                                       const JsonValue &d, Out &out)
    -> Result<void> {
  auto id = models::get_snowflake(d, "id");
  auto channel_id = models::get_snowflake(d, "channel_id");
  if (!id || !channel_id) {
    return fail(Error::ParseError);
  }
  out.emplace_back(MessageDelete{.message_id = *id,
                                 .channel_id = *channel_id,
                                 .channel = message_channel(*channel_id),
                                 .guild = optional_guild(d)});
  return ok();
}

auto EventParser::parse_message_delete_bulk(gateway::shard_id /*shard*/,
                                            const JsonValue &d, Out &out)
    -> Result<void> {
  auto channel_id = models::get_snowflake(d, "channel_id");
  const auto *ids = json::get_array(d, "ids");
  if (!channel_id || !ids) {
    return fail(Error::ParseError);
  }
  std::vector<Snowflake> messages;
  messages.reserve(ids->size());
  for (const auto &raw : *ids) {
    auto id = models::parse_snowflake(raw);
    if (!id) {
      return fail(Error::ParseError);
    }
    messages.push_back(*id);
  }
  out.emplace_back(MessageBulkDelete{.messages = std::move(messages),
                                     .channel_id = *channel_id,
                                     .channel = message_channel(*channel_id),
                                     .guild = optional_guild(d)});
  return ok();
}

auto EventParser::parse_channel_create(gateway::shard_id /*shard*/,
                                       const JsonValue &d, Out &out)
    -> Result<void> {
  auto channel = factory_.parse_channel(d);
  if (!channel) {
    return fail(channel.error());
  }
  if (channel->guild_id) {
    const auto cid = channel->id;
    cache_.update_guild(*channel->guild_id, [&](const StatefulGuild &current) {
      auto raw = current.raw();
      if (std::ranges::find(raw.channel_ids, cid) == raw.channel_ids.end()) {
        raw.channel_ids.push_back(cid);
      }
      return factory_.upgrade(std::move(raw));
    });
  }
  auto stateful = factory_.upgrade(std::move(*channel));
  cache_.put_channel(stateful);
  out.emplace_back(ChannelCreate{std::move(stateful)});
  return ok();
}

auto EventParser::parse_channel_update(gateway::shard_id /*shard*/,
                                       const JsonValue &d, Out &out)
    -> Result<void> {
  auto channel = factory_.parse_channel(d);
  if (!channel) {
    return fail(channel.error());
  }
  auto stateful = factory_.upgrade(std::move(*channel));
  auto previous = cache_.put_channel(stateful);
  out.emplace_back(ChannelUpdate{.old_channel = std::move(previous),
                                 .new_channel = std::move(stateful)});
  return ok();
}

auto EventParser::parse_channel_delete(gateway::shard_id /*shard*/,
                                       const JsonValue &d, Out &out)
    -> Result<void> {
  auto channel = factory_.parse_channel(d);
  if (!channel) {
    return fail(channel.error());
  }
  if (channel->guild_id) {
    const auto cid = channel->id;
    cache_.update_guild(*channel->guild_id, [&](const StatefulGuild &current) {
      auto raw = current.raw();
      std::erase(raw.channel_ids, cid);
      return factory_.upgrade(std::move(raw));
    });
  }
  auto removed = cache_.remove_channel(channel->id);
  out.emplace_back(ChannelDelete{removed ? std::move(*removed)
                                         : factory_.upgrade(std::move(*channel))});
  return ok();
}

auto EventParser::parse_member_add(gateway::shard_id shard, const JsonValue &d,
                                   Out &out) -> Result<void> {
  auto guild_id = models::get_snowflake(d, "guild_id");
  if (!guild_id) {
    return fail(Error::ParseError);
  }
  auto member = factory_.parse_member(d, *guild_id);
  if (!member) {
    return fail(member.error());
  }

  auto [_, updated] =
      cache_.update_guild(*guild_id, [&](const StatefulGuild &current) {
        auto raw = current.raw();
        raw.members.insert_or_assign(member->id(), *member);
        ++raw.member_count;
        return factory_.upgrade(std::move(raw));
      });
  if (!updated) {
    log::debug("shard {}: member add for uncached guild {}", shard, *guild_id);
    return fail(Error::NotFound);
  }
  cache_.put_user(factory_.upgrade(member->user));
  out.emplace_back(
      GuildMemberAdd{.guild = std::move(*updated), .member = std::move(*member)});
  return ok();
}

auto EventParser::parse_member_remove(gateway::shard_id /*shard*/,
                                      const JsonValue &d, Out &out)
    -> Result<void> {
  auto guild_id = models::get_snowflake(d, "guild_id");
  const auto *user_json = json::get_object(d, "user");
  if (!guild_id || !user_json) {
    return fail(Error::ParseError);
  }
  auto user = factory_.parse_user(*user_json);
  if (!user) {
    return fail(user.error());
  }

  std::optional<models::Member> cached;
  const auto uid = user->id;
  auto [_, updated] =
      cache_.update_guild(*guild_id, [&](const StatefulGuild &current) {
        auto raw = current.raw();
        if (auto it = raw.members.find(uid); it != raw.members.end()) {
          cached = it->second;
          raw.members.erase(it);
        }
        raw.member_count = std::max<std::int64_t>(raw.member_count - 1, 0);
        return factory_.upgrade(std::move(raw));
      });
  out.emplace_back(GuildMemberRemove{.guild_id = *guild_id,
                                     .user = std::move(*user),
                                     .cached_member = std::move(cached),
                                     .guild = std::move(updated)});
  return ok();
}

auto EventParser::parse_member_update(gateway::shard_id /*shard*/,
                                      const JsonValue &d, Out &out)
    -> Result<void> {
  auto guild_id = models::get_snowflake(d, "guild_id");
  if (!guild_id) {
    return fail(Error::ParseError);
  }
  auto member = factory_.parse_member(d, *guild_id);
  if (!member) {
    return fail(member.error());
  }

  std::optional<models::Member> old_member;
  auto [_, updated] =
      cache_.update_guild(*guild_id, [&](const StatefulGuild &current) {
        auto raw = current.raw();
        if (auto it = raw.members.find(member->id()); it != raw.members.end()) {
          old_member = it->second;
        }
        raw.members.insert_or_assign(member->id(), *member);
        return factory_.upgrade(std::move(raw));
      });
  cache_.put_user(factory_.upgrade(member->user));
  out.emplace_back(GuildMemberUpdate{.old_member = std::move(old_member),
                                     .member = std::move(*member),
                                     .guild = std::move(updated)});
  return ok();
}

auto EventParser::parse_members_chunk(gateway::shard_id shard,
                                      const JsonValue &d, Out &out)
    -> Result<void> {
  auto guild_id = models::get_snowflake(d, "guild_id");
  const auto *members_json = json::get_array(d, "members");
  auto chunk_index = json::get_int(d, "chunk_index");
  auto chunk_count = json::get_int(d, "chunk_count");
  if (!guild_id || !members_json || !chunk_index || !chunk_count) {
    return fail(Error::ParseError);
  }
  if (!cache_.available_guild(*guild_id)) {
    log::warn("shard {}: member chunk for unknown guild {}", shard, *guild_id);
    out.emplace_back(InvalidGuildChunk{*guild_id});
    return ok();
  }

  std::vector<models::Member> members;
  members.reserve(members_json->size());
  for (const auto &m : *members_json) {
    auto member = factory_.parse_member(m, *guild_id);
    if (!member) {
      return fail(member.error());
    }
    members.push_back(std::move(*member));
  }

  auto [_, updated] =
      cache_.update_guild(*guild_id, [&](const StatefulGuild &current) {
        auto raw = current.raw();
        for (const auto &m : members) {
          raw.members.insert_or_assign(m.id(), m);
        }
        return factory_.upgrade(std::move(raw));
      });
  if (!updated) {
    out.emplace_back(InvalidGuildChunk{*guild_id});
    return ok();
  }
  for (const auto &m : members) {
    cache_.put_user(factory_.upgrade(m.user));
  }
  out.emplace_back(GuildMemberChunk{.guild = std::move(*updated),
                                    .members = std::move(members),
                                    .chunk_index = *chunk_index,
                                    .chunk_count = *chunk_count,
                                    .nonce = json::get_string(d, "nonce")});
  return ok();
}

auto EventParser::parse_emojis_update(gateway::shard_id shard,
                                      const JsonValue &d, Out &out)
    -> Result<void> {
  auto guild_id = models::get_snowflake(d, "guild_id");
  const auto *emojis_json = json::find(d, "emojis");
  if (!guild_id || !emojis_json || !emojis_json->is_array()) {
    return fail(Error::ParseError);
  }
  auto emojis = factory_.parse_emojis(*emojis_json);

  std::vector<models::CustomEmoji> previous;
  auto [_, updated] =
      cache_.update_guild(*guild_id, [&](const StatefulGuild &current) {
        auto raw = current.raw();
        previous = std::exchange(raw.emojis, emojis);
        return factory_.upgrade(std::move(raw));
      });
  if (!updated) {
    log::debug("shard {}: emoji update for uncached guild {}", shard,
               *guild_id);
    return fail(Error::NotFound);
  }
  out.emplace_back(GuildEmojiUpdate{.guild = std::move(*updated),
                                    .previous_emojis = std::move(previous),
                                    .new_emojis = std::move(emojis)});
  return ok();
}

} // namespace shardline::event
