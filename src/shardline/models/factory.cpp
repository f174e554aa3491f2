#include "shardline/models/factory.hpp"

#include "shardline/util/log.hpp"

#include <string>
#include <utility>
#include <variant>

namespace shardline::models {

namespace {

[[nodiscard]] auto get_string_or(const JsonValue &obj, std::string_view key,
                                 std::string fallback = {}) -> std::string {
  return json::get_string(obj, key).value_or(std::move(fallback));
}

} // namespace

auto parse_snowflake(const JsonValue &value) -> std::optional<Snowflake> {
  if (const auto *s = std::get_if<std::string>(&value.data)) {
    if (auto id = Snowflake::parse(*s)) {
      return *id;
    }
    return std::nullopt;
  }
  if (auto n = json::as_int(value); n && *n >= 0) {
    return Snowflake{static_cast<std::uint64_t>(*n)};
  }
  return std::nullopt;
}

auto get_snowflake(const JsonValue &obj, std::string_view key)
    -> std::optional<Snowflake> {
  const auto *v = json::find(obj, key);
  return v ? parse_snowflake(*v) : std::nullopt;
}

auto get_snowflakes(const JsonValue &obj, std::string_view key)
    -> std::vector<Snowflake> {
  std::vector<Snowflake> out;
  const auto *arr = json::get_array(obj, key);
  if (!arr) {
    return out;
  }
  out.reserve(arr->size());
  for (const auto &item : *arr) {
    if (auto id = parse_snowflake(item)) {
      out.push_back(*id);
    }
  }
  return out;
}

auto ModelFactory::parse_user(const JsonValue &json) const -> Result<User> {
  auto id = get_snowflake(json, "id");
  auto username = json::get_string(json, "username");
  if (!id || !username) {
    return fail(Error::ParseError);
  }
  User user{.id = *id, .username = std::move(*username)};
  user.discriminator = get_string_or(json, "discriminator", "0");
  user.global_name = json::get_string(json, "global_name");
  user.avatar = json::get_string(json, "avatar");
  user.bot = json::get_bool(json, "bot").value_or(false);
  user.system = json::get_bool(json, "system").value_or(false);
  return user;
}

auto ModelFactory::parse_member(const JsonValue &json,
                                std::optional<Snowflake> guild_id) const
    -> Result<Member> {
  const auto *user_json = json::get_object(json, "user");
  if (!user_json) {
    return fail(Error::ParseError);
  }
  auto user = parse_user(*user_json);
  if (!user) {
    return fail(user.error());
  }
  Member member{.user = std::move(*user)};
  member.nick = json::get_string(json, "nick");
  member.roles = get_snowflakes(json, "roles");
  member.joined_at = get_string_or(json, "joined_at");
  member.guild_id = guild_id ? guild_id : get_snowflake(json, "guild_id");
  return member;
}

auto ModelFactory::parse_emoji(const JsonValue &json) const
    -> Result<CustomEmoji> {
  auto id = get_snowflake(json, "id");
  if (!id) {
    // Unicode emoji have no id and are not custom.
    return fail(Error::ParseError);
  }
  return CustomEmoji{.id = *id,
                     .name = get_string_or(json, "name"),
                     .animated = json::get_bool(json, "animated").value_or(false)};
}

auto ModelFactory::parse_emojis(const JsonValue &array) const
    -> std::vector<CustomEmoji> {
  std::vector<CustomEmoji> out;
  const auto *items = std::get_if<JsonValue::array_t>(&array.data);
  if (!items) {
    return out;
  }
  out.reserve(items->size());
  for (const auto &item : *items) {
    if (auto emoji = parse_emoji(item)) {
      out.push_back(std::move(*emoji));
    }
  }
  return out;
}

auto ModelFactory::parse_channel(const JsonValue &json) const
    -> Result<Channel> {
  auto id = get_snowflake(json, "id");
  auto raw_type = json::get_int(json, "type");
  if (!id || !raw_type) {
    return fail(Error::ParseError);
  }

  Channel channel{.id = *id, .kind = channel_kind_from_wire(*raw_type)};
  channel.name = json::get_string(json, "name");
  channel.guild_id = get_snowflake(json, "guild_id");
  channel.position = json::get_int(json, "position").value_or(0);
  const auto parent = get_snowflake(json, "parent_id");

  switch (channel.kind) {
  case ChannelKind::Text:
    channel.payload = TextChannel{
        .topic = json::get_string(json, "topic"),
        .nsfw = json::get_bool(json, "nsfw").value_or(false),
        .parent_id = parent};
    break;
  case ChannelKind::Voice:
    channel.payload =
        VoiceChannel{.bitrate = json::get_int(json, "bitrate").value_or(0),
                     .user_limit = json::get_int(json, "user_limit").value_or(0),
                     .parent_id = parent};
    break;
  case ChannelKind::Category:
    channel.payload = CategoryChannel{};
    break;
  case ChannelKind::Direct: {
    DirectChannel direct;
    if (const auto *recipients = json::get_array(json, "recipients")) {
      for (const auto &r : *recipients) {
        if (auto user = parse_user(r)) {
          direct.recipients.push_back(std::move(*user));
        }
      }
    }
    channel.payload = std::move(direct);
    break;
  }
  case ChannelKind::Unsupported:
    channel.payload =
        UnsupportedChannel{.raw_type = *raw_type, .parent_id = parent};
    break;
  }
  return channel;
}

auto ModelFactory::parse_guild(const JsonValue &json) const -> Result<Guild> {
  auto id = get_snowflake(json, "id");
  if (!id) {
    return fail(Error::ParseError);
  }

  Guild guild{.id = *id};
  guild.unavailable = json::get_bool(json, "unavailable").value_or(false);
  if (guild.unavailable) {
    return guild;
  }

  auto name = json::get_string(json, "name");
  if (!name) {
    return fail(Error::ParseError);
  }
  guild.name = std::move(*name);
  guild.icon = json::get_string(json, "icon");
  guild.large = json::get_bool(json, "large").value_or(false);
  guild.member_count = json::get_int(json, "member_count").value_or(0);

  if (const auto *channels = json::get_array(json, "channels")) {
    guild.channel_ids.reserve(channels->size());
    for (const auto &c : *channels) {
      if (auto cid = get_snowflake(c, "id")) {
        guild.channel_ids.push_back(*cid);
      }
    }
  }
  if (const auto *members = json::get_array(json, "members")) {
    for (const auto &m : *members) {
      if (auto member = parse_member(m, guild.id)) {
        auto uid = member->id();
        guild.members.insert_or_assign(uid, std::move(*member));
      } else {
        log::debug("guild {}: skipping malformed member", guild.id);
      }
    }
  }
  if (const auto *emojis = json::find(json, "emojis")) {
    guild.emojis = parse_emojis(*emojis);
  }
  return guild;
}

auto ModelFactory::parse_guild_channels(const JsonValue &json,
                                        Snowflake guild_id) const
    -> std::vector<Channel> {
  std::vector<Channel> out;
  const auto *channels = json::get_array(json, "channels");
  if (!channels) {
    return out;
  }
  out.reserve(channels->size());
  for (const auto &c : *channels) {
    auto channel = parse_channel(c);
    if (!channel) {
      log::debug("guild {}: skipping malformed channel", guild_id);
      continue;
    }
    // Nested guild channels omit their guild_id.
    channel->guild_id = guild_id;
    out.push_back(std::move(*channel));
  }
  return out;
}

auto ModelFactory::parse_message(const JsonValue &json) const
    -> Result<Message> {
  auto id = get_snowflake(json, "id");
  auto channel_id = get_snowflake(json, "channel_id");
  const auto *author_json = json::get_object(json, "author");
  if (!id || !channel_id || !author_json) {
    return fail(Error::ParseError);
  }
  auto author = parse_user(*author_json);
  if (!author) {
    return fail(author.error());
  }

  Message message{.id = *id, .channel_id = *channel_id};
  message.guild_id = get_snowflake(json, "guild_id");
  message.author = std::move(*author);
  message.content = get_string_or(json, "content");
  message.timestamp = get_string_or(json, "timestamp");
  message.edited_timestamp = json::get_string(json, "edited_timestamp");

  // Message members omit the user; it is the author.
  if (const auto *member_json = json::get_object(json, "member")) {
    Member member{.user = message.author};
    member.nick = json::get_string(*member_json, "nick");
    member.roles = get_snowflakes(*member_json, "roles");
    member.joined_at = get_string_or(*member_json, "joined_at");
    member.guild_id = message.guild_id;
    message.member = std::move(member);
  }
  if (const auto *mentions = json::get_array(json, "mentions")) {
    for (const auto &m : *mentions) {
      if (auto uid = get_snowflake(m, "id")) {
        message.mention_ids.push_back(*uid);
      }
    }
  }
  return message;
}

} // namespace shardline::models
