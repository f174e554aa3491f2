#pragma once

#include "shardline/models/stateful.hpp"
#include "shardline/util/snowflake.hpp"
#include "shardline/util/variant_index.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shardline::event {

/// A shard finished its handshake.
struct Connected {};

/// A shard streamed every guild announced in its READY.
struct ShardReady {};

/// Every shard is ready. Published once per dispatcher.
struct Ready {};

/// A guild arrived during startup streaming.
struct GuildStreamed {
  models::StatefulGuild guild;
};

/// The bot joined a guild outside startup.
struct GuildJoined {
  models::StatefulGuild guild;
};

/// A known guild came back, e.g. after an outage.
struct GuildAvailable {
  models::StatefulGuild guild;
};

/// A member chunk arrived for a guild that is not cached.
struct InvalidGuildChunk {
  Snowflake guild_id;
};

struct GuildMemberChunk {
  models::StatefulGuild guild;
  std::vector<models::Member> members;
  std::int64_t chunk_index{0};
  std::int64_t chunk_count{0};
  std::optional<std::string> nonce;
};

struct GuildMemberAdd {
  models::StatefulGuild guild;
  models::Member member;
};

struct GuildMemberRemove {
  Snowflake guild_id;
  models::User user;
  /// The member as it was cached, if it was.
  std::optional<models::Member> cached_member;
  std::optional<models::StatefulGuild> guild;
};

struct GuildMemberUpdate {
  std::optional<models::Member> old_member;
  models::Member member;
  std::optional<models::StatefulGuild> guild;
};

struct GuildEmojiUpdate {
  models::StatefulGuild guild;
  std::vector<models::CustomEmoji> previous_emojis;
  std::vector<models::CustomEmoji> new_emojis;
};

struct MessageCreate {
  models::StatefulMessage message;
  std::optional<models::StatefulChannel> channel;
};

/// Edits may arrive with a partial message.
struct MessageUpdate {
  models::StatefulMessage message;
  std::optional<models::StatefulChannel> channel;
};

struct MessageDelete {
  Snowflake message_id;
  Snowflake channel_id;
  std::optional<models::StatefulChannel> channel;
  std::optional<models::StatefulGuild> guild;
};

struct MessageBulkDelete {
  /// In the order the server listed them.
  std::vector<Snowflake> messages;
  Snowflake channel_id;
  std::optional<models::StatefulChannel> channel;
  std::optional<models::StatefulGuild> guild;

  /// One MessageDelete per id, so bulk and single deletions can share a
  /// handler.
  [[nodiscard]] auto as_single_events() const -> std::vector<MessageDelete> {
    std::vector<MessageDelete> out;
    out.reserve(messages.size());
    for (auto id : messages) {
      out.push_back(MessageDelete{.message_id = id,
                                  .channel_id = channel_id,
                                  .channel = channel,
                                  .guild = guild});
    }
    return out;
  }
};

struct ChannelCreate {
  models::StatefulChannel channel;
};

struct ChannelUpdate {
  std::optional<models::StatefulChannel> old_channel;
  models::StatefulChannel new_channel;
};

struct ChannelDelete {
  models::StatefulChannel channel;
};

using DispatchedEvent =
    std::variant<Connected, ShardReady, Ready, GuildStreamed, GuildJoined,
                 GuildAvailable, InvalidGuildChunk, GuildMemberChunk,
                 GuildMemberAdd, GuildMemberRemove, GuildMemberUpdate,
                 GuildEmojiUpdate, MessageCreate, MessageUpdate, MessageDelete,
                 MessageBulkDelete, ChannelCreate, ChannelUpdate,
                 ChannelDelete>;

inline constexpr std::array<std::string_view,
                            std::variant_size_v<DispatchedEvent>>
    kEventNames = {"Connected",         "ShardReady",
                   "Ready",             "GuildStreamed",
                   "GuildJoined",       "GuildAvailable",
                   "InvalidGuildChunk", "GuildMemberChunk",
                   "GuildMemberAdd",    "GuildMemberRemove",
                   "GuildMemberUpdate", "GuildEmojiUpdate",
                   "MessageCreate",     "MessageUpdate",
                   "MessageDelete",     "MessageBulkDelete",
                   "ChannelCreate",     "ChannelUpdate",
                   "ChannelDelete"};

template <typename E>
inline constexpr std::size_t kEventIndex =
    util::variant_index_v<E, DispatchedEvent>;

[[nodiscard]] inline auto event_type_name(const DispatchedEvent &evt) noexcept
    -> std::string_view {
  return kEventNames[evt.index()];
}

} // namespace shardline::event
