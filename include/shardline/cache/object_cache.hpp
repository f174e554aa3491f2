#pragma once

#include "shardline/cache/striped_store.hpp"
#include "shardline/gateway/event.hpp"
#include "shardline/models/stateful.hpp"
#include "shardline/util/snowflake.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace shardline::cache {

/// Latest known state of guilds, channels and users, shared by all shards.
/// Entries are replaced whole; a wrapper fetched earlier is never patched.
class ObjectCache {
public:
  [[nodiscard]] auto guild(Snowflake id) const
      -> std::optional<models::StatefulGuild> {
    return guilds_.get(id);
  }
  /// Like guild(), but skips unavailable stubs.
  [[nodiscard]] auto available_guild(Snowflake id) const
      -> std::optional<models::StatefulGuild>;
  [[nodiscard]] auto has_guild(Snowflake id) const -> bool {
    return guilds_.contains(id);
  }
  auto put_guild(models::StatefulGuild guild)
      -> std::optional<models::StatefulGuild> {
    const auto id = guild.id();
    return guilds_.put(id, std::move(guild));
  }
  auto remove_guild(Snowflake id) -> std::optional<models::StatefulGuild> {
    return guilds_.erase(id);
  }
  /// Replace a guild with `fn(current)` under its key's write lock. Returns
  /// the previous and the new snapshot; both empty when it is not cached.
  template <typename F>
  auto update_guild(Snowflake id, F &&fn)
      -> std::pair<std::optional<models::StatefulGuild>,
                   std::optional<models::StatefulGuild>> {
    return guilds_.update(
        id,
        [&](const models::StatefulGuild *current)
            -> std::optional<models::StatefulGuild> {
          if (!current) {
            return std::nullopt;
          }
          return fn(*current);
        });
  }

  [[nodiscard]] auto channel(Snowflake id) const
      -> std::optional<models::StatefulChannel> {
    return channels_.get(id);
  }
  auto put_channel(models::StatefulChannel channel)
      -> std::optional<models::StatefulChannel> {
    const auto id = channel.id();
    return channels_.put(id, std::move(channel));
  }
  auto remove_channel(Snowflake id) -> std::optional<models::StatefulChannel> {
    return channels_.erase(id);
  }

  [[nodiscard]] auto user(Snowflake id) const
      -> std::optional<models::StatefulUser> {
    return users_.get(id);
  }
  auto put_user(models::StatefulUser user)
      -> std::optional<models::StatefulUser> {
    const auto id = user.id();
    return users_.put(id, std::move(user));
  }

  [[nodiscard]] auto guild_count() const -> std::size_t {
    return guilds_.size();
  }
  [[nodiscard]] auto channel_count() const -> std::size_t {
    return channels_.size();
  }
  [[nodiscard]] auto user_count() const -> std::size_t { return users_.size(); }
  [[nodiscard]] auto guilds() const -> std::vector<models::StatefulGuild> {
    return guilds_.values();
  }

  // Startup guild streaming, tracked per shard. READY announces the guilds
  // a shard will stream; each GUILD_CREATE for one of them retires it.

  /// No-op once the shard has finished its first startup.
  auto begin_streaming(gateway::shard_id shard, std::vector<Snowflake> pending)
      -> void;
  /// Remaining guild count if `guild` was pending on `shard`, otherwise
  /// nullopt. Reaching zero marks the shard's startup as done.
  auto finish_streamed(gateway::shard_id shard, Snowflake guild)
      -> std::optional<std::size_t>;
  [[nodiscard]] auto startup_done(gateway::shard_id shard) const -> bool;
  auto mark_startup_done(gateway::shard_id shard) -> void;

  auto clear() -> void;

private:
  struct ShardStartup {
    ankerl::unordered_dense::set<Snowflake> pending;
    bool done{false};
  };

  StripedStore<models::StatefulGuild> guilds_;
  StripedStore<models::StatefulChannel> channels_;
  StripedStore<models::StatefulUser> users_;

  mutable std::mutex startup_mutex_;
  ankerl::unordered_dense::map<gateway::shard_id, ShardStartup> startup_;
};

} // namespace shardline::cache
