#include "shardline/cache/object_cache.hpp"

#include "shardline/util/log.hpp"

namespace shardline::cache {

auto ObjectCache::available_guild(Snowflake id) const
    -> std::optional<models::StatefulGuild> {
  auto g = guilds_.get(id);
  if (!g || (*g)->unavailable) {
    return std::nullopt;
  }
  return g;
}

auto ObjectCache::begin_streaming(gateway::shard_id shard,
                                  std::vector<Snowflake> pending) -> void {
  std::lock_guard lock(startup_mutex_);
  auto &state = startup_[shard];
  if (state.done) {
    return;
  }
  state.pending.clear();
  state.pending.insert(pending.begin(), pending.end());
  log::debug("shard {}: streaming {} guild(s)", shard, state.pending.size());
}

auto ObjectCache::finish_streamed(gateway::shard_id shard, Snowflake guild)
    -> std::optional<std::size_t> {
  std::lock_guard lock(startup_mutex_);
  auto it = startup_.find(shard);
  if (it == startup_.end() || it->second.done ||
      it->second.pending.erase(guild) == 0) {
    return std::nullopt;
  }
  const auto remaining = it->second.pending.size();
  if (remaining == 0) {
    it->second.done = true;
  }
  return remaining;
}

auto ObjectCache::startup_done(gateway::shard_id shard) const -> bool {
  std::lock_guard lock(startup_mutex_);
  auto it = startup_.find(shard);
  return it != startup_.end() && it->second.done;
}

auto ObjectCache::mark_startup_done(gateway::shard_id shard) -> void {
  std::lock_guard lock(startup_mutex_);
  auto &state = startup_[shard];
  state.pending.clear();
  state.done = true;
}

auto ObjectCache::clear() -> void {
  guilds_.clear();
  channels_.clear();
  users_.clear();
  std::lock_guard lock(startup_mutex_);
  startup_.clear();
}

} // namespace shardline::cache
