#include "shardline/event/chunker.hpp"

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/util/log.hpp"

#include <boost/asio/post.hpp>

#include <utility>

namespace shardline::event {

GuildChunker::GuildChunker(boost::asio::any_io_executor ex,
                           std::size_t queue_capacity)
    : ex_(ex), pending_(std::move(ex), queue_capacity) {}

auto GuildChunker::track(Snowflake guild_id) -> Progress & {
  auto [it, inserted] = guilds_.try_emplace(guild_id);
  if (inserted) {
    it->second.completed = std::make_shared<AsyncEvent>(ex_);
  }
  return it->second;
}

auto GuildChunker::mark_done(Snowflake guild_id, Progress &progress) -> void {
  if (progress.done) {
    return;
  }
  progress.done = true;
  log::debug("guild {} is fully chunked", guild_id);
  boost::asio::post(ex_, [event = progress.completed] { event->set(); });
}

auto GuildChunker::observe(gateway::shard_id shard, const DispatchedEvent &evt)
    -> void {
  if (const auto *joined = std::get_if<GuildJoined>(&evt)) {
    handle_guild(shard, joined->guild.raw());
  } else if (const auto *streamed = std::get_if<GuildStreamed>(&evt)) {
    handle_guild(shard, streamed->guild.raw());
  } else if (const auto *chunk = std::get_if<GuildMemberChunk>(&evt)) {
    handle_member_chunk(*chunk);
  }
}

auto GuildChunker::handle_guild(gateway::shard_id shard,
                                const models::Guild &guild) -> void {
  {
    std::lock_guard lock(mutex_);
    if (guilds_.contains(guild.id)) {
      return;
    }
    auto &progress = track(guild.id);
    if (!guild.large) {
      mark_done(guild.id, progress);
      return;
    }
  }

  log::debug("guild {} is large, requesting members on shard {}", guild.id,
             shard);
  PendingRequest pending{
      .shard = shard,
      .request = gateway::MemberChunkRequest{.guild_id = guild.id,
                                             .query = std::string{},
                                             .limit = 0}};
  if (!pending_.try_send(boost::system::error_code{}, std::move(pending))) {
    log::warn("member request queue full, guild {} will not be chunked",
              guild.id);
  }
}

auto GuildChunker::handle_member_chunk(const GuildMemberChunk &chunk) -> void {
  const auto id = chunk.guild.id();
  log::debug("received chunk {}/{} for guild {}", chunk.chunk_index + 1,
             chunk.chunk_count, id);

  if (chunk.chunk_count <= 0 || chunk.chunk_index < 0 ||
      chunk.chunk_index >= chunk.chunk_count) {
    log::warn("ignoring chunk {} of {} for guild {}", chunk.chunk_index,
              chunk.chunk_count, id);
    return;
  }

  std::lock_guard lock(mutex_);
  auto &progress = track(id);
  if (progress.chunk_count != chunk.chunk_count) {
    if (!progress.received.empty()) {
      log::warn("guild {} chunk count changed from {} to {}, restarting", id,
                progress.chunk_count, chunk.chunk_count);
    }
    progress.chunk_count = chunk.chunk_count;
    progress.received.clear();
  }
  progress.received.insert(chunk.chunk_index);
  if (static_cast<std::int64_t>(progress.received.size()) ==
      progress.chunk_count) {
    mark_done(id, progress);
  }
}

auto GuildChunker::is_tracked(Snowflake guild_id) const -> bool {
  std::lock_guard lock(mutex_);
  return guilds_.contains(guild_id);
}

auto GuildChunker::is_fully_chunked(Snowflake guild_id) const -> bool {
  std::lock_guard lock(mutex_);
  auto it = guilds_.find(guild_id);
  return it != guilds_.end() && it->second.done;
}

auto GuildChunker::wait_for_guild(Snowflake guild_id) -> task<Result<void>> {
  std::shared_ptr<AsyncEvent> completed;
  {
    std::lock_guard lock(mutex_);
    auto it = guilds_.find(guild_id);
    if (it == guilds_.end()) {
      co_return fail(Error::NotFound);
    }
    completed = it->second.completed;
  }
  co_return co_await completed->wait();
}

auto GuildChunker::run(gateway::ShardCollection &collection) -> task<void> {
  for (;;) {
    auto [ec, pending] = co_await pending_.async_receive(use_nothrow);
    if (ec) {
      co_return;
    }
    auto sent = co_await collection.send(pending.shard,
                                         std::move(pending.request));
    if (!sent) {
      log::warn("member request on shard {} failed: {}", pending.shard,
                sent.error().message());
    }
  }
}

} // namespace shardline::event
