#pragma once

#include "shardline/core/coroutine.hpp"
#include "shardline/event/model.hpp"
#include "shardline/gateway/collection.hpp"
#include "shardline/gateway/event.hpp"
#include "shardline/util/async_event.hpp"
#include "shardline/util/snowflake.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace shardline::event {

/// Requests the full member list of every large guild once, and tracks
/// which guilds have received all their chunks.
class GuildChunker {
public:
  explicit GuildChunker(boost::asio::any_io_executor ex,
                        std::size_t queue_capacity = 1024);

  /// Feed every parsed event; only guild arrivals and member chunks matter.
  auto observe(gateway::shard_id shard, const DispatchedEvent &evt) -> void;

  auto handle_guild(gateway::shard_id shard, const models::Guild &guild)
      -> void;
  auto handle_member_chunk(const GuildMemberChunk &chunk) -> void;

  [[nodiscard]] auto is_tracked(Snowflake guild_id) const -> bool;
  /// Small guilds count as chunked as soon as they are seen.
  [[nodiscard]] auto is_fully_chunked(Snowflake guild_id) const -> bool;

  /// Completes once every chunk of the guild has arrived. NotFound for a
  /// guild that has not been seen. Must be awaited on the chunker's
  /// executor.
  auto wait_for_guild(Snowflake guild_id) -> task<Result<void>>;

  /// Sends queued requests through `collection` until stop().
  auto run(gateway::ShardCollection &collection) -> task<void>;
  auto stop() -> void { pending_.close(); }

private:
  struct PendingRequest {
    gateway::shard_id shard{0};
    gateway::MemberChunkRequest request;
  };
  struct Progress {
    std::int64_t chunk_count{-1};
    ankerl::unordered_dense::set<std::int64_t> received;
    bool done{false};
    // Shared so waiters survive a rehash of guilds_.
    std::shared_ptr<AsyncEvent> completed;
  };

  auto track(Snowflake guild_id) -> Progress &;
  auto mark_done(Snowflake guild_id, Progress &progress) -> void;

  boost::asio::any_io_executor ex_;

  boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code, PendingRequest)>
      pending_;
  mutable std::mutex mutex_;
  ankerl::unordered_dense::map<Snowflake, Progress> guilds_;
};

} // namespace shardline::event
