#pragma once

#include "shardline/gateway/event.hpp"

#include <cstdint>
#include <string>

namespace shardline {
class Client;
}

namespace shardline::dispatch {

/// Describes where an event came from. Never owns mutable state.
struct EventContext {
  gateway::shard_id shard_id{0};
  /// Not owned.
  Client *client{nullptr};
  /// Empty for gateway-level events.
  std::string dispatch_name;
  std::int64_t sequence{0};
};

} // namespace shardline::dispatch
