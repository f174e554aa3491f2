#pragma once

#include "shardline/core/coroutine.hpp"
#include "shardline/core/error.hpp"
#include "shardline/dispatch/context.hpp"
#include "shardline/dispatch/handler_registry.hpp"
#include "shardline/event/chunker.hpp"
#include "shardline/event/model.hpp"
#include "shardline/event/parser.hpp"
#include "shardline/gateway/event.hpp"
#include "shardline/util/async_event.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace shardline::dispatch {

/// Pulls the merged gateway stream, parses dispatches and hands the
/// resulting events to handlers. Subclasses decide how handlers run.
///
/// Gateway-level handlers run inline, one at a time, before the next event
/// is read. Domain events go through deliver(); when it suspends, the pull
/// loop suspends, and so does every shard feeding it.
class EventDispatcher {
public:
  EventDispatcher(boost::asio::any_io_executor ex, event::EventParser &parser,
                  Client *client = nullptr,
                  event::GuildChunker *chunker = nullptr);
  virtual ~EventDispatcher();

  EventDispatcher(const EventDispatcher &) = delete;
  auto operator=(const EventDispatcher &) -> EventDispatcher & = delete;

  template <typename E, typename F>
  auto on(std::string name, F fn, std::size_t channel_capacity = 0) -> void {
    registry_.on<E>(std::move(name), std::move(fn), channel_capacity);
  }

  template <typename G, typename F>
  auto on_gateway(std::string name, F fn) -> void {
    registry_.on_gateway<G>(std::move(name), std::move(fn));
  }

  /// Runs until `source` is closed or stop() is called, then shuts down and
  /// waits for every in-flight handler. Must be awaited on the dispatcher's
  /// executor.
  auto run(gateway::IncomingChannel &source, std::uint32_t shard_count)
      -> task<void>;

  /// Thread-safe.
  auto stop() -> void;

  [[nodiscard]] auto registry() noexcept -> HandlerRegistry & {
    return registry_;
  }
  [[nodiscard]] auto executor() const noexcept
      -> const boost::asio::any_io_executor & {
    return ex_;
  }
  [[nodiscard]] auto ready_fired() const noexcept -> bool {
    return ready_fired_;
  }

protected:
  /// Called once before the first event is read.
  virtual auto start() -> void {}
  /// Hand one domain event to its handlers. Suspending here applies
  /// backpressure to the whole stream.
  virtual auto deliver(const EventContext &ctx, const event::DispatchedEvent &evt)
      -> task<Result<void>> = 0;
  /// Cancel and join everything deliver() started.
  virtual auto shutdown() -> task<void> = 0;

  boost::asio::any_io_executor ex_;
  HandlerRegistry registry_;

private:
  auto pull(gateway::IncomingChannel &source) -> task<void>;
  auto handle(const gateway::IncomingGatewayEvent &evt) -> task<Result<void>>;
  auto run_gateway_handlers(const EventContext &ctx,
                            const gateway::IncomingGatewayEvent &evt)
      -> task<void>;
  auto publish(const EventContext &ctx, const event::DispatchedEvent &evt)
      -> task<Result<void>>;

  event::EventParser &parser_;
  Client *client_;
  event::GuildChunker *chunker_;
  // Shared so a stop() posted before destruction finds nothing to set.
  std::shared_ptr<AsyncEvent> stop_requested_;
  std::vector<bool> ready_shards_;
  bool ready_fired_{false};
};

} // namespace shardline::dispatch
