#include "shardline/dispatch/dispatcher.hpp"

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/util/log.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>

namespace shardline::dispatch {

using namespace boost::asio::experimental::awaitable_operators;

EventDispatcher::EventDispatcher(boost::asio::any_io_executor ex,
                                 event::EventParser &parser, Client *client,
                                 event::GuildChunker *chunker)
    : ex_(std::move(ex)), parser_(parser), client_(client), chunker_(chunker),
      stop_requested_(std::make_shared<AsyncEvent>(ex_)) {}

EventDispatcher::~EventDispatcher() = default;

auto EventDispatcher::run(gateway::IncomingChannel &source,
                          std::uint32_t shard_count) -> task<void> {
  ready_shards_.assign(std::max<std::uint32_t>(shard_count, 1), false);
  ready_fired_ = false;
  start();
  log::info("dispatcher started: {} handler(s), {} shard(s)",
            registry_.event_handler_count(), ready_shards_.size());

  co_await (pull(source) || stop_requested_->wait());

  co_await shutdown();
  log::info("dispatcher stopped");
}

auto EventDispatcher::stop() -> void {
  boost::asio::post(ex_, [weak = std::weak_ptr<AsyncEvent>(stop_requested_)] {
    if (auto event = weak.lock()) {
      event->set();
    }
  });
}

auto EventDispatcher::pull(gateway::IncomingChannel &source) -> task<void> {
  for (;;) {
    auto [ec, evt] = co_await source.async_receive(use_nothrow);
    if (ec) {
      if (!is_cancellation(ec)) {
        log::warn("event stream failed: {}", ec.message());
      }
      co_return;
    }
    if (auto handled = co_await handle(evt); !handled) {
      co_return;
    }
  }
}

auto EventDispatcher::handle(const gateway::IncomingGatewayEvent &evt)
    -> task<Result<void>> {
  EventContext ctx{.shard_id = gateway::shard_of(evt), .client = client_};
  co_await run_gateway_handlers(ctx, evt);

  const auto *dispatch = std::get_if<gateway::GatewayDispatch>(&evt);
  if (!dispatch) {
    co_return ok();
  }
  ctx.dispatch_name = dispatch->event_name;
  ctx.sequence = dispatch->sequence;

  for (const auto &parsed : parser_.parse(*dispatch)) {
    if (chunker_) {
      chunker_->observe(ctx.shard_id, parsed);
    }
    if (auto r = co_await publish(ctx, parsed); !r) {
      co_return r;
    }

    if (!std::holds_alternative<event::ShardReady>(parsed) ||
        ctx.shard_id >= ready_shards_.size()) {
      continue;
    }
    ready_shards_[ctx.shard_id] = true;
    if (!ready_fired_ && std::ranges::all_of(ready_shards_,
                                             [](bool r) { return r; })) {
      ready_fired_ = true;
      log::info("all {} shard(s) ready", ready_shards_.size());
      if (auto r = co_await publish(ctx, event::Ready{}); !r) {
        co_return r;
      }
    }
  }
  co_return ok();
}

auto EventDispatcher::run_gateway_handlers(
    const EventContext &ctx, const gateway::IncomingGatewayEvent &evt)
    -> task<void> {
  for (const auto &handler : registry_.gateway_handlers_for(evt)) {
    try {
      co_await handler->fn(ctx, evt);
    } catch (const std::exception &e) {
      log::error("gateway handler '{}' failed on {} (shard {}): {}",
                 handler->name, gateway::event_name(evt), ctx.shard_id,
                 e.what());
    } catch (...) {
      log::error("gateway handler '{}' failed on {} (shard {}): non-standard "
                 "exception",
                 handler->name, gateway::event_name(evt), ctx.shard_id);
    }
  }
}

auto EventDispatcher::publish(const EventContext &ctx,
                              const event::DispatchedEvent &evt)
    -> task<Result<void>> {
  log::trace("dispatching {} (shard {})", event::event_type_name(evt),
             ctx.shard_id);
  co_return co_await deliver(ctx, evt);
}

} // namespace shardline::dispatch
