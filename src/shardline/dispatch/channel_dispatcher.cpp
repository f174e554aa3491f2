#include "shardline/dispatch/channel_dispatcher.hpp"

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/util/log.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/co_spawn.hpp>

#include <exception>
#include <string>
#include <utility>

namespace shardline::dispatch {

ChannelDispatcher::ChannelDispatcher(boost::asio::any_io_executor ex,
                                     event::EventParser &parser,
                                     Client *client,
                                     event::GuildChunker *chunker)
    : EventDispatcher(ex, parser, client, chunker), drained_(ex) {
  drained_.set();
}

ChannelDispatcher::~ChannelDispatcher() = default;

auto ChannelDispatcher::start() -> void {
  for (std::size_t idx = 0; idx < routes_.size(); ++idx) {
    const auto handlers = registry_.handlers_for(idx);
    // Consumers hold a reference to their route.
    routes_[idx].reserve(handlers.size());
    for (const auto &handler : handlers) {
      auto &route = routes_[idx].emplace_back(Route{
          .handler = handler,
          .channel = std::make_unique<DeliveryChannel>(
              ex_, handler->channel_capacity),
          .cancel = std::make_unique<boost::asio::cancellation_signal>()});

      ++live_consumers_;
      drained_.reset();
      boost::asio::co_spawn(
          ex_, consume(route),
          boost::asio::bind_cancellation_slot(
              route.cancel->slot(), [this](std::exception_ptr ep) {
                if (ep) {
                  log::error("handler consumer ended with an exception");
                }
                if (--live_consumers_ == 0) {
                  drained_.set();
                }
              }));
    }
  }
}

auto ChannelDispatcher::deliver(const EventContext &ctx,
                                const event::DispatchedEvent &evt)
    -> task<Result<void>> {
  auto &routes = routes_[evt.index()];
  if (routes.empty()) {
    co_return ok();
  }
  auto shared = std::make_shared<const event::DispatchedEvent>(evt);
  for (auto &route : routes) {
    auto [ec] = co_await route.channel->async_send(
        boost::system::error_code{}, Delivery{ctx, shared}, use_nothrow);
    if (ec) {
      co_return fail(Error::Cancelled);
    }
  }
  co_return ok();
}

auto ChannelDispatcher::consume(Route &route) -> task<void> {
  const auto &handler = *route.handler;
  for (;;) {
    auto [ec, delivery] = co_await route.channel->async_receive(use_nothrow);
    if (ec) {
      co_return;
    }
    std::string failure;
    try {
      co_await handler.fn(delivery.ctx, *delivery.event);
      continue;
    } catch (const std::exception &e) {
      failure = e.what();
    } catch (...) {
      failure = "non-standard exception";
    }
    if (is_cancelled(co_await boost::asio::this_coro::cancellation_state)) {
      co_return;
    }
    log::error("handler '{}' failed on {} (shard {}): {}", handler.name,
               event::event_type_name(*delivery.event), delivery.ctx.shard_id,
               failure);
  }
}

auto ChannelDispatcher::shutdown() -> task<void> {
  for (auto &routes : routes_) {
    for (auto &route : routes) {
      route.channel->close();
      route.cancel->emit(boost::asio::cancellation_type::terminal);
    }
  }
  while (live_consumers_ > 0) {
    if (!co_await drained_.wait()) {
      break;
    }
  }
  for (auto &routes : routes_) {
    routes.clear();
  }
}

} // namespace shardline::dispatch
