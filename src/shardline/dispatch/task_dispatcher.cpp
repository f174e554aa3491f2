#include "shardline/dispatch/task_dispatcher.hpp"

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/util/log.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/co_spawn.hpp>

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace shardline::dispatch {

TaskDispatcher::TaskDispatcher(boost::asio::any_io_executor ex,
                               event::EventParser &parser,
                               std::size_t max_tasks, Client *client,
                               event::GuildChunker *chunker)
    : EventDispatcher(ex, parser, client, chunker),
      limiter_(ex, max_tasks == 0 ? 1 : max_tasks), idle_(ex) {
  idle_.set();
}

TaskDispatcher::~TaskDispatcher() = default;

auto TaskDispatcher::deliver(const EventContext &ctx,
                             const event::DispatchedEvent &evt)
    -> task<Result<void>> {
  auto handlers = registry_.handlers_for(evt);
  if (handlers.empty()) {
    co_return ok();
  }
  auto shared = std::make_shared<const event::DispatchedEvent>(evt);
  for (const auto &handler : handlers) {
    if (auto slot = co_await limiter_.acquire(); !slot) {
      co_return fail(Error::Cancelled);
    }
    spawn_unit(ctx, shared, handler);
  }
  co_return ok();
}

auto TaskDispatcher::spawn_unit(
    const EventContext &ctx, std::shared_ptr<const event::DispatchedEvent> evt,
    std::shared_ptr<const EventHandler> handler) -> void {
  const auto id = next_unit_++;
  auto &signal = units_[id];
  signal = std::make_unique<boost::asio::cancellation_signal>();
  idle_.reset();

  boost::asio::co_spawn(
      ex_,
      run_unit(ctx, std::move(evt), std::move(handler), SlotGuard{limiter_}),
      boost::asio::bind_cancellation_slot(
          signal->slot(), [this, id](std::exception_ptr ep) {
            if (ep) {
              log::error("handler unit {} ended with an unexpected exception",
                         id);
            }
            units_.erase(id);
            if (units_.empty()) {
              idle_.set();
            }
          }));
}

auto TaskDispatcher::run_unit(EventContext ctx,
                              std::shared_ptr<const event::DispatchedEvent> evt,
                              std::shared_ptr<const EventHandler> handler,
                              SlotGuard slot) -> task<void> {
  (void)slot;
  std::string failure;
  try {
    co_await handler->fn(ctx, *evt);
    co_return;
  } catch (const std::exception &e) {
    failure = e.what();
  } catch (...) {
    failure = "non-standard exception";
  }
  if (is_cancelled(co_await boost::asio::this_coro::cancellation_state)) {
    log::debug("handler '{}' cancelled during {} (shard {})", handler->name,
               event::event_type_name(*evt), ctx.shard_id);
  } else {
    log::error("handler '{}' failed on {} (shard {}): {}", handler->name,
               event::event_type_name(*evt), ctx.shard_id, failure);
  }
}

auto TaskDispatcher::shutdown() -> task<void> {
  if (!units_.empty()) {
    log::info("cancelling {} in-flight handler unit(s)", units_.size());
  }
  // Emitting may complete a unit synchronously and erase it; iterate a copy.
  std::vector<boost::asio::cancellation_signal *> signals;
  signals.reserve(units_.size());
  for (auto &[_, signal] : units_) {
    signals.push_back(signal.get());
  }
  for (auto *signal : signals) {
    signal->emit(boost::asio::cancellation_type::terminal);
  }
  while (!units_.empty()) {
    if (!co_await idle_.wait()) {
      break;
    }
  }
  limiter_.close();
}

} // namespace shardline::dispatch
