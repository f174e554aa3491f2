#pragma once

#include "shardline/dispatch/dispatcher.hpp"
#include "shardline/util/async_event.hpp"
#include "shardline/util/capacity_limiter.hpp"

#include <boost/asio/cancellation_signal.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>

namespace shardline::dispatch {

/// Runs every handler of an event as its own unit, with at most
/// `max_tasks` units alive at once. When all slots are taken, delivery
/// waits for one to free up.
class TaskDispatcher final : public EventDispatcher {
public:
  TaskDispatcher(boost::asio::any_io_executor ex, event::EventParser &parser,
                 std::size_t max_tasks, Client *client = nullptr,
                 event::GuildChunker *chunker = nullptr);
  ~TaskDispatcher() override;

  [[nodiscard]] auto in_flight() const noexcept -> std::size_t {
    return units_.size();
  }
  [[nodiscard]] auto max_tasks() const noexcept -> std::size_t {
    return limiter_.capacity();
  }

protected:
  auto deliver(const EventContext &ctx, const event::DispatchedEvent &evt)
      -> task<Result<void>> override;
  auto shutdown() -> task<void> override;

private:
  auto run_unit(EventContext ctx,
                std::shared_ptr<const event::DispatchedEvent> evt,
                std::shared_ptr<const EventHandler> handler, SlotGuard slot)
      -> task<void>;
  auto spawn_unit(const EventContext &ctx,
                  std::shared_ptr<const event::DispatchedEvent> evt,
                  std::shared_ptr<const EventHandler> handler) -> void;

  CapacityLimiter limiter_;
  std::map<std::uint64_t, std::unique_ptr<boost::asio::cancellation_signal>>
      units_;
  std::uint64_t next_unit_{0};
  AsyncEvent idle_;
};

} // namespace shardline::dispatch
