#pragma once

#include "shardline/dispatch/dispatcher.hpp"
#include "shardline/util/async_event.hpp"

#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include <array>
#include <cstddef>
#include <memory>
#include <variant>
#include <vector>

namespace shardline::dispatch {

/// Gives every (event type, handler) pair its own bounded channel and a
/// consumer task. An event is pushed into each of its channels, in
/// registration order, before the next event is read. With the default
/// capacity of zero, one slow handler holds up the entire stream.
class ChannelDispatcher final : public EventDispatcher {
public:
  ChannelDispatcher(boost::asio::any_io_executor ex, event::EventParser &parser,
                    Client *client = nullptr,
                    event::GuildChunker *chunker = nullptr);
  ~ChannelDispatcher() override;

  [[nodiscard]] auto consumer_count() const noexcept -> std::size_t {
    return live_consumers_;
  }

protected:
  auto start() -> void override;
  auto deliver(const EventContext &ctx, const event::DispatchedEvent &evt)
      -> task<Result<void>> override;
  auto shutdown() -> task<void> override;

private:
  struct Delivery {
    EventContext ctx;
    std::shared_ptr<const event::DispatchedEvent> event;
  };
  using DeliveryChannel = boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code, Delivery)>;

  struct Route {
    std::shared_ptr<const EventHandler> handler;
    std::unique_ptr<DeliveryChannel> channel;
    std::unique_ptr<boost::asio::cancellation_signal> cancel;
  };

  auto consume(Route &route) -> task<void>;

  std::array<std::vector<Route>, std::variant_size_v<event::DispatchedEvent>>
      routes_;
  std::size_t live_consumers_{0};
  AsyncEvent drained_;
};

} // namespace shardline::dispatch
