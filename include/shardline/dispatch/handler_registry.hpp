#pragma once

#include "shardline/core/coroutine.hpp"
#include "shardline/dispatch/context.hpp"
#include "shardline/event/model.hpp"
#include "shardline/gateway/event.hpp"
#include "shardline/util/log.hpp"
#include "shardline/util/variant_index.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace shardline::dispatch {

using EventHandlerFn = std::function<task<void>(
    const EventContext &, const event::DispatchedEvent &)>;
using GatewayHandlerFn = std::function<task<void>(
    const EventContext &, const gateway::IncomingGatewayEvent &)>;

struct EventHandler {
  std::string name;
  EventHandlerFn fn;
  /// Delivery channel capacity in the channel dispatcher. 0 is a rendezvous.
  std::size_t channel_capacity{0};
};

struct GatewayHandler {
  std::string name;
  GatewayHandlerFn fn;
};

/// Handlers keyed by event type, kept in registration order. Register
/// everything before the dispatcher starts; the lists are read without
/// locking while it runs.
class HandlerRegistry {
public:
  template <typename E, typename F>
  auto on(std::string name, F fn, std::size_t channel_capacity = 0) -> void {
    constexpr auto idx = event::kEventIndex<E>;
    log::debug("registered handler '{}' for {}", name, event::kEventNames[idx]);
    events_[idx].push_back(std::make_shared<const EventHandler>(EventHandler{
        .name = std::move(name),
        .fn =
            [fn = std::move(fn)](const EventContext &ctx,
                                 const event::DispatchedEvent &evt)
            -> task<void> { return fn(ctx, std::get<E>(evt)); },
        .channel_capacity = channel_capacity}));
  }

  template <typename G, typename F>
  auto on_gateway(std::string name, F fn) -> void {
    constexpr auto idx = util::variant_index_v<G, gateway::IncomingGatewayEvent>;
    log::debug("registered gateway handler '{}'", name);
    gateway_[idx].push_back(std::make_shared<const GatewayHandler>(
        GatewayHandler{.name = std::move(name),
                       .fn = [fn = std::move(fn)](
                                 const EventContext &ctx,
                                 const gateway::IncomingGatewayEvent &evt)
                           -> task<void> { return fn(ctx, std::get<G>(evt)); }}));
  }

  [[nodiscard]] auto handlers_for(std::size_t event_index) const
      -> std::span<const std::shared_ptr<const EventHandler>> {
    return events_.at(event_index);
  }
  [[nodiscard]] auto handlers_for(const event::DispatchedEvent &evt) const
      -> std::span<const std::shared_ptr<const EventHandler>> {
    return handlers_for(evt.index());
  }
  [[nodiscard]] auto gateway_handlers_for(
      const gateway::IncomingGatewayEvent &evt) const
      -> std::span<const std::shared_ptr<const GatewayHandler>> {
    return gateway_.at(evt.index());
  }

  [[nodiscard]] auto event_handler_count() const noexcept -> std::size_t {
    std::size_t n = 0;
    for (const auto &list : events_) {
      n += list.size();
    }
    return n;
  }

private:
  std::array<std::vector<std::shared_ptr<const EventHandler>>,
             std::variant_size_v<event::DispatchedEvent>>
      events_;
  std::array<std::vector<std::shared_ptr<const GatewayHandler>>,
             std::variant_size_v<gateway::IncomingGatewayEvent>>
      gateway_;
};

} // namespace shardline::dispatch
