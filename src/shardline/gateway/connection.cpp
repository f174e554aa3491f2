#include "shardline/gateway/connection.hpp"

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/util/log.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <format>
#include <utility>
#include <variant>

namespace shardline::gateway {

namespace {

using namespace boost::asio::experimental::awaitable_operators;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

constexpr auto kNever = boost::asio::steady_timer::time_point::max();

[[nodiscard]] auto is_steady(ConnectionState s) noexcept -> bool {
  return s == ConnectionState::SteadyState;
}

} // namespace

GatewayConnection::GatewayConnection(boost::asio::any_io_executor ex,
                                     ConnectionConfig cfg,
                                     TransportFactory factory)
    : ex_(std::move(ex)), cfg_(std::move(cfg)),
      tag_(std::format("[shard {}/{}]", cfg_.identity.id, cfg_.identity.count)),
      factory_(std::move(factory)),
      events_(std::make_shared<IncomingChannel>(ex_, cfg_.event_queue_capacity)),
      outbound_(
          std::make_shared<OutgoingChannel>(ex_, cfg_.outbound_queue_capacity)),
      backoff_(cfg_.backoff), heartbeat_timer_(ex_, kNever),
      backoff_timer_(ex_, kNever), steady_gate_(ex_),
      self_(std::make_shared<GatewayConnection *>(this)) {}

GatewayConnection::~GatewayConnection() { self_.reset(); }

auto GatewayConnection::run() -> task<Result<void>> {
  Result<void> outcome = ok();

  while (!stopping_) {
    set_state(ConnectionState::Connecting);
    reached_steady_ = false;

    std::string url = cfg_.gateway_url;
    if (session_.can_resume() && session_.resume_url) {
      url = *session_.resume_url;
    }

    auto ended = co_await run_session(std::move(url));
    if (stopping_) {
      break;
    }
    if (!ended && is_fatal(ended.error())) {
      log::error("{} giving up: {}", tag_, ended.error().message());
      outcome = fail(ended.error());
      break;
    }

    set_state(ConnectionState::Reconnecting);
    if (reached_steady_) {
      if (steady_clock::now() - steady_since_ >= cfg_.backoff_reset_after) {
        backoff_.reset();
        consecutive_failures_ = 0;
      }
    } else {
      ++consecutive_failures_;
    }

    if (cfg_.max_reconnect_attempts > 0 &&
        consecutive_failures_ > cfg_.max_reconnect_attempts) {
      log::error("{} {} consecutive failed reconnects, giving up", tag_,
                 consecutive_failures_);
      outcome = fail(Error::RetryBudgetExhausted);
      break;
    }

    const auto delay = backoff_.next();
    log::info("{} reconnecting in {} ms (attempt {})", tag_, delay.count(),
              backoff_.attempts());
    co_await wait_backoff(delay);
  }

  set_state(ConnectionState::Closed);
  events_->close();
  outbound_->close();
  co_return outcome;
}

auto GatewayConnection::stop() -> void {
  boost::asio::post(ex_, [weak = std::weak_ptr<GatewayConnection *>(self_)] {
    auto self = weak.lock();
    if (!self) {
      return;
    }
    auto &conn = **self;
    if (conn.stopping_) {
      return;
    }
    conn.stopping_ = true;
    log::debug("{} stop requested", conn.tag_);
    conn.backoff_timer_.cancel();
    conn.events_->close();
    conn.outbound_->close();
    if (conn.transport_) {
      conn.transport_->force_close();
    }
  });
}

auto GatewayConnection::submit(OutgoingGatewayEvent evt)
    -> task<Result<void>> {
  if (auto valid = validate_user_event(evt); !valid) {
    co_return valid;
  }
  auto [ec] = co_await outbound_->async_send(boost::system::error_code{},
                                             std::move(evt), use_nothrow);
  if (ec) {
    co_return fail(Error::ConnectionClosed);
  }
  co_return ok();
}

auto GatewayConnection::run_session(std::string url) -> task<Result<void>> {
  transport_ = factory_(ex_);
  ++connect_attempts_;
  hello_received_ = false;
  awaiting_ack_ = false;
  read_stalled_ = false;
  heartbeat_timer_.expires_at(kNever);
  steady_gate_.reset();

  log::info("{} connecting to {}", tag_, url);
  auto connected = co_await (transport_->connect(url) ||
                             async_sleep(cfg_.connect_timeout));
  Result<void> conn = fail(Error::Timeout);
  if (connected.index() == 0) {
    conn = std::get<0>(std::move(connected));
  }
  if (!conn) {
    if (!stopping_) {
      log::warn("{} connect failed: {}", tag_, conn.error().message());
    }
    transport_->force_close();
    transport_.reset();
    co_return conn;
  }

  set_state(ConnectionState::AwaitingHello);
  auto ended = co_await (read_loop() || heartbeat_loop() || write_loop());
  auto result = std::visit(
      [](auto &r) -> Result<void> { return std::move(r); }, ended);

  steady_gate_.reset();
  heartbeat_timer_.expires_at(kNever);
  co_await teardown_transport(session_.can_resume());
  co_return result;
}

auto GatewayConnection::read_loop() -> task<Result<void>> {
  for (;;) {
    Result<TransportMessage> msg = fail(Error::ConnectionClosed);
    if (!hello_received_) {
      auto first = co_await (transport_->read() ||
                             async_sleep(cfg_.hello_timeout));
      if (first.index() == 1) {
        log::warn("{} no Hello within {} ms", tag_,
                  cfg_.hello_timeout.count());
        co_return fail(Error::Timeout);
      }
      msg = std::get<0>(std::move(first));
    } else {
      msg = co_await transport_->read();
    }

    if (!msg) {
      if (!stopping_) {
        log::warn("{} read failed: {}", tag_, msg.error().message());
      }
      co_return fail(Error::ConnectionClosed);
    }

    switch (msg->kind) {
    case MessageKind::Close:
      co_return handle_close(msg->close_code);
    case MessageKind::Binary:
      log::warn("{} unexpected binary frame ({} bytes)", tag_,
                msg->payload.size());
      co_return fail(Error::ProtocolError);
    case MessageKind::Text:
      break;
    }

    auto frame = decode_frame(msg->payload);
    if (!frame) {
      log::warn("{} dropping undecodable frame: {}", tag_,
                frame.error().message());
      continue;
    }

    auto outcome = co_await handle_frame(*frame);
    if (!outcome) {
      co_return fail(outcome.error());
    }
    if (*outcome == FrameOutcome::Reconnect) {
      co_return ok();
    }
  }
}

auto GatewayConnection::heartbeat_loop() -> task<Result<void>> {
  for (;;) {
    auto [ec] = co_await heartbeat_timer_.async_wait(use_nothrow);
    if (ec) {
      if (is_cancelled(co_await boost::asio::this_coro::cancellation_state)) {
        co_return ok();
      }
      // Rescheduled by Hello.
      continue;
    }

    // A consumer holding back the reader also holds back the ack; only a
    // reader that is free to read can declare the peer dead.
    if (awaiting_ack_ && !read_stalled_) {
      log::warn("{} no heartbeat ack within {} ms, dropping connection", tag_,
                heartbeat_interval_.count());
      transport_->force_close();
      co_return ok();
    }

    if (auto sent = send_heartbeat(); !sent) {
      co_return ok();
    }
    heartbeat_timer_.expires_after(heartbeat_interval_);
  }
}

auto GatewayConnection::write_loop() -> task<Result<void>> {
  for (;;) {
    if (!is_steady(state())) {
      if (auto gate = co_await steady_gate_.wait(); !gate) {
        co_return ok();
      }
    }

    if (!carry_) {
      auto [ec, evt] = co_await outbound_->async_receive(use_nothrow);
      if (ec) {
        co_return ok();
      }
      carry_ = std::move(evt);
    }

    auto sent = send_frame(*carry_);
    if (!sent) {
      if (sent.error() == make_error_code(Error::ConnectionClosed)) {
        // Kept for the next session.
        co_return ok();
      }
      log::warn("{} dropping outgoing event: {}", tag_,
                sent.error().message());
    }
    carry_.reset();
  }
}

auto GatewayConnection::handle_frame(const Frame &frame)
    -> task<Result<FrameOutcome>> {
  switch (frame.op) {
  case Opcode::Hello: {
    if (auto r = handle_hello(frame); !r) {
      co_return fail(r.error());
    }
    co_return FrameOutcome::Continue;
  }
  case Opcode::Dispatch:
    co_return co_await handle_dispatch(frame);
  case Opcode::HeartbeatAck:
    awaiting_ack_ = false;
    ++ack_count_;
    emit_voidable(GatewayHeartbeatAck{cfg_.identity.id, ack_count_});
    co_return FrameOutcome::Continue;
  case Opcode::Heartbeat:
    if (auto r = send_heartbeat(); !r) {
      co_return FrameOutcome::Reconnect;
    }
    co_return FrameOutcome::Continue;
  case Opcode::Reconnect:
    log::info("{} server requested reconnect", tag_);
    emit_voidable(GatewayReconnectRequested{cfg_.identity.id});
    session_.reset();
    co_return FrameOutcome::Reconnect;
  case Opcode::InvalidSession: {
    bool resumable = false;
    if (frame.data) {
      if (const auto *b = std::get_if<bool>(&frame.data->data)) {
        resumable = *b;
      }
    }
    log::info("{} session invalidated (resumable={})", tag_, resumable);
    emit_voidable(GatewayInvalidateSession{cfg_.identity.id, resumable});
    if (!resumable) {
      session_.reset();
    }
    co_return FrameOutcome::Reconnect;
  }
  default:
    log::debug("{} ignoring opcode {}", tag_, std::to_underlying(frame.op));
    co_return FrameOutcome::Continue;
  }
}

auto GatewayConnection::handle_hello(const Frame &frame) -> Result<void> {
  const auto interval =
      frame.data ? json::get_int(*frame.data, "heartbeat_interval")
                 : std::nullopt;
  if (!interval || *interval <= 0) {
    log::warn("{} Hello without a usable heartbeat_interval", tag_);
    return fail(Error::ProtocolError);
  }

  heartbeat_interval_ = milliseconds{*interval};
  hello_received_ = true;
  const auto first =
      std::chrono::duration_cast<milliseconds>(heartbeat_interval_ *
                                               next_jitter());
  heartbeat_timer_.expires_after(first);
  log::debug("{} hello: interval {} ms, first beat in {} ms", tag_,
             heartbeat_interval_.count(), first.count());

  emit_voidable(GatewayHello{cfg_.identity.id, heartbeat_interval_});
  set_state(ConnectionState::Authenticating);
  return send_handshake();
}

auto GatewayConnection::handle_dispatch(const Frame &frame)
    -> task<Result<FrameOutcome>> {
  if (!frame.sequence) {
    log::warn("{} dispatch {} without a sequence, dropped", tag_,
              frame.event_name.value_or("?"));
    co_return FrameOutcome::Continue;
  }
  const auto seq = *frame.sequence;
  if (session_.sequence && seq <= *session_.sequence) {
    log::warn("{} dropping dispatch {} with stale sequence {} (at {})", tag_,
              frame.event_name.value_or("?"), seq, *session_.sequence);
    co_return FrameOutcome::Continue;
  }
  session_.sequence = seq;

  std::string name = frame.event_name.value_or("");
  if (name == "READY") {
    if (frame.data) {
      session_.session_id = json::get_string(*frame.data, "session_id");
      if (auto resume = json::get_string(*frame.data, "resume_gateway_url")) {
        session_.resume_url = std::move(*resume);
      }
    }
    log::info("{} ready, session {}", tag_,
              session_.session_id.value_or("<none>"));
    set_state(ConnectionState::SteadyState);
  } else if (name == "RESUMED") {
    log::info("{} resumed at sequence {}", tag_, seq);
    set_state(ConnectionState::SteadyState);
  }

  auto payload = frame.data ? frame.data : std::make_shared<const JsonValue>();
  read_stalled_ = true;
  auto [ec] = co_await events_->async_send(
      boost::system::error_code{},
      IncomingGatewayEvent{GatewayDispatch{cfg_.identity.id, std::move(name),
                                           seq, std::move(payload)}},
      use_nothrow);
  read_stalled_ = false;
  if (ec) {
    co_return fail(Error::Cancelled);
  }
  co_return FrameOutcome::Continue;
}

auto GatewayConnection::handle_close(std::uint16_t code) -> Result<void> {
  switch (static_cast<CloseCode>(code)) {
  case CloseCode::AuthenticationFailed:
    log::error("{} authentication failed (close {})", tag_, code);
    return fail(Error::Unauthorized);
  case CloseCode::InvalidShard:
  case CloseCode::ShardingRequired:
    log::error("{} shard rejected (close {})", tag_, code);
    return fail(Error::ShardingRequired);
  case CloseCode::InvalidIntents:
  case CloseCode::DisallowedIntents:
    log::error("{} intents rejected (close {})", tag_, code);
    return fail(Error::DisallowedIntents);
  case CloseCode::InvalidSequence:
  case CloseCode::SessionTimedOut:
    log::warn("{} session no longer resumable (close {})", tag_, code);
    session_.reset();
    break;
  default:
    log::info("{} closed by server (code {})", tag_, code);
    break;
  }
  return fail(Error::ConnectionClosed);
}

auto GatewayConnection::send_frame(const OutgoingGatewayEvent &evt)
    -> Result<void> {
  if (!transport_ || !transport_->is_open()) {
    return fail(Error::ConnectionClosed);
  }
  auto text = encode(evt, cfg_.properties);
  if (!text) {
    return fail(text.error());
  }
  return transport_->send_text(std::move(*text));
}

auto GatewayConnection::send_heartbeat() -> Result<void> {
  if (auto sent = send_frame(Heartbeat{session_.sequence}); !sent) {
    return sent;
  }
  awaiting_ack_ = true;
  ++heartbeat_count_;
  emit_voidable(GatewayHeartbeatSent{cfg_.identity.id, heartbeat_count_,
                                     session_.sequence});
  return ok();
}

auto GatewayConnection::send_handshake() -> Result<void> {
  if (session_.can_resume()) {
    log::info("{} resuming session {} at {}", tag_, *session_.session_id,
              *session_.sequence);
    return send_frame(
        Resume{cfg_.token, *session_.session_id, *session_.sequence});
  }
  log::info("{} identifying", tag_);
  return send_frame(Identify{cfg_.token, cfg_.identity, cfg_.intents,
                             cfg_.large_threshold});
}

auto GatewayConnection::emit_voidable(IncomingGatewayEvent evt) -> void {
  const auto name = std::string{event_name(evt)};
  if (!events_->try_send(boost::system::error_code{}, std::move(evt))) {
    log::debug("{} consumer behind, dropped {}", tag_, name);
  }
}

auto GatewayConnection::set_state(ConnectionState next) -> void {
  const auto prev = state_.exchange(next, std::memory_order_acq_rel);
  if (prev == next) {
    return;
  }
  log::trace("{} {} -> {}", tag_, to_string_view(prev), to_string_view(next));
  if (is_steady(next)) {
    steady_since_ = steady_clock::now();
    reached_steady_ = true;
    steady_gate_.set();
  }
}

auto GatewayConnection::teardown_transport(bool resumable) -> task<void> {
  if (!transport_) {
    co_return;
  }
  auto transport = std::exchange(transport_, nullptr);
  if (transport->is_open()) {
    const auto code =
        (resumable && !stopping_)
            ? kResumableCloseCode
            : static_cast<std::uint16_t>(CloseCode::Normal);
    co_await transport->close(code);
  }
}

auto GatewayConnection::wait_backoff(milliseconds delay) -> task<void> {
  backoff_timer_.expires_after(delay);
  auto [ec] = co_await backoff_timer_.async_wait(use_nothrow);
  (void)ec;
}

auto GatewayConnection::next_jitter() -> double {
  double j = 0.0;
  if (cfg_.first_heartbeat_jitter) {
    j = cfg_.first_heartbeat_jitter();
  } else {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    j = dist(rng_);
  }
  return std::clamp(j, 0.0, 1.0);
}

} // namespace shardline::gateway
