#pragma once

#include "shardline/core/coroutine.hpp"
#include "shardline/core/error.hpp"
#include "shardline/gateway/codec.hpp"
#include "shardline/gateway/event.hpp"
#include "shardline/gateway/session_state.hpp"
#include "shardline/gateway/transport.hpp"
#include "shardline/util/async_event.hpp"
#include "shardline/util/backoff.hpp"
#include "shardline/util/enum.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/describe/enum.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace shardline::gateway {

enum class ConnectionState : std::uint8_t {
  Disconnected,
  Connecting,
  AwaitingHello,
  Authenticating,
  SteadyState,
  Reconnecting,
  Closed,
};
BOOST_DESCRIBE_ENUM(ConnectionState, Disconnected, Connecting, AwaitingHello,
                    Authenticating, SteadyState, Reconnecting, Closed)
SHARDLINE_DEFINE_ENUM_SERDE(ConnectionState, ConnectionState::Disconnected)

struct ConnectionConfig {
  std::string token;
  ShardIdentity identity;
  std::string gateway_url;
  std::uint64_t intents{(1ULL << 22) - 1};
  std::uint32_t large_threshold{50};
  ClientProperties properties;
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds hello_timeout{20000};
  ExponentialBackoff::Config backoff;
  /// Steady time after which the backoff and retry budget start over.
  std::chrono::milliseconds backoff_reset_after{30000};
  /// Consecutive failed reconnects tolerated; 0 means unlimited.
  int max_reconnect_attempts{10};
  std::size_t event_queue_capacity{32};
  std::size_t outbound_queue_capacity{64};
  /// Fraction of the heartbeat interval before the first beat, in [0, 1).
  /// Random when unset.
  std::function<double()> first_heartbeat_jitter;
};

/// One gateway session for one shard, reconnecting until stopped.
///
/// All internal state lives on the executor passed at construction. The
/// session runs three loops raced against each other: frame reader,
/// heartbeat timer and outbound writer. Whichever finishes first ends the
/// session and the others are cancelled.
///
/// Destroy it on its executor's thread, or once that executor has stopped
/// running; work posted by stop() then finds the connection gone.
class GatewayConnection {
public:
  GatewayConnection(boost::asio::any_io_executor ex, ConnectionConfig cfg,
                    TransportFactory factory);
  ~GatewayConnection();

  GatewayConnection(const GatewayConnection &) = delete;
  auto operator=(const GatewayConnection &) -> GatewayConnection & = delete;

  /// Returns ok() after stop(), or the fatal error that ended the shard.
  auto run() -> task<Result<void>>;

  /// Thread-safe and idempotent.
  auto stop() -> void;

  /// Queue a caller-issued event. Held until the session is steady.
  auto submit(OutgoingGatewayEvent evt) -> task<Result<void>>;

  [[nodiscard]] auto events() noexcept -> IncomingChannel & { return *events_; }
  [[nodiscard]] auto identity() const noexcept -> const ShardIdentity & {
    return cfg_.identity;
  }
  [[nodiscard]] auto executor() const noexcept
      -> const boost::asio::any_io_executor & {
    return ex_;
  }
  [[nodiscard]] auto state() const noexcept -> ConnectionState {
    return state_.load(std::memory_order_acquire);
  }
  /// Only meaningful on the connection's executor.
  [[nodiscard]] auto session() const noexcept -> const SessionState & {
    return session_;
  }
  [[nodiscard]] auto heartbeats_sent() const noexcept -> std::uint64_t {
    return heartbeat_count_;
  }
  [[nodiscard]] auto heartbeat_acks() const noexcept -> std::uint64_t {
    return ack_count_;
  }
  [[nodiscard]] auto connect_attempts() const noexcept -> std::uint64_t {
    return connect_attempts_;
  }

private:
  enum class FrameOutcome : std::uint8_t { Continue, Reconnect };

  auto run_session(std::string url) -> task<Result<void>>;
  auto read_loop() -> task<Result<void>>;
  auto heartbeat_loop() -> task<Result<void>>;
  auto write_loop() -> task<Result<void>>;
  auto handle_frame(const Frame &frame) -> task<Result<FrameOutcome>>;
  auto handle_hello(const Frame &frame) -> Result<void>;
  auto handle_dispatch(const Frame &frame) -> task<Result<FrameOutcome>>;
  auto handle_close(std::uint16_t code) -> Result<void>;

  auto send_frame(const OutgoingGatewayEvent &evt) -> Result<void>;
  auto send_heartbeat() -> Result<void>;
  auto send_handshake() -> Result<void>;
  auto emit_voidable(IncomingGatewayEvent evt) -> void;
  auto set_state(ConnectionState next) -> void;
  auto teardown_transport(bool resumable) -> task<void>;
  auto wait_backoff(std::chrono::milliseconds delay) -> task<void>;
  [[nodiscard]] auto next_jitter() -> double;

  boost::asio::any_io_executor ex_;
  ConnectionConfig cfg_;
  std::string tag_;
  TransportFactory factory_;
  std::shared_ptr<IncomingChannel> events_;
  std::shared_ptr<OutgoingChannel> outbound_;
  std::shared_ptr<IGatewayTransport> transport_;

  SessionState session_;
  ExponentialBackoff backoff_;
  boost::asio::steady_timer heartbeat_timer_;
  boost::asio::steady_timer backoff_timer_;
  AsyncEvent steady_gate_;

  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
  bool stopping_{false};
  bool hello_received_{false};
  bool awaiting_ack_{false};
  bool read_stalled_{false};
  std::chrono::milliseconds heartbeat_interval_{0};
  std::chrono::steady_clock::time_point steady_since_{};
  bool reached_steady_{false};
  std::optional<OutgoingGatewayEvent> carry_;
  int consecutive_failures_{0};
  std::uint64_t heartbeat_count_{0};
  std::uint64_t ack_count_{0};
  std::uint64_t connect_attempts_{0};
  std::mt19937_64 rng_{std::random_device{}()};
  // Posted work holds a weak reference; reset first on destruction.
  std::shared_ptr<GatewayConnection *> self_;
};

} // namespace shardline::gateway
