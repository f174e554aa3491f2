#pragma once

#include "shardline/core/coroutine.hpp"
#include "shardline/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace shardline::gateway {

enum class MessageKind : std::uint8_t { Text, Binary, Close };

struct TransportMessage {
  MessageKind kind{MessageKind::Text};
  std::string payload;
  /// Set for Close; 0 when the peer sent no code.
  std::uint16_t close_code{0};
};

/// Message-oriented socket under one gateway connection. All calls are made
/// from the connection's executor.
class IGatewayTransport {
public:
  virtual ~IGatewayTransport() = default;

  virtual auto connect(std::string url) -> task<Result<void>> = 0;
  virtual auto read() -> task<Result<TransportMessage>> = 0;
  /// Queue a text frame; frames are written in submission order.
  virtual auto send_text(std::string text) -> Result<void> = 0;
  /// Close handshake with the given code.
  virtual auto close(std::uint16_t code) -> task<void> = 0;
  /// Drop the socket without a close handshake.
  virtual auto force_close() -> void = 0;
  [[nodiscard]] virtual auto is_open() const -> bool = 0;
};

using TransportFactory = std::function<std::shared_ptr<IGatewayTransport>(
    boost::asio::any_io_executor)>;

struct WebSocketOptions {
  std::chrono::milliseconds handshake_timeout{10000};
  std::size_t max_message_size{16UL * 1024UL * 1024UL};
  std::string user_agent{"shardline (https://github.com/shardline, 0.1)"};
};

/// Beast websocket transport for ws:// and wss:// URLs.
class WebSocketTransport final : public IGatewayTransport {
public:
  explicit WebSocketTransport(boost::asio::any_io_executor ex,
                              WebSocketOptions options = {});
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport &) = delete;
  auto operator=(const WebSocketTransport &) -> WebSocketTransport & = delete;

  auto connect(std::string url) -> task<Result<void>> override;
  auto read() -> task<Result<TransportMessage>> override;
  auto send_text(std::string text) -> Result<void> override;
  auto close(std::uint16_t code) -> task<void> override;
  auto force_close() -> void override;
  [[nodiscard]] auto is_open() const -> bool override;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

[[nodiscard]] auto make_websocket_factory(WebSocketOptions options = {})
    -> TransportFactory;

} // namespace shardline::gateway
