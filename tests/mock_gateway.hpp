#pragma once

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/gateway/transport.hpp"
#include "shardline/util/json.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>

#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shardline::test {

/// In-memory socket. Server frames are queued with push_*; frames the
/// client sends are recorded in `sent`.
class ScriptedSocket final : public gateway::IGatewayTransport {
public:
  using Inbox = boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code, gateway::TransportMessage)>;

  explicit ScriptedSocket(boost::asio::any_io_executor ex)
      : inbox_(std::move(ex), 256) {}

  auto connect(std::string url) -> task<Result<void>> override {
    urls.push_back(url);
    if (fail_connect) {
      co_return fail(Error::ConnectionClosed);
    }
    open_ = true;
    co_return ok();
  }

  auto read() -> task<Result<gateway::TransportMessage>> override {
    if (!open_) {
      co_return fail(Error::ConnectionClosed);
    }
    auto [ec, msg] = co_await inbox_.async_receive(use_nothrow);
    if (ec || !open_) {
      co_return fail(Error::ConnectionClosed);
    }
    if (msg.kind == gateway::MessageKind::Close) {
      open_ = false;
    }
    co_return msg;
  }

  auto send_text(std::string text) -> Result<void> override {
    if (!open_) {
      return fail(Error::ConnectionClosed);
    }
    sent.push_back(text);
    if (on_send) {
      on_send(*this, sent.back());
    }
    return ok();
  }

  auto close(std::uint16_t code) -> task<void> override {
    closed_with = code;
    open_ = false;
    inbox_.cancel();
    co_return;
  }

  auto force_close() -> void override {
    force_closed = true;
    open_ = false;
    inbox_.cancel();
  }

  [[nodiscard]] auto is_open() const -> bool override { return open_; }

  auto push_text(std::string text) -> void {
    (void)inbox_.try_send(
        boost::system::error_code{},
        gateway::TransportMessage{.kind = gateway::MessageKind::Text,
                                  .payload = std::move(text)});
  }

  auto push_binary() -> void {
    (void)inbox_.try_send(
        boost::system::error_code{},
        gateway::TransportMessage{.kind = gateway::MessageKind::Binary,
                                  .payload = "\x78\x9c"});
  }

  auto push_close(std::uint16_t code) -> void {
    (void)inbox_.try_send(
        boost::system::error_code{},
        gateway::TransportMessage{.kind = gateway::MessageKind::Close,
                                  .close_code = code});
  }

  /// Opcodes of every frame sent so far.
  [[nodiscard]] auto sent_ops() const -> std::vector<std::int64_t> {
    std::vector<std::int64_t> out;
    for (const auto &text : sent) {
      if (auto v = parse_json(text)) {
        out.push_back(json::get_int(*v, "op").value_or(-1));
      }
    }
    return out;
  }

  [[nodiscard]] auto frames_with_op(std::int64_t op) const
      -> std::vector<JsonValue> {
    std::vector<JsonValue> out;
    for (const auto &text : sent) {
      if (auto v = parse_json(text); v && json::get_int(*v, "op") == op) {
        out.push_back(std::move(*v));
      }
    }
    return out;
  }

  std::vector<std::string> urls;
  std::vector<std::string> sent;
  std::optional<std::uint16_t> closed_with;
  bool force_closed{false};
  bool fail_connect{false};
  std::function<void(ScriptedSocket &, const std::string &)> on_send;

private:
  Inbox inbox_;
  bool open_{false};
};

/// Transport factory that hands out ScriptedSockets and keeps them for
/// inspection. `on_create` runs before the connection sees the socket.
struct ScriptedGateway {
  std::vector<std::shared_ptr<ScriptedSocket>> sockets;
  std::function<void(ScriptedSocket &)> on_create;
  int failing_connects{0};

  [[nodiscard]] auto factory() -> gateway::TransportFactory {
    return [this](boost::asio::any_io_executor ex)
               -> std::shared_ptr<gateway::IGatewayTransport> {
      auto socket = std::make_shared<ScriptedSocket>(std::move(ex));
      if (failing_connects > 0) {
        --failing_connects;
        socket->fail_connect = true;
      }
      sockets.push_back(socket);
      if (on_create) {
        on_create(*socket);
      }
      return socket;
    };
  }

  [[nodiscard]] auto latest() -> ScriptedSocket & { return *sockets.back(); }
};

namespace frames {

[[nodiscard]] inline auto hello(std::int64_t interval_ms) -> std::string {
  return std::format(R"({{"op":10,"d":{{"heartbeat_interval":{}}}}})",
                     interval_ms);
}

[[nodiscard]] inline auto ack() -> std::string { return R"({"op":11})"; }

[[nodiscard]] inline auto heartbeat_request() -> std::string {
  return R"({"op":1,"d":null})";
}

[[nodiscard]] inline auto reconnect() -> std::string {
  return R"({"op":7,"d":null})";
}

[[nodiscard]] inline auto invalid_session(bool resumable) -> std::string {
  return std::format(R"({{"op":9,"d":{}}})", resumable);
}

[[nodiscard]] inline auto dispatch(std::string_view name, std::int64_t seq,
                                   std::string_view data) -> std::string {
  return std::format(R"({{"op":0,"t":"{}","s":{},"d":{}}})", name, seq, data);
}

[[nodiscard]] inline auto ready(std::string_view session_id, std::int64_t seq,
                                std::string_view guilds = "[]")
    -> std::string {
  return dispatch(
      "READY", seq,
      std::format(R"({{"v":10,"session_id":"{}","resume_gateway_url":"wss://resume.test","user":{{"id":"1","username":"bot"}},"guilds":{}}})",
                  session_id, guilds));
}

[[nodiscard]] inline auto resumed(std::int64_t seq) -> std::string {
  return dispatch("RESUMED", seq, "null");
}

} // namespace frames

/// Answers every heartbeat with an ack.
inline auto auto_ack(ScriptedSocket &socket, const std::string &text) -> void {
  if (auto v = parse_json(text); v && json::get_int(*v, "op") == 1) {
    socket.push_text(frames::ack());
  }
}

} // namespace shardline::test
