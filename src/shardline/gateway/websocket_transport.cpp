#include "shardline/gateway/transport.hpp"

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/util/log.hpp"
#include "shardline/util/url.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <deque>
#include <format>
#include <string>
#include <utility>
#include <variant>

namespace shardline::gateway {

namespace {

namespace beast = boost::beast;
namespace beast_ws = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

using PlainWs = beast_ws::stream<beast::tcp_stream>;
using TlsWs = beast_ws::stream<beast::ssl_stream<beast::tcp_stream>>;
using WsVariant = std::variant<std::monostate, PlainWs, TlsWs>;

struct WriteText {
  std::string payload;
};
struct WriteClose {
  std::uint16_t code{1000};
};
using WriteRequest = std::variant<WriteText, WriteClose>;

template <typename Ws>
auto configure(Ws &ws, const WebSocketOptions &options) -> void {
  ws.read_message_max(options.max_message_size);
  ws.set_option(
      beast_ws::stream_base::timeout::suggested(beast::role_type::client));
  ws.set_option(beast_ws::stream_base::decorator(
      [ua = options.user_agent](beast_ws::request_type &req) {
        req.set(beast::http::field::user_agent, ua);
      }));
}

template <typename Ws>
auto upgrade(Ws &ws, const util::Endpoint &endpoint,
             const WebSocketOptions &options) -> task<Result<void>> {
  configure(ws, options);
  auto host = std::format("{}:{}", endpoint.host, endpoint.port);
  auto res = co_await co_as_result(
      ws.async_handshake(host, endpoint.target, use_nothrow));
  if (!res) {
    log::debug("WebSocket handshake with {} failed: {}", host,
               res.error().message());
  }
  co_return res;
}

auto tcp_connect(beast::tcp_stream &stream,
                 const tcp::resolver::results_type &results,
                 std::chrono::milliseconds timeout) -> task<Result<void>> {
  stream.expires_after(timeout);
  auto [ec, endpoint] = co_await stream.async_connect(results, use_nothrow);
  (void)endpoint;
  if (ec) {
    co_return fail(ec);
  }
  co_return ok();
}

template <typename Ws>
auto read_message(Ws &ws, beast::flat_buffer &buffer)
    -> task<Result<TransportMessage>> {
  auto [ec, n] = co_await ws.async_read(buffer, use_nothrow);
  (void)n;
  if (ec == beast_ws::error::closed) {
    const auto &reason = ws.reason();
    co_return TransportMessage{.kind = MessageKind::Close,
                               .payload = std::string(reason.reason.c_str()),
                               .close_code =
                                   static_cast<std::uint16_t>(reason.code)};
  }
  if (ec) {
    co_return fail(ec);
  }
  TransportMessage msg{.kind = ws.got_text() ? MessageKind::Text
                                             : MessageKind::Binary,
                       .payload = beast::buffers_to_string(buffer.data()),
                       .close_code = 0};
  buffer.consume(buffer.size());
  co_return msg;
}

inline auto read_message(std::monostate &, beast::flat_buffer &)
    -> task<Result<TransportMessage>> {
  co_return fail(Error::ConnectionClosed);
}

template <typename Ws>
auto write_request(Ws &ws, WriteRequest &req) -> task<Result<void>> {
  if (auto *text = std::get_if<WriteText>(&req)) {
    ws.text(true);
    auto [ec, n] = co_await ws.async_write(
        boost::asio::buffer(text->payload), use_nothrow);
    (void)n;
    co_return ec ? Result<void>{fail(ec)} : ok();
  }
  const auto code = std::get<WriteClose>(req).code;
  co_return co_await co_as_result(
      ws.async_close(beast_ws::close_reason(code), use_nothrow));
}

inline auto write_request(std::monostate &, WriteRequest &)
    -> task<Result<void>> {
  co_return fail(Error::ConnectionClosed);
}

/// Single writer per socket: frames queued by send_text/close are written
/// one at a time in order.
template <typename ImplT> auto drain_writes(ImplT impl) -> spawn_task {
  while (!impl->pending_writes.empty()) {
    auto req = std::move(impl->pending_writes.front());
    impl->pending_writes.pop_front();
    const bool closing = std::holds_alternative<WriteClose>(req);

    auto res = co_await std::visit(
        [&req](auto &ws) { return write_request(ws, req); }, impl->ws);
    if (!res) {
      log::debug("WebSocket write failed: {}", res.error().message());
    }
    if (!res || closing) {
      impl->open = false;
      impl->pending_writes.clear();
      break;
    }
  }
  impl->write_in_flight = false;
}

} // namespace

struct WebSocketTransport::Impl {
  boost::asio::any_io_executor ex;
  WebSocketOptions options;
  ssl::context tls{ssl::context::tls_client};
  WsVariant ws;
  beast::flat_buffer read_buffer;
  std::deque<WriteRequest> pending_writes;
  bool write_in_flight{false};
  bool open{false};

  Impl(boost::asio::any_io_executor executor, WebSocketOptions opts)
      : ex(std::move(executor)), options(std::move(opts)) {
    boost::system::error_code ec;
    tls.set_default_verify_paths(ec);
    if (ec) {
      log::warn("Failed to load system CA certificates: {}", ec.message());
    }
    tls.set_verify_mode(ssl::verify_peer);
  }
};

WebSocketTransport::WebSocketTransport(boost::asio::any_io_executor ex,
                                       WebSocketOptions options)
    : impl_(std::make_shared<Impl>(std::move(ex), std::move(options))) {}

WebSocketTransport::~WebSocketTransport() = default;

auto WebSocketTransport::connect(std::string url) -> task<Result<void>> {
  auto impl = impl_;
  auto endpoint = util::parse_gateway_url(url);
  if (!endpoint) {
    log::warn("Invalid gateway URL '{}'", url);
    co_return fail(endpoint.error());
  }

  tcp::resolver resolver(impl->ex);
  auto [resolve_ec, results] = co_await resolver.async_resolve(
      endpoint->host, std::to_string(endpoint->port),
      boost::asio::cancel_after(impl->options.handshake_timeout, use_nothrow));
  if (resolve_ec) {
    log::debug("Failed to resolve {} - {}", endpoint->host,
               resolve_ec.message());
    co_return fail(resolve_ec);
  }

  if (endpoint->secure) {
    auto &ws = impl->ws.emplace<TlsWs>(impl->ex, impl->tls);
    auto &tls_stream = ws.next_layer();
    if (!SSL_set_tlsext_host_name(tls_stream.native_handle(),
                                  endpoint->host.c_str())) {
      co_return fail(Error::ProtocolError);
    }
    tls_stream.set_verify_callback(
        ssl::host_name_verification(endpoint->host));

    auto &lowest = beast::get_lowest_layer(ws);
    if (auto res = co_await tcp_connect(lowest, results,
                                        impl->options.handshake_timeout);
        !res) {
      log::debug("Failed to connect to {}:{} - {}", endpoint->host,
                 endpoint->port, res.error().message());
      co_return res;
    }
    auto [tls_ec] = co_await tls_stream.async_handshake(
        ssl::stream_base::client, use_nothrow);
    if (tls_ec) {
      log::debug("TLS handshake with {} failed: {}", endpoint->host,
                 tls_ec.message());
      co_return fail(tls_ec);
    }
    lowest.expires_never();
    if (auto res = co_await upgrade(ws, *endpoint, impl->options); !res) {
      co_return res;
    }
  } else {
    auto &ws = impl->ws.emplace<PlainWs>(impl->ex);
    auto &lowest = beast::get_lowest_layer(ws);
    if (auto res = co_await tcp_connect(lowest, results,
                                        impl->options.handshake_timeout);
        !res) {
      log::debug("Failed to connect to {}:{} - {}", endpoint->host,
                 endpoint->port, res.error().message());
      co_return res;
    }
    lowest.expires_never();
    if (auto res = co_await upgrade(ws, *endpoint, impl->options); !res) {
      co_return res;
    }
  }

  impl->open = true;
  co_return ok();
}

auto WebSocketTransport::read() -> task<Result<TransportMessage>> {
  auto impl = impl_;
  auto msg = co_await std::visit(
      [&impl](auto &ws) { return read_message(ws, impl->read_buffer); },
      impl->ws);
  if (!msg || msg->kind == MessageKind::Close) {
    impl->open = false;
  }
  co_return msg;
}

auto WebSocketTransport::send_text(std::string text) -> Result<void> {
  if (!impl_->open) {
    return fail(Error::ConnectionClosed);
  }
  impl_->pending_writes.emplace_back(WriteText{std::move(text)});
  if (!impl_->write_in_flight) {
    impl_->write_in_flight = true;
    co_spawn(impl_->ex, drain_writes(impl_), detached);
  }
  return ok();
}

auto WebSocketTransport::close(std::uint16_t code) -> task<void> {
  if (!impl_->open) {
    co_return;
  }
  impl_->pending_writes.emplace_back(WriteClose{code});
  if (!impl_->write_in_flight) {
    impl_->write_in_flight = true;
    co_spawn(impl_->ex, drain_writes(impl_), detached);
  }
}

auto WebSocketTransport::force_close() -> void {
  impl_->open = false;
  impl_->pending_writes.clear();
  std::visit(
      [](auto &ws) {
        if constexpr (!std::is_same_v<std::decay_t<decltype(ws)>,
                                      std::monostate>) {
          beast::get_lowest_layer(ws).close();
        }
      },
      impl_->ws);
}

auto WebSocketTransport::is_open() const -> bool { return impl_->open; }

auto make_websocket_factory(WebSocketOptions options) -> TransportFactory {
  return [options = std::move(options)](boost::asio::any_io_executor ex)
             -> std::shared_ptr<IGatewayTransport> {
    return std::make_shared<WebSocketTransport>(std::move(ex), options);
  };
}

} // namespace shardline::gateway
