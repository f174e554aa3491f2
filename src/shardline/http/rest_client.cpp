#include "shardline/http/rest_client.hpp"

#include "shardline/core/asio_awaitable.hpp"
#include "shardline/util/log.hpp"
#include "shardline/util/url.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <charconv>
#include <format>
#include <string>
#include <utility>

namespace shardline::http {

namespace wire {
struct CreateMessageBody {
  std::string content;
};
} // namespace wire

} // namespace shardline::http

template <> struct glz::meta<shardline::http::wire::CreateMessageBody> {
  using T = shardline::http::wire::CreateMessageBody;
  static constexpr auto value = object("content", &T::content);
};

namespace shardline::http {

namespace {

namespace beast = boost::beast;
namespace beast_http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

constexpr std::size_t kMaxResponseSize = 8UL * 1024UL * 1024UL;

auto to_verb(Method method) -> beast_http::verb {
  switch (method) {
  case Method::Get:
    return beast_http::verb::get;
  case Method::Post:
    return beast_http::verb::post;
  case Method::Put:
    return beast_http::verb::put;
  case Method::Patch:
    return beast_http::verb::patch;
  case Method::Delete:
    return beast_http::verb::delete_;
  }
  std::unreachable();
}

auto parse_seconds(std::string_view text) -> std::optional<double> {
  double value = 0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) {
    return std::nullopt;
  }
  return value;
}

template <typename Stream>
auto exchange(Stream &stream, beast_http::request<beast_http::string_body> req,
              std::chrono::milliseconds timeout) -> task<Result<RestResponse>> {
  auto [write_ec, written] = co_await beast_http::async_write(
      stream, req, boost::asio::cancel_after(timeout, use_nothrow));
  (void)written;
  if (write_ec) {
    log::debug("REST write failed: {}", write_ec.message());
    co_return fail(write_ec);
  }

  beast::flat_buffer buffer;
  beast_http::response_parser<beast_http::string_body> parser;
  parser.body_limit(kMaxResponseSize);
  auto [read_ec, read_n] = co_await beast_http::async_read(
      stream, buffer, parser, boost::asio::cancel_after(timeout, use_nothrow));
  (void)read_n;
  if (read_ec) {
    log::debug("REST read failed: {}", read_ec.message());
    co_return fail(read_ec);
  }

  auto msg = parser.release();
  RestResponse out{.status = msg.result_int(), .body = std::move(msg.body())};
  if (auto it = msg.find(beast_http::field::retry_after); it != msg.end()) {
    out.retry_after = parse_seconds(it->value());
  }
  co_return out;
}

} // namespace

auto check_status(const RestResponse &response) -> Result<void> {
  if (response.status >= 200 && response.status < 300) {
    return ok();
  }
  if (response.status == 429) {
    return fail(Error::RateLimited);
  }
  return fail(Error::HttpError);
}

auto parse_gateway_info(const JsonValue &json) -> Result<GatewayInfo> {
  auto url = json::get_string(json, "url");
  auto shards = json::get_int(json, "shards");
  if (!url || !shards || *shards <= 0) {
    return fail(Error::ParseError);
  }
  GatewayInfo info{.url = std::move(*url),
                   .shards = static_cast<std::uint32_t>(*shards)};
  if (const auto *limit = json::get_object(json, "session_start_limit")) {
    auto &out = info.session_start_limit;
    out.total = json::get_int(*limit, "total").value_or(0);
    out.remaining = json::get_int(*limit, "remaining").value_or(0);
    out.reset_after = json::get_int(*limit, "reset_after").value_or(0);
    out.max_concurrency = json::get_int(*limit, "max_concurrency").value_or(1);
  }
  return info;
}

struct RestClient::Impl {
  boost::asio::any_io_executor ex;
  ssl::context tls{ssl::context::tls_client};
  Result<util::Endpoint> endpoint;

  Impl(boost::asio::any_io_executor executor, std::string_view base_url)
      : ex(std::move(executor)), endpoint(util::parse_http_url(base_url)) {
    boost::system::error_code ec;
    tls.set_default_verify_paths(ec);
    if (ec) {
      log::warn("Failed to load system CA certificates: {}", ec.message());
    }
    tls.set_verify_mode(ssl::verify_peer);
  }
};

RestClient::RestClient(boost::asio::any_io_executor ex, RestConfig cfg)
    : cfg_(std::move(cfg)),
      impl_(std::make_unique<Impl>(std::move(ex), cfg_.base_url)) {}

RestClient::~RestClient() = default;

auto RestClient::request(std::string_view route, Method method,
                         std::optional<std::string> body)
    -> task<Result<RestResponse>> {
  for (int attempt = 0;; ++attempt) {
    auto response = co_await send_once(route, method, body);
    if (!response) {
      co_return response;
    }
    auto status = check_status(*response);
    if (status) {
      co_return response;
    }
    if (response->status == 429) {
      last_retry_after_ = response->retry_after;
      log::warn("REST {} rate limited, retry after {}s", route,
                response->retry_after.value_or(0.0));
      co_return fail(status.error());
    }
    if (response->status >= 500 && attempt < cfg_.server_error_retries) {
      auto delay = server_retry_delay(attempt);
      log::warn("REST {} returned {}, retrying in {}", route, response->status,
                delay);
      co_await async_sleep(delay);
      continue;
    }
    auto message = response->json()
                       .transform([](const JsonValue &j) {
                         return json::get_string(j, "message");
                       })
                       .value_or(std::nullopt);
    log::error("REST {} failed with {}: {}", route, response->status,
               message.value_or(response->body));
    co_return fail(status.error());
  }
}

auto RestClient::send_once(std::string_view route, Method method,
                           const std::optional<std::string> &body)
    -> task<Result<RestResponse>> {
  if (!impl_->endpoint) {
    log::error("Invalid REST base URL '{}'", cfg_.base_url);
    co_return fail(impl_->endpoint.error());
  }
  const auto &endpoint = *impl_->endpoint;

  auto target = endpoint.target == "/" ? std::string(route)
                                       : endpoint.target + std::string(route);
  beast_http::request<beast_http::string_body> req{to_verb(method), target,
                                                   11};
  req.set(beast_http::field::host, endpoint.host);
  req.set(beast_http::field::user_agent, cfg_.user_agent);
  req.set(beast_http::field::authorization, std::format("Bot {}", cfg_.token));
  req.set(beast_http::field::connection, "close");
  if (body) {
    req.set(beast_http::field::content_type, "application/json");
    req.body() = *body;
  }
  req.prepare_payload();

  tcp::resolver resolver(impl_->ex);
  auto [resolve_ec, results] = co_await resolver.async_resolve(
      endpoint.host, std::to_string(endpoint.port),
      boost::asio::cancel_after(cfg_.timeout, use_nothrow));
  if (resolve_ec) {
    log::debug("Failed to resolve {} - {}", endpoint.host,
               resolve_ec.message());
    co_return fail(resolve_ec);
  }

  if (!endpoint.secure) {
    beast::tcp_stream stream(impl_->ex);
    stream.expires_after(cfg_.timeout);
    auto [connect_ec, ep] = co_await stream.async_connect(results, use_nothrow);
    (void)ep;
    if (connect_ec) {
      co_return fail(connect_ec);
    }
    stream.expires_never();
    auto res = co_await exchange(stream, std::move(req), cfg_.timeout);
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return res;
  }

  beast::ssl_stream<beast::tcp_stream> stream(impl_->ex, impl_->tls);
  if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                endpoint.host.c_str())) {
    co_return fail(Error::ProtocolError);
  }
  stream.set_verify_callback(ssl::host_name_verification(endpoint.host));
  auto &lowest = beast::get_lowest_layer(stream);
  lowest.expires_after(cfg_.timeout);
  auto [connect_ec, ep] = co_await lowest.async_connect(results, use_nothrow);
  (void)ep;
  if (connect_ec) {
    log::debug("Failed to connect to {}:{} - {}", endpoint.host, endpoint.port,
               connect_ec.message());
    co_return fail(connect_ec);
  }
  auto [tls_ec] =
      co_await stream.async_handshake(ssl::stream_base::client, use_nothrow);
  if (tls_ec) {
    log::debug("TLS handshake with {} failed: {}", endpoint.host,
               tls_ec.message());
    co_return fail(tls_ec);
  }
  lowest.expires_never();

  auto res = co_await exchange(stream, std::move(req), cfg_.timeout);
  // Servers commonly skip close_notify; a truncated shutdown is expected.
  auto [shutdown_ec] = co_await stream.async_shutdown(
      boost::asio::cancel_after(cfg_.timeout, use_nothrow));
  if (shutdown_ec && shutdown_ec != ssl::error::stream_truncated) {
    log::trace("TLS shutdown with {}: {}", endpoint.host,
               shutdown_ec.message());
  }
  co_return res;
}

auto RestClient::get_gateway_bot() -> task<Result<GatewayInfo>> {
  auto response = co_await request("/gateway/bot", Method::Get);
  if (!response) {
    co_return fail(response.error());
  }
  auto json = response->json();
  if (!json) {
    co_return fail(json.error());
  }
  co_return parse_gateway_info(*json);
}

auto RestClient::create_message(Snowflake channel_id, std::string content)
    -> task<Result<JsonValue>> {
  auto body = glz::write_json(wire::CreateMessageBody{std::move(content)});
  if (!body) {
    co_return fail(Error::ParseError);
  }
  auto response =
      co_await request(std::format("/channels/{}/messages", channel_id),
                       Method::Post, std::move(*body));
  if (!response) {
    co_return fail(response.error());
  }
  co_return response->json();
}

} // namespace shardline::http
