#pragma once

#include "shardline/core/error.hpp"

#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace shardline::util {

struct Endpoint {
  bool secure{true};
  std::string host;
  std::uint16_t port{443};
  /// Path plus query, ready for a request line or websocket handshake.
  std::string target{"/"};
};

namespace detail {

[[nodiscard]] inline auto to_endpoint(const boost::urls::url_view &uri,
                                      std::string_view secure_scheme,
                                      std::string_view plain_scheme)
    -> Result<Endpoint> {
  Endpoint out;
  if (uri.scheme() == secure_scheme) {
    out.secure = true;
    out.port = 443;
  } else if (uri.scheme() == plain_scheme) {
    out.secure = false;
    out.port = 80;
  } else {
    return fail(Error::InvalidUrl);
  }

  out.host = std::string(uri.host());
  if (out.host.empty()) {
    return fail(Error::InvalidUrl);
  }
  if (uri.has_port()) {
    auto port = uri.port_number();
    if (port == 0) {
      return fail(Error::InvalidUrl);
    }
    out.port = port;
  }

  auto target = std::string(uri.encoded_path());
  if (target.empty()) {
    target = "/";
  }
  if (auto query = uri.encoded_query(); !query.empty()) {
    target.push_back('?');
    target.append(query.data(), query.size());
  }
  out.target = std::move(target);
  return out;
}

} // namespace detail

/// Parse a ws:// or wss:// gateway URL and pin the protocol version and
/// encoding query parameters the codec speaks.
[[nodiscard]] inline auto parse_gateway_url(std::string_view url)
    -> Result<Endpoint> {
  auto parsed = boost::urls::parse_uri(url);
  if (!parsed) {
    return fail(Error::InvalidUrl);
  }
  boost::urls::url uri(*parsed);
  uri.params().set("v", "10");
  uri.params().set("encoding", "json");
  return detail::to_endpoint(uri, "wss", "ws");
}

/// Parse an http:// or https:// base URL for the REST client.
[[nodiscard]] inline auto parse_http_url(std::string_view url)
    -> Result<Endpoint> {
  auto parsed = boost::urls::parse_uri(url);
  if (!parsed) {
    return fail(Error::InvalidUrl);
  }
  return detail::to_endpoint(*parsed, "https", "http");
}

} // namespace shardline::util
