#include "shardline/http/rest_client.hpp"

#include "test_utils.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "gtest/gtest.h"

#include <deque>
#include <format>
#include <string>
#include <vector>

using namespace shardline;
using namespace shardline::http;
using namespace shardline::test;
using namespace boost::asio::experimental::awaitable_operators;
using namespace std::chrono_literals;

namespace {

namespace beast = boost::beast;
namespace beast_http = beast::http;
using tcp = boost::asio::ip::tcp;

/// Plain-HTTP server on loopback answering one scripted response per
/// connection.
class ScriptedHttpServer {
public:
  struct Reply {
    unsigned status{200};
    std::string body;
    std::string retry_after;
  };
  struct Seen {
    std::string method;
    std::string target;
    std::string authorization;
    std::string body;
  };

  explicit ScriptedHttpServer(boost::asio::io_context &io)
      : acceptor_(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"),
                                    0)) {}

  [[nodiscard]] auto base_url() const -> std::string {
    return std::format("http://127.0.0.1:{}/api/v10",
                       acceptor_.local_endpoint().port());
  }

  auto serve() -> task<void> {
    while (!replies.empty()) {
      auto [ec, socket] = co_await acceptor_.async_accept(use_nothrow);
      if (ec) {
        co_return;
      }
      beast::flat_buffer buffer;
      beast_http::request<beast_http::string_body> req;
      auto [read_ec, n] = co_await beast_http::async_read(socket, buffer, req,
                                                          use_nothrow);
      (void)n;
      if (read_ec) {
        co_return;
      }
      seen.push_back(Seen{.method = std::string(req.method_string()),
                          .target = std::string(req.target()),
                          .authorization =
                              std::string(req[beast_http::field::authorization]),
                          .body = req.body()});

      auto reply = std::move(replies.front());
      replies.pop_front();
      beast_http::response<beast_http::string_body> res{
          static_cast<beast_http::status>(reply.status), 11};
      res.set(beast_http::field::content_type, "application/json");
      if (!reply.retry_after.empty()) {
        res.set(beast_http::field::retry_after, reply.retry_after);
      }
      res.body() = std::move(reply.body);
      res.prepare_payload();
      auto [write_ec, w] =
          co_await beast_http::async_write(socket, res, use_nothrow);
      (void)write_ec;
      (void)w;
      boost::system::error_code ignored;
      socket.shutdown(tcp::socket::shutdown_both, ignored);
    }
  }

  std::deque<Reply> replies;
  std::vector<Seen> seen;

private:
  tcp::acceptor acceptor_;
};

auto client_config(const ScriptedHttpServer &server) -> RestConfig {
  return RestConfig{.base_url = server.base_url(),
                    .token = "abc",
                    .timeout = 2000ms,
                    .server_error_retries = 0};
}

} // namespace

TEST(RestStatusTest, MapsStatusToError) {
  EXPECT_TRUE(check_status(RestResponse{.status = 200}).has_value());
  EXPECT_TRUE(check_status(RestResponse{.status = 204}).has_value());
  EXPECT_EQ(check_status(RestResponse{.status = 429}).error(),
            Error::RateLimited);
  EXPECT_EQ(check_status(RestResponse{.status = 401}).error(), Error::HttpError);
  EXPECT_EQ(check_status(RestResponse{.status = 503}).error(), Error::HttpError);
}

TEST(RestStatusTest, ServerRetryDelayDoubles) {
  EXPECT_EQ(server_retry_delay(0), 2s);
  EXPECT_EQ(server_retry_delay(1), 4s);
  EXPECT_EQ(server_retry_delay(4), 32s);
}

TEST(GatewayInfoTest, ParsesGatewayBot) {
  auto info = parse_gateway_info(json_of(
      R"({"url":"wss://gateway.discord.gg","shards":9,"session_start_limit":{"total":1000,"remaining":999,"reset_after":14400000,"max_concurrency":1}})"));
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->url, "wss://gateway.discord.gg");
  EXPECT_EQ(info->shards, 9u);
  EXPECT_EQ(info->session_start_limit.remaining, 999);
  EXPECT_EQ(info->session_start_limit.reset_after, 14400000);
}

TEST(GatewayInfoTest, RejectsIncompleteInfo) {
  EXPECT_FALSE(parse_gateway_info(json_of(R"({"shards":1})")).has_value());
  EXPECT_FALSE(parse_gateway_info(json_of(R"({"url":"wss://x"})")).has_value());
  EXPECT_FALSE(
      parse_gateway_info(json_of(R"({"url":"wss://x","shards":0})")).has_value());
}

TEST(RestClientTest, FetchesGatewayBotWithBotAuthorization) {
  boost::asio::io_context io;
  ScriptedHttpServer server(io);
  server.replies.push_back(
      {.status = 200, .body = R"({"url":"wss://gw.test","shards":2})"});
  RestClient client(io.get_executor(), client_config(server));

  auto scenario = [&]() -> task<Result<GatewayInfo>> {
    co_return co_await (client.get_gateway_bot() && server.serve());
  };
  auto info = run_on(io, scenario());
  ASSERT_TRUE(info.has_value()) << info.error().message();
  EXPECT_EQ(info->url, "wss://gw.test");
  EXPECT_EQ(info->shards, 2u);

  ASSERT_EQ(server.seen.size(), 1u);
  EXPECT_EQ(server.seen[0].method, "GET");
  EXPECT_EQ(server.seen[0].target, "/api/v10/gateway/bot");
  EXPECT_EQ(server.seen[0].authorization, "Bot abc");
}

TEST(RestClientTest, RateLimitRecordsRetryAfter) {
  boost::asio::io_context io;
  ScriptedHttpServer server(io);
  server.replies.push_back({.status = 429,
                            .body = R"({"message":"You are being rate limited."})",
                            .retry_after = "1.5"});
  RestClient client(io.get_executor(), client_config(server));

  auto scenario = [&]() -> task<Result<RestResponse>> {
    co_return co_await (client.request("/gateway/bot", Method::Get) &&
                        server.serve());
  };
  auto response = run_on(io, scenario());
  ASSERT_FALSE(response.has_value());
  EXPECT_EQ(response.error(), Error::RateLimited);
  EXPECT_EQ(client.last_retry_after(), 1.5);
  EXPECT_EQ(server.seen.size(), 1u);
}

TEST(RestClientTest, ServerErrorWithoutRetriesFails) {
  boost::asio::io_context io;
  ScriptedHttpServer server(io);
  server.replies.push_back({.status = 502, .body = "bad gateway"});
  RestClient client(io.get_executor(), client_config(server));

  auto scenario = [&]() -> task<Result<RestResponse>> {
    co_return co_await (client.request("/gateway/bot", Method::Get) &&
                        server.serve());
  };
  auto response = run_on(io, scenario());
  ASSERT_FALSE(response.has_value());
  EXPECT_EQ(response.error(), Error::HttpError);
}

TEST(RestClientTest, CreateMessagePostsJsonContent) {
  boost::asio::io_context io;
  ScriptedHttpServer server(io);
  server.replies.push_back(
      {.status = 200,
       .body = R"({"id":"9","channel_id":"42","author":{"id":"1","username":"bot"},"content":"hi \"there\""})"});
  RestClient client(io.get_executor(), client_config(server));

  auto scenario = [&]() -> task<Result<JsonValue>> {
    co_return co_await (client.create_message(Snowflake{42}, "hi \"there\"") &&
                        server.serve());
  };
  auto created = run_on(io, scenario());
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ(json::get_string(*created, "id"), "9");

  ASSERT_EQ(server.seen.size(), 1u);
  EXPECT_EQ(server.seen[0].method, "POST");
  EXPECT_EQ(server.seen[0].target, "/api/v10/channels/42/messages");
  auto body = json_of(server.seen[0].body);
  EXPECT_EQ(json::get_string(body, "content"), "hi \"there\"");
}

TEST(RestClientTest, InvalidBaseUrlFailsWithoutConnecting) {
  boost::asio::io_context io;
  RestClient client(io.get_executor(),
                    RestConfig{.base_url = "ftp://example", .token = "t"});
  auto response = run_on(io, client.request("/gateway/bot", Method::Get));
  ASSERT_FALSE(response.has_value());
  EXPECT_EQ(response.error(), Error::InvalidUrl);
}
