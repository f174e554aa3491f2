#pragma once

#include "shardline/core/coroutine.hpp"
#include "shardline/core/error.hpp"
#include "shardline/util/json.hpp"
#include "shardline/util/snowflake.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace shardline::http {

enum class Method : std::uint8_t { Get, Post, Put, Patch, Delete };

struct RestConfig {
  std::string base_url{"https://discord.com/api/v10"};
  std::string token;
  std::chrono::milliseconds timeout{15000};
  std::string user_agent{"shardline (https://github.com/shardline, 0.1)"};
  /// Attempts after the first for 5xx responses.
  int server_error_retries{5};
};

struct RestResponse {
  unsigned status{0};
  std::string body;
  /// Seconds, from the Retry-After header of a 429.
  std::optional<double> retry_after;

  [[nodiscard]] auto json() const -> Result<JsonValue> {
    return parse_json(body);
  }
};

struct SessionStartLimit {
  std::int64_t total{0};
  std::int64_t remaining{0};
  std::int64_t reset_after{0};
  std::int64_t max_concurrency{1};
};

struct GatewayInfo {
  std::string url;
  std::uint32_t shards{1};
  SessionStartLimit session_start_limit;
};

/// Maps a finished response to the error the caller sees: 2xx is success,
/// 429 is RateLimited and anything else is HttpError.
[[nodiscard]] auto check_status(const RestResponse &response) -> Result<void>;

/// Delay before retry `attempt` (0-based) of a 5xx response.
[[nodiscard]] constexpr auto server_retry_delay(int attempt) noexcept
    -> std::chrono::seconds {
  return std::chrono::seconds{std::int64_t{1} << (attempt + 1)};
}

[[nodiscard]] auto parse_gateway_info(const JsonValue &json)
    -> Result<GatewayInfo>;

/// HTTP/1.1 client for the bot REST API. Opens one connection per request.
class RestClient {
public:
  RestClient(boost::asio::any_io_executor ex, RestConfig cfg);
  ~RestClient();

  RestClient(const RestClient &) = delete;
  auto operator=(const RestClient &) -> RestClient & = delete;

  /// `route` is appended to the base URL, e.g. "/gateway/bot".
  auto request(std::string_view route, Method method,
               std::optional<std::string> body = std::nullopt)
      -> task<Result<RestResponse>>;

  auto get_gateway_bot() -> task<Result<GatewayInfo>>;

  /// Returns the created message object.
  auto create_message(Snowflake channel_id, std::string content)
      -> task<Result<JsonValue>>;

  /// Retry-After of the last rate-limited response.
  [[nodiscard]] auto last_retry_after() const noexcept
      -> std::optional<double> {
    return last_retry_after_;
  }

  [[nodiscard]] auto config() const noexcept -> const RestConfig & {
    return cfg_;
  }

private:
  struct Impl;

  auto send_once(std::string_view route, Method method,
                 const std::optional<std::string> &body)
      -> task<Result<RestResponse>>;

  RestConfig cfg_;
  std::unique_ptr<Impl> impl_;
  std::optional<double> last_retry_after_;
};

} // namespace shardline::http
