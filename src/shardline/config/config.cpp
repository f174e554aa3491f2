#include "shardline/config/config.hpp"
#include "shardline/config/toml_util.hpp"

#include "shardline/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <string>
#include <string_view>

namespace shardline {
namespace detail {

struct GatewayToml {
  std::string token;
  std::uint32_t shard_count{0};
  std::uint64_t intents{(1ULL << 22) - 1};
  std::uint32_t large_threshold{50};
  int connect_timeout_ms{10000};
  int hello_timeout_ms{20000};
  int backoff_min_ms{1000};
  int backoff_max_ms{60000};
  int backoff_reset_after_ms{30000};
  int max_reconnect_attempts{10};
  std::uint32_t event_queue_capacity{32};
  std::uint32_t outbound_queue_capacity{64};
  std::string url_override;
};

struct DispatcherToml {
  std::string mode{"task"};
  int max_tasks{16};
  std::uint32_t channel_capacity{0};
  bool enable_chunking{true};
};

struct RestToml {
  std::string base_url{"https://discord.com/api/v10"};
  int timeout_ms{15000};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct ClientToml {
  GatewayToml gateway{};
  DispatcherToml dispatcher{};
  RestToml rest{};
  LogToml log{};
};

} // namespace detail
} // namespace shardline

namespace glz {
template <> struct meta<shardline::detail::GatewayToml> {
  using T = shardline::detail::GatewayToml;
  static constexpr auto value = object(
      "token", &T::token, "shard_count", &T::shard_count, "intents",
      &T::intents, "large_threshold", &T::large_threshold,
      "connect_timeout_ms", &T::connect_timeout_ms, "hello_timeout_ms",
      &T::hello_timeout_ms, "backoff_min_ms", &T::backoff_min_ms,
      "backoff_max_ms", &T::backoff_max_ms, "backoff_reset_after_ms",
      &T::backoff_reset_after_ms, "max_reconnect_attempts",
      &T::max_reconnect_attempts, "event_queue_capacity",
      &T::event_queue_capacity, "outbound_queue_capacity",
      &T::outbound_queue_capacity, "url_override", &T::url_override);
};

template <> struct meta<shardline::detail::DispatcherToml> {
  using T = shardline::detail::DispatcherToml;
  static constexpr auto value =
      object("mode", &T::mode, "max_tasks", &T::max_tasks, "channel_capacity",
             &T::channel_capacity, "enable_chunking", &T::enable_chunking);
};

template <> struct meta<shardline::detail::RestToml> {
  using T = shardline::detail::RestToml;
  static constexpr auto value =
      object("base_url", &T::base_url, "timeout_ms", &T::timeout_ms);
};

template <> struct meta<shardline::detail::LogToml> {
  using T = shardline::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<shardline::detail::ClientToml> {
  using T = shardline::detail::ClientToml;
  static constexpr auto value =
      object("gateway", &T::gateway, "dispatcher", &T::dispatcher, "rest",
             &T::rest, "log", &T::log);
};
} // namespace glz

namespace shardline {
namespace {

[[nodiscard]] auto env(const char *name) -> const char * {
  return std::getenv(name);
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<ClientConfig> {
  auto raw_result = toml_util::parse_toml<detail::ClientToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  ClientConfig cfg{};
  auto &gw = cfg.gateway;
  gw.token = std::move(raw.gateway.token);
  gw.shard_count = raw.gateway.shard_count;
  gw.intents = raw.gateway.intents;
  gw.large_threshold = raw.gateway.large_threshold;
  gw.connect_timeout_ms = raw.gateway.connect_timeout_ms;
  gw.hello_timeout_ms = raw.gateway.hello_timeout_ms;
  gw.backoff_min_ms = raw.gateway.backoff_min_ms;
  gw.backoff_max_ms = raw.gateway.backoff_max_ms;
  gw.backoff_reset_after_ms = raw.gateway.backoff_reset_after_ms;
  gw.max_reconnect_attempts = raw.gateway.max_reconnect_attempts;
  gw.event_queue_capacity = raw.gateway.event_queue_capacity;
  gw.outbound_queue_capacity = raw.gateway.outbound_queue_capacity;
  gw.url_override = std::move(raw.gateway.url_override);

  std::string mode = std::move(raw.dispatcher.mode);
  cfg.dispatcher.max_tasks = raw.dispatcher.max_tasks;
  cfg.dispatcher.channel_capacity = raw.dispatcher.channel_capacity;
  cfg.dispatcher.enable_chunking = raw.dispatcher.enable_chunking;

  cfg.rest.base_url = std::move(raw.rest.base_url);
  cfg.rest.timeout_ms = raw.rest.timeout_ms;

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  if (const char *v = env("SHARDLINE_TOKEN"); v != nullptr) {
    gw.token = v;
  }
  if (const char *v = env("SHARDLINE_SHARD_COUNT"); v != nullptr) {
    gw.shard_count = boost::lexical_cast<std::uint32_t>(v);
  }
  if (const char *v = env("SHARDLINE_INTENTS"); v != nullptr) {
    gw.intents = boost::lexical_cast<std::uint64_t>(v);
  }
  if (const char *v = env("SHARDLINE_GATEWAY_URL"); v != nullptr) {
    gw.url_override = v;
  }
  if (const char *v = env("SHARDLINE_DISPATCHER_MODE"); v != nullptr) {
    mode = v;
  }
  if (const char *v = env("SHARDLINE_MAX_TASKS"); v != nullptr) {
    cfg.dispatcher.max_tasks = boost::lexical_cast<int>(v);
  }
  if (const char *v = env("SHARDLINE_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = env("SHARDLINE_LOG_FILE"); v != nullptr) {
    cfg.log.file = v;
  }

  if (!util::is_enum_name<DispatcherMode>(mode)) {
    log::error("Unknown dispatcher mode '{}'", mode);
    return fail(Error::ParseError);
  }
  cfg.dispatcher.mode = parse<DispatcherMode>(mode);

  if (auto valid = ConfigLoader::validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::validate(const ClientConfig &cfg) -> Result<void> {
  const auto &gw = cfg.gateway;
  auto reject = [](std::string_view why) -> Result<void> {
    log::error("Invalid configuration: {}", why);
    return fail(Error::ParseError);
  };
  if (gw.token.empty()) {
    return reject("gateway.token is empty");
  }
  if (gw.connect_timeout_ms <= 0 || gw.hello_timeout_ms <= 0 ||
      cfg.rest.timeout_ms <= 0) {
    return reject("timeouts must be positive");
  }
  if (gw.backoff_min_ms < 0 || gw.backoff_min_ms > gw.backoff_max_ms) {
    return reject("backoff_min_ms must be within [0, backoff_max_ms]");
  }
  if (gw.max_reconnect_attempts < 0) {
    return reject("max_reconnect_attempts must not be negative");
  }
  if (gw.event_queue_capacity == 0) {
    return reject("event_queue_capacity must be positive");
  }
  if (cfg.dispatcher.max_tasks <= 0) {
    return reject("dispatcher.max_tasks must be positive");
  }
  if (!log::parse_level(cfg.log.level)) {
    return reject("unknown log level");
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<ClientConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Cannot read config file '{}'", path);
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<ClientConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid SHARDLINE_* environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace shardline
