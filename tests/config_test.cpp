#include "shardline/config/config.hpp"

#include "gtest/gtest.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace shardline;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }
  ScopedEnv(const ScopedEnv &) = delete;
  auto operator=(const ScopedEnv &) -> ScopedEnv & = delete;

private:
  const char *name_;
};

constexpr auto kMinimal = R"(
[gateway]
token = "abc"
)";

} // namespace

TEST(ConfigTest, Defaults) {
  ClientConfig cfg;
  EXPECT_EQ(cfg.gateway.shard_count, 0u);
  EXPECT_EQ(cfg.gateway.large_threshold, 50u);
  EXPECT_EQ(cfg.gateway.max_reconnect_attempts, 10);
  EXPECT_EQ(cfg.dispatcher.mode, DispatcherMode::Task);
  EXPECT_EQ(cfg.dispatcher.max_tasks, 16);
  EXPECT_EQ(cfg.dispatcher.channel_capacity, 0u);
  EXPECT_EQ(cfg.rest.base_url, "https://discord.com/api/v10");
  EXPECT_EQ(cfg.log.level, "info");
}

TEST(ConfigTest, MinimalFileUsesDefaults) {
  auto result = ConfigLoader::load_from_string(kMinimal);
  ASSERT_TRUE(result.has_value()) << result.error().message();
  ClientConfig expected;
  expected.gateway.token = "abc";
  EXPECT_EQ(*result, expected);
}

TEST(ConfigTest, LoadFromTomlString) {
  std::string toml = R"(
[gateway]
token = "secret"
shard_count = 4
intents = 513
connect_timeout_ms = 5000
backoff_min_ms = 500
backoff_max_ms = 8000
url_override = "ws://127.0.0.1:9000"

[dispatcher]
mode = "channel"
max_tasks = 8
channel_capacity = 16
enable_chunking = false

[rest]
base_url = "http://127.0.0.1:8080/api"

[log]
level = "debug"
file = "/tmp/shardline.log"
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->gateway.token, "secret");
  EXPECT_EQ(result->gateway.shard_count, 4u);
  EXPECT_EQ(result->gateway.intents, 513u);
  EXPECT_EQ(result->gateway.backoff_max_ms, 8000);
  EXPECT_EQ(result->gateway.url_override, "ws://127.0.0.1:9000");
  EXPECT_EQ(result->dispatcher.mode, DispatcherMode::Channel);
  EXPECT_EQ(result->dispatcher.channel_capacity, 16u);
  EXPECT_FALSE(result->dispatcher.enable_chunking);
  EXPECT_EQ(result->rest.base_url, "http://127.0.0.1:8080/api");
  EXPECT_EQ(result->log.level, "debug");
  EXPECT_EQ(result->log.file, "/tmp/shardline.log");
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
  auto result = ConfigLoader::load_from_string(R"(
[gateway]
token = "abc"
compress = true

[metrics]
enabled = true
)");
  EXPECT_TRUE(result.has_value());
}

TEST(ConfigTest, RejectsInvalidValues) {
  EXPECT_FALSE(ConfigLoader::load_from_string("[gateway]\n").has_value());
  EXPECT_FALSE(ConfigLoader::load_from_string(R"(
[gateway]
token = "abc"
backoff_min_ms = 9000
backoff_max_ms = 1000
)")
                   .has_value());
  EXPECT_FALSE(ConfigLoader::load_from_string(R"(
[gateway]
token = "abc"
[dispatcher]
mode = "threads"
)")
                   .has_value());
  EXPECT_FALSE(ConfigLoader::load_from_string(R"(
[gateway]
token = "abc"
[dispatcher]
max_tasks = 0
)")
                   .has_value());
  EXPECT_FALSE(ConfigLoader::load_from_string(R"(
[gateway]
token = "abc"
[log]
level = "loud"
)")
                   .has_value());
  EXPECT_FALSE(ConfigLoader::load_from_string("not = [valid").has_value());
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  ScopedEnv token("SHARDLINE_TOKEN", "from-env");
  ScopedEnv shards("SHARDLINE_SHARD_COUNT", "3");
  ScopedEnv mode("SHARDLINE_DISPATCHER_MODE", "Channel");

  auto result = ConfigLoader::load_from_string(kMinimal);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->gateway.token, "from-env");
  EXPECT_EQ(result->gateway.shard_count, 3u);
  EXPECT_EQ(result->dispatcher.mode, DispatcherMode::Channel);
}

TEST(ConfigTest, MalformedEnvironmentOverrideIsAParseError) {
  ScopedEnv shards("SHARDLINE_SHARD_COUNT", "many");
  auto result = ConfigLoader::load_from_string(kMinimal);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::ParseError);
}

TEST(ConfigTest, LoadFromFile) {
  auto path = std::filesystem::temp_directory_path() / "shardline_config_test.toml";
  {
    std::ofstream out(path);
    out << kMinimal;
  }
  auto result = ConfigLoader::load_from_file(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->gateway.token, "abc");

  auto missing = ConfigLoader::load_from_file("/nonexistent/shardline.toml");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), Error::FileNotFound);
}

TEST(ConfigTest, DispatcherModeNames) {
  EXPECT_EQ(to_string_view(DispatcherMode::Channel), "channel");
  EXPECT_EQ(parse<DispatcherMode>("TASK"), DispatcherMode::Task);
  EXPECT_TRUE(util::is_enum_name<DispatcherMode>("channel"));
  EXPECT_FALSE(util::is_enum_name<DispatcherMode>("pool"));
}
