#pragma once

#include "shardline/core/error.hpp"
#include "shardline/models/stateful.hpp"
#include "shardline/util/json.hpp"
#include "shardline/util/snowflake.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace shardline::models {

/// Ids arrive as JSON strings; numbers are accepted too.
[[nodiscard]] auto parse_snowflake(const JsonValue &value)
    -> std::optional<Snowflake>;
[[nodiscard]] auto get_snowflake(const JsonValue &obj, std::string_view key)
    -> std::optional<Snowflake>;
[[nodiscard]] auto get_snowflakes(const JsonValue &obj, std::string_view key)
    -> std::vector<Snowflake>;

/// Builds raw entities from decoded JSON and wraps them for the client.
/// Every parse_* returns ParseError when a required field is missing.
class ModelFactory {
public:
  explicit ModelFactory(Client *client = nullptr) noexcept : client_(client) {}

  [[nodiscard]] auto parse_user(const JsonValue &json) const -> Result<User>;
  [[nodiscard]] auto parse_member(const JsonValue &json,
                                  std::optional<Snowflake> guild_id = {}) const
      -> Result<Member>;
  [[nodiscard]] auto parse_emoji(const JsonValue &json) const
      -> Result<CustomEmoji>;
  [[nodiscard]] auto parse_emojis(const JsonValue &array) const
      -> std::vector<CustomEmoji>;
  [[nodiscard]] auto parse_channel(const JsonValue &json) const
      -> Result<Channel>;
  /// Guild body of GUILD_CREATE or a READY stub. Nested channels are
  /// recorded by id only; see parse_guild_channels.
  [[nodiscard]] auto parse_guild(const JsonValue &json) const -> Result<Guild>;
  [[nodiscard]] auto parse_guild_channels(const JsonValue &json,
                                          Snowflake guild_id) const
      -> std::vector<Channel>;
  [[nodiscard]] auto parse_message(const JsonValue &json) const
      -> Result<Message>;

  template <typename Raw>
  [[nodiscard]] auto upgrade(Raw raw) const -> Stateful<Raw> {
    return Stateful<Raw>{std::make_shared<const Raw>(std::move(raw)), client_};
  }

  template <typename Raw>
  [[nodiscard]] auto upgrade(std::shared_ptr<const Raw> raw) const
      -> Stateful<Raw> {
    return Stateful<Raw>{std::move(raw), client_};
  }

  [[nodiscard]] auto client() const noexcept -> Client * { return client_; }

private:
  Client *client_;
};

} // namespace shardline::models
