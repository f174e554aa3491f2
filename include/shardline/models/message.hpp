#pragma once

#include "shardline/models/user.hpp"
#include "shardline/util/snowflake.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shardline::models {

struct Message {
  Snowflake id;
  Snowflake channel_id;
  std::optional<Snowflake> guild_id;
  User author;
  /// Present for guild messages; its `user` mirrors `author`.
  std::optional<Member> member;
  /// Empty without the message content intent.
  std::string content;
  std::string timestamp;
  std::optional<std::string> edited_timestamp;
  std::vector<Snowflake> mention_ids;
};

} // namespace shardline::models
