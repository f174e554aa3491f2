#pragma once

#include "shardline/models/user.hpp"
#include "shardline/util/snowflake.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shardline::models {

struct Guild {
  Snowflake id;
  std::string name;
  std::optional<std::string> icon;
  /// Stub guilds from READY or an outage carry only the id.
  bool unavailable{false};
  bool large{false};
  std::int64_t member_count{0};
  /// Channels themselves live in the object cache.
  std::vector<Snowflake> channel_ids;
  ankerl::unordered_dense::map<Snowflake, Member> members;
  std::vector<CustomEmoji> emojis;

  [[nodiscard]] auto find_member(Snowflake user_id) const -> const Member * {
    auto it = members.find(user_id);
    return it == members.end() ? nullptr : &it->second;
  }
};

} // namespace shardline::models
