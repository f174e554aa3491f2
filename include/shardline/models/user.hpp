#pragma once

#include "shardline/util/snowflake.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shardline::models {

struct User {
  Snowflake id;
  std::string username;
  /// Legacy; "0" for accounts migrated to unique usernames.
  std::string discriminator{"0"};
  std::optional<std::string> global_name;
  std::optional<std::string> avatar;
  bool bot{false};
  bool system{false};

  [[nodiscard]] auto display_name() const noexcept -> std::string_view {
    if (global_name && !global_name->empty()) {
      return *global_name;
    }
    return username;
  }
};

struct Member {
  User user;
  std::optional<std::string> nick;
  std::vector<Snowflake> roles;
  std::string joined_at;
  std::optional<Snowflake> guild_id;

  [[nodiscard]] auto id() const noexcept -> Snowflake { return user.id; }

  [[nodiscard]] auto display_name() const noexcept -> std::string_view {
    if (nick && !nick->empty()) {
      return *nick;
    }
    return user.display_name();
  }
};

struct CustomEmoji {
  Snowflake id;
  std::string name;
  bool animated{false};

  auto operator==(const CustomEmoji &) const -> bool = default;
};

} // namespace shardline::models
