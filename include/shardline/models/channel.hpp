#pragma once

#include "shardline/models/user.hpp"
#include "shardline/util/enum.hpp"
#include "shardline/util/snowflake.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace shardline::models {

enum class ChannelKind : std::uint8_t {
  Text,
  Voice,
  Category,
  Direct,
  Unsupported,
};
BOOST_DESCRIBE_ENUM(ChannelKind, Text, Voice, Category, Direct, Unsupported)
SHARDLINE_DEFINE_ENUM_SERDE(ChannelKind, ChannelKind::Unsupported)

/// Maps the wire `type` integer onto the kinds this library models.
[[nodiscard]] constexpr auto channel_kind_from_wire(std::int64_t type) noexcept
    -> ChannelKind {
  switch (type) {
  case 0:  // guild text
  case 5:  // announcement
    return ChannelKind::Text;
  case 1:  // DM
  case 3:  // group DM
    return ChannelKind::Direct;
  case 2:  // voice
  case 13: // stage
    return ChannelKind::Voice;
  case 4:
    return ChannelKind::Category;
  default:
    return ChannelKind::Unsupported;
  }
}

struct TextChannel {
  std::optional<std::string> topic;
  bool nsfw{false};
  std::optional<Snowflake> parent_id;
};

struct VoiceChannel {
  std::int64_t bitrate{0};
  std::int64_t user_limit{0};
  std::optional<Snowflake> parent_id;
};

struct CategoryChannel {};

struct DirectChannel {
  std::vector<User> recipients;
};

/// A channel type this library does not model yet.
struct UnsupportedChannel {
  std::int64_t raw_type{0};
  std::optional<Snowflake> parent_id;
};

using ChannelPayload = std::variant<TextChannel, VoiceChannel, CategoryChannel,
                                    DirectChannel, UnsupportedChannel>;

struct Channel {
  Snowflake id;
  ChannelKind kind{ChannelKind::Unsupported};
  std::optional<std::string> name;
  std::optional<Snowflake> guild_id;
  std::int64_t position{0};
  ChannelPayload payload{UnsupportedChannel{}};

  /// Text and direct channels accept messages.
  [[nodiscard]] auto is_textual() const noexcept -> bool {
    return kind == ChannelKind::Text || kind == ChannelKind::Direct;
  }

  [[nodiscard]] auto parent_id() const noexcept -> std::optional<Snowflake> {
    return std::visit(
        [](const auto &p) -> std::optional<Snowflake> {
          using T = std::decay_t<decltype(p)>;
          if constexpr (std::is_same_v<T, TextChannel> ||
                        std::is_same_v<T, VoiceChannel> ||
                        std::is_same_v<T, UnsupportedChannel>) {
            return p.parent_id;
          } else {
            return std::nullopt;
          }
        },
        payload);
  }
};

} // namespace shardline::models
