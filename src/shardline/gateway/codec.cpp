#include "shardline/gateway/codec.hpp"

#include "shardline/util/log.hpp"

#include <glaze/json.hpp>

#include <array>
#include <ranges>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace shardline::gateway {
namespace wire {

struct IdentifyProperties {
  std::string os;
  std::string browser;
  std::string device;
};

struct IdentifyData {
  std::string token;
  IdentifyProperties properties;
  bool compress{false};
  std::array<std::uint32_t, 2> shard{};
  std::uint64_t intents{0};
  std::uint32_t large_threshold{50};
};

struct ResumeData {
  std::string token;
  std::string session_id;
  std::int64_t seq{0};
};

struct RequestMembersData {
  std::string guild_id;
  std::optional<std::string> query;
  std::optional<std::uint32_t> limit;
  bool presences{false};
  std::optional<std::vector<std::string>> user_ids;
  std::optional<std::string> nonce;
};

template <typename D> struct Envelope {
  int op{0};
  D d;
};

struct HeartbeatEnvelope {
  int op{std::to_underlying(Opcode::Heartbeat)};
  std::optional<std::int64_t> d;
};

} // namespace wire
} // namespace shardline::gateway

template <> struct glz::meta<shardline::gateway::wire::IdentifyProperties> {
  using T = shardline::gateway::wire::IdentifyProperties;
  static constexpr auto value =
      object("os", &T::os, "browser", &T::browser, "device", &T::device);
};

template <> struct glz::meta<shardline::gateway::wire::IdentifyData> {
  using T = shardline::gateway::wire::IdentifyData;
  static constexpr auto value =
      object("token", &T::token, "properties", &T::properties, "compress",
             &T::compress, "shard", &T::shard, "intents", &T::intents,
             "large_threshold", &T::large_threshold);
};

template <> struct glz::meta<shardline::gateway::wire::ResumeData> {
  using T = shardline::gateway::wire::ResumeData;
  static constexpr auto value = object("token", &T::token, "session_id",
                                       &T::session_id, "seq", &T::seq);
};

template <> struct glz::meta<shardline::gateway::wire::RequestMembersData> {
  using T = shardline::gateway::wire::RequestMembersData;
  static constexpr auto value =
      object("guild_id", &T::guild_id, "query", &T::query, "limit", &T::limit,
             "presences", &T::presences, "user_ids", &T::user_ids, "nonce",
             &T::nonce);
};

template <typename D>
struct glz::meta<shardline::gateway::wire::Envelope<D>> {
  using T = shardline::gateway::wire::Envelope<D>;
  static constexpr auto value = object("op", &T::op, "d", &T::d);
};

template <> struct glz::meta<shardline::gateway::wire::HeartbeatEnvelope> {
  using T = shardline::gateway::wire::HeartbeatEnvelope;
  static constexpr auto value = object("op", &T::op, "d", &T::d);
};

namespace shardline::gateway {
namespace {

template <typename T> auto write(const T &value) -> Result<std::string> {
  auto out = glz::write_json(value);
  if (!out) {
    return fail(Error::ParseError);
  }
  return ok(std::move(*out));
}

template <typename D> auto envelope(Opcode op, D data) -> wire::Envelope<D> {
  return wire::Envelope<D>{.op = std::to_underlying(op), .d = std::move(data)};
}

} // namespace

auto decode_frame(std::string_view text) -> Result<Frame> {
  auto parsed = parse_json(text);
  if (!parsed) {
    return fail(parsed.error());
  }
  const auto &root = *parsed;
  if (!root.is_object()) {
    return fail(Error::ProtocolError);
  }

  auto raw_op = json::get_int(root, "op");
  if (!raw_op) {
    return fail(Error::ProtocolError);
  }
  auto op = to_opcode(*raw_op);
  if (!op) {
    log::debug("Ignoring frame with unknown opcode {}", *raw_op);
    return fail(Error::ProtocolError);
  }

  Frame frame;
  frame.op = *op;
  frame.sequence = json::get_int(root, "s");
  frame.event_name = json::get_string(root, "t");
  if (const auto *d = json::find(root, "d")) {
    frame.data = std::make_shared<const JsonValue>(*d);
  } else {
    frame.data = std::make_shared<const JsonValue>();
  }
  return frame;
}

auto encode(const OutgoingGatewayEvent &evt, const ClientProperties &props)
    -> Result<std::string> {
  return std::visit(
      [&](const auto &e) -> Result<std::string> {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Identify>) {
          return write(envelope(
              Opcode::Identify,
              wire::IdentifyData{
                  .token = e.token,
                  .properties = {.os = props.os,
                                 .browser = props.browser,
                                 .device = props.device},
                  .compress = false,
                  .shard = {e.shard.id, e.shard.count},
                  .intents = e.intents,
                  .large_threshold = e.large_threshold,
              }));
        } else if constexpr (std::is_same_v<T, Resume>) {
          return write(envelope(Opcode::Resume,
                                wire::ResumeData{.token = e.token,
                                                 .session_id = e.session_id,
                                                 .seq = e.sequence}));
        } else if constexpr (std::is_same_v<T, Heartbeat>) {
          // The server expects an explicit null before the first dispatch.
          constexpr auto kOpts = glz::opts{.skip_null_members = false};
          auto out = glz::write<kOpts>(wire::HeartbeatEnvelope{.d = e.sequence});
          if (!out) {
            return fail(Error::ParseError);
          }
          return ok(std::move(*out));
        } else {
          if (auto valid = e.validate(); !valid) {
            return fail(valid.error());
          }
          wire::RequestMembersData data{.guild_id = e.guild_id.str(),
                                        .query = e.query,
                                        .limit = e.limit,
                                        .presences = e.presences,
                                        .user_ids = std::nullopt,
                                        .nonce = e.nonce};
          if (!e.user_ids.empty()) {
            data.user_ids = e.user_ids |
                            std::views::transform(
                                [](Snowflake id) { return id.str(); }) |
                            std::ranges::to<std::vector<std::string>>();
          }
          return write(envelope(Opcode::RequestGuildMembers, std::move(data)));
        }
      },
      evt);
}

} // namespace shardline::gateway
