#pragma once

#include "shardline/core/error.hpp"
#include "shardline/gateway/event.hpp"
#include "shardline/gateway/opcode.hpp"
#include "shardline/util/json.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace shardline::gateway {

/// One decoded `{op, d, s, t}` envelope.
struct Frame {
  Opcode op{Opcode::Dispatch};
  std::optional<std::int64_t> sequence;
  std::optional<std::string> event_name;
  std::shared_ptr<const JsonValue> data;
};

struct ClientProperties {
  std::string os{"linux"};
  std::string browser{"shardline"};
  std::string device{"shardline"};
};

[[nodiscard]] auto decode_frame(std::string_view text) -> Result<Frame>;

[[nodiscard]] auto encode(const OutgoingGatewayEvent &evt,
                          const ClientProperties &props = {})
    -> Result<std::string>;

} // namespace shardline::gateway
