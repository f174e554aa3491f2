#pragma once

#include <cstdint>
#include <optional>

namespace shardline::gateway {

enum class Opcode : std::uint8_t {
  Dispatch = 0,
  Heartbeat = 1,
  Identify = 2,
  PresenceUpdate = 3,
  VoiceStateUpdate = 4,
  Resume = 6,
  Reconnect = 7,
  RequestGuildMembers = 8,
  InvalidSession = 9,
  Hello = 10,
  HeartbeatAck = 11,
};

[[nodiscard]] constexpr auto to_opcode(std::int64_t raw) noexcept
    -> std::optional<Opcode> {
  switch (raw) {
  case 0:
  case 1:
  case 2:
  case 3:
  case 4:
  case 6:
  case 7:
  case 8:
  case 9:
  case 10:
  case 11:
    return static_cast<Opcode>(raw);
  default:
    return std::nullopt;
  }
}

/// Close codes the server uses to reject a session outright.
enum class CloseCode : std::uint16_t {
  Normal = 1000,
  GoingAway = 1001,
  UnknownError = 4000,
  UnknownOpcode = 4001,
  DecodeError = 4002,
  NotAuthenticated = 4003,
  AuthenticationFailed = 4004,
  AlreadyAuthenticated = 4005,
  InvalidSequence = 4007,
  RateLimited = 4008,
  SessionTimedOut = 4009,
  InvalidShard = 4010,
  ShardingRequired = 4011,
  InvalidApiVersion = 4012,
  InvalidIntents = 4013,
  DisallowedIntents = 4014,
};

/// Close code sent when the client drops a session it wants to resume.
/// Anything outside 1000/1001 keeps the session alive server-side.
inline constexpr std::uint16_t kResumableCloseCode = 4900;

} // namespace shardline::gateway
