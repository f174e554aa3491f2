#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace shardline::gateway {

/// Resume bookkeeping for one shard. Owned and mutated by its connection.
struct SessionState {
  std::optional<std::string> session_id;
  std::optional<std::int64_t> sequence;
  std::optional<std::string> resume_url;

  [[nodiscard]] auto can_resume() const noexcept -> bool {
    return session_id.has_value() && sequence.has_value();
  }

  auto reset() noexcept -> void {
    session_id.reset();
    sequence.reset();
    resume_url.reset();
  }
};

} // namespace shardline::gateway
