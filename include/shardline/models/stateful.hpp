#pragma once

#include "shardline/models/channel.hpp"
#include "shardline/models/guild.hpp"
#include "shardline/models/message.hpp"
#include "shardline/models/user.hpp"

#include <memory>
#include <utility>

namespace shardline {
class Client;
}

namespace shardline::models {

/// Read-only snapshot of a raw entity plus the client it came from. Cache
/// updates replace the snapshot wholesale, so a held wrapper keeps showing
/// the state it was created with.
template <typename Raw> class Stateful {
public:
  Stateful() = default;
  Stateful(std::shared_ptr<const Raw> raw, Client *client) noexcept
      : raw_(std::move(raw)), client_(client) {}

  [[nodiscard]] auto raw() const noexcept -> const Raw & { return *raw_; }
  [[nodiscard]] auto snapshot() const noexcept
      -> const std::shared_ptr<const Raw> & {
    return raw_;
  }
  [[nodiscard]] auto operator->() const noexcept -> const Raw * {
    return raw_.get();
  }
  [[nodiscard]] auto operator*() const noexcept -> const Raw & { return *raw_; }
  [[nodiscard]] explicit operator bool() const noexcept {
    return raw_ != nullptr;
  }

  /// Not owned; the client outlives every wrapper it hands out.
  [[nodiscard]] auto client() const noexcept -> Client * { return client_; }

  [[nodiscard]] auto id() const noexcept -> Snowflake { return raw_->id; }

private:
  std::shared_ptr<const Raw> raw_;
  Client *client_{nullptr};
};

using StatefulUser = Stateful<User>;
using StatefulMember = Stateful<Member>;
using StatefulChannel = Stateful<Channel>;
using StatefulGuild = Stateful<Guild>;
using StatefulMessage = Stateful<Message>;

} // namespace shardline::models
