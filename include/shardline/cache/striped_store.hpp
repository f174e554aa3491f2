#pragma once

#include "shardline/util/snowflake.hpp"

#include <ankerl/unordered_dense.h>

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace shardline::cache {

/// Copy-on-write map keyed by Snowflake, split into stripes.
///
/// Readers load the stripe's current snapshot and never lock. Writers take
/// the stripe mutex, copy the snapshot, apply one whole-value replacement
/// and publish the copy. Writes to one key are therefore serialized, and a
/// reader sees either the old value or the new one.
template <typename V> class StripedStore {
public:
  using Map = ankerl::unordered_dense::map<Snowflake, V>;
  static constexpr std::size_t kStripes = 64;

  [[nodiscard]] auto get(Snowflake id) const -> std::optional<V> {
    auto snap = stripe(id).map.load(std::memory_order_acquire);
    auto it = snap->find(id);
    if (it == snap->end()) {
      return std::nullopt;
    }
    return it->second;
  }

  [[nodiscard]] auto contains(Snowflake id) const -> bool {
    auto snap = stripe(id).map.load(std::memory_order_acquire);
    return snap->contains(id);
  }

  /// Returns the value that was replaced, if any.
  auto put(Snowflake id, V value) -> std::optional<V> {
    return write(id, [&](Map &m) -> std::optional<V> {
      std::optional<V> prev;
      if (auto it = m.find(id); it != m.end()) {
        prev = std::move(it->second);
      }
      m.insert_or_assign(id, std::move(value));
      return prev;
    });
  }

  auto erase(Snowflake id) -> std::optional<V> {
    return write(id, [&](Map &m) -> std::optional<V> {
      auto it = m.find(id);
      if (it == m.end()) {
        return std::nullopt;
      }
      std::optional<V> prev{std::move(it->second)};
      m.erase(it);
      return prev;
    });
  }

  /// Atomic read-modify-write of one key. `fn(const V *current)` returns the
  /// replacement, or nullopt to leave the entry untouched. Returns the
  /// previous and the stored value.
  template <typename F>
  auto update(Snowflake id, F &&fn)
      -> std::pair<std::optional<V>, std::optional<V>> {
    auto &s = stripe(id);
    std::lock_guard lock(s.write_mutex);
    auto current = s.map.load(std::memory_order_acquire);

    std::optional<V> prev;
    if (auto it = current->find(id); it != current->end()) {
      prev = it->second;
    }
    std::optional<V> next = fn(prev ? &*prev : nullptr);
    if (!next) {
      return {std::move(prev), std::nullopt};
    }
    auto copy = std::make_shared<Map>(*current);
    copy->insert_or_assign(id, *next);
    s.map.store(std::shared_ptr<const Map>(std::move(copy)),
                std::memory_order_release);
    return {std::move(prev), std::move(next)};
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::size_t total = 0;
    for (const auto &s : stripes_) {
      total += s.map.load(std::memory_order_acquire)->size();
    }
    return total;
  }

  [[nodiscard]] auto values() const -> std::vector<V> {
    std::vector<V> out;
    for (const auto &s : stripes_) {
      auto snap = s.map.load(std::memory_order_acquire);
      for (const auto &[_, v] : *snap) {
        out.push_back(v);
      }
    }
    return out;
  }

  auto clear() -> void {
    for (auto &s : stripes_) {
      std::lock_guard lock(s.write_mutex);
      s.map.store(std::make_shared<const Map>(), std::memory_order_release);
    }
  }

private:
  struct alignas(64) Stripe {
    std::atomic<std::shared_ptr<const Map>> map{std::make_shared<const Map>()};
    std::mutex write_mutex;
  };

  template <typename F> auto write(Snowflake id, F &&mutate) {
    auto &s = stripe(id);
    std::lock_guard lock(s.write_mutex);
    auto copy = std::make_shared<Map>(*s.map.load(std::memory_order_acquire));
    auto result = mutate(*copy);
    s.map.store(std::shared_ptr<const Map>(std::move(copy)),
                std::memory_order_release);
    return result;
  }

  [[nodiscard]] auto stripe(Snowflake id) const -> const Stripe & {
    return stripes_[index_of(id)];
  }
  [[nodiscard]] auto stripe(Snowflake id) -> Stripe & {
    return stripes_[index_of(id)];
  }
  [[nodiscard]] static auto index_of(Snowflake id) noexcept -> std::size_t {
    return ankerl::unordered_dense::hash<std::uint64_t>{}(id.value()) %
           kStripes;
  }

  std::array<Stripe, kStripes> stripes_;
};

} // namespace shardline::cache
