#pragma once

#include "shardline/core/error.hpp"

#include <glaze/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace shardline {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

/// Field accessors over a decoded JSON object. Each returns nullopt when the
/// key is absent, null, or holds a different type.
namespace json {

[[nodiscard]] inline auto find(const JsonValue &obj, std::string_view key)
    -> const JsonValue * {
  const auto *map = std::get_if<JsonValue::object_t>(&obj.data);
  if (!map) {
    return nullptr;
  }
  auto it = map->find(key);
  if (it == map->end() || it->second.is_null()) {
    return nullptr;
  }
  return &it->second;
}

[[nodiscard]] inline auto as_int(const JsonValue &v) -> std::optional<std::int64_t> {
  return std::visit(
      [](const auto &x) -> std::optional<std::int64_t> {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
          return static_cast<std::int64_t>(x);
        } else {
          return std::nullopt;
        }
      },
      v.data);
}

[[nodiscard]] inline auto get_string(const JsonValue &obj, std::string_view key)
    -> std::optional<std::string> {
  const auto *v = find(obj, key);
  if (!v) {
    return std::nullopt;
  }
  if (const auto *s = std::get_if<std::string>(&v->data)) {
    return *s;
  }
  return std::nullopt;
}

[[nodiscard]] inline auto get_int(const JsonValue &obj, std::string_view key)
    -> std::optional<std::int64_t> {
  const auto *v = find(obj, key);
  return v ? as_int(*v) : std::nullopt;
}

[[nodiscard]] inline auto get_bool(const JsonValue &obj, std::string_view key)
    -> std::optional<bool> {
  const auto *v = find(obj, key);
  if (!v) {
    return std::nullopt;
  }
  if (const auto *b = std::get_if<bool>(&v->data)) {
    return *b;
  }
  return std::nullopt;
}

[[nodiscard]] inline auto get_array(const JsonValue &obj, std::string_view key)
    -> const JsonValue::array_t * {
  const auto *v = find(obj, key);
  return v ? std::get_if<JsonValue::array_t>(&v->data) : nullptr;
}

[[nodiscard]] inline auto get_object(const JsonValue &obj,
                                     std::string_view key) -> const JsonValue * {
  const auto *v = find(obj, key);
  return (v && v->is_object()) ? v : nullptr;
}

} // namespace json

} // namespace shardline
