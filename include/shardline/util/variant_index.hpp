#pragma once

#include <cstddef>
#include <type_traits>
#include <variant>

namespace shardline::util {

template <typename T, typename Variant> struct variant_index;

template <typename T, typename... Ts>
struct variant_index<T, std::variant<Ts...>> {
  static_assert((std::is_same_v<T, Ts> || ...),
                "type is not an alternative of the variant");
  static constexpr std::size_t value = [] {
    std::size_t i = 0;
    (void)((std::is_same_v<T, Ts> ? true : (++i, false)) || ...);
    return i;
  }();
};

template <typename T, typename Variant>
inline constexpr std::size_t variant_index_v = variant_index<T, Variant>::value;

} // namespace shardline::util
