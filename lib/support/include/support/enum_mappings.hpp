#ifndef maze_escape_lib_support_include_support_enum_mappings_hpp
#define maze_escape_lib_support_include_support_enum_mappings_hpp

#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include <range/v3/algorithm/find.hpp>
#include <range/v3/range/access.hpp>

template <typename T>
using EnumerationMappingType = std::pair<std::string_view, T>;

template <typename T> [[nodiscard]] constexpr auto enumeration() = delete;

template <typename T>
  requires std::is_enum_v<T>
[[nodiscard]] constexpr std::optional<T>
fromString(const std::string_view Name) {
  constexpr auto Mappings = enumeration<T>();
  const auto Iter =
      ranges::find(Mappings, Name, &EnumerationMappingType<T>::first);
  if (Iter == ranges::end(Mappings)) {
    return std::nullopt;
  }
  return Iter->second;
}

template <typename T>
  requires std::is_enum_v<T>
[[nodiscard]] constexpr std::string_view toString(const T Value) {
  constexpr auto Mappings = enumeration<T>();
  const auto Iter =
      ranges::find(Mappings, Value, &EnumerationMappingType<T>::second);
  if (Iter == ranges::end(Mappings)) {
    return "<unknown>";
  }
  return Iter->first;
}

#endif
