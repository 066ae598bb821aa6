#ifndef maze_escape_lib_support_include_support_concepts_hpp
#define maze_escape_lib_support_include_support_concepts_hpp

#include <concepts>
#include <cstddef>
#include <functional>
#include <type_traits>

template <typename T>
concept Hashable = requires(const T &Val) {
  { std::hash<T>{}(Val) } -> std::convertible_to<std::size_t>;
};

// raw and smart pointers, strings compare against nullptr as well but are
// never null
template <typename T>
concept Nullable = std::is_pointer_v<T> || requires(const T &Val) {
  requires std::is_pointer_v<decltype(Val.get())>;
  { Val == nullptr } -> std::convertible_to<bool>;
};

#endif
