#ifndef maze_escape_lib_support_include_support_ranges_ranges_hpp
#define maze_escape_lib_support_include_support_ranges_ranges_hpp

#include <utility>

#include <range/v3/range/concepts.hpp>
#include <range/v3/view/subrange.hpp>

// boost graph accessors return iterator pairs
[[nodiscard]] constexpr ranges::viewable_range auto toRange(auto Pair) {
  auto [first, second] = Pair;
  return ranges::subrange{std::move(first), std::move(second)};
}

#endif
