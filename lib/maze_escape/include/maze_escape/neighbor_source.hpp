#ifndef maze_escape_lib_maze_escape_include_maze_escape_neighbor_source_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_neighbor_source_hpp

#include <concepts>
#include <functional>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include <range/v3/range/concepts.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/range/traits.hpp>

#include "support/concepts.hpp"

template <typename T>
concept Vertex = std::copyable<T> && std::equality_comparable<T> && Hashable<T>;

template <Vertex VertexType> using VertexSet = std::unordered_set<VertexType>;

// an empty function counts as an absent weight function
template <Vertex VertexType>
using WeightFunction =
    std::function<double(const VertexType &, const VertexType &)>;

template <typename GraphType, typename VertexType>
using neighbor_range_t = decltype(std::declval<const GraphType &>().neighbors(
    std::declval<const VertexType &>()));

// Anything with a const `neighbors(vertex)` member returning a range of
// vertices. Directed graphs report outgoing neighbors only.
template <typename GraphType, typename VertexType>
concept NeighborSource =
    Vertex<VertexType> &&
    ranges::input_range<neighbor_range_t<GraphType, VertexType>> &&
    std::convertible_to<
        ranges::range_reference_t<neighbor_range_t<GraphType, VertexType>>,
        VertexType>;

template <typename NeighborFunctionType> class FunctionNeighborSource {
public:
  explicit FunctionNeighborSource(NeighborFunctionType NeighborFunction)
      : NeighborFunction_(std::move(NeighborFunction)) {}

  template <typename VertexType>
    requires std::invocable<const NeighborFunctionType &, const VertexType &>
  [[nodiscard]] decltype(auto) neighbors(const VertexType &From) const {
    return std::invoke(NeighborFunction_, From);
  }

private:
  NeighborFunctionType NeighborFunction_;
};

[[nodiscard]] auto makeNeighborSource(auto &&NeighborFunction) {
  return FunctionNeighborSource<std::decay_t<decltype(NeighborFunction)>>{
      std::forward<decltype(NeighborFunction)>(NeighborFunction)};
}

template <Vertex VertexType>
[[nodiscard]] constexpr bool isAbsent(const VertexType &Vert) {
  if constexpr (Nullable<VertexType>) {
    return Vert == nullptr;
  } else {
    return false;
  }
}

template <Vertex VertexType, NeighborSource<VertexType> GraphType>
[[nodiscard]] std::vector<VertexType> collectNeighbors(const GraphType &Graph,
                                                       const VertexType &From) {
  return Graph.neighbors(From) | ranges::to<std::vector<VertexType>>();
}

#endif
