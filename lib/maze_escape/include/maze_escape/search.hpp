#ifndef maze_escape_lib_maze_escape_include_maze_escape_search_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_search_hpp

#include <array>
#include <optional>
#include <type_traits>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

#include "maze_escape/breadth_first_search.hpp"
#include "maze_escape/depth_first_search.hpp"
#include "maze_escape/dijkstra.hpp"
#include "maze_escape/neighbor_source.hpp"
#include "maze_escape/path.hpp"
#include "support/enum_mappings.hpp"

template <Vertex VertexType>
using SearchQuery = std::pair<VertexType, VertexType>;

enum class SearchAlgorithm {
  DepthFirst,
  BreadthFirst,
  Dijkstra,
};

template <> [[nodiscard]] constexpr auto enumeration<SearchAlgorithm>() {
  return std::array{
      EnumerationMappingType<SearchAlgorithm>{"dfs",
                                              SearchAlgorithm::DepthFirst},
      EnumerationMappingType<SearchAlgorithm>{"bfs",
                                              SearchAlgorithm::BreadthFirst},
      EnumerationMappingType<SearchAlgorithm>{"dijkstra",
                                              SearchAlgorithm::Dijkstra},
  };
}

template <> class fmt::formatter<SearchAlgorithm> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const SearchAlgorithm Val,
                                                format_context &Ctx) const {
    return fmt::format_to(Ctx.out(), "{}", ::toString(Val));
  }
};

// The weight function is only consulted by the weighted search.
template <Vertex VertexType, NeighborSource<VertexType> GraphType>
[[nodiscard]] std::optional<Path<VertexType>>
runSearch(const GraphType &Graph, const SearchAlgorithm Algorithm,
          const VertexType &Start, const VertexType &Target,
          const std::type_identity_t<WeightFunction<VertexType>> &WeightFn =
              {}) {
  switch (Algorithm) {
  case SearchAlgorithm::DepthFirst:
    return depthFirstSearch(Graph, Start, Target);
  case SearchAlgorithm::BreadthFirst:
    return breadthFirstSearch(Graph, Start, Target);
  case SearchAlgorithm::Dijkstra:
    return dijkstraShortestPath(Graph, Start, Target, WeightFn);
  }
  return std::nullopt;
}

#endif
