#ifndef maze_escape_lib_maze_escape_include_maze_escape_breadth_first_search_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_breadth_first_search_hpp

#include <optional>
#include <queue>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "maze_escape/neighbor_source.hpp"
#include "maze_escape/path.hpp"

// Level-order search returning a path with the minimum number of edges. The
// target is recognized as a neighbor of the vertex being expanded, so the
// search stops before any vertex further away is expanded.
template <Vertex VertexType, NeighborSource<VertexType> GraphType>
[[nodiscard]] std::optional<Path<VertexType>>
breadthFirstSearch(const GraphType &Graph, const VertexType &Start,
                   const VertexType &Target) {
  if (isAbsent(Start) || isAbsent(Target)) {
    return std::nullopt;
  }

  // the target is part of every found path, so it is registered up front
  auto Visited = VertexSet<VertexType>{Target};

  if (Start == Target) {
    return Path<VertexType>{{Target}, std::move(Visited)};
  }

  // start is discovered without a preceding vertex
  auto DiscoveredFrom =
      std::unordered_map<VertexType, std::optional<VertexType>>{};
  DiscoveredFrom.emplace(Start, std::nullopt);

  auto Queue = std::queue<VertexType>{};
  Queue.push(Start);

  while (!Queue.empty()) {
    const auto Current = Queue.front();
    Queue.pop();
    Visited.insert(Current);

    for (const VertexType &Neighbor : collectNeighbors(Graph, Current)) {
      if (Neighbor == Target) {
        auto Vertices = typename Path<VertexType>::container_type{Target};
        for (auto Step = std::optional<VertexType>{Current}; Step.has_value();
             Step = DiscoveredFrom.at(*Step)) {
          Vertices.push_front(*Step);
        }
        return Path<VertexType>{std::move(Vertices), std::move(Visited)};
      }

      if (!DiscoveredFrom.contains(Neighbor)) {
        DiscoveredFrom.emplace(Neighbor, Current);
        Queue.push(Neighbor);
      }
    }
  }

  spdlog::trace("breadthFirstSearch: target not reachable, visited {} vertices",
                Visited.size());
  return std::nullopt;
}

#endif
