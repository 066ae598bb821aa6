#ifndef maze_escape_lib_maze_escape_include_maze_escape_reachability_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_reachability_hpp

#include <concepts>
#include <iterator>
#include <stack>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/view/reverse.hpp>

#include "maze_escape/neighbor_source.hpp"

// Pre-order visit of the spanning tree rooted at Start. Every reachable vertex
// is handed to Visitor exactly once, together with its neighbors. An explicit
// stack keeps deep graphs off the call stack.
template <Vertex VertexType, NeighborSource<VertexType> GraphType,
          typename VisitorType>
  requires std::invocable<VisitorType &, const VertexType &,
                          const std::vector<VertexType> &>
void visitPreOrder(const GraphType &Graph, const VertexType &Start,
                   VisitorType &&Visitor) {
  if (isAbsent(Start)) {
    return;
  }

  auto Visited = VertexSet<VertexType>{};
  auto Pending = std::stack<VertexType>{};
  Pending.push(Start);

  while (!Pending.empty()) {
    const auto Current = Pending.top();
    Pending.pop();

    if (!Visited.insert(Current).second) {
      continue;
    }

    const auto Neighbors = collectNeighbors(Graph, Current);
    Visitor(Current, Neighbors);

    // reversed, so the first neighbor is expanded first
    ranges::for_each(Neighbors | ranges::views::reverse,
                     [&Pending](const VertexType &Neighbor) {
                       Pending.push(Neighbor);
                     });
  }
}

// Start and every vertex reachable from it. Directed graphs only follow
// outgoing edges.
template <Vertex VertexType, NeighborSource<VertexType> GraphType>
[[nodiscard]] VertexSet<VertexType> getAllVertices(const GraphType &Graph,
                                                   const VertexType &Start) {
  auto AllVertices = VertexSet<VertexType>{};
  visitPreOrder(Graph, Start,
                [&AllVertices](const VertexType &Vert,
                               const std::vector<VertexType> & /*Neighbors*/) {
                  AllVertices.insert(Vert);
                });
  return AllVertices;
}

// vertex1: [neighbour11, neighbour12, ...]
// vertex2: [neighbour21, neighbour22, ...]
template <Vertex VertexType, NeighborSource<VertexType> GraphType>
[[nodiscard]] std::string formatAdjacencyList(const GraphType &Graph,
                                              const VertexType &Start) {
  auto Result = std::string{"Graph adjacency list:\n"};
  visitPreOrder(Graph, Start,
                [&Result](const VertexType &Vert,
                          const std::vector<VertexType> &Neighbors) {
                  fmt::format_to(std::back_inserter(Result), "{}: [{}]\n",
                                 Vert, fmt::join(Neighbors, ", "));
                });
  return Result;
}

#endif
