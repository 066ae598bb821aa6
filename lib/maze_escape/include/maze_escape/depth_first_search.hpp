#ifndef maze_escape_lib_maze_escape_include_maze_escape_depth_first_search_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_depth_first_search_hpp

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "maze_escape/neighbor_source.hpp"
#include "maze_escape/path.hpp"

namespace detail {
template <Vertex VertexType> struct DepthFirstFrame {
  VertexType Vert;
  std::vector<VertexType> Neighbors;
  std::size_t NextNeighbor = 0U;
};
} // namespace detail

// Backtracking search returning the first path found in neighbor order. The
// result is not necessarily the shortest. Vertices that were backtracked away
// from stay in the visited set of the result.
template <Vertex VertexType, NeighborSource<VertexType> GraphType>
[[nodiscard]] std::optional<Path<VertexType>>
depthFirstSearch(const GraphType &Graph, const VertexType &Start,
                 const VertexType &Target) {
  if (isAbsent(Start) || isAbsent(Target)) {
    return std::nullopt;
  }

  using FrameType = detail::DepthFirstFrame<VertexType>;

  auto Visited = VertexSet<VertexType>{};
  // the frames double as the path so far
  auto Frames = std::vector<FrameType>{};

  const auto Finish = [&Frames, &Visited]() {
    return Path<VertexType>{
        Frames | ranges::views::transform(&FrameType::Vert) |
            ranges::to<typename Path<VertexType>::container_type>(),
        Visited};
  };

  Visited.insert(Start);
  Frames.push_back(FrameType{Start, {}});
  if (Start == Target) {
    return Finish();
  }
  Frames.back().Neighbors = collectNeighbors(Graph, Start);

  while (!Frames.empty()) {
    auto &Top = Frames.back();
    if (Top.NextNeighbor == Top.Neighbors.size()) {
      // every neighbor failed, backtrack
      Frames.pop_back();
      continue;
    }

    auto Neighbor = Top.Neighbors[Top.NextNeighbor++];
    if (!Visited.insert(Neighbor).second) {
      continue;
    }

    Frames.push_back(FrameType{std::move(Neighbor), {}});
    if (Frames.back().Vert == Target) {
      return Finish();
    }
    Frames.back().Neighbors = collectNeighbors(Graph, Frames.back().Vert);
  }

  spdlog::trace("depthFirstSearch: target not reachable, visited {} vertices",
                Visited.size());
  return std::nullopt;
}

#endif
