#ifndef maze_escape_lib_maze_escape_include_maze_escape_dijkstra_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_dijkstra_hpp

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <queue>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "maze_escape/neighbor_source.hpp"
#include "maze_escape/path.hpp"

namespace detail {
// Node of the shortest path tree. Parents are indices into the node arena of
// the search that created the node.
template <Vertex VertexType> struct FrontierNode {
  VertexType Vert;
  double WeightSumTo{};
  std::optional<std::size_t> Parent{};
  // superseded by a cheaper node for the same vertex
  bool Stale = false;
};

// Nodes are indexed in creation order, so equal weights pop first-in
// first-out.
struct FrontierEntry {
  double WeightSumTo{};
  std::size_t NodeIndex{};

  [[nodiscard]] friend auto operator<=>(const FrontierEntry &,
                                        const FrontierEntry &) = default;
};

template <Vertex VertexType, NeighborSource<VertexType> GraphType>
class DijkstraSearch {
public:
  DijkstraSearch(const GraphType &Graph,
                 const WeightFunction<VertexType> &WeightFn)
      : Graph_(Graph),
        WeightFn_(WeightFn) {}

  [[nodiscard]] std::optional<Path<VertexType>>
  operator()(const VertexType &Start, const VertexType &Target) {
    addNode(Start, 0.0, std::nullopt);

    while (!Frontier_.empty()) {
      const auto Entry = Frontier_.top();
      Frontier_.pop();

      if (Nodes_[Entry.NodeIndex].Stale) {
        continue;
      }

      auto Current = Nodes_[Entry.NodeIndex].Vert;
      // only reachable with negative weights
      if (!Visited_.insert(Current).second) {
        continue;
      }

      if (Current == Target) {
        return commit(Entry.NodeIndex);
      }

      for (const VertexType &Neighbor : collectNeighbors(Graph_, Current)) {
        relax(Entry.NodeIndex, Neighbor);
      }
    }

    spdlog::trace("dijkstraShortestPath: target not reachable, created {} "
                  "frontier nodes for {} vertices",
                  Nodes_.size(), BestNode_.size());
    return std::nullopt;
  }

private:
  void addNode(const VertexType &Vert, const double WeightSumTo,
               const std::optional<std::size_t> Parent) {
    const auto NodeIndex = Nodes_.size();
    Nodes_.push_back(FrontierNode<VertexType>{Vert, WeightSumTo, Parent});
    BestNode_.insert_or_assign(Vert, NodeIndex);
    Frontier_.push(FrontierEntry{WeightSumTo, NodeIndex});
  }

  void relax(const std::size_t CurrentIndex, const VertexType &Neighbor) {
    const auto TentativeWeight =
        Nodes_[CurrentIndex].WeightSumTo +
        WeightFn_(Nodes_[CurrentIndex].Vert, Neighbor);

    const auto Iter = BestNode_.find(Neighbor);
    if (Iter == BestNode_.end()) {
      addNode(Neighbor, TentativeWeight, CurrentIndex);
      return;
    }

    if (auto &Known = Nodes_[Iter->second];
        TentativeWeight < Known.WeightSumTo) {
      Known.Stale = true;
      addNode(Neighbor, TentativeWeight, CurrentIndex);
    }
  }

  [[nodiscard]] Path<VertexType> commit(const std::size_t TargetIndex) {
    auto Vertices = typename Path<VertexType>::container_type{};
    for (auto Index = std::optional<std::size_t>{TargetIndex};
         Index.has_value(); Index = Nodes_[*Index].Parent) {
      Vertices.push_front(Nodes_[*Index].Vert);
    }
    return Path<VertexType>{std::move(Vertices), std::move(Visited_),
                            Nodes_[TargetIndex].WeightSumTo};
  }

  const GraphType &Graph_;
  const WeightFunction<VertexType> &WeightFn_;

  std::vector<FrontierNode<VertexType>> Nodes_{};
  std::priority_queue<FrontierEntry, std::vector<FrontierEntry>, std::greater<>>
      Frontier_{};
  std::unordered_map<VertexType, std::size_t> BestNode_{};
  VertexSet<VertexType> Visited_{};
};
} // namespace detail

// Minimum cumulative weight path for non-negative edge weights. Negative
// weights are not checked and may produce a non-optimal path. Equal-weight
// candidates are expanded in the order they were discovered.
template <Vertex VertexType, NeighborSource<VertexType> GraphType>
[[nodiscard]] std::optional<Path<VertexType>>
dijkstraShortestPath(const GraphType &Graph, const VertexType &Start,
                     const VertexType &Target,
                     const std::type_identity_t<WeightFunction<VertexType>>
                         &WeightFn) {
  if (isAbsent(Start) || isAbsent(Target) || !WeightFn) {
    return std::nullopt;
  }

  auto Search = detail::DijkstraSearch<VertexType, GraphType>{Graph, WeightFn};
  return Search(Start, Target);
}

#endif
