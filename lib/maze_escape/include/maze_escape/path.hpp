#ifndef maze_escape_lib_maze_escape_include_maze_escape_path_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_path_hpp

#include <cstddef>
#include <deque>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/contains.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/drop.hpp>
#include <range/v3/view/transform.hpp>
#include <range/v3/view/zip.hpp>

#include "maze_escape/neighbor_source.hpp"
#include "support/maze_escape_exception.hpp"

inline constexpr std::size_t DefaultPathDisplayCut = 10U;

// A route discovered by one search call.
//
// Representation invariants:
// - consecutive vertices are neighbors in the searched graph
// - a path with one vertex has the same start and target
// - a path without vertices has neither start nor target
template <Vertex VertexType> class Path {
public:
  using vertex_type = VertexType;
  using container_type = std::deque<VertexType>;

  Path() = default;

  Path(container_type Vertices, VertexSet<VertexType> Visited,
       const double TotalWeight = 0.0)
      : Vertices_(std::move(Vertices)),
        Visited_(std::move(Visited)),
        TotalWeight_(TotalWeight) {}

  [[nodiscard]] const container_type &getVertices() const { return Vertices_; }

  // every vertex the producing search inspected, for analysis only
  [[nodiscard]] const VertexSet<VertexType> &getVisited() const {
    return Visited_;
  }

  [[nodiscard]] double getTotalWeight() const { return TotalWeight_; }

  [[nodiscard]] bool empty() const { return Vertices_.empty(); }

  [[nodiscard]] std::size_t size() const { return Vertices_.size(); }

  [[nodiscard]] std::optional<VertexType> getStart() const {
    if (Vertices_.empty()) {
      return std::nullopt;
    }
    return Vertices_.front();
  }

  [[nodiscard]] std::optional<VertexType> getTarget() const {
    if (Vertices_.empty()) {
      return std::nullopt;
    }
    return Vertices_.back();
  }

  // the first vertex has no predecessor and contributes no weight
  void recalculateTotalWeight(const WeightFunction<VertexType> &WeightFn) {
    MazeEscapeException::verify(static_cast<bool>(WeightFn),
                                "recalculateTotalWeight(): no weight function");
    TotalWeight_ = ranges::accumulate(
        ranges::views::zip(Vertices_, Vertices_ | ranges::views::drop(1)) |
            ranges::views::transform([&WeightFn](const auto &Segment) {
              const auto &[From, To] = Segment;
              return WeightFn(From, To);
            }),
        0.0);
  }

private:
  container_type Vertices_{};
  VertexSet<VertexType> Visited_{};
  double TotalWeight_ = 0.0;
};

template <Vertex VertexType, NeighborSource<VertexType> GraphType>
[[nodiscard]] bool isContiguous(const GraphType &Graph,
                                const Path<VertexType> &Route) {
  const auto &Vertices = Route.getVertices();
  return ranges::all_of(
      ranges::views::zip(Vertices, Vertices | ranges::views::drop(1)),
      [&Graph](const auto &Segment) {
        const auto &[From, To] = Segment;
        return ranges::contains(collectNeighbors(Graph, From), To);
      });
}

template <Vertex VertexType>
[[nodiscard]] bool visitedCoversPath(const Path<VertexType> &Route) {
  return ranges::all_of(Route.getVertices(),
                        [&Visited = Route.getVisited()](const VertexType &Vert) {
                          return Visited.contains(Vert);
                        });
}

namespace detail {
template <typename OutputIt, typename VertexType>
OutputIt formatPathTo(OutputIt Out, const Path<VertexType> &Route,
                      const std::size_t DisplayCut) {
  const auto &Vertices = Route.getVertices();
  const auto Length = Vertices.size();
  Out = fmt::format_to(Out, "Weight={:.2f} Length={} visited={} (",
                       Route.getTotalWeight(), Length,
                       Route.getVisited().size());

  // long paths show their head and tail only
  auto Separator = fmt::string_view{""};
  std::size_t Count = 0U;
  for (const auto &Vert : Vertices) {
    if (Count < DisplayCut || Count + DisplayCut + 1U > Length) {
      Out = fmt::format_to(Out, "{}{}", Separator, Vert);
      Separator = ", ";
    } else if (Count == DisplayCut) {
      Out = fmt::format_to(Out, "{}...", Separator);
    }
    ++Count;
  }
  return fmt::format_to(Out, ")");
}
} // namespace detail

template <Vertex VertexType>
[[nodiscard]] std::string
toString(const Path<VertexType> &Route,
         const std::size_t DisplayCut = DefaultPathDisplayCut) {
  auto Result = std::string{};
  detail::formatPathTo(std::back_inserter(Result), Route, DisplayCut);
  return Result;
}

template <typename VertexType> class fmt::formatter<Path<VertexType>> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const Path<VertexType> &Val,
                                                format_context &Ctx) const {
    return ::detail::formatPathTo(Ctx.out(), Val, DefaultPathDisplayCut);
  }
};

#endif
