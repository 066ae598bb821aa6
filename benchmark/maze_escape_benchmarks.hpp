#ifndef maze_escape_benchmark_maze_escape_benchmarks_hpp
#define maze_escape_benchmark_maze_escape_benchmarks_hpp

#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>

#include <benchmark/benchmark.h>

#include "maze_escape/breadth_first_search.hpp"
#include "maze_escape/depth_first_search.hpp"
#include "maze_escape/dijkstra.hpp"
#include "maze_escape/edge_list_graph.hpp"
#include "maze_escape/grid_graph.hpp"
#include "maze_escape/reachability.hpp"

// Size x Size cells with a wall on every other column, leaving a gap
// alternately at the bottom and at the top. Size has to be odd for the exit
// to be open.
[[nodiscard]] inline GridGraph makeSerpentineGrid(const std::size_t Size) {
  auto Grid = GridGraph{Size, Size};
  for (std::size_t Column = 1U; Column < Size; Column += 2U) {
    const auto Gap = (Column / 2U) % 2U == 0U ? Size - 1U : 0U;
    for (std::size_t Row = 0U; Row < Size; ++Row) {
      if (Row != Gap) {
        Grid.addWall(Cell{Row, Column});
      }
    }
  }
  Grid.setStart(Cell{0U, 0U});
  Grid.setExit(Cell{Size - 1U, Size - 1U});
  return Grid;
}

template <typename GraphType, typename VertexType>
void setupCounters(benchmark::State &State, const GraphType &Graph,
                   const VertexType &Start) {
  State.counters["vertices"] =
      static_cast<double>(getAllVertices(Graph, Start).size());
}

template <typename PathType>
void setupPathCounters(benchmark::State &State, const PathType &Found) {
  if (!Found) {
    State.SkipWithError("no path");
    return;
  }
  State.counters["length"] = static_cast<double>(Found->size());
  State.counters["visited"] = static_cast<double>(Found->getVisited().size());
}

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define BENCHMARK_SEARCH(Search)                                               \
  std::optional<Path<std::decay_t<decltype(Start)>>> Found{};                  \
  for (auto _ : State) {                                                       \
    Found = Search;                                                            \
    benchmark::DoNotOptimize(Found);                                           \
    benchmark::ClobberMemory();                                                \
  }                                                                            \
  setupPathCounters(State, Found);

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define GENERATE_SEARCH_BENCHMARKS(Name, Setup, Args)                          \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  using Name = benchmark::Fixture;                                             \
  BENCHMARK_DEFINE_F(Name, dfs)                                                \
  (benchmark::State & State) {                                                 \
    Setup;                                                                     \
    BENCHMARK_SEARCH(depthFirstSearch(Graph, Start, Target))                   \
  }                                                                            \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  BENCHMARK_REGISTER_F(Name, dfs) Args;                                        \
  BENCHMARK_DEFINE_F(Name, bfs)                                                \
  (benchmark::State & State) {                                                 \
    Setup;                                                                     \
    BENCHMARK_SEARCH(breadthFirstSearch(Graph, Start, Target))                 \
  }                                                                            \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  BENCHMARK_REGISTER_F(Name, bfs) Args;                                        \
  BENCHMARK_DEFINE_F(Name, dijkstra)                                           \
  (benchmark::State & State) {                                                 \
    Setup;                                                                     \
    BENCHMARK_SEARCH(dijkstraShortestPath(Graph, Start, Target, WeightFn))     \
  }                                                                            \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  BENCHMARK_REGISTER_F(Name, dijkstra) Args;

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define SETUP_GRID(MakeGrid)                                                   \
  const auto Graph = MakeGrid(static_cast<std::size_t>(State.range(0)));       \
  const auto Start = *Graph.getStart();                                        \
  const auto Target = *Graph.getExit();                                        \
  const auto WeightFn = WeightFunction<Cell>{unitWeight};                      \
  setupCounters(State, Graph, Start);                                          \
  State.SetComplexityN(State.range(0) * State.range(0))

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define SETUP_GENERATED(Generator)                                             \
  const auto [Query, Text] = Generator(static_cast<size_t>(State.range(0)));   \
  const auto Graph = EdgeListGraph::parse(Text);                               \
  const auto Start = Query.first;                                              \
  const auto Target = Query.second;                                            \
  const auto WeightFn = Graph.weightFunction();                                \
  setupCounters(State, Graph, Start);                                          \
  State.SetComplexityN(static_cast<std::int64_t>(Graph.getEdgeCount()))

#endif
