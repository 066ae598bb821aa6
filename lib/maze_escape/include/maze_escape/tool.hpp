#ifndef maze_escape_lib_maze_escape_include_maze_escape_tool_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_tool_hpp

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>
#include <spdlog/spdlog.h>

#include "maze_escape/batch_search.hpp"
#include "maze_escape/config.hpp"
#include "maze_escape/grid_graph.hpp"
#include "maze_escape/neighbor_source.hpp"
#include "maze_escape/path.hpp"
#include "maze_escape/search.hpp"

enum class ExitCode {
  Found = 0,
  NotFound = 1,
  InputError = 2,
};

struct ToolOptions {
  std::string GraphPath{};
  std::string MazePath{};
  std::string QueriesPath{};
  std::string From{};
  std::string To{};
  std::string AlgorithmName{"dijkstra"};
  std::string ConfigPath{};
  std::string DumpConfigPath{};
  // used when ConfigPath is empty
  Config Conf{};
};

[[nodiscard]] std::vector<SearchAlgorithm>
getRequestedAlgorithms(const Config &Conf, std::string_view AlgorithmName);

// The value of -from/-to for a maze: "row,col" inside the maze, or the marker
// when the option was not given.
[[nodiscard]] Cell getEndpoint(std::string_view OptionName,
                               std::string_view Value,
                               const std::optional<Cell> &Marked, char Marker,
                               const GridGraph &Grid);

// DFS and BFS leave the weight at 0
template <Vertex VertexType>
void applyPathWeight(Path<VertexType> &Route, const SearchAlgorithm Algorithm,
                     const WeightFunction<VertexType> &WeightFn,
                     const Config &Conf) {
  if (Conf.EnableRecalculateWeight && Algorithm != SearchAlgorithm::Dijkstra) {
    Route.recalculateTotalWeight(WeightFn);
  }
}

template <Vertex VertexType>
void printResult(std::string &Output, const SearchAlgorithm Algorithm,
                 const VertexType &Start, const VertexType &Target,
                 const std::optional<Path<VertexType>> &Result,
                 const Config &Conf) {
  if (!Result) {
    fmt::format_to(std::back_inserter(Output), "{}: no path from {} to {}\n",
                   Algorithm, Start, Target);
    return;
  }
  fmt::format_to(std::back_inserter(Output), "{}: {}\n", Algorithm,
                 toString(*Result, Conf.PathDisplayCut));
}

// one line per algorithm, returns whether every search found a path
template <Vertex VertexType, NeighborSource<VertexType> GraphType>
[[nodiscard]] bool searchAndPrint(
    const GraphType &Graph, const VertexType &Start, const VertexType &Target,
    const std::type_identity_t<WeightFunction<VertexType>> &WeightFn,
    const Config &Conf, const std::vector<SearchAlgorithm> &Algorithms,
    std::string &Output,
    const std::type_identity_t<std::function<void(const Path<VertexType> &)>>
        &OnFound = {}) {
  auto AllFound = true;
  for (const auto Algorithm : Algorithms) {
    auto Result = runSearch(Graph, Algorithm, Start, Target, WeightFn);
    if (Result) {
      applyPathWeight(*Result, Algorithm, WeightFn, Conf);
    }
    printResult(Output, Algorithm, Start, Target, Result, Conf);
    if (!Result) {
      AllFound = false;
      continue;
    }
    if (OnFound) {
      OnFound(*Result);
    }
  }
  return AllFound;
}

template <Vertex VertexType, NeighborSource<VertexType> GraphType>
[[nodiscard]] bool searchAllAndPrint(
    const GraphType &Graph, const std::vector<SearchQuery<VertexType>> &Queries,
    const std::type_identity_t<WeightFunction<VertexType>> &WeightFn,
    const Config &Conf, const std::vector<SearchAlgorithm> &Algorithms,
    std::string &Output) {
  auto AllFound = true;
  for (const auto Algorithm : Algorithms) {
    auto Results = searchAll(Graph, Queries, Algorithm, WeightFn,
                             Conf.MaxBatchConcurrency);
    spdlog::info("{}: found {} of {} paths", Algorithm,
                 ranges::count_if(Results,
                                  [](const auto &Result) {
                                    return Result.has_value();
                                  }),
                 Results.size());

    for (std::size_t Index = 0U; Index < Results.size(); ++Index) {
      auto &Result = Results[Index];
      const auto &[Start, Target] = Queries[Index];
      if (Result) {
        applyPathWeight(*Result, Algorithm, WeightFn, Conf);
      } else {
        AllFound = false;
      }
      printResult(Output, Algorithm, Start, Target, Result, Conf);
    }
  }
  return AllFound;
}

// Loads the config and the graph or maze named by Options, runs the requested
// searches and appends what the tool prints to Output. Input errors are
// appended to Errors.
[[nodiscard]] ExitCode runTool(const ToolOptions &Options, std::string &Output,
                               std::string &Errors);

#endif
