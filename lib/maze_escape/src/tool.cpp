#include "maze_escape/tool.hpp"

#include <filesystem>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/os.h>
#include <spdlog/spdlog.h>

#include "maze_escape/edge_list_graph.hpp"
#include "maze_escape/reachability.hpp"
#include "support/enum_mappings.hpp"
#include "support/maze_escape_exception.hpp"
#include "support/text.hpp"

namespace {
void dumpToDotFile(const EdgeListGraph &Graph) {
  auto DotFile = fmt::output_file("graph.dot");
  DotFile.print("{}", Graph.toDot());
  spdlog::info("wrote graph.dot");
}

[[nodiscard]] bool runGraph(const ToolOptions &Options, const Config &Conf,
                            std::string &Output) {
  const auto Graph = EdgeListGraph::load(Options.GraphPath);
  spdlog::info("Graph size: |V| = {}, |E| = {}", Graph.getVertexCount(),
               Graph.getEdgeCount());
  const auto Algorithms = getRequestedAlgorithms(Conf, Options.AlgorithmName);

  if (Conf.EnableDotOutput) {
    dumpToDotFile(Graph);
  }

  if (!Options.QueriesPath.empty()) {
    const auto Queries =
        parseSearchQueries(readTextFile(Options.QueriesPath, "Queries"));
    return searchAllAndPrint(Graph, Queries, Graph.weightFunction(), Conf,
                             Algorithms, Output);
  }

  MazeEscapeException::verify(!Options.From.empty() && !Options.To.empty(),
                              "-from and -to are required for -graph");
  MazeEscapeException::verify(Graph.contains(Options.From),
                              "no vertex named {} in {}", Options.From,
                              Options.GraphPath);
  MazeEscapeException::verify(Graph.contains(Options.To),
                              "no vertex named {} in {}", Options.To,
                              Options.GraphPath);

  if (Conf.EnableAdjacencyListOutput) {
    Output += formatAdjacencyList(Graph, Options.From);
  }

  return searchAndPrint(Graph, Options.From, Options.To,
                        Graph.weightFunction(), Conf, Algorithms, Output);
}

[[nodiscard]] bool runMaze(const ToolOptions &Options, const Config &Conf,
                           std::string &Output) {
  MazeEscapeException::verify(Options.QueriesPath.empty(),
                              "-queries is only supported with -graph");
  const auto Grid = GridGraph::load(Options.MazePath);
  spdlog::info("Maze size: {}x{}", Grid.getRows(), Grid.getColumns());
  const auto Algorithms = getRequestedAlgorithms(Conf, Options.AlgorithmName);

  const auto Start = getEndpoint("from", Options.From, Grid.getStart(),
                                 GridGraph::StartSymbol, Grid);
  const auto Target = getEndpoint("to", Options.To, Grid.getExit(),
                                  GridGraph::ExitSymbol, Grid);

  if (Conf.EnableAdjacencyListOutput) {
    Output += formatAdjacencyList(Grid, Start);
  }

  return searchAndPrint(Grid, Start, Target, WeightFunction<Cell>{unitWeight},
                        Conf, Algorithms, Output,
                        [&Grid, &Output](const Path<Cell> &Route) {
                          Output += Grid.render(Route);
                        });
}
} // namespace

std::vector<SearchAlgorithm>
getRequestedAlgorithms(const Config &Conf, const std::string_view AlgorithmName) {
  if (Conf.EnableAllAlgorithms) {
    return {SearchAlgorithm::DepthFirst, SearchAlgorithm::BreadthFirst,
            SearchAlgorithm::Dijkstra};
  }
  const auto Algorithm = fromString<SearchAlgorithm>(AlgorithmName);
  MazeEscapeException::verify(Algorithm.has_value(),
                              "unknown search algorithm '{}'", AlgorithmName);
  return {*Algorithm};
}

Cell getEndpoint(const std::string_view OptionName,
                 const std::string_view Value,
                 const std::optional<Cell> &Marked, const char Marker,
                 const GridGraph &Grid) {
  if (Value.empty()) {
    MazeEscapeException::verify(Marked.has_value(),
                                "maze has no '{}' marker and -{} is missing",
                                Marker, OptionName);
    return *Marked;
  }

  const auto Position = parseCell(Value);
  MazeEscapeException::verify(Position.has_value(),
                              "-{}: expected 'row,col', got '{}'", OptionName,
                              Value);
  MazeEscapeException::verify(Grid.contains(*Position),
                              "-{}: {} is outside the maze", OptionName,
                              *Position);
  return *Position;
}

ExitCode runTool(const ToolOptions &Options, std::string &Output,
                 std::string &Errors) {
  try {
    auto Conf = Options.ConfigPath.empty()
                    ? Options.Conf
                    : Config::parse(Options.ConfigPath);
    spdlog::debug("config:\n{}", Conf);

    if (!Options.DumpConfigPath.empty()) {
      Conf.save(Options.DumpConfigPath);
    }

    MazeEscapeException::verify(
        Options.GraphPath.empty() != Options.MazePath.empty(),
        "exactly one of -graph and -maze is required");

    const auto Found = Options.GraphPath.empty()
                           ? runMaze(Options, Conf, Output)
                           : runGraph(Options, Conf, Output);
    return Found ? ExitCode::Found : ExitCode::NotFound;
  } catch (const MazeEscapeException &Error) {
    fmt::format_to(std::back_inserter(Errors), "error: {}\n", Error.what());
    return ExitCode::InputError;
  }
}
