#include <memory>
#include <string>

#include <fmt/core.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Signals.h>
#include <spdlog/cfg/env.h>
#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include "maze_escape/tool.hpp"

// NOLINTBEGIN
using namespace llvm::cl;

static OptionCategory ToolCategory("maze_escape");
static opt<std::string> GraphPath("graph", desc("Edge list file to search"),
                                  Optional, ValueRequired, cat(ToolCategory));
static opt<std::string> MazePath("maze", desc("Maze file to search"),
                                 Optional, ValueRequired, cat(ToolCategory));
static opt<std::string> QueriesPath(
    "queries", desc("File with one 'from to' query per line (edge lists)"),
    Optional, ValueRequired, cat(ToolCategory));
static opt<std::string> From("from",
                             desc("Start vertex, 'row,col' for mazes"),
                             Optional, ValueRequired, cat(ToolCategory));
static opt<std::string> To("to", desc("Target vertex, 'row,col' for mazes"),
                           Optional, ValueRequired, cat(ToolCategory));
static opt<std::string> AlgorithmName(
    "algorithm", desc("Search algorithm: dfs, bfs or dijkstra"), Optional,
    ValueRequired, init("dijkstra"), cat(ToolCategory));
static opt<std::string> ConfigPath("config", desc("Config file path"),
                                   Optional, ValueRequired, cat(ToolCategory));
static opt<std::string> DumpConfigPath(
    "dump-config", desc("Write the effective config to this file"), Optional,
    ValueRequired, cat(ToolCategory));
// NOLINTEND

int main(int argc, const char **argv) {
  llvm::sys::PrintStackTraceOnErrorSignal(argv[0]);

  auto FileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "maze_escape_log.txt");
  FileSink->set_level(spdlog::level::trace);
  spdlog::default_logger()->sinks().push_back(FileSink);

  spdlog::cfg::load_env_levels();

  HideUnrelatedOptions(ToolCategory);
  ParseCommandLineOptions(argc, argv,
                          "maze_escape: find paths through graphs and mazes\n");

  const auto Options = ToolOptions{
      .GraphPath = GraphPath.getValue(),
      .MazePath = MazePath.getValue(),
      .QueriesPath = QueriesPath.getValue(),
      .From = From.getValue(),
      .To = To.getValue(),
      .AlgorithmName = AlgorithmName.getValue(),
      .ConfigPath = ConfigPath.getValue(),
      .DumpConfigPath = DumpConfigPath.getValue(),
  };

  auto Output = std::string{};
  auto Errors = std::string{};
  const auto Code = runTool(Options, Output, Errors);
  fmt::print("{}", Output);
  fmt::print(stderr, "{}", Errors);
  return static_cast<int>(Code);
}
