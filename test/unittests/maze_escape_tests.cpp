#include "maze_escape_tests.hpp"

#include <source_location>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "maze_escape/edge_list_graph.hpp"

std::string toString(const std::source_location &Loc) {
  return fmt::format("Source: {}:{}:{}", Loc.file_name(), Loc.line(),
                     Loc.column());
}

EdgeListGraph makeGraph(const std::string_view Text) {
  spdlog::trace("makeGraph:\n{}", Text);
  return EdgeListGraph::parse(Text);
}

EdgeListGraph makeCycleGraph() {
  return makeGraph(R"(
A -> B
B -> C
C -> D
D -> A
E
)");
}

EdgeListGraph makeDiamondGraph() {
  return makeGraph(R"(
A -> B : 5
A -> C : 1
B -> D : 1
C -> D : 1
)");
}
