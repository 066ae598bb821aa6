#include <cstddef>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "maze_escape/breadth_first_search.hpp"
#include "maze_escape/grid_graph.hpp"
#include "maze_escape/neighbor_source.hpp"
#include "maze_escape_tests.hpp"
#include "support/testcase_generation.hpp"

using namespace std::string_literals;

TEST_CASE("breadthFirstSearch on a 3x3 grid") {
  const auto Grid = GridGraph{3, 3};
  const auto Start = Cell{0, 0};
  const auto Target = Cell{2, 2};

  const auto Found = breadthFirstSearch(Grid, Start, Target);
  REQUIRE(Found.has_value());
  requireValidPath(Grid, *Found, Start, Target);
  REQUIRE(Found->size() == 5U);
  REQUIRE(Found->size() - 1U == getMinimumHopCount(Grid, Start, Target));
}

TEST_CASE("breadthFirstSearch start is target") {
  const auto Grid = GridGraph{3, 3};
  const auto Found = breadthFirstSearch(Grid, Cell{1, 1}, Cell{1, 1});
  REQUIRE(Found.has_value());
  REQUIRE(getVertexVector(*Found) == std::vector<Cell>{Cell{1, 1}});
  REQUIRE(Found->getVisited().contains(Cell{1, 1}));
  REQUIRE(Found->getTotalWeight() == 0.0);
}

TEST_CASE("breadthFirstSearch minimum hop count") {
  SECTION("diamond") {
    const auto Graph = makeDiamondGraph();
    const auto Found = breadthFirstSearch(Graph, "A"s, "D"s);
    REQUIRE(Found.has_value());
    requireValidPath(Graph, *Found, "A"s, "D"s);
    REQUIRE(getVertexVector(*Found) ==
            std::vector<std::string>{"A", "B", "D"});
  }

  SECTION("shortcut listed last") {
    const auto Graph = makeGraph(R"(
A -> B
B -> C
C -> D
A -> D
)");
    const auto Found = breadthFirstSearch(Graph, "A"s, "D"s);
    REQUIRE(Found.has_value());
    REQUIRE(getVertexVector(*Found) == std::vector<std::string>{"A", "D"});
  }

  SECTION("cycle") {
    const auto Graph = makeCycleGraph();
    const auto Found = breadthFirstSearch(Graph, "B"s, "A"s);
    REQUIRE(Found.has_value());
    requireValidPath(Graph, *Found, "B"s, "A"s);
    REQUIRE(getVertexVector(*Found) ==
            std::vector<std::string>{"B", "C", "D", "A"});
  }

  SECTION("generated graphs") {
    const auto RequireMinimal = [](const auto &Generator,
                                   const std::size_t NumRepetitions) {
      const auto &[Query, Text] = Generator(NumRepetitions);
      const auto &[Start, Target] = Query;
      const auto Graph = makeGraph(Text);

      const auto Found = breadthFirstSearch(Graph, Start, Target);
      REQUIRE(Found.has_value());
      requireValidPath(Graph, *Found, Start, Target);
      REQUIRE(Found->size() - 1U == getMinimumHopCount(Graph, Start, Target));
    };

    RequireMinimal(GenerateForkingPath, 1U);
    RequireMinimal(GenerateForkingPath, 3U);
    RequireMinimal(GenerateMultiForkingPath, 1U);
    RequireMinimal(GenerateMultiForkingPath, 3U);
  }

  SECTION("maze") {
    const auto Grid = GridGraph::parse(R"(S.#...
.##.#.
...#..
.#...E
)");
    const auto Start = *Grid.getStart();
    const auto Target = *Grid.getExit();
    const auto Found = breadthFirstSearch(Grid, Start, Target);
    REQUIRE(Found.has_value());
    requireValidPath(Grid, *Found, Start, Target);
    REQUIRE(Found->size() - 1U == getMinimumHopCount(Grid, Start, Target));
  }
}

TEST_CASE("breadthFirstSearch not found") {
  SECTION("walled off") {
    const auto Grid = GridGraph::parse(R"(S#.
.#.
.#E
)");
    REQUIRE_FALSE(
        breadthFirstSearch(Grid, *Grid.getStart(), *Grid.getExit())
            .has_value());
  }

  SECTION("isolated target") {
    REQUIRE_FALSE(breadthFirstSearch(makeCycleGraph(), "A"s, "E"s).has_value());
  }

  SECTION("unknown vertices") {
    REQUIRE_FALSE(breadthFirstSearch(makeCycleGraph(), "A"s, "Z"s).has_value());
    REQUIRE_FALSE(breadthFirstSearch(makeCycleGraph(), "Z"s, "A"s).has_value());
  }

  SECTION("absent vertices") {
    const auto Source = makeNeighborSource(
        [](const int * /*Vert*/) { return std::vector<const int *>{}; });
    const auto Value = 1;
    const auto *const Absent = static_cast<const int *>(nullptr);
    REQUIRE_FALSE(breadthFirstSearch(Source, Absent, &Value).has_value());
    REQUIRE_FALSE(breadthFirstSearch(Source, &Value, Absent).has_value());
    REQUIRE_FALSE(breadthFirstSearch(Source, Absent, Absent).has_value());
  }
}
