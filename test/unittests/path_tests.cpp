#include <deque>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>

#include "maze_escape/dijkstra.hpp"
#include "maze_escape/path.hpp"
#include "maze_escape_tests.hpp"
#include "support/maze_escape_exception.hpp"

using namespace std::string_literals;

TEST_CASE("path accessors") {
  SECTION("empty") {
    const auto Route = Path<std::string>{};
    REQUIRE(Route.empty());
    REQUIRE(Route.size() == 0U);
    REQUIRE_FALSE(Route.getStart().has_value());
    REQUIRE_FALSE(Route.getTarget().has_value());
    REQUIRE(Route.getTotalWeight() == 0.0);
  }

  SECTION("single vertex") {
    const auto Route = Path<std::string>{{"A"}, {"A"}};
    REQUIRE(Route.size() == 1U);
    REQUIRE(Route.getStart() == "A"s);
    REQUIRE(Route.getTarget() == "A"s);
  }

  SECTION("several vertices") {
    const auto Route = Path<std::string>{{"A", "B", "C"}, {"A", "B", "C", "X"}, 4.5};
    REQUIRE(Route.size() == 3U);
    REQUIRE(Route.getStart() == "A"s);
    REQUIRE(Route.getTarget() == "C"s);
    REQUIRE(Route.getVisited().size() == 4U);
    REQUIRE(Route.getTotalWeight() == 4.5);
  }
}

TEST_CASE("recalculateTotalWeight") {
  const auto Graph = makeGraph(R"(
A -> B : 1.5
B -> C : 2.25
C -> D : 4
)");
  const auto WeightFn = Graph.weightFunction();

  SECTION("sums consecutive pairs") {
    auto Route = Path<std::string>{{"A", "B", "C", "D"}, {}};
    Route.recalculateTotalWeight(WeightFn);
    REQUIRE(Route.getTotalWeight() == Catch::Approx(7.75));
  }

  SECTION("single vertex weighs nothing") {
    auto Route = Path<std::string>{{"B"}, {}, 3.0};
    Route.recalculateTotalWeight(WeightFn);
    REQUIRE(Route.getTotalWeight() == 0.0);
  }

  SECTION("empty path weighs nothing") {
    auto Route = Path<std::string>{};
    Route.recalculateTotalWeight(WeightFn);
    REQUIRE(Route.getTotalWeight() == 0.0);
  }

  SECTION("agrees with the weighted search") {
    const auto Found =
        dijkstraShortestPath(Graph, "A"s, "D"s, WeightFn);
    REQUIRE(Found.has_value());
    auto Recalculated = *Found;
    Recalculated.recalculateTotalWeight(WeightFn);
    REQUIRE(Recalculated.getTotalWeight() ==
            Catch::Approx(Found->getTotalWeight()));
  }

  SECTION("absent weight function") {
    auto Route = Path<std::string>{{"A", "B"}, {}};
    REQUIRE_THROWS_AS(
        Route.recalculateTotalWeight(WeightFunction<std::string>{}),
        MazeEscapeException);
  }
}

TEST_CASE("path contiguity") {
  const auto Graph = makeCycleGraph();
  REQUIRE(isContiguous(Graph, Path<std::string>{{"A", "B", "C"}, {}}));
  REQUIRE(isContiguous(Graph, Path<std::string>{{"D", "A"}, {}}));
  REQUIRE(isContiguous(Graph, Path<std::string>{{"E"}, {}}));
  REQUIRE_FALSE(isContiguous(Graph, Path<std::string>{{"A", "C"}, {}}));
  REQUIRE_FALSE(isContiguous(Graph, Path<std::string>{{"B", "A"}, {}}));
}

TEST_CASE("visited covers path") {
  REQUIRE(visitedCoversPath(Path<std::string>{{"A", "B"}, {"A", "B", "C"}}));
  REQUIRE_FALSE(visitedCoversPath(Path<std::string>{{"A", "B"}, {"A"}}));
}

TEST_CASE("path formatting") {
  SECTION("short path") {
    const auto Route = Path<std::string>{{"A", "B"}, {"A", "B", "C"}, 2.0};
    REQUIRE(fmt::format("{}", Route) ==
            "Weight=2.00 Length=2 visited=3 (A, B)");
  }

  SECTION("empty path") {
    REQUIRE(fmt::format("{}", Path<std::string>{}) ==
            "Weight=0.00 Length=0 visited=0 ()");
  }

  SECTION("long path is cut in the middle") {
    const auto Route =
        Path<int>{{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {}, 1.0 / 3.0};
    REQUIRE(toString(Route, 3U) ==
            "Weight=0.33 Length=10 visited=0 (0, 1, 2, ..., 7, 8, 9)");
  }

  SECTION("path of twice the cut is shown in full") {
    const auto Route = Path<int>{{0, 1, 2, 3, 4, 5}, {}};
    REQUIRE(toString(Route, 3U) ==
            "Weight=0.00 Length=6 visited=0 (0, 1, 2, 3, 4, 5)");
  }

  SECTION("default cut") {
    auto Vertices = Path<int>::container_type{};
    for (auto Index = 0; Index < 25; ++Index) {
      Vertices.push_back(Index);
    }
    const auto Route = Path<int>{Vertices, {}};
    REQUIRE(fmt::format("{}", Route) ==
            "Weight=0.00 Length=25 visited=0 (0, 1, 2, 3, 4, 5, 6, 7, 8, 9, "
            "..., 15, 16, 17, 18, 19, 20, 21, 22, 23, 24)");
  }
}
