#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <oneapi/tbb/parallel_for_each.h>
#include <range/v3/view/cartesian_product.hpp>

#include "maze_escape/batch_search.hpp"
#include "maze_escape/grid_graph.hpp"
#include "maze_escape/reachability.hpp"
#include "maze_escape/search.hpp"
#include "maze_escape_tests.hpp"
#include "support/enum_mappings.hpp"

using namespace std::string_literals;

namespace {
[[nodiscard]] GridGraph makeMaze() {
  return GridGraph::parse(R"(S...#.
.##...
...##.
##...E
..#...
)");
}

[[nodiscard]] std::vector<SearchQuery<Cell>> makeAllPairs(const GridGraph &Grid) {
  const auto Reachable = getAllVertices(Grid, *Grid.getStart());
  auto Cells = std::vector<Cell>{Reachable.begin(), Reachable.end()};
  // a wall, never reached from any start
  Cells.push_back(Cell{0, 4});

  auto Queries = std::vector<SearchQuery<Cell>>{};
  for (const auto &[Start, Target] :
       ranges::views::cartesian_product(Cells, Cells)) {
    Queries.emplace_back(Start, Target);
  }
  return Queries;
}
} // namespace

TEST_CASE("search algorithm names") {
  REQUIRE(fromString<SearchAlgorithm>("dfs") == SearchAlgorithm::DepthFirst);
  REQUIRE(fromString<SearchAlgorithm>("bfs") == SearchAlgorithm::BreadthFirst);
  REQUIRE(fromString<SearchAlgorithm>("dijkstra") ==
          SearchAlgorithm::Dijkstra);
  REQUIRE_FALSE(fromString<SearchAlgorithm>("astar").has_value());
  REQUIRE(toString(SearchAlgorithm::BreadthFirst) == "bfs");
  REQUIRE(fmt::format("{}", SearchAlgorithm::Dijkstra) == "dijkstra");
}

TEST_CASE("runSearch dispatches") {
  const auto Graph = makeDiamondGraph();
  const auto WeightFn = Graph.weightFunction();

  const auto Depth =
      runSearch(Graph, SearchAlgorithm::DepthFirst, "A"s, "D"s, WeightFn);
  const auto Breadth =
      runSearch(Graph, SearchAlgorithm::BreadthFirst, "A"s, "D"s);
  const auto Weighted =
      runSearch(Graph, SearchAlgorithm::Dijkstra, "A"s, "D"s, WeightFn);
  REQUIRE(Depth.has_value());
  REQUIRE(Breadth.has_value());
  REQUIRE(Weighted.has_value());
  REQUIRE(getVertexVector(*Breadth) == std::vector<std::string>{"A", "B", "D"});
  REQUIRE(getVertexVector(*Weighted) ==
          std::vector<std::string>{"A", "C", "D"});

  // the weighted search needs a weight function
  REQUIRE_FALSE(
      runSearch(Graph, SearchAlgorithm::Dijkstra, "A"s, "D"s).has_value());
}

TEST_CASE("searchAll matches single searches") {
  const auto Grid = makeMaze();
  const auto Queries = makeAllPairs(Grid);
  const auto WeightFn = WeightFunction<Cell>{unitWeight};

  for (const auto Algorithm :
       {SearchAlgorithm::DepthFirst, SearchAlgorithm::BreadthFirst,
        SearchAlgorithm::Dijkstra}) {
    for (const auto MaxConcurrency : {std::size_t{1U}, std::size_t{4U}}) {
      INFO(fmt::format("{} with at most {} threads", Algorithm,
                       MaxConcurrency));
      const auto Results =
          searchAll(Grid, Queries, Algorithm, WeightFn, MaxConcurrency);
      REQUIRE(Results.size() == Queries.size());

      for (std::size_t Index = 0U; Index < Queries.size(); ++Index) {
        const auto &[Start, Target] = Queries[Index];
        const auto Expected =
            runSearch(Grid, Algorithm, Start, Target, WeightFn);
        REQUIRE(Results[Index].has_value() == Expected.has_value());
        if (Expected) {
          REQUIRE(Results[Index]->getVertices() == Expected->getVertices());
          REQUIRE(Results[Index]->getTotalWeight() ==
                  Expected->getTotalWeight());
        }
        if (Expected && Algorithm == SearchAlgorithm::BreadthFirst &&
            MaxConcurrency == 1U) {
          REQUIRE(Expected->size() - 1U ==
                  getMinimumHopCount(Grid, Start, Target));
        }
      }
    }
  }
}

TEST_CASE("searchAll keeps query order") {
  const auto Graph = makeCycleGraph();
  const auto Queries = std::vector<SearchQuery<std::string>>{
      {"A", "C"}, {"A", "E"}, {"D", "B"}, {"E", "E"}};

  const auto Results = searchAll(Graph, Queries, SearchAlgorithm::Dijkstra,
                                 Graph.weightFunction());
  REQUIRE(Results.size() == 4U);
  REQUIRE(Results[0].has_value());
  REQUIRE(getVertexVector(*Results[0]) ==
          std::vector<std::string>{"A", "B", "C"});
  REQUIRE_FALSE(Results[1].has_value());
  REQUIRE(Results[2].has_value());
  REQUIRE(getVertexVector(*Results[2]) ==
          std::vector<std::string>{"D", "A", "B"});
  REQUIRE(Results[3].has_value());
  REQUIRE(getVertexVector(*Results[3]) == std::vector<std::string>{"E"});
}

TEST_CASE("searchAll without queries") {
  const auto Graph = makeCycleGraph();
  REQUIRE(searchAll(Graph, std::vector<SearchQuery<std::string>>{},
                    SearchAlgorithm::BreadthFirst)
              .empty());
}

TEST_CASE("concurrent searches on a shared graph") {
  const auto Grid = makeMaze();
  const auto Queries = makeAllPairs(Grid);

  // assertions are not thread safe, count the failures instead
  auto BrokenPaths = std::atomic<std::size_t>{0U};
  const auto Run = [&Grid, &BrokenPaths](const SearchQuery<Cell> &Query) {
    const auto &[Start, Target] = Query;
    const auto Found = breadthFirstSearch(Grid, Start, Target);
    if (Found && !isContiguous(Grid, *Found)) {
      ++BrokenPaths;
    }
  };

  tbb::parallel_for_each(Queries, Run);
  REQUIRE(BrokenPaths.load() == 0U);
}
