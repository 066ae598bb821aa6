#include <cstddef>

#include "maze_escape_benchmarks.hpp"

namespace {
[[nodiscard]] GridGraph makeOpenGrid(const std::size_t Size) {
  auto Grid = GridGraph{Size, Size};
  Grid.setStart(Cell{0U, 0U});
  Grid.setExit(Cell{Size - 1U, Size - 1U});
  return Grid;
}
} // namespace

// NOLINTNEXTLINE
GENERATE_SEARCH_BENCHMARKS(openGrid, SETUP_GRID(makeOpenGrid),
                           ->RangeMultiplier(2)
                               ->Range(8, 256)
                               ->Complexity());

// NOLINTNEXTLINE
GENERATE_SEARCH_BENCHMARKS(serpentineGrid, SETUP_GRID(makeSerpentineGrid),
                           ->Arg(9)
                               ->Arg(33)
                               ->Arg(65)
                               ->Arg(129)
                               ->Complexity());
