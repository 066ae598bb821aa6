#include <cstddef>

#include "maze_escape_benchmarks.hpp"
#include "support/testcase_generation.hpp"

// NOLINTNEXTLINE
GENERATE_SEARCH_BENCHMARKS(
    straightPath, SETUP_GENERATED(GenerateStraightPath),
    ->Range(1, size_t{1U} << size_t{12U})->Complexity());

// NOLINTNEXTLINE
GENERATE_SEARCH_BENCHMARKS(forkingPath, SETUP_GENERATED(GenerateForkingPath),
                           ->Range(1, size_t{1U} << size_t{10U})
                               ->Complexity());

// NOLINTNEXTLINE
GENERATE_SEARCH_BENCHMARKS(multiForkingPath,
                           SETUP_GENERATED(GenerateMultiForkingPath),
                           ->Range(1, size_t{1U} << size_t{10U})
                               ->Complexity());
