#ifndef maze_escape_lib_maze_escape_include_maze_escape_batch_search_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_batch_search_hpp

#include <algorithm>
#include <cstddef>
#include <limits>
#include <optional>
#include <type_traits>
#include <vector>

#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_for.h>
#include <oneapi/tbb/task_arena.h>
#include <spdlog/spdlog.h>

#include "maze_escape/neighbor_source.hpp"
#include "maze_escape/path.hpp"
#include "maze_escape/search.hpp"

// Runs independent searches concurrently, one search per task. Each search
// owns its bookkeeping, the graph and weight function are shared and must be
// safe to call from several threads. Results are in query order.
template <Vertex VertexType, NeighborSource<VertexType> GraphType>
[[nodiscard]] std::vector<std::optional<Path<VertexType>>>
searchAll(const GraphType &Graph,
          const std::vector<SearchQuery<VertexType>> &Queries,
          const SearchAlgorithm Algorithm,
          const std::type_identity_t<WeightFunction<VertexType>> &WeightFn = {},
          const std::size_t MaxConcurrency =
              std::numeric_limits<std::size_t>::max()) {
  auto Results = std::vector<std::optional<Path<VertexType>>>(Queries.size());

  const auto Concurrency =
      MaxConcurrency >= static_cast<std::size_t>(
                            tbb::this_task_arena::max_concurrency())
          ? tbb::task_arena::automatic
          : static_cast<int>(std::max<std::size_t>(MaxConcurrency, 1U));
  auto Arena = tbb::task_arena{Concurrency};
  spdlog::trace("searchAll: {} {} queries with {} threads", Queries.size(),
                Algorithm, Arena.max_concurrency());

  Arena.execute([&]() {
    tbb::parallel_for(tbb::blocked_range<std::size_t>{0U, Queries.size()},
                      [&](const tbb::blocked_range<std::size_t> &Range) {
                        for (auto Index = Range.begin(); Index != Range.end();
                             ++Index) {
                          const auto &[Start, Target] = Queries[Index];
                          Results[Index] = runSearch(Graph, Algorithm, Start,
                                                     Target, WeightFn);
                        }
                      });
  });
  return Results;
}

#endif
