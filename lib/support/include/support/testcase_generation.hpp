#ifndef maze_escape_lib_support_include_support_testcase_generation_hpp
#define maze_escape_lib_support_include_support_testcase_generation_hpp

#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/view/indices.hpp>
#include <range/v3/view/transform.hpp>

// Generators return the (start, target) query and the edge list text of a
// graph with NumRepetitions repetitions of a pattern.
template <typename Generator>
[[nodiscard]] auto generateFromTemplate(std::string Start,
                                        std::string InitializerCode,
                                        Generator &&EdgeTemplateGenerator)
  requires std::is_invocable_r_v<std::string, Generator, size_t>
{
  return [Start = std::move(Start),
          InitializerCode = std::move(InitializerCode),
          EdgeTemplateGenerator = std::forward<Generator>(
              EdgeTemplateGenerator)](const size_t NumRepetitions)
             -> std::pair<std::pair<std::string, std::string>, std::string> {
    return {{Start, fmt::format("A{}", NumRepetitions)},
            fmt::format("{}\n{}\n", InitializerCode,
                        fmt::join(ranges::views::indices(NumRepetitions) |
                                      ranges::views::transform(
                                          EdgeTemplateGenerator),
                                  "\n"))};
  };
}

// A0 -> A1 -> ... -> An
inline const auto GenerateStraightPath =
    generateFromTemplate("A0", "A0", [](const size_t Iter) {
      return fmt::format("A{} -> A{}", Iter, Iter + 1);
    });

// every step forks into a cheap and an expensive branch that join again
inline const auto GenerateForkingPath =
    generateFromTemplate("A0", "A0", [](const size_t Iter) {
      return fmt::format("A{0} -> B{0} : 1\n"
                         "A{0} -> C{0} : 3\n"
                         "B{0} -> A{1} : 4\n"
                         "C{0} -> A{1} : 1",
                         Iter, Iter + 1);
    });

// every step has a short expensive route and a long cheap one, plus a
// dead end and a back edge
inline const auto GenerateMultiForkingPath =
    generateFromTemplate("A0", "A0", [](const size_t Iter) {
      return fmt::format("A{0} -> A{1} : 10\n"
                         "A{0} -> B{0} : 1\n"
                         "B{0} -> C{0} : 1\n"
                         "C{0} -> D{0} : 1\n"
                         "D{0} -> A{1} : 1\n"
                         "B{0} -> E{0} : 1\n"
                         "D{0} -> A{0} : 1",
                         Iter, Iter + 1);
    });

#endif
