#ifndef maze_escape_lib_maze_escape_include_maze_escape_config_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_config_hpp

#include <array>
#include <cstddef>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <fmt/core.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

#include "maze_escape/path.hpp"

class Config {
public:
  template <typename ValueType>
  using MappingType = std::pair<std::string_view, ValueType Config::*>;

  using BooleanMappingType = MappingType<bool>;
  using SizeTMappingType = MappingType<std::size_t>;

  [[nodiscard]] static consteval auto getConfigMapping() {
    return std::tuple{
        std::array{
            BooleanMappingType{"EnableAdjacencyListOutput",
                               &Config::EnableAdjacencyListOutput},
            BooleanMappingType{"EnableDotOutput", &Config::EnableDotOutput},
            BooleanMappingType{"EnableRecalculateWeight",
                               &Config::EnableRecalculateWeight},
            BooleanMappingType{"EnableAllAlgorithms",
                               &Config::EnableAllAlgorithms},
        },
        std::array{
            SizeTMappingType{"PathDisplayCut", &Config::PathDisplayCut},
            SizeTMappingType{"MaxBatchConcurrency",
                             &Config::MaxBatchConcurrency},
        }};
  }

  [[nodiscard]] static Config parse(const std::filesystem::path &File);

  void save(const std::filesystem::path &File);

  // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
  bool EnableAdjacencyListOutput = false;
  bool EnableDotOutput = false;
  bool EnableRecalculateWeight = true;
  bool EnableAllAlgorithms = false;

  std::size_t PathDisplayCut = DefaultPathDisplayCut;
  std::size_t MaxBatchConcurrency = std::numeric_limits<std::size_t>::max();

  // NOLINTEND(misc-non-private-member-variables-in-classes)
};

template <> struct llvm::yaml::MappingTraits<Config> {
  static void mapping(llvm::yaml::IO &YamlIO, Config &Conf);
};

template <> class fmt::formatter<Config> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(Config Conf,
                                                format_context &Ctx) const {
    std::string Str;
    llvm::raw_string_ostream Stream{Str};
    auto OutStream = llvm::yaml::Output{Stream};
    OutStream << Conf;
    Stream.flush();
    return fmt::format_to(Ctx.out(), "{}", Str);
  }
};

#endif
