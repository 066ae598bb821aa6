#ifndef maze_escape_lib_maze_escape_include_maze_escape_grid_graph_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_grid_graph_hpp

#include <compare>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/container/flat_set.hpp>
#include <boost/container_hash/hash.hpp>
#include <fmt/core.h>
#include <fmt/format.h>

#include "maze_escape/path.hpp"

struct Cell {
  std::size_t Row{};
  std::size_t Column{};

  [[nodiscard]] friend constexpr auto operator<=>(const Cell &,
                                                  const Cell &) = default;
};

template <> struct std::hash<Cell> {
  [[nodiscard]] std::size_t operator()(const Cell &Val) const noexcept {
    auto Seed = std::size_t{0U};
    boost::hash_combine(Seed, Val.Row);
    boost::hash_combine(Seed, Val.Column);
    return Seed;
  }
};

template <> class fmt::formatter<Cell> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const Cell &Val,
                                                format_context &Ctx) const {
    return fmt::format_to(Ctx.out(), "({},{})", Val.Row, Val.Column);
  }
};

// Rectangular maze of cells connected to their horizontal and vertical
// neighbors, except for walls.
class GridGraph {
public:
  static constexpr char WallSymbol = '#';
  static constexpr char OpenSymbol = '.';
  static constexpr char StartSymbol = 'S';
  static constexpr char ExitSymbol = 'E';
  static constexpr char PathSymbol = '*';

  GridGraph(std::size_t Rows, std::size_t Columns);

  // one line per row: '#' wall, '.' or ' ' open, 'S' start, 'E' exit
  [[nodiscard]] static GridGraph parse(std::string_view Text);

  [[nodiscard]] static GridGraph load(const std::filesystem::path &File);

  void addWall(Cell Position);

  void removeWall(Cell Position);

  void setStart(Cell Position);

  void setExit(Cell Position);

  [[nodiscard]] bool contains(Cell Position) const;

  [[nodiscard]] bool isWall(Cell Position) const;

  // order: up, right, down, left
  [[nodiscard]] std::vector<Cell> neighbors(const Cell &From) const;

  [[nodiscard]] std::size_t getRows() const { return Rows_; }

  [[nodiscard]] std::size_t getColumns() const { return Columns_; }

  [[nodiscard]] const std::optional<Cell> &getStart() const { return Start_; }

  [[nodiscard]] const std::optional<Cell> &getExit() const { return Exit_; }

  // draws the maze, marking the vertices of Route with '*'
  [[nodiscard]] std::string render(const Path<Cell> &Route = {}) const;

private:
  std::size_t Rows_;
  std::size_t Columns_;
  boost::container::flat_set<Cell> Walls_{};
  std::optional<Cell> Start_{};
  std::optional<Cell> Exit_{};
};

// unit weight for every move, for use with dijkstraShortestPath
[[nodiscard]] double unitWeight(const Cell &From, const Cell &To);

// "row,col"
[[nodiscard]] std::optional<Cell> parseCell(std::string_view Text);

#endif
