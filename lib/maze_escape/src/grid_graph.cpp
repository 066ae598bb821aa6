#include "maze_escape/grid_graph.hpp"

#include <charconv>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <ctre.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/enumerate.hpp>
#include <range/v3/view/filter.hpp>
#include <spdlog/spdlog.h>

#include "support/text.hpp"
#include "support/maze_escape_exception.hpp"

namespace {
[[nodiscard]] std::optional<std::size_t> toSizeT(const std::string_view Text) {
  auto Value = std::size_t{};
  const auto [Ptr, Error] =
      std::from_chars(Text.data(), Text.data() + Text.size(), Value);
  if (Error != std::errc{} || Ptr != Text.data() + Text.size()) {
    return std::nullopt;
  }
  return Value;
}
} // namespace

GridGraph::GridGraph(const std::size_t Rows, const std::size_t Columns)
    : Rows_(Rows),
      Columns_(Columns) {}

GridGraph GridGraph::parse(const std::string_view Text) {
  auto Lines = splitLines(Text);
  while (!Lines.empty() && Lines.back().empty()) {
    Lines.pop_back();
  }
  MazeEscapeException::verify(!Lines.empty(), "GridGraph::parse(): empty maze");

  const auto Columns = Lines.front().size();
  auto Grid = GridGraph{Lines.size(), Columns};

  for (const auto &[Row, Line] : Lines | ranges::views::enumerate) {
    MazeEscapeException::verify(
        Line.size() == Columns,
        "GridGraph::parse(): row {} has {} columns, expected {}", Row,
        Line.size(), Columns);

    for (const auto &[Column, Symbol] : Line | ranges::views::enumerate) {
      const auto Position = Cell{static_cast<std::size_t>(Row),
                                 static_cast<std::size_t>(Column)};
      switch (Symbol) {
      case WallSymbol:
        Grid.addWall(Position);
        break;
      case OpenSymbol:
      case ' ':
        break;
      case StartSymbol:
        MazeEscapeException::verify(!Grid.Start_.has_value(),
                                    "GridGraph::parse(): second start at {}",
                                    Position);
        Grid.setStart(Position);
        break;
      case ExitSymbol:
        MazeEscapeException::verify(!Grid.Exit_.has_value(),
                                    "GridGraph::parse(): second exit at {}",
                                    Position);
        Grid.setExit(Position);
        break;
      default:
        MazeEscapeException::fail("GridGraph::parse(): unknown symbol '{}' at {}",
                                  Symbol, Position);
      }
    }
  }

  spdlog::trace("GridGraph::parse(): {}x{} maze with {} walls", Grid.Rows_,
                Grid.Columns_, Grid.Walls_.size());
  return Grid;
}

GridGraph GridGraph::load(const std::filesystem::path &File) {
  return parse(readTextFile(File, "Maze"));
}

void GridGraph::addWall(const Cell Position) {
  MazeEscapeException::verify(contains(Position),
                              "GridGraph::addWall(): {} is outside the grid",
                              Position);
  Walls_.insert(Position);
}

void GridGraph::removeWall(const Cell Position) { Walls_.erase(Position); }

void GridGraph::setStart(const Cell Position) {
  MazeEscapeException::verify(contains(Position),
                              "GridGraph::setStart(): {} is outside the grid",
                              Position);
  Start_ = Position;
}

void GridGraph::setExit(const Cell Position) {
  MazeEscapeException::verify(contains(Position),
                              "GridGraph::setExit(): {} is outside the grid",
                              Position);
  Exit_ = Position;
}

bool GridGraph::contains(const Cell Position) const {
  return Position.Row < Rows_ && Position.Column < Columns_;
}

bool GridGraph::isWall(const Cell Position) const {
  return Walls_.contains(Position);
}

std::vector<Cell> GridGraph::neighbors(const Cell &From) const {
  if (!contains(From)) {
    return {};
  }

  auto Candidates = std::vector<Cell>{};
  Candidates.reserve(4U);
  if (From.Row > 0U) {
    Candidates.push_back(Cell{From.Row - 1U, From.Column});
  }
  Candidates.push_back(Cell{From.Row, From.Column + 1U});
  Candidates.push_back(Cell{From.Row + 1U, From.Column});
  if (From.Column > 0U) {
    Candidates.push_back(Cell{From.Row, From.Column - 1U});
  }

  return Candidates | ranges::views::filter([this](const Cell &Candidate) {
           return contains(Candidate) && !isWall(Candidate);
         }) |
         ranges::to_vector;
}

std::string GridGraph::render(const Path<Cell> &Route) const {
  auto Rows = std::vector<std::string>(Rows_, std::string(Columns_, OpenSymbol));
  ranges::for_each(Walls_, [&Rows](const Cell &Wall) {
    Rows[Wall.Row][Wall.Column] = WallSymbol;
  });
  ranges::for_each(Route.getVertices(), [this, &Rows](const Cell &Step) {
    if (contains(Step)) {
      Rows[Step.Row][Step.Column] = PathSymbol;
    }
  });
  if (Start_) {
    Rows[Start_->Row][Start_->Column] = StartSymbol;
  }
  if (Exit_) {
    Rows[Exit_->Row][Exit_->Column] = ExitSymbol;
  }
  return fmt::format("{}\n", fmt::join(Rows, "\n"));
}

double unitWeight(const Cell & /*From*/, const Cell & /*To*/) { return 1.0; }

std::optional<Cell> parseCell(const std::string_view Text) {
  if (const auto [Whole, Row, Column] =
          ctre::match<R"(\s*(\d+)\s*,\s*(\d+)\s*)">(Text);
      Whole) {
    const auto RowValue = toSizeT(Row.to_view());
    const auto ColumnValue = toSizeT(Column.to_view());
    if (RowValue && ColumnValue) {
      return Cell{*RowValue, *ColumnValue};
    }
  }
  return std::nullopt;
}
