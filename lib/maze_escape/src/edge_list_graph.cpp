#include "maze_escape/edge_list_graph.hpp"

#include <charconv>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <boost/algorithm/string/replace.hpp>
#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/properties.hpp>
#include <boost/property_map/property_map.hpp>
#include <ctre.hpp>
#include <fmt/format.h>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/enumerate.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "support/maze_escape_exception.hpp"
#include "support/ranges/ranges.hpp"
#include "support/text.hpp"

namespace {
constexpr auto EdgePattern = ctll::fixed_string{
    R"(\s*([\w.]+)\s*(->|--)\s*([\w.]+)\s*(?::\s*([-+]?(?:\d+\.?\d*|\.\d+)(?:[eE][-+]?\d+)?))?\s*)"};
constexpr auto VertexPattern = ctll::fixed_string{R"(\s*([\w.]+)\s*)"};
constexpr auto QueryPattern =
    ctll::fixed_string{R"(\s*([\w.]+)\s+([\w.]+)\s*)"};
constexpr auto BlankPattern = ctll::fixed_string{R"(\s*)"};

[[nodiscard]] std::optional<double> toDouble(const std::string_view Text) {
  // from_chars does not accept a leading '+'
  const auto Digits = Text.starts_with('+') ? Text.substr(1U) : Text;
  auto Value = 0.0;
  const auto [Ptr, Error] =
      std::from_chars(Digits.data(), Digits.data() + Digits.size(), Value);
  if (Error != std::errc{} || Ptr != Digits.data() + Digits.size()) {
    return std::nullopt;
  }
  return Value;
}

[[nodiscard]] std::string_view stripComment(const std::string_view Line) {
  return Line.substr(0U, Line.find('#'));
}

[[nodiscard]] std::string quoted(std::string Name) {
  boost::replace_all(Name, "\"", "\\\"");
  return Name;
}
} // namespace

EdgeListGraph EdgeListGraph::parse(const std::string_view Text) {
  auto Graph = EdgeListGraph{};
  const auto Lines = splitLines(Text);

  for (const auto &[Index, Line] : Lines | ranges::views::enumerate) {
    const auto LineNumber = Index + 1U;
    const auto Content = stripComment(Line);

    if (ctre::match<BlankPattern>(Content)) {
      continue;
    }

    if (const auto [Whole, From, Arrow, To, Weight] =
            ctre::match<EdgePattern>(Content);
        Whole) {
      auto EdgeWeight = DefaultEdgeWeight;
      if (Weight) {
        const auto Parsed = toDouble(Weight.to_view());
        MazeEscapeException::verify(
            Parsed.has_value(),
            "EdgeListGraph::parse(): invalid weight '{}' on line {}",
            Weight.to_view(), LineNumber);
        EdgeWeight = *Parsed;
      }
      if (EdgeWeight < 0.0) {
        spdlog::warn("EdgeListGraph::parse(): negative weight on line {}, "
                     "shortest paths may be wrong",
                     LineNumber);
      }

      if (Arrow.to_view() == "--") {
        Graph.addUndirectedEdge(From.to_string(), To.to_string(), EdgeWeight);
      } else {
        Graph.addEdge(From.to_string(), To.to_string(), EdgeWeight);
      }
      continue;
    }

    if (const auto [Whole, Name] = ctre::match<VertexPattern>(Content);
        Whole) {
      Graph.addVertex(Name.to_string());
      continue;
    }

    MazeEscapeException::fail("EdgeListGraph::parse(): malformed line {}: '{}'",
                              LineNumber, Line);
  }

  spdlog::trace("EdgeListGraph::parse(): |V| = {}, |E| = {}",
                Graph.getVertexCount(), Graph.getEdgeCount());
  return Graph;
}

EdgeListGraph EdgeListGraph::load(const std::filesystem::path &File) {
  return parse(readTextFile(File, "Graph"));
}

EdgeListGraph::VertexDescriptor
EdgeListGraph::addVertex(const std::string &Name) {
  if (const auto Existing = findVertex(Name); Existing) {
    return *Existing;
  }
  const auto Descriptor = boost::add_vertex(Graph_);
  Names_.push_back(Name);
  Descriptors_.emplace(Name, Descriptor);
  return Descriptor;
}

void EdgeListGraph::addEdge(const std::string &From, const std::string &To,
                            const double Weight) {
  const auto Source = addVertex(From);
  const auto Target = addVertex(To);
  if (const auto [Edge, Exists] = boost::edge(Source, Target, Graph_);
      Exists) {
    boost::put(boost::edge_weight, Graph_, Edge, Weight);
    return;
  }
  boost::add_edge(Source, Target, Weight, Graph_);
}

void EdgeListGraph::addUndirectedEdge(const std::string &First,
                                      const std::string &Second,
                                      const double Weight) {
  addEdge(First, Second, Weight);
  addEdge(Second, First, Weight);
}

bool EdgeListGraph::contains(const std::string &Name) const {
  return Descriptors_.contains(Name);
}

std::vector<std::string>
EdgeListGraph::neighbors(const std::string &From) const {
  const auto Source = findVertex(From);
  if (!Source) {
    return {};
  }
  return toRange(boost::adjacent_vertices(*Source, Graph_)) |
         ranges::views::transform(
             [this](const VertexDescriptor Target) { return Names_[Target]; }) |
         ranges::to_vector;
}

std::optional<double> EdgeListGraph::findWeight(const std::string &From,
                                                const std::string &To) const {
  const auto Source = findVertex(From);
  const auto Target = findVertex(To);
  if (!Source || !Target) {
    return std::nullopt;
  }
  const auto [Edge, Exists] = boost::edge(*Source, *Target, Graph_);
  if (!Exists) {
    return std::nullopt;
  }
  return boost::get(boost::edge_weight, Graph_, Edge);
}

double EdgeListGraph::weight(const std::string &From,
                             const std::string &To) const {
  const auto Weight = findWeight(From, To);
  MazeEscapeException::verify(Weight.has_value(),
                              "EdgeListGraph::weight(): no edge {} -> {}", From,
                              To);
  return *Weight;
}

WeightFunction<std::string> EdgeListGraph::weightFunction() const {
  return [this](const std::string &From, const std::string &To) {
    return weight(From, To);
  };
}

std::size_t EdgeListGraph::getVertexCount() const {
  return boost::num_vertices(Graph_);
}

std::size_t EdgeListGraph::getEdgeCount() const {
  return boost::num_edges(Graph_);
}

std::string EdgeListGraph::toDot() const {
  auto Result = std::string{"digraph D {\n"};
  auto Out = std::back_inserter(Result);

  ranges::for_each(Names_, [&Out](const std::string &Name) {
    fmt::format_to(Out, "  \"{}\";\n", quoted(Name));
  });

  const auto WeightMap = boost::get(boost::edge_weight, Graph_);
  for (const auto &Edge : toRange(boost::edges(Graph_))) {
    fmt::format_to(Out, "  \"{}\" -> \"{}\"[label=\"{}\"];\n",
                   quoted(Names_[boost::source(Edge, Graph_)]),
                   quoted(Names_[boost::target(Edge, Graph_)]),
                   boost::get(WeightMap, Edge));
  }

  Result += "}\n";
  return Result;
}

std::optional<EdgeListGraph::VertexDescriptor>
EdgeListGraph::findVertex(const std::string &Name) const {
  const auto Iter = Descriptors_.find(Name);
  if (Iter == Descriptors_.end()) {
    return std::nullopt;
  }
  return Iter->second;
}

std::vector<SearchQuery<std::string>>
parseSearchQueries(const std::string_view Text) {
  auto Queries = std::vector<SearchQuery<std::string>>{};
  const auto Lines = splitLines(Text);

  for (const auto &[Index, Line] : Lines | ranges::views::enumerate) {
    const auto Content = stripComment(Line);
    if (ctre::match<BlankPattern>(Content)) {
      continue;
    }

    const auto [Whole, From, To] = ctre::match<QueryPattern>(Content);
    MazeEscapeException::verify(
        static_cast<bool>(Whole),
        "parseSearchQueries(): malformed query on line {}: '{}'", Index + 1U,
        Line);
    Queries.emplace_back(From.to_string(), To.to_string());
  }
  return Queries;
}
