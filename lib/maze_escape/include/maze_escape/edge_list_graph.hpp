#ifndef maze_escape_lib_maze_escape_include_maze_escape_edge_list_graph_hpp
#define maze_escape_lib_maze_escape_include_maze_escape_edge_list_graph_hpp

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/graph_traits.hpp>
#include <boost/graph/properties.hpp>

#include "maze_escape/neighbor_source.hpp"
#include "maze_escape/search.hpp"

// Directed graph of named vertices with weighted edges.
//
// Text format, one declaration per line:
//   A -> B        directed edge with the default weight
//   A -> B : 2.5  directed edge with weight 2.5
//   A -- B : 3    edges in both directions
//   C             vertex without edges
//   # comment
class EdgeListGraph {
public:
  static constexpr double DefaultEdgeWeight = 1.0;

  using GraphType =
      boost::adjacency_list<boost::vecS, boost::vecS, boost::directedS,
                            boost::no_property,
                            boost::property<boost::edge_weight_t, double>>;
  using VertexDescriptor = boost::graph_traits<GraphType>::vertex_descriptor;

  [[nodiscard]] static EdgeListGraph parse(std::string_view Text);

  [[nodiscard]] static EdgeListGraph load(const std::filesystem::path &File);

  VertexDescriptor addVertex(const std::string &Name);

  // replaces the weight of an existing edge
  void addEdge(const std::string &From, const std::string &To,
               double Weight = DefaultEdgeWeight);

  void addUndirectedEdge(const std::string &First, const std::string &Second,
                         double Weight = DefaultEdgeWeight);

  [[nodiscard]] bool contains(const std::string &Name) const;

  // in edge insertion order, empty for unknown vertices
  [[nodiscard]] std::vector<std::string>
  neighbors(const std::string &From) const;

  [[nodiscard]] std::optional<double> findWeight(const std::string &From,
                                                 const std::string &To) const;

  // throws if there is no edge From -> To
  [[nodiscard]] double weight(const std::string &From,
                              const std::string &To) const;

  // refers to this graph, which has to outlive the returned function
  [[nodiscard]] WeightFunction<std::string> weightFunction() const;

  [[nodiscard]] std::size_t getVertexCount() const;

  [[nodiscard]] std::size_t getEdgeCount() const;

  // in insertion order
  [[nodiscard]] const std::vector<std::string> &getVertexNames() const {
    return Names_;
  }

  // graphviz
  [[nodiscard]] std::string toDot() const;

private:
  [[nodiscard]] std::optional<VertexDescriptor>
  findVertex(const std::string &Name) const;

  GraphType Graph_{};
  std::vector<std::string> Names_{};
  std::unordered_map<std::string, VertexDescriptor> Descriptors_{};
};

// one "from to" pair per line, '#' starts a comment
[[nodiscard]] std::vector<SearchQuery<std::string>>
parseSearchQueries(std::string_view Text);

#endif
