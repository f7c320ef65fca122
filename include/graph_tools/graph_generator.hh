#ifndef __GRAPH_TOOLS_GRAPH_GENERATOR_HH__
#define __GRAPH_TOOLS_GRAPH_GENERATOR_HH__

#include "graph.hh"
#include <random>
#include <utility>
#include <vector>

namespace graph_tools {

class GraphGenerator {
public:
  static constexpr Weight kDefaultMaxWeight = 100;

  explicit GraphGenerator(std::mt19937_64 &rng);

  // Prevent copying and assignment
  GraphGenerator(const GraphGenerator &) = delete;
  GraphGenerator &operator=(const GraphGenerator &) = delete;

  /**
   * @brief Create a random weighted digraph
   *
   * @details Requesting every possible edge yields the complete digraph.
   * Otherwise a random walk lays down a spanning tree of num_vertices - 1
   * edges and the remaining edges are drawn from a shuffle of all other
   * ordered pairs. Vertices are labelled "0" .. "num_vertices - 1".
   *
   * @param num_vertices Number of vertices
   * @param num_edges Number of directed edges, within
   *        [num_vertices - 1, num_vertices * (num_vertices - 1)]
   * @param max_weight Weights are drawn uniformly from [0, max_weight)
   *
   * @throws std::invalid_argument if num_edges is out of range or
   *         max_weight is not positive
   */
  Graph MakeGraph(size_t num_vertices, size_t num_edges,
                  Weight max_weight = kDefaultMaxWeight);

private:
  using VertexPair = std::pair<size_t, size_t>;

  Weight RandomWeight(Weight max_weight);
  size_t RandomVertex(size_t num_vertices);

  // Random walk adding an edge each time it steps onto an unvisited vertex
  Adjacency MakeSpanningTree(size_t num_vertices, Weight max_weight);

  // Adds count pairs drawn from a lazy shuffle of all ordered pairs,
  // skipping those already present in adjacency
  void AddRandomEdges(Adjacency &adjacency, size_t num_vertices, size_t count,
                      Weight max_weight);

  static std::vector<VertexPair> AllVertexPairs(size_t num_vertices);

  std::mt19937_64 &rng_; // reference to external RNG
};

// Label for the vertex at index i
VertexId VertexLabel(size_t i);

} // namespace graph_tools

#endif
