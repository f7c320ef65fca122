#ifndef __GRAPH_TOOLS_GRAPH_HH__
#define __GRAPH_TOOLS_GRAPH_HH__

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace graph_tools {

using VertexId = std::string;
using Weight = int64_t;
using Distance = int64_t;

// Outgoing edges of a single vertex: target -> weight
using Neighbors = std::map<VertexId, Weight>;
using Adjacency = std::map<VertexId, Neighbors>;

/**
 * @brief Weighted directed graph stored as an adjacency map
 *
 * @details A Graph is validated once on construction and is read-only
 * afterwards. Every vertex has an entry in the adjacency map, vertices
 * without outgoing edges map to an empty Neighbors. Self-loops and negative
 * weights are rejected. At most one edge exists per ordered pair.
 */
class Graph {
public:
  Graph() : Graph(Adjacency{}) {}

  // Throws std::invalid_argument on a self-loop or a negative weight.
  // Vertices that only appear as edge targets get an empty entry.
  explicit Graph(Adjacency adjacency);

  const Adjacency &GetAdjacency() const { return adjacency_; }

  // Vertex labels in ascending order
  std::vector<VertexId> Vertices() const;
  size_t VertexCount() const { return adjacency_.size(); }
  size_t EdgeCount() const { return edge_count_; }
  bool Empty() const { return adjacency_.empty(); }

  bool HasVertex(const VertexId &v) const;
  bool HasEdge(const VertexId &from, const VertexId &to) const;
  std::optional<Weight> EdgeWeight(const VertexId &from,
                                   const VertexId &to) const;

  // Outgoing edges of v. Unknown vertices have no edges.
  const Neighbors &GetNeighbors(const VertexId &v) const;

  // Content hash, equal graphs hash equally
  uint64_t Fingerprint() const { return fingerprint_; }

  bool operator==(const Graph &other) const;
  bool operator!=(const Graph &other) const { return !(*this == other); }

private:
  void Validate() const;
  uint64_t ComputeFingerprint() const;

  Adjacency adjacency_;
  size_t edge_count_{0};
  uint64_t fingerprint_{0};
};

} // namespace graph_tools

#endif
