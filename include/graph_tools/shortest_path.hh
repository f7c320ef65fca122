#ifndef __GRAPH_TOOLS_SHORTEST_PATH_HH__
#define __GRAPH_TOOLS_SHORTEST_PATH_HH__

#include "graph.hh"
#include <map>
#include <optional>
#include <vector>

namespace graph_tools {

// Shortest distance to a vertex and the path realising it, both endpoints
// included
struct PathResult {
  Distance distance{0};
  std::vector<VertexId> path;

  bool operator==(const PathResult &other) const {
    return distance == other.distance && path == other.path;
  }
  bool operator!=(const PathResult &other) const { return !(*this == other); }
};

// Finalized vertices only. A vertex missing from the result is unreachable
// or was not reached before an early exit.
using DijkstraResult = std::map<VertexId, PathResult>;

/**
 * @brief Single source shortest paths over non-negative weights
 *
 * @details Vertices are finalized in order of increasing distance. When dest
 * is given the search stops as soon as dest is finalized, so the result only
 * holds the vertices finalized up to that point. Without dest every vertex
 * reachable from start is finalized. Equal distances are finalized in the
 * order they were first discovered.
 *
 * A start vertex that is not part of the graph has no outgoing edges, its
 * result holds only itself.
 *
 * @param graph Graph to search
 * @param start Source vertex
 * @param dest Optional vertex that ends the search once finalized
 * @return Distance and path for each finalized vertex
 * @throws std::overflow_error if a distance to relax exceeds the range of
 * Distance
 */
DijkstraResult Dijkstra(const Graph &graph, const VertexId &start,
                        const std::optional<VertexId> &dest = std::nullopt);

// Path from start to dest, empty if dest is unreachable
std::vector<VertexId> ShortestPath(const Graph &graph, const VertexId &start,
                                   const VertexId &dest);

// Distance from start to dest, nullopt if dest is unreachable
std::optional<Distance> ShortestDistance(const Graph &graph,
                                         const VertexId &start,
                                         const VertexId &dest);

} // namespace graph_tools

#endif
