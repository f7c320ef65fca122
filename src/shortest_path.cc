#include "shortest_path.hh"
#include "spdlog/spdlog.h"
#include <functional>
#include <limits>
#include <queue>
#include <stdexcept>
#include <tuple>
#include <unordered_map>
#include <utility>

namespace graph_tools {

namespace {

// Best known way to reach a vertex that is not finalized yet
struct FrontierEntry {
  Distance distance;
  const VertexId *predecessor; // nullptr for the start vertex
};

// Priority queue ordered by distance, then by discovery order. Vertex
// pointers refer to labels owned by the graph or the caller.
using QueueEntry = std::tuple<Distance, uint64_t, const VertexId *>;
using MinQueue = std::priority_queue<QueueEntry, std::vector<QueueEntry>,
                                     std::greater<QueueEntry>>;

} // namespace

DijkstraResult Dijkstra(const Graph &graph, const VertexId &start,
                        const std::optional<VertexId> &dest) {
  DijkstraResult result;
  std::unordered_map<VertexId, FrontierEntry> frontier;
  MinQueue queue;
  uint64_t sequence = 0;

  frontier.emplace(start, FrontierEntry{0, nullptr});
  queue.emplace(0, sequence++, &start);

  while (!queue.empty()) {
    const Distance dist = std::get<0>(queue.top());
    const VertexId *vertex = std::get<2>(queue.top());
    queue.pop();

    // Lazy deletion: skip entries superseded by a shorter distance
    auto it = frontier.find(*vertex);
    if (it == frontier.end() || it->second.distance != dist) {
      continue;
    }

    // Path of the predecessor is final, extend it by this vertex
    PathResult finalized{dist, {}};
    if (it->second.predecessor) {
      finalized.path = result.at(*it->second.predecessor).path;
    }
    finalized.path.push_back(*vertex);
    frontier.erase(it);

    const VertexId &current_id =
        result.emplace(*vertex, std::move(finalized)).first->first;

    if (dest && current_id == *dest) {
      spdlog::trace("Reached {} from {}, stopping early", *dest, start);
      return result;
    }

    for (const auto &[adj, weight] : graph.GetNeighbors(current_id)) {
      if (result.count(adj)) {
        continue; // Already finalized
      }
      if (weight > std::numeric_limits<Distance>::max() - dist) {
        throw std::overflow_error("Distance overflows on edge " + current_id +
                                  " -> " + adj);
      }
      Distance candidate = dist + weight;
      auto [entry, is_new] =
          frontier.try_emplace(adj, FrontierEntry{candidate, &current_id});
      if (!is_new) {
        if (candidate >= entry->second.distance) {
          continue;
        }
        entry->second = FrontierEntry{candidate, &current_id};
      }
      queue.emplace(candidate, sequence++, &adj);
    }
  }

  spdlog::trace("Finalized {} vertices from {}", result.size(), start);
  return result;
}

std::vector<VertexId> ShortestPath(const Graph &graph, const VertexId &start,
                                   const VertexId &dest) {
  auto result = Dijkstra(graph, start, dest);
  if (auto it = result.find(dest); it != result.end()) {
    return it->second.path;
  }
  return {};
}

std::optional<Distance> ShortestDistance(const Graph &graph,
                                         const VertexId &start,
                                         const VertexId &dest) {
  auto result = Dijkstra(graph, start, dest);
  if (auto it = result.find(dest); it != result.end()) {
    return it->second.distance;
  }
  return std::nullopt;
}

} // namespace graph_tools
