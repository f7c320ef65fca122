#include "graph_generator.hh"
#include "spdlog/spdlog.h"
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace graph_tools {

VertexId VertexLabel(size_t i) { return std::to_string(i); }

GraphGenerator::GraphGenerator(std::mt19937_64 &rng) : rng_(rng) {}

Weight GraphGenerator::RandomWeight(Weight max_weight) {
  std::uniform_int_distribution<Weight> weight_dist(0, max_weight - 1);
  return weight_dist(rng_);
}

size_t GraphGenerator::RandomVertex(size_t num_vertices) {
  std::uniform_int_distribution<size_t> vertex_dist(0, num_vertices - 1);
  return vertex_dist(rng_);
}

Graph GraphGenerator::MakeGraph(size_t num_vertices, size_t num_edges,
                                Weight max_weight) {
  if (max_weight <= 0) {
    throw std::invalid_argument("max_weight must be positive, got " +
                                std::to_string(max_weight));
  }

  if (num_vertices == 0) {
    if (num_edges != 0) {
      throw std::invalid_argument("A graph without vertices has no edges");
    }
    return Graph();
  }

  if (num_vertices - 1 > std::numeric_limits<size_t>::max() / num_vertices) {
    throw std::invalid_argument("Too many vertices: " +
                                std::to_string(num_vertices));
  }
  const size_t max_edges = num_vertices * (num_vertices - 1);
  const size_t tree_edges = num_vertices - 1;

  if (num_edges < tree_edges || num_edges > max_edges) {
    throw std::invalid_argument(
        "Count of edges must be in range [" + std::to_string(tree_edges) +
        ".." + std::to_string(max_edges) + "], got " +
        std::to_string(num_edges));
  }

  spdlog::debug("Generating graph: {} vertices, {} edges, max weight {}",
                num_vertices, num_edges, max_weight);

  Adjacency adjacency;
  if (num_edges == max_edges) {
    // Complete digraph, no need for a spanning tree
    for (size_t i = 0; i < num_vertices; ++i) {
      auto &neighbors = adjacency[VertexLabel(i)];
      for (size_t j = 0; j < num_vertices; ++j) {
        if (i != j) {
          neighbors[VertexLabel(j)] = RandomWeight(max_weight);
        }
      }
    }
  } else {
    adjacency = MakeSpanningTree(num_vertices, max_weight);
    AddRandomEdges(adjacency, num_vertices, num_edges - tree_edges,
                   max_weight);
  }

  Graph graph(std::move(adjacency));
  spdlog::debug("Generated graph with {} vertices and {} edges",
                graph.VertexCount(), graph.EdgeCount());
  return graph;
}

Adjacency GraphGenerator::MakeSpanningTree(size_t num_vertices,
                                           Weight max_weight) {
  Adjacency tree;
  for (size_t i = 0; i < num_vertices; ++i) {
    tree.emplace(VertexLabel(i), Neighbors{});
  }

  std::vector<bool> visited(num_vertices, false);
  size_t current = RandomVertex(num_vertices);
  visited[current] = true;
  size_t visited_count = 1;
  size_t steps = 0;

  while (visited_count < num_vertices) {
    size_t next = RandomVertex(num_vertices);
    if (!visited[next]) {
      tree[VertexLabel(current)][VertexLabel(next)] = RandomWeight(max_weight);
      visited[next] = true;
      ++visited_count;
    }
    current = next;
    ++steps;
  }

  spdlog::trace("Spanning tree walk finished after {} steps", steps);
  return tree;
}

std::vector<GraphGenerator::VertexPair>
GraphGenerator::AllVertexPairs(size_t num_vertices) {
  std::vector<VertexPair> pairs;
  pairs.reserve(num_vertices * (num_vertices - 1));
  for (size_t i = 0; i < num_vertices; ++i) {
    for (size_t j = 0; j < num_vertices; ++j) {
      if (i != j) {
        pairs.emplace_back(i, j);
      }
    }
  }
  return pairs;
}

void GraphGenerator::AddRandomEdges(Adjacency &adjacency, size_t num_vertices,
                                    size_t count, Weight max_weight) {
  if (count == 0) {
    return;
  }

  auto pairs = AllVertexPairs(num_vertices);

  // Fisher-Yates, stopped as soon as enough new edges were drawn
  size_t added = 0;
  while (added < count && !pairs.empty()) {
    std::uniform_int_distribution<size_t> index_dist(0, pairs.size() - 1);
    size_t idx = index_dist(rng_);
    VertexPair pair = pairs[idx];
    pairs[idx] = pairs.back();
    pairs.pop_back();

    auto &neighbors = adjacency[VertexLabel(pair.first)];
    const VertexId target = VertexLabel(pair.second);
    if (neighbors.find(target) != neighbors.end()) {
      continue; // Already a tree edge
    }
    neighbors.emplace(target, RandomWeight(max_weight));
    ++added;
  }

  if (added < count) {
    throw std::logic_error("Ran out of vertex pairs while adding edges");
  }
}

} // namespace graph_tools
