#include "graph.hh"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <utility>

namespace graph_tools {

namespace {
constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

void HashBytes(uint64_t &hash, const void *data, size_t size) {
  const auto *bytes = static_cast<const unsigned char *>(data);
  for (size_t i = 0; i < size; ++i) {
    hash ^= bytes[i];
    hash *= kFnvPrime;
  }
}

void HashLabel(uint64_t &hash, const VertexId &label) {
  uint64_t size = label.size();
  HashBytes(hash, &size, sizeof(size));
  HashBytes(hash, label.data(), label.size());
}

const Neighbors &NoNeighbors() {
  static const Neighbors empty;
  return empty;
}
} // namespace

Graph::Graph(Adjacency adjacency) : adjacency_(std::move(adjacency)) {
  Validate();

  // Targets without their own entry still are vertices of the graph
  std::vector<VertexId> missing;
  for (const auto &[v, neighbors] : adjacency_) {
    edge_count_ += neighbors.size();
    for (const auto &entry : neighbors) {
      if (adjacency_.find(entry.first) == adjacency_.end()) {
        missing.push_back(entry.first);
      }
    }
  }
  for (const auto &v : missing) {
    adjacency_.emplace(v, Neighbors{});
  }

  fingerprint_ = ComputeFingerprint();
}

void Graph::Validate() const {
  for (const auto &[v, neighbors] : adjacency_) {
    for (const auto &[adj, weight] : neighbors) {
      if (adj == v) {
        throw std::invalid_argument("Self-loop on vertex " + v);
      }
      if (weight < 0) {
        throw std::invalid_argument("Negative weight on edge " + v + " -> " +
                                    adj);
      }
    }
  }
}

uint64_t Graph::ComputeFingerprint() const {
  uint64_t hash = kFnvOffsetBasis;
  for (const auto &[v, neighbors] : adjacency_) {
    HashLabel(hash, v);
    uint64_t degree = neighbors.size();
    HashBytes(hash, &degree, sizeof(degree));
    for (const auto &[adj, weight] : neighbors) {
      HashLabel(hash, adj);
      HashBytes(hash, &weight, sizeof(weight));
    }
  }
  return hash;
}

std::vector<VertexId> Graph::Vertices() const {
  std::vector<VertexId> vertices;
  vertices.reserve(adjacency_.size());
  for (const auto &entry : adjacency_) {
    vertices.push_back(entry.first);
  }
  return vertices;
}

bool Graph::HasVertex(const VertexId &v) const {
  return adjacency_.find(v) != adjacency_.end();
}

bool Graph::HasEdge(const VertexId &from, const VertexId &to) const {
  return EdgeWeight(from, to).has_value();
}

std::optional<Weight> Graph::EdgeWeight(const VertexId &from,
                                        const VertexId &to) const {
  const auto &neighbors = GetNeighbors(from);
  if (auto it = neighbors.find(to); it != neighbors.end()) {
    return it->second;
  }
  return std::nullopt;
}

const Neighbors &Graph::GetNeighbors(const VertexId &v) const {
  if (auto it = adjacency_.find(v); it != adjacency_.end()) {
    return it->second;
  }
  spdlog::trace("Vertex {} not in graph, treating as having no edges", v);
  return NoNeighbors();
}

bool Graph::operator==(const Graph &other) const {
  return fingerprint_ == other.fingerprint_ && adjacency_ == other.adjacency_;
}

} // namespace graph_tools
