#include "metrics.hh"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>

namespace graph_tools {

const WeightFunction &EdgeCountWeight() {
  static const WeightFunction weight_fn(
      "edge-count", [](const PathResult &result) {
        return static_cast<double>(result.path.size()) - 1.0;
      });
  return weight_fn;
}

const WeightFunction &DistanceWeight() {
  static const WeightFunction weight_fn(
      "distance", [](const PathResult &result) {
        return static_cast<double>(result.distance);
      });
  return weight_fn;
}

double Eccentricity(const Graph &graph, const VertexId &v,
                    const WeightFunction &weight_fn) {
  auto distances = Dijkstra(graph, v);
  distances.erase(v);

  if (distances.empty()) {
    return std::numeric_limits<double>::infinity();
  }

  double eccentricity = -std::numeric_limits<double>::infinity();
  for (const auto &entry : distances) {
    eccentricity = std::max(eccentricity, weight_fn(entry.second));
  }
  return eccentricity;
}

bool MetricsEngine::CacheKey::operator==(const CacheKey &other) const {
  return vertex == other.vertex && weight_fn == other.weight_fn &&
         (graph == other.graph || *graph == *other.graph);
}

size_t MetricsEngine::CacheKeyHash::operator()(const CacheKey &key) const {
  size_t hash = std::hash<uint64_t>{}(key.graph->Fingerprint());
  auto combine = [&hash](size_t value) {
    hash ^= value + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
  };
  combine(std::hash<VertexId>{}(key.vertex));
  combine(std::hash<std::string>{}(key.weight_fn));
  return hash;
}

MetricsEngine::MetricsEngine(size_t cache_capacity) : cache_(cache_capacity) {}

double MetricsEngine::Eccentricity(const Graph &graph, const VertexId &v,
                                   const WeightFunction &weight_fn) {
  std::shared_ptr<const Graph> snapshot;
  return CachedEccentricity(graph, snapshot, v, weight_fn);
}

double MetricsEngine::CachedEccentricity(const Graph &graph,
                                         std::shared_ptr<const Graph> &snapshot,
                                         const VertexId &v,
                                         const WeightFunction &weight_fn) {
  // Lookups borrow the caller's graph without owning it
  CacheKey lookup{std::shared_ptr<const Graph>(std::shared_ptr<const Graph>(),
                                               &graph),
                  v, weight_fn.Name()};
  if (auto cached = cache_.Get(lookup)) {
    return *cached;
  }

  double eccentricity = graph_tools::Eccentricity(graph, v, weight_fn);
  spdlog::trace("Eccentricity of {} ({}): {}", v, weight_fn.Name(),
                eccentricity);
  if (!snapshot) {
    snapshot = std::make_shared<const Graph>(graph);
  }
  cache_.Put(CacheKey{snapshot, v, weight_fn.Name()}, eccentricity);
  return eccentricity;
}

std::map<VertexId, double>
MetricsEngine::Eccentricities(const Graph &graph,
                              const WeightFunction &weight_fn) {
  std::map<VertexId, double> eccentricities;
  std::shared_ptr<const Graph> snapshot;
  for (const auto &entry : graph.GetAdjacency()) {
    eccentricities.emplace(entry.first, CachedEccentricity(graph, snapshot,
                                                           entry.first,
                                                           weight_fn));
  }
  return eccentricities;
}

double MetricsEngine::Radius(const Graph &graph,
                             const WeightFunction &weight_fn) {
  if (graph.Empty()) {
    throw std::invalid_argument("Radius of a graph without vertices");
  }
  auto eccentricities = Eccentricities(graph, weight_fn);
  return std::min_element(eccentricities.begin(), eccentricities.end(),
                          [](const auto &a, const auto &b) {
                            return a.second < b.second;
                          })
      ->second;
}

double MetricsEngine::Diameter(const Graph &graph,
                               const WeightFunction &weight_fn) {
  if (graph.Empty()) {
    throw std::invalid_argument("Diameter of a graph without vertices");
  }
  auto eccentricities = Eccentricities(graph, weight_fn);
  return std::max_element(eccentricities.begin(), eccentricities.end(),
                          [](const auto &a, const auto &b) {
                            return a.second < b.second;
                          })
      ->second;
}

} // namespace graph_tools
