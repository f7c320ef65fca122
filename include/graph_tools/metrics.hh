#ifndef __GRAPH_TOOLS_METRICS_HH__
#define __GRAPH_TOOLS_METRICS_HH__

#include "graph.hh"
#include "lru_cache.hh"
#include "shortest_path.hh"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace graph_tools {

/**
 * @brief Scalar value of a shortest path, used to define eccentricity
 *
 * @details The name identifies the function in the metrics cache, two
 * weight functions with the same name must compute the same values.
 */
class WeightFunction {
public:
  using Function = std::function<double(const PathResult &)>;

  WeightFunction(std::string name, Function fn)
      : name_(std::move(name)), fn_(std::move(fn)) {}

  const std::string &Name() const { return name_; }
  double operator()(const PathResult &result) const { return fn_(result); }

private:
  std::string name_;
  Function fn_;
};

// Number of edges on the path
const WeightFunction &EdgeCountWeight();
// Summed edge weights
const WeightFunction &DistanceWeight();

/**
 * @brief Eccentricity of v without caching
 *
 * @return Largest weight_fn value over the shortest paths from v to every
 * other vertex reachable from v, or infinity when v reaches no other vertex
 */
double Eccentricity(const Graph &graph, const VertexId &v,
                    const WeightFunction &weight_fn = EdgeCountWeight());

/**
 * @brief Eccentricity based graph metrics with memoization
 *
 * @details Eccentricities are cached per (graph contents, vertex, weight
 * function name) in an LRU cache owned by the engine. Cached entries hold a
 * shared copy of their graph and match only a graph with equal adjacency,
 * so cached and uncached results are identical.
 */
class MetricsEngine {
public:
  static constexpr size_t kDefaultCacheCapacity = 512;

  explicit MetricsEngine(size_t cache_capacity = kDefaultCacheCapacity);

  // Non-copyable
  MetricsEngine(const MetricsEngine &) = delete;
  MetricsEngine &operator=(const MetricsEngine &) = delete;

  double Eccentricity(const Graph &graph, const VertexId &v,
                      const WeightFunction &weight_fn = EdgeCountWeight());

  // Eccentricity of every vertex
  std::map<VertexId, double>
  Eccentricities(const Graph &graph,
                 const WeightFunction &weight_fn = EdgeCountWeight());

  // Minimum eccentricity. Throws std::invalid_argument on an empty graph.
  double Radius(const Graph &graph,
                const WeightFunction &weight_fn = EdgeCountWeight());

  // Maximum eccentricity. Throws std::invalid_argument on an empty graph.
  double Diameter(const Graph &graph,
                  const WeightFunction &weight_fn = EdgeCountWeight());

  CacheStats GetCacheStats() const { return cache_.GetStats(); }
  void ClearCache() { cache_.Clear(); }

private:
  struct CacheKey {
    std::shared_ptr<const Graph> graph; // never null
    VertexId vertex;
    std::string weight_fn;

    bool operator==(const CacheKey &other) const;
  };

  struct CacheKeyHash {
    size_t operator()(const CacheKey &key) const;
  };

  // snapshot is the copy of graph stored with new entries, made on the
  // first miss and shared by later ones
  double CachedEccentricity(const Graph &graph,
                            std::shared_ptr<const Graph> &snapshot,
                            const VertexId &v, const WeightFunction &weight_fn);

  LruCache<CacheKey, double, CacheKeyHash> cache_;
};

} // namespace graph_tools

#endif
