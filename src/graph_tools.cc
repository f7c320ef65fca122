#include "cli.hh"
#include "dot_export.hh"
#include "graph_generator.hh"
#include "metrics.hh"
#include "shortest_path.hh"
#include <CLI/CLI.hpp>
#include <chrono>
#include <cmath>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace {
using namespace graph_tools;

Graph MakeRandomGraph(const CommonOptions &opts) {
  uint64_t seed = opts.seed ? opts.seed
                            : static_cast<uint64_t>(
                                  std::chrono::system_clock::now()
                                      .time_since_epoch()
                                      .count());
  spdlog::info("Using seed {}", seed);

  std::mt19937_64 rng(seed);
  GraphGenerator generator(rng);

  auto gen_start = std::chrono::steady_clock::now();
  Graph graph =
      generator.MakeGraph(opts.num_vertices, opts.num_edges, opts.max_weight);
  auto gen_end = std::chrono::steady_clock::now();
  spdlog::info("Graph generation time: {}ms",
               std::chrono::duration_cast<std::chrono::milliseconds>(
                   gen_end - gen_start)
                   .count());
  return graph;
}

std::string FormatEccentricity(double value) {
  return std::isinf(value) ? std::string("inf") : fmt::format("{}", value);
}

int RunGenerate(const GenerateOptions &opts) {
  Graph graph = MakeRandomGraph(opts);
  WriteDot(graph, std::cout, opts.graph_name);
  return 0;
}

int RunPath(const PathOptions &opts) {
  Graph graph = MakeRandomGraph(opts);
  for (const auto &v : {opts.source, opts.target}) {
    if (!graph.HasVertex(v)) {
      throw std::invalid_argument("Vertex " + v + " is not in the graph");
    }
  }

  auto result = Dijkstra(graph, opts.source, opts.target);
  auto it = result.find(opts.target);
  if (it == result.end()) {
    std::cout << "No path exists between vertices " << opts.source << " and "
              << opts.target << "\n";
    return 0;
  }

  std::cout << "Path length: " << it->second.distance << "\n";
  std::cout << "Path: ";
  const auto &path = it->second.path;
  for (size_t i = 0; i < path.size(); ++i) {
    std::cout << path[i];
    if (i < path.size() - 1)
      std::cout << " -> ";
  }
  std::cout << "\n";
  return 0;
}

int RunMetrics(const MetricsOptions &opts) {
  Graph graph = MakeRandomGraph(opts);
  MetricsEngine engine(opts.cache_size);
  const WeightFunction &weight_fn = opts.weight == WeightKind::Distance
                                        ? DistanceWeight()
                                        : EdgeCountWeight();

  if (opts.per_vertex) {
    for (const auto &[v, ecc] : engine.Eccentricities(graph, weight_fn)) {
      std::cout << "Eccentricity(" << v << "): " << FormatEccentricity(ecc)
                << "\n";
    }
  }
  std::cout << "Radius: " << FormatEccentricity(engine.Radius(graph, weight_fn))
            << "\n";
  std::cout << "Diameter: "
            << FormatEccentricity(engine.Diameter(graph, weight_fn)) << "\n";

  std::stringstream ss;
  ss << engine.GetCacheStats();
  spdlog::info(ss.str());
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Graph tools - random digraphs, shortest paths and metrics"};
  GenerateOptions generate_opts;
  PathOptions path_opts;
  MetricsOptions metrics_opts;

  auto subcmds = CreateCli(app, generate_opts, path_opts, metrics_opts);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  const bool is_generate = subcmds.generate->parsed();
  const bool is_path = subcmds.path->parsed();
  const CommonOptions &active_opts =
      is_generate ? static_cast<const CommonOptions &>(generate_opts)
      : is_path   ? static_cast<const CommonOptions &>(path_opts)
                  : static_cast<const CommonOptions &>(metrics_opts);

  SetupLogging(active_opts);

  try {
    if (is_generate) {
      return RunGenerate(generate_opts);
    }
    if (is_path) {
      return RunPath(path_opts);
    }
    return RunMetrics(metrics_opts);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
