#ifndef __GRAPH_TOOLS_CLI_HH__
#define __GRAPH_TOOLS_CLI_HH__
#include "CLI/App.hpp"
#include "spdlog/common.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace graph_tools {

enum class WeightKind {
  EdgeCount, // Number of edges on a path
  Distance,  // Summed edge weights
};

struct CommonOptions {
  bool verbose{false};
  std::string log_file;
  spdlog::level::level_enum log_level{spdlog::level::info};
  size_t num_vertices{8};
  size_t num_edges{9};
  int64_t max_weight{100};
  uint64_t seed{0};
};

struct GenerateOptions : CommonOptions {
  std::string graph_name{"G"};
};

struct PathOptions : CommonOptions {
  std::string source;
  std::string target;
};

struct MetricsOptions : CommonOptions {
  WeightKind weight{WeightKind::EdgeCount};
  size_t cache_size{512};
  bool per_vertex{false};
};

struct CliSubcommands {
  CLI::App *generate;
  CLI::App *path;
  CLI::App *metrics;
};

void AddCommonOptions(CLI::App *app, CommonOptions &options);
CliSubcommands CreateCli(CLI::App &app, GenerateOptions &generate_opts,
                         PathOptions &path_opts, MetricsOptions &metrics_opts);
// Installs the default logger: a stderr sink with verbose, a file sink with
// log_file, no sinks otherwise. Stdout is left to results.
void SetupLogging(const CommonOptions &options);

} // namespace graph_tools
#endif
