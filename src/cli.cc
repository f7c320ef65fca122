#include "cli.hh"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <vector>

namespace graph_tools {
void SetupLogging(const CommonOptions &options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    // Results go to stdout, log lines to stderr
    if (options.verbose) {
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_pattern("[%^%l%$] %v");
      sinks.push_back(console_sink);
    }

    if (!options.log_file.empty()) {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          options.log_file, true);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("graph_tools", sinks.begin(),
                                                   sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);

    spdlog::info("Graph with {} vertices, {} edges, max weight {}, seed {}",
                 options.num_vertices, options.num_edges, options.max_weight,
                 options.seed);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    exit(1);
  }
}

void AddCommonOptions(CLI::App *app, CommonOptions &options) {
  app->add_flag("-v,--verbose", options.verbose,
                "Enable log output on the console");
  app->add_option("-l,--log-file", options.log_file, "Log file path");

  app->add_option("--log-level", options.log_level,
                  "Log level (trace, debug, info, warn, error, critical)")
      ->default_val(spdlog::level::info)
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));

  app->add_option("-n,--vertices", options.num_vertices, "Number of vertices")
      ->default_val(8)
      ->check(CLI::PositiveNumber);
  app->add_option("-e,--edges", options.num_edges,
                  "Number of directed edges, in [n-1, n*(n-1)]")
      ->default_val(9)
      ->check(CLI::NonNegativeNumber);
  app->add_option("-w,--max-weight", options.max_weight,
                  "Edge weights are drawn from [0, max-weight)")
      ->default_val(100)
      ->check(CLI::PositiveNumber);
  app->add_option("--seed", options.seed,
                  "RNG seed for graph generation (0 for random)")
      ->default_val(0);
}

CliSubcommands CreateCli(CLI::App &app, GenerateOptions &generate_opts,
                         PathOptions &path_opts, MetricsOptions &metrics_opts) {
  app.require_subcommand(1, 1);

  auto generate =
      app.add_subcommand("generate", "Generate a random graph and print DOT");
  auto path = app.add_subcommand(
      "path", "Print the shortest path between two vertices");
  auto metrics = app.add_subcommand(
      "metrics", "Print radius and diameter of a random graph");

  AddCommonOptions(generate, generate_opts);
  generate->add_option("--name", generate_opts.graph_name, "Graph name")
      ->default_val("G");

  AddCommonOptions(path, path_opts);
  path->add_option("source", path_opts.source, "Start vertex")->required();
  path->add_option("target", path_opts.target, "Destination vertex")
      ->required();

  AddCommonOptions(metrics, metrics_opts);
  metrics
      ->add_option("--weight", metrics_opts.weight,
                   "Eccentricity weight (edges, distance)")
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, WeightKind>{
              {"edges", WeightKind::EdgeCount},
              {"distance", WeightKind::Distance}},
          CLI::ignore_case));
  metrics
      ->add_option("--cache-size", metrics_opts.cache_size,
                   "Capacity of the eccentricity cache")
      ->default_val(512)
      ->check(CLI::PositiveNumber);
  metrics->add_flag("--per-vertex", metrics_opts.per_vertex,
                    "Also print the eccentricity of every vertex");

  return CliSubcommands{generate, path, metrics};
}

} // namespace graph_tools
