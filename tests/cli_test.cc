// tests/cli_test.cc
#include "graph_tools/cli.hh"

#include <CLI/CLI.hpp>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace graph_tools {
namespace {

class CliTest : public ::testing::Test {
protected:
  void SetUp() override {
    subcmds_ = CreateCli(app_, generate_opts_, path_opts_, metrics_opts_);
  }

  CLI::App app_{"graph tools"};
  GenerateOptions generate_opts_;
  PathOptions path_opts_;
  MetricsOptions metrics_opts_;
  CliSubcommands subcmds_{};
};

TEST_F(CliTest, MetricsDefaults) {
  app_.parse("metrics");
  EXPECT_TRUE(subcmds_.metrics->parsed());
  EXPECT_EQ(metrics_opts_.weight, WeightKind::EdgeCount);
  EXPECT_EQ(metrics_opts_.cache_size, 512u);
  EXPECT_FALSE(metrics_opts_.per_vertex);
  EXPECT_FALSE(metrics_opts_.verbose);
  EXPECT_EQ(metrics_opts_.num_vertices, 8u);
  EXPECT_EQ(metrics_opts_.num_edges, 9u);
  EXPECT_EQ(metrics_opts_.max_weight, 100);
  EXPECT_EQ(metrics_opts_.log_level, spdlog::level::info);
}

TEST_F(CliTest, MetricsOptions) {
  app_.parse("metrics --weight Distance --cache-size 16 --per-vertex -n 5 "
             "-e 7 --seed 42");
  EXPECT_EQ(metrics_opts_.weight, WeightKind::Distance);
  EXPECT_EQ(metrics_opts_.cache_size, 16u);
  EXPECT_TRUE(metrics_opts_.per_vertex);
  EXPECT_EQ(metrics_opts_.num_vertices, 5u);
  EXPECT_EQ(metrics_opts_.num_edges, 7u);
  EXPECT_EQ(metrics_opts_.seed, 42u);
}

TEST_F(CliTest, PathPositionals) {
  app_.parse("path 0 3 --log-level debug");
  EXPECT_TRUE(subcmds_.path->parsed());
  EXPECT_FALSE(subcmds_.metrics->parsed());
  EXPECT_EQ(path_opts_.source, "0");
  EXPECT_EQ(path_opts_.target, "3");
  EXPECT_EQ(path_opts_.log_level, spdlog::level::debug);
}

TEST_F(CliTest, GenerateName) {
  app_.parse("generate --name Random -w 10");
  EXPECT_EQ(generate_opts_.graph_name, "Random");
  EXPECT_EQ(generate_opts_.max_weight, 10);
}

TEST_F(CliTest, MetricsOnlyOptionsRejectedElsewhere) {
  EXPECT_THROW(app_.parse("path 0 1 --weight distance"), CLI::ParseError);
}

TEST_F(CliTest, InvalidValuesRejected) {
  EXPECT_THROW(app_.parse("metrics --weight hops"), CLI::ParseError);
  EXPECT_THROW(app_.parse("metrics --cache-size 0"), CLI::ParseError);
}

TEST_F(CliTest, PathRequiresBothVertices) {
  EXPECT_THROW(app_.parse("path 0"), CLI::ParseError);
}

TEST_F(CliTest, ExactlyOneSubcommand) {
  EXPECT_THROW(app_.parse(""), CLI::ParseError);
}

TEST(SetupLoggingTest, SilentWithoutSinks) {
  CommonOptions options;
  SetupLogging(options);
  auto logger = spdlog::default_logger();
  EXPECT_EQ(logger->name(), "graph_tools");
  EXPECT_TRUE(logger->sinks().empty());
}

TEST(SetupLoggingTest, VerboseLogsToStderr) {
  CommonOptions options;
  options.verbose = true;
  options.log_level = spdlog::level::warn;
  SetupLogging(options);
  auto logger = spdlog::default_logger();
  ASSERT_EQ(logger->sinks().size(), 1u);
  EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(
                logger->sinks().front()),
            nullptr);
  EXPECT_EQ(logger->level(), spdlog::level::warn);
}

TEST(SetupLoggingTest, LogFileReceivesLines) {
  CommonOptions options;
  options.log_file = testing::TempDir() + "graph_tools_cli_test.log";
  SetupLogging(options);
  spdlog::info("Vertex {} finalized", "v7");
  spdlog::default_logger()->flush();

  std::ifstream in(options.log_file);
  std::string contents((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
  EXPECT_NE(contents.find("Graph with 8 vertices"), std::string::npos);
  EXPECT_NE(contents.find("Vertex v7 finalized"), std::string::npos);
}

} // namespace
} // namespace graph_tools

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
