// tests/dot_export_test.cc
#include "graph_tools/dot_export.hh"

#include <gtest/gtest.h>
#include <sstream>

namespace graph_tools {
namespace {

TEST(DotExportTest, WritesNodesAndWeightedEdges) {
  Graph graph(Adjacency{{"1", {{"2", 5}, {"3", 6}}}, {"2", {{"3", 4}}}});
  const std::string expected = "digraph \"G\" {\n"
                               "  \"1\";\n"
                               "  \"2\";\n"
                               "  \"3\";\n"
                               "  \"1\" -> \"2\" [weight=5, label=\"5\"];\n"
                               "  \"1\" -> \"3\" [weight=6, label=\"6\"];\n"
                               "  \"2\" -> \"3\" [weight=4, label=\"4\"];\n"
                               "}\n";
  EXPECT_EQ(ToDot(graph), expected);
}

TEST(DotExportTest, IsolatedVertexStillListed) {
  Graph graph(Adjacency{{"lonely", {}}});
  EXPECT_EQ(ToDot(graph, "H"), "digraph \"H\" {\n  \"lonely\";\n}\n");
}

TEST(DotExportTest, EscapesQuotesInLabels) {
  Graph graph(Adjacency{{"say \"hi\"", {}}});
  EXPECT_NE(ToDot(graph).find("\"say \\\"hi\\\"\";"), std::string::npos);
}

TEST(DotExportTest, StreamMatchesString) {
  Graph graph(Adjacency{{"a", {{"b", 0}}}});
  std::ostringstream ss;
  WriteDot(graph, ss);
  EXPECT_EQ(ss.str(), ToDot(graph));
}

} // namespace
} // namespace graph_tools

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
