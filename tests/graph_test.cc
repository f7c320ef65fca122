// tests/graph_test.cc
#include "graph_tools/graph.hh"

#include <gtest/gtest.h>
#include <stdexcept>

namespace graph_tools {
namespace {

class GraphTest : public ::testing::Test {
protected:
  Graph graph_{Adjacency{{"1", {{"2", 5}, {"3", 6}}},
                         {"2", {{"3", 4}}},
                         {"3", {{"1", 5}}},
                         {"4", {}}}};
};

TEST_F(GraphTest, CountsVerticesAndEdges) {
  EXPECT_EQ(graph_.VertexCount(), 4u);
  EXPECT_EQ(graph_.EdgeCount(), 4u);
  EXPECT_FALSE(graph_.Empty());
}

TEST_F(GraphTest, VerticesAreSorted) {
  std::vector<VertexId> expected = {"1", "2", "3", "4"};
  EXPECT_EQ(graph_.Vertices(), expected);
}

TEST_F(GraphTest, EdgesAreDirected) {
  EXPECT_TRUE(graph_.HasEdge("1", "2"));
  EXPECT_FALSE(graph_.HasEdge("2", "1"));
  EXPECT_EQ(graph_.EdgeWeight("1", "3"), 6);
  EXPECT_EQ(graph_.EdgeWeight("3", "2"), std::nullopt);
}

TEST_F(GraphTest, IsolatedVertexHasEmptyAdjacency) {
  ASSERT_TRUE(graph_.HasVertex("4"));
  EXPECT_TRUE(graph_.GetNeighbors("4").empty());
  EXPECT_EQ(graph_.GetAdjacency().count("4"), 1u);
}

TEST_F(GraphTest, UnknownVertexHasNoNeighbors) {
  EXPECT_FALSE(graph_.HasVertex("99"));
  EXPECT_TRUE(graph_.GetNeighbors("99").empty());
  EXPECT_FALSE(graph_.HasEdge("99", "1"));
}

TEST(GraphConstructionTest, AddsEntriesForEdgeTargets) {
  Graph graph(Adjacency{{"a", {{"b", 1}}}});
  EXPECT_EQ(graph.VertexCount(), 2u);
  ASSERT_TRUE(graph.HasVertex("b"));
  EXPECT_TRUE(graph.GetNeighbors("b").empty());
}

TEST(GraphConstructionTest, RejectsSelfLoop) {
  Adjacency adjacency{{"a", {{"a", 1}}}};
  EXPECT_THROW(Graph{adjacency}, std::invalid_argument);
}

TEST(GraphConstructionTest, RejectsNegativeWeight) {
  Adjacency adjacency{{"a", {{"b", 2}}}, {"b", {{"a", -1}}}};
  EXPECT_THROW(Graph{adjacency}, std::invalid_argument);
}

TEST(GraphConstructionTest, AcceptsZeroWeight) {
  Graph graph(Adjacency{{"a", {{"b", 0}}}});
  EXPECT_EQ(graph.EdgeWeight("a", "b"), 0);
}

TEST(GraphConstructionTest, DefaultGraphIsEmpty) {
  Graph graph;
  EXPECT_TRUE(graph.Empty());
  EXPECT_EQ(graph.EdgeCount(), 0u);
  EXPECT_EQ(graph, Graph(Adjacency{}));
}

TEST(GraphFingerprintTest, EqualGraphsHaveEqualFingerprints) {
  Graph a(Adjacency{{"1", {{"2", 10}}}});
  Graph b(Adjacency{{"1", {{"2", 10}}}, {"2", {}}});
  EXPECT_EQ(a, b);
  EXPECT_EQ(a.Fingerprint(), b.Fingerprint());
}

TEST(GraphFingerprintTest, DifferentWeightsChangeFingerprint) {
  Graph a(Adjacency{{"1", {{"2", 10}}}});
  Graph b(Adjacency{{"1", {{"2", 11}}}});
  EXPECT_NE(a, b);
  EXPECT_NE(a.Fingerprint(), b.Fingerprint());
}

TEST(GraphFingerprintTest, EdgeDirectionChangesFingerprint) {
  Graph a(Adjacency{{"1", {{"2", 3}}}});
  Graph b(Adjacency{{"2", {{"1", 3}}}});
  EXPECT_NE(a, b);
  EXPECT_NE(a.Fingerprint(), b.Fingerprint());
}

} // namespace
} // namespace graph_tools

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
