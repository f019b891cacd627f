#include <gtest/gtest.h>
#include "planning/astar_search.hpp"

using namespace uav_planner;

TEST(AStarSearch, FindsCheapestPath) {
    Graph graph;
    int a = graph.addNode(Point3(0, 0, 0));
    int b = graph.addNode(Point3(1, 0, 0));
    int c = graph.addNode(Point3(2, 0, 0));
    int d = graph.addNode(Point3(1, 5, 0));
    ASSERT_TRUE(graph.addEdge(a, d));
    ASSERT_TRUE(graph.addEdge(d, c));
    ASSERT_TRUE(graph.addEdge(a, b));
    ASSERT_TRUE(graph.addEdge(b, c));

    SearchResult result;
    ASSERT_EQ(searchGraph(graph, a, c, result), PlanStatus::Success);
    EXPECT_EQ(result.nodeIds, (std::vector<int>{a, b, c}));
    EXPECT_DOUBLE_EQ(result.cost, 2.0);
    ASSERT_EQ(result.path.size(), 3u);
    EXPECT_EQ(result.path.front(), Point3(0, 0, 0));
    EXPECT_EQ(result.path.back(), Point3(2, 0, 0));
    EXPECT_GT(result.expansions, 0u);
}

TEST(AStarSearch, TiesResolvedByInsertionOrder) {
    // 正方形两条等长路径, 先入队的节点优先
    Graph graph;
    graph.addNode(Point3(0, 0, 0));
    graph.addNode(Point3(1, 0, 0));
    graph.addNode(Point3(0, 1, 0));
    graph.addNode(Point3(1, 1, 0));
    graph.addEdge(0, 1);
    graph.addEdge(0, 2);
    graph.addEdge(1, 3);
    graph.addEdge(2, 3);

    SearchResult first;
    ASSERT_EQ(searchGraph(graph, 0, 3, first), PlanStatus::Success);
    EXPECT_EQ(first.nodeIds, (std::vector<int>{0, 1, 3}));
    EXPECT_DOUBLE_EQ(first.cost, 2.0);

    for (int i = 0; i < 5; ++i) {
        SearchResult again;
        ASSERT_EQ(searchGraph(graph, 0, 3, again), PlanStatus::Success);
        EXPECT_EQ(again.nodeIds, first.nodeIds);
        EXPECT_EQ(again.expansions, first.expansions);
    }
}

TEST(AStarSearch, DisconnectedGoalHasNoPath) {
    Graph graph;
    graph.addNode(Point3(0, 0, 0));
    graph.addNode(Point3(1, 0, 0));
    graph.addNode(Point3(5, 0, 0));
    graph.addEdge(0, 1);

    SearchResult result;
    EXPECT_EQ(searchGraph(graph, 0, 2, result), PlanStatus::NoPathFound);
    EXPECT_TRUE(result.path.empty());
    EXPECT_TRUE(result.nodeIds.empty());
}

TEST(AStarSearch, UnknownVertexIsReported) {
    Graph graph;
    graph.addNode(Point3(0, 0, 0));
    graph.addNode(Point3(1, 0, 0));
    graph.addEdge(0, 1);

    SearchResult result;
    EXPECT_EQ(searchGraph(graph, 0, 7, result), PlanStatus::VertexNotFound);
    EXPECT_EQ(searchGraph(graph, -1, 1, result), PlanStatus::VertexNotFound);
    EXPECT_EQ(result.expansions, 0u);

    Graph empty;
    EXPECT_EQ(searchGraph(empty, 0, 0, result), PlanStatus::VertexNotFound);
}

TEST(AStarSearch, StartEqualsGoal) {
    Graph graph;
    graph.addNode(Point3(0, 0, 0));
    graph.addNode(Point3(3, 0, 0));
    graph.addEdge(0, 1);

    SearchResult result;
    ASSERT_EQ(searchGraph(graph, 1, 1, result), PlanStatus::Success);
    EXPECT_EQ(result.nodeIds, (std::vector<int>{1}));
    EXPECT_DOUBLE_EQ(result.cost, 0.0);
}

TEST(Graph, RejectsInvalidEdges) {
    Graph graph;
    graph.addNode(Point3(0, 0, 0));
    graph.addNode(Point3(0, 3, 4));

    EXPECT_TRUE(graph.addEdge(0, 1));
    EXPECT_FALSE(graph.addEdge(1, 0));
    EXPECT_FALSE(graph.addEdge(0, 0));
    EXPECT_FALSE(graph.addEdge(0, 2));
    EXPECT_EQ(graph.edgeCount(), 1u);
    EXPECT_DOUBLE_EQ(graph.neighbors(0).front().weight, 5.0);
    EXPECT_EQ(graph.nearestNode(Point3(0, 2.9, 4)), 1);
}
