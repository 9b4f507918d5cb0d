#include <gtest/gtest.h>
#include "algorithms/algorithm_suite.hpp"
#include "exploration/network_explorer.hpp"
#include "common/relation_types.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <memory>
#include <unordered_map>

using namespace relnet;

namespace {

// Two routes 1 → 4 of equal length; only the one through 3 is all kinship.
Graph twoRoutes() {
    Graph g;
    g.addEdge(1, 2, kAssociation);
    g.addEdge(2, 4, kAssociation);
    g.addEdge(1, 3, kKinship);
    g.addEdge(3, 4, kKinship);
    return g;
}

class CountingTraversal : public NativeTraversal {
public:
    void bfs(const Graph& graph, NodeId start, const NodeVisitor& visitor,
             TraversalDirection direction) const override {
        calls++;
        NativeTraversal::bfs(graph, start, visitor, direction);
    }

    std::unordered_map<NodeId, int> bfsDistances(const Graph& graph, NodeId start,
                                                 int max_depth) const override {
        distance_calls++;
        return NativeTraversal::bfsDistances(graph, start, max_depth);
    }

    std::vector<std::vector<NodeId>> connectedComponents(const Graph& graph) const override {
        component_calls++;
        return NativeTraversal::connectedComponents(graph);
    }

    mutable int calls = 0;
    mutable int distance_calls = 0;
    mutable int component_calls = 0;
};

// Triangles {1,2,3} and {4,5,6} joined by 3 - 4.
Graph twoTriangles() {
    Graph g;
    g.addEdge(1, 2, kKinship);
    g.addEdge(2, 3, kKinship);
    g.addEdge(1, 3, kKinship);
    g.addEdge(4, 5, kKinship);
    g.addEdge(5, 6, kKinship);
    g.addEdge(4, 6, kKinship);
    g.addEdge(3, 4, kAssociation);
    return g;
}

} // namespace

// ─── Pathfinding ──────────────────────────────────────────────

TEST(AlgorithmsTest, DijkstraPrefersKinship) {
    Graph g = twoRoutes();
    auto path = DijkstraPathfinding().shortestPath(g, 1, 4);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->nodes, (std::vector<NodeId>{1, 3, 4}));
    EXPECT_EQ(path->length(), 2);

    PathCost cost = PathfindingAlgorithm::costOf(g, *path);
    EXPECT_EQ(cost.hops, 2);
    EXPECT_EQ(cost.non_kinship, 0);
}

TEST(AlgorithmsTest, LayeredBfsPrefersKinship) {
    Graph g = twoRoutes();
    auto path = LayeredBfsPathfinding().shortestPath(g, 1, 4);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->nodes, (std::vector<NodeId>{1, 3, 4}));
}

TEST(AlgorithmsTest, HopsBeatKinship) {
    Graph g;
    g.addEdge(1, 5, kAssociation);
    g.addEdge(1, 2, kKinship);
    g.addEdge(2, 3, kKinship);
    g.addEdge(3, 5, kKinship);

    auto path = DijkstraPathfinding().shortestPath(g, 1, 5);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->length(), 1);
}

TEST(AlgorithmsTest, PathfindersAgreeOnCost) {
    Graph g;
    g.addEdge(1, 2, kAssociation);
    g.addEdge(2, 3, kKinship);
    g.addEdge(3, 4, kAssociation);
    g.addEdge(1, 5, kKinship);
    g.addEdge(5, 6, kAssociation);
    g.addEdge(6, 4, kKinship);
    g.addEdge(2, 6, kKinship);
    g.addEdge(5, 3, kKinship);
    g.addEdge(4, 7, kAssociation);
    g.addEdge(6, 7, kKinship);
    g.addNode(8);

    DijkstraPathfinding dijkstra;
    LayeredBfsPathfinding layered;
    for (NodeId s : g.nodeIds()) {
        for (NodeId t : g.nodeIds()) {
            auto a = dijkstra.shortestPath(g, s, t);
            auto b = layered.shortestPath(g, s, t);
            ASSERT_EQ(a.has_value(), b.has_value()) << s << " -> " << t;
            if (!a) continue;
            EXPECT_EQ(PathfindingAlgorithm::costOf(g, *a), PathfindingAlgorithm::costOf(g, *b))
                << s << " -> " << t;
            EXPECT_EQ(a->nodes.front(), s);
            EXPECT_EQ(a->nodes.back(), t);
        }
    }
}

TEST(AlgorithmsTest, UnreachableOrMissing) {
    Graph g;
    g.addEdge(1, 2, kKinship);
    g.addNode(3);

    DijkstraPathfinding dijkstra;
    EXPECT_FALSE(dijkstra.shortestPath(g, 1, 3).has_value());
    EXPECT_FALSE(dijkstra.shortestPath(g, 1, 99).has_value());
    EXPECT_FALSE(LayeredBfsPathfinding().shortestPath(g, 1, 3).has_value());

    auto self = dijkstra.shortestPath(g, 1, 1);
    ASSERT_TRUE(self.has_value());
    EXPECT_EQ(self->length(), 0);
}

TEST(AlgorithmsTest, DirectedEdgesFollowedBothWays) {
    Graph g(GraphMode::DIRECTED);
    g.addEdge(2, 1, kKinship);
    g.addEdge(2, 3, kKinship);

    auto path = DijkstraPathfinding().shortestPath(g, 1, 3);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->nodes, (std::vector<NodeId>{1, 2, 3}));
}

TEST(AlgorithmsTest, AllPathsBoundedByLength) {
    Graph g = twoRoutes();
    g.addEdge(1, 4, kAssociation);

    DijkstraPathfinding dijkstra;
    EXPECT_EQ(dijkstra.allPaths(g, 1, 4, 1).size(), 1);
    EXPECT_EQ(dijkstra.allPaths(g, 1, 4, 2).size(), 3);
    EXPECT_TRUE(dijkstra.allPaths(g, 1, 4, 0).empty());
}

TEST(AlgorithmsTest, AllPathsDistinguishesParallelEdges) {
    Graph g;
    g.addEdge(1, 2, kKinship);
    g.addEdge(1, 2, kAssociation);
    EXPECT_EQ(DijkstraPathfinding().allPaths(g, 1, 2, 1).size(), 2);
}

TEST(AlgorithmsTest, WeightedShortestPathFollowsWeights) {
    Graph g;
    g.addEdge(1, 2, kKinship, 5.0);
    g.addEdge(1, 3, kAssociation, 1.0);
    g.addEdge(3, 2, kAssociation, 1.5);

    auto path = DijkstraPathfinding().weightedShortestPath(g, 1, 2);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->nodes, (std::vector<NodeId>{1, 3, 2}));
    EXPECT_DOUBLE_EQ(PathfindingAlgorithm::totalWeight(g, *path), 2.5);

    // The hop-based search still takes the direct edge
    auto hops = DijkstraPathfinding().shortestPath(g, 1, 2);
    ASSERT_TRUE(hops.has_value());
    EXPECT_EQ(hops->length(), 1);

    g.addNode(9);
    EXPECT_FALSE(DijkstraPathfinding().weightedShortestPath(g, 1, 9).has_value());
    EXPECT_FALSE(DijkstraPathfinding().weightedShortestPath(g, 1, 42).has_value());
}

TEST(AlgorithmsTest, WeightedShortestPathRejectsNegativeWeight) {
    Graph g;
    g.addEdge(1, 2, kAssociation, -1.0);
    EXPECT_THROW(DijkstraPathfinding().weightedShortestPath(g, 1, 2), GraphError);
}

// ─── Traversal and metrics ────────────────────────────────────

TEST(AlgorithmsTest, ConnectedComponents) {
    Graph g;
    g.addEdge(2, 1, kKinship);
    g.addEdge(3, 4, kAssociation);
    g.addNode(5);

    auto components = NativeTraversal().connectedComponents(g);
    ASSERT_EQ(components.size(), 3);
    EXPECT_EQ(components[0], (std::vector<NodeId>{1, 2}));
    EXPECT_EQ(components[1], (std::vector<NodeId>{3, 4}));
    EXPECT_EQ(components[2], std::vector<NodeId>{5});
    EXPECT_EQ(StandardMetrics().componentCount(g), 3);
}

TEST(AlgorithmsTest, BfsDistances) {
    Graph g;
    g.addEdge(1, 2, kKinship);
    g.addEdge(2, 3, kKinship);
    g.addEdge(3, 4, kKinship);

    NativeTraversal native;
    const TraversalAlgorithm& traversal = native;
    auto bounded = traversal.bfsDistances(g, 1, 2);
    EXPECT_EQ(bounded.size(), 3);
    EXPECT_EQ(bounded.at(3), 2);

    auto all = traversal.bfsDistances(g, 1);
    EXPECT_EQ(all.at(4), 3);
}

TEST(AlgorithmsTest, AveragePathLength) {
    Graph g;
    g.addEdge(1, 2, kKinship);
    g.addEdge(2, 3, kKinship);
    g.addNode(9);

    StandardMetrics metrics;
    EXPECT_DOUBLE_EQ(metrics.averagePathLength(g, {}), 4.0 / 3.0);
    EXPECT_DOUBLE_EQ(metrics.averagePathLength(g, {1, 3}), 2.0);
    EXPECT_DOUBLE_EQ(metrics.averagePathLength(g, {1, 9}), 0.0);

    StructureMetrics all = metrics.compute(g);
    EXPECT_EQ(all.node_count, 4);
    EXPECT_EQ(all.component_count, 2);
    EXPECT_DOUBLE_EQ(all.density, 2.0 / 6.0);
}

TEST(AlgorithmsTest, StronglyConnectedComponents) {
    Graph g(GraphMode::DIRECTED);
    g.addEdge(1, 2, kKinship);
    g.addEdge(2, 3, kKinship);
    g.addEdge(3, 1, kKinship);
    g.addEdge(3, 4, kAssociation);
    g.addEdge(4, 5, kAssociation);
    g.addEdge(5, 4, kAssociation);
    g.addNode(6);

    NativeTraversal traversal;
    auto components = traversal.stronglyConnectedComponents(g);
    ASSERT_EQ(components.size(), 3);
    EXPECT_EQ(components[0], (std::vector<NodeId>{1, 2, 3}));
    EXPECT_EQ(components[1], (std::vector<NodeId>{4, 5}));
    EXPECT_EQ(components[2], std::vector<NodeId>{6});

    EXPECT_EQ(traversal.ancestors(g, 4), (std::vector<NodeId>{1, 2, 3, 5}));
    EXPECT_EQ(traversal.descendants(g, 3), (std::vector<NodeId>{1, 2, 4, 5}));
    EXPECT_TRUE(traversal.descendants(g, 6).empty());
    EXPECT_TRUE(traversal.ancestors(g, 42).empty());
}

TEST(AlgorithmsTest, UndirectedEdgesReachBothWays) {
    Graph g;
    g.addEdge(1, 2, kKinship);
    g.addEdge(2, 3, kKinship);

    NativeTraversal traversal;
    EXPECT_EQ(traversal.ancestors(g, 1), (std::vector<NodeId>{2, 3}));
    EXPECT_EQ(traversal.descendants(g, 3), (std::vector<NodeId>{1, 2}));
    EXPECT_EQ(traversal.stronglyConnectedComponents(g).size(), 1);
}

TEST(AlgorithmsTest, CentralityOnPathAndStar) {
    Graph path;
    path.addEdge(1, 2, kKinship);
    path.addEdge(2, 3, kKinship);

    StandardMetrics metrics;
    CentralityScores scores = metrics.centrality(path);
    EXPECT_DOUBLE_EQ(scores.degree.at(2), 1.0);
    EXPECT_DOUBLE_EQ(scores.degree.at(1), 0.5);
    EXPECT_DOUBLE_EQ(scores.betweenness.at(2), 1.0);
    EXPECT_DOUBLE_EQ(scores.betweenness.at(1), 0.0);
    EXPECT_DOUBLE_EQ(scores.closeness.at(2), 1.0);
    EXPECT_DOUBLE_EQ(scores.closeness.at(1), 2.0 / 3.0);

    Graph star;
    star.addEdge(1, 2, kKinship);
    star.addEdge(1, 3, kKinship);
    star.addEdge(1, 4, kKinship);

    EXPECT_DOUBLE_EQ(metrics.betweennessCentrality(star).at(1), 3.0);
    NodeScores eigen = metrics.eigenvectorCentrality(star);
    EXPECT_NEAR(eigen.at(1), 1.0 / std::sqrt(2.0), 1e-6);
    EXPECT_NEAR(eigen.at(2), 1.0 / std::sqrt(6.0), 1e-6);
    EXPECT_NEAR(eigen.at(4), eigen.at(3), 1e-12);
}

TEST(AlgorithmsTest, ClusteringDiameterAndRadius) {
    Graph g;
    g.addEdge(1, 2, kKinship);
    g.addEdge(2, 3, kKinship);
    g.addEdge(1, 3, kKinship);
    g.addEdge(3, 4, kAssociation, 2.5);

    StandardMetrics metrics;
    EXPECT_DOUBLE_EQ(metrics.localClustering(g, 1), 1.0);
    EXPECT_DOUBLE_EQ(metrics.localClustering(g, 3), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(metrics.localClustering(g, 4), 0.0);
    EXPECT_DOUBLE_EQ(metrics.averageClustering(g), 7.0 / 12.0);
    EXPECT_DOUBLE_EQ(metrics.compute(g).average_clustering, 7.0 / 12.0);

    EXPECT_EQ(metrics.diameter(g), 2);
    EXPECT_EQ(metrics.radius(g), 1);
    EXPECT_DOUBLE_EQ(metrics.weightedDegree(g).at(3), 4.5);

    // An isolated node has no eccentricity to offer the radius
    g.addNode(9);
    EXPECT_EQ(metrics.radius(g), 1);
    EXPECT_EQ(metrics.diameter(Graph()), 0);
}

// ─── Communities ──────────────────────────────────────────────

TEST(AlgorithmsTest, LouvainSplitsJoinedTriangles) {
    Graph g = twoTriangles();
    LouvainCommunities louvain;
    const CommunityAlgorithm& communities = louvain;

    CommunityStructure structure = communities.detectDetailed(g);
    EXPECT_EQ(structure.count, 2);
    EXPECT_EQ(structure.members.at(0), (std::vector<NodeId>{1, 2, 3}));
    EXPECT_EQ(structure.members.at(1), (std::vector<NodeId>{4, 5, 6}));
    EXPECT_NEAR(structure.modularity, 5.0 / 14.0, 1e-12);

    EXPECT_EQ(communities.communityOf(g, 5), 1);
    EXPECT_EQ(communities.communityOf(g, 42), -1);
    EXPECT_EQ(communities.communityMembers(g, 2), (std::vector<NodeId>{1, 3}));
}

TEST(AlgorithmsTest, CommunityBridgesAndCrossingEdges) {
    Graph g = twoTriangles();
    LouvainCommunities louvain;
    const CommunityAlgorithm& communities = louvain;

    auto bridges = communities.communityBridges(g);
    ASSERT_EQ(bridges.size(), 2);
    EXPECT_EQ(bridges.at(3), (std::vector<int>{0, 1}));
    EXPECT_EQ(bridges.at(4), (std::vector<int>{0, 1}));

    auto crossing = communities.interCommunityEdges(g);
    ASSERT_EQ(crossing.size(), 1);
    EXPECT_EQ(crossing.at({0, 1}), 1);

    auto sizes = communities.communitySizes(g);
    EXPECT_EQ(sizes.at(0), 3);
    EXPECT_EQ(sizes.at(1), 3);
    auto largest = communities.largestCommunities(g, 1);
    ASSERT_EQ(largest.size(), 1);
    EXPECT_EQ(largest[0], (std::pair<int, size_t>{0, 3}));

    EXPECT_DOUBLE_EQ(CommunityAlgorithm::cohesion(g, {1, 2, 3}), 1.0);
    EXPECT_DOUBLE_EQ(CommunityAlgorithm::cohesion(g, {1, 2, 3, 4, 5, 6}), 7.0 / 15.0);
    EXPECT_DOUBLE_EQ(CommunityAlgorithm::cohesion(g, {1}), 0.0);
}

TEST(AlgorithmsTest, CommunitiesAcrossResolutions) {
    Graph g = twoTriangles();
    LouvainCommunities louvain;
    const CommunityAlgorithm& communities = louvain;

    auto levels = communities.detectHierarchical(g);
    ASSERT_EQ(levels.size(), 4);
    EXPECT_DOUBLE_EQ(levels[1].resolution, 1.0);
    EXPECT_EQ(levels[1].count, 2);
    EXPECT_EQ(levels[1].communities.size(), 6);

    // Without edges every node stays alone
    Graph scattered;
    scattered.addNode(1);
    scattered.addNode(2);
    CommunityStructure alone = communities.detectDetailed(scattered);
    EXPECT_EQ(alone.count, 2);
    EXPECT_DOUBLE_EQ(alone.modularity, 0.0);
}

// ─── Suite ────────────────────────────────────────────────────

TEST(AlgorithmsTest, SuiteDefaultsAndSubstitution) {
    auto defaults = AlgorithmSuite::defaults();
    EXPECT_EQ(defaults->traversal().name(), "native");
    EXPECT_EQ(defaults->pathfinding().name(), "dijkstra");
    EXPECT_EQ(defaults->metrics().name(), "standard");
    EXPECT_EQ(defaults->community().name(), "louvain");
    EXPECT_EQ(defaults, AlgorithmSuite::defaults());

    AlgorithmSuite custom(nullptr, std::make_unique<LayeredBfsPathfinding>(), nullptr);
    EXPECT_EQ(custom.traversal().name(), "native");
    EXPECT_EQ(custom.pathfinding().name(), "layered-bfs");

    custom.setPathfinding(nullptr);
    EXPECT_EQ(custom.pathfinding().name(), "layered-bfs");
}

TEST(AlgorithmsTest, PreFilteredRunsOnTraversalFamily) {
    auto counting = std::make_unique<CountingTraversal>();
    CountingTraversal* counted = counting.get();
    auto suite = std::make_shared<AlgorithmSuite>(std::move(counting), nullptr, nullptr);

    Graph g = twoRoutes();
    NetworkExplorer explorer(suite);

    PreFilteredOptions pre;
    pre.start_node = 1;
    ExplorationResult r = explorer.explorePreFiltered(g, pre);
    EXPECT_EQ(r.nodes.size(), 4);
    EXPECT_EQ(counted->calls, 1);

    ExploreByDepthOptions by_depth;
    by_depth.start_node = 1;
    explorer.exploreByDepth(g, by_depth);
    EXPECT_EQ(counted->calls, 1);
}

TEST(AlgorithmsTest, MetricsMeasureThroughSuiteTraversal) {
    auto counting = std::make_unique<CountingTraversal>();
    CountingTraversal* counted = counting.get();
    AlgorithmSuite suite(std::move(counting), nullptr, nullptr);

    Graph g = twoRoutes();
    EXPECT_EQ(suite.metrics().componentCount(g), 1);
    EXPECT_EQ(counted->component_calls, 1);

    EXPECT_DOUBLE_EQ(suite.metrics().averagePathLength(g), 8.0 / 6.0);
    EXPECT_EQ(counted->distance_calls, 4);

    // A replaced traversal is picked up by the metrics family
    auto replacement = std::make_unique<CountingTraversal>();
    CountingTraversal* replaced = replacement.get();
    suite.setTraversal(std::move(replacement));
    suite.setMetrics(std::make_unique<StandardMetrics>());
    suite.metrics().compute(g);
    EXPECT_EQ(replaced->component_calls, 1);
    EXPECT_EQ(replaced->distance_calls, 4);
}
