#include <gtest/gtest.h>
#include "exploration/network_explorer.hpp"
#include "common/errors.hpp"
#include "common/relation_types.hpp"

#include <algorithm>
#include <set>

using namespace relnet;

namespace {

// root=1; level1={2,3,4}; level2={5,6 under 2; 7,8 under 3; 9,10 under 4}.
// Node 4 hangs off the root by an association edge, everything else is kinship.
Graph familyTree() {
    Graph g;
    g.addEdge(1, 2, kKinship);
    g.addEdge(1, 3, kKinship);
    g.addEdge(1, 4, kAssociation);
    g.addEdge(2, 5, kKinship);
    g.addEdge(2, 6, kKinship);
    g.addEdge(3, 7, kKinship);
    g.addEdge(3, 8, kKinship);
    g.addEdge(4, 9, kKinship);
    g.addEdge(4, 10, kKinship);
    return g;
}

ExploreByDepthOptions depthFrom(NodeId start, int max_depth) {
    ExploreByDepthOptions options;
    options.start_node = start;
    options.max_depth = max_depth;
    return options;
}

} // namespace

// ─── exploreByDepth ───────────────────────────────────────────

TEST(ExplorationTest, DepthZeroIsStartOnly) {
    Graph g = familyTree();
    NetworkExplorer explorer;

    for (NodeId start : g.nodeIds()) {
        ExplorationResult r = explorer.exploreByDepth(g, depthFrom(start, 0));
        EXPECT_EQ(r.nodeSet(), std::set<NodeId>{start});
        ASSERT_EQ(r.nodes_by_depth.size(), 1);
        EXPECT_EQ(r.nodes_by_depth.at(0), std::set<NodeId>{start});
        EXPECT_TRUE(r.edges.empty());
    }
}

TEST(ExplorationTest, TreeByLevels) {
    Graph g = familyTree();
    NetworkExplorer explorer;

    ExplorationResult one = explorer.exploreByDepth(g, depthFrom(1, 1));
    EXPECT_EQ(one.statistics.total_nodes, 4);
    EXPECT_EQ(one.nodes_by_depth.at(0).size(), 1);
    EXPECT_EQ(one.nodes_by_depth.at(1).size(), 3);
    EXPECT_EQ(one.edges.size(), 3);

    ExplorationResult two = explorer.exploreByDepth(g, depthFrom(1, 2));
    EXPECT_EQ(two.statistics.total_nodes, 10);
    EXPECT_EQ(two.nodes_by_depth.at(2).size(), 6);
    EXPECT_EQ(two.statistics.total_edges, 9);
    EXPECT_EQ(two.statistics.max_depth_reached, 2);
    EXPECT_DOUBLE_EQ(two.statistics.average_degree, 1.8);
    EXPECT_FALSE(two.truncated);
}

TEST(ExplorationTest, EdgesSortedById) {
    Graph g = familyTree();
    ExplorationResult r = NetworkExplorer().exploreByDepth(g, depthFrom(3, 2));
    EXPECT_TRUE(std::is_sorted(r.edges.begin(), r.edges.end(),
                               [](const Edge& a, const Edge& b) { return a.id < b.id; }));
}

TEST(ExplorationTest, MonotonicInDepth) {
    Graph g = familyTree();
    NetworkExplorer explorer;

    std::set<NodeId> previous;
    for (int depth = 0; depth <= 4; depth++) {
        std::set<NodeId> current = explorer.exploreByDepth(g, depthFrom(5, depth)).nodeSet();
        EXPECT_TRUE(std::includes(current.begin(), current.end(), previous.begin(), previous.end()))
            << "depth " << depth;
        previous = current;
    }
    EXPECT_EQ(previous.size(), 10);
}

TEST(ExplorationTest, MaxNodesCapsResult) {
    Graph g = familyTree();
    NetworkExplorer explorer;

    for (int cap = 1; cap <= 12; cap++) {
        ExploreByDepthOptions options = depthFrom(1, 5);
        options.max_nodes = cap;
        ExplorationResult r = explorer.exploreByDepth(g, options);
        EXPECT_LE(r.nodes.size(), static_cast<size_t>(cap));
        EXPECT_EQ(r.truncated, cap < 10) << "cap " << cap;
    }
}

TEST(ExplorationTest, NodeFilterPrunesSubtree) {
    Graph g = familyTree();
    ExploreByDepthOptions options = depthFrom(1, 2);
    options.node_filter = [](NodeId node, const AttributeMap&) { return node != 2; };

    ExplorationResult r = NetworkExplorer().exploreByDepth(g, options);
    EXPECT_EQ(r.nodeSet(), (std::set<NodeId>{1, 3, 4, 7, 8, 9, 10}));
}

TEST(ExplorationTest, NodeFilterReadsAttributes) {
    Graph g = familyTree();
    g.addNode(3, {{"living", false}});
    ExploreByDepthOptions options = depthFrom(1, 1);
    options.node_filter = [](NodeId, const AttributeMap& attrs) {
        auto it = attrs.find("living");
        return it == attrs.end() || std::get<bool>(it->second);
    };

    ExplorationResult r = NetworkExplorer().exploreByDepth(g, options);
    EXPECT_EQ(r.nodeSet(), (std::set<NodeId>{1, 2, 4}));
}

TEST(ExplorationTest, EarlyTerminationKeepsDiscovered) {
    Graph g = familyTree();
    ExploreByDepthOptions options = depthFrom(1, 3);
    options.early_termination = [](NodeId node, int) { return node == 3; };

    ExplorationResult r = NetworkExplorer().exploreByDepth(g, options);
    EXPECT_EQ(r.nodeSet(), (std::set<NodeId>{1, 2}));
    EXPECT_FALSE(r.truncated);
}

TEST(ExplorationTest, IncludeEdgesOff) {
    Graph g = familyTree();
    ExploreByDepthOptions options = depthFrom(1, 2);
    options.include_edges = false;

    ExplorationResult r = NetworkExplorer().exploreByDepth(g, options);
    EXPECT_EQ(r.nodes.size(), 10);
    EXPECT_TRUE(r.edges.empty());
}

TEST(ExplorationTest, DirectionOnDirectedGraph) {
    Graph g(GraphMode::DIRECTED);
    g.addEdge(1, 2, kKinship);
    g.addEdge(2, 3, kKinship);
    NetworkExplorer explorer;

    ExploreByDepthOptions options = depthFrom(3, 5);
    options.direction = TraversalDirection::FORWARD;
    EXPECT_EQ(explorer.exploreByDepth(g, options).nodeSet(), std::set<NodeId>{3});

    options.direction = TraversalDirection::BACKWARD;
    EXPECT_EQ(explorer.exploreByDepth(g, options).nodeSet(), (std::set<NodeId>{1, 2, 3}));
}

TEST(ExplorationTest, UnknownStartNode) {
    Graph g = familyTree();
    NetworkExplorer explorer;
    EXPECT_THROW(explorer.exploreByDepth(g, depthFrom(42, 2)), UnknownStartNode);

    PreFilteredOptions pre;
    pre.start_node = 42;
    EXPECT_THROW(explorer.explorePreFiltered(g, pre), UnknownStartNode);

    try {
        explorer.exploreByDepth(g, depthFrom(42, 2));
        FAIL() << "expected UnknownStartNode";
    } catch (const UnknownStartNode& e) {
        EXPECT_EQ(e.nodeId(), 42);
    }
}

TEST(ExplorationTest, InvalidBounds) {
    Graph g = familyTree();
    NetworkExplorer explorer;
    EXPECT_THROW(explorer.exploreByDepth(g, depthFrom(1, -1)), InvalidBound);

    ExploreByDepthOptions no_room = depthFrom(1, 2);
    no_room.max_nodes = 0;
    EXPECT_THROW(explorer.exploreByDepth(g, no_room), InvalidBound);

    ExploreByDegreesOptions degrees;
    degrees.start_node = 1;
    degrees.degrees = -2;
    EXPECT_THROW(explorer.exploreByDegrees(g, degrees), InvalidBound);
}

// ─── explorePreFiltered ───────────────────────────────────────

TEST(ExplorationTest, PreFilteredMatchesFilteredDepth) {
    Graph g = familyTree();
    NetworkExplorer explorer;
    const std::vector<std::vector<std::string>> allow_lists = {
        {kKinship}, {kAssociation}, {kKinship, kAssociation}, {}};

    for (const auto& types : allow_lists) {
        EdgeFilter filter = relationTypeFilter(types);
        Graph reduced = filterEdges(g, filter);

        for (NodeId start : {1, 4, 9}) {
            for (int depth = 0; depth <= 3; depth++) {
                ExploreByDepthOptions by_depth = depthFrom(start, depth);
                by_depth.edge_filter = filter;
                ExplorationResult slow = explorer.exploreByDepth(g, by_depth);

                PreFilteredOptions pre;
                pre.start_node = start;
                pre.max_depth = depth;
                ExplorationResult fast = explorer.explorePreFiltered(reduced, pre);

                EXPECT_EQ(slow.nodeSet(), fast.nodeSet());
                EXPECT_EQ(slow.edgeIdSet(), fast.edgeIdSet());
                EXPECT_EQ(slow.depths, fast.depths);
            }
        }
    }
}

TEST(ExplorationTest, PreFilteredHonorsNodeFilterAndCap) {
    Graph g = familyTree();
    NetworkExplorer explorer;

    PreFilteredOptions options;
    options.start_node = 1;
    options.node_filter = [](NodeId node, const AttributeMap&) { return node != 4; };
    EXPECT_EQ(explorer.explorePreFiltered(g, options).nodeSet(),
              (std::set<NodeId>{1, 2, 3, 5, 6, 7, 8}));

    options.max_nodes = 3;
    ExplorationResult capped = explorer.explorePreFiltered(g, options);
    EXPECT_EQ(capped.nodes.size(), 3);
    EXPECT_TRUE(capped.truncated);
}

TEST(ExplorationTest, CapReachedByFilteredNodesIsNotTruncation) {
    Graph g(GraphMode::DIRECTED);
    g.addEdge(1, 2, kKinship);
    g.addEdge(1, 3, kKinship);
    g.addEdge(1, 4, kKinship);
    NetworkExplorer explorer;
    auto not_four = [](NodeId node, const AttributeMap&) { return node != 4; };

    ExploreByDepthOptions by_depth = depthFrom(1, 1);
    by_depth.max_nodes = 3;
    by_depth.node_filter = not_four;
    ExplorationResult r = explorer.exploreByDepth(g, by_depth);
    EXPECT_EQ(r.nodeSet(), (std::set<NodeId>{1, 2, 3}));
    EXPECT_FALSE(r.truncated);

    by_depth.max_nodes = 2;
    EXPECT_TRUE(explorer.exploreByDepth(g, by_depth).truncated);

    PreFilteredOptions pre;
    pre.start_node = 1;
    pre.max_depth = 1;
    pre.max_nodes = 3;
    pre.node_filter = not_four;
    ExplorationResult fast = explorer.explorePreFiltered(g, pre);
    EXPECT_EQ(fast.nodeSet(), (std::set<NodeId>{1, 2, 3}));
    EXPECT_FALSE(fast.truncated);

    ExploreWithFilterOptions with_filter;
    with_filter.start_node = 1;
    with_filter.max_depth = 1;
    with_filter.max_nodes = 3;
    with_filter.node_filter = [](NodeId node, const AttributeMap&, int) { return node != 4; };
    ExplorationResult filtered = explorer.exploreWithFilter(g, with_filter);
    EXPECT_EQ(filtered.nodes.size(), 3);
    EXPECT_FALSE(filtered.truncated);
}

// ─── exploreByDegrees ─────────────────────────────────────────

TEST(ExplorationTest, DegreesByRelationType) {
    Graph g = familyTree();
    ExploreByDegreesOptions options;
    options.start_node = 1;
    options.degrees = 2;
    options.relation_types = {kKinship};

    ExplorationResult r = NetworkExplorer().exploreByDegrees(g, options);
    EXPECT_EQ(r.nodeSet(), (std::set<NodeId>{1, 2, 3, 5, 6, 7, 8}));
    EXPECT_FALSE(r.contains(4));
    EXPECT_FALSE(r.contains(9));
    EXPECT_FALSE(r.contains(10));
    for (const Edge& e : r.edges) EXPECT_EQ(e.relationship_type, kKinship);
}

TEST(ExplorationTest, DegreesByWeight) {
    Graph g;
    g.addEdge(1, 2, kKinship, 0.5);
    g.addEdge(1, 3, kKinship, 2.0);
    g.addEdge(3, 4, kAssociation, 1.0);

    ExploreByDegreesOptions options;
    options.start_node = 1;
    options.degrees = 3;
    options.weight_threshold = 1.0;
    EXPECT_EQ(NetworkExplorer().exploreByDegrees(g, options).nodeSet(),
              (std::set<NodeId>{1, 3, 4}));

    options.relation_types = {kKinship};
    EXPECT_EQ(NetworkExplorer().exploreByDegrees(g, options).nodeSet(),
              (std::set<NodeId>{1, 3}));
}

TEST(ExplorationTest, DegreesBidirectionalOnly) {
    Graph g(GraphMode::DIRECTED);
    g.addEdge(1, 2, kKinship);
    g.addEdge(2, 3, kKinship);

    ExploreByDegreesOptions options;
    options.start_node = 1;
    options.degrees = 2;
    options.bidirectional_only = true;

    ExplorationResult r = NetworkExplorer().exploreByDegrees(g, options);
    EXPECT_EQ(r.nodeSet(), (std::set<NodeId>{1, 2}));
    EXPECT_EQ(r.edges.size(), 1);
}

// ─── exploreWithFilter ────────────────────────────────────────

TEST(ExplorationTest, WithFilterUsesDepth) {
    Graph g = familyTree();
    ExploreWithFilterOptions options;
    options.start_node = 1;
    options.node_filter = [](NodeId node, const AttributeMap&, int depth) {
        return depth < 2 || node % 2 == 0;
    };

    ExplorationResult r = NetworkExplorer().exploreWithFilter(g, options);
    EXPECT_EQ(r.nodeSet(), (std::set<NodeId>{1, 2, 3, 4, 6, 8, 10}));
}

TEST(ExplorationTest, WithFilterDepthOrder) {
    Graph g = familyTree();
    ExploreWithFilterOptions options;
    options.start_node = 1;
    options.order = SearchOrder::DEPTH;

    ExplorationResult r = NetworkExplorer().exploreWithFilter(g, options);
    EXPECT_EQ(r.nodes, (std::vector<NodeId>{1, 2, 5, 6, 3, 7, 8, 4, 9, 10}));
    EXPECT_EQ(r.depths.at(9), 2);
}

TEST(ExplorationTest, WithFilterEdgeFilter) {
    Graph g = familyTree();
    ExploreWithFilterOptions options;
    options.start_node = 1;
    options.edge_filter = relationTypeFilter({kKinship});
    options.max_depth = 1;

    ExplorationResult r = NetworkExplorer().exploreWithFilter(g, options);
    EXPECT_EQ(r.nodeSet(), (std::set<NodeId>{1, 2, 3}));
    EXPECT_EQ(r.edges.size(), 2);
}

// ─── extractSubgraph ──────────────────────────────────────────

TEST(ExplorationTest, SubgraphByNodeSet) {
    Graph g = familyTree();
    SubgraphOptions options;
    options.nodes = std::unordered_set<NodeId>{1, 2, 3, 5};

    Graph sub = NetworkExplorer().extractSubgraph(g, options);
    EXPECT_EQ(sub.nodeCount(), 4);
    EXPECT_EQ(sub.edgeCount(), 3);
    EXPECT_TRUE(sub.hasEdge(1, 2));
    EXPECT_TRUE(sub.hasEdge(1, 3));
    EXPECT_TRUE(sub.hasEdge(2, 5));
    EXPECT_FALSE(sub.hasEdge(1, 4));
    EXPECT_FALSE(sub.hasNode(4));
}

TEST(ExplorationTest, SubgraphByRadiusAndDegree) {
    Graph g = familyTree();
    NetworkExplorer explorer;

    SubgraphOptions options;
    options.center_node = 2;
    options.radius = 1;
    Graph around = explorer.extractSubgraph(g, options);
    EXPECT_EQ(around.nodeIds(), (std::vector<NodeId>{1, 2, 5, 6}));

    // Degree is measured on the full graph: 1 and 2 have degree 3 there
    options.min_degree = 2;
    Graph hubs = explorer.extractSubgraph(g, options);
    EXPECT_EQ(hubs.nodeIds(), (std::vector<NodeId>{1, 2}));
    EXPECT_EQ(hubs.edgeCount(), 1);
}

TEST(ExplorationTest, SubgraphMaxDegreeAndEdgeTypes) {
    Graph g = familyTree();
    NetworkExplorer explorer;

    SubgraphOptions leaves;
    leaves.max_degree = 1;
    Graph sub = explorer.extractSubgraph(g, leaves);
    EXPECT_EQ(sub.nodeIds(), (std::vector<NodeId>{5, 6, 7, 8, 9, 10}));
    EXPECT_EQ(sub.edgeCount(), 0);

    SubgraphOptions typed;
    typed.nodes = std::unordered_set<NodeId>{1, 4, 9};
    typed.preserve_edge_types = {kAssociation};
    Graph assoc = explorer.extractSubgraph(g, typed);
    EXPECT_EQ(assoc.nodeCount(), 3);
    EXPECT_EQ(assoc.edgeCount(), 1);
    EXPECT_TRUE(assoc.hasEdge(1, 4));

    SubgraphOptions inverted;
    inverted.min_degree = 3;
    inverted.max_degree = 1;
    EXPECT_THROW(explorer.extractSubgraph(g, inverted), InvalidBound);
}
