#pragma once

#include "graph/graph.hpp"

#include <optional>
#include <string>
#include <vector>

namespace relnet {

/// A concrete route: nodes[i] and nodes[i+1] are joined by edges[i].
struct GraphPath {
    std::vector<NodeId> nodes;
    std::vector<EdgeId> edges;

    size_t length() const { return edges.size(); }
};

/// Cost used to rank shortest paths: fewer hops first, then fewer
/// non-kinship edges.
struct PathCost {
    int hops = 0;
    int non_kinship = 0;

    bool operator<(const PathCost& other) const {
        if (hops != other.hops) return hops < other.hops;
        return non_kinship < other.non_kinship;
    }
    bool operator==(const PathCost& other) const {
        return hops == other.hops && non_kinship == other.non_kinship;
    }
};

// ─── Pathfinding Algorithm ─────────────────────────────────────
// Shortest path by hop count, ties broken toward kinship edges.
// Relationships are followed in both directions.

class PathfindingAlgorithm {
public:
    virtual ~PathfindingAlgorithm() = default;

    /// Shortest path source → target, or nullopt when unreachable or absent.
    virtual std::optional<GraphPath> shortestPath(
        const Graph& graph, NodeId source, NodeId target) const = 0;

    virtual std::string name() const = 0;

    /// Every simple path source → target with at most `max_length` edges.
    /// Parallel edges yield distinct paths.
    std::vector<GraphPath> allPaths(const Graph& graph, NodeId source, NodeId target,
                                    int max_length) const;

    /// Minimum total edge weight source → target, edges followed both ways.
    /// Throws GraphError on a negative weight along the search.
    std::optional<GraphPath> weightedShortestPath(const Graph& graph, NodeId source,
                                                  NodeId target) const;

    static PathCost costOf(const Graph& graph, const GraphPath& path);
    static double totalWeight(const Graph& graph, const GraphPath& path);
};

/// Dijkstra over the lexicographic (hops, non-kinship) cost.
class DijkstraPathfinding : public PathfindingAlgorithm {
public:
    std::optional<GraphPath> shortestPath(
        const Graph& graph, NodeId source, NodeId target) const override;
    std::string name() const override { return "dijkstra"; }
};

/// Layer-by-layer BFS that relaxes the kinship preference inside each
/// layer. Cheaper than Dijkstra on large unweighted graphs.
class LayeredBfsPathfinding : public PathfindingAlgorithm {
public:
    std::optional<GraphPath> shortestPath(
        const Graph& graph, NodeId source, NodeId target) const override;
    std::string name() const override { return "layered-bfs"; }
};

} // namespace relnet
