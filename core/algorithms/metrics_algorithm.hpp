#pragma once

#include "algorithms/traversal_algorithm.hpp"
#include "graph/graph.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace relnet {

using NodeScores = std::unordered_map<NodeId, double>;

/// Structural summary of a graph.
struct StructureMetrics {
    size_t node_count = 0;
    size_t edge_count = 0;
    double density = 0.0;
    double average_degree = 0.0;
    double average_path_length = 0.0;
    double average_clustering = 0.0;
    size_t component_count = 0;
};

struct CentralityScores {
    NodeScores degree;
    NodeScores betweenness;
    NodeScores closeness;
};

// ─── Metrics Algorithm ─────────────────────────────────────────
// Distances and components come from the traversal family the owning
// AlgorithmSuite binds with useTraversal(); NativeTraversal otherwise.
// Every measure treats edges as undirected.

class MetricsAlgorithm {
public:
    virtual ~MetricsAlgorithm() = default;

    virtual double density(const Graph& graph) const = 0;
    virtual double averageDegree(const Graph& graph) const = 0;

    /// Mean hop distance over connected pairs drawn from `among`
    /// (every node when empty). 0 when no pair is connected.
    virtual double averagePathLength(const Graph& graph,
                                     const std::vector<NodeId>& among = {}) const = 0;

    /// Number of weakly connected components.
    virtual size_t componentCount(const Graph& graph) const = 0;

    /// degree / (n - 1).
    virtual NodeScores degreeCentrality(const Graph& graph) const = 0;
    /// Shortest-path betweenness, each unordered pair counted once, unnormalized.
    virtual NodeScores betweennessCentrality(const Graph& graph) const = 0;
    /// (reachable - 1) / sum of distances to reachable nodes; 0 when isolated.
    virtual NodeScores closenessCentrality(const Graph& graph) const = 0;
    /// Principal eigenvector of the adjacency matrix, unit Euclidean norm.
    virtual NodeScores eigenvectorCentrality(const Graph& graph) const = 0;

    /// Fraction of neighbor pairs that are adjacent; 0 below two neighbors.
    virtual double localClustering(const Graph& graph, NodeId node) const = 0;
    virtual double averageClustering(const Graph& graph) const = 0;

    /// Largest finite eccentricity. 0 for an edgeless graph.
    virtual int diameter(const Graph& graph) const = 0;
    /// Smallest eccentricity among nodes with at least one neighbor.
    virtual int radius(const Graph& graph) const = 0;

    /// Sum of incident edge weights per node.
    virtual NodeScores weightedDegree(const Graph& graph) const = 0;

    virtual std::string name() const = 0;

    StructureMetrics compute(const Graph& graph) const;
    CentralityScores centrality(const Graph& graph) const;

    /// Non-owning; null restores the native traversal.
    void useTraversal(const TraversalAlgorithm* traversal) { traversal_ = traversal; }

protected:
    const TraversalAlgorithm& traversal() const;

private:
    const TraversalAlgorithm* traversal_ = nullptr;
};

/// Exact metrics: one BFS per source for distances, Brandes for
/// betweenness, power iteration on (A + I) for eigenvector centrality.
class StandardMetrics : public MetricsAlgorithm {
public:
    double density(const Graph& graph) const override;
    double averageDegree(const Graph& graph) const override;
    double averagePathLength(const Graph& graph,
                             const std::vector<NodeId>& among) const override;
    size_t componentCount(const Graph& graph) const override;
    NodeScores degreeCentrality(const Graph& graph) const override;
    NodeScores betweennessCentrality(const Graph& graph) const override;
    NodeScores closenessCentrality(const Graph& graph) const override;
    NodeScores eigenvectorCentrality(const Graph& graph) const override;
    double localClustering(const Graph& graph, NodeId node) const override;
    double averageClustering(const Graph& graph) const override;
    int diameter(const Graph& graph) const override;
    int radius(const Graph& graph) const override;
    NodeScores weightedDegree(const Graph& graph) const override;
    std::string name() const override { return "standard"; }

    int max_iterations = 100;
    double tolerance = 1e-9;
};

} // namespace relnet
