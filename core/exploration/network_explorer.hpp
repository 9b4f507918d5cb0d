#pragma once

#include "algorithms/algorithm_suite.hpp"
#include "exploration/exploration_options.hpp"
#include "exploration/exploration_result.hpp"
#include "graph/graph.hpp"

#include <memory>

namespace relnet {

// ─── Network Explorer ──────────────────────────────────────────
// Depth-bounded exploration from a start node. The graph is borrowed
// read-only for the duration of a call and never retained.
//
// Choosing a path:
//   explorePreFiltered() when the graph holds only edges worth following;
//     it runs on the traversal family's BFS with no per-edge predicate.
//   exploreByDepth() when edges need runtime filtering.
// Both yield identical node and edge sets for equivalent filters.

class NetworkExplorer {
public:
    explicit NetworkExplorer(
        std::shared_ptr<const AlgorithmSuite> algorithms = AlgorithmSuite::defaults());

    /// Breadth-first exploration with node/edge filters.
    /// Throws UnknownStartNode, InvalidBound.
    ExplorationResult exploreByDepth(const Graph& graph, const ExploreByDepthOptions& options) const;

    /// Fast path over a graph already reduced to the followed edges.
    /// Throws UnknownStartNode, InvalidBound.
    ExplorationResult explorePreFiltered(const Graph& graph, const PreFilteredOptions& options) const;

    /// exploreByDepth restricted to relation types and/or a minimum weight.
    ExplorationResult exploreByDegrees(const Graph& graph, const ExploreByDegreesOptions& options) const;

    /// BFS or DFS with a depth-aware node filter.
    ExplorationResult exploreWithFilter(const Graph& graph, const ExploreWithFilterOptions& options) const;

    /// Bounded subgraph by node set, radius, degree and edge type.
    Graph extractSubgraph(const Graph& graph, const SubgraphOptions& options) const;

    const AlgorithmSuite& algorithms() const { return *algorithms_; }

private:
    std::shared_ptr<const AlgorithmSuite> algorithms_;
};

} // namespace relnet
