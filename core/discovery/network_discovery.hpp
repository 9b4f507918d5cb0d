#pragma once

#include "algorithms/algorithm_suite.hpp"
#include "discovery/bridge_analyzer.hpp"
#include "discovery/discovery_types.hpp"
#include "discovery/network_metrics.hpp"
#include "discovery/pathway_finder.hpp"

#include <memory>
#include <unordered_set>
#include <vector>

namespace relnet {

// ─── Network Discovery ─────────────────────────────────────────
// Multi-entity discovery over a borrowed, read-only graph:
//   1. hop-bounded traversal from every query entity over the allowed
//      relation types (other query entities are reached but not expanded)
//   2. union of the reached nodes with per-query distances
//   3. direct connections between query pairs
//   4. bridge entities reached from two or more query entities
//   5. shortest pathways for query pairs without a direct connection
//   6. aggregate metrics
// When the union exceeds max_discovered_nodes the closest nodes are kept,
// the result is flagged truncated and steps 3-6 see only retained nodes.

class NetworkDiscovery {
public:
    explicit NetworkDiscovery(
        std::shared_ptr<const AlgorithmSuite> algorithms = AlgorithmSuite::defaults());

    /// Throws InsufficientQueryEntities, UnknownStartNode, InvalidBound.
    DiscoveryResult discover(const Graph& graph, const DiscoveryOptions& options) const;

    /// Connection strength: one point per relationship plus 0.5 per
    /// distinct relationship type.
    static double connectionStrength(const DirectConnection& connection);

private:
    QueryReach reachFrom(const Graph& network, NodeId query,
                         const std::unordered_set<NodeId>& queries,
                         const DiscoveryOptions& options) const;

    std::shared_ptr<const AlgorithmSuite> algorithms_;
    BridgeAnalyzer bridges_;
    PathwayFinder pathways_;
    NetworkMetricsCalculator metrics_;
};

} // namespace relnet
