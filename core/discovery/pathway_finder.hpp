#pragma once

#include "algorithms/algorithm_suite.hpp"
#include "discovery/discovery_types.hpp"

#include <memory>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace relnet {

/// Pathways between query entities over a discovered network.
class PathwayFinder {
public:
    explicit PathwayFinder(
        std::shared_ptr<const AlgorithmSuite> algorithms = AlgorithmSuite::defaults());

    /// Shortest pathway for every query pair not listed in `skip_pairs`
    /// (pairs stored as (smaller, larger)). Unreachable pairs are omitted.
    std::vector<Pathway> findPathways(const Graph& network,
                                      const std::vector<NodeId>& query_entities,
                                      const std::set<std::pair<NodeId, NodeId>>& skip_pairs = {}) const;

    std::optional<Pathway> shortestPathway(const Graph& network, NodeId from, NodeId to,
                                           const std::set<NodeId>& query_entities = {}) const;

    /// Every simple pathway with at most `max_length` edges.
    std::vector<Pathway> allPathways(const Graph& network, NodeId from, NodeId to,
                                     int max_length = 3,
                                     const std::set<NodeId>& query_entities = {}) const;

    /// Simple pathways from → to that visit every node in `through`, with at
    /// most through.size() + 2 edges.
    std::vector<Pathway> pathwaysThroughNodes(const Graph& network, NodeId from, NodeId to,
                                              const std::vector<NodeId>& through,
                                              const std::set<NodeId>& query_entities = {}) const;

    /// Per edge: 2 for kinship, 1 otherwise, plus 1/(edge distance + 1)
    /// where edge distance is 0 between two query entities, 1 when one
    /// endpoint is a query entity and 2 otherwise. Normalized by length.
    static double pathStrength(const Pathway& pathway, const std::set<NodeId>& query_entities);

private:
    Pathway buildPathway(const Graph& network, const GraphPath& path,
                         const std::set<NodeId>& query_entities) const;

    std::shared_ptr<const AlgorithmSuite> algorithms_;
};

} // namespace relnet
