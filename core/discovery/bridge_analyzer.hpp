#pragma once

#include "discovery/discovery_types.hpp"

#include <map>
#include <string>
#include <vector>

namespace relnet {

struct BridgeStatistics {
    size_t total = 0;
    std::map<RelationMix, size_t> by_type;
    double average_connections = 0.0;
    size_t max_connections = 0;
};

/// Finds non-query entities that connect two or more query entities and
/// ranks them. Score = number of query entities reached + sum of 1/hops,
/// plus 0.5 per extra parallel relationship to a directly adjacent query
/// entity. More connections and shorter paths rank higher.
class BridgeAnalyzer {
public:
    /// Bridges sorted by descending score (ties by ascending id);
    /// `limit` > 0 keeps only the top entries.
    std::vector<BridgeEntity> findBridges(const Graph& network,
                                          const std::map<NodeId, DiscoveredEntity>& entities,
                                          const std::vector<QueryReach>& reaches,
                                          size_t limit = 0) const;

    static double bridgeScore(const BridgeEntity& bridge, const Graph& network);

    static std::vector<BridgeEntity> filterByMinConnections(
        const std::vector<BridgeEntity>& bridges, size_t min_connections);
    static std::vector<BridgeEntity> filterByType(
        const std::vector<BridgeEntity>& bridges, RelationMix type);
    static BridgeStatistics statistics(const std::vector<BridgeEntity>& bridges);

private:
    /// Relation types along the shortest-path tree from `node` back to the reach's query entity.
    static std::vector<std::string> typesTowardQuery(const Graph& network, const QueryReach& reach,
                                                     NodeId node);
};

} // namespace relnet
