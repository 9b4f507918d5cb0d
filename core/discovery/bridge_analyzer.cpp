#include "discovery/bridge_analyzer.hpp"

#include <algorithm>

namespace relnet {

std::vector<BridgeEntity> BridgeAnalyzer::findBridges(
    const Graph& network,
    const std::map<NodeId, DiscoveredEntity>& entities,
    const std::vector<QueryReach>& reaches,
    size_t limit) const {
    std::vector<BridgeEntity> bridges;

    for (const auto& [id, entity] : entities) {
        if (entity.is_query_entity || entity.connects_to.size() < 2) continue;

        BridgeEntity bridge;
        bridge.id = id;
        bridge.connects_to.assign(entity.connects_to.begin(), entity.connects_to.end());
        bridge.distances = entity.distances;

        RelationMixTracker mix;
        for (const QueryReach& reach : reaches) {
            if (!entity.connects_to.count(reach.query)) continue;
            std::vector<std::string> types = typesTowardQuery(network, reach, id);
            for (const auto& t : types) mix.add(t);
            bridge.connection_types[reach.query] = std::move(types);
        }
        bridge.bridge_type = mix.mix();
        bridge.bridge_score = bridgeScore(bridge, network);
        bridges.push_back(std::move(bridge));
    }

    std::sort(bridges.begin(), bridges.end(), [](const BridgeEntity& a, const BridgeEntity& b) {
        if (a.bridge_score != b.bridge_score) return a.bridge_score > b.bridge_score;
        return a.id < b.id;
    });
    if (limit > 0 && bridges.size() > limit) bridges.resize(limit);
    return bridges;
}

double BridgeAnalyzer::bridgeScore(const BridgeEntity& bridge, const Graph& network) {
    double score = static_cast<double>(bridge.connects_to.size());
    for (const auto& [query, hops] : bridge.distances) {
        if (query == bridge.id || hops <= 0) continue;
        score += 1.0 / hops;
        if (hops == 1) {
            size_t parallel = network.edgesBetween(bridge.id, query).size();
            if (parallel > 1) score += 0.5 * (parallel - 1);
        }
    }
    return score;
}

std::vector<std::string> BridgeAnalyzer::typesTowardQuery(
    const Graph& network, const QueryReach& reach, NodeId node) {
    std::vector<std::string> types;
    NodeId current = node;
    while (current != reach.query) {
        auto it = reach.parent_edge.find(current);
        if (it == reach.parent_edge.end()) break;
        const Edge* e = network.getEdge(it->second);
        if (!e) break;
        types.push_back(e->relationship_type);
        current = e->opposite(current);
    }
    return types;
}

std::vector<BridgeEntity> BridgeAnalyzer::filterByMinConnections(
    const std::vector<BridgeEntity>& bridges, size_t min_connections) {
    std::vector<BridgeEntity> out;
    for (const auto& b : bridges) {
        if (b.connects_to.size() >= min_connections) out.push_back(b);
    }
    return out;
}

std::vector<BridgeEntity> BridgeAnalyzer::filterByType(
    const std::vector<BridgeEntity>& bridges, RelationMix type) {
    std::vector<BridgeEntity> out;
    for (const auto& b : bridges) {
        if (b.bridge_type == type) out.push_back(b);
    }
    return out;
}

BridgeStatistics BridgeAnalyzer::statistics(const std::vector<BridgeEntity>& bridges) {
    BridgeStatistics stats;
    stats.total = bridges.size();
    if (bridges.empty()) return stats;

    size_t connections = 0;
    for (const auto& b : bridges) {
        stats.by_type[b.bridge_type]++;
        connections += b.connects_to.size();
        stats.max_connections = std::max(stats.max_connections, b.connects_to.size());
    }
    stats.average_connections = static_cast<double>(connections) / bridges.size();
    return stats;
}

} // namespace relnet
