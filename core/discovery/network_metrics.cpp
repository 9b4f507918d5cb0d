#include "discovery/network_metrics.hpp"

#include <algorithm>

namespace relnet {

NetworkMetricsCalculator::NetworkMetricsCalculator(std::shared_ptr<const AlgorithmSuite> algorithms)
    : algorithms_(algorithms ? std::move(algorithms) : AlgorithmSuite::defaults()) {}

NetworkMetrics NetworkMetricsCalculator::calculate(const Graph& network,
                                                   const std::vector<NodeId>& query_entities,
                                                   size_t direct_connections,
                                                   size_t bridge_entities,
                                                   size_t pathways) const {
    const MetricsAlgorithm& metrics = algorithms_->metrics();

    NetworkMetrics m;
    m.total_nodes = network.nodeCount();
    m.total_edges = network.edgeCount();
    for (NodeId q : query_entities) {
        if (network.hasNode(q)) m.query_entities++;
    }
    m.discovered_entities = m.total_nodes - m.query_entities;
    m.direct_connections = direct_connections;
    m.bridge_entities = bridge_entities;
    m.pathways = pathways;
    m.density = metrics.density(network);
    m.average_path_length = metrics.averagePathLength(network, query_entities);
    m.component_count = metrics.componentCount(network);
    m.community_count = algorithms_->community().detectDetailed(network).count;
    return m;
}

std::vector<std::pair<NodeId, size_t>> NetworkMetricsCalculator::highDegreeNodes(
    const Graph& network, size_t top_n) {
    std::vector<std::pair<NodeId, size_t>> degrees;
    for (NodeId id : network.nodeIds()) {
        degrees.emplace_back(id, network.degree(id));
    }
    std::stable_sort(degrees.begin(), degrees.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (degrees.size() > top_n) degrees.resize(top_n);
    return degrees;
}

} // namespace relnet
