#pragma once

#include "algorithms/algorithm_suite.hpp"
#include "discovery/discovery_types.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace relnet {

/// Aggregate metrics of a discovered network.
class NetworkMetricsCalculator {
public:
    explicit NetworkMetricsCalculator(
        std::shared_ptr<const AlgorithmSuite> algorithms = AlgorithmSuite::defaults());

    /// Counts come from the result being assembled; density, average path
    /// length (between connected query pairs), component count and
    /// community count are computed on `network` by the suite.
    NetworkMetrics calculate(const Graph& network,
                             const std::vector<NodeId>& query_entities,
                             size_t direct_connections,
                             size_t bridge_entities,
                             size_t pathways) const;

    /// The `top_n` highest-degree nodes, ties by ascending id.
    static std::vector<std::pair<NodeId, size_t>> highDegreeNodes(const Graph& network, size_t top_n = 10);

private:
    std::shared_ptr<const AlgorithmSuite> algorithms_;
};

} // namespace relnet
