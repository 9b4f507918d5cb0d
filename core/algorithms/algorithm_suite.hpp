#pragma once

#include "algorithms/traversal_algorithm.hpp"
#include "algorithms/pathfinding_algorithm.hpp"
#include "algorithms/metrics_algorithm.hpp"
#include "algorithms/community_algorithm.hpp"

#include <memory>

namespace relnet {

/// One implementation per algorithm family. Explorers and discovery hold
/// a shared, immutable suite and never name a concrete class.
/// The metrics family always measures with the suite's traversal family.
class AlgorithmSuite {
public:
    /// Native traversal, Dijkstra pathfinding, standard metrics, Louvain communities.
    AlgorithmSuite();
    AlgorithmSuite(std::unique_ptr<TraversalAlgorithm> traversal,
                   std::unique_ptr<PathfindingAlgorithm> pathfinding,
                   std::unique_ptr<MetricsAlgorithm> metrics,
                   std::unique_ptr<CommunityAlgorithm> community = nullptr);

    AlgorithmSuite(const AlgorithmSuite&) = delete;
    AlgorithmSuite& operator=(const AlgorithmSuite&) = delete;

    /// Process-wide default suite. The algorithms are stateless, so
    /// sharing it across threads is safe.
    static std::shared_ptr<const AlgorithmSuite> defaults();

    const TraversalAlgorithm& traversal() const { return *traversal_; }
    const PathfindingAlgorithm& pathfinding() const { return *pathfinding_; }
    const MetricsAlgorithm& metrics() const { return *metrics_; }
    const CommunityAlgorithm& community() const { return *community_; }

    void setTraversal(std::unique_ptr<TraversalAlgorithm> t);
    void setPathfinding(std::unique_ptr<PathfindingAlgorithm> p);
    void setMetrics(std::unique_ptr<MetricsAlgorithm> m);
    void setCommunity(std::unique_ptr<CommunityAlgorithm> c);

private:
    std::unique_ptr<TraversalAlgorithm> traversal_;
    std::unique_ptr<PathfindingAlgorithm> pathfinding_;
    std::unique_ptr<MetricsAlgorithm> metrics_;
    std::unique_ptr<CommunityAlgorithm> community_;
};

} // namespace relnet
