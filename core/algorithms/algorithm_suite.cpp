#include "algorithms/algorithm_suite.hpp"

namespace relnet {

AlgorithmSuite::AlgorithmSuite()
    : traversal_(std::make_unique<NativeTraversal>()),
      pathfinding_(std::make_unique<DijkstraPathfinding>()),
      metrics_(std::make_unique<StandardMetrics>()),
      community_(std::make_unique<LouvainCommunities>()) {
    metrics_->useTraversal(traversal_.get());
}

AlgorithmSuite::AlgorithmSuite(std::unique_ptr<TraversalAlgorithm> traversal,
                               std::unique_ptr<PathfindingAlgorithm> pathfinding,
                               std::unique_ptr<MetricsAlgorithm> metrics,
                               std::unique_ptr<CommunityAlgorithm> community)
    : AlgorithmSuite() {
    // Null arguments keep the default for that family
    setTraversal(std::move(traversal));
    setPathfinding(std::move(pathfinding));
    setMetrics(std::move(metrics));
    setCommunity(std::move(community));
}

std::shared_ptr<const AlgorithmSuite> AlgorithmSuite::defaults() {
    static const std::shared_ptr<const AlgorithmSuite> suite =
        std::make_shared<const AlgorithmSuite>();
    return suite;
}

void AlgorithmSuite::setTraversal(std::unique_ptr<TraversalAlgorithm> t) {
    if (!t) return;
    traversal_ = std::move(t);
    metrics_->useTraversal(traversal_.get());
}

void AlgorithmSuite::setPathfinding(std::unique_ptr<PathfindingAlgorithm> p) {
    if (p) pathfinding_ = std::move(p);
}

void AlgorithmSuite::setMetrics(std::unique_ptr<MetricsAlgorithm> m) {
    if (!m) return;
    metrics_ = std::move(m);
    metrics_->useTraversal(traversal_.get());
}

void AlgorithmSuite::setCommunity(std::unique_ptr<CommunityAlgorithm> c) {
    if (c) community_ = std::move(c);
}

} // namespace relnet
