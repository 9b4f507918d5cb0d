#pragma once

#include "exploration/network_explorer.hpp"

#include <memory>
#include <random>

namespace relnet {

// ─── Progressive Explorer ──────────────────────────────────────
// Strategy-driven exploration bounded by a node (or visit) budget:
// - BEST_FIRST:  expand the highest-scoring frontier node next. A node is
//                scored once, when first discovered; ties go to the node
//                discovered first.
// - RANDOM_WALK: step to a uniform neighbor with walk_probability, restart
//                at the start node otherwise (or with teleport_probability).
//                max_nodes caps visit events; visit counts are recorded.
// - BREADTH / DEPTH: plain traversal, scoring and walk parameters ignored.

class ProgressiveExplorer {
public:
    explicit ProgressiveExplorer(
        std::shared_ptr<const AlgorithmSuite> algorithms = AlgorithmSuite::defaults());

    /// Throws UnknownStartNode, InvalidBound.
    ExplorationResult explore(const Graph& graph, const ProgressiveOptions& options) const;

private:
    ExplorationResult bestFirst(const Graph& graph, const ProgressiveOptions& options) const;
    ExplorationResult randomWalk(const Graph& graph, const ProgressiveOptions& options) const;

    NetworkExplorer explorer_;
};

} // namespace relnet
