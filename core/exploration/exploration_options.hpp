#pragma once

#include "graph/graph.hpp"

#include <climits>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace relnet {

// ─── Callbacks ─────────────────────────────────────────────────
// Injected predicates and scorers. They must be pure: the engine may call
// them in any order and assumes identical input gives identical output.

using NodeFilter = std::function<bool(NodeId node, const AttributeMap& attributes)>;
using DepthNodeFilter = std::function<bool(NodeId node, const AttributeMap& attributes, int depth)>;
using EdgeFilter = std::function<bool(const Edge& edge)>;
using EarlyTermination = std::function<bool(NodeId node, int depth)>;
using NodeScorer = std::function<double(NodeId node, const AttributeMap& attributes)>;

/// Edge filter accepting only the given relationship types.
EdgeFilter relationTypeFilter(const std::vector<std::string>& relation_types);

// ─── Exploration configurations ────────────────────────────────
// validate() throws InvalidBound for out-of-range bounds.

struct ExploreByDepthOptions {
    NodeId start_node = 0;
    int max_depth = 3;
    int max_nodes = 1000;
    NodeFilter node_filter;
    EdgeFilter edge_filter;
    EarlyTermination early_termination;
    TraversalDirection direction = TraversalDirection::ALL;
    bool include_edges = true;

    void validate() const;
};

/// For graphs already reduced to the edges worth following.
struct PreFilteredOptions {
    NodeId start_node = 0;
    int max_depth = 10;
    int max_nodes = INT_MAX;
    NodeFilter node_filter;
    EarlyTermination early_termination;
    TraversalDirection direction = TraversalDirection::ALL;
    bool include_edges = true;

    void validate() const;
};

struct ExploreByDegreesOptions {
    NodeId start_node = 0;
    int degrees = 1;
    std::vector<std::string> relation_types;    // empty = any type
    std::optional<double> weight_threshold;     // edge.weight >= threshold
    bool bidirectional_only = false;
    int max_nodes = 1000;

    void validate() const;
};

enum class SearchOrder {
    BREADTH,
    DEPTH
};

struct ExploreWithFilterOptions {
    NodeId start_node = 0;
    DepthNodeFilter node_filter;
    EdgeFilter edge_filter;
    int max_depth = 10;
    int max_nodes = INT_MAX;
    SearchOrder order = SearchOrder::BREADTH;

    void validate() const;
};

/// Selection modes combine by intersection; the edge-type allow-list is
/// applied after node selection.
struct SubgraphOptions {
    std::optional<std::unordered_set<NodeId>> nodes;
    std::optional<NodeId> center_node;
    int radius = 1;
    std::optional<size_t> min_degree;   // degree measured on the full graph
    std::optional<size_t> max_degree;
    std::vector<std::string> preserve_edge_types;

    void validate() const;
};

enum class ExplorationStrategy {
    BREADTH,
    DEPTH,
    BEST_FIRST,
    RANDOM_WALK
};

struct ProgressiveOptions {
    NodeId start_node = 0;
    ExplorationStrategy strategy = ExplorationStrategy::BREADTH;
    int max_nodes = 100;                // random walk: cap on visit events
    NodeScorer scoring;
    double walk_probability = 0.85;
    double teleport_probability = 0.15;
    std::optional<uint64_t> seed;

    void validate() const;
};

} // namespace relnet
