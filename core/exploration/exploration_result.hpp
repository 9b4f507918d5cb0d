#pragma once

#include "graph/graph.hpp"

#include <map>
#include <set>
#include <unordered_map>
#include <vector>

namespace relnet {

struct ExplorationStatistics {
    size_t total_nodes = 0;
    size_t total_edges = 0;
    int max_depth_reached = 0;
    double average_degree = 0.0;
};

/// Outcome of one exploration call. Built fresh per call and owned by the
/// caller; it holds copies, never references into the explored graph.
struct ExplorationResult {
    std::vector<NodeId> nodes;                      // discovery order
    std::unordered_map<NodeId, int> depths;
    std::map<int, std::set<NodeId>> nodes_by_depth;
    std::vector<Edge> edges;                        // ascending edge id
    std::unordered_map<NodeId, int> visit_counts;   // random walk only
    ExplorationStatistics statistics;
    bool truncated = false;

    bool contains(NodeId id) const { return depths.count(id) > 0; }
    std::set<NodeId> nodeSet() const { return std::set<NodeId>(nodes.begin(), nodes.end()); }
    std::set<EdgeId> edgeIdSet() const;
};

/// Incremental construction of an ExplorationResult.
class ExplorationResultBuilder {
public:
    /// Record `id` at `depth`; a repeat keeps the smaller depth.
    void addNode(NodeId id, int depth);
    void recordVisit(NodeId id) { result_.visit_counts[id]++; }
    void addEdge(const Edge& edge);
    void setTruncated(bool truncated) { result_.truncated = truncated; }

    size_t nodeCount() const { return result_.nodes.size(); }
    bool contains(NodeId id) const { return result_.contains(id); }

    /// Add every graph edge with both endpoints in the result that `keep`
    /// accepts (all of them when `keep` is empty).
    void collectInducedEdges(const Graph& graph,
                             const std::function<bool(const Edge&)>& keep = {});

    /// Sort edges, group by depth and fill in statistics.
    ExplorationResult finish();

private:
    ExplorationResult result_;
    std::set<EdgeId> edge_ids_;
};

} // namespace relnet
