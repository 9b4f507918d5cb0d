#include "exploration/exploration_result.hpp"

#include <algorithm>

namespace relnet {

std::set<EdgeId> ExplorationResult::edgeIdSet() const {
    std::set<EdgeId> ids;
    for (const Edge& e : edges) ids.insert(e.id);
    return ids;
}

void ExplorationResultBuilder::addNode(NodeId id, int depth) {
    auto it = result_.depths.find(id);
    if (it == result_.depths.end()) {
        result_.depths.emplace(id, depth);
        result_.nodes.push_back(id);
    } else if (depth < it->second) {
        it->second = depth;
    }
}

void ExplorationResultBuilder::addEdge(const Edge& edge) {
    if (edge_ids_.insert(edge.id).second) {
        result_.edges.push_back(edge);
    }
}

void ExplorationResultBuilder::collectInducedEdges(
    const Graph& graph, const std::function<bool(const Edge&)>& keep) {
    for (NodeId id : result_.nodes) {
        for (EdgeId eid : graph.incidentEdges(id)) {
            const Edge* e = graph.getEdge(eid);
            if (edge_ids_.count(eid) || !contains(e->opposite(id))) continue;
            if (keep && !keep(*e)) continue;
            addEdge(*e);
        }
    }
}

ExplorationResult ExplorationResultBuilder::finish() {
    std::sort(result_.edges.begin(), result_.edges.end(),
              [](const Edge& a, const Edge& b) { return a.id < b.id; });

    result_.nodes_by_depth.clear();
    int max_depth = 0;
    for (NodeId id : result_.nodes) {
        int depth = result_.depths.at(id);
        result_.nodes_by_depth[depth].insert(id);
        max_depth = std::max(max_depth, depth);
    }

    ExplorationStatistics& stats = result_.statistics;
    stats.total_nodes = result_.nodes.size();
    stats.total_edges = result_.edges.size();
    stats.max_depth_reached = max_depth;
    stats.average_degree = stats.total_nodes > 0
        ? (2.0 * stats.total_edges) / stats.total_nodes
        : 0.0;

    ExplorationResult out = std::move(result_);
    result_ = ExplorationResult{};
    edge_ids_.clear();
    return out;
}

} // namespace relnet
