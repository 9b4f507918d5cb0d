#include "algorithms/pathfinding_algorithm.hpp"
#include "common/errors.hpp"
#include "common/relation_types.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace relnet {

namespace {

int edgePenalty(const Edge& e) {
    return e.relationship_type == kKinship ? 0 : 1;
}

GraphPath rebuildPath(const Graph& graph, NodeId source, NodeId target,
                      const std::unordered_map<NodeId, EdgeId>& parent) {
    GraphPath path;
    NodeId current = target;
    path.nodes.push_back(current);
    while (current != source) {
        EdgeId eid = parent.at(current);
        path.edges.push_back(eid);
        current = graph.getEdge(eid)->opposite(current);
        path.nodes.push_back(current);
    }
    std::reverse(path.nodes.begin(), path.nodes.end());
    std::reverse(path.edges.begin(), path.edges.end());
    return path;
}

} // namespace

// ─── Shared helpers ────────────────────────────────────────────

PathCost PathfindingAlgorithm::costOf(const Graph& graph, const GraphPath& path) {
    PathCost cost;
    for (EdgeId eid : path.edges) {
        const Edge* e = graph.getEdge(eid);
        if (!e) continue;
        cost.hops++;
        cost.non_kinship += edgePenalty(*e);
    }
    return cost;
}

double PathfindingAlgorithm::totalWeight(const Graph& graph, const GraphPath& path) {
    double total = 0.0;
    for (EdgeId eid : path.edges) {
        const Edge* e = graph.getEdge(eid);
        if (e) total += e->weight;
    }
    return total;
}

std::optional<GraphPath> PathfindingAlgorithm::weightedShortestPath(
    const Graph& graph, NodeId source, NodeId target) const {
    if (!graph.hasNode(source) || !graph.hasNode(target)) return std::nullopt;

    using Entry = std::pair<double, NodeId>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> frontier;
    std::unordered_map<NodeId, double> best{{source, 0.0}};
    std::unordered_map<NodeId, EdgeId> parent;
    std::unordered_set<NodeId> settled;

    frontier.emplace(0.0, source);
    while (!frontier.empty()) {
        auto [distance, node] = frontier.top();
        frontier.pop();
        if (!settled.insert(node).second) continue;
        if (node == target) return rebuildPath(graph, source, target, parent);

        for (EdgeId eid : graph.traversableEdges(node)) {
            const Edge* e = graph.getEdge(eid);
            if (e->weight < 0.0) {
                throw GraphError("Negative weight on edge " + std::to_string(eid));
            }
            NodeId next = e->opposite(node);
            if (settled.count(next)) continue;

            double candidate = distance + e->weight;
            auto it = best.find(next);
            if (it == best.end() || candidate < it->second) {
                best[next] = candidate;
                parent[next] = eid;
                frontier.emplace(candidate, next);
            }
        }
    }
    return std::nullopt;
}

std::vector<GraphPath> PathfindingAlgorithm::allPaths(
    const Graph& graph, NodeId source, NodeId target, int max_length) const {
    std::vector<GraphPath> results;
    if (!graph.hasNode(source) || !graph.hasNode(target) || max_length < 1) return results;

    GraphPath current;
    current.nodes.push_back(source);
    std::unordered_set<NodeId> on_path{source};

    std::function<void(NodeId)> extend = [&](NodeId node) {
        if (node == target) {
            results.push_back(current);
            return;
        }
        if (static_cast<int>(current.edges.size()) >= max_length) return;

        for (EdgeId eid : graph.traversableEdges(node)) {
            NodeId next = graph.getEdge(eid)->opposite(node);
            if (on_path.count(next)) continue;
            on_path.insert(next);
            current.nodes.push_back(next);
            current.edges.push_back(eid);
            extend(next);
            current.edges.pop_back();
            current.nodes.pop_back();
            on_path.erase(next);
        }
    };
    extend(source);
    return results;
}

// ─── Dijkstra ──────────────────────────────────────────────────

std::optional<GraphPath> DijkstraPathfinding::shortestPath(
    const Graph& graph, NodeId source, NodeId target) const {
    if (!graph.hasNode(source) || !graph.hasNode(target)) return std::nullopt;

    struct Entry {
        PathCost cost;
        uint64_t seq;
        NodeId node;
    };
    auto later = [](const Entry& a, const Entry& b) {
        if (!(a.cost == b.cost)) return b.cost < a.cost;
        return a.seq > b.seq;
    };
    std::priority_queue<Entry, std::vector<Entry>, decltype(later)> frontier(later);

    std::unordered_map<NodeId, PathCost> best{{source, PathCost{}}};
    std::unordered_map<NodeId, EdgeId> parent;
    std::unordered_set<NodeId> settled;
    uint64_t seq = 0;

    frontier.push({PathCost{}, seq++, source});
    while (!frontier.empty()) {
        Entry top = frontier.top();
        frontier.pop();
        if (!settled.insert(top.node).second) continue;
        if (top.node == target) return rebuildPath(graph, source, target, parent);

        for (EdgeId eid : graph.traversableEdges(top.node)) {
            const Edge* e = graph.getEdge(eid);
            NodeId next = e->opposite(top.node);
            if (settled.count(next)) continue;

            PathCost candidate{top.cost.hops + 1, top.cost.non_kinship + edgePenalty(*e)};
            auto it = best.find(next);
            if (it == best.end() || candidate < it->second) {
                best[next] = candidate;
                parent[next] = eid;
                frontier.push({candidate, seq++, next});
            }
        }
    }
    return std::nullopt;
}

// ─── Layered BFS ───────────────────────────────────────────────

std::optional<GraphPath> LayeredBfsPathfinding::shortestPath(
    const Graph& graph, NodeId source, NodeId target) const {
    if (!graph.hasNode(source) || !graph.hasNode(target)) return std::nullopt;

    std::unordered_map<NodeId, PathCost> cost{{source, PathCost{}}};
    std::unordered_map<NodeId, EdgeId> parent;
    std::deque<NodeId> queue{source};

    // FIFO order finalizes layer d before any node of layer d+1 is expanded,
    // so relaxing within the next layer is enough for the kinship tie-break.
    while (!queue.empty()) {
        NodeId node = queue.front();
        queue.pop_front();
        if (node == target) return rebuildPath(graph, source, target, parent);

        const PathCost here = cost.at(node);
        for (EdgeId eid : graph.traversableEdges(node)) {
            const Edge* e = graph.getEdge(eid);
            NodeId next = e->opposite(node);
            PathCost candidate{here.hops + 1, here.non_kinship + edgePenalty(*e)};

            auto it = cost.find(next);
            if (it == cost.end()) {
                cost.emplace(next, candidate);
                parent[next] = eid;
                queue.push_back(next);
            } else if (it->second.hops == candidate.hops &&
                       candidate.non_kinship < it->second.non_kinship) {
                it->second = candidate;
                parent[next] = eid;
            }
        }
    }
    return std::nullopt;
}

} // namespace relnet
