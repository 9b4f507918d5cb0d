#include "algorithms/traversal_algorithm.hpp"

#include <algorithm>
#include <unordered_set>

namespace relnet {

namespace {

std::vector<NodeId> reachableAlong(const Graph& graph, NodeId node, TraversalDirection direction) {
    std::vector<NodeId> reached;
    graph.bfsFromNode(node, [&](NodeId other, int) {
        if (other != node) reached.push_back(other);
        return VisitAction::CONTINUE;
    }, direction);
    std::sort(reached.begin(), reached.end());
    return reached;
}

} // namespace

void NativeTraversal::bfs(const Graph& graph, NodeId start, const NodeVisitor& visitor,
                          TraversalDirection direction) const {
    graph.bfsFromNode(start, visitor, direction);
}

void NativeTraversal::dfs(const Graph& graph, NodeId start, const NodeVisitor& visitor,
                          TraversalDirection direction) const {
    graph.dfsFromNode(start, visitor, direction);
}

std::unordered_map<NodeId, int> NativeTraversal::bfsDistances(
    const Graph& graph, NodeId start, int max_depth) const {
    std::unordered_map<NodeId, int> distances;
    graph.bfsFromNode(start, [&](NodeId node, int depth) {
        distances[node] = depth;
        if (max_depth >= 0 && depth >= max_depth) return VisitAction::SKIP;
        return VisitAction::CONTINUE;
    });
    return distances;
}

std::vector<std::vector<NodeId>> NativeTraversal::connectedComponents(const Graph& graph) const {
    std::vector<std::vector<NodeId>> components;
    std::unordered_set<NodeId> assigned;

    for (NodeId seed : graph.nodeIds()) {
        if (assigned.count(seed)) continue;
        std::vector<NodeId> component;
        graph.bfsFromNode(seed, [&](NodeId node, int) {
            assigned.insert(node);
            component.push_back(node);
            return VisitAction::CONTINUE;
        });
        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
    }
    return components;
}

std::vector<std::vector<NodeId>> NativeTraversal::stronglyConnectedComponents(const Graph& graph) const {
    std::vector<NodeId> ids = graph.nodeIds();
    std::unordered_map<NodeId, std::vector<NodeId>> successors;
    for (NodeId id : ids) {
        successors[id] = graph.neighbors(id, TraversalDirection::FORWARD);
    }

    // Kosaraju: record finish order of an iterative forward DFS, then sweep
    // backward edges in reverse finish order.
    std::vector<NodeId> finished;
    std::unordered_set<NodeId> seen;
    for (NodeId root : ids) {
        if (!seen.insert(root).second) continue;
        std::vector<std::pair<NodeId, size_t>> stack{{root, 0}};
        while (!stack.empty()) {
            NodeId node = stack.back().first;
            const std::vector<NodeId>& next = successors.at(node);
            if (stack.back().second < next.size()) {
                NodeId child = next[stack.back().second++];
                if (seen.insert(child).second) stack.emplace_back(child, 0);
            } else {
                finished.push_back(node);
                stack.pop_back();
            }
        }
    }

    std::vector<std::vector<NodeId>> components;
    std::unordered_set<NodeId> assigned;
    for (auto it = finished.rbegin(); it != finished.rend(); ++it) {
        if (assigned.count(*it)) continue;
        std::vector<NodeId> component;
        graph.bfsFromNode(*it, [&](NodeId node, int) {
            if (!assigned.insert(node).second) return VisitAction::SKIP;
            component.push_back(node);
            return VisitAction::CONTINUE;
        }, TraversalDirection::BACKWARD);
        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
    }
    std::sort(components.begin(), components.end(),
              [](const auto& a, const auto& b) { return a.front() < b.front(); });
    return components;
}

std::vector<NodeId> NativeTraversal::ancestors(const Graph& graph, NodeId node) const {
    return reachableAlong(graph, node, TraversalDirection::BACKWARD);
}

std::vector<NodeId> NativeTraversal::descendants(const Graph& graph, NodeId node) const {
    return reachableAlong(graph, node, TraversalDirection::FORWARD);
}

} // namespace relnet
