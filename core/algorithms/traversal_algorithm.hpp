#pragma once

#include "graph/graph.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace relnet {

// ─── Traversal Algorithm ───────────────────────────────────────
// Abstract traversal family. Engine code only sees this interface,
// so an implementation can be swapped without touching call sites.

class TraversalAlgorithm {
public:
    virtual ~TraversalAlgorithm() = default;

    /// Breadth-first walk driven by `visitor`.
    virtual void bfs(const Graph& graph, NodeId start, const NodeVisitor& visitor,
                     TraversalDirection direction = TraversalDirection::ALL) const = 0;

    /// Depth-first walk driven by `visitor`.
    virtual void dfs(const Graph& graph, NodeId start, const NodeVisitor& visitor,
                     TraversalDirection direction = TraversalDirection::ALL) const = 0;

    /// Hop distance from `start` to every node within `max_depth` (< 0 = unbounded).
    virtual std::unordered_map<NodeId, int> bfsDistances(
        const Graph& graph, NodeId start, int max_depth = -1) const = 0;

    /// Weakly connected components, each sorted, ordered by smallest member.
    virtual std::vector<std::vector<NodeId>> connectedComponents(const Graph& graph) const = 0;

    /// Strongly connected components over edge direction; undirected edges
    /// count both ways. Same ordering as connectedComponents().
    virtual std::vector<std::vector<NodeId>> stronglyConnectedComponents(const Graph& graph) const = 0;

    /// Nodes with a directed path to `node` (sorted, `node` excluded).
    virtual std::vector<NodeId> ancestors(const Graph& graph, NodeId node) const = 0;
    /// Nodes reachable from `node` along edge direction (sorted, `node` excluded).
    virtual std::vector<NodeId> descendants(const Graph& graph, NodeId node) const = 0;

    virtual std::string name() const = 0;
};

/// Delegates to the graph's own BFS/DFS primitives.
class NativeTraversal : public TraversalAlgorithm {
public:
    void bfs(const Graph& graph, NodeId start, const NodeVisitor& visitor,
             TraversalDirection direction) const override;
    void dfs(const Graph& graph, NodeId start, const NodeVisitor& visitor,
             TraversalDirection direction) const override;
    std::unordered_map<NodeId, int> bfsDistances(
        const Graph& graph, NodeId start, int max_depth) const override;
    std::vector<std::vector<NodeId>> connectedComponents(const Graph& graph) const override;
    std::vector<std::vector<NodeId>> stronglyConnectedComponents(const Graph& graph) const override;
    std::vector<NodeId> ancestors(const Graph& graph, NodeId node) const override;
    std::vector<NodeId> descendants(const Graph& graph, NodeId node) const override;
    std::string name() const override { return "native"; }
};

} // namespace relnet
