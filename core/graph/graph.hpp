#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace relnet {

enum class GraphMode {
    DIRECTED,
    UNDIRECTED,
    MIXED           // per-edge `undirected` flag decides
};

/// Which incident edges a traversal may follow from a node.
/// Undirected edges are followed in every direction.
enum class TraversalDirection {
    ALL,
    FORWARD,
    BACKWARD
};

/// Answer of a traversal visitor for the node it was just handed.
enum class VisitAction {
    CONTINUE,       // expand this node's neighbors
    SKIP,           // keep going, but do not expand this node
    STOP            // abort the whole traversal
};

using NodeVisitor = std::function<VisitAction(NodeId node, int depth)>;

struct GraphMetrics {
    size_t node_count = 0;
    size_t edge_count = 0;
    double density = 0.0;
    double average_degree = 0.0;
};

// ─── Graph ─────────────────────────────────────────────────────
// In-memory relationship graph. G = (N, E) with a directed, undirected
// or mixed mode. Multi-edges are allowed, self-loops are not.
// Adjacency lists keep edge insertion order so traversals are repeatable.
// Lookups of missing ids return null/empty rather than throwing.

class Graph {
public:
    explicit Graph(GraphMode mode = GraphMode::UNDIRECTED) : mode_(mode) {}

    GraphMode mode() const { return mode_; }

    // ── Node operations ──
    /// Add the node or merge `attributes` into the existing one.
    void addNode(NodeId id, const AttributeMap& attributes = {});
    bool removeNode(NodeId id);
    bool hasNode(NodeId id) const { return nodes_.count(id) > 0; }
    Node* getNode(NodeId id);
    const Node* getNode(NodeId id) const;
    const AttributeMap* getNodeAttributes(NodeId id) const;
    std::vector<NodeId> nodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }

    // ── Edge operations ──
    /// Add a new edge, creating missing endpoints. Throws GraphError on a self-loop.
    EdgeId addEdge(NodeId source, NodeId target,
                   const std::string& relationship_type, double weight = 1.0,
                   const AttributeMap& attributes = {});
    /// Insert `edge`, or merge it into the edge with the same id and endpoints.
    /// A zero or clashing id gets a fresh one.
    EdgeId mergeEdge(const Edge& edge);
    bool removeEdge(EdgeId id);
    bool hasEdge(EdgeId id) const { return edges_.count(id) > 0; }
    /// True if some edge leads source → target (either way when undirected).
    bool hasEdge(NodeId source, NodeId target) const;
    Edge* getEdge(EdgeId id);
    const Edge* getEdge(EdgeId id) const;
    const AttributeMap* getEdgeAttributes(EdgeId id) const;
    std::vector<EdgeId> edgeIds() const;
    /// All edges joining a and b, in either direction.
    std::vector<EdgeId> edgesBetween(NodeId a, NodeId b) const;
    size_t edgeCount() const { return edges_.size(); }
    bool isUndirected(const Edge& edge) const;

    // ── Adjacency queries ──
    std::vector<EdgeId> incidentEdges(NodeId node_id) const;
    std::vector<EdgeId> traversableEdges(NodeId node_id,
                                         TraversalDirection direction = TraversalDirection::ALL) const;
    std::vector<NodeId> neighbors(NodeId node_id,
                                  TraversalDirection direction = TraversalDirection::ALL) const;
    size_t degree(NodeId node_id) const;

    GraphMetrics metrics() const;

    // ── Native traversal primitives ──
    void bfsFromNode(NodeId start, const NodeVisitor& visitor,
                     TraversalDirection direction = TraversalDirection::ALL) const;
    void dfsFromNode(NodeId start, const NodeVisitor& visitor,
                     TraversalDirection direction = TraversalDirection::ALL) const;

    // ── Subgraph extraction / combination ──
    Graph extractSubgraph(const std::unordered_set<NodeId>& node_ids) const;
    /// Union of a and b; attributes from b win on conflict.
    static Graph merge(const Graph& a, const Graph& b);
    void clear();
    Graph clone() const { return *this; }

    // ── Iteration (ascending id order) ──
    void forEachNode(const std::function<void(const Node&)>& fn) const;
    void forEachEdge(const std::function<void(const Edge&)>& fn) const;

private:
    EdgeId insertEdge(Edge edge);

    template <typename Fn>
    void forEachTraversable(NodeId node_id, TraversalDirection direction, Fn&& fn) const;

    GraphMode mode_;
    EdgeId next_edge_id_ = 1;

    std::unordered_map<NodeId, Node> nodes_;
    std::unordered_map<EdgeId, Edge> edges_;

    // Adjacency lists: node_id → edge_ids in insertion order
    std::unordered_map<NodeId, std::vector<EdgeId>> outgoing_;
    std::unordered_map<NodeId, std::vector<EdgeId>> incoming_;
};

/// Copy of `graph` with every node and only the edges `keep` accepts.
Graph filterEdges(const Graph& graph, const std::function<bool(const Edge&)>& keep);

} // namespace relnet
