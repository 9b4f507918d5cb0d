#include "graph/graph.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <deque>
#include <utility>

namespace relnet {

// ─── Node operations ───────────────────────────────────────────

void Graph::addNode(NodeId id, const AttributeMap& attributes) {
    auto it = nodes_.find(id);
    if (it != nodes_.end()) {
        mergeAttributes(it->second.attributes, attributes);
        return;
    }
    nodes_.emplace(id, Node(id, attributes));
    outgoing_[id];  // ensure entry exists
    incoming_[id];
}

bool Graph::removeNode(NodeId id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    for (EdgeId eid : incidentEdges(id)) {
        removeEdge(eid);
    }

    outgoing_.erase(id);
    incoming_.erase(id);
    nodes_.erase(it);
    return true;
}

Node* Graph::getNode(NodeId id) {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const Node* Graph::getNode(NodeId id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const AttributeMap* Graph::getNodeAttributes(NodeId id) const {
    const Node* n = getNode(id);
    return n ? &n->attributes : nullptr;
}

std::vector<NodeId> Graph::nodeIds() const {
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ─── Edge operations ───────────────────────────────────────────

EdgeId Graph::addEdge(NodeId source, NodeId target,
                      const std::string& relationship_type, double weight,
                      const AttributeMap& attributes) {
    Edge e(0, source, target, relationship_type, weight);
    e.attributes = attributes;
    e.undirected = mode_ == GraphMode::UNDIRECTED;
    return insertEdge(std::move(e));
}

EdgeId Graph::mergeEdge(const Edge& edge) {
    Edge* existing = edge.id != 0 ? getEdge(edge.id) : nullptr;
    if (existing) {
        bool same_ends = (existing->source == edge.source && existing->target == edge.target) ||
                         (isUndirected(*existing) &&
                          existing->source == edge.target && existing->target == edge.source);
        if (same_ends) {
            existing->relationship_type = edge.relationship_type;
            existing->weight = edge.weight;
            mergeAttributes(existing->attributes, edge.attributes);
            return existing->id;
        }
    }
    Edge copy = edge;
    if (existing) copy.id = 0;
    return insertEdge(std::move(copy));
}

EdgeId Graph::insertEdge(Edge edge) {
    if (edge.source == edge.target) {
        throw GraphError("Self-loop rejected on node " + std::to_string(edge.source));
    }
    addNode(edge.source);
    addNode(edge.target);

    if (edge.id == 0) edge.id = next_edge_id_;
    if (edge.id >= next_edge_id_) next_edge_id_ = edge.id + 1;
    if (mode_ != GraphMode::MIXED) edge.undirected = mode_ == GraphMode::UNDIRECTED;

    EdgeId id = edge.id;
    outgoing_[edge.source].push_back(id);
    incoming_[edge.target].push_back(id);
    edges_.emplace(id, std::move(edge));
    return id;
}

bool Graph::removeEdge(EdgeId id) {
    auto it = edges_.find(id);
    if (it == edges_.end()) return false;

    const Edge& e = it->second;
    auto drop = [id](std::vector<EdgeId>& list) {
        list.erase(std::remove(list.begin(), list.end(), id), list.end());
    };
    if (outgoing_.count(e.source)) drop(outgoing_[e.source]);
    if (incoming_.count(e.target)) drop(incoming_[e.target]);

    edges_.erase(it);
    return true;
}

bool Graph::hasEdge(NodeId source, NodeId target) const {
    for (EdgeId eid : edgesBetween(source, target)) {
        const Edge& e = edges_.at(eid);
        if (e.source == source || isUndirected(e)) return true;
    }
    return false;
}

Edge* Graph::getEdge(EdgeId id) {
    auto it = edges_.find(id);
    return it != edges_.end() ? &it->second : nullptr;
}

const Edge* Graph::getEdge(EdgeId id) const {
    auto it = edges_.find(id);
    return it != edges_.end() ? &it->second : nullptr;
}

const AttributeMap* Graph::getEdgeAttributes(EdgeId id) const {
    const Edge* e = getEdge(id);
    return e ? &e->attributes : nullptr;
}

std::vector<EdgeId> Graph::edgeIds() const {
    std::vector<EdgeId> ids;
    ids.reserve(edges_.size());
    for (const auto& [id, _] : edges_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<EdgeId> Graph::edgesBetween(NodeId a, NodeId b) const {
    std::vector<EdgeId> result;
    auto out = outgoing_.find(a);
    if (out == outgoing_.end()) return result;
    for (EdgeId eid : out->second) {
        if (edges_.at(eid).target == b) result.push_back(eid);
    }
    auto in = incoming_.find(a);
    for (EdgeId eid : in->second) {
        if (edges_.at(eid).source == b) result.push_back(eid);
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool Graph::isUndirected(const Edge& edge) const {
    switch (mode_) {
        case GraphMode::DIRECTED:   return false;
        case GraphMode::UNDIRECTED: return true;
        case GraphMode::MIXED:      return edge.undirected;
    }
    return false;
}

// ─── Adjacency queries ────────────────────────────────────────

template <typename Fn>
void Graph::forEachTraversable(NodeId node_id, TraversalDirection direction, Fn&& fn) const {
    auto out = outgoing_.find(node_id);
    if (out == outgoing_.end()) return;
    for (EdgeId eid : out->second) {
        const Edge& e = edges_.at(eid);
        if (direction != TraversalDirection::BACKWARD || isUndirected(e)) fn(e);
    }
    for (EdgeId eid : incoming_.at(node_id)) {
        const Edge& e = edges_.at(eid);
        if (direction != TraversalDirection::FORWARD || isUndirected(e)) fn(e);
    }
}

std::vector<EdgeId> Graph::incidentEdges(NodeId node_id) const {
    return traversableEdges(node_id, TraversalDirection::ALL);
}

std::vector<EdgeId> Graph::traversableEdges(NodeId node_id, TraversalDirection direction) const {
    std::vector<EdgeId> result;
    forEachTraversable(node_id, direction, [&](const Edge& e) { result.push_back(e.id); });
    return result;
}

std::vector<NodeId> Graph::neighbors(NodeId node_id, TraversalDirection direction) const {
    std::vector<NodeId> result;
    std::unordered_set<NodeId> seen;
    forEachTraversable(node_id, direction, [&](const Edge& e) {
        NodeId other = e.opposite(node_id);
        if (seen.insert(other).second) result.push_back(other);
    });
    return result;
}

size_t Graph::degree(NodeId node_id) const {
    auto out = outgoing_.find(node_id);
    if (out == outgoing_.end()) return 0;
    return out->second.size() + incoming_.at(node_id).size();
}

GraphMetrics Graph::metrics() const {
    GraphMetrics m;
    m.node_count = nodes_.size();
    m.edge_count = edges_.size();
    if (m.node_count == 0) return m;

    m.average_degree = 2.0 * m.edge_count / m.node_count;
    if (m.node_count < 2) return m;

    double ordered_pairs = static_cast<double>(m.node_count) * (m.node_count - 1);
    if (mode_ == GraphMode::UNDIRECTED) {
        m.density = m.edge_count / (ordered_pairs / 2.0);
    } else {
        // Mixed: an undirected edge stands for two arcs
        double arcs = 0.0;
        for (const auto& [_, e] : edges_) {
            arcs += isUndirected(e) ? 2.0 : 1.0;
        }
        m.density = arcs / ordered_pairs;
    }
    return m;
}

// ─── Native traversal primitives ──────────────────────────────

void Graph::bfsFromNode(NodeId start, const NodeVisitor& visitor,
                        TraversalDirection direction) const {
    if (!hasNode(start)) return;

    std::unordered_set<NodeId> seen{start};
    std::deque<std::pair<NodeId, int>> queue{{start, 0}};

    while (!queue.empty()) {
        auto [node, depth] = queue.front();
        queue.pop_front();

        VisitAction action = visitor(node, depth);
        if (action == VisitAction::STOP) return;
        if (action == VisitAction::SKIP) continue;

        forEachTraversable(node, direction, [&](const Edge& e) {
            NodeId next = e.opposite(node);
            if (seen.insert(next).second) queue.emplace_back(next, depth + 1);
        });
    }
}

void Graph::dfsFromNode(NodeId start, const NodeVisitor& visitor,
                        TraversalDirection direction) const {
    if (!hasNode(start)) return;

    std::unordered_set<NodeId> seen;
    std::vector<std::pair<NodeId, int>> stack{{start, 0}};

    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();
        if (!seen.insert(node).second) continue;

        VisitAction action = visitor(node, depth);
        if (action == VisitAction::STOP) return;
        if (action == VisitAction::SKIP) continue;

        // Push in reverse so the first adjacent edge is explored first
        std::vector<NodeId> next;
        forEachTraversable(node, direction, [&](const Edge& e) {
            NodeId other = e.opposite(node);
            if (!seen.count(other)) next.push_back(other);
        });
        for (auto it = next.rbegin(); it != next.rend(); ++it) {
            stack.emplace_back(*it, depth + 1);
        }
    }
}

// ─── Subgraph extraction / combination ────────────────────────

Graph Graph::extractSubgraph(const std::unordered_set<NodeId>& node_ids) const {
    Graph sub(mode_);
    for (NodeId nid : node_ids) {
        const Node* n = getNode(nid);
        if (!n) continue;
        sub.addNode(n->id, n->attributes);
    }
    for (EdgeId eid : edgeIds()) {
        const Edge& edge = edges_.at(eid);
        if (node_ids.count(edge.source) && node_ids.count(edge.target)) {
            sub.insertEdge(edge);
        }
    }
    return sub;
}

Graph Graph::merge(const Graph& a, const Graph& b) {
    Graph result = a.clone();
    if (a.mode_ != b.mode_) {
        // Pin each edge's orientation before the mode becomes per-edge
        for (auto& [_, e] : result.edges_) {
            e.undirected = a.isUndirected(e);
        }
        result.mode_ = GraphMode::MIXED;
    }

    b.forEachNode([&](const Node& n) {
        result.addNode(n.id, n.attributes);
    });
    // Only an id shared with an edge of `a` may merge in place. Every other
    // edge of b is inserted, renumbered when its id is already taken by a
    // renumbered predecessor, so parallel edges of b all survive.
    b.forEachEdge([&](const Edge& e) {
        Edge copy = e;
        copy.undirected = b.isUndirected(e);
        if (a.hasEdge(e.id)) {
            result.mergeEdge(copy);
            return;
        }
        if (result.hasEdge(copy.id)) copy.id = 0;
        result.insertEdge(std::move(copy));
    });
    return result;
}

void Graph::clear() {
    nodes_.clear();
    edges_.clear();
    outgoing_.clear();
    incoming_.clear();
    next_edge_id_ = 1;
}

// ─── Iteration ─────────────────────────────────────────────────

void Graph::forEachNode(const std::function<void(const Node&)>& fn) const {
    for (NodeId id : nodeIds()) {
        fn(nodes_.at(id));
    }
}

void Graph::forEachEdge(const std::function<void(const Edge&)>& fn) const {
    for (EdgeId id : edgeIds()) {
        fn(edges_.at(id));
    }
}

Graph filterEdges(const Graph& graph, const std::function<bool(const Edge&)>& keep) {
    Graph filtered(graph.mode());
    graph.forEachNode([&](const Node& n) {
        filtered.addNode(n.id, n.attributes);
    });
    graph.forEachEdge([&](const Edge& e) {
        if (keep(e)) filtered.mergeEdge(e);
    });
    return filtered;
}

} // namespace relnet
