#pragma once

#include "graph/attribute.hpp"
#include "graph/node.hpp"

#include <cstdint>
#include <string>

namespace relnet {

using EdgeId = uint64_t;

/// A typed relationship source → target with an optional weight.
/// `undirected` is only consulted in mixed-mode graphs; the graph mode
/// decides it otherwise.
struct Edge {
    EdgeId id = 0;
    NodeId source = 0;
    NodeId target = 0;
    std::string relationship_type;
    double weight = 1.0;
    bool undirected = false;
    AttributeMap attributes;

    Edge() = default;
    Edge(EdgeId id, NodeId source, NodeId target, std::string rel_type, double weight = 1.0)
        : id(id), source(source), target(target),
          relationship_type(std::move(rel_type)), weight(weight) {}

    /// The endpoint across from `node_id`.
    NodeId opposite(NodeId node_id) const {
        return node_id == source ? target : source;
    }

    bool touches(NodeId node_id) const {
        return source == node_id || target == node_id;
    }
};

} // namespace relnet
