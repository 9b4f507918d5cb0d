#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace relnet {

/// Base class for conditions the engine surfaces to its caller.
class RelnetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The start node (or a query entity) is absent from the graph.
class UnknownStartNode : public RelnetError {
public:
    explicit UnknownStartNode(uint64_t node_id)
        : RelnetError("Start node not found: " + std::to_string(node_id)),
          node_id_(node_id) {}

    uint64_t nodeId() const { return node_id_; }

private:
    uint64_t node_id_;
};

/// Multi-entity discovery needs at least two distinct query entities.
class InsufficientQueryEntities : public RelnetError {
public:
    explicit InsufficientQueryEntities(size_t supplied)
        : RelnetError("Multi-entity discovery needs at least 2 query entities, got " +
                      std::to_string(supplied)),
          supplied_(supplied) {}

    size_t supplied() const { return supplied_; }

private:
    size_t supplied_;
};

/// A depth, size or probability bound is out of range.
class InvalidBound : public RelnetError {
public:
    InvalidBound(const std::string& name, const std::string& value)
        : RelnetError("Invalid bound " + name + ": " + value), name_(name) {}

    const std::string& boundName() const { return name_; }

private:
    std::string name_;
};

/// Structural violation while building a graph (e.g. a self-loop).
class GraphError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace relnet
