#pragma once

#include "graph/attribute.hpp"

#include <cstdint>
#include <string>

namespace relnet {

using NodeId = uint64_t;

/// An entity in the relationship graph: an opaque id plus caller-defined
/// attributes (label, type, numeric properties).
struct Node {
    NodeId id = 0;
    AttributeMap attributes;

    Node() = default;
    explicit Node(NodeId id, AttributeMap attributes = {})
        : id(id), attributes(std::move(attributes)) {}

    void setAttribute(const std::string& key, AttributeValue value) {
        attributes[key] = std::move(value);
    }

    const AttributeValue* getAttribute(const std::string& key) const {
        auto it = attributes.find(key);
        return it != attributes.end() ? &it->second : nullptr;
    }

    bool hasAttribute(const std::string& key) const {
        return attributes.count(key) > 0;
    }
};

} // namespace relnet
