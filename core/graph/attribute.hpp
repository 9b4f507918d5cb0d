#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace relnet {

/// Typed value stored in a node or edge attribute map.
/// The engine treats attributes as opaque; only caller-supplied filters
/// and scorers look inside them.
using AttributeValue = std::variant<bool, int64_t, double, std::string>;
using AttributeMap = std::unordered_map<std::string, AttributeValue>;

/// Copy every entry of `incoming` into `target`, replacing existing keys.
inline void mergeAttributes(AttributeMap& target, const AttributeMap& incoming) {
    for (const auto& [key, value] : incoming) {
        target[key] = value;
    }
}

/// Numeric view of an attribute: ints and doubles convert, bools map to 0/1.
inline std::optional<double> numericAttribute(const AttributeMap& attrs, const std::string& key) {
    auto it = attrs.find(key);
    if (it == attrs.end()) return std::nullopt;
    const AttributeValue& v = it->second;
    if (auto d = std::get_if<double>(&v)) return *d;
    if (auto i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    if (auto b = std::get_if<bool>(&v)) return *b ? 1.0 : 0.0;
    return std::nullopt;
}

inline std::optional<std::string> stringAttribute(const AttributeMap& attrs, const std::string& key) {
    auto it = attrs.find(key);
    if (it == attrs.end()) return std::nullopt;
    if (auto s = std::get_if<std::string>(&it->second)) return *s;
    return std::nullopt;
}

} // namespace relnet
