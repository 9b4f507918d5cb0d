#pragma once

#include "common/relation_types.hpp"
#include "exploration/exploration_options.hpp"
#include "graph/graph.hpp"

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace relnet {

struct DiscoveryOptions {
    std::vector<NodeId> query_entities;
    int max_hop_distance = 2;
    std::vector<std::string> include_relation_types;   // empty = every type
    NodeFilter node_filter;                             // never applied to query entities
    size_t max_bridge_entities = 0;                     // top-N, 0 = all
    int max_discovered_nodes = 5000;                    // safety cap on the union
    bool include_discovery_paths = false;

    /// Throws InvalidBound.
    void validate() const;
};

/// Hop-bounded reach of one query entity: distances and a shortest-path
/// tree (parent edge per node, kinship edges preferred).
struct QueryReach {
    NodeId query = 0;
    std::unordered_map<NodeId, int> distance;
    std::unordered_map<NodeId, EdgeId> parent_edge;

    bool reaches(NodeId id) const { return distance.count(id) > 0; }
};

/// Query-relative classification of one node.
struct DiscoveredEntity {
    NodeId id = 0;
    int distance = 0;                       // min over query entities
    bool is_query_entity = false;
    std::set<NodeId> connects_to;           // query entities that reached it (self excluded)
    std::map<NodeId, int> distances;        // query entity → hops
    std::vector<NodeId> discovery_path;     // nearest query entity → id, when requested
};

struct DirectConnection {
    NodeId entity_a = 0;
    NodeId entity_b = 0;
    std::vector<Edge> relationships;
    std::set<std::string> relation_types;
    double strength = 0.0;
};

struct BridgeEntity {
    NodeId id = 0;
    std::vector<NodeId> connects_to;
    std::map<NodeId, int> distances;
    std::map<NodeId, std::vector<std::string>> connection_types;   // relation types toward each query entity
    RelationMix bridge_type = RelationMix::ASSOCIATION;
    double bridge_score = 0.0;
};

struct Pathway {
    NodeId from = 0;
    NodeId to = 0;
    std::vector<NodeId> path;
    std::vector<Edge> edges;
    RelationMix path_type = RelationMix::ASSOCIATION;
    double strength = 0.0;

    size_t length() const { return edges.size(); }
};

struct NetworkMetrics {
    size_t total_nodes = 0;
    size_t query_entities = 0;
    size_t discovered_entities = 0;
    size_t total_edges = 0;
    size_t direct_connections = 0;
    size_t bridge_entities = 0;
    size_t pathways = 0;
    double density = 0.0;
    double average_path_length = 0.0;
    size_t component_count = 0;
    size_t community_count = 0;
};

/// Complete output of multi-entity discovery. Owns copies of everything it
/// reports; nothing refers back into the input graph.
struct DiscoveryResult {
    std::vector<NodeId> query_entities;
    std::map<NodeId, DiscoveredEntity> entities;
    std::vector<Edge> edges;
    std::vector<DirectConnection> direct_connections;
    std::vector<BridgeEntity> bridge_entities;
    std::vector<Pathway> pathways;
    NetworkMetrics metrics;
    bool truncated = false;

    const DiscoveredEntity* entity(NodeId id) const {
        auto it = entities.find(id);
        return it != entities.end() ? &it->second : nullptr;
    }
};

} // namespace relnet
