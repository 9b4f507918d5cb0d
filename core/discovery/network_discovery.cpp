#include "discovery/network_discovery.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace relnet {

namespace {

std::vector<NodeId> uniqueInOrder(const std::vector<NodeId>& ids) {
    std::vector<NodeId> out;
    std::unordered_set<NodeId> seen;
    for (NodeId id : ids) {
        if (seen.insert(id).second) out.push_back(id);
    }
    return out;
}

std::map<NodeId, DiscoveredEntity> unionOf(const std::vector<QueryReach>& reaches,
                                          const std::unordered_set<NodeId>& queries) {
    std::map<NodeId, DiscoveredEntity> entities;
    for (const QueryReach& reach : reaches) {
        for (const auto& [node, hops] : reach.distance) {
            DiscoveredEntity& entity = entities[node];
            entity.id = node;
            entity.is_query_entity = queries.count(node) > 0;
            entity.distances[reach.query] = hops;
            if (node != reach.query) entity.connects_to.insert(reach.query);
        }
    }
    for (auto& [id, entity] : entities) {
        int best = std::numeric_limits<int>::max();
        for (const auto& [query, hops] : entity.distances) best = std::min(best, hops);
        entity.distance = entity.is_query_entity ? 0 : best;
    }
    return entities;
}

// Closest first: query entities, then distance, then breadth of connection.
std::unordered_set<NodeId> retainClosest(const std::map<NodeId, DiscoveredEntity>& entities,
                                         size_t cap) {
    std::vector<const DiscoveredEntity*> ranked;
    for (const auto& [_, entity] : entities) ranked.push_back(&entity);
    std::sort(ranked.begin(), ranked.end(), [](const DiscoveredEntity* a, const DiscoveredEntity* b) {
        if (a->is_query_entity != b->is_query_entity) return a->is_query_entity;
        if (a->distance != b->distance) return a->distance < b->distance;
        if (a->connects_to.size() != b->connects_to.size()) {
            return a->connects_to.size() > b->connects_to.size();
        }
        return a->id < b->id;
    });

    std::unordered_set<NodeId> kept;
    for (const DiscoveredEntity* e : ranked) {
        if (kept.size() >= cap && !e->is_query_entity) break;
        kept.insert(e->id);
    }
    return kept;
}

} // namespace

void DiscoveryOptions::validate() const {
    if (max_hop_distance < 0) {
        throw InvalidBound("max_hop_distance", std::to_string(max_hop_distance));
    }
    if (max_discovered_nodes <= 0) {
        throw InvalidBound("max_discovered_nodes", std::to_string(max_discovered_nodes));
    }
}

NetworkDiscovery::NetworkDiscovery(std::shared_ptr<const AlgorithmSuite> algorithms)
    : algorithms_(algorithms ? std::move(algorithms) : AlgorithmSuite::defaults()),
      pathways_(algorithms_),
      metrics_(algorithms_) {}

double NetworkDiscovery::connectionStrength(const DirectConnection& connection) {
    return static_cast<double>(connection.relationships.size()) +
           0.5 * static_cast<double>(connection.relation_types.size());
}

QueryReach NetworkDiscovery::reachFrom(const Graph& network, NodeId query,
                                       const std::unordered_set<NodeId>& queries,
                                       const DiscoveryOptions& options) const {
    QueryReach reach;
    reach.query = query;

    algorithms_->traversal().bfs(network, query, [&](NodeId node, int depth) {
        bool other_query = node != query && queries.count(node) > 0;
        if (node != query && !other_query && options.node_filter) {
            const AttributeMap* attrs = network.getNodeAttributes(node);
            if (!options.node_filter(node, attrs ? *attrs : AttributeMap{})) {
                return VisitAction::SKIP;
            }
        }
        reach.distance[node] = depth;
        if (other_query || depth >= options.max_hop_distance) return VisitAction::SKIP;
        return VisitAction::CONTINUE;
    });

    // Shortest-path tree: parent is any expanded node one hop closer,
    // kinship edges first, then the lowest edge id.
    for (const auto& [node, hops] : reach.distance) {
        if (node == query) continue;
        EdgeId chosen = 0;
        bool chosen_kinship = false;
        for (EdgeId eid : network.traversableEdges(node)) {
            const Edge* e = network.getEdge(eid);
            NodeId prev = e->opposite(node);
            auto it = reach.distance.find(prev);
            if (it == reach.distance.end() || it->second != hops - 1) continue;
            if (prev != query && queries.count(prev)) continue;

            bool kinship = e->relationship_type == kKinship;
            if (chosen == 0 || (kinship && !chosen_kinship) ||
                (kinship == chosen_kinship && eid < chosen)) {
                chosen = eid;
                chosen_kinship = kinship;
            }
        }
        if (chosen != 0) reach.parent_edge[node] = chosen;
    }
    return reach;
}

DiscoveryResult NetworkDiscovery::discover(const Graph& graph, const DiscoveryOptions& options) const {
    options.validate();

    std::vector<NodeId> queries = uniqueInOrder(options.query_entities);
    if (queries.size() < 2) throw InsufficientQueryEntities(queries.size());
    for (NodeId q : queries) {
        if (!graph.hasNode(q)) throw UnknownStartNode(q);
    }
    std::unordered_set<NodeId> query_set(queries.begin(), queries.end());

    // Reduce to the allowed relation types once; every per-query walk
    // then runs on the traversal family's BFS without edge predicates.
    Graph network = options.include_relation_types.empty()
        ? graph.clone()
        : filterEdges(graph, relationTypeFilter(options.include_relation_types));

    std::vector<QueryReach> reaches;
    for (NodeId q : queries) reaches.push_back(reachFrom(network, q, query_set, options));

    std::unordered_set<NodeId> retained;
    for (const QueryReach& reach : reaches) {
        for (const auto& [node, _] : reach.distance) retained.insert(node);
    }

    DiscoveryResult result;
    result.query_entities = queries;

    const size_t cap = static_cast<size_t>(options.max_discovered_nodes);
    if (retained.size() > cap) {
        result.truncated = true;
        retained = retainClosest(unionOf(reaches, query_set), cap);
        spdlog::debug("discovery union truncated to {} nodes", retained.size());
        network = network.extractSubgraph(retained);
        reaches.clear();
        for (NodeId q : queries) reaches.push_back(reachFrom(network, q, query_set, options));
        retained.clear();
        for (const QueryReach& reach : reaches) {
            for (const auto& [node, _] : reach.distance) retained.insert(node);
        }
    }
    network = network.extractSubgraph(retained);

    result.entities = unionOf(reaches, query_set);
    if (options.include_discovery_paths) {
        for (auto& [id, entity] : result.entities) {
            if (entity.is_query_entity) continue;
            // Nearest query entity, earliest in query order on ties
            const QueryReach* nearest = nullptr;
            for (const QueryReach& reach : reaches) {
                auto it = reach.distance.find(id);
                if (it == reach.distance.end()) continue;
                if (!nearest || it->second < nearest->distance.at(id)) nearest = &reach;
            }
            std::vector<NodeId> path{id};
            NodeId current = id;
            while (nearest && current != nearest->query) {
                auto it = nearest->parent_edge.find(current);
                if (it == nearest->parent_edge.end()) break;
                current = network.getEdge(it->second)->opposite(current);
                path.push_back(current);
            }
            std::reverse(path.begin(), path.end());
            entity.discovery_path = std::move(path);
        }
    }

    network.forEachEdge([&](const Edge& e) { result.edges.push_back(e); });

    // Direct connections
    std::set<std::pair<NodeId, NodeId>> connected_pairs;
    for (size_t i = 0; i < queries.size(); i++) {
        for (size_t j = i + 1; j < queries.size(); j++) {
            std::vector<EdgeId> between = network.edgesBetween(queries[i], queries[j]);
            if (between.empty()) continue;

            DirectConnection connection;
            connection.entity_a = queries[i];
            connection.entity_b = queries[j];
            for (EdgeId eid : between) {
                const Edge* e = network.getEdge(eid);
                connection.relationships.push_back(*e);
                connection.relation_types.insert(e->relationship_type);
            }
            connection.strength = connectionStrength(connection);
            result.direct_connections.push_back(std::move(connection));
            connected_pairs.insert({std::min(queries[i], queries[j]), std::max(queries[i], queries[j])});
        }
    }

    result.bridge_entities = bridges_.findBridges(network, result.entities, reaches,
                                                  options.max_bridge_entities);
    result.pathways = pathways_.findPathways(network, queries, connected_pairs);
    result.metrics = metrics_.calculate(network, queries,
                                        result.direct_connections.size(),
                                        result.bridge_entities.size(),
                                        result.pathways.size());

    spdlog::debug("discovery over {} query entities: {} nodes, {} direct, {} bridges, {} pathways{}",
                  queries.size(), result.metrics.total_nodes,
                  result.direct_connections.size(), result.bridge_entities.size(),
                  result.pathways.size(), result.truncated ? " (truncated)" : "");
    return result;
}

} // namespace relnet
