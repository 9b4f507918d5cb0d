#include "discovery/pathway_finder.hpp"

#include <algorithm>

namespace relnet {

PathwayFinder::PathwayFinder(std::shared_ptr<const AlgorithmSuite> algorithms)
    : algorithms_(algorithms ? std::move(algorithms) : AlgorithmSuite::defaults()) {}

std::vector<Pathway> PathwayFinder::findPathways(
    const Graph& network,
    const std::vector<NodeId>& query_entities,
    const std::set<std::pair<NodeId, NodeId>>& skip_pairs) const {
    std::set<NodeId> queries(query_entities.begin(), query_entities.end());
    std::vector<Pathway> pathways;

    for (size_t i = 0; i < query_entities.size(); i++) {
        for (size_t j = i + 1; j < query_entities.size(); j++) {
            NodeId a = query_entities[i];
            NodeId b = query_entities[j];
            if (skip_pairs.count({std::min(a, b), std::max(a, b)})) continue;

            auto pathway = shortestPathway(network, a, b, queries);
            if (pathway) pathways.push_back(std::move(*pathway));
        }
    }
    return pathways;
}

std::optional<Pathway> PathwayFinder::shortestPathway(
    const Graph& network, NodeId from, NodeId to,
    const std::set<NodeId>& query_entities) const {
    auto path = algorithms_->pathfinding().shortestPath(network, from, to);
    if (!path || path->edges.empty()) return std::nullopt;
    return buildPathway(network, *path, query_entities);
}

std::vector<Pathway> PathwayFinder::allPathways(
    const Graph& network, NodeId from, NodeId to, int max_length,
    const std::set<NodeId>& query_entities) const {
    std::vector<Pathway> pathways;
    for (const GraphPath& path : algorithms_->pathfinding().allPaths(network, from, to, max_length)) {
        pathways.push_back(buildPathway(network, path, query_entities));
    }
    return pathways;
}

std::vector<Pathway> PathwayFinder::pathwaysThroughNodes(
    const Graph& network, NodeId from, NodeId to, const std::vector<NodeId>& through,
    const std::set<NodeId>& query_entities) const {
    std::vector<Pathway> pathways;
    const int max_length = static_cast<int>(through.size()) + 2;
    for (const GraphPath& path : algorithms_->pathfinding().allPaths(network, from, to, max_length)) {
        bool visits_all = std::all_of(through.begin(), through.end(), [&](NodeId node) {
            return std::find(path.nodes.begin(), path.nodes.end(), node) != path.nodes.end();
        });
        if (visits_all) pathways.push_back(buildPathway(network, path, query_entities));
    }
    return pathways;
}

Pathway PathwayFinder::buildPathway(const Graph& network, const GraphPath& path,
                                    const std::set<NodeId>& query_entities) const {
    Pathway pathway;
    pathway.from = path.nodes.front();
    pathway.to = path.nodes.back();
    pathway.path = path.nodes;

    RelationMixTracker mix;
    for (EdgeId eid : path.edges) {
        const Edge* e = network.getEdge(eid);
        pathway.edges.push_back(*e);
        mix.add(e->relationship_type);
    }
    pathway.path_type = mix.mix();
    pathway.strength = pathStrength(pathway, query_entities);
    return pathway;
}

double PathwayFinder::pathStrength(const Pathway& pathway, const std::set<NodeId>& query_entities) {
    if (pathway.edges.empty()) return 0.0;

    double strength = 0.0;
    for (const Edge& e : pathway.edges) {
        strength += e.relationship_type == kKinship ? 2.0 : 1.0;
        int edge_distance = 2 - static_cast<int>(query_entities.count(e.source)) -
                            static_cast<int>(query_entities.count(e.target));
        strength += 1.0 / (edge_distance + 1);
    }
    return strength / pathway.edges.size();
}

} // namespace relnet
