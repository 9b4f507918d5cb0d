#include "algorithms/metrics_algorithm.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <unordered_set>

namespace relnet {

namespace {

int eccentricity(const std::unordered_map<NodeId, int>& distances) {
    int farthest = 0;
    for (const auto& [_, hops] : distances) farthest = std::max(farthest, hops);
    return farthest;
}

} // namespace

// ─── Shared ────────────────────────────────────────────────────

const TraversalAlgorithm& MetricsAlgorithm::traversal() const {
    static const NativeTraversal native{};
    return traversal_ ? *traversal_ : native;
}

StructureMetrics MetricsAlgorithm::compute(const Graph& graph) const {
    StructureMetrics m;
    m.node_count = graph.nodeCount();
    m.edge_count = graph.edgeCount();
    m.density = density(graph);
    m.average_degree = averageDegree(graph);
    m.average_path_length = averagePathLength(graph);
    m.average_clustering = averageClustering(graph);
    m.component_count = componentCount(graph);
    return m;
}

CentralityScores MetricsAlgorithm::centrality(const Graph& graph) const {
    CentralityScores scores;
    scores.degree = degreeCentrality(graph);
    scores.betweenness = betweennessCentrality(graph);
    scores.closeness = closenessCentrality(graph);
    return scores;
}

// ─── Structure ─────────────────────────────────────────────────

double StandardMetrics::density(const Graph& graph) const {
    return graph.metrics().density;
}

double StandardMetrics::averageDegree(const Graph& graph) const {
    return graph.metrics().average_degree;
}

double StandardMetrics::averagePathLength(const Graph& graph,
                                          const std::vector<NodeId>& among) const {
    std::vector<NodeId> sources = among.empty() ? graph.nodeIds() : among;
    std::unordered_set<NodeId> wanted(sources.begin(), sources.end());

    double total = 0.0;
    size_t pairs = 0;
    std::unordered_set<NodeId> done;

    for (NodeId s : sources) {
        if (!graph.hasNode(s) || !done.insert(s).second) continue;
        for (const auto& [node, hops] : traversal().bfsDistances(graph, s)) {
            // Count each unordered pair once
            if (hops > 0 && wanted.count(node) && !done.count(node)) {
                total += hops;
                pairs++;
            }
        }
    }
    return pairs > 0 ? total / pairs : 0.0;
}

size_t StandardMetrics::componentCount(const Graph& graph) const {
    return traversal().connectedComponents(graph).size();
}

// ─── Centrality ────────────────────────────────────────────────

NodeScores StandardMetrics::degreeCentrality(const Graph& graph) const {
    NodeScores scores;
    size_t n = graph.nodeCount();
    for (NodeId id : graph.nodeIds()) {
        scores[id] = n > 1 ? static_cast<double>(graph.degree(id)) / (n - 1) : 0.0;
    }
    return scores;
}

NodeScores StandardMetrics::betweennessCentrality(const Graph& graph) const {
    std::vector<NodeId> ids = graph.nodeIds();
    NodeScores scores;
    std::unordered_map<NodeId, std::vector<NodeId>> adjacent;
    for (NodeId id : ids) {
        scores[id] = 0.0;
        adjacent[id] = graph.neighbors(id);
    }

    // Brandes: shortest-path counts forward, dependencies backward
    for (NodeId s : ids) {
        std::vector<NodeId> order;
        std::unordered_map<NodeId, std::vector<NodeId>> predecessors;
        std::unordered_map<NodeId, double> paths{{s, 1.0}};
        std::unordered_map<NodeId, int> distance{{s, 0}};
        std::deque<NodeId> queue{s};

        while (!queue.empty()) {
            NodeId v = queue.front();
            queue.pop_front();
            order.push_back(v);
            const int next_hop = distance.at(v) + 1;
            for (NodeId w : adjacent.at(v)) {
                if (!distance.count(w)) {
                    distance[w] = next_hop;
                    queue.push_back(w);
                }
                if (distance.at(w) == next_hop) {
                    paths[w] += paths.at(v);
                    predecessors[w].push_back(v);
                }
            }
        }

        std::unordered_map<NodeId, double> dependency;
        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            NodeId w = *it;
            for (NodeId v : predecessors[w]) {
                dependency[v] += paths.at(v) / paths.at(w) * (1.0 + dependency[w]);
            }
            if (w != s) scores[w] += dependency[w];
        }
    }

    for (auto& [_, score] : scores) score /= 2.0;
    return scores;
}

NodeScores StandardMetrics::closenessCentrality(const Graph& graph) const {
    NodeScores scores;
    for (NodeId id : graph.nodeIds()) {
        auto distances = traversal().bfsDistances(graph, id);
        double total = 0.0;
        for (const auto& [_, hops] : distances) total += hops;
        scores[id] = total > 0.0 ? (distances.size() - 1) / total : 0.0;
    }
    return scores;
}

NodeScores StandardMetrics::eigenvectorCentrality(const Graph& graph) const {
    std::vector<NodeId> ids = graph.nodeIds();
    NodeScores scores;
    if (ids.empty()) return scores;

    std::unordered_map<NodeId, std::vector<NodeId>> adjacent;
    for (NodeId id : ids) {
        scores[id] = 1.0;
        adjacent[id] = graph.neighbors(id);
    }

    // Iterating (A + I) keeps bipartite graphs from oscillating
    for (int iteration = 0; iteration < max_iterations; iteration++) {
        NodeScores next;
        double norm = 0.0;
        for (NodeId id : ids) {
            double value = scores.at(id);
            for (NodeId other : adjacent.at(id)) value += scores.at(other);
            next[id] = value;
            norm += value * value;
        }
        norm = std::sqrt(norm);

        double change = 0.0;
        for (NodeId id : ids) {
            next[id] /= norm;
            change += std::abs(next.at(id) - scores.at(id));
        }
        scores = std::move(next);
        if (change < ids.size() * tolerance) break;
    }
    return scores;
}

// ─── Clustering and distances ──────────────────────────────────

double StandardMetrics::localClustering(const Graph& graph, NodeId node) const {
    std::vector<NodeId> around = graph.neighbors(node);
    size_t k = around.size();
    if (k < 2) return 0.0;

    size_t linked = 0;
    for (size_t i = 0; i < k; i++) {
        for (size_t j = i + 1; j < k; j++) {
            if (!graph.edgesBetween(around[i], around[j]).empty()) linked++;
        }
    }
    return 2.0 * linked / (k * (k - 1));
}

double StandardMetrics::averageClustering(const Graph& graph) const {
    std::vector<NodeId> ids = graph.nodeIds();
    if (ids.empty()) return 0.0;
    double total = 0.0;
    for (NodeId id : ids) total += localClustering(graph, id);
    return total / ids.size();
}

int StandardMetrics::diameter(const Graph& graph) const {
    int widest = 0;
    for (NodeId id : graph.nodeIds()) {
        widest = std::max(widest, eccentricity(traversal().bfsDistances(graph, id)));
    }
    return widest;
}

int StandardMetrics::radius(const Graph& graph) const {
    int narrowest = 0;
    bool found = false;
    for (NodeId id : graph.nodeIds()) {
        auto distances = traversal().bfsDistances(graph, id);
        if (distances.size() < 2) continue;
        int e = eccentricity(distances);
        if (!found || e < narrowest) narrowest = e;
        found = true;
    }
    return narrowest;
}

NodeScores StandardMetrics::weightedDegree(const Graph& graph) const {
    NodeScores scores;
    for (NodeId id : graph.nodeIds()) {
        double total = 0.0;
        for (EdgeId eid : graph.incidentEdges(id)) total += graph.getEdge(eid)->weight;
        scores[id] = total;
    }
    return scores;
}

} // namespace relnet
